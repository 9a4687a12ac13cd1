#pragma once

#include <functional>
#include <utility>
#include <vector>

namespace stemdeck {

    /**
     * @brief Multi-listener notification used for component events
     *
     * Listeners are identified by the token returned from connect().
     * Handlers run synchronously on the thread that calls emit(), in
     * connection order. A handler may connect or disconnect listeners;
     * the change takes effect on the next emit().
     */
    template<typename... Args>
    class event {
        public:
            using handler_t = std::function<void(Args...)>;

            int connect(handler_t handler) {
                const int token = m_next_token++;
                m_handlers.emplace_back(token, std::move(handler));
                return token;
            }

            void disconnect(int token) {
                for (auto it = m_handlers.begin(); it != m_handlers.end(); ++it) {
                    if (it->first == token) {
                        m_handlers.erase(it);
                        return;
                    }
                }
            }

            void emit(Args... args) const {
                auto handlers = m_handlers;
                for (auto& [token, handler] : handlers) {
                    if (handler) {
                        handler(args...);
                    }
                }
            }

            [[nodiscard]] std::size_t size() const { return m_handlers.size(); }

        private:
            std::vector<std::pair<int, handler_t>> m_handlers;
            int m_next_token = 1;
    };

} // namespace stemdeck

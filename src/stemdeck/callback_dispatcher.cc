#include <stemdeck/callback_dispatcher.hh>
#include <vector>

namespace stemdeck {
    callback_dispatcher::callback_dispatcher() = default;
    callback_dispatcher::~callback_dispatcher() = default;

    int callback_dispatcher::next_token() {
        return m_next_token.fetch_add(1);
    }

    void callback_dispatcher::enqueue(const callback_t& cbk) {
        std::lock_guard <std::mutex> lk(m_mutex);
        m_queue.emplace_back(cbk);
    }

    std::size_t callback_dispatcher::dispatch() {
        // 1) snapshot & clear under lock
        std::vector <callback_t> toDispatch; {
            std::lock_guard <std::mutex> lk(m_mutex);
            toDispatch.assign(m_queue.begin(), m_queue.end());
            m_queue.clear();
        }

        // 2) invoke each on the control thread
        for (auto& [token, cbk] : toDispatch) {
            if (cbk) {
                cbk();
            }
        }
        return toDispatch.size();
    }

    void callback_dispatcher::cleanup(int token) {
        std::lock_guard <std::mutex> lk(m_mutex);
        auto it = m_queue.begin();
        while (it != m_queue.end()) {
            if (it->first == token) {
                it = m_queue.erase(it);
            } else {
                ++it;
            }
        }
    }

    std::size_t callback_dispatcher::pending() const {
        std::lock_guard <std::mutex> lk(m_mutex);
        return m_queue.size();
    }
}

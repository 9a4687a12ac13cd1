#include <stemdeck/document_store.hh>
#include <stemdeck/error.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <atomic>
#include <mutex>
#include <utility>

namespace stemdeck {

    subscription::subscription() = default;

    subscription::subscription(cancel_t cancel)
        : m_cancel(std::move(cancel)) {
    }

    subscription::~subscription() {
        unsubscribe();
    }

    subscription::subscription(subscription&& other) noexcept
        : m_cancel(std::move(other.m_cancel)) {
        other.m_cancel = nullptr;
    }

    subscription& subscription::operator=(subscription&& other) noexcept {
        if (this != &other) {
            unsubscribe();
            m_cancel = std::move(other.m_cancel);
            other.m_cancel = nullptr;
        }
        return *this;
    }

    void subscription::unsubscribe() {
        if (m_cancel) {
            auto cancel = std::move(m_cancel);
            m_cancel = nullptr;
            cancel();
        }
    }

    document_store::~document_store() = default;

    std::vector<std::string> split_path(const std::string& path) {
        std::vector<std::string> keys;
        std::string::size_type start = 0;
        while (start <= path.size()) {
            const auto end = path.find('/', start);
            const auto key = path.substr(start, end == std::string::npos ? std::string::npos : end - start);
            if (key.empty()) {
                throw store_error("invalid store path '" + path + "'");
            }
            keys.push_back(key);
            if (end == std::string::npos) {
                break;
            }
            start = end + 1;
        }
        return keys;
    }

    std::string join_path(std::initializer_list<std::string> keys) {
        std::string out;
        for (const auto& key : keys) {
            if (!out.empty()) {
                out += '/';
            }
            out += key;
        }
        return out;
    }

    namespace {
        using keys_t = std::vector<std::string>;

        // One path is the other or lies below it
        bool related(const keys_t& a, const keys_t& b) {
            const auto n = std::min(a.size(), b.size());
            return std::equal(a.begin(), a.begin() + static_cast<std::ptrdiff_t>(n), b.begin());
        }

        nlohmann::json value_at(const nlohmann::json& root, const keys_t& keys) {
            const nlohmann::json* node = &root;
            for (const auto& key : keys) {
                if (!node->is_object()) {
                    return nullptr;
                }
                auto it = node->find(key);
                if (it == node->end()) {
                    return nullptr;
                }
                node = &*it;
            }
            return *node;
        }

        void erase_at(nlohmann::json& node, const keys_t& keys, std::size_t depth) {
            if (!node.is_object()) {
                return;
            }
            auto it = node.find(keys[depth]);
            if (it == node.end()) {
                return;
            }
            if (depth + 1 == keys.size()) {
                node.erase(it);
                return;
            }
            erase_at(*it, keys, depth + 1);
            if (it->is_object() && it->empty()) {
                node.erase(it);
            }
        }
    }

    struct memory_document_store::impl {
        struct subscriber {
            keys_t keys;
            callback_t callback;
            nlohmann::json last;
            std::atomic<bool> alive{true};
        };
        using delivery = std::pair<std::shared_ptr<subscriber>, nlohmann::json>;

        mutable std::mutex m_mutex;
        nlohmann::json m_root = nlohmann::json::object();
        std::vector<std::shared_ptr<subscriber>> m_subscribers;

        // Caller holds m_mutex
        std::vector<delivery> collect(const keys_t& changed) {
            std::vector<delivery> out;
            for (auto& sub : m_subscribers) {
                if (!related(sub->keys, changed)) {
                    continue;
                }
                auto value = value_at(m_root, sub->keys);
                if (value != sub->last) {
                    sub->last = value;
                    out.emplace_back(sub, std::move(value));
                }
            }
            return out;
        }

        static void deliver(const std::vector<delivery>& deliveries) {
            for (const auto& [sub, value] : deliveries) {
                if (sub->alive.load()) {
                    sub->callback(value);
                }
            }
        }

        void cancel(const std::shared_ptr<subscriber>& sub) {
            sub->alive.store(false);
            std::lock_guard<std::mutex> lock(m_mutex);
            m_subscribers.erase(std::remove(m_subscribers.begin(), m_subscribers.end(), sub),
                                m_subscribers.end());
        }
    };

    memory_document_store::memory_document_store()
        : m_pimpl(std::make_shared<impl>()) {
    }

    memory_document_store::~memory_document_store() = default;

    std::optional<nlohmann::json> memory_document_store::read(const std::string& path) {
        const auto keys = split_path(path);
        std::lock_guard<std::mutex> lock(m_pimpl->m_mutex);
        auto value = value_at(m_pimpl->m_root, keys);
        if (value.is_null()) {
            return std::nullopt;
        }
        return value;
    }

    void memory_document_store::write(const std::string& path, const nlohmann::json& value) {
        if (value.is_null()) {
            remove(path);
            return;
        }
        const auto keys = split_path(path);
        std::vector<impl::delivery> deliveries;
        {
            std::lock_guard<std::mutex> lock(m_pimpl->m_mutex);
            nlohmann::json* node = &m_pimpl->m_root;
            for (std::size_t i = 0; i + 1 < keys.size(); ++i) {
                auto& child = (*node)[keys[i]];
                if (!child.is_object()) {
                    child = nlohmann::json::object();
                }
                node = &child;
            }
            (*node)[keys.back()] = value;
            deliveries = m_pimpl->collect(keys);
        }
        impl::deliver(deliveries);
    }

    void memory_document_store::remove(const std::string& path) {
        const auto keys = split_path(path);
        std::vector<impl::delivery> deliveries;
        {
            std::lock_guard<std::mutex> lock(m_pimpl->m_mutex);
            erase_at(m_pimpl->m_root, keys, 0);
            deliveries = m_pimpl->collect(keys);
        }
        impl::deliver(deliveries);
    }

    subscription memory_document_store::subscribe(const std::string& path, callback_t callback) {
        if (!callback) {
            throw store_error("subscribe to '" + path + "' without a callback");
        }
        auto sub = std::make_shared<impl::subscriber>();
        sub->keys = split_path(path);
        sub->callback = std::move(callback);
        nlohmann::json current;
        {
            std::lock_guard<std::mutex> lock(m_pimpl->m_mutex);
            current = value_at(m_pimpl->m_root, sub->keys);
            sub->last = current;
            m_pimpl->m_subscribers.push_back(sub);
        }
        LOG_DEBUG("document_store", "subscribed to", path);

        std::weak_ptr<impl> weak = m_pimpl;
        subscription handle([weak, sub]() {
            if (auto self = weak.lock()) {
                self->cancel(sub);
            } else {
                sub->alive.store(false);
            }
        });
        std::vector<impl::delivery> initial;
        initial.emplace_back(sub, std::move(current));
        impl::deliver(initial);
        return handle;
    }

    std::size_t memory_document_store::subscriber_count() const {
        std::lock_guard<std::mutex> lock(m_pimpl->m_mutex);
        return m_pimpl->m_subscribers.size();
    }

} // namespace stemdeck

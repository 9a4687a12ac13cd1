#include <stemdeck/track_state_store.hh>
#include <stemdeck/error.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <mutex>

namespace stemdeck {

    song_mix_states parse_song_states(const nlohmann::json& value) {
        song_mix_states out;
        if (!value.is_object()) {
            return out;
        }
        for (auto it = value.begin(); it != value.end(); ++it) {
            if (!it->is_object()) {
                continue;
            }
            try {
                out[it.key()] = it->get<track_mix_state>();
            } catch (const nlohmann::json::exception& e) {
                LOG_WARN("track_state_store", "ignoring malformed state of track", it.key(), ":", e.what());
            }
        }
        return out;
    }

    struct track_state_store::impl {
        impl(std::shared_ptr<document_store> store, callback_dispatcher& dispatcher,
             std::string user_id, float default_volume)
            : m_store(std::move(store)),
              m_dispatcher(dispatcher),
              m_user(std::move(user_id)),
              m_default_volume(default_volume) {
        }

        std::shared_ptr<document_store> m_store;
        callback_dispatcher& m_dispatcher;
        std::string m_user;
        float m_default_volume;

        mutable std::mutex m_mutex;
        // token -> store subscription
        std::map<int, subscription> m_subscriptions;

        std::string song_path(const std::string& song_id) const {
            if (m_user.empty()) {
                throw persistence_error("track state store has no user");
            }
            return join_path({"users", m_user, "trackStates", song_id});
        }

        std::string track_path(const std::string& song_id, const std::string& track_id) const {
            return song_path(song_id) + "/" + track_id;
        }

        void cancel(int token) {
            subscription sub;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                auto it = m_subscriptions.find(token);
                if (it != m_subscriptions.end()) {
                    sub = std::move(it->second);
                    m_subscriptions.erase(it);
                }
            }
            sub.unsubscribe();
            m_dispatcher.cleanup(token);
        }

        void cancel_all() {
            std::map<int, subscription> subs;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                subs.swap(m_subscriptions);
            }
            for (auto& [token, sub] : subs) {
                sub.unsubscribe();
                m_dispatcher.cleanup(token);
            }
        }
    };

    track_state_store::track_state_store(std::shared_ptr<document_store> store, callback_dispatcher& dispatcher,
                                         std::string user_id, float default_volume)
        : m_pimpl(std::make_shared<impl>(std::move(store), dispatcher, std::move(user_id), default_volume)) {
        if (!m_pimpl->m_store) {
            THROW_RUNTIME("track state store requires a document store");
        }
    }

    track_state_store::~track_state_store() {
        m_pimpl->cancel_all();
    }

    void track_state_store::set_user(const std::string& user_id) {
        if (user_id == m_pimpl->m_user) {
            return;
        }
        m_pimpl->cancel_all();
        LOG_INFO("track_state_store", "user changed to", user_id);
        m_pimpl->m_user = user_id;
    }

    const std::string& track_state_store::user() const {
        return m_pimpl->m_user;
    }

    track_mix_state track_state_store::default_state() const {
        track_mix_state s;
        s.volume = std::clamp(m_pimpl->m_default_volume, 0.0f, 1.0f);
        return s;
    }

    song_mix_states track_state_store::load(const song& s) {
        const auto path = m_pimpl->song_path(s.id);
        song_mix_states stored;
        try {
            auto value = m_pimpl->m_store->read(path);
            if (value) {
                stored = parse_song_states(*value);
            }
        } catch (const store_error& e) {
            throw persistence_error("loading track states of song " + s.id + ": " + e.what());
        }

        song_mix_states out;
        song_mix_states missing;
        for (const auto& t : s.tracks) {
            auto it = stored.find(t.id);
            if (it != stored.end()) {
                out[t.id] = it->second;
            } else {
                out[t.id] = default_state();
                missing[t.id] = default_state();
            }
        }

        if (!missing.empty()) {
            LOG_DEBUG("track_state_store", "initializing", missing.size(), "track states of song", s.id);
            for (const auto& [track_id, state] : missing) {
                save(s.id, track_id, state);
            }
        }
        return out;
    }

    void track_state_store::save(const std::string& song_id, const std::string& track_id,
                                 const track_mix_state& state) {
        const auto path = m_pimpl->track_path(song_id, track_id);
        try {
            m_pimpl->m_store->write(path, nlohmann::json(state));
        } catch (const store_error& e) {
            throw persistence_error("saving track state " + song_id + "/" + track_id + ": " + e.what());
        }
    }

    void track_state_store::save_song(const std::string& song_id, const song_mix_states& states) {
        const auto path = m_pimpl->song_path(song_id);
        nlohmann::json doc = nlohmann::json::object();
        for (const auto& [track_id, state] : states) {
            doc[track_id] = state;
        }
        try {
            m_pimpl->m_store->write(path, doc);
        } catch (const store_error& e) {
            throw persistence_error("saving track states of song " + song_id + ": " + e.what());
        }
    }

    std::map<std::string, song_mix_states> track_state_store::load_all() {
        if (m_pimpl->m_user.empty()) {
            throw persistence_error("track state store has no user");
        }
        std::map<std::string, song_mix_states> out;
        try {
            auto value = m_pimpl->m_store->read(join_path({"users", m_pimpl->m_user, "trackStates"}));
            if (value && value->is_object()) {
                for (auto it = value->begin(); it != value->end(); ++it) {
                    out[it.key()] = parse_song_states(*it);
                }
            }
        } catch (const store_error& e) {
            throw persistence_error(std::string("loading track states: ") + e.what());
        }
        return out;
    }

    subscription track_state_store::subscribe(const std::string& song_id, push_callback_t callback) {
        const auto path = m_pimpl->song_path(song_id);
        callback_dispatcher& dispatcher = m_pimpl->m_dispatcher;
        const int token = dispatcher.next_token();

        subscription remote;
        try {
            remote = m_pimpl->m_store->subscribe(path, [&dispatcher, token, callback](const nlohmann::json& value) {
                auto states = parse_song_states(value);
                dispatcher.enqueue({token, [callback, states]() { callback(states); }});
            });
        } catch (const store_error& e) {
            throw persistence_error("subscribing to track states of song " + song_id + ": " + e.what());
        }
        {
            std::lock_guard<std::mutex> lock(m_pimpl->m_mutex);
            m_pimpl->m_subscriptions.emplace(token, std::move(remote));
        }
        LOG_DEBUG("track_state_store", "subscribed to song", song_id, "token", token);

        std::weak_ptr<impl> weak = m_pimpl;
        return subscription([weak, token]() {
            if (auto self = weak.lock()) {
                self->cancel(token);
            }
        });
    }

    std::size_t track_state_store::active_subscriptions() const {
        std::lock_guard<std::mutex> lock(m_pimpl->m_mutex);
        return m_pimpl->m_subscriptions.size();
    }

} // namespace stemdeck

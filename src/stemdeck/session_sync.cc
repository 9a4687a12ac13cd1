#include <stemdeck/session_sync.hh>
#include <stemdeck/error.hh>
#include <stemdeck/transport.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <random>

namespace stemdeck {

    namespace {
        std::string to_base36(std::uint64_t value) {
            static const char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
            std::string out;
            do {
                out.insert(out.begin(), digits[value % 36]);
                value /= 36;
            } while (value > 0);
            return out;
        }

        std::int64_t epoch_millis() {
            using namespace std::chrono;
            return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
        }

        // <base36 timestamp>-<6 random base36 digits>
        std::string make_session_id() {
            static thread_local std::mt19937_64 rng{std::random_device{}()};
            std::uniform_int_distribution<std::uint64_t> dist(0, 36ULL * 36 * 36 * 36 * 36 * 36 - 1);
            std::string suffix = to_base36(dist(rng));
            suffix.insert(suffix.begin(), 6 - std::min<std::size_t>(6, suffix.size()), '0');
            return to_base36(static_cast<std::uint64_t>(epoch_millis())) + "-" + suffix;
        }

        std::string session_path(const std::string& id) {
            return join_path({"sessions", id});
        }

        std::string state_path(const std::string& id) {
            return join_path({"sessions", id, "state"});
        }
    }

    void reconcile(transport& t, const transport_snapshot& snapshot, const engine_config& config) {
        if (!t.has_song()) {
            return;
        }
        if (std::fabs(snapshot.seek_position - t.position()) > config.seek_tolerance_seconds) {
            t.seek(snapshot.seek_position);
        }
        if (snapshot.playback_speed > 0.0 &&
            std::fabs(snapshot.playback_speed - t.playback_speed()) > config.speed_tolerance) {
            t.set_speed(snapshot.playback_speed);
        }
        const bool playing = t.phase() == transport_phase::playing;
        if (snapshot.is_playing && !playing) {
            t.play();
        } else if (!snapshot.is_playing && playing) {
            t.pause();
        }
    }

    struct session_sync::impl {
        impl(std::shared_ptr<document_store> store, callback_dispatcher& dispatcher,
             scheduler& clock, transport& t, std::string device_id, engine_config config)
            : m_store(std::move(store)),
              m_dispatcher(dispatcher),
              m_clock(clock),
              m_transport(t),
              m_device_id(std::move(device_id)),
              m_config(config) {
        }

        std::shared_ptr<document_store> m_store;
        callback_dispatcher& m_dispatcher;
        scheduler& m_clock;
        transport& m_transport;
        std::string m_device_id;
        engine_config m_config;
        volume_source_t m_volumes;

        session_role m_role = session_role::none;
        std::string m_session_id;
        // Bumped on every join/leave; pushes of an older session are dropped
        std::uint64_t m_generation = 0;

        subscription m_remote;
        int m_token = 0;
        std::optional<scheduler::time_point> m_last_applied;
        std::optional<transport_snapshot> m_held;
        std::optional<transport_snapshot> m_last;
        scheduler::timer_id m_debounce = scheduler::invalid_timer;

        int m_changed_conn = 0;
        int m_ready_conn = 0;

        event<const std::string&> m_on_error;
        event<const std::string&> m_on_ended;
        event<const transport_snapshot&> m_on_applied;

        transport_snapshot current_snapshot() const {
            return transport_snapshot::from_state(m_transport.state(),
                                                  m_volumes ? m_volumes() : std::map<std::string, float>{});
        }

        void write_state(const transport_snapshot& snap) {
            try {
                m_store->write(state_path(m_session_id), nlohmann::json(snap));
            } catch (const store_error& e) {
                LOG_ERROR("session_sync", "publishing state of session", m_session_id, "failed:", e.what());
            }
        }

        void report(const std::string& message) {
            LOG_ERROR("session_sync", message);
            m_on_error.emit(message);
        }

        void cancel_debounce() {
            if (m_debounce != scheduler::invalid_timer) {
                m_clock.cancel(m_debounce);
                m_debounce = scheduler::invalid_timer;
            }
        }

        void drop_follower() {
            m_remote.unsubscribe();
            if (m_token != 0) {
                m_dispatcher.cleanup(m_token);
                m_token = 0;
            }
            cancel_debounce();
            m_held.reset();
            m_last_applied.reset();
        }

        void on_push(std::uint64_t generation, const nlohmann::json& value) {
            if (generation != m_generation || m_role != session_role::follower) {
                return;
            }
            if (value.is_null()) {
                LOG_INFO("session_sync", "session", m_session_id, "ended by its admin");
                cancel_debounce();
                m_held.reset();
                m_on_ended.emit(m_session_id);
                return;
            }

            try {
                m_held = value.get<transport_snapshot>();
            } catch (const nlohmann::json::exception& e) {
                LOG_WARN("session_sync", "ignoring malformed snapshot of session", m_session_id, ":", e.what());
                return;
            }
            const auto now = m_clock.now();
            if (!m_last_applied || now - *m_last_applied >= m_config.sync_debounce) {
                apply_held();
                return;
            }
            if (m_debounce == scheduler::invalid_timer) {
                const auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(
                    *m_last_applied + m_config.sync_debounce - now);
                m_debounce = m_clock.schedule(wait, [this]() {
                    m_debounce = scheduler::invalid_timer;
                    apply_held();
                });
            }
        }

        void apply_held() {
            if (!m_held) {
                return;
            }
            auto snap = std::move(*m_held);
            m_held.reset();
            m_last_applied = m_clock.now();
            m_last = snap;
            reconcile(m_transport, snap, m_config);
            m_on_applied.emit(snap);
        }
    };

    session_sync::session_sync(std::shared_ptr<document_store> store, callback_dispatcher& dispatcher,
                               scheduler& clock, transport& t, std::string device_id, engine_config config)
        : m_pimpl(std::make_unique<impl>(std::move(store), dispatcher, clock, t, std::move(device_id), config)) {
        if (!m_pimpl->m_store) {
            THROW_RUNTIME("session sync requires a document store");
        }
        auto* d = m_pimpl.get();
        d->m_changed_conn = t.on_transport_changed().connect([d](const transport_state&) {
            if (d->m_role == session_role::admin) {
                d->write_state(d->current_snapshot());
            }
        });
        // A follower that loads a song catches up with the last snapshot
        d->m_ready_conn = t.on_ready().connect([d](const song&) {
            if (d->m_role == session_role::follower && d->m_last) {
                reconcile(d->m_transport, *d->m_last, d->m_config);
            }
        });
    }

    session_sync::~session_sync() {
        leave_session();
        m_pimpl->m_transport.on_transport_changed().disconnect(m_pimpl->m_changed_conn);
        m_pimpl->m_transport.on_ready().disconnect(m_pimpl->m_ready_conn);
    }

    std::optional<std::string> session_sync::create_session() {
        auto& d = *m_pimpl;
        leave_session();

        const auto id = make_session_id();
        nlohmann::json doc = {
            {"admin", d.m_device_id},
            {"createdAt", epoch_millis()},
            {"state", nlohmann::json(transport_snapshot{})}
        };
        try {
            d.m_store->write(session_path(id), doc);
        } catch (const store_error& e) {
            d.report(std::string("creating session failed: ") + e.what());
            return std::nullopt;
        }

        ++d.m_generation;
        d.m_session_id = id;
        d.m_role = session_role::admin;
        LOG_INFO("session_sync", "created session", id, "as admin", d.m_device_id);
        return id;
    }

    bool session_sync::join_session(const std::string& session_id) {
        auto& d = *m_pimpl;
        leave_session();

        std::optional<nlohmann::json> doc;
        try {
            doc = d.m_store->read(session_path(session_id));
        } catch (const store_error& e) {
            d.report("joining session " + session_id + " failed: " + e.what());
            return false;
        }
        if (!doc) {
            d.report("joining session " + session_id + " failed: no such session");
            return false;
        }

        const auto generation = ++d.m_generation;
        d.m_session_id = session_id;
        d.m_role = session_role::follower;
        d.m_token = d.m_dispatcher.next_token();

        auto* self = &d;
        callback_dispatcher& dispatcher = d.m_dispatcher;
        const int token = d.m_token;
        try {
            d.m_remote = d.m_store->subscribe(state_path(session_id),
                [&dispatcher, self, token, generation](const nlohmann::json& value) {
                    dispatcher.enqueue({token, [self, generation, value]() {
                        self->on_push(generation, value);
                    }});
                });
        } catch (const store_error& e) {
            d.drop_follower();
            d.m_role = session_role::none;
            d.m_session_id.clear();
            d.report("joining session " + session_id + " failed: " + e.what());
            return false;
        }
        LOG_INFO("session_sync", "device", d.m_device_id, "following session", session_id);
        return true;
    }

    void session_sync::leave_session() {
        auto& d = *m_pimpl;
        if (d.m_role == session_role::none) {
            return;
        }
        if (d.m_role == session_role::admin) {
            if (d.m_config.admin_leave_deletes_session) {
                try {
                    d.m_store->remove(session_path(d.m_session_id));
                } catch (const store_error& e) {
                    LOG_ERROR("session_sync", "removing session", d.m_session_id, "failed:", e.what());
                }
            }
        } else {
            d.drop_follower();
        }
        LOG_INFO("session_sync", "left session", d.m_session_id);
        ++d.m_generation;
        d.m_role = session_role::none;
        d.m_session_id.clear();
    }

    std::vector<session_info> session_sync::list_sessions() {
        std::optional<nlohmann::json> all;
        try {
            all = m_pimpl->m_store->read("sessions");
        } catch (const store_error& e) {
            throw session_error(std::string("listing sessions failed: ") + e.what());
        }
        std::vector<session_info> out;
        if (!all || !all->is_object()) {
            return out;
        }
        for (auto it = all->begin(); it != all->end(); ++it) {
            if (!it->is_object()) {
                continue;
            }
            session_info info;
            info.id = it.key();
            info.admin = it->value("admin", std::string{});
            info.created_at = it->value("createdAt", std::int64_t{0});
            out.push_back(std::move(info));
        }
        return out;
    }

    void session_sync::delete_session(const std::string& session_id) {
        if (session_id == m_pimpl->m_session_id) {
            leave_session();
        }
        try {
            m_pimpl->m_store->remove(session_path(session_id));
        } catch (const store_error& e) {
            throw session_error("deleting session " + session_id + " failed: " + e.what());
        }
        LOG_INFO("session_sync", "deleted session", session_id);
    }

    void session_sync::publish() {
        if (m_pimpl->m_role == session_role::admin) {
            m_pimpl->write_state(m_pimpl->current_snapshot());
        }
    }

    void session_sync::set_volume_source(volume_source_t source) {
        m_pimpl->m_volumes = std::move(source);
    }

    session_role session_sync::role() const {
        return m_pimpl->m_role;
    }

    bool session_sync::is_admin() const {
        return m_pimpl->m_role == session_role::admin;
    }

    bool session_sync::in_session() const {
        return m_pimpl->m_role != session_role::none;
    }

    const std::string& session_sync::session_id() const {
        return m_pimpl->m_session_id;
    }

    const std::string& session_sync::device_id() const {
        return m_pimpl->m_device_id;
    }

    std::optional<transport_snapshot> session_sync::last_snapshot() const {
        return m_pimpl->m_last;
    }

    event<const std::string&>& session_sync::on_session_error() {
        return m_pimpl->m_on_error;
    }

    event<const std::string&>& session_sync::on_session_ended() {
        return m_pimpl->m_on_ended;
    }

    event<const transport_snapshot&>& session_sync::on_snapshot_applied() {
        return m_pimpl->m_on_applied;
    }

} // namespace stemdeck

#include <stemdeck/player.hh>
#include <stemdeck/error.hh>
#include <failsafe/failsafe.hh>

namespace stemdeck {

    struct player::impl {
        impl(std::shared_ptr<channel_factory> factory,
             std::shared_ptr<document_store> store,
             std::shared_ptr<content_store> content,
             scheduler& clock,
             player_options options)
            : m_options(std::move(options)),
              m_clock(clock),
              m_content(std::move(content)),
              m_transport(std::move(factory), clock, m_options.config),
              m_states(store, m_dispatcher, m_options.user_id, m_options.config.default_volume),
              m_mixer(m_transport, clock, m_options.config),
              m_session(store, m_dispatcher, clock, m_transport, m_options.device_id, m_options.config) {
        }

        player_options m_options;
        scheduler& m_clock;
        std::shared_ptr<content_store> m_content;
        callback_dispatcher m_dispatcher;
        transport m_transport;
        track_state_store m_states;
        track_mixer m_mixer;
        session_sync m_session;
        // Constructed after the ready handler below is connected, so the
        // mixer is bound before the queue starts playback
        std::unique_ptr<queue_controller> m_queue;

        subscription m_mix_sub;
        int m_ready_conn = 0;
        int m_mix_conn = 0;

        void bind_song(const song& s) {
            m_mix_sub.unsubscribe();
            song_mix_states states;
            try {
                states = m_states.load(s);
            } catch (const persistence_error& e) {
                LOG_ERROR("player", "loading mix states of song", s.id, "failed:", e.what());
            }
            m_mixer.bind(s, states);

            const auto song_id = s.id;
            try {
                m_mix_sub = m_states.subscribe(song_id, [this, song_id](const song_mix_states& remote) {
                    if (m_mixer.song_id() == song_id) {
                        m_mixer.apply_remote(remote);
                    }
                });
            } catch (const persistence_error& e) {
                LOG_ERROR("player", "subscribing to mix states of song", song_id, "failed:", e.what());
            }
        }
    };

    player::player(std::shared_ptr<channel_factory> factory,
                   std::shared_ptr<document_store> store,
                   std::shared_ptr<content_store> content,
                   scheduler& clock,
                   player_options options) {
        if (!store || !content) {
            THROW_RUNTIME("player requires a document store and a content store");
        }
        std::string error;
        if (!options.config.validate(&error)) {
            throw config_error("invalid engine configuration: " + error);
        }
        m_pimpl = std::make_unique<impl>(std::move(factory), std::move(store), std::move(content),
                                         clock, std::move(options));
        auto* d = m_pimpl.get();

        d->m_mixer.set_store(&d->m_states);
        d->m_session.set_volume_source([d]() { return d->m_mixer.volumes(); });
        d->m_ready_conn = d->m_transport.on_ready().connect([d](const song& s) { d->bind_song(s); });
        d->m_mix_conn = d->m_mixer.on_mix_changed().connect([d](const song_mix_states&) {
            d->m_session.publish();
        });
        d->m_queue = std::make_unique<queue_controller>(d->m_transport, *d->m_content, d->m_options.shuffle_seed);
        LOG_INFO("player", "device", d->m_options.device_id, "ready for user", d->m_options.user_id);
    }

    player::~player() {
        auto* d = m_pimpl.get();
        d->m_queue.reset();
        d->m_mix_sub.unsubscribe();
        d->m_mixer.on_mix_changed().disconnect(d->m_mix_conn);
        d->m_transport.on_ready().disconnect(d->m_ready_conn);
    }

    std::size_t player::poll() {
        auto& d = *m_pimpl;
        std::size_t processed = d.m_dispatcher.dispatch();
        processed += d.m_clock.run_due();
        if (d.m_transport.poll()) {
            ++processed;
        }
        return processed;
    }

    void player::set_user(const std::string& user_id) {
        auto& d = *m_pimpl;
        d.m_mix_sub.unsubscribe();
        d.m_states.set_user(user_id);
        d.m_options.user_id = user_id;
        if (auto* ctx = d.m_transport.context()) {
            d.bind_song(ctx->get_song());
        }
    }

    transport& player::get_transport() {
        return m_pimpl->m_transport;
    }

    track_mixer& player::mixer() {
        return m_pimpl->m_mixer;
    }

    queue_controller& player::queue() {
        return *m_pimpl->m_queue;
    }

    track_state_store& player::track_states() {
        return m_pimpl->m_states;
    }

    session_sync& player::session() {
        return m_pimpl->m_session;
    }

    callback_dispatcher& player::dispatcher() {
        return m_pimpl->m_dispatcher;
    }

    const engine_config& player::config() const {
        return m_pimpl->m_options.config;
    }

} // namespace stemdeck

#include <stemdeck/track_mixer.hh>
#include <stemdeck/error.hh>
#include <stemdeck/fan_out.hh>
#include <stemdeck/track_state_store.hh>
#include <stemdeck/transport.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>

namespace stemdeck {

    float resolve_gain(const std::string& track_id, const song_mix_states& states) {
        auto it = states.find(track_id);
        if (it == states.end()) {
            return 0.0f;
        }
        const auto& self = it->second;
        if (self.mute) {
            return 0.0f;
        }
        const bool any_solo = std::any_of(states.begin(), states.end(),
                                          [](const auto& entry) { return entry.second.solo; });
        if (any_solo) {
            return self.solo ? self.volume : 0.0f;
        }
        return self.volume;
    }

    struct track_mixer::impl {
        impl(transport& t, scheduler& clock, engine_config config)
            : m_transport(t),
              m_clock(clock),
              m_config(config) {
        }

        transport& m_transport;
        scheduler& m_clock;
        engine_config m_config;
        track_state_store* m_store = nullptr;

        std::string m_song_id;
        std::vector<std::string> m_order;
        song_mix_states m_states;
        std::map<std::string, scheduler::timer_id> m_clicks;
        event<const song_mix_states&> m_on_changed;

        bool knows(const std::string& track_id) const {
            if (m_states.count(track_id) > 0) {
                return true;
            }
            LOG_WARN("track_mixer", "ignoring unknown track", track_id);
            return false;
        }

        // The transport only takes gains for the song it has loaded
        playback_context* context() {
            auto* ctx = m_transport.context();
            if (!ctx || ctx->get_song().id != m_song_id) {
                return nullptr;
            }
            return ctx;
        }

        void apply_gain(const std::string& track_id) {
            auto* ctx = context();
            if (!ctx) {
                return;
            }
            auto* slot = ctx->find(track_id);
            if (!slot || !slot->usable) {
                return;
            }
            const float gain = resolve_gain(track_id, m_states);
            try {
                slot->handle->set_gain(gain);
            } catch (const channel_error& e) {
                LOG_WARN("track_mixer", "set_gain on", track_id, "failed:", e.what());
            }
        }

        void apply_all_gains() {
            auto* ctx = context();
            if (!ctx) {
                return;
            }
            using target_t = std::pair<channel_slot*, float>;
            std::vector<target_t> targets;
            for (auto* slot : ctx->usable_slots()) {
                targets.emplace_back(slot, resolve_gain(slot->source.id, m_states));
            }
            auto results = fan_out(targets, [](const target_t& target) {
                target.first->handle->set_gain(target.second);
            });
            for (const auto& r : results) {
                if (!r.ok) {
                    LOG_WARN("track_mixer", "set_gain on", targets[r.index].first->source.id, "failed:", r.error);
                }
            }
        }

        void mirror_to_transport(const std::string& track_id) {
            if (!context()) {
                return;
            }
            const auto& s = m_states[track_id];
            m_transport.set_track_active(track_id, !s.mute);
            m_transport.set_track_soloed(track_id, s.solo);
        }

        void mirror_all() {
            for (const auto& id : m_order) {
                mirror_to_transport(id);
            }
        }

        void persist(const std::string& track_id) {
            if (!m_store) {
                return;
            }
            try {
                m_store->save(m_song_id, track_id, m_states[track_id]);
            } catch (const persistence_error& e) {
                LOG_ERROR("track_mixer", "saving state of", track_id, "failed:", e.what());
            }
        }

        void cancel_clicks() {
            for (auto& [id, timer] : m_clicks) {
                m_clock.cancel(timer);
            }
            m_clicks.clear();
        }
    };

    track_mixer::track_mixer(transport& t, scheduler& clock, engine_config config)
        : m_pimpl(std::make_unique<impl>(t, clock, config)) {
    }

    track_mixer::~track_mixer() {
        m_pimpl->cancel_clicks();
    }

    void track_mixer::bind(const song& s, const song_mix_states& states) {
        auto& d = *m_pimpl;
        d.cancel_clicks();
        d.m_song_id = s.id;
        d.m_order = s.track_ids();
        d.m_states.clear();
        for (const auto& id : d.m_order) {
            auto it = states.find(id);
            if (it != states.end()) {
                d.m_states[id] = it->second;
            } else {
                track_mix_state fresh;
                fresh.volume = std::clamp(d.m_config.default_volume, 0.0f, 1.0f);
                d.m_states[id] = fresh;
            }
        }
        d.apply_all_gains();
        d.mirror_all();
        LOG_DEBUG("track_mixer", "bound to song", s.id, "with", d.m_order.size(), "tracks");
        d.m_on_changed.emit(d.m_states);
    }

    void track_mixer::unbind() {
        auto& d = *m_pimpl;
        d.cancel_clicks();
        d.m_song_id.clear();
        d.m_order.clear();
        d.m_states.clear();
    }

    bool track_mixer::is_bound() const {
        return !m_pimpl->m_song_id.empty();
    }

    const std::string& track_mixer::song_id() const {
        return m_pimpl->m_song_id;
    }

    void track_mixer::set_store(track_state_store* store) {
        m_pimpl->m_store = store;
    }

    void track_mixer::set_volume(const std::string& track_id, float volume) {
        auto& d = *m_pimpl;
        if (!d.knows(track_id)) {
            return;
        }
        d.m_states[track_id].volume = std::clamp(volume, 0.0f, 1.0f);
        d.apply_gain(track_id);
        d.persist(track_id);
        d.m_on_changed.emit(d.m_states);
    }

    void track_mixer::toggle_mute(const std::string& track_id) {
        auto& d = *m_pimpl;
        if (!d.knows(track_id)) {
            return;
        }
        auto& s = d.m_states[track_id];
        s.mute = !s.mute;
        LOG_DEBUG("track_mixer", track_id, s.mute ? "muted" : "unmuted");
        d.apply_all_gains();
        d.mirror_to_transport(track_id);
        d.persist(track_id);
        d.m_on_changed.emit(d.m_states);
    }

    void track_mixer::toggle_solo(const std::string& track_id) {
        auto& d = *m_pimpl;
        if (!d.knows(track_id)) {
            return;
        }
        auto& s = d.m_states[track_id];
        s.solo = !s.solo;
        LOG_DEBUG("track_mixer", track_id, s.solo ? "soloed" : "unsoloed");
        d.apply_all_gains();
        d.mirror_to_transport(track_id);
        d.persist(track_id);
        d.m_on_changed.emit(d.m_states);
    }

    void track_mixer::classify_click(const std::string& track_id) {
        auto& d = *m_pimpl;
        if (!d.knows(track_id)) {
            return;
        }
        auto it = d.m_clicks.find(track_id);
        if (it != d.m_clicks.end()) {
            // Second press inside the window
            d.m_clock.cancel(it->second);
            d.m_clicks.erase(it);
            toggle_mute(track_id);
            return;
        }
        d.m_clicks[track_id] = d.m_clock.schedule(d.m_config.click_window, [this, track_id]() {
            m_pimpl->m_clicks.erase(track_id);
            toggle_solo(track_id);
        });
    }

    bool track_mixer::click_pending(const std::string& track_id) const {
        return m_pimpl->m_clicks.count(track_id) > 0;
    }

    void track_mixer::apply_remote(const song_mix_states& states) {
        auto& d = *m_pimpl;
        if (!is_bound()) {
            return;
        }
        for (const auto& [id, remote] : states) {
            auto it = d.m_states.find(id);
            if (it != d.m_states.end()) {
                it->second = remote;
            }
        }
        d.apply_all_gains();
        d.mirror_all();
        d.m_on_changed.emit(d.m_states);
    }

    float track_mixer::effective_gain(const std::string& track_id) const {
        return resolve_gain(track_id, m_pimpl->m_states);
    }

    track_mix_state track_mixer::state(const std::string& track_id) const {
        auto it = m_pimpl->m_states.find(track_id);
        if (it == m_pimpl->m_states.end()) {
            throw state_error("unknown track '" + track_id + "'");
        }
        return it->second;
    }

    const song_mix_states& track_mixer::snapshot() const {
        return m_pimpl->m_states;
    }

    std::map<std::string, float> track_mixer::volumes() const {
        std::map<std::string, float> out;
        for (const auto& [id, s] : m_pimpl->m_states) {
            out[id] = s.volume;
        }
        return out;
    }

    event<const song_mix_states&>& track_mixer::on_mix_changed() {
        return m_pimpl->m_on_changed;
    }

} // namespace stemdeck

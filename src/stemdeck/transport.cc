// This is copyrighted software. More information is at the end of this file.
#include <stemdeck/transport.hh>
#include <stemdeck/error.hh>
#include <stemdeck/fan_out.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <chrono>
#include <future>
#include <list>
#include <set>
#include <string>
#include <system_error>

namespace stemdeck {

    const char* to_string(transport_phase phase) {
        switch (phase) {
            case transport_phase::idle:     return "idle";
            case transport_phase::loading:  return "loading";
            case transport_phase::ready:    return "ready";
            case transport_phase::playing:  return "playing";
            case transport_phase::paused:   return "paused";
            case transport_phase::seeking:  return "seeking";
            case transport_phase::finished: return "finished";
        }
        return "unknown";
    }

    namespace {
        struct pending_load {
            std::uint64_t generation = 0;
            song target;
            std::future<std::vector<channel_slot>> result;
        };

        bool is_settled(std::future<std::vector<channel_slot>>& f) {
            return f.wait_for(std::chrono::seconds(0)) != std::future_status::timeout;
        }

        void log_failures(const char* operation, const std::vector<channel_slot*>& slots,
                          const std::vector<fan_out_result>& results) {
            const auto failed = count_failures(results);
            if (failed == 0) {
                return;
            }
            LOG_WARN("transport", operation, "failed on", failed, "of", results.size(), "tracks");
            for (const auto& r : results) {
                if (!r.ok) {
                    LOG_WARN("transport", operation, "failed on track", slots[r.index]->source.id, ":", r.error);
                }
            }
        }
    }

    struct transport::impl {
        impl(std::shared_ptr<channel_factory> factory, scheduler& clock, engine_config config)
            : m_factory(std::move(factory)),
              m_clock(clock),
              m_config(config) {
        }

        std::shared_ptr<channel_factory> m_factory;
        scheduler& m_clock;
        engine_config m_config;

        std::unique_ptr<playback_context> m_context;
        std::unique_ptr<pending_load> m_pending;
        std::list<pending_load> m_superseded;
        std::uint64_t m_generation = 0;

        transport_phase m_phase = transport_phase::idle;
        transport_state m_idle_state;
        double m_speed = 1.0;
        bool m_seeking = false;
        std::set<std::string> m_unmeasured;
        scheduler::timer_id m_tick = scheduler::invalid_timer;

        event<const song&> m_on_ready;
        event<const transport_state&> m_on_changed;
        event<> m_on_finished;

        transport_state& state() {
            return m_context ? m_context->state() : m_idle_state;
        }

        void set_phase(transport_phase phase) {
            if (phase != m_phase) {
                LOG_DEBUG("transport", to_string(m_phase), "->", to_string(phase));
                m_phase = phase;
            }
        }

        void changed() {
            m_on_changed.emit(state());
        }

        // ------------------------------------------------------------------
        // Loading
        // ------------------------------------------------------------------

        void supersede_pending() {
            if (m_pending) {
                LOG_INFO("transport", "load of song", m_pending->target.id, "superseded");
                m_superseded.push_back(std::move(*m_pending));
                m_pending.reset();
            }
        }

        void drain_superseded(bool block) {
            for (auto it = m_superseded.begin(); it != m_superseded.end();) {
                if (!block && !is_settled(it->result)) {
                    ++it;
                    continue;
                }
                auto slots = it->result.get();
                release_channels(slots, "load superseded");
                it = m_superseded.erase(it);
            }
        }

        void start_load(const song& s) {
            std::vector<channel_slot> slots;
            slots.reserve(s.tracks.size());
            for (const auto& t : s.tracks) {
                channel_slot slot;
                slot.source = t;
                slot.handle = m_factory->create();
                slots.push_back(std::move(slot));
            }

            // Shared so the task is still intact if launching a thread fails
            auto owned = std::make_shared<std::vector<channel_slot>>(std::move(slots));
            auto task = [owned]() {
                std::vector<channel_slot*> targets;
                for (auto& slot : *owned) {
                    targets.push_back(&slot);
                }
                auto results = fan_out(targets, [](channel_slot* slot) {
                    slot->handle->load(slot->source.path);
                });
                for (const auto& r : results) {
                    targets[r.index]->usable = r.ok;
                    targets[r.index]->error = r.error;
                }
                return std::move(*owned);
            };

            auto pending = std::make_unique<pending_load>();
            pending->generation = ++m_generation;
            pending->target = s;
            try {
                pending->result = std::async(std::launch::async, task);
            } catch (const std::system_error& e) {
                LOG_WARN("transport", "no loader thread available, loading on demand:", e.what());
                pending->result = std::async(std::launch::deferred, task);
            }
            m_pending = std::move(pending);
        }

        bool complete_pending() {
            if (!m_pending) {
                return false;
            }
            auto done = std::move(m_pending);
            auto slots = done->result.get();
            if (done->generation != m_generation) {
                release_channels(slots, "load superseded");
                return false;
            }

            std::size_t failures = 0;
            for (const auto& slot : slots) {
                if (!slot.usable) {
                    ++failures;
                    LOG_WARN("transport", "track", slot.source.id, "failed to load:", slot.error);
                }
            }

            m_unmeasured.clear();
            m_context = std::make_unique<playback_context>(done->target, std::move(slots), done->generation);
            auto& st = m_context->state();
            st.playback_speed = m_speed;
            set_phase(transport_phase::ready);
            LOG_INFO("transport", "song", done->target.id, "ready,",
                     st.loaded_track_ids.size(), "channels loaded,", failures, "failed");
            m_on_ready.emit(m_context->get_song());
            return true;
        }

        void drop_context() {
            cancel_tick();
            m_seeking = false;
            if (m_context) {
                m_idle_state.playback_speed = m_speed;
                m_context.reset();
            }
        }

        // ------------------------------------------------------------------
        // Progress
        // ------------------------------------------------------------------

        void schedule_tick() {
            cancel_tick();
            const auto generation = m_context ? m_context->generation() : 0;
            m_tick = m_clock.schedule(m_config.progress_interval, [this, generation]() {
                m_tick = scheduler::invalid_timer;
                if (m_context && m_context->generation() == generation) {
                    on_tick();
                }
            });
        }

        void cancel_tick() {
            if (m_tick != scheduler::invalid_timer) {
                m_clock.cancel(m_tick);
                m_tick = scheduler::invalid_timer;
            }
        }

        void on_tick() {
            if (!m_context || m_phase != transport_phase::playing) {
                return;
            }
            if (m_seeking) {
                schedule_tick();
                return;
            }

            auto active = m_context->active_slots();
            std::size_t considered = 0;
            bool all_done = true;
            bool position_taken = false;
            auto& st = m_context->state();
            for (auto* slot : active) {
                channel_status s;
                try {
                    s = slot->handle->status();
                } catch (const channel_error& e) {
                    // Excluded like a channel that failed to load
                    LOG_WARN("transport", "status of", slot->source.id, "failed, excluding track:", e.what());
                    slot->usable = false;
                    st.loaded_track_ids.erase(slot->source.id);
                    continue;
                }
                if (!s.loaded || s.duration_seconds <= 0.0) {
                    if (m_unmeasured.insert(slot->source.id).second) {
                        LOG_WARN("transport", "track", slot->source.id, "reports no duration, not considered for finish");
                    }
                    continue;
                }
                if (!position_taken) {
                    st.seek_position_seconds = s.position_seconds;
                    position_taken = true;
                }
                ++considered;
                if (s.position_seconds < s.duration_seconds) {
                    all_done = false;
                }
            }

            if (considered > 0 && all_done) {
                finish();
                return;
            }
            schedule_tick();
        }

        void finish() {
            auto& st = m_context->state();
            st.is_playing = false;
            st.finished = true;
            set_phase(transport_phase::finished);
            LOG_INFO("transport", "song", m_context->get_song().id, "finished");
            changed();
            m_on_finished.emit();
        }

        double sample_position() {
            if (!m_context) {
                return 0.0;
            }
            auto& st = m_context->state();
            if (m_phase != transport_phase::playing) {
                return st.seek_position_seconds;
            }
            for (auto* slot : m_context->active_slots()) {
                try {
                    auto s = slot->handle->status();
                    if (s.loaded) {
                        st.seek_position_seconds = s.position_seconds;
                        break;
                    }
                } catch (const channel_error& e) {
                    LOG_WARN("transport", "status of", slot->source.id, "failed:", e.what());
                }
            }
            return st.seek_position_seconds;
        }

        void start_channels(double position) {
            auto slots = m_context->active_slots();
            const double speed = m_speed;
            auto results = fan_out(slots, [position, speed](channel_slot* slot) {
                slot->handle->set_position(position);
                slot->handle->set_rate(speed);
                slot->handle->play();
            });
            log_failures("play", slots, results);
        }

        void stop_channels() {
            auto slots = m_context->usable_slots();
            auto results = fan_out(slots, [](channel_slot* slot) {
                slot->handle->stop();
            });
            log_failures("stop", slots, results);
        }
    };

    transport::transport(std::shared_ptr<channel_factory> factory, scheduler& clock, engine_config config)
        : m_pimpl(std::make_unique<impl>(std::move(factory), clock, config)) {
        if (!m_pimpl->m_factory) {
            THROW_RUNTIME("transport requires a channel factory");
        }
    }

    transport::~transport() {
        m_pimpl->cancel_tick();
        m_pimpl->supersede_pending();
        m_pimpl->drain_superseded(true);
        m_pimpl->m_context.reset();
    }

    void transport::load(const song& s) {
        LOG_INFO("transport", "loading song", s.id, "with", s.tracks.size(), "tracks");
        m_pimpl->supersede_pending();
        m_pimpl->drop_context();
        m_pimpl->set_phase(transport_phase::loading);
        m_pimpl->start_load(s);
    }

    bool transport::poll() {
        m_pimpl->drain_superseded(false);
        if (m_pimpl->m_pending && is_settled(m_pimpl->m_pending->result)) {
            return m_pimpl->complete_pending();
        }
        return false;
    }

    bool transport::wait_for_load() {
        m_pimpl->drain_superseded(false);
        if (!m_pimpl->m_pending) {
            return false;
        }
        m_pimpl->m_pending->result.wait();
        return m_pimpl->complete_pending();
    }

    void transport::unload() {
        m_pimpl->supersede_pending();
        // Invalidate any completion still in flight
        ++m_pimpl->m_generation;
        m_pimpl->drop_context();
        m_pimpl->set_phase(transport_phase::idle);
    }

    void transport::play() {
        auto& d = *m_pimpl;
        if (!d.m_context) {
            LOG_WARN("transport", "play ignored: no song loaded");
            return;
        }
        switch (d.m_phase) {
            case transport_phase::ready:
            case transport_phase::paused:
                break;
            case transport_phase::finished:
                d.m_context->state().seek_position_seconds = 0.0;
                break;
            case transport_phase::playing:
                return;
            default:
                LOG_WARN("transport", "play ignored in state", to_string(d.m_phase));
                return;
        }
        auto& st = d.m_context->state();
        d.start_channels(st.seek_position_seconds);
        st.is_playing = true;
        st.finished = false;
        d.set_phase(transport_phase::playing);
        d.schedule_tick();
        d.changed();
    }

    void transport::pause() {
        auto& d = *m_pimpl;
        if (!d.m_context || d.m_phase != transport_phase::playing) {
            LOG_WARN("transport", "pause ignored in state", to_string(d.m_phase));
            return;
        }
        d.sample_position();
        auto slots = d.m_context->usable_slots();
        auto results = fan_out(slots, [](channel_slot* slot) {
            slot->handle->pause();
        });
        log_failures("pause", slots, results);
        d.cancel_tick();
        d.m_context->state().is_playing = false;
        d.set_phase(transport_phase::paused);
        d.changed();
    }

    void transport::stop() {
        auto& d = *m_pimpl;
        if (!d.m_context) {
            return;
        }
        d.cancel_tick();
        d.stop_channels();
        auto& st = d.m_context->state();
        st.seek_position_seconds = 0.0;
        st.is_playing = false;
        st.finished = false;
        d.set_phase(transport_phase::ready);
        d.changed();
    }

    void transport::seek(double seconds) {
        auto& d = *m_pimpl;
        if (!d.m_context) {
            LOG_WARN("transport", "seek ignored: no song loaded");
            return;
        }
        const double target = std::max(0.0, seconds);
        const auto before = d.m_phase;
        auto& st = d.m_context->state();

        d.m_seeking = true;
        d.set_phase(transport_phase::seeking);
        auto slots = d.m_context->usable_slots();
        auto results = fan_out(slots, [target](channel_slot* slot) {
            slot->handle->set_position(target);
        });
        log_failures("seek", slots, results);
        st.seek_position_seconds = target;

        if (before == transport_phase::finished) {
            st.finished = false;
            d.set_phase(transport_phase::paused);
        } else {
            d.set_phase(before);
        }
        d.m_seeking = false;
        d.changed();
    }

    void transport::set_speed(double multiplier) {
        auto& d = *m_pimpl;
        if (!(multiplier > 0.0)) {
            throw state_error("playback speed must be positive");
        }
        d.m_speed = multiplier;
        if (!d.m_context) {
            d.m_idle_state.playback_speed = multiplier;
            return;
        }
        auto slots = d.m_context->usable_slots();
        auto results = fan_out(slots, [multiplier](channel_slot* slot) {
            slot->handle->set_rate(multiplier);
        });
        log_failures("set_rate", slots, results);
        d.m_context->state().playback_speed = multiplier;
        d.changed();
    }

    void transport::restart() {
        auto& d = *m_pimpl;
        if (!d.m_context) {
            LOG_WARN("transport", "restart ignored: no song loaded");
            return;
        }
        d.cancel_tick();
        d.stop_channels();
        auto& st = d.m_context->state();
        st.seek_position_seconds = 0.0;
        st.is_playing = false;
        st.finished = false;
        d.set_phase(transport_phase::ready);
        play();
    }

    void transport::skip_forward() {
        auto& d = *m_pimpl;
        if (!d.m_context) {
            return;
        }
        double target = d.sample_position() + d.m_config.skip_seconds;
        const double length = duration();
        if (length > 0.0) {
            target = std::min(target, length);
        }
        seek(target);
    }

    void transport::skip_backward() {
        auto& d = *m_pimpl;
        if (!d.m_context) {
            return;
        }
        seek(std::max(0.0, d.sample_position() - d.m_config.skip_seconds));
    }

    void transport::set_track_active(const std::string& track_id, bool active) {
        auto& d = *m_pimpl;
        if (!d.m_context) {
            return;
        }
        auto* slot = d.m_context->find(track_id);
        if (!slot) {
            LOG_WARN("transport", "unknown track", track_id);
            return;
        }
        auto& st = d.m_context->state();
        const bool was_active = st.active_track_ids.count(track_id) > 0;
        if (active == was_active) {
            return;
        }
        // Position of the tracks that were already active
        const double position = d.sample_position();
        if (active) {
            st.active_track_ids.insert(track_id);
        } else {
            st.active_track_ids.erase(track_id);
        }
        if (!slot->usable || d.m_phase != transport_phase::playing) {
            return;
        }

        try {
            if (active) {
                slot->handle->set_position(position);
                slot->handle->set_rate(d.m_speed);
                slot->handle->play();
            } else {
                slot->handle->pause();
            }
        } catch (const channel_error& e) {
            LOG_WARN("transport", "track", track_id, active ? "start" : "pause", "failed:", e.what());
        }
    }

    void transport::set_track_soloed(const std::string& track_id, bool soloed) {
        auto& d = *m_pimpl;
        if (!d.m_context) {
            return;
        }
        if (!d.m_context->find(track_id)) {
            LOG_WARN("transport", "unknown track", track_id);
            return;
        }
        auto& ids = d.m_context->state().soloed_track_ids;
        if (soloed) {
            ids.insert(track_id);
        } else {
            ids.erase(track_id);
        }
    }

    double transport::position() const {
        return m_pimpl->sample_position();
    }

    double transport::duration() const {
        auto& d = *m_pimpl;
        if (!d.m_context) {
            return 0.0;
        }
        for (auto* slot : d.m_context->active_slots()) {
            try {
                const auto s = slot->handle->status();
                if (s.loaded) {
                    return s.duration_seconds;
                }
            } catch (const channel_error& e) {
                LOG_WARN("transport", "status of", slot->source.id, "failed:", e.what());
            }
        }
        return 0.0;
    }

    transport_phase transport::phase() const {
        return m_pimpl->m_phase;
    }

    bool transport::has_song() const {
        return m_pimpl->m_context != nullptr;
    }

    bool transport::is_seeking() const {
        return m_pimpl->m_seeking;
    }

    const transport_state& transport::state() const {
        return m_pimpl->state();
    }

    double transport::playback_speed() const {
        return m_pimpl->m_speed;
    }

    playback_context* transport::context() {
        return m_pimpl->m_context.get();
    }

    const playback_context* transport::context() const {
        return m_pimpl->m_context.get();
    }

    event<const song&>& transport::on_ready() {
        return m_pimpl->m_on_ready;
    }

    event<const transport_state&>& transport::on_transport_changed() {
        return m_pimpl->m_on_changed;
    }

    event<>& transport::on_finished() {
        return m_pimpl->m_on_finished;
    }

} // namespace stemdeck


/*
 * Copyright (C) 2025
 *
 * This file is part of stemdeck.
 *
 * stemdeck is free software: you can redistribute it and/or modify it under the
 * terms of the GNU Lesser General Public License as published by the Free
 * Software Foundation, either version 3 of the License, or (at your option) any
 * later version.
 *
 * stemdeck is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR
 * A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with stemdeck.  If not, see <http://www.gnu.org/licenses/>.
 */

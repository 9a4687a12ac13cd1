/**
 * @file transport.hh
 * @brief Multi-channel playback transport
 * @ingroup transport
 */

// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <memory>
#include <string>
#include <stemdeck/channel.hh>
#include <stemdeck/clock.hh>
#include <stemdeck/engine_config.hh>
#include <stemdeck/event.hh>
#include <stemdeck/playback_context.hh>
#include <stemdeck/types.hh>
#include <stemdeck/export_stemdeck.h>

namespace stemdeck {

    enum class transport_phase {
        idle,
        loading,
        ready,
        playing,
        paused,
        seeking,
        finished
    };

    STEMDECK_EXPORT const char* to_string(transport_phase phase);

    /**
     * @class transport
     * @brief Keeps the channels of one song moving together
     * @ingroup transport
     *
     * The transport owns the playback_context of the current song. Every
     * command is issued to all usable channels at once through fan_out and
     * returns only after each channel settled. A channel that fails to load
     * is excluded from all later batches of that load; a channel that fails
     * any other command is logged and ignored. Channel errors never reach
     * the caller.
     *
     * ## State Machine
     *
     * @code
     * idle -> loading -> ready <-> playing <-> paused
     * playing -> seeking -> playing | paused
     * playing -> finished -> playing (restart)
     * @endcode
     *
     * All methods must be called from the control thread. Loading runs in
     * the background; its completion is delivered by poll() or
     * wait_for_load().
     *
     * @code
     * stemdeck::transport t(factory, clock, config);
     * t.on_ready().connect([&](const stemdeck::song&) { t.play(); });
     * t.load(song);
     * while (running) {
     *     t.poll();
     *     clock.run_due();
     * }
     * @endcode
     */
    class STEMDECK_EXPORT transport {
        public:
            transport(std::shared_ptr<channel_factory> factory, scheduler& clock, engine_config config = {});
            ~transport();

            transport(const transport&) = delete;
            transport& operator=(const transport&) = delete;

            /**
             * @brief Switch to @p s
             *
             * Unloads the previous song, then loads one channel per track in
             * parallel in the background. A load that is superseded by a later
             * load() or unload() is discarded when it settles.
             */
            void load(const song& s);

            /**
             * @brief Complete a settled background load, if any
             * @return true if a load was completed and on_ready emitted
             */
            bool poll();

            /**
             * @brief Block until the pending load settled, then complete it
             * @return true if a load was completed
             */
            bool wait_for_load();

            void unload();

            void play();
            void pause();

            /**
             * @brief Stop all channels and rewind to the beginning
             */
            void stop();

            /**
             * @brief Move every channel to @p seconds (negative values clamp to 0)
             */
            void seek(double seconds);

            /**
             * @brief Set the playback rate of every channel
             * @throws state_error if @p multiplier is not positive
             */
            void set_speed(double multiplier);

            /**
             * @brief Stop, rewind and play again
             */
            void restart();

            void skip_forward();
            void skip_backward();

            /**
             * @brief Mark a track audible (unmuted) or not
             *
             * A track activated while playing starts at the current position.
             */
            void set_track_active(const std::string& track_id, bool active);
            void set_track_soloed(const std::string& track_id, bool soloed);

            /// Current position, sampled from the first active channel while playing
            [[nodiscard]] double position() const;
            /// Duration of the first active track, 0 without a song
            [[nodiscard]] double duration() const;

            [[nodiscard]] transport_phase phase() const;
            [[nodiscard]] bool has_song() const;
            [[nodiscard]] bool is_seeking() const;
            [[nodiscard]] const transport_state& state() const;
            [[nodiscard]] double playback_speed() const;

            /// Context of the current song, nullptr while idle or loading
            [[nodiscard]] playback_context* context();
            [[nodiscard]] const playback_context* context() const;

            event<const song&>& on_ready();
            event<const transport_state&>& on_transport_changed();
            event<>& on_finished();

        private:
            struct impl;
            std::unique_ptr<impl> m_pimpl;
    };

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

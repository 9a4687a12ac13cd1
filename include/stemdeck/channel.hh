/**
 * @file channel.hh
 * @brief Channel handle interface
 * @ingroup channels
 */

// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <memory>
#include <string>
#include <stemdeck/export_stemdeck.h>

namespace stemdeck {

    /**
     * @brief Playback status reported by a channel
     */
    struct channel_status {
        bool loaded = false;
        bool playing = false;
        double position_seconds = 0.0;
        double duration_seconds = 0.0;
    };

    /**
     * @class channel
     * @brief One independently controllable decoded audio resource
     * @ingroup channels
     *
     * A channel plays exactly one track of a song. The transport drives one
     * channel per track and issues every command through a fan-out batch, so
     * operations may be called from worker threads. A single channel never
     * receives two commands concurrently.
     *
     * Every operation reports failure by throwing channel_error.
     *
     * ## State Machine
     *
     * - **Unloaded**: initial state; only load() is valid
     * - **Stopped / Paused**: loaded, position held
     * - **Playing**: position advances at the current rate
     *
     * @see channel_factory, transport
     */
    class STEMDECK_EXPORT channel {
        public:
            virtual ~channel();

            /**
             * @brief Decode and prepare the resource for playback
             * @param resource_ref Opaque reference taken from track::path
             * @throws channel_error if the resource cannot be loaded
             */
            virtual void load(const std::string& resource_ref) = 0;

            /**
             * @brief Release the decoded resource
             */
            virtual void unload() = 0;

            virtual void play() = 0;
            virtual void pause() = 0;

            /**
             * @brief Stop playback and rewind to the beginning
             */
            virtual void stop() = 0;

            virtual void set_position(double seconds) = 0;

            /**
             * @brief Set playback rate multiplier (1.0 = normal speed)
             */
            virtual void set_rate(double multiplier) = 0;

            /**
             * @brief Set output gain in [0, 1]
             */
            virtual void set_gain(float gain) = 0;

            [[nodiscard]] virtual channel_status status() const = 0;
    };

    /**
     * @brief Creates channels for one output backend
     */
    class STEMDECK_EXPORT channel_factory {
        public:
            virtual ~channel_factory();

            [[nodiscard]] virtual std::unique_ptr<channel> create() = 0;

            [[nodiscard]] virtual std::string get_name() const = 0;
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

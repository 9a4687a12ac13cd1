// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <stdexcept>
#include <string>

namespace stemdeck {

/**
 * @brief Base exception class for all stemdeck errors
 *
 * All stemdeck-specific exceptions derive from this class, making it easy
 * to catch all stemdeck errors with a single catch block.
 */
class stemdeck_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Audio channel related errors
 *
 * Thrown by channel handles when an operation on a single channel fails, such as:
 * - Audio resource not found or not decodable
 * - Operation on a channel that is not loaded
 * - Output device refused the command
 *
 * Channel errors never leave the transport: fan-out batches catch them and
 * exclude the channel from further commands.
 */
class channel_error : public stemdeck_error {
public:
    using stemdeck_error::stemdeck_error;
};

/**
 * @brief Track state persistence errors
 *
 * Thrown by the track state store when reading or writing mixer
 * preferences fails, or when no user is set.
 */
class persistence_error : public stemdeck_error {
public:
    using stemdeck_error::stemdeck_error;
};

/**
 * @brief Session synchronization errors
 *
 * Thrown when a session operation is attempted in the wrong role or the
 * session document cannot be created or joined.
 */
class session_error : public stemdeck_error {
public:
    using stemdeck_error::stemdeck_error;
};

/**
 * @brief Remote document store errors
 *
 * Thrown by document store implementations, such as:
 * - Invalid path
 * - Backend unavailable
 * - Value rejected
 */
class store_error : public stemdeck_error {
public:
    using stemdeck_error::stemdeck_error;
};

/**
 * @brief State related errors
 *
 * Thrown when operations are attempted in invalid states, such as:
 * - Navigating a queue that was never started
 * - Looking up a song that is not in the content store
 * - Setting a non-positive playback speed
 */
class state_error : public stemdeck_error {
public:
    using stemdeck_error::stemdeck_error;
};

/**
 * @brief Configuration errors
 *
 * Thrown when a configuration file cannot be read or holds invalid values.
 */
class config_error : public stemdeck_error {
public:
    using stemdeck_error::stemdeck_error;
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

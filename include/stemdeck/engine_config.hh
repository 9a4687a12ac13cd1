#pragma once

#include <chrono>
#include <string>
#include <nlohmann/json_fwd.hpp>
#include <stemdeck/export_stemdeck.h>

namespace stemdeck {

    /**
     * @brief Tunables of the playback engine
     *
     * Every timing and tolerance the mixer, transport and session
     * synchronization use lives here, so deployments can adjust them
     * without touching code.
     */
    struct STEMDECK_EXPORT engine_config {
        /// Second press within this window turns a solo click into a mute
        std::chrono::milliseconds click_window{300};
        /// Period of the transport progress tick
        std::chrono::milliseconds progress_interval{50};
        /// Minimum interval between two snapshots applied by a follower
        std::chrono::milliseconds sync_debounce{100};
        /// Follower seeks only when it is further than this from the admin
        double seek_tolerance_seconds = 0.1;
        /// Follower adopts the admin speed only beyond this difference
        double speed_tolerance = 0.001;
        /// Step of skip_forward / skip_backward
        double skip_seconds = 10.0;
        /// Volume of a freshly initialized track state
        float default_volume = 1.0f;
        /// When the admin leaves, the session document is removed
        bool admin_leave_deletes_session = true;

        /**
         * Validate configuration values.
         *
         * @param error Optional output string describing the first validation error.
         * @return true if the configuration is valid.
         */
        bool validate(std::string* error = nullptr) const;

        /**
         * Build a configuration from a JSON object.
         *
         * Keys are the field names; durations are given in milliseconds.
         * Unknown keys are ignored, missing keys keep their defaults.
         *
         * @throws config_error on wrong value types or invalid values
         */
        static engine_config from_json(const nlohmann::json& j);
    };

    /**
     * @brief Read an engine_config from a JSON file
     * @throws config_error if the file cannot be read or parsed
     */
    STEMDECK_EXPORT engine_config load_engine_config(const std::string& path);

} // namespace stemdeck

#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>
#include <stemdeck/export_stemdeck.h>

namespace stemdeck {

    /**
     * @brief One stem of a song
     *
     * Immutable during a playback session.
     */
    struct STEMDECK_EXPORT track {
        std::string id;
        std::string name;
        /// Opaque audio resource reference handed to the channel handle
        std::string path;
    };

    /**
     * @brief A song as delivered by the content store
     */
    struct STEMDECK_EXPORT song {
        std::string id;
        std::string title;
        std::string artist;
        std::vector<track> tracks;

        [[nodiscard]] const track* find_track(const std::string& track_id) const;
        [[nodiscard]] std::vector<std::string> track_ids() const;
    };

    /**
     * @brief Per (user, song, track) mixer preference
     */
    struct STEMDECK_EXPORT track_mix_state {
        float volume = 1.0f;
        bool mute = false;
        bool solo = false;

        bool operator==(const track_mix_state& other) const;
        bool operator!=(const track_mix_state& other) const { return !(*this == other); }
    };

    /// Mixer preferences of one song keyed by track id
    using song_mix_states = std::map<std::string, track_mix_state>;

    /**
     * @brief Live transport state of the current song
     *
     * Exactly one instance exists per loaded song; it lives inside the
     * playback_context and dies with it.
     */
    struct STEMDECK_EXPORT transport_state {
        std::set<std::string> loaded_track_ids;
        /// Unmuted tracks
        std::set<std::string> active_track_ids;
        std::set<std::string> soloed_track_ids;
        double seek_position_seconds = 0.0;
        bool is_playing = false;
        double playback_speed = 1.0;
        bool finished = false;
    };

    /**
     * @brief Transport state as written to a shared session document
     */
    struct STEMDECK_EXPORT transport_snapshot {
        bool is_playing = false;
        double seek_position = 0.0;
        std::vector<std::string> active_tracks;
        std::vector<std::string> soloed_tracks;
        std::map<std::string, float> track_volumes;
        double playback_speed = 1.0;

        static transport_snapshot from_state(const transport_state& state,
                                             const std::map<std::string, float>& volumes = {});
    };

    // JSON mapping used by the document stores. Missing keys fall back to defaults.
    STEMDECK_EXPORT void to_json(nlohmann::json& j, const track_mix_state& s);
    STEMDECK_EXPORT void from_json(const nlohmann::json& j, track_mix_state& s);
    STEMDECK_EXPORT void to_json(nlohmann::json& j, const transport_snapshot& s);
    STEMDECK_EXPORT void from_json(const nlohmann::json& j, transport_snapshot& s);

} // namespace stemdeck

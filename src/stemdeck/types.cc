#include <stemdeck/types.hh>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>

namespace stemdeck {

    const track* song::find_track(const std::string& track_id) const {
        auto it = std::find_if(tracks.begin(), tracks.end(),
                               [&track_id](const track& t) { return t.id == track_id; });
        return it == tracks.end() ? nullptr : &*it;
    }

    std::vector<std::string> song::track_ids() const {
        std::vector<std::string> ids;
        ids.reserve(tracks.size());
        for (const auto& t : tracks) {
            ids.push_back(t.id);
        }
        return ids;
    }

    bool track_mix_state::operator==(const track_mix_state& other) const {
        return std::fabs(volume - other.volume) < 1e-6f && mute == other.mute && solo == other.solo;
    }

    transport_snapshot transport_snapshot::from_state(const transport_state& state,
                                                      const std::map<std::string, float>& volumes) {
        transport_snapshot snap;
        snap.is_playing = state.is_playing;
        snap.seek_position = state.seek_position_seconds;
        snap.active_tracks.assign(state.active_track_ids.begin(), state.active_track_ids.end());
        snap.soloed_tracks.assign(state.soloed_track_ids.begin(), state.soloed_track_ids.end());
        snap.track_volumes = volumes;
        snap.playback_speed = state.playback_speed;
        return snap;
    }

    void to_json(nlohmann::json& j, const track_mix_state& s) {
        j = nlohmann::json{{"volume", s.volume}, {"mute", s.mute}, {"solo", s.solo}};
    }

    void from_json(const nlohmann::json& j, track_mix_state& s) {
        track_mix_state defaults;
        if (!j.is_object()) {
            s = defaults;
            return;
        }
        s.volume = std::clamp(j.value("volume", defaults.volume), 0.0f, 1.0f);
        s.mute = j.value("mute", defaults.mute);
        s.solo = j.value("solo", defaults.solo);
    }

    void to_json(nlohmann::json& j, const transport_snapshot& s) {
        j = nlohmann::json{
            {"isPlaying", s.is_playing},
            {"seekPosition", s.seek_position},
            {"activeTracks", s.active_tracks},
            {"soloedTracks", s.soloed_tracks},
            {"trackVolumes", s.track_volumes},
            {"playbackSpeed", s.playback_speed}
        };
    }

    void from_json(const nlohmann::json& j, transport_snapshot& s) {
        transport_snapshot defaults;
        if (!j.is_object()) {
            s = defaults;
            return;
        }
        s.is_playing = j.value("isPlaying", defaults.is_playing);
        s.seek_position = j.value("seekPosition", defaults.seek_position);
        s.active_tracks = j.value("activeTracks", defaults.active_tracks);
        s.soloed_tracks = j.value("soloedTracks", defaults.soloed_tracks);
        s.track_volumes = j.value("trackVolumes", defaults.track_volumes);
        s.playback_speed = j.value("playbackSpeed", defaults.playback_speed);
        // A zero speed in the document means "unset"
        if (s.playback_speed <= 0.0) {
            s.playback_speed = defaults.playback_speed;
        }
    }

} // namespace stemdeck

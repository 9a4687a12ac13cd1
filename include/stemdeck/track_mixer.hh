/**
 * @file track_mixer.hh
 * @brief Solo, mute and volume resolution for the tracks of a song
 * @ingroup mixer
 */

#pragma once

#include <map>
#include <memory>
#include <string>
#include <stemdeck/clock.hh>
#include <stemdeck/engine_config.hh>
#include <stemdeck/event.hh>
#include <stemdeck/types.hh>
#include <stemdeck/export_stemdeck.h>

namespace stemdeck {

    class transport;
    class track_state_store;

    /**
     * @brief Gain of @p track_id under the solo/mute rule
     *
     * A muted track is silent. Otherwise, when any track is soloed, only
     * soloed tracks are heard at their volume. Otherwise every track plays
     * at its volume. Unknown tracks are silent.
     */
    STEMDECK_EXPORT float resolve_gain(const std::string& track_id, const song_mix_states& states);

    /**
     * @class track_mixer
     * @brief Owns the mix state of the current song and applies it to the channels
     * @ingroup mixer
     *
     * The mixer state is authoritative: a channel that refuses a gain is
     * logged and left alone. Every local mutation is written through to the
     * track state store (failures are logged, never surfaced) and mirrored
     * into the transport's active and soloed track sets.
     *
     * ## Click classification
     *
     * classify_click() turns raw presses into gestures. The first press on
     * a track opens a click_window; a second press inside it mutes, and a
     * window that expires without a second press solos. Each track has its
     * own window.
     *
     * @code
     * mixer.classify_click("drums");   // window opens
     * clock.advance(300ms);             // window expires: drums soloed
     * @endcode
     */
    class STEMDECK_EXPORT track_mixer {
        public:
            track_mixer(transport& t, scheduler& clock, engine_config config = {});
            ~track_mixer();

            track_mixer(const track_mixer&) = delete;
            track_mixer& operator=(const track_mixer&) = delete;

            /**
             * @brief Take over the mix state of a freshly loaded song
             *
             * Tracks of @p s missing from @p states get the default state.
             * Applies every gain and the transport track sets.
             */
            void bind(const song& s, const song_mix_states& states);
            void unbind();
            [[nodiscard]] bool is_bound() const;
            [[nodiscard]] const std::string& song_id() const;

            /// Write-through target; nullptr disables persistence
            void set_store(track_state_store* store);

            /**
             * @brief Set the volume of one track, clamped to [0, 1]
             */
            void set_volume(const std::string& track_id, float volume);
            void toggle_mute(const std::string& track_id);
            void toggle_solo(const std::string& track_id);

            /// Feed one press of the solo/mute control of a track
            void classify_click(const std::string& track_id);
            [[nodiscard]] bool click_pending(const std::string& track_id) const;

            /**
             * @brief Replace the mix state with a remote push and re-apply every gain
             *
             * Tracks absent from @p states keep their current state. Nothing is
             * written back to the store.
             */
            void apply_remote(const song_mix_states& states);

            [[nodiscard]] float effective_gain(const std::string& track_id) const;
            [[nodiscard]] track_mix_state state(const std::string& track_id) const;
            [[nodiscard]] const song_mix_states& snapshot() const;
            /// Volume per track, as carried in session snapshots
            [[nodiscard]] std::map<std::string, float> volumes() const;

            event<const song_mix_states&>& on_mix_changed();

        private:
            struct impl;
            std::unique_ptr<impl> m_pimpl;
    };

} // namespace stemdeck

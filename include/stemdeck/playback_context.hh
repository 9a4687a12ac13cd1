#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <stemdeck/channel.hh>
#include <stemdeck/types.hh>
#include <stemdeck/export_stemdeck.h>

namespace stemdeck {

    /**
     * @brief One track of the current song and the channel playing it
     */
    struct STEMDECK_EXPORT channel_slot {
        track source;
        std::unique_ptr<channel> handle;
        /// False when the channel failed to load; excluded from every batch
        bool usable = false;
        std::string error;
    };

    /**
     * @brief Unload every channel of @p slots in parallel, best effort
     *
     * Failures are logged. Used for switched songs and for loads that were
     * superseded before they completed.
     */
    STEMDECK_EXPORT void release_channels(std::vector<channel_slot>& slots, const char* reason);

    /**
     * @class playback_context
     * @brief Everything that belongs to the currently loaded song
     *
     * Created by the transport when a load settles and destroyed on song
     * switch or unload. Destruction unloads every channel. Holds the only
     * transport_state of the device.
     */
    class STEMDECK_EXPORT playback_context {
        public:
            playback_context(song s, std::vector<channel_slot> slots, std::uint64_t generation);
            ~playback_context();

            playback_context(const playback_context&) = delete;
            playback_context& operator=(const playback_context&) = delete;

            [[nodiscard]] const song& get_song() const { return m_song; }
            [[nodiscard]] std::uint64_t generation() const { return m_generation; }

            [[nodiscard]] channel_slot* find(const std::string& track_id);
            [[nodiscard]] const channel_slot* find(const std::string& track_id) const;

            /// Loaded channels, in song track order
            [[nodiscard]] std::vector<channel_slot*> usable_slots();
            /// Loaded channels of unmuted tracks, in song track order
            [[nodiscard]] std::vector<channel_slot*> active_slots();

            [[nodiscard]] transport_state& state() { return m_state; }
            [[nodiscard]] const transport_state& state() const { return m_state; }

        private:
            song m_song;
            std::vector<channel_slot> m_slots;
            std::uint64_t m_generation;
            transport_state m_state;
    };

} // namespace stemdeck

/**
 * @file queue_controller.hh
 * @brief Playlist and filtered-list navigation on top of the transport
 * @ingroup queue
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <stemdeck/content_store.hh>
#include <stemdeck/event.hh>
#include <stemdeck/types.hh>
#include <stemdeck/export_stemdeck.h>

namespace stemdeck {

    class transport;

    enum class queue_mode {
        /// Songs start playing as soon as they are ready
        playlist,
        /// Manual navigation only loads; playback waits for the user
        filtered_list
    };

    enum class queue_phase {
        idle,
        playing,
        complete
    };

    STEMDECK_EXPORT const char* to_string(queue_phase phase);

    /**
     * @class queue_controller
     * @brief Walks an ordered list of songs through the transport
     * @ingroup queue
     *
     * When the transport finishes a song the queue restarts it
     * (repeat_single), moves on, wraps (repeat_queue) or completes. A
     * completed queue emits on_queue_complete() once and loads nothing more.
     * Songs reached by a finished song always start playing.
     *
     * With shuffle on, next, previous and automatic advance pick a random
     * song other than the current one.
     */
    class STEMDECK_EXPORT queue_controller {
        public:
            queue_controller(transport& t, const content_store& content, std::uint32_t seed = 0);
            ~queue_controller();

            queue_controller(const queue_controller&) = delete;
            queue_controller& operator=(const queue_controller&) = delete;

            /**
             * @brief Start a new queue at @p start_index
             * @throws state_error on an empty list, an index out of range
             *         or an unknown song
             */
            void start(const std::vector<std::string>& song_ids, queue_mode mode, std::size_t start_index = 0);

            /**
             * @return false when already at the end and repeat_queue is off
             * @throws state_error if the queue is idle or the target song is unknown
             */
            bool next();
            bool previous();
            void jump_to(std::size_t index);

            /// Stop playback and clear the queue
            void stop();

            void set_repeat_single(bool on);
            void set_repeat_queue(bool on);
            void set_shuffle(bool on);

            [[nodiscard]] bool repeat_single() const;
            [[nodiscard]] bool repeat_queue() const;
            [[nodiscard]] bool shuffle() const;

            [[nodiscard]] queue_phase phase() const;
            [[nodiscard]] queue_mode mode() const;
            [[nodiscard]] std::optional<std::size_t> current_index() const;
            [[nodiscard]] std::optional<std::string> current_song_id() const;
            [[nodiscard]] const std::vector<std::string>& song_ids() const;

            event<const song&, std::size_t>& on_song_changed();
            event<>& on_queue_complete();

        private:
            struct impl;
            std::unique_ptr<impl> m_pimpl;
    };

} // namespace stemdeck

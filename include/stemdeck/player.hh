/**
 * @file player.hh
 * @brief One device's complete rehearsal engine
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <stemdeck/callback_dispatcher.hh>
#include <stemdeck/channel.hh>
#include <stemdeck/clock.hh>
#include <stemdeck/content_store.hh>
#include <stemdeck/document_store.hh>
#include <stemdeck/engine_config.hh>
#include <stemdeck/queue_controller.hh>
#include <stemdeck/session_sync.hh>
#include <stemdeck/track_mixer.hh>
#include <stemdeck/track_state_store.hh>
#include <stemdeck/transport.hh>
#include <stemdeck/export_stemdeck.h>

namespace stemdeck {

    struct STEMDECK_EXPORT player_options {
        std::string user_id;
        std::string device_id;
        engine_config config;
        /// 0 picks a random seed
        std::uint32_t shuffle_seed = 0;
    };

    /**
     * @class player
     * @brief Owns and wires the components of one device
     *
     * - a ready song binds the mixer to the user's persisted mix states and
     *   subscribes to remote changes of them
     * - mixer changes are written to the track state store and, as admin,
     *   published to the session
     * - a finished song advances the queue
     * - session snapshots drive the transport of a follower
     *
     * The owner runs the control loop by calling poll() regularly; every
     * callback and timer runs inside it.
     *
     * @code
     * stemdeck::steady_scheduler clock;
     * stemdeck::player p(factory, store, content, clock, {"alice", "laptop"});
     * p.queue().start({"song-1", "song-2"}, stemdeck::queue_mode::playlist);
     * while (p.queue().phase() != stemdeck::queue_phase::complete) {
     *     p.poll();
     *     std::this_thread::sleep_for(std::chrono::milliseconds(10));
     * }
     * @endcode
     */
    class STEMDECK_EXPORT player {
        public:
            player(std::shared_ptr<channel_factory> factory,
                   std::shared_ptr<document_store> store,
                   std::shared_ptr<content_store> content,
                   scheduler& clock,
                   player_options options);
            ~player();

            player(const player&) = delete;
            player& operator=(const player&) = delete;

            /**
             * @brief Run one iteration of the control loop
             *
             * Dispatches queued pushes, fires due timers and completes a
             * settled song load.
             * @return number of callbacks, timers and loads processed
             */
            std::size_t poll();

            /**
             * @brief Switch user and rebind the current song to their mix states
             */
            void set_user(const std::string& user_id);

            transport& get_transport();
            track_mixer& mixer();
            queue_controller& queue();
            track_state_store& track_states();
            session_sync& session();
            callback_dispatcher& dispatcher();
            [[nodiscard]] const engine_config& config() const;

        private:
            struct impl;
            std::unique_ptr<impl> m_pimpl;
    };

} // namespace stemdeck

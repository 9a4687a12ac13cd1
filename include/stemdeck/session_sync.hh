/**
 * @file session_sync.hh
 * @brief Shared listening sessions driven by one admin device
 * @ingroup session
 */

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <stemdeck/callback_dispatcher.hh>
#include <stemdeck/clock.hh>
#include <stemdeck/document_store.hh>
#include <stemdeck/engine_config.hh>
#include <stemdeck/event.hh>
#include <stemdeck/types.hh>
#include <stemdeck/export_stemdeck.h>

namespace stemdeck {

    class transport;

    enum class session_role {
        none,
        admin,
        follower
    };

    struct STEMDECK_EXPORT session_info {
        std::string id;
        std::string admin;
        /// Milliseconds since the Unix epoch
        std::int64_t created_at = 0;
    };

    /**
     * @class session_sync
     * @brief Propagates transport state from one admin to any number of followers
     * @ingroup session
     *
     * A session is the document sessions/<id> = {admin, createdAt, state},
     * where state is a transport_snapshot. The admin overwrites the snapshot
     * on every local transport change and is its only writer. Followers
     * subscribe to it and reconcile their own transport, never writing.
     *
     * ## Follower reconciliation
     *
     * Snapshots are applied at most once per sync_debounce. One that arrives
     * earlier is held and applied when the window closes; a newer one
     * replaces it. Applying a snapshot:
     * - seeks when the local position is more than seek_tolerance_seconds away
     * - adopts the playback speed when it differs by more than speed_tolerance
     * - plays or pauses to match is_playing
     *
     * Applying the same snapshot twice leaves the transport as applying it once.
     *
     * There is no heartbeat: a follower notices a vanished admin only when
     * the session document is removed.
     */
    class STEMDECK_EXPORT session_sync {
        public:
            /// Returns the per-track volumes carried in admin snapshots
            using volume_source_t = std::function<std::map<std::string, float>()>;

            session_sync(std::shared_ptr<document_store> store, callback_dispatcher& dispatcher,
                         scheduler& clock, transport& t, std::string device_id,
                         engine_config config = {});
            ~session_sync();

            session_sync(const session_sync&) = delete;
            session_sync& operator=(const session_sync&) = delete;

            /**
             * @brief Create a session with this device as admin
             *
             * Leaves the current session first.
             * @return the new session id, or nullopt after reporting the
             *         failure through on_session_error()
             */
            std::optional<std::string> create_session();

            /**
             * @brief Follow an existing session
             * @return false after reporting the failure through on_session_error()
             */
            bool join_session(const std::string& session_id);

            void leave_session();

            /**
             * @brief Every session in the store
             * @throws session_error if the store cannot be read
             */
            std::vector<session_info> list_sessions();

            /**
             * @brief Remove a session document, leaving it first if it is the current one
             * @throws session_error if the store refuses the removal
             */
            void delete_session(const std::string& session_id);

            /// Write the current transport state now (admin only)
            void publish();

            void set_volume_source(volume_source_t source);

            [[nodiscard]] session_role role() const;
            [[nodiscard]] bool is_admin() const;
            [[nodiscard]] bool in_session() const;
            [[nodiscard]] const std::string& session_id() const;
            [[nodiscard]] const std::string& device_id() const;

            /// Latest snapshot received as follower, kept after the session ended
            [[nodiscard]] std::optional<transport_snapshot> last_snapshot() const;

            event<const std::string&>& on_session_error();
            /// Follower: the session document disappeared
            event<const std::string&>& on_session_ended();
            event<const transport_snapshot&>& on_snapshot_applied();

        private:
            struct impl;
            std::unique_ptr<impl> m_pimpl;
    };

    /**
     * @brief Reconcile @p t with @p snapshot
     *
     * Seeks, changes speed and plays or pauses only where the difference
     * exceeds the tolerances of @p config.
     */
    STEMDECK_EXPORT void reconcile(transport& t, const transport_snapshot& snapshot, const engine_config& config);

} // namespace stemdeck

/**
 * @file track_state_store.hh
 * @brief Per-user persistence of mixer preferences
 */

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <stemdeck/callback_dispatcher.hh>
#include <stemdeck/document_store.hh>
#include <stemdeck/types.hh>
#include <stemdeck/export_stemdeck.h>

namespace stemdeck {

    /**
     * @class track_state_store
     * @brief Persists and live-syncs track_mix_state per (user, song, track)
     *
     * States live at users/<user>/trackStates/<song>/<track> in the
     * document store. Reads never fail on absence: a missing track gets
     * default_state(), which is persisted on the first load of the song.
     *
     * Only the owning user writes its states. Every operation throws
     * persistence_error when the document store fails or no user is set.
     *
     * Subscription pushes are queued on the callback_dispatcher, so the
     * callback runs on the control thread during dispatch().
     */
    class STEMDECK_EXPORT track_state_store {
        public:
            using push_callback_t = std::function<void(const song_mix_states&)>;

            track_state_store(std::shared_ptr<document_store> store, callback_dispatcher& dispatcher,
                              std::string user_id = {}, float default_volume = 1.0f);
            ~track_state_store();

            track_state_store(const track_state_store&) = delete;
            track_state_store& operator=(const track_state_store&) = delete;

            /**
             * @brief Switch user; cancels every active subscription
             */
            void set_user(const std::string& user_id);
            [[nodiscard]] const std::string& user() const;

            [[nodiscard]] track_mix_state default_state() const;

            /**
             * @brief States of every track of @p s
             *
             * Tracks without a persisted state get the default, and the
             * defaults are written back.
             */
            song_mix_states load(const song& s);

            /// Write-through of one track
            void save(const std::string& song_id, const std::string& track_id, const track_mix_state& state);

            /// Write every state of one song at once
            void save_song(const std::string& song_id, const song_mix_states& states);

            /// Every persisted state of the user, keyed by song id
            std::map<std::string, song_mix_states> load_all();

            /**
             * @brief Observe the states of one song
             *
             * @p callback receives the full per-song map right away and on
             * every later change, always from callback_dispatcher::dispatch().
             */
            [[nodiscard]] subscription subscribe(const std::string& song_id, push_callback_t callback);

            [[nodiscard]] std::size_t active_subscriptions() const;

        private:
            struct impl;
            std::shared_ptr<impl> m_pimpl;
    };

    /// Parse the per-song object of the store; malformed entries are skipped, volumes clamped to [0, 1]
    STEMDECK_EXPORT song_mix_states parse_song_states(const nlohmann::json& value);

} // namespace stemdeck

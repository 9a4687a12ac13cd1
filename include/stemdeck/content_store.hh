#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <stemdeck/types.hh>
#include <stemdeck/export_stemdeck.h>

namespace stemdeck {

    /**
     * @brief Source of song metadata
     */
    class STEMDECK_EXPORT content_store {
        public:
            virtual ~content_store();

            /**
             * @throws state_error if no song has this id
             */
            [[nodiscard]] virtual song get_song(const std::string& song_id) const = 0;

            [[nodiscard]] virtual bool has_song(const std::string& song_id) const = 0;
    };

    class STEMDECK_EXPORT memory_content_store : public content_store {
        public:
            memory_content_store();
            explicit memory_content_store(const std::vector<song>& songs);

            /// Add or replace a song
            void add_song(const song& s);

            song get_song(const std::string& song_id) const override;
            bool has_song(const std::string& song_id) const override;

        private:
            mutable std::mutex m_mutex;
            std::map<std::string, song> m_songs;
    };

} // namespace stemdeck

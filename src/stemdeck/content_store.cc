#include <stemdeck/content_store.hh>
#include <stemdeck/error.hh>

namespace stemdeck {

    content_store::~content_store() = default;

    memory_content_store::memory_content_store() = default;

    memory_content_store::memory_content_store(const std::vector<song>& songs) {
        for (const auto& s : songs) {
            m_songs[s.id] = s;
        }
    }

    void memory_content_store::add_song(const song& s) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_songs[s.id] = s;
    }

    song memory_content_store::get_song(const std::string& song_id) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_songs.find(song_id);
        if (it == m_songs.end()) {
            throw state_error("unknown song '" + song_id + "'");
        }
        return it->second;
    }

    bool memory_content_store::has_song(const std::string& song_id) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_songs.count(song_id) > 0;
    }

} // namespace stemdeck

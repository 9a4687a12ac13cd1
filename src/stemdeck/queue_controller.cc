#include <stemdeck/queue_controller.hh>
#include <stemdeck/error.hh>
#include <stemdeck/transport.hh>
#include <failsafe/failsafe.hh>
#include <random>

namespace stemdeck {

    const char* to_string(queue_phase phase) {
        switch (phase) {
            case queue_phase::idle:     return "idle";
            case queue_phase::playing:  return "playing";
            case queue_phase::complete: return "complete";
        }
        return "unknown";
    }

    struct queue_controller::impl {
        impl(transport& t, const content_store& content, std::uint32_t seed)
            : m_transport(t),
              m_content(content),
              m_rng(seed != 0 ? seed : std::random_device{}()) {
        }

        transport& m_transport;
        const content_store& m_content;
        std::mt19937 m_rng;

        std::vector<std::string> m_songs;
        std::size_t m_index = 0;
        queue_mode m_mode = queue_mode::playlist;
        queue_phase m_phase = queue_phase::idle;
        bool m_repeat_single = false;
        bool m_repeat_queue = false;
        bool m_shuffle = false;
        // One-shot: play the next song that becomes ready
        bool m_auto_start = false;

        int m_ready_conn = 0;
        int m_finished_conn = 0;

        event<const song&, std::size_t> m_on_song_changed;
        event<> m_on_complete;

        std::optional<std::size_t> random_other() {
            if (m_songs.size() < 2) {
                return std::nullopt;
            }
            std::uniform_int_distribution<std::size_t> dist(0, m_songs.size() - 2);
            auto pick = dist(m_rng);
            return pick >= m_index ? pick + 1 : pick;
        }

        std::optional<std::size_t> next_index() {
            if (m_shuffle) {
                if (auto pick = random_other()) {
                    return pick;
                }
                return m_repeat_queue ? std::optional<std::size_t>(0) : std::nullopt;
            }
            if (m_index + 1 < m_songs.size()) {
                return m_index + 1;
            }
            return m_repeat_queue ? std::optional<std::size_t>(0) : std::nullopt;
        }

        std::optional<std::size_t> previous_index() {
            if (m_shuffle) {
                if (auto pick = random_other()) {
                    return pick;
                }
                return m_repeat_queue ? std::optional<std::size_t>(m_songs.size() - 1) : std::nullopt;
            }
            if (m_index > 0) {
                return m_index - 1;
            }
            return m_repeat_queue ? std::optional<std::size_t>(m_songs.size() - 1) : std::nullopt;
        }

        void go_to(std::size_t index, const song& target, bool auto_start) {
            m_transport.stop();
            m_transport.unload();
            m_index = index;
            m_phase = queue_phase::playing;
            m_auto_start = auto_start;
            LOG_INFO("queue_controller", "song", index + 1, "of", m_songs.size(), ":", target.id);
            m_on_song_changed.emit(target, index);
            m_transport.load(target);
        }

        // Explicit navigation: an unknown song is the caller's error
        void navigate(std::size_t index) {
            const auto target = m_content.get_song(m_songs[index]);
            go_to(index, target, m_mode == queue_mode::playlist);
        }

        void complete() {
            m_phase = queue_phase::complete;
            m_auto_start = false;
            LOG_INFO("queue_controller", "queue complete after", m_songs.size(), "songs");
            m_on_complete.emit();
        }

        void on_finished() {
            if (m_phase != queue_phase::playing) {
                return;
            }
            if (m_repeat_single) {
                m_transport.restart();
                return;
            }

            // Unknown songs are skipped; give up after one pass over the list
            for (std::size_t attempts = 0; attempts < m_songs.size(); ++attempts) {
                const auto index = next_index();
                if (!index) {
                    complete();
                    return;
                }
                const auto& id = m_songs[*index];
                if (!m_content.has_song(id)) {
                    LOG_WARN("queue_controller", "skipping unknown song", id);
                    m_index = *index;
                    continue;
                }
                go_to(*index, m_content.get_song(id), true);
                return;
            }
            complete();
        }

        void on_ready(const song& s) {
            if (!m_auto_start || m_phase != queue_phase::playing) {
                return;
            }
            if (m_index >= m_songs.size() || m_songs[m_index] != s.id) {
                return;
            }
            m_auto_start = false;
            m_transport.play();
        }

        void require_started() const {
            if (m_phase == queue_phase::idle || m_songs.empty()) {
                throw state_error("queue has not been started");
            }
        }
    };

    queue_controller::queue_controller(transport& t, const content_store& content, std::uint32_t seed)
        : m_pimpl(std::make_unique<impl>(t, content, seed)) {
        auto* d = m_pimpl.get();
        d->m_ready_conn = t.on_ready().connect([d](const song& s) { d->on_ready(s); });
        d->m_finished_conn = t.on_finished().connect([d]() { d->on_finished(); });
    }

    queue_controller::~queue_controller() {
        m_pimpl->m_transport.on_ready().disconnect(m_pimpl->m_ready_conn);
        m_pimpl->m_transport.on_finished().disconnect(m_pimpl->m_finished_conn);
    }

    void queue_controller::start(const std::vector<std::string>& song_ids, queue_mode mode, std::size_t start_index) {
        if (song_ids.empty()) {
            throw state_error("cannot start an empty queue");
        }
        if (start_index >= song_ids.size()) {
            throw state_error("start index " + std::to_string(start_index) + " out of range");
        }
        const auto target = m_pimpl->m_content.get_song(song_ids[start_index]);
        m_pimpl->m_songs = song_ids;
        m_pimpl->m_mode = mode;
        m_pimpl->go_to(start_index, target, mode == queue_mode::playlist);
    }

    bool queue_controller::next() {
        auto& d = *m_pimpl;
        d.require_started();
        const auto index = d.next_index();
        if (!index) {
            LOG_DEBUG("queue_controller", "next ignored: end of queue");
            return false;
        }
        d.navigate(*index);
        return true;
    }

    bool queue_controller::previous() {
        auto& d = *m_pimpl;
        d.require_started();
        const auto index = d.previous_index();
        if (!index) {
            LOG_DEBUG("queue_controller", "previous ignored: start of queue");
            return false;
        }
        d.navigate(*index);
        return true;
    }

    void queue_controller::jump_to(std::size_t index) {
        auto& d = *m_pimpl;
        d.require_started();
        if (index >= d.m_songs.size()) {
            throw state_error("queue index " + std::to_string(index) + " out of range");
        }
        d.navigate(index);
    }

    void queue_controller::stop() {
        auto& d = *m_pimpl;
        if (d.m_phase == queue_phase::idle) {
            return;
        }
        d.m_transport.stop();
        d.m_songs.clear();
        d.m_index = 0;
        d.m_auto_start = false;
        d.m_phase = queue_phase::idle;
    }

    void queue_controller::set_repeat_single(bool on) {
        m_pimpl->m_repeat_single = on;
    }

    void queue_controller::set_repeat_queue(bool on) {
        m_pimpl->m_repeat_queue = on;
    }

    void queue_controller::set_shuffle(bool on) {
        m_pimpl->m_shuffle = on;
    }

    bool queue_controller::repeat_single() const {
        return m_pimpl->m_repeat_single;
    }

    bool queue_controller::repeat_queue() const {
        return m_pimpl->m_repeat_queue;
    }

    bool queue_controller::shuffle() const {
        return m_pimpl->m_shuffle;
    }

    queue_phase queue_controller::phase() const {
        return m_pimpl->m_phase;
    }

    queue_mode queue_controller::mode() const {
        return m_pimpl->m_mode;
    }

    std::optional<std::size_t> queue_controller::current_index() const {
        if (m_pimpl->m_phase == queue_phase::idle) {
            return std::nullopt;
        }
        return m_pimpl->m_index;
    }

    std::optional<std::string> queue_controller::current_song_id() const {
        if (m_pimpl->m_phase == queue_phase::idle || m_pimpl->m_index >= m_pimpl->m_songs.size()) {
            return std::nullopt;
        }
        return m_pimpl->m_songs[m_pimpl->m_index];
    }

    const std::vector<std::string>& queue_controller::song_ids() const {
        return m_pimpl->m_songs;
    }

    event<const song&, std::size_t>& queue_controller::on_song_changed() {
        return m_pimpl->m_on_song_changed;
    }

    event<>& queue_controller::on_queue_complete() {
        return m_pimpl->m_on_complete;
    }

} // namespace stemdeck

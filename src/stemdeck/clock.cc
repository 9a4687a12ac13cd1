#include <stemdeck/clock.hh>
#include <map>
#include <unordered_map>
#include <utility>

namespace stemdeck {

    struct scheduler::impl {
        using queue_t = std::multimap<time_point, std::pair<timer_id, task_t>>;

        queue_t m_queue;
        std::unordered_map<timer_id, queue_t::iterator> m_index;
        timer_id m_next_id = 1;
    };

    scheduler::scheduler()
        : m_pimpl(std::make_unique<impl>()) {
    }

    scheduler::~scheduler() = default;

    scheduler::timer_id scheduler::schedule(std::chrono::milliseconds delay, task_t task) {
        if (delay.count() < 0) {
            delay = std::chrono::milliseconds{0};
        }
        const timer_id id = m_pimpl->m_next_id++;
        auto it = m_pimpl->m_queue.emplace(now() + delay, std::make_pair(id, std::move(task)));
        m_pimpl->m_index.emplace(id, it);
        return id;
    }

    bool scheduler::cancel(timer_id id) {
        auto it = m_pimpl->m_index.find(id);
        if (it == m_pimpl->m_index.end()) {
            return false;
        }
        m_pimpl->m_queue.erase(it->second);
        m_pimpl->m_index.erase(it);
        return true;
    }

    std::size_t scheduler::pending() const {
        return m_pimpl->m_queue.size();
    }

    std::optional<scheduler::time_point> scheduler::next_deadline() const {
        if (m_pimpl->m_queue.empty()) {
            return std::nullopt;
        }
        return m_pimpl->m_queue.begin()->first;
    }

    bool scheduler::run_next(time_point limit) {
        if (m_pimpl->m_queue.empty()) {
            return false;
        }
        auto it = m_pimpl->m_queue.begin();
        if (it->first > limit) {
            return false;
        }
        // Detach before running: the task may schedule or cancel timers
        auto task = std::move(it->second.second);
        m_pimpl->m_index.erase(it->second.first);
        m_pimpl->m_queue.erase(it);
        if (task) {
            task();
        }
        return true;
    }

    std::size_t scheduler::run_due() {
        std::size_t count = 0;
        const auto limit = now();
        while (run_next(limit)) {
            ++count;
        }
        return count;
    }

    scheduler::time_point steady_scheduler::now() const {
        return clock_type::now();
    }

    manual_scheduler::manual_scheduler()
        : m_now(clock_type::time_point{} + std::chrono::hours(1)) {
    }

    scheduler::time_point manual_scheduler::now() const {
        return m_now;
    }

    std::size_t manual_scheduler::advance(std::chrono::milliseconds dt) {
        const auto target = m_now + dt;
        std::size_t count = 0;
        while (true) {
            auto deadline = next_deadline();
            if (!deadline || *deadline > target) {
                break;
            }
            if (*deadline > m_now) {
                m_now = *deadline;
            }
            if (run_next(m_now)) {
                ++count;
            }
        }
        m_now = target;
        return count;
    }

} // namespace stemdeck

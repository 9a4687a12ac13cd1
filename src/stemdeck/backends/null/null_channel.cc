#include <stemdeck/backends/null/null_channel.hh>
#include <stemdeck/error.hh>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>

namespace stemdeck {

namespace {
    constexpr const char* ref_prefix = "null:";

    double parse_duration(const std::string& ref) {
        const std::string prefix(ref_prefix);
        if (ref.compare(0, prefix.size(), prefix) != 0) {
            throw channel_error("null channel: unsupported resource '" + ref + "'");
        }
        double seconds = 0.0;
        try {
            seconds = std::stod(ref.substr(prefix.size()));
        } catch (const std::logic_error&) {
            throw channel_error("null channel: bad duration in '" + ref + "'");
        }
        if (!std::isfinite(seconds) || seconds < 0.0) {
            throw channel_error("null channel: bad duration in '" + ref + "'");
        }
        return seconds;
    }
}

null_channel::null_channel(const scheduler& clock)
    : m_clock(clock) {
}

null_channel::~null_channel() = default;

void null_channel::require_loaded(const char* operation) const {
    if (!m_loaded) {
        throw channel_error(std::string("null channel: ") + operation + " on unloaded channel");
    }
}

double null_channel::position_locked() const {
    if (!m_playing) {
        return m_base_position;
    }
    const auto elapsed = std::chrono::duration<double>(m_clock.now() - m_started).count();
    return std::min(m_duration, m_base_position + elapsed * m_rate);
}

void null_channel::load(const std::string& resource_ref) {
    const double duration = parse_duration(resource_ref);
    std::lock_guard<std::mutex> lock(m_mutex);
    m_duration = duration;
    m_base_position = 0.0;
    m_playing = false;
    m_loaded = true;
}

void null_channel::unload() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_loaded = false;
    m_playing = false;
    m_base_position = 0.0;
    m_duration = 0.0;
}

void null_channel::play() {
    std::lock_guard<std::mutex> lock(m_mutex);
    require_loaded("play");
    if (!m_playing) {
        m_started = m_clock.now();
        m_playing = true;
    }
}

void null_channel::pause() {
    std::lock_guard<std::mutex> lock(m_mutex);
    require_loaded("pause");
    m_base_position = position_locked();
    m_playing = false;
}

void null_channel::stop() {
    std::lock_guard<std::mutex> lock(m_mutex);
    require_loaded("stop");
    m_playing = false;
    m_base_position = 0.0;
}

void null_channel::set_position(double seconds) {
    std::lock_guard<std::mutex> lock(m_mutex);
    require_loaded("set_position");
    m_base_position = std::clamp(seconds, 0.0, m_duration);
    m_started = m_clock.now();
}

void null_channel::set_rate(double multiplier) {
    std::lock_guard<std::mutex> lock(m_mutex);
    require_loaded("set_rate");
    if (multiplier <= 0.0) {
        throw channel_error("null channel: rate must be positive");
    }
    // Re-anchor so the elapsed part keeps the old rate
    m_base_position = position_locked();
    m_started = m_clock.now();
    m_rate = multiplier;
}

void null_channel::set_gain(float gain) {
    std::lock_guard<std::mutex> lock(m_mutex);
    require_loaded("set_gain");
    m_gain = std::clamp(gain, 0.0f, 1.0f);
}

channel_status null_channel::status() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    channel_status s;
    s.loaded = m_loaded;
    s.playing = m_playing && position_locked() < m_duration;
    s.position_seconds = position_locked();
    s.duration_seconds = m_duration;
    return s;
}

float null_channel::gain() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_gain;
}

double null_channel::rate() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_rate;
}

null_channel_factory::null_channel_factory(const scheduler& clock)
    : m_clock(clock) {
}

std::unique_ptr<channel> null_channel_factory::create() {
    return std::make_unique<null_channel>(m_clock);
}

} // namespace stemdeck

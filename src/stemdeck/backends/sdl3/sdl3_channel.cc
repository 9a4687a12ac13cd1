// This is copyrighted software. More information is at the end of this file.
#include "sdl3_channel.hh"
#include <stemdeck/backends/sdl3/sdl3_backend.hh>
#include <stemdeck/error.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <cmath>

namespace stemdeck {

// Custom deleter that checks if SDL is still initialized
static void safe_destroy_audio_stream(SDL_AudioStream* stream) {
    if (stream && SDL_WasInit(SDL_INIT_AUDIO)) {
        SDL_DestroyAudioStream(stream);
    }
}

static std::string sdl_failure(const std::string& what) {
    return "SDL3 channel: " + what + ": " + SDL_GetError();
}

sdl3_channel::sdl3_channel() = default;

sdl3_channel::~sdl3_channel() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stream.reset();
}

void sdl3_channel::require_loaded(const char* operation) const {
    if (!m_stream) {
        throw channel_error(std::string("SDL3 channel: ") + operation + " on unloaded channel");
    }
}

double sdl3_channel::bytes_per_second() const {
    return static_cast<double>(m_frame_size) * static_cast<double>(m_spec.freq);
}

void sdl3_channel::queue_from(std::size_t byte_offset) {
    byte_offset = std::min(byte_offset - byte_offset % m_frame_size, m_pcm.size());
    if (!SDL_ClearAudioStream(m_stream.get())) {
        throw channel_error(sdl_failure("clear failed"));
    }
    m_queued_from = byte_offset;
    const auto remaining = m_pcm.size() - byte_offset;
    if (remaining > 0 &&
        !SDL_PutAudioStreamData(m_stream.get(), m_pcm.data() + byte_offset, static_cast<int>(remaining))) {
        throw channel_error(sdl_failure("queueing audio failed"));
    }
    if (!SDL_FlushAudioStream(m_stream.get())) {
        throw channel_error(sdl_failure("flush failed"));
    }
}

double sdl3_channel::position_locked() const {
    const int queued = SDL_GetAudioStreamQueued(m_stream.get());
    const std::size_t pending = queued > 0 ? static_cast<std::size_t>(queued) : 0;
    const std::size_t fed = m_pcm.size() - m_queued_from;
    const std::size_t played = m_queued_from + (fed - std::min(pending, fed));
    const double bps = bytes_per_second();
    return bps > 0.0 ? static_cast<double>(played) / bps : 0.0;
}

void sdl3_channel::load(const std::string& resource_ref) {
    SDL_AudioSpec spec{};
    Uint8* buffer = nullptr;
    Uint32 length = 0;
    if (!SDL_LoadWAV(resource_ref.c_str(), &spec, &buffer, &length)) {
        throw channel_error(sdl_failure("cannot load '" + resource_ref + "'"));
    }
    std::vector<std::uint8_t> pcm(buffer, buffer + length);
    SDL_free(buffer);

    const auto frame_size = static_cast<std::size_t>(SDL_AUDIO_FRAMESIZE(spec));
    if (frame_size == 0 || spec.freq <= 0) {
        throw channel_error("SDL3 channel: unsupported audio format in '" + resource_ref + "'");
    }

    std::shared_ptr<SDL_AudioStream> stream(
        SDL_OpenAudioDeviceStream(SDL_AUDIO_DEVICE_DEFAULT_PLAYBACK, &spec, nullptr, nullptr),
        safe_destroy_audio_stream);
    if (!stream) {
        throw channel_error(sdl_failure("cannot open playback stream"));
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_stream = std::move(stream);
    m_spec = spec;
    m_pcm = std::move(pcm);
    m_frame_size = frame_size;
    SDL_SetAudioStreamGain(m_stream.get(), m_gain);
    SDL_SetAudioStreamFrequencyRatio(m_stream.get(), m_ratio);
    queue_from(0);
    LOG_DEBUG("sdl3_channel", "loaded", resource_ref, "bytes:", m_pcm.size(), "freq:", spec.freq);
}

void sdl3_channel::unload() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stream.reset();
    m_pcm.clear();
    m_pcm.shrink_to_fit();
    m_queued_from = 0;
}

void sdl3_channel::play() {
    std::lock_guard<std::mutex> lock(m_mutex);
    require_loaded("play");
    if (!SDL_ResumeAudioStreamDevice(m_stream.get())) {
        throw channel_error(sdl_failure("resume failed"));
    }
}

void sdl3_channel::pause() {
    std::lock_guard<std::mutex> lock(m_mutex);
    require_loaded("pause");
    if (!SDL_PauseAudioStreamDevice(m_stream.get())) {
        throw channel_error(sdl_failure("pause failed"));
    }
}

void sdl3_channel::stop() {
    std::lock_guard<std::mutex> lock(m_mutex);
    require_loaded("stop");
    if (!SDL_PauseAudioStreamDevice(m_stream.get())) {
        throw channel_error(sdl_failure("pause failed"));
    }
    queue_from(0);
}

void sdl3_channel::set_position(double seconds) {
    std::lock_guard<std::mutex> lock(m_mutex);
    require_loaded("set_position");
    const double clamped = std::max(0.0, seconds);
    queue_from(static_cast<std::size_t>(std::llround(clamped * bytes_per_second())));
}

void sdl3_channel::set_rate(double multiplier) {
    std::lock_guard<std::mutex> lock(m_mutex);
    require_loaded("set_rate");
    // SDL accepts ratios in [0.01, 100]
    const auto ratio = static_cast<float>(std::clamp(multiplier, 0.01, 100.0));
    if (!SDL_SetAudioStreamFrequencyRatio(m_stream.get(), ratio)) {
        throw channel_error(sdl_failure("set frequency ratio failed"));
    }
    m_ratio = ratio;
}

void sdl3_channel::set_gain(float gain) {
    std::lock_guard<std::mutex> lock(m_mutex);
    require_loaded("set_gain");
    const float clamped = std::clamp(gain, 0.0f, 1.0f);
    if (!SDL_SetAudioStreamGain(m_stream.get(), clamped)) {
        throw channel_error(sdl_failure("set gain failed"));
    }
    m_gain = clamped;
}

channel_status sdl3_channel::status() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    channel_status s;
    if (!m_stream) {
        return s;
    }
    s.loaded = true;
    s.duration_seconds = static_cast<double>(m_pcm.size()) / bytes_per_second();
    s.position_seconds = position_locked();
    s.playing = !SDL_AudioStreamDevicePaused(m_stream.get()) && SDL_GetAudioStreamQueued(m_stream.get()) > 0;
    return s;
}

sdl3_channel_factory::sdl3_channel_factory() {
    if (!SDL_InitSubSystem(SDL_INIT_AUDIO)) {
        throw channel_error(sdl_failure("audio subsystem initialization failed"));
    }
    const char* driver = SDL_GetCurrentAudioDriver();
    LOG_INFO("sdl3_channel", "SDL audio subsystem initialized, driver:", driver ? driver : "none");
}

sdl3_channel_factory::~sdl3_channel_factory() {
    SDL_QuitSubSystem(SDL_INIT_AUDIO);
}

std::unique_ptr<channel> sdl3_channel_factory::create() {
    return std::make_unique<sdl3_channel>();
}

std::shared_ptr<channel_factory> create_sdl3_channel_factory() {
    return std::make_shared<sdl3_channel_factory>();
}

} // namespace stemdeck


/*
 * Copyright (C) 2025
 *
 * This file is part of stemdeck.
 *
 * stemdeck is free software: you can redistribute it and/or modify it under the
 * terms of the GNU Lesser General Public License as published by the Free
 * Software Foundation, either version 3 of the License, or (at your option) any
 * later version.
 *
 * stemdeck is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR
 * A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with stemdeck.  If not, see <http://www.gnu.org/licenses/>.
 */

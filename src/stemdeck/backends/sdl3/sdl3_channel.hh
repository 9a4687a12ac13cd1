#ifndef STEMDECK_SDL3_CHANNEL_HH
#define STEMDECK_SDL3_CHANNEL_HH

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <SDL3/SDL.h>
#include <stemdeck/channel.hh>

namespace stemdeck {

/**
 * One WAV stem streamed to the default playback device.
 *
 * The whole decoded stem is queued into the stream from the current
 * offset; the playback position is derived from what is still queued.
 */
class sdl3_channel : public channel {
public:
    sdl3_channel();
    ~sdl3_channel() override;

    void load(const std::string& resource_ref) override;
    void unload() override;
    void play() override;
    void pause() override;
    void stop() override;
    void set_position(double seconds) override;
    void set_rate(double multiplier) override;
    void set_gain(float gain) override;
    channel_status status() const override;

private:
    void require_loaded(const char* operation) const;
    void queue_from(std::size_t byte_offset);
    double bytes_per_second() const;
    double position_locked() const;

    mutable std::mutex m_mutex;
    std::shared_ptr<SDL_AudioStream> m_stream;
    SDL_AudioSpec m_spec{};
    std::vector<std::uint8_t> m_pcm;
    std::size_t m_frame_size = 0;
    std::size_t m_queued_from = 0;
    float m_gain = 1.0f;
    float m_ratio = 1.0f;
};

class sdl3_channel_factory : public channel_factory {
public:
    sdl3_channel_factory();
    ~sdl3_channel_factory() override;

    std::unique_ptr<channel> create() override;
    std::string get_name() const override { return "SDL3"; }
};

} // namespace stemdeck

#endif // STEMDECK_SDL3_CHANNEL_HH

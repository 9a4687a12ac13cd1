#ifndef STEMDECK_BACKENDS_NULL_CHANNEL_HH
#define STEMDECK_BACKENDS_NULL_CHANNEL_HH

#include <memory>
#include <mutex>
#include <string>
#include <stemdeck/channel.hh>
#include <stemdeck/clock.hh>
#include <stemdeck/export_stemdeck.h>

namespace stemdeck {

/**
 * Silent channel for testing and headless environments.
 *
 * The resource reference encodes the duration: "null:<seconds>", e.g.
 * "null:180.5". An empty reference, one starting with "fail:" or one that
 * does not parse fails to load. The position advances with the clock of
 * the scheduler passed at construction, scaled by the playback rate.
 */
class STEMDECK_EXPORT null_channel : public channel {
public:
    explicit null_channel(const scheduler& clock);
    ~null_channel() override;

    void load(const std::string& resource_ref) override;
    void unload() override;
    void play() override;
    void pause() override;
    void stop() override;
    void set_position(double seconds) override;
    void set_rate(double multiplier) override;
    void set_gain(float gain) override;
    [[nodiscard]] channel_status status() const override;

    [[nodiscard]] float gain() const;
    [[nodiscard]] double rate() const;

private:
    double position_locked() const;
    void require_loaded(const char* operation) const;

    const scheduler& m_clock;
    mutable std::mutex m_mutex;
    bool m_loaded = false;
    bool m_playing = false;
    double m_duration = 0.0;
    double m_base_position = 0.0;
    scheduler::time_point m_started;
    double m_rate = 1.0;
    float m_gain = 1.0f;
};

/**
 * Creates null_channel instances sharing one clock.
 *
 * Example usage:
 * @code
 * stemdeck::steady_scheduler clock;
 * auto factory = std::make_shared<stemdeck::null_channel_factory>(clock);
 * auto ch = factory->create();
 * ch->load("null:12.0");
 * @endcode
 */
class STEMDECK_EXPORT null_channel_factory : public channel_factory {
public:
    explicit null_channel_factory(const scheduler& clock);

    std::unique_ptr<channel> create() override;
    std::string get_name() const override { return "Null"; }

private:
    const scheduler& m_clock;
};

} // namespace stemdeck

#endif // STEMDECK_BACKENDS_NULL_CHANNEL_HH

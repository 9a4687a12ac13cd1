#ifndef STEMDECK_MOCK_COMPONENTS_HH
#define STEMDECK_MOCK_COMPONENTS_HH

#include <stemdeck/channel.hh>
#include <stemdeck/document_store.hh>
#include <stemdeck/error.hh>
#include <stemdeck/types.hh>
#include <atomic>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace stemdeck::test {

// Observable state of one mock channel; shared between the channel and the test
struct mock_channel_state {
    mutable std::mutex mutex;
    std::string ref;
    bool loaded = false;
    bool playing = false;
    double position = 0.0;
    double duration = 0.0;
    double rate = 1.0;
    float gain = 1.0f;
    std::set<std::string> failing;

    std::atomic<int> load_calls{0};
    std::atomic<int> unload_calls{0};
    std::atomic<int> play_calls{0};
    std::atomic<int> pause_calls{0};
    std::atomic<int> stop_calls{0};
    std::atomic<int> seek_calls{0};
    std::atomic<int> rate_calls{0};
    std::atomic<int> gain_calls{0};

    void set_position(double p) {
        std::lock_guard<std::mutex> lock(mutex);
        position = p;
    }

    double get_position() const {
        std::lock_guard<std::mutex> lock(mutex);
        return position;
    }

    float get_gain() const {
        std::lock_guard<std::mutex> lock(mutex);
        return gain;
    }

    bool is_playing() const {
        std::lock_guard<std::mutex> lock(mutex);
        return playing;
    }

    double get_rate() const {
        std::lock_guard<std::mutex> lock(mutex);
        return rate;
    }

    // Make a later operation fail ("play", "pause", "set_gain", ...)
    void fail(const std::string& operation) {
        std::lock_guard<std::mutex> lock(mutex);
        failing.insert(operation);
    }
};

// What channels do for a given resource reference
struct mock_channel_script {
    std::mutex mutex;
    std::map<std::string, double> durations;
    std::map<std::string, std::set<std::string>> failures;
    std::map<std::string, std::shared_future<void>> gates;
    std::vector<std::shared_ptr<mock_channel_state>> channels;
    double default_duration = 60.0;
};

class mock_channel : public channel {
public:
    mock_channel(std::shared_ptr<mock_channel_script> script, std::shared_ptr<mock_channel_state> state)
        : m_script(std::move(script)), m_state(std::move(state)) {}

    void load(const std::string& resource_ref) override {
        ++m_state->load_calls;
        std::shared_future<void> gate;
        double duration = 0.0;
        std::set<std::string> failing;
        {
            std::lock_guard<std::mutex> lock(m_script->mutex);
            auto g = m_script->gates.find(resource_ref);
            if (g != m_script->gates.end()) {
                gate = g->second;
            }
            auto d = m_script->durations.find(resource_ref);
            duration = d != m_script->durations.end() ? d->second : m_script->default_duration;
            auto f = m_script->failures.find(resource_ref);
            if (f != m_script->failures.end()) {
                failing = f->second;
            }
        }
        if (gate.valid()) {
            gate.wait();
        }

        std::lock_guard<std::mutex> lock(m_state->mutex);
        m_state->ref = resource_ref;
        m_state->failing = failing;
        if (resource_ref.empty() || m_state->failing.count("load")) {
            throw channel_error("mock channel: cannot load '" + resource_ref + "'");
        }
        m_state->loaded = true;
        m_state->duration = duration;
        m_state->position = 0.0;
    }

    void unload() override {
        ++m_state->unload_calls;
        std::lock_guard<std::mutex> lock(m_state->mutex);
        check("unload");
        m_state->loaded = false;
        m_state->playing = false;
    }

    void play() override {
        ++m_state->play_calls;
        std::lock_guard<std::mutex> lock(m_state->mutex);
        check("play");
        m_state->playing = true;
    }

    void pause() override {
        ++m_state->pause_calls;
        std::lock_guard<std::mutex> lock(m_state->mutex);
        check("pause");
        m_state->playing = false;
    }

    void stop() override {
        ++m_state->stop_calls;
        std::lock_guard<std::mutex> lock(m_state->mutex);
        check("stop");
        m_state->playing = false;
        m_state->position = 0.0;
    }

    void set_position(double seconds) override {
        ++m_state->seek_calls;
        std::lock_guard<std::mutex> lock(m_state->mutex);
        check("set_position");
        m_state->position = seconds;
    }

    void set_rate(double multiplier) override {
        ++m_state->rate_calls;
        std::lock_guard<std::mutex> lock(m_state->mutex);
        check("set_rate");
        m_state->rate = multiplier;
    }

    void set_gain(float gain) override {
        ++m_state->gain_calls;
        std::lock_guard<std::mutex> lock(m_state->mutex);
        check("set_gain");
        m_state->gain = gain;
    }

    channel_status status() const override {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        check("status");
        channel_status s;
        s.loaded = m_state->loaded;
        s.playing = m_state->playing;
        s.position_seconds = m_state->position;
        s.duration_seconds = m_state->duration;
        return s;
    }

private:
    // Caller holds the state mutex
    void check(const char* operation) const {
        if (m_state->failing.count(operation)) {
            throw channel_error(std::string("mock channel: ") + operation + " failed");
        }
    }

    std::shared_ptr<mock_channel_script> m_script;
    std::shared_ptr<mock_channel_state> m_state;
};

class mock_channel_factory : public channel_factory {
public:
    mock_channel_factory() : m_script(std::make_shared<mock_channel_script>()) {}

    std::unique_ptr<channel> create() override {
        auto state = std::make_shared<mock_channel_state>();
        {
            std::lock_guard<std::mutex> lock(m_script->mutex);
            m_script->channels.push_back(state);
        }
        return std::make_unique<mock_channel>(m_script, state);
    }

    std::string get_name() const override { return "Mock"; }

    void set_duration(const std::string& ref, double seconds) {
        std::lock_guard<std::mutex> lock(m_script->mutex);
        m_script->durations[ref] = seconds;
    }

    void fail(const std::string& ref, const std::string& operation) {
        std::lock_guard<std::mutex> lock(m_script->mutex);
        m_script->failures[ref].insert(operation);
    }

    // Loads of ref block until the returned promise is fulfilled
    std::shared_ptr<std::promise<void>> hold(const std::string& ref) {
        auto gate = std::make_shared<std::promise<void>>();
        std::lock_guard<std::mutex> lock(m_script->mutex);
        m_script->gates[ref] = gate->get_future().share();
        return gate;
    }

    // Most recently created channel that loaded ref
    std::shared_ptr<mock_channel_state> channel_for(const std::string& ref) const {
        std::lock_guard<std::mutex> lock(m_script->mutex);
        for (auto it = m_script->channels.rbegin(); it != m_script->channels.rend(); ++it) {
            std::lock_guard<std::mutex> state_lock((*it)->mutex);
            if ((*it)->ref == ref) {
                return *it;
            }
        }
        return nullptr;
    }

    std::size_t created() const {
        std::lock_guard<std::mutex> lock(m_script->mutex);
        return m_script->channels.size();
    }

private:
    std::shared_ptr<mock_channel_script> m_script;
};

// Document store whose operations can be switched to fail
class failing_document_store : public document_store {
public:
    std::atomic<bool> fail_reads{false};
    std::atomic<bool> fail_writes{false};
    std::atomic<bool> fail_subscribe{false};
    std::atomic<int> writes{0};

    std::optional<nlohmann::json> read(const std::string& path) override {
        if (fail_reads) {
            throw store_error("store offline");
        }
        return m_inner.read(path);
    }

    void write(const std::string& path, const nlohmann::json& value) override {
        if (fail_writes) {
            throw store_error("store offline");
        }
        ++writes;
        m_inner.write(path, value);
    }

    void remove(const std::string& path) override {
        if (fail_writes) {
            throw store_error("store offline");
        }
        m_inner.remove(path);
    }

    subscription subscribe(const std::string& path, callback_t callback) override {
        if (fail_subscribe) {
            throw store_error("store offline");
        }
        return m_inner.subscribe(path, std::move(callback));
    }

private:
    memory_document_store m_inner;
};

// Song whose tracks have refs equal to their ids
inline song make_song(const std::string& id, const std::vector<std::string>& track_ids) {
    song s;
    s.id = id;
    s.title = "Song " + id;
    s.artist = "Band";
    for (const auto& t : track_ids) {
        s.tracks.push_back({t, "Track " + t, id + "/" + t});
    }
    return s;
}

} // namespace stemdeck::test

#endif // STEMDECK_MOCK_COMPONENTS_HH

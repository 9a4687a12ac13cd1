#include <stemdeck/engine_config.hh>
#include <stemdeck/error.hh>
#include <failsafe/failsafe.hh>
#include <nlohmann/json.hpp>
#include <fstream>

namespace stemdeck {

    namespace {
        bool fail(std::string* error, const std::string& message) {
            if (error) {
                *error = message;
            }
            return false;
        }

        void read_millis(const nlohmann::json& j, const char* key, std::chrono::milliseconds& out) {
            auto it = j.find(key);
            if (it == j.end()) {
                return;
            }
            if (!it->is_number()) {
                throw config_error(std::string(key) + " must be a number of milliseconds");
            }
            out = std::chrono::milliseconds(it->get<long long>());
        }

        template<typename T>
        void read_value(const nlohmann::json& j, const char* key, T& out) {
            auto it = j.find(key);
            if (it == j.end()) {
                return;
            }
            try {
                out = it->get<T>();
            } catch (const nlohmann::json::exception& e) {
                throw config_error(std::string(key) + ": " + e.what());
            }
        }
    }

    bool engine_config::validate(std::string* error) const {
        if (click_window.count() <= 0) {
            return fail(error, "click_window must be positive");
        }
        if (progress_interval.count() <= 0) {
            return fail(error, "progress_interval must be positive");
        }
        if (sync_debounce.count() < 0) {
            return fail(error, "sync_debounce must not be negative");
        }
        if (seek_tolerance_seconds < 0.0) {
            return fail(error, "seek_tolerance_seconds must not be negative");
        }
        if (speed_tolerance < 0.0) {
            return fail(error, "speed_tolerance must not be negative");
        }
        if (skip_seconds <= 0.0) {
            return fail(error, "skip_seconds must be positive");
        }
        if (default_volume < 0.0f || default_volume > 1.0f) {
            return fail(error, "default_volume must be within [0, 1]");
        }
        return true;
    }

    engine_config engine_config::from_json(const nlohmann::json& j) {
        if (!j.is_object()) {
            throw config_error("engine configuration must be a JSON object");
        }
        engine_config cfg;
        read_millis(j, "click_window", cfg.click_window);
        read_millis(j, "progress_interval", cfg.progress_interval);
        read_millis(j, "sync_debounce", cfg.sync_debounce);
        read_value(j, "seek_tolerance_seconds", cfg.seek_tolerance_seconds);
        read_value(j, "speed_tolerance", cfg.speed_tolerance);
        read_value(j, "skip_seconds", cfg.skip_seconds);
        read_value(j, "default_volume", cfg.default_volume);
        read_value(j, "admin_leave_deletes_session", cfg.admin_leave_deletes_session);

        std::string error;
        if (!cfg.validate(&error)) {
            throw config_error(error);
        }
        return cfg;
    }

    engine_config load_engine_config(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            throw config_error("cannot open configuration file " + path);
        }
        nlohmann::json j;
        try {
            in >> j;
        } catch (const nlohmann::json::parse_error& e) {
            throw config_error("cannot parse " + path + ": " + e.what());
        }
        auto cfg = engine_config::from_json(j);
        LOG_INFO("engine_config", "Loaded configuration from", path);
        return cfg;
    }

} // namespace stemdeck

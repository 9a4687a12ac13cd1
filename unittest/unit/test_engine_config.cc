/**
 * @file test_engine_config.cc
 * @brief Unit tests for engine configuration parsing and validation
 */

#include <doctest/doctest.h>
#include <stemdeck/engine_config.hh>
#include <stemdeck/error.hh>
#include <nlohmann/json.hpp>
#include <cstdio>
#include <fstream>
#include <string>

using namespace stemdeck;
using namespace std::chrono_literals;

TEST_SUITE("EngineConfig::Unit") {

    TEST_CASE("should_have_valid_defaults") {
        engine_config cfg;
        CHECK(cfg.validate());
        CHECK(cfg.click_window == 300ms);
        CHECK(cfg.progress_interval == 50ms);
        CHECK(cfg.sync_debounce == 100ms);
        CHECK(cfg.seek_tolerance_seconds == doctest::Approx(0.1));
        CHECK(cfg.speed_tolerance == doctest::Approx(0.001));
        CHECK(cfg.skip_seconds == doctest::Approx(10.0));
        CHECK(cfg.default_volume == doctest::Approx(1.0f));
        CHECK(cfg.admin_leave_deletes_session);
    }

    TEST_CASE("should_name_the_invalid_field") {
        std::string error;

        SUBCASE("click_window") {
            engine_config cfg;
            cfg.click_window = 0ms;
            CHECK_FALSE(cfg.validate(&error));
            CHECK(error.find("click_window") != std::string::npos);
        }
        SUBCASE("progress_interval") {
            engine_config cfg;
            cfg.progress_interval = -5ms;
            CHECK_FALSE(cfg.validate(&error));
            CHECK(error.find("progress_interval") != std::string::npos);
        }
        SUBCASE("default_volume") {
            engine_config cfg;
            cfg.default_volume = 1.5f;
            CHECK_FALSE(cfg.validate(&error));
            CHECK(error.find("default_volume") != std::string::npos);
        }
        SUBCASE("skip_seconds") {
            engine_config cfg;
            cfg.skip_seconds = 0.0;
            CHECK_FALSE(cfg.validate(&error));
            CHECK(error.find("skip_seconds") != std::string::npos);
        }
    }

    TEST_CASE("should_read_overrides_from_json") {
        auto j = nlohmann::json::parse(R"({
            "click_window": 250,
            "sync_debounce": 200,
            "seek_tolerance_seconds": 0.25,
            "admin_leave_deletes_session": false,
            "unknown_key": "ignored"
        })");

        auto cfg = engine_config::from_json(j);

        CHECK(cfg.click_window == 250ms);
        CHECK(cfg.sync_debounce == 200ms);
        CHECK(cfg.seek_tolerance_seconds == doctest::Approx(0.25));
        CHECK_FALSE(cfg.admin_leave_deletes_session);
        CHECK(cfg.progress_interval == 50ms);
    }

    TEST_CASE("should_reject_bad_json") {
        const auto not_object = nlohmann::json::array();
        const auto bad_duration = nlohmann::json::parse(R"({"click_window": "fast"})");
        const auto bad_flag = nlohmann::json::parse(R"({"admin_leave_deletes_session": 3})");
        const auto bad_volume = nlohmann::json::parse(R"({"default_volume": -1.0})");

        CHECK_THROWS_AS(engine_config::from_json(not_object), config_error);
        CHECK_THROWS_AS(engine_config::from_json(bad_duration), config_error);
        CHECK_THROWS_AS(engine_config::from_json(bad_flag), config_error);
        CHECK_THROWS_AS(engine_config::from_json(bad_volume), config_error);
    }

    TEST_CASE("should_load_configuration_file") {
        const std::string path = "stemdeck_test_config.json";
        {
            std::ofstream out(path);
            out << R"({"skip_seconds": 5, "progress_interval": 20})";
        }

        auto cfg = load_engine_config(path);
        CHECK(cfg.skip_seconds == doctest::Approx(5.0));
        CHECK(cfg.progress_interval == 20ms);
        std::remove(path.c_str());

        CHECK_THROWS_AS(load_engine_config("does/not/exist.json"), config_error);
    }

    TEST_CASE("should_reject_unparsable_file") {
        const std::string path = "stemdeck_bad_config.json";
        {
            std::ofstream out(path);
            out << "{ not json";
        }
        CHECK_THROWS_AS(load_engine_config(path), config_error);
        std::remove(path.c_str());
    }
}

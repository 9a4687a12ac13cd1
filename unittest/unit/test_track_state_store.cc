/**
 * @file test_track_state_store.cc
 * @brief Unit tests for per-user track state persistence
 */

#include <doctest/doctest.h>
#include <stemdeck/error.hh>
#include <stemdeck/track_state_store.hh>
#include <nlohmann/json.hpp>
#include "../mock_components.hh"

using namespace stemdeck;
using namespace stemdeck::test;

namespace {
    track_mix_state mix(float volume, bool mute, bool solo) {
        track_mix_state s;
        s.volume = volume;
        s.mute = mute;
        s.solo = solo;
        return s;
    }
}

TEST_SUITE("TrackStateStore::Unit") {

    TEST_CASE("saved state loads back unchanged") {
        auto store = std::make_shared<memory_document_store>();
        callback_dispatcher dispatcher;
        track_state_store states(store, dispatcher, "u1");
        auto s = make_song("s1", {"drums", "bass"});

        states.save("s1", "bass", mix(0.42f, true, false));
        auto loaded = states.load(s);

        REQUIRE(loaded.count("bass") == 1);
        CHECK(loaded["bass"] == mix(0.42f, true, false));
        CHECK(loaded["drums"] == states.default_state());

        auto raw = store->read("users/u1/trackStates/s1/bass");
        REQUIRE(raw);
        CHECK((*raw)["volume"].get<double>() == doctest::Approx(0.42));
        CHECK((*raw)["mute"].get<bool>());
        CHECK_FALSE((*raw)["solo"].get<bool>());
    }

    TEST_CASE("missing tracks are initialized in the store") {
        auto store = std::make_shared<memory_document_store>();
        callback_dispatcher dispatcher;
        track_state_store states(store, dispatcher, "u1", 0.8f);
        auto s = make_song("s1", {"a", "b"});

        auto loaded = states.load(s);
        CHECK(loaded.size() == 2);
        CHECK(loaded["a"].volume == doctest::Approx(0.8f));
        CHECK(store->read("users/u1/trackStates/s1/a"));
        CHECK(store->read("users/u1/trackStates/s1/b"));
    }

    TEST_CASE("default volume is clamped") {
        auto store = std::make_shared<memory_document_store>();
        callback_dispatcher dispatcher;
        track_state_store states(store, dispatcher, "u1", 3.0f);
        CHECK(states.default_state().volume == doctest::Approx(1.0f));
        CHECK_FALSE(states.default_state().mute);
        CHECK_FALSE(states.default_state().solo);
    }

    TEST_CASE("states of other users stay separate") {
        auto store = std::make_shared<memory_document_store>();
        callback_dispatcher dispatcher;
        track_state_store states(store, dispatcher, "u1");
        auto s = make_song("s1", {"a"});

        states.save("s1", "a", mix(0.1f, false, true));
        states.set_user("u2");
        CHECK(states.user() == "u2");
        CHECK(states.load(s)["a"] == states.default_state());
    }

    TEST_CASE("operations without a user fail") {
        auto store = std::make_shared<memory_document_store>();
        callback_dispatcher dispatcher;
        track_state_store states(store, dispatcher);
        auto s = make_song("s1", {"a"});

        CHECK_THROWS_AS(states.load(s), persistence_error);
        CHECK_THROWS_AS(states.save("s1", "a", track_mix_state{}), persistence_error);
        CHECK_THROWS_AS(states.load_all(), persistence_error);
        CHECK_THROWS_AS((void)states.subscribe("s1", [](const song_mix_states&) {}), persistence_error);
    }

    TEST_CASE("store failures surface as persistence errors") {
        auto store = std::make_shared<failing_document_store>();
        callback_dispatcher dispatcher;
        track_state_store states(store, dispatcher, "u1");
        auto s = make_song("s1", {"a"});

        SUBCASE("read") {
            store->fail_reads = true;
            CHECK_THROWS_AS(states.load(s), persistence_error);
            CHECK_THROWS_AS(states.load_all(), persistence_error);
        }
        SUBCASE("write") {
            store->fail_writes = true;
            CHECK_THROWS_AS(states.save("s1", "a", track_mix_state{}), persistence_error);
            CHECK_THROWS_AS(states.save_song("s1", {}), persistence_error);
            CHECK_THROWS_AS(states.load(s), persistence_error);
        }
        SUBCASE("subscribe") {
            store->fail_subscribe = true;
            CHECK_THROWS_AS((void)states.subscribe("s1", [](const song_mix_states&) {}), persistence_error);
            CHECK(states.active_subscriptions() == 0);
        }
    }

    TEST_CASE("save_song replaces all states of a song") {
        auto store = std::make_shared<memory_document_store>();
        callback_dispatcher dispatcher;
        track_state_store states(store, dispatcher, "u1");

        states.save("s1", "old", mix(0.5f, false, false));
        states.save_song("s1", {{"a", mix(0.2f, false, false)}, {"b", mix(0.9f, false, true)}});

        auto all = states.load_all();
        REQUIRE(all.count("s1") == 1);
        CHECK(all["s1"].size() == 2);
        CHECK(all["s1"].count("old") == 0);
        CHECK(all["s1"]["b"].solo);
    }

    TEST_CASE("load_all groups states by song") {
        auto store = std::make_shared<memory_document_store>();
        callback_dispatcher dispatcher;
        track_state_store states(store, dispatcher, "u1");

        CHECK(states.load_all().empty());
        states.save("s1", "a", mix(0.3f, false, false));
        states.save("s2", "x", mix(0.4f, true, false));
        // Entries that are not objects are skipped
        store->write("users/u1/trackStates/s2/junk", 5);

        auto all = states.load_all();
        CHECK(all.size() == 2);
        CHECK(all["s1"]["a"].volume == doctest::Approx(0.3f));
        CHECK(all["s2"].size() == 1);
        CHECK(all["s2"]["x"].mute);
    }

    TEST_CASE("subscription pushes through the dispatcher") {
        auto store = std::make_shared<memory_document_store>();
        callback_dispatcher dispatcher;
        track_state_store states(store, dispatcher, "u1");
        std::vector<song_mix_states> pushes;

        auto sub = states.subscribe("s1", [&](const song_mix_states& s) { pushes.push_back(s); });
        CHECK(states.active_subscriptions() == 1);
        CHECK(pushes.empty());

        dispatcher.dispatch();
        REQUIRE(pushes.size() == 1);
        CHECK(pushes[0].empty());

        states.save("s1", "a", mix(0.7f, false, false));
        CHECK(pushes.size() == 1);
        dispatcher.dispatch();
        REQUIRE(pushes.size() == 2);
        CHECK(pushes[1]["a"].volume == doctest::Approx(0.7f));

        states.save("s2", "a", mix(0.1f, false, false));
        dispatcher.dispatch();
        CHECK(pushes.size() == 2);

        sub.unsubscribe();
        CHECK(states.active_subscriptions() == 0);
        states.save("s1", "a", mix(0.2f, false, false));
        dispatcher.dispatch();
        CHECK(pushes.size() == 2);
    }

    TEST_CASE("cancelled subscription drops queued pushes") {
        auto store = std::make_shared<memory_document_store>();
        callback_dispatcher dispatcher;
        track_state_store states(store, dispatcher, "u1");
        int pushes = 0;

        auto sub = states.subscribe("s1", [&](const song_mix_states&) { ++pushes; });
        states.save("s1", "a", mix(0.7f, false, false));
        CHECK(dispatcher.pending() == 2);

        sub.unsubscribe();
        CHECK(dispatcher.pending() == 0);
        dispatcher.dispatch();
        CHECK(pushes == 0);
    }

    TEST_CASE("changing user cancels subscriptions") {
        auto store = std::make_shared<memory_document_store>();
        callback_dispatcher dispatcher;
        track_state_store states(store, dispatcher, "u1");
        int pushes = 0;

        auto sub = states.subscribe("s1", [&](const song_mix_states&) { ++pushes; });
        states.set_user("u2");
        CHECK(states.active_subscriptions() == 0);
        CHECK(store->subscriber_count() == 0);

        states.save("s1", "a", mix(0.7f, false, false));
        dispatcher.dispatch();
        CHECK(pushes == 0);
        // Releasing the handle later is harmless
        sub.unsubscribe();
    }

    TEST_CASE("subscription outliving the store is inert") {
        auto store = std::make_shared<memory_document_store>();
        callback_dispatcher dispatcher;
        subscription sub;
        {
            track_state_store states(store, dispatcher, "u1");
            sub = states.subscribe("s1", [](const song_mix_states&) {});
        }
        CHECK(store->subscriber_count() == 0);
        CHECK_NOTHROW(sub.unsubscribe());
    }

    TEST_CASE("parse_song_states skips malformed entries") {
        nlohmann::json doc = {
            {"a", {{"volume", 0.5}, {"mute", true}}},
            {"b", "garbage"},
            {"c", {{"volume", "loud"}}},
            {"d", {{"mute", 1.5}, {"volume", 0.2}}},
            {"e", {{"volume", 5.0}}},
            {"f", {{"volume", -2.0}, {"solo", true}}}
        };
        auto parsed = parse_song_states(doc);
        CHECK(parsed.size() == 3);
        CHECK(parsed["a"].volume == doctest::Approx(0.5f));
        CHECK(parsed["a"].mute);
        CHECK_FALSE(parsed["a"].solo);
        CHECK_FALSE(parsed.count("c"));
        CHECK_FALSE(parsed.count("d"));
        CHECK(parsed["e"].volume == doctest::Approx(1.0f));
        CHECK(parsed["f"].volume == doctest::Approx(0.0f));
        CHECK(parsed["f"].solo);
        CHECK(parse_song_states(nlohmann::json(42)).empty());
    }

    TEST_CASE("wrong-typed stored state falls back to the default") {
        auto store = std::make_shared<memory_document_store>();
        callback_dispatcher dispatcher;
        track_state_store states(store, dispatcher, "u1");
        auto s = make_song("s1", {"a", "b"});
        store->write("users/u1/trackStates/s1/a", {{"volume", "loud"}});
        store->write("users/u1/trackStates/s1/b", {{"volume", 5.0}, {"mute", true}});

        song_mix_states loaded;
        CHECK_NOTHROW(loaded = states.load(s));
        CHECK(loaded["a"] == states.default_state());
        CHECK(loaded["b"].volume == doctest::Approx(1.0f));
        CHECK(loaded["b"].mute);

        auto raw = store->read("users/u1/trackStates/s1/a");
        REQUIRE(raw);
        CHECK((*raw)["volume"].get<double>() == doctest::Approx(states.default_state().volume));
    }

    TEST_CASE("malformed remote change does not reach the writer") {
        auto store = std::make_shared<memory_document_store>();
        callback_dispatcher dispatcher;
        track_state_store states(store, dispatcher, "u1");
        std::vector<song_mix_states> pushes;
        auto sub = states.subscribe("s1", [&](const song_mix_states& m) { pushes.push_back(m); });

        CHECK_NOTHROW(store->write("users/u1/trackStates/s1/a", {{"solo", "yes"}}));
        CHECK_NOTHROW(store->write("users/u1/trackStates/s1/b", {{"volume", 0.3}}));
        dispatcher.dispatch();
        REQUIRE_FALSE(pushes.empty());
        CHECK_FALSE(pushes.back().count("a"));
        CHECK(pushes.back()["b"].volume == doctest::Approx(0.3f));
    }
}

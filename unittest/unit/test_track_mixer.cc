/**
 * @file test_track_mixer.cc
 * @brief Unit tests for per-track volume, mute and solo
 */

#include <doctest/doctest.h>
#include <stemdeck/error.hh>
#include <stemdeck/track_mixer.hh>
#include <stemdeck/track_state_store.hh>
#include "../mock_components.hh"
#include "../test_fixtures.hh"

using namespace stemdeck;
using namespace stemdeck::test;

namespace {
    track_mix_state mix(float volume, bool mute = false, bool solo = false) {
        track_mix_state s;
        s.volume = volume;
        s.mute = mute;
        s.solo = solo;
        return s;
    }

    class mixer_fixture : public transport_fixture {
        protected:
            song abc = make_song("s1", {"a", "b", "c"});
            track_mixer mixer{*player, clock, config};

            float gain_of(const std::string& track_id) {
                return factory->channel_for("s1/" + track_id)->get_gain();
            }

            void bind_loaded(const song_mix_states& states) {
                load_ready(abc);
                mixer.bind(abc, states);
            }
    };
}

TEST_SUITE("TrackMixer::Unit") {

    TEST_CASE("resolve_gain follows mute and solo") {
        song_mix_states states{{"a", mix(0.8f)}, {"b", mix(0.5f, true)}, {"c", mix(0.3f)}};
        CHECK(resolve_gain("a", states) == doctest::Approx(0.8f));
        CHECK(resolve_gain("b", states) == doctest::Approx(0.0f));
        CHECK(resolve_gain("c", states) == doctest::Approx(0.3f));
        CHECK(resolve_gain("ghost", states) == doctest::Approx(0.0f));

        SUBCASE("solo silences the others") {
            states["a"].solo = true;
            CHECK(resolve_gain("a", states) == doctest::Approx(0.8f));
            CHECK(resolve_gain("c", states) == doctest::Approx(0.0f));
        }

        SUBCASE("mute wins over solo") {
            states["b"].solo = true;
            CHECK(resolve_gain("b", states) == doctest::Approx(0.0f));
            CHECK(resolve_gain("a", states) == doctest::Approx(0.0f));
        }
    }

    TEST_CASE_FIXTURE(mixer_fixture, "three_track_solo_scenario") {
        bind_loaded({{"a", mix(0.9f)}, {"b", mix(0.7f, true)}, {"c", mix(0.4f)}});
        CHECK(gain_of("a") == doctest::Approx(0.9f));
        CHECK(gain_of("b") == doctest::Approx(0.0f));
        CHECK(gain_of("c") == doctest::Approx(0.4f));

        mixer.toggle_solo("a");
        CHECK(gain_of("a") == doctest::Approx(0.9f));
        CHECK(gain_of("b") == doctest::Approx(0.0f));
        CHECK(gain_of("c") == doctest::Approx(0.0f));
        CHECK(player->state().soloed_track_ids == std::set<std::string>{"a"});

        mixer.toggle_solo("c");
        CHECK(gain_of("a") == doctest::Approx(0.9f));
        CHECK(gain_of("b") == doctest::Approx(0.0f));
        CHECK(gain_of("c") == doctest::Approx(0.4f));
        CHECK(mixer.effective_gain("c") == doctest::Approx(0.4f));
    }

    TEST_CASE_FIXTURE(mixer_fixture, "should_fill_missing_states_with_defaults") {
        bind_loaded({{"b", mix(0.25f)}});
        CHECK(mixer.is_bound());
        CHECK(mixer.song_id() == "s1");
        CHECK(mixer.snapshot().size() == 3);
        CHECK(mixer.state("a") == track_mix_state{});
        CHECK(mixer.state("b").volume == doctest::Approx(0.25f));
        CHECK_THROWS_AS((void)mixer.state("ghost"), state_error);
    }

    TEST_CASE_FIXTURE(mixer_fixture, "should_mirror_mute_into_transport") {
        bind_loaded({{"a", mix(1.0f)}, {"b", mix(1.0f, true)}, {"c", mix(1.0f)}});
        CHECK(player->state().active_track_ids == std::set<std::string>{"a", "c"});

        player->play();
        CHECK_FALSE(factory->channel_for("s1/b")->is_playing());

        factory->channel_for("s1/a")->set_position(4.0);
        mixer.toggle_mute("b");
        auto b = factory->channel_for("s1/b");
        CHECK(b->is_playing());
        CHECK(b->get_position() == doctest::Approx(4.0));
        CHECK(b->get_gain() == doctest::Approx(1.0f));

        mixer.toggle_mute("a");
        CHECK_FALSE(factory->channel_for("s1/a")->is_playing());
        CHECK(gain_of("a") == doctest::Approx(0.0f));
    }

    TEST_CASE_FIXTURE(mixer_fixture, "should_clamp_volume") {
        bind_loaded({});
        mixer.set_volume("a", 1.7f);
        CHECK(mixer.state("a").volume == doctest::Approx(1.0f));
        mixer.set_volume("a", -0.2f);
        CHECK(mixer.state("a").volume == doctest::Approx(0.0f));
        mixer.set_volume("b", 0.35f);
        CHECK(gain_of("b") == doctest::Approx(0.35f));
        CHECK(mixer.volumes().at("b") == doctest::Approx(0.35f));
    }

    TEST_CASE_FIXTURE(mixer_fixture, "should_ignore_unknown_tracks") {
        bind_loaded({});
        int changes = 0;
        mixer.on_mix_changed().connect([&](const song_mix_states&) { ++changes; });
        CHECK_NOTHROW(mixer.set_volume("ghost", 0.1f));
        CHECK_NOTHROW(mixer.toggle_mute("ghost"));
        CHECK_NOTHROW(mixer.classify_click("ghost"));
        CHECK(changes == 0);
        CHECK(clock.pending() == 0);
    }

    TEST_CASE_FIXTURE(mixer_fixture, "should_survive_gain_failures") {
        bind_loaded({});
        factory->channel_for("s1/a")->fail("set_gain");
        CHECK_NOTHROW(mixer.set_volume("a", 0.5f));
        CHECK(mixer.state("a").volume == doctest::Approx(0.5f));
        CHECK_NOTHROW(mixer.toggle_solo("b"));
        CHECK(gain_of("c") == doctest::Approx(0.0f));
    }

    TEST_CASE_FIXTURE(mixer_fixture, "single_click_solos_after_window") {
        bind_loaded({});
        mixer.classify_click("a");
        CHECK(mixer.click_pending("a"));

        clock.advance(config.click_window - std::chrono::milliseconds(1));
        CHECK_FALSE(mixer.state("a").solo);

        clock.advance(std::chrono::milliseconds(1));
        CHECK(mixer.state("a").solo);
        CHECK_FALSE(mixer.state("a").mute);
        CHECK_FALSE(mixer.click_pending("a"));
    }

    TEST_CASE_FIXTURE(mixer_fixture, "double_click_mutes_without_solo") {
        bind_loaded({});
        mixer.classify_click("a");
        clock.advance(std::chrono::milliseconds(120));
        mixer.classify_click("a");

        CHECK(mixer.state("a").mute);
        CHECK_FALSE(mixer.click_pending("a"));
        clock.advance(std::chrono::milliseconds(1000));
        CHECK_FALSE(mixer.state("a").solo);
        CHECK(gain_of("a") == doctest::Approx(0.0f));
    }

    TEST_CASE_FIXTURE(mixer_fixture, "slow_clicks_are_two_single_clicks") {
        bind_loaded({});
        mixer.classify_click("a");
        clock.advance(config.click_window + std::chrono::milliseconds(50));
        CHECK(mixer.state("a").solo);

        mixer.classify_click("a");
        clock.advance(config.click_window);
        CHECK_FALSE(mixer.state("a").solo);
        CHECK_FALSE(mixer.state("a").mute);
    }

    TEST_CASE_FIXTURE(mixer_fixture, "clicks_on_different_tracks_are_independent") {
        bind_loaded({});
        mixer.classify_click("a");
        clock.advance(std::chrono::milliseconds(100));
        mixer.classify_click("b");
        clock.advance(std::chrono::milliseconds(100));
        mixer.classify_click("b");

        CHECK(mixer.state("b").mute);
        CHECK(mixer.click_pending("a"));
        clock.advance(config.click_window);
        CHECK(mixer.state("a").solo);
        CHECK_FALSE(mixer.state("b").solo);
    }

    TEST_CASE_FIXTURE(mixer_fixture, "unbind_cancels_pending_clicks") {
        bind_loaded({});
        mixer.classify_click("a");
        mixer.unbind();
        CHECK_FALSE(mixer.is_bound());
        CHECK(clock.pending() == 0);
        CHECK(mixer.snapshot().empty());
    }

    TEST_CASE_FIXTURE(mixer_fixture, "should_write_through_to_store") {
        auto store = std::make_shared<memory_document_store>();
        callback_dispatcher dispatcher;
        track_state_store states(store, dispatcher, "u1");
        mixer.set_store(&states);
        bind_loaded({});

        mixer.set_volume("a", 0.42f);
        mixer.toggle_mute("b");
        auto loaded = states.load(abc);
        CHECK(loaded["a"].volume == doctest::Approx(0.42f));
        CHECK(loaded["b"].mute);
        mixer.set_store(nullptr);
    }

    TEST_CASE_FIXTURE(mixer_fixture, "should_keep_local_state_when_persisting_fails") {
        auto store = std::make_shared<failing_document_store>();
        callback_dispatcher dispatcher;
        track_state_store states(store, dispatcher, "u1");
        mixer.set_store(&states);
        bind_loaded({});

        store->fail_writes = true;
        CHECK_NOTHROW(mixer.toggle_mute("a"));
        CHECK(mixer.state("a").mute);
        CHECK(gain_of("a") == doctest::Approx(0.0f));
        mixer.set_store(nullptr);
    }

    TEST_CASE_FIXTURE(mixer_fixture, "remote_states_apply_without_writing_back") {
        auto store = std::make_shared<failing_document_store>();
        callback_dispatcher dispatcher;
        track_state_store states(store, dispatcher, "u1");
        mixer.set_store(&states);
        bind_loaded({});
        int changes = 0;
        mixer.on_mix_changed().connect([&](const song_mix_states&) { ++changes; });

        const int writes = store->writes.load();
        mixer.apply_remote({{"a", mix(0.6f, false, true)}, {"ghost", mix(0.1f)}});
        CHECK(store->writes.load() == writes);
        CHECK(changes == 1);
        CHECK(mixer.state("a").solo);
        CHECK(mixer.snapshot().count("ghost") == 0);
        CHECK(gain_of("a") == doctest::Approx(0.6f));
        CHECK(gain_of("b") == doctest::Approx(0.0f));
        CHECK(player->state().soloed_track_ids == std::set<std::string>{"a"});
        mixer.set_store(nullptr);
    }

    TEST_CASE_FIXTURE(mixer_fixture, "should_not_touch_channels_of_another_song") {
        auto other = make_song("s2", {"a"});
        load_ready(other);
        mixer.bind(abc, {});
        mixer.set_volume("a", 0.2f);
        CHECK(factory->channel_for("s2/a")->get_gain() == doctest::Approx(1.0f));
        CHECK(factory->channel_for("s2/a")->gain_calls.load() == 0);
    }
}

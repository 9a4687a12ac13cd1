/**
 * @file test_types.cc
 * @brief Unit tests for data model helpers and their document mapping
 */

#include <doctest/doctest.h>
#include <stemdeck/types.hh>
#include <nlohmann/json.hpp>
#include "../mock_components.hh"

using namespace stemdeck;

TEST_SUITE("Types::Unit") {

    TEST_CASE("should_find_tracks_by_id") {
        auto s = test::make_song("s1", {"drums", "bass"});
        REQUIRE(s.find_track("bass") != nullptr);
        CHECK(s.find_track("bass")->path == "s1/bass");
        CHECK(s.find_track("keys") == nullptr);
        CHECK(s.track_ids() == std::vector<std::string>{"drums", "bass"});
    }

    TEST_CASE("should_default_missing_mix_state_fields") {
        auto state = nlohmann::json::parse(R"({"mute": true})").get<track_mix_state>();
        CHECK(state.volume == doctest::Approx(1.0f));
        CHECK(state.mute);
        CHECK_FALSE(state.solo);

        auto from_null = nlohmann::json().get<track_mix_state>();
        CHECK(from_null == track_mix_state{});
    }

    TEST_CASE("should_use_document_keys_for_snapshots") {
        transport_state st;
        st.is_playing = true;
        st.seek_position_seconds = 42.5;
        st.active_track_ids = {"a", "b"};
        st.soloed_track_ids = {"b"};
        st.playback_speed = 0.75;

        nlohmann::json j = transport_snapshot::from_state(st, {{"a", 0.5f}});

        CHECK(j["isPlaying"] == true);
        CHECK(j["seekPosition"].get<double>() == doctest::Approx(42.5));
        CHECK(j["activeTracks"] == nlohmann::json::array({"a", "b"}));
        CHECK(j["soloedTracks"] == nlohmann::json::array({"b"}));
        CHECK(j["trackVolumes"]["a"].get<float>() == doctest::Approx(0.5f));
        CHECK(j["playbackSpeed"].get<double>() == doctest::Approx(0.75));
    }

    TEST_CASE("should_treat_unset_speed_as_normal") {
        auto snap = nlohmann::json::parse(R"({"isPlaying": true, "playbackSpeed": 0})").get<transport_snapshot>();
        CHECK(snap.is_playing);
        CHECK(snap.playback_speed == doctest::Approx(1.0));
        CHECK(snap.seek_position == doctest::Approx(0.0));
        CHECK(snap.active_tracks.empty());
    }
}

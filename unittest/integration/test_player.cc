/**
 * @file test_player.cc
 * @brief End-to-end tests of the assembled player on null channels
 *
 * Test Coverage:
 * - Queue playback with mixer binding and persisted track states
 * - Track states shared between devices of one user
 * - Admin/follower session between two players
 */

#include <doctest/doctest.h>
#include <stemdeck/backends/null/null_channel.hh>
#include <stemdeck/error.hh>
#include <stemdeck/player.hh>
#include <nlohmann/json.hpp>
#include <chrono>

using namespace stemdeck;
using namespace std::chrono_literals;

namespace {
    song null_song(const std::string& id, double seconds) {
        song s;
        s.id = id;
        s.title = "Song " + id;
        s.artist = "Band";
        const auto ref = "null:" + std::to_string(seconds);
        s.tracks = {{"drums", "Drums", ref}, {"bass", "Bass", ref}, {"vocals", "Vocals", ref}};
        return s;
    }

    class player_fixture {
        protected:
            manual_scheduler clock;
            std::shared_ptr<memory_document_store> store = std::make_shared<memory_document_store>();
            std::shared_ptr<memory_content_store> content = std::make_shared<memory_content_store>(
                std::vector<song>{null_song("s1", 2.0), null_song("s2", 3.0)});

            std::unique_ptr<player> make_player(const std::string& user, const std::string& device) {
                player_options options;
                options.user_id = user;
                options.device_id = device;
                options.shuffle_seed = 1;
                return std::make_unique<player>(std::make_shared<null_channel_factory>(clock),
                                                store, content, clock, options);
            }
    };
}

TEST_SUITE("Player::Integration") {

    TEST_CASE_FIXTURE(player_fixture, "queue_plays_through_with_mixer_bound") {
        auto p = make_player("u1", "d1");
        int completed = 0;
        p->queue().on_queue_complete().connect([&] { ++completed; });

        p->queue().start({"s1", "s2"}, queue_mode::playlist);
        REQUIRE(p->get_transport().wait_for_load());
        CHECK(p->get_transport().phase() == transport_phase::playing);
        CHECK(p->mixer().song_id() == "s1");
        CHECK(store->read("users/u1/trackStates/s1/drums"));

        p->mixer().toggle_mute("bass");
        CHECK_FALSE(p->get_transport().state().active_track_ids.count("bass"));
        p->poll();
        CHECK(p->mixer().state("bass").mute);

        clock.advance(2100ms);
        CHECK(p->queue().current_song_id() == std::optional<std::string>("s2"));
        REQUIRE(p->get_transport().wait_for_load());
        CHECK(p->mixer().song_id() == "s2");
        CHECK_FALSE(p->mixer().state("bass").mute);

        clock.advance(3100ms);
        CHECK(completed == 1);
        CHECK(p->queue().phase() == queue_phase::complete);
    }

    TEST_CASE_FIXTURE(player_fixture, "track_states_follow_the_user") {
        {
            auto p = make_player("u1", "d1");
            p->queue().start({"s1"}, queue_mode::filtered_list);
            REQUIRE(p->get_transport().wait_for_load());
            p->mixer().set_volume("vocals", 0.42f);
            p->mixer().toggle_solo("drums");
        }

        auto p = make_player("u1", "d2");
        p->queue().start({"s1"}, queue_mode::filtered_list);
        REQUIRE(p->get_transport().wait_for_load());
        CHECK(p->mixer().state("vocals").volume == doctest::Approx(0.42f));
        CHECK(p->mixer().state("drums").solo);
        CHECK(p->mixer().effective_gain("vocals") == doctest::Approx(0.0f));

        p->set_user("u2");
        CHECK_FALSE(p->mixer().state("drums").solo);
        CHECK(p->track_states().user() == "u2");
    }

    TEST_CASE_FIXTURE(player_fixture, "remote_changes_of_the_same_user_apply") {
        auto a = make_player("u1", "d1");
        auto b = make_player("u1", "d2");
        a->queue().start({"s1"}, queue_mode::filtered_list);
        b->queue().start({"s1"}, queue_mode::filtered_list);
        REQUIRE(a->get_transport().wait_for_load());
        REQUIRE(b->get_transport().wait_for_load());
        a->poll();
        b->poll();

        a->mixer().set_volume("bass", 0.3f);
        b->poll();
        CHECK(b->mixer().state("bass").volume == doctest::Approx(0.3f));
    }

    TEST_CASE_FIXTURE(player_fixture, "follower_mirrors_admin_transport") {
        auto admin = make_player("u1", "admin");
        auto follower = make_player("u2", "follower");

        auto id = admin->session().create_session();
        REQUIRE(id);
        REQUIRE(follower->session().join_session(*id));
        follower->poll();

        admin->queue().start({"s1"}, queue_mode::filtered_list);
        follower->queue().start({"s1"}, queue_mode::filtered_list);
        REQUIRE(admin->get_transport().wait_for_load());
        REQUIRE(follower->get_transport().wait_for_load());

        clock.advance(200ms);
        admin->get_transport().seek(1.0);
        admin->get_transport().play();
        admin->mixer().set_volume("drums", 0.6f);
        follower->poll();
        clock.advance(100ms);
        follower->poll();

        auto& remote = follower->get_transport();
        CHECK(remote.phase() == transport_phase::playing);
        CHECK(remote.position() == doctest::Approx(1.0));

        auto state = store->read("sessions/" + *id + "/state");
        REQUIRE(state);
        CHECK((*state)["trackVolumes"]["drums"].get<double>() == doctest::Approx(0.6));

        admin->get_transport().pause();
        follower->poll();
        clock.advance(100ms);
        CHECK(remote.phase() == transport_phase::paused);

        std::vector<std::string> ended;
        follower->session().on_session_ended().connect([&](const std::string& sid) { ended.push_back(sid); });
        admin->session().leave_session();
        follower->poll();
        CHECK(ended == std::vector<std::string>{*id});
    }

    TEST_CASE_FIXTURE(player_fixture, "invalid_configuration_is_rejected") {
        player_options options;
        options.config.sync_debounce = std::chrono::milliseconds(-1);
        CHECK_THROWS_AS(player(std::make_shared<null_channel_factory>(clock), store, content, clock, options),
                        config_error);
    }
}

#ifndef STEMDECK_TEST_FIXTURES_HH
#define STEMDECK_TEST_FIXTURES_HH

#include <stemdeck/clock.hh>
#include <stemdeck/engine_config.hh>
#include <stemdeck/transport.hh>
#include <chrono>
#include <memory>
#include "mock_components.hh"
#include <doctest/doctest.h>

namespace stemdeck::test {
    using namespace std::chrono_literals;

    // Transport on mock channels and virtual time
    class transport_fixture {
        protected:
            manual_scheduler clock;
            std::shared_ptr<mock_channel_factory> factory;
            engine_config config;
            std::unique_ptr<transport> player;

        public:
            transport_fixture()
                : factory(std::make_shared<mock_channel_factory>()) {
                player = std::make_unique<transport>(factory, clock, config);
            }

            // Load and wait until the song is ready
            void load_ready(const song& s) {
                player->load(s);
                REQUIRE(player->wait_for_load());
                REQUIRE(player->phase() == transport_phase::ready);
            }

            // Put every channel of s at its end
            void run_to_end(const song& s, double duration = 60.0) {
                for (const auto& t : s.tracks) {
                    if (auto ch = factory->channel_for(t.path)) {
                        ch->set_position(duration);
                    }
                }
                clock.advance(config.progress_interval);
            }
    };
}

#endif // STEMDECK_TEST_FIXTURES_HH

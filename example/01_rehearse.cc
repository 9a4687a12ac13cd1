/**
 * @example 01_rehearse.cc
 * @brief Basic example: rehearsing a song from WAV stems
 *
 * Every argument is one stem of the same song. The stems are played
 * together through SDL3; the first stem is soloed after five seconds
 * and the song plays to the end.
 */

#include <stemdeck/backends/sdl3/sdl3_backend.hh>
#include <stemdeck/document_store.hh>
#include <stemdeck/error.hh>
#include <stemdeck/player.hh>
#include <chrono>
#include <iostream>
#include <thread>

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <stem.wav> [<stem.wav> ...]\n";
        return 1;
    }

    try {
        stemdeck::song s;
        s.id = "rehearsal";
        s.title = "Rehearsal";
        for (int i = 1; i < argc; ++i) {
            s.tracks.push_back({"stem-" + std::to_string(i), argv[i], argv[i]});
        }

        auto content = std::make_shared<stemdeck::memory_content_store>();
        content->add_song(s);
        auto store = std::make_shared<stemdeck::memory_document_store>();
        auto factory = stemdeck::create_sdl3_channel_factory();

        stemdeck::steady_scheduler clock;
        stemdeck::player_options options;
        options.user_id = "local";
        options.device_id = "console";
        stemdeck::player p(factory, store, content, clock, options);

        p.get_transport().on_finished().connect([]() { std::cout << "Song finished\n"; });
        p.queue().start({s.id}, stemdeck::queue_mode::playlist);
        std::cout << "Loading " << s.tracks.size() << " stems...\n";

        bool soloed = false;
        const auto started = std::chrono::steady_clock::now();
        while (p.queue().phase() != stemdeck::queue_phase::complete) {
            p.poll();
            if (!soloed && std::chrono::steady_clock::now() - started > std::chrono::seconds(5)) {
                p.mixer().toggle_solo(s.tracks.front().id);
                std::cout << "Soloed " << s.tracks.front().name << '\n';
                soloed = true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    } catch (const stemdeck::channel_error& e) {
        std::cerr << "Audio error: " << e.what() << '\n';
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}

/**
 * @example 02_session.cc
 * @brief Shared session between an admin and a follower device
 *
 * Two players share one in-memory document store and run on silent
 * channels. The admin creates a session and controls playback; the
 * follower joins and mirrors it.
 */

#include <stemdeck/backends/null/null_channel.hh>
#include <stemdeck/document_store.hh>
#include <stemdeck/player.hh>
#include <chrono>
#include <iostream>
#include <thread>

namespace {
    void run_for(std::chrono::milliseconds duration, stemdeck::player& a, stemdeck::player& b) {
        const auto until = std::chrono::steady_clock::now() + duration;
        while (std::chrono::steady_clock::now() < until) {
            a.poll();
            b.poll();
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    void report(const char* who, stemdeck::player& p) {
        const auto& t = p.get_transport();
        std::cout << who << ": " << stemdeck::to_string(t.phase())
                  << " at " << t.position() << "s, speed " << t.playback_speed() << '\n';
    }
}

int main() {
    try {
        stemdeck::song s;
        s.id = "demo";
        s.title = "Demo";
        s.tracks = {{"drums", "Drums", "null:30"}, {"bass", "Bass", "null:30"}, {"keys", "Keys", "null:30"}};

        auto content = std::make_shared<stemdeck::memory_content_store>(std::vector<stemdeck::song>{s});
        auto store = std::make_shared<stemdeck::memory_document_store>();

        stemdeck::steady_scheduler clock;
        auto factory = std::make_shared<stemdeck::null_channel_factory>(clock);

        stemdeck::player admin(factory, store, content, clock, {"alice", "stage", {}, 0});
        stemdeck::player follower(factory, store, content, clock, {"bob", "phone", {}, 0});

        const auto id = admin.session().create_session();
        if (!id) {
            std::cerr << "Could not create a session\n";
            return 1;
        }
        std::cout << "Session " << *id << " created\n";
        if (!follower.session().join_session(*id)) {
            std::cerr << "Could not join session " << *id << '\n';
            return 1;
        }

        admin.queue().start({s.id}, stemdeck::queue_mode::filtered_list);
        follower.queue().start({s.id}, stemdeck::queue_mode::filtered_list);
        run_for(std::chrono::milliseconds(200), admin, follower);

        admin.get_transport().play();
        run_for(std::chrono::milliseconds(500), admin, follower);
        report("admin", admin);
        report("follower", follower);

        admin.get_transport().seek(12.0);
        admin.get_transport().set_speed(1.25);
        run_for(std::chrono::milliseconds(300), admin, follower);
        report("admin", admin);
        report("follower", follower);

        admin.get_transport().pause();
        run_for(std::chrono::milliseconds(200), admin, follower);
        report("admin", admin);
        report("follower", follower);

        for (const auto& info : admin.session().list_sessions()) {
            std::cout << "session " << info.id << " admin " << info.admin << '\n';
        }
        admin.session().leave_session();
        run_for(std::chrono::milliseconds(50), admin, follower);
        std::cout << "Sessions left: " << admin.session().list_sessions().size() << '\n';
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }
    return 0;
}

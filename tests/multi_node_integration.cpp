#include "peerchat/core/Node.hpp"
#include "peerchat/log/StructuredLogger.hpp"
#include "peerchat/network/DatagramTransport.hpp"
#include "test_support.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

using namespace peerchat;
using namespace std::chrono_literals;

namespace {

bool knows_user(Node& node, const std::string& name) {
    for (const auto& user : node.users()) {
        if (user.name == name && !user.is_self) {
            return true;
        }
    }
    return false;
}

bool history_has(Node& node, const std::string& needle) {
    for (const auto& line : node.history().tail(100)) {
        if (line.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

}  // namespace

int main() {
    log::StructuredLogger::instance().set_enabled(false);

    const auto temp_dir = std::filesystem::temp_directory_path() / "peerchat_multi_node_test";
    std::filesystem::remove_all(temp_dir);
    std::filesystem::create_directories(temp_dir);

    test::EventRecorder alice_events;
    test::EventRecorder bob_events;

    auto alice_config = test::make_loopback_config("alice");
    alice_config.peers_file = (temp_dir / "alice_peers").string();
    alice_config.history_file = (temp_dir / "alice_history").string();
    auto bob_config = test::make_loopback_config("bob");
    bob_config.keepalive_interval = 50ms;

    auto alice = std::make_unique<Node>(alice_config);
    Node bob(bob_config);
    alice->set_event_handler(alice_events.handler());
    bob.set_event_handler(bob_events.handler());
    alice->start();
    bob.start();
    assert(alice->running());
    assert(alice->peers().empty());
    assert(bob.peers().empty());

    // One side connects; the other learns the connection without a command.
    {
        const auto response = alice->handle_command("connect", "127.0.0.1:" + std::to_string(bob.listening_port()));
        assert(response.success);
        assert(bob.directory().port_of("127.0.0.1") == alice->listening_port());
        assert(test::wait_until([&] { return knows_user(bob, "alice"); }));
        assert(test::wait_until([&] { return knows_user(*alice, "bob"); }));
        assert(bob_events.contains(ChatEvent::Kind::Joined, "alice"));
    }

    // Chat reaches the peer and both histories.
    {
        const auto report = alice->send_chat("hello: everyone");
        assert(report.attempted == 1);
        assert(report.delivered == 1);
        assert(test::wait_until([&] { return bob_events.contains(ChatEvent::Kind::Chat, "alice", "hello: everyone"); }));
        assert(history_has(*alice, "alice: hello: everyone"));
        assert(history_has(bob, "alice: hello: everyone"));

        assert(alice->send_chat("").attempted == 0);

        bob.send_chat("hi alice");
        assert(test::wait_until([&] { return alice_events.contains(ChatEvent::Kind::Chat, "bob", "hi alice"); }));
    }

    // Whisper in the other direction.
    {
        const auto response = bob.handle_command("whisper", "alice just for you");
        assert(response.success);
        assert(test::wait_until([&] {
            return alice_events.contains(ChatEvent::Kind::Private, "bob", "just for you");
        }));
        assert(history_has(*alice, "[private from bob] just for you"));
        assert(alice_events.count(ChatEvent::Kind::Chat) == 1);
    }

    // Keepalive pings restore presence that was lost.
    {
        assert(alice->presence().remove("bob", "127.0.0.1"));
        assert(test::wait_until([&] { return knows_user(*alice, "bob"); }));
    }

    // Garbage on the wire is counted and otherwise ignored.
    {
        const auto before = alice->statistics();
        network::DatagramTransport stray;
        stray.open(0, 200ms);
        assert(stray.send_to("127.0.0.1", alice->listening_port(), "HELLO:garbage"));
        assert(stray.send_to("127.0.0.1", alice->listening_port(), "SYS:JOIN:no-address"));
        assert(test::wait_until([&] { return alice->statistics().malformed_datagrams >= before.malformed_datagrams + 2; }));
        assert(alice->statistics().datagrams_received >= before.datagrams_received + 2);
        assert(alice->running());
    }

    // Dropped datagrams are lost silently; later traffic still flows.
    {
        network::DatagramTransport::TestHooks hooks{};
        std::atomic<int> dropped{0};
        hooks.drop_receive = [&](const network::Datagram& datagram) {
            if (datagram.payload.find("lost in transit") != std::string::npos) {
                dropped.fetch_add(1);
                return true;
            }
            return false;
        };
        network::DatagramTransport::set_test_hooks(&hooks);
        alice->send_chat("lost in transit");
        assert(test::wait_until([&] { return dropped.load() == 1; }));
        network::DatagramTransport::set_test_hooks(nullptr);

        alice->send_chat("arrived");
        assert(test::wait_until([&] { return bob_events.contains(ChatEvent::Kind::Chat, "alice", "arrived"); }));
        assert(!bob_events.contains(ChatEvent::Kind::Chat, "alice", "lost in transit"));
    }

    // Leaving is announced; the peer record stays.
    {
        alice->shutdown();
        assert(!alice->running());
        assert(test::wait_until([&] { return bob_events.contains(ChatEvent::Kind::Left, "alice"); }));
        assert(bob.directory().port_of("127.0.0.1").has_value());
        alice->shutdown();
    }

    // A restart reloads the persisted peers and announces itself.
    {
        alice.reset();
        test::EventRecorder restarted_events;
        auto restarted = std::make_unique<Node>(alice_config);
        restarted->set_event_handler(restarted_events.handler());
        restarted->start();
        assert(restarted->peers().size() == 1);
        assert(restarted->peers().front().port == bob.listening_port());
        assert(history_has(*restarted, "alice: hello: everyone"));
        assert(test::wait_until([&] { return bob_events.count(ChatEvent::Kind::Joined) >= 2; }));
        assert(test::wait_until([&] { return knows_user(bob, "alice"); }));
        restarted->shutdown();
    }

    bob.shutdown();

    // Between quiet peers a Leave removes the identity for good.
    {
        test::EventRecorder erin_events;
        Node dave(test::make_loopback_config("dave"));
        Node erin(test::make_loopback_config("erin"));
        erin.set_event_handler(erin_events.handler());
        dave.start();
        erin.start();
        assert(dave.handle_command("connect", "127.0.0.1:" + std::to_string(erin.listening_port())).success);
        assert(test::wait_until([&] { return knows_user(erin, "dave"); }));

        dave.shutdown();
        assert(test::wait_until([&] { return erin_events.contains(ChatEvent::Kind::Left, "dave"); }));
        assert(!knows_user(erin, "dave"));
        assert(erin.directory().size() == 1);
        erin.shutdown();
    }

    std::filesystem::remove_all(temp_dir);
    return 0;
}

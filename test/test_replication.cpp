// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// test_replication.cpp - End-to-end replication over the in-process hub

#include <catch2/catch_all.hpp>
#include <statecast/authority.h>
#include <statecast/builders.h>
#include <statecast/local_transport.h>
#include <statecast/observer.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace statecast;
using namespace std::chrono_literals;

namespace {

struct FakeClock {
    std::shared_ptr<RateLimiter::Clock::time_point> now =
        std::make_shared<RateLimiter::Clock::time_point>(RateLimiter::Clock::time_point{} + 1h);

    RateLimiter::TimeSource source() const {
        auto current = now;
        return [current] { return *current; };
    }

    void advance(RateLimiter::Clock::duration d) { *now += d; }
};

// One observer process: its hub endpoint plus its registry
struct Peer {
    Peer(LocalHub& hub, const Identity& identity)
        : transport(hub.connect(identity))
        , registry(*transport)
    {
        registry.init();
    }

    std::shared_ptr<ObserverTransport> transport;
    ObserverRegistry registry;
};

Value gold_tree(int gold) {
    return MapBuilder().set("gold", gold).finish();
}

} // namespace

TEST_CASE("Replication end to end", "[replication]") {
    LocalHub hub;
    FakeClock clock;
    AuthorityRegistry authority(hub, ReplicationConfig{}, clock.source());
    authority.init();

    Peer alice(hub, "alice");
    Peer bob(hub, "bob");

    authority.create_node("n", scope::All{}, gold_tree(0));
    hub.pump();

    auto alice_node = alice.registry.get_node("n");
    REQUIRE(alice_node != nullptr);
    REQUIRE(bob.registry.get_node("n") != nullptr);
    REQUIRE(alice_node->state() == gold_tree(0));

    SECTION("patches advance every observer in order") {
        REQUIRE(authority.patch_node("n", op_increment({"gold"}, 100)) == 1);
        REQUIRE(authority.state("n") == gold_tree(100));
        hub.pump();
        REQUIRE(alice_node->version() == 1);
        REQUIRE(alice_node->state() == gold_tree(100));

        REQUIRE(authority.patch_node("n", op_set({"gold"}, Value{50})) == 2);
        hub.pump();
        REQUIRE(alice_node->version() == 2);
        REQUIRE(alice_node->state() == gold_tree(50));
        REQUIRE(bob.registry.get_node("n")->state() == gold_tree(50));
    }

    SECTION("out-of-order delivery keeps the newest state") {
        // Capture the wire messages of a third observer and replay them reversed
        auto carol_transport = hub.connect("carol");
        std::vector<Message> captured;
        ScopedConnection capture = carol_transport->on_message([&](const Message& msg) { captured.push_back(msg); });

        (void)authority.patch_node("n", op_increment({"gold"}, 100));
        (void)authority.patch_node("n", op_set({"gold"}, Value{50}));
        hub.pump();
        REQUIRE(captured.size() == 2);

        ObserverRegistry carol(*carol_transport);
        carol.init();
        carol.handle_message(CreateMessage{"n", Snapshot{"n", 0, gold_tree(0)}});
        carol.handle_message(captured[1]);
        carol.handle_message(captured[0]);

        auto node = carol.get_node("n");
        REQUIRE(node->version() == 2);
        REQUIRE(node->state() == gold_tree(50));

        // Redelivery of the latest patch is rejected by the version gate
        carol.handle_message(captured[1]);
        REQUIRE(node->version() == 2);
    }

    SECTION("list operations replicate") {
        authority.create_node("inv", scope::All{},
                              MapBuilder().set("items", VectorBuilder().push_back("a").push_back("b").finish()).finish());
        (void)authority.patch_node("inv", op_list_insert({"items"}, 0, Value{"sword"}));
        hub.pump();
        REQUIRE(alice.registry.get_node("inv")->get_value({"items"}) == Value::vector({"sword", "a", "b"}));

        (void)authority.patch_node("inv", op_list_remove_at({"items"}, 1));
        hub.pump();
        REQUIRE(alice.registry.get_node("inv")->get_value({"items"}) == Value::vector({"sword", "b"}));
    }

    SECTION("single scope never reaches other identities") {
        std::vector<Message> bob_messages;
        ScopedConnection spy = bob.transport->on_message([&](const Message& msg) { bob_messages.push_back(msg); });

        authority.create_node("secret", scope::Single{"alice"}, gold_tree(1));
        (void)authority.patch_node("secret", op_increment({"gold"}, 1));
        hub.pump();
        REQUIRE(alice.registry.get_node("secret")->state() == gold_tree(2));

        authority.destroy_node("secret");
        hub.pump();
        REQUIRE(alice.registry.get_node("secret") == nullptr);

        REQUIRE(bob_messages.empty());
        REQUIRE(bob.registry.get_node("secret") == nullptr);
    }

    SECTION("destroy reaches every observer") {
        authority.destroy_node("n");
        hub.pump();
        REQUIRE(alice.registry.size() == 0);
        REQUIRE(bob.registry.size() == 0);
        REQUIRE(alice_node->is_destroyed());
    }

    SECTION("replace_state resyncs observers") {
        int any_changes = 0;
        ScopedConnection conn = alice_node->listen_for_any_change([&] { ++any_changes; });
        REQUIRE(authority.replace_state("n", gold_tree(999)) == 1);
        hub.pump();
        REQUIRE(alice_node->state() == gold_tree(999));
        REQUIRE(alice_node->version() == 1);
        REQUIRE(any_changes == 1);
    }

    SECTION("dropped unreliable patches leave a version gap") {
        hub.set_unreliable_drop_filter([](const Identity& identity, const Message&) { return identity == "alice"; });

        (void)authority.patch_node("n", op_increment({"gold"}, 5, Reliability::Unreliable));
        (void)authority.patch_node("n", op_increment({"gold"}, 1));
        hub.pump();

        REQUIRE(hub.stats().dropped == 1);
        REQUIRE(alice_node->version() == 2);
        REQUIRE(alice_node->state() == gold_tree(1));
        REQUIRE(bob.registry.get_node("n")->state() == gold_tree(6));
    }
}

TEST_CASE("Replication bootstrap", "[replication][bootstrap]") {
    LocalHub hub;
    FakeClock clock;
    AuthorityRegistry authority(hub, ReplicationConfig{}, clock.source());
    authority.init();

    authority.create_node("shared", scope::All{}, gold_tree(0));
    authority.create_node("alice_only", scope::Single{"alice"}, gold_tree(1));
    (void)authority.patch_node("shared", op_increment({"gold"}, 10));
    hub.pump();

    SECTION("late joiner receives the visible nodes at their current version") {
        Peer alice(hub, "alice");
        REQUIRE(alice.registry.request_initial_data() == BootstrapStatus::Ready);
        REQUIRE(alice.registry.node_ids() == std::vector<NodeId>{"alice_only", "shared"});
        REQUIRE(alice.registry.get_node("shared")->version() == 1);
        REQUIRE(alice.registry.get_node("shared")->state() == gold_tree(10));

        Peer bob(hub, "bob");
        REQUIRE(bob.registry.request_initial_data() == BootstrapStatus::Ready);
        REQUIRE(bob.registry.node_ids() == std::vector<NodeId>{"shared"});

        (void)authority.patch_node("shared", op_increment({"gold"}, 1));
        hub.pump();
        REQUIRE(alice.registry.get_node("shared")->state() == gold_tree(11));
    }

    SECTION("bootstrap requests are rate limited per identity") {
        auto endpoint = hub.connect("alice");
        for (int i = 0; i < 5; ++i) {
            REQUIRE_FALSE(endpoint->request_initial_data(1s).empty());
        }
        REQUIRE(endpoint->request_initial_data(1s).empty());

        ObserverRegistry limited(*endpoint);
        limited.init();
        REQUIRE(limited.request_initial_data() == BootstrapStatus::Empty);

        clock.advance(10s);
        REQUIRE(limited.request_initial_data() == BootstrapStatus::Ready);
        REQUIRE(limited.size() == 2);
    }

    SECTION("unreachable authority fails the bootstrap") {
        Peer alice(hub, "alice");
        hub.set_requests_enabled(false);
        REQUIRE(alice.registry.request_initial_data() == BootstrapStatus::Failed);

        hub.set_requests_enabled(true);
        REQUIRE(alice.registry.request_initial_data() == BootstrapStatus::Ready);
    }

    SECTION("waiting for a node that arrives later") {
        Peer alice(hub, "alice");
        auto future = alice.registry.wait_for_node("later");

        authority.create_node("later", scope::All{}, gold_tree(3));
        hub.pump();
        REQUIRE(future.wait_for(0ms) == std::future_status::ready);
        REQUIRE(future.get()->state() == gold_tree(3));
    }

    SECTION("dynamically named nodes are reported by class") {
        Peer alice(hub, "alice");
        std::vector<NodeId> players;
        ScopedConnection conn = alice.registry.on_node_of_class_created(
            "player:", [&](const ObserverNodePtr& node) { players.push_back(node->id()); });

        authority.create_node("player:alice", scope::All{}, gold_tree(0));
        authority.create_node("player:bob", scope::All{}, gold_tree(0));
        authority.create_node("match", scope::All{}, gold_tree(0));
        hub.pump();

        REQUIRE(players == std::vector<NodeId>{"player:alice", "player:bob"});
    }
}

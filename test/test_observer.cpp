// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// test_observer.cpp - Tests for ObserverNode and ObserverRegistry

#include <catch2/catch_all.hpp>
#include <statecast/builders.h>
#include <statecast/observer.h>

#include <chrono>
#include <future>
#include <optional>
#include <string>
#include <vector>

using namespace statecast;
using namespace std::chrono_literals;

namespace {

// Scripted bootstrap responses; messages are pushed by calling deliver()
class ScriptedTransport : public ObserverTransport {
public:
    std::vector<CreateMessage> request_initial_data(std::chrono::milliseconds timeout) override {
        last_timeout = timeout;
        ++requests;
        if (fail) throw TransportError("authority unreachable");
        return response;
    }

    Connection on_message(MessageHandler handler) override {
        return messages.connect(std::move(handler));
    }

    void deliver(const Message& msg) { messages.fire(msg); }

    Signal<Message> messages;
    std::vector<CreateMessage> response;
    bool fail = false;
    int requests = 0;
    std::chrono::milliseconds last_timeout{0};
};

Value gold_tree(int gold) {
    return MapBuilder().set("gold", gold).finish();
}

Snapshot gold_snapshot(const NodeId& id, uint64_t version, int gold) {
    return Snapshot{id, version, gold_tree(gold)};
}

Patch gold_patch(const NodeId& id, uint64_t version, std::vector<PatchOperation> ops) {
    return Patch{id, version, std::move(ops)};
}

} // namespace

// ============================================================
// ObserverNode
// ============================================================

TEST_CASE("ObserverNode version gate", "[observer][node]") {
    ObserverNode node(gold_snapshot("n", 0, 0));

    SECTION("newer patch is applied") {
        REQUIRE(node.apply_patch(gold_patch("n", 1, {op_increment({"gold"}, 100)})));
        REQUIRE(node.version() == 1);
        REQUIRE(node.get_value({"gold"}) == Value{100});
    }

    SECTION("stale and duplicate patches are ignored") {
        REQUIRE(node.apply_patch(gold_patch("n", 2, {op_set({"gold"}, Value{50})})));
        REQUIRE_FALSE(node.apply_patch(gold_patch("n", 1, {op_set({"gold"}, Value{100})})));
        REQUIRE_FALSE(node.apply_patch(gold_patch("n", 2, {op_set({"gold"}, Value{7})})));
        REQUIRE(node.version() == 2);
        REQUIRE(node.state() == gold_tree(50));
    }

    SECTION("snapshot wins regardless of version") {
        REQUIRE(node.apply_patch(gold_patch("n", 5, {op_set({"gold"}, Value{5})})));
        node.apply_snapshot(gold_snapshot("n", 3, 30));
        REQUIRE(node.version() == 3);
        REQUIRE(node.state() == gold_tree(30));
        REQUIRE_FALSE(node.apply_patch(gold_patch("n", 3, {op_set({"gold"}, Value{1})})));
    }

    SECTION("patch for another node is a caller error") {
        REQUIRE_THROWS_AS(node.apply_patch(gold_patch("other", 1, {})), std::invalid_argument);
    }
}

TEST_CASE("ObserverNode change notifications", "[observer][node]") {
    auto initial = MapBuilder()
                       .set("gold", 0)
                       .set("name", "alice")
                       .set("items", VectorBuilder().push_back("a").push_back("b").finish())
                       .set("flags", MapBuilder().finish())
                       .finish();
    ObserverNode node(Snapshot{"n", 0, initial});

    struct Change {
        std::optional<Value> now;
        std::optional<Value> before;
    };
    std::vector<Change> gold_changes;
    std::vector<Change> name_changes;
    int any_changes = 0;

    ScopedConnectionList connections;
    connections += node.listen_for_change({"gold"}, [&](const auto& now, const auto& before) {
        gold_changes.push_back({now, before});
    });
    connections += node.listen_for_change({"name"}, [&](const auto& now, const auto& before) {
        name_changes.push_back({now, before});
    });
    connections += node.listen_for_any_change([&] { ++any_changes; });

    SECTION("only changed paths fire, any-change fires once per patch") {
        REQUIRE(node.apply_patch(gold_patch("n", 1, {op_increment({"gold"}, 10), op_increment({"gold"}, 5)})));
        REQUIRE(gold_changes.size() == 1);
        REQUIRE(gold_changes[0].now == Value{15});
        REQUIRE(gold_changes[0].before == Value{0});
        REQUIRE(name_changes.empty());
        REQUIRE(any_changes == 1);
    }

    SECTION("setting an equal value does not fire the path listener") {
        REQUIRE(node.apply_patch(gold_patch("n", 1, {op_set({"name"}, Value{"alice"})})));
        REQUIRE(name_changes.empty());
        REQUIRE(any_changes == 1);
    }

    SECTION("delete reports an absent new value") {
        REQUIRE(node.apply_patch(gold_patch("n", 1, {op_delete({"name"})})));
        REQUIRE(name_changes.size() == 1);
        REQUIRE_FALSE(name_changes[0].now.has_value());
        REQUIRE(name_changes[0].before == Value{"alice"});
    }

    SECTION("map operations notify path_to_map + key") {
        std::vector<Change> flag_changes;
        connections += node.listen_for_change({"flags", "done"}, [&](const auto& now, const auto& before) {
            flag_changes.push_back({now, before});
        });
        REQUIRE(node.apply_patch(gold_patch("n", 1, {op_map_set({"flags"}, "done", Value{true})})));
        REQUIRE(flag_changes.size() == 1);
        REQUIRE(flag_changes[0].now == Value{true});
        REQUIRE_FALSE(flag_changes[0].before.has_value());
    }

    SECTION("exact listeners only hear operations on their own path") {
        std::vector<Change> first_item;
        std::vector<Change> all_items;
        connections += node.listen_for_change({"items", 0}, [&](const auto& now, const auto& before) {
            first_item.push_back({now, before});
        });
        connections += node.listen_for_change({"items"}, [&](const auto& now, const auto& before) {
            all_items.push_back({now, before});
        });
        REQUIRE(node.apply_patch(gold_patch("n", 1, {op_list_insert({"items"}, 0, Value{"sword"})})));
        REQUIRE(first_item.empty());
        REQUIRE(all_items.size() == 1);
        REQUIRE(all_items[0].now->size() == 3);
    }

    SECTION("related listeners also hear operations above their path") {
        std::vector<Change> first_item;
        connections += node.listen_for_change(
            {"items", 0}, [&](const auto& now, const auto& before) { first_item.push_back({now, before}); },
            ChangeMatch::Related);
        REQUIRE(node.apply_patch(gold_patch("n", 1, {op_list_insert({"items"}, 0, Value{"sword"})})));
        REQUIRE(first_item.size() == 1);
        REQUIRE(first_item[0].now == Value{"sword"});
        REQUIRE(first_item[0].before == Value{"a"});
    }

    SECTION("snapshot fires every listener with nullopt") {
        node.apply_snapshot(Snapshot{"n", 4, initial});
        REQUIRE(gold_changes.size() == 1);
        REQUIRE(name_changes.size() == 1);
        REQUIRE_FALSE(gold_changes[0].now.has_value());
        REQUIRE_FALSE(gold_changes[0].before.has_value());
        REQUIRE(any_changes == 1);
    }

    SECTION("stale patches notify nobody") {
        node.apply_snapshot(Snapshot{"n", 4, initial});
        gold_changes.clear();
        REQUIRE_FALSE(node.apply_patch(gold_patch("n", 2, {op_increment({"gold"}, 1)})));
        REQUIRE(gold_changes.empty());
        REQUIRE(any_changes == 1);
    }

    SECTION("raw patch listeners see the patch before it is applied") {
        std::optional<uint64_t> patch_version;
        std::optional<uint64_t> node_version;
        connections += node.listen_for_raw_patch([&](const Patch& patch) {
            patch_version = patch.version;
            node_version = node.version();
        });
        REQUIRE(node.apply_patch(gold_patch("n", 1, {op_increment({"gold"}, 1)})));
        REQUIRE(patch_version == uint64_t{1});
        REQUIRE(node_version == uint64_t{0});
    }

    SECTION("disconnected listeners stay quiet") {
        connections.clear();
        REQUIRE(node.apply_patch(gold_patch("n", 1, {op_increment({"gold"}, 1)})));
        REQUIRE(gold_changes.empty());
        REQUIRE(any_changes == 0);
    }
}

TEST_CASE("ObserverNode destroy", "[observer][node]") {
    ObserverNode node(gold_snapshot("n", 0, 0));
    int calls = 0;
    auto conn = node.listen_for_any_change([&] { ++calls; });

    node.destroy();
    REQUIRE(node.is_destroyed());
    REQUIRE_NOTHROW(node.destroy());

    REQUIRE_FALSE(node.apply_patch(gold_patch("n", 1, {op_increment({"gold"}, 1)})));
    node.apply_snapshot(gold_snapshot("n", 9, 9));
    REQUIRE(calls == 0);
    REQUIRE(node.version() == 0);
    REQUIRE_FALSE(node.listen_for_change({"gold"}, [](const auto&, const auto&) {}).connected());
}

// ============================================================
// ObserverRegistry
// ============================================================

TEST_CASE("ObserverRegistry message routing", "[observer][registry]") {
    ScriptedTransport transport;
    ObserverRegistry registry(transport);
    registry.init();

    transport.deliver(CreateMessage{"n", gold_snapshot("n", 0, 0)});
    REQUIRE(registry.size() == 1);
    auto node = registry.get_node("n");
    REQUIRE(node != nullptr);

    SECTION("patches reach the node") {
        transport.deliver(PatchMessage{"n", gold_patch("n", 1, {op_increment({"gold"}, 100)})});
        REQUIRE(node->get_value({"gold"}) == Value{100});
    }

    SECTION("patches for unknown nodes are ignored") {
        REQUIRE_NOTHROW(transport.deliver(PatchMessage{"x", gold_patch("x", 1, {})}));
        REQUIRE(registry.size() == 1);
    }

    SECTION("duplicate create resets the existing node") {
        int snapshots = 0;
        auto conn = node->listen_for_any_change([&] { ++snapshots; });
        transport.deliver(CreateMessage{"n", gold_snapshot("n", 7, 70)});
        REQUIRE(registry.get_node("n") == node);
        REQUIRE(node->version() == 7);
        REQUIRE(snapshots == 1);
        conn.disconnect();
    }

    SECTION("destroy removes and destroys the node") {
        transport.deliver(DestroyMessage{"n"});
        REQUIRE(registry.get_node("n") == nullptr);
        REQUIRE(node->is_destroyed());
        REQUIRE_NOTHROW(transport.deliver(DestroyMessage{"n"}));
    }

    SECTION("messages after shutdown are ignored") {
        registry.shutdown();
        REQUIRE(node->is_destroyed());
        transport.deliver(CreateMessage{"m", gold_snapshot("m", 0, 0)});
        REQUIRE(registry.size() == 0);
    }
}

TEST_CASE("ObserverRegistry waiters", "[observer][registry]") {
    ScriptedTransport transport;
    ObserverRegistry registry(transport);
    registry.init();

    SECTION("wait_for_node resolves when the node is created") {
        auto first = registry.wait_for_node("n");
        auto second = registry.wait_for_node("n");
        REQUIRE(first.wait_for(0ms) == std::future_status::timeout);

        transport.deliver(CreateMessage{"n", gold_snapshot("n", 0, 0)});
        REQUIRE(first.wait_for(0ms) == std::future_status::ready);
        auto node = first.get();
        REQUIRE(node == second.get());
        REQUIRE(node->id() == "n");
    }

    SECTION("wait_for_node on an existing node is immediate") {
        transport.deliver(CreateMessage{"n", gold_snapshot("n", 0, 0)});
        auto future = registry.wait_for_node("n");
        REQUIRE(future.wait_for(0ms) == std::future_status::ready);
    }

    SECTION("shutdown fails pending futures") {
        auto future = registry.wait_for_node("n");
        registry.shutdown();
        REQUIRE_THROWS_AS(future.get(), std::runtime_error);
    }

    SECTION("waiting after shutdown fails instead of hanging") {
        registry.shutdown();
        auto future = registry.wait_for_node("n");
        REQUIRE(future.wait_for(0ms) == std::future_status::ready);
        REQUIRE_THROWS_AS(future.get(), std::runtime_error);

        int ready = 0;
        auto conn = registry.on_node_ready("n", [&](const ObserverNodePtr&) { ++ready; });
        REQUIRE_FALSE(conn.connected());
        transport.deliver(CreateMessage{"n", gold_snapshot("n", 0, 0)});
        REQUIRE(ready == 0);
    }

    SECTION("on_node_ready fires once and can be cancelled") {
        int ready = 0;
        int cancelled = 0;
        auto kept = registry.on_node_ready("n", [&](const ObserverNodePtr&) { ++ready; });
        auto dropped = registry.on_node_ready("n", [&](const ObserverNodePtr&) { ++cancelled; });
        dropped.disconnect();

        transport.deliver(CreateMessage{"n", gold_snapshot("n", 0, 0)});
        transport.deliver(CreateMessage{"n", gold_snapshot("n", 1, 0)});
        REQUIRE(ready == 1);
        REQUIRE(cancelled == 0);
    }

    SECTION("on_node_ready for an existing node runs immediately") {
        transport.deliver(CreateMessage{"n", gold_snapshot("n", 0, 0)});
        NodeId seen;
        auto conn = registry.on_node_ready("n", [&](const ObserverNodePtr& node) { seen = node->id(); });
        REQUIRE(seen == "n");
        REQUIRE_FALSE(conn.connected());
    }
}

TEST_CASE("ObserverRegistry class subscriptions", "[observer][registry]") {
    ScriptedTransport transport;
    ObserverRegistry registry(transport);
    registry.init();

    transport.deliver(CreateMessage{"player:alice", gold_snapshot("player:alice", 0, 0)});
    transport.deliver(CreateMessage{"match", gold_snapshot("match", 0, 0)});

    std::vector<NodeId> first;
    std::vector<NodeId> second;
    auto first_conn = registry.on_node_of_class_created("player:", [&](const ObserverNodePtr& node) {
        first.push_back(node->id());
    });
    auto second_conn = registry.on_node_of_class_created("player:", [&](const ObserverNodePtr& node) {
        second.push_back(node->id());
    });

    REQUIRE(first == std::vector<NodeId>{"player:alice"});

    transport.deliver(CreateMessage{"player:bob", gold_snapshot("player:bob", 0, 0)});
    REQUIRE(first == std::vector<NodeId>{"player:alice", "player:bob"});

    SECTION("cancelling one subscription leaves the other") {
        first_conn.disconnect();
        transport.deliver(CreateMessage{"player:carol", gold_snapshot("player:carol", 0, 0)});
        REQUIRE(first.size() == 2);
        REQUIRE(second == std::vector<NodeId>{"player:alice", "player:bob", "player:carol"});
    }

    SECTION("a repeated create is not a new node") {
        transport.deliver(CreateMessage{"player:bob", gold_snapshot("player:bob", 3, 0)});
        REQUIRE(first.size() == 2);
    }

    first_conn.disconnect();
    second_conn.disconnect();
}

TEST_CASE("ObserverRegistry bootstrap", "[observer][registry][bootstrap]") {
    ScriptedTransport transport;
    ReplicationConfig config;
    config.bootstrap_timeout = 250ms;
    ObserverRegistry registry(transport, config);

    SECTION("requires a running registry") {
        REQUIRE_THROWS_AS(registry.request_initial_data(), std::logic_error);
    }

    registry.init();

    SECTION("ready response materializes nodes") {
        transport.response = {CreateMessage{"a", gold_snapshot("a", 2, 20)},
                              CreateMessage{"b", gold_snapshot("b", 0, 0)}};
        REQUIRE(registry.request_initial_data() == BootstrapStatus::Ready);
        REQUIRE(transport.last_timeout == 250ms);
        REQUIRE(registry.node_ids() == std::vector<NodeId>{"a", "b"});
        REQUIRE(registry.get_node("a")->version() == 2);
        REQUIRE(registry.is_initialized());

        REQUIRE(registry.request_initial_data() == BootstrapStatus::AlreadyInitialized);
        REQUIRE(transport.requests == 1);
    }

    SECTION("empty response means retry later") {
        REQUIRE(registry.request_initial_data(1s) == BootstrapStatus::Empty);
        REQUIRE(transport.last_timeout == 1s);
        REQUIRE_FALSE(registry.is_initialized());

        transport.response = {CreateMessage{"a", gold_snapshot("a", 0, 0)}};
        REQUIRE(registry.request_initial_data() == BootstrapStatus::Ready);
    }

    SECTION("transport failure is reported, not thrown") {
        transport.fail = true;
        REQUIRE(registry.request_initial_data() == BootstrapStatus::Failed);
        REQUIRE_FALSE(registry.is_initialized());
    }

    SECTION("status names") {
        REQUIRE(to_string(BootstrapStatus::Ready) == "ready");
        REQUIRE(to_string(BootstrapStatus::Failed) == "failed");
    }
}

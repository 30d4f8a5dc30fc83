// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file replication_demo.cpp
/// @brief Demonstrates statecast replication over the in-process LocalHub
///
/// This example shows:
/// - Creating scoped nodes on the authority
/// - Observers bootstrapping, waiting for nodes and listening for changes
/// - Reliable and unreliable patches, and a dropped unreliable patch
/// - Class subscriptions for dynamically named nodes
///
/// Usage: statecast_demo [config.json]

#include <statecast/authority.h>
#include <statecast/builders.h>
#include <statecast/local_transport.h>
#include <statecast/observer.h>
#include <statecast/serialization.h>
#include <statecast/token.h>

#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace statecast;

namespace {

const NodeToken kMatchState = NodeToken::create("match_state");
const NodeToken kPlayerData = NodeToken::create("player_data");

ReplicationConfig load_config(int argc, char** argv) {
    if (argc < 2) {
        return ReplicationConfig{};
    }
    std::ifstream file(argv[1]);
    if (!file) {
        throw std::runtime_error(std::string("cannot open ") + argv[1]);
    }
    std::stringstream content;
    content << file.rdbuf();
    return ReplicationConfig::from_json(content.str());
}

std::string describe(const std::optional<Value>& v) {
    return v ? to_json(*v) : std::string("<absent>");
}

// ============================================================================
// Observer process
// ============================================================================

class Client {
public:
    Client(LocalHub& hub, const Identity& identity, const ReplicationConfig& config)
        : name_(identity)
        , transport_(hub.connect(identity))
        , registry_(*transport_, config)
    {
        registry_.init();

        connections_ += registry_.on_node_ready(kMatchState.id(), [this](const ObserverNodePtr& node) {
            std::cout << "[" << name_ << "] match ready at v" << node->version() << "\n";
            connections_ += node->listen_for_change({"gold"}, [this](const auto& now, const auto& before) {
                std::cout << "[" << name_ << "] gold: " << describe(before) << " -> " << describe(now) << "\n";
            });
            connections_ += node->listen_for_any_change([this, node] {
                std::cout << "[" << name_ << "] match now v" << node->version() << " "
                          << to_json(node->state()) << "\n";
            });
        });

        connections_ += registry_.on_node_of_class_created(
            kPlayerData.class_prefix(), [this](const ObserverNodePtr& node) {
                std::cout << "[" << name_ << "] player node " << node->id() << ": " << to_json(node->state())
                          << "\n";
            });
    }

    void bootstrap() {
        auto status = registry_.request_initial_data();
        std::cout << "[" << name_ << "] bootstrap: " << to_string(status) << " (" << registry_.size()
                  << " node(s))\n";
    }

private:
    std::string name_;
    std::shared_ptr<ObserverTransport> transport_;
    ObserverRegistry registry_;
    ScopedConnectionList connections_;
};

} // namespace

int main(int argc, char** argv) {
    try {
        const auto config = load_config(argc, argv);
        std::cout << "=== statecast replication demo ===\n";
        std::cout << "config: " << to_json(config.to_value()) << "\n\n";

        LocalHub hub;
        AuthorityRegistry authority(hub, config);
        authority.init();

        std::cout << "--- Authority creates nodes ---\n";
        authority.create_node(kMatchState.id(), scope::All{},
                              MapBuilder().set("gold", 0).set("items", VectorBuilder().push_back("map").finish()).finish());
        authority.create_node(kPlayerData.instance("alice"), scope::Single{"alice"},
                              MapBuilder().set("hp", 100).finish());

        std::cout << "\n--- Clients join late and bootstrap ---\n";
        Client alice(hub, "alice", config);
        Client bob(hub, "bob", config);
        alice.bootstrap();
        bob.bootstrap();

        std::cout << "\n--- Reliable patches ---\n";
        authority.patch_node(kMatchState.id(), op_increment({"gold"}, 100));
        authority.patch_node_multiple(kMatchState.id(), {op_list_insert({"items"}, 0, Value{"sword"}),
                                                         op_set({"round"}, Value{1})});
        hub.pump();

        std::cout << "\n--- Unreliable patch dropped for bob ---\n";
        hub.set_unreliable_drop_filter([](const Identity& identity, const Message&) { return identity == "bob"; });
        authority.patch_node(kMatchState.id(), op_increment({"gold"}, 5, Reliability::Unreliable));
        hub.pump();
        hub.set_unreliable_drop_filter(nullptr);

        std::cout << "\n--- Resync by snapshot ---\n";
        authority.replace_state(kMatchState.id(), *authority.state(kMatchState.id()));
        hub.pump();

        std::cout << "\n--- Dynamic player node ---\n";
        authority.create_node(kPlayerData.instance("bob"), scope::Single{"bob"}, MapBuilder().set("hp", 80).finish());
        hub.pump();

        const auto stats = hub.stats();
        std::cout << "\nhub: sent=" << stats.sent << " dropped=" << stats.dropped << " delivered=" << stats.delivered
                  << " requests=" << stats.requests << "\n";
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

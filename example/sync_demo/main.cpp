// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file main.cpp
/// @brief Demonstrates sync_tree::SyncDatabase over an in-process transport
///
/// This example shows:
/// - Buffering work until the first full dataset arrives
/// - Local set / update / push / remove with status callbacks
/// - Priority ordering and query views
/// - Change observers with ScopedConnection

#include <sync_tree/query.h>
#include <sync_tree/serialization.h>
#include <sync_tree/sync_database.h>

#include <iostream>
#include <memory>
#include <string>

using namespace sync_tree;

namespace {

void print_status(const std::string& what, const WriteStatus& status)
{
    std::cout << "  [" << what << "] " << (status.success ? "ok" : "failed: " + status.error) << "\n";
}

Message remote_replace(std::string_view path, std::string payload)
{
    Message m;
    m.behavior = WriteBehavior::Replace;
    m.path = Path::from_string(path);
    m.value = std::move(payload);
    return m;
}

} // namespace

int main()
{
    auto transport = std::make_shared<LoopbackTransport>();
    SyncDatabase db(transport);
    db.go_online();

    ScopedConnection observer = db.subscribe([](const Path& p) { std::cout << "  changed: " << p.to_string() << "\n"; });

    std::cout << "=== Waiting for initial data ===\n";
    db.when_initial([](SyncDatabase& d) { std::cout << "  initial data: " << d.dump() << "\n"; });

    transport->deliver(remote_replace("/", R"({"rooms": {"lobby": {"topic": "welcome"}}})"));

    std::cout << "\n=== Local writes ===\n";
    db.set(Path{"rooms", "lobby", "topic"}, "general chat",
           [](const WriteStatus& s) { print_status("set topic", s); });
    db.update(Path{"rooms", "lobby"}, R"({"open": true, "topic": null})",
              [](const WriteStatus& s) { print_status("update lobby", s); });
    db.set(Path{"rooms", "broken"}, R"({"oops": )",
           [](const WriteStatus& s) { print_status("set broken", s); });

    std::cout << "\n=== Push ===\n";
    for (const char* text : {"hello", "how are you", "bye"}) {
        auto key = db.push(Path{"messages"}, text);
        std::cout << "  pushed " << key << "\n";
    }

    std::cout << "\n=== Priorities ===\n";
    db.set_with_priority(Path{"rooms", "kitchen"}, R"({"topic": "food"})", 1.0);
    db.set_priority(Path{"rooms", "lobby"}, 2.0);
    for (const auto& room : db.snapshot_for("/rooms").children()) {
        std::cout << "  " << room.key() << " -> " << room.to_json() << "\n";
    }

    std::cout << "\n=== Query: last two messages ===\n";
    for (const auto& msg : Query::parse(R"(orderBy="$key"&limitToLast=2)").apply(db.snapshot_for("/messages"))) {
        std::cout << "  " << msg.key() << " = " << msg.value().as_string() << "\n";
    }

    std::cout << "\n=== Remove ===\n";
    db.remove(Path{"messages"});
    std::cout << "  messages exist: " << std::boolalpha << db.snapshot_for("/messages").exists() << "\n";

    std::cout << "\n=== Outbound ===\n";
    for (const auto& m : transport->take_sent()) {
        std::cout << "  " << (m.behavior == WriteBehavior::Merge ? "merge  " : "replace") << " " << m.path.to_string()
                  << " " << m.value.value_or("<delete>") << "\n";
    }

    std::cout << "\n=== Final tree ===\n" << db.dump(false) << "\n";
    return 0;
}

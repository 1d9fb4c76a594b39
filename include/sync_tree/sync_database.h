// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file sync_database.h
/// @brief SyncDatabase - local mirror of a remote hierarchical dataset.
///
/// The database owns one root Value inside a lager store and applies writes
/// to it through a pure reducer (sync_update). Local writes and messages
/// delivered by the Transport are serialized by a single mutex.
///
/// Every write follows the same sequence:
/// 1. lock
/// 2. decode the payload (a decode error fails the write; nothing changes)
/// 3. dispatch to the store
/// 4. local writes only: hand the message to Transport::send
/// 5. unlock
/// 6. notify change observers with the written path
/// 7. local writes only: invoke the status callback exactly once
///
/// Observers, status callbacks and initial consumers all run after the lock is
/// released, so they may call back into the database.
///
/// Usage:
/// @code
///   auto transport = std::make_shared<LoopbackTransport>();
///   SyncDatabase db(transport);
///
///   db.set(Path{"a", "b"}, R"({"x":1})");
///   db.update(Path{"a", "b"}, R"({"y":2})");
///   db.snapshot_for("/a/b").to_json();        // {"x":1,"y":2}
///
///   std::string key = db.push(Path{"messages"}, "hello");
/// @endcode

#pragma once

#include <sync_tree/api.h>
#include <sync_tree/change_notifier.h>
#include <sync_tree/message.h>
#include <sync_tree/path.h>
#include <sync_tree/push_id.h>
#include <sync_tree/snapshot.h>
#include <sync_tree/transport.h>
#include <sync_tree/value.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace sync_tree {

// ============================================================
// Model
// ============================================================

struct SyncModel {
    Value root = Value{ValueMap{}};

    /// Set by the first Replace; never cleared
    bool initial_received = false;

    /// Incremented by every applied action
    std::uint64_t version = 0;
};

/// Cheap change detection for the store: every reducer step bumps version
inline bool operator==(const SyncModel& a, const SyncModel& b)
{
    return a.version == b.version && a.initial_received == b.initial_received;
}

// ============================================================
// Actions
// ============================================================

namespace actions {

/// Wholesale substitution at path. A null value deletes the subtree.
struct Replace {
    Path path;
    Value value;
};

/// One-level merge of value's children into the node at path
struct Merge {
    Path path;
    Value value;
};

/// Set (or clear, with std::monostate) the priority of the node at path
struct AssignPriority {
    Path path;
    Priority priority;
};

/// The first full dataset has been applied
struct MarkInitial {};

} // namespace actions

using SyncAction = std::variant<actions::Replace, actions::Merge, actions::AssignPriority, actions::MarkInitial>;

// ============================================================
// Reducer - Pure function for state updates
// ============================================================

SYNC_TREE_API SyncModel sync_update(SyncModel model, SyncAction action);

/// Decode a message into the action that applies it.
///
/// - a path ending in ".priority" assigns the parent's priority from the raw text
/// - an absent value (or one that decodes to null) is a delete
/// - otherwise the payload is decoded and the message priority attached
///   (a NaN or infinite priority is an error)
///
/// @return std::nullopt with @p error_out filled if the payload is malformed
[[nodiscard]] SYNC_TREE_API std::optional<SyncAction> to_action(const Message& message,
                                                                std::string* error_out = nullptr);

// ============================================================
// SyncDatabase
// ============================================================

class SYNC_TREE_API SyncDatabase {
public:
    /// Runs once the first full dataset is present
    using InitialConsumer = std::function<void(SyncDatabase&)>;

    /// @param transport Outbound collaborator; its receive hook is installed here
    /// @param clock     Time source for push ids (system clock when empty)
    explicit SyncDatabase(std::shared_ptr<Transport> transport, PushIdGenerator::Clock clock = {});

    /// Closes the transport
    ~SyncDatabase();

    SyncDatabase(const SyncDatabase&) = delete;
    SyncDatabase& operator=(const SyncDatabase&) = delete;

    // ---- Reads ----

    /// Point-in-time view of @p path; absent if any segment is missing
    [[nodiscard]] DataSnapshot snapshot_for(const Path& path) const;
    [[nodiscard]] DataSnapshot snapshot_for(std::string_view path) const;

    /// Compact JSON of the whole tree
    [[nodiscard]] std::string dump(bool compact = true) const;

    [[nodiscard]] bool has_initial() const;

    [[nodiscard]] std::uint64_t version() const;

    // ---- Writes ----
    //
    // An absent @p raw value means delete. Payload text whose first
    // non-blank character is '{' is JSON; anything else is a string.

    void set(const Path& path, std::optional<std::string> raw, StatusCallback callback = {});

    void set_with_priority(const Path& path, std::optional<std::string> raw, Priority priority,
                           StatusCallback callback = {});

    void update(const Path& path, std::optional<std::string> raw, StatusCallback callback = {});

    /// Write @p raw under a freshly generated child key of @p path.
    /// @return The generated key, also when @p raw is absent (then nothing is written)
    std::string push(const Path& path, std::optional<std::string> raw, StatusCallback callback = {});

    /// Equivalent to a Replace at path/.priority
    /// A non-finite number fails through @p callback and writes nothing
    void set_priority(const Path& path, Priority priority, StatusCallback callback = {});

    /// Delete the subtree at @p path. Deleting the root leaves an empty map.
    void remove(const Path& path, StatusCallback callback = {});

    // ---- Incoming ----

    /// Apply a message from the remote side. Never re-sent; malformed
    /// messages are logged and dropped.
    void apply_incoming(const Message& message);

    /// Run @p consumer once the first Replace has been applied.
    /// Queued (FIFO) until then, run immediately afterwards. A consumer
    /// registered while the queue is still being run is appended to it, so
    /// every consumer runs after all consumers registered before it.
    /// A queued consumer that throws is logged; the rest still run.
    void when_initial(InitialConsumer consumer);

    // ---- Observers ----

    [[nodiscard]] Connection subscribe(ChangeHandler handler);

    // ---- Transport lifecycle ----

    void go_online();
    void go_offline();

private:
    void local_write(Message message);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sync_tree

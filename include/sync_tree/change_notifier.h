// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file change_notifier.h
/// @brief Thread-safe multicast of "the tree changed at this path".
///
/// Features:
/// - Explicit subscribe / disconnect
/// - Connection lifecycle management (RAII via ScopedConnection)
/// - Guard mechanism for automatic disconnection
/// - Handlers run outside the notifier's own lock, in subscription order
/// - A handler that throws is logged and skipped; later handlers still run
///
/// Usage:
/// @code
///   ChangeNotifier notifier;
///   ScopedConnection conn = notifier.subscribe([](const Path& p) {
///       std::cout << "changed: " << p << "\n";
///   });
///   notifier.publish(Path{"users", "alice"});
/// @endcode

#pragma once

#include <sync_tree/api.h>
#include <sync_tree/path.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace sync_tree {

using ChangeHandler = std::function<void(const Path&)>;

namespace detail {

struct NotifierSlot {
    ChangeHandler handler;
    std::function<bool()> guard;
    bool active = true;
};

struct NotifierState {
    std::mutex mutex;
    std::vector<std::shared_ptr<NotifierSlot>> slots;

    void disconnect(const std::shared_ptr<NotifierSlot>& slot);
};

} // namespace detail

// ============================================================================
// Connection Management
// ============================================================================

/// @brief Handle to one subscription
///
/// Lightweight handle. Does NOT auto-disconnect on destruction.
/// Use ScopedConnection for RAII semantics. Safe to use after the notifier
/// that issued it has been destroyed.
class SYNC_TREE_API Connection {
public:
    Connection() noexcept = default;

    Connection(Connection&& other) noexcept = default;
    Connection& operator=(Connection&& other) noexcept = default;
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    ~Connection() = default;

    void disconnect();

    [[nodiscard]] bool connected() const;
    [[nodiscard]] explicit operator bool() const { return connected(); }

private:
    friend class ChangeNotifier;
    Connection(std::weak_ptr<detail::NotifierSlot> slot, std::weak_ptr<detail::NotifierState> state) noexcept;

    std::weak_ptr<detail::NotifierSlot> slot_;
    std::weak_ptr<detail::NotifierState> state_;
};

/// @brief RAII wrapper for Connection - auto-disconnects on destruction
class SYNC_TREE_API ScopedConnection {
public:
    ScopedConnection() noexcept = default;
    ScopedConnection(Connection conn) noexcept;
    ScopedConnection(ScopedConnection&&) noexcept = default;
    ScopedConnection& operator=(ScopedConnection&& other) noexcept;
    ScopedConnection& operator=(Connection conn) noexcept;
    ~ScopedConnection();

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    void reset();
    [[nodiscard]] Connection release() noexcept;
    [[nodiscard]] bool connected() const { return conn_.connected(); }
    [[nodiscard]] explicit operator bool() const { return connected(); }

private:
    Connection conn_;
};

// ============================================================================
// ChangeNotifier
// ============================================================================

/// Thread Safety: subscribe, disconnect and publish may be called from any thread.
class SYNC_TREE_API ChangeNotifier {
public:
    ChangeNotifier();
    ~ChangeNotifier();
    ChangeNotifier(const ChangeNotifier&) = delete;
    ChangeNotifier& operator=(const ChangeNotifier&) = delete;

    [[nodiscard]] Connection subscribe(ChangeHandler handler);

    /// Subscribe with guard (skipped once the guard has expired)
    template <typename T>
    [[nodiscard]] Connection subscribe(std::weak_ptr<T> guard, ChangeHandler handler) {
        return subscribe_impl(std::move(handler), [g = std::move(guard)]() { return !g.expired(); });
    }

    /// Invoke every active handler with @p path
    void publish(const Path& path) const;

    [[nodiscard]] std::size_t handler_count() const;

private:
    Connection subscribe_impl(ChangeHandler handler, std::function<bool()> guard);

    std::shared_ptr<detail::NotifierState> state_;
};

} // namespace sync_tree

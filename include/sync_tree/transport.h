// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file transport.h
/// @brief Contract between the database and whatever carries messages to the
///        remote service.
///
/// The database:
/// - installs its receive hook with on_received() once, at construction
/// - calls send() for each local write, in apply order, while holding its lock
///   (send must not block and must not call back into the database)
/// - forwards connect() / disconnect() verbatim
/// - calls close() from its destructor
///
/// Handshake, retry and framing are the transport's business.

#pragma once

#include <sync_tree/api.h>
#include <sync_tree/message.h>

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <vector>

namespace sync_tree {

class SYNC_TREE_API Transport {
public:
    using ReceiveHandler = std::function<void(const Message&)>;

    virtual ~Transport() = default;

    /// Best-effort, fire-and-forget outbound delivery
    virtual void send(const Message& message) = 0;

    virtual void connect() = 0;
    virtual void disconnect() = 0;

    /// Release resources; no handler is called afterwards
    virtual void close() = 0;

    /// Install the handler that receives decoded incoming messages
    virtual void on_received(ReceiveHandler handler) = 0;
};

/// In-process transport: records what is sent, delivers what it is given.
class SYNC_TREE_API LoopbackTransport : public Transport {
public:
    void send(const Message& message) override;
    void connect() override;
    void disconnect() override;
    void close() override;
    void on_received(ReceiveHandler handler) override;

    /// Hand @p message to the installed handler as if it came from the remote side.
    /// @return false if no handler is installed or the transport is closed
    bool deliver(const Message& message);

    /// Messages passed to send(), oldest first (callbacks stripped)
    [[nodiscard]] std::vector<Message> sent() const;

    /// Remove and return the sent messages
    [[nodiscard]] std::vector<Message> take_sent();

    [[nodiscard]] bool is_connected() const;
    [[nodiscard]] bool is_closed() const;

private:
    mutable std::mutex mutex_;
    ReceiveHandler handler_;
    std::deque<Message> sent_;
    bool connected_ = false;
    bool closed_ = false;
};

} // namespace sync_tree

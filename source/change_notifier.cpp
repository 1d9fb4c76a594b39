// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file change_notifier.cpp
/// @brief Implementation of ChangeNotifier

#include <sync_tree/change_notifier.h>
#include <sync_tree/value.h>

#include <algorithm>
#include <exception>

namespace sync_tree {

namespace detail {

void NotifierState::disconnect(const std::shared_ptr<NotifierSlot>& slot)
{
    std::lock_guard<std::mutex> lock(mutex);
    if (!slot->active) {
        return;
    }
    slot->active = false;
    slots.erase(std::remove(slots.begin(), slots.end(), slot), slots.end());
}

} // namespace detail

// ============================================================================
// Connection Implementation
// ============================================================================

Connection::Connection(std::weak_ptr<detail::NotifierSlot> slot,
                       std::weak_ptr<detail::NotifierState> state) noexcept
    : slot_(std::move(slot))
    , state_(std::move(state))
{
}

void Connection::disconnect()
{
    auto slot = slot_.lock();
    auto state = state_.lock();
    if (slot && state) {
        state->disconnect(slot);
    }
    slot_.reset();
    state_.reset();
}

bool Connection::connected() const
{
    auto slot = slot_.lock();
    auto state = state_.lock();
    if (!slot || !state) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    return slot->active;
}

// ============================================================================
// ScopedConnection Implementation
// ============================================================================

ScopedConnection::ScopedConnection(Connection conn) noexcept
    : conn_(std::move(conn))
{
}

ScopedConnection& ScopedConnection::operator=(ScopedConnection&& other) noexcept
{
    if (this != &other) {
        reset();
        conn_ = std::move(other.conn_);
    }
    return *this;
}

ScopedConnection& ScopedConnection::operator=(Connection conn) noexcept
{
    reset();
    conn_ = std::move(conn);
    return *this;
}

ScopedConnection::~ScopedConnection()
{
    reset();
}

void ScopedConnection::reset()
{
    conn_.disconnect();
}

Connection ScopedConnection::release() noexcept
{
    return std::move(conn_);
}

// ============================================================================
// ChangeNotifier Implementation
// ============================================================================

ChangeNotifier::ChangeNotifier()
    : state_(std::make_shared<detail::NotifierState>())
{
}

ChangeNotifier::~ChangeNotifier() = default;

Connection ChangeNotifier::subscribe(ChangeHandler handler)
{
    return subscribe_impl(std::move(handler), nullptr);
}

Connection ChangeNotifier::subscribe_impl(ChangeHandler handler, std::function<bool()> guard)
{
    auto slot = std::make_shared<detail::NotifierSlot>();
    slot->handler = std::move(handler);
    slot->guard = std::move(guard);

    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->slots.push_back(slot);
    return Connection(slot, state_);
}

void ChangeNotifier::publish(const Path& path) const
{
    // Copy so handlers may subscribe or disconnect while being called
    std::vector<std::shared_ptr<detail::NotifierSlot>> dispatch;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        dispatch = state_->slots;
    }

    for (const auto& slot : dispatch) {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (!slot->active) {
                continue;
            }
        }
        if (slot->guard && !slot->guard()) {
            continue;
        }
        if (!slot->handler) {
            continue;
        }
        try {
            slot->handler(path);
        } catch (const std::exception& e) {
            detail::log_warning("ChangeNotifier::publish",
                                "handler for " + path.to_string() + " threw: " + e.what());
        } catch (...) {
            detail::log_warning("ChangeNotifier::publish",
                                "handler for " + path.to_string() + " threw a non-standard exception");
        }
    }
}

std::size_t ChangeNotifier::handler_count() const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->slots.size();
}

} // namespace sync_tree

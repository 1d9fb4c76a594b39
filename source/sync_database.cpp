// sync_database.cpp
// Implementation of the synchronized document store

#include <sync_tree/sync_database.h>
#include <sync_tree/path_core.h>
#include <sync_tree/priority.h>
#include <sync_tree/serialization.h>

#include <lager/event_loop/manual.hpp>
#include <lager/store.hpp>

#include <exception>
#include <utility>
#include <mutex>
#include <vector>

namespace sync_tree {

// ============================================================
// Reducer Implementation
// ============================================================

SyncModel sync_update(SyncModel model, SyncAction action)
{
    return std::visit(
        [&model](auto&& act) -> SyncModel {
            using T = std::decay_t<decltype(act)>;

            if constexpr (std::is_same_v<T, actions::Replace>) {
                model.root = replace_at_path(model.root, act.path, act.value);
            } else if constexpr (std::is_same_v<T, actions::Merge>) {
                if (act.value.is_null()) {
                    model.root = erase_at_path(model.root, act.path);
                } else {
                    model.root = merge_at_path(model.root, act.path, act.value);
                }
            } else if constexpr (std::is_same_v<T, actions::AssignPriority>) {
                model.root = set_priority_at_path(model.root, act.path, act.priority);
            } else if constexpr (std::is_same_v<T, actions::MarkInitial>) {
                model.initial_received = true;
            }

            ++model.version;
            return model;
        },
        std::move(action));
}

std::optional<SyncAction> to_action(const Message& message, std::string* error_out)
{
    if (!message.path.is_root() && message.path.key() == priority_key) {
        Priority priority = message.value ? parse_priority(*message.value) : Priority{};
        return actions::AssignPriority{message.path.parent(), std::move(priority)};
    }

    if (message.is_delete()) {
        return actions::Replace{message.path, Value{}};
    }

    auto decoded = parse_payload(*message.value, error_out);
    if (!decoded) {
        return std::nullopt;
    }
    if (decoded->is_null()) {
        return actions::Replace{message.path, Value{}};
    }

    if (message.priority && !is_valid_priority(*message.priority)) {
        if (error_out) {
            *error_out = "priority number must be finite";
        }
        return std::nullopt;
    }

    Value value = std::move(*decoded);
    if (message.priority) {
        value = value.with_priority(*message.priority);
    }

    if (message.behavior == WriteBehavior::Merge) {
        return actions::Merge{message.path, std::move(value)};
    }
    return actions::Replace{message.path, std::move(value)};
}

namespace {

/// Node whose content an applied message changed
Path changed_path(const Path& path)
{
    if (!path.is_root() && path.key() == priority_key) {
        return path.parent();
    }
    return path;
}

} // anonymous namespace

// Store type deduction helper
inline auto make_sync_store_impl(SyncModel initial)
{
    return lager::make_store<SyncAction>(std::move(initial), lager::with_manual_event_loop{},
                                         lager::with_reducer(sync_update));
}

using SyncStoreType = decltype(make_sync_store_impl(std::declval<SyncModel>()));

// ============================================================
// SyncDatabase Implementation
// ============================================================

struct SyncDatabase::Impl {
    mutable std::mutex mutex;
    std::unique_ptr<SyncStoreType> store;
    std::shared_ptr<Transport> transport;
    PushIdGenerator push_ids;
    ChangeNotifier notifier;
    std::vector<InitialConsumer> pending_initial;

    /// True while queued initial consumers are being run outside the lock.
    /// when_initial keeps queueing until the queue is empty so order holds.
    bool draining_initial = false;

    Impl(std::shared_ptr<Transport> t, PushIdGenerator::Clock clock)
        : store(std::make_unique<SyncStoreType>(make_sync_store_impl(SyncModel{})))
        , transport(std::move(t))
        , push_ids(clock ? std::move(clock) : PushIdGenerator::Clock{&PushIdGenerator::system_clock_ms})
    {
    }

    const SyncModel& model() const { return store->get(); }

    /// Run @p batch, then anything queued meanwhile, until the queue is empty
    void drain_initial(SyncDatabase& db, std::vector<InitialConsumer> batch)
    {
        while (!batch.empty()) {
            for (auto& consumer : batch) {
                run_initial(db, consumer);
            }
            batch.clear();

            std::lock_guard<std::mutex> lock(mutex);
            batch.swap(pending_initial);
            if (batch.empty()) {
                draining_initial = false;
            }
        }
    }

    static void run_initial(SyncDatabase& db, InitialConsumer& consumer)
    {
        try {
            consumer(db);
        } catch (const std::exception& e) {
            detail::log_warning("SyncDatabase::when_initial", std::string("initial consumer threw: ") + e.what());
        } catch (...) {
            detail::log_warning("SyncDatabase::when_initial", "initial consumer threw a non-standard exception");
        }
    }
};

SyncDatabase::SyncDatabase(std::shared_ptr<Transport> transport, PushIdGenerator::Clock clock)
    : impl_(std::make_unique<Impl>(std::move(transport), std::move(clock)))
{
    if (impl_->transport) {
        impl_->transport->on_received([this](const Message& message) { apply_incoming(message); });
    }
}

SyncDatabase::~SyncDatabase()
{
    if (!impl_->transport) {
        return;
    }
    try {
        impl_->transport->close();
    } catch (const std::exception& e) {
        detail::log_warning("SyncDatabase::~SyncDatabase", std::string("transport close failed: ") + e.what());
    }
}

// ------------------------------------------------------------
// Reads
// ------------------------------------------------------------

DataSnapshot SyncDatabase::snapshot_for(const Path& path) const
{
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return DataSnapshot{path, get_at_path(impl_->model().root, path)};
}

DataSnapshot SyncDatabase::snapshot_for(std::string_view path) const
{
    return snapshot_for(Path::from_string(path));
}

std::string SyncDatabase::dump(bool compact) const
{
    Value root;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        root = impl_->model().root;
    }
    return to_json(root, compact);
}

bool SyncDatabase::has_initial() const
{
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->model().initial_received;
}

std::uint64_t SyncDatabase::version() const
{
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->model().version;
}

// ------------------------------------------------------------
// Writes
// ------------------------------------------------------------

void SyncDatabase::set(const Path& path, std::optional<std::string> raw, StatusCallback callback)
{
    local_write(Message{WriteBehavior::Replace, path, std::move(raw), std::nullopt, std::move(callback)});
}

void SyncDatabase::set_with_priority(const Path& path, std::optional<std::string> raw, Priority priority,
                                     StatusCallback callback)
{
    local_write(Message{WriteBehavior::Replace, path, std::move(raw), std::move(priority), std::move(callback)});
}

void SyncDatabase::update(const Path& path, std::optional<std::string> raw, StatusCallback callback)
{
    local_write(Message{WriteBehavior::Merge, path, std::move(raw), std::nullopt, std::move(callback)});
}

std::string SyncDatabase::push(const Path& path, std::optional<std::string> raw, StatusCallback callback)
{
    std::string key = impl_->push_ids.next();
    if (raw) {
        set(path.child(key), std::move(raw), std::move(callback));
    } else if (callback) {
        callback(WriteStatus{});
    }
    return key;
}

void SyncDatabase::set_priority(const Path& path, Priority priority, StatusCallback callback)
{
    if (!is_valid_priority(priority)) {
        if (callback) {
            callback(WriteStatus{false, "invalid priority at " + path.to_string() + ": number must be finite"});
        }
        return;
    }
    set(path.child(priority_key), priority_to_json(priority), std::move(callback));
}

void SyncDatabase::remove(const Path& path, StatusCallback callback)
{
    set(path, std::nullopt, std::move(callback));
}

void SyncDatabase::local_write(Message message)
{
    StatusCallback callback = std::move(message.callback);
    WriteStatus status;
    std::optional<Path> changed;

    {
        std::lock_guard<std::mutex> lock(impl_->mutex);

        std::string error;
        auto action = to_action(message, &error);
        if (!action) {
            status = WriteStatus{false, "rejected write at " + message.path.to_string() + ": " + error};
        } else {
            impl_->store->dispatch(std::move(*action));
            changed = changed_path(message.path);

            if (impl_->transport) {
                try {
                    impl_->transport->send(message);
                } catch (const std::exception& e) {
                    detail::log_warning("SyncDatabase::local_write", std::string("send failed: ") + e.what());
                    status = WriteStatus{false, std::string("send failed: ") + e.what()};
                }
            }
        }
    }

    if (changed) {
        impl_->notifier.publish(*changed);
    }
    if (callback) {
        callback(status);
    }
}

// ------------------------------------------------------------
// Incoming
// ------------------------------------------------------------

void SyncDatabase::apply_incoming(const Message& message)
{
    std::vector<InitialConsumer> ready;

    {
        std::lock_guard<std::mutex> lock(impl_->mutex);

        std::string error;
        auto action = to_action(message, &error);
        if (!action) {
            detail::log_warning("SyncDatabase::apply_incoming",
                                "dropping message for " + message.path.to_string() + ": " + error);
            return;
        }
        impl_->store->dispatch(std::move(*action));

        if (message.behavior == WriteBehavior::Replace && !impl_->model().initial_received) {
            impl_->store->dispatch(actions::MarkInitial{});
            ready.swap(impl_->pending_initial);
            impl_->draining_initial = !ready.empty();
        }
    }

    impl_->notifier.publish(changed_path(message.path));

    impl_->drain_initial(*this, std::move(ready));
}

void SyncDatabase::when_initial(InitialConsumer consumer)
{
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (!impl_->model().initial_received || impl_->draining_initial) {
            impl_->pending_initial.push_back(std::move(consumer));
            return;
        }
    }
    consumer(*this);
}

// ------------------------------------------------------------
// Observers / transport
// ------------------------------------------------------------

Connection SyncDatabase::subscribe(ChangeHandler handler)
{
    return impl_->notifier.subscribe(std::move(handler));
}

void SyncDatabase::go_online()
{
    if (impl_->transport) {
        impl_->transport->connect();
    }
}

void SyncDatabase::go_offline()
{
    if (impl_->transport) {
        impl_->transport->disconnect();
    }
}

} // namespace sync_tree

// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path_core.cpp
/// @brief Implementation of persistent path-addressed edits.

#include <sync_tree/path_core.h>
#include <sync_tree/serialization.h>

namespace sync_tree {

// ============================================================
// Anonymous namespace - Internal implementation details
// ============================================================

namespace {

/// Recursive helper for insert_at_path
Value insert_recursive(const Value& current, const Path& path, std::size_t path_index, Value new_val)
{
    if (path_index >= path.size()) {
        return new_val;
    }

    const auto& key = path[path_index];

    // Scalars and null along the way become empty maps
    Value node = current.is_map() ? current : Value{ValueMap{}};

    const Value* existing = node.find(key);
    Value child = existing ? *existing : Value{};
    if (!child.is_map() && path_index + 1 < path.size()) {
        child = Value{ValueMap{}};
    }

    return node.set(key, insert_recursive(child, path, path_index + 1, std::move(new_val)));
}

/// Recursive helper for erase_at_path
Value erase_recursive(const Value& current, const Path& path, std::size_t path_index)
{
    const auto& key = path[path_index];

    if (path_index + 1 == path.size()) {
        return current.erase(key);
    }

    const Value* child = current.find(key);
    if (!child) {
        return current;
    }
    return current.set(key, erase_recursive(*child, path, path_index + 1));
}

Value keep_scalar_priority(const Value& existing, Value incoming)
{
    if (existing.is_scalar() && !existing.is_null() && incoming.is_scalar() &&
        !has_priority(incoming.priority)) {
        incoming.priority = existing.priority;
    }
    return incoming;
}

} // anonymous namespace

// ============================================================
// Public API Implementation
// ============================================================

std::optional<Value> get_at_path(const Value& root, const Path& path)
{
    const Value* current = &root;
    for (const auto& segment : path) {
        current = current->find(segment);
        if (!current) {
            return std::nullopt;
        }
    }
    return *current;
}

Value insert_at_path(const Value& root, const Path& path, Value new_val)
{
    if (path.empty()) {
        return new_val;
    }
    return insert_recursive(root, path, 0, std::move(new_val));
}

Value replace_at_path(const Value& root, const Path& path, Value new_val)
{
    if (new_val.is_null()) {
        return erase_at_path(root, path);
    }

    Value pruned = prune_nulls(new_val);
    if (auto existing = get_at_path(root, path)) {
        pruned = keep_scalar_priority(*existing, std::move(pruned));
    }
    return insert_at_path(root, path, std::move(pruned));
}

Value merge_values(const Value& target, const Value& incoming)
{
    auto* incoming_map = incoming.get_if<ValueMap>();

    if (!incoming_map) {
        if (target.is_map() || incoming.is_null()) {
            return target;
        }
        return keep_scalar_priority(target, incoming);
    }

    Value result = target.is_map() ? target : Value{ValueMap{}}.with_priority(target.priority);

    for (const auto& [key, boxed] : *incoming_map) {
        const Value& child = boxed.get();
        if (child.is_null()) {
            continue;
        }
        const Value* existing = result.find(key);
        if (existing && existing->is_scalar() && child.is_scalar()) {
            result = result.set(key, keep_scalar_priority(*existing, child));
        } else {
            result = result.set(key, prune_nulls(child));
        }
    }

    if (has_priority(incoming.priority)) {
        result.priority = incoming.priority;
    }
    return result;
}

Value merge_at_path(const Value& root, const Path& path, const Value& incoming)
{
    auto existing = get_at_path(root, path);
    if (!existing) {
        if (incoming.is_null()) {
            return root;
        }
        return insert_at_path(root, path, prune_nulls(incoming));
    }
    return insert_at_path(root, path, merge_values(*existing, incoming));
}

Value erase_at_path(const Value& root, const Path& path)
{
    if (path.empty()) {
        return Value{ValueMap{}};
    }
    return erase_recursive(root, path, 0);
}

Value set_priority_at_path(const Value& root, const Path& path, Priority priority)
{
    auto existing = get_at_path(root, path);
    Value node = existing ? *existing : Value{ValueMap{}};
    return insert_at_path(root, path, node.with_priority(std::move(priority)));
}

} // namespace sync_tree

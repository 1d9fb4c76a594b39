// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Value - the JSON-like node type stored in a synchronized document.
///
/// A Value is a closed tagged variant:
/// - null (std::monostate)
/// - scalars: bool, int64_t, double, std::string
/// - map: string key -> boxed child Value (immer::map, structurally shared)
///
/// There is no native list type. Ordered collections are maps whose keys sort
/// in the desired order (push keys, or "0", "1", ... for decoded JSON arrays).
///
/// Every Value also carries an optional Priority. Priority is ordering
/// metadata only: it is ignored by operator== and never changes how a node is
/// stored or merged, only how siblings are ordered (see priority.h).
///
/// Values are immutable. set()/erase() return a new Value that shares every
/// untouched subtree with the original, so copying a Value (for a snapshot,
/// for a message, across threads) is O(1).

#pragma once

#include <sync_tree/sync_tree_config.h>
#include <sync_tree/api.h>

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/memory_policy.hpp>

#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace sync_tree {

namespace detail {

inline void log_access_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if SYNC_TREE_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if SYNC_TREE_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

inline void log_warning(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if SYNC_TREE_VERBOSE_LOG
    std::cerr << "[" << func << "] warning: " << message
              << " (" << loc.file_name() << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

} // namespace detail

// ============================================================
// Priority - ordering metadata attached to a node
//
// none < number < string (see priority.h for the full ordering rules)
// ============================================================

using Priority = std::variant<std::monostate, double, std::string>;

[[nodiscard]] inline bool has_priority(const Priority& p) noexcept
{
    return !std::holds_alternative<std::monostate>(p);
}

/// Reserved child name addressing a node's priority (e.g. "/items/x/.priority")
inline constexpr std::string_view priority_key = ".priority";

/// Reserved member carrying the scalar of a prioritised leaf: {".value": 1, ".priority": 2}
inline constexpr std::string_view value_key = ".value";

// ============================================================
// BasicValue
// ============================================================

template <typename MemoryPolicy>
struct BasicValue;

template <typename MemoryPolicy>
using BasicValueBox = immer::box<BasicValue<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueMap = immer::map<std::string,
                                 BasicValueBox<MemoryPolicy>,
                                 std::hash<std::string>,
                                 std::equal_to<std::string>,
                                 MemoryPolicy>;

template <typename MemoryPolicy = immer::default_memory_policy>
struct BasicValue
{
    using memory_policy = MemoryPolicy;
    using value_box     = BasicValueBox<MemoryPolicy>;
    using value_map     = BasicValueMap<MemoryPolicy>;

    std::variant<std::monostate,
                 bool,
                 int64_t,
                 double,
                 std::string,
                 value_map>
        data;

    Priority priority;

    BasicValue() noexcept : data(std::monostate{}) {}
    BasicValue(bool v) noexcept : data(v) {}
    BasicValue(int v) noexcept : data(static_cast<int64_t>(v)) {}
    BasicValue(int64_t v) noexcept : data(v) {}
    BasicValue(double v) noexcept : data(v) {}
    BasicValue(const std::string& v) : data(v) {}
    BasicValue(std::string&& v) noexcept : data(std::move(v)) {}
    BasicValue(const char* v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(value_map v) : data(std::move(v)) {}

    static BasicValue map(std::initializer_list<std::pair<std::string, BasicValue>> init = {}) {
        auto t = value_map{}.transient();
        for (const auto& [key, val] : init) {
            t.set(key, value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    [[nodiscard]] BasicValue with_priority(Priority p) const {
        BasicValue result = *this;
        result.priority = std::move(p);
        return result;
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] std::size_t type_index() const noexcept { return data.index(); }
    [[nodiscard]] bool is_null() const noexcept { return is<std::monostate>(); }
    [[nodiscard]] bool is_map() const noexcept { return is<value_map>(); }

    /// Anything that is not a map: null, bool, number, string
    [[nodiscard]] bool is_scalar() const noexcept { return !is_map(); }

    [[nodiscard]] bool is_number() const noexcept { return is<int64_t>() || is<double>(); }

    [[nodiscard]] const BasicValue* find(const std::string& key) const {
        if (auto* m = get_if<value_map>()) {
            if (auto* found = m->find(key)) return &found->get();
        }
        return nullptr;
    }

    [[nodiscard]] BasicValue at(const std::string& key) const {
        if (auto* found = find(key)) return *found;
        detail::log_key_error("Value::at", key, "not found or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] bool contains(const std::string& key) const { return find(key) != nullptr; }

    /// Set a child. A non-map value is replaced by a single-entry map.
    [[nodiscard]] BasicValue set(const std::string& key, BasicValue val) const {
        if (auto* m = get_if<value_map>()) {
            BasicValue result{m->set(key, value_box{std::move(val)})};
            result.priority = priority;
            return result;
        }
        return BasicValue{value_map{}.set(key, value_box{std::move(val)})};
    }

    [[nodiscard]] BasicValue erase(const std::string& key) const {
        if (auto* m = get_if<value_map>()) {
            if (!m->count(key)) return *this;
            BasicValue result{m->erase(key)};
            result.priority = priority;
            return result;
        }
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        if (auto* m = get_if<value_map>()) return m->size();
        return 0;
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] int64_t as_int(int64_t default_val = 0) const {
        if (auto* p = get_if<int64_t>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_number(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        if (auto* p = get_if<int64_t>()) return static_cast<double>(*p);
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] value_map as_map(value_map default_val = {}) const {
        if (auto* p = get_if<value_map>()) return *p;
        return default_val;
    }
};

// Thread-safe memory policy: snapshots leave the engine lock and cross threads
using memory_policy = immer::default_memory_policy;

using Value    = BasicValue<memory_policy>;
using ValueBox = BasicValueBox<memory_policy>;
using ValueMap = BasicValueMap<memory_policy>;

/// Structural equality. Priority is ordering metadata and is not compared.
template <typename MemoryPolicy>
bool operator==(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b)
{
    return a.data == b.data;
}

template <typename MemoryPolicy>
bool operator!=(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b)
{
    return !(a == b);
}

/// Equality including the priority of every node in both trees
[[nodiscard]] SYNC_TREE_API bool identical(const Value& a, const Value& b);

/// Short human-readable form, e.g. "\"abc\"", "42", "{map:3}"
[[nodiscard]] SYNC_TREE_API std::string value_to_string(const Value& val);

/// Print the tree with indentation
SYNC_TREE_API void print_value(const Value& val, const std::string& prefix = "", std::size_t depth = 0);

extern template struct BasicValue<memory_policy>;

} // namespace sync_tree

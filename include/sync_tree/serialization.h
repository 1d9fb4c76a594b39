// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serialization.h
/// @brief JSON text <-> Value conversion, and decoding of raw write payloads.
///
/// Decoding rules (from_json):
/// - objects become maps; JSON arrays become maps keyed "0", "1", ...
/// - integral numbers become int64_t, everything else double
/// - a ".priority" member is lifted into the node's Priority
/// - an object holding only ".value" (and optionally ".priority") decodes to
///   that scalar: {".value": 5, ".priority": 1} -> 5 with priority 1
///
/// Encoding (to_json) is the inverse: prioritised maps get a ".priority"
/// member, prioritised scalars are wrapped as {".value", ".priority"}.
///
/// Usage:
/// @code
///   std::string error;
///   Value v = from_json(R"({"x":1,".priority":"a"})", &error);
///   if (!error.empty()) { ... }
///   std::string text = to_json(v);        // {".priority":"a","x":1}
/// @endcode

#pragma once

#include <sync_tree/api.h>
#include <sync_tree/value.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace sync_tree {

// ============================================================
// JSON Serialization
// ============================================================

/// Convert Value to JSON text
/// @param compact If true, produce minimal output; if false, pretty-print with indentation
/// @note Map members are written in key order so output is deterministic.
[[nodiscard]] SYNC_TREE_API std::string to_json(const Value& val, bool compact = true);

/// Deepest object/array nesting from_json accepts
inline constexpr std::size_t max_json_depth = 512;

/// Parse JSON text to Value
/// @param json_str The JSON text to parse
/// @param error_out If provided, receives an error message on failure (left empty on success)
/// @return Parsed Value, or null Value on parse error
[[nodiscard]] SYNC_TREE_API Value from_json(std::string_view json_str, std::string* error_out = nullptr);

/// Remove null members at every depth. Null is never stored in a document.
[[nodiscard]] SYNC_TREE_API Value prune_nulls(const Value& val);

// ============================================================
// Write payloads
// ============================================================

/// Decode the raw text of a write.
///
/// Text whose first non-blank character is '{' is parsed as a JSON object;
/// anything else is kept verbatim as a string scalar.
/// @return The decoded value, or std::nullopt with @p error_out filled when
///         the text starts with '{' but is not a valid object.
[[nodiscard]] SYNC_TREE_API std::optional<Value> parse_payload(std::string_view raw, std::string* error_out = nullptr);

// ============================================================
// Priority text
// ============================================================

/// JSON form of a priority: number, quoted string, or "null"
[[nodiscard]] SYNC_TREE_API std::string priority_to_json(const Priority& priority);

/// Inverse of priority_to_json. Unquoted text that is not a number or "null"
/// is taken as a string priority.
[[nodiscard]] SYNC_TREE_API Priority parse_priority(std::string_view text);

} // namespace sync_tree

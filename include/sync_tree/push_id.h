// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file push_id.h
/// @brief Generator for chronologically ordered child keys.
///
/// A push id is 20 characters drawn from a 64-character alphabet that is
/// itself in ASCII order:
///
///     -0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ_abcdefghijklmnopqrstuvwxyz
///
/// - characters 0..7 encode the creation time in milliseconds (big-endian, base 64)
/// - characters 8..19 are random
///
/// Within one millisecond (or if the clock steps back) the random part of the
/// previous id is incremented instead of redrawn, so ids returned by one
/// generator sort strictly in call order.
///
/// Usage:
/// @code
///   PushIdGenerator gen;
///   std::string a = gen.next();
///   std::string b = gen.next();   // a < b
/// @endcode

#pragma once

#include <sync_tree/api.h>

#include <array>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>

namespace sync_tree {

inline constexpr std::string_view push_id_alphabet =
    "-0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ_abcdefghijklmnopqrstuvwxyz";

inline constexpr std::size_t push_id_length = 20;

class SYNC_TREE_API PushIdGenerator {
public:
    /// Milliseconds since the Unix epoch
    using Clock = std::function<std::int64_t()>;

    /// Uses the system clock
    PushIdGenerator();

    explicit PushIdGenerator(Clock clock);

    PushIdGenerator(const PushIdGenerator&) = delete;
    PushIdGenerator& operator=(const PushIdGenerator&) = delete;

    /// Thread-safe
    [[nodiscard]] std::string next();

    [[nodiscard]] static std::int64_t system_clock_ms();

private:
    static constexpr std::size_t timestamp_chars = 8;
    static constexpr std::size_t random_chars = push_id_length - timestamp_chars;

    std::mutex mutex_;
    Clock clock_;
    std::mt19937_64 rng_;
    std::int64_t last_time_ = -1;
    std::array<std::uint8_t, random_chars> last_random_{};
};

/// Decode the millisecond timestamp of a push id.
/// @return std::nullopt if @p key is not a well-formed push id
[[nodiscard]] SYNC_TREE_API std::optional<std::int64_t> push_id_timestamp(std::string_view key);

} // namespace sync_tree

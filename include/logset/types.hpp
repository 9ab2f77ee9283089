// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logset Contributors

#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace logset {

// ============================================================================
// Timestamp
// ============================================================================

struct Timestamp {
    std::int64_t tv_sec = 0;   // Seconds since epoch
    std::int64_t tv_nsec = 0;  // Nanoseconds

    // Create from current wall-clock time
    static Timestamp now() noexcept {
        auto tp = std::chrono::system_clock::now();
        auto sec = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch());
        auto nsec = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()) - sec;
        return {sec.count(), nsec.count()};
    }

    [[nodiscard]] constexpr std::int64_t total_nanos() const noexcept {
        return tv_sec * 1'000'000'000 + tv_nsec;
    }

    [[nodiscard]] static constexpr Timestamp from_nanos(std::int64_t ns) noexcept {
        return {ns / 1'000'000'000, ns % 1'000'000'000};
    }

    friend constexpr bool operator==(const Timestamp&, const Timestamp&) = default;
};

// ============================================================================
// Priorities
// ============================================================================

// Ascending from most severe to most verbose. A threshold P admits p iff p <= P.
enum class Priority : std::uint8_t {
    Exit = 0,  // Terminate with a given exit code
    Panic,     // Irrecoverable failure, terminates with exit code 1
    Warning,   // Recoverable errors
    Info,      // High-level information about program execution
    Debug      // Execution tracing
};

[[nodiscard]] constexpr std::string_view priority_name(Priority priority) noexcept {
    switch (priority) {
        case Priority::Exit:    return "EXIT";
        case Priority::Panic:   return "PANIC";
        case Priority::Warning: return "WARNING";
        case Priority::Info:    return "INFO";
        case Priority::Debug:   return "DEBUG";
    }
    return "UNKNOWN";
}

/// Case-insensitive inverse of priority_name()
[[nodiscard]] inline std::optional<Priority> parse_priority(std::string_view text) {
    std::string upper(text);
    std::ranges::transform(upper, upper.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    for (auto p : {Priority::Exit, Priority::Panic, Priority::Warning,
                   Priority::Info, Priority::Debug}) {
        if (upper == priority_name(p)) return p;
    }
    return std::nullopt;
}

[[nodiscard]] constexpr bool admits(Priority threshold, Priority priority) noexcept {
    return priority <= threshold;
}

// ============================================================================
// Log Record
// ============================================================================

struct Record {
    Priority priority = Priority::Info;
    std::string_view file;          // Caller's source file, path allowed
    std::uint_least32_t line = 0;
    std::string_view message;
    Timestamp timestamp{};

    std::optional<int> exit_code;   // Exit records only
    std::string_view stack_trace;   // Panic records only
};

// ============================================================================
// Send outcome
// ============================================================================

enum class Delivery : std::uint8_t {
    Queued,   // Accepted by the logger actor
    Dropped   // Logger already draining or closed
};

} // namespace logset

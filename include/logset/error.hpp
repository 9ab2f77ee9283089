// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logset Contributors

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace logset {

// ============================================================================
// Fatal Errors
// ============================================================================
//
// The logger is the error channel of last resort: when it can no longer
// guarantee that records reach the disk there is nobody left to report to.
// Such conditions are raised as FatalError and end the process via fatal().
//
//   Filesystem - creating the log directory, opening, writing, flushing or
//                removing a log file failed
//   Liveness   - an actor did not answer a request within its bound
//
// ============================================================================

enum class FatalKind : std::uint8_t {
    Filesystem,
    Liveness
};

[[nodiscard]] constexpr std::string_view fatal_kind_name(FatalKind kind) noexcept {
    switch (kind) {
        case FatalKind::Filesystem: return "filesystem";
        case FatalKind::Liveness:   return "liveness";
    }
    return "unknown";
}

class FatalError : public std::runtime_error {
public:
    FatalError(FatalKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    [[nodiscard]] FatalKind kind() const noexcept { return kind_; }

private:
    FatalKind kind_;
};

/**
 * @brief Report a fatal error on stderr and abort the process
 *
 * Output: "logset: fatal <kind>: <what>"
 */
[[noreturn]] void fatal(const FatalError& error) noexcept;

} // namespace logset

// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logset Contributors
//
// Console diagnostics. INTERNAL header.
//
// The library's own messages (config fallbacks, fatal errors) never go into
// the log files: a broken file set cannot be asked to report on itself.

#pragma once

#include <format>
#include <string_view>
#include <utility>

namespace logset {
namespace detail {

/// Write "logset: <message>\n" to stderr
void report(std::string_view message) noexcept;

template<typename... Args>
void reportf(std::format_string<Args...> fmt, Args&&... args) {
    report(std::format(fmt, std::forward<Args>(args)...));
}

} // namespace detail
} // namespace logset

// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logset Contributors

#pragma once

#include "types.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace logset {

struct Config;

// ============================================================================
// Line Format
// ============================================================================
//
//   <time> [<TAG>] -<file>, line <N>- <message>
//   <stack trace lines, panic records only>
//
//   <time>  RFC 3339, UTC, nine fraction digits: 2026-10-19T08:15:30.123456789Z
//   <TAG>   priority name; "EXIT <code>" for exit records
//   <file>  caller's file name, directory stripped
//
// ============================================================================

/// "YYYY-MM-DDTHH:MM:SS.nnnnnnnnnZ"; fixed width so names sort by time
[[nodiscard]] std::string format_timestamp(const Timestamp& ts);

/// Format one record, newline terminated. Trailing newlines of the message
/// and stack trace are trimmed first.
[[nodiscard]] std::string format_line(const Record& record);

/// Multi-line record describing the logger configuration
[[nodiscard]] std::string format_config_record(const Config& config, const Timestamp& ts);

/// Header written at the top of each new log file
[[nodiscard]] std::string format_file_header(std::int64_t max_file_bytes, int max_files,
                                             const Timestamp& ts);

// ============================================================================
// Utility: Extract filename / stem from path
// ============================================================================

[[nodiscard]] constexpr std::string_view extract_filename(std::string_view path) noexcept {
    if (auto pos = path.find_last_of("/\\"); pos != std::string_view::npos) {
        return path.substr(pos + 1);
    }
    return path;
}

/// File name without directory and without its last extension
[[nodiscard]] constexpr std::string_view extract_stem(std::string_view path) noexcept {
    auto name = extract_filename(path);
    if (auto pos = name.rfind('.'); pos != std::string_view::npos && pos > 0) {
        return name.substr(0, pos);
    }
    return name;
}

[[nodiscard]] constexpr std::string_view trim_trailing_newlines(std::string_view text) noexcept {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.remove_suffix(1);
    }
    return text;
}

} // namespace logset

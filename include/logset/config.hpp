// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logset Contributors

#pragma once

#include "types.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace logset {

// ============================================================================
// Constants
// ============================================================================

/// Defaults used for every field the config document leaves out
inline constexpr const char* kDefaultRootDir = "/usr/local/var/log";
inline constexpr int kDefaultMaxFiles = 3;
inline constexpr std::int64_t kDefaultMaxFileBytes = 1'000'000;
inline constexpr Priority kDefaultThreshold = Priority::Info;

/// Config files are found by this suffix, e.g. "myapp.logging.config"
inline constexpr std::string_view kConfigFileSuffix = "logging.config";

/// Log actor inbound queue; callers block when it is full
inline constexpr std::size_t kLogQueueCapacity = 1024;

/// Liveness bounds. Expiry is fatal.
inline constexpr auto kFileSetReplyTimeout = std::chrono::seconds{1};
inline constexpr auto kLoggerReplyTimeout = std::chrono::seconds{10};
inline constexpr auto kLoggerCloseTimeout = std::chrono::seconds{60};   // Covers writing out a full queue

inline constexpr auto kDefaultReloadInterval = std::chrono::seconds{10};

inline constexpr int kPanicExitCode = 1;

// ============================================================================
// Configuration Error
// ============================================================================

enum class ConfigError {
    EmptyRootDir,
    EmptyFilePrefix,
    InvalidMaxFiles,       // Less than 1
    InvalidMaxFileBytes,   // Less than 1
};

[[nodiscard]] constexpr std::string_view config_error_message(ConfigError err) noexcept {
    switch (err) {
        case ConfigError::EmptyRootDir:
            return "root_dir cannot be empty";
        case ConfigError::EmptyFilePrefix:
            return "file_name_prefix cannot be empty";
        case ConfigError::InvalidMaxFiles:
            return "max_files must be at least 1";
        case ConfigError::InvalidMaxFileBytes:
            return "max_file_bytes must be at least 1";
    }
    return "unknown configuration error";
}

// ============================================================================
// Configuration
// ============================================================================

struct Config {
    // Directory holding the log files
    std::filesystem::path root_dir = kDefaultRootDir;

    // Log file name prefix ("myapp" -> "myapp_<timestamp>.log")
    std::string file_name_prefix;

    // Retention and rotation
    int max_files = kDefaultMaxFiles;
    std::int64_t max_file_bytes = kDefaultMaxFileBytes;

    // Most verbose priority that is still written
    Priority threshold = kDefaultThreshold;

    // Source file stems whose DEBUG entries are dropped
    std::set<std::string> suppressed_file_stems;

    friend bool operator==(const Config&, const Config&) = default;

    /// Independent deep copy
    [[nodiscard]] Config clone() const { return *this; }

    [[nodiscard]] bool is_suppressed(std::string_view file_stem) const {
        return suppressed_file_stems.contains(std::string(file_stem));
    }

    [[nodiscard]] std::expected<void, std::vector<ConfigError>> validate() const {
        std::vector<ConfigError> errors;

        if (root_dir.empty()) {
            errors.push_back(ConfigError::EmptyRootDir);
        }
        if (file_name_prefix.empty()) {
            errors.push_back(ConfigError::EmptyFilePrefix);
        }
        if (max_files < 1) {
            errors.push_back(ConfigError::InvalidMaxFiles);
        }
        if (max_file_bytes < 1) {
            errors.push_back(ConfigError::InvalidMaxFileBytes);
        }

        if (errors.empty()) {
            return {};
        }
        return std::unexpected(std::move(errors));
    }

    /// Pretty-printed config document (4-space indent). The output of
    /// default_config().to_json() is a complete template for a config file.
    [[nodiscard]] std::string to_json() const;

    /// Comma-separated suppressed stems in sorted order
    [[nodiscard]] std::string suppressed_list() const;
};

/// Defaults, with file_name_prefix set to the running executable's name
[[nodiscard]] Config default_config();

/**
 * @brief Split a comma-separated list of source file names into stems
 *
 * Whitespace around names is ignored, empty names are skipped and an
 * extension is optional: "file1.cpp, file2" -> {"file1", "file2"}.
 */
[[nodiscard]] std::set<std::string> parse_suppressed(std::string_view csv);

/**
 * @brief Parse a config document
 *
 * Every field is optional; missing fields keep their default. Keys are
 * matched case-insensitively ("rootDir", "RootDir", "ROOTDIR"). An invalid
 * priority or a non-positive size/count resets that field to its default and
 * is described in `warnings`.
 *
 * @return The config, or a description of why the text is not a JSON object
 */
[[nodiscard]] std::expected<Config, std::string>
parse_config(std::string_view json_text, std::vector<std::string>* warnings = nullptr);

} // namespace logset

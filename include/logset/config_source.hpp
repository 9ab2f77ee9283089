// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logset Contributors

#pragma once

#include "config.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>

namespace logset {

// ============================================================================
// ConfigSource - Supplies the logger's configuration on demand
// ============================================================================

class ConfigSource {
public:
    virtual ~ConfigSource() = default;

    /// Never fails: a missing or invalid source yields defaults.
    /// @param warn_if_missing Report an unreadable source on stderr
    [[nodiscard]] virtual Config read(bool warn_if_missing) = 0;
};

// ============================================================================
// JsonFileConfigSource - Reads a JSON config document from disk
// ============================================================================
//
// Without an explicit file, the first regular file in the search directory
// whose name ends with "logging.config" is used (e.g. "myapp.logging.config").
//
// Document (all fields optional):
//   {
//       "rootDir": "/usr/local/var/log",
//       "numFiles": 3,
//       "fileNumBytes": 1000000,
//       "priority": "INFO",
//       "suppressedFiles": ""
//   }
//
// ============================================================================

class JsonFileConfigSource : public ConfigSource {
public:
    /// Search the current working directory
    JsonFileConfigSource();

    /// Search `directory` for a *logging.config file
    static std::shared_ptr<JsonFileConfigSource> in_directory(std::filesystem::path directory);

    /// Always read `file`
    static std::shared_ptr<JsonFileConfigSource> from_file(std::filesystem::path file);

    [[nodiscard]] Config read(bool warn_if_missing) override;

    /// The file read() would use now, if any
    [[nodiscard]] std::optional<std::filesystem::path> locate() const;

private:
    std::filesystem::path directory_;
    std::filesystem::path file_;
};

// ============================================================================
// StaticConfigSource - In-memory config, replaceable at runtime
// ============================================================================

class StaticConfigSource : public ConfigSource {
public:
    StaticConfigSource();
    explicit StaticConfigSource(Config config);

    [[nodiscard]] Config read(bool warn_if_missing) override;

    /// Picked up by the logger at its next reload
    void set(Config config);

private:
    std::mutex mutex_;
    Config config_;
};

} // namespace logset

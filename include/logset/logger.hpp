// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logset Contributors

#pragma once

#include "types.hpp"
#include "config.hpp"
#include "config_source.hpp"

#include <chrono>
#include <concepts>
#include <cstdint>
#include <expected>
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>

namespace logset {

// ============================================================================
// Format string carrying the caller's source location
// ============================================================================

template<typename... Args>
struct LocatedFormat {
    std::format_string<Args...> fmt;
    std::source_location location;

    template<typename S>
        requires std::convertible_to<const S&, std::string_view>
    consteval LocatedFormat(const S& s,
                            std::source_location loc = std::source_location::current())
        : fmt(s), location(loc) {}
};

template<typename... Args>
using FormatWithLocation = LocatedFormat<std::type_identity_t<Args>...>;

// ============================================================================
// Options
// ============================================================================

struct LoggerOptions {
    // Where the configuration comes from. Null: JSON file in the working directory.
    std::shared_ptr<ConfigSource> source;

    // How often the source is re-read
    std::chrono::milliseconds reload_interval = kDefaultReloadInterval;
};

enum class LoggerState : std::uint8_t {
    Starting,
    Running,
    Draining,
    Closed
};

// ============================================================================
// Logger - Actor serializing all logging of one process
// ============================================================================
//
// Construct one Logger at process start and hand it to whoever logs. Every
// member function may be called from any thread.
//
//   Callers ---log/exit/panic/set_config/suppress/get_config/close---> actor
//   actor: filter (priority, suppression) -> format -> FileSet -> disk
//
// Filtering happens when the actor dequeues an entry, so a reconfiguration
// applies to every entry not yet processed. Entries are written in the order
// their log() calls got a queue slot, across all threads. No order is
// guaranteed between requests of different kinds.
//
// ============================================================================

class Logger {
public:
    /// Configuration from a "*logging.config" file in the working directory
    Logger();

    /// Starts the actor and returns once the configuration record is written
    explicit Logger(LoggerOptions options);

    /// Closes if still open
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    // ========================================================================
    // Logging
    // ========================================================================

    /**
     * @brief Queue an entry for the actor
     *
     * Blocks while kLogQueueCapacity entries are waiting.
     * @return Delivery::Dropped once the logger is draining or closed
     */
    Delivery log(Priority priority,
                 std::string_view message,
                 const std::source_location& loc = std::source_location::current());

    template<typename... Args>
    Delivery logf(Priority priority, FormatWithLocation<Args...> fmt, Args&&... args) {
        return log(priority, std::format(fmt.fmt, std::forward<Args>(args)...), fmt.location);
    }

    Delivery warning(std::string_view message,
                     const std::source_location& loc = std::source_location::current()) {
        return log(Priority::Warning, message, loc);
    }

    Delivery info(std::string_view message,
                  const std::source_location& loc = std::source_location::current()) {
        return log(Priority::Info, message, loc);
    }

    Delivery debug(std::string_view message,
                   const std::source_location& loc = std::source_location::current()) {
        return log(Priority::Debug, message, loc);
    }

    template<typename... Args>
    Delivery warningf(FormatWithLocation<Args...> fmt, Args&&... args) {
        return log(Priority::Warning, std::format(fmt.fmt, std::forward<Args>(args)...), fmt.location);
    }

    template<typename... Args>
    Delivery infof(FormatWithLocation<Args...> fmt, Args&&... args) {
        return log(Priority::Info, std::format(fmt.fmt, std::forward<Args>(args)...), fmt.location);
    }

    template<typename... Args>
    Delivery debugf(FormatWithLocation<Args...> fmt, Args&&... args) {
        return log(Priority::Debug, std::format(fmt.fmt, std::forward<Args>(args)...), fmt.location);
    }

    // ========================================================================
    // Termination
    // ========================================================================

    /**
     * @brief Log "[EXIT <code>] message", close the files, std::exit(code)
     *
     * Waits for the actor to finish writing; never returns.
     */
    [[noreturn]] void exit(int code,
                           std::string_view message,
                           const std::source_location& loc = std::source_location::current());

    template<typename... Args>
    [[noreturn]] void exitf(int code, FormatWithLocation<Args...> fmt, Args&&... args) {
        exit(code, std::format(fmt.fmt, std::forward<Args>(args)...), fmt.location);
    }

    /**
     * @brief Log "[PANIC] message" and a stack trace, close the files, exit with kPanicExitCode
     */
    [[noreturn]] void panic(std::string_view message,
                            const std::source_location& loc = std::source_location::current());

    template<typename... Args>
    [[noreturn]] void panicf(FormatWithLocation<Args...> fmt, Args&&... args) {
        panic(std::format(fmt.fmt, std::forward<Args>(args)...), fmt.location);
    }

    // ========================================================================
    // Configuration
    // ========================================================================

    /**
     * @brief Replace file count, file size and threshold of the live config
     *
     * Entries queued before the change are written under the old rules.
     * Invalid values are rejected here and never reach the actor.
     */
    std::expected<void, ConfigError> set_config(int max_files,
                                                std::int64_t max_file_bytes,
                                                Priority threshold);

    /// Replace the suppression set with the stems in a comma-separated list.
    /// An empty list suppresses nothing.
    void suppress(std::string_view file_names);

    /// Copy of the live configuration
    [[nodiscard]] Config get_config() const;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /// Stop accepting entries, write out the queue, close the files. Idempotent.
    /// Waiting longer than kLoggerCloseTimeout is fatal.
    void close();

    [[nodiscard]] LoggerState state() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace logset

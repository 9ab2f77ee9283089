// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logset Contributors

#include "logset/platform.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>

#ifdef LOGSET_PLATFORM_WINDOWS
#include <windows.h>
#endif

#ifdef LOGSET_PLATFORM_APPLE
#include <mach-o/dyld.h>
#include <climits>
#endif

namespace logset {

namespace {

constexpr const char* kFallbackExecutableName = "logset";

// Last timestamp handed out, in nanoseconds since the epoch
std::atomic<std::int64_t> g_last_timestamp{0};

} // anonymous namespace

// ============================================================================
// Executable Name
// ============================================================================

std::string get_executable_name() {
    std::filesystem::path exe;

#if defined(LOGSET_PLATFORM_LINUX)
    std::error_code ec;
    exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) exe.clear();
#elif defined(LOGSET_PLATFORM_APPLE)
    char buf[PATH_MAX];
    std::uint32_t size = sizeof(buf);
    if (_NSGetExecutablePath(buf, &size) == 0) {
        exe = buf;
    }
#elif defined(LOGSET_PLATFORM_WINDOWS)
    char buf[MAX_PATH];
    auto len = GetModuleFileNameA(nullptr, buf, MAX_PATH);
    if (len > 0 && len < MAX_PATH) {
        exe = std::string(buf, len);
    }
#endif

    auto name = exe.filename().string();
    return name.empty() ? std::string(kFallbackExecutableName) : name;
}

// ============================================================================
// Timestamp Functions
// ============================================================================

// Log file names embed the timestamp and are ordered by it, so two calls
// never return the same value even when the clock is coarse or steps back.
Timestamp get_timestamp() noexcept {
    auto now = Timestamp::now().total_nanos();
    auto last = g_last_timestamp.load(std::memory_order_relaxed);
    std::int64_t next;
    do {
        next = now > last ? now : last + 1;
    } while (!g_last_timestamp.compare_exchange_weak(last, next, std::memory_order_relaxed));
    return Timestamp::from_nanos(next);
}

} // namespace logset

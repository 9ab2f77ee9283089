// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logset Contributors

#pragma once

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(_WIN32) || defined(_WIN64) || defined(__CYGWIN__)
    #define LOGSET_PLATFORM_WINDOWS 1
#endif

#if defined(__APPLE__) && defined(__MACH__)
    #define LOGSET_PLATFORM_APPLE 1
#endif

#if defined(__linux__)
    #define LOGSET_PLATFORM_LINUX 1
#endif

// ============================================================================
// Platform Utility Functions (implemented in platform.cpp)
// ============================================================================

#include "types.hpp"

#include <string>

namespace logset {

/// Wall-clock time, strictly increasing across calls within the process
[[nodiscard]] Timestamp get_timestamp() noexcept;

/// File name of the running executable ("logset" if it cannot be determined)
[[nodiscard]] std::string get_executable_name();

} // namespace logset

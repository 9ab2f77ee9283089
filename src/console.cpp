// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logset Contributors

#include "console.hpp"
#include "logset/error.hpp"

#include <cstdio>
#include <cstdlib>

namespace logset {
namespace detail {

// stdio locks the stream per call, so concurrent reports do not interleave
void report(std::string_view message) noexcept {
    std::fprintf(stderr, "logset: %.*s\n",
                 static_cast<int>(message.size()), message.data());
    std::fflush(stderr);
}

} // namespace detail

void fatal(const FatalError& error) noexcept {
    std::fprintf(stderr, "logset: fatal %.*s: %s\n",
                 static_cast<int>(fatal_kind_name(error.kind()).size()),
                 fatal_kind_name(error.kind()).data(),
                 error.what());
    std::fflush(stderr);
    std::abort();
}

} // namespace logset

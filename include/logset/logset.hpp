// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logset Contributors

/**
 * @file logset.hpp
 * @brief Logset - actor-based logging to a self-rotating set of files
 *
 * @code
 * logset::Logger log;  // reads ./<name>.logging.config, or defaults
 *
 * log.info("service started");
 * log.debugf("{} requests pending", pending);
 * log.set_config(5, 10'000'000, logset::Priority::Debug);
 * log.suppress("parser,lexer");
 *
 * if (broken) log.panic("state corrupted");  // writes a stack trace, exits 1
 * log.close();
 * @endcode
 */

#pragma once

#include "types.hpp"
#include "error.hpp"
#include "config.hpp"
#include "config_source.hpp"
#include "formatter.hpp"
#include "file_set.hpp"
#include "logger.hpp"

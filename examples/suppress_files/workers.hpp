// SPDX-License-Identifier: MIT
// Workers of the suppression example, one per source file

#pragma once

#include <logset/logger.hpp>

#include <stop_token>

void run_file1(std::stop_token stop, logset::Logger& logger);
void run_file2(std::stop_token stop, logset::Logger& logger);
void run_file3(std::stop_token stop, logset::Logger& logger);

// SPDX-License-Identifier: MIT
// Logset Basic Example
//
// Build:
//   cmake -S . -B build && cmake --build build
//   ./build/logset_example_basic
//
// Writes to ./logs/logset_example_basic_<timestamp>.log and exits with code 1
// through panic().

#include <logset/logset.hpp>

#include <iostream>
#include <memory>

int main() {
    auto config = logset::default_config();
    config.root_dir = "./logs";
    config.threshold = logset::Priority::Info;

    logset::Logger logger(logset::LoggerOptions{std::make_shared<logset::StaticConfigSource>(config)});

    logger.info("This message WILL appear in the log");
    logger.infof("Processing {} items", 42);
    logger.debug("This message will NOT appear in the log");

    std::cout << "Logs written to ./logs/\n";
    logger.panic("This is a panic");
}

// SPDX-License-Identifier: MIT
// Logset Live Reconfiguration Example
//
// The first messages are spread over two small log files. set_config() then
// raises the file size and drops DEBUG for everything logged afterwards.

#include <logset/logset.hpp>

#include <iostream>
#include <memory>

int main() {
    auto config = logset::default_config();
    config.root_dir = "./logs";
    config.max_file_bytes = 200;
    config.threshold = logset::Priority::Debug;

    logset::Logger logger(logset::LoggerOptions{std::make_shared<logset::StaticConfigSource>(config)});

    logger.info("Test started");
    for (int i = 0; i < 2; ++i) {
        logger.debugf("Debug {}", i);
        logger.infof("Info {}", i);
    }

    if (auto result = logger.set_config(3, 10'000'000, logset::Priority::Info); !result) {
        std::cerr << "set_config: " << logset::config_error_message(result.error()) << "\n";
        return 1;
    }

    // DEBUG is now filtered
    for (int i = 2; i < 5; ++i) {
        logger.debugf("Debug {}", i);
        logger.infof("Info {}", i);
    }
    logger.info("Done");
    logger.close();

    for (const auto& path : logset::FileSet::list_log_files(config.root_dir, config.file_name_prefix)) {
        std::cout << path.string() << "\n";
    }
    return 0;
}

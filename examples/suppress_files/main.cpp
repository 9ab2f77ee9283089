// SPDX-License-Identifier: MIT
// Logset Suppression Example
//
// Three threads log DEBUG and INFO from file1.cpp, file2.cpp and file3.cpp.
// After a second the DEBUG messages of file1 and file2 are suppressed; their
// INFO messages keep appearing.

#include "workers.hpp"

#include <logset/logset.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <thread>

int main() {
    auto config = logset::default_config();
    config.root_dir = "./logs";
    config.threshold = logset::Priority::Debug;

    logset::Logger logger(logset::LoggerOptions{std::make_shared<logset::StaticConfigSource>(config)});

    {
        std::jthread t1(run_file1, std::ref(logger));
        std::jthread t2(run_file2, std::ref(logger));
        std::jthread t3(run_file3, std::ref(logger));

        std::this_thread::sleep_for(std::chrono::seconds{1});

        // The ".cpp" extension is optional
        logger.suppress("file1.cpp,file2");

        std::this_thread::sleep_for(std::chrono::seconds{1});
    }

    logger.info("Done");
    return 0;
}

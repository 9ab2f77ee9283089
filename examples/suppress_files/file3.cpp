// SPDX-License-Identifier: MIT

#include "workers.hpp"

#include <chrono>
#include <thread>

void run_file3(std::stop_token stop, logset::Logger& logger) {
    for (int i = 0; !stop.stop_requested(); ++i) {
        logger.debugf("file3 debug {}", i);
        logger.infof("file3 info {}", i);
        std::this_thread::sleep_for(std::chrono::milliseconds{150});
    }
}

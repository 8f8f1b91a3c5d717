#include <gtest/gtest.h>

#include "config/Config.hpp"
#include "log/Registry.hpp"

#include <iostream>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        tf::config::LoggingConfig logging;
        logging.levels.console_log_level = spdlog::level::err;
        tf::log::Registry::init(logging);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize thumbforge test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}

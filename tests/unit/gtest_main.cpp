#include <gtest/gtest.h>
#include <iostream>

#include "config/Config.hpp"
#include "log/Registry.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        ppt::config::LoggingConfig logging;
        logging.console_log_level = spdlog::level::warn;
        ppt::log::Registry::init(logging);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize ppt-runner test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}

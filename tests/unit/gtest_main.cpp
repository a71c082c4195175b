#include <gtest/gtest.h>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        pglo::config::ConfigRegistry::init(pglo::config::Config{});
        pglo::logging::LogRegistry::init();
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize pglo test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}

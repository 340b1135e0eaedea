/**
 * @file test_main.cpp
 * @brief Test entry point - Initialize test environment and global fixtures
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "core/Logger.hpp"

#include <iostream>

namespace Hillkeeper {
namespace Test {

// =============================================================================
// Global Test Environment
// =============================================================================

/**
 * @brief Global test environment for the Hillkeeper tests
 *
 * Routes logging through the Hillkeeper loggers without console output
 * and raises the threshold so expected configuration warnings stay quiet.
 */
class HillkeeperTestEnvironment : public ::testing::Environment {
public:
    void SetUp() override {
        std::cout << "=== Hillkeeper Test Suite Starting ===" << std::endl;

        Logger::Initialize("", false);
        Logger::SetLevel(spdlog::level::critical);
    }

    void TearDown() override {
        Logger::Shutdown();

        std::cout << "=== Hillkeeper Test Suite Complete ===" << std::endl;
    }
};

} // namespace Test
} // namespace Hillkeeper

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    ::testing::InitGoogleMock(&argc, argv);

    ::testing::AddGlobalTestEnvironment(new Hillkeeper::Test::HillkeeperTestEnvironment());

    return RUN_ALL_TESTS();
}

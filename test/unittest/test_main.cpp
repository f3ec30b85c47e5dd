/**
 * @file test_main.cpp
 * @brief Main entry point for HRMS module unit tests
 * @date 2025-12-02
 */

#include <gtest/gtest.h>
#include <lap/log/CLog.hpp>
#include "CHrms.hpp"

int main(int argc, char **argv)
{
    ::lap::core::MemoryManager::getInstance();  // Initialize memory manager first

    // Initialize logging
    ::lap::log::LogManager::getInstance().initialize();

    // Initialize Google Test
    ::testing::InitGoogleTest(&argc, argv);

    // Run all tests
    int result = RUN_ALL_TESTS();

    return result;
}

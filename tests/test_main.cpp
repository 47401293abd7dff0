/**
 * @file test_main.cpp
 * @brief relayq Test Suite Entry Point
 *
 * Google Test runner for all relayq unit tests
 */

#include <gtest/gtest.h>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

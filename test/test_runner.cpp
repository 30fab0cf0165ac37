// test/test_runner.cpp
// -----------------------------------------------------------
// Google Test entry point for the unit and integration suites.
// Console logging is muted so test output stays readable; set
// SAFEINTAKE_TEST_LOG=1 to keep it.

#include <cstdlib>
#include <gtest/gtest.h>
#include "util/logger.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    if (std::getenv("SAFEINTAKE_TEST_LOG") == nullptr) {
        safeintake::util::logger::setConsoleOutput(false);
    }
    return RUN_ALL_TESTS();
}

// test/test_runner.cpp
// -----------------------------------------------------------
// Google Test entry point for the idredact unit tests under test/unit/.
// Logging is raised to ERROR so that test output stays readable.

#include <gtest/gtest.h>

#include "util/logger.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    idredact::util::logger::setLogLevel(idredact::util::logger::LogLevel::ERROR);
    return RUN_ALL_TESTS();
}

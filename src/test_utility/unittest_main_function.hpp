/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cuvette_test_utility_unittest_main_function_hpp
#define cuvette_test_utility_unittest_main_function_hpp

#include <string>

#include "libcuvette/Error.hpp"
#include "libcuvette/Logger.hpp"
#include "libcuvette/utility/environment.hpp"

// WATCH OUT!
// boost libraries must be included before CppUTest, so in order to be
// on the safe side include this file as the last header file in the test code
#include <CppUTest/CommandLineTestRunner.h>
#include <CppUTest/MemoryLeakWarningPlugin.h>

namespace test_utility {

// CUVETTE_TEST_LOG_LEVEL=DEBUG|INFO|WARN|ERROR shows the log of the code under test
inline void setLogLevelFromEnvironment() {
    auto value = libcuvette::environment::getOptionalVariable("CUVETTE_TEST_LOG_LEVEL");
    auto level = libcuvette::LogLevel::WARN;
    if(value) {
        for(auto candidate : {libcuvette::LogLevel::DEBUG, libcuvette::LogLevel::INFO,
                              libcuvette::LogLevel::WARN, libcuvette::LogLevel::ERROR}) {
            if(*value == libcuvette::logLevelToString(candidate)) {
                level = candidate;
            }
        }
    }
    libcuvette::Logger::getInstance().setLevel(level);
}

}

#define CUVETTE_UNITTEST_MAIN_FUNCTION() \
int main(int argc, char **argv) { \
    /* the leak detector is not thread-safe and reports lazily initialized statics */ \
    MemoryLeakWarningPlugin::turnOffNewDeleteOverloads(); \
    test_utility::setLogLevelFromEnvironment(); \
    try { \
        return CommandLineTestRunner::RunAllTests(argc, argv); \
    } \
    catch(const libcuvette::Error& e) { \
        libcuvette::Logger::getInstance().logErrorTrace(e, "test"); \
        return 1; \
    } \
}

#endif

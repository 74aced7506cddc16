/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <boost/filesystem.hpp>
#include <boost/regex.hpp>

#include "test_utility/config.hpp"
#include "libcuvette/Utility.hpp"
#include "engine/RunLogger.hpp"
#include "test_utility/unittest_main_function.hpp"

using namespace cuvette;

TEST_GROUP(RunLoggerTestGroup) {
};

TEST(RunLoggerTestGroup, writesStagedRecords) {
    auto configRAII = test_utility::config::makeConfig();
    auto logsDir = configRAII.getPrefixDir() / "logs";

    auto logFile = boost::filesystem::path{};
    {
        engine::RunLogger runLogger{logsDir};
        logFile = runLogger.getLogFile();
        runLogger.log(engine::RunLogger::Stage::PROVISIONING, "created staging directories");
        runLogger.log(engine::RunLogger::Stage::EXECUTION, boost::format("exit code %d") % 0);
        CHECK(runLogger.isHealthy());
    }

    CHECK_EQUAL(logFile.parent_path().string(), logsDir.string());
    auto nameRegex = boost::regex{R"(run_[0-9]{8}T[0-9]{6}\.[0-9]{3}Z_[a-z]{8}\.log)"};
    CHECK(boost::regex_match(logFile.filename().string(), nameRegex));

    auto content = libcuvette::filesystem::readFile(logFile);
    auto contentRegex = boost::regex{
        R"(\[[0-9]{4}-[0-9]{2}-[0-9]{2}T[0-9]{2}:[0-9]{2}:[0-9]{2}\.[0-9]{3}Z\] \[PROVISIONING\] created staging directories\n)"
        R"(\[[0-9]{4}-[0-9]{2}-[0-9]{2}T[0-9]{2}:[0-9]{2}:[0-9]{2}\.[0-9]{3}Z\] \[EXECUTION\] exit code 0\n)"};
    CHECK(boost::regex_match(content, contentRegex));
}

TEST(RunLoggerTestGroup, recordsAfterCloseAreDropped) {
    auto configRAII = test_utility::config::makeConfig();
    engine::RunLogger runLogger{configRAII.getPrefixDir() / "logs"};
    runLogger.log(engine::RunLogger::Stage::CLEANUP, "before close");
    runLogger.close();
    runLogger.log(engine::RunLogger::Stage::CLEANUP, "after close");
    runLogger.close();

    auto content = libcuvette::filesystem::readFile(runLogger.getLogFile());
    CHECK(content.find("before close") != std::string::npos);
    CHECK(content.find("after close") == std::string::npos);
}

TEST(RunLoggerTestGroup, unavailableLogsDirDoesNotThrow) {
    engine::RunLogger runLogger{"/proc/cuvette-nonexistent/logs"};
    CHECK_FALSE(runLogger.isHealthy());
    runLogger.log(engine::RunLogger::Stage::EXECUTION, "dropped");
    runLogger.close();
}

TEST(RunLoggerTestGroup, stageToString) {
    CHECK_EQUAL(engine::RunLogger::stageToString(engine::RunLogger::Stage::PROVISIONING), std::string{"PROVISIONING"});
    CHECK_EQUAL(engine::RunLogger::stageToString(engine::RunLogger::Stage::RESOLUTION), std::string{"RESOLUTION"});
    CHECK_EQUAL(engine::RunLogger::stageToString(engine::RunLogger::Stage::TRANSFORMATION), std::string{"TRANSFORMATION"});
    CHECK_EQUAL(engine::RunLogger::stageToString(engine::RunLogger::Stage::EXECUTION), std::string{"EXECUTION"});
    CHECK_EQUAL(engine::RunLogger::stageToString(engine::RunLogger::Stage::RECONCILIATION), std::string{"RECONCILIATION"});
    CHECK_EQUAL(engine::RunLogger::stageToString(engine::RunLogger::Stage::CLEANUP), std::string{"CLEANUP"});
}

CUVETTE_UNITTEST_MAIN_FUNCTION();

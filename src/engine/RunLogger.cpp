/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "RunLogger.hpp"

#include <chrono>

#include "libcuvette/Error.hpp"
#include "libcuvette/Utility.hpp"
#include "engine/Utility.hpp"


namespace cuvette {
namespace engine {

RunLogger::RunLogger(const boost::filesystem::path& logsDir) {
    auto now = std::chrono::system_clock::now();
    auto name = boost::format("run_%s_%s.log")
        % utility::makeUTCTimestamp(now, true)
        % libcuvette::string::generateRandom(8);
    logFile = logsDir / name.str();

    try {
        libcuvette::filesystem::createFoldersIfNecessary(logsDir);
    }
    catch(const libcuvette::Error& e) {
        reportFailure(e.what());
        return;
    }

    stream.open(logFile.string(), std::ios_base::out | std::ios_base::app);
    if(!stream) {
        reportFailure("cannot open file");
        return;
    }
    utility::logMessage(boost::format("Run log: %s") % logFile, libcuvette::LogLevel::INFO);
}

RunLogger::~RunLogger() {
    close();
}

void RunLogger::log(Stage stage, const boost::format& message) {
    log(stage, message.str());
}

void RunLogger::log(Stage stage, const std::string& message) {
    if(failed || closed) {
        return;
    }

    auto timestamp = std::string{};
    try {
        timestamp = utility::makeUTCTimestamp(std::chrono::system_clock::now());
    }
    catch(const libcuvette::Error& e) {
        reportFailure(e.what());
        return;
    }

    auto record = boost::format("[%s] [%s] %s\n") % timestamp % stageToString(stage) % message;
    stream << record.str();
    stream.flush();
    if(!stream) {
        reportFailure("write failed");
    }
}

void RunLogger::close() {
    if(closed) {
        return;
    }
    closed = true;
    if(stream.is_open()) {
        stream.close();
        if(!stream && !failed) {
            reportFailure("close failed");
        }
    }
}

const boost::filesystem::path& RunLogger::getLogFile() const {
    return logFile;
}

bool RunLogger::isHealthy() const {
    return !failed;
}

std::string RunLogger::stageToString(Stage stage) {
    switch(stage) {
        case Stage::PROVISIONING:   return "PROVISIONING";
        case Stage::RESOLUTION:     return "RESOLUTION";
        case Stage::TRANSFORMATION: return "TRANSFORMATION";
        case Stage::EXECUTION:      return "EXECUTION";
        case Stage::RECONCILIATION: return "RECONCILIATION";
        case Stage::CLEANUP:        return "CLEANUP";
    }
    return "UNKNOWN";
}

void RunLogger::reportFailure(const std::string& reason) {
    if(failed) {
        return;
    }
    failed = true;
    auto message = boost::format("Run log %s is unavailable (%s). Further run log records are dropped.")
        % logFile % reason;
    utility::logMessage(message, libcuvette::LogLevel::WARN);
}

}
}

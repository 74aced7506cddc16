/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cuvette_engine_RunLogger_hpp
#define cuvette_engine_RunLogger_hpp

#include <fstream>
#include <string>

#include <boost/format.hpp>
#include <boost/filesystem.hpp>


namespace cuvette {
namespace engine {

/**
 * Append-only log of one invocation, written to <logsDir>/run_<UTC timestamp>_<token>.log.
 *
 * Each record reads "[<ISO-8601 UTC timestamp>] [<STAGE>] <message>". The run log is
 * observational only: a failure to open or write it is reported once on the process
 * logger, after which further records are silently dropped.
 */
class RunLogger {
public:
    enum class Stage {PROVISIONING, RESOLUTION, TRANSFORMATION, EXECUTION, RECONCILIATION, CLEANUP};

public:
    RunLogger(const boost::filesystem::path& logsDir);
    RunLogger(const RunLogger&) = delete;
    RunLogger& operator=(const RunLogger&) = delete;
    ~RunLogger();

    void log(Stage, const std::string& message);
    void log(Stage, const boost::format& message);
    void close();

    const boost::filesystem::path& getLogFile() const;
    bool isHealthy() const;

    static std::string stageToString(Stage);

private:
    void reportFailure(const std::string& reason);

private:
    boost::filesystem::path logFile;
    std::ofstream stream;
    bool failed = false;
    bool closed = false;
};

}
}

#endif

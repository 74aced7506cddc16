/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libcuvette_Logger_hpp
#define libcuvette_Logger_hpp

#include <atomic>
#include <string>
#include <iostream>
#include <mutex>

#include <boost/format.hpp>

#include "libcuvette/LogLevel.hpp"
#include "libcuvette/Error.hpp"

namespace libcuvette {

/**
 * Process-wide logger. Several executions may run concurrently in the same
 * process, so every message (and every error trace) is written to its stream
 * as a whole while holding the stream lock.
 *
 * Format: "[<monotonic time>] [<hostname>-<pid>] [<subsystem>] [<LEVEL>] <message>".
 * GENERAL messages are written without prefix.
 */
class Logger {
public:
    static Logger& getInstance();

    void log(const std::string& message, const std::string& sysName, const libcuvette::LogLevel& logLevel,
             std::ostream& out_stream = std::cout, std::ostream& err_stream = std::cerr);
    void log(const boost::format& message, const std::string& sysName, const libcuvette::LogLevel& logLevel,
             std::ostream& out_stream = std::cout, std::ostream& err_stream = std::cerr);
    void logErrorTrace(const libcuvette::Error& error, const std::string& sysName, std::ostream& errStream = std::cerr);
    void setLevel(libcuvette::LogLevel logLevel) { level = logLevel; };
    libcuvette::LogLevel getLevel() const { return level; };

private:
    Logger();
    Logger(const Logger&) = delete;
    Logger(Logger&&) = delete;

    std::string makePrefix(libcuvette::LogLevel logLevel, const std::string& systemName) const;
    void write(const std::string& text, libcuvette::LogLevel logLevel, std::ostream& out_stream, std::ostream& err_stream);

private:
    std::atomic<libcuvette::LogLevel> level;
    std::string instanceID;
    std::mutex streamMutex;
};

// Shorthands for the messages of the library code
void logMessage(const std::string&, LogLevel, std::ostream& out = std::cout, std::ostream& err = std::cerr);
void logMessage(const boost::format&, LogLevel, std::ostream& out = std::cout, std::ostream& err = std::cerr);

}

#endif

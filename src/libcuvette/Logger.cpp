/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "libcuvette/Logger.hpp"

#include <string>
#include <sstream>
#include <iostream>
#include <cerrno>
#include <cstring>

#include <time.h>
#include <sys/types.h>
#include <unistd.h>

#include <boost/format.hpp>

#include "libcuvette/Error.hpp"
#include "libcuvette/utility/process.hpp"

namespace libcuvette {

    Logger& Logger::getInstance() {
        static Logger logger;
        return logger;
    }

    Logger::Logger()
        : level{ libcuvette::LogLevel::WARN }
        , instanceID{ (boost::format("%s-%d") % libcuvette::process::getHostname() % getpid()).str() }
    {}

    void Logger::log(const std::string& message, const std::string& systemName, const libcuvette::LogLevel& logLevel,
                     std::ostream& out_stream, std::ostream& err_stream) {
        if(logLevel < level) {
            return;
        }
        write(makePrefix(logLevel, systemName) + message + "\n", logLevel, out_stream, err_stream);
    }

    void Logger::log(const boost::format& message, const std::string& systemName, const libcuvette::LogLevel& logLevel,
                     std::ostream& out_stream, std::ostream& err_stream) {
        log(message.str(), systemName, logLevel, out_stream, err_stream);
    }

    void Logger::logErrorTrace(const libcuvette::Error& error, const std::string& systemName, std::ostream& errStream) {
        if(error.getLogLevel() < level) {
            return;
        }

        auto text = std::ostringstream{};
        text << makePrefix(LogLevel::ERROR, systemName) << "Error trace (most nested error last):\n";

        const auto& trace = error.getErrorTrace();
        for(size_t i=0; i!=trace.size(); ++i) {
            const auto& entry = trace[trace.size()-i-1];
            text << boost::format("#%-3.3s %s at %s:%s %s\n")
                % i % entry.functionName % entry.fileName % (entry.fileLine != -1 ? std::to_string(entry.fileLine) : "")
                % entry.errorMessage;
        }

        write(text.str(), LogLevel::ERROR, std::cout, errStream);
    }

    std::string Logger::makePrefix(libcuvette::LogLevel logLevel, const std::string& systemName) const {
        if(logLevel == libcuvette::LogLevel::GENERAL) {
            return "";
        }

        auto tp = timespec{};
        if(clock_gettime(CLOCK_MONOTONIC, &tp) != 0) {
            auto message = boost::format("logger failed to retrieve monotonic time (%s)") % strerror(errno);
            CUVETTE_THROW_ERROR(message.str());
        }

        auto prefix = boost::format("[%d.%09d] [%s] [%s] [%s] ")
            % tp.tv_sec % tp.tv_nsec % instanceID % systemName % logLevelToString(logLevel);
        return prefix.str();
    }

    void Logger::write(const std::string& text, libcuvette::LogLevel logLevel,
                       std::ostream& out_stream, std::ostream& err_stream) {
        std::lock_guard<std::mutex> lock{streamMutex};

        // WARNING and ERROR messages go to stderr
        auto& stream = (logLevel == LogLevel::WARN || logLevel == LogLevel::ERROR) ? err_stream : out_stream;
        stream << text << std::flush;
    }

    void logMessage(const boost::format& message, LogLevel level, std::ostream& out, std::ostream& err) {
        logMessage(message.str(), level, out, err);
    }

    void logMessage(const std::string& message, LogLevel level, std::ostream& out, std::ostream& err) {
        Logger::getInstance().log(message, "libcuvette", level, out, err);
    }

}

/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Utility.hpp"

#include <time.h>

#include "libcuvette/Error.hpp"


namespace cuvette {
namespace engine {
namespace utility {

/**
 * ISO-8601 UTC timestamp with millisecond precision, e.g. 2023-05-04T10:11:12.345Z.
 * The compact variant (20230504T101112.345Z) has no separators that would be awkward
 * in file names.
 */
std::string makeUTCTimestamp(const std::chrono::system_clock::time_point& timePoint, bool compact) {
    auto seconds = std::chrono::system_clock::to_time_t(timePoint);
    auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(
        timePoint.time_since_epoch()).count() % 1000;

    struct tm utc;
    if(gmtime_r(&seconds, &utc) == nullptr) {
        CUVETTE_THROW_ERROR("Failed to convert time point to UTC (gmtime_r failed)");
    }

    char buffer[32];
    const char* format = compact ? "%Y%m%dT%H%M%S" : "%Y-%m-%dT%H:%M:%S";
    if(strftime(buffer, sizeof(buffer), format, &utc) == 0) {
        CUVETTE_THROW_ERROR("Failed to format UTC timestamp (strftime failed)");
    }

    auto timestamp = boost::format("%s.%03dZ") % buffer % milliseconds;
    return timestamp.str();
}

void logMessage(const boost::format& message, libcuvette::LogLevel level,
                std::ostream& out, std::ostream& err) {
    utility::logMessage(message.str(), level, out, err);
}

void logMessage(const std::string& message, libcuvette::LogLevel level,
                std::ostream& out, std::ostream& err) {
    auto subsystemName = "Engine";
    libcuvette::Logger::getInstance().log(message, subsystemName, level, out, err);
}

} // namespace
} // namespace
} // namespace

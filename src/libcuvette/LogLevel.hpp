/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libcuvette_LogLevel_hpp
#define libcuvette_LogLevel_hpp

#include <string>

namespace libcuvette {

// GENERAL messages are printed unconditionally and without prefixes (e.g. help and version output)
enum class LogLevel {DEBUG, INFO, WARN, ERROR, GENERAL};

inline std::string logLevelToString(LogLevel level) {
    switch(level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARN:    return "WARN";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::GENERAL: return "GENERAL";
    }
    return "UNKNOWN";
}

}

#endif

/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Error.hpp"

#include <ios>
#include <stdexcept>
#include <system_error>

namespace libcuvette {

std::string getExceptionTypeString(const std::exception& e) {
    if (dynamic_cast<const std::logic_error*>(&e)) {
        return "logic error";
    }
    else if (dynamic_cast<const std::ios_base::failure*>(&e)) {
        return "ios_base failure";
    }
    else if (dynamic_cast<const std::system_error*>(&e)) {
        return "system error";
    }
    else if (dynamic_cast<const std::runtime_error*>(&e)) {
        return "runtime error";
    }
    return "generic exception";
}

void rethrowWithTraceEntry(const std::exception& exception, const Error::ErrorTraceEntry& entry) {
    const auto* error = dynamic_cast<const Error*>(&exception);
    rethrowWithTraceEntry(exception, entry, error ? error->getLogLevel() : LogLevel::ERROR);
}

void rethrowWithTraceEntry(const std::exception& exception, const Error::ErrorTraceEntry& entry, LogLevel logLevel) {
    if(const auto* cp = dynamic_cast<const Error*>(&exception)) {
        // the object is the exception being handled: update its trace and rethrow it as it is
        auto* error = const_cast<Error*>(cp);
        error->setLogLevel(logLevel);
        error->appendErrorTraceEntry(entry);
        throw;
    }

    auto previousEntry = Error::ErrorTraceEntry{exception.what(), "unspecified location", -1,
                                                getExceptionTypeString(exception)};
    auto error = Error{logLevel, previousEntry};
    error.appendErrorTraceEntry(entry);
    throw error;
}

}

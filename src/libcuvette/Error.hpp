/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libcuvette_Error_hpp
#define libcuvette_Error_hpp

#include <exception>
#include <string>
#include <vector>
#include <cstring>

#include <boost/filesystem.hpp>

#include "libcuvette/LogLevel.hpp"

namespace libcuvette {

/**
 * This class encapsulates error trace information to be propagated as an exception.
 *
 * An error trace entry encapsulates information about file, line and function name
 * where the error trace entry was created.
 *
 * The first error trace entry is created by the macro CUVETTE_THROW_ERROR (or by
 * CUVETTE_THROW_TYPED_ERROR for the subclasses that carry extra context).
 * Additional error trace entries are created by the macro CUVETTE_RETHROW_ERROR.
 * Rethrowing keeps the dynamic type of the caught object, so a subclass thrown deep
 * inside the engine reaches the caller as the same subclass.
 *
 * Note: this class should be instantiated and thrown through the macros.
 * Caught instances of this class should be rethrown through the CUVETTE_RETHROW_ERROR macro.
 */
class Error : public std::exception {
public:
    struct ErrorTraceEntry {
        std::string errorMessage;
        boost::filesystem::path fileName;
        int fileLine;
        std::string functionName;
    };

public:
    Error(LogLevel logLevel, const ErrorTraceEntry& entry)
        : logLevel{ logLevel }
        , errorTrace{ entry }
    {}

    virtual ~Error() = default;

    const char* what() const noexcept override {
        // Return the 'what()' of the original exception that generated this error trace
        // as if the original exception was propagated directly up to the current
        // stack frame, i.e. without intermediate catch-rethrows.
        return errorTrace.front().errorMessage.c_str();
    }

    void appendErrorTraceEntry(const ErrorTraceEntry& entry) {
        errorTrace.push_back(entry);
    }

    const std::vector<ErrorTraceEntry>& getErrorTrace() const {
        return errorTrace;
    }

    LogLevel getLogLevel() const {
        return logLevel;
    }

    void setLogLevel(LogLevel value) {
        logLevel = value;
    }

private:
    LogLevel logLevel = LogLevel::ERROR;
    std::vector<ErrorTraceEntry> errorTrace;
};

inline bool operator==(const Error::ErrorTraceEntry& lhs, const Error::ErrorTraceEntry& rhs) {
    return lhs.errorMessage == rhs.errorMessage
        && lhs.fileName == rhs.fileName
        && lhs.fileLine == rhs.fileLine
        && lhs.functionName == rhs.functionName;
}

inline bool operator!=(const Error::ErrorTraceEntry& lhs, const Error::ErrorTraceEntry& rhs) {
    return !(lhs == rhs);
}

std::string getExceptionTypeString(const std::exception& e);

/**
 * Appends the entry to the trace of the exception being handled and rethrows it.
 * A libcuvette::Error (or subclass) is rethrown as the same object, hence keeps its
 * dynamic type. Any other exception is converted into a libcuvette::Error whose first
 * entry describes the original exception.
 * Without explicit log level, a libcuvette::Error keeps its own and anything else gets ERROR.
 */
[[noreturn]] void rethrowWithTraceEntry(const std::exception&, const Error::ErrorTraceEntry&);
[[noreturn]] void rethrowWithTraceEntry(const std::exception&, const Error::ErrorTraceEntry&, LogLevel);

}


// CUVETTE_THROW_ERROR macros
#define __FILENAME__ (strrchr(__FILE__, '/') ? strrchr(__FILE__, '/') + 1 : __FILE__)

#define CUVETTE_GET_OVERLOADED_THROW_ERROR(_1, _2, NAME, ...) NAME

#define CUVETTE_THROW_ERROR_2(errorMessage, logLevel) { \
    auto stackTraceEntry = libcuvette::Error::ErrorTraceEntry{errorMessage, __FILENAME__, __LINE__, __func__}; \
    throw libcuvette::Error{logLevel, stackTraceEntry}; \
}

#define CUVETTE_THROW_ERROR_1(errorMessage) CUVETTE_THROW_ERROR_2(errorMessage, libcuvette::LogLevel::ERROR)

#define CUVETTE_THROW_ERROR(...) CUVETTE_GET_OVERLOADED_THROW_ERROR(__VA_ARGS__, CUVETTE_THROW_ERROR_2, CUVETTE_THROW_ERROR_1)(__VA_ARGS__)


// CUVETTE_THROW_TYPED_ERROR: throws a subclass of libcuvette::Error whose constructor
// takes the error trace entry followed by the subclass-specific arguments
#define CUVETTE_THROW_TYPED_ERROR(ErrorType, errorMessage, ...) { \
    auto stackTraceEntry = libcuvette::Error::ErrorTraceEntry{errorMessage, __FILENAME__, __LINE__, __func__}; \
    throw ErrorType{stackTraceEntry, ##__VA_ARGS__}; \
}


// CUVETTE_RETHROW_ERROR macros: must be used inside a catch block when the caught
// object is a libcuvette::Error, which is then rethrown with "throw;"
#define CUVETTE_GET_OVERLOADED_RETHROW_ERROR(_1, _2, _3, NAME, ...) NAME

#define CUVETTE_RETHROW_ERROR_3(exception, errorMessage, logLevel) { \
    auto errorTraceEntry = libcuvette::Error::ErrorTraceEntry{errorMessage, __FILENAME__, __LINE__, __func__}; \
    libcuvette::rethrowWithTraceEntry(exception, errorTraceEntry, logLevel); \
}

#define CUVETTE_RETHROW_ERROR_2(exception, errorMessage) { \
    auto errorTraceEntry = libcuvette::Error::ErrorTraceEntry{errorMessage, __FILENAME__, __LINE__, __func__}; \
    libcuvette::rethrowWithTraceEntry(exception, errorTraceEntry); \
}

#define CUVETTE_RETHROW_ERROR(...) CUVETTE_GET_OVERLOADED_RETHROW_ERROR(__VA_ARGS__, CUVETTE_RETHROW_ERROR_3, CUVETTE_RETHROW_ERROR_2)(__VA_ARGS__)

#endif

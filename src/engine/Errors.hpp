/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cuvette_engine_Errors_hpp
#define cuvette_engine_Errors_hpp

#include <chrono>
#include <string>

#include "libcuvette/Error.hpp"


namespace cuvette {
namespace engine {

/**
 * The typed errors of an execution. They are thrown with CUVETTE_THROW_TYPED_ERROR
 * and, being libcuvette::Error objects, keep their dynamic type when intermediate
 * layers append trace entries with CUVETTE_RETHROW_ERROR. Callers tell them apart
 * with catch clauses instead of matching messages.
 */

// The request was rejected before anything was provisioned.
class InvalidRequestError : public libcuvette::Error {
public:
    InvalidRequestError(const ErrorTraceEntry& entry)
        : libcuvette::Error{libcuvette::LogLevel::INFO, entry}
    {}
};

// The sandbox could not be prepared or the container runtime failed.
class SetupError : public libcuvette::Error {
public:
    SetupError(const ErrorTraceEntry& entry)
        : libcuvette::Error{libcuvette::LogLevel::ERROR, entry}
    {}
};

// The guest process ran and exited with a non-zero status.
class GuestExecutionError : public libcuvette::Error {
public:
    GuestExecutionError(const ErrorTraceEntry& entry,
                        const std::string& stdoutText,
                        const std::string& stderrText,
                        int exitCode)
        : libcuvette::Error{libcuvette::LogLevel::INFO, entry}
        , stdoutText{stdoutText}
        , stderrText{stderrText}
        , exitCode{exitCode}
    {}

    const std::string& getStdout() const { return stdoutText; }
    const std::string& getStderr() const { return stderrText; }
    int getExitCode() const { return exitCode; }

private:
    std::string stdoutText;
    std::string stderrText;
    int exitCode;
};

// The guest process exceeded its wall-clock timeout and was killed.
class TimeoutError : public libcuvette::Error {
public:
    TimeoutError(const ErrorTraceEntry& entry,
                 const std::string& stdoutText,
                 const std::string& stderrText,
                 std::chrono::seconds timeout)
        : libcuvette::Error{libcuvette::LogLevel::INFO, entry}
        , stdoutText{stdoutText}
        , stderrText{stderrText}
        , timeout{timeout}
    {}

    const std::string& getStdout() const { return stdoutText; }
    const std::string& getStderr() const { return stderrText; }
    std::chrono::seconds getTimeout() const { return timeout; }

private:
    std::string stdoutText;
    std::string stderrText;
    std::chrono::seconds timeout;
};

// Reading or classifying the created files failed. Never leaves the engine.
class ReconciliationError : public libcuvette::Error {
public:
    ReconciliationError(const ErrorTraceEntry& entry)
        : libcuvette::Error{libcuvette::LogLevel::WARN, entry}
    {}
};

}
}

#endif

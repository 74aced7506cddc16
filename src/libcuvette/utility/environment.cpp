/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "environment.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include "libcuvette/Error.hpp"
#include "libcuvette/Logger.hpp"

namespace libcuvette {
namespace environment {

boost::optional<std::string> getOptionalVariable(const std::string& key) {
    const char* value = std::getenv(key.c_str());
    if(value == nullptr) {
        return boost::none;
    }
    logMessage(boost::format("Got environment variable %s=%s") % key % value, libcuvette::LogLevel::DEBUG);
    return std::string{value};
}

Variables getVariables(const std::vector<std::string>& keys) {
    auto variables = Variables{};
    for(const auto& key : keys) {
        auto value = getOptionalVariable(key);
        if(value) {
            variables.emplace_back(key, *value);
        }
    }
    return variables;
}

void setVariable(const std::string& key, const std::string& value) {
    int overwrite = 1;
    if(setenv(key.c_str(), value.c_str(), overwrite) != 0) {
        auto message = boost::format("Failed to setenv(%s, %s, %d): %s")
            % key % value % overwrite % strerror(errno);
        CUVETTE_THROW_ERROR(message.str());
    }
    logMessage(boost::format("Set environment variable %s=%s") % key % value, libcuvette::LogLevel::DEBUG);
}

void unsetVariable(const std::string& key) {
    if(unsetenv(key.c_str()) != 0) {
        auto message = boost::format("Failed to unsetenv(%s): %s") % key % strerror(errno);
        CUVETTE_THROW_ERROR(message.str());
    }
}

}}

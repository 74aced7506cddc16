/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "RequestValidator.hpp"

#include <boost/format.hpp>

#include "libcuvette/Utility.hpp"
#include "engine/Errors.hpp"
#include "engine/Utility.hpp"


namespace cuvette {
namespace engine {

RequestValidator::RequestValidator(std::shared_ptr<const common::Config> config)
    : maxCodeBytes{ static_cast<std::size_t>(config->json["maxCodeBytes"].GetUint64()) }
{
    for(const auto& pattern : config->getStringArray("forbiddenCodePatterns")) {
        try {
            forbiddenPatterns.emplace_back(pattern, boost::regex{pattern});
        }
        catch(const boost::regex_error& e) {
            auto message = boost::format("Invalid forbidden code pattern '%s' in configuration: %s")
                % pattern % e.what();
            CUVETTE_THROW_TYPED_ERROR(SetupError, message.str());
        }
    }
}

void RequestValidator::validate(const ExecutionRequest& request) const {
    utility::logMessage("Validating request", libcuvette::LogLevel::DEBUG);

    if(libcuvette::string::isBlank(request.code)) {
        CUVETTE_THROW_TYPED_ERROR(InvalidRequestError, "Code must be a non-empty string");
    }

    if(request.code.size() > maxCodeBytes) {
        auto message = boost::format("Code is %d bytes long, the maximum allowed size is %d bytes")
            % request.code.size() % maxCodeBytes;
        CUVETTE_THROW_TYPED_ERROR(InvalidRequestError, message.str());
    }

    for(const auto& entry : request.dataFiles) {
        if(libcuvette::string::isBlank(entry.first)) {
            auto message = boost::format("Data file with handle '%s' has an empty logical name") % entry.second;
            CUVETTE_THROW_TYPED_ERROR(InvalidRequestError, message.str());
        }
        if(libcuvette::string::isBlank(entry.second)) {
            auto message = boost::format("Data file '%s' has an empty handle") % entry.first;
            CUVETTE_THROW_TYPED_ERROR(InvalidRequestError, message.str());
        }
    }

    for(const auto& pattern : forbiddenPatterns) {
        if(boost::regex_search(request.code, pattern.second)) {
            auto message = boost::format("Code contains a forbidden construct (pattern '%s')") % pattern.first;
            CUVETTE_THROW_TYPED_ERROR(InvalidRequestError, message.str());
        }
    }

    utility::logMessage("Successfully validated request", libcuvette::LogLevel::DEBUG);
}

}
}

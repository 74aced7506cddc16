/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cuvette_engine_RequestValidator_hpp
#define cuvette_engine_RequestValidator_hpp

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <boost/regex.hpp>

#include "common/Config.hpp"
#include "engine/ExecutionTypes.hpp"


namespace cuvette {
namespace engine {

class RequestValidator {
public:
    RequestValidator(std::shared_ptr<const common::Config>);
    void validate(const ExecutionRequest&) const;

private:
    std::size_t maxCodeBytes;
    std::vector<std::pair<std::string, boost::regex>> forbiddenPatterns;
};

}
}

#endif

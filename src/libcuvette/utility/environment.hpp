/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libcuvette_utility_environment_hpp
#define libcuvette_utility_environment_hpp

#include <string>
#include <utility>
#include <vector>

#include <boost/optional.hpp>

/**
 * Access to the environment of the engine process
 */

namespace libcuvette {
namespace environment {

using Variables = std::vector<std::pair<std::string, std::string>>;

boost::optional<std::string> getOptionalVariable(const std::string& key);

// the variables among the given keys that are set, in the order of the keys
Variables getVariables(const std::vector<std::string>& keys);

void setVariable(const std::string& key, const std::string& value);
void unsetVariable(const std::string& key);

}}

#endif

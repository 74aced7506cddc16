/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libcuvette_utility_process_hpp
#define libcuvette_utility_process_hpp

#include <functional>
#include <iostream>
#include <string>

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>

#include "libcuvette/CLIArguments.hpp"

/**
 * Utility functions for system operations
 */

namespace libcuvette {
namespace process {

int forkExecWait(const libcuvette::CLIArguments& args,
                 const boost::optional<std::function<void()>>& preExecChildActions = {},
                 const boost::optional<std::function<void(int)>>& postForkParentActions = {},
                 std::iostream* const childStdoutStream = nullptr);
boost::optional<boost::filesystem::path> findExecutable(const std::string& name);
std::string getHostname();

}}

#endif

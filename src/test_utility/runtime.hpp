/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

/**
 * @brief Fake container runtime clients for the tests of the execution pipeline.
 */

#ifndef cuvette_test_utility_runtime_hpp
#define cuvette_test_utility_runtime_hpp

#include <string>

#include <boost/filesystem.hpp>

namespace test_utility {
namespace runtime {

/**
 * Writes an executable shell script that behaves like the CLI client of a
 * container runtime:
 * - "kill" always succeeds;
 * - "image inspect" succeeds if isImageAvailable is set;
 * - "run" stores its arguments in <script dir>/last-arguments and the guest
 *   script in <script dir>/last-script.py, sets SCRIPT, INPUT and OUTPUT to the
 *   host side of the bind mounts, writes a container id into the --cidfile
 *   file if one is given, then executes runBody.
 */
boost::filesystem::path writeFakeRuntime(const boost::filesystem::path& script,
                                         const std::string& runBody,
                                         bool isImageAvailable = true);

std::string readLastArguments(const boost::filesystem::path& script);
std::string readLastScript(const boost::filesystem::path& script);

}
}

#endif

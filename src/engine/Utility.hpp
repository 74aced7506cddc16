/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cuvette_engine_Utility_hpp
#define cuvette_engine_Utility_hpp

#include <chrono>
#include <iostream>
#include <string>

#include <boost/format.hpp>

#include "libcuvette/Logger.hpp"

namespace cuvette {
namespace engine {
namespace utility {

std::string makeUTCTimestamp(const std::chrono::system_clock::time_point&, bool compact=false);
void logMessage(const boost::format&, libcuvette::LogLevel,
                std::ostream& out=std::cout, std::ostream& err=std::cerr);
void logMessage(const std::string&, libcuvette::LogLevel,
                std::ostream& out=std::cout, std::ostream& err=std::cerr);

} // namespace
} // namespace
} // namespace

#endif

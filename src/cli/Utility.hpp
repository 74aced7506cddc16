/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cli_Utility_hpp
#define cli_Utility_hpp

#include <iostream>
#include <string>
#include <tuple>

#include <boost/format.hpp>
#include <boost/program_options.hpp>

#include "libcuvette/Logger.hpp"
#include "libcuvette/Error.hpp"
#include "libcuvette/CLIArguments.hpp"

namespace cuvette {
namespace cli {
namespace utility {

// parsing of "cuvette [OPTIONS] COMMAND [COMMAND OPTIONS] [ARGS]"
std::tuple<libcuvette::CLIArguments, libcuvette::CLIArguments> groupOptionsAndPositionalArguments(
        const libcuvette::CLIArguments& args,
        const boost::program_options::options_description& optionsDescription);
void validateNumberOfPositionalArguments(const libcuvette::CLIArguments& positionalArgs,
        const int min, const int max, const std::string& command);

// content of a file, or of stdin for "-"
std::string readInput(const std::string& fileOrDash);

// messages of the CLI subsystem; GENERAL messages are printed without prefix
void printLog(const std::string& message, libcuvette::LogLevel level,
              std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr);
void printLog(const boost::format& message, libcuvette::LogLevel level,
              std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr);

}
}
}

#endif

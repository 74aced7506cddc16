/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cli_CLI_hpp
#define cli_CLI_hpp

#include <memory>

#include <boost/program_options.hpp>

#include "libcuvette/CLIArguments.hpp"
#include "common/Config.hpp"
#include "cli/Command.hpp"


namespace cuvette {
namespace cli {

/**
 * Parses the global options ("cuvette [OPTIONS] COMMAND ...") and creates
 * the object of the requested command from the remaining arguments.
 */
class CLI {
public:
    CLI();
    std::unique_ptr<cli::Command> parseCommandLine(const libcuvette::CLIArguments&, std::shared_ptr<common::Config>) const;
    const boost::program_options::options_description& getOptionsDescription() const;

private:
    boost::program_options::variables_map parseGlobalOptions(const libcuvette::CLIArguments&) const;
    void configureLogger(const boost::program_options::variables_map&) const;

private:
    boost::program_options::options_description optionsDescription{"Options"};
};

}
}

#endif

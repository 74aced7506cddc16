/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cli_command_hpp
#define cli_command_hpp

#include <iostream>
#include <string>
#include <tuple>

#include <boost/format.hpp>
#include <boost/program_options.hpp>

#include "libcuvette/CLIArguments.hpp"
#include "libcuvette/Error.hpp"
#include "cli/Utility.hpp"

namespace cuvette {
namespace cli {

class Command {
public:
    virtual ~Command() {}
    virtual void execute() = 0;
    virtual std::string getBriefDescription() const = 0;
    virtual void printHelpMessage() const = 0;

protected:
    /**
     * Parses the arguments of a command that accepts no options.
     * Returns the positional arguments that follow the command name.
     */
    static libcuvette::CLIArguments parseArgumentsWithoutOptions(const libcuvette::CLIArguments& args,
                                                                const std::string& commandName,
                                                                const int maxPositionalArgs) {
        cli::utility::printLog(boost::format("parsing CLI arguments of %s command") % commandName,
                               libcuvette::LogLevel::DEBUG);

        boost::program_options::options_description noOptions;
        libcuvette::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, noOptions);

        if(nameAndOptionArgs.argc() > 1) {
            auto message = boost::format("Command '%s' doesn't support options\nSee 'cuvette help %s'")
                % commandName % commandName;
            cli::utility::printLog(message, libcuvette::LogLevel::GENERAL, std::cerr);
            CUVETTE_THROW_ERROR(message.str(), libcuvette::LogLevel::INFO);
        }

        cli::utility::validateNumberOfPositionalArguments(positionalArgs, 0, maxPositionalArgs, commandName);
        return positionalArgs;
    }
};

}
}

#endif

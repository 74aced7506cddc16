/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cli_CommandObjectsFactory_hpp
#define cli_CommandObjectsFactory_hpp

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "common/Config.hpp"
#include "libcuvette/CLIArguments.hpp"
#include "cli/Command.hpp"


namespace cuvette {
namespace cli {

/**
 * Registry of the CLI commands. A command object is created either without
 * arguments, to query its descriptions, or from its CLI arguments, to run it.
 */
class CommandObjectsFactory {
public:
    CommandObjectsFactory();

    bool isValidCommandName(const std::string& commandName) const;
    std::vector<std::string> getCommandNames() const;
    std::unique_ptr<cli::Command> makeCommandObject(const std::string& commandName) const;
    std::unique_ptr<cli::Command> makeCommandObject(const std::string& commandName,
                                                    const libcuvette::CLIArguments& commandArgs,
                                                    std::shared_ptr<common::Config> config) const;

private:
    struct Makers {
        std::function<std::unique_ptr<cli::Command>()> withoutArguments;
        std::function<std::unique_ptr<cli::Command>(const libcuvette::CLIArguments&,
                                                    std::shared_ptr<common::Config>)> withArguments;
    };

    template<class CommandType>
    void addCommand(const std::string& commandName) {
        auto makers = Makers{};
        makers.withoutArguments = []() {
            return std::unique_ptr<cli::Command>{new CommandType{}};
        };
        makers.withArguments = [](const libcuvette::CLIArguments& commandArgs, std::shared_ptr<common::Config> config) {
            return std::unique_ptr<cli::Command>{new CommandType{commandArgs, std::move(config)}};
        };
        commands[commandName] = std::move(makers);
    }

    const Makers& getMakers(const std::string& commandName) const;

private:
    std::map<std::string, Makers> commands; // ordered, for the listing in "cuvette help"
};

}
}

#endif

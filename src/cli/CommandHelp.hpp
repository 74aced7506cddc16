/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cli_CommandHelp_hpp
#define cli_CommandHelp_hpp

#include <iostream>
#include <memory>
#include <string>

#include "common/Config.hpp"
#include "cli/Utility.hpp"
#include "cli/Command.hpp"
#include "cli/CLI.hpp"
#include "cli/HelpMessage.hpp"
#include "cli/CommandObjectsFactory.hpp"

namespace cuvette {
namespace cli {

/**
 * "cuvette help" prints the list of commands, "cuvette help COMMAND"
 * prints the help message of COMMAND.
 */
class CommandHelp : public Command {
public:
    CommandHelp() = default;

    CommandHelp(const libcuvette::CLIArguments& args, std::shared_ptr<common::Config>) {
        auto positionalArgs = parseArgumentsWithoutOptions(args, "help", 1);
        if(!positionalArgs.empty()) {
            // throws if the name is not a command
            topic = CommandObjectsFactory{}.makeCommandObject(positionalArgs.argv()[0]);
        }
    }

    void execute() override {
        if(topic) {
            topic->printHelpMessage();
            return;
        }

        std::cout
        << "Usage: cuvette [OPTIONS] COMMAND\n"
        << "\n"
        << "Run untrusted data-analysis scripts in a resource-bounded container\n"
        << "\n"
        << cli::CLI{}.getOptionsDescription()
        << "\n"
        << "Commands:\n";

        auto factory = CommandObjectsFactory{};
        for(const auto& name : factory.getCommandNames()) {
            auto description = factory.makeCommandObject(name)->getBriefDescription();
            std::cout << "   " << name << ": " << description << "\n";
        }

        std::cout << "\nSee 'cuvette help COMMAND' for the options of a command\n";
    }

    std::string getBriefDescription() const override {
        return "Print help message about a command";
    }

    void printHelpMessage() const override {
        std::cout << cli::HelpMessage()
            .setUsage("cuvette help [COMMAND]")
            .setDescription(getBriefDescription());
    }

    // public for test purpose
    bool hasTopic() const {
        return static_cast<bool>(topic);
    }

private:
    std::unique_ptr<cli::Command> topic;
};

}
}

#endif

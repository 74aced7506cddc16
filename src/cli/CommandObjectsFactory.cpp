/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "CommandObjectsFactory.hpp"

#include <iostream>

#include <boost/format.hpp>

#include "libcuvette/Error.hpp"
#include "cli/CommandExecute.hpp"
#include "cli/CommandHelp.hpp"
#include "cli/CommandVersion.hpp"
#include "cli/Utility.hpp"


namespace cuvette {
namespace cli {

CommandObjectsFactory::CommandObjectsFactory() {
    addCommand<cli::CommandExecute>("execute");
    addCommand<cli::CommandHelp>("help");
    addCommand<cli::CommandVersion>("version");
}

bool CommandObjectsFactory::isValidCommandName(const std::string& commandName) const {
    return commands.count(commandName) > 0;
}

std::vector<std::string> CommandObjectsFactory::getCommandNames() const {
    auto names = std::vector<std::string>{};
    for(const auto& kv : commands) {
        names.push_back(kv.first);
    }
    return names;
}

std::unique_ptr<cli::Command> CommandObjectsFactory::makeCommandObject(const std::string& commandName) const {
    return getMakers(commandName).withoutArguments();
}

std::unique_ptr<cli::Command> CommandObjectsFactory::makeCommandObject(
    const std::string& commandName,
    const libcuvette::CLIArguments& commandArgs,
    std::shared_ptr<common::Config> config) const {
    return getMakers(commandName).withArguments(commandArgs, std::move(config));
}

const CommandObjectsFactory::Makers& CommandObjectsFactory::getMakers(const std::string& commandName) const {
    auto it = commands.find(commandName);
    if(it == commands.cend()) {
        auto message = boost::format("'%s' is not a Cuvette command\nSee 'cuvette help'") % commandName;
        cli::utility::printLog(message, libcuvette::LogLevel::GENERAL, std::cerr);
        CUVETTE_THROW_ERROR(message.str(), libcuvette::LogLevel::DEBUG);
    }
    return it->second;
}

}
}

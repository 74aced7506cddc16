/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "CLI.hpp"

#include <iostream>
#include <string>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>

#include "libcuvette/Error.hpp"
#include "libcuvette/Logger.hpp"
#include "cli/Utility.hpp"
#include "cli/CommandObjectsFactory.hpp"


namespace cuvette {
namespace cli {

CLI::CLI() {
    optionsDescription.add_options()
        ("help", "Print help")
        ("version", "Print version information and quit")
        ("config",
            boost::program_options::value<std::string>(),
            "Use the given configuration file instead of <prefix>/etc/cuvette.json")
        ("debug", "Enable debug mode (print all log messages with DEBUG level or higher)")
        ("verbose", "Enable verbose mode (print all log messages with INFO level or higher)");
}

std::unique_ptr<cli::Command> CLI::parseCommandLine(const libcuvette::CLIArguments& args, std::shared_ptr<common::Config> conf) const {
    libcuvette::CLIArguments nameAndOptionArgs, positionalArgs;
    std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);

    auto values = parseGlobalOptions(nameAndOptionArgs);
    configureLogger(values);

    // without --config the default configuration is loaded by the commands that need it
    if(values.count("config")) {
        auto configFile = boost::filesystem::absolute(values["config"].as<std::string>());
        cli::utility::printLog(boost::format("loading configuration %s") % configFile, libcuvette::LogLevel::DEBUG);
        conf->load(configFile, conf->getSchemaFile());
    }

    auto factory = cli::CommandObjectsFactory{};

    // --help and --version override the other arguments
    if(values.count("help")) {
        return factory.makeCommandObject("help", libcuvette::CLIArguments{}, std::move(conf));
    }
    if(values.count("version")) {
        return factory.makeCommandObject("version", libcuvette::CLIArguments{"version"}, std::move(conf));
    }

    if(positionalArgs.empty()) {
        return factory.makeCommandObject("help");
    }

    auto commandName = std::string{positionalArgs.argv()[0]};
    return factory.makeCommandObject(commandName, positionalArgs, std::move(conf));
}

const boost::program_options::options_description& CLI::getOptionsDescription() const {
    return optionsDescription;
}

boost::program_options::variables_map CLI::parseGlobalOptions(const libcuvette::CLIArguments& nameAndOptionArgs) const {
    boost::program_options::variables_map values;
    try {
        boost::program_options::store(
            boost::program_options::command_line_parser(nameAndOptionArgs.argc(), nameAndOptionArgs.argv())
                .options(optionsDescription)
                .style(boost::program_options::command_line_style::unix_style)
                .run(), values);
        boost::program_options::notify(values);
    }
    catch (const std::exception& e) {
        auto message = boost::format("%s\nSee 'cuvette help'") % e.what();
        cli::utility::printLog(message, libcuvette::LogLevel::GENERAL, std::cerr);
        CUVETTE_THROW_ERROR(message.str(), libcuvette::LogLevel::INFO);
    }
    return values;
}

void CLI::configureLogger(const boost::program_options::variables_map& values) const {
    auto level = libcuvette::LogLevel::WARN;
    if(values.count("debug")) {
        level = libcuvette::LogLevel::DEBUG;
    }
    else if(values.count("verbose")) {
        level = libcuvette::LogLevel::INFO;
    }
    libcuvette::Logger::getInstance().setLevel(level);
}

} // namespace
} // namespace

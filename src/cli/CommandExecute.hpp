/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cli_CommandExecute_hpp
#define cli_CommandExecute_hpp

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <boost/format.hpp>
#include <boost/optional.hpp>
#include <boost/program_options.hpp>

#include "common/Config.hpp"
#include "libcuvette/CLIArguments.hpp"
#include "libcuvette/Utility.hpp"
#include "cli/Command.hpp"
#include "cli/HelpMessage.hpp"
#include "cli/Utility.hpp"
#include "engine/Errors.hpp"
#include "engine/ExecutionEngine.hpp"
#include "engine/ExecutionTypes.hpp"
#include "engine/ResultSerializer.hpp"


namespace cuvette {
namespace cli {

class CommandExecute : public Command {
public:
    CommandExecute() {
        initializeOptionsDescription();
    }

    CommandExecute(const libcuvette::CLIArguments& args, std::shared_ptr<common::Config> conf)
        : conf{std::move(conf)}
    {
        initializeOptionsDescription();
        parseCommandArguments(args);
    }

    void execute() override {
        cli::utility::printLog("Executing execute command", libcuvette::LogLevel::INFO);

        if(!conf->isLoaded()) {
            conf->load(conf->getDefaultConfigFile(), conf->getSchemaFile());
        }

        engine::ExecutionEngine executionEngine{conf};
        try {
            auto result = executionEngine.execute(request);
            auto json = engine::serialization::makeResultJSON(result);
            std::cout << libcuvette::json::serializePretty(json) << std::endl;
        }
        catch(libcuvette::Error& e) {
            // the typed errors are part of the output, anything else is an internal failure
            if(engine::serialization::getErrorKind(e) != "internal") {
                auto json = engine::serialization::makeErrorJSON(e);
                std::cout << libcuvette::json::serializePretty(json) << std::endl;
            }
            CUVETTE_RETHROW_ERROR(e, "Failed to execute command 'execute'");
        }

        cli::utility::printLog("Successfully executed execute command", libcuvette::LogLevel::INFO);
    }

    std::string getBriefDescription() const override {
        return "Execute a script in a sandboxed container";
    }

    void printHelpMessage() const override {
        std::cout << cli::HelpMessage()
            .setUsage("cuvette execute (--request FILE | --code-file FILE) [OPTIONS]")
            .setDescription(getBriefDescription())
            .setOptionsDescription(optionsDescription)
            .addSection("Notes",
                "FILE can be '-' to read from stdin.\n"
                "A request is a JSON object {\"code\": ..., \"dataFiles\": {...}, \"timeoutSeconds\": ...}.\n"
                "The result is printed to stdout as a JSON object.")
            .addSection("Exit status",
                "0: success\n"
                "2: setup error\n"
                "3: the script failed\n"
                "4: timeout\n"
                "5: invalid request");
    }

    // public for test purpose
    const engine::ExecutionRequest& getRequest() const {
        return request;
    }

private:
    void initializeOptionsDescription() {
        optionsDescription.add_options()
            ("request",
                boost::program_options::value<std::string>(&requestFile),
                "Read the request (JSON) from file")
            ("code-file",
                boost::program_options::value<std::string>(&codeFile),
                "Read the code to execute from file")
            ("data-file,d",
                boost::program_options::value<std::vector<std::string>>(&dataFiles),
                "Make a data file available to the script as NAME=HANDLE, where HANDLE is"
                " the ID or description of an uploaded file (or a host path, if allowed)")
            ("timeout,t",
                boost::program_options::value<int>(),
                "Wall-clock timeout in seconds (clamped into the configured range)");
    }

    void parseCommandArguments(const libcuvette::CLIArguments& args) {
        cli::utility::printLog("parsing CLI arguments of execute command", libcuvette::LogLevel::DEBUG);

        libcuvette::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);

        // the execute command doesn't support positional arguments
        cli::utility::validateNumberOfPositionalArguments(positionalArgs, 0, 0, "execute");

        try {
            boost::program_options::variables_map values;
            boost::program_options::parsed_options parsed =
                boost::program_options::command_line_parser(nameAndOptionArgs.argc(), nameAndOptionArgs.argv())
                        .options(optionsDescription)
                        .style(boost::program_options::command_line_style::unix_style)
                        .run();
            boost::program_options::store(parsed, values);
            boost::program_options::notify(values);

            if(values.count("request") == values.count("code-file")) {
                CUVETTE_THROW_ERROR("Exactly one of the options --request and --code-file must be specified");
            }

            if(values.count("request")) {
                request = engine::serialization::parseRequest(cli::utility::readInput(requestFile));
            }
            else {
                request.code = cli::utility::readInput(codeFile);
            }

            for(const auto& dataFile : dataFiles) {
                auto kv = libcuvette::string::parseKeyValuePair(dataFile);
                request.dataFiles[kv.first] = kv.second;
            }

            if(values.count("timeout")) {
                request.timeoutSeconds = values["timeout"].as<int>();
            }
        }
        catch(engine::InvalidRequestError& e) {
            cli::utility::printLog(e.what(), libcuvette::LogLevel::GENERAL, std::cerr);
            CUVETTE_RETHROW_ERROR(e, "Failed to parse request");
        }
        catch(std::exception& e) {
            auto message = boost::format("%s\nSee 'cuvette help execute'") % e.what();
            cli::utility::printLog(message, libcuvette::LogLevel::GENERAL, std::cerr);
            CUVETTE_THROW_ERROR(message.str(), libcuvette::LogLevel::INFO);
        }

        cli::utility::printLog("successfully parsed CLI arguments", libcuvette::LogLevel::DEBUG);
    }

private:
    boost::program_options::options_description optionsDescription{"Options"};
    std::shared_ptr<common::Config> conf;
    std::string requestFile;
    std::string codeFile;
    std::vector<std::string> dataFiles;
    engine::ExecutionRequest request;
};

}
}

#endif

/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cli_CommandVersion_hpp
#define cli_CommandVersion_hpp

#include <iostream>
#include <memory>

#include <boost/format.hpp>

#include "common/Config.hpp"
#include "libcuvette/CLIArguments.hpp"
#include "cli/Command.hpp"
#include "cli/HelpMessage.hpp"
#include "cli/Utility.hpp"


namespace cuvette {
namespace cli {

class CommandVersion : public Command {
public:
    CommandVersion() = default;

    CommandVersion(const libcuvette::CLIArguments& args, std::shared_ptr<common::Config> conf)
        : conf{std::move(conf)}
    {
        parseArgumentsWithoutOptions(args, "version", 0);
    }

    void execute() override {
        auto text = boost::format("cuvette %s") % conf->buildTime.version;
        cli::utility::printLog(text, libcuvette::LogLevel::GENERAL);

        // with --config the version also reports what executions would run on
        if(conf->isLoaded()) {
            auto details = boost::format("container runtime: %s\nimage: %s")
                % conf->json["runtimePath"].GetString()
                % conf->json["image"].GetString();
            cli::utility::printLog(details, libcuvette::LogLevel::GENERAL);
        }
    }

    std::string getBriefDescription() const override {
        return "Show the Cuvette version information";
    }

    void printHelpMessage() const override {
        std::cout << cli::HelpMessage()
            .setUsage("cuvette [--config FILE] version")
            .setDescription(getBriefDescription())
            .addSection("Notes", "With --config, the container runtime and the image of the\n"
                                 "given configuration are printed as well.");
    }

private:
    std::shared_ptr<common::Config> conf;
};

}
}

#endif

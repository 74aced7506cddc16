/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <exception>
#include <iostream>
#include <memory>
#include <chrono>
#include <clocale>

#include <sys/types.h>
#include <sys/stat.h>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>

#include "common/Config.hpp"
#include "libcuvette/Error.hpp"
#include "libcuvette/Logger.hpp"
#include "libcuvette/CLIArguments.hpp"
#include "cli/CLI.hpp"
#include "engine/Errors.hpp"

using namespace cuvette;

// exit statuses of "cuvette execute", documented in its help message
static const int exitStatusSetupError = 2;
static const int exitStatusGuestExecutionError = 3;
static const int exitStatusTimeoutError = 4;
static const int exitStatusInvalidRequestError = 5;

int main(int argc, char* argv[]) {
    std::setlocale(LC_CTYPE, "C.UTF-8"); // enable handling of non-ascii characters

    // staged files and directories get explicit permissions where the guest needs them
    umask(022);

    auto& logger = libcuvette::Logger::getInstance();

    try {
        auto program_start = std::chrono::high_resolution_clock::now();

        // Initialize Config object, the configuration file is loaded by the commands that need it
        auto config = std::make_shared<common::Config>();
        config->prefixDir = boost::filesystem::canonical("/proc/self/exe").parent_path().parent_path();
        config->program_start = program_start;

        // Process command
        auto args = libcuvette::CLIArguments(argc, argv);
        auto command = cli::CLI{}.parseCommandLine(args, config);
        command->execute();
    }
    catch(const engine::SetupError& e) {
        logger.logErrorTrace(e, "main");
        return exitStatusSetupError;
    }
    catch(const engine::GuestExecutionError& e) {
        logger.logErrorTrace(e, "main");
        return exitStatusGuestExecutionError;
    }
    catch(const engine::TimeoutError& e) {
        logger.logErrorTrace(e, "main");
        return exitStatusTimeoutError;
    }
    catch(const engine::InvalidRequestError& e) {
        logger.logErrorTrace(e, "main");
        return exitStatusInvalidRequestError;
    }
    catch(const libcuvette::Error& e) {
        logger.logErrorTrace(e, "main");
        return 1;
    }
    catch(const std::exception& e) {
        auto message = boost::format("Caught exception in main function. No error trace available."
                                     " Exception message: %s") % e.what();
        logger.log(message.str(), "main", libcuvette::LogLevel::ERROR);
        return 1;
    }

    return 0;
}

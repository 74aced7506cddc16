/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cuvette_engine_ContainerExecutor_hpp
#define cuvette_engine_ContainerExecutor_hpp

#include <memory>
#include <string>

#include <boost/filesystem.hpp>

#include "common/Config.hpp"
#include "libcuvette/CLIArguments.hpp"
#include "engine/EnvironmentProvisioner.hpp"
#include "engine/ExecutionTypes.hpp"
#include "engine/RunLogger.hpp"
#include "engine/StagingContext.hpp"


namespace cuvette {
namespace engine {

struct ExecutionOutcome {
    std::string stdoutText;
    std::string stderrText;
    std::string combinedText; // stdout and stderr in order of arrival
    int exitCode;
    bool truncated;
};

/**
 * Runs the guest script in a container through the CLI client of an OCI
 * container runtime (docker or a compatible one). The engine never sees the
 * container itself: the client process is spawned in its own process group,
 * its stdout and stderr are captured through pipes and its exit status is
 * mapped to the outcome of the execution.
 */
class ContainerExecutor {
public:
    static const char* const scriptFilename;

public:
    ContainerExecutor(std::shared_ptr<const common::Config>);

    boost::filesystem::path checkAvailability() const;
    libcuvette::CLIArguments makeRunArguments(const std::string& containerName,
                                              const StagingContext&,
                                              const ResourceLimits&,
                                              const GuestEnvironment&,
                                              const GuestPaths&) const;
    ExecutionOutcome run(const libcuvette::CLIArguments& runArguments,
                         const std::string& containerName,
                         const boost::filesystem::path& containerIdFile,
                         const ResourceLimits&,
                         RunLogger&) const;

    static std::string makeContainerName();
    static boost::filesystem::path getContainerIdFile(const StagingContext&);

private:
    void killContainer(const std::string& containerName) const;
    bool isRuntimeFailure(const ExecutionOutcome&, const boost::filesystem::path& containerIdFile) const;

private:
    std::shared_ptr<const common::Config> config;
};

}
}

#endif

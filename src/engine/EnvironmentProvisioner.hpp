/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cuvette_engine_EnvironmentProvisioner_hpp
#define cuvette_engine_EnvironmentProvisioner_hpp

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>

#include "common/Config.hpp"
#include "engine/ExecutionTypes.hpp"
#include "engine/StagingContext.hpp"


namespace cuvette {
namespace engine {

// Container-side counterparts of the staging directories
struct GuestPaths {
    boost::filesystem::path scriptDir;
    boost::filesystem::path inputDir;
    boost::filesystem::path outputDir;
};

using GuestEnvironment = std::vector<std::pair<std::string, std::string>>;

class EnvironmentProvisioner {
public:
    EnvironmentProvisioner(std::shared_ptr<const common::Config>);

    StagingContext createStagingContext() const;
    ResourceLimits makeResourceLimits(const ExecutionRequest&) const;
    std::chrono::seconds clampTimeout(const boost::optional<int>& requestedSeconds) const;
    GuestEnvironment makeGuestEnvironment() const;
    GuestPaths getGuestPaths() const;

private:
    std::shared_ptr<const common::Config> config;
};

}
}

#endif

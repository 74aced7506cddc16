/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "EnvironmentProvisioner.hpp"

#include <algorithm>

#include <boost/format.hpp>

#include "libcuvette/Error.hpp"
#include "libcuvette/Utility.hpp"
#include "engine/Errors.hpp"
#include "engine/Utility.hpp"


namespace cuvette {
namespace engine {

EnvironmentProvisioner::EnvironmentProvisioner(std::shared_ptr<const common::Config> config)
    : config{std::move(config)}
{}

StagingContext EnvironmentProvisioner::createStagingContext() const {
    utility::logMessage("Creating staging directories", libcuvette::LogLevel::INFO);

    auto tempDir = boost::filesystem::path{ config->json["tempDir"].GetString() };
    if(!boost::filesystem::is_directory(tempDir)) {
        auto message = boost::format("Invalid temporary directory %s") % tempDir;
        CUVETTE_THROW_TYPED_ERROR(SetupError, message.str());
    }

    auto runRoot = boost::filesystem::path{};
    try {
        runRoot = libcuvette::filesystem::makeUniqueDirectory(tempDir / "cuvette-run");
    }
    catch(const libcuvette::Error& e) {
        auto message = boost::format("Failed to create staging directory in %s: %s") % tempDir % e.what();
        CUVETTE_THROW_TYPED_ERROR(SetupError, message.str());
    }

    // from here on the run root is owned by the context, also if the creation of a subdirectory fails
    auto context = StagingContext{runRoot};

    try {
        namespace fs = boost::filesystem;
        fs::create_directory(context.getScriptRoot());
        fs::create_directory(context.getInputRoot());
        fs::create_directory(context.getOutputRoot());

        // the run root stays private, the guest only gets the three roots as bind mounts
        fs::permissions(context.getScriptRoot(), fs::owner_all | fs::group_read | fs::group_exe | fs::others_read | fs::others_exe);
        fs::permissions(context.getInputRoot(), fs::owner_all | fs::group_read | fs::group_exe | fs::others_read | fs::others_exe);
        if(config->getFlag("runAsInvokingUser", true)) {
            fs::permissions(context.getOutputRoot(), fs::owner_all | fs::group_read | fs::group_exe | fs::others_read | fs::others_exe);
        }
        else {
            // the guest runs as the image's user, which can be anybody
            fs::permissions(context.getOutputRoot(), fs::all_all);
        }
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to create staging directories in %s: %s") % runRoot % e.what();
        CUVETTE_THROW_TYPED_ERROR(SetupError, message.str());
    }

    utility::logMessage(boost::format("Successfully created staging directories in %s") % runRoot,
                        libcuvette::LogLevel::INFO);
    return context;
}

ResourceLimits EnvironmentProvisioner::makeResourceLimits(const ExecutionRequest& request) const {
    auto limits = ResourceLimits{};
    limits.memoryBytes = static_cast<std::size_t>(config->json["memoryLimitBytes"].GetUint64());
    limits.cpus = config->json["cpuLimit"].GetDouble();
    limits.pidsLimit = config->json["pidsLimit"].GetInt();
    limits.timeout = clampTimeout(request.timeoutSeconds);
    limits.maxOutputBytes = static_cast<std::size_t>(config->json["maxOutputBytes"].GetUint64());
    limits.killGracePeriod = std::chrono::milliseconds{
        config->json.HasMember("killGracePeriodMilliseconds") ? config->json["killGracePeriodMilliseconds"].GetInt() : 0 };

    utility::logMessage(boost::format("Resource limits: memory=%d bytes, cpus=%.2f, pids=%d, timeout=%ds, output=%d bytes")
                            % limits.memoryBytes % limits.cpus % limits.pidsLimit % limits.timeout.count() % limits.maxOutputBytes,
                        libcuvette::LogLevel::DEBUG);
    return limits;
}

std::chrono::seconds EnvironmentProvisioner::clampTimeout(const boost::optional<int>& requestedSeconds) const {
    auto minSeconds = config->json["minTimeoutSeconds"].GetInt();
    auto maxSeconds = config->json["maxTimeoutSeconds"].GetInt();
    auto seconds = requestedSeconds ? *requestedSeconds : config->json["defaultTimeoutSeconds"].GetInt();

    auto clamped = std::min(std::max(seconds, minSeconds), maxSeconds);
    if(clamped != seconds) {
        utility::logMessage(boost::format("Clamped timeout of %d seconds into range [%d, %d]")
                                % seconds % minSeconds % maxSeconds,
                            libcuvette::LogLevel::INFO);
    }
    return std::chrono::seconds{clamped};
}

/**
 * The guest environment is built from scratch: the runtime client is started with
 * explicit -e options only, so host variables reach the guest only through the
 * allow list.
 */
GuestEnvironment EnvironmentProvisioner::makeGuestEnvironment() const {
    auto environment = GuestEnvironment{
        {"OUTPUT_DIR", getGuestPaths().outputDir.string()},
        {"MPLBACKEND", "Agg"},
        {"PYTHONUNBUFFERED", "1"},
        {"PYTHONIOENCODING", "utf-8"},
        {"PYTHONDONTWRITEBYTECODE", "1"}
    };

    auto allowed = std::vector<std::string>{};
    for(const auto& key : config->getStringArray("environmentAllowList")) {
        auto isAlreadySet = [&key](const std::pair<std::string, std::string>& variable) {
            return variable.first == key;
        };
        if(std::any_of(environment.cbegin(), environment.cend(), isAlreadySet)) {
            utility::logMessage(boost::format("Ignoring allow-listed variable %s: reserved by the engine") % key,
                                libcuvette::LogLevel::WARN);
            continue;
        }
        allowed.push_back(key);
    }

    auto inherited = libcuvette::environment::getVariables(allowed);
    environment.insert(environment.end(), inherited.cbegin(), inherited.cend());

    return environment;
}

GuestPaths EnvironmentProvisioner::getGuestPaths() const {
    return GuestPaths{
        config->json["containerScriptDir"].GetString(),
        config->json["containerInputDir"].GetString(),
        config->json["containerOutputDir"].GetString()
    };
}

}
}

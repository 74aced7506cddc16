/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "common/Config.hpp"

#include "libcuvette/Error.hpp"
#include "libcuvette/Utility.hpp"


namespace cuvette {
namespace common {

Config::Config(const boost::filesystem::path& cuvetteInstallationPrefixDir)
    : prefixDir{cuvetteInstallationPrefixDir}
{
    load(getDefaultConfigFile(), getSchemaFile());
}

Config::Config(const boost::filesystem::path& configFilename,
               const boost::filesystem::path& configSchemaFilename)
    : json{ libcuvette::json::readAndValidate(configFilename, configSchemaFilename) }
{}

void Config::load(const boost::filesystem::path& configFilename,
                  const boost::filesystem::path& configSchemaFilename) {
    libcuvette::logMessage(boost::format("Loading configuration %s (schema %s)") % configFilename % configSchemaFilename,
                           libcuvette::LogLevel::DEBUG);
    try {
        json = libcuvette::json::readAndValidate(configFilename, configSchemaFilename);
    }
    catch(libcuvette::Error& e) {
        auto message = boost::format("Failed to load configuration file %s") % configFilename;
        CUVETTE_RETHROW_ERROR(e, message.str());
    }
}

bool Config::isLoaded() const {
    return json.IsObject() && json.MemberCount() > 0;
}

boost::filesystem::path Config::getDefaultConfigFile() const {
    return prefixDir / "etc/cuvette.json";
}

boost::filesystem::path Config::getSchemaFile() const {
    return prefixDir / "etc/cuvette.schema.json";
}

boost::optional<boost::filesystem::path> Config::getUploadsDirectory() const {
    if(!json.HasMember("uploadsDir")) {
        return {};
    }
    return boost::filesystem::path{ json["uploadsDir"].GetString() };
}

bool Config::getFlag(const char* key, bool defaultValue) const {
    if(!json.HasMember(key)) {
        return defaultValue;
    }
    return json[key].GetBool();
}

std::vector<std::string> Config::getStringArray(const char* key) const {
    auto values = std::vector<std::string>{};
    if(!json.HasMember(key)) {
        return values;
    }
    for(const auto& value : json[key].GetArray()) {
        values.push_back(value.GetString());
    }
    return values;
}

std::vector<int> Config::getRuntimeSetupExitCodes() const {
    // docker, podman and nerdctl all use 125 for "the runtime itself failed"
    if(!json.HasMember("runtimeSetupExitCodes")) {
        return {125};
    }
    auto codes = std::vector<int>{};
    for(const auto& value : json["runtimeSetupExitCodes"].GetArray()) {
        codes.push_back(value.GetInt());
    }
    return codes;
}

}} // namespaces

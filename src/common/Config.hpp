/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cuvette_common_Config_hpp
#define cuvette_common_Config_hpp

#include <string>
#include <vector>
#include <chrono>

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>
#include <rapidjson/document.h>


namespace cuvette {
namespace common {

class Config {
    public:
        Config() = default;
        Config(const boost::filesystem::path& configFilename,
               const boost::filesystem::path& configSchemaFilename);
        Config(const boost::filesystem::path& cuvetteInstallationPrefixDir);

        struct BuildTime {
            std::string version = CUVETTE_VERSION;
        };

        void load(const boost::filesystem::path& configFilename,
                  const boost::filesystem::path& configSchemaFilename);
        bool isLoaded() const;

        boost::filesystem::path getDefaultConfigFile() const;
        boost::filesystem::path getSchemaFile() const;
        boost::optional<boost::filesystem::path> getUploadsDirectory() const;
        bool getFlag(const char* key, bool defaultValue) const;
        std::vector<std::string> getStringArray(const char* key) const;
        std::vector<int> getRuntimeSetupExitCodes() const;

        BuildTime buildTime;
        boost::filesystem::path prefixDir;
        rapidjson::Document json{ rapidjson::kObjectType };

        std::chrono::high_resolution_clock::time_point program_start; // for time measurement
};

}
}

#endif

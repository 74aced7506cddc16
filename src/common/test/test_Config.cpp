/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <boost/filesystem.hpp>

#include "libcuvette/Error.hpp"
#include "libcuvette/Utility.hpp"
#include "common/Config.hpp"
#include "test_utility/config.hpp"
#include "test_utility/unittest_main_function.hpp"

using namespace cuvette;

TEST_GROUP(ConfigTestGroup) {
};

TEST(ConfigTestGroup, loadDefaultConfiguration) {
    auto configRAII = test_utility::config::makeConfig();
    auto prefixDir = configRAII.getPrefixDir();

    common::Config config{prefixDir};

    CHECK(config.isLoaded());
    CHECK_EQUAL(config.getDefaultConfigFile().string(), (prefixDir / "etc/cuvette.json").string());
    CHECK_EQUAL(config.getSchemaFile().string(), (prefixDir / "etc/cuvette.schema.json").string());
    CHECK_EQUAL(config.json["runtimePath"].GetString(), std::string{"docker"});
    CHECK_EQUAL(config.json["defaultTimeoutSeconds"].GetInt(), 30);
    CHECK_EQUAL(config.getUploadsDirectory()->string(), std::string{"/var/lib/cuvette/uploads"});
    CHECK(config.getFlag("checkImageAvailability", false));
    CHECK_FALSE(config.getFlag("allowHostPaths", true));

    auto allowList = config.getStringArray("environmentAllowList");
    CHECK_EQUAL(allowList.size(), static_cast<std::size_t>(2));
    CHECK_EQUAL(allowList[0], std::string{"TZ"});
    CHECK_EQUAL(allowList[1], std::string{"LANG"});
    CHECK(config.getStringArray("forbiddenCodePatterns").empty());

    auto exitCodes = config.getRuntimeSetupExitCodes();
    CHECK_EQUAL(exitCodes.size(), static_cast<std::size_t>(1));
    CHECK_EQUAL(exitCodes[0], 125);
}

TEST(ConfigTestGroup, defaultsOfOptionalEntries) {
    auto configRAII = test_utility::config::makeConfig();
    auto& json = configRAII.config->json;
    json.RemoveMember("uploadsDir");
    json.RemoveMember("runAsInvokingUser");
    json.RemoveMember("environmentAllowList");
    json.RemoveMember("runtimeSetupExitCodes");

    CHECK_FALSE(configRAII.config->getUploadsDirectory());
    CHECK(configRAII.config->getFlag("runAsInvokingUser", true));
    CHECK_FALSE(configRAII.config->getFlag("runAsInvokingUser", false));
    CHECK(configRAII.config->getStringArray("environmentAllowList").empty());

    auto exitCodes = configRAII.config->getRuntimeSetupExitCodes();
    CHECK_EQUAL(exitCodes.size(), static_cast<std::size_t>(1));
    CHECK_EQUAL(exitCodes[0], 125);
}

TEST(ConfigTestGroup, notLoaded) {
    common::Config config;
    CHECK_FALSE(config.isLoaded());
}

TEST(ConfigTestGroup, invalidConfiguration) {
    auto configRAII = test_utility::config::makeConfig();
    auto prefixDir = configRAII.getPrefixDir();
    auto configFile = prefixDir / "etc/cuvette.json";
    auto schemaFile = prefixDir / "etc/cuvette.schema.json";

    common::Config config;

    // out of range value
    auto json = libcuvette::json::read(configFile);
    json["pidsLimit"].SetInt(0);
    libcuvette::json::write(json, configFile);
    CHECK_THROWS(libcuvette::Error, config.load(configFile, schemaFile));

    // unknown entry
    json = libcuvette::json::read(prefixDir / "etc/cuvette.json");
    json["pidsLimit"].SetInt(128);
    json.AddMember("unknownEntry", true, json.GetAllocator());
    libcuvette::json::write(json, configFile);
    CHECK_THROWS(libcuvette::Error, config.load(configFile, schemaFile));

    // relative directory
    json.RemoveMember("unknownEntry");
    json["tempDir"].SetString("tmp", json.GetAllocator());
    libcuvette::json::write(json, configFile);
    CHECK_THROWS(libcuvette::Error, config.load(configFile, schemaFile));

    // missing file
    CHECK_THROWS(libcuvette::Error, config.load(prefixDir / "etc/missing.json", schemaFile));
    CHECK_FALSE(config.isLoaded());

    // valid again
    json["tempDir"].SetString("/tmp", json.GetAllocator());
    libcuvette::json::write(json, configFile);
    config.load(configFile, schemaFile);
    CHECK(config.isLoaded());
}

CUVETTE_UNITTEST_MAIN_FUNCTION();

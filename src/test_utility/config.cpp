/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "config.hpp"

#include "libcuvette/Utility.hpp"

namespace rj = rapidjson;
using namespace cuvette;

namespace test_utility {
namespace config {

void ConfigRAII::setRuntimePath(const boost::filesystem::path& path) {
    config->json["runtimePath"].SetString(path.c_str(), config->json.GetAllocator());
}

static void addString(rj::Document& document, const char* key, const std::string& value) {
    auto& allocator = document.GetAllocator();
    document.AddMember(rj::StringRef(key), rj::Value{value.c_str(), allocator}, allocator);
}

static void populateJSON(rj::Document& document, const boost::filesystem::path& prefixDir) {
    auto& allocator = document.GetAllocator();

    addString(document, "runtimePath", (prefixDir / "bin/runtime").string());
    addString(document, "image", "cuvette/test-image:latest");
    addString(document, "interpreter", "python3");
    document.AddMember("checkImageAvailability", true, allocator);
    addString(document, "tempDir", (prefixDir / "tmp").string());
    addString(document, "logsDir", (prefixDir / "logs").string());
    addString(document, "uploadsDir", (prefixDir / "uploads").string());
    addString(document, "containerScriptDir", "/sandbox/script");
    addString(document, "containerInputDir", "/sandbox/input");
    addString(document, "containerOutputDir", "/sandbox/output");
    document.AddMember("memoryLimitBytes", rj::Value{uint64_t{268435456}}, allocator);
    document.AddMember("cpuLimit", 1.0, allocator);
    document.AddMember("pidsLimit", 128, allocator);
    document.AddMember("minTimeoutSeconds", 1, allocator);
    document.AddMember("maxTimeoutSeconds", 60, allocator);
    document.AddMember("defaultTimeoutSeconds", 30, allocator);
    document.AddMember("maxCodeBytes", rj::Value{uint64_t{1048576}}, allocator);
    document.AddMember("maxOutputBytes", rj::Value{uint64_t{1048576}}, allocator);
    document.AddMember("killGracePeriodMilliseconds", 0, allocator);
    document.AddMember("runAsInvokingUser", true, allocator);
    document.AddMember("allowHostPaths", true, allocator);
    document.AddMember("persistCreatedFiles", false, allocator);
    document.AddMember("environmentAllowList", rj::Value{rj::kArrayType}, allocator);
    document.AddMember("forbiddenCodePatterns", rj::Value{rj::kArrayType}, allocator);
    auto setupExitCodes = rj::Value{rj::kArrayType};
    setupExitCodes.PushBack(125, allocator);
    document.AddMember("runtimeSetupExitCodes", setupExitCodes, allocator);
    auto errorPrefixes = rj::Value{rj::kArrayType};
    errorPrefixes.PushBack(rj::StringRef("docker: "), allocator);
    document.AddMember("runtimeErrorPrefixes", errorPrefixes, allocator);
}

ConfigRAII makeConfig() {
    auto raii = ConfigRAII{};
    raii.prefixDir = libcuvette::PathRAII{
        libcuvette::filesystem::makeUniqueDirectory("/tmp/cuvette-test-prefix-dir")};
    auto prefixDir = raii.getPrefixDir();

    raii.config = std::make_shared<common::Config>();
    raii.config->prefixDir = prefixDir;
    populateJSON(raii.config->json, prefixDir);

    libcuvette::filesystem::createFoldersIfNecessary(prefixDir / "bin");
    libcuvette::filesystem::createFoldersIfNecessary(prefixDir / "tmp");

    // JSON schema and default configuration
    auto repoRootDir = boost::filesystem::path{__FILE__}.parent_path().parent_path().parent_path();
    libcuvette::filesystem::copyFile(repoRootDir / "etc/cuvette.schema.json", prefixDir / "etc/cuvette.schema.json");
    libcuvette::filesystem::copyFile(repoRootDir / "etc/cuvette.json", prefixDir / "etc/cuvette.json");

    return raii;
}

}
}

/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <rapidjson/document.h>

#include "test_utility/config.hpp"
#include "engine/Errors.hpp"
#include "engine/RequestValidator.hpp"
#include "test_utility/unittest_main_function.hpp"

namespace rj = rapidjson;
using namespace cuvette;

TEST_GROUP(RequestValidatorTestGroup) {
};

static engine::ExecutionRequest makeRequest(const std::string& code) {
    auto request = engine::ExecutionRequest{};
    request.code = code;
    return request;
}

TEST(RequestValidatorTestGroup, acceptsValidRequest) {
    auto configRAII = test_utility::config::makeConfig();
    auto validator = engine::RequestValidator{configRAII.config};

    auto request = makeRequest("print(2 + 2)");
    request.dataFiles = {{"patients", "patients.csv"}};
    request.timeoutSeconds = 10;
    validator.validate(request);
}

TEST(RequestValidatorTestGroup, rejectsEmptyCode) {
    auto configRAII = test_utility::config::makeConfig();
    auto validator = engine::RequestValidator{configRAII.config};

    CHECK_THROWS(engine::InvalidRequestError, validator.validate(makeRequest("")));
    CHECK_THROWS(engine::InvalidRequestError, validator.validate(makeRequest("  \n\t ")));
}

TEST(RequestValidatorTestGroup, rejectsOversizedCode) {
    auto configRAII = test_utility::config::makeConfig();
    configRAII.config->json["maxCodeBytes"].SetUint64(16);
    auto validator = engine::RequestValidator{configRAII.config};

    validator.validate(makeRequest(std::string(16, 'x')));
    CHECK_THROWS(engine::InvalidRequestError, validator.validate(makeRequest(std::string(17, 'x'))));
}

TEST(RequestValidatorTestGroup, rejectsInvalidDataFiles) {
    auto configRAII = test_utility::config::makeConfig();
    auto validator = engine::RequestValidator{configRAII.config};

    auto request = makeRequest("print(1)");
    request.dataFiles = {{"", "patients.csv"}};
    CHECK_THROWS(engine::InvalidRequestError, validator.validate(request));

    request.dataFiles = {{"patients", " "}};
    CHECK_THROWS(engine::InvalidRequestError, validator.validate(request));
}

TEST(RequestValidatorTestGroup, forbiddenCodePatterns) {
    auto configRAII = test_utility::config::makeConfig();
    auto& json = configRAII.config->json;
    json["forbiddenCodePatterns"].PushBack(rj::Value{R"(\bsubprocess\b)"}, json.GetAllocator());
    auto validator = engine::RequestValidator{configRAII.config};

    validator.validate(makeRequest("import os"));
    CHECK_THROWS(engine::InvalidRequestError, validator.validate(makeRequest("import subprocess")));

    // the error carries the user-facing log level
    try {
        validator.validate(makeRequest("import subprocess"));
        FAIL("expected exception");
    }
    catch(const engine::InvalidRequestError& e) {
        CHECK(e.getLogLevel() == libcuvette::LogLevel::INFO);
        CHECK(std::string{e.what()}.find("forbidden") != std::string::npos);
    }
}

TEST(RequestValidatorTestGroup, invalidForbiddenCodePatternIsSetupError) {
    auto configRAII = test_utility::config::makeConfig();
    auto& json = configRAII.config->json;
    json["forbiddenCodePatterns"].PushBack(rj::Value{"(unbalanced"}, json.GetAllocator());

    CHECK_THROWS(engine::SetupError, engine::RequestValidator{configRAII.config});
}

CUVETTE_UNITTEST_MAIN_FUNCTION();

/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cuvette_engine_ResultSerializer_hpp
#define cuvette_engine_ResultSerializer_hpp

#include <string>

#include <rapidjson/document.h>

#include "libcuvette/Error.hpp"
#include "engine/ExecutionTypes.hpp"


namespace cuvette {
namespace engine {

/**
 * JSON representation of requests, results and errors as exchanged with the
 * callers of the engine.
 */
namespace serialization {

rapidjson::Document makeResultJSON(const ExecutionResult&);
rapidjson::Document makeErrorJSON(const libcuvette::Error&);
std::string getErrorKind(const libcuvette::Error&);

ExecutionRequest parseRequest(const rapidjson::Value&);
ExecutionRequest parseRequest(const std::string&);

}

}
}

#endif

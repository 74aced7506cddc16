/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libcuvette_utility_json_hpp
#define libcuvette_utility_json_hpp

#include <string>

#include <boost/filesystem.hpp>
#include <rapidjson/document.h>

/**
 * Utility functions for JSON operations
 */

namespace libcuvette {
namespace json {

rapidjson::Document parse(const std::string& string);
rapidjson::Document read(const boost::filesystem::path& filename);

// Schemas may only use references internal to the schema file ("#/definitions/...")
rapidjson::Document readAndValidate(const boost::filesystem::path& jsonFile,
                                    const boost::filesystem::path& schemaFile);

void write(const rapidjson::Value& json, const boost::filesystem::path& filename);
std::string serialize(const rapidjson::Value& json);
std::string serializePretty(const rapidjson::Value& json);

}}

#endif

/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "json.hpp"

#include <fstream>
#include <iterator>

#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/error/en.h>
#include <rapidjson/schema.h>
#include <rapidjson/writer.h>

#include "libcuvette/Error.hpp"
#include "libcuvette/Logger.hpp"
#include "libcuvette/utility/filesystem.hpp"

namespace rj = rapidjson;

namespace libcuvette {
namespace json {

static std::string makeParseErrorMessage(const std::string& source, const rj::Document& json) {
    auto message = boost::format("Error parsing JSON %s. Input data is not valid JSON\nError(offset %u): %s")
        % source
        % static_cast<unsigned>(json.GetErrorOffset())
        % rj::GetParseError_En(json.GetParseError());
    return message.str();
}

static std::string makeValidationErrorMessage(const boost::filesystem::path& jsonFile, const rj::SchemaValidator& validator) {
    rj::StringBuffer schemaPointer;
    validator.GetInvalidSchemaPointer().StringifyUriFragment(schemaPointer);
    rj::StringBuffer documentPointer;
    validator.GetInvalidDocumentPointer().StringifyUriFragment(documentPointer);
    rj::StringBuffer report;
    rj::PrettyWriter<rj::StringBuffer> writer(report);
    validator.GetError().Accept(writer);

    auto message = boost::format("JSON file %s doesn't conform to its schema\n"
                                 "Invalid schema: %s\n"
                                 "Invalid keyword: %s\n"
                                 "Invalid document: %s\n"
                                 "Error report:\n%s")
        % jsonFile
        % schemaPointer.GetString()
        % validator.GetInvalidSchemaKeyword()
        % documentPointer.GetString()
        % report.GetString();
    return message.str();
}

rj::Document parse(const std::string& string) {
    auto json = rj::Document{};
    json.Parse(string.c_str(), string.size());
    if (json.HasParseError()) {
        auto source = boost::format("string '%s'") % string;
        CUVETTE_THROW_ERROR(makeParseErrorMessage(source.str(), json));
    }
    return json;
}

rj::Document read(const boost::filesystem::path& filename) {
    std::ifstream ifs(filename.string(), std::ios::binary);
    if (!ifs) {
        auto message = boost::format("Error opening JSON file %s") % filename;
        CUVETTE_THROW_ERROR(message.str());
    }
    auto content = std::string{std::istreambuf_iterator<char>{ifs}, std::istreambuf_iterator<char>{}};
    if (ifs.bad()) {
        auto message = boost::format("Error reading JSON file %s") % filename;
        CUVETTE_THROW_ERROR(message.str());
    }

    auto json = rj::Document{};
    json.Parse(content.c_str(), content.size());
    if (json.HasParseError()) {
        auto source = boost::format("file %s") % filename;
        CUVETTE_THROW_ERROR(makeParseErrorMessage(source.str(), json));
    }
    return json;
}

rj::Document readAndValidate(const boost::filesystem::path& jsonFile, const boost::filesystem::path& schemaFile) {
    logMessage(boost::format("Validating JSON file %s against schema %s") % jsonFile % schemaFile, LogLevel::DEBUG);

    auto schemaJSON = rj::Document{};
    try {
        schemaJSON = read(schemaFile);
    }
    catch(const libcuvette::Error& e) {
        auto message = boost::format("Failed to read JSON schema %s") % schemaFile;
        CUVETTE_RETHROW_ERROR(e, message.str());
    }
    rj::SchemaDocument schema{schemaJSON};

    auto json = read(jsonFile);
    rj::SchemaValidator validator{schema};
    if (!json.Accept(validator)) {
        CUVETTE_THROW_ERROR(makeValidationErrorMessage(jsonFile, validator));
    }
    return json;
}

void write(const rj::Value& json, const boost::filesystem::path& filename) {
    try {
        filesystem::createFoldersIfNecessary(filename.parent_path());
        std::ofstream ofs(filename.string());
        if(!ofs) {
            auto message = boost::format("Failed to open std::ofstream for %s") % filename;
            CUVETTE_THROW_ERROR(message.str());
        }
        rj::OStreamWrapper osw(ofs);
        rj::PrettyWriter<rj::OStreamWrapper> writer(osw);
        writer.SetIndent(' ', 2);
        json.Accept(writer);
        ofs << "\n";
        if(!ofs) {
            auto message = boost::format("Failed to write to %s") % filename;
            CUVETTE_THROW_ERROR(message.str());
        }
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to write JSON to %s") % filename;
        CUVETTE_RETHROW_ERROR(e, message.str());
    }
}

std::string serialize(const rj::Value& json) {
    rj::StringBuffer buffer;
    rj::Writer<rj::StringBuffer> writer(buffer);
    json.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

std::string serializePretty(const rj::Value& json) {
    rj::StringBuffer buffer;
    rj::PrettyWriter<rj::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    json.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

}}

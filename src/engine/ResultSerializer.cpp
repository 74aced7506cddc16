/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "ResultSerializer.hpp"

#include <cstdint>

#include <boost/format.hpp>

#include "libcuvette/Utility.hpp"
#include "engine/Errors.hpp"

namespace rj = rapidjson;


namespace cuvette {
namespace engine {
namespace serialization {

static rj::Value makeString(const std::string& s, rj::Document::AllocatorType& allocator) {
    return rj::Value{s.c_str(), static_cast<rj::SizeType>(s.size()), allocator};
}

static void addDimensions(rj::Value& object,
                          const boost::optional<unsigned>& width,
                          const boost::optional<unsigned>& height,
                          rj::Document::AllocatorType& allocator) {
    if(width) {
        object.AddMember("width", rj::Value{*width}, allocator);
    }
    if(height) {
        object.AddMember("height", rj::Value{*height}, allocator);
    }
}

rj::Document makeResultJSON(const ExecutionResult& result) {
    auto json = rj::Document{rj::kObjectType};
    auto& allocator = json.GetAllocator();

    json.AddMember("output", makeString(result.output, allocator), allocator);
    json.AddMember("stdout", makeString(result.stdoutText, allocator), allocator);
    json.AddMember("stderr", makeString(result.stderrText, allocator), allocator);
    json.AddMember("code", makeString(result.executedCode, allocator), allocator);
    json.AddMember("resultKind",
                   rj::Value{result.kind == ResultKind::BINARY_ARTIFACT ? "binary-artifact" : "text", allocator},
                   allocator);

    if(result.binaryOutput) {
        const auto& binary = *result.binaryOutput;
        auto value = rj::Value{rj::kObjectType};
        value.AddMember("data", makeString(binary.base64Data, allocator), allocator);
        value.AddMember("mimeType", makeString(binary.mimeType, allocator), allocator);
        value.AddMember("filename", makeString(binary.filename, allocator), allocator);
        value.AddMember("sizeBytes", rj::Value{static_cast<uint64_t>(binary.sizeBytes)}, allocator);
        addDimensions(value, binary.width, binary.height, allocator);
        value.AddMember("sourceCode", makeString(binary.sourceCode, allocator), allocator);
        json.AddMember("binaryOutput", value, allocator);
    }

    auto createdFiles = rj::Value{rj::kArrayType};
    for(const auto& file : result.createdFiles) {
        auto value = rj::Value{rj::kObjectType};
        value.AddMember("filename", makeString(file.filename, allocator), allocator);
        value.AddMember("sizeBytes", rj::Value{static_cast<uint64_t>(file.sizeBytes)}, allocator);
        value.AddMember("kind", makeString(contentKindToString(file.kind), allocator), allocator);
        value.AddMember("mimeType", makeString(file.mimeType, allocator), allocator);
        if(file.base64Data) {
            value.AddMember("data", makeString(*file.base64Data, allocator), allocator);
        }
        addDimensions(value, file.width, file.height, allocator);
        if(file.fileId) {
            value.AddMember("fileId", makeString(*file.fileId, allocator), allocator);
        }
        createdFiles.PushBack(value, allocator);
    }
    json.AddMember("createdFiles", createdFiles, allocator);

    json.AddMember("exitCode", rj::Value{result.exitCode}, allocator);
    json.AddMember("elapsedSeconds", rj::Value{result.elapsedSeconds}, allocator);
    return json;
}

std::string getErrorKind(const libcuvette::Error& error) {
    if(dynamic_cast<const SetupError*>(&error)) {
        return "setup";
    }
    else if(dynamic_cast<const GuestExecutionError*>(&error)) {
        return "guest-execution";
    }
    else if(dynamic_cast<const TimeoutError*>(&error)) {
        return "timeout";
    }
    else if(dynamic_cast<const InvalidRequestError*>(&error)) {
        return "invalid-request";
    }
    else if(dynamic_cast<const ReconciliationError*>(&error)) {
        return "reconciliation";
    }
    return "internal";
}

rj::Document makeErrorJSON(const libcuvette::Error& error) {
    auto json = rj::Document{rj::kObjectType};
    auto& allocator = json.GetAllocator();

    auto value = rj::Value{rj::kObjectType};
    value.AddMember("kind", makeString(getErrorKind(error), allocator), allocator);
    value.AddMember("message", makeString(error.what(), allocator), allocator);

    if(const auto* guestError = dynamic_cast<const GuestExecutionError*>(&error)) {
        value.AddMember("stdout", makeString(guestError->getStdout(), allocator), allocator);
        value.AddMember("stderr", makeString(guestError->getStderr(), allocator), allocator);
        value.AddMember("exitCode", rj::Value{guestError->getExitCode()}, allocator);
    }
    else if(const auto* timeoutError = dynamic_cast<const TimeoutError*>(&error)) {
        value.AddMember("stdout", makeString(timeoutError->getStdout(), allocator), allocator);
        value.AddMember("stderr", makeString(timeoutError->getStderr(), allocator), allocator);
        value.AddMember("timeoutSeconds", rj::Value{static_cast<int64_t>(timeoutError->getTimeout().count())}, allocator);
    }

    json.AddMember("error", value, allocator);
    return json;
}

ExecutionRequest parseRequest(const rj::Value& json) {
    if(!json.IsObject()) {
        CUVETTE_THROW_TYPED_ERROR(InvalidRequestError, "Invalid request: expected a JSON object");
    }

    auto request = ExecutionRequest{};

    if(!json.HasMember("code") || !json["code"].IsString()) {
        CUVETTE_THROW_TYPED_ERROR(InvalidRequestError, "Invalid request: 'code' must be a string");
    }
    request.code = std::string(json["code"].GetString(), json["code"].GetStringLength());

    if(json.HasMember("dataFiles") && !json["dataFiles"].IsNull()) {
        const auto& dataFiles = json["dataFiles"];
        if(!dataFiles.IsObject()) {
            CUVETTE_THROW_TYPED_ERROR(InvalidRequestError, "Invalid request: 'dataFiles' must be an object");
        }
        for(const auto& member : dataFiles.GetObject()) {
            if(!member.value.IsString()) {
                auto message = boost::format("Invalid request: handle of data file '%s' must be a string")
                    % member.name.GetString();
                CUVETTE_THROW_TYPED_ERROR(InvalidRequestError, message.str());
            }
            request.dataFiles[member.name.GetString()] = member.value.GetString();
        }
    }

    const char* timeoutKey = json.HasMember("timeoutSeconds") ? "timeoutSeconds" : "timeout";
    if(json.HasMember(timeoutKey) && !json[timeoutKey].IsNull()) {
        const auto& timeout = json[timeoutKey];
        if(timeout.IsInt()) {
            request.timeoutSeconds = timeout.GetInt();
        }
        else if(timeout.IsNumber()) {
            auto seconds = timeout.GetDouble();
            if(seconds < 0 || seconds > 1e9) {
                auto message = boost::format("Invalid request: '%s' is out of range") % timeoutKey;
                CUVETTE_THROW_TYPED_ERROR(InvalidRequestError, message.str());
            }
            request.timeoutSeconds = static_cast<int>(seconds);
        }
        else {
            auto message = boost::format("Invalid request: '%s' must be a number") % timeoutKey;
            CUVETTE_THROW_TYPED_ERROR(InvalidRequestError, message.str());
        }
    }

    return request;
}

ExecutionRequest parseRequest(const std::string& text) {
    auto json = rj::Document{};
    json.Parse(text.c_str(), text.size());
    if(json.HasParseError()) {
        auto message = boost::format("Invalid request: malformed JSON (error %d at offset %d)")
            % json.GetParseError() % json.GetErrorOffset();
        CUVETTE_THROW_TYPED_ERROR(InvalidRequestError, message.str());
    }
    return parseRequest(json);
}

}
}
}

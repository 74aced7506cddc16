/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "ArtifactStore.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>

#include <boost/format.hpp>
#include <boost/regex.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <rapidjson/document.h>

#include "libcuvette/Error.hpp"
#include "libcuvette/Utility.hpp"
#include "engine/Utility.hpp"

namespace rj = rapidjson;


namespace cuvette {
namespace engine {

static boost::optional<std::string> getOptionalString(const rj::Value& object, const char* key) {
    if(!object.HasMember(key) || !object[key].IsString()) {
        return {};
    }
    return std::string{ object[key].GetString() };
}

static std::string getFormatFromMimeType(const std::string& mimeType) {
    auto slash = mimeType.find('/');
    if(slash == std::string::npos) {
        return mimeType;
    }
    return mimeType.substr(slash + 1);
}

ArtifactStore::ArtifactStore(const boost::filesystem::path& uploadsDir)
    : uploadsDir{uploadsDir}
{}

const boost::filesystem::path& ArtifactStore::getUploadsDirectory() const {
    return uploadsDir;
}

bool ArtifactStore::isFileId(const std::string& handle) {
    static const auto uuidRegex = boost::regex{
        "^[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}$"};
    return boost::regex_match(handle, uuidRegex);
}

/**
 * Resolves a handle to a stored file: first as a file id, then as the description
 * of one of the stored files. Returns none when neither matches.
 */
boost::optional<StoredArtifact> ArtifactStore::resolve(const std::string& handle) const {
    if(isFileId(handle)) {
        auto artifact = resolveFileId(handle);
        if(artifact) {
            return artifact;
        }
    }
    return resolveDescription(handle);
}

boost::optional<StoredArtifact> ArtifactStore::resolveFileId(const std::string& fileId) const {
    auto file = uploadsDir / fileId;
    if(!boost::filesystem::is_regular_file(file)) {
        utility::logMessage(boost::format("No stored file with id %s in %s") % fileId % uploadsDir,
                            libcuvette::LogLevel::DEBUG);
        return {};
    }

    auto artifact = StoredArtifact{fileId, file, ArtifactMetadata{}};
    auto metadata = readMetadata(getMetadataDirectory() / (fileId + ".json"));
    if(metadata) {
        artifact.metadata = *metadata;
    }
    return artifact;
}

boost::optional<StoredArtifact> ArtifactStore::resolveDescription(const std::string& description) const {
    auto metadataDir = getMetadataDirectory();
    if(!boost::filesystem::is_directory(metadataDir)) {
        return {};
    }

    // sorted, so that the same handle resolves to the same file when several descriptions match
    auto metadataFiles = std::vector<boost::filesystem::path>{};
    for(boost::filesystem::directory_iterator entry{metadataDir};
        entry != boost::filesystem::directory_iterator{};
        ++entry) {
        if(entry->path().extension() == ".json") {
            metadataFiles.push_back(entry->path());
        }
    }
    std::sort(metadataFiles.begin(), metadataFiles.end());

    for(const auto& metadataFile : metadataFiles) {
        auto metadata = readMetadata(metadataFile);
        if(!metadata || !metadata->description || *metadata->description != description) {
            continue;
        }
        auto fileId = metadataFile.stem().string();
        auto file = uploadsDir / fileId;
        if(!boost::filesystem::is_regular_file(file)) {
            utility::logMessage(boost::format("Ignoring metadata %s: file %s doesn't exist") % metadataFile % file,
                                libcuvette::LogLevel::WARN);
            continue;
        }
        return StoredArtifact{fileId, file, *metadata};
    }

    return {};
}

boost::optional<ArtifactMetadata> ArtifactStore::readMetadata(const boost::filesystem::path& metadataFile) const {
    if(!boost::filesystem::exists(metadataFile)) {
        return {};
    }

    auto json = rj::Document{};
    try {
        json = libcuvette::json::read(metadataFile);
    }
    catch(const libcuvette::Error& e) {
        utility::logMessage(boost::format("Skipping invalid metadata file %s: %s") % metadataFile % e.what(),
                            libcuvette::LogLevel::WARN);
        return {};
    }
    if(!json.IsObject()) {
        utility::logMessage(boost::format("Skipping invalid metadata file %s: not a JSON object") % metadataFile,
                            libcuvette::LogLevel::WARN);
        return {};
    }

    auto metadata = ArtifactMetadata{};
    metadata.description = getOptionalString(json, "description");
    metadata.originalFilename = getOptionalString(json, "originalFilename");
    if(json.HasMember("schema") && json["schema"].IsObject()) {
        metadata.format = getOptionalString(json["schema"], "format");
    }
    return metadata;
}

/**
 * Copies the file into the store under a fresh id and writes its metadata.
 * Returns the id.
 */
std::string ArtifactStore::store(const boost::filesystem::path& file,
                                 const std::string& originalFilename,
                                 const std::string& mimeType,
                                 const std::string& sourceCode) const {
    auto fileId = boost::uuids::to_string(boost::uuids::random_generator{}());
    auto destination = uploadsDir / fileId;

    utility::logMessage(boost::format("Storing %s as %s") % file % fileId, libcuvette::LogLevel::INFO);

    try {
        libcuvette::filesystem::copyFile(file, destination);
        boost::filesystem::permissions(destination, boost::filesystem::owner_read | boost::filesystem::owner_write
                                                    | boost::filesystem::group_read | boost::filesystem::others_read);

        auto json = rj::Document{rj::kObjectType};
        auto& allocator = json.GetAllocator();

        auto description = boost::format("Generated file: %s") % originalFilename;
        json.AddMember("description", rj::Value{description.str().c_str(), allocator}, allocator);
        auto schema = rj::Value{rj::kObjectType};
        schema.AddMember("type", rj::Value{"file"}, allocator);
        schema.AddMember("format", rj::Value{getFormatFromMimeType(mimeType).c_str(), allocator}, allocator);
        auto encoding = mimeType.compare(0, 5, "text/") == 0 ? "utf-8" : "binary";
        schema.AddMember("encoding", rj::Value{encoding, allocator}, allocator);
        json.AddMember("schema", schema, allocator);
        auto tags = rj::Value{rj::kArrayType};
        tags.PushBack(rj::Value{"generated"}, allocator);
        tags.PushBack(rj::Value{"cuvette"}, allocator);
        json.AddMember("tags", tags, allocator);
        json.AddMember("originalFilename", rj::Value{originalFilename.c_str(), allocator}, allocator);
        json.AddMember("mimeType", rj::Value{mimeType.c_str(), allocator}, allocator);
        json.AddMember("generatedBy", rj::Value{"cuvette"}, allocator);
        auto generatedAt = utility::makeUTCTimestamp(std::chrono::system_clock::now());
        json.AddMember("generatedAt", rj::Value{generatedAt.c_str(), allocator}, allocator);
        json.AddMember("sourceCode", rj::Value{sourceCode.c_str(), static_cast<rj::SizeType>(sourceCode.size()), allocator}, allocator);
        json.AddMember("size", rj::Value{static_cast<uint64_t>(libcuvette::filesystem::getFileSize(destination))}, allocator);

        libcuvette::json::write(json, getMetadataDirectory() / (fileId + ".json"));
    }
    catch(libcuvette::Error& e) {
        libcuvette::filesystem::removeFile(destination);
        auto message = boost::format("Failed to store %s in %s") % file % uploadsDir;
        CUVETTE_RETHROW_ERROR(e, message.str());
    }
    catch(const std::exception& e) {
        libcuvette::filesystem::removeFile(destination);
        auto message = boost::format("Failed to store %s in %s") % file % uploadsDir;
        CUVETTE_RETHROW_ERROR(e, message.str());
    }

    return fileId;
}

boost::filesystem::path ArtifactStore::getMetadataDirectory() const {
    return uploadsDir / "metadata";
}

}
}

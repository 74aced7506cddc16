/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "FileResolver.hpp"

#include <cctype>

#include <boost/format.hpp>
#include <rapidjson/document.h>

#include "libcuvette/Error.hpp"
#include "libcuvette/Utility.hpp"
#include "engine/Errors.hpp"
#include "engine/Utility.hpp"

namespace rj = rapidjson;


namespace cuvette {
namespace engine {

const char* const FileResolver::manifestFilename = "manifest.json";

// Guest-side resolution of logical file names. @MANIFEST@ is replaced with the
// container path of the manifest.
static const char* const preludeTemplate = R"PRELUDE(import json as _cuvette_json
import os as _cuvette_os

def _cuvette_load_manifest():
    try:
        with open(@MANIFEST@) as manifest_file:
            return _cuvette_json.load(manifest_file)
    except (OSError, ValueError):
        return {}

_cuvette_manifest = _cuvette_load_manifest()

def available_files():
    """Logical names of the data files of this run."""
    return sorted(_cuvette_manifest)

def resolve_file(name):
    """Path of a data file given its logical name. Existing paths are returned unchanged."""
    path = _cuvette_os.fspath(name)
    if _cuvette_os.path.exists(path):
        return path
    if path in _cuvette_manifest:
        return _cuvette_manifest[path]
    available = ", ".join(repr(n) for n in available_files()) or "none"
    raise FileNotFoundError("Data file %r not found. Available files: %s" % (path, available))

def _cuvette_resolving(reader):
    def read(source, *args, **kwargs):
        if isinstance(source, (str, _cuvette_os.PathLike)):
            source = resolve_file(source)
        return reader(source, *args, **kwargs)
    read.__doc__ = reader.__doc__
    read.__wrapped__ = reader
    return read

try:
    import pandas as _cuvette_pandas
except ImportError:
    _cuvette_pandas = None
if _cuvette_pandas is not None:
    _cuvette_pandas.read_csv = _cuvette_resolving(_cuvette_pandas.read_csv)
    _cuvette_pandas.read_excel = _cuvette_resolving(_cuvette_pandas.read_excel)
)PRELUDE";

static std::string makePythonStringLiteral(const std::string& s) {
    auto literal = std::string{"'"};
    for(auto c : s) {
        if(c == '\\' || c == '\'') {
            literal += '\\';
        }
        literal += c;
    }
    literal += "'";
    return literal;
}

static std::string getExtensionOfFormat(const boost::optional<std::string>& format) {
    if(!format) {
        return "";
    }
    auto type = FileResolver::detectFileType("", format);
    switch(type) {
        case FileType::CSV:     return ".csv";
        case FileType::JSON:    return ".json";
        case FileType::EXCEL:   return ".xlsx";
        case FileType::PARQUET: return ".parquet";
        case FileType::TEXT:    return ".txt";
        case FileType::UNKNOWN: return "";
    }
    return "";
}

FileResolver::FileResolver(std::shared_ptr<const common::Config> config)
    : config{config}
    , guestInputDir{config->json["containerInputDir"].GetString()}
    , allowHostPaths{config->getFlag("allowHostPaths", false)}
{
    auto uploadsDir = config->getUploadsDirectory();
    if(uploadsDir) {
        artifactStore = ArtifactStore{*uploadsDir};
    }
}

std::vector<ProcessedFile> FileResolver::stageFiles(const std::map<std::string, std::string>& dataFiles,
                                                    const StagingContext& context) const {
    utility::logMessage(boost::format("Staging %d data file(s)") % dataFiles.size(), libcuvette::LogLevel::INFO);

    auto usedNames = std::set<std::string>{ manifestFilename };
    auto processedFiles = std::vector<ProcessedFile>{};
    for(const auto& entry : dataFiles) {
        processedFiles.push_back(stageFile(entry.first, entry.second, context, usedNames));
    }

    utility::logMessage("Successfully staged data files", libcuvette::LogLevel::INFO);
    return processedFiles;
}

ProcessedFile FileResolver::stageFile(const std::string& logicalName,
                                      const std::string& handle,
                                      const StagingContext& context,
                                      std::set<std::string>& usedNames) const {
    auto source = boost::filesystem::path{};
    auto originalFilename = std::string{};
    auto format = boost::optional<std::string>{};

    auto artifact = artifactStore ? artifactStore->resolve(handle) : boost::optional<StoredArtifact>{};
    if(artifact) {
        source = artifact->file;
        originalFilename = artifact->metadata.originalFilename
            ? boost::filesystem::path{*artifact->metadata.originalFilename}.filename().string()
            : artifact->fileId;
        format = artifact->metadata.format;
        utility::logMessage(boost::format("Resolved data file '%s' to stored file %s") % logicalName % artifact->fileId,
                            libcuvette::LogLevel::DEBUG);
    }
    else if(allowHostPaths && boost::filesystem::is_regular_file(handle)) {
        source = boost::filesystem::path{handle};
        originalFilename = source.filename().string();
        utility::logMessage(boost::format("Resolved data file '%s' to host path %s") % logicalName % source,
                            libcuvette::LogLevel::DEBUG);
    }
    else {
        auto message = boost::format("Failed to resolve data file '%s': handle '%s' matches no stored file%s")
            % logicalName % handle % (allowHostPaths ? " and no host file" : "");
        CUVETTE_THROW_TYPED_ERROR(SetupError, message.str());
    }

    auto stagedName = sanitizeFilename(originalFilename);
    if(boost::filesystem::path{stagedName}.extension().empty()) {
        stagedName += getExtensionOfFormat(format);
    }
    auto uniqueName = stagedName;
    for(int i=1; usedNames.count(uniqueName) > 0; ++i) {
        uniqueName = std::to_string(i) + "_" + stagedName;
    }
    usedNames.insert(uniqueName);

    auto processedFile = ProcessedFile{};
    processedFile.logicalName = logicalName;
    processedFile.hostPath = context.getInputRoot() / uniqueName;
    processedFile.guestPath = guestInputDir / uniqueName;
    processedFile.handle = handle;
    processedFile.originalFilename = originalFilename;
    processedFile.type = detectFileType(uniqueName, format);

    try {
        libcuvette::filesystem::copyFile(source, processedFile.hostPath);
        boost::filesystem::permissions(processedFile.hostPath,
                                       boost::filesystem::owner_read | boost::filesystem::owner_write
                                       | boost::filesystem::group_read | boost::filesystem::others_read);
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to stage data file '%s' (handle '%s'): %s")
            % logicalName % handle % e.what();
        CUVETTE_THROW_TYPED_ERROR(SetupError, message.str());
    }

    return processedFile;
}

/**
 * Writes the manifest: a JSON object mapping every logical name to the container
 * path of its staged file. The original file name of a data file is added as an
 * alias, unless it is already taken by a logical name or by an earlier alias.
 */
boost::filesystem::path FileResolver::writeManifest(const std::vector<ProcessedFile>& processedFiles,
                                                    const StagingContext& context) const {
    auto json = rj::Document{rj::kObjectType};
    auto& allocator = json.GetAllocator();

    auto names = std::set<std::string>{};
    for(const auto& file : processedFiles) {
        names.insert(file.logicalName);
        json.AddMember(rj::Value{file.logicalName.c_str(), allocator},
                       rj::Value{file.guestPath.c_str(), allocator},
                       allocator);
    }
    for(const auto& file : processedFiles) {
        if(file.originalFilename.empty() || names.count(file.originalFilename) > 0) {
            continue;
        }
        names.insert(file.originalFilename);
        json.AddMember(rj::Value{file.originalFilename.c_str(), allocator},
                       rj::Value{file.guestPath.c_str(), allocator},
                       allocator);
    }

    auto manifest = context.getInputRoot() / manifestFilename;
    try {
        libcuvette::json::write(json, manifest);
        boost::filesystem::permissions(manifest,
                                       boost::filesystem::owner_read | boost::filesystem::owner_write
                                       | boost::filesystem::group_read | boost::filesystem::others_read);
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to write manifest %s: %s") % manifest % e.what();
        CUVETTE_THROW_TYPED_ERROR(SetupError, message.str());
    }
    return manifest;
}

std::string FileResolver::makePrelude() const {
    auto prelude = std::string{preludeTemplate};
    auto manifest = makePythonStringLiteral((guestInputDir / manifestFilename).string());
    return libcuvette::string::replace(prelude, "@MANIFEST@", manifest);
}

FileType FileResolver::detectFileType(const std::string& filename, const boost::optional<std::string>& format) {
    if(format) {
        auto f = libcuvette::string::toLower(*format);
        if(f == "csv" || f == "tsv") {
            return FileType::CSV;
        }
        else if(f == "json") {
            return FileType::JSON;
        }
        else if(f == "excel" || f == "xlsx" || f == "xls") {
            return FileType::EXCEL;
        }
        else if(f == "parquet") {
            return FileType::PARQUET;
        }
        else if(f == "text" || f == "txt" || f == "plain") {
            return FileType::TEXT;
        }
    }

    auto extension = libcuvette::string::toLower(boost::filesystem::path{filename}.extension().string());
    if(extension == ".csv" || extension == ".tsv") {
        return FileType::CSV;
    }
    else if(extension == ".json") {
        return FileType::JSON;
    }
    else if(extension == ".xlsx" || extension == ".xls") {
        return FileType::EXCEL;
    }
    else if(extension == ".parquet") {
        return FileType::PARQUET;
    }
    else if(extension == ".txt" || extension == ".md") {
        return FileType::TEXT;
    }
    return FileType::UNKNOWN;
}

/**
 * Reduces a file name to [A-Za-z0-9._-] characters, so that it is safe to use
 * as a single path element on the host and in the guest.
 */
std::string FileResolver::sanitizeFilename(const std::string& filename) {
    auto sanitized = std::string{};
    for(auto c : filename) {
        auto isSafe = std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-';
        sanitized += isSafe ? c : '_';
    }
    auto firstNonDot = sanitized.find_first_not_of('.');
    sanitized = firstNonDot == std::string::npos ? std::string{} : sanitized.substr(firstNonDot);
    return sanitized.empty() ? std::string{"file"} : sanitized;
}

}
}

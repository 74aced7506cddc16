/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cuvette_engine_ExecutionTypes_hpp
#define cuvette_engine_ExecutionTypes_hpp

#include <chrono>
#include <map>
#include <string>
#include <vector>
#include <cstddef>

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>


namespace cuvette {
namespace engine {

struct ExecutionRequest {
    std::string code;
    // logical name -> handle (upload id, upload description or host path)
    std::map<std::string, std::string> dataFiles;
    boost::optional<int> timeoutSeconds;
};

struct ResourceLimits {
    std::size_t memoryBytes;
    double cpus;
    int pidsLimit;
    std::chrono::seconds timeout;
    std::size_t maxOutputBytes;
    std::chrono::milliseconds killGracePeriod;
};

enum class FileType {CSV, JSON, EXCEL, PARQUET, TEXT, UNKNOWN};

std::string fileTypeToString(FileType);

struct ProcessedFile {
    std::string logicalName;
    boost::filesystem::path hostPath;
    boost::filesystem::path guestPath;
    std::string handle;
    std::string originalFilename;
    FileType type;
};

enum class ContentKind {IMAGE, GENERIC};

std::string contentKindToString(ContentKind);

struct CreatedFile {
    std::string filename;
    std::size_t sizeBytes;
    ContentKind kind;
    std::string mimeType;
    boost::optional<std::string> base64Data;
    boost::optional<unsigned> width;
    boost::optional<unsigned> height;
    boost::optional<std::string> fileId;
};

struct BinaryOutput {
    std::string base64Data;
    std::string mimeType;
    std::string filename;
    std::size_t sizeBytes;
    boost::optional<unsigned> width;
    boost::optional<unsigned> height;
    std::string sourceCode;
};

enum class ResultKind {TEXT, BINARY_ARTIFACT};

struct ExecutionResult {
    std::string output;
    std::string stdoutText;
    std::string stderrText;
    std::string executedCode;
    ResultKind kind = ResultKind::TEXT;
    boost::optional<BinaryOutput> binaryOutput;
    std::vector<CreatedFile> createdFiles;
    int exitCode = 0;
    double elapsedSeconds = 0;
};

}
}

#endif

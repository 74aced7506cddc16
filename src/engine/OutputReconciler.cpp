/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "OutputReconciler.hpp"

#include <algorithm>
#include <iterator>

#include <boost/format.hpp>

#include "libcuvette/Utility.hpp"
#include "engine/ContentSignature.hpp"
#include "engine/Errors.hpp"
#include "engine/Utility.hpp"


namespace cuvette {
namespace engine {

OutputReconciler::OutputReconciler(std::shared_ptr<const common::Config> config)
    : config{std::move(config)}
{
    if(this->config->getFlag("persistCreatedFiles", false)) {
        auto uploadsDir = this->config->getUploadsDirectory();
        if(uploadsDir) {
            artifactStore = ArtifactStore{*uploadsDir};
        }
        else {
            utility::logMessage("Persistence of created files is enabled but no uploadsDir is configured."
                                " Created files will not be persisted.", libcuvette::LogLevel::WARN);
        }
    }
}

/**
 * Symlinks are not followed: the guest could otherwise point one at a host
 * file that is readable by the engine but not by the container.
 */
OutputSnapshot OutputReconciler::snapshot(const boost::filesystem::path& outputRoot) const {
    auto result = OutputSnapshot{};
    if(!boost::filesystem::exists(outputRoot)) {
        return result;
    }

    try {
        auto it = boost::filesystem::recursive_directory_iterator{outputRoot};
        for(auto end = boost::filesystem::recursive_directory_iterator{}; it != end; ++it) {
            const auto& path = it->path();
            if(boost::filesystem::is_symlink(it->symlink_status())) {
                continue;
            }
            if(boost::filesystem::is_regular_file(it->status())) {
                result.insert(path.lexically_relative(outputRoot).generic_string());
            }
        }
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to take snapshot of output directory %s") % outputRoot;
        CUVETTE_RETHROW_ERROR(e, message.str());
    }
    return result;
}

std::vector<std::string> OutputReconciler::diff(const OutputSnapshot& before, const OutputSnapshot& after) {
    auto candidates = std::vector<std::string>{};
    std::set_difference(after.cbegin(), after.cend(),
                        before.cbegin(), before.cend(),
                        std::back_inserter(candidates));
    return candidates;
}

ReconciledOutput OutputReconciler::reconcile(const boost::filesystem::path& outputRoot,
                                             const OutputSnapshot& before,
                                             const std::string& executedCode) const {
    auto result = ReconciledOutput{};

    auto after = OutputSnapshot{};
    try {
        after = snapshot(outputRoot);
    }
    catch(const libcuvette::Error& e) {
        CUVETTE_THROW_TYPED_ERROR(ReconciliationError, e.what());
    }

    auto candidates = diff(before, after);
    utility::logMessage(boost::format("Found %d created file(s) in %s") % candidates.size() % outputRoot,
                        libcuvette::LogLevel::INFO);

    for(const auto& name : candidates) {
        auto file = outputRoot / name;
        auto createdFile = classify(file, name);

        if(createdFile.kind == ContentKind::IMAGE && !result.primaryOutput) {
            auto primary = BinaryOutput{};
            primary.base64Data = *createdFile.base64Data;
            primary.mimeType = createdFile.mimeType;
            primary.filename = createdFile.filename;
            primary.sizeBytes = createdFile.sizeBytes;
            primary.width = createdFile.width;
            primary.height = createdFile.height;
            primary.sourceCode = executedCode;
            result.primaryOutput = std::move(primary);
        }

        if(artifactStore) {
            persist(createdFile, file, executedCode);
        }

        result.createdFiles.push_back(std::move(createdFile));
    }

    return result;
}

CreatedFile OutputReconciler::classify(const boost::filesystem::path& file, const std::string& relativeName) const {
    auto bytes = std::string{};
    try {
        bytes = libcuvette::filesystem::readBinaryFile(file);
    }
    catch(const libcuvette::Error& e) {
        auto message = boost::format("Failed to read created file %s: %s") % file % e.what();
        CUVETTE_THROW_TYPED_ERROR(ReconciliationError, message.str());
    }

    auto signature = detectContentSignature(bytes, file);

    auto createdFile = CreatedFile{};
    createdFile.filename = relativeName;
    createdFile.sizeBytes = bytes.size();
    createdFile.kind = signature.kind;
    createdFile.mimeType = signature.mimeType;
    if(signature.kind == ContentKind::IMAGE) {
        createdFile.base64Data = libcuvette::base64::encode(bytes);
        if(signature.dimensions) {
            createdFile.width = signature.dimensions->width;
            createdFile.height = signature.dimensions->height;
        }
    }

    utility::logMessage(boost::format("Classified %s as %s (%s, %d bytes)")
                            % relativeName % contentKindToString(createdFile.kind)
                            % createdFile.mimeType % createdFile.sizeBytes,
                        libcuvette::LogLevel::DEBUG);
    return createdFile;
}

void OutputReconciler::persist(CreatedFile& createdFile, const boost::filesystem::path& file, const std::string& executedCode) const {
    try {
        createdFile.fileId = artifactStore->store(file, createdFile.filename, createdFile.mimeType, executedCode);
    }
    catch(const libcuvette::Error& e) {
        auto message = boost::format("Failed to persist created file %s: %s") % createdFile.filename % e.what();
        utility::logMessage(message, libcuvette::LogLevel::WARN);
    }
}

}
}

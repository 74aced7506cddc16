/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cuvette_engine_ArtifactStore_hpp
#define cuvette_engine_ArtifactStore_hpp

#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>


namespace cuvette {
namespace engine {

struct ArtifactMetadata {
    boost::optional<std::string> description;
    boost::optional<std::string> originalFilename;
    boost::optional<std::string> format;
};

struct StoredArtifact {
    std::string fileId;
    boost::filesystem::path file;
    ArtifactMetadata metadata;
};

/**
 * Directory based store of uploaded and generated files.
 *
 * Layout:
 *   <uploadsDir>/<uuid>                 the bytes
 *   <uploadsDir>/metadata/<uuid>.json   the metadata (optional for uploads)
 */
class ArtifactStore {
public:
    ArtifactStore(const boost::filesystem::path& uploadsDir);

    boost::optional<StoredArtifact> resolve(const std::string& handle) const;
    std::string store(const boost::filesystem::path& file,
                      const std::string& originalFilename,
                      const std::string& mimeType,
                      const std::string& sourceCode) const;

    const boost::filesystem::path& getUploadsDirectory() const;
    static bool isFileId(const std::string&);

private:
    boost::optional<StoredArtifact> resolveFileId(const std::string& fileId) const;
    boost::optional<StoredArtifact> resolveDescription(const std::string& description) const;
    boost::optional<ArtifactMetadata> readMetadata(const boost::filesystem::path& metadataFile) const;
    boost::filesystem::path getMetadataDirectory() const;

private:
    boost::filesystem::path uploadsDir;
};

}
}

#endif

/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cuvette_engine_FileResolver_hpp
#define cuvette_engine_FileResolver_hpp

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>

#include "common/Config.hpp"
#include "engine/ArtifactStore.hpp"
#include "engine/ExecutionTypes.hpp"
#include "engine/StagingContext.hpp"


namespace cuvette {
namespace engine {

/**
 * Materializes the data files of a request into the input root and generates
 * the guest-side code that maps logical names to the staged files.
 */
class FileResolver {
public:
    static const char* const manifestFilename;

public:
    FileResolver(std::shared_ptr<const common::Config>);

    std::vector<ProcessedFile> stageFiles(const std::map<std::string, std::string>& dataFiles,
                                          const StagingContext&) const;
    boost::filesystem::path writeManifest(const std::vector<ProcessedFile>&, const StagingContext&) const;
    std::string makePrelude() const;

    static FileType detectFileType(const std::string& filename, const boost::optional<std::string>& format);
    static std::string sanitizeFilename(const std::string&);

private:
    ProcessedFile stageFile(const std::string& logicalName,
                            const std::string& handle,
                            const StagingContext&,
                            std::set<std::string>& usedNames) const;

private:
    std::shared_ptr<const common::Config> config;
    boost::optional<ArtifactStore> artifactStore;
    boost::filesystem::path guestInputDir;
    bool allowHostPaths;
};

}
}

#endif

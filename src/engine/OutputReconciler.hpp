/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cuvette_engine_OutputReconciler_hpp
#define cuvette_engine_OutputReconciler_hpp

#include <memory>
#include <set>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>

#include "common/Config.hpp"
#include "engine/ArtifactStore.hpp"
#include "engine/ExecutionTypes.hpp"


namespace cuvette {
namespace engine {

// Relative paths (generic format) of the regular files below a directory
using OutputSnapshot = std::set<std::string>;

struct ReconciledOutput {
    std::vector<CreatedFile> createdFiles;
    boost::optional<BinaryOutput> primaryOutput;
};

class OutputReconciler {
public:
    OutputReconciler(std::shared_ptr<const common::Config>);

    OutputSnapshot snapshot(const boost::filesystem::path& outputRoot) const;
    ReconciledOutput reconcile(const boost::filesystem::path& outputRoot,
                               const OutputSnapshot& before,
                               const std::string& executedCode) const;

    static std::vector<std::string> diff(const OutputSnapshot& before, const OutputSnapshot& after);

private:
    CreatedFile classify(const boost::filesystem::path& file, const std::string& relativeName) const;
    void persist(CreatedFile&, const boost::filesystem::path& file, const std::string& executedCode) const;

private:
    std::shared_ptr<const common::Config> config;
    boost::optional<ArtifactStore> artifactStore;
};

}
}

#endif

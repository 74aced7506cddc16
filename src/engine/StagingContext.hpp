/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cuvette_engine_StagingContext_hpp
#define cuvette_engine_StagingContext_hpp

#include <boost/filesystem.hpp>

#include "libcuvette/PathRAII.hpp"


namespace cuvette {
namespace engine {

/**
 * The staging directories of one invocation: a run root holding the script root,
 * the input root and the output root. The run root is owned through a PathRAII,
 * hence removed as a whole when the context goes out of scope, whichever path
 * the invocation takes.
 */
class StagingContext {
public:
    StagingContext(const boost::filesystem::path& runRoot);
    StagingContext(StagingContext&&) = default;
    StagingContext& operator=(StagingContext&&) = default;

    const boost::filesystem::path& getRunRoot() const { return runRoot; }
    const boost::filesystem::path& getScriptRoot() const { return scriptRoot; }
    const boost::filesystem::path& getInputRoot() const { return inputRoot; }
    const boost::filesystem::path& getOutputRoot() const { return outputRoot; }

    void remove();
    bool isRemoved() const;

private:
    libcuvette::PathRAII runRootRAII;
    boost::filesystem::path runRoot;
    boost::filesystem::path scriptRoot;
    boost::filesystem::path inputRoot;
    boost::filesystem::path outputRoot;
};

}
}

#endif

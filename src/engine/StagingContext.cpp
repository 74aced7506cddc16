/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "StagingContext.hpp"


namespace cuvette {
namespace engine {

StagingContext::StagingContext(const boost::filesystem::path& runRoot)
    : runRootRAII{runRoot}
    , runRoot{runRoot}
    , scriptRoot{runRoot / "script"}
    , inputRoot{runRoot / "input"}
    , outputRoot{runRoot / "output"}
{}

/**
 * Removes the staging directories right away. Throws on failure, in which case
 * the destructor tries again.
 */
void StagingContext::remove() {
    runRootRAII.remove();
}

bool StagingContext::isRemoved() const {
    return !runRootRAII.isManaging();
}

}
}

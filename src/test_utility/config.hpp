/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

/**
 * @brief Utility functions to be used in the tests.
 */

#ifndef cuvette_test_utility_config_hpp
#define cuvette_test_utility_config_hpp

#include <memory>

#include <boost/filesystem.hpp>

#include "libcuvette/PathRAII.hpp"
#include "common/Config.hpp"

namespace test_utility {
namespace config {

/**
 * A configuration whose directories (temp, logs, uploads) live below a private
 * prefix directory, which is removed together with the object.
 */
struct ConfigRAII {
    std::shared_ptr<cuvette::common::Config> config;
    libcuvette::PathRAII prefixDir;

    boost::filesystem::path getPrefixDir() const { return prefixDir.getPath(); }
    void setRuntimePath(const boost::filesystem::path&);
};

ConfigRAII makeConfig();

}
}

#endif

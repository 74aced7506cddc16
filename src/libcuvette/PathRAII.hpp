/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libcuvette_PathRAII_hpp
#define libcuvette_PathRAII_hpp

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>

namespace libcuvette {

/**
 * Owns a file or directory tree on the host and removes it when destroyed.
 *
 * Ownership moves with the object, so a staging directory can be handed from
 * the code that creates it to the code that outlives the creation step.
 * Removal failures in the destructor are logged as warnings.
 */
class PathRAII {
public:
    PathRAII() = default;
    explicit PathRAII(boost::filesystem::path path);
    PathRAII(const PathRAII&) = delete;
    PathRAII(PathRAII&&);
    PathRAII& operator=(const PathRAII&) = delete;
    PathRAII& operator=(PathRAII&&);
    ~PathRAII();

    const boost::filesystem::path& getPath() const;
    bool isManaging() const;

    // removes the tree now; the object manages nothing afterwards
    void remove();

    // stops managing the tree, leaving it on disk
    boost::filesystem::path release();

private:
    void removeAndLog() noexcept;

    boost::optional<boost::filesystem::path> path;
};

}

#endif

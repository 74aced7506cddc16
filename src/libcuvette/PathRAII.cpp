/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "PathRAII.hpp"

#include <boost/format.hpp>

#include "Error.hpp"
#include "libcuvette/utility/filesystem.hpp"
#include "libcuvette/Logger.hpp"

namespace libcuvette {

// The guest may leave files or folders behind without owner write or search
// permission: grant them before removing the tree.
static void makeTreeRemovable(const boost::filesystem::path& root) {
    auto permissions = boost::filesystem::perms::add_perms
                     | boost::filesystem::perms::owner_write
                     | boost::filesystem::perms::owner_exe;
    boost::filesystem::permissions(root, permissions);

    if(!boost::filesystem::is_directory(root) || filesystem::isSymlink(root)) {
        return;
    }

    auto it = boost::filesystem::recursive_directory_iterator{root};
    auto end = boost::filesystem::recursive_directory_iterator{};
    for(; it != end; ++it) {
        if(filesystem::isSymlink(it->path())) {
            it.no_push();
            continue;
        }
        boost::filesystem::permissions(it->path(), permissions);
    }
}

PathRAII::PathRAII(boost::filesystem::path path)
    : path{std::move(path)}
{}

PathRAII::PathRAII(PathRAII&& rhs)
    : path{std::move(rhs.path)}
{
    rhs.path.reset();
}

PathRAII& PathRAII::operator=(PathRAII&& rhs) {
    if(this != &rhs) {
        removeAndLog();
        path = std::move(rhs.path);
        rhs.path.reset();
    }
    return *this;
}

PathRAII::~PathRAII() {
    removeAndLog();
}

const boost::filesystem::path& PathRAII::getPath() const {
    return path.value();
}

bool PathRAII::isManaging() const {
    return static_cast<bool>(path);
}

/**
 * Throws if the removal fails, in which case the tree stays managed
 * and the destructor tries again.
 */
void PathRAII::remove() {
    if(!path) {
        return;
    }
    if(boost::filesystem::exists(boost::filesystem::symlink_status(*path))) {
        makeTreeRemovable(*path);
        boost::filesystem::remove_all(*path);
    }
    path.reset();
}

boost::filesystem::path PathRAII::release() {
    auto released = path.value_or(boost::filesystem::path{});
    path.reset();
    return released;
}

void PathRAII::removeAndLog() noexcept {
    try {
        remove();
    }
    catch(const std::exception& e) {
        logMessage(boost::format("Failed to remove %s: %s") % *path % e.what(), LogLevel::WARN);
    }
}

}

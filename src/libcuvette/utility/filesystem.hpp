/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libcuvette_utility_filesystem_hpp
#define libcuvette_utility_filesystem_hpp

#include <string>
#include <vector>
#include <sys/types.h>

#include <boost/filesystem.hpp>

/**
 * Utility functions for filesystem manipulation and investigation
 */

namespace libcuvette {
namespace filesystem {

void createFoldersIfNecessary(const boost::filesystem::path&);
void copyFile(const boost::filesystem::path& src, const boost::filesystem::path& dst);
void removeFile(const boost::filesystem::path& path);
size_t getFileSize(const boost::filesystem::path& filename);
std::string readFile(const boost::filesystem::path& path);
std::string readBinaryFile(const boost::filesystem::path& path);
void writeTextFile(const std::string& text,
                   const boost::filesystem::path& filename,
                   const std::ios_base::openmode mode = std::ios_base::out);
boost::filesystem::path makeUniquePathWithRandomSuffix(const boost::filesystem::path&);
boost::filesystem::path makeUniqueDirectory(const boost::filesystem::path&);
bool isSymlink(const boost::filesystem::path& path);

}}

#endif

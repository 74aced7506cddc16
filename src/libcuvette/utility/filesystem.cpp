/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "filesystem.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sys/stat.h>
#include <unistd.h>

#include <boost/format.hpp>

#include "libcuvette/Error.hpp"
#include "libcuvette/Logger.hpp"
#include "libcuvette/utility/string.hpp"

/**
 * Utility functions for filesystem manipulation
 */

namespace libcuvette {
namespace filesystem {

size_t getFileSize(const boost::filesystem::path& filename) {
    struct stat st;
    if(stat(filename.c_str(), &st) != 0) {
        auto message = boost::format("Failed to retrieve size of file %s. Stat failed: %s")
            % filename % strerror(errno);
        CUVETTE_THROW_ERROR(message.str());
    }
    return st.st_size;
}

void createFoldersIfNecessary(const boost::filesystem::path& path) {
    auto currentPath = boost::filesystem::path("");

    if(!boost::filesystem::exists(path)) {
        logMessage(boost::format{"Creating directory %s"} % path, LogLevel::DEBUG);
    }

    for(const auto& element : path) {
        currentPath /= element;
        if(!boost::filesystem::exists(currentPath)) {
            bool created = false;
            try {
                created = boost::filesystem::create_directory(currentPath);
            } catch(const std::exception& e) {
                auto message = boost::format("Failed to create directory %s") % currentPath;
                CUVETTE_RETHROW_ERROR(e, message.str());
            }
            if(!created) {
                // the creation might have failed because another process concurrently
                // created the same directory. So check whether the directory was indeed
                // created by another process.
                if(!boost::filesystem::is_directory(currentPath)) {
                    auto message = boost::format("Failed to create directory %s") % currentPath;
                    CUVETTE_THROW_ERROR(message.str());
                }
            }
        }
    }
}

void copyFile(const boost::filesystem::path& src, const boost::filesystem::path& dst) {
    logMessage(boost::format{"Copying %s -> %s"} % src % dst, LogLevel::DEBUG);
    try {
        createFoldersIfNecessary(dst.parent_path());
        boost::filesystem::remove(dst); // remove dst if already exists
        boost::filesystem::copy_file(src, dst);
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to copy %s to %s") % src % dst;
        CUVETTE_RETHROW_ERROR(e, message.str());
    }
}

/**
 * Removes the file if it exists. Failures are logged, not thrown, so that
 * this can be used while handling another error.
 */
void removeFile(const boost::filesystem::path& path) {
    auto ec = boost::system::error_code{};
    boost::filesystem::remove(path, ec);
    if(ec) {
        logMessage(boost::format{"Failed to remove %s: %s"} % path % ec.message(), LogLevel::WARN);
    }
}

std::string readFile(const boost::filesystem::path& path) {
    std::ifstream ifs(path.string());
    auto s = std::string(   std::istreambuf_iterator<char>(ifs),
                            std::istreambuf_iterator<char>());
    return s;
}

/**
 * Reads the whole file as raw bytes. Unlike readFile(), a file that cannot be
 * opened or read is reported as an error instead of yielding an empty string.
 */
std::string readBinaryFile(const boost::filesystem::path& path) {
    std::ifstream ifs(path.string(), std::ios::in | std::ios::binary);
    if(!ifs) {
        auto message = boost::format("Failed to open %s for reading") % path;
        CUVETTE_THROW_ERROR(message.str());
    }
    auto bytes = std::string(   std::istreambuf_iterator<char>(ifs),
                                std::istreambuf_iterator<char>());
    if(ifs.bad()) {
        auto message = boost::format("Failed to read %s") % path;
        CUVETTE_THROW_ERROR(message.str());
    }
    return bytes;
}

void writeTextFile(const std::string& text, const boost::filesystem::path& filename, const std::ios_base::openmode mode) {
    try {
        createFoldersIfNecessary(filename.parent_path());
        auto ofs = std::ofstream{filename.string(), mode};
        if (!ofs) {
            auto message = boost::format("Failed to open std::ofstream for %s") % filename;
            CUVETTE_THROW_ERROR(message.str());
        }
        ofs << text;
        ofs.flush();
        if (!ofs) {
            auto message = boost::format("Failed to write to %s") % filename;
            CUVETTE_THROW_ERROR(message.str());
        }
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to write text file %s") % filename;
        CUVETTE_RETHROW_ERROR(e, message.str());
    }
}

/**
 * Generates a random suffix and append it to the given path. If the generated random
 * path exists, tries again with another suffix until the operation succeedes.
 *
 * Note: boost::filesystem::unique_path offers a similar functionality. However, it
 * fails (throws exception) when the locale configuration is invalid. More specifically,
 * we experienced the problem when LC_CTYPE was set to UTF-8 and the locale UTF-8 was not
 * installed.
 */
boost::filesystem::path makeUniquePathWithRandomSuffix(const boost::filesystem::path& path) {
    auto uniquePath = std::string{};

    do {
        const size_t sizeOfRandomSuffix = 16;
        uniquePath = path.string() + "-" + string::generateRandom(sizeOfRandomSuffix);
    } while(boost::filesystem::exists(uniquePath));

    return uniquePath;
}

/**
 * Like makeUniquePathWithRandomSuffix(), but also creates the directory. The
 * existence check and the creation are a single mkdir() call, so two processes
 * racing for the same name can't both succeed: the loser draws a new suffix.
 */
boost::filesystem::path makeUniqueDirectory(const boost::filesystem::path& path) {
    createFoldersIfNecessary(path.parent_path());

    const int maxAttempts = 100;
    for(int attempt=0; attempt<maxAttempts; ++attempt) {
        auto candidate = makeUniquePathWithRandomSuffix(path);
        if(mkdir(candidate.c_str(), 0700) == 0) {
            logMessage(boost::format{"Created directory %s"} % candidate, LogLevel::DEBUG);
            return candidate;
        }
        if(errno != EEXIST) {
            auto message = boost::format("Failed to create directory %s: %s") % candidate % strerror(errno);
            CUVETTE_THROW_ERROR(message.str());
        }
    }

    auto message = boost::format("Failed to create a unique directory with prefix %s after %d attempts")
        % path % maxAttempts;
    CUVETTE_THROW_ERROR(message.str());
}

bool isSymlink(const boost::filesystem::path& path) {
    struct stat sb;
    if (lstat(path.c_str(), &sb) != 0) {
        return false;
    }
    return S_ISLNK(sb.st_mode);
}

}}

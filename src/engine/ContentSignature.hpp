/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cuvette_engine_ContentSignature_hpp
#define cuvette_engine_ContentSignature_hpp

#include <string>

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>

#include "engine/ExecutionTypes.hpp"


namespace cuvette {
namespace engine {

struct ImageDimensions {
    unsigned width;
    unsigned height;
};

/**
 * Result of classifying a file by its leading bytes. The MIME type falls
 * back to the extension mapping when the content has no known signature.
 */
struct ContentSignature {
    ContentKind kind;
    std::string mimeType;
    boost::optional<ImageDimensions> dimensions;
};

ContentSignature detectContentSignature(const std::string& bytes, const boost::filesystem::path& filename);
boost::optional<std::string> detectImageMimeType(const std::string& bytes);
boost::optional<ImageDimensions> readImageDimensions(const std::string& bytes, const std::string& mimeType);
std::string mimeTypeFromExtension(const boost::filesystem::path& filename);

}
}

#endif

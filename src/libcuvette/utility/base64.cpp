/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "base64.hpp"

#include <algorithm>

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <boost/format.hpp>

#include "libcuvette/Error.hpp"

namespace libcuvette {
namespace base64 {

namespace it = boost::archive::iterators;

/**
 * Standard base64 (RFC 4648) with '=' padding and no line breaks.
 */
std::string encode(const std::string& bytes) {
    using Encoder = it::base64_from_binary<it::transform_width<std::string::const_iterator, 6, 8>>;

    auto text = std::string(Encoder(bytes.cbegin()), Encoder(bytes.cend()));
    auto padding = (3 - bytes.size() % 3) % 3;
    text.append(padding, '=');
    return text;
}

std::string decode(const std::string& text) {
    using Decoder = it::transform_width<it::binary_from_base64<std::string::const_iterator>, 8, 6>;

    if(text.size() % 4 != 0) {
        auto message = boost::format("Failed to decode base64 text of length %d: length is not a multiple of 4")
            % text.size();
        CUVETTE_THROW_ERROR(message.str());
    }

    auto padding = static_cast<size_t>(std::count(text.crbegin(), text.crbegin() + std::min<size_t>(2, text.size()), '='));
    auto unpadded = text;
    // binary_from_base64 rejects '=', so decode 'A's instead and drop the extra bytes
    std::replace(unpadded.end() - padding, unpadded.end(), '=', 'A');

    auto bytes = std::string{};
    try {
        bytes = std::string(Decoder(unpadded.cbegin()), Decoder(unpadded.cend()));
    }
    catch(const std::exception& e) {
        CUVETTE_RETHROW_ERROR(e, "Failed to decode base64 text");
    }
    bytes.erase(bytes.size() - padding);
    return bytes;
}

}}

/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "string.hpp"

#include <algorithm>
#include <cctype>
#include <random>

#include <boost/format.hpp>
#include <boost/algorithm/string.hpp>

#include "libcuvette/Error.hpp"

/**
 * Utility functions for string manipulation
 */

namespace libcuvette {
namespace string {

std::string replace(std::string &buf, const std::string& from, const std::string& to) {
    std::string::size_type pos = buf.find(from);
    while(pos != std::string::npos){
        buf.replace(pos, from.size(), to);
        pos = buf.find(from, pos + to.size());
    }
    return buf;
}

std::pair<std::string, std::string> parseKeyValuePair(const std::string& pairString, const char separator) {
    auto keyEnd = std::find(pairString.cbegin(), pairString.cend(), separator);
    auto key = std::string(pairString.cbegin(), keyEnd);
    auto value = keyEnd != pairString.cend() ? std::string(keyEnd+1, pairString.cend()) : std::string{};
    if(key.empty()) {
        auto message = boost::format("Failed to parse key-value pair '%s': key is empty") % pairString;
        CUVETTE_THROW_ERROR(message.str())
    }
    return std::pair<std::string, std::string>{key, value};
}

/**
 * Returns a string of lowercase letters drawn from a generator seeded by
 * std::random_device. Each call gets its own generator, so concurrent callers
 * don't share state.
 */
std::string generateRandom(size_t size) {
    auto dist = std::uniform_int_distribution<std::mt19937::result_type>(0, 'z'-'a');
    std::mt19937 generator;
    generator.seed(std::random_device()());

    auto string = std::string(size, '.');

    for(size_t i=0; i<string.size(); ++i) {
        auto randomCharacter = 'a' + dist(generator);
        string[i] = randomCharacter;
    }

    return string;
}

std::string toLower(const std::string& s) {
    return boost::algorithm::to_lower_copy(s);
}

bool isBlank(const std::string& s) {
    return std::all_of(s.cbegin(), s.cend(), [](unsigned char c) { return std::isspace(c); });
}

}}

/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libcuvette_utility_string_hpp
#define libcuvette_utility_string_hpp

#include <string>
#include <tuple>
#include <sys/types.h>

/**
 * Utility functions for string manipulation
 */

namespace libcuvette {
namespace string {

std::string replace(std::string &buf, const std::string& from, const std::string& to);
std::pair<std::string, std::string> parseKeyValuePair(const std::string& pairString, const char separator = '=');
std::string generateRandom(size_t size);
std::string toLower(const std::string&);
bool isBlank(const std::string&);

}}

#endif

/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libcuvette_utility_base64_hpp
#define libcuvette_utility_base64_hpp

#include <string>

/**
 * Utility functions for base64 transport encoding
 */

namespace libcuvette {
namespace base64 {

std::string encode(const std::string& bytes);
std::string decode(const std::string& text);

}}

#endif

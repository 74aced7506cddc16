/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libcuvette_Utility_hpp
#define libcuvette_Utility_hpp

/*
 * All utility headers.
 */

#include "libcuvette/utility/base64.hpp"
#include "libcuvette/utility/environment.hpp"
#include "libcuvette/utility/filesystem.hpp"
#include "libcuvette/utility/json.hpp"
#include "libcuvette/utility/process.hpp"
#include "libcuvette/utility/string.hpp"

#endif

/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "ExecutionTypes.hpp"


namespace cuvette {
namespace engine {

std::string fileTypeToString(FileType type) {
    switch(type) {
        case FileType::CSV: return "csv";
        case FileType::JSON: return "json";
        case FileType::EXCEL: return "excel";
        case FileType::PARQUET: return "parquet";
        case FileType::TEXT: return "text";
        case FileType::UNKNOWN: return "unknown";
    }
    return "unknown";
}

std::string contentKindToString(ContentKind kind) {
    return kind == ContentKind::IMAGE ? "image" : "generic";
}

}
}

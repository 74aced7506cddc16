/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cuvette_engine_CodeTransformer_hpp
#define cuvette_engine_CodeTransformer_hpp

#include <string>
#include <tuple>


namespace cuvette {
namespace engine {

/**
 * Rewrites guest code so that it follows the output contract of the sandbox:
 * - a prelude (_cuvette_output_path() helper, aliased as output_path(), plus
 *   the given file resolution code) is injected at the top, between marker
 *   comments;
 * - recognized writes to relative literal paths (savefig, to_csv, to_excel,
 *   to_json, to_parquet, open in a write mode, and the legacy
 *   os.environ['OUTPUT_DIR'] + '/name' form) go through _cuvette_output_path(),
 *   which a guest variable named output_path cannot shadow;
 * - a guarded matplotlib close('all') block is appended when figures are saved
 *   and never closed.
 *
 * The rewriting is pattern based and best effort. Transforming already
 * transformed code returns it unchanged.
 */
class CodeTransformer {
public:
    static const char* const preludeBeginMarker;
    static const char* const preludeEndMarker;
    static const char* const cleanupBeginMarker;
    static const char* const cleanupEndMarker;

public:
    std::string transform(const std::string& code, const std::string& prelude) const;

    std::string routeWrites(const std::string& code) const;
    std::string appendPlotCleanup(const std::string& code) const;
    std::string injectPrelude(const std::string& code, const std::string& prelude) const;

private:
    std::tuple<std::string, std::string> splitPrelude(const std::string& code) const;
};

}
}

#endif

/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "CodeTransformer.hpp"

#include <functional>

#include <boost/format.hpp>
#include <boost/regex.hpp>

#include "libcuvette/Logger.hpp"
#include "engine/Utility.hpp"


namespace cuvette {
namespace engine {

const char* const CodeTransformer::preludeBeginMarker = "# >>> cuvette prelude >>>";
const char* const CodeTransformer::preludeEndMarker = "# <<< cuvette prelude <<<";
const char* const CodeTransformer::cleanupBeginMarker = "# >>> cuvette cleanup >>>";
const char* const CodeTransformer::cleanupEndMarker = "# <<< cuvette cleanup <<<";

static const char* const outputPathHelper = R"HELPER(import os as _cuvette_os

def _cuvette_output_path(name):
    """Path of a file in the output directory of this run."""
    return _cuvette_os.path.join(_cuvette_os.environ.get('OUTPUT_DIR', '.'), _cuvette_os.fspath(name))

output_path = _cuvette_output_path
)HELPER";

static const char* const plotCleanup = R"CLEANUP(try:
    import matplotlib.pyplot as _cuvette_plt
    _cuvette_plt.close('all')
except Exception:
    pass
)CLEANUP";

// <call>(<quote><path><quote>
static const auto exportCallRegex = boost::regex{
    R"((\.(?:savefig|to_csv|to_excel|to_json|to_parquet)\(\s*)([rbuRBU]?)(['"])([^'"\n\\]+)\3)"};

// open(<quote><path><quote>, [mode=]<quote><mode with w, a or x><quote>
static const auto openCallRegex = boost::regex{
    R"(((?<![\w.])open\(\s*)([rbuRBU]?)(['"])([^'"\n\\]+)\3(\s*,\s*(?:mode\s*=\s*)?)(['"])([rbt+]*[wax][rbt+]*)\6)"};

// os.environ['OUTPUT_DIR'] + '/name' and os.getenv('OUTPUT_DIR') + '/name'.
// A bare '/' literal is not a file name: "+ '/' + name" is left as it is.
static const auto legacyOutputDirRegex = boost::regex{
    R"(os\.(?:environ\[\s*(['"])OUTPUT_DIR\1\s*\]|environ\.get\(\s*(['"])OUTPUT_DIR\2\s*\)|getenv\(\s*(['"])OUTPUT_DIR\3\s*\))\s*\+\s*(['"])/?([^'"\n\\/][^'"\n\\]*)\4)"};

static const auto plotSaveRegex = boost::regex{R"((?:\.|\b)savefig\()"};
static const auto plotCloseRegex = boost::regex{R"(\b(?:plt|pyplot)\.close\()"};
static const auto futureImportRegex = boost::regex{R"(^from[ \t]+__future__[ \t]+import[^\n]*\n?)"};

static std::string replaceMatches(const std::string& code,
                                  const boost::regex& regex,
                                  const std::function<std::string(const boost::smatch&)>& makeReplacement) {
    auto result = std::string{};
    auto last = code.cbegin();
    for(boost::sregex_iterator it{code.cbegin(), code.cend(), regex}, end; it != end; ++it) {
        const auto& match = *it;
        result.append(last, match[0].first);
        result += makeReplacement(match);
        last = match[0].second;
    }
    result.append(last, code.cend());
    return result;
}

static bool isRelativeLocalPath(const std::string& path) {
    return !path.empty()
        && path[0] != '/'
        && path[0] != '~'
        && path.find("://") == std::string::npos;
}

static std::string makeOutputPathCall(const std::string& prefix, const std::string& quote, const std::string& path) {
    return "_cuvette_output_path(" + prefix + quote + path + quote + ")";
}

std::string CodeTransformer::transform(const std::string& code, const std::string& prelude) const {
    utility::logMessage("Transforming code", libcuvette::LogLevel::DEBUG);

    std::string existingPrelude, body;
    std::tie(existingPrelude, body) = splitPrelude(code);

    body = routeWrites(body);
    body = appendPlotCleanup(body);

    auto transformed = existingPrelude.empty()
        ? injectPrelude(body, prelude)
        : existingPrelude + body;

    utility::logMessage(boost::format("Transformed code (%d -> %d bytes)") % code.size() % transformed.size(),
                        libcuvette::LogLevel::DEBUG);
    return transformed;
}

std::string CodeTransformer::routeWrites(const std::string& code) const {
    auto routed = replaceMatches(code, exportCallRegex, [](const boost::smatch& match) {
        if(!isRelativeLocalPath(match[4])) {
            return match.str(0);
        }
        return match.str(1) + makeOutputPathCall(match[2], match[3], match[4]);
    });

    routed = replaceMatches(routed, openCallRegex, [](const boost::smatch& match) {
        if(!isRelativeLocalPath(match[4])) {
            return match.str(0);
        }
        return match.str(1) + makeOutputPathCall(match[2], match[3], match[4])
            + match.str(5) + match.str(6) + match.str(7) + match.str(6);
    });

    routed = replaceMatches(routed, legacyOutputDirRegex, [](const boost::smatch& match) {
        return makeOutputPathCall("", match[4], match[5]);
    });

    return routed;
}

std::string CodeTransformer::appendPlotCleanup(const std::string& code) const {
    bool savesPlots = boost::regex_search(code, plotSaveRegex);
    bool closesPlots = boost::regex_search(code, plotCloseRegex);
    bool hasCleanup = code.find(cleanupBeginMarker) != std::string::npos;
    if(!savesPlots || closesPlots || hasCleanup) {
        return code;
    }

    auto result = code;
    if(!result.empty() && result.back() != '\n') {
        result += '\n';
    }
    result += std::string{cleanupBeginMarker} + "\n" + plotCleanup + cleanupEndMarker + "\n";
    return result;
}

/**
 * Puts the prelude block at the top of the code. "from __future__" imports must
 * stay the first statements of a module, so they are hoisted above the block.
 */
std::string CodeTransformer::injectPrelude(const std::string& code, const std::string& prelude) const {
    auto futureImports = std::string{};
    auto body = replaceMatches(code, futureImportRegex, [&futureImports](const boost::smatch& match) {
        futureImports += match.str(0);
        if(futureImports.back() != '\n') {
            futureImports += '\n';
        }
        return std::string{};
    });

    auto block = std::string{preludeBeginMarker} + "\n"
        + outputPathHelper + "\n"
        + prelude;
    if(!block.empty() && block.back() != '\n') {
        block += '\n';
    }
    block += std::string{preludeEndMarker} + "\n";

    return futureImports + block + body;
}

/**
 * Splits already transformed code into the part up to and including the prelude
 * end marker line, and the rest. Code without prelude yields an empty first part.
 */
std::tuple<std::string, std::string> CodeTransformer::splitPrelude(const std::string& code) const {
    auto begin = code.find(preludeBeginMarker);
    auto end = code.find(preludeEndMarker);
    if(begin == std::string::npos || end == std::string::npos || end < begin) {
        return std::tuple<std::string, std::string>{"", code};
    }

    auto endOfLine = code.find('\n', end);
    auto split = endOfLine == std::string::npos ? code.size() : endOfLine + 1;
    return std::tuple<std::string, std::string>{code.substr(0, split), code.substr(split)};
}

}
}

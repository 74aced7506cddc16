/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "runtime.hpp"

#include <boost/format.hpp>

#include "libcuvette/Utility.hpp"

namespace test_utility {
namespace runtime {

static const char* const preamble = R"SH(#!/bin/sh
case "$1" in
    kill)
        exit 0
        ;;
    image)
        exit %d
        ;;
esac

HERE=$(dirname "$0")
printf '%%s\n' "$@" > "$HERE/last-arguments"

SCRIPT=
INPUT=
OUTPUT=
CIDFILE=
previous=
for arg in "$@"; do
    if [ "$previous" = "--cidfile" ]; then
        CIDFILE="$arg"
    fi
    if [ "$previous" = "-v" ]; then
        case "$arg" in
            *:/sandbox/script/*) SCRIPT="${arg%%%%:*}" ;;
            *:/sandbox/input:*) INPUT="${arg%%%%:*}" ;;
            *:/sandbox/output:*) OUTPUT="${arg%%%%:*}" ;;
        esac
    fi
    previous="$arg"
done
if [ -n "$SCRIPT" ]; then
    cp "$SCRIPT" "$HERE/last-script.py"
fi
if [ -n "$CIDFILE" ]; then
    echo 4f1c2b3a9d8e > "$CIDFILE"
fi

)SH";

boost::filesystem::path writeFakeRuntime(const boost::filesystem::path& script,
                                         const std::string& runBody,
                                         bool isImageAvailable) {
    auto content = (boost::format(preamble) % (isImageAvailable ? 0 : 1)).str() + runBody + "\n";
    libcuvette::filesystem::writeTextFile(content, script);
    boost::filesystem::permissions(script, boost::filesystem::owner_all
                                           | boost::filesystem::group_read | boost::filesystem::group_exe
                                           | boost::filesystem::others_read | boost::filesystem::others_exe);
    return script;
}

std::string readLastArguments(const boost::filesystem::path& script) {
    return libcuvette::filesystem::readFile(script.parent_path() / "last-arguments");
}

std::string readLastScript(const boost::filesystem::path& script) {
    return libcuvette::filesystem::readFile(script.parent_path() / "last-script.py");
}

}
}

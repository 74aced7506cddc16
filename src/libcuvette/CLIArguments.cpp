/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "CLIArguments.hpp"

#include <boost/algorithm/string/join.hpp>

namespace libcuvette {

CLIArguments::CLIArguments() {
    updatePointers();
}

CLIArguments::CLIArguments(const CLIArguments& rhs)
    : strings{rhs.strings}
{
    updatePointers();
}

CLIArguments::CLIArguments(CLIArguments&& rhs)
    : strings{std::move(rhs.strings)}
{
    updatePointers();
    rhs.strings.clear();
    rhs.updatePointers();
}

CLIArguments::CLIArguments(int argc, char* argv[])
    : strings(argv, argv + argc)
{
    updatePointers();
}

CLIArguments::CLIArguments(std::initializer_list<std::string> args)
    : strings{args}
{
    updatePointers();
}

CLIArguments::CLIArguments(std::vector<std::string> args)
    : strings{std::move(args)}
{
    updatePointers();
}

CLIArguments& CLIArguments::operator=(const CLIArguments& rhs) {
    if(this != &rhs) {
        strings = rhs.strings;
        updatePointers();
    }
    return *this;
}

CLIArguments& CLIArguments::operator=(CLIArguments&& rhs) {
    if(this != &rhs) {
        strings = std::move(rhs.strings);
        updatePointers();
        rhs.strings.clear();
        rhs.updatePointers();
    }
    return *this;
}

CLIArguments& CLIArguments::operator+=(const CLIArguments& rhs) {
    strings.insert(strings.end(), rhs.strings.cbegin(), rhs.strings.cend());
    updatePointers();
    return *this;
}

void CLIArguments::push_back(const std::string& arg) {
    strings.push_back(arg);
    updatePointers();
}

int CLIArguments::argc() const {
    return static_cast<int>(strings.size());
}

char** CLIArguments::argv() const {
    return const_cast<char**>(pointers.data());
}

CLIArguments::const_iterator CLIArguments::begin() const {
    return strings.cbegin();
}

CLIArguments::const_iterator CLIArguments::end() const {
    return strings.cend();
}

bool CLIArguments::empty() const {
    return strings.empty();
}

std::string CLIArguments::string() const {
    return boost::algorithm::join(strings, " ");
}

/**
 * Like string(), but arguments containing whitespace, quotes or '$' are wrapped in single
 * quotes, so that the logged command line can be pasted back into a shell.
 */
std::string CLIArguments::quotedString() const {
    auto quoted = std::vector<std::string>{};
    for(const auto& arg : strings) {
        if(!arg.empty() && arg.find_first_of(" \t\n'\"$") == std::string::npos) {
            quoted.push_back(arg);
            continue;
        }
        auto escaped = std::string{"'"};
        for(auto c : arg) {
            escaped += (c == '\'') ? std::string{"'\\''"} : std::string(1, c);
        }
        escaped += "'";
        quoted.push_back(escaped);
    }
    return boost::algorithm::join(quoted, " ");
}

const std::vector<std::string>& CLIArguments::toVector() const {
    return strings;
}

// strings may have reallocated: the pointers are always rebuilt from scratch
void CLIArguments::updatePointers() {
    pointers.clear();
    pointers.reserve(strings.size() + 1);
    for(auto& arg : strings) {
        pointers.push_back(&arg[0]);
    }
    pointers.push_back(nullptr);
}

}

/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libcuvette_CLIArguments_hpp
#define libcuvette_CLIArguments_hpp

#include <initializer_list>
#include <vector>
#include <string>

namespace libcuvette {

/**
 * A command line: the arguments as strings plus a null-terminated argv view
 * of them, as expected by execvp() and boost::program_options.
 * The argv view is valid until the next modification of the object.
 */
class CLIArguments {
public:
    using const_iterator = std::vector<std::string>::const_iterator;

public:
    CLIArguments();
    CLIArguments(const CLIArguments& rhs);
    CLIArguments(CLIArguments&& rhs);
    CLIArguments(int argc, char* argv[]);
    CLIArguments(std::initializer_list<std::string> args);
    explicit CLIArguments(std::vector<std::string> args);
    template<class InputIter>
    CLIArguments(InputIter begin, InputIter end)
        : strings(begin, end)
    {
        updatePointers();
    }

    CLIArguments& operator=(const CLIArguments& rhs);
    CLIArguments& operator=(CLIArguments&& rhs);
    CLIArguments& operator+=(const CLIArguments& rhs);
    void push_back(const std::string& arg);

    int argc() const;
    char** argv() const;
    const_iterator begin() const;
    const_iterator end() const;
    bool empty() const;

    std::string string() const;
    std::string quotedString() const;
    const std::vector<std::string>& toVector() const;

private:
    void updatePointers();

private:
    std::vector<std::string> strings;
    std::vector<char*> pointers;
};

}

#endif

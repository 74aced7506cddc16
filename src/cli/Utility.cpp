/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "cli/Utility.hpp"

#include <iterator>
#include <vector>

#include <boost/filesystem.hpp>

#include "libcuvette/Utility.hpp"


namespace cuvette {
namespace cli {
namespace utility {

static bool isShortOption(const std::string& token) {
    return token.size() > 1 && token[0] == '-' && token[1] != '-';
}

static bool isLongOption(const std::string& token) {
    return token.size() > 2 && token.compare(0, 2, "--") == 0 && token[2] != '-';
}

static bool isOption(const std::string& token) {
    return isShortOption(token) || isLongOption(token);
}

static bool takesValue(const boost::program_options::option_description& option) {
    return option.semantic()->max_tokens() > 0;
}

/**
 * Returns how many tokens, starting from tokens[first], make up one option:
 * 2 if the option takes its value from the next token, otherwise 1.
 * Unknown options count as a single token and are left for boost::program_options
 * to report.
 */
static size_t countOptionTokens(const std::vector<std::string>& tokens, size_t first,
                                const boost::program_options::options_description& optionsDescription) {
    const auto& token = tokens[first];
    bool valueMayFollow = false;

    if(isLongOption(token)) {
        // "--name=value" already carries its value
        if(token.find('=') == std::string::npos) {
            auto option = optionsDescription.find_nothrow(token.substr(2), false);
            valueMayFollow = option && takesValue(*option);
        }
    }
    else {
        // cluster of short options: only the last one can take the next token as value
        for(size_t i = 1; i < token.size(); ++i) {
            auto option = optionsDescription.find_nothrow(std::string{"-"} + token[i], false);
            if(!option) {
                break;
            }
            if(takesValue(*option)) {
                valueMayFollow = (i + 1 == token.size());
                break;
            }
        }
    }

    // "-" alone is a value (stdin)
    bool nextIsValue = valueMayFollow && first + 1 < tokens.size() && !isOption(tokens[first + 1]);
    return nextIsValue ? 2 : 1;
}

/**
 * Splits the CLI arguments into two groups.
 *
 * The first group contains the program/command name, its options and their values;
 * it is meant to be processed by boost::program_options with the given options description.
 * The second group starts at the first positional argument, i.e. the command name
 * followed by the command's own arguments, and is empty if there is none.
 *
 * E.g. "cuvette --verbose execute --timeout 5 --code-file script.py" is split into
 * ("cuvette --verbose", "execute --timeout 5 --code-file script.py").
 */
std::tuple<libcuvette::CLIArguments, libcuvette::CLIArguments> groupOptionsAndPositionalArguments(
        const libcuvette::CLIArguments& args,
        const boost::program_options::options_description& optionsDescription) {
    libcuvette::CLIArguments nameAndOptionArgs, positionalArgs;
    auto tokens = args.toVector();

    if(!tokens.empty()) {
        nameAndOptionArgs.push_back(tokens.front());

        size_t next = 1;
        while(next < tokens.size() && isOption(tokens[next])) {
            auto count = countOptionTokens(tokens, next, optionsDescription);
            for(size_t i = 0; i < count; ++i) {
                nameAndOptionArgs.push_back(tokens[next + i]);
            }
            next += count;
        }

        positionalArgs = libcuvette::CLIArguments(tokens.cbegin() + next, tokens.cend());
    }

    return std::make_tuple(nameAndOptionArgs, positionalArgs);
}

void validateNumberOfPositionalArguments(const libcuvette::CLIArguments& positionalArgs, const int min, const int max,
        const std::string& command) {
    auto numberOfArguments = positionalArgs.argc();
    if(numberOfArguments < min || numberOfArguments > max) {
        auto quantity = numberOfArguments < min ? std::string("few") : std::string("many");
        auto message = boost::format("Too %s arguments for command '%s'\n"
                                     "See 'cuvette help %s'") % quantity % command % command;
        printLog(message, libcuvette::LogLevel::GENERAL, std::cerr);
        CUVETTE_THROW_ERROR(message.str(), libcuvette::LogLevel::INFO);
    }
}

/**
 * Reads the whole content of a file, or of stdin when the argument is "-".
 */
std::string readInput(const std::string& fileOrDash) {
    if(fileOrDash == "-") {
        auto content = std::string{std::istreambuf_iterator<char>{std::cin}, std::istreambuf_iterator<char>{}};
        if(std::cin.bad()) {
            CUVETTE_THROW_ERROR("Failed to read from stdin");
        }
        return content;
    }
    return libcuvette::filesystem::readBinaryFile(boost::filesystem::absolute(fileOrDash));
}

void printLog(const std::string& message, libcuvette::LogLevel level, std::ostream& outStream, std::ostream& errStream) {
    libcuvette::Logger::getInstance().log(message, "CLI", level, outStream, errStream);
}

void printLog(const boost::format& message, libcuvette::LogLevel level, std::ostream& outStream, std::ostream& errStream) {
    printLog(message.str(), level, outStream, errStream);
}

} // namespace
} // namespace
} // namespace

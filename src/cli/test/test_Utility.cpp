/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <string>
#include <vector>

#include "libcuvette/PathRAII.hpp"
#include "libcuvette/Utility.hpp"
#include "cli/Utility.hpp"
#include "test_utility/unittest_main_function.hpp"

using namespace cuvette;

TEST_GROUP(CLIUtilityTestGroup) {
};

static boost::program_options::options_description makeExecuteLikeOptions() {
    auto optionsDescription = boost::program_options::options_description();
    optionsDescription.add_options()
        ("code-file", boost::program_options::value<std::string>(), "Code file")
        ("data-file,d", boost::program_options::value<std::vector<std::string>>(), "Data file")
        ("timeout,t", boost::program_options::value<int>(), "Timeout")
        ("verbose", "Verbose");
    return optionsDescription;
}

static std::vector<std::string> toVector(const libcuvette::CLIArguments& args) {
    return std::vector<std::string>(args.begin(), args.end());
}

TEST(CLIUtilityTestGroup, groupOptionsAndPositionalArguments) {
    auto optionsDescription = makeExecuteLikeOptions();
    libcuvette::CLIArguments nameAndOptionArgs, positionalArgs;

    // command name only
    std::tie(nameAndOptionArgs, positionalArgs) =
        cli::utility::groupOptionsAndPositionalArguments({"execute"}, optionsDescription);
    CHECK_EQUAL(nameAndOptionArgs.argc(), 1);
    CHECK(positionalArgs.empty());

    // separated and adjacent values
    std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(
        {"execute", "--code-file", "script.py", "--timeout=5", "-d", "a=a.csv", "-db=b.csv", "--verbose"},
        optionsDescription);
    CHECK(toVector(nameAndOptionArgs) == (std::vector<std::string>{
        "execute", "--code-file", "script.py", "--timeout=5", "-d", "a=a.csv", "-db=b.csv", "--verbose"}));
    CHECK(positionalArgs.empty());

    // the first positional argument ends the options
    std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(
        {"execute", "-t", "3", "extra", "--verbose"}, optionsDescription);
    CHECK(toVector(nameAndOptionArgs) == (std::vector<std::string>{"execute", "-t", "3"}));
    CHECK(toVector(positionalArgs) == (std::vector<std::string>{"extra", "--verbose"}));

    // stdin as value
    std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(
        {"execute", "--code-file", "-"}, optionsDescription);
    CHECK(toVector(nameAndOptionArgs) == (std::vector<std::string>{"execute", "--code-file", "-"}));
    CHECK(positionalArgs.empty());

    // option without value followed by a positional argument
    std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(
        {"execute", "--verbose", "extra"}, optionsDescription);
    CHECK(toVector(nameAndOptionArgs) == (std::vector<std::string>{"execute", "--verbose"}));
    CHECK(toVector(positionalArgs) == (std::vector<std::string>{"extra"}));
}

TEST(CLIUtilityTestGroup, validateNumberOfPositionalArguments) {
    cli::utility::validateNumberOfPositionalArguments({}, 0, 0, "execute");
    cli::utility::validateNumberOfPositionalArguments({"execute"}, 1, 1, "help");
    CHECK_THROWS(libcuvette::Error, cli::utility::validateNumberOfPositionalArguments({"extra"}, 0, 0, "execute"));
    CHECK_THROWS(libcuvette::Error, cli::utility::validateNumberOfPositionalArguments({}, 1, 2, "help"));
}

TEST(CLIUtilityTestGroup, readInput) {
    auto directory = libcuvette::PathRAII{libcuvette::filesystem::makeUniqueDirectory("/tmp/cuvette-test-cli-utility")};
    auto file = directory.getPath() / "script.py";
    libcuvette::filesystem::writeTextFile("import pandas as pd\n", file);

    CHECK_EQUAL(cli::utility::readInput(file.string()), std::string{"import pandas as pd\n"});
    CHECK_THROWS(libcuvette::Error, cli::utility::readInput((directory.getPath() / "missing.py").string()));
}

CUVETTE_UNITTEST_MAIN_FUNCTION();

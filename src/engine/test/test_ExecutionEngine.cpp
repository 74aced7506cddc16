/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <atomic>
#include <iterator>
#include <chrono>
#include <thread>
#include <vector>

#include <boost/filesystem.hpp>

#include "test_utility/config.hpp"
#include "test_utility/runtime.hpp"
#include "libcuvette/Utility.hpp"
#include "engine/Errors.hpp"
#include "engine/ExecutionEngine.hpp"
#include "test_utility/unittest_main_function.hpp"

using namespace cuvette;

TEST_GROUP(ExecutionEngineTestGroup) {
};

static boost::filesystem::path getRuntime(const test_utility::config::ConfigRAII& configRAII) {
    return configRAII.config->json["runtimePath"].GetString();
}

static std::size_t countEntries(const boost::filesystem::path& directory) {
    if(!boost::filesystem::exists(directory)) {
        return 0;
    }
    return static_cast<std::size_t>(std::distance(boost::filesystem::directory_iterator{directory},
                                                  boost::filesystem::directory_iterator{}));
}

static bool contains(const std::string& s, const std::string& substring) {
    return s.find(substring) != std::string::npos;
}

static engine::ExecutionRequest makeRequest(const std::string& code) {
    auto request = engine::ExecutionRequest{};
    request.code = code;
    return request;
}

TEST(ExecutionEngineTestGroup, textResult) {
    auto configRAII = test_utility::config::makeConfig();
    auto runtime = test_utility::runtime::writeFakeRuntime(getRuntime(configRAII), "echo 4");
    auto executionEngine = engine::ExecutionEngine{configRAII.config};

    auto result = executionEngine.execute(makeRequest("print(2 + 2)"));

    CHECK_EQUAL(result.output, std::string{"4\n"});
    CHECK_EQUAL(result.stdoutText, std::string{"4\n"});
    CHECK_EQUAL(result.stderrText, std::string{""});
    CHECK_EQUAL(result.exitCode, 0);
    CHECK(result.kind == engine::ResultKind::TEXT);
    CHECK_FALSE(result.binaryOutput);
    CHECK(result.createdFiles.empty());
    CHECK(result.elapsedSeconds >= 0);

    // the guest received the transformed code
    auto script = test_utility::runtime::readLastScript(runtime);
    CHECK_EQUAL(script, result.executedCode);
    CHECK(contains(script, engine::CodeTransformer::preludeBeginMarker));
    CHECK(contains(script, "print(2 + 2)"));

    // and ran isolated
    auto arguments = test_utility::runtime::readLastArguments(runtime);
    CHECK(contains(arguments, "--network\nnone\n"));
    CHECK(contains(arguments, "-e\nOUTPUT_DIR=/sandbox/output\n"));
}

TEST(ExecutionEngineTestGroup, binaryArtifactResult) {
    auto configRAII = test_utility::config::makeConfig();

    auto png = std::string{"\x89PNG\r\n\x1a\n"}
        + std::string{"\0\0\0\x0d", 4} + "IHDR"
        + std::string{"\0\0\x03\x20", 4} + std::string{"\0\0\x02\x58", 4}
        + std::string{"\x08\x06\0\0\0", 5};
    auto fixture = configRAII.getPrefixDir() / "fixture.png";
    libcuvette::filesystem::writeTextFile(png, fixture, std::ios_base::out | std::ios_base::binary);

    test_utility::runtime::writeFakeRuntime(getRuntime(configRAII), "cp " + fixture.string() + " \"$OUTPUT/plot.png\"");
    auto executionEngine = engine::ExecutionEngine{configRAII.config};

    auto code = std::string{
        "import matplotlib.pyplot as plt\n"
        "plt.plot([1, 2, 3], [1, 4, 9])\n"
        "plt.savefig('plot.png')\n"};
    auto result = executionEngine.execute(makeRequest(code));

    CHECK(result.kind == engine::ResultKind::BINARY_ARTIFACT);
    CHECK(result.binaryOutput);
    CHECK_EQUAL(result.binaryOutput->mimeType, std::string{"image/png"});
    CHECK_EQUAL(result.binaryOutput->filename, std::string{"plot.png"});
    CHECK_EQUAL(result.binaryOutput->sizeBytes, png.size());
    CHECK_EQUAL(*result.binaryOutput->width, 800u);
    CHECK_EQUAL(*result.binaryOutput->height, 600u);
    CHECK(libcuvette::base64::decode(result.binaryOutput->base64Data) == png);
    CHECK_EQUAL(result.binaryOutput->sourceCode, result.executedCode);
    CHECK(contains(result.executedCode, "plt.savefig(_cuvette_output_path('plot.png'))"));

    CHECK_EQUAL(result.createdFiles.size(), static_cast<std::size_t>(1));
    CHECK(result.createdFiles.front().kind == engine::ContentKind::IMAGE);
}

TEST(ExecutionEngineTestGroup, dataFileResolution) {
    auto configRAII = test_utility::config::makeConfig();
    auto dataFile = configRAII.getPrefixDir() / "data/patients.csv";
    libcuvette::filesystem::writeTextFile("id,age\n1,30\n2,40\n3,50\n", dataFile);

    test_utility::runtime::writeFakeRuntime(getRuntime(configRAII),
        "grep -q '\"patients\"' \"$INPUT/manifest.json\" || exit 9\n"
        "echo $(tail -n +2 \"$INPUT/patients.csv\" | wc -l)");
    auto executionEngine = engine::ExecutionEngine{configRAII.config};

    auto request = makeRequest(
        "import pandas as pd\n"
        "df = pd.read_csv('patients')\n"
        "print(len(df))\n");
    request.dataFiles = {{"patients", dataFile.string()}};
    auto result = executionEngine.execute(request);

    CHECK_EQUAL(result.output, std::string{"3\n"});
    CHECK(contains(result.executedCode, "def resolve_file(name):"));
}

TEST(ExecutionEngineTestGroup, unresolvableDataFile) {
    auto configRAII = test_utility::config::makeConfig();
    auto runtime = test_utility::runtime::writeFakeRuntime(getRuntime(configRAII), "echo unreachable");
    auto executionEngine = engine::ExecutionEngine{configRAII.config};

    auto request = makeRequest("print(1)");
    request.dataFiles = {{"missing", "no such upload"}};
    CHECK_THROWS(engine::SetupError, executionEngine.execute(request));

    // nothing was spawned
    CHECK_FALSE(boost::filesystem::exists(runtime.parent_path() / "last-arguments"));
    CHECK_EQUAL(countEntries(configRAII.getPrefixDir() / "tmp"), static_cast<std::size_t>(0));
}

TEST(ExecutionEngineTestGroup, guestExecutionError) {
    auto configRAII = test_utility::config::makeConfig();
    test_utility::runtime::writeFakeRuntime(getRuntime(configRAII),
        "echo 'Traceback (most recent call last):' >&2\n"
        "echo \"FileNotFoundError: [Errno 2] No such file or directory: 'nonexistent.csv'\" >&2\n"
        "exit 1");
    auto executionEngine = engine::ExecutionEngine{configRAII.config};

    try {
        executionEngine.execute(makeRequest("import pandas as pd\npd.read_csv('nonexistent.csv')\n"));
        FAIL("expected exception");
    }
    catch(const engine::GuestExecutionError& e) {
        CHECK_EQUAL(e.getExitCode(), 1);
        CHECK(contains(e.getStderr(), "FileNotFoundError"));
        CHECK(contains(e.what(), "FileNotFoundError"));
        // the engine appended its own trace entry
        CHECK(e.getErrorTrace().size() >= 2);
    }
    CHECK_EQUAL(countEntries(configRAII.getPrefixDir() / "tmp"), static_cast<std::size_t>(0));
}

TEST(ExecutionEngineTestGroup, guestExitingWithRuntimeSetupExitCode) {
    auto configRAII = test_utility::config::makeConfig();
    test_utility::runtime::writeFakeRuntime(getRuntime(configRAII), "echo 'bye' >&2; exit 125");
    auto executionEngine = engine::ExecutionEngine{configRAII.config};

    try {
        executionEngine.execute(makeRequest("import sys\nsys.exit(125)\n"));
        FAIL("expected exception");
    }
    catch(const engine::GuestExecutionError& e) {
        CHECK_EQUAL(e.getExitCode(), 125);
        CHECK_EQUAL(e.getStderr(), std::string{"bye\n"});
    }
    CHECK_EQUAL(countEntries(configRAII.getPrefixDir() / "tmp"), static_cast<std::size_t>(0));
}

TEST(ExecutionEngineTestGroup, timeoutError) {
    auto configRAII = test_utility::config::makeConfig();
    test_utility::runtime::writeFakeRuntime(getRuntime(configRAII), "sleep 30");
    auto executionEngine = engine::ExecutionEngine{configRAII.config};

    auto request = makeRequest("import time\ntime.sleep(30)\n");
    request.timeoutSeconds = 1;

    auto start = std::chrono::steady_clock::now();
    try {
        executionEngine.execute(request);
        FAIL("expected exception");
    }
    catch(const engine::TimeoutError& e) {
        CHECK_EQUAL(e.getTimeout().count(), 1);
    }
    CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds{10});
    CHECK_EQUAL(countEntries(configRAII.getPrefixDir() / "tmp"), static_cast<std::size_t>(0));
}

TEST(ExecutionEngineTestGroup, runtimeNotAvailable) {
    auto configRAII = test_utility::config::makeConfig();
    configRAII.setRuntimePath("/cuvette-nonexistent/docker");
    auto executionEngine = engine::ExecutionEngine{configRAII.config};

    CHECK_THROWS(engine::SetupError, executionEngine.execute(makeRequest("print(1)")));
    CHECK_EQUAL(countEntries(configRAII.getPrefixDir() / "tmp"), static_cast<std::size_t>(0));
}

TEST(ExecutionEngineTestGroup, invalidRequest) {
    auto configRAII = test_utility::config::makeConfig();
    auto runtime = test_utility::runtime::writeFakeRuntime(getRuntime(configRAII), "echo unreachable");
    auto executionEngine = engine::ExecutionEngine{configRAII.config};

    CHECK_THROWS(engine::InvalidRequestError, executionEngine.execute(makeRequest("   ")));

    // rejected before provisioning: no staging directory, no run log
    CHECK_EQUAL(countEntries(configRAII.getPrefixDir() / "tmp"), static_cast<std::size_t>(0));
    CHECK_EQUAL(countEntries(configRAII.getPrefixDir() / "logs"), static_cast<std::size_t>(0));
    CHECK_FALSE(boost::filesystem::exists(runtime.parent_path() / "last-arguments"));
}

TEST(ExecutionEngineTestGroup, createdFilesWithoutImage) {
    auto configRAII = test_utility::config::makeConfig();
    test_utility::runtime::writeFakeRuntime(getRuntime(configRAII),
        "mkdir -p \"$OUTPUT/reports\"\n"
        "printf 'a,b\\n1,2\\n' > \"$OUTPUT/reports/summary.csv\"\n"
        "echo done");
    auto executionEngine = engine::ExecutionEngine{configRAII.config};

    auto result = executionEngine.execute(makeRequest("df.to_csv('reports/summary.csv')\nprint('done')\n"));

    CHECK(result.kind == engine::ResultKind::TEXT);
    CHECK_FALSE(result.binaryOutput);
    CHECK_EQUAL(result.createdFiles.size(), static_cast<std::size_t>(1));
    CHECK_EQUAL(result.createdFiles.front().filename, std::string{"reports/summary.csv"});
    CHECK_EQUAL(result.createdFiles.front().mimeType, std::string{"text/csv"});
    CHECK_EQUAL(result.createdFiles.front().sizeBytes, static_cast<std::size_t>(8));
}

TEST(ExecutionEngineTestGroup, runLog) {
    auto configRAII = test_utility::config::makeConfig();
    test_utility::runtime::writeFakeRuntime(getRuntime(configRAII), "echo hello");
    auto executionEngine = engine::ExecutionEngine{configRAII.config};

    executionEngine.execute(makeRequest("print('hello')"));

    auto logsDir = configRAII.getPrefixDir() / "logs";
    CHECK_EQUAL(countEntries(logsDir), static_cast<std::size_t>(1));
    auto logFile = boost::filesystem::directory_iterator{logsDir}->path();
    auto log = libcuvette::filesystem::readFile(logFile);
    CHECK(contains(log, "[PROVISIONING]"));
    CHECK(contains(log, "[RESOLUTION]"));
    CHECK(contains(log, "[TRANSFORMATION]"));
    CHECK(contains(log, "[EXECUTION] [stdout] hello"));
    CHECK(contains(log, "[RECONCILIATION]"));
    CHECK(contains(log, "[CLEANUP] Execution succeeded"));
}

TEST(ExecutionEngineTestGroup, concurrentExecutions) {
    auto configRAII = test_utility::config::makeConfig();
    test_utility::runtime::writeFakeRuntime(getRuntime(configRAII),
        "echo \"$(basename \"$(dirname \"$OUTPUT\")\")\"");
    auto executionEngine = engine::ExecutionEngine{configRAII.config};

    const int numberOfExecutions = 4;
    auto outputs = std::vector<std::string>(numberOfExecutions);
    std::atomic<int> failures{0};

    auto threads = std::vector<std::thread>{};
    for(int i=0; i<numberOfExecutions; ++i) {
        threads.emplace_back([&executionEngine, &outputs, &failures, i]() {
            try {
                outputs[i] = executionEngine.execute(makeRequest("print(" + std::to_string(i) + ")")).output;
            }
            catch(const std::exception&) {
                ++failures;
            }
        });
    }
    for(auto& thread : threads) {
        thread.join();
    }

    CHECK_EQUAL(failures.load(), 0);
    // every execution got its own staging directories
    for(int i=0; i<numberOfExecutions; ++i) {
        CHECK(contains(outputs[i], "cuvette-run-"));
        for(int j=i+1; j<numberOfExecutions; ++j) {
            CHECK(outputs[i] != outputs[j]);
        }
    }
    CHECK_EQUAL(countEntries(configRAII.getPrefixDir() / "tmp"), static_cast<std::size_t>(0));
    CHECK_EQUAL(countEntries(configRAII.getPrefixDir() / "logs"), static_cast<std::size_t>(numberOfExecutions));
}

CUVETTE_UNITTEST_MAIN_FUNCTION();

/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <cstdint>

#include <boost/filesystem.hpp>

#include "test_utility/config.hpp"
#include "libcuvette/Utility.hpp"
#include "engine/OutputReconciler.hpp"
#include "test_utility/unittest_main_function.hpp"

using namespace cuvette;

TEST_GROUP(OutputReconcilerTestGroup) {
};

static std::string makePNG(unsigned char width, unsigned char height) {
    auto bytes = std::string{"\x89PNG\r\n\x1a\n"};
    bytes += std::string{"\0\0\0\x0d", 4} + "IHDR";
    bytes += std::string{"\0\0\0", 3} + static_cast<char>(width);
    bytes += std::string{"\0\0\0", 3} + static_cast<char>(height);
    bytes += std::string{"\x08\x06\0\0\0", 5};
    return bytes;
}

static void writeBinaryFile(const std::string& bytes, const boost::filesystem::path& file) {
    libcuvette::filesystem::writeTextFile(bytes, file, std::ios_base::out | std::ios_base::binary);
}

TEST(OutputReconcilerTestGroup, snapshot) {
    auto configRAII = test_utility::config::makeConfig();
    auto reconciler = engine::OutputReconciler{configRAII.config};
    auto outputRoot = configRAII.getPrefixDir() / "output";

    libcuvette::filesystem::writeTextFile("1", outputRoot / "a.txt");
    libcuvette::filesystem::writeTextFile("2", outputRoot / "nested/deeper/b.txt");
    boost::filesystem::create_directories(outputRoot / "empty");
    boost::filesystem::create_symlink("/etc/hostname", outputRoot / "link");

    auto snapshot = reconciler.snapshot(outputRoot);
    CHECK(snapshot == (engine::OutputSnapshot{"a.txt", "nested/deeper/b.txt"}));

    CHECK(reconciler.snapshot(configRAII.getPrefixDir() / "nonexistent").empty());
}

TEST(OutputReconcilerTestGroup, diff) {
    auto before = engine::OutputSnapshot{"a", "b"};
    auto after = engine::OutputSnapshot{"a", "b", "c", "d/e"};
    auto candidates = engine::OutputReconciler::diff(before, after);
    CHECK(candidates == (std::vector<std::string>{"c", "d/e"}));

    CHECK(engine::OutputReconciler::diff(after, before).empty());
}

TEST(OutputReconcilerTestGroup, reconcile) {
    auto configRAII = test_utility::config::makeConfig();
    auto reconciler = engine::OutputReconciler{configRAII.config};
    auto outputRoot = configRAII.getPrefixDir() / "output";

    libcuvette::filesystem::writeTextFile("preexisting", outputRoot / "old.txt");
    auto before = reconciler.snapshot(outputRoot);

    writeBinaryFile(makePNG(30, 20), outputRoot / "b_chart.png");
    writeBinaryFile(makePNG(40, 10), outputRoot / "a_chart.png");
    libcuvette::filesystem::writeTextFile("x,y\n", outputRoot / "reports/summary.csv");

    auto reconciled = reconciler.reconcile(outputRoot, before, "executed code");

    CHECK_EQUAL(reconciled.createdFiles.size(), static_cast<std::size_t>(3));
    const auto& first = reconciled.createdFiles[0];
    const auto& second = reconciled.createdFiles[1];
    const auto& third = reconciled.createdFiles[2];

    CHECK_EQUAL(first.filename, std::string{"a_chart.png"});
    CHECK(first.kind == engine::ContentKind::IMAGE);
    CHECK_EQUAL(first.mimeType, std::string{"image/png"});
    CHECK(first.base64Data);
    CHECK_EQUAL(*first.width, 40u);
    CHECK_EQUAL(*first.height, 10u);
    CHECK_FALSE(first.fileId);

    CHECK_EQUAL(second.filename, std::string{"b_chart.png"});

    CHECK_EQUAL(third.filename, std::string{"reports/summary.csv"});
    CHECK(third.kind == engine::ContentKind::GENERIC);
    CHECK_EQUAL(third.mimeType, std::string{"text/csv"});
    CHECK_EQUAL(third.sizeBytes, static_cast<std::size_t>(4));
    CHECK_FALSE(third.base64Data);

    // the first image in name order is the primary output
    CHECK(reconciled.primaryOutput);
    CHECK_EQUAL(reconciled.primaryOutput->filename, std::string{"a_chart.png"});
    CHECK_EQUAL(reconciled.primaryOutput->base64Data, *first.base64Data);
    CHECK(libcuvette::base64::decode(reconciled.primaryOutput->base64Data) == makePNG(40, 10));
    CHECK_EQUAL(reconciled.primaryOutput->sourceCode, std::string{"executed code"});
}

TEST(OutputReconcilerTestGroup, noImagesNoPrimaryOutput) {
    auto configRAII = test_utility::config::makeConfig();
    auto reconciler = engine::OutputReconciler{configRAII.config};
    auto outputRoot = configRAII.getPrefixDir() / "output";
    boost::filesystem::create_directories(outputRoot);

    auto before = reconciler.snapshot(outputRoot);
    libcuvette::filesystem::writeTextFile("%PDF-1.4\n", outputRoot / "report.pdf");

    auto reconciled = reconciler.reconcile(outputRoot, before, "");
    CHECK_EQUAL(reconciled.createdFiles.size(), static_cast<std::size_t>(1));
    CHECK_EQUAL(reconciled.createdFiles.front().mimeType, std::string{"application/pdf"});
    CHECK_FALSE(reconciled.primaryOutput);
}

TEST(OutputReconcilerTestGroup, persistCreatedFiles) {
    auto configRAII = test_utility::config::makeConfig();
    configRAII.config->json["persistCreatedFiles"].SetBool(true);
    auto reconciler = engine::OutputReconciler{configRAII.config};
    auto outputRoot = configRAII.getPrefixDir() / "output";
    boost::filesystem::create_directories(outputRoot);

    auto before = reconciler.snapshot(outputRoot);
    writeBinaryFile(makePNG(1, 1), outputRoot / "plot.png");

    auto reconciled = reconciler.reconcile(outputRoot, before, "plt.savefig('plot.png')");
    const auto& file = reconciled.createdFiles.front();
    CHECK(file.fileId);

    auto uploadsDir = configRAII.getPrefixDir() / "uploads";
    CHECK(boost::filesystem::is_regular_file(uploadsDir / *file.fileId));
    auto metadata = libcuvette::json::read(uploadsDir / "metadata" / (*file.fileId + ".json"));
    CHECK_EQUAL(metadata["sourceCode"].GetString(), std::string{"plt.savefig('plot.png')"});
    CHECK_EQUAL(metadata["mimeType"].GetString(), std::string{"image/png"});
}

CUVETTE_UNITTEST_MAIN_FUNCTION();

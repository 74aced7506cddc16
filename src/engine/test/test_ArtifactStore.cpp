/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <boost/filesystem.hpp>

#include "test_utility/config.hpp"
#include "libcuvette/Utility.hpp"
#include "engine/ArtifactStore.hpp"
#include "test_utility/unittest_main_function.hpp"

using namespace cuvette;

TEST_GROUP(ArtifactStoreTestGroup) {
};

TEST(ArtifactStoreTestGroup, isFileId) {
    CHECK(engine::ArtifactStore::isFileId("0f8fad5b-d9cb-469f-a165-70867728950e"));
    CHECK(engine::ArtifactStore::isFileId("0F8FAD5B-D9CB-469F-A165-70867728950E"));
    CHECK_FALSE(engine::ArtifactStore::isFileId("0f8fad5b-d9cb-469f-a165"));
    CHECK_FALSE(engine::ArtifactStore::isFileId("patients.csv"));
    CHECK_FALSE(engine::ArtifactStore::isFileId("../0f8fad5b-d9cb-469f-a165-70867728950e"));
}

TEST(ArtifactStoreTestGroup, storeAndResolve) {
    auto configRAII = test_utility::config::makeConfig();
    auto uploadsDir = configRAII.getPrefixDir() / "uploads";
    auto store = engine::ArtifactStore{uploadsDir};

    auto file = configRAII.getPrefixDir() / "summary.csv";
    libcuvette::filesystem::writeTextFile("a,b\n1,2\n", file);

    auto fileId = store.store(file, "summary.csv", "text/csv", "df.to_csv('summary.csv')");
    CHECK(engine::ArtifactStore::isFileId(fileId));
    CHECK_EQUAL(libcuvette::filesystem::readFile(uploadsDir / fileId), std::string{"a,b\n1,2\n"});

    auto metadata = libcuvette::json::read(uploadsDir / "metadata" / (fileId + ".json"));
    CHECK_EQUAL(metadata["description"].GetString(), std::string{"Generated file: summary.csv"});
    CHECK_EQUAL(metadata["originalFilename"].GetString(), std::string{"summary.csv"});
    CHECK_EQUAL(metadata["mimeType"].GetString(), std::string{"text/csv"});
    CHECK_EQUAL(metadata["schema"]["format"].GetString(), std::string{"csv"});
    CHECK_EQUAL(metadata["schema"]["encoding"].GetString(), std::string{"utf-8"});
    CHECK_EQUAL(metadata["sourceCode"].GetString(), std::string{"df.to_csv('summary.csv')"});
    CHECK_EQUAL(metadata["size"].GetUint64(), static_cast<uint64_t>(8));

    // by id
    auto byId = store.resolve(fileId);
    CHECK(byId);
    CHECK_EQUAL(byId->fileId, fileId);
    CHECK_EQUAL(byId->file.string(), (uploadsDir / fileId).string());
    CHECK(*byId->metadata.originalFilename == "summary.csv");
    CHECK(*byId->metadata.format == "csv");

    // by description
    auto byDescription = store.resolve("Generated file: summary.csv");
    CHECK(byDescription);
    CHECK_EQUAL(byDescription->fileId, fileId);

    CHECK_FALSE(store.resolve("unknown"));
    CHECK_FALSE(store.resolve("00000000-0000-0000-0000-000000000000"));
}

TEST(ArtifactStoreTestGroup, uploadWithoutMetadata) {
    auto configRAII = test_utility::config::makeConfig();
    auto uploadsDir = configRAII.getPrefixDir() / "uploads";
    auto fileId = std::string{"0f8fad5b-d9cb-469f-a165-70867728950e"};
    libcuvette::filesystem::writeTextFile("content", uploadsDir / fileId);

    auto artifact = engine::ArtifactStore{uploadsDir}.resolve(fileId);
    CHECK(artifact);
    CHECK_FALSE(artifact->metadata.description);
    CHECK_FALSE(artifact->metadata.originalFilename);
}

TEST(ArtifactStoreTestGroup, invalidMetadataIsSkipped) {
    auto configRAII = test_utility::config::makeConfig();
    auto uploadsDir = configRAII.getPrefixDir() / "uploads";
    auto fileId = std::string{"0f8fad5b-d9cb-469f-a165-70867728950e"};
    libcuvette::filesystem::writeTextFile("content", uploadsDir / fileId);
    libcuvette::filesystem::writeTextFile("{invalid", uploadsDir / "metadata" / (fileId + ".json"));

    auto store = engine::ArtifactStore{uploadsDir};
    auto artifact = store.resolve(fileId);
    CHECK(artifact);
    CHECK_FALSE(artifact->metadata.description);
    CHECK_FALSE(store.resolve("content"));
}

TEST(ArtifactStoreTestGroup, missingUploadsDir) {
    auto store = engine::ArtifactStore{"/cuvette-nonexistent/uploads"};
    CHECK_FALSE(store.resolve("0f8fad5b-d9cb-469f-a165-70867728950e"));
    CHECK_FALSE(store.resolve("description"));
}

CUVETTE_UNITTEST_MAIN_FUNCTION();

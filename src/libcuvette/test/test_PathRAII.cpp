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

#include "libcuvette/PathRAII.hpp"
#include "libcuvette/Utility.hpp"
#include "test_utility/unittest_main_function.hpp"


namespace libcuvette {
namespace test {

TEST_GROUP(PathRAIITestGroup) {
};

TEST(PathRAIITestGroup, removesPathOnDestruction) {
    auto path = boost::filesystem::path{};
    {
        auto raii = libcuvette::PathRAII{libcuvette::filesystem::makeUniqueDirectory("/tmp/cuvette-test-pathraii")};
        path = raii.getPath();
        libcuvette::filesystem::writeTextFile("content", path / "dir/file");
        CHECK(boost::filesystem::exists(path / "dir/file"));
    }
    CHECK_FALSE(boost::filesystem::exists(path));
}

TEST(PathRAIITestGroup, removesFilesWithoutOwnerPermissions) {
    auto path = boost::filesystem::path{};
    {
        auto raii = libcuvette::PathRAII{libcuvette::filesystem::makeUniqueDirectory("/tmp/cuvette-test-pathraii")};
        path = raii.getPath();
        libcuvette::filesystem::writeTextFile("content", path / "locked/file");
        boost::filesystem::permissions(path / "locked/file", boost::filesystem::perms::owner_read);
        boost::filesystem::permissions(path / "locked", boost::filesystem::perms::owner_read);
    }
    CHECK_FALSE(boost::filesystem::exists(path));
}

TEST(PathRAIITestGroup, release) {
    auto path = libcuvette::filesystem::makeUniqueDirectory("/tmp/cuvette-test-pathraii");
    {
        auto raii = libcuvette::PathRAII{path};
        CHECK(raii.isManaging());
        CHECK_EQUAL(raii.release().string(), path.string());
        CHECK_FALSE(raii.isManaging());
        CHECK(raii.release().empty());
    }
    CHECK(boost::filesystem::exists(path));
    boost::filesystem::remove_all(path);
}

TEST(PathRAIITestGroup, moveTransfersOwnership) {
    auto path = libcuvette::filesystem::makeUniqueDirectory("/tmp/cuvette-test-pathraii");
    {
        auto source = libcuvette::PathRAII{path};
        auto destination = libcuvette::PathRAII{std::move(source)};
        CHECK_FALSE(source.isManaging());
        CHECK(destination.isManaging());
        CHECK_EQUAL(destination.getPath().string(), path.string());
    }
    CHECK_FALSE(boost::filesystem::exists(path));
}

TEST(PathRAIITestGroup, moveAssignmentRemovesPreviousPath) {
    auto first = libcuvette::filesystem::makeUniqueDirectory("/tmp/cuvette-test-pathraii");
    auto second = libcuvette::filesystem::makeUniqueDirectory("/tmp/cuvette-test-pathraii");
    {
        auto raii = libcuvette::PathRAII{first};
        raii = libcuvette::PathRAII{second};
        CHECK_FALSE(boost::filesystem::exists(first));
        CHECK(boost::filesystem::exists(second));
    }
    CHECK_FALSE(boost::filesystem::exists(second));
}

TEST(PathRAIITestGroup, removeIsIdempotent) {
    auto raii = libcuvette::PathRAII{libcuvette::filesystem::makeUniqueDirectory("/tmp/cuvette-test-pathraii")};
    auto path = raii.getPath();
    raii.remove();
    CHECK_FALSE(boost::filesystem::exists(path));
    CHECK_FALSE(raii.isManaging());
    raii.remove();
}

}}

CUVETTE_UNITTEST_MAIN_FUNCTION();

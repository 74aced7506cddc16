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
#include <string>

#include "engine/ContentSignature.hpp"
#include "test_utility/unittest_main_function.hpp"

using namespace cuvette;

TEST_GROUP(ContentSignatureTestGroup) {
};

static std::string bigEndian(uint32_t value, std::size_t size) {
    auto bytes = std::string(size, '\0');
    for(std::size_t i = 0; i < size; ++i) {
        bytes[size - i - 1] = static_cast<char>((value >> (8 * i)) & 0xFF);
    }
    return bytes;
}

static std::string littleEndian(uint32_t value, std::size_t size) {
    auto bytes = std::string(size, '\0');
    for(std::size_t i = 0; i < size; ++i) {
        bytes[i] = static_cast<char>((value >> (8 * i)) & 0xFF);
    }
    return bytes;
}

static std::string makePNG(uint32_t width, uint32_t height) {
    return std::string{"\x89PNG\r\n\x1a\n"}
        + bigEndian(13, 4) + "IHDR"
        + bigEndian(width, 4) + bigEndian(height, 4)
        + std::string{"\x08\x06\x00\x00\x00", 5};
}

static std::string makeGIF(uint32_t width, uint32_t height) {
    return std::string{"GIF89a"} + littleEndian(width, 2) + littleEndian(height, 2) + std::string(4, '\0');
}

static std::string makeBMP(int32_t width, int32_t height) {
    return std::string{"BM"} + std::string(12, '\0')
        + littleEndian(40, 4)
        + littleEndian(static_cast<uint32_t>(width), 4)
        + littleEndian(static_cast<uint32_t>(height), 4)
        + std::string(16, '\0');
}

static std::string makeJPEG(uint32_t width, uint32_t height) {
    return std::string{"\xff\xd8"}
        + std::string{"\xff\xe0"} + bigEndian(16, 2) + std::string(14, 'J')
        + std::string{"\xff\xc0"} + bigEndian(17, 2) + std::string{"\x08"}
        + bigEndian(height, 2) + bigEndian(width, 2)
        + std::string(12, '\0');
}

static std::string makeWEBPExtended(uint32_t width, uint32_t height) {
    return std::string{"RIFF"} + littleEndian(22, 4) + "WEBP"
        + "VP8X" + littleEndian(10, 4) + littleEndian(0, 4)
        + littleEndian(width - 1, 3) + littleEndian(height - 1, 3);
}

TEST(ContentSignatureTestGroup, png) {
    auto signature = engine::detectContentSignature(makePNG(800, 600), "plot.png");
    CHECK(signature.kind == engine::ContentKind::IMAGE);
    CHECK_EQUAL(signature.mimeType, std::string{"image/png"});
    CHECK(signature.dimensions);
    CHECK_EQUAL(signature.dimensions->width, 800u);
    CHECK_EQUAL(signature.dimensions->height, 600u);
}

TEST(ContentSignatureTestGroup, contentWinsOverExtension) {
    auto signature = engine::detectContentSignature(makePNG(10, 20), "misnamed.txt");
    CHECK(signature.kind == engine::ContentKind::IMAGE);
    CHECK_EQUAL(signature.mimeType, std::string{"image/png"});

    signature = engine::detectContentSignature("not an image", "fake.png");
    CHECK(signature.kind == engine::ContentKind::GENERIC);
    CHECK_EQUAL(signature.mimeType, std::string{"image/png"});
}

TEST(ContentSignatureTestGroup, truncatedPNGHasNoDimensions) {
    auto bytes = std::string{"\x89PNG\r\n\x1a\n"};
    auto signature = engine::detectContentSignature(bytes, "plot.png");
    CHECK(signature.kind == engine::ContentKind::IMAGE);
    CHECK_FALSE(signature.dimensions);
}

TEST(ContentSignatureTestGroup, gif) {
    auto signature = engine::detectContentSignature(makeGIF(320, 200), "anim.gif");
    CHECK_EQUAL(signature.mimeType, std::string{"image/gif"});
    CHECK_EQUAL(signature.dimensions->width, 320u);
    CHECK_EQUAL(signature.dimensions->height, 200u);
}

TEST(ContentSignatureTestGroup, bmp) {
    auto signature = engine::detectContentSignature(makeBMP(64, 32), "image.bmp");
    CHECK_EQUAL(signature.mimeType, std::string{"image/bmp"});
    CHECK_EQUAL(signature.dimensions->width, 64u);
    CHECK_EQUAL(signature.dimensions->height, 32u);

    // top-down bitmap
    signature = engine::detectContentSignature(makeBMP(64, -32), "image.bmp");
    CHECK_EQUAL(signature.dimensions->height, 32u);
}

TEST(ContentSignatureTestGroup, jpeg) {
    auto signature = engine::detectContentSignature(makeJPEG(1024, 768), "photo.jpg");
    CHECK(signature.kind == engine::ContentKind::IMAGE);
    CHECK_EQUAL(signature.mimeType, std::string{"image/jpeg"});
    CHECK_EQUAL(signature.dimensions->width, 1024u);
    CHECK_EQUAL(signature.dimensions->height, 768u);
}

TEST(ContentSignatureTestGroup, webp) {
    auto signature = engine::detectContentSignature(makeWEBPExtended(500, 400), "image.webp");
    CHECK_EQUAL(signature.mimeType, std::string{"image/webp"});
    CHECK_EQUAL(signature.dimensions->width, 500u);
    CHECK_EQUAL(signature.dimensions->height, 400u);
}

TEST(ContentSignatureTestGroup, documents) {
    auto pdf = engine::detectContentSignature("%PDF-1.7\n...", "report");
    CHECK(pdf.kind == engine::ContentKind::GENERIC);
    CHECK_EQUAL(pdf.mimeType, std::string{"application/pdf"});

    auto svg = engine::detectContentSignature("<?xml version=\"1.0\"?>\n<svg xmlns=\"http://www.w3.org/2000/svg\"/>", "chart");
    CHECK(svg.kind == engine::ContentKind::GENERIC);
    CHECK_EQUAL(svg.mimeType, std::string{"image/svg+xml"});

    auto inlineSvg = engine::detectContentSignature("  <svg></svg>", "chart");
    CHECK_EQUAL(inlineSvg.mimeType, std::string{"image/svg+xml"});
}

TEST(ContentSignatureTestGroup, mimeTypeFromExtension) {
    CHECK_EQUAL(engine::mimeTypeFromExtension("summary.csv"), std::string{"text/csv"});
    CHECK_EQUAL(engine::mimeTypeFromExtension("REPORT.JSON"), std::string{"application/json"});
    CHECK_EQUAL(engine::mimeTypeFromExtension("notes.txt"), std::string{"text/plain"});
    CHECK_EQUAL(engine::mimeTypeFromExtension("data.xlsx"),
                std::string{"application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"});
    CHECK_EQUAL(engine::mimeTypeFromExtension("no_extension"), std::string{"application/octet-stream"});
    CHECK_EQUAL(engine::mimeTypeFromExtension("weird.xyz"), std::string{"application/octet-stream"});
}

TEST(ContentSignatureTestGroup, detectImageMimeType) {
    CHECK(*engine::detectImageMimeType(makePNG(1, 1)) == "image/png");
    CHECK(*engine::detectImageMimeType(makeJPEG(1, 1)) == "image/jpeg");
    CHECK_FALSE(engine::detectImageMimeType(""));
    CHECK_FALSE(engine::detectImageMimeType("BM"));
    CHECK_FALSE(engine::detectImageMimeType("hello world"));
}

TEST(ContentSignatureTestGroup, readImageDimensionsOfUnknownType) {
    CHECK_FALSE(engine::readImageDimensions(makePNG(1, 1), "image/svg+xml"));
}

CUVETTE_UNITTEST_MAIN_FUNCTION();

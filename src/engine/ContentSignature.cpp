/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "ContentSignature.hpp"

#include <cstdint>
#include <unordered_map>

#include <boost/algorithm/string.hpp>

#include "libcuvette/Utility.hpp"


namespace cuvette {
namespace engine {

namespace {

bool startsWith(const std::string& bytes, const std::string& prefix, std::size_t offset = 0) {
    return bytes.size() >= offset + prefix.size()
        && bytes.compare(offset, prefix.size(), prefix) == 0;
}

uint32_t readBigEndian(const std::string& bytes, std::size_t offset, std::size_t size) {
    uint32_t value = 0;
    for(std::size_t i = 0; i < size; ++i) {
        value = (value << 8) | static_cast<unsigned char>(bytes[offset + i]);
    }
    return value;
}

uint32_t readLittleEndian(const std::string& bytes, std::size_t offset, std::size_t size) {
    uint32_t value = 0;
    for(std::size_t i = size; i > 0; --i) {
        value = (value << 8) | static_cast<unsigned char>(bytes[offset + i - 1]);
    }
    return value;
}

boost::optional<ImageDimensions> makeDimensions(int64_t width, int64_t height) {
    if(width <= 0 || height <= 0) {
        return {};
    }
    return ImageDimensions{static_cast<unsigned>(width), static_cast<unsigned>(height)};
}

// IHDR is always the first chunk: width and height at offsets 16 and 20
boost::optional<ImageDimensions> readPNGDimensions(const std::string& bytes) {
    if(bytes.size() < 24 || !startsWith(bytes, "IHDR", 12)) {
        return {};
    }
    return makeDimensions(readBigEndian(bytes, 16, 4), readBigEndian(bytes, 20, 4));
}

// logical screen descriptor follows the 6-byte header
boost::optional<ImageDimensions> readGIFDimensions(const std::string& bytes) {
    if(bytes.size() < 10) {
        return {};
    }
    return makeDimensions(readLittleEndian(bytes, 6, 2), readLittleEndian(bytes, 8, 2));
}

// BITMAPINFOHEADER (or later) starts at offset 14; a negative height means top-down rows
boost::optional<ImageDimensions> readBMPDimensions(const std::string& bytes) {
    if(bytes.size() < 26) {
        return {};
    }
    auto headerSize = readLittleEndian(bytes, 14, 4);
    if(headerSize == 12) {
        return makeDimensions(readLittleEndian(bytes, 18, 2), readLittleEndian(bytes, 20, 2));
    }
    auto width = static_cast<int32_t>(readLittleEndian(bytes, 18, 4));
    auto height = static_cast<int32_t>(readLittleEndian(bytes, 22, 4));
    return makeDimensions(width, height < 0 ? -static_cast<int64_t>(height) : height);
}

/**
 * Walks the JPEG segments until a start-of-frame marker (SOF0-SOF15 except
 * DHT, JPG and DAC) and reads height and width from it.
 */
boost::optional<ImageDimensions> readJPEGDimensions(const std::string& bytes) {
    std::size_t offset = 2;
    while(offset + 4 <= bytes.size()) {
        if(static_cast<unsigned char>(bytes[offset]) != 0xFF) {
            return {};
        }
        auto marker = static_cast<unsigned char>(bytes[offset + 1]);
        if(marker == 0xFF) { // fill byte
            ++offset;
            continue;
        }
        if(marker == 0xD8 || marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7)) { // no payload
            offset += 2;
            continue;
        }
        if(marker == 0xD9 || marker == 0xDA) { // end of image or start of scan
            return {};
        }

        auto segmentLength = readBigEndian(bytes, offset + 2, 2);
        bool isStartOfFrame = marker >= 0xC0 && marker <= 0xCF
            && marker != 0xC4 && marker != 0xC8 && marker != 0xCC;
        if(isStartOfFrame) {
            if(offset + 9 > bytes.size()) {
                return {};
            }
            return makeDimensions(readBigEndian(bytes, offset + 7, 2), readBigEndian(bytes, offset + 5, 2));
        }
        if(segmentLength < 2) {
            return {};
        }
        offset += 2 + segmentLength;
    }
    return {};
}

boost::optional<ImageDimensions> readWEBPDimensions(const std::string& bytes) {
    if(bytes.size() < 30) {
        return {};
    }
    if(startsWith(bytes, "VP8 ", 12)) {
        // lossy: key frame start code, then 14-bit width and height
        if(!startsWith(bytes, "\x9d\x01\x2a", 23)) {
            return {};
        }
        return makeDimensions(readLittleEndian(bytes, 26, 2) & 0x3FFF, readLittleEndian(bytes, 28, 2) & 0x3FFF);
    }
    if(startsWith(bytes, "VP8L", 12)) {
        // lossless: signature byte, then 14-bit width-1 and height-1
        if(static_cast<unsigned char>(bytes[20]) != 0x2F) {
            return {};
        }
        auto bits = readLittleEndian(bytes, 21, 4);
        return makeDimensions((bits & 0x3FFF) + 1, ((bits >> 14) & 0x3FFF) + 1);
    }
    if(startsWith(bytes, "VP8X", 12)) {
        // extended: 24-bit canvas width-1 and height-1
        return makeDimensions(readLittleEndian(bytes, 24, 3) + 1, readLittleEndian(bytes, 27, 3) + 1);
    }
    return {};
}

bool looksLikeSVG(const std::string& bytes) {
    auto head = libcuvette::string::toLower(bytes.substr(0, 1024));
    auto begin = head.find_first_not_of(" \t\r\n");
    if(begin == std::string::npos) {
        return false;
    }
    if(head.compare(begin, 4, "<svg") == 0) {
        return true;
    }
    return head.compare(begin, 5, "<?xml") == 0 && head.find("<svg") != std::string::npos;
}

}

boost::optional<std::string> detectImageMimeType(const std::string& bytes) {
    if(startsWith(bytes, "\x89PNG\r\n\x1a\n")) {
        return std::string{"image/png"};
    }
    if(startsWith(bytes, "\xff\xd8\xff")) {
        return std::string{"image/jpeg"};
    }
    if(startsWith(bytes, "GIF87a") || startsWith(bytes, "GIF89a")) {
        return std::string{"image/gif"};
    }
    if(startsWith(bytes, "BM") && bytes.size() >= 26) {
        return std::string{"image/bmp"};
    }
    if(startsWith(bytes, "RIFF") && startsWith(bytes, "WEBP", 8)) {
        return std::string{"image/webp"};
    }
    return {};
}

boost::optional<ImageDimensions> readImageDimensions(const std::string& bytes, const std::string& mimeType) {
    if(mimeType == "image/png") {
        return readPNGDimensions(bytes);
    }
    else if(mimeType == "image/jpeg") {
        return readJPEGDimensions(bytes);
    }
    else if(mimeType == "image/gif") {
        return readGIFDimensions(bytes);
    }
    else if(mimeType == "image/bmp") {
        return readBMPDimensions(bytes);
    }
    else if(mimeType == "image/webp") {
        return readWEBPDimensions(bytes);
    }
    return {};
}

std::string mimeTypeFromExtension(const boost::filesystem::path& filename) {
    static const auto mimeTypes = std::unordered_map<std::string, std::string>{
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".bmp", "image/bmp"},
        {".webp", "image/webp"},
        {".svg", "image/svg+xml"},
        {".pdf", "application/pdf"},
        {".csv", "text/csv"},
        {".tsv", "text/tab-separated-values"},
        {".txt", "text/plain"},
        {".log", "text/plain"},
        {".md", "text/markdown"},
        {".html", "text/html"},
        {".htm", "text/html"},
        {".json", "application/json"},
        {".xml", "application/xml"},
        {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {".xls", "application/vnd.ms-excel"},
        {".parquet", "application/vnd.apache.parquet"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".npy", "application/octet-stream"},
        {".pkl", "application/octet-stream"}
    };

    auto extension = libcuvette::string::toLower(filename.extension().string());
    auto it = mimeTypes.find(extension);
    if(it == mimeTypes.cend()) {
        return "application/octet-stream";
    }
    return it->second;
}

ContentSignature detectContentSignature(const std::string& bytes, const boost::filesystem::path& filename) {
    if(auto imageMimeType = detectImageMimeType(bytes)) {
        return ContentSignature{ContentKind::IMAGE, *imageMimeType, readImageDimensions(bytes, *imageMimeType)};
    }
    if(startsWith(bytes, "%PDF-")) {
        return ContentSignature{ContentKind::GENERIC, "application/pdf", {}};
    }
    if(looksLikeSVG(bytes)) {
        return ContentSignature{ContentKind::GENERIC, "image/svg+xml", {}};
    }
    return ContentSignature{ContentKind::GENERIC, mimeTypeFromExtension(filename), {}};
}

}
}

// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#include <quire.hpp>
#include <imageops.hpp>
#include "testutils.hpp"

#include <fmt/format.h>
#include <png.h>

#include <cstdio>
#include <cstring>
#include <filesystem>
#include <string>

using quire::testing::count_occurrences;
using quire::testing::PdfIndex;
using namespace quire::internal;
using namespace std::literals;

namespace {

std::string encode_png(uint32_t w, uint32_t h, png_uint_32 format, const std::string &pixels) {
    png_image image;
    memset(&image, 0, sizeof(image));
    image.version = PNG_IMAGE_VERSION;
    image.width = w;
    image.height = h;
    image.format = format;
    png_alloc_size_t size = 0;
    if(png_image_write_to_memory(&image, nullptr, &size, 0, pixels.data(), 0, nullptr) == 0) {
        fprintf(stderr, "PNG size query failed: %s\n", image.message);
        return {};
    }
    std::string out(size, '\0');
    if(png_image_write_to_memory(&image, out.data(), &size, 0, pixels.data(), 0, nullptr) == 0) {
        fprintf(stderr, "PNG encoding failed: %s\n", image.message);
        return {};
    }
    out.resize(size);
    return out;
}

std::string solid_pixels(size_t num_pixels, std::string_view pixel) {
    std::string result;
    for(size_t i = 0; i < num_pixels; ++i) {
        result += pixel;
    }
    return result;
}

std::string base64_encode(std::string_view data) {
    static const char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    size_t i = 0;
    for(; i + 2 < data.size(); i += 3) {
        const uint32_t v = (uint8_t)data[i] << 16 | (uint8_t)data[i + 1] << 8 | (uint8_t)data[i + 2];
        out += alphabet[(v >> 18) & 63];
        out += alphabet[(v >> 12) & 63];
        out += alphabet[(v >> 6) & 63];
        out += alphabet[v & 63];
        if(out.size() % 76 == 0) {
            out += '\n';
        }
    }
    if(i + 1 == data.size()) {
        const uint32_t v = (uint8_t)data[i] << 16;
        out += alphabet[(v >> 18) & 63];
        out += alphabet[(v >> 12) & 63];
        out += "==";
    } else if(i + 2 == data.size()) {
        const uint32_t v = (uint8_t)data[i] << 16 | (uint8_t)data[i + 1] << 8;
        out += alphabet[(v >> 18) & 63];
        out += alphabet[(v >> 12) & 63];
        out += alphabet[(v >> 6) & 63];
        out += '=';
    }
    return out;
}

std::string red_png() { return encode_png(4, 2, PNG_FORMAT_RGB, solid_pixels(8, "\xff\x00\x00"sv)); }

std::string serialize(const quire::Document &doc) {
    auto b = doc.bytes();
    CHECK(b.has_value());
    return b ? *b : std::string{};
}

void test_png_is_embedded_as_jpeg() {
    const auto png = red_png();
    CHECK(!png.empty());
    quire::Document doc;
    doc.add_page();
    auto rc = doc.image_from_bytes(10, 10, 40, 20, png);
    CHECK(rc.has_value());
    CHECK(doc.image_count() == 1);
    const auto pdf = serialize(doc);
    PdfIndex idx(pdf);
    CHECK(idx.valid());
    CHECK(idx.page_content(0) == "q\n  40.00 0 0 20.00 10.00 762.00 cm\n  /Im1 Do\nQ\n");
    const auto page = idx.page_objects().at(0);
    const auto image_obj = idx.reference_of(page, "/Im1");
    CHECK(image_obj > 0);
    const auto dict = idx.dictionary(image_obj);
    CHECK(dict.find("/Subtype /Image") != std::string::npos);
    CHECK(dict.find("/Width 4\n") != std::string::npos);
    CHECK(dict.find("/Height 2\n") != std::string::npos);
    CHECK(dict.find("/ColorSpace /DeviceRGB") != std::string::npos);
    CHECK(dict.find("/BitsPerComponent 8") != std::string::npos);
    CHECK(dict.find("/Filter /DCTDecode") != std::string::npos);
    const auto data = idx.stream(image_obj);
    CHECK(data.starts_with("\xff\xd8"));
    CHECK(dict.find(fmt::format("/Length {}\n", data.size())) != std::string::npos);
}

void test_gray_and_multiple_images() {
    std::string ramp;
    for(int i = 0; i < 256; ++i) {
        ramp += (char)i;
    }
    const auto gray = encode_png(16, 16, PNG_FORMAT_GRAY, ramp);
    quire::Document doc;
    CHECK(doc.image_from_bytes(0, 0, 16, 16, gray).has_value());
    CHECK(doc.image_from_bytes(0, 100, 16, 16, red_png()).has_value());
    doc.add_page();
    CHECK(doc.image_from_bytes(0, 0, 16, 16, gray).has_value());
    CHECK(doc.image_count() == 3);
    const auto pdf = serialize(doc);
    PdfIndex idx(pdf);
    CHECK(idx.valid());
    CHECK(count_occurrences(pdf, "/Subtype /Image") == 3);
    CHECK(count_occurrences(pdf, "/ColorSpace /DeviceGray") == 2);
    CHECK(idx.page_content(0).find("/Im1 Do") != std::string::npos);
    CHECK(idx.page_content(0).find("/Im2 Do") != std::string::npos);
    CHECK(idx.page_content(1).find("/Im3 Do") != std::string::npos);
    // Each page lists only the images it draws.
    const auto pages = idx.page_objects();
    CHECK(idx.reference_of(pages.at(1), "/Im1") == -1);
    CHECK(idx.reference_of(pages.at(1), "/Im3") > 0);
}

void test_alpha_is_premultiplied() {
    const auto transparent =
        encode_png(8, 8, PNG_FORMAT_RGBA, solid_pixels(64, "\xff\x00\x00\x00"sv));
    auto img = load_image_from_memory(transparent);
    CHECK(img.has_value());
    if(!img) {
        return;
    }
    CHECK(img->md.alpha_depth == 8);
    CHECK(img->alpha.size() == 64);
    CHECK(img->pixels.size() == 64 * 3);
    auto jpg = encode_jpeg(*img);
    CHECK(jpg.has_value());
    if(!jpg) {
        return;
    }
    auto decoded = load_image_from_memory(jpg->file_contents);
    CHECK(decoded.has_value());
    if(!decoded) {
        return;
    }
    CHECK(decoded->md.w == 8);
    CHECK(decoded->alpha.empty());
    for(const auto c : decoded->pixels) {
        CHECK((unsigned char)c < 16);
    }

    const auto opaque = encode_png(8, 8, PNG_FORMAT_RGBA, solid_pixels(64, "\xff\x00\x00\xff"sv));
    auto opaque_img = load_image_from_memory(opaque);
    CHECK(opaque_img.has_value());
    auto opaque_jpg = encode_jpeg(*opaque_img);
    CHECK(opaque_jpg.has_value());
    auto opaque_decoded = load_image_from_memory(opaque_jpg->file_contents);
    CHECK(opaque_decoded.has_value());
    CHECK((unsigned char)opaque_decoded->pixels[0] > 240);
    CHECK((unsigned char)opaque_decoded->pixels[1] < 16);
}

void test_jpeg_input() {
    RawPixelImage raw;
    raw.md.w = 16;
    raw.md.h = 8;
    raw.md.cs = ImageColorspace::Gray;
    raw.pixels = solid_pixels(128, "\x80"sv);
    auto jpg = encode_jpeg(raw);
    CHECK(jpg.has_value());
    CHECK(jpg->cs == ImageColorspace::Gray);
    CHECK(jpg->file_contents.starts_with("\xff\xd8\xff"));
    quire::Document doc;
    CHECK(doc.image_from_bytes(0, 0, 32, 16, jpg->file_contents).has_value());
    const auto pdf = serialize(doc);
    CHECK(pdf.find("/Width 16\n") != std::string::npos);
    CHECK(pdf.find("/Height 8\n") != std::string::npos);
    CHECK(pdf.find("/ColorSpace /DeviceGray") != std::string::npos);
}

void test_invalid_raw_images() {
    RawPixelImage raw;
    raw.md.w = 0;
    raw.md.h = 4;
    CHECK(validate_raw_image(raw).error() == ErrorCode::InvalidImageSize);
    raw.md.w = 4;
    raw.pixels = std::string(10, '\0');
    CHECK(validate_raw_image(raw).error() == ErrorCode::MissingPixels);
    raw.pixels = std::string(48, '\0');
    CHECK(validate_raw_image(raw).has_value());
    raw.alpha = std::string(3, '\0');
    raw.md.alpha_depth = 8;
    CHECK(validate_raw_image(raw).error() == ErrorCode::MissingPixels);
    raw.md.pixel_depth = 16;
    CHECK(encode_jpeg(raw).error() == ErrorCode::UnsupportedFormat);

    quire::Document doc;
    doc.add_page();
    doc.image(0, 0, 10, 10, raw);
    CHECK(doc.image_count() == 0);
    CHECK(doc.draw_image(0, 0, 10, 10, raw).error() == ErrorCode::UnsupportedFormat);
}

void test_malformed_input_leaves_document_unchanged() {
    quire::Document doc;
    doc.add_page().text("before");
    const auto before = serialize(doc);

    auto rc = doc.image_from_bytes(0, 0, 10, 10, "not an image");
    CHECK(!rc);
    CHECK(rc.error() == ErrorCode::UnsupportedFormat);
    rc = doc.image_from_bytes(0, 0, 10, 10, "");
    CHECK(rc.error() == ErrorCode::EmptyInput);
    rc = doc.image_from_bytes(0, 0, 10, 10, std::string("\x89PNG\r\n\x1a\ngarbage", 15));
    CHECK(!rc);
    rc = doc.image_from_bytes(0, 0, 10, 10, std::string("\xff\xd8\xff\xe0garbage", 11));
    CHECK(!rc);
    const auto png = red_png();
    rc = doc.image_from_bytes(0, 0, 10, 10, png.substr(0, png.size() / 2));
    CHECK(!rc);

    RawPixelImage raw;
    raw.md.w = 64;
    raw.md.h = 64;
    for(int i = 0; i < 64 * 64; ++i) {
        raw.pixels += (char)(i % 64 * 4);
        raw.pixels += (char)(i / 64 * 4);
        raw.pixels += (char)(i % 7 * 30);
    }
    auto jpg = encode_jpeg(raw);
    CHECK(jpg.has_value());
    if(jpg) {
        const auto &full = jpg->file_contents;
        rc = doc.image_from_bytes(0, 0, 10, 10, full.substr(0, full.size() / 2));
        CHECK(!rc);
        CHECK(rc.error() == ErrorCode::UnsupportedFormat);
        // The complete data is accepted.
        quire::Document other;
        CHECK(other.image_from_bytes(0, 0, 10, 10, full).has_value());
    }
    rc = doc.image_from_base64(0, 0, 10, 10, "!!!!");
    CHECK(rc.error() == ErrorCode::BadBase64);
    rc = doc.image_from_stream(0, 0, 10, 10, nullptr);
    CHECK(rc.error() == ErrorCode::ArgIsNull);
    rc = doc.image_from_file(0, 0, 10, 10, "/nonexistent/quire/image.png");
    CHECK(rc.error() == ErrorCode::FileDoesNotExist);

    CHECK(doc.image_count() == 0);
    CHECK(doc.page_count() == 1);
    CHECK(serialize(doc) == before);
}

void test_other_sources() {
    const auto png = red_png();
    quire::Document doc;
    CHECK(doc.image_from_base64(0, 0, 10, 10, base64_encode(png)).has_value());

    FILE *f = tmpfile();
    CHECK(f != nullptr);
    if(f) {
        CHECK(fwrite(png.data(), 1, png.size(), f) == png.size());
        rewind(f);
        CHECK(doc.image_from_stream(0, 20, 10, 10, f).has_value());
        fclose(f);
    }

    const char *fname = "quire_imagetest.png";
    f = fopen(fname, "wb");
    CHECK(f != nullptr);
    if(f) {
        CHECK(fwrite(png.data(), 1, png.size(), f) == png.size());
        fclose(f);
        CHECK(doc.image_from_file(0, 40, 10, 10, fname).has_value());
        auto loaded = load_image_file(fname);
        CHECK(loaded.has_value());
        CHECK(loaded->md.w == 4);
        CHECK(loaded->md.cs == ImageColorspace::RGB);
        CHECK(loaded->alpha.empty());
        std::filesystem::remove(fname);
    }
    CHECK(doc.image_count() == 3);
    PdfIndex idx(serialize(doc));
    CHECK(idx.valid());
    CHECK(count_occurrences(idx.page_content(0), " Do\n") == 3);
}

} // namespace

int main() {
    RUN_TEST(test_png_is_embedded_as_jpeg);
    RUN_TEST(test_gray_and_multiple_images);
    RUN_TEST(test_alpha_is_premultiplied);
    RUN_TEST(test_jpeg_input);
    RUN_TEST(test_invalid_raw_images);
    RUN_TEST(test_malformed_input_leaves_document_unchanged);
    RUN_TEST(test_other_sources);
    return quire::testing::test_result();
}

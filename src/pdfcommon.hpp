// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2024 Jussi Pakkanen

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace quire::internal {

class LimitDouble {
public:
    constexpr LimitDouble() : value(minval) {}

    // No "explicit" because we want the following to work for convenience:
    // Color{0.0, 0.3, 1.0}
    constexpr LimitDouble(double new_val) : value(new_val) { clamp(); }

    constexpr double v() const { return value; }

private:
    constexpr static double maxval = 1.0;
    constexpr static double minval = 0.0;

    constexpr void clamp() {
        if(value < minval) {
            value = minval;
        }
        if(value > maxval) {
            value = maxval;
        }
    }

    double value;
};

struct Color {
    LimitDouble r;
    LimitDouble g;
    LimitDouble b;
};

namespace colors {

constexpr Color Black{0, 0, 0};
constexpr Color White{1, 1, 1};
constexpr Color Red{1, 0, 0};
constexpr Color Green{0, 1, 0};
constexpr Color Blue{0, 0, 1};
constexpr Color Gray{0.5, 0.5, 0.5};
constexpr Color Yellow{1, 1, 0};
constexpr Color Cyan{0, 1, 1};
constexpr Color Magenta{1, 0, 1};

} // namespace colors

// Components are 0-255.
Color rgb(int r, int g, int b);

// Accepts "#RRGGBB" and "RRGGBB". Anything else is black.
Color hex(std::string_view hexcode);

// All sizes are in points (1/72 inch).
struct PageSize {
    double w;
    double h;
};

namespace pagesizes {

constexpr PageSize Letter{612, 792};
constexpr PageSize Legal{612, 1008};
constexpr PageSize Tabloid{792, 1224};
constexpr PageSize A3{841.89, 1190.55};
constexpr PageSize A4{595.28, 841.89};
constexpr PageSize A5{419.53, 595.28};
constexpr PageSize B4{708.66, 1000.63};
constexpr PageSize B5{498.90, 708.66};

} // namespace pagesizes

enum class Orientation : int32_t { Portrait, Landscape };

struct Margins {
    double top;
    double right;
    double bottom;
    double left;
};

constexpr double PT_PER_INCH = 72.0;
constexpr double PT_PER_MM = 72.0 / 25.4;
constexpr double PT_PER_CM = 72.0 / 2.54;

constexpr double inches(double n) { return n * PT_PER_INCH; }
constexpr double mm(double n) { return n * PT_PER_MM; }
constexpr double cm(double n) { return n * PT_PER_CM; }

enum class TextAlign : int32_t { Left, Center, Right };

struct Point {
    double x;
    double y;
};

struct Metadata {
    std::string title;
    std::string author;
    std::string subject;
    std::string keywords;
    std::string creator;
    std::string producer;
    // A default constructed time point means "not set".
    std::chrono::system_clock::time_point creation_date;
    std::chrono::system_clock::time_point mod_date;
};

enum class ImageColorspace : int32_t { RGB, Gray };

struct RasterImageMetadata {
    uint32_t w = 0;
    uint32_t h = 0;
    uint32_t pixel_depth = 8;
    uint32_t alpha_depth = 0;
    ImageColorspace cs = ImageColorspace::RGB;
};

// Decoded, uncompressed pixels. Rows are stored top to bottom
// with no padding. The alpha channel, if any, is a separate plane.
struct RawPixelImage {
    RasterImageMetadata md;
    std::string pixels;
    std::string alpha;
};

// An image as it is stored in the output file.
struct JpegImage {
    uint32_t w = 0;
    uint32_t h = 0;
    ImageColorspace cs = ImageColorspace::RGB;
    std::string file_contents;
};

int32_t num_channels(ImageColorspace cs);

} // namespace quire::internal

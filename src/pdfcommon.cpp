// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2024 Jussi Pakkanen

#include <pdfcommon.hpp>

namespace quire::internal {

namespace {

int hexdigit(char c) {
    if(c >= '0' && c <= '9') {
        return c - '0';
    }
    if(c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if(c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

} // namespace

Color rgb(int r, int g, int b) { return Color{r / 255.0, g / 255.0, b / 255.0}; }

Color hex(std::string_view hexcode) {
    if(hexcode.starts_with('#')) {
        hexcode.remove_prefix(1);
    }
    if(hexcode.size() != 6) {
        return colors::Black;
    }
    int components[3];
    for(int i = 0; i < 3; ++i) {
        const int high = hexdigit(hexcode[2 * i]);
        const int low = hexdigit(hexcode[2 * i + 1]);
        if(high < 0 || low < 0) {
            return colors::Black;
        }
        components[i] = high * 16 + low;
    }
    return rgb(components[0], components[1], components[2]);
}

int32_t num_channels(ImageColorspace cs) {
    switch(cs) {
    case ImageColorspace::RGB:
        return 3;
    case ImageColorspace::Gray:
        return 1;
    }
    return 3;
}

} // namespace quire::internal

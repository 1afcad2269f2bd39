// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2024 Jussi Pakkanen

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace quire::internal {

// The 14 standard fonts every PDF reader must provide.
// The order is also the order of font objects in the output file.
enum class BuiltinFont : int32_t {
    Courier,
    CourierBold,
    CourierOblique,
    CourierBoldOblique,
    Helvetica,
    HelveticaBold,
    HelveticaOblique,
    HelveticaBoldOblique,
    TimesRoman,
    TimesBold,
    TimesItalic,
    TimesBoldItalic,
    Symbol,
    ZapfDingbats,
};

constexpr std::size_t NUM_BUILTIN_FONTS = 14;

enum class FontFamily : int32_t { Courier, Helvetica, Times, Symbol, ZapfDingbats };

enum class FontStyle : int32_t { Regular, Bold, Italic, BoldItalic };

struct BuiltinFontInfo {
    BuiltinFont id;
    const char *base_font;
    const char *subtype;
    FontFamily family;
    FontStyle style;
    // Average glyph advance as a fraction of the point size.
    double average_width;
    // Symbolic fonts use their own encoding.
    bool uses_winansi;
};

const BuiltinFontInfo &builtin_font_info(BuiltinFont font);

// Accepts the base font names ("Helvetica-Bold") and the family alias "Times".
std::optional<BuiltinFont> find_builtin_font(std::string_view name);

// "regular", "bold", "italic" and "bolditalic", case insensitive.
std::optional<FontStyle> find_font_style(std::string_view name);

// The font in the same family as `font` with the given style. Families
// without styles return `font` unchanged.
BuiltinFont with_style(BuiltinFont font, FontStyle style);

bool is_bold(FontStyle style);
bool is_italic(FontStyle style);

// Approximate width of text, not based on real glyph metrics.
double estimate_text_width(BuiltinFont font, double pointsize, std::string_view utf8_text);

} // namespace quire::internal

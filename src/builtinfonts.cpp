// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2024 Jussi Pakkanen

#include <builtinfonts.hpp>
#include <utils.hpp>

#include <cctype>

namespace quire::internal {

namespace {

// clang-format off

const std::array<BuiltinFontInfo, NUM_BUILTIN_FONTS> font_table{{
    {BuiltinFont::Courier,              "Courier",               "Type1", FontFamily::Courier,      FontStyle::Regular,    0.6,  true},
    {BuiltinFont::CourierBold,          "Courier-Bold",          "Type1", FontFamily::Courier,      FontStyle::Bold,       0.6,  true},
    {BuiltinFont::CourierOblique,       "Courier-Oblique",       "Type1", FontFamily::Courier,      FontStyle::Italic,     0.6,  true},
    {BuiltinFont::CourierBoldOblique,   "Courier-BoldOblique",   "Type1", FontFamily::Courier,      FontStyle::BoldItalic, 0.6,  true},
    {BuiltinFont::Helvetica,            "Helvetica",             "Type1", FontFamily::Helvetica,    FontStyle::Regular,    0.5,  true},
    {BuiltinFont::HelveticaBold,        "Helvetica-Bold",        "Type1", FontFamily::Helvetica,    FontStyle::Bold,       0.5,  true},
    {BuiltinFont::HelveticaOblique,     "Helvetica-Oblique",     "Type1", FontFamily::Helvetica,    FontStyle::Italic,     0.5,  true},
    {BuiltinFont::HelveticaBoldOblique, "Helvetica-BoldOblique", "Type1", FontFamily::Helvetica,    FontStyle::BoldItalic, 0.5,  true},
    {BuiltinFont::TimesRoman,           "Times-Roman",           "Type1", FontFamily::Times,        FontStyle::Regular,    0.45, true},
    {BuiltinFont::TimesBold,            "Times-Bold",            "Type1", FontFamily::Times,        FontStyle::Bold,       0.45, true},
    {BuiltinFont::TimesItalic,          "Times-Italic",          "Type1", FontFamily::Times,        FontStyle::Italic,     0.45, true},
    {BuiltinFont::TimesBoldItalic,      "Times-BoldItalic",      "Type1", FontFamily::Times,        FontStyle::BoldItalic, 0.45, true},
    {BuiltinFont::Symbol,               "Symbol",                "Type1", FontFamily::Symbol,       FontStyle::Regular,    0.5,  false},
    {BuiltinFont::ZapfDingbats,         "ZapfDingbats",          "Type1", FontFamily::ZapfDingbats, FontStyle::Regular,    0.5,  false},
}};

// clang-format on

bool equals_nocase(std::string_view a, std::string_view b) {
    if(a.size() != b.size()) {
        return false;
    }
    for(size_t i = 0; i < a.size(); ++i) {
        if(std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) {
            return false;
        }
    }
    return true;
}

} // namespace

const BuiltinFontInfo &builtin_font_info(BuiltinFont font) {
    return font_table.at((std::size_t)font);
}

std::optional<BuiltinFont> find_builtin_font(std::string_view name) {
    for(const auto &f : font_table) {
        if(name == f.base_font) {
            return f.id;
        }
    }
    if(name == "Times") {
        return BuiltinFont::TimesRoman;
    }
    return {};
}

std::optional<FontStyle> find_font_style(std::string_view name) {
    if(equals_nocase(name, "regular")) {
        return FontStyle::Regular;
    }
    if(equals_nocase(name, "bold")) {
        return FontStyle::Bold;
    }
    if(equals_nocase(name, "italic")) {
        return FontStyle::Italic;
    }
    if(equals_nocase(name, "bolditalic")) {
        return FontStyle::BoldItalic;
    }
    return {};
}

BuiltinFont with_style(BuiltinFont font, FontStyle style) {
    const auto family = builtin_font_info(font).family;
    for(const auto &f : font_table) {
        if(f.family == family && f.style == style) {
            return f.id;
        }
    }
    return font;
}

bool is_bold(FontStyle style) { return style == FontStyle::Bold || style == FontStyle::BoldItalic; }

bool is_italic(FontStyle style) {
    return style == FontStyle::Italic || style == FontStyle::BoldItalic;
}

double estimate_text_width(BuiltinFont font, double pointsize, std::string_view utf8_text) {
    return double(count_codepoints(utf8_text)) * builtin_font_info(font).average_width * pointsize;
}

} // namespace quire::internal

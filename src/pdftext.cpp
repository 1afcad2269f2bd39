// SPDX-License-Identifier: Apache-2.0
// Copyright 2023-2024 Jussi Pakkanen

#include <document.hpp>

#include <cstdio>
#include <string>

namespace quire::internal {

namespace {

const char BULLET[] = "•";

bool is_space(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v'; }

std::vector<std::string_view> split_words(std::string_view text) {
    std::vector<std::string_view> words;
    size_t i = 0;
    while(i < text.size()) {
        while(i < text.size() && is_space(text[i])) {
            ++i;
        }
        const size_t start = i;
        while(i < text.size() && !is_space(text[i])) {
            ++i;
        }
        if(i > start) {
            words.push_back(text.substr(start, i - start));
        }
    }
    return words;
}

} // namespace

Document &Document::set_font(std::string_view name, double size) {
    if(auto f = find_builtin_font(name)) {
        font_id = *f;
        pointsize = size;
    } else if(auto style = find_font_style(name)) {
        font_id = with_style(font_id, *style);
        pointsize = size;
    } else {
        fprintf(stderr, "Unknown font \"%.*s\", ignoring.\n", (int)name.size(), name.data());
    }
    return *this;
}

Document &Document::font(std::string_view name) { return set_font(name, pointsize); }

Document &Document::set_font_size(double size) {
    pointsize = size;
    return *this;
}

Document &Document::set_line_height(double multiplier) {
    line_height_mult = multiplier;
    return *this;
}

Document &Document::bold() {
    const auto style = builtin_font_info(font_id).style;
    font_id = with_style(font_id, is_italic(style) ? FontStyle::BoldItalic : FontStyle::Bold);
    return *this;
}

Document &Document::italic() {
    const auto style = builtin_font_info(font_id).style;
    font_id = with_style(font_id, is_bold(style) ? FontStyle::BoldItalic : FontStyle::Italic);
    return *this;
}

Document &Document::regular() {
    font_id = with_style(font_id, FontStyle::Regular);
    return *this;
}

void Document::emit_text(std::string_view utf8, double tx, double ty) {
    auto &p = current_page();
    p.render_text(font_id, pointsize, tx, pdf_y(ty), utf8);
}

Document &Document::text(std::string_view utf8) {
    ensure_page();
    emit_text(utf8, x, y);
    return *this;
}

Document &Document::text_at(double tx, double ty, std::string_view utf8) {
    emit_text(utf8, tx, ty);
    return *this;
}

void Document::newline(bool reset_x) {
    ensure_page();
    if(reset_x) {
        x = docprops.margins.left;
    }
    y += pointsize * line_height_mult;
    if(y > bottom_limit()) {
        add_page();
    }
}

Document &Document::ln() {
    newline(true);
    return *this;
}

Document &Document::br() {
    newline(false);
    return *this;
}

Document &Document::write_text(std::string_view utf8) {
    ensure_page();
    emit_text(utf8, x, y);
    x += text_width(utf8);
    return *this;
}

Document &Document::write_line(std::string_view utf8) { return text(utf8).ln(); }

double Document::text_width(std::string_view utf8) const {
    return estimate_text_width(font_id, pointsize, utf8);
}

Document &Document::paragraph(std::string_view utf8, TextAlign align) {
    ensure_page();
    const double width = content_width();
    const double space_width = text_width(" ");
    auto flush = [&](const std::string &line) {
        switch(align) {
        case TextAlign::Left:
            text(line);
            break;
        case TextAlign::Center:
            center_text(line);
            break;
        case TextAlign::Right:
            right_text(line);
            break;
        }
        ln();
    };

    std::string line;
    double line_width = 0;
    for(const auto &word : split_words(utf8)) {
        const double word_width = text_width(word);
        if(!line.empty() && line_width + space_width + word_width > width) {
            flush(line);
            line.clear();
            line_width = 0;
        }
        if(!line.empty()) {
            line += ' ';
            line_width += space_width;
        }
        line += word;
        line_width += word_width;
    }
    if(!line.empty()) {
        flush(line);
    }
    return *this;
}

Document &Document::center_text(std::string_view utf8) {
    ensure_page();
    const double w = text_width(utf8);
    emit_text(utf8, docprops.margins.left + (content_width() - w) / 2, y);
    return *this;
}

Document &Document::right_text(std::string_view utf8) {
    ensure_page();
    const double w = text_width(utf8);
    emit_text(utf8, pages.back().width() - docprops.margins.right - w, y);
    return *this;
}

void Document::styled_line(std::string_view utf8, double size, bool centered, int32_t line_feeds) {
    const auto old_font = font_id;
    const auto old_size = pointsize;
    bold();
    pointsize = size;
    if(centered) {
        center_text(utf8);
    } else {
        text(utf8);
    }
    for(int32_t i = 0; i < line_feeds; ++i) {
        ln();
    }
    font_id = old_font;
    pointsize = old_size;
}

Document &Document::title(std::string_view utf8) {
    styled_line(utf8, 24, true, 2);
    return *this;
}

Document &Document::heading(std::string_view utf8) {
    styled_line(utf8, 16, false, 1);
    return *this;
}

Document &Document::subheading(std::string_view utf8) {
    styled_line(utf8, 14, false, 1);
    return *this;
}

Document &Document::list(const std::vector<std::string> &items) {
    ensure_page();
    const double indent = pointsize * 1.5;
    for(const auto &item : items) {
        emit_text(BULLET, x, y);
        emit_text(item, x + indent, y);
        ln();
    }
    return *this;
}

Document &Document::numbered_list(const std::vector<std::string> &items) {
    ensure_page();
    const double indent = pointsize * 2;
    for(size_t i = 0; i < items.size(); ++i) {
        emit_text(fmt::format("{}.", i + 1), x, y);
        emit_text(items[i], docprops.margins.left + indent, y);
        ln();
    }
    return *this;
}

} // namespace quire::internal

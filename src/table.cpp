// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#include <table.hpp>
#include <document.hpp>

#include <cstdio>

namespace quire::internal {

namespace {

// Distance from the top of the text box to the baseline, as a fraction of the font size.
constexpr double ASCENT_RATIO = 0.8;

} // namespace

Table::Table(Document &d, const std::vector<double> &column_widths)
    : doc{d}, header_bg{rgb(220, 220, 220)} {
    doc.ensure_page();
    x = doc.x;
    y = doc.y;
    font_id = doc.font_id;
    pointsize = doc.pointsize;
    columns.reserve(column_widths.size());
    for(const auto w : column_widths) {
        columns.push_back(TableColumn{w, TextAlign::Left});
        total_width += w;
    }
}

Table &Table::set_cell_padding(double padding) {
    cell_padding = padding;
    return *this;
}

Table &Table::set_border(double width, const Color &color) {
    border_width = width;
    border_color = color;
    return *this;
}

Table &Table::set_header_style(const Color &background, const Color &foreground) {
    header_bg = background;
    header_fg = foreground;
    return *this;
}

Table &Table::set_alternate_row_color(const Color &color) {
    alt_row_bg = color;
    return *this;
}

Table &Table::set_font(std::string_view name, double size) {
    if(auto f = find_builtin_font(name)) {
        font_id = *f;
        pointsize = size;
    } else if(auto style = find_font_style(name)) {
        font_id = with_style(font_id, *style);
        pointsize = size;
    } else {
        fprintf(stderr, "Unknown table font \"%.*s\", ignoring.\n", (int)name.size(), name.data());
    }
    return *this;
}

Table &Table::set_column_align(int32_t column, TextAlign align) {
    if(column >= 0 && (size_t)column < columns.size()) {
        columns[column].align = align;
    }
    return *this;
}

Table &Table::header(const std::vector<std::string> &cells) {
    header_row = cells;
    return *this;
}

Table &Table::row(const std::vector<std::string> &cells) {
    data_rows.push_back(cells);
    return *this;
}

Table &Table::rows(const std::vector<std::vector<std::string>> &new_rows) {
    data_rows.insert(data_rows.end(), new_rows.begin(), new_rows.end());
    return *this;
}

Document &Table::draw() {
    doc.ensure_page();
    const auto old_font = doc.font_id;
    const auto old_size = doc.pointsize;
    doc.font_id = font_id;
    doc.pointsize = pointsize;

    double cur_y = y;
    if(!header_row.empty()) {
        cur_y = draw_row(cur_y, header_row, true, false);
    }
    for(size_t i = 0; i < data_rows.size(); ++i) {
        const bool is_alt = i % 2 == 1 && alt_row_bg;
        if(cur_y + row_height() > doc.bottom_limit()) {
            doc.add_page();
            cur_y = doc.y;
            if(!header_row.empty()) {
                cur_y = draw_row(cur_y, header_row, true, false);
            }
        }
        cur_y = draw_row(cur_y, data_rows[i], false, is_alt);
    }

    doc.y = cur_y;
    doc.x = x;
    doc.font_id = old_font;
    doc.pointsize = old_size;
    return doc;
}

double
Table::draw_row(double row_y, const std::vector<std::string> &cells, bool is_header, bool is_alt) {
    const double h = row_height();
    double cell_x = x;

    if(is_header) {
        doc.set_fill_color(header_bg);
        doc.rect_filled(x, row_y, total_width, h);
    } else if(is_alt) {
        doc.set_fill_color(*alt_row_bg);
        doc.rect_filled(x, row_y, total_width, h);
    }

    doc.set_stroke_color(border_color);
    doc.set_line_width(border_width);
    doc.set_fill_color(is_header ? header_fg : colors::Black);

    const auto body_font = doc.font_id;
    if(is_header) {
        doc.bold();
    }
    for(size_t i = 0; i < columns.size(); ++i) {
        const auto &col = columns[i];
        doc.rect(cell_x, row_y, col.width, h);

        const std::string_view cell_text = i < cells.size() ? std::string_view{cells[i]} : "";
        const double text_y = row_y + cell_padding + pointsize * ASCENT_RATIO;
        double text_x = cell_x + cell_padding;
        const double text_w = doc.text_width(cell_text);
        switch(col.align) {
        case TextAlign::Left:
            break;
        case TextAlign::Center:
            text_x = cell_x + (col.width - text_w) / 2;
            break;
        case TextAlign::Right:
            text_x = cell_x + col.width - cell_padding - text_w;
            break;
        }
        if(!cell_text.empty()) {
            doc.emit_text(cell_text, text_x, text_y);
        }
        cell_x += col.width;
    }
    doc.font_id = body_font;
    return row_y + h;
}

Table Document::new_table(const std::vector<double> &column_widths) {
    return Table(*this, column_widths);
}

Table Document::new_table_auto(int32_t num_columns) {
    if(num_columns <= 0) {
        return new_table({});
    }
    ensure_page();
    const double w = content_width() / num_columns;
    return new_table(std::vector<double>(num_columns, w));
}

Document &Document::simple_table(const std::vector<std::string> &headers,
                                 const std::vector<std::vector<std::string>> &rows) {
    return new_table_auto((int32_t)headers.size()).header(headers).rows(rows).draw();
}

Document &Document::data_table(const std::map<std::string, std::string> &data) {
    ensure_page();
    const double w = content_width() / 2;
    auto t = new_table({w, w});
    t.set_column_align(0, TextAlign::Left).set_column_align(1, TextAlign::Left);
    t.header({"Field", "Value"});
    for(const auto &[key, value] : data) {
        t.row({key, value});
    }
    return t.draw();
}

Document &
Document::key_value_table(const std::vector<std::pair<std::string, std::string>> &pairs) {
    ensure_page();
    const double w = content_width() / 2;
    auto t = new_table({w, w});
    t.set_column_align(0, TextAlign::Right).set_column_align(1, TextAlign::Left);
    for(const auto &[key, value] : pairs) {
        t.row({key + ":", value});
    }
    return t.draw();
}

} // namespace quire::internal

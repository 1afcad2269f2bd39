// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#pragma once

#include <pdfcommon.hpp>
#include <builtinfonts.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quire::internal {

class Document;

struct TableColumn {
    double width;
    TextAlign align = TextAlign::Left;
};

// A table anchored at the document cursor position at creation time.
// Nothing is written to the document until draw() is called.
class Table {
public:
    Table(Document &doc, const std::vector<double> &column_widths);

    Table &set_cell_padding(double padding);
    Table &set_border(double width, const Color &color);
    Table &set_header_style(const Color &background, const Color &foreground);
    Table &set_alternate_row_color(const Color &color);
    Table &set_font(std::string_view name, double size);
    // Out of range columns are ignored.
    Table &set_column_align(int32_t column, TextAlign align);

    Table &header(const std::vector<std::string> &cells);
    Table &row(const std::vector<std::string> &cells);
    Table &rows(const std::vector<std::vector<std::string>> &new_rows);

    double row_height() const { return pointsize + 2 * cell_padding; }

    // Lays out the rows, adding pages as needed. The header is repeated
    // at the top of every new page. Leaves the cursor below the table.
    Document &draw();

private:
    double draw_row(double row_y, const std::vector<std::string> &cells, bool is_header, bool is_alt);

    Document &doc;
    double x;
    double y;
    double total_width = 0;
    std::vector<TableColumn> columns;
    std::vector<std::string> header_row;
    std::vector<std::vector<std::string>> data_rows;
    double cell_padding = 4;
    double border_width = 0.5;
    Color border_color = colors::Black;
    Color header_bg;
    Color header_fg = colors::Black;
    std::optional<Color> alt_row_bg;
    BuiltinFont font_id;
    double pointsize;
};

} // namespace quire::internal

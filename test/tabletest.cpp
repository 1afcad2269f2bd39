// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#include <quire.hpp>
#include "testutils.hpp"

#include <string>
#include <vector>

using quire::testing::count_occurrences;
using quire::testing::PdfIndex;

namespace {

// Letter with one inch margins and 12pt text: rows are 20pt high and the
// content area ends at y = 720.

std::vector<std::vector<std::string>> make_rows(int n) {
    std::vector<std::vector<std::string>> rows;
    for(int i = 0; i < n; ++i) {
        rows.push_back({fmt::format("row{}", i), fmt::format("value{}", i)});
    }
    return rows;
}

PdfIndex serialize(const quire::Document &doc) {
    auto b = doc.bytes();
    CHECK(b.has_value());
    return PdfIndex(b ? *b : std::string{});
}

// Header at 630, data rows at 650, 670 and 690. The fourth would end at 730.
void draw_ten_rows(quire::Document &doc) {
    doc.add_page().set_pos(72, 630);
    auto t = doc.new_table({234, 234});
    CHECK(t.row_height() == 20);
    t.header({"Name", "Value"}).rows(make_rows(10)).draw();
}

void test_overflow_adds_pages() {
    quire::Document doc;
    draw_ten_rows(doc);
    // 7 rows remain and a fresh page holds 31 below the header.
    CHECK(doc.page_count() == 2);
    auto idx = serialize(doc);
    CHECK(idx.valid());
    const auto first = idx.page_content(0);
    const auto second = idx.page_content(1);
    CHECK(count_occurrences(first, "(Name) Tj") == 1);
    CHECK(count_occurrences(second, "(Name) Tj") == 1);
    CHECK(first.find("(row2) Tj") != std::string::npos);
    CHECK(first.find("(row3) Tj") == std::string::npos);
    CHECK(second.find("(row3) Tj") != std::string::npos);
    CHECK(second.find("(row9) Tj") != std::string::npos);
    // The header comes first on the new page.
    CHECK(second.find("(Name) Tj") < second.find("(row3) Tj"));
    // Cursor ends below the last row: header 72-92, rows 3..9 at 92-232.
    CHECK(doc.get_pos().y == 232);
    CHECK(doc.get_pos().x == 72);
}

void test_header_repeats_on_every_page() {
    quire::Document doc;
    doc.add_page().set_pos(72, 630);
    doc.new_table({234, 234}).header({"Name", "Value"}).rows(make_rows(100)).draw();
    // 3 rows on the first page, then 31 per page for the remaining 97.
    CHECK(doc.page_count() == 5);
    auto idx = serialize(doc);
    for(size_t i = 0; i < 5; ++i) {
        const auto content = idx.page_content(i);
        CHECK(count_occurrences(content, "(Name) Tj") == 1);
        CHECK(count_occurrences(content, "/Helvetica-Bold 12.00 Tf") == 2);
        const auto first_text = content.find(") Tj");
        CHECK(content.rfind('(', first_text) == content.find("(Name) Tj"));
    }
    CHECK(idx.page_content(4).find("(row99) Tj") != std::string::npos);
}

void test_header_style_and_alternate_rows() {
    quire::Document doc;
    doc.add_page();
    doc.new_table({100, 100})
        .set_header_style(quire::colors::Blue, quire::colors::White)
        .set_alternate_row_color(quire::rgb(240, 240, 240))
        .set_border(1, quire::colors::Red)
        .header({"A", "B"})
        .row({"1", "2"})
        .row({"3", "4"})
        .draw();
    const auto content = serialize(doc).page_content(0);
    CHECK(content.find("0.000 0.000 1.000 rg\n72.00 700.00 200.00 20.00 re\nf\n") !=
          std::string::npos);
    // Only the second data row gets the alternate background.
    CHECK(count_occurrences(content, "0.941 0.941 0.941 rg") == 1);
    CHECK(content.find("0.941 0.941 0.941 rg\n72.00 660.00 200.00 20.00 re\nf\n") !=
          std::string::npos);
    CHECK(count_occurrences(content, "1.000 0.000 0.000 RG") == 3);
    CHECK(count_occurrences(content, "1.00 w") == 3);
    // Header text in white, body text in black.
    CHECK(content.find("1.000 1.000 1.000 rg") < content.find("(A) Tj"));
    CHECK(count_occurrences(content, " re\nS\n") == 6);
}

void test_alignment_and_cells() {
    quire::Document doc;
    doc.add_page();
    doc.new_table({100, 100, 100})
        .set_cell_padding(5)
        .set_column_align(1, quire::TextAlign::Center)
        .set_column_align(2, quire::TextAlign::Right)
        .set_column_align(7, quire::TextAlign::Right)
        .set_column_align(-1, quire::TextAlign::Right)
        .row({"ab", "cd", "ef", "ignored"})
        .row({"short"})
        .draw();
    const auto content = serialize(doc).page_content(0);
    // Baseline is padding + 0.8 * size below the row top: 792 - 72 - 5 - 9.6.
    CHECK(content.find("77.00 705.40 Td\n  (ab) Tj") != std::string::npos);
    // "cd" is 12pt wide: 172 + (100 - 12) / 2.
    CHECK(content.find("216.00 705.40 Td\n  (cd) Tj") != std::string::npos);
    // "ef": 272 + 100 - 5 - 12.
    CHECK(content.find("355.00 705.40 Td\n  (ef) Tj") != std::string::npos);
    CHECK(content.find("ignored") == std::string::npos);
    CHECK(content.find("(short) Tj") != std::string::npos);
    CHECK(count_occurrences(content, " Tj") == 4);
    CHECK(count_occurrences(content, " re\nS\n") == 6);
}

void test_table_font_is_restored() {
    quire::Document doc;
    doc.add_page();
    doc.new_table({100}).set_font("Courier", 10).header({"h"}).row({"r"}).draw();
    CHECK(doc.current_font() == quire::BuiltinFont::Helvetica);
    CHECK(doc.font_size() == 12);
    const auto content = serialize(doc).page_content(0);
    CHECK(content.find("/Courier-Bold 10.00 Tf") != std::string::npos);
    CHECK(content.find("/Courier 10.00 Tf") != std::string::npos);
    CHECK(content.find("/Helvetica") == std::string::npos);
    CHECK(doc.get_pos().y == 72 + 2 * 18);
}

void test_convenience_tables() {
    quire::Document doc;
    doc.add_page();
    doc.data_table({{"zeta", "last"}, {"alpha", "first"}, {"mid", "middle"}});
    doc.key_value_table({{"Name", "Quire"}, {"Kind", "Library"}});
    doc.simple_table({"x", "y", "z"}, {{"1", "2", "3"}});
    const auto content = serialize(doc).page_content(0);
    CHECK(content.find("(Field) Tj") < content.find("(alpha) Tj"));
    CHECK(content.find("(alpha) Tj") < content.find("(mid) Tj"));
    CHECK(content.find("(mid) Tj") < content.find("(zeta) Tj"));
    CHECK(content.find("(Name:) Tj") != std::string::npos);
    CHECK(content.find("(Kind:) Tj") != std::string::npos);
    CHECK(content.find("(z) Tj") != std::string::npos);
    // Data table: 4 rows, key/value: 2 rows, simple: 2 rows.
    CHECK(doc.get_pos().y == 72 + 8 * 20);
    // Simple table columns are a third of the content width each.
    CHECK(content.find("72.00 580.00 156.00 20.00 re") != std::string::npos);
}

} // namespace

int main() {
    RUN_TEST(test_overflow_adds_pages);
    RUN_TEST(test_header_repeats_on_every_page);
    RUN_TEST(test_header_style_and_alternate_rows);
    RUN_TEST(test_alignment_and_cells);
    RUN_TEST(test_table_font_is_restored);
    RUN_TEST(test_convenience_tables);
    return quire::testing::test_result();
}

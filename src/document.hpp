// SPDX-License-Identifier: Apache-2.0
// Copyright 2023-2024 Jussi Pakkanen

#pragma once

#include <pdfcommon.hpp>
#include <builtinfonts.hpp>
#include <errorhandling.hpp>
#include <pdfpage.hpp>

#include <fmt/core.h>

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace quire::internal {

struct DocumentProperties {
    PageSize page_size = pagesizes::Letter;
    Orientation orientation = Orientation::Portrait;
    Margins margins{72, 72, 72, 72};
    std::string font = "Helvetica";
    double font_size = 12;
    double line_height = 1.2;
    Metadata metadata;
    // Content streams are stored uncompressed unless this is set.
    bool compress_streams = false;
};

class Table;
class PdfWriter;

// The in-memory description of a PDF file. Pages are built with the
// fluent drawing and text methods and turned into bytes only when the
// document is written out.
//
// Unless noted otherwise, coordinates are in points with the origin at the
// top left corner of the current page and y growing downwards.
class Document {
public:
    Document();
    explicit Document(const DocumentProperties &d);

    friend class Table;
    friend class PdfWriter;

    // Page setup. These apply to pages added afterwards.
    Document &set_page_size(const PageSize &size);
    Document &set_orientation(Orientation o);
    Document &set_margins(double top, double right, double bottom, double left);
    Document &set_margins(const Margins &m);

    Document &add_page();

    Document &set_pos(double x, double y);
    Point get_pos() const { return Point{x, y}; }
    // Relative to the top left corner of the content area.
    Document &move_to(double x, double y);

    // One-based, zero before the first page is added.
    int32_t page() const { return (int32_t)pages.size(); }
    int32_t page_count() const { return (int32_t)pages.size(); }

    double content_width() const;
    double content_height() const;
    const Margins &margins() const { return docprops.margins; }

    Document &set_metadata(const Metadata &m);
    Document &set_title(std::string_view title);
    Document &set_author(std::string_view author);
    Document &set_subject(std::string_view subject);
    Document &set_keywords(std::string_view keywords);
    Document &set_creator(std::string_view creator);
    const Metadata &metadata() const { return docprops.metadata; }

    // Drawing.
    Document &set_line_width(double w);
    Document &set_stroke_color(const Color &c);
    Document &set_fill_color(const Color &c);
    Document &set_dash(const std::vector<double> &pattern, double phase = 0);
    Document &clear_dash();

    Document &line(double x1, double y1, double x2, double y2);
    Document &hline();
    Document &hline_at(double y);
    // (x, y) is the top left corner of the rectangle.
    Document &rect(double x, double y, double w, double h);
    Document &rect_filled(double x, double y, double w, double h);
    Document &rect_filled_stroke(double x, double y, double w, double h);
    Document &ellipse(double x, double y, double rx, double ry);
    Document &ellipse_filled(double x, double y, double rx, double ry);
    Document &circle(double x, double y, double r);
    Document &circle_filled(double x, double y, double r);
    // Fewer than three points draws nothing.
    Document &polygon(const std::vector<Point> &points);
    Document &polygon_filled(const std::vector<Point> &points);

    Document &save_state();
    Document &restore_state();
    Document &translate(double tx, double ty);
    Document &scale(double sx, double sy);
    Document &rotate(double degrees);

    // Images are always stored as JPEG. Invalid images are reported on
    // stderr and not drawn.
    Document &image(double x, double y, double w, double h, const RawPixelImage &img);

    // These do not modify the document on failure.
    rvoe<NoReturnValue> draw_image(double x, double y, double w, double h, const RawPixelImage &img);
    rvoe<NoReturnValue>
    image_from_file(double x, double y, double w, double h, const std::filesystem::path &fname);
    rvoe<NoReturnValue> image_from_stream(double x, double y, double w, double h, FILE *f);
    rvoe<NoReturnValue>
    image_from_bytes(double x, double y, double w, double h, std::string_view data);
    rvoe<NoReturnValue>
    image_from_base64(double x, double y, double w, double h, std::string_view b64);

    int32_t image_count() const { return (int32_t)images.size(); }

    // Text.
    Document &set_font(std::string_view name, double size);
    Document &font(std::string_view name);
    Document &set_font_size(double size);
    Document &size(double size) { return set_font_size(size); }
    Document &set_line_height(double multiplier);
    Document &bold();
    Document &italic();
    Document &regular();

    BuiltinFont current_font() const { return font_id; }
    double font_size() const { return pointsize; }
    double line_height() const { return line_height_mult; }

    // The cursor y is the baseline of the text.
    Document &text(std::string_view utf8);
    Document &text_at(double x, double y, std::string_view utf8);
    Document &ln();
    Document &br();
    Document &write_text(std::string_view utf8);
    template<typename... Args> Document &writef(fmt::format_string<Args...> f, Args &&...args) {
        return write_text(fmt::format(f, std::forward<Args>(args)...));
    }
    Document &write_line(std::string_view utf8);
    template<typename... Args>
    Document &write_linef(fmt::format_string<Args...> f, Args &&...args) {
        return write_line(fmt::format(f, std::forward<Args>(args)...));
    }
    Document &paragraph(std::string_view utf8, TextAlign align = TextAlign::Left);
    double text_width(std::string_view utf8) const;
    Document &center_text(std::string_view utf8);
    Document &right_text(std::string_view utf8);
    Document &title(std::string_view utf8);
    Document &heading(std::string_view utf8);
    Document &subheading(std::string_view utf8);
    Document &list(const std::vector<std::string> &items);
    Document &numbered_list(const std::vector<std::string> &items);

    // Tables.
    Table new_table(const std::vector<double> &column_widths);
    Table new_table_auto(int32_t num_columns);
    Document &simple_table(const std::vector<std::string> &headers,
                           const std::vector<std::vector<std::string>> &rows);
    Document &data_table(const std::map<std::string, std::string> &data);
    Document &key_value_table(const std::vector<std::pair<std::string, std::string>> &pairs);

    // Output. Every call serializes the whole document from scratch.
    rvoe<NoReturnValue> write(FILE *output_file) const;
    rvoe<NoReturnValue> save(const std::filesystem::path &ofilename) const;
    rvoe<std::string> bytes() const;

private:
    void ensure_page();
    Page &current_page();
    // Converts a top-down y coordinate to PDF user space on the current page.
    double pdf_y(double y) const { return pages.back().height() - y; }
    PageSize oriented_page_size() const;
    double bottom_limit() const;

    void draw_ellipse(double x, double y, double rx, double ry, bool fill);
    void draw_polygon(const std::vector<Point> &points, bool fill);
    void emit_text(std::string_view utf8, double x, double y);
    void newline(bool reset_x);
    void styled_line(std::string_view utf8, double size, bool centered, int32_t line_feeds);

    DocumentProperties docprops;
    std::vector<Page> pages;
    std::vector<JpegImage> images;
    BuiltinFont font_id = BuiltinFont::Helvetica;
    double pointsize;
    double line_height_mult;
    double x = 0;
    double y = 0;
};

} // namespace quire::internal

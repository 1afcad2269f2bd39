// SPDX-License-Identifier: Apache-2.0
// Copyright 2023-2024 Jussi Pakkanen

#include <document.hpp>
#include <pdfwriter.hpp>
#include <utils.hpp>

#include <cstdio>

namespace quire::internal {

namespace {

const char DEFAULT_PRODUCER[] = "Quire";

void fill_metadata_defaults(Metadata &m) {
    const std::chrono::system_clock::time_point unset{};
    if(m.producer.empty()) {
        m.producer = DEFAULT_PRODUCER;
    }
    if(m.creation_date == unset || m.mod_date == unset) {
        const auto now = current_time();
        if(m.creation_date == unset) {
            m.creation_date = now;
        }
        if(m.mod_date == unset) {
            m.mod_date = now;
        }
    }
}

} // namespace

Document::Document() : Document(DocumentProperties{}) {}

Document::Document(const DocumentProperties &d)
    : docprops{d}, pointsize{d.font_size}, line_height_mult{d.line_height} {
    fill_metadata_defaults(docprops.metadata);
    auto f = find_builtin_font(docprops.font);
    if(f) {
        font_id = *f;
    } else {
        fprintf(stderr,
                "Unknown font \"%s\", using %s.\n",
                docprops.font.c_str(),
                builtin_font_info(font_id).base_font);
    }
}

Document &Document::set_page_size(const PageSize &size) {
    docprops.page_size = size;
    return *this;
}

Document &Document::set_orientation(Orientation o) {
    docprops.orientation = o;
    return *this;
}

Document &Document::set_margins(double top, double right, double bottom, double left) {
    return set_margins(Margins{top, right, bottom, left});
}

Document &Document::set_margins(const Margins &m) {
    docprops.margins = m;
    return *this;
}

PageSize Document::oriented_page_size() const {
    if(docprops.orientation == Orientation::Landscape) {
        return PageSize{docprops.page_size.h, docprops.page_size.w};
    }
    return docprops.page_size;
}

Document &Document::add_page() {
    pages.emplace_back(oriented_page_size());
    x = docprops.margins.left;
    y = docprops.margins.top;
    return *this;
}

void Document::ensure_page() {
    if(pages.empty()) {
        add_page();
    }
}

Page &Document::current_page() {
    ensure_page();
    return pages.back();
}

Document &Document::set_pos(double new_x, double new_y) {
    x = new_x;
    y = new_y;
    return *this;
}

Document &Document::move_to(double new_x, double new_y) {
    x = docprops.margins.left + new_x;
    y = docprops.margins.top + new_y;
    return *this;
}

double Document::content_width() const {
    const double w = pages.empty() ? oriented_page_size().w : pages.back().width();
    return w - docprops.margins.left - docprops.margins.right;
}

double Document::content_height() const {
    const double h = pages.empty() ? oriented_page_size().h : pages.back().height();
    return h - docprops.margins.top - docprops.margins.bottom;
}

// The largest y the content area reaches on the current page.
double Document::bottom_limit() const {
    const double h = pages.empty() ? oriented_page_size().h : pages.back().height();
    return h - docprops.margins.bottom;
}

Document &Document::set_metadata(const Metadata &m) {
    docprops.metadata = m;
    fill_metadata_defaults(docprops.metadata);
    return *this;
}

Document &Document::set_title(std::string_view title) {
    docprops.metadata.title = title;
    return *this;
}

Document &Document::set_author(std::string_view author) {
    docprops.metadata.author = author;
    return *this;
}

Document &Document::set_subject(std::string_view subject) {
    docprops.metadata.subject = subject;
    return *this;
}

Document &Document::set_keywords(std::string_view keywords) {
    docprops.metadata.keywords = keywords;
    return *this;
}

Document &Document::set_creator(std::string_view creator) {
    docprops.metadata.creator = creator;
    return *this;
}

rvoe<NoReturnValue> Document::write(FILE *output_file) const {
    PdfWriter pw(*this);
    return pw.write_to_file(output_file);
}

rvoe<NoReturnValue> Document::save(const std::filesystem::path &ofilename) const {
    PdfWriter pw(*this);
    return pw.write_to_file(ofilename);
}

rvoe<std::string> Document::bytes() const {
    PdfWriter pw(*this);
    return pw.write_to_memory();
}

} // namespace quire::internal

// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2024 Jussi Pakkanen

#include <document.hpp>
#include <imagefileops.hpp>
#include <imageops.hpp>
#include <utils.hpp>

#include <cmath>
#include <cstdio>
#include <numbers>

namespace quire::internal {

namespace {

// Control point distance for approximating a quarter circle with a cubic Bezier.
constexpr double BEZIER_KAPPA = 0.5522848;

double round3(double v) { return std::round(1000 * v) / 1000; }

} // namespace

Document &Document::set_line_width(double w) {
    current_page().cmd_w(w);
    return *this;
}

Document &Document::set_stroke_color(const Color &c) {
    current_page().cmd_RG(c);
    return *this;
}

Document &Document::set_fill_color(const Color &c) {
    current_page().cmd_rg(c);
    return *this;
}

Document &Document::set_dash(const std::vector<double> &pattern, double phase) {
    current_page().cmd_d(pattern, phase);
    return *this;
}

Document &Document::clear_dash() {
    current_page().cmd_d({}, 0);
    return *this;
}

Document &Document::line(double x1, double y1, double x2, double y2) {
    auto &p = current_page();
    p.cmd_m(x1, pdf_y(y1));
    p.cmd_l(x2, pdf_y(y2));
    p.cmd_S();
    return *this;
}

Document &Document::hline() {
    ensure_page();
    return hline_at(y);
}

Document &Document::hline_at(double line_y) {
    ensure_page();
    return line(docprops.margins.left,
                line_y,
                pages.back().width() - docprops.margins.right,
                line_y);
}

Document &Document::rect(double rx, double ry, double w, double h) {
    auto &p = current_page();
    p.cmd_re(rx, pdf_y(ry) - h, w, h);
    p.cmd_S();
    return *this;
}

Document &Document::rect_filled(double rx, double ry, double w, double h) {
    auto &p = current_page();
    p.cmd_re(rx, pdf_y(ry) - h, w, h);
    p.cmd_f();
    return *this;
}

Document &Document::rect_filled_stroke(double rx, double ry, double w, double h) {
    auto &p = current_page();
    p.cmd_re(rx, pdf_y(ry) - h, w, h);
    p.cmd_B();
    return *this;
}

void Document::draw_ellipse(double cx, double cy, double rx, double ry, bool fill) {
    auto &p = current_page();
    const double k = BEZIER_KAPPA;
    cy = pdf_y(cy);
    p.cmd_m(cx + rx, cy);
    p.cmd_c(cx + rx, cy + ry * k, cx + rx * k, cy + ry, cx, cy + ry);
    p.cmd_c(cx - rx * k, cy + ry, cx - rx, cy + ry * k, cx - rx, cy);
    p.cmd_c(cx - rx, cy - ry * k, cx - rx * k, cy - ry, cx, cy - ry);
    p.cmd_c(cx + rx * k, cy - ry, cx + rx, cy - ry * k, cx + rx, cy);
    if(fill) {
        p.cmd_f();
    } else {
        p.cmd_S();
    }
}

Document &Document::ellipse(double cx, double cy, double rx, double ry) {
    draw_ellipse(cx, cy, rx, ry, false);
    return *this;
}

Document &Document::ellipse_filled(double cx, double cy, double rx, double ry) {
    draw_ellipse(cx, cy, rx, ry, true);
    return *this;
}

Document &Document::circle(double cx, double cy, double r) { return ellipse(cx, cy, r, r); }

Document &Document::circle_filled(double cx, double cy, double r) {
    return ellipse_filled(cx, cy, r, r);
}

void Document::draw_polygon(const std::vector<Point> &points, bool fill) {
    if(points.size() < 3) {
        return;
    }
    auto &p = current_page();
    p.cmd_m(points.front().x, pdf_y(points.front().y));
    for(size_t i = 1; i < points.size(); ++i) {
        p.cmd_l(points[i].x, pdf_y(points[i].y));
    }
    p.cmd_h();
    if(fill) {
        p.cmd_f();
    } else {
        p.cmd_S();
    }
}

Document &Document::polygon(const std::vector<Point> &points) {
    draw_polygon(points, false);
    return *this;
}

Document &Document::polygon_filled(const std::vector<Point> &points) {
    draw_polygon(points, true);
    return *this;
}

Document &Document::save_state() {
    current_page().cmd_q();
    return *this;
}

Document &Document::restore_state() {
    if(!current_page().cmd_Q()) {
        fprintf(stderr, "Ignoring restore_state without a matching save_state.\n");
    }
    return *this;
}

Document &Document::translate(double tx, double ty) {
    current_page().cmd_cm(1, 0, 0, 1, tx, -ty);
    return *this;
}

Document &Document::scale(double sx, double sy) {
    current_page().cmd_cm(sx, 0, 0, sy, 0, 0);
    return *this;
}

Document &Document::rotate(double degrees) {
    const double rad = degrees * std::numbers::pi / 180;
    const double c = round3(std::cos(rad)) + 0.0;
    const double s = round3(std::sin(rad)) + 0.0;
    current_page().cmd_cm(c, s, 0.0 - s, c, 0, 0);
    return *this;
}

rvoe<NoReturnValue>
Document::draw_image(double ix, double iy, double w, double h, const RawPixelImage &img) {
    ERC(jpg, encode_jpeg(img));
    auto &p = current_page();
    const int32_t image_index = (int32_t)images.size();
    images.emplace_back(std::move(jpg));
    p.draw_image(image_index, ix, pdf_y(iy) - h, w, h);
    RETOK;
}

Document &Document::image(double ix, double iy, double w, double h, const RawPixelImage &img) {
    auto rc = draw_image(ix, iy, w, h, img);
    if(!rc) {
        fprintf(stderr, "Could not add image: %s\n", error_text(rc.error()));
    }
    return *this;
}

rvoe<NoReturnValue> Document::image_from_file(
    double ix, double iy, double w, double h, const std::filesystem::path &fname) {
    ERC(img, load_image_file(fname));
    return draw_image(ix, iy, w, h, img);
}

rvoe<NoReturnValue>
Document::image_from_stream(double ix, double iy, double w, double h, FILE *f) {
    ERC(data, load_file_as_bytes(f));
    return image_from_bytes(ix, iy, w, h, data);
}

rvoe<NoReturnValue>
Document::image_from_bytes(double ix, double iy, double w, double h, std::string_view data) {
    ERC(img, load_image_from_memory(data));
    return draw_image(ix, iy, w, h, img);
}

rvoe<NoReturnValue>
Document::image_from_base64(double ix, double iy, double w, double h, std::string_view b64) {
    ERC(data, base64_decode(b64));
    return image_from_bytes(ix, iy, w, h, data);
}

} // namespace quire::internal

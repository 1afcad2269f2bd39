// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2024 Jussi Pakkanen

#include <pdfpage.hpp>
#include <utils.hpp>

#include <fmt/core.h>

#include <iterator>

namespace quire::internal {

std::string image_resource_name(int32_t image_index) {
    return fmt::format("Im{}", image_index + 1);
}

Page::Page(PageSize size) : size{size} {}

void Page::cmd_q() { content.q(); }

bool Page::cmd_Q() { return content.Q(); }

void Page::cmd_re(double x, double y, double w, double h) { content.append_command(x, y, w, h, "re"); }

void Page::cmd_f() { content.append("f"); }

void Page::cmd_S() { content.append("S"); }

void Page::cmd_B() { content.append("B"); }

void Page::cmd_h() { content.append("h"); }

void Page::cmd_m(double x, double y) { content.append_command(x, y, "m"); }

void Page::cmd_l(double x, double y) { content.append_command(x, y, "l"); }

void Page::cmd_w(double w) { content.append_command(w, "w"); }

void Page::cmd_c(double x1, double y1, double x2, double y2, double x3, double y3) {
    content.append_curve(x1, y1, x2, y2, x3, y3);
}

void Page::cmd_cm(double m1, double m2, double m3, double m4, double m5, double m6) {
    content.append_matrix(m1, m2, m3, m4, m5, m6);
}

void Page::cmd_d(const std::vector<double> &dash_array, double phase) {
    if(dash_array.empty()) {
        content.append("[] 0 d");
        return;
    }
    std::string arr{"["};
    auto app = std::back_inserter(arr);
    bool first = true;
    for(const auto d : dash_array) {
        if(!first) {
            arr += ' ';
        }
        fmt::format_to(app, "{:.2f}", d);
        first = false;
    }
    arr += ']';
    content.append_command(fmt::format("{} {:.2f}", arr, phase), "d");
}

void Page::cmd_RG(const Color &c) { content.append_color(c, "RG"); }

void Page::cmd_rg(const Color &c) { content.append_color(c, "rg"); }

void Page::draw_image(int32_t image_index, double x, double y, double w, double h) {
    images.insert(image_index);
    content.q();
    content.append(fmt::format("{:.2f} 0 0 {:.2f} {:.2f} {:.2f} cm", w, h, x, y));
    content.append(fmt::format("/{} Do", image_resource_name(image_index)));
    content.Q();
}

void Page::render_text(
    BuiltinFont font, double pointsize, double x, double y, std::string_view utf8) {
    const auto &info = builtin_font_info(font);
    fonts.insert(font);
    content.BT();
    content.append(fmt::format("/{} {:.2f} Tf", info.base_font, pointsize));
    content.append_command(x, y, "Td");
    content.append_command(pdfstring_quote(utf8_to_winansi(utf8)), "Tj");
    content.ET();
}

} // namespace quire::internal

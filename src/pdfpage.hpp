// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2024 Jussi Pakkanen

#pragma once

#include <pdfcommon.hpp>
#include <builtinfonts.hpp>
#include <commandstreamformatter.hpp>

#include <cstdint>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace quire::internal {

// Resource name of an image in page resource dictionaries, "Im1" for index 0.
std::string image_resource_name(int32_t image_index);

// One page of the document. All coordinates given to the cmd_ methods are
// already in PDF user space, that is, y grows upwards from the bottom edge.
class Page {

public:
    // The size must already have the orientation applied.
    explicit Page(PageSize size);

    double width() const { return size.w; }
    double height() const { return size.h; }

    // All methods that begin with cmd_ map directly to the PDF primitive with the same name.
    void cmd_q(); // Save
    bool cmd_Q(); // Restore
    void cmd_re(double x, double y, double w, double h);
    void cmd_f();
    void cmd_S();
    void cmd_B();
    void cmd_h();
    void cmd_m(double x, double y);
    void cmd_l(double x, double y);
    void cmd_w(double w);
    void cmd_c(double x1, double y1, double x2, double y2, double x3, double y3);
    void cmd_cm(double m1, double m2, double m3, double m4, double m5, double m6);
    void cmd_d(const std::vector<double> &dash_array, double phase);

    // Stroke.
    void cmd_RG(const Color &c);
    // Nonstroke
    void cmd_rg(const Color &c);

    void draw_image(int32_t image_index, double x, double y, double w, double h);
    void render_text(BuiltinFont font, double pointsize, double x, double y, std::string_view utf8);

    const CommandStreamFormatter &commands() const { return content; }
    const std::set<BuiltinFont> &used_fonts() const { return fonts; }
    const std::set<int32_t> &used_images() const { return images; }

private:
    PageSize size;
    CommandStreamFormatter content;
    std::set<BuiltinFont> fonts;
    std::set<int32_t> images;
};

} // namespace quire::internal

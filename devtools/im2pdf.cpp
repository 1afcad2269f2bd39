// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#include <quire.hpp>

#include <cstdio>

// Puts every input image on its own page, scaled to fit the content area.
int main(int argc, char **argv) {
    if(argc < 3) {
        printf("%s <pdf output> <image input> [<image input> ...]\n", argv[0]);
        return 1;
    }
    quire::DocumentProperties dp;
    dp.page_size = quire::pagesizes::A4;
    dp.margins = quire::Margins{36, 36, 36, 36};
    dp.metadata.title = "Image testing tool";
    quire::Document doc(dp);
    for(int i = 2; i < argc; ++i) {
        auto image = quire::load_image_file(argv[i]);
        if(!image) {
            fprintf(stderr, "%s: %s\n", argv[i], quire::error_text(image.error()));
            return 1;
        }
        doc.add_page();
        const double avail_w = doc.content_width();
        const double avail_h = doc.content_height();
        const double aspect = double(image->md.w) / image->md.h;
        double w = avail_w;
        double h = w / aspect;
        if(h > avail_h) {
            h = avail_h;
            w = h * aspect;
        }
        auto rc = doc.draw_image(doc.margins().left, doc.margins().top, w, h, *image);
        if(!rc) {
            fprintf(stderr, "%s: %s\n", argv[i], quire::error_text(rc.error()));
            return 1;
        }
    }
    auto rc = doc.save(argv[1]);
    if(!rc) {
        fprintf(stderr, "Could not write %s: %s\n", argv[1], quire::error_text(rc.error()));
        return 1;
    }
    return 0;
}

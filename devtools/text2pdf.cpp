// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#include <quire.hpp>
#include <utils.hpp>

#include <cstdio>
#include <string>
#include <string_view>

// Lays out a plain text file as paragraphs separated by blank lines.
int main(int argc, char **argv) {
    if(argc != 3 && argc != 4) {
        printf("%s <text file> <pdf output> [font]\n", argv[0]);
        return 1;
    }
    auto contents = quire::internal::load_file_as_bytes(std::filesystem::path(argv[1]));
    if(!contents) {
        fprintf(stderr, "%s: %s\n", argv[1], quire::error_text(contents.error()));
        return 1;
    }
    quire::DocumentProperties dp;
    dp.metadata.title = std::filesystem::path(argv[1]).filename().string();
    dp.metadata.creator = "text2pdf";
    if(argc == 4) {
        dp.font = argv[3];
    }
    quire::Document doc(dp);
    doc.add_page();

    std::string_view text(*contents);
    std::string paragraph;
    while(!text.empty()) {
        const auto eol = text.find('\n');
        std::string_view line = text.substr(0, eol);
        text = eol == std::string_view::npos ? std::string_view{} : text.substr(eol + 1);
        if(line.find_first_not_of(" \t\r") == std::string_view::npos) {
            if(!paragraph.empty()) {
                doc.paragraph(paragraph).ln();
                paragraph.clear();
            }
            continue;
        }
        if(!paragraph.empty()) {
            paragraph += ' ';
        }
        paragraph += line;
    }
    if(!paragraph.empty()) {
        doc.paragraph(paragraph);
    }

    auto rc = doc.save(argv[2]);
    if(!rc) {
        fprintf(stderr, "Could not write %s: %s\n", argv[2], quire::error_text(rc.error()));
        return 1;
    }
    return 0;
}

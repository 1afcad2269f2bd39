// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#pragma once

#include <document.hpp>
#include <objectformatter.hpp>

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace quire::internal {

struct PdfObject {
    int32_t number;
    std::string dict;
    std::string stream;
    bool has_stream = false;
};

// Turns a Document into PDF bytes. Object numbers are assigned during
// the build and start from 1 every time.
class PdfWriter {
public:
    explicit PdfWriter(const Document &doc);

    // Writes to a temporary file first and renames it over the target
    // only once everything has been flushed to disk.
    rvoe<NoReturnValue> write_to_file(const std::filesystem::path &ofilename);
    rvoe<NoReturnValue> write_to_file(FILE *output_file);
    rvoe<std::string> write_to_memory();

private:
    rvoe<NoReturnValue> build_objects();
    int32_t add_object(std::string dict);
    int32_t add_stream_object(std::string dict, std::string stream);
    int32_t reserve_object();

    rvoe<NoReturnValue> write_page(const Page &page);
    void write_pages_root();
    void write_catalog();
    void write_info();

    std::string serialize() const;
    void write_cross_reference_table(std::string &buf, const std::vector<size_t> &offsets) const;
    void write_trailer(std::string &buf, size_t xref_offset) const;

    const Document &doc;
    int32_t next_object_number = 1;
    std::vector<PdfObject> objects;
    std::vector<int32_t> font_objects;
    std::vector<int32_t> image_objects;

    // Page dictionaries stay open until the page tree object number is known.
    struct OpenPage {
        int32_t obj_num;
        ObjectFormatter dict;
    };
    std::vector<OpenPage> open_pages;
    int32_t pages_obj = -1;
    int32_t catalog_obj = -1;
    int32_t info_obj = -1;
};

} // namespace quire::internal

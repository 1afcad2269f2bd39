// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#include <pdfwriter.hpp>
#include <utils.hpp>

#include <fmt/core.h>

#include <cerrno>
#include <cstring>
#include <iterator>
#include <memory>
#include <set>
#include <system_error>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace quire::internal {

namespace {

const char PDF_header[] = "%PDF-1.4\n%\xe2\xe3\xcf\xd3\n";

void write_info_string(ObjectFormatter &fmt, const char *key, const std::string &value) {
    if(value.empty()) {
        return;
    }
    fmt.add_token(key);
    fmt.add_token(utf8_to_pdf_textstring(value));
}

} // namespace

PdfWriter::PdfWriter(const Document &doc_) : doc(doc_) {}

int32_t PdfWriter::reserve_object() {
    const int32_t num = next_object_number++;
    objects.push_back(PdfObject{num, {}, {}, false});
    return num;
}

int32_t PdfWriter::add_object(std::string dict) {
    const int32_t num = reserve_object();
    objects.back().dict = std::move(dict);
    return num;
}

int32_t PdfWriter::add_stream_object(std::string dict, std::string stream) {
    const int32_t num = reserve_object();
    objects.back().dict = std::move(dict);
    objects.back().stream = std::move(stream);
    objects.back().has_stream = true;
    return num;
}

rvoe<NoReturnValue> PdfWriter::build_objects() {
    next_object_number = 1;
    objects.clear();
    open_pages.clear();
    font_objects.assign(NUM_BUILTIN_FONTS, -1);
    image_objects.clear();

    // A document without pages still produces a valid file.
    std::vector<Page> blank;
    if(doc.pages.empty()) {
        blank.emplace_back(doc.oriented_page_size());
    }
    const std::vector<Page> &pages = doc.pages.empty() ? blank : doc.pages;

    std::set<BuiltinFont> used_fonts;
    for(const auto &p : pages) {
        used_fonts.insert(p.used_fonts().begin(), p.used_fonts().end());
    }
    for(const auto f : used_fonts) {
        const auto &info = builtin_font_info(f);
        ObjectFormatter fmt;
        fmt.begin_dict();
        fmt.add_token_pair("/Type", "/Font");
        fmt.add_token("/Subtype");
        fmt.add_token_with_slash(info.subtype);
        fmt.add_token("/BaseFont");
        fmt.add_token_with_slash(info.base_font);
        if(info.uses_winansi) {
            fmt.add_token_pair("/Encoding", "/WinAnsiEncoding");
        }
        fmt.end_dict();
        font_objects[(size_t)f] = add_object(fmt.steal());
    }

    for(const auto &img : doc.images) {
        ObjectFormatter fmt;
        fmt.begin_dict();
        fmt.add_token_pair("/Type", "/XObject");
        fmt.add_token_pair("/Subtype", "/Image");
        fmt.add_token_pair("/Width", img.w);
        fmt.add_token_pair("/Height", img.h);
        fmt.add_token_pair("/ColorSpace",
                           img.cs == ImageColorspace::Gray ? "/DeviceGray" : "/DeviceRGB");
        fmt.add_token_pair("/BitsPerComponent", "8");
        fmt.add_token_pair("/Filter", "/DCTDecode");
        fmt.add_token_pair("/Length", img.file_contents.size());
        fmt.end_dict();
        image_objects.push_back(add_stream_object(fmt.steal(), img.file_contents));
    }

    for(const auto &p : pages) {
        ERCV(write_page(p));
    }
    write_pages_root();
    write_catalog();
    write_info();
    RETOK;
}

rvoe<NoReturnValue> PdfWriter::write_page(const Page &page) {
    std::string commands = page.commands().closed_contents();
    ObjectFormatter cfmt;
    cfmt.begin_dict();
    if(doc.docprops.compress_streams) {
        ERC(compressed, flate_compress(commands));
        commands = std::move(compressed);
        cfmt.add_token_pair("/Filter", "/FlateDecode");
    }
    cfmt.add_token_pair("/Length", commands.size());
    cfmt.end_dict();
    const int32_t contents_obj = add_stream_object(cfmt.steal(), std::move(commands));

    OpenPage op{reserve_object(), ObjectFormatter{}};
    auto &fmt = op.dict;
    fmt.begin_dict();
    fmt.add_token_pair("/Type", "/Page");
    fmt.add_token("/MediaBox");
    fmt.begin_array();
    fmt.add_token(0);
    fmt.add_token(0);
    fmt.add_token(page.width());
    fmt.add_token(page.height());
    fmt.end_array();
    fmt.add_token("/Contents");
    fmt.add_object_ref(contents_obj);
    fmt.add_token("/Resources");
    fmt.begin_dict();
    if(!page.used_fonts().empty()) {
        fmt.add_token("/Font");
        fmt.begin_dict();
        for(const auto f : page.used_fonts()) {
            fmt.add_token_with_slash(builtin_font_info(f).base_font);
            fmt.add_object_ref(font_objects[(size_t)f]);
        }
        fmt.end_dict();
    }
    if(!page.used_images().empty()) {
        fmt.add_token("/XObject");
        fmt.begin_dict();
        for(const auto i : page.used_images()) {
            fmt.add_token_with_slash(image_resource_name(i));
            fmt.add_object_ref(image_objects.at(i));
        }
        fmt.end_dict();
    }
    fmt.end_dict();
    // The dictionary is closed once /Parent is known.
    open_pages.push_back(std::move(op));
    RETOK;
}

void PdfWriter::write_pages_root() {
    ObjectFormatter fmt;
    fmt.begin_dict();
    fmt.add_token_pair("/Type", "/Pages");
    fmt.add_token("/Kids");
    fmt.begin_array();
    for(const auto &op : open_pages) {
        fmt.add_object_ref(op.obj_num);
    }
    fmt.end_array();
    fmt.add_token_pair("/Count", open_pages.size());
    fmt.end_dict();
    pages_obj = add_object(fmt.steal());

    for(auto &op : open_pages) {
        op.dict.add_token("/Parent");
        op.dict.add_object_ref(pages_obj);
        op.dict.end_dict();
        objects.at(op.obj_num - 1).dict = op.dict.steal();
    }
}

void PdfWriter::write_catalog() {
    ObjectFormatter fmt;
    fmt.begin_dict();
    fmt.add_token_pair("/Type", "/Catalog");
    fmt.add_token("/Pages");
    fmt.add_object_ref(pages_obj);
    fmt.end_dict();
    catalog_obj = add_object(fmt.steal());
}

void PdfWriter::write_info() {
    const auto &md = doc.docprops.metadata;
    const std::chrono::system_clock::time_point unset{};
    ObjectFormatter fmt;
    fmt.begin_dict();
    write_info_string(fmt, "/Title", md.title);
    write_info_string(fmt, "/Author", md.author);
    write_info_string(fmt, "/Subject", md.subject);
    write_info_string(fmt, "/Keywords", md.keywords);
    write_info_string(fmt, "/Creator", md.creator);
    write_info_string(fmt, "/Producer", md.producer);
    if(md.creation_date != unset) {
        fmt.add_token("/CreationDate");
        fmt.add_token(pdf_date_string(md.creation_date));
    }
    if(md.mod_date != unset) {
        fmt.add_token("/ModDate");
        fmt.add_token(pdf_date_string(md.mod_date));
    }
    fmt.end_dict();
    info_obj = add_object(fmt.steal());
}

std::string PdfWriter::serialize() const {
    std::string buf{PDF_header};
    auto app = std::back_inserter(buf);
    std::vector<size_t> offsets;
    offsets.reserve(objects.size());
    for(const auto &obj : objects) {
        offsets.push_back(buf.size());
        fmt::format_to(app, "{} 0 obj\n", obj.number);
        buf += obj.dict;
        if(obj.has_stream) {
            if(buf.back() != '\n') {
                buf += '\n';
            }
            buf += "stream\n";
            buf += obj.stream;
            // There must always be a newline before "endstream".
            // It is not counted in the /Length key in the object dictionary.
            buf += "\nendstream\n";
        }
        if(buf.back() != '\n') {
            buf += '\n';
        }
        buf += "endobj\n";
    }
    const size_t xref_offset = buf.size();
    write_cross_reference_table(buf, offsets);
    write_trailer(buf, xref_offset);
    return buf;
}

void PdfWriter::write_cross_reference_table(std::string &buf,
                                            const std::vector<size_t> &offsets) const {
    auto app = std::back_inserter(buf);
    fmt::format_to(app,
                   R"(xref
0 {}
)",
                   offsets.size() + 1);
    buf += "0000000000 65535 f \n"; // The end of line whitespace is significant.
    for(const auto off : offsets) {
        fmt::format_to(app, "{:010} 00000 n \n", off);
    }
}

void PdfWriter::write_trailer(std::string &buf, size_t xref_offset) const {
    ObjectFormatter fmt;
    fmt.begin_dict();
    fmt.add_token_pair("/Size", objects.size() + 1);
    fmt.add_token("/Root");
    fmt.add_object_ref(catalog_obj);
    fmt.add_token("/Info");
    fmt.add_object_ref(info_obj);
    fmt.end_dict();
    buf += "trailer\n";
    buf += fmt.steal();
    fmt::format_to(std::back_inserter(buf),
                   R"(startxref
{}
%%EOF
)",
                   xref_offset);
}

rvoe<std::string> PdfWriter::write_to_memory() {
    ERCV(build_objects());
    return serialize();
}

rvoe<NoReturnValue> PdfWriter::write_to_file(FILE *output_file) {
    if(!output_file) {
        RETERR(ArgIsNull);
    }
    ERC(contents, write_to_memory());
    if(fwrite(contents.data(), 1, contents.size(), output_file) != contents.size()) {
        perror(nullptr);
        RETERR(FileWriteError);
    }
    RETOK;
}

rvoe<NoReturnValue> PdfWriter::write_to_file(const std::filesystem::path &ofilename) {
    // Serialize fully before touching the file system.
    ERC(contents, write_to_memory());
    std::filesystem::path tempfname(ofilename);
    tempfname += "~";
    FILE *out_file = fopen(tempfname.string().c_str(), "wb");
    if(!out_file) {
        perror(nullptr);
        RETERR(CouldNotOpenFile);
    }
    std::unique_ptr<FILE, int (*)(FILE *)> fcloser(out_file, fclose);

    if(fwrite(contents.data(), 1, contents.size(), out_file) != contents.size()) {
        perror(nullptr);
        RETERR(FileWriteError);
    }
    if(fflush(out_file) != 0) {
        perror(nullptr);
        RETERR(FileWriteError);
    }
    if(
#ifdef _WIN32
        _commit(fileno(out_file))
#else
        fsync(fileno(out_file))
#endif
        != 0) {

        perror(nullptr);
        RETERR(FileWriteError);
    }
    // Close the file manually to verify it worked.
    fcloser.release();
    if(fclose(out_file) != 0) {
        perror(nullptr);
        RETERR(FileWriteError);
    }

    // If we made it here, the file has been fully written and fsync'd to disk. Now replace.
    std::error_code ec;
    std::filesystem::rename(tempfname, ofilename, ec);
    if(ec) {
        fprintf(stderr, "%s\n", ec.message().c_str());
        RETERR(FileWriteError);
    }
    RETOK;
}

} // namespace quire::internal

// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2024 Jussi Pakkanen

#include <utils.hpp>
#include <fmt/core.h>
#include <zlib.h>

#include <array>
#include <cstdlib>
#include <memory>
#include <utility>
#include <time.h>

namespace quire::internal {

namespace {

const uint32_t REPLACEMENT_CHARACTER = 0xFFFD;

struct UtfDecodeStep {
    uint32_t byte1_data_mask;
    uint32_t num_subsequent_bytes;
    uint32_t min_value;
};

// clang-format off
const std::array<std::pair<uint32_t, unsigned char>, 27> winansi_specials{{
    {0x20AC, 0x80}, {0x201A, 0x82}, {0x0192, 0x83}, {0x201E, 0x84}, {0x2026, 0x85},
    {0x2020, 0x86}, {0x2021, 0x87}, {0x02C6, 0x88}, {0x2030, 0x89}, {0x0160, 0x8A},
    {0x2039, 0x8B}, {0x0152, 0x8C}, {0x017D, 0x8E}, {0x2018, 0x91}, {0x2019, 0x92},
    {0x201C, 0x93}, {0x201D, 0x94}, {0x2022, 0x95}, {0x2013, 0x96}, {0x2014, 0x97},
    {0x02DC, 0x98}, {0x2122, 0x99}, {0x0161, 0x9A}, {0x203A, 0x9B}, {0x0153, 0x9C},
    {0x017E, 0x9E}, {0x0178, 0x9F},
}};
// clang-format on

int base64_value(char c) {
    if(c >= 'A' && c <= 'Z') {
        return c - 'A';
    }
    if(c >= 'a' && c <= 'z') {
        return c - 'a' + 26;
    }
    if(c >= '0' && c <= '9') {
        return c - '0' + 52;
    }
    if(c == '+') {
        return 62;
    }
    if(c == '/') {
        return 63;
    }
    return -1;
}

void append_glyph_to_utf16be(uint32_t glyph, std::vector<uint16_t> &u16buf) {
    if(glyph < 0x10000) {
        u16buf.push_back((uint16_t)glyph);
    } else {
        const auto reduced = glyph - 0x10000;
        const auto high_surrogate = (reduced >> 10) + 0xD800;
        const auto low_surrogate = (reduced & 0b1111111111) + 0xDC00;
        u16buf.push_back((uint16_t)high_surrogate);
        u16buf.push_back((uint16_t)low_surrogate);
    }
}

struct DeflateCloser {
    void operator()(z_stream *zs) const {
        if(zs) {
            deflateEnd(zs);
        }
    }
};

} // namespace

rvoe<std::string> flate_compress(std::string_view data) {
    std::string compressed;
    const int CHUNK = 1024 * 1024;
    std::string buf;
    z_stream strm;
    strm.zalloc = Z_NULL;
    strm.zfree = Z_NULL;
    strm.opaque = Z_NULL;

    auto ret = deflateInit(&strm, Z_BEST_COMPRESSION);
    if(ret != Z_OK) {
        RETERR(CompressionFailure);
    }
    std::unique_ptr<z_stream, DeflateCloser> zcloser(&strm);
    strm.avail_in = data.size();
    strm.next_in = (Bytef *)(data.data());

    do {
        buf.resize(CHUNK);
        strm.avail_out = CHUNK;
        strm.next_out = (Bytef *)buf.data();
        ret = deflate(&strm, Z_FINISH);
        if(ret == Z_STREAM_ERROR) {
            RETERR(CompressionFailure);
        }
        const int write_size = CHUNK - strm.avail_out;
        buf.resize(write_size);
        compressed += buf;
    } while(strm.avail_out == 0);
    if(ret != Z_STREAM_END) {
        RETERR(CompressionFailure);
    }
    return compressed;
}

rvoe<std::string> load_file_as_bytes(const std::filesystem::path &fname) {
    std::error_code ec;
    if(!std::filesystem::is_regular_file(fname, ec)) {
        RETERR(FileDoesNotExist);
    }
    FILE *f = fopen(fname.string().c_str(), "rb");
    if(!f) {
        perror(nullptr);
        RETERR(CouldNotOpenFile);
    }
    std::unique_ptr<FILE, FileCloser> fcloser(f);
    return load_file_as_bytes(f);
}

rvoe<std::string> load_file_as_bytes(FILE *f) {
    if(!f) {
        RETERR(ArgIsNull);
    }
    std::string contents;
    const size_t bufsize = 64 * 1024;
    char buf[bufsize];
    while(true) {
        const size_t rc = fread(buf, 1, bufsize, f);
        contents.append(buf, rc);
        if(rc < bufsize) {
            break;
        }
    }
    if(ferror(f)) {
        perror(nullptr);
        RETERR(FileReadError);
    }
    return contents;
}

rvoe<std::string> base64_decode(std::string_view encoded) {
    std::string cleaned;
    cleaned.reserve(encoded.size());
    for(const char c : encoded) {
        if(c == '\r' || c == '\n') {
            continue;
        }
        cleaned += c;
    }
    if(cleaned.size() % 4 != 0) {
        RETERR(BadBase64);
    }
    std::string decoded;
    decoded.reserve(cleaned.size() / 4 * 3);
    for(size_t i = 0; i < cleaned.size(); i += 4) {
        const bool is_last = i + 4 == cleaned.size();
        int padding = 0;
        uint32_t group = 0;
        for(size_t j = 0; j < 4; ++j) {
            const char c = cleaned[i + j];
            if(c == '=') {
                // Padding is only allowed at the end of the final group.
                if(!is_last || j < 2) {
                    RETERR(BadBase64);
                }
                ++padding;
                group <<= 6;
                continue;
            }
            if(padding > 0) {
                RETERR(BadBase64);
            }
            const int value = base64_value(c);
            if(value < 0) {
                RETERR(BadBase64);
            }
            group = (group << 6) | (uint32_t)value;
        }
        decoded += char((group >> 16) & 0xFF);
        if(padding < 2) {
            decoded += char((group >> 8) & 0xFF);
        }
        if(padding < 1) {
            decoded += char(group & 0xFF);
        }
    }
    return decoded;
}

std::vector<uint32_t> utf8_to_codepoints(std::string_view input) {
    std::vector<uint32_t> result;
    result.reserve(input.size());
    size_t cur = 0;
    while(cur < input.size()) {
        const uint32_t byte1 = (unsigned char)input[cur];
        if(byte1 < 0x80) {
            result.push_back(byte1);
            ++cur;
            continue;
        }
        UtfDecodeStep par;
        if((byte1 & 0b11100000) == 0b11000000) {
            par = UtfDecodeStep{0b00011111, 1, 0x80};
        } else if((byte1 & 0b11110000) == 0b11100000) {
            par = UtfDecodeStep{0b00001111, 2, 0x800};
        } else if((byte1 & 0b11111000) == 0b11110000) {
            par = UtfDecodeStep{0b00000111, 3, 0x10000};
        } else {
            result.push_back(REPLACEMENT_CHARACTER);
            ++cur;
            continue;
        }
        if(cur + par.num_subsequent_bytes >= input.size()) {
            result.push_back(REPLACEMENT_CHARACTER);
            ++cur;
            continue;
        }
        uint32_t unpacked = byte1 & par.byte1_data_mask;
        bool valid = true;
        for(uint32_t i = 0; i < par.num_subsequent_bytes; ++i) {
            const uint32_t subsequent = (unsigned char)input[cur + 1 + i];
            if((subsequent & 0b11000000) != 0b10000000) {
                valid = false;
                break;
            }
            unpacked = (unpacked << 6) | (subsequent & 0b111111);
        }
        if(!valid || unpacked < par.min_value || unpacked > 0x10FFFF) {
            result.push_back(REPLACEMENT_CHARACTER);
            ++cur;
            continue;
        }
        result.push_back(unpacked);
        cur += 1 + par.num_subsequent_bytes;
    }
    return result;
}

size_t count_codepoints(std::string_view utf8) { return utf8_to_codepoints(utf8).size(); }

std::string utf8_to_winansi(std::string_view utf8) {
    std::string result;
    result.reserve(utf8.size());
    for(const auto codepoint : utf8_to_codepoints(utf8)) {
        if(codepoint < 0x80 || (codepoint >= 0xA0 && codepoint < 0x100)) {
            result += (char)codepoint;
            continue;
        }
        for(const auto &[unicode, winansi] : winansi_specials) {
            if(unicode == codepoint) {
                result += (char)winansi;
                break;
            }
        }
    }
    return result;
}

std::string utf8_to_pdfutf16be(std::string_view utf8, bool add_adornments) {
    std::string encoded(add_adornments ? "<FEFF" : ""); // ISO 32000-1, 7.9.2.2
    std::vector<uint16_t> u16buf;
    auto app = std::back_inserter(encoded);
    for(const auto codepoint : utf8_to_codepoints(utf8)) {
        u16buf.clear();
        append_glyph_to_utf16be(codepoint, u16buf);
        for(const auto u16 : u16buf) {
            fmt::format_to(app, "{:04X}", u16);
        }
    }
    if(add_adornments) {
        encoded += '>';
    }
    return encoded;
}

bool is_ascii(std::string_view text) {
    for(const auto c : text) {
        if((unsigned char)c >= 128) {
            return false;
        }
    }
    return true;
}

std::string pdfstring_quote(std::string_view raw_string) {
    std::string result;
    result.reserve(raw_string.size() * 2 + 2);
    auto app = std::back_inserter(result);
    result.push_back('(');
    for(const char c : raw_string) {
        const auto uc = (unsigned char)c;
        switch(c) {
        case '(':
        case ')':
        case '\\':
            result.push_back('\\');
            result.push_back(c);
            break;
        case '\n':
            result += "\\n";
            break;
        case '\r':
            result += "\\r";
            break;
        case '\t':
            result += "\\t";
            break;
        default:
            if(uc < 32 || uc > 126) {
                fmt::format_to(app, "\\{:03o}", uc);
            } else {
                result.push_back(c);
            }
        }
    }
    result.push_back(')');
    return result;
}

std::string utf8_to_pdf_textstring(std::string_view utf8) {
    if(is_ascii(utf8)) {
        return pdfstring_quote(utf8);
    }
    return utf8_to_pdfutf16be(utf8);
}

std::string pdf_date_string(std::chrono::system_clock::time_point timepoint) {
    const int bufsize = 128;
    char buf[bufsize];
    const time_t t = std::chrono::system_clock::to_time_t(timepoint);
    struct tm utctime;
    if(gmtime_r(&t, &utctime) == nullptr) {
        perror(nullptr);
        return "(D:19700101000000Z)";
    }
    strftime(buf, bufsize, "(D:%Y%m%d%H%M%SZ)", &utctime);
    return std::string(buf);
}

std::chrono::system_clock::time_point current_time() {
    if(const char *epoch = getenv("SOURCE_DATE_EPOCH")) {
        return std::chrono::system_clock::from_time_t((time_t)strtoll(epoch, nullptr, 10));
    }
    return std::chrono::system_clock::now();
}

} // namespace quire::internal

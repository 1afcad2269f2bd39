// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2024 Jussi Pakkanen

#pragma once

#include <errorhandling.hpp>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace quire::internal {

rvoe<std::string> flate_compress(std::string_view data);

rvoe<std::string> load_file_as_bytes(const std::filesystem::path &fname);

// Reads until end of file. Works for pipes and other unseekable streams.
rvoe<std::string> load_file_as_bytes(FILE *f);

// Standard alphabet with padding. Line breaks are skipped.
rvoe<std::string> base64_decode(std::string_view encoded);

// Invalid byte sequences decode to U+FFFD.
std::vector<uint32_t> utf8_to_codepoints(std::string_view input);

size_t count_codepoints(std::string_view utf8);

// Converts to the single byte WinAnsiEncoding used by the builtin fonts.
// Characters that have no WinAnsi representation are dropped.
std::string utf8_to_winansi(std::string_view utf8);

std::string utf8_to_pdfutf16be(std::string_view utf8, bool add_adornments = true);

bool is_ascii(std::string_view text);

// Wraps bytes in parentheses and escapes everything that is not printable ASCII.
std::string pdfstring_quote(std::string_view raw_string);

// ASCII strings are written as literal strings, everything else as UTF-16BE.
std::string utf8_to_pdf_textstring(std::string_view utf8);

std::string pdf_date_string(std::chrono::system_clock::time_point timepoint);

// Honors SOURCE_DATE_EPOCH for reproducible output.
std::chrono::system_clock::time_point current_time();

struct FileCloser {
    void operator()(FILE *f) const {
        if(f) {
            fclose(f);
        }
    }
};

} // namespace quire::internal

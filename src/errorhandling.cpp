// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2024 Jussi Pakkanen

#include <errorhandling.hpp>
#include <array>
#include <cstddef>

namespace quire::internal {

// clang-format off

const std::array<const char *, (std::size_t)ErrorCode::NumErrors> error_texts{
"No error.",
"Unexpected error, the real error message should be in stdout or stderr.",
"Could not open file.",
"Writing to file failed.",
"Failed to load data from file.",
"File does not exist.",
"Required argument is NULL.",
"Unsupported image format.",
"Invalid image size.",
"Missing pixel data.",
"Incorrect amount of color channels in image.",
"Compression failure.",
"JPEG encoding failed.",
"Malformed base64 data.",
"Input data is empty.",
};

// clang-format on

const char *error_text(ErrorCode ec) noexcept {
    const int index = (int32_t)ec;
    if(index < 0 || (std::size_t)index >= error_texts.size()) {
        return "Invalid error code.";
    }
    return error_texts[index];
}

} // namespace quire::internal

// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2024 Jussi Pakkanen

#pragma once

#include <cstdint>
#include <expected>

namespace quire::internal {

enum class ErrorCode : int32_t {
    NoError,
    DynamicError,
    CouldNotOpenFile,
    FileWriteError,
    FileReadError,
    FileDoesNotExist,
    ArgIsNull,
    UnsupportedFormat,
    InvalidImageSize,
    MissingPixels,

    IncorrectColorChannelCount,
    CompressionFailure,
    JpegEncodeFailure,
    BadBase64,
    EmptyInput,
    // When you add an error code here, also add the string representation in the .cpp file.
    NumErrors,
};

const char *error_text(ErrorCode ec) noexcept;

// All errors are returned as std::unexpecteds and propagated manually.

// This error exists solely so you can put a breakpoint in it.
inline std::unexpected<ErrorCode> create_error(ErrorCode code) { return std::unexpected(code); }

#define RETERR(code) return create_error(ErrorCode::code)

#define RETOK                                                                                      \
    return NoReturnValue {}

// Return value or error.
template<typename T> using rvoe = std::expected<T, ErrorCode>;

#define ERC(varname, func)                                                                         \
    auto varname##_variant = func;                                                                 \
    if(!(varname##_variant)) {                                                                     \
        return std::unexpected(varname##_variant.error());                                         \
    }                                                                                              \
    auto &varname = varname##_variant.value();

// For void.

#define ERCV(func)                                                                                 \
    {                                                                                              \
        auto placeholder_name_variant = func;                                                      \
        if(!(placeholder_name_variant)) {                                                          \
            return std::unexpected(placeholder_name_variant.error());                              \
        }                                                                                          \
    }

struct NoReturnValue {};

} // namespace quire::internal

// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2024 Jussi Pakkanen

#pragma once

#include <pdfcommon.hpp>
#include <errorhandling.hpp>

namespace quire::internal {

constexpr int DEFAULT_JPEG_QUALITY = 90;

// Validates that the pixel buffers match the declared size.
rvoe<NoReturnValue> validate_raw_image(const RawPixelImage &image);

// Every image is stored as a baseline JPEG regardless of its source format.
// Alpha is multiplied into the color channels, so fully transparent
// pixels come out black.
rvoe<JpegImage> encode_jpeg(const RawPixelImage &image, int quality = DEFAULT_JPEG_QUALITY);

} // namespace quire::internal

// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#pragma once

// The functionality in this header is neither ABI nor API stable.

#include <errorhandling.hpp>
#include <pdfcommon.hpp>
#include <builtinfonts.hpp>
#include <document.hpp>
#include <table.hpp>
#include <imagefileops.hpp>

namespace quire {

using internal::ErrorCode;
using internal::error_text;
using internal::rvoe;
using internal::NoReturnValue;

using internal::Color;
using internal::rgb;
using internal::hex;
namespace colors = internal::colors;

using internal::PageSize;
namespace pagesizes = internal::pagesizes;
using internal::Orientation;
using internal::Margins;
using internal::inches;
using internal::mm;
using internal::cm;
using internal::TextAlign;
using internal::Point;
using internal::Metadata;

using internal::ImageColorspace;
using internal::RasterImageMetadata;
using internal::RawPixelImage;
using internal::load_image_file;
using internal::load_image_from_memory;

using internal::BuiltinFont;

using internal::DocumentProperties;
using internal::Document;
using internal::Table;

} // namespace quire

// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2024 Jussi Pakkanen

#pragma once

#include <pdfcommon.hpp>
#include <errorhandling.hpp>

#include <filesystem>
#include <string_view>

namespace quire::internal {

rvoe<RawPixelImage> load_image_file(const std::filesystem::path &fname);

// There is no metadata telling us what the bytes represent, so the
// format is detected from the magic numbers. PNG and JPEG are supported.
rvoe<RawPixelImage> load_image_from_memory(std::string_view data);

} // namespace quire::internal

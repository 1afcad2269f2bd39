// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2024 Jussi Pakkanen

#include <imagefileops.hpp>
#include <utils.hpp>
#include <png.h>
#include <jpeglib.h>

#include <csetjmp>
#include <cstdio>
#include <cstring>
#include <memory>

namespace quire::internal {

namespace {

const std::string_view PNG_SIG("\x89PNG\r\n\x1a\n", 8);
const std::string_view JPG_SIG("\xff\xd8\xff", 3);

struct PngImageCloser {
    void operator()(png_image *image) const { png_image_free(image); }
};

// Splits interleaved color+alpha samples into separate planes.
void separate_alpha(const std::string &interleaved, size_t num_color_channels, RawPixelImage &result) {
    const size_t stride = num_color_channels + 1;
    result.pixels.reserve(interleaved.size() / stride * num_color_channels);
    result.alpha.reserve(interleaved.size() / stride);
    for(size_t i = 0; i + stride <= interleaved.size(); i += stride) {
        result.pixels.append(interleaved, i, num_color_channels);
        result.alpha += interleaved[i + num_color_channels];
    }
}

rvoe<RawPixelImage> load_png_from_memory(std::string_view data) {
    png_image image;
    memset(&image, 0, (sizeof image));
    image.version = PNG_IMAGE_VERSION;
    std::unique_ptr<png_image, PngImageCloser> pngcloser(&image);

    if(png_image_begin_read_from_memory(&image, data.data(), data.size()) == 0) {
        fprintf(stderr, "Opening a PNG file failed: %s\n", image.message);
        RETERR(UnsupportedFormat);
    }
    const bool is_color = (image.format & PNG_FORMAT_FLAG_COLOR) != 0;
    const bool has_alpha = (image.format & PNG_FORMAT_FLAG_ALPHA) != 0;
    image.format = is_color ? PNG_FORMAT_RGBA : PNG_FORMAT_GA;
    if(image.width == 0 || image.height == 0) {
        RETERR(InvalidImageSize);
    }

    std::string buf;
    buf.resize(PNG_IMAGE_SIZE(image));
    if(png_image_finish_read(&image, nullptr, buf.data(), 0, nullptr) == 0) {
        fprintf(stderr, "PNG file reading failed: %s\n", image.message);
        RETERR(UnsupportedFormat);
    }

    RawPixelImage result;
    result.md.w = image.width;
    result.md.h = image.height;
    result.md.pixel_depth = 8;
    result.md.cs = is_color ? ImageColorspace::RGB : ImageColorspace::Gray;
    separate_alpha(buf, is_color ? 3 : 1, result);
    if(has_alpha) {
        result.md.alpha_depth = 8;
    } else {
        result.alpha.clear();
    }
    return result;
}

struct JpegError {
    struct jpeg_error_mgr jmgr;
    jmp_buf buf;
};

void jpegErrorExit(j_common_ptr cinfo) {
    JpegError *e = (JpegError *)cinfo->err;
    longjmp(e->buf, 1);
}

struct JpegCloser {
    void operator()(jpeg_decompress_struct *j) const {
        if(j) {
            jpeg_destroy_decompress(j);
        }
    }
};

rvoe<RawPixelImage> load_jpg_from_memory(std::string_view data) {
    // Libjpeg kills the process on invalid input.
    // Changing the behaviour requires mucking about
    // with setjmp/longjmp.
    //
    // Everything with a destructor must be created before setjmp.
    RawPixelImage result;
    struct jpeg_decompress_struct cinfo;
    JpegError jerr;

    cinfo.err = jpeg_std_error(&jerr.jmgr);
    jpeg_create_decompress(&cinfo);
    std::unique_ptr<jpeg_decompress_struct, JpegCloser> jpgcloser(&cinfo);
    jerr.jmgr.error_exit = jpegErrorExit;
    if(setjmp(jerr.buf)) {
        RETERR(UnsupportedFormat);
    }
    jpeg_mem_src(&cinfo, (const unsigned char *)data.data(), (unsigned long)data.size());
    if(jpeg_read_header(&cinfo, TRUE) != JPEG_HEADER_OK) {
        RETERR(UnsupportedFormat);
    }
    switch(cinfo.jpeg_color_space) {
    case JCS_GRAYSCALE:
        cinfo.out_color_space = JCS_GRAYSCALE;
        result.md.cs = ImageColorspace::Gray;
        break;
    case JCS_RGB:
    case JCS_YCbCr:
        cinfo.out_color_space = JCS_RGB;
        result.md.cs = ImageColorspace::RGB;
        break;
    default:
        // CMYK and YCCK would need inversion detection.
        RETERR(UnsupportedFormat);
    }

    jpeg_start_decompress(&cinfo);
    if(cinfo.output_width == 0 || cinfo.output_height == 0) {
        RETERR(InvalidImageSize);
    }
    result.md.w = cinfo.output_width;
    result.md.h = cinfo.output_height;
    result.md.pixel_depth = 8;
    const size_t row_stride = (size_t)cinfo.output_width * cinfo.output_components;
    result.pixels.resize(row_stride * cinfo.output_height);
    while(cinfo.output_scanline < cinfo.output_height) {
        JSAMPROW row = (JSAMPROW)(result.pixels.data() + row_stride * cinfo.output_scanline);
        jpeg_read_scanlines(&cinfo, &row, 1);
    }
    jpeg_finish_decompress(&cinfo);
    // Truncated data is only a warning to libjpeg, which pads the missing rows.
    if(jerr.jmgr.num_warnings != 0) {
        fprintf(stderr, "Corrupt JPEG data.\n");
        RETERR(UnsupportedFormat);
    }
    return result;
}

} // namespace

rvoe<RawPixelImage> load_image_file(const std::filesystem::path &fname) {
    ERC(contents, load_file_as_bytes(fname));
    return load_image_from_memory(contents);
}

rvoe<RawPixelImage> load_image_from_memory(std::string_view data) {
    if(data.empty()) {
        RETERR(EmptyInput);
    }
    if(data.starts_with(PNG_SIG)) {
        return load_png_from_memory(data);
    }
    if(data.starts_with(JPG_SIG)) {
        return load_jpg_from_memory(data);
    }
    RETERR(UnsupportedFormat);
}

} // namespace quire::internal

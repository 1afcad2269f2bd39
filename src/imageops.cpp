// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2024 Jussi Pakkanen

#include <imageops.hpp>
#include <jpeglib.h>

#include <csetjmp>
#include <cstdio>
#include <cstdlib>
#include <memory>

namespace quire::internal {

namespace {

struct JpegError {
    struct jpeg_error_mgr jmgr;
    jmp_buf buf;
};

void jpegErrorExit(j_common_ptr cinfo) {
    JpegError *e = (JpegError *)cinfo->err;
    longjmp(e->buf, 1);
}

struct JpegCompressCloser {
    void operator()(jpeg_compress_struct *j) const {
        if(j) {
            jpeg_destroy_compress(j);
        }
    }
};

struct MallocFreer {
    void operator()(unsigned char *p) const { free(p); }
};

std::string premultiply_alpha(const RawPixelImage &image) {
    if(image.alpha.empty()) {
        return image.pixels;
    }
    const size_t channels = num_channels(image.md.cs);
    std::string result(image.pixels.size(), '\0');
    for(size_t i = 0; i < image.pixels.size(); ++i) {
        const uint32_t color = (unsigned char)image.pixels[i];
        const uint32_t alpha = (unsigned char)image.alpha[i / channels];
        result[i] = char((color * alpha + 127) / 255);
    }
    return result;
}

} // namespace

rvoe<NoReturnValue> validate_raw_image(const RawPixelImage &image) {
    if(image.md.w == 0 || image.md.h == 0) {
        RETERR(InvalidImageSize);
    }
    if(image.md.pixel_depth != 8) {
        RETERR(UnsupportedFormat);
    }
    const size_t num_pixels = (size_t)image.md.w * image.md.h;
    if(image.pixels.size() != num_pixels * num_channels(image.md.cs)) {
        RETERR(MissingPixels);
    }
    if(!image.alpha.empty()) {
        if(image.md.alpha_depth != 8) {
            RETERR(UnsupportedFormat);
        }
        if(image.alpha.size() != num_pixels) {
            RETERR(MissingPixels);
        }
    }
    RETOK;
}

rvoe<JpegImage> encode_jpeg(const RawPixelImage &image, int quality) {
    ERCV(validate_raw_image(image));
    const std::string pixels = premultiply_alpha(image);

    // Everything with a destructor must be created before setjmp.
    JpegImage result;
    unsigned char *outbuf = nullptr;
    unsigned long outsize = 0;
    struct jpeg_compress_struct cinfo;
    JpegError jerr;
    std::unique_ptr<unsigned char, MallocFreer> buffreer;

    cinfo.err = jpeg_std_error(&jerr.jmgr);
    jpeg_create_compress(&cinfo);
    std::unique_ptr<jpeg_compress_struct, JpegCompressCloser> jpgcloser(&cinfo);
    jerr.jmgr.error_exit = jpegErrorExit;
    if(setjmp(jerr.buf)) {
        free(outbuf);
        RETERR(JpegEncodeFailure);
    }
    jpeg_mem_dest(&cinfo, &outbuf, &outsize);

    cinfo.image_width = image.md.w;
    cinfo.image_height = image.md.h;
    if(image.md.cs == ImageColorspace::Gray) {
        cinfo.input_components = 1;
        cinfo.in_color_space = JCS_GRAYSCALE;
    } else {
        cinfo.input_components = 3;
        cinfo.in_color_space = JCS_RGB;
    }
    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, quality, TRUE);
    jpeg_start_compress(&cinfo, TRUE);
    const size_t row_stride = (size_t)image.md.w * cinfo.input_components;
    while(cinfo.next_scanline < cinfo.image_height) {
        JSAMPROW row = (JSAMPROW)(pixels.data() + row_stride * cinfo.next_scanline);
        jpeg_write_scanlines(&cinfo, &row, 1);
    }
    jpeg_finish_compress(&cinfo);

    buffreer.reset(outbuf);
    result.w = image.md.w;
    result.h = image.md.h;
    result.cs = image.md.cs;
    result.file_contents.assign((const char *)outbuf, outsize);
    return result;
}

} // namespace quire::internal

/*
 * inkwash - Batch Manga Colorization Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inkwash/image.hpp"
#include "inkwash/errors.hpp"
#include "inkwash/logger.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <csetjmp>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>

#include <png.h>
#include <jpeglib.h>

namespace inkwash {

namespace {

using FilePtr = std::unique_ptr<FILE, int (*)(FILE*)>;

FilePtr openFile(const std::filesystem::path& path, const char* mode) {
    return FilePtr(std::fopen(path.c_str(), mode), &std::fclose);
}

enum class Codec { Png, Jpeg, Unknown };

Codec sniff(FILE* fp) {
    std::array<unsigned char, 8> sig{};
    std::size_t got = std::fread(sig.data(), 1, sig.size(), fp);
    std::rewind(fp);
    if (got >= 8 && png_sig_cmp(sig.data(), 0, 8) == 0) {
        return Codec::Png;
    }
    if (got >= 3 && sig[0] == 0xFF && sig[1] == 0xD8 && sig[2] == 0xFF) {
        return Codec::Jpeg;
    }
    return Codec::Unknown;
}

struct PngErrorState {
    char message[256]{};
};

void png_error_handler(png_structp png_ptr, png_const_charp msg) {
    auto* state = static_cast<PngErrorState*>(png_get_error_ptr(png_ptr));
    if (state && msg) {
        std::snprintf(state->message, sizeof(state->message), "%s", msg);
    }
    png_longjmp(png_ptr, 1);
}

void png_warning_handler(png_structp /*png_ptr*/, png_const_charp msg) {
    LOG_TRACE(std::string("libpng: ") + (msg ? msg : ""));
}

// Everything with a destructor lives outside the setjmp frame.
bool decodePng(FILE* fp, Image& out, std::vector<png_bytep>& rows, std::string& err) {
    PngErrorState state;
    png_structp png_ptr = png_create_read_struct(PNG_LIBPNG_VER_STRING, &state,
                                                 png_error_handler, png_warning_handler);
    if (!png_ptr) {
        err = "Failed to create PNG read struct";
        return false;
    }
    png_infop info_ptr = png_create_info_struct(png_ptr);
    if (!info_ptr) {
        png_destroy_read_struct(&png_ptr, nullptr, nullptr);
        err = "Failed to create PNG info struct";
        return false;
    }

    if (setjmp(png_jmpbuf(png_ptr))) {
        png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
        err = state.message[0] != '\0' ? state.message : "Failed to decode PNG";
        return false;
    }

    png_init_io(png_ptr, fp);
    png_read_info(png_ptr, info_ptr);

    png_uint_32 width = 0;
    png_uint_32 height = 0;
    int bit_depth = 0;
    int color_type = 0;
    png_get_IHDR(png_ptr, info_ptr, &width, &height, &bit_depth, &color_type, nullptr, nullptr, nullptr);

    if (bit_depth == 16) png_set_strip_16(png_ptr);
    if (color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(png_ptr);
    if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) png_set_expand_gray_1_2_4_to_8(png_ptr);
    if (png_get_valid(png_ptr, info_ptr, PNG_INFO_tRNS)) png_set_tRNS_to_alpha(png_ptr);
    if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) png_set_gray_to_rgb(png_ptr);
    if (png_get_interlace_type(png_ptr, info_ptr) != PNG_INTERLACE_NONE) png_set_interlace_handling(png_ptr);

    png_read_update_info(png_ptr, info_ptr);

    const int channels = png_get_channels(png_ptr, info_ptr);
    const png_size_t rowbytes = png_get_rowbytes(png_ptr, info_ptr);
    out.width = static_cast<int>(width);
    out.height = static_cast<int>(height);
    out.channels = channels;
    out.pixels.resize(static_cast<std::size_t>(height) * rowbytes);
    rows.resize(height);
    for (png_uint_32 y = 0; y < height; ++y) {
        rows[y] = out.pixels.data() + y * rowbytes;
    }
    png_read_image(png_ptr, rows.data());
    png_read_end(png_ptr, nullptr);
    png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
    return true;
}

struct JpegErrorMgr {
    jpeg_error_mgr pub;
    jmp_buf setjmp_buffer;
    char message[JMSG_LENGTH_MAX]{};
};

void jpeg_error_exit(j_common_ptr cinfo) {
    auto* err = reinterpret_cast<JpegErrorMgr*>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->message);
    longjmp(err->setjmp_buffer, 1);
}

bool decodeJpeg(FILE* fp, Image& out, std::string& err) {
    jpeg_decompress_struct cinfo{};
    JpegErrorMgr jerr{};
    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpeg_error_exit;

    if (setjmp(jerr.setjmp_buffer)) {
        err = jerr.message[0] != '\0' ? jerr.message : "Failed to decode JPEG";
        jpeg_destroy_decompress(&cinfo);
        return false;
    }

    jpeg_create_decompress(&cinfo);
    jpeg_stdio_src(&cinfo, fp);
    jpeg_read_header(&cinfo, TRUE);

    if (cinfo.jpeg_color_space == JCS_CMYK || cinfo.jpeg_color_space == JCS_YCCK) {
        jpeg_destroy_decompress(&cinfo);
        err = "CMYK JPEG is not supported";
        return false;
    }
    cinfo.out_color_space = JCS_RGB;
    jpeg_start_decompress(&cinfo);

    out.width = static_cast<int>(cinfo.output_width);
    out.height = static_cast<int>(cinfo.output_height);
    out.channels = static_cast<int>(cinfo.output_components);
    const std::size_t row_stride = static_cast<std::size_t>(out.width) * out.channels;
    out.pixels.resize(static_cast<std::size_t>(out.height) * row_stride);

    while (cinfo.output_scanline < cinfo.output_height) {
        JSAMPROW rowptr[1];
        rowptr[0] = reinterpret_cast<JSAMPROW>(
            out.pixels.data() + static_cast<std::size_t>(cinfo.output_scanline) * row_stride);
        jpeg_read_scanlines(&cinfo, rowptr, 1);
    }

    jpeg_finish_decompress(&cinfo);
    jpeg_destroy_decompress(&cinfo);
    return true;
}

// RGBA to RGB over a white background.
Image flattenAlpha(const Image& rgba) {
    cv::Mat src = matView(rgba);
    cv::Mat rgb;
    cv::Mat alpha;
    cv::cvtColor(src, rgb, cv::COLOR_RGBA2RGB);
    cv::extractChannel(src, alpha, 3);

    cv::Mat weight;
    alpha.convertTo(weight, CV_32F, 1.0 / 255.0);
    cv::Mat paperWeight = 1.0 - weight;
    cv::Mat paper(rgb.size(), rgb.type(), cv::Scalar::all(255));
    cv::Mat out;
    cv::blendLinear(rgb, paper, weight, paperWeight, out);
    return fromMat(out);
}

bool encodePng(FILE* fp, const Image& image, std::vector<png_const_bytep>& rows, std::string& err) {
    PngErrorState state;
    png_structp png_ptr = png_create_write_struct(PNG_LIBPNG_VER_STRING, &state,
                                                  png_error_handler, png_warning_handler);
    if (!png_ptr) {
        err = "Failed to create PNG write struct";
        return false;
    }
    png_infop info_ptr = png_create_info_struct(png_ptr);
    if (!info_ptr) {
        png_destroy_write_struct(&png_ptr, nullptr);
        err = "Failed to create PNG info struct";
        return false;
    }

    if (setjmp(png_jmpbuf(png_ptr))) {
        png_destroy_write_struct(&png_ptr, &info_ptr);
        err = state.message[0] != '\0' ? state.message : "Failed to encode PNG";
        return false;
    }

    png_init_io(png_ptr, fp);
    const int color_type = image.channels == 1 ? PNG_COLOR_TYPE_GRAY : PNG_COLOR_TYPE_RGB;
    png_set_IHDR(png_ptr, info_ptr,
                 static_cast<png_uint_32>(image.width), static_cast<png_uint_32>(image.height),
                 8, color_type, PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE);
    png_write_info(png_ptr, info_ptr);

    const std::size_t rowbytes = static_cast<std::size_t>(image.width) * image.channels;
    rows.resize(static_cast<std::size_t>(image.height));
    for (int y = 0; y < image.height; ++y) {
        rows[y] = image.pixels.data() + static_cast<std::size_t>(y) * rowbytes;
    }
    png_write_image(png_ptr, const_cast<png_bytepp>(rows.data()));
    png_write_end(png_ptr, nullptr);
    png_destroy_write_struct(&png_ptr, &info_ptr);
    return true;
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

}

Image::Image(int w, int h, int c, std::uint8_t fill)
    : width(w), height(h), channels(c),
      pixels(static_cast<std::size_t>(w) * static_cast<std::size_t>(h) * static_cast<std::size_t>(c), fill) {
}

Image loadImage(const std::filesystem::path& path) {
    FilePtr fp = openFile(path, "rb");
    if (!fp) {
        throw ImageError("Cannot open image: " + path.string());
    }

    Image out;
    std::string err;
    bool ok = false;
    switch (sniff(fp.get())) {
        case Codec::Png: {
            std::vector<png_bytep> rows;
            ok = decodePng(fp.get(), out, rows, err);
            break;
        }
        case Codec::Jpeg:
            ok = decodeJpeg(fp.get(), out, err);
            break;
        case Codec::Unknown:
            err = "unrecognized image format";
            break;
    }
    if (!ok) {
        throw ImageError(path.filename().string() + ": " + err);
    }
    if (out.width <= 0 || out.height <= 0) {
        throw ImageError(path.filename().string() + ": empty image");
    }

    if (out.channels == 4) {
        out = flattenAlpha(out);
    } else if (out.channels == 1) {
        out = toRgb(out);
    }
    LOG_TRACE("Loaded " + path.filename().string() + " " + std::to_string(out.width) + "x" +
              std::to_string(out.height));
    return out;
}

void savePng(const std::filesystem::path& path, const Image& image) {
    if (image.empty() || (image.channels != 1 && image.channels != 3)) {
        throw ImageError("Refusing to write invalid image: " + path.string());
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw ImageError("Cannot create directory " + path.parent_path().string() + ": " + ec.message());
        }
    }

    // Written beside the target and renamed so readers never see a partial file.
    auto tempPath = path;
    tempPath += ".tmp";
    std::string err;
    bool ok = false;
    {
        FilePtr fp = openFile(tempPath, "wb");
        if (!fp) {
            throw ImageError("Cannot open for writing: " + tempPath.string());
        }
        std::vector<png_const_bytep> rows;
        ok = encodePng(fp.get(), image, rows, err);
        if (ok && std::fflush(fp.get()) != 0) {
            ok = false;
            err = "flush failed";
        }
    }
    if (!ok) {
        std::filesystem::remove(tempPath, ec);
        throw ImageError(path.filename().string() + ": " + err);
    }

    std::filesystem::rename(tempPath, path, ec);
    if (ec) {
        std::error_code rmEc;
        std::filesystem::remove(tempPath, rmEc);
        throw ImageError("Cannot finalize " + path.string() + ": " + ec.message());
    }
}

bool isSupportedImage(const std::filesystem::path& path) {
    static const std::array<const char*, 3> kExtensions = {".png", ".jpg", ".jpeg"};
    const std::string ext = toLowerCopy(path.extension().string());
    return std::find(kExtensions.begin(), kExtensions.end(), ext) != kExtensions.end();
}

cv::Mat matView(const Image& image) {
    if (image.empty()) {
        return cv::Mat();
    }
    // OpenCV takes a mutable pointer; callers only read through the view.
    return cv::Mat(image.height, image.width, CV_8UC(image.channels),
                   const_cast<std::uint8_t*>(image.pixels.data()));
}

Image fromMat(const cv::Mat& mat) {
    if (mat.empty()) {
        return Image();
    }
    if (mat.depth() != CV_8U || (mat.channels() != 1 && mat.channels() != 3)) {
        throw ImageError("Unsupported matrix type " + std::to_string(mat.type()));
    }
    Image out(mat.cols, mat.rows, mat.channels());
    cv::Mat dst = matView(out);
    mat.copyTo(dst);
    return out;
}

Image luminance(const Image& image) {
    if (image.channels == 1) {
        return image;
    }
    cv::Mat gray;
    cv::cvtColor(matView(image), gray, cv::COLOR_RGB2GRAY);
    return fromMat(gray);
}

Image toRgb(const Image& image) {
    if (image.channels == 3) {
        return image;
    }
    cv::Mat rgb;
    cv::cvtColor(matView(image), rgb, cv::COLOR_GRAY2RGB);
    return fromMat(rgb);
}

Image resize(const Image& image, int width, int height, int interpolation) {
    if (width == image.width && height == image.height) {
        return image;
    }
    if (width <= 0 || height <= 0 || image.empty()) {
        throw ImageError("Invalid resize target " + std::to_string(width) + "x" + std::to_string(height));
    }
    cv::Mat out;
    cv::resize(matView(image), out, cv::Size(width, height), 0, 0, interpolation);
    return fromMat(out);
}

Image maxFilter(const Image& gray, int size) {
    if (gray.channels != 1) {
        throw ImageError("maxFilter expects a single-channel image");
    }
    if (size <= 1) {
        return gray;
    }
    cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(size, size));
    cv::Mat out;
    cv::dilate(matView(gray), out, kernel);
    return fromMat(out);
}

Image gaussianBlur(const Image& gray, double sigma) {
    if (gray.channels != 1) {
        throw ImageError("gaussianBlur expects a single-channel image");
    }
    if (sigma <= 0.0) {
        return gray;
    }
    cv::Mat out;
    cv::GaussianBlur(matView(gray), out, cv::Size(0, 0), sigma);
    return fromMat(out);
}

Size processingSize(int width, int height, int maxSide) noexcept {
    if (width <= 0 || height <= 0 || maxSide < 8) {
        return Size{};
    }
    auto round8 = [](int v) { return v - (v % 8); };
    const int longest = std::max(width, height);
    const double scale = std::min(static_cast<double>(maxSide) / longest, 1.0);
    return Size{round8(static_cast<int>(width * scale)), round8(static_cast<int>(height * scale))};
}

}

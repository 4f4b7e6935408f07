// src/image_io.cpp
#include "image_io.hpp"
#include <algorithm>
#include <cctype>
#include <csetjmp>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

extern "C" {
#include <jpeglib.h>
}

struct my_error_mgr {
    jpeg_error_mgr pub;
    jmp_buf setjmp_buffer;
    char msg[JMSG_LENGTH_MAX];
};

static void my_output_message(j_common_ptr cinfo) {
    my_error_mgr* myerr = (my_error_mgr*)cinfo->err;
    (*cinfo->err->format_message)(cinfo, myerr->msg);
    std::fprintf(stderr, "[libjpeg] %s\n", myerr->msg);
    std::fflush(stderr);
}

static void my_error_exit(j_common_ptr cinfo) {
    my_error_mgr* myerr = (my_error_mgr*)cinfo->err;
    (*cinfo->err->output_message)(cinfo);
    longjmp(myerr->setjmp_buffer, 1);
}

static void install_error_mgr(j_common_ptr cinfo, my_error_mgr& jerr) {
    std::memset(&jerr, 0, sizeof(jerr));
    cinfo->err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = my_error_exit;
    jerr.pub.output_message = my_output_message;
}

static FILE* open_file(const std::string& path, const char* mode) {
    FILE* fp = nullptr;
#if defined(_MSC_VER)
    if (fopen_s(&fp, path.c_str(), mode) != 0) fp = nullptr;
#else
    fp = std::fopen(path.c_str(), mode);
#endif
    if (!fp) throw std::runtime_error("could not open file: " + path);
    return fp;
}

static std::string lower_extension(const std::string& path) {
    const size_t dot = path.find_last_of('.');
    const size_t slash = path.find_last_of("/\\");
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) return "";
    std::string ext = path.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
        [](unsigned char c) { return (char)std::tolower(c); });
    return ext;
}

static inline void rgba_row_to_rgb(const ImageRGBA& img, int y, unsigned char* p) {
    const uint8_t* src = img.pixels.data() + (size_t)y * img.width * 4;
    for (int x = 0; x < img.width; ++x, src += 4) {
        *p++ = src[0];
        *p++ = src[1];
        *p++ = src[2];
    }
}

static inline void rgba_row_to_rgb(const ImageRGBA& img, int y, std::vector<unsigned char>& row) {
    row.resize((size_t)img.width * 3);
    rgba_row_to_rgb(img, y, row.data());
}

static void check_writable(const ImageRGBA& img, const char* fn) {
    if (img.width <= 0 || img.height <= 0)
        throw std::runtime_error(std::string(fn) + ": bad size");
    if (img.pixels.size() != img.pixel_count() * 4)
        throw std::runtime_error(std::string(fn) + ": buffer size mismatch");
}

// Only C state lives in this frame; `img` belongs to the caller, so its value
// is well defined after a longjmp back here. Returns false with `msg` filled in
// on a libjpeg error.
static bool jpeg_decode_rgba(FILE* fp, ImageRGBA& img, char* msg)
{
    jpeg_decompress_struct cinfo;
    my_error_mgr jerr;
    std::memset(&cinfo, 0, sizeof(cinfo));
    install_error_mgr((j_common_ptr)&cinfo, jerr);

    if (setjmp(jerr.setjmp_buffer)) {
        std::memcpy(msg, jerr.msg, JMSG_LENGTH_MAX);
        jpeg_destroy_decompress(&cinfo);
        return false;
    }

    jpeg_create_decompress(&cinfo);
    jpeg_stdio_src(&cinfo, fp);
    jpeg_read_header(&cinfo, TRUE);
    cinfo.out_color_space = JCS_RGB;
    jpeg_start_decompress(&cinfo);

    img.width = (int)cinfo.output_width;
    img.height = (int)cinfo.output_height;
    try {
        img.pixels.resize(img.pixel_count() * 4);
    }
    catch (...) {
        jpeg_destroy_decompress(&cinfo);
        throw;
    }

    // Row buffer lives in libjpeg's pool so an error longjmp leaks nothing.
    JSAMPARRAY row = (*cinfo.mem->alloc_sarray)((j_common_ptr)&cinfo, JPOOL_IMAGE,
        cinfo.output_width * cinfo.output_components, 1);
    while (cinfo.output_scanline < cinfo.output_height) {
        const size_t y = cinfo.output_scanline;
        jpeg_read_scanlines(&cinfo, row, 1);
        uint8_t* dst = img.pixels.data() + y * img.width * 4;
        const JSAMPLE* src = row[0];
        for (int x = 0; x < img.width; ++x, src += 3, dst += 4) {
            dst[0] = src[0];
            dst[1] = src[1];
            dst[2] = src[2];
            dst[3] = 255;
        }
    }

    jpeg_finish_decompress(&cinfo);
    jpeg_destroy_decompress(&cinfo);
    return true;
}

ImageRGBA jpeg_read_rgba(const std::string& path)
{
    FILE* fp = open_file(path, "rb");
    ImageRGBA img;
    char msg[JMSG_LENGTH_MAX] = {};
    bool ok = false;
    try {
        ok = jpeg_decode_rgba(fp, img, msg);
    }
    catch (...) {
        std::fclose(fp);
        throw;
    }
    std::fclose(fp);
    if (!ok) throw std::runtime_error(msg[0] ? std::string(msg) : "libjpeg error");
    return img;
}

void jpeg_write_rgb_scanlines(const ImageRGBA& img, const std::string& out_path, int quality)
{
    check_writable(img, "jpeg_write_rgb_scanlines");

    FILE* fp = open_file(out_path, "wb");

    jpeg_compress_struct cinfo;
    my_error_mgr jerr;
    std::memset(&cinfo, 0, sizeof(cinfo));
    install_error_mgr((j_common_ptr)&cinfo, jerr);

    if (setjmp(jerr.setjmp_buffer)) {
        jpeg_destroy_compress(&cinfo);
        std::fclose(fp);
        std::remove(out_path.c_str());
        throw std::runtime_error(jerr.msg[0] ? jerr.msg : "libjpeg error");
    }

    jpeg_create_compress(&cinfo);
    jpeg_stdio_dest(&cinfo, fp);

    cinfo.image_width = (JDIMENSION)img.width;
    cinfo.image_height = (JDIMENSION)img.height;
    cinfo.input_components = 3;
    cinfo.in_color_space = JCS_RGB;

    jpeg_set_defaults(&cinfo);
    if (quality < 1) quality = 1;
    if (quality > 100) quality = 100;
    jpeg_set_quality(&cinfo, quality, TRUE);
#if JPEG_LIB_VERSION >= 70
    cinfo.optimize_coding = TRUE;
#endif

    jpeg_start_compress(&cinfo, TRUE);

    // Pool-allocated for the same reason as the reader's row buffer.
    JSAMPARRAY row = (*cinfo.mem->alloc_sarray)((j_common_ptr)&cinfo, JPOOL_IMAGE,
        (JDIMENSION)img.width * 3, 1);
    while (cinfo.next_scanline < cinfo.image_height) {
        rgba_row_to_rgb(img, (int)cinfo.next_scanline, row[0]);
        jpeg_write_scanlines(&cinfo, row, 1);
    }

    jpeg_finish_compress(&cinfo);
    jpeg_destroy_compress(&cinfo);
    std::fclose(fp);
}

namespace {

    // Next whitespace-separated token of a P6 header, skipping '#' comments.
    std::string next_token(std::istream& in) {
        std::string tok;
        int c;
        while ((c = in.get()) != EOF) {
            if (c == '#') {
                while ((c = in.get()) != EOF && c != '\n') {}
                continue;
            }
            if (std::isspace(c)) {
                if (!tok.empty()) break;
                continue;
            }
            tok.push_back((char)c);
        }
        return tok;
    }

    int parse_positive(const std::string& tok, const char* what) {
        int v = 0;
        std::istringstream ss(tok);
        if (!(ss >> v) || v <= 0)
            throw std::runtime_error(std::string("netpbm: bad ") + what + " '" + tok + "'");
        return v;
    }

    void read_body(std::istream& in, ImageRGBA& img, int depth) {
        img.pixels.assign(img.pixel_count() * 4, 255);
        std::vector<char> row((size_t)img.width * depth);
        for (int y = 0; y < img.height; ++y) {
            if (!in.read(row.data(), (std::streamsize)row.size()))
                throw std::runtime_error("netpbm: truncated pixel data");
            uint8_t* dst = img.pixels.data() + (size_t)y * img.width * 4;
            for (int x = 0; x < img.width; ++x)
                for (int c = 0; c < depth; ++c)
                    dst[x * 4 + c] = (uint8_t)row[(size_t)x * depth + c];
        }
    }

} // namespace

ImageRGBA netpbm_read_rgba(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("could not open file: " + path);

    const std::string magic = next_token(f);
    ImageRGBA img;
    int depth = 3, maxval = 0;

    if (magic == "P6") {
        img.width = parse_positive(next_token(f), "width");
        img.height = parse_positive(next_token(f), "height");
        maxval = parse_positive(next_token(f), "maxval");
    }
    else if (magic == "P7") {
        std::string line, tupltype;
        while (std::getline(f, line)) {
            if (line.empty() || line[0] == '#') continue;
            std::istringstream ls(line);
            std::string key, value;
            ls >> key >> value;
            if (key == "ENDHDR") break;
            else if (key == "WIDTH") img.width = parse_positive(value, "width");
            else if (key == "HEIGHT") img.height = parse_positive(value, "height");
            else if (key == "DEPTH") depth = parse_positive(value, "depth");
            else if (key == "MAXVAL") maxval = parse_positive(value, "maxval");
            else if (key == "TUPLTYPE") tupltype = value;
        }
        if (img.width <= 0 || img.height <= 0)
            throw std::runtime_error("netpbm: P7 header lacks WIDTH/HEIGHT");
        if (depth != 3 && depth != 4)
            throw std::runtime_error("netpbm: unsupported P7 tuple type '" + tupltype + "'");
    }
    else {
        throw std::runtime_error("netpbm: unsupported magic '" + magic + "' in " + path);
    }

    if (maxval != 255)
        throw std::runtime_error("netpbm: only 8-bit samples (maxval 255) are supported");

    read_body(f, img, depth);
    return img;
}

void ppm_write_rgb(const ImageRGBA& img, const std::string& path) {
    check_writable(img, "ppm_write_rgb");
    std::ofstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("could not open output file: " + path);
    f << "P6\n" << img.width << " " << img.height << "\n255\n";
    std::vector<unsigned char> row;
    for (int y = 0; y < img.height; ++y) {
        rgba_row_to_rgb(img, y, row);
        f.write(reinterpret_cast<const char*>(row.data()), (std::streamsize)row.size());
    }
    if (!f) throw std::runtime_error("write failed: " + path);
}

void pam_write_rgba(const ImageRGBA& img, const std::string& path) {
    check_writable(img, "pam_write_rgba");
    std::ofstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("could not open output file: " + path);
    f << "P7\nWIDTH " << img.width << "\nHEIGHT " << img.height
      << "\nDEPTH 4\nMAXVAL 255\nTUPLTYPE RGB_ALPHA\nENDHDR\n";
    f.write(reinterpret_cast<const char*>(img.pixels.data()), (std::streamsize)img.pixels.size());
    if (!f) throw std::runtime_error("write failed: " + path);
}

ImageRGBA read_image(const std::string& path) {
    const std::string ext = lower_extension(path);
    if (ext == "jpg" || ext == "jpeg") return jpeg_read_rgba(path);
    if (ext == "ppm" || ext == "pam" || ext == "pnm") return netpbm_read_rgba(path);
    throw std::runtime_error("unsupported input format: " + path);
}

void write_image(const ImageRGBA& img, const std::string& path, int jpeg_quality) {
    const std::string ext = lower_extension(path);
    if (ext == "jpg" || ext == "jpeg") jpeg_write_rgb_scanlines(img, path, jpeg_quality);
    else if (ext == "ppm") ppm_write_rgb(img, path);
    else if (ext == "pam") pam_write_rgba(img, path);
    else throw std::runtime_error("unsupported output format: " + path);
}

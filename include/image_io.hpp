#pragma once
#include <string>
#include "image.hpp"

/*
File surface for the CLI front-end only; the core never touches disk.

The format is picked from the extension (case-insensitive):
  .jpg / .jpeg  libjpeg, RGB only (alpha = 255 on read, dropped on write)
  .ppm          binary netpbm P6 (alpha = 255 on read, dropped on write)
  .pam          netpbm P7, TUPLTYPE RGB_ALPHA (RGB also accepted on read)
All functions throw std::runtime_error on failure.
*/
ImageRGBA read_image(const std::string& path);
void write_image(const ImageRGBA& img, const std::string& path, int jpeg_quality = 100);

ImageRGBA jpeg_read_rgba(const std::string& path);
// Encodes the RGB channels with libjpeg at the given quality (clamped to 1..100).
void jpeg_write_rgb_scanlines(const ImageRGBA& img, const std::string& out_path, int quality);

ImageRGBA netpbm_read_rgba(const std::string& path);
void ppm_write_rgb(const ImageRGBA& img, const std::string& path);
void pam_write_rgba(const ImageRGBA& img, const std::string& path);

#pragma once

#include <cstdint>
#include <vector>

#include "image.hpp"

/*
 Full-range BT.601 (JFIF) coefficients. The forward and inverse paths below
 use the same constant set, so a triple survives rgb -> ycbcr -> rgb with at
 most one code value of rounding error per channel.
 */
struct YCbCr {
	float y, cb, cr;
};

struct RGB8 {
	uint8_t r, g, b;
};

YCbCr rgb_to_ycbcr(uint8_t r, uint8_t g, uint8_t b);

// Rounds to nearest and clamps each channel to [0,255].
RGB8 ycbcr_to_rgb(float y, float cb, float cr);

// Full-resolution planes of one image. Alpha is carried aside untouched.
struct YCbCrPlanes {
	Plane y, cb, cr;
	std::vector<uint8_t> alpha; // size = width*height
};

// Caller guarantees img has been validated (see validate_image).
YCbCrPlanes split_planes(const ImageRGBA& img);

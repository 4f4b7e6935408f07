#pragma once

/*
Plain data types shared by every pipeline stage. Nothing here owns more than
a std::vector, so the types copy and move like values and can be handed to
worker threads without any extra bookkeeping.
*/

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

/*
 Interleaved RGBA, 8 bits per channel, row-major, top-left origin.
 pixels.size() == width * height * 4 for every valid image.
 */
struct ImageRGBA {
	int width = 0, height = 0;
	std::vector<uint8_t> pixels; // R,G,B,A per pixel

	size_t pixel_count() const { return (size_t)width * (size_t)height; }
};

/*
 Single-channel sample grid. Samples stay in float between stages so the only
 rounding in the whole pipeline happens in quantization and in the final
 conversion back to 8 bits.
 */
struct Plane {
	int width = 0, height = 0;
	std::vector<float> samples; // size = width*height

	Plane() = default;
	Plane(int w, int h, float fill = 0.0f)
		: width(w), height(h), samples((size_t)w * (size_t)h, fill) {}

	float& at(int x, int y) { return samples[(size_t)y * width + x]; }
	float at(int x, int y) const { return samples[(size_t)y * width + x]; }
};

// Fatal input error; reported before any output is allocated.
class InvalidDimensions : public std::runtime_error {
public:
	explicit InvalidDimensions(const std::string& what)
		: std::runtime_error(what) {}
};

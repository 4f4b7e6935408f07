#include "color.hpp"

namespace {

	inline uint8_t round_clamp_u8(float v) {
		if (v < 0.f) v = 0.f;
		else if (v > 255.f) v = 255.f;
		return static_cast<uint8_t>(v + 0.5f);
	}

} // namespace

YCbCr rgb_to_ycbcr(uint8_t r, uint8_t g, uint8_t b) {
	const float R = float(r), G = float(g), B = float(b);
	YCbCr out;
	out.y  =  0.299f    * R + 0.587f    * G + 0.114f    * B;
	out.cb = -0.168736f * R - 0.331264f * G + 0.5f      * B + 128.0f;
	out.cr =  0.5f      * R - 0.418688f * G - 0.081312f * B + 128.0f;
	return out;
}

RGB8 ycbcr_to_rgb(float y, float cb, float cr) {
	const float c_b = cb - 128.0f;
	const float c_r = cr - 128.0f;
	RGB8 out;
	out.r = round_clamp_u8(y + 1.402f * c_r);
	out.g = round_clamp_u8(y - 0.344136f * c_b - 0.714136f * c_r);
	out.b = round_clamp_u8(y + 1.772f * c_b);
	return out;
}

YCbCrPlanes split_planes(const ImageRGBA& img) {
	const int w = img.width, h = img.height;
	YCbCrPlanes planes;
	planes.y = Plane(w, h);
	planes.cb = Plane(w, h);
	planes.cr = Plane(w, h);
	planes.alpha.resize(img.pixel_count());

	const uint8_t* p = img.pixels.data();
	for (size_t i = 0, n = img.pixel_count(); i < n; ++i, p += 4) {
		const YCbCr c = rgb_to_ycbcr(p[0], p[1], p[2]);
		planes.y.samples[i] = c.y;
		planes.cb.samples[i] = c.cb;
		planes.cr.samples[i] = c.cr;
		planes.alpha[i] = p[3];
	}
	return planes;
}

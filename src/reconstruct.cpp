#include "reconstruct.hpp"
#include "color.hpp"

#include <stdexcept>

namespace {

	// Full-size chroma passes through; anything else goes through the 4:2:0 upsampler.
	const Plane& full_res_chroma(const Plane& p, int width, int height,
		ChromaUpsample upsample, Plane& storage) {
		if (p.width == width && p.height == height)
			return p;
		storage = upsample_420(p, width, height, upsample);
		return storage;
	}

} // namespace

ImageRGBA assemble_rgba(const Plane& y, const Plane& cb, const Plane& cr,
	const std::vector<uint8_t>& alpha, int width, int height,
	ChromaUpsample upsample) {
	if (width <= 0 || height <= 0)
		throw std::runtime_error("assemble_rgba: bad size");
	const size_t n = (size_t)width * (size_t)height;
	if (y.width != width || y.height != height || y.samples.size() != n)
		throw std::runtime_error("assemble_rgba: luma plane mis-sized");
	if (alpha.size() != n)
		throw std::runtime_error("assemble_rgba: alpha plane mis-sized");

	Plane cb_storage, cr_storage;
	const Plane& cb_full = full_res_chroma(cb, width, height, upsample, cb_storage);
	const Plane& cr_full = full_res_chroma(cr, width, height, upsample, cr_storage);

	ImageRGBA out;
	out.width = width;
	out.height = height;
	out.pixels.resize(n * 4);

	uint8_t* p = out.pixels.data();
	for (size_t i = 0; i < n; ++i, p += 4) {
		const RGB8 c = ycbcr_to_rgb(y.samples[i], cb_full.samples[i], cr_full.samples[i]);
		p[0] = c.r;
		p[1] = c.g;
		p[2] = c.b;
		p[3] = alpha[i];
	}
	return out;
}

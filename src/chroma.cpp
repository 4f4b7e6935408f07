#include "chroma.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace {

	inline int clampi(int v, int lo, int hi) {
		return v < lo ? lo : (v > hi ? hi : v);
	}

	/*
	Half-res sample i covers full-res columns 2i and 2i+1, so its center sits
	at 2i + 0.5. Mapping a full-res pixel center back gives (x - 0.5) / 2.
	*/
	inline void bilinear_tap(int x, int half_n, int& i0, int& i1, float& t) {
		const float pos = (float(x) - 0.5f) * 0.5f;
		const float base = std::floor(pos);
		t = pos - base;
		i0 = clampi(int(base), 0, half_n - 1);
		i1 = clampi(int(base) + 1, 0, half_n - 1);
	}

} // namespace

Plane downsample_420(const Plane& plane, ChromaDownsample filter) {
	const int hw = half_extent(plane.width);
	const int hh = half_extent(plane.height);
	Plane out(hw, hh);

	for (int y = 0; y < hh; ++y) {
		const int y0 = 2 * y;
		const int y1 = std::min(y0 + 1, plane.height - 1);
		for (int x = 0; x < hw; ++x) {
			const int x0 = 2 * x;
			if (filter == ChromaDownsample::Point) {
				out.at(x, y) = plane.at(x0, y0);
				continue;
			}
			const int x1 = std::min(x0 + 1, plane.width - 1);
			out.at(x, y) = 0.25f * (plane.at(x0, y0) + plane.at(x1, y0) +
				plane.at(x0, y1) + plane.at(x1, y1));
		}
	}
	return out;
}

Plane upsample_420(const Plane& half, int target_w, int target_h, ChromaUpsample filter) {
	if (target_w <= 0 || target_h <= 0)
		throw std::runtime_error("upsample_420: bad target size");
	if (half.width < half_extent(target_w) || half.height < half_extent(target_h))
		throw std::runtime_error("upsample_420: half plane too small for target");

	Plane out(target_w, target_h);

	if (filter == ChromaUpsample::Replicate) {
		for (int y = 0; y < target_h; ++y)
			for (int x = 0; x < target_w; ++x)
				out.at(x, y) = half.at(x / 2, y / 2);
		return out;
	}

	// Only the part of the half plane that maps onto the target is sampled.
	const int used_w = half_extent(target_w);
	const int used_h = half_extent(target_h);
	for (int y = 0; y < target_h; ++y) {
		int ya, yb;
		float ty;
		bilinear_tap(y, used_h, ya, yb, ty);
		for (int x = 0; x < target_w; ++x) {
			int xa, xb;
			float tx;
			bilinear_tap(x, used_w, xa, xb, tx);
			const float top = half.at(xa, ya) + (half.at(xb, ya) - half.at(xa, ya)) * tx;
			const float bot = half.at(xa, yb) + (half.at(xb, yb) - half.at(xa, yb)) * tx;
			out.at(x, y) = top + (bot - top) * ty;
		}
	}
	return out;
}

#pragma once

#include "image.hpp"

enum class ChromaMode {
	Subsample420, // Cb/Cr at half resolution in both axes
	Full444,      // Cb/Cr transformed at full resolution
};

enum class ChromaDownsample {
	Average, // mean of each 2x2 cell, edge replicated
	Point,   // top-left sample of each 2x2 cell
};

enum class ChromaUpsample {
	Replicate, // each half-res sample fills its 2x2 footprint
	Bilinear,  // interpolate between half-res sample centers
};

// Half-resolution size for one axis: ceil(n / 2).
inline int half_extent(int n) { return (n + 1) / 2; }

// Output is half_extent(w) x half_extent(h).
Plane downsample_420(const Plane& plane, ChromaDownsample filter = ChromaDownsample::Average);

/*
 Expands a half-resolution plane back to target_w x target_h. The half plane
 must be at least half_extent(target_w) x half_extent(target_h); throws
 std::runtime_error otherwise.
 */
Plane upsample_420(const Plane& half, int target_w, int target_h,
	ChromaUpsample filter = ChromaUpsample::Replicate);

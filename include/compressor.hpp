#pragma once

/*
This header is the stable surface shared by the CPU/GPU backends and the
small CLI front-end. Everything a caller needs to degrade an image lives
here; the per-stage headers are only needed to drive stages one by one.
*/

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "chroma.hpp"
#include "image.hpp"

/*
 One call walks these stages strictly in order, with no retry or branching.
 A validation failure ends the call in Validating.
 */
enum class PipelineStage {
	Idle,
	Validating,
	Converting,
	Subsampling,
	Transforming,
	Quantizing,
	Dequantizing,
	InverseTransforming,
	Reconstructing,
	Done,
};

const char* stage_name(PipelineStage stage);

struct CompressOptions {
	ChromaMode chroma_mode = ChromaMode::Subsample420;
	ChromaDownsample downsample = ChromaDownsample::Average;
	ChromaUpsample upsample = ChromaUpsample::Replicate;
	int threads = 1; // 0 = one worker per hardware thread
	// Called on entry to every stage after Idle. Must not throw.
	std::function<void(PipelineStage)> on_stage;
};

/*
 Throws InvalidDimensions when width/height is not positive, when
 width*height*4 overflows, or when pixels.size() != width*height*4.
 */
void validate_image(const ImageRGBA& img);

// Clamps to [0,1]; NaN becomes 0.
float clamp_strength(float strength);

// quality 100 -> strength 0, quality 0 -> strength 1 (quality clamped to [0,100]).
float strength_from_quality(int quality);

/*
 CPU pipeline: YCbCr conversion, 4:2:0 chroma subsampling, 8x8 DCT +
 quantization scaled by strength, dequantization + IDCT, back to RGBA.
 Strength is clamped to [0,1]. The input is never modified and the result is
 freshly allocated. Output bytes depend only on (img, strength, chroma
 options), never on options.threads.
 */
ImageRGBA compress_image(const ImageRGBA& img, float strength,
	const CompressOptions& options = {});

// Same as compress_image with strength_from_quality(quality).
ImageRGBA compress_image_quality(const ImageRGBA& img, int quality,
	const CompressOptions& options = {});

// Metrics helpers. RGB channels of two same-sized images; alpha ignored.
double mse_rgb(const ImageRGBA& a, const ImageRGBA& b);
double mean_abs_diff_rgb(const ImageRGBA& a, const ImageRGBA& b);
double psnr_from_mse(double mse, double peak = 255.0);

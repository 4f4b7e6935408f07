#include "compressor.hpp"
#include "block_transform.hpp"
#include "color.hpp"
#include "reconstruct.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

	inline void enter(const CompressOptions& options, PipelineStage stage) {
		if (options.on_stage) options.on_stage(stage);
	}

	// Working set for one call; nothing here outlives compress_image.
	struct PlaneSet {
		Plane y, cb, cr;
	};

	struct QuantizedSet {
		QuantizedPlane y, cb, cr;
	};

	struct DctSet {
		DctPlane y, cb, cr;
	};

} // namespace

const char* stage_name(PipelineStage stage) {
	switch (stage) {
	case PipelineStage::Idle: return "idle";
	case PipelineStage::Validating: return "validating";
	case PipelineStage::Converting: return "converting";
	case PipelineStage::Subsampling: return "subsampling";
	case PipelineStage::Transforming: return "transforming";
	case PipelineStage::Quantizing: return "quantizing";
	case PipelineStage::Dequantizing: return "dequantizing";
	case PipelineStage::InverseTransforming: return "inverse-transforming";
	case PipelineStage::Reconstructing: return "reconstructing";
	case PipelineStage::Done: return "done";
	}
	return "unknown";
}

void validate_image(const ImageRGBA& img) {
	if (img.width <= 0 || img.height <= 0)
		throw InvalidDimensions("validate_image: width and height must be positive (got " +
			std::to_string(img.width) + "x" + std::to_string(img.height) + ")");

	const size_t max_bytes = std::numeric_limits<size_t>::max();
	const size_t w = (size_t)img.width, h = (size_t)img.height;
	if (w > max_bytes / h || w * h > max_bytes / 4)
		throw InvalidDimensions("validate_image: pixel count overflows");

	const size_t expected = w * h * 4;
	if (img.pixels.size() != expected)
		throw InvalidDimensions("validate_image: buffer holds " + std::to_string(img.pixels.size()) +
			" bytes, expected " + std::to_string(expected));
}

float clamp_strength(float strength) {
	if (std::isnan(strength)) return 0.0f;
	return strength < 0.0f ? 0.0f : (strength > 1.0f ? 1.0f : strength);
}

float strength_from_quality(int quality) {
	if (quality < 0) quality = 0;
	if (quality > 100) quality = 100;
	return float(100 - quality) / 100.0f;
}

ImageRGBA compress_image(const ImageRGBA& img, float strength, const CompressOptions& options) {
	enter(options, PipelineStage::Validating);
	validate_image(img);
	strength = clamp_strength(strength);
	const QuantTables tables = make_quant_tables(strength);
	const int threads = options.threads;

	enter(options, PipelineStage::Converting);
	YCbCrPlanes full = split_planes(img);

	enter(options, PipelineStage::Subsampling);
	PlaneSet planes;
	planes.y = std::move(full.y);
	if (options.chroma_mode == ChromaMode::Subsample420) {
		planes.cb = downsample_420(full.cb, options.downsample);
		planes.cr = downsample_420(full.cr, options.downsample);
	}
	else {
		planes.cb = std::move(full.cb);
		planes.cr = std::move(full.cr);
	}

	enter(options, PipelineStage::Transforming);
	DctSet dct;
	dct.y = forward_dct_plane(planes.y, threads);
	dct.cb = forward_dct_plane(planes.cb, threads);
	dct.cr = forward_dct_plane(planes.cr, threads);

	enter(options, PipelineStage::Quantizing);
	QuantizedSet quantized;
	quantized.y = quantize_plane(dct.y, tables.luma, threads);
	quantized.cb = quantize_plane(dct.cb, tables.chroma, threads);
	quantized.cr = quantize_plane(dct.cr, tables.chroma, threads);

	enter(options, PipelineStage::Dequantizing);
	dct.y = dequantize_plane(quantized.y, tables.luma, threads);
	dct.cb = dequantize_plane(quantized.cb, tables.chroma, threads);
	dct.cr = dequantize_plane(quantized.cr, tables.chroma, threads);

	enter(options, PipelineStage::InverseTransforming);
	planes.y = inverse_dct_plane(dct.y, threads);
	planes.cb = inverse_dct_plane(dct.cb, threads);
	planes.cr = inverse_dct_plane(dct.cr, threads);

	enter(options, PipelineStage::Reconstructing);
	ImageRGBA out = assemble_rgba(planes.y, planes.cb, planes.cr, full.alpha,
		img.width, img.height, options.upsample);

	enter(options, PipelineStage::Done);
	return out;
}

ImageRGBA compress_image_quality(const ImageRGBA& img, int quality, const CompressOptions& options) {
	return compress_image(img, strength_from_quality(quality), options);
}

// Metrics
namespace {

	template <typename Fn>
	double accumulate_rgb(const ImageRGBA& a, const ImageRGBA& b, const char* fn, Fn per_channel) {
		if (a.width != b.width || a.height != b.height || a.pixels.size() != b.pixels.size())
			throw std::runtime_error(std::string(fn) + ": size mismatch");
		const size_t n = a.pixels.size() / 4;
		if (n == 0) return 0.0;
		double acc = 0.0;
		for (size_t i = 0; i < n; ++i)
			for (int c = 0; c < 3; ++c)
				acc += per_channel(double(a.pixels[i * 4 + c]) - double(b.pixels[i * 4 + c]));
		return acc / double(n * 3);
	}

} // namespace

double mse_rgb(const ImageRGBA& a, const ImageRGBA& b) {
	return accumulate_rgb(a, b, "mse_rgb", [](double d) { return d * d; });
}

double mean_abs_diff_rgb(const ImageRGBA& a, const ImageRGBA& b) {
	return accumulate_rgb(a, b, "mean_abs_diff_rgb", [](double d) { return std::fabs(d); });
}

double psnr_from_mse(double mse, double peak) {
	if (mse <= 1e-12) return 99.0;
	return 10.0 * std::log10((peak * peak) / mse);
}

// jpegsim CLI: load an image, simulate JPEG artifacts, report error, write result.
#include "cli.hpp"

#include <cerrno>
#include <chrono>
#include <climits>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <vector>

#include "image_io.hpp"
#ifdef JPEGSIM_HAVE_CUDA
#include "compressor_gpu.hpp"
#endif

namespace {

	bool parse_float(const char* s, float& out) {
		char* end = nullptr;
		errno = 0;
		const float v = std::strtof(s, &end);
		if (end == s || *end != '\0' || errno == ERANGE || !std::isfinite(v)) return false;
		out = v;
		return true;
	}

	bool parse_int(const char* s, int& out) {
		char* end = nullptr;
		errno = 0;
		const long v = std::strtol(s, &end, 10);
		if (end == s || *end != '\0' || errno == ERANGE || v < INT_MIN || v > INT_MAX) return false;
		out = (int)v;
		return true;
	}

	using Clock = std::chrono::steady_clock;

	// Records the time each stage is entered; the next stage's entry closes it.
	struct StageTimer {
		std::vector<PipelineStage> stages;
		std::vector<Clock::time_point> stamps;

		void mark(PipelineStage s) {
			stages.push_back(s);
			stamps.push_back(Clock::now());
		}

		void report() const {
			for (size_t i = 0; i + 1 < stages.size(); ++i) {
				const double ms = std::chrono::duration<double, std::milli>(stamps[i + 1] - stamps[i]).count();
				std::fprintf(stderr, "[jpegsim] %-22s %8.3f ms\n", stage_name(stages[i]), ms);
			}
		}
	};

} // namespace

void print_usage(const char* argv0) {
	std::printf(
		"Usage: %s <input> <output> [options]\n"
		"  input:  .jpg/.jpeg, .ppm (P6) or .pam (P7)\n"
		"  output: .jpg/.jpeg, .ppm or .pam (alpha kept only in .pam)\n"
		"Options:\n"
		"  --strength S                 0.0 (near-lossless) .. 1.0 (heaviest), default 0.5\n"
		"  --quality Q                  0 .. 100, alternative to --strength\n"
		"  --chroma 420|444             chroma subsampling, default 420\n"
		"  --downsample average|point   4:2:0 downsampling filter, default average\n"
		"  --upsample replicate|bilinear 4:2:0 upsampling filter, default replicate\n"
		"  --threads N                  block workers, 0 = all cores, default 1\n"
		"  --gpu                        run block stages on CUDA (if built with it)\n"
		"  --jpeg-quality Q             encoder quality for .jpg output, default 100\n"
		"  --verbose                    print per-stage timings\n",
		argv0);
}

bool parse_args(int argc, const char* const* argv, CliConfig& cfg) {
	if (argc < 3) return false;
	cfg.in_path = argv[1];
	cfg.out_path = argv[2];
	for (int i = 3; i < argc; ++i) {
		const std::string s = argv[i];
		const bool has_value = i + 1 < argc;
		if (s == "--strength" && has_value) {
			if (!parse_float(argv[++i], cfg.strength)) return false;
		}
		else if (s == "--quality" && has_value) {
			int q = 0;
			if (!parse_int(argv[++i], q)) return false;
			cfg.strength = strength_from_quality(q);
		}
		else if (s == "--threads" && has_value) {
			if (!parse_int(argv[++i], cfg.options.threads)) return false;
		}
		else if (s == "--jpeg-quality" && has_value) {
			if (!parse_int(argv[++i], cfg.jpeg_quality)) return false;
		}
		else if (s == "--chroma" && has_value) {
			const std::string v = argv[++i];
			if (v == "420") cfg.options.chroma_mode = ChromaMode::Subsample420;
			else if (v == "444") cfg.options.chroma_mode = ChromaMode::Full444;
			else return false;
		}
		else if (s == "--downsample" && has_value) {
			const std::string v = argv[++i];
			if (v == "average") cfg.options.downsample = ChromaDownsample::Average;
			else if (v == "point") cfg.options.downsample = ChromaDownsample::Point;
			else return false;
		}
		else if (s == "--upsample" && has_value) {
			const std::string v = argv[++i];
			if (v == "replicate") cfg.options.upsample = ChromaUpsample::Replicate;
			else if (v == "bilinear") cfg.options.upsample = ChromaUpsample::Bilinear;
			else return false;
		}
		else if (s == "--gpu") cfg.use_gpu = true;
		else if (s == "--verbose") cfg.verbose = true;
		else return false;
	}
	if (cfg.options.threads < 0) return false;
	return true;
}

int run_cli(int argc, const char* const* argv) {
	CliConfig cfg;
	if (!parse_args(argc, argv, cfg)) {
		print_usage(argc > 0 ? argv[0] : "jpegsim");
		return 2;
	}

	try {
		const ImageRGBA input = read_image(cfg.in_path);
		if (cfg.verbose)
			std::fprintf(stderr, "[jpegsim] loaded %s (%dx%d)\n", cfg.in_path.c_str(), input.width, input.height);

		StageTimer timer;
		if (cfg.verbose)
			cfg.options.on_stage = [&timer](PipelineStage s) { timer.mark(s); };

		const float strength = clamp_strength(cfg.strength);
		ImageRGBA output;
		if (cfg.use_gpu) {
#ifdef JPEGSIM_HAVE_CUDA
			if (!gpu_available()) {
				std::fprintf(stderr, "[jpegsim] no CUDA device found\n");
				return 1;
			}
			output = compress_image_gpu(input, strength, cfg.options);
#else
			std::fprintf(stderr, "[jpegsim] built without CUDA support, --gpu unavailable\n");
			return 1;
#endif
		}
		else {
			output = compress_image(input, strength, cfg.options);
		}
		if (cfg.verbose) timer.report();

		const double mse = mse_rgb(input, output);
		std::printf("strength=%.3f mse=%.4f psnr=%.2f dB mad=%.4f\n",
			strength, mse, psnr_from_mse(mse), mean_abs_diff_rgb(input, output));

		write_image(output, cfg.out_path, cfg.jpeg_quality);
		if (cfg.verbose)
			std::fprintf(stderr, "[jpegsim] wrote %s\n", cfg.out_path.c_str());
	}
	catch (const InvalidDimensions& e) {
		std::fprintf(stderr, "[jpegsim] invalid image: %s\n", e.what());
		return 1;
	}
	catch (const std::exception& e) {
		std::fprintf(stderr, "[jpegsim] error: %s\n", e.what());
		return 1;
	}
	return 0;
}

#include <gtest/gtest.h>

#include <cstdio>
#include <string>
#include <vector>

#include "cli.hpp"
#include "image_io.hpp"
#include "test_util.hpp"

namespace {

	bool parse(std::vector<const char*> args, CliConfig& cfg) {
		args.insert(args.begin(), "jpegsim");
		return parse_args((int)args.size(), args.data(), cfg);
	}

	int run(std::vector<const char*> args) {
		args.insert(args.begin(), "jpegsim");
		return run_cli((int)args.size(), args.data());
	}

	std::string temp_path(const std::string& name) {
		return ::testing::TempDir() + "jpegsim_cli_" + name;
	}

} // namespace

TEST(CliArgs, DefaultsAndPaths) {
	CliConfig cfg;
	ASSERT_TRUE(parse({ "in.ppm", "out.pam" }, cfg));
	EXPECT_EQ(cfg.in_path, "in.ppm");
	EXPECT_EQ(cfg.out_path, "out.pam");
	EXPECT_FLOAT_EQ(cfg.strength, 0.5f);
	EXPECT_EQ(cfg.options.threads, 1);
	EXPECT_EQ(cfg.jpeg_quality, 100);
	EXPECT_FALSE(cfg.use_gpu);
}

TEST(CliArgs, ParsesEveryOption) {
	CliConfig cfg;
	ASSERT_TRUE(parse({ "a.jpg", "b.jpg", "--strength", "0.8", "--chroma", "444",
		"--downsample", "point", "--upsample", "bilinear", "--threads", "0",
		"--jpeg-quality", "75", "--gpu", "--verbose" }, cfg));
	EXPECT_FLOAT_EQ(cfg.strength, 0.8f);
	EXPECT_EQ(cfg.options.chroma_mode, ChromaMode::Full444);
	EXPECT_EQ(cfg.options.downsample, ChromaDownsample::Point);
	EXPECT_EQ(cfg.options.upsample, ChromaUpsample::Bilinear);
	EXPECT_EQ(cfg.options.threads, 0);
	EXPECT_EQ(cfg.jpeg_quality, 75);
	EXPECT_TRUE(cfg.use_gpu);
	EXPECT_TRUE(cfg.verbose);
}

TEST(CliArgs, QualityMapsOntoStrength) {
	CliConfig cfg;
	ASSERT_TRUE(parse({ "a.ppm", "b.ppm", "--quality", "80" }, cfg));
	EXPECT_FLOAT_EQ(cfg.strength, 0.2f);
	ASSERT_TRUE(parse({ "a.ppm", "b.ppm", "--quality", "0" }, cfg));
	EXPECT_FLOAT_EQ(cfg.strength, 1.0f);
}

TEST(CliArgs, RejectsMalformedNumbers) {
	const std::vector<std::vector<const char*>> bad = {
		{ "a.ppm", "b.ppm", "--strength", "abc" },
		{ "a.ppm", "b.ppm", "--strength", "0.5x" },
		{ "a.ppm", "b.ppm", "--strength", "" },
		{ "a.ppm", "b.ppm", "--strength", "nan" },
		{ "a.ppm", "b.ppm", "--threads", "many" },
		{ "a.ppm", "b.ppm", "--threads", "4.5" },
		{ "a.ppm", "b.ppm", "--threads", "-1" },
		{ "a.ppm", "b.ppm", "--threads", "99999999999999999999" },
		{ "a.ppm", "b.ppm", "--quality", "high" },
		{ "a.ppm", "b.ppm", "--jpeg-quality", "9o" },
	};
	for (const auto& args : bad) {
		CliConfig cfg;
		EXPECT_FALSE(parse(args, cfg)) << args[2] << " " << args[3];
	}
}

TEST(CliArgs, RejectsUnknownAndIncompleteOptions) {
	CliConfig cfg;
	EXPECT_FALSE(parse({ "a.ppm" }, cfg));
	EXPECT_FALSE(parse({ "a.ppm", "b.ppm", "--fast" }, cfg));
	EXPECT_FALSE(parse({ "a.ppm", "b.ppm", "--strength" }, cfg));
	EXPECT_FALSE(parse({ "a.ppm", "b.ppm", "--chroma", "422" }, cfg));
	EXPECT_FALSE(parse({ "a.ppm", "b.ppm", "--upsample", "cubic" }, cfg));
}

TEST(CliRun, ExitCodes) {
	const std::string in = temp_path("in.pam");
	const std::string out = temp_path("out.pam");
	const ImageRGBA img = color_noise_image(12, 10, 40);
	write_image(img, in);

	EXPECT_EQ(run({ in.c_str(), out.c_str(), "--strength", "abc" }), 2);
	EXPECT_EQ(run({ in.c_str() }), 2);

	const std::string missing = temp_path("missing.pam");
	EXPECT_EQ(run({ missing.c_str(), out.c_str() }), 1);
	const std::string bad_ext = temp_path("out.gif");
	EXPECT_EQ(run({ in.c_str(), bad_ext.c_str() }), 1);

	ASSERT_EQ(run({ in.c_str(), out.c_str(), "--quality", "100", "--chroma", "444" }), 0);
	const ImageRGBA back = read_image(out);
	EXPECT_EQ(back.width, 12);
	EXPECT_EQ(back.height, 10);
	EXPECT_TRUE(alpha_equal(img, back));
	EXPECT_LE(max_rgb_diff(img, back), 3);

	std::remove(in.c_str());
	std::remove(out.c_str());
}

TEST(CliRun, OutputFormatFollowsExtension) {
	const std::string in = temp_path("src.pam");
	write_image(color_noise_image(9, 7, 41), in);

	const std::string ppm = temp_path("dst.ppm");
	ASSERT_EQ(run({ in.c_str(), ppm.c_str() }), 0);
	const ImageRGBA from_ppm = read_image(ppm);
	for (size_t i = 3; i < from_ppm.pixels.size(); i += 4) EXPECT_EQ(from_ppm.pixels[i], 255);

	const std::string jpg = temp_path("dst.jpg");
	ASSERT_EQ(run({ in.c_str(), jpg.c_str(), "--jpeg-quality", "90" }), 0);
	std::FILE* f = std::fopen(jpg.c_str(), "rb");
	ASSERT_NE(f, nullptr);
	const int b0 = std::fgetc(f), b1 = std::fgetc(f);
	std::fclose(f);
	EXPECT_EQ(b0, 0xFF);
	EXPECT_EQ(b1, 0xD8);

	std::remove(in.c_str());
	std::remove(ppm.c_str());
	std::remove(jpg.c_str());
}

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "color.hpp"
#include "reconstruct.hpp"

TEST(Reconstruct, UpsamplesHalfChromaAndCopiesAlpha) {
	const int w = 5, h = 3;
	const Plane y(w, h, 100.0f);
	const Plane cb(3, 2, 128.0f);
	Plane cr(3, 2, 128.0f);
	cr.at(2, 1) = 200.0f; // covers pixel (4, 2)

	std::vector<uint8_t> alpha(w * h);
	for (size_t i = 0; i < alpha.size(); ++i) alpha[i] = (uint8_t)(i * 13);

	const ImageRGBA out = assemble_rgba(y, cb, cr, alpha, w, h);
	ASSERT_EQ(out.width, w);
	ASSERT_EQ(out.height, h);
	ASSERT_EQ(out.pixels.size(), (size_t)w * h * 4);

	for (size_t i = 0; i < alpha.size(); ++i) EXPECT_EQ(out.pixels[i * 4 + 3], alpha[i]);

	// neutral chroma -> gray
	EXPECT_EQ(out.pixels[0], 100);
	EXPECT_EQ(out.pixels[1], 100);
	EXPECT_EQ(out.pixels[2], 100);

	// the red-shifted cell
	const size_t last = ((size_t)2 * w + 4) * 4;
	const RGB8 expect = ycbcr_to_rgb(100.0f, 128.0f, 200.0f);
	EXPECT_EQ(out.pixels[last + 0], expect.r);
	EXPECT_EQ(out.pixels[last + 1], expect.g);
	EXPECT_EQ(out.pixels[last + 2], expect.b);
	EXPECT_GT(out.pixels[last + 0], out.pixels[last + 2]);
}

TEST(Reconstruct, FullResolutionChromaPassesThrough) {
	const Plane y(2, 2, 50.0f), cb(2, 2, 90.0f), cr(2, 2, 160.0f);
	const std::vector<uint8_t> alpha(4, 255);
	const ImageRGBA out = assemble_rgba(y, cb, cr, alpha, 2, 2, ChromaUpsample::Bilinear);
	const RGB8 expect = ycbcr_to_rgb(50.0f, 90.0f, 160.0f);
	for (int i = 0; i < 4; ++i) {
		EXPECT_EQ(out.pixels[i * 4 + 0], expect.r);
		EXPECT_EQ(out.pixels[i * 4 + 1], expect.g);
		EXPECT_EQ(out.pixels[i * 4 + 2], expect.b);
	}
}

TEST(Reconstruct, RejectsMisSizedInputs) {
	const Plane cb(2, 2), cr(2, 2);
	const std::vector<uint8_t> alpha(16, 0);
	EXPECT_THROW(assemble_rgba(Plane(3, 4), cb, cr, alpha, 4, 4), std::runtime_error);
	EXPECT_THROW(assemble_rgba(Plane(4, 4), cb, cr, std::vector<uint8_t>(15), 4, 4), std::runtime_error);
	EXPECT_THROW(assemble_rgba(Plane(4, 4), Plane(1, 1), cr, alpha, 4, 4), std::runtime_error);
	EXPECT_THROW(assemble_rgba(Plane(4, 4), cb, cr, alpha, 0, 4), std::runtime_error);
}

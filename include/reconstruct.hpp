#pragma once

#include <cstdint>
#include <vector>

#include "chroma.hpp"
#include "image.hpp"

/*
 Builds the output image from the reconstructed planes. Cb/Cr are upsampled
 when they are smaller than width x height; Y must already be full size.
 Alpha is copied byte for byte. Throws std::runtime_error when a plane or the
 alpha buffer does not cover the requested size.
 */
ImageRGBA assemble_rgba(const Plane& y, const Plane& cb, const Plane& cr,
	const std::vector<uint8_t>& alpha, int width, int height,
	ChromaUpsample upsample = ChromaUpsample::Replicate);

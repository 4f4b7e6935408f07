#pragma once

/*
8x8 block stages: tiling with edge replication, forward DCT, quantization,
and their inverses. Blocks are fixed-size value types kept in a flat arena
per plane (raster order, index = by * blocks_x + bx), so every block can be
processed independently of its neighbours.
*/

#include <cstdint>
#include <vector>

#include "image.hpp"

constexpr int kBlockSize = 8;
constexpr int kBlockArea = kBlockSize * kBlockSize;

// Quantization steps never go below this; strength 0 is near-lossless, not a
// division by zero.
constexpr float kMinQuantStep = 1.0f / 16.0f;

// Quantized quotients are clamped to this magnitude before conversion.
constexpr int32_t kMaxQuantizedMagnitude = 1 << 20;

// Row-major, index = u * 8 + v (u vertical frequency, v horizontal).
struct Block8x8 {
	float v[kBlockArea];
};

struct QuantizedBlock {
	int32_t v[kBlockArea];
};

struct QuantTable {
	float step[kBlockArea];
};

struct QuantTables {
	QuantTable luma;
	QuantTable chroma;
};

struct BlockGrid {
	int width = 0, height = 0;
	int blocks_x = 0, blocks_y = 0;

	size_t block_count() const { return (size_t)blocks_x * (size_t)blocks_y; }
};

struct DctPlane {
	BlockGrid grid;
	std::vector<Block8x8> blocks;
};

struct QuantizedPlane {
	BlockGrid grid;
	std::vector<QuantizedBlock> blocks;
};

// IJG (libjpeg) baseline tables, used as perceptual weights only.
extern const uint8_t kBaseQ_Luma[kBlockArea];
extern const uint8_t kBaseQ_Chroma[kBlockArea];

/*
 Maps strength in [0,1] onto a multiplier for the base tables. Goes through
 the IJG quality curve with q = 100 - 99 * strength:
   factor = (q < 50 ? 5000 / q : 200 - 2q) / 100
 so factor(0) == 0, factor(0.5) ~= 1 and factor(1) == 50. Strictly increasing
 in strength. Input is clamped first.
 */
float strength_to_quant_factor(float strength);

QuantTable make_quant_table(const uint8_t base[kBlockArea], float factor);
QuantTables make_quant_tables(float strength);

BlockGrid make_block_grid(int width, int height);

// Level-shifted (-128) 8x8 window at block (bx, by); positions past the plane
// edge replicate the last valid row/column.
Block8x8 load_block(const Plane& plane, int bx, int by);

// Adds 128, clamps to [0,255] and writes the part of the block that lies
// inside the plane. Padding is dropped.
void store_block(const Block8x8& block, Plane& plane, int bx, int by);

// Orthonormal DCT-II basis, T[u * 8 + x]. Shared by the CPU and CUDA paths.
const float* dct_basis();

// Orthonormal DCT-II, rows then columns. in and out may not alias.
void fdct_8x8(const float in[kBlockArea], float out[kBlockArea]);
// Exact transpose of fdct_8x8, columns then rows.
void idct_8x8(const float in[kBlockArea], float out[kBlockArea]);

QuantizedBlock quantize_block(const Block8x8& coeff, const QuantTable& table);
Block8x8 dequantize_block(const QuantizedBlock& q, const QuantTable& table);

// threads: 1 = serial, 0 = hardware concurrency.
DctPlane forward_dct_plane(const Plane& plane, int threads = 1);
QuantizedPlane quantize_plane(const DctPlane& dct, const QuantTable& table, int threads = 1);
DctPlane dequantize_plane(const QuantizedPlane& q, const QuantTable& table, int threads = 1);
Plane inverse_dct_plane(const DctPlane& dct, int threads = 1);

// forward_dct_plane + quantize_plane.
QuantizedPlane forward_transform(const Plane& plane, const QuantTable& table, int threads = 1);
// dequantize_plane + inverse_dct_plane.
Plane inverse_transform(const QuantizedPlane& q, const QuantTable& table, int threads = 1);

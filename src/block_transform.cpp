#include "block_transform.hpp"
#include "parallel.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

/*
Base tables are the IJG (libjpeg) baselines: finer steps for low frequencies,
coarse for high ones, and coarser overall for chroma. They are only used as
relative weights here, nothing downstream expects JPEG-compatible values.
*/
const uint8_t kBaseQ_Luma[kBlockArea] = {
  16,11,10,16,24,40,51,61,
  12,12,14,19,26,58,60,55,
  14,13,16,24,40,57,69,56,
  14,17,22,29,51,87,80,62,
  18,22,37,56,68,109,103,77,
  24,35,55,64,81,104,113,92,
  49,64,78,87,103,121,120,101,
  72,92,95,98,112,100,103,99
};

const uint8_t kBaseQ_Chroma[kBlockArea] = {
  17,18,24,47,99,99,99,99,
  18,21,26,66,99,99,99,99,
  24,26,56,99,99,99,99,99,
  47,66,99,99,99,99,99,99,
  99,99,99,99,99,99,99,99,
  99,99,99,99,99,99,99,99,
  99,99,99,99,99,99,99,99,
  99,99,99,99,99,99,99,99
};

namespace {

	inline float clampf(float v, float lo, float hi) {
		return v < lo ? lo : (v > hi ? hi : v);
	}

	// T[u * 8 + x] = a(u) * cos((2x + 1) * u * pi / 16)
	struct DctBasis {
		float T[kBlockArea];

		DctBasis() {
			constexpr double PI = 3.14159265358979323846;
			const double invSqrt8 = 1.0 / std::sqrt(8.0);
			for (int u = 0; u < kBlockSize; ++u) {
				const double alpha = (u == 0) ? invSqrt8 : std::sqrt(2.0) * invSqrt8;
				for (int x = 0; x < kBlockSize; ++x)
					T[u * 8 + x] = static_cast<float>(alpha * std::cos(((2.0 * x + 1.0) * u) * (PI / 16.0)));
			}
		}
	};

	const DctBasis& basis() {
		static const DctBasis b;
		return b;
	}

	void check_grid(const BlockGrid& g, size_t blocks, const char* fn) {
		if (g.width <= 0 || g.height <= 0 || blocks != g.block_count())
			throw std::runtime_error(std::string(fn) + ": block arena does not match grid");
	}

} // namespace

const float* dct_basis() {
	return basis().T;
}

float strength_to_quant_factor(float strength) {
	if (!(strength >= 0.0f)) strength = 0.0f; // also catches NaN
	if (strength > 1.0f) strength = 1.0f;
	const float q = 100.0f - 99.0f * strength;
	const float scale = (q < 50.0f) ? (5000.0f / q) : (200.0f - 2.0f * q);
	return scale / 100.0f;
}

QuantTable make_quant_table(const uint8_t base[kBlockArea], float factor) {
	QuantTable t;
	for (int i = 0; i < kBlockArea; ++i)
		t.step[i] = std::max(float(base[i]) * factor, kMinQuantStep);
	return t;
}

QuantTables make_quant_tables(float strength) {
	const float factor = strength_to_quant_factor(strength);
	QuantTables tables;
	tables.luma = make_quant_table(kBaseQ_Luma, factor);
	tables.chroma = make_quant_table(kBaseQ_Chroma, factor);
	return tables;
}

BlockGrid make_block_grid(int width, int height) {
	if (width <= 0 || height <= 0)
		throw std::runtime_error("make_block_grid: bad size");
	BlockGrid g;
	g.width = width;
	g.height = height;
	g.blocks_x = (width + kBlockSize - 1) / kBlockSize;
	g.blocks_y = (height + kBlockSize - 1) / kBlockSize;
	return g;
}

Block8x8 load_block(const Plane& plane, int bx, int by) {
	Block8x8 b;
	const int x0 = bx * kBlockSize, y0 = by * kBlockSize;
	for (int ty = 0; ty < kBlockSize; ++ty) {
		const int y = std::min(y0 + ty, plane.height - 1);
		for (int tx = 0; tx < kBlockSize; ++tx) {
			const int x = std::min(x0 + tx, plane.width - 1);
			b.v[ty * 8 + tx] = plane.at(x, y) - 128.0f;
		}
	}
	return b;
}

void store_block(const Block8x8& block, Plane& plane, int bx, int by) {
	const int x0 = bx * kBlockSize, y0 = by * kBlockSize;
	const int h = std::min(kBlockSize, plane.height - y0);
	const int w = std::min(kBlockSize, plane.width - x0);
	for (int ty = 0; ty < h; ++ty)
		for (int tx = 0; tx < w; ++tx)
			plane.at(x0 + tx, y0 + ty) = clampf(block.v[ty * 8 + tx] + 128.0f, 0.0f, 255.0f);
}

void fdct_8x8(const float in[kBlockArea], float out[kBlockArea]) {
	const float* T = basis().T;
	float tmp[kBlockArea];

	// rows: tmp[y][v] = sum_x in[y][x] * T[v][x]
	for (int y = 0; y < 8; ++y)
		for (int v = 0; v < 8; ++v) {
			float s = 0.f;
			for (int k = 0; k < 8; ++k) s += in[y * 8 + k] * T[v * 8 + k];
			tmp[y * 8 + v] = s;
		}
	// columns: out[u][v] = sum_y T[u][y] * tmp[y][v]
	for (int u = 0; u < 8; ++u)
		for (int v = 0; v < 8; ++v) {
			float s = 0.f;
			for (int k = 0; k < 8; ++k) s += T[u * 8 + k] * tmp[k * 8 + v];
			out[u * 8 + v] = s;
		}
}

void idct_8x8(const float in[kBlockArea], float out[kBlockArea]) {
	const float* T = basis().T;
	float tmp[kBlockArea];

	// columns: tmp[y][v] = sum_u T[u][y] * in[u][v]
	for (int y = 0; y < 8; ++y)
		for (int v = 0; v < 8; ++v) {
			float s = 0.f;
			for (int k = 0; k < 8; ++k) s += T[k * 8 + y] * in[k * 8 + v];
			tmp[y * 8 + v] = s;
		}
	// rows: out[y][x] = sum_v tmp[y][v] * T[v][x]
	for (int y = 0; y < 8; ++y)
		for (int x = 0; x < 8; ++x) {
			float s = 0.f;
			for (int k = 0; k < 8; ++k) s += tmp[y * 8 + k] * T[k * 8 + x];
			out[y * 8 + x] = s;
		}
}

QuantizedBlock quantize_block(const Block8x8& coeff, const QuantTable& table) {
	const float lim = float(kMaxQuantizedMagnitude);
	QuantizedBlock q;
	for (int i = 0; i < kBlockArea; ++i) {
		float r = std::round(coeff.v[i] / table.step[i]);
		if (std::isnan(r)) r = 0.f;
		q.v[i] = static_cast<int32_t>(clampf(r, -lim, lim));
	}
	return q;
}

Block8x8 dequantize_block(const QuantizedBlock& q, const QuantTable& table) {
	Block8x8 b;
	for (int i = 0; i < kBlockArea; ++i)
		b.v[i] = float(q.v[i]) * table.step[i];
	return b;
}

DctPlane forward_dct_plane(const Plane& plane, int threads) {
	if ((size_t)plane.width * (size_t)plane.height != plane.samples.size() || plane.samples.empty())
		throw std::runtime_error("forward_dct_plane: plane mis-sized");

	DctPlane out;
	out.grid = make_block_grid(plane.width, plane.height);
	out.blocks.resize(out.grid.block_count());
	const int blocks_x = out.grid.blocks_x;

	parallel_for(out.blocks.size(), threads, [&](size_t i) {
		const int bx = int(i % blocks_x), by = int(i / blocks_x);
		const Block8x8 spatial = load_block(plane, bx, by);
		fdct_8x8(spatial.v, out.blocks[i].v);
	});
	return out;
}

QuantizedPlane quantize_plane(const DctPlane& dct, const QuantTable& table, int threads) {
	check_grid(dct.grid, dct.blocks.size(), "quantize_plane");
	QuantizedPlane out;
	out.grid = dct.grid;
	out.blocks.resize(dct.blocks.size());
	parallel_for(out.blocks.size(), threads, [&](size_t i) {
		out.blocks[i] = quantize_block(dct.blocks[i], table);
	});
	return out;
}

DctPlane dequantize_plane(const QuantizedPlane& q, const QuantTable& table, int threads) {
	check_grid(q.grid, q.blocks.size(), "dequantize_plane");
	DctPlane out;
	out.grid = q.grid;
	out.blocks.resize(q.blocks.size());
	parallel_for(out.blocks.size(), threads, [&](size_t i) {
		out.blocks[i] = dequantize_block(q.blocks[i], table);
	});
	return out;
}

Plane inverse_dct_plane(const DctPlane& dct, int threads) {
	check_grid(dct.grid, dct.blocks.size(), "inverse_dct_plane");
	Plane out(dct.grid.width, dct.grid.height);
	const int blocks_x = dct.grid.blocks_x;

	// Blocks write disjoint pixel ranges of `out`.
	parallel_for(dct.blocks.size(), threads, [&](size_t i) {
		const int bx = int(i % blocks_x), by = int(i / blocks_x);
		Block8x8 spatial;
		idct_8x8(dct.blocks[i].v, spatial.v);
		store_block(spatial, out, bx, by);
	});
	return out;
}

QuantizedPlane forward_transform(const Plane& plane, const QuantTable& table, int threads) {
	return quantize_plane(forward_dct_plane(plane, threads), table, threads);
}

Plane inverse_transform(const QuantizedPlane& q, const QuantTable& table, int threads) {
	return inverse_dct_plane(dequantize_plane(q, table, threads), threads);
}

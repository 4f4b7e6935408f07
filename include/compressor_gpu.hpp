#pragma once

/*
CUDA backend for the block stages. Only compiled when the build finds a CUDA
toolchain (JPEGSIM_HAVE_CUDA). Colour conversion, chroma resampling and
reconstruction stay on the host; each plane's load/fdct/quantize/dequantize/
idct runs on the device with one thread block per 8x8 block.
*/

#include <stdexcept>
#include <string>

#include "block_transform.hpp"
#include "compressor.hpp"

#ifdef _MSC_VER
#define NOMINMAX
#endif

#include <cuda_runtime.h>

/*
 CUDA APIs fail loudly but late. CUDA_CHECK turns every failing call into a
 std::runtime_error carrying the source location.
 */
#define CUDA_CHECK(stmt)                                                     \
    do {                                                                     \
        cudaError_t __err = (stmt);                                          \
        if (__err != cudaSuccess) {                                          \
            throw std::runtime_error(std::string("CUDA error: ") +           \
                                     cudaGetErrorString(__err) +             \
                                     " at " __FILE__ ":" + std::to_string(__LINE__)); \
        }                                                                    \
    } while (0)

// True when at least one CUDA device is usable.
bool gpu_available();

// Quantize/dequantize round trip of one plane on the device. "out" is resized
// to the input's size; contents are overwritten.
void compress_plane_gpu(const Plane& in, Plane& out, const QuantTable& table);

// Device counterpart of compress_image. options.threads is ignored.
ImageRGBA compress_image_gpu(const ImageRGBA& img, float strength,
	const CompressOptions& options = {});

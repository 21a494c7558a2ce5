/*
 * ChromaKey Keying Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "ChromaKey/Keying/FrameScaler.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace ChromaKey::Keying {

namespace {

struct SampleTap {
	std::uint32_t i0;
	std::uint32_t i1;
	float t;
};

std::vector<SampleTap> makeTaps(std::uint32_t sourceExtent, std::uint32_t targetExtent)
{
	std::vector<SampleTap> taps(targetExtent);
	const float scale = static_cast<float>(sourceExtent) / static_cast<float>(targetExtent);
	const float last = static_cast<float>(sourceExtent - 1);

	for (std::uint32_t i = 0; i < targetExtent; ++i) {
		const float position = std::clamp((static_cast<float>(i) + 0.5f) * scale - 0.5f, 0.0f, last);
		const auto i0 = static_cast<std::uint32_t>(std::floor(position));
		const std::uint32_t i1 = std::min(i0 + 1, sourceExtent - 1);
		taps[i] = {i0, i1, position - static_cast<float>(i0)};
	}
	return taps;
}

} // anonymous namespace

Frame resizeBilinear(const Frame &source, std::uint32_t width, std::uint32_t height,
		     TaskQueue::RowBandWorkerPool &pool)
{
	if (source.isEmpty()) {
		throw std::invalid_argument("cannot resize an empty frame");
	}
	if (width == 0 || height == 0) {
		throw std::invalid_argument("resize target must not be empty");
	}
	if (source.getWidth() == width && source.getHeight() == height) {
		return source.clone();
	}

	const std::vector<SampleTap> xTaps = makeTaps(source.getWidth(), width);
	const std::vector<SampleTap> yTaps = makeTaps(source.getHeight(), height);
	const std::size_t bpp = source.getBytesPerPixel();

	Frame target(width, height, source.getFormat());

	pool.run(height, [&](std::size_t begin, std::size_t end) {
		for (std::size_t y = begin; y < end; ++y) {
			const SampleTap &ty = yTaps[y];
			const std::uint8_t *row0 = source.getRow(ty.i0);
			const std::uint8_t *row1 = source.getRow(ty.i1);
			std::uint8_t *out = target.getRow(static_cast<std::uint32_t>(y));

			for (std::uint32_t x = 0; x < width; ++x) {
				const SampleTap &tx = xTaps[x];
				const std::uint8_t *p00 = row0 + tx.i0 * bpp;
				const std::uint8_t *p01 = row0 + tx.i1 * bpp;
				const std::uint8_t *p10 = row1 + tx.i0 * bpp;
				const std::uint8_t *p11 = row1 + tx.i1 * bpp;
				for (std::size_t c = 0; c < bpp; ++c) {
					const float top = p00[c] + (p01[c] - p00[c]) * tx.t;
					const float bottom = p10[c] + (p11[c] - p10[c]) * tx.t;
					out[x * bpp + c] = toByte(top + (bottom - top) * ty.t);
				}
			}
		}
	});

	return target;
}

} // namespace ChromaKey::Keying

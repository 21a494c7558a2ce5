/*
 * ChromaKey Keying Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "ChromaKey/Keying/AlphaCompositor.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>

#include "ChromaKey/Keying/FrameScaler.hpp"

namespace ChromaKey::Keying {

namespace {

inline std::uint8_t lerp(std::uint8_t foreground, std::uint8_t background, float w) noexcept
{
	return toByte(static_cast<float>(foreground) * (1.0f - w) + static_cast<float>(background) * w);
}

inline Color blend(Color foreground, Color background, float w) noexcept
{
	if (w <= 0.0f) {
		return foreground;
	}
	if (w >= 1.0f) {
		return background;
	}
	return {lerp(foreground.r, background.r, w), lerp(foreground.g, background.g, w),
		lerp(foreground.b, background.b, w)};
}

void checkMask(const Frame &foreground, const AlphaMask &mask)
{
	if (!mask.matches(foreground)) {
		throw std::invalid_argument("alpha mask does not match the foreground frame");
	}
}

/**
 * Returns the background at foreground size: either the given frame or a
 * rescaled copy held in `storage`.
 */
const Frame &fitBackground(const Frame &foreground, const Frame &background, std::optional<Frame> &storage,
			   TaskQueue::RowBandWorkerPool &pool)
{
	if (background.hasSameSize(foreground)) {
		return background;
	}
	storage.emplace(resizeBilinear(background, foreground.getWidth(), foreground.getHeight(), pool));
	return *storage;
}

} // anonymous namespace

Frame OpaqueCompositor::composite(const Frame &foreground, const AlphaMask &mask, const Frame *background,
				  TaskQueue::RowBandWorkerPool &pool) const
{
	checkMask(foreground, mask);

	std::optional<Frame> scaled;
	const Frame *fitted = background ? &fitBackground(foreground, *background, scaled, pool) : nullptr;

	Frame output(foreground.getWidth(), foreground.getHeight(), PixelFormat::Rgb24);

	pool.run(foreground.getHeight(), [&](std::size_t begin, std::size_t end) {
		for (std::size_t y = begin; y < end; ++y) {
			const auto row = static_cast<std::uint32_t>(y);
			const float *weights = mask.getRow(row);
			for (std::uint32_t x = 0; x < foreground.getWidth(); ++x) {
				const Color back = fitted ? fitted->getPixel(x, row) : solidColor_;
				output.setPixel(x, row, blend(foreground.getPixel(x, row), back, weights[x]));
			}
		}
	});

	return output;
}

Frame AlphaCompositor::composite(const Frame &foreground, const AlphaMask &mask, const Frame *background,
				 TaskQueue::RowBandWorkerPool &pool) const
{
	checkMask(foreground, mask);

	std::optional<Frame> scaled;
	const Frame *fitted = background ? &fitBackground(foreground, *background, scaled, pool) : nullptr;

	Frame output(foreground.getWidth(), foreground.getHeight(), PixelFormat::Rgba32);

	pool.run(foreground.getHeight(), [&](std::size_t begin, std::size_t end) {
		for (std::size_t y = begin; y < end; ++y) {
			const auto row = static_cast<std::uint32_t>(y);
			const float *weights = mask.getRow(row);
			for (std::uint32_t x = 0; x < foreground.getWidth(); ++x) {
				const float w = std::clamp(weights[x], 0.0f, 1.0f);
				if (fitted) {
					output.setPixel(x, row, blend(foreground.getPixel(x, row), fitted->getPixel(x, row), w),
							255);
				} else {
					output.setPixel(x, row, foreground.getPixel(x, row), toByte((1.0f - w) * 255.0f));
				}
			}
		}
	});

	return output;
}

std::unique_ptr<ICompositor> makeCompositor(SinkCapability capability, Color solidColor)
{
	switch (capability) {
	case SinkCapability::AlphaCapable:
		return std::make_unique<AlphaCompositor>();
	case SinkCapability::Opaque:
		return std::make_unique<OpaqueCompositor>(solidColor);
	default:
		throw std::invalid_argument("unknown sink capability");
	}
}

} // namespace ChromaKey::Keying

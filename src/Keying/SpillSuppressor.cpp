/*
 * ChromaKey Keying Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "ChromaKey/Keying/SpillSuppressor.hpp"

#include <array>
#include <stdexcept>

namespace ChromaKey::Keying {

namespace {

int findPrimaryChannel(Color key) noexcept
{
	const std::array<int, 3> channels{key.r, key.g, key.b};
	int primary = 0;
	for (int i = 1; i < 3; ++i) {
		if (channels[i] > channels[primary]) {
			primary = i;
		}
	}
	return primary;
}

bool hasSingleDominantChannel(Color key, int primary) noexcept
{
	const std::array<int, 3> channels{key.r, key.g, key.b};
	return channels[primary] > channels[(primary + 1) % 3] && channels[primary] > channels[(primary + 2) % 3];
}

} // anonymous namespace

SpillSuppressor::SpillSuppressor(const KeySettings &settings) noexcept
	: primaryChannel_(findPrimaryChannel(settings.keyColor)),
	  strength_(settings.blendStrength),
	  enabled_(settings.blendStrength > 0.0f && hasSingleDominantChannel(settings.keyColor, primaryChannel_))
{
}

Color SpillSuppressor::suppress(Color color, float weight) const noexcept
{
	if (!enabled_ || weight <= 0.0f || weight >= 1.0f) {
		return color;
	}

	std::array<float, 3> channels{static_cast<float>(color.r), static_cast<float>(color.g),
				      static_cast<float>(color.b)};
	const float average = 0.5f * (channels[(primaryChannel_ + 1) % 3] + channels[(primaryChannel_ + 2) % 3]);
	const float excess = channels[primaryChannel_] - average;
	if (excess <= 0.0f) {
		return color;
	}

	channels[primaryChannel_] -= strength_ * excess;
	return {toByte(channels[0]), toByte(channels[1]), toByte(channels[2])};
}

void SpillSuppressor::suppressFrame(Frame &frame, const AlphaMask &rawMask, TaskQueue::RowBandWorkerPool &pool) const
{
	if (!rawMask.matches(frame)) {
		throw std::invalid_argument("spill suppression mask does not match the frame");
	}
	if (!enabled_) {
		return;
	}

	pool.run(frame.getHeight(), [&](std::size_t begin, std::size_t end) {
		for (std::size_t y = begin; y < end; ++y) {
			const auto row = static_cast<std::uint32_t>(y);
			const float *weights = rawMask.getRow(row);
			for (std::uint32_t x = 0; x < frame.getWidth(); ++x) {
				const float weight = weights[x];
				if (weight > 0.0f && weight < 1.0f) {
					frame.setPixel(x, row, suppress(frame.getPixel(x, row), weight),
						       frame.getAlpha(x, row));
				}
			}
		}
	});
}

} // namespace ChromaKey::Keying

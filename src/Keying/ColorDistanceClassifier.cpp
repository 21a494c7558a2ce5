/*
 * ChromaKey Keying Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "ChromaKey/Keying/ColorDistanceClassifier.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace ChromaKey::Keying {

ColorDistanceClassifier::ColorDistanceClassifier(const KeySettings &settings) noexcept
	: keyChroma_(toChroma(settings.keyColor)),
	  similarity_(settings.getEffectiveSimilarity()),
	  falloff_(std::max(settings.blendStrength, kMinFalloff))
{
}

float ColorDistanceClassifier::chromaDistance(Color color) const noexcept
{
	const Chroma chroma = toChroma(color);
	const float dcb = chroma.cb - keyChroma_.cb;
	const float dcr = chroma.cr - keyChroma_.cr;
	return std::sqrt(dcb * dcb + dcr * dcr) / std::numbers::sqrt2_v<float>;
}

float ColorDistanceClassifier::classify(Color color) const noexcept
{
	const float distance = chromaDistance(color);
	if (distance <= similarity_) {
		return 1.0f;
	}
	if (distance >= similarity_ + falloff_) {
		return 0.0f;
	}

	const float t = (distance - similarity_) / falloff_;
	return 1.0f - t * t * (3.0f - 2.0f * t);
}

AlphaMask ColorDistanceClassifier::classifyFrame(const Frame &frame, TaskQueue::RowBandWorkerPool &pool) const
{
	AlphaMask mask(frame.getWidth(), frame.getHeight());

	pool.run(frame.getHeight(), [&](std::size_t begin, std::size_t end) {
		for (std::size_t y = begin; y < end; ++y) {
			const auto row = static_cast<std::uint32_t>(y);
			float *weights = mask.getRow(row);
			for (std::uint32_t x = 0; x < frame.getWidth(); ++x) {
				weights[x] = classify(frame.getPixel(x, row));
			}
		}
	});

	return mask;
}

} // namespace ChromaKey::Keying

/*
 * ChromaKey Keying Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <ChromaKey/TaskQueue/RowBandWorkerPool.hpp>

#include "Color.hpp"
#include "Frame.hpp"
#include "KeySettings.hpp"

namespace ChromaKey::Keying {

/**
 * @brief Maps a pixel to its keying weight from its chroma distance to the key color.
 *
 * The weight is 1 up to `similarity`, falls along a smoothstep across the
 * falloff band (width max(blendStrength, kMinFalloff)) and is 0 beyond it.
 * Luma is ignored, so black, gray and white sit at the same distance.
 */
class ColorDistanceClassifier {
public:
	constexpr static float kMinFalloff = 0.01f;

	explicit ColorDistanceClassifier(const KeySettings &settings) noexcept;

	float getSimilarity() const noexcept { return similarity_; }
	float getFalloff() const noexcept { return falloff_; }

	/**
	 * @brief Euclidean CbCr distance divided by sqrt(2), as ffmpeg's chromakey filter measures it.
	 *
	 * 0 for the key color itself and at most 1 for any pair of colors.
	 */
	float chromaDistance(Color color) const noexcept;

	float classify(Color color) const noexcept;

	/**
	 * @brief Computes the raw (unrefined) mask of a whole frame.
	 */
	AlphaMask classifyFrame(const Frame &frame, TaskQueue::RowBandWorkerPool &pool) const;

private:
	const Chroma keyChroma_;
	const float similarity_;
	const float falloff_;
};

} // namespace ChromaKey::Keying

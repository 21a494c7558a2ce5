/*
 * ChromaKey Keying Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include "Color.hpp"

namespace ChromaKey::Keying {

struct KeySettings {
	/// Below this, keying degenerates to exact-match and is clamped up.
	constexpr static float kMinSimilarity = 0.001f;

	Color keyColor = kDefaultKeyColor;

	/// Chroma distance up to which a pixel is fully keyed, in (0, 1].
	float similarity = 0.1f;

	/// Spill suppression strength and width of the keying falloff band, in [0, 1].
	float blendStrength = 0.1f;

	/// Mask blur radius in pixels.
	int edgeBlurRadius = 0;

	/**
	 * @throws ConfigurationError if any parameter is out of range.
	 */
	void validate() const;

	float getEffectiveSimilarity() const noexcept { return similarity < kMinSimilarity ? kMinSimilarity : similarity; }
};

} // namespace ChromaKey::Keying

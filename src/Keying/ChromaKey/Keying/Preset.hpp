/*
 * ChromaKey Keying Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <algorithm>
#include <cmath>

#include "Color.hpp"
#include "KeySettings.hpp"

namespace ChromaKey::Keying {

/**
 * @brief Single-slider controls on a 0 to 100 scale.
 *
 * `strength` maps linearly onto similarity 0.01 to 0.40 and `edgeBlur` onto a
 * blur radius of edgeBlur / 10 pixels.
 */
struct Preset {
	constexpr static double kMinPresetSimilarity = 0.01;
	constexpr static double kMaxPresetSimilarity = 0.40;
	constexpr static float kDefaultBlendStrength = 0.1f;

	double strength = 50.0;
	double edgeBlur = 0.0;

	static float strengthToSimilarity(double strength) noexcept
	{
		const double clamped = std::clamp(strength, 0.0, 100.0);
		return static_cast<float>(kMinPresetSimilarity +
					  clamped / 100.0 * (kMaxPresetSimilarity - kMinPresetSimilarity));
	}

	static int edgeBlurToRadius(double edgeBlur) noexcept
	{
		return static_cast<int>(std::lround(std::clamp(edgeBlur, 0.0, 100.0) / 10.0));
	}

	KeySettings toKeySettings(Color keyColor = kDefaultKeyColor) const noexcept
	{
		KeySettings settings;
		settings.keyColor = keyColor;
		settings.similarity = strengthToSimilarity(strength);
		settings.blendStrength = kDefaultBlendStrength;
		settings.edgeBlurRadius = edgeBlurToRadius(edgeBlur);
		return settings;
	}
};

} // namespace ChromaKey::Keying

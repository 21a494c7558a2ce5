/*
 * ChromaKey Keying Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "ChromaKey/Keying/KeySettings.hpp"

#include <cmath>

#include <fmt/format.h>

#include "ChromaKey/Keying/ConfigurationError.hpp"

namespace ChromaKey::Keying {

void KeySettings::validate() const
{
	if (!std::isfinite(similarity) || similarity <= 0.0f || similarity > 1.0f) {
		throw ConfigurationError(fmt::format("similarity must be in (0, 1], got {}", similarity));
	}
	if (!std::isfinite(blendStrength) || blendStrength < 0.0f || blendStrength > 1.0f) {
		throw ConfigurationError(fmt::format("blendStrength must be in [0, 1], got {}", blendStrength));
	}
	if (edgeBlurRadius < 0) {
		throw ConfigurationError(fmt::format("edgeBlurRadius must be non-negative, got {}", edgeBlurRadius));
	}
}

} // namespace ChromaKey::Keying

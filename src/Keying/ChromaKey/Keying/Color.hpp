/*
 * ChromaKey Keying Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ChromaKey::Keying {

struct Color {
	std::uint8_t r = 0;
	std::uint8_t g = 0;
	std::uint8_t b = 0;

	bool operator==(const Color &) const = default;

	/**
	 * @brief Parses `#RRGGBB` or `RRGGBB` (case-insensitive).
	 */
	static std::optional<Color> parseHex(std::string_view hex) noexcept;

	/**
	 * @throws ConfigurationError if `hex` is not a valid color.
	 */
	static Color fromHex(std::string_view hex);

	std::string toHex() const;
};

constexpr Color kDefaultKeyColor{0, 255, 0};
constexpr Color kBlack{0, 0, 0};

/**
 * @brief Chroma of a color in full-range BT.601 YCbCr, both components in [-0.5, 0.5].
 */
struct Chroma {
	float cb;
	float cr;
};

inline Chroma toChroma(Color color) noexcept
{
	const float r = static_cast<float>(color.r) / 255.0f;
	const float g = static_cast<float>(color.g) / 255.0f;
	const float b = static_cast<float>(color.b) / 255.0f;
	return {-0.168736f * r - 0.331264f * g + 0.5f * b, 0.5f * r - 0.418688f * g - 0.081312f * b};
}

inline std::uint8_t toByte(float value) noexcept
{
	if (value <= 0.0f) {
		return 0;
	}
	if (value >= 255.0f) {
		return 255;
	}
	return static_cast<std::uint8_t>(value + 0.5f);
}

} // namespace ChromaKey::Keying

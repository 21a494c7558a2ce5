/*
 * ChromaKey Keying Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "ChromaKey/Keying/Color.hpp"

#include <fmt/format.h>

#include "ChromaKey/Keying/ConfigurationError.hpp"

namespace ChromaKey::Keying {

namespace {

int hexDigit(char c) noexcept
{
	if (c >= '0' && c <= '9') {
		return c - '0';
	}
	if (c >= 'a' && c <= 'f') {
		return c - 'a' + 10;
	}
	if (c >= 'A' && c <= 'F') {
		return c - 'A' + 10;
	}
	return -1;
}

} // anonymous namespace

std::optional<Color> Color::parseHex(std::string_view hex) noexcept
{
	if (!hex.empty() && hex.front() == '#') {
		hex.remove_prefix(1);
	}
	if (hex.size() != 6) {
		return std::nullopt;
	}

	std::uint8_t channels[3];
	for (std::size_t i = 0; i < 3; ++i) {
		const int hi = hexDigit(hex[i * 2]);
		const int lo = hexDigit(hex[i * 2 + 1]);
		if (hi < 0 || lo < 0) {
			return std::nullopt;
		}
		channels[i] = static_cast<std::uint8_t>(hi * 16 + lo);
	}

	return Color{channels[0], channels[1], channels[2]};
}

Color Color::fromHex(std::string_view hex)
{
	if (auto color = parseHex(hex)) {
		return *color;
	}
	throw ConfigurationError(fmt::format("invalid color '{}', expected #RRGGBB", hex));
}

std::string Color::toHex() const
{
	return fmt::format("#{:02x}{:02x}{:02x}", r, g, b);
}

} // namespace ChromaKey::Keying

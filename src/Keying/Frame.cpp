/*
 * ChromaKey Keying Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "ChromaKey/Keying/Frame.hpp"

#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>

namespace ChromaKey::Keying {

Frame::Frame(std::uint32_t width, std::uint32_t height, PixelFormat format)
	: width_(width),
	  height_(height),
	  format_(format),
	  data_(static_cast<std::size_t>(width) * height * Keying::getBytesPerPixel(format), 0)
{
}

Frame Frame::fromBytes(std::uint32_t width, std::uint32_t height, PixelFormat format,
		       std::span<const std::uint8_t> bytes)
{
	Frame frame(width, height, format);
	if (bytes.size() != frame.data_.size()) {
		throw std::invalid_argument(fmt::format("frame of {}x{} needs {} bytes, got {}", width, height,
							frame.data_.size(), bytes.size()));
	}
	std::copy(bytes.begin(), bytes.end(), frame.data_.begin());
	return frame;
}

Frame Frame::filled(std::uint32_t width, std::uint32_t height, PixelFormat format, Color color, std::uint8_t alpha)
{
	Frame frame(width, height, format);
	for (std::uint32_t y = 0; y < height; ++y) {
		for (std::uint32_t x = 0; x < width; ++x) {
			frame.setPixel(x, y, color, alpha);
		}
	}
	return frame;
}

Frame Frame::clone() const
{
	Frame frame(width_, height_, format_);
	std::copy(data_.begin(), data_.end(), frame.data_.begin());
	return frame;
}

AlphaMask::AlphaMask(std::uint32_t width, std::uint32_t height, float fill)
	: width_(width),
	  height_(height),
	  weights_(static_cast<std::size_t>(width) * height, fill)
{
}

AlphaMask AlphaMask::clone() const
{
	AlphaMask mask(width_, height_);
	std::copy(weights_.begin(), weights_.end(), mask.weights_.begin());
	return mask;
}

} // namespace ChromaKey::Keying

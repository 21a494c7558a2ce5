/*
 * ChromaKey Keying Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include <ChromaKey/Memory/AlignedAllocator.hpp>

#include "Color.hpp"

namespace ChromaKey::Keying {

enum class PixelFormat {
	Rgb24,
	Rgba32,
};

constexpr std::size_t getBytesPerPixel(PixelFormat format) noexcept
{
	return format == PixelFormat::Rgba32 ? 4 : 3;
}

/**
 * @brief Tightly packed interleaved pixel buffer.
 *
 * Frames are move-only so that exactly one pipeline stage owns a frame at a
 * time; use clone() where a copy is really wanted.
 */
class Frame {
public:
	Frame() noexcept = default;

	/**
	 * @brief Creates a zero-filled frame.
	 */
	Frame(std::uint32_t width, std::uint32_t height, PixelFormat format);

	/**
	 * @throws std::invalid_argument if `bytes` does not hold exactly one frame.
	 */
	static Frame fromBytes(std::uint32_t width, std::uint32_t height, PixelFormat format,
			       std::span<const std::uint8_t> bytes);

	static Frame filled(std::uint32_t width, std::uint32_t height, PixelFormat format, Color color,
			    std::uint8_t alpha = 255);

	~Frame() noexcept = default;

	Frame(Frame &&) noexcept = default;
	Frame &operator=(Frame &&) noexcept = default;
	Frame(const Frame &) = delete;
	Frame &operator=(const Frame &) = delete;

	Frame clone() const;

	std::uint32_t getWidth() const noexcept { return width_; }
	std::uint32_t getHeight() const noexcept { return height_; }
	PixelFormat getFormat() const noexcept { return format_; }
	std::size_t getBytesPerPixel() const noexcept { return Keying::getBytesPerPixel(format_); }
	std::size_t getStride() const noexcept { return static_cast<std::size_t>(width_) * getBytesPerPixel(); }
	std::size_t getPixelCount() const noexcept
	{
		return static_cast<std::size_t>(width_) * static_cast<std::size_t>(height_);
	}
	bool isEmpty() const noexcept { return width_ == 0 || height_ == 0; }

	std::span<std::uint8_t> getData() noexcept { return {data_.data(), data_.size()}; }
	std::span<const std::uint8_t> getData() const noexcept { return {data_.data(), data_.size()}; }

	std::uint8_t *getRow(std::uint32_t y) noexcept { return data_.data() + y * getStride(); }
	const std::uint8_t *getRow(std::uint32_t y) const noexcept { return data_.data() + y * getStride(); }

	Color getPixel(std::uint32_t x, std::uint32_t y) const noexcept
	{
		const std::uint8_t *p = getRow(y) + x * getBytesPerPixel();
		return {p[0], p[1], p[2]};
	}

	std::uint8_t getAlpha(std::uint32_t x, std::uint32_t y) const noexcept
	{
		return format_ == PixelFormat::Rgba32 ? getRow(y)[x * 4 + 3] : 255;
	}

	void setPixel(std::uint32_t x, std::uint32_t y, Color color, std::uint8_t alpha = 255) noexcept
	{
		std::uint8_t *p = getRow(y) + x * getBytesPerPixel();
		p[0] = color.r;
		p[1] = color.g;
		p[2] = color.b;
		if (format_ == PixelFormat::Rgba32) {
			p[3] = alpha;
		}
	}

	bool hasSameSize(const Frame &other) const noexcept
	{
		return width_ == other.width_ && height_ == other.height_;
	}

private:
	std::uint32_t width_ = 0;
	std::uint32_t height_ = 0;
	PixelFormat format_ = PixelFormat::Rgb24;
	Memory::AlignedVector<std::uint8_t> data_;
};

/**
 * @brief Per-pixel keying weight in [0, 1]; 1 means "replace with background".
 *
 * A mask always has the dimensions of the frame it was computed from.
 */
class AlphaMask {
public:
	AlphaMask() noexcept = default;
	AlphaMask(std::uint32_t width, std::uint32_t height, float fill = 0.0f);

	~AlphaMask() noexcept = default;

	AlphaMask(AlphaMask &&) noexcept = default;
	AlphaMask &operator=(AlphaMask &&) noexcept = default;
	AlphaMask(const AlphaMask &) = delete;
	AlphaMask &operator=(const AlphaMask &) = delete;

	AlphaMask clone() const;

	std::uint32_t getWidth() const noexcept { return width_; }
	std::uint32_t getHeight() const noexcept { return height_; }
	std::size_t getPixelCount() const noexcept
	{
		return static_cast<std::size_t>(width_) * static_cast<std::size_t>(height_);
	}

	std::span<float> getData() noexcept { return {weights_.data(), weights_.size()}; }
	std::span<const float> getData() const noexcept { return {weights_.data(), weights_.size()}; }

	float *getRow(std::uint32_t y) noexcept { return weights_.data() + static_cast<std::size_t>(y) * width_; }
	const float *getRow(std::uint32_t y) const noexcept
	{
		return weights_.data() + static_cast<std::size_t>(y) * width_;
	}

	float at(std::uint32_t x, std::uint32_t y) const noexcept { return getRow(y)[x]; }

	bool matches(const Frame &frame) const noexcept
	{
		return width_ == frame.getWidth() && height_ == frame.getHeight();
	}

private:
	std::uint32_t width_ = 0;
	std::uint32_t height_ = 0;
	Memory::AlignedVector<float> weights_;
};

} // namespace ChromaKey::Keying

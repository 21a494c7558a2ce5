/*
 * ChromaKey Keying Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <memory>

#include <ChromaKey/TaskQueue/RowBandWorkerPool.hpp>

#include "Color.hpp"
#include "Frame.hpp"

namespace ChromaKey::Keying {

enum class SinkCapability {
	Opaque,
	AlphaCapable,
};

/**
 * @brief Blends a foreground over a background through the refined mask.
 *
 * `output = foreground * (1 - w) + background * w` per channel. The output
 * always has the foreground's dimensions; a background of any other size is
 * rescaled before blending.
 */
class ICompositor {
protected:
	ICompositor() = default;

public:
	virtual ~ICompositor() = default;

	virtual SinkCapability getSinkCapability() const noexcept = 0;
	virtual PixelFormat getOutputFormat() const noexcept = 0;

	/**
	 * @param background The replacement frame, or nullptr for the solid/transparent fallback.
	 * @throws std::invalid_argument if the mask does not match the foreground.
	 */
	virtual Frame composite(const Frame &foreground, const AlphaMask &mask, const Frame *background,
				TaskQueue::RowBandWorkerPool &pool) const = 0;

	ICompositor(const ICompositor &) = delete;
	ICompositor &operator=(const ICompositor &) = delete;
	ICompositor(ICompositor &&) = delete;
	ICompositor &operator=(ICompositor &&) = delete;
};

/**
 * @brief RGB output. Keyed pixels without a background become the solid color.
 */
class OpaqueCompositor final : public ICompositor {
public:
	explicit OpaqueCompositor(Color solidColor) noexcept : solidColor_(solidColor) {}

	SinkCapability getSinkCapability() const noexcept override { return SinkCapability::Opaque; }
	PixelFormat getOutputFormat() const noexcept override { return PixelFormat::Rgb24; }

	Frame composite(const Frame &foreground, const AlphaMask &mask, const Frame *background,
			TaskQueue::RowBandWorkerPool &pool) const override;

private:
	const Color solidColor_;
};

/**
 * @brief RGBA output. Without a background the weight becomes transparency;
 * with one the result is blended and fully opaque.
 */
class AlphaCompositor final : public ICompositor {
public:
	AlphaCompositor() noexcept = default;

	SinkCapability getSinkCapability() const noexcept override { return SinkCapability::AlphaCapable; }
	PixelFormat getOutputFormat() const noexcept override { return PixelFormat::Rgba32; }

	Frame composite(const Frame &foreground, const AlphaMask &mask, const Frame *background,
			TaskQueue::RowBandWorkerPool &pool) const override;
};

std::unique_ptr<ICompositor> makeCompositor(SinkCapability capability, Color solidColor = kBlack);

} // namespace ChromaKey::Keying

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
#include <memory>
#include <optional>
#include <vector>

#include <ChromaKey/Logger/ILogger.hpp>
#include <ChromaKey/TaskQueue/RowBandWorkerPool.hpp>

#include "Color.hpp"
#include "Frame.hpp"

namespace ChromaKey::Keying {

struct DetectorProperty {
	/// Frames wider than this are downscaled before sampling. 0 disables downscaling.
	std::uint32_t thumbnailWidth = 320;

	/// Corner patches are max(minPatchSize, dimension / patchDivisor) pixels per axis.
	std::uint32_t minPatchSize = 6;
	std::uint32_t patchDivisor = 24;

	/// A sample is conclusive when its strongest channel leads the others by at least this much.
	float minDominance = 32.0f;

	Color fallbackColor = kDefaultKeyColor;
};

struct PatchRect {
	std::uint32_t x;
	std::uint32_t y;
	std::uint32_t width;
	std::uint32_t height;
};

/**
 * @brief Estimates the key color from the four corner patches of a frame.
 *
 * Each patch is averaged and scored by how far its strongest channel leads the
 * other two, so blue and red screens are detected as well as green ones. The
 * highest scoring patch wins.
 */
class KeyColorDetector {
public:
	explicit KeyColorDetector(std::shared_ptr<const Logger::ILogger> logger, DetectorProperty property = {});

	const DetectorProperty &getProperty() const noexcept { return property_; }

	/**
	 * @return The detected color, or std::nullopt when the frame is empty or no
	 * patch is conclusively dominant.
	 */
	std::optional<Color> tryDetect(const Frame &frame, TaskQueue::RowBandWorkerPool &pool) const;

	/**
	 * @brief Like tryDetect, but falls back to `fallbackColor` instead of failing.
	 */
	Color detect(const Frame &frame, TaskQueue::RowBandWorkerPool &pool) const noexcept;

	std::vector<PatchRect> getCornerPatches(std::uint32_t width, std::uint32_t height) const;

	static Color averagePatch(const Frame &frame, const PatchRect &patch) noexcept;

	/// Lead of the strongest channel over the stronger of the other two, in channel units.
	static float dominance(Color color) noexcept;

private:
	std::optional<Color> detectOnFrame(const Frame &frame) const;

	const std::shared_ptr<const Logger::ILogger> logger_;
	const DetectorProperty property_;
};

} // namespace ChromaKey::Keying

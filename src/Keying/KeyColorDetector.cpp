/*
 * ChromaKey Keying Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "ChromaKey/Keying/KeyColorDetector.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#include "ChromaKey/Keying/FrameScaler.hpp"

namespace ChromaKey::Keying {

KeyColorDetector::KeyColorDetector(std::shared_ptr<const Logger::ILogger> logger, DetectorProperty property)
	: logger_(logger ? std::move(logger) : throw std::invalid_argument("logger must not be null")),
	  property_(property.patchDivisor > 0 ? property
					      : throw std::invalid_argument("patchDivisor must be greater than 0"))
{
}

std::optional<Color> KeyColorDetector::tryDetect(const Frame &frame, TaskQueue::RowBandWorkerPool &pool) const
{
	if (frame.isEmpty()) {
		return std::nullopt;
	}

	if (property_.thumbnailWidth == 0 || frame.getWidth() <= property_.thumbnailWidth) {
		return detectOnFrame(frame);
	}

	const std::uint64_t scaledHeight = static_cast<std::uint64_t>(frame.getHeight()) * property_.thumbnailWidth /
					   frame.getWidth();
	const auto thumbnailHeight = static_cast<std::uint32_t>(std::max<std::uint64_t>(1, scaledHeight));
	const Frame thumbnail = resizeBilinear(frame, property_.thumbnailWidth, thumbnailHeight, pool);
	return detectOnFrame(thumbnail);
}

Color KeyColorDetector::detect(const Frame &frame, TaskQueue::RowBandWorkerPool &pool) const noexcept
{
	try {
		if (const std::optional<Color> color = tryDetect(frame, pool)) {
			logger_->info("KeyColorDetected", {{"color", color->toHex()}});
			return *color;
		}
		logger_->warn("KeyColorDetectionInconclusive", {{"fallback", property_.fallbackColor.toHex()}});
	} catch (const std::exception &e) {
		logger_->logException(e, "KeyColorDetector::detect");
	}
	return property_.fallbackColor;
}

std::vector<PatchRect> KeyColorDetector::getCornerPatches(std::uint32_t width, std::uint32_t height) const
{
	if (width == 0 || height == 0) {
		return {};
	}

	const std::uint32_t patchWidth =
		std::min(width, std::max(property_.minPatchSize, width / property_.patchDivisor));
	const std::uint32_t patchHeight =
		std::min(height, std::max(property_.minPatchSize, height / property_.patchDivisor));
	if (patchWidth == 0 || patchHeight == 0) {
		return {};
	}

	const std::uint32_t right = width - patchWidth;
	const std::uint32_t bottom = height - patchHeight;
	return {
		{0, 0, patchWidth, patchHeight},
		{right, 0, patchWidth, patchHeight},
		{0, bottom, patchWidth, patchHeight},
		{right, bottom, patchWidth, patchHeight},
	};
}

Color KeyColorDetector::averagePatch(const Frame &frame, const PatchRect &patch) noexcept
{
	std::uint64_t sumR = 0, sumG = 0, sumB = 0;
	for (std::uint32_t y = patch.y; y < patch.y + patch.height; ++y) {
		for (std::uint32_t x = patch.x; x < patch.x + patch.width; ++x) {
			const Color c = frame.getPixel(x, y);
			sumR += c.r;
			sumG += c.g;
			sumB += c.b;
		}
	}

	const std::uint64_t count = static_cast<std::uint64_t>(patch.width) * patch.height;
	if (count == 0) {
		return kBlack;
	}
	const auto mean = [count](std::uint64_t sum) { return static_cast<std::uint8_t>((sum + count / 2) / count); };
	return {mean(sumR), mean(sumG), mean(sumB)};
}

float KeyColorDetector::dominance(Color color) noexcept
{
	const int r = color.r, g = color.g, b = color.b;
	if (g >= r && g >= b) {
		return static_cast<float>(g - std::max(r, b));
	}
	if (b >= r) {
		return static_cast<float>(b - std::max(r, g));
	}
	return static_cast<float>(r - std::max(g, b));
}

std::optional<Color> KeyColorDetector::detectOnFrame(const Frame &frame) const
{
	std::optional<Color> best;
	float bestScore = 0.0f;

	for (const PatchRect &patch : getCornerPatches(frame.getWidth(), frame.getHeight())) {
		const Color sample = averagePatch(frame, patch);
		const float score = dominance(sample);
		logger_->debug("KeyColorSample", {{"x", std::to_string(patch.x)},
						  {"y", std::to_string(patch.y)},
						  {"color", sample.toHex()},
						  {"dominance", std::to_string(score)}});
		if (score >= property_.minDominance && (!best || score > bestScore)) {
			best = sample;
			bestScore = score;
		}
	}

	return best;
}

} // namespace ChromaKey::Keying

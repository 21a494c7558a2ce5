/*
 * ChromaKey Pipeline Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include <ChromaKey/Keying/Frame.hpp>
#include <ChromaKey/TaskQueue/RowBandWorkerPool.hpp>

#include "BackgroundSource.hpp"

namespace ChromaKey::Pipeline {

/**
 * @brief Hands out the background frame for each output frame, in lock-step.
 *
 * Every background frame is brought to the output size once, when it is first
 * read, and only the current one is kept. A looping stream is rewound when its
 * source is restartable. Otherwise the frames it has read are cached for
 * replay, unless the stream is known to be at least as long as the output.
 */
class BackgroundSequencer {
public:
	/**
	 * @param outputFrames The number of output frames if known in advance.
	 */
	BackgroundSequencer(BackgroundSource &source, std::uint32_t width, std::uint32_t height,
			    TaskQueue::RowBandWorkerPool &pool, std::optional<std::size_t> outputFrames = std::nullopt);

	BackgroundSequencer(const BackgroundSequencer &) = delete;
	BackgroundSequencer &operator=(const BackgroundSequencer &) = delete;
	BackgroundSequencer(BackgroundSequencer &&) = delete;
	BackgroundSequencer &operator=(BackgroundSequencer &&) = delete;

	/**
	 * @brief Returns the background of output frame `frameIndex`, or nullptr when there is none.
	 *
	 * Must be called once per output frame with increasing indices.
	 *
	 * @throws FrameProcessingError if a video stream yields no frames at all.
	 */
	const Keying::Frame *advance(std::size_t frameIndex);

	/// Number of background frames held for replay.
	std::size_t getCachedFrameCount() const noexcept { return replayCache_.size(); }

private:
	Keying::Frame fit(const Keying::Frame &frame) const;

	/**
	 * @return The fitted next frame of the stream, or nullptr at its end.
	 */
	const Keying::Frame *readNext(std::size_t frameIndex);

	BackgroundSource &source_;
	const std::uint32_t width_;
	const std::uint32_t height_;
	TaskQueue::RowBandWorkerPool &pool_;

	std::optional<Keying::Frame> staticFrame_;
	std::optional<Keying::Frame> current_;
	bool cacheForReplay_ = false;
	std::vector<Keying::Frame> replayCache_;
	std::size_t framesRead_ = 0;
	bool exhausted_ = false;
	std::size_t replayIndex_ = 0;
};

} // namespace ChromaKey::Pipeline

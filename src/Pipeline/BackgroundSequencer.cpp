/*
 * ChromaKey Pipeline Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "ChromaKey/Pipeline/BackgroundSequencer.hpp"

#include <utility>

#include <ChromaKey/Keying/FrameScaler.hpp>

#include "ChromaKey/Pipeline/FrameProcessingError.hpp"

namespace ChromaKey::Pipeline {

BackgroundSequencer::BackgroundSequencer(BackgroundSource &source, std::uint32_t width, std::uint32_t height,
					 TaskQueue::RowBandWorkerPool &pool, std::optional<std::size_t> outputFrames)
	: source_(source),
	  width_(width),
	  height_(height),
	  pool_(pool)
{
	source_.validate();
	if (source_.getKind() == BackgroundKind::StaticImage) {
		staticFrame_.emplace(fit(source_.getImage()));
	} else if (source_.getKind() == BackgroundKind::VideoStream &&
		   source_.getEndPolicy() == StreamEndPolicy::Loop) {
		const IFrameSource &stream = *source_.getStream();
		const std::optional<std::size_t> streamFrames = stream.getTotalFrames();
		const bool coversOutput = streamFrames && outputFrames && *streamFrames >= *outputFrames;
		cacheForReplay_ = !stream.isRestartable() && !coversOutput;
	}
}

const Keying::Frame *BackgroundSequencer::advance(std::size_t frameIndex)
{
	switch (source_.getKind()) {
	case BackgroundKind::None:
		return nullptr;
	case BackgroundKind::StaticImage:
		return &*staticFrame_;
	case BackgroundKind::VideoStream:
		break;
	default:
		throw FrameProcessingError(frameIndex, "unknown background kind");
	}

	if (!exhausted_) {
		if (const Keying::Frame *frame = readNext(frameIndex)) {
			return frame;
		}
		if (framesRead_ == 0) {
			throw FrameProcessingError(frameIndex, "background video stream has no frames");
		}

		IFrameSource &stream = *source_.getStream();
		if (source_.getEndPolicy() == StreamEndPolicy::Loop && stream.isRestartable()) {
			stream.restart();
			if (const Keying::Frame *frame = readNext(frameIndex)) {
				return frame;
			}
			throw FrameProcessingError(frameIndex, "background video stream is empty after restart");
		}
		exhausted_ = true;
	}

	// A stream that ended earlier than announced has no replay cache and holds its last frame.
	if (source_.getEndPolicy() == StreamEndPolicy::HoldLast || replayCache_.empty()) {
		return &*current_;
	}

	const Keying::Frame *frame = &replayCache_[replayIndex_];
	replayIndex_ = (replayIndex_ + 1) % replayCache_.size();
	return frame;
}

const Keying::Frame *BackgroundSequencer::readNext(std::size_t frameIndex)
{
	std::optional<Keying::Frame> frame = source_.getStream()->next();
	if (!frame) {
		return nullptr;
	}
	if (frame->isEmpty()) {
		throw FrameProcessingError(frameIndex, "background frame is empty");
	}
	++framesRead_;

	if (cacheForReplay_) {
		replayCache_.push_back(fit(*frame));
		return &replayCache_.back();
	}
	current_ = fit(*frame);
	return &*current_;
}

Keying::Frame BackgroundSequencer::fit(const Keying::Frame &frame) const
{
	if (frame.getWidth() == width_ && frame.getHeight() == height_) {
		return frame.clone();
	}
	return Keying::resizeBilinear(frame, width_, height_, pool_);
}

} // namespace ChromaKey::Pipeline

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
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include "IOutputSink.hpp"

namespace ChromaKey::Pipeline {

/**
 * @brief Output sink that keeps everything in memory.
 *
 * Accessors may be called from another thread while the job runs.
 */
class MemoryOutputSink : public IOutputSink {
public:
	explicit MemoryOutputSink(Keying::SinkCapability capability) noexcept : capability_(capability) {}

	Keying::SinkCapability getCapability() const noexcept override { return capability_; }

	void writeFrame(Keying::Frame frame) override
	{
		std::lock_guard<std::mutex> lock(mutex_);
		frames_.push_back(std::move(frame));
	}

	void writeAudio(const Audio::AudioBuffer &audio) override
	{
		std::lock_guard<std::mutex> lock(mutex_);
		audio_ = audio;
	}

	void finish(JobState terminalState) override
	{
		std::lock_guard<std::mutex> lock(mutex_);
		finishState_ = terminalState;
		++finishCount_;
	}

	std::size_t getFrameCount() const
	{
		std::lock_guard<std::mutex> lock(mutex_);
		return frames_.size();
	}

	/// Moves the collected frames out; call after the job has finished.
	std::vector<Keying::Frame> takeFrames()
	{
		std::lock_guard<std::mutex> lock(mutex_);
		return std::move(frames_);
	}

	std::optional<Audio::AudioBuffer> getAudio() const
	{
		std::lock_guard<std::mutex> lock(mutex_);
		return audio_;
	}

	std::optional<JobState> getFinishState() const
	{
		std::lock_guard<std::mutex> lock(mutex_);
		return finishState_;
	}

	std::size_t getFinishCount() const
	{
		std::lock_guard<std::mutex> lock(mutex_);
		return finishCount_;
	}

private:
	const Keying::SinkCapability capability_;
	mutable std::mutex mutex_;
	std::vector<Keying::Frame> frames_;
	std::optional<Audio::AudioBuffer> audio_;
	std::optional<JobState> finishState_;
	std::size_t finishCount_ = 0;
};

} // namespace ChromaKey::Pipeline

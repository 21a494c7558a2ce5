/*
 * ChromaKey Pipeline Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <ChromaKey/Audio/AudioBuffer.hpp>
#include <ChromaKey/Keying/AlphaCompositor.hpp>
#include <ChromaKey/Keying/Frame.hpp>

#include "JobState.hpp"

namespace ChromaKey::Pipeline {

/**
 * @brief Receives the composited output of one job.
 *
 * Frames arrive in source order. `finish` is called exactly once, with the
 * terminal state of the job; anything other than Completed means the output
 * is incomplete but holds only whole frames.
 */
class IOutputSink {
protected:
	IOutputSink() = default;

public:
	virtual ~IOutputSink() = default;

	virtual Keying::SinkCapability getCapability() const noexcept = 0;

	virtual void writeFrame(Keying::Frame frame) = 0;

	virtual void writeAudio(const Audio::AudioBuffer &audio) = 0;

	virtual void finish(JobState terminalState) = 0;

	IOutputSink(const IOutputSink &) = delete;
	IOutputSink &operator=(const IOutputSink &) = delete;
	IOutputSink(IOutputSink &&) = delete;
	IOutputSink &operator=(IOutputSink &&) = delete;
};

} // namespace ChromaKey::Pipeline

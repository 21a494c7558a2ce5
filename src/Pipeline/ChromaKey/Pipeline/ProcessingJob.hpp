/*
 * ChromaKey Pipeline Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <memory>
#include <optional>

#include <ChromaKey/Audio/AudioBuffer.hpp>
#include <ChromaKey/Keying/KeySettings.hpp>

#include "BackgroundSource.hpp"
#include "IFrameSource.hpp"
#include "IOutputSink.hpp"

namespace ChromaKey::Pipeline {

/**
 * @brief Everything one run needs. Consumed by FramePipeline::start.
 */
struct ProcessingJob {
	std::unique_ptr<IFrameSource> foreground;

	/// When true, keySettings.keyColor is replaced by a color detected on the first frame.
	bool autoDetectKeyColor = false;
	Keying::KeySettings keySettings;

	BackgroundSource background;

	Audio::AudioMode audioMode = Audio::AudioMode::Foreground;
	std::optional<Audio::AudioBuffer> foregroundAudio;
	std::optional<Audio::AudioBuffer> backgroundAudio;

	std::shared_ptr<IOutputSink> sink;
};

} // namespace ChromaKey::Pipeline

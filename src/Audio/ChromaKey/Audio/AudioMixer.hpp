/*
 * ChromaKey Audio Library
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

#include <ChromaKey/Logger/ILogger.hpp>

#include "AudioBuffer.hpp"

namespace ChromaKey::Audio {

/**
 * @brief Produces the single output audio stream of a job.
 *
 * | mode       | result                                              |
 * |------------|-----------------------------------------------------|
 * | Foreground | foreground unchanged, none if absent                |
 * | Background | background unchanged, none if absent                |
 * | Mix        | normalized sum, or the present one if one is absent |
 * | None       | none                                                |
 *
 * std::nullopt stands for "no audio stream" and is what an absent input
 * turns into.
 */
class AudioMixer {
public:
	explicit AudioMixer(std::shared_ptr<const Logger::ILogger> logger);

	/**
	 * @throws std::invalid_argument if a present buffer fails AudioBuffer::validate.
	 */
	std::optional<AudioBuffer> mix(AudioMode mode, const std::optional<AudioBuffer> &foreground,
				       const std::optional<AudioBuffer> &background) const;

	/**
	 * @brief Sums two streams in the foreground's format and scales the result by
	 * 1 / peak when the peak exceeds full scale.
	 */
	AudioBuffer sum(const AudioBuffer &foreground, const AudioBuffer &background) const;

	/// Maps channels onto `channels`: mono is duplicated, mono targets average, others wrap around.
	static AudioBuffer remixChannels(const AudioBuffer &source, std::uint32_t channels);

	/// Linear-interpolation resampling.
	static AudioBuffer resampleLinear(const AudioBuffer &source, std::uint32_t sampleRate);

private:
	const std::shared_ptr<const Logger::ILogger> logger_;
};

} // namespace ChromaKey::Audio

/*
 * ChromaKey Audio Library
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
#include <stdexcept>
#include <string_view>
#include <vector>

namespace ChromaKey::Audio {

/**
 * @brief Decoded PCM audio, float32 samples interleaved by channel.
 */
struct AudioBuffer {
	std::uint32_t sampleRate = 48000;
	std::uint32_t channels = 2;
	std::vector<float> samples;

	std::size_t getFrameCount() const noexcept { return channels == 0 ? 0 : samples.size() / channels; }

	bool isEmpty() const noexcept { return samples.empty(); }

	bool hasSameFormat(const AudioBuffer &other) const noexcept
	{
		return sampleRate == other.sampleRate && channels == other.channels;
	}

	/**
	 * @throws std::invalid_argument if the format is degenerate or the samples do not fill whole frames.
	 */
	void validate() const
	{
		if (sampleRate == 0) {
			throw std::invalid_argument("sampleRate must be greater than 0");
		}
		if (channels == 0) {
			throw std::invalid_argument("channels must be greater than 0");
		}
		if (samples.size() % channels != 0) {
			throw std::invalid_argument("sample count is not a multiple of the channel count");
		}
	}
};

enum class AudioMode {
	Foreground,
	Background,
	Mix,
	None,
};

inline std::optional<AudioMode> parseAudioMode(std::string_view name) noexcept
{
	if (name == "foreground") {
		return AudioMode::Foreground;
	} else if (name == "background") {
		return AudioMode::Background;
	} else if (name == "mix") {
		return AudioMode::Mix;
	} else if (name == "none") {
		return AudioMode::None;
	}
	return std::nullopt;
}

constexpr std::string_view toString(AudioMode mode) noexcept
{
	switch (mode) {
	case AudioMode::Foreground:
		return "foreground";
	case AudioMode::Background:
		return "background";
	case AudioMode::Mix:
		return "mix";
	case AudioMode::None:
		return "none";
	default:
		return "unknown";
	}
}

} // namespace ChromaKey::Audio

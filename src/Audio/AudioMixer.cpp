/*
 * ChromaKey Audio Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "ChromaKey/Audio/AudioMixer.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace ChromaKey::Audio {

namespace {

std::optional<AudioBuffer> passThrough(const std::optional<AudioBuffer> &buffer)
{
	if (buffer) {
		buffer->validate();
	}
	return buffer;
}

} // anonymous namespace

AudioMixer::AudioMixer(std::shared_ptr<const Logger::ILogger> logger)
	: logger_(logger ? std::move(logger) : throw std::invalid_argument("logger must not be null"))
{
}

std::optional<AudioBuffer> AudioMixer::mix(AudioMode mode, const std::optional<AudioBuffer> &foreground,
					   const std::optional<AudioBuffer> &background) const
{
	switch (mode) {
	case AudioMode::Foreground:
		return passThrough(foreground);
	case AudioMode::Background:
		return passThrough(background);
	case AudioMode::None:
		return std::nullopt;
	case AudioMode::Mix:
		if (foreground && background) {
			foreground->validate();
			background->validate();
			return sum(*foreground, *background);
		}
		if (foreground || background) {
			logger_->info("AudioMixSingleStream", {{"present", foreground ? "foreground" : "background"}});
		}
		return foreground ? passThrough(foreground) : passThrough(background);
	default:
		throw std::invalid_argument("unknown audio mode");
	}
}

AudioBuffer AudioMixer::sum(const AudioBuffer &foreground, const AudioBuffer &background) const
{
	AudioBuffer adapted;
	const AudioBuffer *other = &background;
	if (!background.hasSameFormat(foreground)) {
		logger_->info("AudioMixAdaptingBackground",
			      {{"fromRate", std::to_string(background.sampleRate)},
			       {"fromChannels", std::to_string(background.channels)},
			       {"toRate", std::to_string(foreground.sampleRate)},
			       {"toChannels", std::to_string(foreground.channels)}});
		adapted = resampleLinear(remixChannels(background, foreground.channels), foreground.sampleRate);
		other = &adapted;
	}

	AudioBuffer mixed;
	mixed.sampleRate = foreground.sampleRate;
	mixed.channels = foreground.channels;
	mixed.samples.assign(std::max(foreground.samples.size(), other->samples.size()), 0.0f);

	float peak = 0.0f;
	for (std::size_t i = 0; i < mixed.samples.size(); ++i) {
		float value = 0.0f;
		if (i < foreground.samples.size()) {
			value += foreground.samples[i];
		}
		if (i < other->samples.size()) {
			value += other->samples[i];
		}
		mixed.samples[i] = value;
		peak = std::max(peak, std::abs(value));
	}

	if (peak > 1.0f) {
		for (float &sample : mixed.samples) {
			sample /= peak;
		}
		logger_->debug("AudioMixNormalized", {{"peak", std::to_string(peak)}});
	}

	return mixed;
}

AudioBuffer AudioMixer::remixChannels(const AudioBuffer &source, std::uint32_t channels)
{
	if (channels == 0) {
		throw std::invalid_argument("channels must be greater than 0");
	}
	if (source.channels == channels) {
		return source;
	}

	const std::size_t frames = source.getFrameCount();
	AudioBuffer target;
	target.sampleRate = source.sampleRate;
	target.channels = channels;
	target.samples.resize(frames * channels);

	for (std::size_t f = 0; f < frames; ++f) {
		const float *in = source.samples.data() + f * source.channels;
		float *out = target.samples.data() + f * channels;
		if (channels == 1) {
			float total = 0.0f;
			for (std::uint32_t c = 0; c < source.channels; ++c) {
				total += in[c];
			}
			out[0] = total / static_cast<float>(source.channels);
		} else {
			for (std::uint32_t c = 0; c < channels; ++c) {
				out[c] = in[c % source.channels];
			}
		}
	}

	return target;
}

AudioBuffer AudioMixer::resampleLinear(const AudioBuffer &source, std::uint32_t sampleRate)
{
	if (sampleRate == 0) {
		throw std::invalid_argument("sampleRate must be greater than 0");
	}
	if (source.sampleRate == sampleRate || source.isEmpty()) {
		AudioBuffer copy = source;
		copy.sampleRate = sampleRate;
		return copy;
	}

	const std::size_t inFrames = source.getFrameCount();
	const auto outFrames = static_cast<std::size_t>(
		std::llround(static_cast<double>(inFrames) * sampleRate / static_cast<double>(source.sampleRate)));
	const double step = static_cast<double>(source.sampleRate) / static_cast<double>(sampleRate);

	AudioBuffer target;
	target.sampleRate = sampleRate;
	target.channels = source.channels;
	target.samples.resize(outFrames * source.channels);

	for (std::size_t f = 0; f < outFrames; ++f) {
		const double position = static_cast<double>(f) * step;
		const auto i0 = std::min(static_cast<std::size_t>(position), inFrames - 1);
		const std::size_t i1 = std::min(i0 + 1, inFrames - 1);
		const auto t = static_cast<float>(position - static_cast<double>(i0));
		for (std::uint32_t c = 0; c < source.channels; ++c) {
			const float a = source.samples[i0 * source.channels + c];
			const float b = source.samples[i1 * source.channels + c];
			target.samples[f * source.channels + c] = a + (b - a) * t;
		}
	}

	return target;
}

} // namespace ChromaKey::Audio

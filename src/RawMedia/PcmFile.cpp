/*
 * ChromaKey RawMedia Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "ChromaKey/RawMedia/PcmFile.hpp"

#include <array>
#include <bit>
#include <cstring>
#include <fstream>
#include <stdexcept>

namespace ChromaKey::RawMedia {

namespace {

constexpr std::size_t kSampleSize = sizeof(float);

static_assert(sizeof(float) == sizeof(std::uint32_t));

float decodeSample(const std::array<char, kSampleSize> &bytes) noexcept
{
	std::uint32_t bits = 0;
	for (std::size_t i = 0; i < kSampleSize; ++i) {
		bits |= static_cast<std::uint32_t>(static_cast<unsigned char>(bytes[i])) << (8 * i);
	}
	return std::bit_cast<float>(bits);
}

std::array<char, kSampleSize> encodeSample(float sample) noexcept
{
	const auto bits = std::bit_cast<std::uint32_t>(sample);
	std::array<char, kSampleSize> bytes;
	for (std::size_t i = 0; i < kSampleSize; ++i) {
		bytes[i] = static_cast<char>((bits >> (8 * i)) & 0xFFu);
	}
	return bytes;
}

} // anonymous namespace

Audio::AudioBuffer readPcmF32(std::istream &in, std::uint32_t sampleRate, std::uint32_t channels)
{
	Audio::AudioBuffer audio;
	audio.sampleRate = sampleRate;
	audio.channels = channels;
	if (channels == 0) {
		throw std::invalid_argument("channels must be greater than 0");
	}

	std::array<char, kSampleSize> bytes;
	while (in.read(bytes.data(), static_cast<std::streamsize>(bytes.size()))) {
		audio.samples.push_back(decodeSample(bytes));
	}

	audio.samples.resize(audio.samples.size() - audio.samples.size() % channels);
	return audio;
}

Audio::AudioBuffer readPcmF32File(const std::filesystem::path &path, std::uint32_t sampleRate,
				  std::uint32_t channels)
{
	std::ifstream ifs(path, std::ios::binary);
	if (!ifs) {
		throw std::runtime_error("cannot open PCM audio: " + path.string());
	}
	return readPcmF32(ifs, sampleRate, channels);
}

void writePcmF32(std::ostream &out, const Audio::AudioBuffer &audio)
{
	for (const float sample : audio.samples) {
		const std::array<char, kSampleSize> bytes = encodeSample(sample);
		out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
	}
}

void writePcmF32File(const std::filesystem::path &path, const Audio::AudioBuffer &audio)
{
	std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
	if (!ofs) {
		throw std::runtime_error("cannot create PCM audio: " + path.string());
	}
	writePcmF32(ofs, audio);
	if (!ofs.flush()) {
		throw std::runtime_error("failed to write PCM audio: " + path.string());
	}
}

} // namespace ChromaKey::RawMedia

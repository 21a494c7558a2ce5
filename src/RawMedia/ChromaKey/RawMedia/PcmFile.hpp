/*
 * ChromaKey RawMedia Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <ostream>

#include <ChromaKey/Audio/AudioBuffer.hpp>

namespace ChromaKey::RawMedia {

/**
 * @brief Reads headerless interleaved float32 little-endian PCM (ffmpeg's `f32le`).
 *
 * Trailing bytes that do not fill a whole sample frame are dropped.
 */
Audio::AudioBuffer readPcmF32(std::istream &in, std::uint32_t sampleRate, std::uint32_t channels);

/**
 * @throws std::runtime_error if the file cannot be opened.
 */
Audio::AudioBuffer readPcmF32File(const std::filesystem::path &path, std::uint32_t sampleRate,
				  std::uint32_t channels);

void writePcmF32(std::ostream &out, const Audio::AudioBuffer &audio);

/**
 * @throws std::runtime_error if the file cannot be written.
 */
void writePcmF32File(const std::filesystem::path &path, const Audio::AudioBuffer &audio);

} // namespace ChromaKey::RawMedia

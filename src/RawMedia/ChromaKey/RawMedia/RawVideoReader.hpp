/*
 * ChromaKey RawMedia Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>

#include <ChromaKey/Keying/Frame.hpp>
#include <ChromaKey/Pipeline/IFrameSource.hpp>

namespace ChromaKey::RawMedia {

/**
 * @brief Reads headerless, tightly packed frames of a fixed size from a stream.
 *
 * A trailing partial frame is reported as a FrameProcessingError for its index.
 * A seekable stream can be restarted from its first frame.
 */
class RawVideoReader final : public Pipeline::IFrameSource {
public:
	RawVideoReader(std::unique_ptr<std::istream> stream, std::uint32_t width, std::uint32_t height,
		       Keying::PixelFormat format = Keying::PixelFormat::Rgb24,
		       std::optional<std::size_t> totalFrames = std::nullopt);

	/**
	 * @brief Opens a file; the frame count is derived from the file size.
	 * @throws std::runtime_error if the file cannot be opened.
	 */
	static std::unique_ptr<RawVideoReader> open(const std::filesystem::path &path, std::uint32_t width,
						    std::uint32_t height,
						    Keying::PixelFormat format = Keying::PixelFormat::Rgb24);

	std::optional<Keying::Frame> next() override;

	std::optional<std::size_t> getTotalFrames() const noexcept override { return totalFrames_; }

	bool isRestartable() const noexcept override { return seekable_; }

	/**
	 * @brief Seeks back to the first frame.
	 * @throws std::logic_error if the stream is not seekable.
	 * @throws std::runtime_error if seeking fails.
	 */
	void restart() override;

	std::size_t getFrameSize() const noexcept { return frameSize_; }

private:
	const std::unique_ptr<std::istream> stream_;
	const std::uint32_t width_;
	const std::uint32_t height_;
	const Keying::PixelFormat format_;
	const std::size_t frameSize_;
	const std::optional<std::size_t> totalFrames_;
	const bool seekable_;
	std::size_t framesRead_ = 0;
};

/**
 * @brief Reads exactly one frame, for static background images.
 * @throws std::runtime_error if the file cannot be opened or holds less than one frame.
 */
Keying::Frame readRawImage(const std::filesystem::path &path, std::uint32_t width, std::uint32_t height);

} // namespace ChromaKey::RawMedia

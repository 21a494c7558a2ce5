/*
 * ChromaKey RawMedia Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "ChromaKey/RawMedia/RawVideoReader.hpp"

#include <fstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <ChromaKey/Pipeline/FrameProcessingError.hpp>

namespace ChromaKey::RawMedia {

RawVideoReader::RawVideoReader(std::unique_ptr<std::istream> stream, std::uint32_t width, std::uint32_t height,
			       Keying::PixelFormat format, std::optional<std::size_t> totalFrames)
	: stream_(stream ? std::move(stream) : throw std::invalid_argument("stream must not be null")),
	  width_(width),
	  height_(height),
	  format_(format),
	  frameSize_(static_cast<std::size_t>(width) * height * Keying::getBytesPerPixel(format)),
	  totalFrames_(totalFrames),
	  seekable_(stream_->tellg() == std::streampos(0))
{
	if (frameSize_ == 0) {
		throw std::invalid_argument("frame dimensions must be positive");
	}
}

std::unique_ptr<RawVideoReader> RawVideoReader::open(const std::filesystem::path &path, std::uint32_t width,
						     std::uint32_t height, Keying::PixelFormat format)
{
	auto stream = std::make_unique<std::ifstream>(path, std::ios::binary);
	if (!*stream) {
		throw std::runtime_error("cannot open raw video: " + path.string());
	}

	const std::size_t frameSize = static_cast<std::size_t>(width) * height * Keying::getBytesPerPixel(format);
	std::optional<std::size_t> totalFrames;
	std::error_code ec;
	const std::uintmax_t fileSize = std::filesystem::file_size(path, ec);
	if (!ec && frameSize > 0) {
		totalFrames = static_cast<std::size_t>(fileSize / frameSize);
	}

	return std::make_unique<RawVideoReader>(std::move(stream), width, height, format, totalFrames);
}

std::optional<Keying::Frame> RawVideoReader::next()
{
	std::vector<std::uint8_t> buffer(frameSize_);
	stream_->read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(frameSize_));
	const auto bytesRead = static_cast<std::size_t>(stream_->gcount());

	if (bytesRead == 0) {
		return std::nullopt;
	}
	if (bytesRead != frameSize_) {
		throw Pipeline::FrameProcessingError(framesRead_, "truncated frame in raw video stream");
	}

	++framesRead_;
	return Keying::Frame::fromBytes(width_, height_, format_, buffer);
}

void RawVideoReader::restart()
{
	if (!seekable_) {
		throw std::logic_error("raw video stream is not seekable");
	}

	stream_->clear();
	stream_->seekg(0);
	if (!*stream_) {
		throw std::runtime_error("failed to rewind raw video stream");
	}
	framesRead_ = 0;
}

Keying::Frame readRawImage(const std::filesystem::path &path, std::uint32_t width, std::uint32_t height)
{
	std::unique_ptr<RawVideoReader> reader = RawVideoReader::open(path, width, height);
	std::optional<Keying::Frame> frame = reader->next();
	if (!frame) {
		throw std::runtime_error("raw image holds less than one frame: " + path.string());
	}
	return std::move(*frame);
}

} // namespace ChromaKey::RawMedia

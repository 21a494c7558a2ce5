/*
 * ChromaKey RawMedia Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "ChromaKey/RawMedia/RawFileSink.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "ChromaKey/RawMedia/PcmFile.hpp"

namespace ChromaKey::RawMedia {

RawFileSink::RawFileSink(std::shared_ptr<const Logger::ILogger> logger, const std::filesystem::path &videoPath,
			 bool alpha, std::optional<std::filesystem::path> audioPath)
	: logger_(logger ? std::move(logger) : throw std::invalid_argument("logger must not be null")),
	  videoPath_(videoPath),
	  partialPath_(makePartialPath(videoPath)),
	  capability_(alpha ? Keying::SinkCapability::AlphaCapable : Keying::SinkCapability::Opaque),
	  audioPath_(std::move(audioPath)),
	  video_(partialPath_, std::ios::binary | std::ios::trunc)
{
	if (!video_) {
		throw std::runtime_error("cannot create output video: " + partialPath_.string());
	}
}

std::filesystem::path RawFileSink::makePartialPath(const std::filesystem::path &videoPath)
{
	std::filesystem::path partialPath = videoPath;
	partialPath += ".partial";
	return partialPath;
}

void RawFileSink::writeFrame(Keying::Frame frame)
{
	const auto data = frame.getData();
	video_.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
	if (!video_) {
		throw std::runtime_error("failed to write output video: " + partialPath_.string());
	}
	++framesWritten_;
}

void RawFileSink::writeAudio(const Audio::AudioBuffer &audio)
{
	if (!audioPath_) {
		logger_->warn("AudioDiscarded", {{"reason", "no audio output path"}});
		return;
	}
	writePcmF32File(*audioPath_, audio);
	logger_->info("AudioWritten", {{"path", audioPath_->string()},
				       {"sampleRate", std::to_string(audio.sampleRate)},
				       {"channels", std::to_string(audio.channels)}});
}

void RawFileSink::finish(Pipeline::JobState terminalState)
{
	video_.close();
	if (!video_) {
		throw std::runtime_error("failed to close output video: " + partialPath_.string());
	}

	if (terminalState == Pipeline::JobState::Completed) {
		std::filesystem::rename(partialPath_, videoPath_);
		logger_->info("OutputFinished", {{"path", videoPath_.string()}, {"frames", std::to_string(framesWritten_)}});
	} else {
		logger_->warn("OutputIncomplete", {{"path", partialPath_.string()},
						   {"frames", std::to_string(framesWritten_)},
						   {"state", Pipeline::toString(terminalState)}});
	}
}

} // namespace ChromaKey::RawMedia

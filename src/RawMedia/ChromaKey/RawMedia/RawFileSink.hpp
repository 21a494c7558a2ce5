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
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>

#include <ChromaKey/Logger/ILogger.hpp>
#include <ChromaKey/Pipeline/IOutputSink.hpp>

namespace ChromaKey::RawMedia {

/**
 * @brief Output sink writing headerless RGB24 or RGBA frames to one file and PCM audio to another.
 *
 * Frames are written whole to `<videoPath>.partial`, which is renamed to
 * `videoPath` only when the job completes. A failed or cancelled job leaves the
 * `.partial` file holding only complete frames.
 */
class RawFileSink final : public Pipeline::IOutputSink {
public:
	/**
	 * @param audioPath Where mixed audio goes; audio is discarded with a warning when absent.
	 * @throws std::runtime_error if the partial video file cannot be created.
	 */
	RawFileSink(std::shared_ptr<const Logger::ILogger> logger, const std::filesystem::path &videoPath,
		    bool alpha, std::optional<std::filesystem::path> audioPath);

	Keying::SinkCapability getCapability() const noexcept override { return capability_; }

	void writeFrame(Keying::Frame frame) override;

	void writeAudio(const Audio::AudioBuffer &audio) override;

	/**
	 * @brief Closes the video file and, on Completed, moves it to its final name.
	 * @throws std::runtime_error if closing or renaming fails.
	 */
	void finish(Pipeline::JobState terminalState) override;

	std::size_t getFramesWritten() const noexcept { return framesWritten_; }

	const std::filesystem::path &getPartialPath() const noexcept { return partialPath_; }

	static std::filesystem::path makePartialPath(const std::filesystem::path &videoPath);

private:
	const std::shared_ptr<const Logger::ILogger> logger_;
	const std::filesystem::path videoPath_;
	const std::filesystem::path partialPath_;
	const Keying::SinkCapability capability_;
	const std::optional<std::filesystem::path> audioPath_;
	std::ofstream video_;
	std::size_t framesWritten_ = 0;
};

} // namespace ChromaKey::RawMedia

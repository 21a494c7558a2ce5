/*
 * Chroma Key Compositor
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; for more details see the file
 * "LICENSE.GPL-3.0-or-later" in the distribution root.
 */

#include <chrono>
#include <csignal>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <ChromaKey/JobConfig/JobConfig.hpp>
#include <ChromaKey/Keying/ConfigurationError.hpp>
#include <ChromaKey/Logger/PrintLogger.hpp>
#include <ChromaKey/Pipeline/FramePipeline.hpp>
#include <ChromaKey/RawMedia/PcmFile.hpp>
#include <ChromaKey/RawMedia/RawFileSink.hpp>
#include <ChromaKey/RawMedia/RawVideoReader.hpp>

using namespace ChromaKey;

#define PROGRAM_NAME "chroma-key-compositor"

#ifndef CHROMAKEY_VERSION
#define CHROMAKEY_VERSION "0.0.0"
#endif

namespace {

constexpr int kExitCompleted = 0;
constexpr int kExitFailed = 1;
constexpr int kExitConfigurationError = 2;
constexpr int kExitCancelled = 130;

constexpr std::chrono::milliseconds kProgressPollInterval{200};

volatile std::sig_atomic_t g_interrupted_ = 0;

void handleInterrupt(int)
{
	g_interrupted_ = 1;
}

void printUsage()
{
	std::cerr << "usage: " PROGRAM_NAME " [--verbose] <job.json>\n"
		  << "       " PROGRAM_NAME " --version\n";
}

Pipeline::BackgroundSource openBackground(const JobConfig::BackgroundConfig &config)
{
	switch (config.kind) {
	case Pipeline::BackgroundKind::StaticImage:
		return Pipeline::BackgroundSource::staticImage(
			RawMedia::readRawImage(config.media->path, config.media->width, config.media->height),
			config.solidColor);
	case Pipeline::BackgroundKind::VideoStream:
		return Pipeline::BackgroundSource::videoStream(
			RawMedia::RawVideoReader::open(config.media->path, config.media->width, config.media->height),
			config.endPolicy, config.solidColor);
	case Pipeline::BackgroundKind::None:
	default:
		return Pipeline::BackgroundSource::none(config.solidColor);
	}
}

std::optional<Audio::AudioBuffer> openAudio(const std::optional<JobConfig::PcmInput> &input)
{
	if (!input) {
		return std::nullopt;
	}
	return RawMedia::readPcmF32File(input->path, input->sampleRate, input->channels);
}

Pipeline::ProcessingJob buildJob(const JobConfig::JobConfig &config, std::shared_ptr<const Logger::ILogger> logger)
{
	Pipeline::ProcessingJob job;
	job.foreground =
		RawMedia::RawVideoReader::open(config.foreground.path, config.foreground.width, config.foreground.height);
	job.autoDetectKeyColor = config.key.autoDetect;
	job.keySettings = config.key.settings;
	job.background = openBackground(config.background);
	job.audioMode = config.audio.mode;
	if (config.audio.mode != Audio::AudioMode::None) {
		job.foregroundAudio = openAudio(config.audio.foreground);
		job.backgroundAudio = openAudio(config.audio.background);
	}

	std::optional<std::filesystem::path> audioPath;
	if (config.output.audioPath) {
		audioPath = *config.output.audioPath;
	}
	job.sink = std::make_shared<RawMedia::RawFileSink>(std::move(logger), config.output.path, config.output.alpha,
							   std::move(audioPath));
	return job;
}

int toExitCode(const Pipeline::JobResult &result)
{
	switch (result.state) {
	case Pipeline::JobState::Completed:
		return kExitCompleted;
	case Pipeline::JobState::Cancelled:
		return kExitCancelled;
	default:
		return kExitFailed;
	}
}

} // anonymous namespace

int main(int argc, char **argv)
{
	bool verbose = false;
	std::optional<std::filesystem::path> jobPath;
	for (int i = 1; i < argc; ++i) {
		const std::string_view arg(argv[i]);
		if (arg == "--verbose" || arg == "-v") {
			verbose = true;
		} else if (arg == "--version") {
			std::cout << PROGRAM_NAME " " CHROMAKEY_VERSION "\n";
			return kExitCompleted;
		} else if (!jobPath && !arg.starts_with("-")) {
			jobPath = std::filesystem::path(arg);
		} else {
			printUsage();
			return kExitConfigurationError;
		}
	}
	if (!jobPath) {
		printUsage();
		return kExitConfigurationError;
	}

	std::shared_ptr<const Logger::ILogger> logger =
		std::make_shared<Logger::PrintLogger>(std::cerr, "[" PROGRAM_NAME "]", verbose);

	JobConfig::JobConfig config;
	Pipeline::ProcessingJob job;
	try {
		config = JobConfig::JobConfig::load(*jobPath, logger);
		if (config.verbose && !verbose) {
			logger = std::make_shared<Logger::PrintLogger>(std::cerr, "[" PROGRAM_NAME "]", true);
		}
		job = buildJob(config, logger);
	} catch (const Keying::ConfigurationError &e) {
		logger->error("ConfigurationError", {{"message", e.what()}});
		return kExitConfigurationError;
	} catch (const std::exception &e) {
		logger->error("JobSetupError", {{"message", e.what()}});
		return kExitConfigurationError;
	}

	std::signal(SIGINT, handleInterrupt);

	Pipeline::FramePipeline pipeline(logger, config.pipeline);

	std::optional<Pipeline::JobHandle> handle;
	try {
		handle.emplace(pipeline.start(std::move(job)));
	} catch (const Keying::ConfigurationError &e) {
		logger->error("ConfigurationError", {{"message", e.what()}});
		return kExitConfigurationError;
	} catch (const std::exception &e) {
		logger->error("JobStartError", {{"message", e.what()}});
		return kExitFailed;
	}

	bool cancelRequested = false;
	while (!handle->getProgress().isTerminal()) {
		if (g_interrupted_ && !cancelRequested) {
			logger->warn("Interrupted, cancelling after the current frame");
			handle->cancel();
			cancelRequested = true;
		}

		const std::optional<Pipeline::ProgressEvent> event =
			handle->getProgress().waitForUpdate(kProgressPollInterval);
		if (!event || Pipeline::isTerminal(event->state)) {
			continue;
		}

		if (const std::optional<double> fraction = event->getFraction()) {
			logger->info("Progress state={} frames={}/{} ({:.1f}%)", Pipeline::toString(event->state),
				     event->framesDone, *event->totalFrames, *fraction * 100.0);
		} else {
			logger->info("Progress state={} frames={}", Pipeline::toString(event->state), event->framesDone);
		}
	}

	const Pipeline::JobResult result = handle->wait();
	if (result.error) {
		logger->error("JobFailed", {{"message", result.error->message},
					    {"frameIndex", result.error->frameIndex
								   ? std::to_string(*result.error->frameIndex)
								   : std::string("-")}});
	}
	logger->info("Job {} with {} frames written", Pipeline::toString(result.state), result.framesWritten);

	return toExitCode(result);
}

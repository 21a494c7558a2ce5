/*
 * ChromaKey Pipeline Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "ChromaKey/Pipeline/FramePipeline.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#include <fmt/format.h>

#include <ChromaKey/Keying/ConfigurationError.hpp>

#include "ChromaKey/Pipeline/FrameProcessingError.hpp"

namespace ChromaKey::Pipeline {

namespace {

std::size_t toThreadCount(int numThreads)
{
	if (numThreads < 1) {
		throw std::invalid_argument("numThreads must be at least 1");
	}
	return static_cast<std::size_t>(numThreads);
}

} // anonymous namespace

JobResult JobHandle::wait() const
{
	const ProgressEvent event = progress_->waitForTerminal();
	return {event.state, event.framesDone, event.error};
}

FramePipeline::FramePipeline(std::shared_ptr<const Logger::ILogger> logger, PipelineProperty property)
	: logger_(logger ? std::move(logger) : throw std::invalid_argument("logger must not be null")),
	  property_(std::move(property)),
	  pool_(logger_, toThreadCount(property_.numThreads)),
	  mixer_(logger_),
	  detector_(logger_, property_.detector),
	  queue_(logger_, std::max<std::size_t>(1, property_.maxPendingJobs))
{
}

FramePipeline::~FramePipeline() noexcept
{
	queue_.shutdown();
}

void FramePipeline::validate(const ProcessingJob &job)
{
	if (!job.foreground) {
		throw Keying::ConfigurationError("foreground frame source is missing");
	}
	if (!job.sink) {
		throw Keying::ConfigurationError("output sink is missing");
	}

	job.keySettings.validate();
	job.background.validate();

	try {
		if (job.foregroundAudio) {
			job.foregroundAudio->validate();
		}
		if (job.backgroundAudio) {
			job.backgroundAudio->validate();
		}
	} catch (const std::invalid_argument &e) {
		throw Keying::ConfigurationError(std::string("invalid audio stream: ") + e.what());
	}
}

JobHandle FramePipeline::start(ProcessingJob job)
{
	validate(job);

	auto progress = std::make_shared<ProgressChannel>();
	auto token = std::make_shared<std::atomic<bool>>(false);
	auto sharedJob = std::make_shared<ProcessingJob>(std::move(job));

	progress->publish({0, sharedJob->foreground->getTotalFrames(), JobState::Idle, std::nullopt});

	queue_.push(
		[this, sharedJob, progress](const TaskQueue::JobTaskQueue::CancellationToken &taskToken) {
			try {
				runJob(*sharedJob, *progress, taskToken);
			} catch (const std::exception &e) {
				ProgressEvent failed = progress->getLatest();
				failed.state = JobState::Failed;
				failed.error = JobError{JobErrorKind::Internal, e.what(), std::nullopt};
				progress->publish(failed);
				throw;
			}
		},
		token);

	return JobHandle(std::move(progress), std::move(token));
}

void FramePipeline::runJob(ProcessingJob &job, ProgressChannel &progress,
			   const TaskQueue::JobTaskQueue::CancellationToken &token)
{
	const std::optional<std::size_t> totalFrames = job.foreground->getTotalFrames();
	const std::size_t progressInterval = std::max<std::size_t>(1, property_.progressInterval);
	std::size_t framesDone = 0;

	const auto publish = [&](JobState state, std::optional<JobError> error) {
		progress.publish({framesDone, totalFrames, state, std::move(error)});
	};

	const auto finish = [&](JobState state, std::optional<JobError> error) {
		try {
			job.sink->finish(state);
		} catch (const std::exception &e) {
			logger_->logException(e, "IOutputSink::finish");
			if (state == JobState::Completed) {
				state = JobState::Failed;
				error = JobError{JobErrorKind::Internal, e.what(), std::nullopt};
			}
		}
		logger_->info("JobFinished",
			      {{"state", toString(state)}, {"framesDone", std::to_string(framesDone)}});
		publish(state, std::move(error));
	};

	if (token->load()) {
		finish(JobState::Cancelled, std::nullopt);
		return;
	}

	try {
		std::optional<Keying::Frame> pending = job.foreground->next();

		Keying::KeySettings settings = job.keySettings;
		if (job.autoDetectKeyColor) {
			publish(JobState::Detecting, std::nullopt);
			settings.keyColor = pending ? detector_.detect(*pending, pool_) : property_.detector.fallbackColor;
		}

		logger_->info("JobStarted", {{"keyColor", settings.keyColor.toHex()},
					     {"similarity", std::to_string(settings.similarity)},
					     {"blendStrength", std::to_string(settings.blendStrength)},
					     {"edgeBlurRadius", std::to_string(settings.edgeBlurRadius)},
					     {"audioMode", Audio::toString(job.audioMode)}});
		publish(JobState::Running, std::nullopt);

		if (const std::optional<Audio::AudioBuffer> audio =
			    mixer_.mix(job.audioMode, job.foregroundAudio, job.backgroundAudio)) {
			job.sink->writeAudio(*audio);
		}

		const Keying::ColorDistanceClassifier classifier(settings);
		const Keying::SpillSuppressor suppressor(settings);
		const Keying::EdgeRefiner refiner(settings.edgeBlurRadius);
		const std::unique_ptr<Keying::ICompositor> compositor =
			Keying::makeCompositor(job.sink->getCapability(), job.background.getSolidColor());

		std::optional<BackgroundSequencer> sequencer;
		std::uint32_t width = 0;
		std::uint32_t height = 0;

		while (true) {
			if (token->load()) {
				finish(JobState::Cancelled, std::nullopt);
				return;
			}

			std::optional<Keying::Frame> frame = pending ? std::move(pending) : job.foreground->next();
			pending.reset();
			if (!frame) {
				break;
			}

			if (token->load()) {
				finish(JobState::Cancelled, std::nullopt);
				return;
			}

			if (!sequencer) {
				if (frame->isEmpty()) {
					throw FrameProcessingError(framesDone, "first frame has no pixels");
				}
				width = frame->getWidth();
				height = frame->getHeight();
				sequencer.emplace(job.background, width, height, pool_, totalFrames);
			}

			const FrameStages stages{classifier, suppressor, refiner, *compositor, *sequencer};
			Keying::Frame output = processFrame(framesDone, std::move(*frame), width, height, stages);
			job.sink->writeFrame(std::move(output));
			++framesDone;

			if (framesDone % progressInterval == 0) {
				publish(JobState::Running, std::nullopt);
			}
		}

		finish(JobState::Completed, std::nullopt);
	} catch (const FrameProcessingError &e) {
		logger_->error("FrameProcessingError",
			       {{"frameIndex", std::to_string(e.getFrameIndex())}, {"message", e.what()}});
		finish(JobState::Failed, JobError{JobErrorKind::FrameProcessing, e.what(), e.getFrameIndex()});
	} catch (const std::exception &e) {
		logger_->logException(e, "FramePipeline::runJob");
		finish(JobState::Failed, JobError{JobErrorKind::Internal, e.what(), framesDone});
	}
}

Keying::Frame FramePipeline::processFrame(std::size_t frameIndex, Keying::Frame frame, std::uint32_t width,
					  std::uint32_t height, const FrameStages &stages)
{
	if (frame.getWidth() != width || frame.getHeight() != height) {
		throw FrameProcessingError(frameIndex, fmt::format("frame size changed from {}x{} to {}x{}", width,
								   height, frame.getWidth(), frame.getHeight()));
	}

	try {
		const Keying::Frame *background = stages.background.advance(frameIndex);

		Keying::AlphaMask rawMask = stages.classifier.classifyFrame(frame, pool_);
		stages.suppressor.suppressFrame(frame, rawMask, pool_);
		const Keying::AlphaMask mask = stages.refiner.refine(std::move(rawMask), pool_);

		return stages.compositor.composite(frame, mask, background, pool_);
	} catch (const FrameProcessingError &) {
		throw;
	} catch (const std::exception &e) {
		throw FrameProcessingError(frameIndex, e.what());
	}
}

} // namespace ChromaKey::Pipeline

/*
 * ChromaKey Pipeline Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>

#include <ChromaKey/Audio/AudioMixer.hpp>
#include <ChromaKey/Keying/AlphaCompositor.hpp>
#include <ChromaKey/Keying/ColorDistanceClassifier.hpp>
#include <ChromaKey/Keying/EdgeRefiner.hpp>
#include <ChromaKey/Keying/KeyColorDetector.hpp>
#include <ChromaKey/Keying/SpillSuppressor.hpp>
#include <ChromaKey/Logger/ILogger.hpp>
#include <ChromaKey/TaskQueue/JobTaskQueue.hpp>
#include <ChromaKey/TaskQueue/RowBandWorkerPool.hpp>

#include "BackgroundSequencer.hpp"
#include "PipelineProperty.hpp"
#include "ProcessingJob.hpp"
#include "ProgressChannel.hpp"

namespace ChromaKey::Pipeline {

struct JobResult {
	JobState state = JobState::Idle;
	std::size_t framesWritten = 0;
	std::optional<JobError> error;
};

/**
 * @brief The caller's side of a started job.
 */
class JobHandle {
public:
	/**
	 * @brief Requests cooperative cancellation. The job stops before its next frame.
	 */
	void cancel() noexcept { token_->store(true); }

	bool isCancellationRequested() const noexcept { return token_->load(); }

	ProgressChannel &getProgress() const noexcept { return *progress_; }

	/**
	 * @brief Blocks until the job reaches a terminal state.
	 */
	JobResult wait() const;

private:
	friend class FramePipeline;

	JobHandle(std::shared_ptr<ProgressChannel> progress, TaskQueue::JobTaskQueue::CancellationToken token) noexcept
		: progress_(std::move(progress)),
		  token_(std::move(token))
	{
	}

	std::shared_ptr<ProgressChannel> progress_;
	TaskQueue::JobTaskQueue::CancellationToken token_;
};

/**
 * @class FramePipeline
 * @brief Runs chroma-key jobs on a dedicated worker thread.
 *
 * Per frame: classify, suppress spill, refine the mask, composite over the
 * background frame of the same index, and hand the result to the sink. Frames
 * leave in source order. Jobs started on one pipeline run one after another.
 */
class FramePipeline {
public:
	FramePipeline(std::shared_ptr<const Logger::ILogger> logger, PipelineProperty property = {});

	~FramePipeline() noexcept;

	FramePipeline(const FramePipeline &) = delete;
	FramePipeline &operator=(const FramePipeline &) = delete;
	FramePipeline(FramePipeline &&) = delete;
	FramePipeline &operator=(FramePipeline &&) = delete;

	/**
	 * @brief Validates `job` and queues it. Returns without waiting for any frame.
	 * @throws Keying::ConfigurationError if the job is misconfigured; nothing is queued then.
	 * @throws std::runtime_error if PipelineProperty::maxPendingJobs jobs are already waiting
	 *         or the pipeline is shutting down; nothing is queued then either.
	 */
	JobHandle start(ProcessingJob job);

	/**
	 * @throws Keying::ConfigurationError on missing references or invalid settings.
	 */
	static void validate(const ProcessingJob &job);

	const PipelineProperty &getProperty() const noexcept { return property_; }

private:
	struct FrameStages {
		const Keying::ColorDistanceClassifier &classifier;
		const Keying::SpillSuppressor &suppressor;
		const Keying::EdgeRefiner &refiner;
		const Keying::ICompositor &compositor;
		BackgroundSequencer &background;
	};

	void runJob(ProcessingJob &job, ProgressChannel &progress, const TaskQueue::JobTaskQueue::CancellationToken &token);

	Keying::Frame processFrame(std::size_t frameIndex, Keying::Frame frame, std::uint32_t width,
				   std::uint32_t height, const FrameStages &stages);

	const std::shared_ptr<const Logger::ILogger> logger_;
	const PipelineProperty property_;

	TaskQueue::RowBandWorkerPool pool_;
	const Audio::AudioMixer mixer_;
	const Keying::KeyColorDetector detector_;

	TaskQueue::JobTaskQueue queue_;
};

} // namespace ChromaKey::Pipeline

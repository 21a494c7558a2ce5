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
#include <optional>
#include <string>

#include "JobState.hpp"

namespace ChromaKey::Pipeline {

enum class JobErrorKind {
	FrameProcessing,
	Internal,
};

struct JobError {
	JobErrorKind kind = JobErrorKind::Internal;
	std::string message;
	std::optional<std::size_t> frameIndex;
};

struct ProgressEvent {
	std::size_t framesDone = 0;
	std::optional<std::size_t> totalFrames;
	JobState state = JobState::Idle;

	/// Set only on a Failed event.
	std::optional<JobError> error;

	/// framesDone / totalFrames in [0, 1], or std::nullopt while the total is unknown.
	std::optional<double> getFraction() const noexcept
	{
		if (!totalFrames || *totalFrames == 0) {
			return std::nullopt;
		}
		return static_cast<double>(framesDone) / static_cast<double>(*totalFrames);
	}
};

} // namespace ChromaKey::Pipeline

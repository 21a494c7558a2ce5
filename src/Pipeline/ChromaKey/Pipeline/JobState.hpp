/*
 * ChromaKey Pipeline Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <string_view>

namespace ChromaKey::Pipeline {

enum class JobState {
	Idle,
	Detecting,
	Running,
	Completed,
	Failed,
	Cancelled,
};

constexpr bool isTerminal(JobState state) noexcept
{
	return state == JobState::Completed || state == JobState::Failed || state == JobState::Cancelled;
}

constexpr std::string_view toString(JobState state) noexcept
{
	switch (state) {
	case JobState::Idle:
		return "Idle";
	case JobState::Detecting:
		return "Detecting";
	case JobState::Running:
		return "Running";
	case JobState::Completed:
		return "Completed";
	case JobState::Failed:
		return "Failed";
	case JobState::Cancelled:
		return "Cancelled";
	default:
		return "Unknown";
	}
}

} // namespace ChromaKey::Pipeline

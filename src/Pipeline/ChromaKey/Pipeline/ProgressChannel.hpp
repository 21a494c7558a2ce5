/*
 * ChromaKey Pipeline Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>

#include "ProgressEvent.hpp"

namespace ChromaKey::Pipeline {

/**
 * @brief Single-slot, latest-wins progress mailbox between a job and its observer.
 *
 * `publish` never waits for the observer: an unread event is simply replaced
 * by a newer one. Once a terminal event is published the slot is frozen, so
 * the terminal event is the last thing any observer sees.
 */
class ProgressChannel {
public:
	ProgressChannel() = default;
	~ProgressChannel() noexcept = default;

	ProgressChannel(const ProgressChannel &) = delete;
	ProgressChannel &operator=(const ProgressChannel &) = delete;
	ProgressChannel(ProgressChannel &&) = delete;
	ProgressChannel &operator=(ProgressChannel &&) = delete;

	/**
	 * @return false if the channel already holds a terminal event and `event` was dropped.
	 */
	bool publish(const ProgressEvent &event);

	/**
	 * @brief Blocks until an event newer than the last one returned is available.
	 * @return The newest event, or std::nullopt if none arrived within `timeout`.
	 */
	std::optional<ProgressEvent> waitForUpdate(std::chrono::milliseconds timeout);

	/**
	 * @brief Blocks until the job has reached a terminal state.
	 */
	ProgressEvent waitForTerminal();

	ProgressEvent getLatest() const;

	bool isTerminal() const;

private:
	mutable std::mutex mutex_;
	std::condition_variable cond_;
	ProgressEvent latest_;
	std::uint64_t sequence_ = 0;
	std::uint64_t readSequence_ = 0;
};

} // namespace ChromaKey::Pipeline

/*
 * ChromaKey Pipeline Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "ChromaKey/Pipeline/ProgressChannel.hpp"

namespace ChromaKey::Pipeline {

bool ProgressChannel::publish(const ProgressEvent &event)
{
	{
		std::lock_guard<std::mutex> lock(mutex_);
		if (Pipeline::isTerminal(latest_.state)) {
			return false;
		}
		latest_ = event;
		++sequence_;
	}
	cond_.notify_all();
	return true;
}

std::optional<ProgressEvent> ProgressChannel::waitForUpdate(std::chrono::milliseconds timeout)
{
	std::unique_lock<std::mutex> lock(mutex_);
	if (!cond_.wait_for(lock, timeout, [this] { return sequence_ != readSequence_; })) {
		return std::nullopt;
	}
	readSequence_ = sequence_;
	return latest_;
}

ProgressEvent ProgressChannel::waitForTerminal()
{
	std::unique_lock<std::mutex> lock(mutex_);
	cond_.wait(lock, [this] { return Pipeline::isTerminal(latest_.state); });
	readSequence_ = sequence_;
	return latest_;
}

ProgressEvent ProgressChannel::getLatest() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return latest_;
}

bool ProgressChannel::isTerminal() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return Pipeline::isTerminal(latest_.state);
}

} // namespace ChromaKey::Pipeline

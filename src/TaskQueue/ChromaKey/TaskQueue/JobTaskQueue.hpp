/*
 * ChromaKey TaskQueue Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <stdexcept>
#include <thread>
#include <utility>

#include <ChromaKey/Logger/ILogger.hpp>

namespace ChromaKey::TaskQueue {

/**
 * @brief A single worker thread that runs long, cooperatively cancellable jobs in FIFO order.
 *
 * The thread is started upon construction and joined upon destruction. Unlike a
 * throttling queue, pending tasks are never dropped: a task whose token was set
 * before it started is still invoked, so that it can report its own cancellation.
 */
class JobTaskQueue {
public:
	/**
	 * @brief Shared cancellation flag. When set to true, the task should stop at its next checkpoint.
	 */
	using CancellationToken = std::shared_ptr<std::atomic<bool>>;

	using CancellableTask = std::function<void(const CancellationToken &)>;

private:
	using QueuedTask = std::pair<CancellableTask, CancellationToken>;

public:
	/**
	 * @param logger The logger to use for internal messages.
	 * @param maxPendingTasks The number of tasks that may wait behind the running one. Must be at least 1.
	 */
	JobTaskQueue(std::shared_ptr<const Logger::ILogger> logger, std::size_t maxPendingTasks)
		: logger_(std::move(logger)),
		  maxPendingTasks_(maxPendingTasks > 0
					   ? maxPendingTasks
					   : throw std::invalid_argument("maxPendingTasks must be greater than 0")),
		  worker_(&JobTaskQueue::workerLoop, this)
	{
	}

	~JobTaskQueue() noexcept { shutdown(); }

	JobTaskQueue(const JobTaskQueue &) = delete;
	JobTaskQueue &operator=(const JobTaskQueue &) = delete;
	JobTaskQueue(JobTaskQueue &&) = delete;
	JobTaskQueue &operator=(JobTaskQueue &&) = delete;

	/**
	 * @brief Cancels the running and pending tasks, lets them finish, and joins the worker.
	 */
	void shutdown() noexcept
	{
		if (worker_.joinable()) {
			stop();
			worker_.join();
		}
	}

	/**
	 * @brief Enqueues a task.
	 * @param task The task body. It receives its own cancellation token.
	 * @param token An existing token to attach, or nullptr to create a fresh one.
	 * @return The token attached to the task.
	 * @throws std::runtime_error if the queue has been stopped or is full.
	 */
	CancellationToken push(CancellableTask task, CancellationToken token = nullptr)
	{
		if (!token) {
			token = std::make_shared<std::atomic<bool>>(false);
		}

		{
			std::lock_guard<std::mutex> lock(mutex_);
			if (stopped_) {
				throw std::runtime_error("push on stopped JobTaskQueue");
			}
			if (queue_.size() >= maxPendingTasks_) {
				throw std::runtime_error("JobTaskQueue is full");
			}
			queue_.push({std::move(task), token});
		}
		cond_.notify_one();
		return token;
	}

	std::size_t pendingCount() const
	{
		std::lock_guard<std::mutex> lock(mutex_);
		return queue_.size();
	}

private:
	void workerLoop()
	{
		while (true) {
			std::optional<QueuedTask> queuedTaskOpt = pop();
			if (!queuedTaskOpt) {
				break;
			}

			{
				std::lock_guard<std::mutex> lock(mutex_);
				currentTaskToken_ = queuedTaskOpt->second;
				if (stopped_) {
					currentTaskToken_->store(true);
				}
			}

			try {
				queuedTaskOpt->first(queuedTaskOpt->second);
			} catch (const std::exception &e) {
				logger_->error("JobTaskExceptionError", {{"message", e.what()}});
			} catch (...) {
				logger_->error("JobTaskUnknownExceptionError", {});
			}

			{
				std::lock_guard<std::mutex> lock(mutex_);
				currentTaskToken_.reset();
			}
		}
	}

	/**
	 * @return The next task, or std::nullopt once the queue is stopped and drained.
	 */
	std::optional<QueuedTask> pop()
	{
		std::unique_lock<std::mutex> lock(mutex_);
		cond_.wait(lock, [this] { return !queue_.empty() || stopped_; });

		if (queue_.empty()) {
			return std::nullopt;
		}

		auto queuedTask = std::move(queue_.front());
		queue_.pop();

		return queuedTask;
	}

	/**
	 * @brief Stops accepting tasks and raises the token of every running and pending task.
	 * Pending tasks still run so that each one observes its cancellation.
	 */
	void stop()
	{
		{
			std::lock_guard<std::mutex> lock(mutex_);
			if (stopped_) {
				return;
			}
			stopped_ = true;

			std::queue<QueuedTask> pending;
			while (!queue_.empty()) {
				queue_.front().second->store(true);
				pending.push(std::move(queue_.front()));
				queue_.pop();
			}
			queue_ = std::move(pending);

			if (currentTaskToken_) {
				currentTaskToken_->store(true);
			}
		}
		cond_.notify_all();
	}

	const std::shared_ptr<const Logger::ILogger> logger_;
	const std::size_t maxPendingTasks_;
	mutable std::mutex mutex_;
	std::condition_variable cond_;
	std::queue<QueuedTask> queue_;
	bool stopped_ = false;
	CancellationToken currentTaskToken_;
	std::thread worker_;
};

} // namespace ChromaKey::TaskQueue

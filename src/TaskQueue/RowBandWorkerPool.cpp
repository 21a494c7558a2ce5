/*
 * ChromaKey TaskQueue Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "ChromaKey/TaskQueue/RowBandWorkerPool.hpp"

#include <algorithm>
#include <utility>

namespace ChromaKey::TaskQueue {

RowBandWorkerPool::RowBandWorkerPool(std::shared_ptr<const Logger::ILogger> logger, std::size_t numThreads)
	: logger_(std::move(logger))
{
	const std::size_t numHelpers = numThreads > 1 ? numThreads - 1 : 0;
	workers_.reserve(numHelpers);
	for (std::size_t i = 0; i < numHelpers; ++i) {
		workers_.emplace_back(&RowBandWorkerPool::workerLoop, this);
	}
	logger_->debug("RowBandWorkerPool started with {} threads", getNumThreads());
}

RowBandWorkerPool::~RowBandWorkerPool() noexcept
{
	{
		std::lock_guard<std::mutex> lock(mutex_);
		stopped_ = true;
	}
	workCond_.notify_all();

	for (std::thread &worker : workers_) {
		if (worker.joinable()) {
			worker.join();
		}
	}
}

void RowBandWorkerPool::run(std::size_t count, const BandFunction &bandFunction)
{
	if (count == 0) {
		return;
	}

	if (workers_.empty() || count == 1) {
		bandFunction(0, count);
		return;
	}

	std::lock_guard<std::mutex> runLock(runMutex_);

	std::unique_lock<std::mutex> lock(mutex_);
	numBands_ = std::min(getNumThreads(), count);
	bandSize_ = (count + numBands_ - 1) / numBands_;
	numBands_ = (count + bandSize_ - 1) / bandSize_;
	count_ = count;
	bandFunction_ = &bandFunction;
	nextBand_ = 0;
	remainingBands_ = numBands_;
	firstException_ = nullptr;
	++generation_;
	workCond_.notify_all();

	while (runNextBand(lock)) {
	}

	doneCond_.wait(lock, [this] { return remainingBands_ == 0; });

	bandFunction_ = nullptr;
	std::exception_ptr exception = std::exchange(firstException_, nullptr);
	lock.unlock();

	if (exception) {
		std::rethrow_exception(exception);
	}
}

void RowBandWorkerPool::workerLoop()
{
	std::size_t seenGeneration = 0;
	std::unique_lock<std::mutex> lock(mutex_);

	while (true) {
		workCond_.wait(lock, [&] { return stopped_ || generation_ != seenGeneration; });
		if (stopped_) {
			return;
		}
		seenGeneration = generation_;

		while (runNextBand(lock)) {
		}
	}
}

/**
 * Must be called with `lock` held. Releases it while the band runs.
 * @return false when no band is left to claim.
 */
bool RowBandWorkerPool::runNextBand(std::unique_lock<std::mutex> &lock)
{
	if (!bandFunction_ || nextBand_ >= numBands_) {
		return false;
	}

	const std::size_t band = nextBand_++;
	const std::size_t begin = band * bandSize_;
	const std::size_t end = std::min(count_, begin + bandSize_);
	const BandFunction &bandFunction = *bandFunction_;

	lock.unlock();
	std::exception_ptr exception;
	try {
		bandFunction(begin, end);
	} catch (...) {
		exception = std::current_exception();
	}
	lock.lock();

	if (exception && !firstException_) {
		firstException_ = exception;
	}

	if (--remainingBands_ == 0) {
		doneCond_.notify_all();
	}
	return true;
}

} // namespace ChromaKey::TaskQueue

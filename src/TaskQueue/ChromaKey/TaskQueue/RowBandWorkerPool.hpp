/*
 * ChromaKey TaskQueue Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <ChromaKey/Logger/ILogger.hpp>

namespace ChromaKey::TaskQueue {

/**
 * @class RowBandWorkerPool
 * @brief Splits an index range into contiguous bands and runs them on persistent worker threads.
 *
 * `run` blocks until every band has finished; the calling thread processes
 * bands too. Bands are disjoint, so a band function that only writes the rows
 * of its own band needs no further synchronization.
 *
 * If any band throws, the remaining bands still run and the first exception
 * is rethrown from `run`.
 */
class RowBandWorkerPool {
public:
	using BandFunction = std::function<void(std::size_t begin, std::size_t end)>;

	/**
	 * @param numThreads Total number of threads including the caller. 0 is treated as 1.
	 */
	RowBandWorkerPool(std::shared_ptr<const Logger::ILogger> logger, std::size_t numThreads);

	~RowBandWorkerPool() noexcept;

	RowBandWorkerPool(const RowBandWorkerPool &) = delete;
	RowBandWorkerPool &operator=(const RowBandWorkerPool &) = delete;
	RowBandWorkerPool(RowBandWorkerPool &&) = delete;
	RowBandWorkerPool &operator=(RowBandWorkerPool &&) = delete;

	std::size_t getNumThreads() const noexcept { return workers_.size() + 1; }

	void run(std::size_t count, const BandFunction &bandFunction);

private:
	void workerLoop();
	bool runNextBand(std::unique_lock<std::mutex> &lock);

	const std::shared_ptr<const Logger::ILogger> logger_;

	std::mutex runMutex_;

	std::mutex mutex_;
	std::condition_variable workCond_;
	std::condition_variable doneCond_;
	bool stopped_ = false;
	std::size_t generation_ = 0;

	const BandFunction *bandFunction_ = nullptr;
	std::size_t count_ = 0;
	std::size_t bandSize_ = 0;
	std::size_t numBands_ = 0;
	std::size_t nextBand_ = 0;
	std::size_t remainingBands_ = 0;
	std::exception_ptr firstException_;

	std::vector<std::thread> workers_;
};

} // namespace ChromaKey::TaskQueue

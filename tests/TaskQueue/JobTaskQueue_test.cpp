/*
 * ChromaKey TaskQueue Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include <ChromaKey/Logger/NullLogger.hpp>
#include <ChromaKey/TaskQueue/JobTaskQueue.hpp>

using namespace ChromaKey;
using namespace ChromaKey::TaskQueue;

TEST(JobTaskQueueTest, RunsTasksInOrder)
{
	std::vector<int> order;
	std::mutex mutex;
	std::promise<void> done;

	{
		JobTaskQueue queue(Logger::NullLogger::instance(), 8);
		for (int i = 0; i < 4; ++i) {
			queue.push([&, i](const JobTaskQueue::CancellationToken &) {
				std::lock_guard<std::mutex> lock(mutex);
				order.push_back(i);
				if (i == 3) {
					done.set_value();
				}
			});
		}
		done.get_future().wait();
	}

	EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3}));
}

TEST(JobTaskQueueTest, UsesGivenToken)
{
	JobTaskQueue queue(Logger::NullLogger::instance(), 1);
	auto token = std::make_shared<std::atomic<bool>>(false);
	std::promise<bool> seen;

	const auto returned = queue.push(
		[&](const JobTaskQueue::CancellationToken &t) { seen.set_value(t.get() == token.get()); }, token);

	EXPECT_EQ(returned, token);
	EXPECT_TRUE(seen.get_future().get());
}

TEST(JobTaskQueueTest, ShutdownCancelsRunningAndPendingTasksButStillRunsThem)
{
	std::promise<void> started;
	std::atomic<bool> firstSawCancel = false;
	std::atomic<bool> secondSawCancel = false;

	JobTaskQueue queue(Logger::NullLogger::instance(), 4);
	queue.push([&](const JobTaskQueue::CancellationToken &token) {
		started.set_value();
		while (!token->load()) {
			std::this_thread::sleep_for(std::chrono::milliseconds(1));
		}
		firstSawCancel = true;
	});
	queue.push([&](const JobTaskQueue::CancellationToken &token) { secondSawCancel = token->load(); });

	started.get_future().wait();
	queue.shutdown();

	EXPECT_TRUE(firstSawCancel);
	EXPECT_TRUE(secondSawCancel);
}

TEST(JobTaskQueueTest, ThrowingTaskDoesNotStopWorker)
{
	JobTaskQueue queue(Logger::NullLogger::instance(), 4);
	std::promise<void> ran;

	queue.push([](const JobTaskQueue::CancellationToken &) { throw std::runtime_error("boom"); });
	queue.push([&](const JobTaskQueue::CancellationToken &) { ran.set_value(); });

	EXPECT_EQ(ran.get_future().wait_for(std::chrono::seconds(5)), std::future_status::ready);
}

TEST(JobTaskQueueTest, PushAfterShutdownThrows)
{
	JobTaskQueue queue(Logger::NullLogger::instance(), 1);
	queue.shutdown();
	EXPECT_THROW(queue.push([](const JobTaskQueue::CancellationToken &) {}), std::runtime_error);
}

TEST(JobTaskQueueTest, RejectsZeroCapacity)
{
	EXPECT_THROW(JobTaskQueue(Logger::NullLogger::instance(), 0), std::invalid_argument);
}

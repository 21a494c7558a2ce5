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
#include <stdexcept>
#include <vector>

#include <ChromaKey/Logger/NullLogger.hpp>
#include <ChromaKey/TaskQueue/RowBandWorkerPool.hpp>

using namespace ChromaKey;
using namespace ChromaKey::TaskQueue;

TEST(RowBandWorkerPoolTest, CoversEveryIndexExactlyOnce)
{
	RowBandWorkerPool pool(Logger::NullLogger::instance(), 4);
	EXPECT_EQ(pool.getNumThreads(), 4u);

	for (std::size_t count : {1u, 3u, 4u, 7u, 100u, 1081u}) {
		std::vector<std::atomic<int>> hits(count);
		pool.run(count, [&](std::size_t begin, std::size_t end) {
			for (std::size_t i = begin; i < end; ++i) {
				hits[i].fetch_add(1);
			}
		});
		for (std::size_t i = 0; i < count; ++i) {
			ASSERT_EQ(hits[i].load(), 1) << "count=" << count << " index=" << i;
		}
	}
}

TEST(RowBandWorkerPoolTest, ZeroCountDoesNotCall)
{
	RowBandWorkerPool pool(Logger::NullLogger::instance(), 2);
	bool called = false;
	pool.run(0, [&](std::size_t, std::size_t) { called = true; });
	EXPECT_FALSE(called);
}

TEST(RowBandWorkerPoolTest, SingleThreadRunsInline)
{
	RowBandWorkerPool pool(Logger::NullLogger::instance(), 0);
	EXPECT_EQ(pool.getNumThreads(), 1u);

	std::size_t calls = 0;
	pool.run(10, [&](std::size_t begin, std::size_t end) {
		++calls;
		EXPECT_EQ(begin, 0u);
		EXPECT_EQ(end, 10u);
	});
	EXPECT_EQ(calls, 1u);
}

TEST(RowBandWorkerPoolTest, RethrowsBandException)
{
	RowBandWorkerPool pool(Logger::NullLogger::instance(), 3);
	EXPECT_THROW(pool.run(30,
			      [](std::size_t begin, std::size_t) {
				      if (begin == 0) {
					      throw std::runtime_error("band failed");
				      }
			      }),
		     std::runtime_error);

	std::atomic<std::size_t> total = 0;
	pool.run(30, [&](std::size_t begin, std::size_t end) { total += end - begin; });
	EXPECT_EQ(total.load(), 30u);
}

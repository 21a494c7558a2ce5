/*
 * ChromaKey Keying Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <stdexcept>
#include <utility>
#include <vector>

#include <ChromaKey/Keying/FrameScaler.hpp>
#include <ChromaKey/Logger/NullLogger.hpp>

using namespace ChromaKey;
using namespace ChromaKey::Keying;

TEST(FrameScalerTest, SameSizeIsExactCopy)
{
	TaskQueue::RowBandWorkerPool pool(Logger::NullLogger::instance(), 2);
	Frame source(3, 2, PixelFormat::Rgb24);
	for (std::size_t i = 0; i < source.getData().size(); ++i) {
		source.getData()[i] = static_cast<std::uint8_t>(i * 13);
	}

	const Frame copy = resizeBilinear(source, 3, 2, pool);

	ASSERT_EQ(copy.getData().size(), source.getData().size());
	for (std::size_t i = 0; i < source.getData().size(); ++i) {
		EXPECT_EQ(copy.getData()[i], source.getData()[i]);
	}
}

TEST(FrameScalerTest, UniformFrameStaysUniform)
{
	TaskQueue::RowBandWorkerPool pool(Logger::NullLogger::instance(), 2);
	const Frame source = Frame::filled(5, 4, PixelFormat::Rgb24, {12, 34, 56});

	for (const auto &[w, h] : {std::pair{20u, 9u}, std::pair{2u, 1u}, std::pair{7u, 13u}}) {
		const Frame scaled = resizeBilinear(source, w, h, pool);
		ASSERT_EQ(scaled.getWidth(), w);
		ASSERT_EQ(scaled.getHeight(), h);
		for (std::uint32_t y = 0; y < h; ++y) {
			for (std::uint32_t x = 0; x < w; ++x) {
				EXPECT_EQ(scaled.getPixel(x, y), (Color{12, 34, 56}));
			}
		}
	}
}

TEST(FrameScalerTest, UpscaleInterpolatesAtPixelCenters)
{
	TaskQueue::RowBandWorkerPool pool(Logger::NullLogger::instance(), 1);
	Frame source(2, 1, PixelFormat::Rgb24);
	source.setPixel(0, 0, {0, 0, 0});
	source.setPixel(1, 0, {255, 255, 255});

	const Frame scaled = resizeBilinear(source, 4, 1, pool);

	EXPECT_EQ(scaled.getPixel(0, 0).r, 0);
	EXPECT_EQ(scaled.getPixel(1, 0).r, 64);
	EXPECT_EQ(scaled.getPixel(2, 0).r, 191);
	EXPECT_EQ(scaled.getPixel(3, 0).r, 255);
}

TEST(FrameScalerTest, KeepsAlphaChannel)
{
	TaskQueue::RowBandWorkerPool pool(Logger::NullLogger::instance(), 1);
	const Frame source = Frame::filled(2, 2, PixelFormat::Rgba32, {1, 2, 3}, 77);

	const Frame scaled = resizeBilinear(source, 3, 3, pool);

	EXPECT_EQ(scaled.getFormat(), PixelFormat::Rgba32);
	EXPECT_EQ(scaled.getAlpha(1, 1), 77);
}

TEST(FrameScalerTest, RejectsEmptyInputAndTarget)
{
	TaskQueue::RowBandWorkerPool pool(Logger::NullLogger::instance(), 1);
	EXPECT_THROW(resizeBilinear(Frame(), 2, 2, pool), std::invalid_argument);
	EXPECT_THROW(resizeBilinear(Frame(2, 2, PixelFormat::Rgb24), 0, 2, pool), std::invalid_argument);
}

TEST(FrameTest, FromBytesChecksSize)
{
	const std::vector<std::uint8_t> bytes(2 * 2 * 3, 9);
	EXPECT_NO_THROW(Frame::fromBytes(2, 2, PixelFormat::Rgb24, bytes));
	EXPECT_THROW(Frame::fromBytes(2, 2, PixelFormat::Rgba32, bytes), std::invalid_argument);
}

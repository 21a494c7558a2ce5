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

#include <ChromaKey/Keying/AlphaCompositor.hpp>
#include <ChromaKey/Logger/NullLogger.hpp>

using namespace ChromaKey;
using namespace ChromaKey::Keying;

class AlphaCompositorTest : public ::testing::Test {
protected:
	TaskQueue::RowBandWorkerPool pool{Logger::NullLogger::instance(), 2};

	const Color foregroundColor{200, 40, 10};
	const Color backgroundColor{0, 0, 100};

	Frame foreground = Frame::filled(4, 3, PixelFormat::Rgb24, foregroundColor);
	Frame background = Frame::filled(4, 3, PixelFormat::Rgb24, backgroundColor);
};

TEST_F(AlphaCompositorTest, ZeroWeightKeepsForeground)
{
	const AlphaMask mask(4, 3, 0.0f);

	for (SinkCapability capability : {SinkCapability::Opaque, SinkCapability::AlphaCapable}) {
		const auto compositor = makeCompositor(capability);
		const Frame output = compositor->composite(foreground, mask, &background, pool);
		for (std::uint32_t y = 0; y < 3; ++y) {
			for (std::uint32_t x = 0; x < 4; ++x) {
				EXPECT_EQ(output.getPixel(x, y), foregroundColor);
				EXPECT_EQ(output.getAlpha(x, y), 255);
			}
		}
	}
}

TEST_F(AlphaCompositorTest, FullWeightShowsBackground)
{
	const AlphaMask mask(4, 3, 1.0f);

	for (SinkCapability capability : {SinkCapability::Opaque, SinkCapability::AlphaCapable}) {
		const auto compositor = makeCompositor(capability);
		const Frame output = compositor->composite(foreground, mask, &background, pool);
		for (std::uint32_t y = 0; y < 3; ++y) {
			for (std::uint32_t x = 0; x < 4; ++x) {
				EXPECT_EQ(output.getPixel(x, y), backgroundColor);
				EXPECT_EQ(output.getAlpha(x, y), 255);
			}
		}
	}
}

TEST_F(AlphaCompositorTest, BackgroundOfOtherSizeIsScaledToForeground)
{
	const Frame small = Frame::filled(2, 2, PixelFormat::Rgb24, backgroundColor);
	const AlphaMask mask(4, 3, 1.0f);

	const Frame output = OpaqueCompositor(kBlack).composite(foreground, mask, &small, pool);

	EXPECT_EQ(output.getWidth(), 4u);
	EXPECT_EQ(output.getHeight(), 3u);
	for (std::uint32_t y = 0; y < 3; ++y) {
		for (std::uint32_t x = 0; x < 4; ++x) {
			EXPECT_EQ(output.getPixel(x, y), backgroundColor);
		}
	}
}

TEST_F(AlphaCompositorTest, HalfWeightBlendsLinearly)
{
	const AlphaMask mask(4, 3, 0.5f);
	const Frame output = OpaqueCompositor(kBlack).composite(foreground, mask, &background, pool);
	EXPECT_EQ(output.getPixel(0, 0), (Color{100, 20, 55}));
}

TEST_F(AlphaCompositorTest, OpaqueWithoutBackgroundUsesSolidColor)
{
	AlphaMask mask(4, 3, 0.0f);
	mask.getRow(1)[2] = 1.0f;

	const Frame output = OpaqueCompositor({10, 20, 30}).composite(foreground, mask, nullptr, pool);

	EXPECT_EQ(output.getFormat(), PixelFormat::Rgb24);
	EXPECT_EQ(output.getPixel(2, 1), (Color{10, 20, 30}));
	EXPECT_EQ(output.getPixel(0, 0), foregroundColor);
}

TEST_F(AlphaCompositorTest, AlphaWithoutBackgroundBecomesTransparent)
{
	AlphaMask mask(4, 3, 0.0f);
	mask.getRow(0)[0] = 1.0f;
	mask.getRow(0)[1] = 0.5f;

	const Frame output = AlphaCompositor().composite(foreground, mask, nullptr, pool);

	EXPECT_EQ(output.getFormat(), PixelFormat::Rgba32);
	EXPECT_EQ(output.getAlpha(0, 0), 0);
	EXPECT_EQ(output.getAlpha(1, 0), 128);
	EXPECT_EQ(output.getAlpha(2, 0), 255);
	EXPECT_EQ(output.getPixel(0, 0), foregroundColor);
}

TEST_F(AlphaCompositorTest, FactorySelectsStrategyByCapability)
{
	EXPECT_EQ(makeCompositor(SinkCapability::Opaque)->getOutputFormat(), PixelFormat::Rgb24);
	EXPECT_EQ(makeCompositor(SinkCapability::AlphaCapable)->getOutputFormat(), PixelFormat::Rgba32);
	EXPECT_EQ(makeCompositor(SinkCapability::AlphaCapable)->getSinkCapability(), SinkCapability::AlphaCapable);
}

TEST_F(AlphaCompositorTest, RejectsMismatchedMask)
{
	const AlphaMask mask(3, 3, 0.0f);
	EXPECT_THROW(AlphaCompositor().composite(foreground, mask, nullptr, pool), std::invalid_argument);
}

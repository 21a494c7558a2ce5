/*
 * ChromaKey Keying Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <ChromaKey/Keying/KeyColorDetector.hpp>
#include <ChromaKey/Logger/NullLogger.hpp>

using namespace ChromaKey;
using namespace ChromaKey::Keying;

class KeyColorDetectorTest : public ::testing::Test {
protected:
	TaskQueue::RowBandWorkerPool pool{Logger::NullLogger::instance(), 2};
	KeyColorDetector detector{Logger::NullLogger::instance()};
};

TEST_F(KeyColorDetectorTest, UniformGreenBordersYieldThatGreen)
{
	const Color green{20, 190, 40};
	const Frame frame = Frame::filled(64, 48, PixelFormat::Rgb24, green);

	EXPECT_EQ(detector.tryDetect(frame, pool), green);
	EXPECT_EQ(detector.detect(frame, pool), green);
}

TEST_F(KeyColorDetectorTest, DetectsNonGreenScreens)
{
	const Frame blue = Frame::filled(64, 48, PixelFormat::Rgb24, {10, 30, 220});
	EXPECT_EQ(detector.tryDetect(blue, pool), (Color{10, 30, 220}));
}

TEST_F(KeyColorDetectorTest, LargeFramesAreSampledOnThumbnail)
{
	const Frame frame = Frame::filled(1280, 720, PixelFormat::Rgb24, kDefaultKeyColor);
	EXPECT_EQ(detector.tryDetect(frame, pool), kDefaultKeyColor);
}

TEST_F(KeyColorDetectorTest, PicksMostDominantCorner)
{
	Frame frame = Frame::filled(48, 48, PixelFormat::Rgb24, {120, 120, 120});
	for (std::uint32_t y = 42; y < 48; ++y) {
		for (std::uint32_t x = 42; x < 48; ++x) {
			frame.setPixel(x, y, {30, 200, 60});
		}
	}
	for (std::uint32_t y = 0; y < 6; ++y) {
		for (std::uint32_t x = 0; x < 6; ++x) {
			frame.setPixel(x, y, {90, 150, 90});
		}
	}

	EXPECT_EQ(detector.tryDetect(frame, pool), (Color{30, 200, 60}));
}

TEST_F(KeyColorDetectorTest, FallsBackWhenNothingIsDominant)
{
	const Frame gray = Frame::filled(64, 48, PixelFormat::Rgb24, {128, 128, 128});
	EXPECT_FALSE(detector.tryDetect(gray, pool));
	EXPECT_EQ(detector.detect(gray, pool), kDefaultKeyColor);
}

TEST_F(KeyColorDetectorTest, FallsBackOnEmptyFrame)
{
	EXPECT_FALSE(detector.tryDetect(Frame(), pool));
	EXPECT_EQ(detector.detect(Frame(), pool), kDefaultKeyColor);
}

TEST_F(KeyColorDetectorTest, FallbackColorIsConfigurable)
{
	DetectorProperty property;
	property.fallbackColor = {0, 0, 255};
	const KeyColorDetector blueFallback(Logger::NullLogger::instance(), property);

	EXPECT_EQ(blueFallback.detect(Frame::filled(8, 8, PixelFormat::Rgb24, {50, 50, 50}), pool),
		  (Color{0, 0, 255}));
}

TEST_F(KeyColorDetectorTest, CornerPatchesScaleWithFrame)
{
	const auto small = detector.getCornerPatches(48, 48);
	ASSERT_EQ(small.size(), 4u);
	EXPECT_EQ(small[0].width, 6u);
	EXPECT_EQ(small[3].x, 42u);
	EXPECT_EQ(small[3].y, 42u);

	const auto wide = detector.getCornerPatches(480, 240);
	EXPECT_EQ(wide[0].width, 20u);
	EXPECT_EQ(wide[0].height, 10u);

	const auto tiny = detector.getCornerPatches(4, 3);
	EXPECT_EQ(tiny[0].width, 4u);
	EXPECT_EQ(tiny[0].height, 3u);

	EXPECT_TRUE(detector.getCornerPatches(0, 10).empty());
}

TEST_F(KeyColorDetectorTest, DominanceIsLeadOverStrongestOtherChannel)
{
	EXPECT_FLOAT_EQ(KeyColorDetector::dominance({10, 200, 50}), 150.0f);
	EXPECT_FLOAT_EQ(KeyColorDetector::dominance({220, 10, 100}), 120.0f);
	EXPECT_FLOAT_EQ(KeyColorDetector::dominance({80, 80, 80}), 0.0f);
}

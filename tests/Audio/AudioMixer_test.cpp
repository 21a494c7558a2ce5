/*
 * ChromaKey Audio Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <utility>
#include <vector>

#include <ChromaKey/Audio/AudioMixer.hpp>
#include <ChromaKey/Logger/NullLogger.hpp>

using namespace ChromaKey;
using namespace ChromaKey::Audio;

namespace {

AudioBuffer makeBuffer(std::uint32_t sampleRate, std::uint32_t channels, std::vector<float> samples)
{
	AudioBuffer buffer;
	buffer.sampleRate = sampleRate;
	buffer.channels = channels;
	buffer.samples = std::move(samples);
	return buffer;
}

} // anonymous namespace

class AudioMixerTest : public ::testing::Test {
protected:
	AudioMixer mixer{Logger::NullLogger::instance()};

	const AudioBuffer foreground = makeBuffer(48000, 2, {0.1f, 0.2f, 0.3f, 0.4f});
	const AudioBuffer background = makeBuffer(48000, 2, {0.5f, 0.5f, -0.5f, -0.5f});
};

TEST_F(AudioMixerTest, ForegroundModePassesForegroundThrough)
{
	const auto result = mixer.mix(AudioMode::Foreground, foreground, background);
	ASSERT_TRUE(result.has_value());
	EXPECT_EQ(result->samples, foreground.samples);

	EXPECT_FALSE(mixer.mix(AudioMode::Foreground, std::nullopt, background).has_value());
}

TEST_F(AudioMixerTest, BackgroundModePassesBackgroundThrough)
{
	const auto result = mixer.mix(AudioMode::Background, foreground, background);
	ASSERT_TRUE(result.has_value());
	EXPECT_EQ(result->samples, background.samples);

	EXPECT_FALSE(mixer.mix(AudioMode::Background, foreground, std::nullopt).has_value());
}

TEST_F(AudioMixerTest, NoneModeIsAlwaysSilent)
{
	EXPECT_FALSE(mixer.mix(AudioMode::None, foreground, background).has_value());
	EXPECT_FALSE(mixer.mix(AudioMode::None, foreground, std::nullopt).has_value());
	EXPECT_FALSE(mixer.mix(AudioMode::None, std::nullopt, std::nullopt).has_value());
}

TEST_F(AudioMixerTest, MixWithOneStreamAbsentPassesTheOtherThrough)
{
	const auto onlyForeground = mixer.mix(AudioMode::Mix, foreground, std::nullopt);
	ASSERT_TRUE(onlyForeground.has_value());
	EXPECT_EQ(onlyForeground->samples, foreground.samples);

	const auto onlyBackground = mixer.mix(AudioMode::Mix, std::nullopt, background);
	ASSERT_TRUE(onlyBackground.has_value());
	EXPECT_EQ(onlyBackground->samples, background.samples);

	EXPECT_FALSE(mixer.mix(AudioMode::Mix, std::nullopt, std::nullopt).has_value());
}

TEST_F(AudioMixerTest, MixSumsBothStreams)
{
	const auto result = mixer.mix(AudioMode::Mix, foreground, background);
	ASSERT_TRUE(result.has_value());
	ASSERT_EQ(result->samples.size(), 4u);
	EXPECT_FLOAT_EQ(result->samples[0], 0.6f);
	EXPECT_FLOAT_EQ(result->samples[1], 0.7f);
	EXPECT_FLOAT_EQ(result->samples[2], -0.2f);
	EXPECT_FLOAT_EQ(result->samples[3], -0.1f);
}

TEST_F(AudioMixerTest, MixIsNormalizedToAvoidClipping)
{
	const AudioBuffer loudA = makeBuffer(48000, 1, {0.9f, 0.5f});
	const AudioBuffer loudB = makeBuffer(48000, 1, {0.9f, -0.1f});

	const auto result = mixer.mix(AudioMode::Mix, loudA, loudB);
	ASSERT_TRUE(result.has_value());
	EXPECT_FLOAT_EQ(result->samples[0], 1.0f);
	EXPECT_FLOAT_EQ(result->samples[1], 0.4f / 1.8f);
	for (float sample : result->samples) {
		EXPECT_LE(std::abs(sample), 1.0f);
	}
}

TEST_F(AudioMixerTest, MixLastsAsLongAsTheLongerStream)
{
	const AudioBuffer shortStream = makeBuffer(48000, 2, {0.1f, 0.1f});
	const auto result = mixer.mix(AudioMode::Mix, shortStream, background);
	ASSERT_TRUE(result.has_value());
	ASSERT_EQ(result->getFrameCount(), 2u);
	EXPECT_FLOAT_EQ(result->samples[2], -0.5f);
}

TEST_F(AudioMixerTest, MixAdaptsBackgroundToForegroundFormat)
{
	const AudioBuffer mono24k = makeBuffer(24000, 1, {0.2f, 0.4f});

	const auto result = mixer.mix(AudioMode::Mix, foreground, mono24k);
	ASSERT_TRUE(result.has_value());
	EXPECT_EQ(result->sampleRate, 48000u);
	EXPECT_EQ(result->channels, 2u);
	ASSERT_EQ(result->getFrameCount(), 4u);
	EXPECT_FLOAT_EQ(result->samples[0], 0.1f + 0.2f);
	EXPECT_FLOAT_EQ(result->samples[1], 0.2f + 0.2f);
	EXPECT_FLOAT_EQ(result->samples[2], 0.3f + 0.3f);
	EXPECT_FLOAT_EQ(result->samples[3], 0.4f + 0.3f);
}

TEST_F(AudioMixerTest, RejectsMalformedBuffers)
{
	const AudioBuffer broken = makeBuffer(48000, 2, {0.1f, 0.2f, 0.3f});
	EXPECT_THROW(mixer.mix(AudioMode::Foreground, broken, std::nullopt), std::invalid_argument);
}

TEST(AudioModeTest, ParsesNames)
{
	EXPECT_EQ(parseAudioMode("foreground"), AudioMode::Foreground);
	EXPECT_EQ(parseAudioMode("background"), AudioMode::Background);
	EXPECT_EQ(parseAudioMode("mix"), AudioMode::Mix);
	EXPECT_EQ(parseAudioMode("none"), AudioMode::None);
	EXPECT_FALSE(parseAudioMode("both").has_value());
	EXPECT_EQ(toString(AudioMode::Mix), "mix");
}

TEST(AudioRemixTest, DownmixAveragesChannels)
{
	const AudioBuffer stereo = makeBuffer(48000, 2, {0.2f, 0.4f, -1.0f, 1.0f});
	const AudioBuffer mono = AudioMixer::remixChannels(stereo, 1);
	ASSERT_EQ(mono.samples.size(), 2u);
	EXPECT_FLOAT_EQ(mono.samples[0], 0.3f);
	EXPECT_FLOAT_EQ(mono.samples[1], 0.0f);
}

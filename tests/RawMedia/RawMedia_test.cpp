/*
 * ChromaKey RawMedia Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <ChromaKey/Logger/NullLogger.hpp>
#include <ChromaKey/Pipeline/FrameProcessingError.hpp>
#include <ChromaKey/RawMedia/PcmFile.hpp>
#include <ChromaKey/RawMedia/RawFileSink.hpp>
#include <ChromaKey/RawMedia/RawVideoReader.hpp>

using namespace ChromaKey;
using namespace ChromaKey::RawMedia;
using Keying::Color;
using Keying::Frame;
using Keying::PixelFormat;

namespace {

std::unique_ptr<std::istream> makeStream(const std::vector<std::uint8_t> &bytes)
{
	return std::make_unique<std::istringstream>(std::string(bytes.begin(), bytes.end()));
}

std::vector<std::uint8_t> readAll(const std::filesystem::path &path)
{
	std::ifstream ifs(path, std::ios::binary);
	return {std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

} // anonymous namespace

TEST(RawVideoReaderTest, ReadsWholeFramesInOrder)
{
	const std::vector<std::uint8_t> bytes{1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12};
	RawVideoReader reader(makeStream(bytes), 2, 1, PixelFormat::Rgb24, 2);

	EXPECT_EQ(reader.getFrameSize(), 6u);
	EXPECT_EQ(reader.getTotalFrames(), std::optional<std::size_t>(2));

	const std::optional<Frame> first = reader.next();
	ASSERT_TRUE(first.has_value());
	EXPECT_EQ(first->getPixel(0, 0), (Color{1, 2, 3}));
	EXPECT_EQ(first->getPixel(1, 0), (Color{4, 5, 6}));

	const std::optional<Frame> second = reader.next();
	ASSERT_TRUE(second.has_value());
	EXPECT_EQ(second->getPixel(1, 0), (Color{10, 11, 12}));

	EXPECT_FALSE(reader.next().has_value());
}

TEST(RawVideoReaderTest, TruncatedFrameIsReportedWithItsIndex)
{
	const std::vector<std::uint8_t> bytes{1, 2, 3, 4, 5, 6, 7, 8};
	RawVideoReader reader(makeStream(bytes), 2, 1);

	ASSERT_TRUE(reader.next().has_value());
	try {
		(void)reader.next();
		FAIL() << "expected FrameProcessingError";
	} catch (const Pipeline::FrameProcessingError &e) {
		EXPECT_EQ(e.getFrameIndex(), 1u);
	}
}

TEST(RawVideoReaderTest, RestartRewindsToFirstFrame)
{
	const std::vector<std::uint8_t> bytes{1, 2, 3, 4, 5, 6};
	RawVideoReader reader(makeStream(bytes), 1, 1);
	ASSERT_TRUE(reader.isRestartable());

	EXPECT_EQ(reader.next()->getPixel(0, 0), (Color{1, 2, 3}));
	EXPECT_EQ(reader.next()->getPixel(0, 0), (Color{4, 5, 6}));
	EXPECT_FALSE(reader.next().has_value());

	reader.restart();
	EXPECT_EQ(reader.next()->getPixel(0, 0), (Color{1, 2, 3}));
}

TEST(RawVideoReaderTest, OpenDerivesFrameCountFromFileSize)
{
	const std::filesystem::path path = std::filesystem::temp_directory_path() / "chromakey_rawvideo_test.rgb";
	{
		std::ofstream ofs(path, std::ios::binary);
		const std::string bytes(2 * 2 * 3 * 3, '\x40');
		ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
	}

	const std::unique_ptr<RawVideoReader> reader = RawVideoReader::open(path, 2, 2);
	EXPECT_EQ(reader->getTotalFrames(), std::optional<std::size_t>(3));

	std::size_t count = 0;
	while (const std::optional<Frame> frame = reader->next()) {
		EXPECT_EQ(frame->getPixel(1, 1), (Color{0x40, 0x40, 0x40}));
		++count;
	}
	EXPECT_EQ(count, 3u);

	const Frame image = readRawImage(path, 2, 2);
	EXPECT_EQ(image.getWidth(), 2u);
	EXPECT_THROW(readRawImage(path, 8, 8), std::runtime_error);

	std::filesystem::remove(path);
	EXPECT_THROW(RawVideoReader::open(path, 2, 2), std::runtime_error);
}

TEST(PcmFileTest, StreamRoundTripKeepsFormatAndDropsPartialFrames)
{
	Audio::AudioBuffer audio;
	audio.sampleRate = 44100;
	audio.channels = 2;
	audio.samples = {0.5f, -0.5f, 1.0f, -1.0f};

	std::stringstream stream;
	writePcmF32(stream, audio);
	EXPECT_EQ(stream.str().size(), 16u);

	// One extra sample that does not complete a stereo frame.
	const float extra = 0.25f;
	stream.write(reinterpret_cast<const char *>(&extra), sizeof(extra));

	const Audio::AudioBuffer read = readPcmF32(stream, 44100, 2);
	EXPECT_EQ(read.sampleRate, 44100u);
	EXPECT_EQ(read.channels, 2u);
	EXPECT_EQ(read.samples, audio.samples);
}

TEST(PcmFileTest, MissingFileThrows)
{
	const std::filesystem::path path = std::filesystem::temp_directory_path() / "chromakey_pcm_test_missing.f32";
	std::filesystem::remove(path);
	EXPECT_THROW(readPcmF32File(path, 48000, 2), std::runtime_error);
}

TEST(RawFileSinkTest, WritesFramesAndAudio)
{
	const std::filesystem::path videoPath = std::filesystem::temp_directory_path() / "chromakey_sink_test.rgba";
	const std::filesystem::path audioPath = std::filesystem::temp_directory_path() / "chromakey_sink_test.f32";

	{
		RawFileSink sink(Logger::NullLogger::instance(), videoPath, true, audioPath);
		EXPECT_EQ(sink.getCapability(), Keying::SinkCapability::AlphaCapable);

		sink.writeFrame(Frame::filled(2, 1, PixelFormat::Rgba32, Color{1, 2, 3}, 4));
		sink.writeFrame(Frame::filled(2, 1, PixelFormat::Rgba32, Color{5, 6, 7}, 8));

		Audio::AudioBuffer audio;
		audio.channels = 1;
		audio.samples = {0.125f, 0.25f};
		sink.writeAudio(audio);

		sink.finish(Pipeline::JobState::Completed);
		EXPECT_EQ(sink.getFramesWritten(), 2u);
	}

	const std::vector<std::uint8_t> expected{1, 2, 3, 4, 1, 2, 3, 4, 5, 6, 7, 8, 5, 6, 7, 8};
	EXPECT_EQ(readAll(videoPath), expected);

	const Audio::AudioBuffer audio = readPcmF32File(audioPath, 48000, 1);
	EXPECT_EQ(audio.samples, (std::vector<float>{0.125f, 0.25f}));

	std::filesystem::remove(videoPath);
	std::filesystem::remove(audioPath);
}

TEST(RawFileSinkTest, OpaqueSinkWithoutAudioPathDiscardsAudio)
{
	const std::filesystem::path videoPath = std::filesystem::temp_directory_path() / "chromakey_sink_test.rgb";

	RawFileSink sink(Logger::NullLogger::instance(), videoPath, false, std::nullopt);
	EXPECT_EQ(sink.getCapability(), Keying::SinkCapability::Opaque);

	Audio::AudioBuffer audio;
	audio.samples = {0.1f, 0.1f};
	EXPECT_NO_THROW(sink.writeAudio(audio));
	sink.writeFrame(Frame::filled(1, 1, PixelFormat::Rgb24, Color{9, 9, 9}));
	sink.finish(Pipeline::JobState::Completed);

	EXPECT_EQ(readAll(videoPath), (std::vector<std::uint8_t>{9, 9, 9}));
	EXPECT_FALSE(std::filesystem::exists(sink.getPartialPath()));
	std::filesystem::remove(videoPath);
}

TEST(RawFileSinkTest, IncompleteJobLeavesOnlyPartialFile)
{
	const std::filesystem::path videoPath =
		std::filesystem::temp_directory_path() / "chromakey_sink_test_incomplete.rgb";
	const std::filesystem::path partialPath = RawFileSink::makePartialPath(videoPath);
	std::filesystem::remove(videoPath);
	EXPECT_EQ(partialPath.filename().string(), "chromakey_sink_test_incomplete.rgb.partial");

	for (const Pipeline::JobState state : {Pipeline::JobState::Cancelled, Pipeline::JobState::Failed}) {
		RawFileSink sink(Logger::NullLogger::instance(), videoPath, false, std::nullopt);
		EXPECT_TRUE(sink.getPartialPath() == partialPath);
		sink.writeFrame(Frame::filled(1, 1, PixelFormat::Rgb24, Color{7, 7, 7}));
		sink.finish(state);

		EXPECT_FALSE(std::filesystem::exists(videoPath)) << Pipeline::toString(state);
		EXPECT_EQ(readAll(partialPath), (std::vector<std::uint8_t>{7, 7, 7})) << Pipeline::toString(state);
	}
	std::filesystem::remove(partialPath);
}

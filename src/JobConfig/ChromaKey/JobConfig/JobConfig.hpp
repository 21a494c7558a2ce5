/*
 * ChromaKey JobConfig Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include <ChromaKey/Audio/AudioBuffer.hpp>
#include <ChromaKey/Keying/Color.hpp>
#include <ChromaKey/Keying/KeySettings.hpp>
#include <ChromaKey/Logger/ILogger.hpp>
#include <ChromaKey/Pipeline/BackgroundSource.hpp>
#include <ChromaKey/Pipeline/PipelineProperty.hpp>

namespace ChromaKey::JobConfig {

/// Headerless interleaved RGB24 frames, one after another.
struct RawVideoInput {
	std::string path;
	std::uint32_t width = 0;
	std::uint32_t height = 0;
};

/// Headerless interleaved float32 little-endian PCM.
struct PcmInput {
	std::string path;
	std::uint32_t sampleRate = 48000;
	std::uint32_t channels = 2;
};

struct KeyConfig {
	bool autoDetect = false;
	Keying::KeySettings settings;
};

struct BackgroundConfig {
	Pipeline::BackgroundKind kind = Pipeline::BackgroundKind::None;
	std::optional<RawVideoInput> media;
	Pipeline::StreamEndPolicy endPolicy = Pipeline::StreamEndPolicy::Loop;
	Keying::Color solidColor = Keying::kBlack;
};

struct AudioConfig {
	Audio::AudioMode mode = Audio::AudioMode::Foreground;
	std::optional<PcmInput> foreground;
	std::optional<PcmInput> background;
};

struct OutputConfig {
	std::string path;
	bool alpha = false;
	std::optional<std::string> audioPath;
};

/**
 * @brief Job description read by the command-line tool.
 *
 * ```json
 * {
 *   "foreground": {"path": "in.rgb", "width": 1920, "height": 1080},
 *   "key": {"color": "auto", "strength": 40, "edgeBlur": 20},
 *   "background": {"type": "video", "path": "bg.rgb", "width": 1280, "height": 720, "endPolicy": "loop"},
 *   "audio": {"mode": "mix", "foreground": {"path": "in.f32"}, "background": {"path": "bg.f32"}},
 *   "output": {"path": "out.rgba", "alpha": true, "audioPath": "out.f32"},
 *   "pipeline": {"numThreads": 4, "progressInterval": 30}
 * }
 * ```
 */
struct JobConfig {
	RawVideoInput foreground;
	KeyConfig key;
	BackgroundConfig background;
	AudioConfig audio;
	OutputConfig output;
	Pipeline::PipelineProperty pipeline;
	bool verbose = false;

	/**
	 * @throws Keying::ConfigurationError if the file cannot be read or describes an invalid job.
	 */
	static JobConfig load(const std::filesystem::path &path, std::shared_ptr<const Logger::ILogger> logger);

	/**
	 * @throws Keying::ConfigurationError on missing or invalid fields.
	 */
	static JobConfig parse(const nlohmann::json &j, const Logger::ILogger &logger);
};

void from_json(const nlohmann::json &j, RawVideoInput &p);
void from_json(const nlohmann::json &j, PcmInput &p);
void from_json(const nlohmann::json &j, KeyConfig &p);
void from_json(const nlohmann::json &j, BackgroundConfig &p);
void from_json(const nlohmann::json &j, AudioConfig &p);
void from_json(const nlohmann::json &j, OutputConfig &p);

} // namespace ChromaKey::JobConfig

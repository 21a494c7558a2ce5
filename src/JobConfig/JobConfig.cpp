/*
 * ChromaKey JobConfig Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "ChromaKey/JobConfig/JobConfig.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include <ChromaKey/Keying/ConfigurationError.hpp>
#include <ChromaKey/Keying/Preset.hpp>

namespace ChromaKey::JobConfig {

namespace {

Keying::Color parseColor(const nlohmann::json &j, const char *key)
{
	return Keying::Color::fromHex(j.at(key).get<std::string>());
}

/// Reads through a signed type so that negative values are rejected instead of wrapping.
std::uint32_t parsePositive(const nlohmann::json &j, const char *key)
{
	const auto value = j.at(key).get<std::int64_t>();
	if (value <= 0 || value > std::numeric_limits<std::uint32_t>::max()) {
		throw Keying::ConfigurationError(std::string(key) + " must be a positive 32-bit integer, got " +
						 std::to_string(value));
	}
	return static_cast<std::uint32_t>(value);
}

} // anonymous namespace

void from_json(const nlohmann::json &j, RawVideoInput &p)
{
	j.at("path").get_to(p.path);
	p.width = parsePositive(j, "width");
	p.height = parsePositive(j, "height");
}

void from_json(const nlohmann::json &j, PcmInput &p)
{
	j.at("path").get_to(p.path);
	if (j.contains("sampleRate"))
		p.sampleRate = parsePositive(j, "sampleRate");
	if (j.contains("channels"))
		p.channels = parsePositive(j, "channels");
}

void from_json(const nlohmann::json &j, KeyConfig &p)
{
	const std::string color = j.contains("color") ? j.at("color").get<std::string>() : std::string("auto");
	p.autoDetect = color == "auto";
	const Keying::Color keyColor = p.autoDetect ? Keying::kDefaultKeyColor : Keying::Color::fromHex(color);

	// The 0-100 slider values come first so that explicit parameters can refine them.
	Keying::Preset preset;
	if (j.contains("strength"))
		j.at("strength").get_to(preset.strength);
	if (j.contains("edgeBlur"))
		j.at("edgeBlur").get_to(preset.edgeBlur);
	p.settings = preset.toKeySettings(keyColor);

	if (j.contains("similarity"))
		j.at("similarity").get_to(p.settings.similarity);
	if (j.contains("blend"))
		j.at("blend").get_to(p.settings.blendStrength);
	if (j.contains("edgeBlurRadius"))
		j.at("edgeBlurRadius").get_to(p.settings.edgeBlurRadius);

	p.settings.validate();
}

void from_json(const nlohmann::json &j, BackgroundConfig &p)
{
	const std::string type = j.at("type").get<std::string>();
	if (type == "none") {
		p.kind = Pipeline::BackgroundKind::None;
	} else if (type == "image") {
		p.kind = Pipeline::BackgroundKind::StaticImage;
	} else if (type == "video") {
		p.kind = Pipeline::BackgroundKind::VideoStream;
	} else {
		throw Keying::ConfigurationError("unknown background type: " + type);
	}

	if (p.kind != Pipeline::BackgroundKind::None) {
		if (!j.contains("path")) {
			throw Keying::ConfigurationError("background of type " + type + " requires a path");
		}
		j.get_to(p.media.emplace());
	}

	if (j.contains("endPolicy")) {
		const std::string name = j.at("endPolicy").get<std::string>();
		const std::optional<Pipeline::StreamEndPolicy> policy = Pipeline::parseStreamEndPolicy(name);
		if (!policy) {
			throw Keying::ConfigurationError("unknown background endPolicy: " + name);
		}
		p.endPolicy = *policy;
	}

	if (j.contains("color"))
		p.solidColor = parseColor(j, "color");
}

void from_json(const nlohmann::json &j, AudioConfig &p)
{
	if (j.contains("mode")) {
		const std::string name = j.at("mode").get<std::string>();
		const std::optional<Audio::AudioMode> mode = Audio::parseAudioMode(name);
		if (!mode) {
			throw Keying::ConfigurationError("unknown audio mode: " + name);
		}
		p.mode = *mode;
	}
	if (j.contains("foreground"))
		j.at("foreground").get_to(p.foreground.emplace());
	if (j.contains("background"))
		j.at("background").get_to(p.background.emplace());
}

void from_json(const nlohmann::json &j, OutputConfig &p)
{
	j.at("path").get_to(p.path);
	if (j.contains("alpha"))
		j.at("alpha").get_to(p.alpha);
	if (j.contains("audioPath"))
		p.audioPath = j.at("audioPath").get<std::string>();
}

JobConfig JobConfig::load(const std::filesystem::path &path, std::shared_ptr<const Logger::ILogger> logger)
{
	std::ifstream ifs(path);
	if (!ifs) {
		throw Keying::ConfigurationError("cannot open job file: " + path.string());
	}

	nlohmann::json j;
	try {
		ifs >> j;
	} catch (const nlohmann::json::exception &e) {
		throw Keying::ConfigurationError("malformed job file " + path.string() + ": " + e.what());
	}

	logger->info("Loading job from {}", path.string());
	return parse(j, *logger);
}

JobConfig JobConfig::parse(const nlohmann::json &j, const Logger::ILogger &logger)
{
	JobConfig config;
	try {
		j.at("foreground").get_to(config.foreground);
		j.at("output").get_to(config.output);
		(j.contains("key") ? j.at("key") : nlohmann::json::object()).get_to(config.key);
		if (j.contains("background"))
			j.at("background").get_to(config.background);
		if (j.contains("audio"))
			j.at("audio").get_to(config.audio);

		if (j.contains("pipeline")) {
			const auto &pipeline = j.at("pipeline");
			if (pipeline.contains("numThreads"))
				pipeline.at("numThreads").get_to(config.pipeline.numThreads);
			if (pipeline.contains("progressInterval"))
				config.pipeline.progressInterval = parsePositive(pipeline, "progressInterval");
			if (pipeline.contains("verbose"))
				pipeline.at("verbose").get_to(config.verbose);
		}
	} catch (const nlohmann::json::exception &e) {
		throw Keying::ConfigurationError(std::string("invalid job description: ") + e.what());
	}

	if (config.pipeline.numThreads < 1) {
		throw Keying::ConfigurationError("pipeline.numThreads must be at least 1");
	}

	const Keying::KeySettings &settings = config.key.settings;
	logger.info("Loaded foreground: {} ({}x{})", config.foreground.path, config.foreground.width,
		    config.foreground.height);
	logger.info("Loaded key: color={} similarity={} blend={} edgeBlurRadius={}",
		    config.key.autoDetect ? std::string("auto") : settings.keyColor.toHex(), settings.similarity,
		    settings.blendStrength, settings.edgeBlurRadius);
	if (config.background.media) {
		logger.info("Loaded background: {} ({}x{})", config.background.media->path,
			    config.background.media->width, config.background.media->height);
	}
	logger.info("Loaded audio mode: {}", Audio::toString(config.audio.mode));
	logger.info("Loaded output: {} alpha={}", config.output.path, config.output.alpha);

	return config;
}

} // namespace ChromaKey::JobConfig

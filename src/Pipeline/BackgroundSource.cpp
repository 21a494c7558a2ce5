/*
 * ChromaKey Pipeline Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "ChromaKey/Pipeline/BackgroundSource.hpp"

#include <utility>

#include <ChromaKey/Keying/ConfigurationError.hpp>

namespace ChromaKey::Pipeline {

std::optional<StreamEndPolicy> parseStreamEndPolicy(std::string_view name) noexcept
{
	if (name == "loop") {
		return StreamEndPolicy::Loop;
	} else if (name == "hold") {
		return StreamEndPolicy::HoldLast;
	}
	return std::nullopt;
}

BackgroundSource BackgroundSource::none(Keying::Color solidColor)
{
	BackgroundSource source;
	source.kind_ = BackgroundKind::None;
	source.solidColor_ = solidColor;
	return source;
}

BackgroundSource BackgroundSource::staticImage(Keying::Frame image, Keying::Color solidColor)
{
	BackgroundSource source;
	source.kind_ = BackgroundKind::StaticImage;
	source.solidColor_ = solidColor;
	source.image_ = std::move(image);
	return source;
}

BackgroundSource BackgroundSource::videoStream(std::unique_ptr<IFrameSource> stream, StreamEndPolicy policy,
					       Keying::Color solidColor)
{
	BackgroundSource source;
	source.kind_ = BackgroundKind::VideoStream;
	source.solidColor_ = solidColor;
	source.endPolicy_ = policy;
	source.stream_ = std::move(stream);
	return source;
}

void BackgroundSource::validate() const
{
	switch (kind_) {
	case BackgroundKind::None:
		return;
	case BackgroundKind::StaticImage:
		if (image_.isEmpty()) {
			throw Keying::ConfigurationError("static background image is empty");
		}
		return;
	case BackgroundKind::VideoStream:
		if (!stream_) {
			throw Keying::ConfigurationError("background video stream is missing");
		}
		return;
	default:
		throw Keying::ConfigurationError("unknown background kind");
	}
}

} // namespace ChromaKey::Pipeline

/*
 * ChromaKey Pipeline Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <memory>
#include <optional>
#include <string_view>

#include <ChromaKey/Keying/Color.hpp>
#include <ChromaKey/Keying/Frame.hpp>

#include "IFrameSource.hpp"

namespace ChromaKey::Pipeline {

enum class BackgroundKind {
	None,
	StaticImage,
	VideoStream,
};

/// What a background video does once it runs out before the foreground.
enum class StreamEndPolicy {
	Loop,
	HoldLast,
};

std::optional<StreamEndPolicy> parseStreamEndPolicy(std::string_view name) noexcept;

/**
 * @brief Replacement background of one job.
 *
 * None composites over `solidColor` (or transparency on alpha-capable sinks),
 * StaticImage reuses one frame, VideoStream advances one frame per output frame.
 */
class BackgroundSource {
public:
	static BackgroundSource none(Keying::Color solidColor = Keying::kBlack);
	static BackgroundSource staticImage(Keying::Frame image, Keying::Color solidColor = Keying::kBlack);
	static BackgroundSource videoStream(std::unique_ptr<IFrameSource> stream,
					    StreamEndPolicy policy = StreamEndPolicy::Loop,
					    Keying::Color solidColor = Keying::kBlack);

	BackgroundSource() noexcept = default;
	~BackgroundSource() noexcept = default;

	BackgroundSource(BackgroundSource &&) noexcept = default;
	BackgroundSource &operator=(BackgroundSource &&) noexcept = default;
	BackgroundSource(const BackgroundSource &) = delete;
	BackgroundSource &operator=(const BackgroundSource &) = delete;

	BackgroundKind getKind() const noexcept { return kind_; }
	Keying::Color getSolidColor() const noexcept { return solidColor_; }
	StreamEndPolicy getEndPolicy() const noexcept { return endPolicy_; }

	const Keying::Frame &getImage() const noexcept { return image_; }
	IFrameSource *getStream() const noexcept { return stream_.get(); }

	/**
	 * @throws Keying::ConfigurationError if a StaticImage has no pixels or a VideoStream has no source.
	 */
	void validate() const;

private:
	BackgroundKind kind_ = BackgroundKind::None;
	Keying::Color solidColor_ = Keying::kBlack;
	StreamEndPolicy endPolicy_ = StreamEndPolicy::Loop;
	Keying::Frame image_;
	std::unique_ptr<IFrameSource> stream_;
};

} // namespace ChromaKey::Pipeline

/*
 * ChromaKey Pipeline Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include "IFrameSource.hpp"

namespace ChromaKey::Pipeline {

/**
 * @brief Frame source over frames already held in memory.
 */
class VectorFrameSource final : public IFrameSource {
public:
	explicit VectorFrameSource(std::vector<Keying::Frame> frames) : frames_(std::move(frames)) {}

	std::optional<Keying::Frame> next() override
	{
		if (position_ >= frames_.size()) {
			return std::nullopt;
		}
		return std::move(frames_[position_++]);
	}

	std::optional<std::size_t> getTotalFrames() const noexcept override { return frames_.size(); }

private:
	std::vector<Keying::Frame> frames_;
	std::size_t position_ = 0;
};

} // namespace ChromaKey::Pipeline

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
#include <stdexcept>
#include <string>

namespace ChromaKey::Pipeline {

/**
 * @brief A frame could not be processed; the job stops at `getFrameIndex()`.
 */
class FrameProcessingError : public std::runtime_error {
public:
	FrameProcessingError(std::size_t frameIndex, const std::string &message)
		: std::runtime_error(message),
		  frameIndex_(frameIndex)
	{
	}

	std::size_t getFrameIndex() const noexcept { return frameIndex_; }

private:
	std::size_t frameIndex_;
};

} // namespace ChromaKey::Pipeline

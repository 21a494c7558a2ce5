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
#include <stdexcept>

#include <ChromaKey/Keying/Frame.hpp>

namespace ChromaKey::Pipeline {

/**
 * @brief A lazy, finite, ordered stream of decoded frames that can be read only once.
 */
class IFrameSource {
protected:
	IFrameSource() = default;

public:
	virtual ~IFrameSource() = default;

	/**
	 * @return The next frame, or std::nullopt at the end of the stream.
	 */
	virtual std::optional<Keying::Frame> next() = 0;

	/**
	 * @return The number of frames in the stream if known in advance.
	 */
	virtual std::optional<std::size_t> getTotalFrames() const noexcept { return std::nullopt; }

	/**
	 * @return Whether restart() can rewind the stream to its first frame.
	 */
	virtual bool isRestartable() const noexcept { return false; }

	/**
	 * @brief Rewinds the stream so that next() yields the first frame again.
	 * @throws std::logic_error if the stream is not restartable.
	 * @throws std::runtime_error if rewinding fails.
	 */
	virtual void restart() { throw std::logic_error("frame source cannot be restarted"); }

	IFrameSource(const IFrameSource &) = delete;
	IFrameSource &operator=(const IFrameSource &) = delete;
	IFrameSource(IFrameSource &&) = delete;
	IFrameSource &operator=(IFrameSource &&) = delete;
};

} // namespace ChromaKey::Pipeline

/*
 * ChromaKey Keying Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <ChromaKey/TaskQueue/RowBandWorkerPool.hpp>

#include "Color.hpp"
#include "Frame.hpp"
#include "KeySettings.hpp"

namespace ChromaKey::Keying {

/**
 * @brief Removes key-colored fringe from partially keyed pixels.
 *
 * The channel that dominates the key color is pulled toward the average of the
 * other two by `blendStrength` times its excess. Pixels with weight 0 or 1 are
 * left untouched, and a key color without a single dominant channel (a gray
 * key) disables suppression.
 */
class SpillSuppressor {
public:
	explicit SpillSuppressor(const KeySettings &settings) noexcept;

	bool isEnabled() const noexcept { return enabled_; }

	Color suppress(Color color, float weight) const noexcept;

	/**
	 * @brief Applies suppression in place using the raw classifier mask.
	 * @throws std::invalid_argument if the mask does not match the frame.
	 */
	void suppressFrame(Frame &frame, const AlphaMask &rawMask, TaskQueue::RowBandWorkerPool &pool) const;

private:
	const int primaryChannel_;
	const float strength_;
	const bool enabled_;
};

} // namespace ChromaKey::Keying

/*
 * ChromaKey Keying Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstdint>

#include <ChromaKey/TaskQueue/RowBandWorkerPool.hpp>

#include "Frame.hpp"

namespace ChromaKey::Keying {

/**
 * @brief Separable box blur over the keying mask.
 *
 * Borders replicate the outermost weight. A radius wider than the mask is
 * clamped per axis to `dimension - 1`.
 */
class EdgeRefiner {
public:
	explicit EdgeRefiner(int radius);

	int getRadius() const noexcept { return radius_; }

	/**
	 * @brief Returns the effective radius along an axis of `extent` pixels.
	 */
	std::uint32_t getEffectiveRadius(std::uint32_t extent) const noexcept;

	AlphaMask refine(AlphaMask mask, TaskQueue::RowBandWorkerPool &pool) const;

private:
	void blurRows(const AlphaMask &source, AlphaMask &target, TaskQueue::RowBandWorkerPool &pool) const;
	void blurColumns(const AlphaMask &source, AlphaMask &target, TaskQueue::RowBandWorkerPool &pool) const;

	const int radius_;
};

} // namespace ChromaKey::Keying

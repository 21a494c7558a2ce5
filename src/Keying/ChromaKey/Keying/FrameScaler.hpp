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
 * @brief Bilinear resampling with pixel-center alignment and edge clamping.
 *
 * The output keeps the pixel format of the source. Resizing to the source size
 * returns an exact copy.
 *
 * @throws std::invalid_argument if the source is empty or a target dimension is 0.
 */
Frame resizeBilinear(const Frame &source, std::uint32_t width, std::uint32_t height,
		     TaskQueue::RowBandWorkerPool &pool);

} // namespace ChromaKey::Keying

/*
 * ChromaKey Keying Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "ChromaKey/Keying/EdgeRefiner.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace ChromaKey::Keying {

namespace {

inline std::size_t clampIndex(std::int64_t index, std::size_t extent) noexcept
{
	if (index < 0) {
		return 0;
	}
	const auto last = static_cast<std::int64_t>(extent) - 1;
	return static_cast<std::size_t>(index > last ? last : index);
}

} // anonymous namespace

EdgeRefiner::EdgeRefiner(int radius)
	: radius_(radius >= 0 ? radius : throw std::invalid_argument("edge blur radius must be non-negative"))
{
}

std::uint32_t EdgeRefiner::getEffectiveRadius(std::uint32_t extent) const noexcept
{
	if (extent == 0) {
		return 0;
	}
	return std::min(static_cast<std::uint32_t>(radius_), extent - 1);
}

AlphaMask EdgeRefiner::refine(AlphaMask mask, TaskQueue::RowBandWorkerPool &pool) const
{
	if (radius_ == 0 || mask.getPixelCount() == 0) {
		return mask;
	}

	AlphaMask intermediate(mask.getWidth(), mask.getHeight());
	blurRows(mask, intermediate, pool);
	blurColumns(intermediate, mask, pool);
	return mask;
}

void EdgeRefiner::blurRows(const AlphaMask &source, AlphaMask &target, TaskQueue::RowBandWorkerPool &pool) const
{
	const std::uint32_t width = source.getWidth();
	const std::int64_t r = getEffectiveRadius(width);
	if (r == 0) {
		std::copy(source.getData().begin(), source.getData().end(), target.getData().begin());
		return;
	}
	const double norm = 1.0 / static_cast<double>(2 * r + 1);

	pool.run(source.getHeight(), [&](std::size_t begin, std::size_t end) {
		for (std::size_t y = begin; y < end; ++y) {
			const float *in = source.getRow(static_cast<std::uint32_t>(y));
			float *out = target.getRow(static_cast<std::uint32_t>(y));

			double sum = 0.0;
			for (std::int64_t k = -r; k <= r; ++k) {
				sum += in[clampIndex(k, width)];
			}
			for (std::int64_t x = 0; x < static_cast<std::int64_t>(width); ++x) {
				out[x] = static_cast<float>(std::clamp(sum * norm, 0.0, 1.0));
				sum += in[clampIndex(x + r + 1, width)];
				sum -= in[clampIndex(x - r, width)];
			}
		}
	});
}

/// Slides one window per column down the mask; bands are ranges of columns so each band walks rows in order.
void EdgeRefiner::blurColumns(const AlphaMask &source, AlphaMask &target, TaskQueue::RowBandWorkerPool &pool) const
{
	const std::uint32_t height = source.getHeight();
	const std::int64_t r = getEffectiveRadius(height);
	if (r == 0) {
		std::copy(source.getData().begin(), source.getData().end(), target.getData().begin());
		return;
	}
	const double norm = 1.0 / static_cast<double>(2 * r + 1);

	pool.run(source.getWidth(), [&](std::size_t begin, std::size_t end) {
		std::vector<double> sums(end - begin, 0.0);

		for (std::int64_t k = -r; k <= r; ++k) {
			const float *in = source.getRow(static_cast<std::uint32_t>(clampIndex(k, height)));
			for (std::size_t x = begin; x < end; ++x) {
				sums[x - begin] += in[x];
			}
		}

		for (std::int64_t y = 0; y < static_cast<std::int64_t>(height); ++y) {
			float *out = target.getRow(static_cast<std::uint32_t>(y));
			const float *entering = source.getRow(static_cast<std::uint32_t>(clampIndex(y + r + 1, height)));
			const float *leaving = source.getRow(static_cast<std::uint32_t>(clampIndex(y - r, height)));
			for (std::size_t x = begin; x < end; ++x) {
				double &sum = sums[x - begin];
				out[x] = static_cast<float>(std::clamp(sum * norm, 0.0, 1.0));
				sum += entering[x];
				sum -= leaving[x];
			}
		}
	});
}

} // namespace ChromaKey::Keying

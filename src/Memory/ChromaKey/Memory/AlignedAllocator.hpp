/*
 * ChromaKey Memory Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstddef>
#include <limits>
#include <new>
#include <stdexcept>
#include <vector>

namespace ChromaKey::Memory {

/**
 * @brief Alignment used for pixel and mask planes.
 *
 * 32 bytes keeps each plane start on an AVX2 register boundary so that the
 * per-row kernels can be auto-vectorized without peeling.
 */
constexpr std::size_t kPlaneAlignment = 32;

/**
 * @brief STL-compatible allocator that performs aligned allocations.
 *
 * A default-constructed allocator uses kPlaneAlignment, which lets planes be
 * declared as plain `AlignedVector<T>` members. Copies and rebinds keep the
 * alignment of the source allocator.
 *
 * @tparam T The value type to allocate.
 */
template<typename T> class AlignedAllocator {
public:
	using value_type = T;

	template<class U> struct rebind {
		using other = AlignedAllocator<U>;
	};

	AlignedAllocator() noexcept : alignment_(kPlaneAlignment) {}

	/**
	 * @throws std::invalid_argument if alignment is not a power of two or is
	 *         smaller than alignof(std::max_align_t).
	 */
	explicit AlignedAllocator(std::size_t alignment) : alignment_(validateAlignment(alignment)) {}

	template<class U> AlignedAllocator(const AlignedAllocator<U> &other) noexcept : alignment_(other.alignment()) {}

	T *allocate(std::size_t n)
	{
		if (n > std::numeric_limits<std::size_t>::max() / sizeof(T)) {
			throw std::bad_alloc();
		}

		void *p = ::operator new(n * sizeof(T), std::align_val_t(alignment_));
		return static_cast<T *>(p);
	}

	void deallocate(T *p, std::size_t) noexcept { ::operator delete(p, std::align_val_t(alignment_)); }

	std::size_t alignment() const noexcept { return alignment_; }

	template<typename U> bool operator==(const AlignedAllocator<U> &other) const noexcept
	{
		return alignment_ == other.alignment();
	}

	template<typename U> bool operator!=(const AlignedAllocator<U> &other) const noexcept
	{
		return !(*this == other);
	}

private:
	static std::size_t validateAlignment(std::size_t alignment)
	{
		if (alignment < alignof(std::max_align_t) || (alignment & (alignment - 1)) != 0) {
			throw std::invalid_argument(
				"Alignment must be a power of two and at least alignof(std::max_align_t)");
		}
		return alignment;
	}

	std::size_t alignment_;
};

template<typename T> using AlignedVector = std::vector<T, AlignedAllocator<T>>;

} // namespace ChromaKey::Memory

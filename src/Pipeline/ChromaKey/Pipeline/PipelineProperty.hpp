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

#include <ChromaKey/Keying/KeyColorDetector.hpp>

namespace ChromaKey::Pipeline {

struct PipelineProperty {
	/// Threads working on the row bands of a frame, including the job thread.
	int numThreads = 2;

	/// A Running progress event is published every this many frames.
	std::size_t progressInterval = 10;

	/// Jobs that may wait behind the running one.
	std::size_t maxPendingJobs = 4;

	Keying::DetectorProperty detector;
};

} // namespace ChromaKey::Pipeline

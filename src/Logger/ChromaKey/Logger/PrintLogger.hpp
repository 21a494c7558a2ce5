/*
 * ChromaKey Logger Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <iterator>
#include <mutex>
#include <ostream>
#include <source_location>
#include <span>
#include <string_view>

#include <fmt/format.h>

#include "ILogger.hpp"

namespace ChromaKey::Logger {

/**
 * @brief Writes tab-separated `key=value` log lines to a stream.
 *
 * The stream is borrowed and must outlive the logger. Writes are serialized so
 * that lines from the job worker and the caller thread never interleave.
 */
class PrintLogger final : public ILogger {
public:
	PrintLogger(std::ostream &out, std::string_view prefix, bool verbose = false) noexcept
		: out_(out),
		  prefix_(prefix),
		  minLevel_(verbose ? LogLevel::Debug : LogLevel::Info)
	{
	}

	~PrintLogger() override = default;

protected:
	void log(LogLevel level, std::string_view message) const noexcept override
	{
		if (level < minLevel_) {
			return;
		}

		try {
			fmt::basic_memory_buffer<char, 4096> buffer;
			fmt::format_to(std::back_inserter(buffer), "{} level={}\tmessage={}\n", prefix_, levelName(level),
				       message);
			write({buffer.data(), buffer.size()});
		} catch (...) {
			write("LOGGER PANIC OCCURRED\n");
		}
	}

	void log(LogLevel level, std::string_view name, std::source_location loc,
		 std::span<const LogField> context) const noexcept override
	{
		if (level < minLevel_) {
			return;
		}

		try {
			fmt::basic_memory_buffer<char, 4096> buffer;
			fmt::format_to(std::back_inserter(buffer), "{} level={}\tname={}\tlocation={}:{}", prefix_,
				       levelName(level), name, loc.file_name(), loc.line());
			for (const LogField &field : context) {
				fmt::format_to(std::back_inserter(buffer), "\t{}={}", field.key, field.value);
			}
			buffer.push_back('\n');
			write({buffer.data(), buffer.size()});
		} catch (...) {
			write("LOGGER PANIC OCCURRED\n");
		}
	}

private:
	void write(std::string_view line) const noexcept
	{
		std::lock_guard<std::mutex> lock(mutex_);
		out_.write(line.data(), static_cast<std::streamsize>(line.size()));
		out_.flush();
	}

	std::ostream &out_;
	const std::string_view prefix_;
	const LogLevel minLevel_;
	mutable std::mutex mutex_;
};

} // namespace ChromaKey::Logger

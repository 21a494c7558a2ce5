/*
 * ChromaKey Logger Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <memory>
#include <source_location>
#include <span>
#include <string_view>

#include "ILogger.hpp"

namespace ChromaKey::Logger {

class NullLogger final : public ILogger {
public:
	NullLogger() = default;
	~NullLogger() noexcept override = default;

	bool isInvalid() const noexcept override { return true; }

	static std::shared_ptr<const NullLogger> instance()
	{
		static const std::shared_ptr<const NullLogger> instance = std::make_shared<const NullLogger>();
		return instance;
	}

protected:
	void log(LogLevel, std::string_view) const noexcept override {}

	void log(LogLevel, std::string_view, std::source_location, std::span<const LogField>) const noexcept override
	{
	}
};

} // namespace ChromaKey::Logger

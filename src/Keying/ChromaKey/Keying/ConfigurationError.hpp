/*
 * ChromaKey Keying Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <stdexcept>

namespace ChromaKey::Keying {

/**
 * @brief Raised by pre-flight validation. A job that raises it never starts.
 */
class ConfigurationError : public std::invalid_argument {
public:
	using std::invalid_argument::invalid_argument;
};

} // namespace ChromaKey::Keying

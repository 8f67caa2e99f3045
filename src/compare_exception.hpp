/* compare_exception.hpp - error type shared by every comparer.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <stdexcept>
#include <string>

enum class error_kind {
	package,
	xml_parse,
	missing_part,
	invalid_package,
	unsupported_feature,
	internal,
};

[[nodiscard]] const char* error_kind_name(error_kind kind) noexcept;

class compare_exception : public std::runtime_error {
public:
	compare_exception(error_kind k, const std::string& msg) : std::runtime_error(msg), message{msg}, kind{k} {
	}
	compare_exception(error_kind k, const std::string& msg, const std::string& loc) : std::runtime_error(msg), message{msg}, locator{loc}, kind{k} {
	}

	[[nodiscard]] error_kind get_kind() const noexcept {
		return kind;
	}

	[[nodiscard]] const std::string& get_locator() const noexcept {
		return locator;
	}

	[[nodiscard]] const std::string& get_message() const noexcept {
		return message;
	}

	[[nodiscard]] std::string get_display_message() const {
		if (locator.empty()) {
			return message;
		}
		return locator + ": " + message;
	}

private:
	std::string message;
	std::string locator;
	error_kind kind;
};

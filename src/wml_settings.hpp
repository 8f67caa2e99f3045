/* wml_settings.hpp - word-processing comparer settings.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <string>
#include <vector>

struct wml_comparer_settings {
	std::string author;
	// ISO-8601 UTC; empty means the time of the comparison.
	std::string date_time;
	bool case_insensitive{false};
	bool conflate_spaces{false};
	bool track_formatting_changes{false};
	double detail_threshold{0.0};
	std::vector<char32_t> word_separators;
	int starting_revision_id{0};

	wml_comparer_settings();

	[[nodiscard]] bool is_word_separator(char32_t ch) const;
	[[nodiscard]] std::string effective_author() const;
	[[nodiscard]] std::string effective_date() const;
};

[[nodiscard]] std::vector<char32_t> default_word_separators();
[[nodiscard]] std::string current_utc_timestamp();

/* wml_settings.cpp - word-processing comparer settings.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "wml_settings.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <algorithm>
#include <wx/datetime.h>

wml_comparer_settings::wml_comparer_settings() : word_separators{default_word_separators()} {
}

bool wml_comparer_settings::is_word_separator(char32_t ch) const {
	if (is_unicode_whitespace(ch)) {
		return true;
	}
	if (conflate_spaces && ch == 0x00A0) {
		return true;
	}
	return std::find(word_separators.begin(), word_separators.end(), ch) != word_separators.end();
}

std::string wml_comparer_settings::effective_author() const {
	return author.empty() ? std::string{DEFAULT_AUTHOR} : author;
}

std::string wml_comparer_settings::effective_date() const {
	return date_time.empty() ? current_utc_timestamp() : date_time;
}

std::vector<char32_t> default_word_separators() {
	return {U' ', U'-', U')', U'(', U';', U',', 0xFF08, 0xFF09, 0xFF0C, 0x3001, 0xFF1B, 0x3002, 0xFF1A, 0x7684};
}

std::string current_utc_timestamp() {
	return wxDateTime::Now().Format("%Y-%m-%dT%H:%M:%SZ", wxDateTime::UTC).ToStdString();
}

/* sml_comparer.hpp - spreadsheet comparison entry points.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "sml_settings.hpp"
#include "sml_types.hpp"
#include <string>

struct sml_compare_output {
	// The newer workbook with highlighted cells and a summary sheet.
	std::string document;
	sml_comparison_result result;
};

[[nodiscard]] sml_compare_output sml_compare(const std::string& older, const std::string& newer, const sml_comparer_settings& settings);
// Changes only, without rendering a marked workbook.
[[nodiscard]] sml_comparison_result sml_compute_changes(const std::string& older, const std::string& newer, const sml_comparer_settings& settings);

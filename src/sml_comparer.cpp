/* sml_comparer.cpp - spreadsheet comparison entry points.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "sml_comparer.hpp"
#include "package.hpp"
#include "sml_canonicalize.hpp"
#include "sml_diff.hpp"
#include "sml_markup.hpp"
#include <wx/log.h>

sml_comparison_result sml_compute_changes(const std::string& older, const std::string& newer, const sml_comparer_settings& settings) {
	const auto package1 = package::open(older);
	const auto package2 = package::open(newer);
	const auto signature1 = sml_canonicalize(package1, settings);
	const auto signature2 = sml_canonicalize(package2, settings);
	return sml_compute_diff(signature1, signature2, settings);
}

sml_compare_output sml_compare(const std::string& older, const std::string& newer, const sml_comparer_settings& settings) {
	sml_compare_output output;
	output.result = sml_compute_changes(older, newer, settings);
	auto marked = package::open(newer);
	sml_render_markup(marked, output.result, settings);
	output.document = marked.save();
	wxLogVerbose("Spreadsheet comparison: %zu values, %zu formulas, %zu formats changed", output.result.count(sml_change_type::value_changed), output.result.count(sml_change_type::formula_changed), output.result.count(sml_change_type::format_changed));
	return output;
}

/* pml_comparer.cpp - presentation comparison entry points.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "pml_comparer.hpp"
#include "package.hpp"
#include "pml_canonicalize.hpp"
#include "pml_diff.hpp"
#include "pml_markup.hpp"
#include <wx/log.h>

pml_comparison_result pml_compute_changes(const std::string& older, const std::string& newer, const pml_comparer_settings& settings) {
	const auto package1 = package::open(older);
	const auto package2 = package::open(newer);
	const auto signature1 = pml_canonicalize(package1, settings);
	const auto signature2 = pml_canonicalize(package2, settings);
	return pml_compute_diff(signature1, signature2, settings);
}

pml_compare_output pml_compare(const std::string& older, const std::string& newer, const pml_comparer_settings& settings) {
	pml_compare_output output;
	output.result = pml_compute_changes(older, newer, settings);
	auto marked = package::open(newer);
	pml_render_markup(marked, output.result, settings);
	output.document = marked.save();
	wxLogVerbose("Presentation comparison: %zu shapes inserted, %zu deleted, %zu text changes", output.result.shapes_inserted(), output.result.shapes_deleted(), output.result.text_changes());
	return output;
}

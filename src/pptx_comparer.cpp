/* pptx_comparer.cpp - presentation comparer.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "pptx_comparer.hpp"
#include "change_json.hpp"
#include "pml_change_list.hpp"
#include "pml_comparer.hpp"
#include "pml_patch.hpp"
#include <utility>
#include <wx/log.h>

std::string pptx_comparer::compare(const std::string& older, const std::string& newer, const comparer_settings& settings) const {
	auto output = pml_compare(older, newer, settings.pml);
	wxLogVerbose("%zu presentation changes", output.result.total_changes());
	return std::move(output.document);
}

nlohmann::json pptx_comparer::changes(const std::string& older, const std::string& newer, const comparer_settings& settings) const {
	const auto result = pml_compute_changes(older, newer, settings.pml);
	return make_change_report(format(), result.changes, pml_build_change_list(result.changes));
}

std::string pptx_comparer::apply(const std::string& base, const nlohmann::json& report) const {
	return pml_apply_changes(base, pml_changes_from_report(report));
}

std::string pptx_comparer::revert(const std::string& result, const nlohmann::json& report) const {
	return pml_revert_changes(result, pml_changes_from_report(report));
}

REGISTER_COMPARER(pptx_comparer)

/* docx_comparer.cpp - word-processing document comparer.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "docx_comparer.hpp"
#include "change_json.hpp"
#include "wml_change_list.hpp"
#include "wml_comparer.hpp"
#include <utility>
#include <wx/log.h>

std::string docx_comparer::compare(const std::string& older, const std::string& newer, const comparer_settings& settings) const {
	auto result = wml_compare(older, newer, settings.wml);
	wxLogVerbose("%zu insertions, %zu deletions, %zu format changes", result.insertions, result.deletions, result.format_changes);
	return std::move(result.document);
}

nlohmann::json docx_comparer::changes(const std::string& older, const std::string& newer, const comparer_settings& settings) const {
	const auto result = wml_compare(older, newer, settings.wml);
	return make_change_report(format(), result.changes, wml_build_change_list(result.changes));
}

// Both sides work on a compared document; the report picks the revisions to settle.
std::string docx_comparer::apply(const std::string& base, const nlohmann::json& report) const {
	const auto ids = revision_ids_from_report(report);
	wxLogVerbose("Accepting %zu revisions", ids.size());
	return wml_apply_revision_ids(base, ids);
}

std::string docx_comparer::revert(const std::string& result, const nlohmann::json& report) const {
	const auto ids = revision_ids_from_report(report);
	wxLogVerbose("Rejecting %zu revisions", ids.size());
	return wml_revert_revision_ids(result, ids);
}

REGISTER_COMPARER(docx_comparer)

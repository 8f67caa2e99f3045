/* wml_comparer.hpp - word-processing document comparison entry points.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "wml_change_extractor.hpp"
#include "wml_coalesce.hpp"
#include "wml_settings.hpp"
#include <set>
#include <string>
#include <vector>

struct wml_comparison_result {
	std::string document;
	std::vector<wml_change> changes;
	size_t insertions{0};
	size_t deletions{0};
	size_t format_changes{0};
	// Statuses counted on the correlated atom stream, and the atoms the coalescer wrote for it.
	wml_coalesce_stats correlated;
	wml_coalesce_stats coalesced;
};

[[nodiscard]] wml_comparison_result wml_compare(const std::string& older, const std::string& newer, const wml_comparer_settings& settings);
// Change records of every revision in the main document, footnotes and endnotes.
[[nodiscard]] std::vector<wml_change> wml_get_revisions(const std::string& document);
// Accepts exactly the listed revisions and returns the rewritten package.
[[nodiscard]] std::string wml_apply_revision_ids(const std::string& document, const std::set<int>& revision_ids);
// Rejects exactly the listed revisions and returns the rewritten package.
[[nodiscard]] std::string wml_revert_revision_ids(const std::string& document, const std::set<int>& revision_ids);

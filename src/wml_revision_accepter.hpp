/* wml_revision_accepter.hpp - accepting and rejecting tracked revisions.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <pugixml.hpp>
#include <set>

enum class revision_strategy {
	accept_all,
	accept_by_ids,
	reject_by_ids,
};

struct revision_selection {
	revision_strategy strategy{revision_strategy::accept_all};
	std::set<int> ids;

	[[nodiscard]] bool selects(pugi::xml_node revision) const;
};

// Transforms the tree in place. Revisions the selection does not cover are left untouched,
// and malformed revisions are skipped. Accepting everything also drops deleted math and any
// delText left outside a deletion.
void wml_apply_revisions(pugi::xml_node root, const revision_selection& selection);
inline void wml_accept_all_revisions(pugi::xml_node root) {
	wml_apply_revisions(root, revision_selection{});
}

/* wml_revision_accepter.cpp - accepting and rejecting tracked revisions.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "wml_revision_accepter.hpp"
#include "xml_utils.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <wx/log.h>

namespace {
constexpr std::string_view INSERTIONS[] = {"ins", "moveTo"};
constexpr std::string_view DELETIONS[] = {"del", "moveFrom"};
constexpr std::string_view PROPERTY_CHANGES[] = {"pPrChange", "rPrChange", "tblPrChange", "tblGridChange", "tcPrChange", "trPrChange", "tblPrExChange", "sectPrChange", "numberingChange"};
// Markers that only make sense while revisions are pending.
constexpr std::string_view RANGE_MARKERS[] = {
	"customXmlDelRangeStart",
	"customXmlDelRangeEnd",
	"customXmlInsRangeStart",
	"customXmlInsRangeEnd",
	"customXmlMoveFromRangeStart",
	"customXmlMoveFromRangeEnd",
	"customXmlMoveToRangeStart",
	"customXmlMoveToRangeEnd",
	"moveFromRangeStart",
	"moveFromRangeEnd",
	"moveToRangeStart",
	"moveToRangeEnd",
	"cellIns",
};

template <size_t N>
bool name_in(pugi::xml_node node, const std::string_view (&names)[N]) {
	for (const auto name : names) {
		if (has_local_name(node, name)) {
			return true;
		}
	}
	return false;
}

bool is_revision_element(pugi::xml_node node) {
	return name_in(node, INSERTIONS) || name_in(node, DELETIONS) || name_in(node, PROPERTY_CHANGES) || name_in(node, RANGE_MARKERS);
}

void collect_revisions(pugi::xml_node node, std::vector<pugi::xml_node>& out) {
	for (auto child : node.children()) {
		if (child.type() != pugi::node_element) {
			continue;
		}
		if (is_revision_element(child)) {
			out.push_back(child);
		}
		collect_revisions(child, out);
	}
}

// A revision sitting in pPr/rPr marks the paragraph mark itself.
bool is_paragraph_mark_revision(pugi::xml_node node) {
	const auto parent = node.parent();
	return (has_local_name(node, "ins") || has_local_name(node, "del")) && has_local_name(parent, "rPr") && has_local_name(parent.parent(), "pPr");
}

bool is_row_revision(pugi::xml_node node) {
	return (has_local_name(node, "ins") || has_local_name(node, "del")) && has_local_name(node.parent(), "trPr");
}

// Joins a paragraph whose mark is gone with the paragraph that follows it.
void merge_with_next_paragraph(pugi::xml_node p) {
	auto next = p.next_sibling();
	while (next && next.type() != pugi::node_element) {
		next = next.next_sibling();
	}
	if (!next || !has_local_name(next, "p")) {
		return;
	}
	auto anchor = first_child_local(next, "pPr");
	for (auto child : element_children(p)) {
		if (has_local_name(child, "pPr")) {
			continue;
		}
		if (anchor) {
			anchor = next.insert_move_after(child, anchor);
		} else {
			anchor = next.prepend_move(child);
		}
	}
	p.parent().remove_child(p);
}

void rename_deleted_text(pugi::xml_node node) {
	for (auto t : descendants_local(node, "delText")) {
		const std::string prefix = std::string(t.name()).substr(0, std::string(t.name()).find(':') + 1);
		t.set_name((prefix + "t").c_str());
	}
	for (auto instr : descendants_local(node, "delInstrText")) {
		const std::string prefix = std::string(instr.name()).substr(0, std::string(instr.name()).find(':') + 1);
		instr.set_name((prefix + "instrText").c_str());
	}
}

// Puts the recorded "before" properties back in place of the current ones.
void restore_previous_properties(pugi::xml_node change) {
	auto owner = change.parent();
	const auto previous = change.first_child().type() == pugi::node_element ? change.first_child() : pugi::xml_node{};
	const bool paragraph = has_local_name(owner, "pPr");
	for (auto child : element_children(owner)) {
		if (child == change) {
			continue;
		}
		if (paragraph && (has_local_name(child, "rPr") || has_local_name(child, "sectPr"))) {
			continue;
		}
		owner.remove_child(child);
	}
	if (previous) {
		for (auto child : element_children(previous)) {
			owner.insert_copy_before(child, change);
		}
	}
	owner.remove_child(change);
}

bool has_deleted_math_control(pugi::xml_node node) {
	if (!has_local_name(node, "f") || std::string(node.name()).rfind("m:", 0) != 0) {
		return false;
	}
	const auto fpr = first_child_local(node, "fPr");
	const auto ctrl = fpr ? first_child_local(fpr, "ctrlPr") : pugi::xml_node{};
	return ctrl && first_child_local(ctrl, "del");
}

void remove_deleted_math(pugi::xml_node root) {
	std::vector<pugi::xml_node> doomed;
	for (auto f : descendants_local(root, "f")) {
		if (has_deleted_math_control(f)) {
			doomed.push_back(f);
		}
	}
	for (auto it = doomed.rbegin(); it != doomed.rend(); ++it) {
		it->parent().remove_child(*it);
	}
}
}

bool revision_selection::selects(pugi::xml_node revision) const {
	if (strategy == revision_strategy::accept_all) {
		return true;
	}
	const auto id = revision.attribute("w:id");
	return id && ids.count(id.as_int()) != 0;
}

void wml_apply_revisions(pugi::xml_node root, const revision_selection& selection) {
	const bool accepting = selection.strategy != revision_strategy::reject_by_ids;
	if (selection.strategy == revision_strategy::accept_all) {
		remove_deleted_math(root);
	}
	std::vector<pugi::xml_node> revisions;
	collect_revisions(root, revisions);

	// Paragraph marks and table rows first: they change the shape of the containers.
	std::vector<pugi::xml_node> merges;
	std::vector<pugi::xml_node> rows;
	std::vector<pugi::xml_node> rest;
	for (auto rev : revisions) {
		if (!selection.selects(rev)) {
			continue;
		}
		const bool removes_content = accepting ? name_in(rev, DELETIONS) : name_in(rev, INSERTIONS);
		if (is_paragraph_mark_revision(rev)) {
			auto p = rev.parent().parent().parent();
			auto rpr = rev.parent();
			rpr.remove_child(rev);
			if (removes_content && has_local_name(p, "p")) {
				merges.push_back(p);
			}
		} else if (is_row_revision(rev)) {
			auto tr = rev.parent().parent();
			rev.parent().remove_child(rev);
			if (removes_content && has_local_name(tr, "tr")) {
				rows.push_back(tr);
			}
		} else {
			rest.push_back(rev);
		}
	}
	for (auto it = merges.rbegin(); it != merges.rend(); ++it) {
		merge_with_next_paragraph(*it);
	}

	for (auto it = rest.rbegin(); it != rest.rend(); ++it) {
		auto rev = *it;
		if (name_in(rev, INSERTIONS)) {
			if (accepting) {
				unwrap_node(rev);
			} else {
				rev.parent().remove_child(rev);
			}
		} else if (name_in(rev, DELETIONS)) {
			if (accepting) {
				rev.parent().remove_child(rev);
			} else {
				rename_deleted_text(rev);
				unwrap_node(rev);
			}
		} else if (name_in(rev, PROPERTY_CHANGES)) {
			if (accepting) {
				rev.parent().remove_child(rev);
			} else {
				restore_previous_properties(rev);
			}
		} else {
			rev.parent().remove_child(rev);
		}
	}
	for (auto it = rows.rbegin(); it != rows.rend(); ++it) {
		it->parent().remove_child(*it);
	}
	if (selection.strategy == revision_strategy::accept_all) {
		// Deleted text outside any deletion is malformed; it never survives acceptance.
		const auto stray = descendants_local(root, "delText");
		if (!stray.empty()) {
			wxLogWarning("Removed %zu deleted-text elements found outside a deletion", stray.size());
		}
		for (auto text : stray) {
			text.parent().remove_child(text);
		}
	}
}

/* wml_markup.cpp - native revision markup for compared word-processing parts.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "wml_markup.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include "wml_preprocess.hpp"
#include "xml_utils.hpp"
#include <algorithm>
#include <map>
#include <set>
#include <unordered_map>

namespace {
using rank_table = std::unordered_map<std::string_view, int>;

const rank_table PPR_ORDER = {
	{"pStyle", 10},
	{"keepNext", 20},
	{"keepLines", 30},
	{"pageBreakBefore", 40},
	{"framePr", 50},
	{"widowControl", 60},
	{"numPr", 70},
	{"suppressLineNumbers", 80},
	{"pBdr", 90},
	{"shd", 100},
	{"tabs", 120},
	{"suppressAutoHyphens", 130},
	{"kinsoku", 140},
	{"wordWrap", 150},
	{"overflowPunct", 160},
	{"topLinePunct", 170},
	{"autoSpaceDE", 180},
	{"autoSpaceDN", 190},
	{"bidi", 200},
	{"adjustRightInd", 210},
	{"snapToGrid", 220},
	{"spacing", 230},
	{"ind", 240},
	{"contextualSpacing", 250},
	{"mirrorIndents", 260},
	{"suppressOverlap", 270},
	{"jc", 280},
	{"textDirection", 290},
	{"textAlignment", 300},
	{"textboxTightWrap", 310},
	{"outlineLvl", 320},
	{"divId", 330},
	{"cnfStyle", 340},
	{"rPr", 350},
	{"sectPr", 360},
	{"pPrChange", 370},
};

const rank_table RPR_ORDER = {
	{"moveFrom", 5},
	{"moveTo", 7},
	{"ins", 10},
	{"del", 20},
	{"rStyle", 30},
	{"rFonts", 40},
	{"b", 50},
	{"bCs", 60},
	{"i", 70},
	{"iCs", 80},
	{"caps", 90},
	{"smallCaps", 100},
	{"strike", 110},
	{"dstrike", 120},
	{"outline", 130},
	{"shadow", 140},
	{"emboss", 150},
	{"imprint", 160},
	{"noProof", 170},
	{"snapToGrid", 180},
	{"vanish", 190},
	{"webHidden", 200},
	{"color", 210},
	{"spacing", 220},
	{"w", 230},
	{"kern", 240},
	{"position", 250},
	{"sz", 260},
	{"szCs", 270},
	{"highlight", 280},
	{"u", 290},
	{"effect", 300},
	{"bdr", 310},
	{"shd", 320},
	{"fitText", 330},
	{"vertAlign", 340},
	{"rtl", 350},
	{"cs", 360},
	{"em", 370},
	{"lang", 380},
	{"eastAsianLayout", 390},
	{"specVanish", 400},
	{"oMath", 410},
	{"rPrChange", 420},
};

const rank_table TBLPR_ORDER = {
	{"tblStyle", 10},
	{"tblpPr", 20},
	{"tblOverlap", 30},
	{"bidiVisual", 40},
	{"tblStyleRowBandSize", 50},
	{"tblStyleColBandSize", 60},
	{"tblW", 70},
	{"jc", 80},
	{"tblCellSpacing", 90},
	{"tblInd", 100},
	{"tblBorders", 110},
	{"shd", 120},
	{"tblLayout", 130},
	{"tblCellMar", 140},
	{"tblLook", 150},
	{"tblCaption", 160},
	{"tblDescription", 170},
	{"tblPrChange", 180},
};

const rank_table TCPR_ORDER = {
	{"cnfStyle", 10},
	{"tcW", 20},
	{"gridSpan", 30},
	{"hMerge", 40},
	{"vMerge", 50},
	{"tcBorders", 60},
	{"shd", 70},
	{"noWrap", 80},
	{"tcMar", 90},
	{"textDirection", 100},
	{"tcFitText", 110},
	{"vAlign", 120},
	{"hideMark", 130},
	{"headers", 140},
	{"cellIns", 150},
	{"cellDel", 160},
	{"cellMerge", 170},
	{"tcPrChange", 180},
};

const rank_table TBL_BORDERS_ORDER = {
	{"top", 10},
	{"start", 15},
	{"left", 20},
	{"bottom", 30},
	{"end", 35},
	{"right", 40},
	{"insideH", 50},
	{"insideV", 60},
};

const rank_table TC_BORDERS_ORDER = {
	{"top", 10},
	{"start", 15},
	{"left", 20},
	{"bottom", 30},
	{"end", 35},
	{"right", 40},
	{"insideH", 50},
	{"insideV", 60},
	{"tl2br", 70},
	{"tr2bl", 80},
};

const rank_table PBDR_ORDER = {
	{"top", 10},
	{"left", 20},
	{"bottom", 30},
	{"right", 40},
	{"between", 50},
	{"bar", 60},
};

const std::set<std::string_view> REVISION_ELEMENTS = {
	"ins",
	"del",
	"rPrChange",
	"pPrChange",
	"tblPrChange",
	"tblPrExChange",
	"trPrChange",
	"tcPrChange",
	"sectPrChange",
	"tblGridChange",
	"numberingChange",
	"moveFrom",
	"moveTo",
	"moveFromRangeStart",
	"moveFromRangeEnd",
	"moveToRangeStart",
	"moveToRangeEnd",
	"cellIns",
	"cellDel",
	"cellMerge",
};

const rank_table* rank_table_for(std::string_view local) {
	static const std::map<std::string_view, const rank_table*> tables = {
		{"pPr", &PPR_ORDER},
		{"rPr", &RPR_ORDER},
		{"tblPr", &TBLPR_ORDER},
		{"tcPr", &TCPR_ORDER},
		{"tblBorders", &TBL_BORDERS_ORDER},
		{"tcBorders", &TC_BORDERS_ORDER},
		{"pBdr", &PBDR_ORDER},
	};
	const auto it = tables.find(local);
	return it == tables.end() ? nullptr : it->second;
}

std::string qualified(pugi::xml_node like, const char* local) {
	const std::string prefix = get_prefix(like.name());
	return prefix.empty() ? std::string(local) : prefix + ":" + local;
}

std::string status_of(pugi::xml_node node) {
	return node.attribute(PT_STATUS).as_string();
}

void stamp_revision(pugi::xml_node revision, const wml_revision_stamp& stamp) {
	revision.remove_attribute("w:id");
	revision.remove_attribute("w:author");
	revision.remove_attribute("w:date");
	revision.prepend_attribute("w:date") = stamp.date.c_str();
	revision.prepend_attribute("w:author") = stamp.author.c_str();
	revision.prepend_attribute("w:id") = "0";
}

pugi::xml_node ensure_child_first(pugi::xml_node parent, const char* local) {
	if (auto existing = first_child_local(parent, local)) {
		return existing;
	}
	return parent.prepend_child(qualified(parent, local).c_str());
}

bool is_wrappable(const std::string& status) {
	return status == "Deleted" || status == "Inserted";
}

void collect_marked(pugi::xml_node node, std::vector<pugi::xml_node>& parents, std::vector<pugi::xml_node>& marks, std::vector<pugi::xml_node>& format_runs) {
	bool parent_recorded{false};
	for (auto child : node.children()) {
		if (child.type() != pugi::node_element) {
			continue;
		}
		const std::string status = status_of(child);
		if (has_local_name(child, "pPr")) {
			if (is_wrappable(status)) {
				marks.push_back(child);
			}
		} else if (is_wrappable(status) && !parent_recorded) {
			parents.push_back(node);
			parent_recorded = true;
		} else if (status == "FormatChanged" && has_local_name(child, "r")) {
			format_runs.push_back(child);
		}
		collect_marked(child, parents, marks, format_runs);
	}
}

void wrap_siblings(pugi::xml_node parent, const wml_revision_stamp& stamp) {
	auto child = parent.first_child();
	while (child) {
		const std::string status = child.type() == pugi::node_element && !has_local_name(child, "pPr") ? status_of(child) : std::string{};
		if (!is_wrappable(status)) {
			child = child.next_sibling();
			continue;
		}
		auto wrapper = parent.insert_child_before(qualified(parent, status == "Deleted" ? "del" : "ins").c_str(), child);
		stamp_revision(wrapper, stamp);
		while (child && child.type() == pugi::node_element && status_of(child) == status && !has_local_name(child, "pPr")) {
			auto next = child.next_sibling();
			child.remove_attribute(PT_STATUS);
			wrapper.append_move(child);
			child = next;
		}
	}
}

void mark_paragraph(pugi::xml_node ppr, const wml_revision_stamp& stamp) {
	const std::string status = status_of(ppr);
	ppr.remove_attribute(PT_STATUS);
	auto rpr = first_child_local(ppr, "rPr");
	if (!rpr) {
		rpr = ppr.append_child(qualified(ppr, "rPr").c_str());
	}
	auto revision = rpr.append_child(qualified(ppr, status == "Deleted" ? "del" : "ins").c_str());
	stamp_revision(revision, stamp);
}

// Every run and paragraph mark of the row carries the same insert or delete status.
std::string uniform_row_status(pugi::xml_node row) {
	std::string status;
	bool saw_mark{false};
	for (auto node : descendants_local(row, "pPr")) {
		const std::string current = status_of(node);
		if (!is_wrappable(current) || (!status.empty() && current != status)) {
			return {};
		}
		status = current;
		saw_mark = true;
	}
	if (!saw_mark) {
		return {};
	}
	for (auto run : descendants_local(row, "r")) {
		if (status_of(run) != status) {
			return {};
		}
	}
	return status;
}

void mark_rows(pugi::xml_node root, const wml_revision_stamp& stamp) {
	for (auto row : descendants_local(root, "tr")) {
		const std::string status = uniform_row_status(row);
		if (status.empty()) {
			continue;
		}
		auto trpr = first_child_local(row, "trPr");
		if (!trpr) {
			if (auto exceptions = first_child_local(row, "tblPrEx")) {
				trpr = row.insert_child_after(qualified(row, "trPr").c_str(), exceptions);
			} else {
				trpr = row.prepend_child(qualified(row, "trPr").c_str());
			}
		}
		auto revision = trpr.append_child(qualified(row, status == "Deleted" ? "del" : "ins").c_str());
		stamp_revision(revision, stamp);
	}
}

void sort_children(pugi::xml_node node, const rank_table& ranks) {
	std::vector<pugi::xml_node> elements;
	for (auto child : node.children()) {
		if (child.type() == pugi::node_element) {
			elements.push_back(child);
		}
	}
	auto rank = [&](pugi::xml_node n) {
		const auto it = ranks.find(get_local_name(n.name()));
		return it == ranks.end() ? 10000 : it->second;
	};
	std::stable_sort(elements.begin(), elements.end(), [&](pugi::xml_node a, pugi::xml_node b) { return rank(a) < rank(b); });
	for (auto element : elements) {
		node.append_move(element);
	}
}

void promote(pugi::xml_node node, const char* local) {
	auto properties = first_child_local(node, local);
	if (!properties) {
		return;
	}
	const auto children = element_children(node);
	if (children.front() != properties) {
		node.insert_move_before(properties, children.front());
	}
}

void order_recursive(pugi::xml_node node) {
	for (auto child : node.children()) {
		if (child.type() == pugi::node_element) {
			order_recursive(child);
		}
	}
	const std::string local = local_name(node);
	if (const auto* ranks = rank_table_for(local)) {
		sort_children(node, *ranks);
	}
	if (local == "p") {
		promote(node, "pPr");
	} else if (local == "r") {
		promote(node, "rPr");
	} else if (local == "tbl") {
		promote(node, "tblPr");
	} else if (local == "tr") {
		promote(node, "trPr");
		promote(node, "tblPrEx");
	} else if (local == "tc") {
		promote(node, "tcPr");
	}
}

void renumber_recursive(pugi::xml_node node, revision_id_generator& ids) {
	if (is_revision_element(node) && node.attribute("w:id")) {
		node.remove_attribute("w:id");
		node.prepend_attribute("w:id") = ids.next();
	}
	for (auto child : node.children()) {
		if (child.type() == pugi::node_element) {
			renumber_recursive(child, ids);
		}
	}
}
}

bool is_revision_element(pugi::xml_node node) {
	return node.type() == pugi::node_element && REVISION_ELEMENTS.count(get_local_name(node.name())) != 0;
}

void wml_mark_revisions(pugi::xml_node root, const wml_revision_stamp& stamp) {
	mark_rows(root, stamp);
	std::vector<pugi::xml_node> parents;
	std::vector<pugi::xml_node> marks;
	std::vector<pugi::xml_node> format_runs;
	collect_marked(root, parents, marks, format_runs);
	for (auto parent : parents) {
		wrap_siblings(parent, stamp);
	}
	for (auto ppr : marks) {
		mark_paragraph(ppr, stamp);
	}
	for (auto run : format_runs) {
		run.remove_attribute(PT_STATUS);
		if (auto change = first_descendant_local(run, "rPrChange")) {
			stamp_revision(change, stamp);
		}
	}
}

void wml_order_elements(pugi::xml_node root) {
	order_recursive(root);
}

void wml_renumber_revisions(pugi::xml_node root, revision_id_generator& ids) {
	renumber_recursive(root, ids);
}

void wml_decorate(pugi::xml_node root, const wml_revision_stamp& stamp, revision_id_generator& ids) {
	wml_mark_revisions(root, stamp);
	wml_order_elements(root);
	wml_renumber_revisions(root, ids);
	strip_powertools_markup(root);
}

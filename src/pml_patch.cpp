/* pml_patch.cpp - replays presentation change records.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "pml_patch.hpp"
#include "compare_exception.hpp"
#include "package.hpp"
#include "pml_canonicalize.hpp"
#include "utils.hpp"
#include "xml_utils.hpp"
#include <map>
#include <utility>
#include <wx/log.h>

namespace {
bool patchable(pml_change_type type) {
	switch (type) {
		case pml_change_type::text_changed:
		case pml_change_type::text_formatting_changed:
		case pml_change_type::shape_moved:
		case pml_change_type::shape_resized:
			return true;
		default:
			return false;
	}
}

pugi::xml_node find_shape(pugi::xml_node tree, const pml_change& change) {
	pugi::xml_node by_name;
	for (auto c_nv_pr : descendants_local(tree, "cNvPr")) {
		if (change.shape_id && attribute_local(c_nv_pr, "id") == *change.shape_id) {
			return c_nv_pr.parent().parent();
		}
		if (!by_name && change.shape_name && attribute_local(c_nv_pr, "name") == *change.shape_name) {
			by_name = c_nv_pr.parent().parent();
		}
	}
	return by_name;
}

pugi::xml_node find_transform(pugi::xml_node shape) {
	if (auto xfrm = first_child_local(shape, "xfrm")) {
		return xfrm;
	}
	if (auto xfrm = first_child_local(first_child_local(shape, "spPr"), "xfrm")) {
		return xfrm;
	}
	return first_child_local(first_child_local(shape, "grpSpPr"), "xfrm");
}

void set_attribute(pugi::xml_node node, const char* name, long long value) {
	auto attr = node.attribute(name);
	if (!attr) {
		attr = node.append_attribute(name);
	}
	attr.set_value(value);
}

// Rebuilds the paragraphs of a text body from plain text, keeping its body and list properties
// and the properties of its first run.
void write_plain_text(pugi::xml_node body, const std::string& text) {
	const auto paragraphs = children_local(body, "p");
	const std::string a = paragraphs.empty() ? std::string("a") : get_prefix(paragraphs.front().name());
	const std::string p_name = a.empty() ? std::string("p") : a + ":p";
	const std::string r_name = a.empty() ? std::string("r") : a + ":r";
	const std::string t_name = a.empty() ? std::string("t") : a + ":t";
	pugi::xml_document saved;
	if (auto r_pr = first_descendant_local(body, "rPr")) {
		saved.append_copy(r_pr);
	}
	for (auto paragraph : paragraphs) {
		body.remove_child(paragraph);
	}
	size_t start = 0;
	while (true) {
		const size_t end = text.find('\n', start);
		const std::string line = text.substr(start, end == std::string::npos ? std::string::npos : end - start);
		auto paragraph = body.append_child(p_name.c_str());
		if (!line.empty()) {
			auto run = paragraph.append_child(r_name.c_str());
			if (saved.first_child()) {
				run.append_copy(saved.first_child());
			}
			auto t = run.append_child(t_name.c_str());
			t.text().set(line.c_str());
		}
		if (end == std::string::npos) {
			break;
		}
		start = end + 1;
	}
}

void apply_text(pugi::xml_node shape, const pml_change& change, const std::string& part) {
	auto body = first_child_local(shape, "txBody");
	if (change.new_text_body) {
		pugi::xml_document fragment;
		load_xml(fragment, *change.new_text_body, part);
		if (body) {
			shape.insert_copy_after(fragment.document_element(), body);
			shape.remove_child(body);
		} else if (auto sp_pr = first_child_local(shape, "spPr")) {
			shape.insert_copy_after(fragment.document_element(), sp_pr);
		} else {
			shape.append_copy(fragment.document_element());
		}
		return;
	}
	if (!change.new_value) {
		if (body) {
			shape.remove_child(body);
		}
		return;
	}
	if (!body) {
		wxLogWarning("Shape '%s' in %s has no text body to rewrite", change.shape_name.value_or(""), part);
		return;
	}
	write_plain_text(body, *change.new_value);
}

void apply_transform(pugi::xml_node shape, const pml_change& change, const std::string& part) {
	auto xfrm = find_transform(shape);
	if (!xfrm) {
		wxLogWarning("Shape '%s' in %s has no transform", change.shape_name.value_or(""), part);
		return;
	}
	if (change.type == pml_change_type::shape_moved && change.new_x && change.new_y) {
		auto off = first_child_local(xfrm, "off");
		set_attribute(off, "x", *change.new_x);
		set_attribute(off, "y", *change.new_y);
	} else if (change.type == pml_change_type::shape_resized && change.new_cx && change.new_cy) {
		auto ext = first_child_local(xfrm, "ext");
		set_attribute(ext, "cx", *change.new_cx);
		set_attribute(ext, "cy", *change.new_cy);
	}
}

void apply_to_slide(package& pkg, const std::string& part, const std::vector<const pml_change*>& changes) {
	auto doc = pkg.get_xml_part(part);
	const auto tree = first_descendant_local(doc->document_element(), "spTree");
	for (const auto* change : changes) {
		auto shape = find_shape(tree, *change);
		if (!shape) {
			wxLogWarning("No shape '%s' on %s; skipping %s", change->shape_name.value_or(change->shape_id.value_or("")), part, pml_change_type_name(change->type));
			continue;
		}
		if (change->type == pml_change_type::text_changed || change->type == pml_change_type::text_formatting_changed) {
			apply_text(shape, *change, part);
		} else {
			apply_transform(shape, *change, part);
		}
	}
	pkg.put_xml_part(part, *doc);
}
}

pml_change pml_invert_change(const pml_change& change) {
	pml_change inverse = change;
	std::swap(inverse.old_value, inverse.new_value);
	std::swap(inverse.old_text_body, inverse.new_text_body);
	std::swap(inverse.old_x, inverse.new_x);
	std::swap(inverse.old_y, inverse.new_y);
	std::swap(inverse.old_cx, inverse.new_cx);
	std::swap(inverse.old_cy, inverse.new_cy);
	for (auto& text_change : inverse.text_changes) {
		std::swap(text_change.old_text, text_change.new_text);
		if (text_change.type == pml_text_change_type::insert) {
			text_change.type = pml_text_change_type::remove;
		} else if (text_change.type == pml_text_change_type::remove) {
			text_change.type = pml_text_change_type::insert;
		}
	}
	if (change.type == pml_change_type::shape_inserted) {
		inverse.type = pml_change_type::shape_deleted;
	} else if (change.type == pml_change_type::shape_deleted) {
		inverse.type = pml_change_type::shape_inserted;
	} else if (change.type == pml_change_type::slide_inserted) {
		inverse.type = pml_change_type::slide_deleted;
	} else if (change.type == pml_change_type::slide_deleted) {
		inverse.type = pml_change_type::slide_inserted;
	}
	return inverse;
}

std::string pml_apply_changes(const std::string& base, const std::vector<pml_change>& changes) {
	auto pkg = package::open(base);
	const auto parts = pml_slide_parts(pkg);
	std::map<std::string, std::vector<const pml_change*>> by_part;
	for (const auto& change : changes) {
		if (!patchable(change.type)) {
			continue;
		}
		if (change.slide_index < 1 || change.slide_index > static_cast<int>(parts.size())) {
			throw compare_exception(error_kind::missing_part, "no slide " + std::to_string(change.slide_index), PML_PRESENTATION_PART);
		}
		by_part[parts[static_cast<size_t>(change.slide_index - 1)]].push_back(&change);
	}
	for (const auto& [part, slide_changes] : by_part) {
		apply_to_slide(pkg, part, slide_changes);
	}
	wxLogVerbose("Patched %zu slides", by_part.size());
	return pkg.save();
}

std::string pml_revert_changes(const std::string& result, const std::vector<pml_change>& changes) {
	std::vector<pml_change> inverse;
	inverse.reserve(changes.size());
	for (const auto& change : changes) {
		inverse.push_back(pml_invert_change(change));
	}
	return pml_apply_changes(result, inverse);
}

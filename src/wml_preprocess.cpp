/* wml_preprocess.cpp - markup simplification and element identifiers.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "wml_preprocess.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include "xml_utils.hpp"
#include <cstdio>
#include <set>
#include <string_view>
#include <vector>

namespace {
void collect_elements(pugi::xml_node node, std::vector<pugi::xml_node>& out) {
	for (auto child : node.children()) {
		if (child.type() == pugi::node_element) {
			out.push_back(child);
			collect_elements(child, out);
		}
	}
}

std::vector<pugi::xml_node> all_elements(pugi::xml_node root) {
	std::vector<pugi::xml_node> out;
	collect_elements(root, out);
	return out;
}

bool run_is_empty(pugi::xml_node run) {
	for (auto child : run.children()) {
		if (child.type() == pugi::node_element && !has_local_name(child, "rPr")) {
			return false;
		}
	}
	return true;
}

void remove_emptied_runs(const std::vector<pugi::xml_node>& runs) {
	std::set<pugi::xml_node> seen;
	for (auto run : runs) {
		if (seen.insert(run).second && run_is_empty(run)) {
			run.parent().remove_child(run);
		}
	}
}

std::set<std::string_view> removable_names(const wml_simplify_settings& settings) {
	std::set<std::string_view> names;
	if (settings.remove_bookmarks) {
		names.insert({"bookmarkStart", "bookmarkEnd"});
	}
	if (settings.remove_comments) {
		names.insert({"commentRangeStart", "commentRangeEnd", "commentReference", "annotationRef"});
	}
	if (settings.remove_field_codes) {
		names.insert({"fldChar", "instrText", "delInstrText"});
	}
	if (settings.remove_last_rendered_page_break) {
		names.insert("lastRenderedPageBreak");
	}
	if (settings.remove_permissions) {
		names.insert({"permStart", "permEnd"});
	}
	if (settings.remove_proof) {
		names.insert("proofErr");
	}
	if (settings.remove_soft_hyphens) {
		names.insert("softHyphen");
	}
	return names;
}

// Runs between a field's begin and separate marks hold only the field code.
void remove_field_code_runs(pugi::xml_node root) {
	for (auto p : descendants_local(root, "p")) {
		int depth{0};
		bool in_code{false};
		std::vector<pugi::xml_node> doomed;
		for (auto r : descendants_local(p, "r")) {
			if (ancestor_local(r, "p") != p) {
				continue;
			}
			const auto fld = first_child_local(r, "fldChar");
			const std::string type = fld ? attribute_local(fld, "fldCharType") : std::string{};
			if (type == "begin") {
				++depth;
				in_code = true;
			} else if (type == "separate") {
				in_code = false;
			} else if (type == "end") {
				depth = depth > 0 ? depth - 1 : 0;
				in_code = false;
			} else if (in_code && depth > 0) {
				doomed.push_back(r);
			}
		}
		for (auto r : doomed) {
			r.parent().remove_child(r);
		}
	}
}

void unwrap_content_control(pugi::xml_node sdt) {
	for (auto child : element_children(sdt)) {
		if (has_local_name(child, "sdtContent")) {
			unwrap_node(child);
		} else {
			sdt.remove_child(child);
		}
	}
	unwrap_node(sdt);
}

void unwrap_with_properties(pugi::xml_node node, std::string_view properties) {
	if (auto props = first_child_local(node, properties)) {
		node.remove_child(props);
	}
	unwrap_node(node);
}
}

void wml_simplify_markup(pugi::xml_node root, const wml_simplify_settings& settings) {
	if (settings.remove_field_codes) {
		remove_field_code_runs(root);
	}
	const auto doomed = removable_names(settings);
	auto elements = all_elements(root);
	std::vector<pugi::xml_node> touched_runs;
	// Innermost first, so unwrapping never invalidates a node still to be visited.
	for (auto it = elements.rbegin(); it != elements.rend(); ++it) {
		auto node = *it;
		const std::string name = local_name(node);
		if (doomed.count(name) != 0) {
			auto parent = node.parent();
			parent.remove_child(node);
			if (has_local_name(parent, "r")) {
				touched_runs.push_back(parent);
			}
		} else if (settings.remove_content_controls && name == "sdt") {
			unwrap_content_control(node);
		} else if (settings.remove_smart_tags && name == "smartTag") {
			unwrap_with_properties(node, "smartTagPr");
		} else if (settings.remove_smart_tags && name == "customXml") {
			unwrap_with_properties(node, "customXmlPr");
		} else if (settings.remove_hyperlinks && name == "hyperlink") {
			unwrap_node(node);
		} else if (settings.remove_field_codes && name == "fldSimple") {
			unwrap_node(node);
		}
	}
	remove_emptied_runs(touched_runs);
	if (!settings.remove_rsid_info && !settings.remove_soft_hyphens) {
		return;
	}
	for (auto node : all_elements(root)) {
		if (settings.remove_rsid_info) {
			std::vector<pugi::xml_attribute> attrs;
			for (auto attr : node.attributes()) {
				const std::string qname = attr.name();
				if (is_rsid_attribute(attr.name()) || qname == "w14:paraId" || qname == "w14:textId") {
					attrs.push_back(attr);
				}
			}
			for (auto attr : attrs) {
				node.remove_attribute(attr);
			}
		}
		if (settings.remove_soft_hyphens && (has_local_name(node, "t") || has_local_name(node, "delText"))) {
			const std::string text = node.text().as_string();
			const std::string cleaned = remove_soft_hyphens(text);
			if (cleaned != text) {
				node.text().set(cleaned.c_str());
			}
		}
	}
}

std::string unid_generator::next() {
	char buf[17];
	std::snprintf(buf, sizeof(buf), "%016lx", ++counter);
	return buf;
}

void assign_unids(pugi::xml_node root, unid_generator& generator) {
	if (root.type() == pugi::node_element && !root.attribute(PT_UNID)) {
		root.append_attribute(PT_UNID) = generator.next().c_str();
	}
	for (auto node : all_elements(root)) {
		if (!node.attribute(PT_UNID)) {
			node.append_attribute(PT_UNID) = generator.next().c_str();
		}
	}
}

void ensure_powertools_namespace(pugi::xml_node document_element) {
	const std::string decl = std::string("xmlns:") + PT_PREFIX;
	if (!document_element.attribute(decl.c_str())) {
		document_element.append_attribute(decl.c_str()) = POWERTOOLS_NS;
	}
}

void strip_powertools_markup(pugi::xml_node root) {
	const std::string prefix = std::string(PT_PREFIX) + ":";
	const std::string decl = std::string("xmlns:") + PT_PREFIX;
	std::vector<pugi::xml_node> nodes{root};
	collect_elements(root, nodes);
	for (auto node : nodes) {
		std::vector<pugi::xml_attribute> attrs;
		for (auto attr : node.attributes()) {
			const std::string_view name = attr.name();
			if (name.substr(0, prefix.size()) == prefix || name == decl) {
				attrs.push_back(attr);
			}
		}
		for (auto attr : attrs) {
			node.remove_attribute(attr);
		}
	}
}

bool is_rsid_attribute(const char* name) {
	const std::string local = get_local_name(name);
	return local.rfind("rsid", 0) == 0;
}

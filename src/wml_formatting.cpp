/* wml_formatting.cpp - run formatting signatures and format-change detection.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "wml_formatting.hpp"
#include "constants.hpp"
#include "hashing.hpp"
#include "utils.hpp"
#include "wml_preprocess.hpp"
#include "xml_utils.hpp"
#include <algorithm>
#include <string_view>

namespace {
constexpr std::string_view ALLOWED_PROPERTIES[] = {"b", "bCs", "i", "iCs", "u", "sz", "szCs", "color", "rFonts", "highlight", "strike", "dstrike", "caps", "smallCaps"};
constexpr std::string_view VALUED_PROPERTIES[] = {"u", "color", "sz", "szCs", "rFonts", "highlight"};
constexpr std::string_view FONT_SLOTS[] = {"ascii", "hAnsi", "cs", "eastAsia"};

template <size_t N>
bool contains(const std::string_view (&values)[N], std::string_view value) {
	return std::find(std::begin(values), std::end(values), value) != std::end(values);
}

bool keeps_attribute(std::string_view element, const pugi::xml_attribute& attr) {
	const std::string name = attr.name();
	if (name.rfind("xmlns", 0) == 0 || name.rfind(std::string(PT_PREFIX) + ":", 0) == 0 || is_rsid_attribute(attr.name())) {
		return false;
	}
	const std::string local = get_local_name(attr.name());
	if (local == "Unid") {
		return false;
	}
	if (contains(VALUED_PROPERTIES, element)) {
		return local == "val" || (element == "rFonts" && contains(FONT_SLOTS, local));
	}
	return true;
}

void write_element(pugi::xml_node node, std::string& out) {
	const std::string local = local_name(node);
	out += "<w:" + local;
	for (auto attr : node.attributes()) {
		if (keeps_attribute(local, attr)) {
			out += " w:" + get_local_name(attr.name()) + "=\"" + attr.value() + "\"";
		}
	}
	out += " />";
}
}

std::string wml_formatting_signature(pugi::xml_node run) {
	const auto rpr = first_child_local(run, "rPr");
	if (!rpr) {
		return {};
	}
	std::string body;
	for (auto child : element_children(rpr)) {
		if (contains(ALLOWED_PROPERTIES, local_name(child))) {
			write_element(child, body);
		}
	}
	if (body.empty()) {
		return {};
	}
	return sha1_hex("<w:rPr>" + body + "</w:rPr>");
}

std::string wml_run_properties_xml(pugi::xml_node run) {
	const auto rpr = first_child_local(run, "rPr");
	if (!rpr) {
		return {};
	}
	pugi::xml_document copy;
	auto node = copy.append_copy(rpr);
	strip_powertools_markup(node);
	return node_to_string(node);
}

size_t wml_reconcile_formatting(std::vector<atom_ptr>& atoms) {
	size_t changed{0};
	for (auto& atom : atoms) {
		if (atom->status != correlation_status::equal || !atom->before) {
			continue;
		}
		if (atom->is_paragraph_mark()) {
			continue;
		}
		if (atom->formatting_signature == atom->before->formatting_signature) {
			continue;
		}
		atom->status = correlation_status::format_changed;
		atom->before_signature = atom->before->formatting_signature;
		if (auto run = atom->before->find_ancestor("r")) {
			atom->before_rpr = wml_run_properties_xml(run->node);
		}
		++changed;
	}
	return changed;
}

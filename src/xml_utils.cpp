/* xml_utils.cpp - pugixml helpers shared by every comparer.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "xml_utils.hpp"
#include "compare_exception.hpp"
#include "utils.hpp"
#include <sstream>

void load_xml(pugi::xml_document& doc, std::string_view content, const std::string& locator) {
	const auto result = doc.load_buffer(content.data(), content.size(), XML_PARSE_FLAGS);
	if (!result) {
		throw compare_exception(error_kind::xml_parse, std::string(result.description()) + " at offset " + std::to_string(result.offset), locator);
	}
}

std::string serialize_xml(const pugi::xml_document& doc) {
	std::ostringstream out;
	out << XML_DECLARATION;
	doc.save(out, "", pugi::format_raw | pugi::format_no_declaration, pugi::encoding_utf8);
	return out.str();
}

std::string node_to_string(pugi::xml_node node) {
	std::ostringstream out;
	node.print(out, "", pugi::format_raw, pugi::encoding_utf8);
	return out.str();
}

std::string local_name(pugi::xml_node node) {
	return get_local_name(node.name());
}

bool has_local_name(pugi::xml_node node, std::string_view name) {
	if (node.type() != pugi::node_element) {
		return false;
	}
	std::string_view qname = node.name();
	const auto pos = qname.find(':');
	if (pos != std::string_view::npos) {
		qname.remove_prefix(pos + 1);
	}
	return qname == name;
}

pugi::xml_node first_child_local(pugi::xml_node node, std::string_view name) {
	for (auto child : node.children()) {
		if (has_local_name(child, name)) {
			return child;
		}
	}
	return {};
}

std::vector<pugi::xml_node> children_local(pugi::xml_node node, std::string_view name) {
	std::vector<pugi::xml_node> result;
	for (auto child : node.children()) {
		if (has_local_name(child, name)) {
			result.push_back(child);
		}
	}
	return result;
}

std::vector<pugi::xml_node> element_children(pugi::xml_node node) {
	std::vector<pugi::xml_node> result;
	for (auto child : node.children()) {
		if (child.type() == pugi::node_element) {
			result.push_back(child);
		}
	}
	return result;
}

namespace {
void collect_descendants(pugi::xml_node node, std::string_view name, std::vector<pugi::xml_node>& out) {
	for (auto child : node.children()) {
		if (child.type() != pugi::node_element) {
			continue;
		}
		if (has_local_name(child, name)) {
			out.push_back(child);
		}
		collect_descendants(child, name, out);
	}
}
}

std::vector<pugi::xml_node> descendants_local(pugi::xml_node node, std::string_view name) {
	std::vector<pugi::xml_node> result;
	collect_descendants(node, name, result);
	return result;
}

pugi::xml_node first_descendant_local(pugi::xml_node node, std::string_view name) {
	for (auto child : node.children()) {
		if (child.type() != pugi::node_element) {
			continue;
		}
		if (has_local_name(child, name)) {
			return child;
		}
		if (auto found = first_descendant_local(child, name)) {
			return found;
		}
	}
	return {};
}

pugi::xml_node ancestor_local(pugi::xml_node node, std::string_view name) {
	for (auto parent = node.parent(); parent; parent = parent.parent()) {
		if (has_local_name(parent, name)) {
			return parent;
		}
	}
	return {};
}

std::string attribute_local(pugi::xml_node node, std::string_view name) {
	for (auto attr : node.attributes()) {
		std::string_view qname = attr.name();
		const auto pos = qname.find(':');
		if (pos != std::string_view::npos) {
			if (qname.substr(0, pos) == "xmlns") {
				continue;
			}
			qname.remove_prefix(pos + 1);
		}
		if (qname == name) {
			return attr.value();
		}
	}
	return {};
}

std::string qualified_attribute_local(pugi::xml_node node, std::string_view name) {
	for (auto attr : node.attributes()) {
		const std::string_view qname = attr.name();
		const auto pos = qname.find(':');
		if (pos == std::string_view::npos || qname.substr(0, pos) == "xmlns") {
			continue;
		}
		if (qname.substr(pos + 1) == name) {
			return attr.value();
		}
	}
	return {};
}

std::string descendant_text(pugi::xml_node node, std::string_view name) {
	std::string text;
	for (auto t : descendants_local(node, name)) {
		text += t.text().as_string();
	}
	return text;
}

void unwrap_node(pugi::xml_node node) {
	auto parent = node.parent();
	if (!parent) {
		return;
	}
	while (auto child = node.first_child()) {
		parent.insert_move_before(child, node);
	}
	parent.remove_child(node);
}

void remove_children(pugi::xml_node node) {
	while (auto child = node.first_child()) {
		node.remove_child(child);
	}
}

std::string declare_namespace(pugi::xml_node root, const char* uri, const char* preferred_prefix) {
	for (auto attr : root.attributes()) {
		const std::string_view name = attr.name();
		if (name.substr(0, 6) == "xmlns:" && std::string_view(attr.value()) == uri) {
			return std::string(name.substr(6));
		}
	}
	root.append_attribute(("xmlns:" + std::string(preferred_prefix)).c_str()) = uri;
	return preferred_prefix;
}

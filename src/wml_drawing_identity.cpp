/* wml_drawing_identity.cpp - content identity of drawings and pictures.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "wml_drawing_identity.hpp"
#include "constants.hpp"
#include "hashing.hpp"
#include "package.hpp"
#include "utils.hpp"
#include "xml_utils.hpp"
#include <algorithm>
#include <tuple>
#include <vector>
#include <wx/log.h>

namespace {
constexpr const char* TEXTBOX_PREFIX = "TEXTBOX:";

void append_textbox_content(pugi::xml_node node, std::string& out) {
	if (node.type() == pugi::node_pcdata || node.type() == pugi::node_cdata) {
		out += node.value();
		return;
	}
	if (node.type() != pugi::node_element) {
		return;
	}
	out += local_name(node);
	for (auto child : node.children()) {
		append_textbox_content(child, out);
	}
}

std::string find_image_relationship(pugi::xml_node drawing) {
	for (auto blip : descendants_local(drawing, "blip")) {
		const std::string embed = blip.attribute("r:embed").as_string();
		if (!embed.empty()) {
			return embed;
		}
	}
	for (auto image : descendants_local(drawing, "imagedata")) {
		const std::string id = image.attribute("r:id").as_string();
		if (!id.empty()) {
			return id;
		}
		const std::string relid = attribute_local(image, "relid");
		if (!relid.empty()) {
			return relid;
		}
	}
	return {};
}

bool excluded_from_structure(const std::string& name) {
	if (name.rfind("xmlns", 0) == 0 || name.rfind("r:", 0) == 0 || name.rfind("wp14:", 0) == 0) {
		return true;
	}
	if (name.rfind(std::string(PT_PREFIX) + ":", 0) == 0) {
		return true;
	}
	return name == "ObjectID" || name == "ShapeID" || name == "id" || name == "type";
}

void append_structure(pugi::xml_node node, std::string& out) {
	if (node.type() == pugi::node_pcdata || node.type() == pugi::node_cdata) {
		out += node.value();
		return;
	}
	if (node.type() != pugi::node_element) {
		return;
	}
	out += local_name(node);
	std::vector<std::tuple<std::string, std::string>> attrs;
	for (auto attr : node.attributes()) {
		const std::string name = attr.name();
		if (!excluded_from_structure(name)) {
			attrs.emplace_back(name, attr.value());
		}
	}
	std::sort(attrs.begin(), attrs.end());
	for (const auto& [name, value] : attrs) {
		out += name + "=" + value + ";";
	}
	for (auto child : node.children()) {
		append_structure(child, out);
	}
}
}

std::string wml_drawing_identity(pugi::xml_node drawing, const package* pkg, const std::string& part) {
	const auto textboxes = descendants_local(drawing, "txbxContent");
	if (!textboxes.empty()) {
		std::string content = TEXTBOX_PREFIX;
		for (auto txbx : textboxes) {
			append_textbox_content(txbx, content);
		}
		return sha1_hex(content);
	}
	const std::string rel_id = find_image_relationship(drawing);
	if (pkg != nullptr && !rel_id.empty()) {
		const auto* rel = pkg->find_relationship(part, rel_id);
		if (rel != nullptr && !rel->external) {
			if (const auto* bytes = pkg->get_part(package::resolve_target(part, rel->target))) {
				return sha1_hex(*bytes);
			}
		}
		wxLogWarning("Cannot resolve image relationship %s in %s; using markup identity", rel_id, part);
	}
	return wml_xml_structure_hash(drawing);
}

std::string wml_xml_structure_hash(pugi::xml_node node) {
	std::string content;
	append_structure(node, content);
	return sha1_hex(content);
}

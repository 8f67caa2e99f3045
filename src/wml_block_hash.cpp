/* wml_block_hash.cpp - block-level correlation hashes.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "wml_block_hash.hpp"
#include "constants.hpp"
#include "hashing.hpp"
#include "utils.hpp"
#include "wml_preprocess.hpp"
#include "wml_revision_accepter.hpp"
#include "xml_utils.hpp"
#include <unordered_map>
#include <vector>

namespace {
constexpr const char* NBSP = "\xC2\xA0";

std::string escape_text(const std::string& text) {
	std::string out;
	out.reserve(text.size());
	for (const char ch : text) {
		switch (ch) {
			case '&':
				out += "&amp;";
				break;
			case '<':
				out += "&lt;";
				break;
			case '>':
				out += "&gt;";
				break;
			case '"':
				out += "&quot;";
				break;
			default:
				out += ch;
		}
	}
	return out;
}

std::string normalize_text(const std::string& text, const wml_comparer_settings& settings) {
	std::string result = text;
	if (settings.case_insensitive) {
		result = fold_case(result);
	}
	if (settings.conflate_spaces) {
		std::string conflated;
		for (const char ch : result) {
			if (ch == ' ') {
				conflated += NBSP;
			} else {
				conflated += ch;
			}
		}
		result = std::move(conflated);
	}
	return escape_text(result);
}

bool skip_attribute(const pugi::xml_attribute& attr) {
	const std::string name = attr.name();
	return is_rsid_attribute(attr.name()) || name.rfind("xmlns", 0) == 0 || name.rfind(std::string(PT_PREFIX) + ":", 0) == 0;
}

bool is_text_only_run(pugi::xml_node run) {
	bool has_text{false};
	for (auto child : element_children(run)) {
		if (has_local_name(child, "t")) {
			has_text = true;
		} else if (!has_local_name(child, "rPr")) {
			return false;
		}
	}
	return has_text;
}

class canonical_writer {
public:
	explicit canonical_writer(const wml_comparer_settings& settings) : settings{settings} {
	}

	void write(pugi::xml_node node) {
		if (node.type() == pugi::node_pcdata || node.type() == pugi::node_cdata) {
			out += normalize_text(node.value(), settings);
			return;
		}
		if (node.type() != pugi::node_element) {
			return;
		}
		const std::string name = local_name(node);
		if (name == "bookmarkStart" || name == "bookmarkEnd" || name == "pPr" || name == "rPr") {
			return;
		}
		if (name == "p") {
			write_paragraph(node);
		} else if (name == "r") {
			for (auto child : node.children()) {
				write(child);
			}
		} else if (name == "tbl") {
			write_filtered(node, "tr");
		} else if (name == "tr") {
			write_filtered(node, "tc");
		} else if (name == "tc" || name == "txbxContent") {
			write_filtered(node, {});
		} else if (name == "tcPr") {
			write_filtered(node, "gridSpan");
		} else if (name == "gridSpan") {
			out += "<w:gridSpan val=\"" + escape_text(attribute_local(node, "val")) + "\"/>";
		} else if ((name == "drawing" || name == "pict") && first_descendant_local(node, "txbxContent")) {
			out += "<w:" + name + ">";
			for (auto txbx : descendants_local(node, "txbxContent")) {
				write(txbx);
			}
			out += "</w:" + name + ">";
		} else {
			write_generic(node);
		}
	}

	[[nodiscard]] const std::string& result() const noexcept {
		return out;
	}

private:
	const wml_comparer_settings& settings;
	std::string out;
	std::string pending_text;

	void flush_text() {
		if (!pending_text.empty()) {
			out += "<w:r><w:t>" + normalize_text(pending_text, settings) + "</w:t></w:r>";
			pending_text.clear();
		}
	}

	void write_paragraph(pugi::xml_node p) {
		out += "<w:p>";
		for (auto child : element_children(p)) {
			if (has_local_name(child, "pPr")) {
				continue;
			}
			if (has_local_name(child, "r") && is_text_only_run(child)) {
				for (auto t : children_local(child, "t")) {
					pending_text += t.text().as_string();
				}
				continue;
			}
			flush_text();
			write(child);
		}
		flush_text();
		out += "</w:p>";
	}

	void write_filtered(pugi::xml_node node, std::string_view keep) {
		const std::string name = node.name();
		out += "<" + name + ">";
		for (auto child : element_children(node)) {
			if (keep.empty() || has_local_name(child, keep)) {
				write(child);
			}
		}
		out += "</" + name + ">";
	}

	void write_generic(pugi::xml_node node) {
		const std::string name = node.name();
		out += "<" + name;
		for (auto attr : node.attributes()) {
			if (skip_attribute(attr)) {
				continue;
			}
			out += " " + get_local_name(attr.name()) + "=\"" + escape_text(attr.value()) + "\"";
		}
		if (!node.first_child()) {
			out += "/>";
			return;
		}
		out += ">";
		for (auto child : node.children()) {
			write(child);
		}
		out += "</" + name + ">";
	}
};

bool is_hashed_block(pugi::xml_node node) {
	return has_local_name(node, "p") || has_local_name(node, "tbl") || has_local_name(node, "tr") || has_local_name(node, "txbxContent");
}

void collect_blocks(pugi::xml_node node, std::vector<pugi::xml_node>& out) {
	for (auto child : node.children()) {
		if (child.type() != pugi::node_element) {
			continue;
		}
		if (is_hashed_block(child)) {
			out.push_back(child);
		}
		collect_blocks(child, out);
	}
}
}

std::string wml_block_canonical_form(pugi::xml_node block, const wml_comparer_settings& settings) {
	canonical_writer writer(settings);
	writer.write(block);
	return writer.result();
}

void wml_assign_block_hashes(pugi::xml_node root, const wml_comparer_settings& settings) {
	pugi::xml_document shadow;
	auto shadow_root = shadow.append_copy(root);
	wml_accept_all_revisions(shadow_root);

	std::vector<pugi::xml_node> shadow_blocks;
	collect_blocks(shadow_root, shadow_blocks);
	std::unordered_map<std::string, std::string> hashes;
	for (auto block : shadow_blocks) {
		const std::string unid = block.attribute(PT_UNID).as_string();
		if (!unid.empty()) {
			hashes[unid] = sha1_hex(wml_block_canonical_form(block, settings));
		}
	}

	std::vector<pugi::xml_node> blocks;
	collect_blocks(root, blocks);
	for (auto block : blocks) {
		const auto it = hashes.find(block.attribute(PT_UNID).as_string());
		if (it == hashes.end()) {
			continue;
		}
		auto attr = block.attribute(PT_CORRELATED_HASH);
		if (!attr) {
			attr = block.append_attribute(PT_CORRELATED_HASH);
		}
		attr.set_value(it->second.c_str());
	}
}

/* wml_atomizer.cpp - flattening of word-processing content into atoms.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "wml_atomizer.hpp"
#include "constants.hpp"
#include "hashing.hpp"
#include "package.hpp"
#include "utils.hpp"
#include "wml_drawing_identity.hpp"
#include "wml_formatting.hpp"
#include "xml_utils.hpp"
#include <algorithm>
#include <map>
#include <unordered_map>

namespace {
const std::map<std::string_view, std::vector<std::string_view>> RECURSION_ELEMENTS = {
	{"del", {}},
	{"ins", {}},
	{"tbl", {"tblPr", "tblGrid", "tblPrEx"}},
	{"tr", {"trPr", "tblPrEx"}},
	{"tc", {"tcPr", "tblPrEx"}},
	{"group", {"fill", "stroke", "shadow", "path", "formulas", "handles", "lock", "extrusion"}},
	{"shape", {"fill", "stroke", "shadow", "textpath", "path", "formulas", "handles", "imagedata", "lock", "extrusion", "wrap"}},
	{"rect", {"fill", "stroke", "shadow", "textpath", "path", "formulas", "handles", "lock", "extrusion"}},
	{"textbox", {}},
	{"lock", {}},
	{"txbxContent", {}},
	{"wrap", {}},
	{"sdt", {"sdtPr", "sdtEndPr"}},
	{"sdtContent", {}},
	{"hyperlink", {}},
	{"smartTag", {"smartTagPr"}},
	{"ruby", {"rubyPr"}},
	{"shapetype", {"stroke", "path", "fill", "shadow", "formulas", "handles"}},
	{"pict", {"shapetype"}},
};

constexpr std::string_view THROW_AWAY[] = {
	"bookmarkStart",
	"bookmarkEnd",
	"commentRangeStart",
	"commentRangeEnd",
	"lastRenderedPageBreak",
	"proofErr",
	"tblPr",
	"sectPr",
	"permEnd",
	"permStart",
	"footnoteRef",
	"endnoteRef",
	"separator",
	"continuationSeparator",
};

// Run children that become atoms but carry no dedicated kind.
constexpr std::string_view OTHER_RUN_CHILDREN[] = {"dayLong", "dayShort", "monthLong", "monthShort", "noBreakHyphen", "pgNum", "softHyphen", "yearLong", "yearShort", "instrText", "annotationRef", "commentReference"};

template <size_t N>
bool contains(const std::string_view (&values)[N], std::string_view value) {
	return std::find(std::begin(values), std::end(values), value) != std::end(values);
}

bool is_chain_boundary(std::string_view local) {
	return local == "body" || local == "footnotes" || local == "endnotes";
}

class atomizer {
public:
	atomizer(const std::string& part, const package* pkg, const wml_comparer_settings& settings) : part{part}, pkg{pkg}, settings{settings} {
	}

	void walk(pugi::xml_node node, const std::string& signature) {
		if (node.type() != pugi::node_element) {
			return;
		}
		const std::string local = local_name(node);
		if (local == "body" || local == "footnote" || local == "endnote") {
			walk_children(node, {}, {});
		} else if (local == "p") {
			walk_children(node, {"pPr"}, {});
			auto atom = make_atom(wml_content_kind::paragraph_mark, 0, {}, chain_including(node), {});
			atom->content = first_child_local(node, "pPr");
			atoms.push_back(std::move(atom));
		} else if (local == "r") {
			walk_children(node, {"rPr"}, settings.track_formatting_changes ? wml_formatting_signature(node) : std::string{});
		} else if (local == "t" || local == "delText") {
			const auto chain = chain_including(node.parent());
			for (const char32_t ch : utf8_to_u32(node.text().as_string())) {
				auto atom = make_atom(wml_content_kind::text, ch, {}, chain, signature);
				atom->content = node;
				atoms.push_back(std::move(atom));
			}
		} else if (local == "oMath" || local == "oMathPara") {
			emit(node, wml_content_kind::math, wml_xml_structure_hash(node), signature);
		} else if (local == "pict" && !first_descendant_local(node, "txbxContent")) {
			emit(node, wml_content_kind::picture, wml_drawing_identity(node, pkg, part), signature);
		} else if (const auto recursion = RECURSION_ELEMENTS.find(local); recursion != RECURSION_ELEMENTS.end()) {
			walk_children(node, recursion->second, signature);
		} else if (run_content(node, local, signature)) {
			return;
		} else if (contains(THROW_AWAY, local)) {
			return;
		} else if (local == "AlternateContent") {
			auto branch = first_child_local(node, "Fallback");
			if (!branch) {
				branch = first_child_local(node, "Choice");
			}
			if (branch) {
				walk_children(branch, {}, signature);
			}
		} else {
			walk_children(node, {}, signature);
		}
	}

	std::vector<atom_ptr> atoms;

private:
	const std::string& part;
	const package* pkg;
	const wml_comparer_settings& settings;
	std::unordered_map<pugi::xml_node_struct*, ancestor_ptr> handles;
	std::unordered_map<std::string, std::string> key_hashes;

	void walk_children(pugi::xml_node node, const std::vector<std::string_view>& skip, const std::string& signature) {
		for (auto child : node.children()) {
			if (child.type() != pugi::node_element) {
				continue;
			}
			if (std::find(skip.begin(), skip.end(), get_local_name(child.name())) != skip.end()) {
				continue;
			}
			walk(child, signature);
		}
	}

	bool run_content(pugi::xml_node node, const std::string& local, const std::string& signature) {
		if (local == "br" || local == "cr") {
			emit(node, wml_content_kind::break_, {}, signature);
		} else if (local == "tab" || local == "ptab") {
			emit(node, wml_content_kind::tab, {}, signature);
		} else if (local == "drawing") {
			emit(node, wml_content_kind::drawing, wml_drawing_identity(node, pkg, part), signature);
		} else if (local == "footnoteReference") {
			emit(node, wml_content_kind::footnote_ref, attribute_local(node, "id"), signature);
		} else if (local == "endnoteReference") {
			emit(node, wml_content_kind::endnote_ref, attribute_local(node, "id"), signature);
		} else if (local == "fldChar") {
			const std::string type = attribute_local(node, "fldCharType");
			const auto kind = type == "begin" ? wml_content_kind::field_begin : type == "separate" ? wml_content_kind::field_separator : wml_content_kind::field_end;
			emit(node, kind, {}, signature);
		} else if (local == "fldSimple") {
			emit(node, wml_content_kind::simple_field, attribute_local(node, "instr"), signature);
		} else if (local == "sym") {
			emit(node, wml_content_kind::symbol, attribute_local(node, "font") + ":" + attribute_local(node, "char"), signature);
		} else if (local == "object") {
			emit(node, wml_content_kind::object, wml_xml_structure_hash(node), signature);
		} else if (contains(OTHER_RUN_CHILDREN, local)) {
			emit(node, wml_content_kind::unknown, local + node.text().as_string(), signature);
		} else {
			return false;
		}
		return true;
	}

	void emit(pugi::xml_node node, wml_content_kind kind, const std::string& value, const std::string& signature) {
		auto atom = make_atom(kind, 0, value, chain_including(node.parent()), signature);
		atom->content = node;
		atoms.push_back(std::move(atom));
	}

	atom_ptr make_atom(wml_content_kind kind, char32_t ch, const std::string& value, const std::vector<ancestor_ptr>& chain, const std::string& signature) {
		auto atom = std::make_shared<wml_atom>();
		atom->kind = kind;
		atom->ch = ch;
		atom->value = value;
		atom->ancestors = chain;
		atom->ancestor_unids.reserve(chain.size());
		for (const auto& ancestor : chain) {
			atom->ancestor_unids.push_back(ancestor->unid);
		}
		atom->formatting_signature = signature;
		atom->part = part;
		const std::string key = atom_identity_key(kind, normalize_char(ch), value);
		auto cached = key_hashes.find(key);
		if (cached == key_hashes.end()) {
			cached = key_hashes.emplace(key, sha1_hex(key)).first;
		}
		atom->hash = cached->second;
		return atom;
	}

	char32_t normalize_char(char32_t ch) const {
		if (settings.conflate_spaces && ch == U' ') {
			return 0x00A0;
		}
		if (settings.case_insensitive) {
			return fold_case(ch);
		}
		return ch;
	}

	ancestor_ptr handle_for(pugi::xml_node node) {
		auto& slot = handles[node.internal_object()];
		if (!slot) {
			auto ancestor = std::make_shared<wml_ancestor>();
			ancestor->node = node;
			ancestor->local = local_name(node);
			ancestor->unid = node.attribute(PT_UNID).as_string();
			ancestor->correlated_hash = node.attribute(PT_CORRELATED_HASH).as_string();
			slot = std::move(ancestor);
		}
		return slot;
	}

	// Root-to-leaf chain ending with node itself.
	std::vector<ancestor_ptr> chain_including(pugi::xml_node node) {
		std::vector<ancestor_ptr> chain;
		for (auto current = node; current && current.type() == pugi::node_element; current = current.parent()) {
			if (is_chain_boundary(get_local_name(current.name()))) {
				break;
			}
			chain.push_back(handle_for(current));
		}
		std::reverse(chain.begin(), chain.end());
		return chain;
	}
};
}

std::vector<atom_ptr> wml_create_atom_list(pugi::xml_node content_parent, const std::string& part, const package* pkg, const wml_comparer_settings& settings) {
	atomizer walker(part, pkg, settings);
	walker.walk(content_parent, {});
	return std::move(walker.atoms);
}

const std::vector<std::string_view>& wml_container_properties(std::string_view local) {
	static const std::vector<std::string_view> none;
	const auto it = RECURSION_ELEMENTS.find(local);
	return it == RECURSION_ELEMENTS.end() ? none : it->second;
}

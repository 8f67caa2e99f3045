/* wml_comparison_unit.cpp - words and hierarchical groups built from atoms.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "wml_comparison_unit.hpp"
#include "hashing.hpp"
#include "xml_utils.hpp"
#include <algorithm>
#include <cstdlib>

namespace {
struct word_entry {
	unit_ptr unit;
	std::vector<std::string> hierarchy;
};

bool is_grouping_element(const std::string& local) {
	return local == "p" || local == "tbl" || local == "tr" || local == "tc" || local == "txbxContent";
}

std::vector<std::string> hierarchy_of(const wml_atom& atom) {
	std::vector<std::string> keys;
	for (const auto& ancestor : atom.ancestors) {
		if (is_grouping_element(ancestor->local)) {
			keys.push_back(ancestor->local + ":" + ancestor->unid);
		}
	}
	return keys;
}

bool breaks_word(const wml_atom& atom) {
	switch (atom.kind) {
		case wml_content_kind::paragraph_mark:
		case wml_content_kind::break_:
		case wml_content_kind::tab:
		case wml_content_kind::drawing:
		case wml_content_kind::picture:
		case wml_content_kind::math:
		case wml_content_kind::footnote_ref:
		case wml_content_kind::endnote_ref:
		case wml_content_kind::symbol:
		case wml_content_kind::object:
		case wml_content_kind::field_begin:
		case wml_content_kind::field_end:
			return true;
		default:
			return false;
	}
}

bool is_ascii_digit_atom(const std::vector<atom_ptr>& atoms, size_t index) {
	if (index >= atoms.size() || !atoms[index]->is_text()) {
		return false;
	}
	const char32_t ch = atoms[index]->ch;
	return ch >= U'0' && ch <= U'9';
}

wml_group_type group_type_of(const std::string& key) {
	const std::string local = key.substr(0, key.find(':'));
	if (local == "tbl") {
		return wml_group_type::table;
	}
	if (local == "tr") {
		return wml_group_type::row;
	}
	if (local == "tc") {
		return wml_group_type::cell;
	}
	if (local == "txbxContent") {
		return wml_group_type::textbox;
	}
	return wml_group_type::paragraph;
}

ancestor_ptr ancestor_for_key(const unit_ptr& unit, const std::string& key) {
	std::vector<atom_ptr> atoms;
	unit->collect_atoms(atoms);
	if (atoms.empty()) {
		return nullptr;
	}
	for (const auto& ancestor : atoms.front()->ancestors) {
		if (ancestor->local + ":" + ancestor->unid == key) {
			return ancestor;
		}
	}
	return nullptr;
}

std::string merge_shape(pugi::xml_node table) {
	std::string shape;
	for (auto tr : children_local(table, "tr")) {
		for (auto tc : children_local(tr, "tc")) {
			const auto tcpr = first_child_local(tc, "tcPr");
			const auto span = tcpr ? first_child_local(tcpr, "gridSpan") : pugi::xml_node{};
			const auto vmerge = tcpr ? first_child_local(tcpr, "vMerge") : pugi::xml_node{};
			shape += "c" + (span ? attribute_local(span, "val") : std::string("1"));
			if (vmerge) {
				shape += attribute_local(vmerge, "val") == "restart" ? "R" : "M";
			}
		}
		shape += "|";
	}
	return shape;
}

bool table_has_merged_cells(pugi::xml_node table) {
	for (auto tr : children_local(table, "tr")) {
		for (auto tc : children_local(tr, "tc")) {
			const auto tcpr = first_child_local(tc, "tcPr");
			if (!tcpr) {
				continue;
			}
			if (first_child_local(tcpr, "vMerge") || first_child_local(tcpr, "hMerge")) {
				return true;
			}
			const auto span = first_child_local(tcpr, "gridSpan");
			if (span && std::atoi(attribute_local(span, "val").c_str()) > 1) {
				return true;
			}
		}
	}
	return false;
}

unit_ptr make_group(wml_group_type type, const std::string& unid, std::vector<unit_ptr> contents, const ancestor_ptr& ancestor) {
	wml_group group;
	group.type = type;
	group.unid = unid;
	std::string concatenated;
	for (const auto& unit : contents) {
		concatenated += unit->hash();
	}
	group.hash = sha1_hex(concatenated);
	group.contents = std::move(contents);
	if (ancestor) {
		group.correlated_hash = ancestor->correlated_hash;
		if (type == wml_group_type::table) {
			group.has_merged_cells = table_has_merged_cells(ancestor->node);
			group.structure_hash = sha1_hex(merge_shape(ancestor->node));
		}
	}
	return std::make_shared<const wml_unit>(std::move(group));
}

std::vector<unit_ptr> build_level(const std::vector<word_entry>& words, size_t level);

// Groups mixing loose words with nested groups wrap each run of loose words in a paragraph.
std::vector<unit_ptr> wrap_loose_words(std::vector<unit_ptr> units) {
	const bool has_words = std::any_of(units.begin(), units.end(), [](const unit_ptr& u) { return u->is_word(); });
	const bool has_groups = std::any_of(units.begin(), units.end(), [](const unit_ptr& u) { return u->is_group(); });
	if (!has_words || !has_groups) {
		return units;
	}
	std::vector<unit_ptr> result;
	std::vector<unit_ptr> loose;
	auto flush = [&]() {
		if (!loose.empty()) {
			result.push_back(make_group(wml_group_type::paragraph, {}, std::move(loose), nullptr));
			loose.clear();
		}
	};
	for (auto& unit : units) {
		if (unit->is_word()) {
			loose.push_back(std::move(unit));
		} else {
			flush();
			result.push_back(std::move(unit));
		}
	}
	flush();
	return result;
}

void flush_level_group(const std::vector<word_entry>& members, size_t level, const std::string& key, std::vector<unit_ptr>& out) {
	if (members.empty()) {
		return;
	}
	if (key.empty()) {
		for (const auto& entry : members) {
			out.push_back(entry.unit);
		}
		return;
	}
	auto contents = wrap_loose_words(build_level(members, level + 1));
	const auto ancestor = ancestor_for_key(members.front().unit, key);
	out.push_back(make_group(group_type_of(key), key.substr(key.find(':') + 1), std::move(contents), ancestor));
}

std::vector<unit_ptr> build_level(const std::vector<word_entry>& words, size_t level) {
	std::vector<unit_ptr> result;
	if (words.empty()) {
		return result;
	}
	auto key_at = [level](const word_entry& entry) {
		return level < entry.hierarchy.size() ? entry.hierarchy[level] : std::string{};
	};
	std::string current_key = key_at(words.front());
	std::vector<word_entry> members;
	for (const auto& entry : words) {
		const std::string key = key_at(entry);
		if (key != current_key) {
			flush_level_group(members, level, current_key, result);
			members.clear();
			current_key = key;
		}
		members.push_back(entry);
	}
	flush_level_group(members, level, current_key, result);
	return result;
}
}

bool wml_word::is_text_only() const noexcept {
	return std::all_of(atoms.begin(), atoms.end(), [](const atom_ptr& a) { return a->is_text(); });
}

std::string wml_word::text() const {
	std::string result;
	for (const auto& atom : atoms) {
		result += atom->display_text();
	}
	return result;
}

const std::string& wml_unit::hash() const {
	if (is_word()) {
		return word().hash;
	}
	const auto& g = group();
	return g.correlated_hash.empty() ? g.hash : g.correlated_hash;
}

void wml_unit::collect_atoms(std::vector<atom_ptr>& out) const {
	if (is_word()) {
		const auto& atoms = word().atoms;
		out.insert(out.end(), atoms.begin(), atoms.end());
		return;
	}
	for (const auto& unit : group().contents) {
		unit->collect_atoms(out);
	}
}

std::vector<atom_ptr> wml_unit::atoms() const {
	std::vector<atom_ptr> out;
	collect_atoms(out);
	return out;
}

size_t wml_unit::atom_count() const {
	if (is_word()) {
		return word().atoms.size();
	}
	size_t count{0};
	for (const auto& unit : group().contents) {
		count += unit->atom_count();
	}
	return count;
}

atom_ptr wml_unit::last_atom() const {
	if (is_word()) {
		return word().atoms.empty() ? nullptr : word().atoms.back();
	}
	const auto& contents = group().contents;
	for (auto it = contents.rbegin(); it != contents.rend(); ++it) {
		if (auto atom = (*it)->last_atom()) {
			return atom;
		}
	}
	return nullptr;
}

unit_ptr make_word_unit(std::vector<atom_ptr> atoms) {
	wml_word word;
	std::string concatenated;
	for (const auto& atom : atoms) {
		concatenated += atom->hash;
	}
	word.hash = sha1_hex(concatenated);
	word.atoms = std::move(atoms);
	return std::make_shared<const wml_unit>(std::move(word));
}

bool is_cjk_ideograph(char32_t ch) noexcept {
	return ch >= 0x4E00 && ch <= 0x9FFF;
}

std::vector<unit_ptr> wml_split_into_words(const std::vector<atom_ptr>& atoms, const wml_comparer_settings& settings) {
	std::vector<unit_ptr> words;
	std::vector<atom_ptr> current;
	std::vector<std::string> current_hierarchy;
	auto flush = [&]() {
		if (!current.empty()) {
			words.push_back(make_word_unit(std::move(current)));
			current.clear();
		}
	};
	for (size_t i = 0; i < atoms.size(); ++i) {
		const auto& atom = atoms[i];
		auto hierarchy = hierarchy_of(*atom);
		if (hierarchy != current_hierarchy) {
			flush();
			current_hierarchy = std::move(hierarchy);
		}
		bool alone{false};
		if (atom->is_text()) {
			const char32_t ch = atom->ch;
			if (ch == U'.' || ch == U',') {
				alone = !(i > 0 && is_ascii_digit_atom(atoms, i - 1)) && !is_ascii_digit_atom(atoms, i + 1);
			} else {
				alone = is_cjk_ideograph(ch) || settings.is_word_separator(ch);
			}
		} else {
			alone = breaks_word(*atom);
		}
		if (alone) {
			flush();
			words.push_back(make_word_unit({atom}));
		} else {
			current.push_back(atom);
		}
	}
	flush();
	return words;
}

std::vector<unit_ptr> wml_get_comparison_units(const std::vector<atom_ptr>& atoms, const wml_comparer_settings& settings) {
	std::vector<word_entry> entries;
	for (auto& word : wml_split_into_words(atoms, settings)) {
		auto hierarchy = hierarchy_of(*word->word().atoms.front());
		entries.push_back({std::move(word), std::move(hierarchy)});
	}
	return wrap_loose_words(build_level(entries, 0));
}

/* wml_lcs.cpp - longest common subsequence over comparison units.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "wml_lcs.hpp"
#include <algorithm>
#include <map>
#include <optional>
#include <set>
#include <wx/log.h>

namespace {
using unit_list = std::vector<unit_ptr>;
using sequence_list = std::vector<correlated_sequence>;

enum class unit_key {
	word,
	paragraph,
	table,
	row,
	cell,
	textbox,
};

unit_key key_of(const unit_ptr& unit) {
	if (unit->is_word()) {
		return unit_key::word;
	}
	switch (unit->group().type) {
		case wml_group_type::table:
			return unit_key::table;
		case wml_group_type::row:
			return unit_key::row;
		case wml_group_type::cell:
			return unit_key::cell;
		case wml_group_type::textbox:
			return unit_key::textbox;
		default:
			return unit_key::paragraph;
	}
}

unit_list slice(const unit_list& units, size_t from, size_t to) {
	from = std::min(from, units.size());
	to = std::min(std::max(to, from), units.size());
	return unit_list(units.begin() + static_cast<std::ptrdiff_t>(from), units.begin() + static_cast<std::ptrdiff_t>(to));
}

void push(sequence_list& out, correlation_status status, unit_list left, unit_list right) {
	out.push_back({status, std::move(left), std::move(right)});
}

// Deleted, inserted or unknown depending on which sides are non-empty.
void push_remainder(sequence_list& out, unit_list left, unit_list right) {
	if (left.empty() && right.empty()) {
		return;
	}
	if (right.empty()) {
		push(out, correlation_status::deleted, std::move(left), {});
	} else if (left.empty()) {
		push(out, correlation_status::inserted, {}, std::move(right));
	} else {
		push(out, correlation_status::unknown, std::move(left), std::move(right));
	}
}

bool is_paragraph_mark_word(const unit_ptr& unit) {
	return unit->is_word() && unit->word().is_paragraph_mark();
}

bool starts_with_paragraph_mark(const unit_ptr& unit) {
	return unit->is_word() && !unit->word().atoms.empty() && unit->word().atoms.front()->is_paragraph_mark();
}

bool is_single_atom_word(const unit_ptr& unit) {
	return unit->is_word() && unit->word().atoms.size() == 1;
}

std::optional<sequence_list> detect_unrelated_sources(const unit_list& units1, const unit_list& units2) {
	if (units1.size() <= 3 || units2.size() <= 3) {
		return std::nullopt;
	}
	auto leading_hashes = [](const unit_list& units) {
		std::set<std::string> hashes;
		for (size_t i = 0; i < units.size() && i < 4; ++i) {
			if (units[i]->is_group()) {
				hashes.insert(units[i]->group().hash);
			}
		}
		return hashes;
	};
	const auto left = leading_hashes(units1);
	const auto right = leading_hashes(units2);
	if (left.empty() || right.empty()) {
		return std::nullopt;
	}
	for (const auto& hash : left) {
		if (right.count(hash) != 0) {
			return std::nullopt;
		}
	}
	wxLogDebug("Documents share no leading blocks; treating them as unrelated");
	sequence_list result;
	push(result, correlation_status::deleted, units1, {});
	push(result, correlation_status::inserted, {}, units2);
	return result;
}

std::optional<sequence_list> process_correlated_hashes(const correlated_sequence& seq) {
	const auto& u1 = seq.units1;
	const auto& u2 = seq.units2;
	if (std::min(u1.size(), u2.size()) < 3) {
		return std::nullopt;
	}
	auto eligible = [](const unit_ptr& unit) {
		return unit->is_group(wml_group_type::paragraph) || unit->is_group(wml_group_type::table) || unit->is_group(wml_group_type::row);
	};
	if (!eligible(u1.front()) || !eligible(u2.front())) {
		return std::nullopt;
	}
	size_t best_length{0};
	size_t best_i1{0};
	size_t best_i2{0};
	size_t best_atoms{0};
	for (size_t i1 = 0; i1 < u1.size(); ++i1) {
		for (size_t i2 = 0; i2 < u2.size(); ++i2) {
			size_t length{0};
			size_t atoms{0};
			while (i1 + length < u1.size() && i2 + length < u2.size()) {
				const auto& a = u1[i1 + length];
				const auto& b = u2[i2 + length];
				if (!a->is_group() || !b->is_group() || a->group().type != b->group().type) {
					break;
				}
				const auto& hash = a->group().correlated_hash;
				if (hash.empty() || hash != b->group().correlated_hash) {
					break;
				}
				atoms += a->atom_count();
				++length;
			}
			if (length > 0 && atoms > best_atoms) {
				best_length = length;
				best_i1 = i1;
				best_i2 = i2;
				best_atoms = atoms;
			}
		}
	}
	if (best_length == 0) {
		return std::nullopt;
	}
	size_t atoms_right{0};
	for (size_t k = 0; k < best_length; ++k) {
		atoms_right += u2[best_i2 + k]->atom_count();
	}
	const size_t smaller = std::min(best_atoms, atoms_right);
	if (best_length == 1 && smaller <= 16) {
		return std::nullopt;
	}
	if (best_length > 1 && best_length <= 3 && smaller <= 32) {
		return std::nullopt;
	}
	sequence_list result;
	push_remainder(result, slice(u1, 0, best_i1), slice(u2, 0, best_i2));
	for (size_t k = 0; k < best_length; ++k) {
		push(result, correlation_status::unknown, {u1[best_i1 + k]}, {u2[best_i2 + k]});
	}
	push_remainder(result, slice(u1, best_i1 + best_length, u1.size()), slice(u2, best_i2 + best_length, u2.size()));
	return result;
}

std::optional<sequence_list> find_common_at_beginning_and_end(const correlated_sequence& seq, const wml_comparer_settings& settings) {
	const auto& u1 = seq.units1;
	const auto& u2 = seq.units2;
	const size_t n1 = u1.size();
	const size_t n2 = u2.size();
	const size_t min_length = std::min(n1, n2);
	if (min_length == 0) {
		return std::nullopt;
	}
	size_t prefix{0};
	while (prefix < min_length && u1[prefix]->hash() == u2[prefix]->hash()) {
		++prefix;
	}
	if (prefix > 0 && static_cast<double>(prefix) / static_cast<double>(min_length) < settings.detail_threshold) {
		prefix = 0;
	}
	if (prefix > 0) {
		sequence_list result;
		push(result, correlation_status::equal, slice(u1, 0, prefix), slice(u2, 0, prefix));
		push_remainder(result, slice(u1, prefix, n1), slice(u2, prefix, n2));
		return result;
	}
	size_t suffix{0};
	while (suffix < min_length && u1[n1 - 1 - suffix]->hash() == u2[n2 - 1 - suffix]->hash()) {
		++suffix;
	}
	while (suffix > 1 && is_paragraph_mark_word(u1[n1 - suffix])) {
		--suffix;
	}
	bool only_paragraph_mark{false};
	if (suffix == 1) {
		only_paragraph_mark = is_paragraph_mark_word(u1[n1 - 1]);
	} else if (suffix == 2) {
		only_paragraph_mark = is_paragraph_mark_word(u1[n1 - 1]) && is_single_atom_word(u1[n1 - 2]);
	}
	if (only_paragraph_mark) {
		suffix = 0;
	} else if (suffix > 0 && static_cast<double>(suffix) / static_cast<double>(min_length) < settings.detail_threshold) {
		suffix = 0;
	}
	if (suffix == 0) {
		return std::nullopt;
	}
	const size_t first1 = n1 - suffix;
	const size_t first2 = n2 - suffix;
	size_t remaining_left{0};
	size_t remaining_right{0};
	if (u1[first1]->is_word()) {
		const bool common_has_mark = std::any_of(u1.begin() + static_cast<std::ptrdiff_t>(first1), u1.end(), starts_with_paragraph_mark);
		if (common_has_mark) {
			auto count_trailing = [](const unit_list& units, size_t end) {
				size_t count{0};
				while (end > count) {
					const auto& unit = units[end - count - 1];
					if (!unit->is_word() || starts_with_paragraph_mark(unit)) {
						break;
					}
					++count;
				}
				return count;
			};
			remaining_left = count_trailing(u1, first1);
			remaining_right = count_trailing(u2, first2);
		}
	}
	sequence_list result;
	push_remainder(result, slice(u1, 0, first1 - remaining_left), slice(u2, 0, first2 - remaining_right));
	push_remainder(result, slice(u1, first1 - remaining_left, first1), slice(u2, first2 - remaining_right, first2));
	push(result, correlation_status::equal, slice(u1, first1, n1), slice(u2, first2, n2));
	return result;
}

unit_list flatten_contents(const unit_list& units) {
	unit_list result;
	for (const auto& unit : units) {
		if (unit->is_group()) {
			const auto& contents = unit->group().contents;
			result.insert(result.end(), contents.begin(), contents.end());
		} else {
			result.push_back(unit);
		}
	}
	return result;
}

std::vector<std::pair<unit_key, unit_list>> group_adjacent(const unit_list& units, unit_key (*classify)(const unit_ptr&)) {
	std::vector<std::pair<unit_key, unit_list>> groups;
	for (const auto& unit : units) {
		const unit_key key = classify(unit);
		if (groups.empty() || groups.back().first != key) {
			groups.push_back({key, {}});
		}
		groups.back().second.push_back(unit);
	}
	return groups;
}

unit_key word_row_textbox_key(const unit_ptr& unit) {
	const unit_key key = key_of(unit);
	if (key == unit_key::word || key == unit_key::row || key == unit_key::textbox) {
		return key;
	}
	return unit_key::cell;
}

unit_key table_paragraph_key(const unit_ptr& unit) {
	return key_of(unit) == unit_key::table ? unit_key::table : unit_key::paragraph;
}

std::optional<sequence_list> do_lcs_algorithm_for_table(const wml_group& table1, const wml_group& table2) {
	const auto& rows1 = table1.contents;
	const auto& rows2 = table2.contents;
	sequence_list result;
	if (rows1.size() == rows2.size()) {
		bool all_correlated{true};
		for (size_t i = 0; i < rows1.size() && all_correlated; ++i) {
			const auto& h1 = rows1[i]->is_group() ? rows1[i]->group().correlated_hash : std::string{};
			const auto& h2 = rows2[i]->is_group() ? rows2[i]->group().correlated_hash : std::string{};
			all_correlated = !h1.empty() && h1 == h2;
		}
		if (all_correlated) {
			for (size_t i = 0; i < rows1.size(); ++i) {
				push(result, correlation_status::unknown, {rows1[i]}, {rows2[i]});
			}
			return result;
		}
	}
	if (!table1.has_merged_cells && !table2.has_merged_cells) {
		return std::nullopt;
	}
	if (!table1.structure_hash.empty() && table1.structure_hash == table2.structure_hash) {
		const size_t common = std::min(rows1.size(), rows2.size());
		for (size_t i = 0; i < common; ++i) {
			push(result, correlation_status::unknown, {rows1[i]}, {rows2[i]});
		}
		push_remainder(result, slice(rows1, common, rows1.size()), slice(rows2, common, rows2.size()));
		return result;
	}
	push(result, correlation_status::deleted, rows1, {});
	push(result, correlation_status::inserted, {}, rows2);
	return result;
}

sequence_list handle_matching_rows(const unit_list& u1, const unit_list& u2) {
	sequence_list result;
	const auto& cells1 = u1.front()->group().contents;
	const auto& cells2 = u2.front()->group().contents;
	const size_t common = std::min(cells1.size(), cells2.size());
	for (size_t i = 0; i < common; ++i) {
		push(result, correlation_status::unknown, {cells1[i]}, {cells2[i]});
	}
	push_remainder(result, slice(cells1, common, cells1.size()), slice(cells2, common, cells2.size()));
	push_remainder(result, slice(u1, 1, u1.size()), slice(u2, 1, u2.size()));
	return result;
}

sequence_list handle_no_match_cases(const unit_list& u1, const unit_list& u2) {
	std::map<unit_key, size_t> count1;
	std::map<unit_key, size_t> count2;
	for (const auto& unit : u1) {
		++count1[key_of(unit)];
	}
	for (const auto& unit : u2) {
		++count2[key_of(unit)];
	}
	auto total = [&](unit_key key) {
		return count1[key] + count2[key];
	};
	auto only = [](const std::map<unit_key, size_t>& counts, std::initializer_list<unit_key> keys) {
		for (const auto& [key, count] : counts) {
			if (count != 0 && std::find(keys.begin(), keys.end(), key) == keys.end()) {
				return false;
			}
		}
		return true;
	};
	sequence_list result;
	if (total(unit_key::word) > 0 && total(unit_key::row) + total(unit_key::textbox) > 0 && only(count1, {unit_key::word, unit_key::row, unit_key::textbox}) && only(count2, {unit_key::word, unit_key::row, unit_key::textbox})) {
		const auto groups1 = group_adjacent(u1, word_row_textbox_key);
		const auto groups2 = group_adjacent(u2, word_row_textbox_key);
		size_t i1{0};
		size_t i2{0};
		while (i1 < groups1.size() && i2 < groups2.size()) {
			if (groups1[i1].first == groups2[i2].first) {
				push(result, correlation_status::unknown, groups1[i1++].second, groups2[i2++].second);
			} else if (groups1[i1].first == unit_key::word || groups2[i2].first != unit_key::word) {
				push(result, correlation_status::deleted, groups1[i1++].second, {});
			} else {
				push(result, correlation_status::inserted, {}, groups2[i2++].second);
			}
		}
		for (; i1 < groups1.size(); ++i1) {
			push(result, correlation_status::deleted, groups1[i1].second, {});
		}
		for (; i2 < groups2.size(); ++i2) {
			push(result, correlation_status::inserted, {}, groups2[i2].second);
		}
		return result;
	}
	if (count1[unit_key::table] > 0 && count2[unit_key::table] > 0 && count1[unit_key::paragraph] > 0 && count2[unit_key::paragraph] > 0 && (u1.size() > 1 || u2.size() > 1)) {
		const auto groups1 = group_adjacent(u1, table_paragraph_key);
		const auto groups2 = group_adjacent(u2, table_paragraph_key);
		size_t i1{0};
		size_t i2{0};
		while (i1 < groups1.size() && i2 < groups2.size()) {
			if (groups1[i1].first == groups2[i2].first) {
				push(result, correlation_status::unknown, groups1[i1++].second, groups2[i2++].second);
			} else if (groups1[i1].first == unit_key::paragraph) {
				push(result, correlation_status::deleted, groups1[i1++].second, {});
			} else {
				push(result, correlation_status::inserted, {}, groups2[i2++].second);
			}
		}
		for (; i1 < groups1.size(); ++i1) {
			push(result, correlation_status::deleted, groups1[i1].second, {});
		}
		for (; i2 < groups2.size(); ++i2) {
			push(result, correlation_status::inserted, {}, groups2[i2].second);
		}
		return result;
	}
	if (u1.size() == 1 && u2.size() == 1 && u1.front()->is_group(wml_group_type::table) && u2.front()->is_group(wml_group_type::table)) {
		if (auto table_result = do_lcs_algorithm_for_table(u1.front()->group(), u2.front()->group())) {
			return *table_result;
		}
	}
	const std::initializer_list<unit_key> blocks{unit_key::table, unit_key::paragraph, unit_key::textbox};
	if (!u1.empty() && !u2.empty() && only(count1, blocks) && only(count2, blocks)) {
		push(result, correlation_status::unknown, flatten_contents(u1), flatten_contents(u2));
		return result;
	}
	if (u1.front()->is_group(wml_group_type::row) && u2.front()->is_group(wml_group_type::row)) {
		return handle_matching_rows(u1, u2);
	}
	if (u1.front()->is_group(wml_group_type::cell) && u2.front()->is_group(wml_group_type::cell)) {
		push(result, correlation_status::unknown, u1.front()->group().contents, u2.front()->group().contents);
		push_remainder(result, slice(u1, 1, u1.size()), slice(u2, 1, u2.size()));
		return result;
	}
	if (u1.front()->is_word() && u2.front()->is_group(wml_group_type::row)) {
		push(result, correlation_status::inserted, {}, u2);
		push(result, correlation_status::deleted, u1, {});
		return result;
	}
	if (u1.front()->is_group(wml_group_type::row) && u2.front()->is_word()) {
		push(result, correlation_status::deleted, u1, {});
		push(result, correlation_status::inserted, {}, u2);
		return result;
	}
	const auto last1 = u1.back()->last_atom();
	const auto last2 = u2.back()->last_atom();
	const bool mark1 = last1 && last1->is_paragraph_mark();
	const bool mark2 = last2 && last2->is_paragraph_mark();
	if (mark1 && !mark2) {
		push(result, correlation_status::inserted, {}, u2);
		push(result, correlation_status::deleted, u1, {});
		return result;
	}
	push(result, correlation_status::deleted, u1, {});
	push(result, correlation_status::inserted, {}, u2);
	return result;
}

unit_list split_into_atom_words(const wml_word& word) {
	unit_list result;
	for (const auto& atom : word.atoms) {
		result.push_back(make_word_unit({atom}));
	}
	return result;
}

// A pair of differing single words with a shared first or last character is compared character by character.
std::optional<sequence_list> refine_single_words(const unit_list& u1, const unit_list& u2) {
	if (u1.size() != 1 || u2.size() != 1 || !u1.front()->is_word() || !u2.front()->is_word()) {
		return std::nullopt;
	}
	const auto& w1 = u1.front()->word();
	const auto& w2 = u2.front()->word();
	if (w1.atoms.empty() || w2.atoms.empty() || !w1.is_text_only() || !w2.is_text_only()) {
		return std::nullopt;
	}
	if (w1.atoms.size() < 2 && w2.atoms.size() < 2) {
		return std::nullopt;
	}
	if (w1.atoms.front()->hash != w2.atoms.front()->hash && w1.atoms.back()->hash != w2.atoms.back()->hash) {
		return std::nullopt;
	}
	sequence_list result;
	push(result, correlation_status::unknown, split_into_atom_words(w1), split_into_atom_words(w2));
	return result;
}

bool has_meaningful_content(const unit_list& units, const wml_comparer_settings& settings) {
	for (const auto& unit : units) {
		for (const auto& atom : unit->word().atoms) {
			if (!atom->is_text()) {
				return true;
			}
			if (!settings.is_word_separator(atom->ch) && !is_cjk_ideograph(atom->ch)) {
				return true;
			}
		}
	}
	return false;
}

sequence_list do_lcs_algorithm(const correlated_sequence& seq, const wml_comparer_settings& settings) {
	const auto& u1 = seq.units1;
	const auto& u2 = seq.units2;
	sequence_list result;
	if (u1.empty() || u2.empty()) {
		push_remainder(result, u1, u2);
		return result;
	}
	size_t best_length{0};
	size_t best_i1{0};
	size_t best_i2{0};
	for (size_t i1 = 0; i1 < u1.size(); ++i1) {
		for (size_t i2 = 0; i2 < u2.size(); ++i2) {
			size_t length{0};
			while (i1 + length < u1.size() && i2 + length < u2.size() && u1[i1 + length]->hash() == u2[i2 + length]->hash()) {
				++length;
			}
			if (length > best_length) {
				best_length = length;
				best_i1 = i1;
				best_i2 = i2;
			}
		}
	}
	while (best_length > 1 && is_paragraph_mark_word(u1[best_i1])) {
		++best_i1;
		++best_i2;
		--best_length;
	}
	const bool only_paragraph_mark = best_length == 1 && is_paragraph_mark_word(u1[best_i1]);
	if (best_length == 1 && u2[best_i2]->is_word()) {
		const auto& atoms = u2[best_i2]->word().atoms;
		if (atoms.size() == 1 && atoms.front()->is_text() && (atoms.front()->ch == U' ' || atoms.front()->ch == 0xA0)) {
			best_length = 0;
		}
	}
	if (best_length > 0 && best_length <= 3) {
		const auto matched = slice(u1, best_i1, best_i1 + best_length);
		const bool all_words = std::all_of(matched.begin(), matched.end(), [](const unit_ptr& u) { return u->is_word(); });
		if (all_words && !has_meaningful_content(matched, settings)) {
			best_length = 0;
		}
	}
	if (best_length > 0 && !only_paragraph_mark) {
		auto is_word = [](const unit_ptr& u) {
			return u->is_word();
		};
		if (std::all_of(u1.begin(), u1.end(), is_word) && std::all_of(u2.begin(), u2.end(), is_word)) {
			const double ratio = static_cast<double>(best_length) / static_cast<double>(std::max(u1.size(), u2.size()));
			if (ratio < settings.detail_threshold) {
				best_length = 0;
			}
		}
	}
	if (best_length == 0) {
		if (auto refined = refine_single_words(u1, u2)) {
			return *refined;
		}
		return handle_no_match_cases(u1, u2);
	}
	push_remainder(result, slice(u1, 0, best_i1), slice(u2, 0, best_i2));
	push(result, correlation_status::equal, slice(u1, best_i1, best_i1 + best_length), slice(u2, best_i2, best_i2 + best_length));
	push_remainder(result, slice(u1, best_i1 + best_length, u1.size()), slice(u2, best_i2 + best_length, u2.size()));
	return result;
}

atom_ptr clone_with_status(const atom_ptr& atom, correlation_status status) {
	auto copy = std::make_shared<wml_atom>(*atom);
	copy->status = status;
	return copy;
}

std::vector<atom_ptr> collect(const unit_list& units) {
	std::vector<atom_ptr> atoms;
	for (const auto& unit : units) {
		unit->collect_atoms(atoms);
	}
	return atoms;
}
}

std::vector<correlated_sequence> wml_lcs(const std::vector<unit_ptr>& units1, const std::vector<unit_ptr>& units2, const wml_comparer_settings& settings) {
	if (auto unrelated = detect_unrelated_sources(units1, units2)) {
		return *unrelated;
	}
	sequence_list list;
	push(list, correlation_status::unknown, units1, units2);
	while (true) {
		const auto it = std::find_if(list.begin(), list.end(), [](const correlated_sequence& seq) { return seq.status == correlation_status::unknown; });
		if (it == list.end()) {
			break;
		}
		const auto index = it - list.begin();
		auto replacement = process_correlated_hashes(*it);
		if (!replacement) {
			replacement = find_common_at_beginning_and_end(*it, settings);
		}
		if (!replacement) {
			replacement = do_lcs_algorithm(*it, settings);
		}
		list.erase(list.begin() + index);
		list.insert(list.begin() + index, std::make_move_iterator(replacement->begin()), std::make_move_iterator(replacement->end()));
	}
	return list;
}

std::vector<atom_ptr> wml_flatten_to_atoms(const std::vector<correlated_sequence>& sequences) {
	std::vector<atom_ptr> result;
	for (const auto& seq : sequences) {
		const auto atoms1 = collect(seq.units1);
		const auto atoms2 = collect(seq.units2);
		if (seq.status == correlation_status::equal) {
			const size_t common = std::min(atoms1.size(), atoms2.size());
			for (size_t i = 0; i < common; ++i) {
				auto atom = clone_with_status(atoms2[i], correlation_status::equal);
				atom->before = atoms1[i];
				result.push_back(std::move(atom));
			}
			for (size_t i = common; i < atoms1.size(); ++i) {
				result.push_back(clone_with_status(atoms1[i], correlation_status::deleted));
			}
			for (size_t i = common; i < atoms2.size(); ++i) {
				result.push_back(clone_with_status(atoms2[i], correlation_status::inserted));
			}
			continue;
		}
		for (const auto& atom : atoms1) {
			result.push_back(clone_with_status(atom, correlation_status::deleted));
		}
		for (const auto& atom : atoms2) {
			result.push_back(clone_with_status(atom, correlation_status::inserted));
		}
	}
	return result;
}

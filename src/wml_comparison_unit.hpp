/* wml_comparison_unit.hpp - words and hierarchical groups built from atoms.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "wml_atom.hpp"
#include "wml_settings.hpp"
#include <memory>
#include <string>
#include <variant>
#include <vector>

enum class wml_group_type {
	paragraph,
	table,
	row,
	cell,
	textbox,
};

class wml_unit;
using unit_ptr = std::shared_ptr<const wml_unit>;

struct wml_word {
	std::vector<atom_ptr> atoms;
	std::string hash;

	[[nodiscard]] bool is_paragraph_mark() const noexcept {
		return atoms.size() == 1 && atoms.front()->is_paragraph_mark();
	}

	[[nodiscard]] bool is_text_only() const noexcept;
	[[nodiscard]] std::string text() const;
};

struct wml_group {
	wml_group_type type{wml_group_type::paragraph};
	std::string unid;
	std::vector<unit_ptr> contents;
	std::string hash;
	std::string correlated_hash;
	// Tables only: vertical or horizontal merges anywhere in the grid, and the shape of that grid.
	bool has_merged_cells{false};
	std::string structure_hash;
};

class wml_unit {
public:
	explicit wml_unit(wml_word word) : data{std::move(word)} {
	}

	explicit wml_unit(wml_group group) : data{std::move(group)} {
	}

	[[nodiscard]] bool is_word() const noexcept {
		return std::holds_alternative<wml_word>(data);
	}

	[[nodiscard]] bool is_group() const noexcept {
		return std::holds_alternative<wml_group>(data);
	}

	[[nodiscard]] bool is_group(wml_group_type type) const noexcept {
		return is_group() && group().type == type;
	}

	[[nodiscard]] const wml_word& word() const {
		return std::get<wml_word>(data);
	}

	[[nodiscard]] const wml_group& group() const {
		return std::get<wml_group>(data);
	}

	// Block-level correlated hash for groups that have one, otherwise the content hash.
	[[nodiscard]] const std::string& hash() const;
	void collect_atoms(std::vector<atom_ptr>& out) const;
	[[nodiscard]] std::vector<atom_ptr> atoms() const;
	[[nodiscard]] size_t atom_count() const;
	[[nodiscard]] atom_ptr last_atom() const;

private:
	std::variant<wml_word, wml_group> data;
};

[[nodiscard]] unit_ptr make_word_unit(std::vector<atom_ptr> atoms);
[[nodiscard]] std::vector<unit_ptr> wml_split_into_words(const std::vector<atom_ptr>& atoms, const wml_comparer_settings& settings);
// Words nested into paragraph, table, row, cell and textbox groups by ancestor identity.
[[nodiscard]] std::vector<unit_ptr> wml_get_comparison_units(const std::vector<atom_ptr>& atoms, const wml_comparer_settings& settings);
[[nodiscard]] bool is_cjk_ideograph(char32_t ch) noexcept;

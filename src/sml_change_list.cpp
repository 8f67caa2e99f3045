/* sml_change_list.cpp - reviewer pane items built from spreadsheet changes.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "sml_change_list.hpp"
#include <cstdlib>

namespace {
enum class run_direction {
	none,
	horizontal,
	vertical,
};

run_direction adjacency(const sml_change& a, const sml_change& b) {
	const auto [column1, row1] = parse_cell_reference(a.cell_address.value_or(""));
	const auto [column2, row2] = parse_cell_reference(b.cell_address.value_or(""));
	if (row1 == 0 || row2 == 0 || column1 == 0 || column2 == 0) {
		return run_direction::none;
	}
	if (row1 == row2 && std::abs(column1 - column2) == 1) {
		return run_direction::horizontal;
	}
	if (column1 == column2 && std::abs(row1 - row2) == 1) {
		return run_direction::vertical;
	}
	return run_direction::none;
}

const char* kind_label(sml_change_type type) {
	switch (type) {
		case sml_change_type::cell_added:
			return "Added";
		case sml_change_type::cell_deleted:
			return "Deleted";
		case sml_change_type::value_changed:
			return "Value";
		case sml_change_type::formula_changed:
			return "Formula";
		case sml_change_type::format_changed:
			return "Format";
		default:
			return "Changed";
	}
}

sml_change_list_item to_item(const std::vector<const sml_change*>& group, size_t index) {
	const sml_change& first = *group.front();
	sml_change_list_item item;
	item.id = "change-" + std::to_string(index);
	item.type = first.type;
	item.sheet_name = first.sheet_name;
	item.cell_address = first.cell_address;
	item.row_index = first.row_index;
	item.column_index = first.column_index;
	item.count = group.size();
	if (group.size() == 1) {
		item.summary = first.description();
		item.details = first;
	} else {
		item.summary = std::to_string(group.size()) + " cells changed (" + kind_label(first.type) + ") in " + first.sheet_name.value_or("Sheet");
		if (first.cell_address && group.back()->cell_address) {
			item.cell_range = *first.cell_address + ":" + *group.back()->cell_address;
		}
	}
	if (first.sheet_name && first.cell_address) {
		item.anchor = *first.sheet_name + "!" + *first.cell_address;
	}
	return item;
}
}

std::vector<sml_change_list_item> sml_build_change_list(const std::vector<sml_change>& changes, const sml_change_list_options& options) {
	std::vector<sml_change_list_item> items;
	std::vector<const sml_change*> group;
	auto direction = run_direction::none;
	for (const auto& change : changes) {
		if (group.empty()) {
			group.push_back(&change);
			continue;
		}
		const sml_change& last = *group.back();
		const auto next = adjacency(last, change);
		const bool extends = options.group_adjacent_cells && is_cell_change(change.type) && change.type == last.type && change.sheet_name == last.sheet_name && next != run_direction::none && (direction == run_direction::none || direction == next);
		if (extends) {
			group.push_back(&change);
			direction = next;
			continue;
		}
		items.push_back(to_item(group, items.size() + 1));
		group.assign(1, &change);
		direction = run_direction::none;
	}
	if (!group.empty()) {
		items.push_back(to_item(group, items.size() + 1));
	}
	return items;
}

/* sml_change_list.hpp - reviewer pane items built from spreadsheet changes.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "sml_types.hpp"
#include <optional>
#include <string>
#include <vector>

struct sml_change_list_options {
	bool group_adjacent_cells{true};
};

struct sml_change_list_item {
	std::string id;
	sml_change_type type{sml_change_type::value_changed};
	std::optional<std::string> sheet_name;
	std::optional<std::string> cell_address;
	// First and last address of a grouped run, such as A1:C1.
	std::optional<std::string> cell_range;
	std::optional<int> row_index;
	std::optional<int> column_index;
	size_t count{1};
	std::string summary;
	// The underlying change of an ungrouped item.
	std::optional<sml_change> details;
	std::optional<std::string> anchor;
};

[[nodiscard]] std::vector<sml_change_list_item> sml_build_change_list(const std::vector<sml_change>& changes, const sml_change_list_options& options = {});

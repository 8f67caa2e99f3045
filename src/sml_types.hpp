/* sml_types.hpp - spreadsheet change records.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

enum class sml_change_type {
	sheet_added,
	sheet_deleted,
	sheet_renamed,
	row_inserted,
	row_deleted,
	column_inserted,
	column_deleted,
	cell_added,
	cell_deleted,
	value_changed,
	formula_changed,
	format_changed,
	named_range_added,
	named_range_deleted,
	named_range_changed,
	comment_added,
	comment_deleted,
	comment_changed,
	data_validation_added,
	data_validation_deleted,
	data_validation_changed,
	merged_cell_added,
	merged_cell_deleted,
	conditional_format_added,
	conditional_format_deleted,
	conditional_format_changed,
	hyperlink_added,
	hyperlink_deleted,
	hyperlink_changed,
};

[[nodiscard]] const char* sml_change_type_name(sml_change_type type) noexcept;
[[nodiscard]] std::optional<sml_change_type> parse_sml_change_type(const std::string& name);
[[nodiscard]] bool is_cell_change(sml_change_type type) noexcept;

// Fully materialized cell style, so stylistic equality is a value comparison.
struct sml_cell_format {
	std::optional<std::string> number_format_code{"General"};
	bool bold{false};
	bool italic{false};
	bool underline{false};
	bool strikethrough{false};
	std::optional<std::string> font_name{"Calibri"};
	std::optional<double> font_size{11.0};
	std::optional<std::string> font_color;
	std::optional<std::string> fill_pattern;
	std::optional<std::string> fill_foreground_color;
	std::optional<std::string> fill_background_color;
	std::optional<std::string> border_left_style;
	std::optional<std::string> border_left_color;
	std::optional<std::string> border_right_style;
	std::optional<std::string> border_right_color;
	std::optional<std::string> border_top_style;
	std::optional<std::string> border_top_color;
	std::optional<std::string> border_bottom_style;
	std::optional<std::string> border_bottom_color;
	std::optional<std::string> horizontal_alignment{"general"};
	std::optional<std::string> vertical_alignment{"bottom"};
	bool wrap_text{false};
	std::optional<int> indent;

	bool operator==(const sml_cell_format& other) const = default;

	// Describes how this format differs from the older one.
	[[nodiscard]] std::string difference_from(const sml_cell_format& older) const;
};

struct sml_change {
	sml_change_type type{sml_change_type::value_changed};
	std::optional<std::string> sheet_name;
	std::optional<std::string> cell_address;
	std::optional<int> row_index;
	std::optional<int> column_index;
	std::optional<std::string> old_sheet_name;
	std::optional<std::string> old_value;
	std::optional<std::string> new_value;
	std::optional<std::string> old_formula;
	std::optional<std::string> new_formula;
	std::optional<sml_cell_format> old_format;
	std::optional<sml_cell_format> new_format;
	std::optional<std::string> named_range_name;
	std::optional<std::string> old_named_range_value;
	std::optional<std::string> new_named_range_value;
	std::optional<std::string> old_comment;
	std::optional<std::string> new_comment;
	std::optional<std::string> comment_author;
	std::optional<std::string> data_validation_type;
	std::optional<std::string> old_data_validation;
	std::optional<std::string> new_data_validation;
	std::optional<std::string> merged_cell_range;
	std::optional<std::string> old_hyperlink;
	std::optional<std::string> new_hyperlink;
	std::optional<std::string> conditional_format_range;
	std::optional<std::string> old_conditional_format;
	std::optional<std::string> new_conditional_format;

	[[nodiscard]] std::string description() const;
};

struct sml_comparison_result {
	std::vector<sml_change> changes;

	[[nodiscard]] size_t total_changes() const noexcept {
		return changes.size();
	}

	[[nodiscard]] size_t count(sml_change_type type) const noexcept;
};

// 1 is A, 27 is AA.
[[nodiscard]] std::string column_letter(int column);
[[nodiscard]] std::string cell_address(int column, int row);
// Column and row of an A1 reference; zero for a missing part. Absolute markers are ignored.
[[nodiscard]] std::pair<int, int> parse_cell_reference(const std::string& reference);

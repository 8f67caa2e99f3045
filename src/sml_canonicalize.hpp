/* sml_canonicalize.hpp - spreadsheet signatures used for comparison.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "sml_settings.hpp"
#include "sml_types.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

class package;

struct sml_cell_signature {
	std::string address;
	int row{0};
	int column{0};
	std::optional<std::string> resolved_value;
	std::optional<std::string> formula;
	// Base64 SHA-256 of "value|formula".
	std::string content_hash;
	sml_cell_format format;
};

struct sml_comment_signature {
	std::string cell_address;
	std::string author;
	std::string text;
};

struct sml_data_validation_signature {
	std::string cell_range;
	std::string validation_type;
	std::optional<std::string> operator_;
	std::optional<std::string> formula1;
	std::optional<std::string> formula2;
	bool allow_blank{false};
	bool show_drop_down{true};
	bool show_input_message{false};
	bool show_error_message{false};
	std::optional<std::string> error_title;
	std::optional<std::string> error;
	std::optional<std::string> prompt_title;
	std::optional<std::string> prompt;

	[[nodiscard]] std::string hash() const;
	[[nodiscard]] std::string to_string() const;
};

struct sml_hyperlink_signature {
	std::string cell_address;
	std::string target;
	std::optional<std::string> display;
	std::optional<std::string> tooltip;

	[[nodiscard]] std::string hash() const;
};

struct sml_worksheet_signature {
	std::string name;
	std::string relationship_id;
	std::string part;
	std::map<std::string, sml_cell_signature> cells;
	std::set<int> populated_rows;
	std::set<int> populated_columns;
	std::map<int, std::string> row_signatures;
	std::map<int, std::string> column_signatures;
	std::map<std::string, sml_comment_signature> comments;
	// Keyed by the first address of each sqref range.
	std::map<std::string, sml_data_validation_signature> data_validations;
	std::set<std::string> merged_ranges;
	std::map<std::string, sml_hyperlink_signature> hyperlinks;
	// Serialized rules keyed by sqref.
	std::map<std::string, std::string> conditional_formats;

	// Cells of a row ordered by column, or of a column ordered by row.
	[[nodiscard]] std::vector<const sml_cell_signature*> cells_in_row(int row) const;
	[[nodiscard]] std::vector<const sml_cell_signature*> cells_in_column(int column) const;
	[[nodiscard]] std::string content_hash() const;
};

struct sml_workbook_signature {
	// Sheets in workbook order.
	std::vector<sml_worksheet_signature> sheets;
	std::map<std::string, std::string> defined_names;

	[[nodiscard]] const sml_worksheet_signature* find_sheet(const std::string& name) const;
};

// Throws compare_exception(missing_part) when the workbook part is absent.
[[nodiscard]] sml_workbook_signature sml_canonicalize(const package& pkg, const sml_comparer_settings& settings);
// Canonical form of a stored cell value: shortest round-trip decimal for numbers, the text otherwise.
[[nodiscard]] std::string sml_normalize_numeric(const std::string& value);
[[nodiscard]] std::string sml_cell_content_hash(const std::optional<std::string>& value, const std::optional<std::string>& formula);
// Eight hex digit rolling hash of sampled cell values.
[[nodiscard]] std::string sml_quick_hash(const std::string& content);
// Worksheet part of each sheet name, in workbook order.
[[nodiscard]] std::vector<std::pair<std::string, std::string>> sml_sheet_parts(const package& pkg);

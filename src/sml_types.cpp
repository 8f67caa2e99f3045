/* sml_types.cpp - spreadsheet change records.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "sml_types.hpp"
#include "utils.hpp"
#include <array>
#include <cctype>

namespace {
constexpr std::array<std::pair<sml_change_type, const char*>, 29> CHANGE_TYPE_NAMES = {{
	{sml_change_type::sheet_added, "SheetAdded"},
	{sml_change_type::sheet_deleted, "SheetDeleted"},
	{sml_change_type::sheet_renamed, "SheetRenamed"},
	{sml_change_type::row_inserted, "RowInserted"},
	{sml_change_type::row_deleted, "RowDeleted"},
	{sml_change_type::column_inserted, "ColumnInserted"},
	{sml_change_type::column_deleted, "ColumnDeleted"},
	{sml_change_type::cell_added, "CellAdded"},
	{sml_change_type::cell_deleted, "CellDeleted"},
	{sml_change_type::value_changed, "ValueChanged"},
	{sml_change_type::formula_changed, "FormulaChanged"},
	{sml_change_type::format_changed, "FormatChanged"},
	{sml_change_type::named_range_added, "NamedRangeAdded"},
	{sml_change_type::named_range_deleted, "NamedRangeDeleted"},
	{sml_change_type::named_range_changed, "NamedRangeChanged"},
	{sml_change_type::comment_added, "CommentAdded"},
	{sml_change_type::comment_deleted, "CommentDeleted"},
	{sml_change_type::comment_changed, "CommentChanged"},
	{sml_change_type::data_validation_added, "DataValidationAdded"},
	{sml_change_type::data_validation_deleted, "DataValidationDeleted"},
	{sml_change_type::data_validation_changed, "DataValidationChanged"},
	{sml_change_type::merged_cell_added, "MergedCellAdded"},
	{sml_change_type::merged_cell_deleted, "MergedCellDeleted"},
	{sml_change_type::conditional_format_added, "ConditionalFormatAdded"},
	{sml_change_type::conditional_format_deleted, "ConditionalFormatDeleted"},
	{sml_change_type::conditional_format_changed, "ConditionalFormatChanged"},
	{sml_change_type::hyperlink_added, "HyperlinkAdded"},
	{sml_change_type::hyperlink_deleted, "HyperlinkDeleted"},
	{sml_change_type::hyperlink_changed, "HyperlinkChanged"},
}};

std::string quoted(const std::optional<std::string>& value) {
	return "'" + value.value_or("") + "'";
}

std::string optional_text(const std::optional<std::string>& value) {
	return value ? "'" + *value + "'" : "none";
}

std::string optional_number(const std::optional<double>& value) {
	return value ? format_double(*value) : "none";
}
}

const char* sml_change_type_name(sml_change_type type) noexcept {
	for (const auto& [value, name] : CHANGE_TYPE_NAMES) {
		if (value == type) {
			return name;
		}
	}
	return "Unknown";
}

std::optional<sml_change_type> parse_sml_change_type(const std::string& name) {
	for (const auto& [value, text] : CHANGE_TYPE_NAMES) {
		if (name == text) {
			return value;
		}
	}
	return std::nullopt;
}

bool is_cell_change(sml_change_type type) noexcept {
	switch (type) {
		case sml_change_type::cell_added:
		case sml_change_type::cell_deleted:
		case sml_change_type::value_changed:
		case sml_change_type::formula_changed:
		case sml_change_type::format_changed:
			return true;
		default:
			return false;
	}
}

std::string sml_cell_format::difference_from(const sml_cell_format& older) const {
	if (*this == older) {
		return "No difference";
	}
	std::vector<std::string> diffs;
	if (number_format_code != older.number_format_code) {
		diffs.push_back("Number format: " + optional_text(older.number_format_code) + " → " + optional_text(number_format_code));
	}
	if (bold != older.bold) {
		diffs.emplace_back(bold ? "Made bold" : "Removed bold");
	}
	if (italic != older.italic) {
		diffs.emplace_back(italic ? "Made italic" : "Removed italic");
	}
	if (underline != older.underline) {
		diffs.emplace_back(underline ? "Added underline" : "Removed underline");
	}
	if (strikethrough != older.strikethrough) {
		diffs.emplace_back(strikethrough ? "Added strikethrough" : "Removed strikethrough");
	}
	if (font_name != older.font_name) {
		diffs.push_back("Font: " + optional_text(older.font_name) + " → " + optional_text(font_name));
	}
	if (font_size != older.font_size) {
		diffs.push_back("Size: " + optional_number(older.font_size) + " → " + optional_number(font_size));
	}
	if (font_color != older.font_color) {
		diffs.push_back("Font color: " + optional_text(older.font_color) + " → " + optional_text(font_color));
	}
	if (fill_foreground_color != older.fill_foreground_color) {
		diffs.push_back("Fill color: " + optional_text(older.fill_foreground_color) + " → " + optional_text(fill_foreground_color));
	}
	if (horizontal_alignment != older.horizontal_alignment) {
		diffs.push_back("Horizontal align: " + optional_text(older.horizontal_alignment) + " → " + optional_text(horizontal_alignment));
	}
	if (vertical_alignment != older.vertical_alignment) {
		diffs.push_back("Vertical align: " + optional_text(older.vertical_alignment) + " → " + optional_text(vertical_alignment));
	}
	if (wrap_text != older.wrap_text) {
		diffs.emplace_back(wrap_text ? "Enabled wrap text" : "Disabled wrap text");
	}
	if (diffs.empty()) {
		return "Minor formatting change";
	}
	std::string joined;
	for (const auto& diff : diffs) {
		if (!joined.empty()) {
			joined += "; ";
		}
		joined += diff;
	}
	return joined;
}

std::string sml_change::description() const {
	const std::string sheet = sheet_name.value_or("");
	const std::string cell = sheet + "!" + cell_address.value_or("");
	switch (type) {
		case sml_change_type::sheet_added:
			return "Sheet '" + sheet + "' was added";
		case sml_change_type::sheet_deleted:
			return "Sheet '" + sheet + "' was deleted";
		case sml_change_type::sheet_renamed:
			return "Sheet renamed from " + quoted(old_sheet_name) + " to '" + sheet + "'";
		case sml_change_type::row_inserted:
			return "Row " + std::to_string(row_index.value_or(0)) + " was inserted in sheet '" + sheet + "'";
		case sml_change_type::row_deleted:
			return "Row " + std::to_string(row_index.value_or(0)) + " was deleted from sheet '" + sheet + "'";
		case sml_change_type::column_inserted:
			return "Column " + column_letter(column_index.value_or(0)) + " was inserted in sheet '" + sheet + "'";
		case sml_change_type::column_deleted:
			return "Column " + column_letter(column_index.value_or(0)) + " was deleted from sheet '" + sheet + "'";
		case sml_change_type::cell_added:
			return "Cell " + cell + " was added with value " + quoted(new_value);
		case sml_change_type::cell_deleted:
			return "Cell " + cell + " was deleted (had value " + quoted(old_value) + ")";
		case sml_change_type::value_changed:
			return "Cell " + cell + " value changed from " + quoted(old_value) + " to " + quoted(new_value);
		case sml_change_type::formula_changed:
			return "Cell " + cell + " formula changed from " + quoted(old_formula) + " to " + quoted(new_formula);
		case sml_change_type::format_changed:
			if (old_format && new_format) {
				return "Cell " + cell + " formatting changed: " + new_format->difference_from(*old_format);
			}
			return "Cell " + cell + " formatting changed";
		case sml_change_type::named_range_added:
			return "Named range " + quoted(named_range_name) + " was added with value " + quoted(new_named_range_value);
		case sml_change_type::named_range_deleted:
			return "Named range " + quoted(named_range_name) + " was deleted (had value " + quoted(old_named_range_value) + ")";
		case sml_change_type::named_range_changed:
			return "Named range " + quoted(named_range_name) + " changed from " + quoted(old_named_range_value) + " to " + quoted(new_named_range_value);
		case sml_change_type::comment_added:
			return "Comment added to " + cell + ": '" + truncate_text(new_comment.value_or(""), 50) + "'";
		case sml_change_type::comment_deleted:
			return "Comment deleted from " + cell;
		case sml_change_type::comment_changed:
			return "Comment changed at " + cell;
		case sml_change_type::data_validation_added:
			return "Data validation (" + data_validation_type.value_or("") + ") added to " + cell;
		case sml_change_type::data_validation_deleted:
			return "Data validation removed from " + cell;
		case sml_change_type::data_validation_changed:
			return "Data validation changed at " + cell;
		case sml_change_type::merged_cell_added:
			return "Merged cell region " + merged_cell_range.value_or("") + " added in sheet '" + sheet + "'";
		case sml_change_type::merged_cell_deleted:
			return "Merged cell region " + merged_cell_range.value_or("") + " removed from sheet '" + sheet + "'";
		case sml_change_type::conditional_format_added:
			return "Conditional formatting added to " + conditional_format_range.value_or("") + " in sheet '" + sheet + "'";
		case sml_change_type::conditional_format_deleted:
			return "Conditional formatting removed from " + conditional_format_range.value_or("") + " in sheet '" + sheet + "'";
		case sml_change_type::conditional_format_changed:
			return "Conditional formatting changed at " + conditional_format_range.value_or("") + " in sheet '" + sheet + "'";
		case sml_change_type::hyperlink_added:
			return "Hyperlink added to " + cell + ": " + quoted(new_hyperlink);
		case sml_change_type::hyperlink_deleted:
			return "Hyperlink removed from " + cell;
		case sml_change_type::hyperlink_changed:
			return "Hyperlink changed at " + cell + " from " + quoted(old_hyperlink) + " to " + quoted(new_hyperlink);
	}
	return {};
}

size_t sml_comparison_result::count(sml_change_type type) const noexcept {
	size_t total = 0;
	for (const auto& change : changes) {
		if (change.type == type) {
			++total;
		}
	}
	return total;
}

std::string column_letter(int column) {
	std::string letters;
	while (column > 0) {
		--column;
		letters.insert(letters.begin(), static_cast<char>('A' + column % 26));
		column /= 26;
	}
	return letters;
}

std::string cell_address(int column, int row) {
	return column_letter(column) + std::to_string(row);
}

std::pair<int, int> parse_cell_reference(const std::string& reference) {
	int column = 0;
	size_t i = 0;
	if (i < reference.size() && reference[i] == '$') {
		++i;
	}
	for (; i < reference.size() && std::isalpha(static_cast<unsigned char>(reference[i])); ++i) {
		column = column * 26 + (std::toupper(static_cast<unsigned char>(reference[i])) - 'A' + 1);
	}
	if (i < reference.size() && reference[i] == '$') {
		++i;
	}
	int row = 0;
	for (; i < reference.size() && std::isdigit(static_cast<unsigned char>(reference[i])); ++i) {
		row = row * 10 + (reference[i] - '0');
	}
	if (i != reference.size()) {
		row = 0;
	}
	return {column, row};
}

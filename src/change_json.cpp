/* change_json.cpp - JSON form of change records and change-list items.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "change_json.hpp"
#include "compare_exception.hpp"
#include <optional>
#include <utility>

using nlohmann::json;

namespace {
template <typename T>
void put_optional(json& j, const char* key, const std::optional<T>& value) {
	if (value) {
		j[key] = *value;
	}
}

template <typename T>
void get_optional(const json& j, const char* key, std::optional<T>& value) {
	const auto it = j.find(key);
	if (it == j.end() || it->is_null()) {
		value.reset();
		return;
	}
	value = it->get<T>();
}

json section_of(const json& report, const char* key) {
	const auto it = report.find(key);
	if (it == report.end() || !it->is_array()) {
		return json::array();
	}
	return *it;
}

std::string record_locator(size_t index) {
	return "changes[" + std::to_string(index) + "]";
}
} // namespace

void to_json(json& j, const wml_change& change) {
	j = json{
		{"type", wml_change_type_name(change.type)},
		{"revision_id", change.revision_id},
		{"paragraph_index", change.paragraph_index},
		{"old_text", change.old_text},
		{"new_text", change.new_text},
		{"words_deleted", change.word_count.deleted},
		{"words_inserted", change.word_count.inserted},
		{"author", change.author},
		{"date", change.date},
	};
	put_optional(j, "table_row", change.table_row);
	put_optional(j, "table_cell", change.table_cell);
	if (!change.format_description.empty()) {
		j["format_description"] = change.format_description;
	}
	if (change.in_footnote) {
		j["in_footnote"] = true;
	}
	if (change.in_endnote) {
		j["in_endnote"] = true;
	}
	if (change.in_table) {
		j["in_table"] = true;
	}
	if (change.in_textbox) {
		j["in_textbox"] = true;
	}
}

void to_json(json& j, const wml_change_list_item& item) {
	j = json{
		{"id", item.id},
		{"type", wml_change_type_name(item.type)},
		{"summary", item.summary},
		{"preview", item.preview_text},
		{"words_deleted", item.word_count.deleted},
		{"words_inserted", item.word_count.inserted},
		{"paragraph_index", item.paragraph_index},
		{"revision_id", item.revision_id},
		{"revision_ids", item.revision_ids},
		{"anchor", item.anchor},
		{"details",
			{
				{"old_text", item.details.old_text},
				{"new_text", item.details.new_text},
				{"format_description", item.details.format_description},
				{"author", item.details.author},
				{"date", item.details.date},
				{"location", item.details.location_context},
			}},
	};
}

void to_json(json& j, const sml_cell_format& format) {
	j = json{
		{"bold", format.bold},
		{"italic", format.italic},
		{"underline", format.underline},
		{"strikethrough", format.strikethrough},
		{"wrap_text", format.wrap_text},
	};
	put_optional(j, "number_format_code", format.number_format_code);
	put_optional(j, "font_name", format.font_name);
	put_optional(j, "font_size", format.font_size);
	put_optional(j, "font_color", format.font_color);
	put_optional(j, "fill_pattern", format.fill_pattern);
	put_optional(j, "fill_foreground_color", format.fill_foreground_color);
	put_optional(j, "fill_background_color", format.fill_background_color);
	put_optional(j, "border_left_style", format.border_left_style);
	put_optional(j, "border_left_color", format.border_left_color);
	put_optional(j, "border_right_style", format.border_right_style);
	put_optional(j, "border_right_color", format.border_right_color);
	put_optional(j, "border_top_style", format.border_top_style);
	put_optional(j, "border_top_color", format.border_top_color);
	put_optional(j, "border_bottom_style", format.border_bottom_style);
	put_optional(j, "border_bottom_color", format.border_bottom_color);
	put_optional(j, "horizontal_alignment", format.horizontal_alignment);
	put_optional(j, "vertical_alignment", format.vertical_alignment);
	put_optional(j, "indent", format.indent);
}

void from_json(const json& j, sml_cell_format& format) {
	format.bold = j.value("bold", false);
	format.italic = j.value("italic", false);
	format.underline = j.value("underline", false);
	format.strikethrough = j.value("strikethrough", false);
	format.wrap_text = j.value("wrap_text", false);
	get_optional(j, "number_format_code", format.number_format_code);
	get_optional(j, "font_name", format.font_name);
	get_optional(j, "font_size", format.font_size);
	get_optional(j, "font_color", format.font_color);
	get_optional(j, "fill_pattern", format.fill_pattern);
	get_optional(j, "fill_foreground_color", format.fill_foreground_color);
	get_optional(j, "fill_background_color", format.fill_background_color);
	get_optional(j, "border_left_style", format.border_left_style);
	get_optional(j, "border_left_color", format.border_left_color);
	get_optional(j, "border_right_style", format.border_right_style);
	get_optional(j, "border_right_color", format.border_right_color);
	get_optional(j, "border_top_style", format.border_top_style);
	get_optional(j, "border_top_color", format.border_top_color);
	get_optional(j, "border_bottom_style", format.border_bottom_style);
	get_optional(j, "border_bottom_color", format.border_bottom_color);
	get_optional(j, "horizontal_alignment", format.horizontal_alignment);
	get_optional(j, "vertical_alignment", format.vertical_alignment);
	get_optional(j, "indent", format.indent);
}

void to_json(json& j, const sml_change& change) {
	j = json{{"type", sml_change_type_name(change.type)}, {"description", change.description()}};
	put_optional(j, "sheet_name", change.sheet_name);
	put_optional(j, "cell_address", change.cell_address);
	put_optional(j, "row_index", change.row_index);
	put_optional(j, "column_index", change.column_index);
	put_optional(j, "old_sheet_name", change.old_sheet_name);
	put_optional(j, "old_value", change.old_value);
	put_optional(j, "new_value", change.new_value);
	put_optional(j, "old_formula", change.old_formula);
	put_optional(j, "new_formula", change.new_formula);
	put_optional(j, "old_format", change.old_format);
	put_optional(j, "new_format", change.new_format);
	put_optional(j, "named_range_name", change.named_range_name);
	put_optional(j, "old_named_range_value", change.old_named_range_value);
	put_optional(j, "new_named_range_value", change.new_named_range_value);
	put_optional(j, "old_comment", change.old_comment);
	put_optional(j, "new_comment", change.new_comment);
	put_optional(j, "comment_author", change.comment_author);
	put_optional(j, "data_validation_type", change.data_validation_type);
	put_optional(j, "old_data_validation", change.old_data_validation);
	put_optional(j, "new_data_validation", change.new_data_validation);
	put_optional(j, "merged_cell_range", change.merged_cell_range);
	put_optional(j, "old_hyperlink", change.old_hyperlink);
	put_optional(j, "new_hyperlink", change.new_hyperlink);
	put_optional(j, "conditional_format_range", change.conditional_format_range);
	put_optional(j, "old_conditional_format", change.old_conditional_format);
	put_optional(j, "new_conditional_format", change.new_conditional_format);
}

void from_json(const json& j, sml_change& change) {
	const std::string name = j.value("type", "");
	const auto type = parse_sml_change_type(name);
	if (!type) {
		throw compare_exception(error_kind::invalid_package, "unknown spreadsheet change type '" + name + "'");
	}
	change.type = *type;
	get_optional(j, "sheet_name", change.sheet_name);
	get_optional(j, "cell_address", change.cell_address);
	get_optional(j, "row_index", change.row_index);
	get_optional(j, "column_index", change.column_index);
	get_optional(j, "old_sheet_name", change.old_sheet_name);
	get_optional(j, "old_value", change.old_value);
	get_optional(j, "new_value", change.new_value);
	get_optional(j, "old_formula", change.old_formula);
	get_optional(j, "new_formula", change.new_formula);
	get_optional(j, "old_format", change.old_format);
	get_optional(j, "new_format", change.new_format);
	get_optional(j, "named_range_name", change.named_range_name);
	get_optional(j, "old_named_range_value", change.old_named_range_value);
	get_optional(j, "new_named_range_value", change.new_named_range_value);
	get_optional(j, "old_comment", change.old_comment);
	get_optional(j, "new_comment", change.new_comment);
	get_optional(j, "comment_author", change.comment_author);
	get_optional(j, "data_validation_type", change.data_validation_type);
	get_optional(j, "old_data_validation", change.old_data_validation);
	get_optional(j, "new_data_validation", change.new_data_validation);
	get_optional(j, "merged_cell_range", change.merged_cell_range);
	get_optional(j, "old_hyperlink", change.old_hyperlink);
	get_optional(j, "new_hyperlink", change.new_hyperlink);
	get_optional(j, "conditional_format_range", change.conditional_format_range);
	get_optional(j, "old_conditional_format", change.old_conditional_format);
	get_optional(j, "new_conditional_format", change.new_conditional_format);
}

void to_json(json& j, const sml_change_list_item& item) {
	j = json{
		{"id", item.id},
		{"type", sml_change_type_name(item.type)},
		{"count", item.count},
		{"summary", item.summary},
	};
	put_optional(j, "sheet_name", item.sheet_name);
	put_optional(j, "cell_address", item.cell_address);
	put_optional(j, "cell_range", item.cell_range);
	put_optional(j, "row_index", item.row_index);
	put_optional(j, "column_index", item.column_index);
	put_optional(j, "details", item.details);
	put_optional(j, "anchor", item.anchor);
}

void to_json(json& j, const pml_text_change& change) {
	j = json{
		{"type", pml_text_change_type_name(change.type)},
		{"paragraph_index", change.paragraph_index},
		{"run_index", change.run_index},
	};
	put_optional(j, "old_text", change.old_text);
	put_optional(j, "new_text", change.new_text);
}

void from_json(const json& j, pml_text_change& change) {
	const std::string name = j.value("type", "");
	const auto type = parse_pml_text_change_type(name);
	if (!type) {
		throw compare_exception(error_kind::invalid_package, "unknown text change type '" + name + "'");
	}
	change.type = *type;
	change.paragraph_index = j.value("paragraph_index", 0);
	change.run_index = j.value("run_index", 0);
	get_optional(j, "old_text", change.old_text);
	get_optional(j, "new_text", change.new_text);
}

void to_json(json& j, const pml_change& change) {
	j = json{
		{"type", pml_change_type_name(change.type)},
		{"slide_index", change.slide_index},
		{"description", change.description()},
	};
	put_optional(j, "old_slide_index", change.old_slide_index);
	put_optional(j, "shape_name", change.shape_name);
	put_optional(j, "shape_id", change.shape_id);
	put_optional(j, "old_value", change.old_value);
	put_optional(j, "new_value", change.new_value);
	put_optional(j, "old_x", change.old_x);
	put_optional(j, "old_y", change.old_y);
	put_optional(j, "old_cx", change.old_cx);
	put_optional(j, "old_cy", change.old_cy);
	put_optional(j, "new_x", change.new_x);
	put_optional(j, "new_y", change.new_y);
	put_optional(j, "new_cx", change.new_cx);
	put_optional(j, "new_cy", change.new_cy);
	put_optional(j, "old_text_body", change.old_text_body);
	put_optional(j, "new_text_body", change.new_text_body);
	if (!change.text_changes.empty()) {
		j["text_changes"] = change.text_changes;
	}
	put_optional(j, "match_confidence", change.match_confidence);
}

void from_json(const json& j, pml_change& change) {
	const std::string name = j.value("type", "");
	const auto type = parse_pml_change_type(name);
	if (!type) {
		throw compare_exception(error_kind::invalid_package, "unknown presentation change type '" + name + "'");
	}
	change.type = *type;
	change.slide_index = j.value("slide_index", 0);
	get_optional(j, "old_slide_index", change.old_slide_index);
	get_optional(j, "shape_name", change.shape_name);
	get_optional(j, "shape_id", change.shape_id);
	get_optional(j, "old_value", change.old_value);
	get_optional(j, "new_value", change.new_value);
	get_optional(j, "old_x", change.old_x);
	get_optional(j, "old_y", change.old_y);
	get_optional(j, "old_cx", change.old_cx);
	get_optional(j, "old_cy", change.old_cy);
	get_optional(j, "new_x", change.new_x);
	get_optional(j, "new_y", change.new_y);
	get_optional(j, "new_cx", change.new_cx);
	get_optional(j, "new_cy", change.new_cy);
	get_optional(j, "old_text_body", change.old_text_body);
	get_optional(j, "new_text_body", change.new_text_body);
	change.text_changes.clear();
	if (const auto it = j.find("text_changes"); it != j.end() && it->is_array()) {
		change.text_changes = it->get<std::vector<pml_text_change>>();
	}
	get_optional(j, "match_confidence", change.match_confidence);
}

void to_json(json& j, const pml_change_list_item& item) {
	j = json{
		{"id", item.id},
		{"type", pml_change_type_name(item.type)},
		{"slide_index", item.slide_index},
		{"summary", item.summary},
	};
	put_optional(j, "shape_name", item.shape_name);
	put_optional(j, "shape_id", item.shape_id);
	put_optional(j, "preview", item.preview);
	put_optional(j, "count", item.count);
	put_optional(j, "details", item.details);
	put_optional(j, "anchor", item.anchor);
}

json make_change_report(const std::string& format, json changes, json items) {
	return json{{"format", format}, {"changes", std::move(changes)}, {"items", std::move(items)}};
}

json parse_change_report(const std::string& text, const std::string& locator) {
	auto j = json::parse(text, nullptr, false);
	if (j.is_discarded()) {
		throw compare_exception(error_kind::invalid_package, "not valid JSON", locator);
	}
	if (!j.is_object() || !j.contains("format") || !j["format"].is_string()) {
		throw compare_exception(error_kind::invalid_package, "not a change report", locator);
	}
	return j;
}

std::set<int> revision_ids_from_report(const json& report) {
	std::set<int> ids;
	for (const auto& item : section_of(report, "items")) {
		if (const auto it = item.find("revision_ids"); it != item.end() && it->is_array()) {
			for (const auto& id : *it) {
				ids.insert(id.get<int>());
			}
		}
	}
	if (!ids.empty()) {
		return ids;
	}
	for (const auto& change : section_of(report, "changes")) {
		if (change.contains("revision_id")) {
			ids.insert(change["revision_id"].get<int>());
		}
	}
	return ids;
}

std::vector<sml_change> sml_changes_from_report(const json& report) {
	std::vector<sml_change> changes;
	const json records = section_of(report, "changes");
	for (size_t i = 0; i < records.size(); ++i) {
		try {
			changes.push_back(records[i].get<sml_change>());
		} catch (const json::exception& e) {
			throw compare_exception(error_kind::invalid_package, e.what(), record_locator(i));
		} catch (const compare_exception& e) {
			throw compare_exception(e.get_kind(), e.get_message(), record_locator(i));
		}
	}
	return changes;
}

std::vector<pml_change> pml_changes_from_report(const json& report) {
	std::vector<pml_change> changes;
	const json records = section_of(report, "changes");
	for (size_t i = 0; i < records.size(); ++i) {
		try {
			changes.push_back(records[i].get<pml_change>());
		} catch (const json::exception& e) {
			throw compare_exception(error_kind::invalid_package, e.what(), record_locator(i));
		} catch (const compare_exception& e) {
			throw compare_exception(e.get_kind(), e.get_message(), record_locator(i));
		}
	}
	return changes;
}

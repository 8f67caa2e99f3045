/* sml_markup.cpp - highlights spreadsheet changes in a copy of the newer workbook.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "sml_markup.hpp"
#include "compare_exception.hpp"
#include "constants.hpp"
#include "package.hpp"
#include "sml_canonicalize.hpp"
#include "sml_sheet_xml.hpp"
#include "xml_utils.hpp"
#include <algorithm>
#include <initializer_list>
#include <map>
#include <vector>
#include <wx/log.h>

namespace {
constexpr const char* WORKBOOK_PART = "xl/workbook.xml";
constexpr const char* STYLES_PART = "xl/styles.xml";

struct highlight_styles {
	int added{0};
	int deleted{0};
	int value{0};
	int formula{0};
	int format{0};
};

std::string minimal_stylesheet() {
	return std::string(XML_DECLARATION) + "<styleSheet xmlns=\"" + SPREADSHEETML_NS + "\">"
		"<fonts count=\"1\"><font><sz val=\"11\"/><name val=\"Calibri\"/></font></fonts>"
		"<fills count=\"2\"><fill><patternFill patternType=\"none\"/></fill><fill><patternFill patternType=\"gray125\"/></fill></fills>"
		"<borders count=\"1\"><border><left/><right/><top/><bottom/><diagonal/></border></borders>"
		"<cellXfs count=\"1\"><xf numFmtId=\"0\" fontId=\"0\" fillId=\"0\" borderId=\"0\"/></cellXfs>"
		"</styleSheet>";
}

// Returns the named child of the stylesheet, creating it ahead of the first later section when absent.
pugi::xml_node style_section(pugi::xml_node root, const char* name, std::initializer_list<const char*> later_sections) {
	if (auto existing = first_child_local(root, name)) {
		return existing;
	}
	for (const char* later : later_sections) {
		if (auto next = first_child_local(root, later)) {
			return root.insert_child_before(sml_qualified_name(root, name).c_str(), next);
		}
	}
	return root.append_child(sml_qualified_name(root, name).c_str());
}

int add_solid_fill(pugi::xml_node fills, const std::string& color) {
	const int id = static_cast<int>(children_local(fills, "fill").size());
	auto pattern = fills.append_child(sml_qualified_name(fills, "fill").c_str()).append_child(sml_qualified_name(fills, "patternFill").c_str());
	pattern.append_attribute("patternType") = "solid";
	pattern.append_child(sml_qualified_name(fills, "fgColor").c_str()).append_attribute("rgb") = ("FF" + color).c_str();
	pattern.append_child(sml_qualified_name(fills, "bgColor").c_str()).append_attribute("indexed") = 64;
	return id;
}

int add_fill_format(pugi::xml_node cell_xfs, int fill_id) {
	const int id = static_cast<int>(children_local(cell_xfs, "xf").size());
	auto xf = cell_xfs.append_child(sml_qualified_name(cell_xfs, "xf").c_str());
	xf.append_attribute("numFmtId") = 0;
	xf.append_attribute("fontId") = 0;
	xf.append_attribute("fillId") = fill_id;
	xf.append_attribute("borderId") = 0;
	xf.append_attribute("applyFill") = 1;
	return id;
}

void set_count(pugi::xml_node node, const char* child) {
	const auto count = children_local(node, child).size();
	auto attr = node.attribute("count");
	if (!attr) {
		attr = node.append_attribute("count");
	}
	attr.set_value(static_cast<unsigned long long>(count));
}

highlight_styles add_highlight_styles(package& pkg, const sml_comparer_settings& settings) {
	pugi::xml_document doc;
	if (const auto* existing = pkg.get_part(STYLES_PART)) {
		load_xml(doc, *existing, STYLES_PART);
	} else {
		load_xml(doc, minimal_stylesheet(), STYLES_PART);
		pkg.add_relationship(WORKBOOK_PART, REL_TYPE_STYLES, "styles.xml");
		pkg.add_content_type_override(STYLES_PART, CONTENT_TYPE_SML_STYLES);
	}
	auto root = doc.document_element();
	auto fills = style_section(root, "fills", {"borders", "cellStyleXfs", "cellXfs"});
	auto cell_xfs = style_section(root, "cellXfs", {"cellStyles", "dxfs", "tableStyles", "colors", "extLst"});
	highlight_styles styles;
	styles.added = add_fill_format(cell_xfs, add_solid_fill(fills, settings.added_cell_color));
	styles.deleted = add_fill_format(cell_xfs, add_solid_fill(fills, settings.deleted_cell_color));
	styles.value = add_fill_format(cell_xfs, add_solid_fill(fills, settings.modified_value_color));
	styles.formula = add_fill_format(cell_xfs, add_solid_fill(fills, settings.modified_formula_color));
	styles.format = add_fill_format(cell_xfs, add_solid_fill(fills, settings.modified_format_color));
	set_count(fills, "fill");
	set_count(cell_xfs, "xf");
	pkg.put_xml_part(STYLES_PART, doc);
	return styles;
}

std::optional<int> style_for(sml_change_type type, const highlight_styles& styles) {
	switch (type) {
		case sml_change_type::cell_added:
			return styles.added;
		case sml_change_type::cell_deleted:
			return styles.deleted;
		case sml_change_type::value_changed:
			return styles.value;
		case sml_change_type::formula_changed:
			return styles.formula;
		case sml_change_type::format_changed:
			return styles.format;
		default:
			return std::nullopt;
	}
}

void highlight_cells(package& pkg, const sml_comparison_result& result, const highlight_styles& styles) {
	const auto sheet_parts = sml_sheet_parts(pkg);
	std::map<std::string, std::vector<const sml_change*>> by_part;
	for (const auto& change : result.changes) {
		if (!change.sheet_name || !change.cell_address || !style_for(change.type, styles)) {
			continue;
		}
		const auto it = std::find_if(sheet_parts.begin(), sheet_parts.end(), [&](const auto& entry) { return entry.first == *change.sheet_name; });
		if (it != sheet_parts.end()) {
			by_part[it->second].push_back(&change);
		}
	}
	for (const auto& [part, changes] : by_part) {
		auto doc = pkg.get_xml_part(part);
		auto sheet_data = first_child_local(doc->document_element(), "sheetData");
		if (!sheet_data) {
			wxLogWarning("Worksheet %s has no sheetData; changes are not highlighted", part);
			continue;
		}
		for (const auto* change : changes) {
			auto cell = sml_find_or_create_cell(sheet_data, *change->cell_address);
			auto attr = cell.attribute("s");
			if (!attr) {
				attr = cell.append_attribute("s");
			}
			attr.set_value(*style_for(change->type, styles));
		}
		pkg.put_xml_part(part, *doc);
	}
}

void add_text_row(pugi::xml_node sheet_data, int row, const std::vector<std::string>& values) {
	auto row_node = sheet_data.append_child("row");
	row_node.append_attribute("r") = row;
	for (size_t i = 0; i < values.size(); ++i) {
		auto cell = row_node.append_child("c");
		cell.append_attribute("r") = cell_address(static_cast<int>(i) + 1, row).c_str();
		if (values[i].empty()) {
			continue;
		}
		sml_set_cell_content(cell, values[i], std::nullopt);
	}
}

std::string summary_sheet_name(const package& pkg) {
	const auto sheets = sml_sheet_parts(pkg);
	std::string name = SML_SUMMARY_SHEET;
	for (int suffix = 2; std::any_of(sheets.begin(), sheets.end(), [&](const auto& entry) { return entry.first == name; }); ++suffix) {
		name = std::string(SML_SUMMARY_SHEET) + std::to_string(suffix);
	}
	return name;
}

void add_summary_sheet(package& pkg, const sml_comparison_result& result) {
	const std::string name = summary_sheet_name(pkg);
	const std::string target = "worksheets/" + name + ".xml";
	const std::string part = "xl/" + target;
	pugi::xml_document doc;
	auto worksheet = doc.append_child("worksheet");
	worksheet.append_attribute("xmlns") = SPREADSHEETML_NS;
	worksheet.append_attribute("xmlns:r") = REL_NS;
	auto sheet_data = worksheet.append_child("sheetData");
	const auto count = [&](sml_change_type type) { return std::to_string(result.count(type)); };
	int row = 1;
	add_text_row(sheet_data, row++, {"Spreadsheet Comparison Summary"});
	add_text_row(sheet_data, row++, {""});
	add_text_row(sheet_data, row++, {"Total Changes:", std::to_string(result.total_changes())});
	add_text_row(sheet_data, row++, {"Value Changes:", count(sml_change_type::value_changed)});
	add_text_row(sheet_data, row++, {"Formula Changes:", count(sml_change_type::formula_changed)});
	add_text_row(sheet_data, row++, {"Format Changes:", count(sml_change_type::format_changed)});
	add_text_row(sheet_data, row++, {"Cells Added:", count(sml_change_type::cell_added)});
	add_text_row(sheet_data, row++, {"Cells Deleted:", count(sml_change_type::cell_deleted)});
	add_text_row(sheet_data, row++, {"Sheets Added:", count(sml_change_type::sheet_added)});
	add_text_row(sheet_data, row++, {"Sheets Deleted:", count(sml_change_type::sheet_deleted)});
	add_text_row(sheet_data, row++, {""});
	add_text_row(sheet_data, row++, {"Change Type", "Sheet", "Cell", "Old Value", "New Value", "Description"});
	for (const auto& change : result.changes) {
		const auto old_side = change.old_value ? change.old_value : change.old_formula;
		const auto new_side = change.new_value ? change.new_value : change.new_formula;
		add_text_row(sheet_data, row++, {sml_change_type_name(change.type), change.sheet_name.value_or(""), change.cell_address.value_or(""), old_side.value_or(""), new_side.value_or(""), change.description()});
	}
	pkg.put_xml_part(part, doc);
	pkg.add_content_type_override(part, CONTENT_TYPE_WORKSHEET);
	const std::string rel_id = pkg.add_relationship(WORKBOOK_PART, REL_TYPE_WORKSHEET, target);
	auto workbook = pkg.get_xml_part(WORKBOOK_PART);
	auto root = workbook->document_element();
	auto sheets = first_child_local(root, "sheets");
	int max_id = 0;
	for (auto sheet : children_local(sheets, "sheet")) {
		max_id = std::max(max_id, sheet.attribute("sheetId").as_int(0));
	}
	const std::string prefix = declare_namespace(root, REL_NS, "r");
	auto sheet = sheets.append_child(sml_qualified_name(sheets, "sheet").c_str());
	sheet.append_attribute("name") = name.c_str();
	sheet.append_attribute("sheetId") = max_id + 1;
	sheet.append_attribute((prefix + ":id").c_str()) = rel_id.c_str();
	pkg.put_xml_part(WORKBOOK_PART, *workbook);
}
}

void sml_render_markup(package& pkg, const sml_comparison_result& result, const sml_comparer_settings& settings) {
	const auto styles = add_highlight_styles(pkg, settings);
	highlight_cells(pkg, result, styles);
	add_summary_sheet(pkg, result);
	wxLogVerbose("Highlighted %zu spreadsheet changes", result.total_changes());
}

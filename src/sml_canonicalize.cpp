/* sml_canonicalize.cpp - reduces a workbook to value-level signatures.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "sml_canonicalize.hpp"
#include "compare_exception.hpp"
#include "constants.hpp"
#include "hashing.hpp"
#include "package.hpp"
#include "utils.hpp"
#include "xml_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <tuple>
#include <wx/log.h>

namespace {
constexpr const char* WORKBOOK_PART = "xl/workbook.xml";
constexpr const char* SHARED_STRINGS_PART = "xl/sharedStrings.xml";
constexpr const char* STYLES_PART = "xl/styles.xml";

struct font_info {
	bool bold{false};
	bool italic{false};
	bool underline{false};
	bool strikethrough{false};
	std::optional<std::string> name;
	std::optional<double> size;
	std::optional<std::string> color;
};

struct fill_info {
	std::optional<std::string> pattern;
	std::optional<std::string> fg_color;
	std::optional<std::string> bg_color;
};

struct border_info {
	std::optional<std::string> left_style;
	std::optional<std::string> left_color;
	std::optional<std::string> right_style;
	std::optional<std::string> right_color;
	std::optional<std::string> top_style;
	std::optional<std::string> top_color;
	std::optional<std::string> bottom_style;
	std::optional<std::string> bottom_color;
};

struct xf_info {
	std::optional<int> num_fmt_id;
	std::optional<size_t> font_id;
	std::optional<size_t> fill_id;
	std::optional<size_t> border_id;
	std::optional<std::string> horizontal;
	std::optional<std::string> vertical;
	bool wrap_text{false};
	std::optional<int> indent;
};

struct style_info {
	std::map<int, std::string> number_formats;
	std::vector<font_info> fonts;
	std::vector<fill_info> fills;
	std::vector<border_info> borders;
	std::vector<xf_info> cell_xfs;
};

std::optional<std::string> optional_attribute(pugi::xml_node node, std::string_view name) {
	for (auto attr : node.attributes()) {
		if (get_local_name(attr.name()) == name) {
			return std::string(attr.value());
		}
	}
	return std::nullopt;
}

std::optional<std::string> color_of(pugi::xml_node node) {
	if (!node) {
		return std::nullopt;
	}
	if (auto rgb = optional_attribute(node, "rgb")) {
		return rgb;
	}
	return optional_attribute(node, "theme");
}

bool flag_attribute(pugi::xml_node node, std::string_view name, bool fallback) {
	const auto value = optional_attribute(node, name);
	if (!value) {
		return fallback;
	}
	return *value == "1" || *value == "true";
}

template <typename T>
std::optional<T> number_attribute(pugi::xml_node node, std::string_view name) {
	const auto value = optional_attribute(node, name);
	if (!value || value->empty()) {
		return std::nullopt;
	}
	char* end = nullptr;
	const long parsed = std::strtol(value->c_str(), &end, 10);
	if (*end != '\0' || parsed < 0) {
		return std::nullopt;
	}
	return static_cast<T>(parsed);
}

std::optional<std::string> optional_text(pugi::xml_node node) {
	if (!node) {
		return std::nullopt;
	}
	std::string text = node.text().get();
	if (text.empty()) {
		return std::nullopt;
	}
	return text;
}

font_info parse_font(pugi::xml_node font) {
	font_info info;
	for (auto child : element_children(font)) {
		const std::string local = local_name(child);
		if (local == "b") {
			info.bold = flag_attribute(child, "val", true);
		} else if (local == "i") {
			info.italic = flag_attribute(child, "val", true);
		} else if (local == "u") {
			info.underline = attribute_local(child, "val") != "none";
		} else if (local == "strike") {
			info.strikethrough = flag_attribute(child, "val", true);
		} else if (local == "name") {
			info.name = optional_attribute(child, "val");
		} else if (local == "sz") {
			if (const auto size = optional_attribute(child, "val")) {
				if (const auto parsed = parse_double(*size)) {
					info.size = *parsed;
				}
			}
		} else if (local == "color") {
			info.color = color_of(child);
		}
	}
	return info;
}

fill_info parse_fill(pugi::xml_node fill) {
	fill_info info;
	const auto pattern = first_child_local(fill, "patternFill");
	if (!pattern) {
		return info;
	}
	info.pattern = optional_attribute(pattern, "patternType");
	info.fg_color = color_of(first_child_local(pattern, "fgColor"));
	info.bg_color = color_of(first_child_local(pattern, "bgColor"));
	return info;
}

border_info parse_border(pugi::xml_node border) {
	border_info info;
	for (auto side : element_children(border)) {
		const std::string local = local_name(side);
		auto style = optional_attribute(side, "style");
		auto color = color_of(first_child_local(side, "color"));
		if (local == "left") {
			info.left_style = std::move(style);
			info.left_color = std::move(color);
		} else if (local == "right") {
			info.right_style = std::move(style);
			info.right_color = std::move(color);
		} else if (local == "top") {
			info.top_style = std::move(style);
			info.top_color = std::move(color);
		} else if (local == "bottom") {
			info.bottom_style = std::move(style);
			info.bottom_color = std::move(color);
		}
	}
	return info;
}

xf_info parse_xf(pugi::xml_node xf) {
	xf_info info;
	info.num_fmt_id = number_attribute<int>(xf, "numFmtId");
	info.font_id = number_attribute<size_t>(xf, "fontId");
	info.fill_id = number_attribute<size_t>(xf, "fillId");
	info.border_id = number_attribute<size_t>(xf, "borderId");
	if (const auto alignment = first_child_local(xf, "alignment")) {
		info.horizontal = optional_attribute(alignment, "horizontal");
		info.vertical = optional_attribute(alignment, "vertical");
		info.wrap_text = flag_attribute(alignment, "wrapText", false);
		info.indent = number_attribute<int>(alignment, "indent");
	}
	return info;
}

style_info read_styles(const package& pkg) {
	style_info info;
	const auto doc = pkg.try_get_xml_part(STYLES_PART);
	if (!doc) {
		return info;
	}
	const auto root = doc->document_element();
	for (auto format : children_local(first_child_local(root, "numFmts"), "numFmt")) {
		if (const auto id = number_attribute<int>(format, "numFmtId")) {
			info.number_formats[*id] = attribute_local(format, "formatCode");
		}
	}
	for (auto font : children_local(first_child_local(root, "fonts"), "font")) {
		info.fonts.push_back(parse_font(font));
	}
	for (auto fill : children_local(first_child_local(root, "fills"), "fill")) {
		info.fills.push_back(parse_fill(fill));
	}
	for (auto border : children_local(first_child_local(root, "borders"), "border")) {
		info.borders.push_back(parse_border(border));
	}
	for (auto xf : children_local(first_child_local(root, "cellXfs"), "xf")) {
		info.cell_xfs.push_back(parse_xf(xf));
	}
	return info;
}

sml_cell_format expand_style(size_t index, const style_info& styles) {
	if (index >= styles.cell_xfs.size()) {
		return {};
	}
	const auto& xf = styles.cell_xfs[index];
	sml_cell_format format;
	format.number_format_code = "General";
	if (xf.num_fmt_id) {
		if (const auto it = styles.number_formats.find(*xf.num_fmt_id); it != styles.number_formats.end()) {
			format.number_format_code = it->second;
		}
	}
	const font_info font = xf.font_id && *xf.font_id < styles.fonts.size() ? styles.fonts[*xf.font_id] : font_info{};
	const fill_info fill = xf.fill_id && *xf.fill_id < styles.fills.size() ? styles.fills[*xf.fill_id] : fill_info{};
	const border_info border = xf.border_id && *xf.border_id < styles.borders.size() ? styles.borders[*xf.border_id] : border_info{};
	format.bold = font.bold;
	format.italic = font.italic;
	format.underline = font.underline;
	format.strikethrough = font.strikethrough;
	format.font_name = font.name;
	format.font_size = font.size;
	format.font_color = font.color;
	format.fill_pattern = fill.pattern;
	format.fill_foreground_color = fill.fg_color;
	format.fill_background_color = fill.bg_color;
	format.border_left_style = border.left_style;
	format.border_left_color = border.left_color;
	format.border_right_style = border.right_style;
	format.border_right_color = border.right_color;
	format.border_top_style = border.top_style;
	format.border_top_color = border.top_color;
	format.border_bottom_style = border.bottom_style;
	format.border_bottom_color = border.bottom_color;
	format.horizontal_alignment = xf.horizontal;
	format.vertical_alignment = xf.vertical;
	format.wrap_text = xf.wrap_text;
	format.indent = xf.indent;
	return format;
}

std::vector<std::string> read_shared_strings(const package& pkg) {
	std::vector<std::string> strings;
	const auto doc = pkg.try_get_xml_part(SHARED_STRINGS_PART);
	if (!doc) {
		return strings;
	}
	for (auto item : children_local(doc->document_element(), "si")) {
		strings.push_back(descendant_text(item, "t"));
	}
	return strings;
}

std::optional<std::string> resolve_value(pugi::xml_node cell, const std::vector<std::string>& shared_strings) {
	const std::string type = attribute_local(cell, "t");
	const auto raw = optional_text(first_child_local(cell, "v"));
	if (!raw) {
		if (const auto inline_string = first_child_local(cell, "is")) {
			std::string text = descendant_text(inline_string, "t");
			if (!text.empty()) {
				return text;
			}
		}
		return std::nullopt;
	}
	if (type == "s") {
		char* end = nullptr;
		const unsigned long index = std::strtoul(raw->c_str(), &end, 10);
		if (*end == '\0' && index < shared_strings.size()) {
			return shared_strings[index];
		}
		return raw;
	}
	if (type == "str" || type == "e" || type == "inlineStr") {
		return raw;
	}
	if (type == "b") {
		return std::string(*raw == "1" ? "TRUE" : "FALSE");
	}
	return sml_normalize_numeric(*raw);
}

std::vector<const sml_cell_signature*> sample_cells(std::vector<const sml_cell_signature*> cells, size_t sample_size) {
	if (sample_size == 0 || cells.size() <= sample_size) {
		return cells;
	}
	std::vector<const sml_cell_signature*> sampled;
	sampled.reserve(sample_size);
	const double step = static_cast<double>(cells.size()) / static_cast<double>(sample_size);
	for (size_t i = 0; i < sample_size; ++i) {
		sampled.push_back(cells[static_cast<size_t>(static_cast<double>(i) * step)]);
	}
	return sampled;
}

std::string sampled_signature(const std::vector<const sml_cell_signature*>& cells, int sample_size) {
	std::string content;
	bool first = true;
	for (const auto* cell : sample_cells(cells, static_cast<size_t>(std::max(sample_size, 0)))) {
		if (!first) {
			content += "|";
		}
		content += cell->resolved_value.value_or("");
		first = false;
	}
	return sml_quick_hash(content);
}

void read_comments(const package& pkg, sml_worksheet_signature& sheet) {
	for (const auto& rel : pkg.get_relationships(sheet.part)) {
		if (rel.type != REL_TYPE_COMMENTS || rel.external) {
			continue;
		}
		const std::string path = package::resolve_target(sheet.part, rel.target);
		const auto doc = pkg.try_get_xml_part(path);
		if (!doc) {
			wxLogWarning("Comments part %s of sheet '%s' is unavailable", path, sheet.name);
			return;
		}
		const auto root = doc->document_element();
		std::vector<std::string> authors;
		for (auto author : children_local(first_child_local(root, "authors"), "author")) {
			authors.emplace_back(author.text().get());
		}
		for (auto comment : children_local(first_child_local(root, "commentList"), "comment")) {
			const std::string ref = attribute_local(comment, "ref");
			if (ref.empty()) {
				continue;
			}
			const size_t author_id = number_attribute<size_t>(comment, "authorId").value_or(0);
			sml_comment_signature signature;
			signature.cell_address = ref;
			signature.author = author_id < authors.size() ? authors[author_id] : "Unknown";
			signature.text = descendant_text(first_child_local(comment, "text"), "t");
			sheet.comments[ref] = std::move(signature);
		}
		return;
	}
}

void read_data_validations(pugi::xml_node root, sml_worksheet_signature& sheet) {
	for (auto validation : children_local(first_child_local(root, "dataValidations"), "dataValidation")) {
		const std::string sqref = attribute_local(validation, "sqref");
		if (sqref.empty()) {
			continue;
		}
		sml_data_validation_signature signature;
		signature.validation_type = optional_attribute(validation, "type").value_or("none");
		signature.operator_ = optional_attribute(validation, "operator");
		signature.formula1 = optional_text(first_child_local(validation, "formula1"));
		signature.formula2 = optional_text(first_child_local(validation, "formula2"));
		signature.allow_blank = flag_attribute(validation, "allowBlank", false);
		// showDropDown="1" hides the in-cell list.
		signature.show_drop_down = !flag_attribute(validation, "showDropDown", false);
		signature.show_input_message = flag_attribute(validation, "showInputMessage", false);
		signature.show_error_message = flag_attribute(validation, "showErrorMessage", false);
		signature.error_title = optional_attribute(validation, "errorTitle");
		signature.error = optional_attribute(validation, "error");
		signature.prompt_title = optional_attribute(validation, "promptTitle");
		signature.prompt = optional_attribute(validation, "prompt");
		for (const auto& range : split_whitespace(sqref)) {
			auto entry = signature;
			entry.cell_range = range;
			sheet.data_validations[range.substr(0, range.find(':'))] = std::move(entry);
		}
	}
}

void read_merged_ranges(pugi::xml_node root, sml_worksheet_signature& sheet) {
	for (auto merge : children_local(first_child_local(root, "mergeCells"), "mergeCell")) {
		const std::string range = attribute_local(merge, "ref");
		if (!range.empty()) {
			sheet.merged_ranges.insert(range);
		}
	}
}

void read_conditional_formats(pugi::xml_node root, sml_worksheet_signature& sheet) {
	for (auto formatting : children_local(root, "conditionalFormatting")) {
		const std::string sqref = attribute_local(formatting, "sqref");
		if (sqref.empty()) {
			continue;
		}
		std::string rules;
		for (auto rule : children_local(formatting, "cfRule")) {
			// Priorities shift whenever a rule elsewhere is added, so they stay out of the signature.
			rules += attribute_local(rule, "type") + "|" + attribute_local(rule, "operator") + "|" + attribute_local(rule, "dxfId");
			for (auto formula : children_local(rule, "formula")) {
				rules += "|" + std::string(formula.text().get());
			}
			rules += ";";
		}
		sheet.conditional_formats[sqref] += rules;
	}
}

void read_hyperlinks(const package& pkg, pugi::xml_node root, sml_worksheet_signature& sheet) {
	for (auto link : children_local(first_child_local(root, "hyperlinks"), "hyperlink")) {
		const std::string ref = attribute_local(link, "ref");
		if (ref.empty()) {
			continue;
		}
		sml_hyperlink_signature signature;
		signature.cell_address = ref;
		if (const auto id = optional_attribute(link, "id")) {
			if (const auto* rel = pkg.find_relationship(sheet.part, *id)) {
				signature.target = rel->target;
			}
		}
		if (signature.target.empty()) {
			signature.target = attribute_local(link, "location");
		}
		signature.display = optional_attribute(link, "display");
		signature.tooltip = optional_attribute(link, "tooltip");
		sheet.hyperlinks[ref] = std::move(signature);
	}
}

sml_worksheet_signature canonicalize_sheet(const package& pkg, const std::string& name, const std::string& rel_id, const std::string& part, const std::vector<std::string>& shared_strings, const style_info& styles, const sml_comparer_settings& settings) {
	sml_worksheet_signature sheet;
	sheet.name = name;
	sheet.relationship_id = rel_id;
	sheet.part = part;
	const auto doc = pkg.get_xml_part(part);
	const auto root = doc->document_element();
	for (auto row : children_local(first_child_local(root, "sheetData"), "row")) {
		for (auto cell : children_local(row, "c")) {
			const std::string ref = attribute_local(cell, "r");
			if (ref.empty()) {
				continue;
			}
			const auto [column, row_index] = parse_cell_reference(ref);
			if (column == 0 || row_index == 0) {
				throw compare_exception(error_kind::invalid_package, "invalid cell reference " + ref, part);
			}
			sml_cell_signature signature;
			signature.address = ref;
			signature.row = row_index;
			signature.column = column;
			signature.resolved_value = resolve_value(cell, shared_strings);
			signature.formula = optional_text(first_child_local(cell, "f"));
			signature.content_hash = sml_cell_content_hash(signature.resolved_value, signature.formula);
			signature.format = expand_style(number_attribute<size_t>(cell, "s").value_or(0), styles);
			sheet.populated_rows.insert(row_index);
			sheet.populated_columns.insert(column);
			sheet.cells[ref] = std::move(signature);
		}
	}
	if (settings.enable_row_alignment) {
		for (const int row : sheet.populated_rows) {
			sheet.row_signatures[row] = sampled_signature(sheet.cells_in_row(row), settings.row_signature_sample_size);
		}
	}
	if (settings.enable_column_alignment) {
		for (const int column : sheet.populated_columns) {
			sheet.column_signatures[column] = sampled_signature(sheet.cells_in_column(column), settings.row_signature_sample_size);
		}
	}
	if (settings.compare_comments) {
		read_comments(pkg, sheet);
	}
	if (settings.compare_data_validation) {
		read_data_validations(root, sheet);
	}
	if (settings.compare_merged_cells) {
		read_merged_ranges(root, sheet);
	}
	if (settings.compare_conditional_formatting) {
		read_conditional_formats(root, sheet);
	}
	if (settings.compare_hyperlinks) {
		read_hyperlinks(pkg, root, sheet);
	}
	return sheet;
}
}

std::string sml_data_validation_signature::hash() const {
	return sha256_base64(validation_type + "|" + operator_.value_or("") + "|" + formula1.value_or("") + "|" + formula2.value_or("") + "|" + (allow_blank ? "true" : "false") + "|" + (show_drop_down ? "true" : "false"));
}

std::string sml_data_validation_signature::to_string() const {
	std::string text = "Type: " + validation_type;
	if (operator_) {
		text += ", Operator: " + *operator_;
	}
	if (formula1) {
		text += ", Formula1: " + *formula1;
	}
	if (formula2) {
		text += ", Formula2: " + *formula2;
	}
	return text;
}

std::string sml_hyperlink_signature::hash() const {
	return sha256_base64(target + "|" + display.value_or(""));
}

std::vector<const sml_cell_signature*> sml_worksheet_signature::cells_in_row(int row) const {
	std::vector<const sml_cell_signature*> found;
	for (const auto& [address, cell] : cells) {
		if (cell.row == row) {
			found.push_back(&cell);
		}
	}
	std::sort(found.begin(), found.end(), [](const auto* a, const auto* b) { return a->column < b->column; });
	return found;
}

std::vector<const sml_cell_signature*> sml_worksheet_signature::cells_in_column(int column) const {
	std::vector<const sml_cell_signature*> found;
	for (const auto& [address, cell] : cells) {
		if (cell.column == column) {
			found.push_back(&cell);
		}
	}
	std::sort(found.begin(), found.end(), [](const auto* a, const auto* b) { return a->row < b->row; });
	return found;
}

std::string sml_worksheet_signature::content_hash() const {
	std::vector<const sml_cell_signature*> ordered;
	for (const auto& [address, cell] : cells) {
		ordered.push_back(&cell);
	}
	std::sort(ordered.begin(), ordered.end(), [](const auto* a, const auto* b) { return std::tie(a->row, a->column) < std::tie(b->row, b->column); });
	std::string content;
	for (const auto* cell : ordered) {
		content += cell->address + ":" + cell->resolved_value.value_or("") + "|";
	}
	return sha256_base64(content);
}

const sml_worksheet_signature* sml_workbook_signature::find_sheet(const std::string& name) const {
	const auto it = std::find_if(sheets.begin(), sheets.end(), [&](const auto& sheet) { return sheet.name == name; });
	return it == sheets.end() ? nullptr : &*it;
}

std::vector<std::pair<std::string, std::string>> sml_sheet_parts(const package& pkg) {
	const auto workbook = pkg.get_xml_part(WORKBOOK_PART);
	std::vector<std::pair<std::string, std::string>> parts;
	for (auto sheet : children_local(first_child_local(workbook->document_element(), "sheets"), "sheet")) {
		const std::string name = attribute_local(sheet, "name");
		const std::string id = attribute_local(sheet, "id");
		const auto* rel = pkg.find_relationship(WORKBOOK_PART, id);
		if (name.empty() || rel == nullptr) {
			throw compare_exception(error_kind::missing_part, "sheet '" + name + "' has no worksheet relationship", WORKBOOK_PART);
		}
		parts.emplace_back(name, package::resolve_target(WORKBOOK_PART, rel->target));
	}
	return parts;
}

sml_workbook_signature sml_canonicalize(const package& pkg, const sml_comparer_settings& settings) {
	const auto workbook = pkg.get_xml_part(WORKBOOK_PART);
	const auto root = workbook->document_element();
	if (!first_child_local(root, "sheets")) {
		throw compare_exception(error_kind::invalid_package, "workbook has no sheets element", WORKBOOK_PART);
	}
	const auto shared_strings = read_shared_strings(pkg);
	const auto styles = read_styles(pkg);
	sml_workbook_signature signature;
	for (auto sheet : children_local(first_child_local(root, "sheets"), "sheet")) {
		const std::string name = attribute_local(sheet, "name");
		const std::string id = attribute_local(sheet, "id");
		const auto* rel = pkg.find_relationship(WORKBOOK_PART, id);
		if (name.empty() || rel == nullptr) {
			throw compare_exception(error_kind::missing_part, "sheet '" + name + "' has no worksheet relationship", WORKBOOK_PART);
		}
		const std::string part = package::resolve_target(WORKBOOK_PART, rel->target);
		signature.sheets.push_back(canonicalize_sheet(pkg, name, id, part, shared_strings, styles, settings));
	}
	for (auto defined : children_local(first_child_local(root, "definedNames"), "definedName")) {
		const std::string name = attribute_local(defined, "name");
		if (!name.empty()) {
			signature.defined_names[name] = defined.text().get();
		}
	}
	wxLogVerbose("Canonicalized %zu sheets, %zu shared strings", signature.sheets.size(), shared_strings.size());
	return signature;
}

std::string sml_normalize_numeric(const std::string& value) {
	if (value.empty()) {
		return value;
	}
	const char first = value.front();
	if (!(std::isdigit(static_cast<unsigned char>(first)) || first == '-' || first == '+' || first == '.')) {
		return value;
	}
	const auto parsed = parse_double(value);
	return parsed ? format_double(*parsed) : value;
}

std::string sml_cell_content_hash(const std::optional<std::string>& value, const std::optional<std::string>& formula) {
	return sha256_base64(value.value_or("") + "|" + formula.value_or(""));
}

std::string sml_quick_hash(const std::string& content) {
	std::uint32_t hash = 17;
	for (const char32_t ch : utf8_to_u32(content)) {
		hash = hash * 31 + static_cast<std::uint32_t>(ch);
	}
	char buf[9];
	std::snprintf(buf, sizeof(buf), "%08X", hash);
	return buf;
}

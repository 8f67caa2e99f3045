/* sml_sheet_xml.cpp - editing helpers for worksheet markup.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "sml_sheet_xml.hpp"
#include "sml_types.hpp"
#include "utils.hpp"
#include "xml_utils.hpp"
#include <cctype>

namespace {
int row_number(pugi::xml_node row) {
	return row.attribute("r").as_int(0);
}

int cell_column(pugi::xml_node cell) {
	return parse_cell_reference(cell.attribute("r").as_string()).first;
}

bool looks_numeric(const std::string& value) {
	return parse_double(value).has_value();
}

bool needs_preserve(const std::string& text) {
	return !text.empty() && (std::isspace(static_cast<unsigned char>(text.front())) || std::isspace(static_cast<unsigned char>(text.back())));
}
}

std::string sml_qualified_name(pugi::xml_node context, const char* local) {
	const std::string prefix = get_prefix(context.name());
	return prefix.empty() ? std::string(local) : prefix + ":" + local;
}

pugi::xml_node sml_find_cell(pugi::xml_node sheet_data, const std::string& address) {
	const int row = parse_cell_reference(address).second;
	for (auto row_node : children_local(sheet_data, "row")) {
		if (row_number(row_node) != row) {
			continue;
		}
		for (auto cell : children_local(row_node, "c")) {
			if (cell.attribute("r").as_string() == address) {
				return cell;
			}
		}
	}
	return {};
}

pugi::xml_node sml_find_or_create_row(pugi::xml_node sheet_data, int row) {
	for (auto row_node : children_local(sheet_data, "row")) {
		const int number = row_number(row_node);
		if (number == row) {
			return row_node;
		}
		if (number > row) {
			auto created = sheet_data.insert_child_before(sml_qualified_name(sheet_data, "row").c_str(), row_node);
			created.append_attribute("r") = row;
			return created;
		}
	}
	auto created = sheet_data.append_child(sml_qualified_name(sheet_data, "row").c_str());
	created.append_attribute("r") = row;
	return created;
}

pugi::xml_node sml_find_or_create_cell(pugi::xml_node sheet_data, const std::string& address) {
	const auto [column, row] = parse_cell_reference(address);
	auto row_node = sml_find_or_create_row(sheet_data, row);
	for (auto cell : children_local(row_node, "c")) {
		if (cell.attribute("r").as_string() == address) {
			return cell;
		}
		if (cell_column(cell) > column) {
			auto created = row_node.insert_child_before(sml_qualified_name(sheet_data, "c").c_str(), cell);
			created.append_attribute("r") = address.c_str();
			return created;
		}
	}
	auto created = row_node.append_child(sml_qualified_name(sheet_data, "c").c_str());
	created.append_attribute("r") = address.c_str();
	return created;
}

void sml_set_cell_content(pugi::xml_node cell, const std::optional<std::string>& value, const std::optional<std::string>& formula) {
	for (auto child : element_children(cell)) {
		const std::string local = local_name(child);
		if (local == "f" || local == "v" || local == "is") {
			cell.remove_child(child);
		}
	}
	cell.remove_attribute("t");
	if (formula) {
		cell.append_child(sml_qualified_name(cell, "f").c_str()).text().set(formula->c_str());
	}
	if (!value) {
		return;
	}
	if (looks_numeric(*value)) {
		cell.append_child(sml_qualified_name(cell, "v").c_str()).text().set(value->c_str());
		return;
	}
	if (formula) {
		cell.append_attribute("t") = "str";
		cell.append_child(sml_qualified_name(cell, "v").c_str()).text().set(value->c_str());
		return;
	}
	cell.append_attribute("t") = "inlineStr";
	auto text = cell.append_child(sml_qualified_name(cell, "is").c_str()).append_child(sml_qualified_name(cell, "t").c_str());
	if (needs_preserve(*value)) {
		text.append_attribute("xml:space") = "preserve";
	}
	text.text().set(value->c_str());
}

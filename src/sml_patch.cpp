/* sml_patch.cpp - writes spreadsheet changes back into a workbook.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "sml_patch.hpp"
#include "compare_exception.hpp"
#include "package.hpp"
#include "sml_canonicalize.hpp"
#include "sml_sheet_xml.hpp"
#include "xml_utils.hpp"
#include <algorithm>
#include <map>
#include <utility>
#include <wx/log.h>

namespace {
bool patchable(sml_change_type type) {
	return type == sml_change_type::value_changed || type == sml_change_type::formula_changed || type == sml_change_type::cell_added || type == sml_change_type::cell_deleted;
}

void apply_to_sheet(package& pkg, const std::string& part, const std::vector<const sml_change*>& changes) {
	auto doc = pkg.get_xml_part(part);
	auto sheet_data = first_child_local(doc->document_element(), "sheetData");
	if (!sheet_data) {
		throw compare_exception(error_kind::invalid_package, "worksheet has no sheetData", part);
	}
	for (const auto* change : changes) {
		if (!change->cell_address || parse_cell_reference(*change->cell_address).second == 0) {
			wxLogWarning("Skipping %s without a usable cell address", sml_change_type_name(change->type));
			continue;
		}
		const std::string& address = *change->cell_address;
		if (change->type == sml_change_type::cell_deleted) {
			if (auto cell = sml_find_cell(sheet_data, address)) {
				cell.parent().remove_child(cell);
			}
			continue;
		}
		auto cell = sml_find_or_create_cell(sheet_data, address);
		sml_set_cell_content(cell, change->new_value, change->new_formula);
	}
	pkg.put_xml_part(part, *doc);
}
}

sml_change sml_invert_change(const sml_change& change) {
	sml_change inverse = change;
	std::swap(inverse.old_value, inverse.new_value);
	std::swap(inverse.old_formula, inverse.new_formula);
	std::swap(inverse.old_format, inverse.new_format);
	if (change.type == sml_change_type::cell_added) {
		inverse.type = sml_change_type::cell_deleted;
	} else if (change.type == sml_change_type::cell_deleted) {
		inverse.type = sml_change_type::cell_added;
	}
	return inverse;
}

std::string sml_apply_changes(const std::string& base, const std::vector<sml_change>& changes) {
	auto pkg = package::open(base);
	const auto sheet_parts = sml_sheet_parts(pkg);
	std::map<std::string, std::vector<const sml_change*>> by_part;
	for (const auto& change : changes) {
		if (!patchable(change.type) || !change.sheet_name) {
			continue;
		}
		const auto it = std::find_if(sheet_parts.begin(), sheet_parts.end(), [&](const auto& entry) { return entry.first == *change.sheet_name; });
		if (it == sheet_parts.end()) {
			throw compare_exception(error_kind::missing_part, "no sheet named '" + *change.sheet_name + "'", "xl/workbook.xml");
		}
		by_part[it->second].push_back(&change);
	}
	for (const auto& [part, sheet_changes] : by_part) {
		apply_to_sheet(pkg, part, sheet_changes);
	}
	wxLogVerbose("Patched %zu worksheets", by_part.size());
	return pkg.save();
}

std::string sml_revert_changes(const std::string& result, const std::vector<sml_change>& changes) {
	std::vector<sml_change> inverse;
	inverse.reserve(changes.size());
	for (const auto& change : changes) {
		inverse.push_back(sml_invert_change(change));
	}
	return sml_apply_changes(result, inverse);
}

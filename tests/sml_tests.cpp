/* sml_tests.cpp - spreadsheet comparison, grouping, patch and markup tests.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "package.hpp"
#include "sml_canonicalize.hpp"
#include "sml_change_list.hpp"
#include "sml_comparer.hpp"
#include "sml_markup.hpp"
#include "sml_patch.hpp"
#include "test_documents.hpp"
#include "utils.hpp"
#include "xml_utils.hpp"
#include <clocale>
#include <gtest/gtest.h>
#include <string>

namespace {
test_cell number(const std::string& reference, const std::string& value) {
	return {reference, value, false, {}};
}

test_cell text(const std::string& reference, const std::string& value) {
	return {reference, value, true, {}};
}

std::string cell_value(const std::string& workbook, const std::string& sheet, const std::string& address) {
	const auto signature = sml_canonicalize(package::open(workbook), {});
	const auto* found = signature.find_sheet(sheet);
	if (found == nullptr) {
		return "<no sheet>";
	}
	const auto it = found->cells.find(address);
	if (it == found->cells.end()) {
		return "<no cell>";
	}
	return it->second.resolved_value.value_or("<empty>");
}

const sml_comparer_settings defaults;
} // namespace

TEST(sml_compare, SingleValueChange) {
	const auto result = sml_compute_changes(make_xlsx({{"Sheet1", {number("A1", "100")}}}), make_xlsx({{"Sheet1", {number("A1", "200")}}}), defaults);
	ASSERT_EQ(result.total_changes(), 1u);
	const auto& change = result.changes[0];
	EXPECT_EQ(change.type, sml_change_type::value_changed);
	EXPECT_EQ(change.sheet_name, "Sheet1");
	EXPECT_EQ(change.cell_address, "A1");
	EXPECT_EQ(change.old_value, "100");
	EXPECT_EQ(change.new_value, "200");
	EXPECT_EQ(change.description(), "Cell Sheet1!A1 value changed from '100' to '200'");
}

TEST(sml_compare, IdenticalWorkbooksHaveNoChanges) {
	const auto workbook = make_xlsx({{"Data", {number("A1", "1"), text("B1", "label"), number("A2", "2.5")}}});
	EXPECT_EQ(sml_compute_changes(workbook, workbook, defaults).total_changes(), 0u);
}

TEST(sml_compare, CellsAddedAndDeleted) {
	const auto result = sml_compute_changes(make_xlsx({{"Sheet1", {number("A1", "1"), number("B1", "2")}}}), make_xlsx({{"Sheet1", {number("A1", "1"), number("C3", "9")}}}), defaults);
	EXPECT_EQ(result.count(sml_change_type::cell_deleted), 1u);
	EXPECT_EQ(result.count(sml_change_type::cell_added), 1u);
	EXPECT_EQ(result.total_changes(), 2u);
}

TEST(sml_compare, FormulaChangesAreSeparateFromValues) {
	const auto result = sml_compute_changes(make_xlsx({{"Sheet1", {{"A1", "3", false, "1+2"}}}}), make_xlsx({{"Sheet1", {{"A1", "3", false, "2+1"}}}}), defaults);
	ASSERT_EQ(result.total_changes(), 1u);
	EXPECT_EQ(result.changes[0].type, sml_change_type::formula_changed);
	EXPECT_EQ(result.changes[0].old_formula, "1+2");
	EXPECT_EQ(result.changes[0].new_formula, "2+1");
}

TEST(sml_compare, NumbersCompareInCanonicalForm) {
	EXPECT_EQ(sml_normalize_numeric("100"), "100");
	EXPECT_EQ(sml_normalize_numeric("100.0"), "100");
	EXPECT_EQ(sml_normalize_numeric("0.1"), "0.1");
	EXPECT_EQ(sml_normalize_numeric("text"), "text");
	const auto result = sml_compute_changes(make_xlsx({{"Sheet1", {number("A1", "100.0")}}}), make_xlsx({{"Sheet1", {number("A1", "100")}}}), defaults);
	EXPECT_EQ(result.total_changes(), 0u);
}

TEST(sml_compare, ToleranceAndCaseSettings) {
	sml_comparer_settings settings;
	settings.numeric_tolerance = 0.01;
	settings.case_insensitive_values = true;
	const auto result = sml_compute_changes(make_xlsx({{"Sheet1", {number("A1", "1.000"), text("B1", "Total")}}}), make_xlsx({{"Sheet1", {number("A1", "1.005"), text("B1", "TOTAL")}}}), settings);
	EXPECT_EQ(result.total_changes(), 0u);
}

TEST(sml_compare, NumberParsingIgnoresTheLocale) {
	const std::string previous = std::setlocale(LC_NUMERIC, nullptr);
	// A comma-decimal locale, where one is installed.
	std::setlocale(LC_NUMERIC, "de_DE.UTF-8");
	EXPECT_EQ(sml_normalize_numeric("1.50"), "1.5");
	EXPECT_EQ(sml_normalize_numeric("+2.50"), "2.5");
	EXPECT_EQ(sml_normalize_numeric("-.25"), "-0.25");
	EXPECT_EQ(sml_normalize_numeric("1,5"), "1,5");
	EXPECT_EQ(sml_normalize_numeric("0x10"), "0x10");
	EXPECT_EQ(sml_normalize_numeric("-inf"), "-inf");
	EXPECT_EQ(sml_normalize_numeric(" 7"), " 7");
	EXPECT_FALSE(parse_double("+-1").has_value());
	EXPECT_FALSE(parse_double("").has_value());
	std::setlocale(LC_NUMERIC, previous.c_str());
}

TEST(sml_compare, ToleranceStillAppliesToCaseInsensitiveValues) {
	sml_comparer_settings settings;
	settings.numeric_tolerance = 0.01;
	settings.case_insensitive_values = true;
	const auto result = sml_compute_changes(make_xlsx({{"Sheet1", {number("A1", "2.000"), number("A2", "3"), text("B1", "Net")}}}), make_xlsx({{"Sheet1", {number("A1", "2.004"), number("A2", "3.5"), text("B1", "NET")}}}), settings);
	ASSERT_EQ(result.total_changes(), 1u);
	EXPECT_EQ(result.changes[0].type, sml_change_type::value_changed);
	EXPECT_EQ(result.changes[0].cell_address.value_or(""), "A2");
}

TEST(sml_compare, SheetsAddedAndDeleted) {
	const auto result = sml_compute_changes(make_xlsx({{"Sheet1", {number("A1", "1")}}, {"Old", {number("A1", "5")}}}), make_xlsx({{"Sheet1", {number("A1", "1")}}, {"Brand new", {text("A1", "completely different")}}}), defaults);
	EXPECT_EQ(result.count(sml_change_type::sheet_added), 1u);
	EXPECT_EQ(result.count(sml_change_type::sheet_deleted), 1u);
}

TEST(sml_compare, RenamedSheetIsDetected) {
	const std::vector<test_cell> cells{number("A1", "1"), number("A2", "2"), text("B1", "x")};
	const auto result = sml_compute_changes(make_xlsx({{"Before", cells}}), make_xlsx({{"After", cells}}), defaults);
	ASSERT_EQ(result.total_changes(), 1u);
	EXPECT_EQ(result.changes[0].type, sml_change_type::sheet_renamed);
	EXPECT_EQ(result.changes[0].old_sheet_name, "Before");
	EXPECT_EQ(result.changes[0].sheet_name, "After");
}

TEST(sml_compare, RenameDetectionCanBeDisabled) {
	sml_comparer_settings settings;
	settings.enable_sheet_rename_detection = false;
	const std::vector<test_cell> cells{number("A1", "1")};
	const auto result = sml_compute_changes(make_xlsx({{"Before", cells}}), make_xlsx({{"After", cells}}), settings);
	EXPECT_EQ(result.count(sml_change_type::sheet_renamed), 0u);
	EXPECT_EQ(result.count(sml_change_type::sheet_added), 1u);
	EXPECT_EQ(result.count(sml_change_type::sheet_deleted), 1u);
}

TEST(sml_change_list, AdjacentCellsCollapseIntoARange) {
	const auto result = sml_compute_changes(make_xlsx({{"Sheet1", {number("A1", "1"), number("B1", "2"), number("C1", "3")}}}), make_xlsx({{"Sheet1", {number("A1", "10"), number("B1", "20"), number("C1", "30")}}}), defaults);
	const auto items = sml_build_change_list(result.changes);
	ASSERT_EQ(items.size(), 1u);
	EXPECT_EQ(items[0].count, 3u);
	EXPECT_EQ(items[0].cell_range, "A1:C1");
	EXPECT_EQ(items[0].summary, "3 cells changed (Value) in Sheet1");
	EXPECT_FALSE(items[0].details);
	EXPECT_EQ(items[0].id, "change-1");
}

TEST(sml_change_list, ScatteredCellsStaySeparate) {
	std::vector<sml_change> changes(2);
	changes[0].sheet_name = "S";
	changes[0].cell_address = "A1";
	changes[1].sheet_name = "S";
	changes[1].cell_address = "C5";
	const auto items = sml_build_change_list(changes);
	ASSERT_EQ(items.size(), 2u);
	EXPECT_TRUE(items[0].details);
	EXPECT_EQ(items[1].id, "change-2");
	EXPECT_EQ(items[1].anchor, "S!C5");
}

TEST(sml_change_list, GroupsFollowOneDirection) {
	std::vector<sml_change> changes(3);
	for (auto& change : changes) {
		change.sheet_name = "S";
	}
	changes[0].cell_address = "A1";
	changes[1].cell_address = "B1";
	changes[2].cell_address = "B2";
	const auto items = sml_build_change_list(changes);
	ASSERT_EQ(items.size(), 2u);
	EXPECT_EQ(items[0].cell_range, "A1:B1");
	EXPECT_EQ(items[1].cell_address, "B2");
}

TEST(sml_patch, ApplyWritesNewValuesAndRevertRestores) {
	const auto older = make_xlsx({{"Sheet1", {number("A1", "100"), text("B1", "old label")}}});
	const auto newer = make_xlsx({{"Sheet1", {number("A1", "200"), text("B1", "new label")}}});
	const auto result = sml_compute_changes(older, newer, defaults);
	ASSERT_EQ(result.total_changes(), 2u);
	const auto applied = sml_apply_changes(older, result.changes);
	EXPECT_EQ(cell_value(applied, "Sheet1", "A1"), "200");
	EXPECT_EQ(cell_value(applied, "Sheet1", "B1"), "new label");
	EXPECT_EQ(sml_compute_changes(applied, newer, defaults).total_changes(), 0u);
	const auto reverted = sml_revert_changes(applied, result.changes);
	EXPECT_EQ(sml_compute_changes(reverted, older, defaults).total_changes(), 0u);
}

TEST(sml_patch, AddedCellsAreCreated) {
	const auto older = make_xlsx({{"Sheet1", {number("A1", "1")}}});
	const auto newer = make_xlsx({{"Sheet1", {number("A1", "1"), number("D4", "7")}}});
	const auto result = sml_compute_changes(older, newer, defaults);
	const auto applied = sml_apply_changes(older, result.changes);
	EXPECT_EQ(cell_value(applied, "Sheet1", "D4"), "7");
}

TEST(sml_patch, InverseSwapsSides) {
	sml_change change;
	change.type = sml_change_type::cell_added;
	change.new_value = "5";
	const auto inverse = sml_invert_change(change);
	EXPECT_EQ(inverse.type, sml_change_type::cell_deleted);
	EXPECT_EQ(inverse.old_value, "5");
	EXPECT_FALSE(inverse.new_value);
}

TEST(sml_markup, OutputHighlightsCellsAndAddsSummary) {
	const auto output = sml_compare(make_xlsx({{"Sheet1", {number("A1", "100")}}}), make_xlsx({{"Sheet1", {number("A1", "200")}}}), defaults);
	ASSERT_EQ(output.result.total_changes(), 1u);
	pugi::xml_document workbook;
	load_part(workbook, output.document, "xl/workbook.xml");
	bool has_summary = false;
	for (auto sheet : descendants_local(workbook.document_element(), "sheet")) {
		has_summary = has_summary || attribute_local(sheet, "name") == SML_SUMMARY_SHEET;
	}
	EXPECT_TRUE(has_summary);
	const auto pkg = package::open(output.document);
	EXPECT_TRUE(pkg.has_part("xl/styles.xml"));
	pugi::xml_document sheet;
	load_part(sheet, output.document, "xl/worksheets/sheet1.xml");
	const auto cell = first_descendant_local(sheet.document_element(), "c");
	ASSERT_TRUE(cell);
	EXPECT_GT(cell.attribute("s").as_int(0), 0);
	EXPECT_EQ(cell_value(output.document, "Sheet1", "A1"), "200");
}

/* change_json_tests.cpp - change report serialization tests.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "change_json.hpp"
#include "compare_exception.hpp"
#include <gtest/gtest.h>

using nlohmann::json;

TEST(change_json, ReportHasFormatChangesAndItems) {
	wml_change change;
	change.type = wml_change_type::text_deleted;
	change.revision_id = 4;
	change.paragraph_index = 2;
	change.old_text = "lazy";
	change.word_count.deleted = 1;
	change.in_table = true;
	const auto report = make_change_report("docx", json::array({change}), json::array());
	EXPECT_EQ(report["format"], "docx");
	ASSERT_EQ(report["changes"].size(), 1u);
	const auto& record = report["changes"][0];
	EXPECT_EQ(record["type"], "TextDeleted");
	EXPECT_EQ(record["revision_id"], 4);
	EXPECT_EQ(record["old_text"], "lazy");
	EXPECT_EQ(record["words_deleted"], 1);
	EXPECT_EQ(record["in_table"], true);
	EXPECT_FALSE(record.contains("in_footnote"));
	EXPECT_FALSE(record.contains("table_row"));
}

TEST(change_json, ListItemCarriesDetails) {
	wml_change_list_item item;
	item.id = "change-1";
	item.type = wml_change_type::text_replaced;
	item.revision_ids = {1, 2};
	item.details.old_text = "a";
	item.details.new_text = "b";
	const json j = item;
	EXPECT_EQ(j["id"], "change-1");
	EXPECT_EQ(j["type"], "TextReplaced");
	EXPECT_EQ(j["revision_ids"], json::array({1, 2}));
	EXPECT_EQ(j["details"]["new_text"], "b");
}

TEST(change_json, ParseRejectsMalformedReports) {
	try {
		(void)parse_change_report("{not json", "changes.json");
		FAIL() << "expected a compare_exception";
	} catch (const compare_exception& e) {
		EXPECT_EQ(e.get_kind(), error_kind::invalid_package);
		EXPECT_EQ(e.get_locator(), "changes.json");
	}
	EXPECT_THROW((void)parse_change_report(R"({"changes": []})", "changes.json"), compare_exception);
	EXPECT_THROW((void)parse_change_report("[1, 2]", "changes.json"), compare_exception);
	EXPECT_NO_THROW((void)parse_change_report(R"({"format": "xlsx"})", "changes.json"));
}

TEST(change_json, RevisionIdsPreferItems) {
	const auto report = json::parse(R"({"format": "docx", "changes": [{"revision_id": 9}], "items": [{"revision_ids": [1, 2]}, {"revision_ids": [2, 5]}]})");
	EXPECT_EQ(revision_ids_from_report(report), (std::set<int>{1, 2, 5}));
}

TEST(change_json, RevisionIdsFallBackToChanges) {
	const auto report = json::parse(R"({"format": "docx", "changes": [{"revision_id": 9}, {"revision_id": 3}, {"type": "TextInserted"}]})");
	EXPECT_EQ(revision_ids_from_report(report), (std::set<int>{3, 9}));
	EXPECT_TRUE(revision_ids_from_report(json::parse(R"({"format": "docx"})")).empty());
}

TEST(change_json, SpreadsheetChangesReadBack) {
	sml_change change;
	change.type = sml_change_type::value_changed;
	change.sheet_name = "Sheet1";
	change.cell_address = "B2";
	change.old_value = "1";
	change.new_value = "2";
	sml_cell_format format;
	format.bold = true;
	format.font_name = "Calibri";
	change.new_format = format;
	const auto report = make_change_report("xlsx", json::array({change}), json::array());
	EXPECT_EQ(report["changes"][0]["description"], change.description());
	const auto changes = sml_changes_from_report(report);
	ASSERT_EQ(changes.size(), 1u);
	EXPECT_EQ(changes[0].type, sml_change_type::value_changed);
	EXPECT_EQ(changes[0].cell_address, "B2");
	EXPECT_EQ(changes[0].new_value, "2");
	EXPECT_FALSE(changes[0].old_formula);
	ASSERT_TRUE(changes[0].new_format);
	EXPECT_TRUE(changes[0].new_format->bold);
	EXPECT_EQ(changes[0].new_format->font_name, "Calibri");
}

TEST(change_json, PresentationChangesReadBack) {
	pml_change change;
	change.type = pml_change_type::text_changed;
	change.slide_index = 2;
	change.shape_name = "Title 1";
	change.new_x = 914400;
	pml_text_change edit;
	edit.type = pml_text_change_type::replace;
	edit.old_text = "Intro";
	edit.new_text = "Welcome";
	change.text_changes.push_back(edit);
	const auto report = make_change_report("pptx", json::array({change}), json::array());
	const auto changes = pml_changes_from_report(report);
	ASSERT_EQ(changes.size(), 1u);
	EXPECT_EQ(changes[0].type, pml_change_type::text_changed);
	EXPECT_EQ(changes[0].slide_index, 2);
	EXPECT_EQ(changes[0].new_x, 914400);
	ASSERT_EQ(changes[0].text_changes.size(), 1u);
	EXPECT_EQ(changes[0].text_changes[0].type, pml_text_change_type::replace);
	EXPECT_EQ(changes[0].text_changes[0].new_text, "Welcome");
}

TEST(change_json, UnknownTypeNamesTheRecord) {
	const auto report = json::parse(R"({"format": "pptx", "changes": [{"type": "TextChanged", "slide_index": 1}, {"type": "Teleported"}]})");
	try {
		(void)pml_changes_from_report(report);
		FAIL() << "expected a compare_exception";
	} catch (const compare_exception& e) {
		EXPECT_EQ(e.get_kind(), error_kind::invalid_package);
		EXPECT_EQ(e.get_locator(), "changes[1]");
	}
}

TEST(change_json, WrongFieldTypeIsAnInvalidPackage) {
	const auto report = json::parse(R"({"format": "xlsx", "changes": [{"type": "ValueChanged", "sheet_name": 7}]})");
	EXPECT_THROW((void)sml_changes_from_report(report), compare_exception);
}

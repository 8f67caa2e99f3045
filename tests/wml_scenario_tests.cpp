/* wml_scenario_tests.cpp - end-to-end word-processing comparisons.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "test_documents.hpp"
#include "utils.hpp"
#include "wml_comparer.hpp"
#include "xml_utils.hpp"
#include <gtest/gtest.h>
#include <set>
#include <string>
#include <vector>

namespace {
std::vector<wml_change> of_type(const std::vector<wml_change>& changes, wml_change_type type) {
	std::vector<wml_change> found;
	for (const auto& change : changes) {
		if (change.type == type) {
			found.push_back(change);
		}
	}
	return found;
}

std::vector<wml_change> in_paragraph(const std::vector<wml_change>& changes, size_t paragraph) {
	std::vector<wml_change> found;
	for (const auto& change : changes) {
		if (change.paragraph_index == paragraph && !change.in_footnote) {
			found.push_back(change);
		}
	}
	return found;
}

wml_comparer_settings fixed_settings() {
	wml_comparer_settings settings;
	settings.author = "Reviewer";
	settings.date_time = "2025-01-01T00:00:00Z";
	return settings;
}

std::string footnote_paragraph(const std::string& text) {
	return R"(<w:p><w:r><w:rPr><w:rStyle w:val="FootnoteReference"/></w:rPr><w:footnoteReference w:id="1"/></w:r><w:r><w:t xml:space="preserve">)" + text + "</w:t></w:r></w:p>";
}

const std::string FOOTNOTES = R"(<w:footnote w:type="separator" w:id="-1"><w:p><w:r><w:separator/></w:r></w:p></w:footnote>)"
							  R"(<w:footnote w:type="continuationSeparator" w:id="0"><w:p><w:r><w:continuationSeparator/></w:r></w:p></w:footnote>)"
							  R"(<w:footnote w:id="1"><w:p><w:r><w:t>A note that never changes.</w:t></w:r></w:p></w:footnote>)";
using table_rows = std::vector<std::vector<std::string>>;

// A two-column table; a non-empty heading adds a first row whose single cell spans both columns.
std::string wml_table(const table_rows& rows, const std::string& heading = {}) {
	std::string xml = R"(<w:tbl><w:tblPr><w:tblW w:w="0" w:type="auto"/></w:tblPr><w:tblGrid><w:gridCol w:w="2000"/><w:gridCol w:w="2000"/></w:tblGrid>)";
	if (!heading.empty()) {
		xml += R"(<w:tr><w:tc><w:tcPr><w:gridSpan w:val="2"/></w:tcPr>)" + wml_paragraph(heading) + "</w:tc></w:tr>";
	}
	for (const auto& row : rows) {
		xml += "<w:tr>";
		for (const auto& cell : row) {
			xml += "<w:tc>" + wml_paragraph(cell) + "</w:tc>";
		}
		xml += "</w:tr>";
	}
	return xml + "</w:tbl>";
}

std::string docx_with_table(const table_rows& rows, const std::string& heading = {}) {
	docx_content content;
	content.body = wml_paragraph("Stock report") + wml_table(rows, heading);
	return make_docx(content);
}

std::string textbox_paragraph(const std::string& text) {
	return R"(<w:p><w:r><w:pict><v:shape id="StatusBox" style="width:120pt;height:40pt"><v:textbox><w:txbxContent>)" + wml_paragraph(text) + "</w:txbxContent></v:textbox></v:shape></w:pict></w:r></w:p>";
}

std::string endnote(const std::string& id, const std::string& text) {
	return R"(<w:endnote w:id=")" + id + R"("><w:p><w:r><w:t xml:space="preserve">)" + text + "</w:t></w:r></w:p></w:endnote>";
}

const std::string ENDNOTE_SEPARATORS = R"(<w:endnote w:type="separator" w:id="-1"><w:p><w:r><w:separator/></w:r></w:p></w:endnote>)"
									   R"(<w:endnote w:type="continuationSeparator" w:id="0"><w:p><w:r><w:continuationSeparator/></w:r></w:p></w:endnote>)";

const std::string ENDNOTE_BODY = R"(<w:p><w:r><w:t xml:space="preserve">Claim </w:t></w:r><w:r><w:endnoteReference w:id="1"/></w:r>)"
								 R"(<w:r><w:t xml:space="preserve"> and more </w:t></w:r><w:r><w:endnoteReference w:id="2"/></w:r></w:p>)";

std::set<int> revision_ids_of(const wml_comparison_result& result) {
	std::set<int> ids;
	for (const auto& change : result.changes) {
		ids.insert(change.revision_id);
	}
	return ids;
}

std::vector<std::string> paragraph_texts(const std::string& docx) {
	pugi::xml_document doc;
	load_part(doc, docx, "word/document.xml");
	std::vector<std::string> texts;
	for (auto p : descendants_local(doc.document_element(), "p")) {
		texts.push_back(descendant_text(p, "t"));
	}
	return texts;
}

size_t row_revisions(const std::string& docx, const char* local) {
	pugi::xml_document doc;
	load_part(doc, docx, "word/document.xml");
	size_t found = 0;
	for (auto tr_pr : descendants_local(doc.document_element(), "trPr")) {
		found += children_local(tr_pr, local).size();
	}
	return found;
}
} // namespace

TEST(wml_scenario, ReplacedTrailingWords) {
	const auto result = wml_compare(make_paragraphs_docx({"The quick brown fox jumps over the lazy dog."}), make_paragraphs_docx({"The quick brown fox jumps over the active cat."}), fixed_settings());
	const auto deleted = of_type(result.changes, wml_change_type::text_deleted);
	const auto inserted = of_type(result.changes, wml_change_type::text_inserted);
	ASSERT_EQ(deleted.size(), 1u);
	ASSERT_EQ(inserted.size(), 1u);
	EXPECT_EQ(deleted[0].old_text, "lazy dog");
	EXPECT_EQ(inserted[0].new_text, "active cat");
	EXPECT_EQ(deleted[0].paragraph_index, 1u);
	EXPECT_EQ(inserted[0].paragraph_index, 1u);
	EXPECT_GE(result.changes.size(), 2u);
	EXPECT_EQ(deleted[0].author, "Reviewer");
	EXPECT_EQ(deleted[0].date, "2025-01-01T00:00:00Z");
}

TEST(wml_scenario, NumbersAndPunctuationDiffByCharacter) {
	const auto result = wml_compare(make_paragraphs_docx({"12.34", "12,34", "Ab,cd", "Test.", ".Test.123"}), make_paragraphs_docx({"12.34", "12,4", "Ab,cd", "st.", ".Test.123"}), fixed_settings());
	EXPECT_TRUE(in_paragraph(result.changes, 1).empty());
	EXPECT_TRUE(in_paragraph(result.changes, 3).empty());
	EXPECT_TRUE(in_paragraph(result.changes, 5).empty());
	const auto second = in_paragraph(result.changes, 2);
	ASSERT_EQ(second.size(), 1u);
	EXPECT_EQ(second[0].type, wml_change_type::text_deleted);
	EXPECT_EQ(second[0].old_text, "3");
	const auto fourth = in_paragraph(result.changes, 4);
	ASSERT_EQ(fourth.size(), 1u);
	EXPECT_EQ(fourth[0].type, wml_change_type::text_deleted);
	EXPECT_EQ(fourth[0].old_text, "Te");
}

TEST(wml_scenario, FootnoteReferenceStaysEqual) {
	docx_content older;
	older.body = footnote_paragraph(" The original text that will change.");
	older.footnotes = FOOTNOTES;
	docx_content newer;
	newer.body = footnote_paragraph(" The modified text that is different.");
	newer.footnotes = FOOTNOTES;
	const auto result = wml_compare(make_docx(older), make_docx(newer), fixed_settings());

	pugi::xml_document doc;
	load_part(doc, result.document, "word/document.xml");
	const auto references = descendants_local(doc.document_element(), "footnoteReference");
	ASSERT_EQ(references.size(), 1u);
	EXPECT_FALSE(ancestor_local(references[0], "ins"));
	EXPECT_FALSE(ancestor_local(references[0], "del"));

	std::string deleted;
	std::string inserted;
	for (const auto& change : result.changes) {
		EXPECT_FALSE(change.in_footnote);
		if (change.type == wml_change_type::text_deleted) {
			deleted += change.old_text;
		} else if (change.type == wml_change_type::text_inserted) {
			inserted += change.new_text;
		}
	}
	EXPECT_NE(deleted.find("original"), std::string::npos);
	EXPECT_NE(inserted.find("modified"), std::string::npos);
	EXPECT_EQ(deleted.find("text"), std::string::npos);
}

TEST(wml_scenario, BoldToItalicIsAFormatChange) {
	docx_content older;
	older.body = wml_paragraph("Hello", "<w:b/>");
	docx_content newer;
	newer.body = wml_paragraph("Hello", "<w:i/>");
	auto settings = fixed_settings();
	settings.track_formatting_changes = true;
	const auto result = wml_compare(make_docx(older), make_docx(newer), settings);
	EXPECT_TRUE(of_type(result.changes, wml_change_type::text_inserted).empty());
	EXPECT_TRUE(of_type(result.changes, wml_change_type::text_deleted).empty());
	const auto formats = of_type(result.changes, wml_change_type::format_changed);
	ASSERT_EQ(formats.size(), 1u);
	EXPECT_NE(formats[0].before_rpr.find("<w:b/>"), std::string::npos);
	EXPECT_NE(formats[0].after_rpr.find("<w:i/>"), std::string::npos);
	EXPECT_EQ(result.format_changes, 1u);
}

TEST(wml_scenario, FormattingIgnoredWithoutTracking) {
	docx_content older;
	older.body = wml_paragraph("Hello", "<w:b/>");
	docx_content newer;
	newer.body = wml_paragraph("Hello", "<w:i/>");
	const auto result = wml_compare(make_docx(older), make_docx(newer), fixed_settings());
	EXPECT_TRUE(result.changes.empty());
}

TEST(wml_scenario, InsertedParagraphIsReported) {
	const auto result = wml_compare(make_paragraphs_docx({"Kept paragraph."}), make_paragraphs_docx({"Kept paragraph.", "Entirely new paragraph."}), fixed_settings());
	EXPECT_EQ(result.deletions, 0u);
	EXPECT_GE(result.insertions, 1u);
	EXPECT_FALSE(of_type(result.changes, wml_change_type::paragraph_inserted).empty());
}

TEST(wml_scenario, CaseInsensitiveIgnoresCapitalisation) {
	auto settings = fixed_settings();
	settings.case_insensitive = true;
	const auto result = wml_compare(make_paragraphs_docx({"Hello World"}), make_paragraphs_docx({"hello world"}), settings);
	EXPECT_TRUE(result.changes.empty());
}

TEST(wml_scenario, CaseFoldingAgreesAcrossStages) {
	auto settings = fixed_settings();
	settings.case_insensitive = true;
	const std::string upper = "\xC3\x84rger \xC3\x9C""ber Stra\xC3\x9F""e";
	const std::string lower = "\xC3\xA4rger \xC3\xBC""ber stra\xC3\x9F""e";
	const auto result = wml_compare(make_paragraphs_docx({upper}), make_paragraphs_docx({lower}), settings);
	EXPECT_EQ(result.changes.empty(), fold_case(upper) == fold_case(lower));
	EXPECT_EQ(fold_case(std::string("Hello")), "HELLO");
	for (const char32_t ch : utf8_to_u32(upper)) {
		EXPECT_EQ(u32_to_utf8(fold_case(ch)), fold_case(u32_to_utf8(ch)));
	}
}

TEST(wml_scenario, RevisionsRoundTripThroughGetRevisions) {
	const auto result = wml_compare(make_paragraphs_docx({"alpha beta"}), make_paragraphs_docx({"alpha gamma"}), fixed_settings());
	const auto revisions = wml_get_revisions(result.document);
	ASSERT_EQ(revisions.size(), result.changes.size());
	for (size_t i = 0; i < revisions.size(); ++i) {
		EXPECT_EQ(revisions[i].type, result.changes[i].type);
		EXPECT_EQ(revisions[i].revision_id, result.changes[i].revision_id);
	}
}

TEST(wml_scenario, InsertedTableRowIsMarkedOnTheRow) {
	const auto older = docx_with_table({{"Name", "Qty"}, {"Apples", "3"}});
	const auto newer = docx_with_table({{"Name", "Qty"}, {"Pears", "7"}, {"Apples", "3"}});
	const auto result = wml_compare(older, newer, fixed_settings());
	EXPECT_EQ(row_revisions(result.document, "ins"), 1u);
	EXPECT_EQ(row_revisions(result.document, "del"), 0u);
	const auto rows = of_type(result.changes, wml_change_type::table_row_inserted);
	ASSERT_EQ(rows.size(), 1u);
	EXPECT_TRUE(rows[0].in_table);
	ASSERT_TRUE(rows[0].table_row.has_value());
	EXPECT_EQ(*rows[0].table_row, 1u);
	EXPECT_TRUE(of_type(result.changes, wml_change_type::table_row_deleted).empty());
	EXPECT_EQ(wml_get_revisions(result.document).size(), result.changes.size());

	const auto accepted = wml_apply_revision_ids(result.document, revision_ids_of(result));
	EXPECT_EQ(paragraph_texts(accepted), paragraph_texts(newer));
	EXPECT_TRUE(wml_get_revisions(accepted).empty());
	const auto rejected = wml_revert_revision_ids(result.document, revision_ids_of(result));
	EXPECT_EQ(paragraph_texts(rejected), paragraph_texts(older));
	EXPECT_TRUE(wml_get_revisions(rejected).empty());
}

TEST(wml_scenario, DeletedTableRowRoundTrips) {
	const auto older = docx_with_table({{"Name", "Qty"}, {"Apples", "3"}, {"Pears", "7"}});
	const auto newer = docx_with_table({{"Name", "Qty"}, {"Pears", "7"}});
	const auto result = wml_compare(older, newer, fixed_settings());
	EXPECT_EQ(row_revisions(result.document, "del"), 1u);
	const auto rows = of_type(result.changes, wml_change_type::table_row_deleted);
	ASSERT_EQ(rows.size(), 1u);
	EXPECT_TRUE(of_type(result.changes, wml_change_type::table_row_inserted).empty());
	EXPECT_GE(result.deletions, 1u);
	EXPECT_EQ(paragraph_texts(wml_apply_revision_ids(result.document, revision_ids_of(result))), paragraph_texts(newer));
	EXPECT_EQ(paragraph_texts(wml_revert_revision_ids(result.document, revision_ids_of(result))), paragraph_texts(older));
}

TEST(wml_scenario, EditedCellReportsItsPosition) {
	const auto result = wml_compare(docx_with_table({{"Name", "Qty"}, {"Apples", "3"}}), docx_with_table({{"Name", "Qty"}, {"Apples", "5"}}), fixed_settings());
	EXPECT_EQ(row_revisions(result.document, "ins"), 0u);
	EXPECT_EQ(row_revisions(result.document, "del"), 0u);
	const auto deleted = of_type(result.changes, wml_change_type::text_deleted);
	const auto inserted = of_type(result.changes, wml_change_type::text_inserted);
	ASSERT_EQ(deleted.size(), 1u);
	ASSERT_EQ(inserted.size(), 1u);
	EXPECT_EQ(deleted[0].old_text, "3");
	EXPECT_EQ(inserted[0].new_text, "5");
	for (const auto& change : {deleted[0], inserted[0]}) {
		EXPECT_TRUE(change.in_table);
		ASSERT_TRUE(change.table_row.has_value());
		ASSERT_TRUE(change.table_cell.has_value());
		EXPECT_EQ(*change.table_row, 1u);
		EXPECT_EQ(*change.table_cell, 1u);
	}
	for (const auto& change : result.changes) {
		EXPECT_TRUE(change.in_table);
	}
}

TEST(wml_scenario, MergedCellsWithSameShapeCompareRowByRow) {
	const auto result = wml_compare(docx_with_table({{"Apples", "3"}}, "Inventory"), docx_with_table({{"Apples", "5"}}, "Inventory"), fixed_settings());
	EXPECT_TRUE(of_type(result.changes, wml_change_type::table_row_inserted).empty());
	EXPECT_TRUE(of_type(result.changes, wml_change_type::table_row_deleted).empty());
	const auto deleted = of_type(result.changes, wml_change_type::text_deleted);
	ASSERT_EQ(deleted.size(), 1u);
	EXPECT_EQ(deleted[0].old_text, "3");
	ASSERT_TRUE(deleted[0].table_row.has_value());
	EXPECT_EQ(*deleted[0].table_row, 1u);
}

TEST(wml_scenario, MergedCellsWithNewShapeReplaceTheTable) {
	const auto older = docx_with_table({{"Apples", "3"}}, "Inventory");
	const auto newer = docx_with_table({{"Apples", "3"}, {"Pears", "7"}}, "Inventory");
	const auto result = wml_compare(older, newer, fixed_settings());
	EXPECT_EQ(of_type(result.changes, wml_change_type::table_row_deleted).size(), 2u);
	EXPECT_EQ(of_type(result.changes, wml_change_type::table_row_inserted).size(), 3u);
	EXPECT_EQ(row_revisions(result.document, "del"), 2u);
	EXPECT_EQ(row_revisions(result.document, "ins"), 3u);
	EXPECT_EQ(paragraph_texts(wml_apply_revision_ids(result.document, revision_ids_of(result))), paragraph_texts(newer));
	EXPECT_EQ(paragraph_texts(wml_revert_revision_ids(result.document, revision_ids_of(result))), paragraph_texts(older));
}

TEST(wml_scenario, TextboxEditIsFlagged) {
	docx_content older;
	older.body = wml_paragraph("Report body.") + textbox_paragraph("Status: draft pending");
	docx_content newer;
	newer.body = wml_paragraph("Report body.") + textbox_paragraph("Status: final pending");
	const auto result = wml_compare(make_docx(older), make_docx(newer), fixed_settings());
	std::string deleted;
	std::string inserted;
	for (const auto& change : result.changes) {
		if (change.type == wml_change_type::text_deleted) {
			EXPECT_TRUE(change.in_textbox);
			deleted += change.old_text;
		} else if (change.type == wml_change_type::text_inserted) {
			EXPECT_TRUE(change.in_textbox);
			inserted += change.new_text;
		}
		EXPECT_FALSE(change.in_table);
	}
	EXPECT_NE(deleted.find("draft"), std::string::npos);
	EXPECT_NE(inserted.find("final"), std::string::npos);

	pugi::xml_document doc;
	load_part(doc, result.document, "word/document.xml");
	const auto box = first_descendant_local(doc.document_element(), "txbxContent");
	ASSERT_TRUE(box);
	EXPECT_TRUE(first_descendant_local(box, "ins"));
	EXPECT_TRUE(first_descendant_local(box, "del"));

	const auto accepted = wml_apply_revision_ids(result.document, revision_ids_of(result));
	load_part(doc, accepted, "word/document.xml");
	EXPECT_NE(descendant_text(doc.document_element(), "t").find("Status: final pending"), std::string::npos);
	EXPECT_EQ(descendant_text(doc.document_element(), "t").find("draft"), std::string::npos);
}

TEST(wml_scenario, EndnotesArePairedById) {
	docx_content older;
	older.body = ENDNOTE_BODY;
	older.endnotes = ENDNOTE_SEPARATORS + endnote("1", "The endnote cites the first edition.") + endnote("2", "A stable endnote.");
	docx_content newer;
	newer.body = ENDNOTE_BODY;
	// Reordered in the part, so pairing by position would compare different notes.
	newer.endnotes = ENDNOTE_SEPARATORS + endnote("2", "A stable endnote.") + endnote("1", "The endnote cites the second edition.");
	const auto result = wml_compare(make_docx(older), make_docx(newer), fixed_settings());
	std::string deleted;
	std::string inserted;
	for (const auto& change : result.changes) {
		EXPECT_TRUE(change.in_endnote);
		EXPECT_FALSE(change.in_footnote);
		if (change.type == wml_change_type::text_deleted) {
			deleted += change.old_text;
		} else if (change.type == wml_change_type::text_inserted) {
			inserted += change.new_text;
		}
	}
	EXPECT_EQ(deleted, "first");
	EXPECT_EQ(inserted, "second");

	pugi::xml_document doc;
	load_part(doc, result.document, "word/endnotes.xml");
	bool saw_stable{false};
	for (auto note : children_local(doc.document_element(), "endnote")) {
		if (attribute_local(note, "id") == "2") {
			saw_stable = true;
			EXPECT_EQ(descendant_text(note, "t"), "A stable endnote.");
			EXPECT_FALSE(first_descendant_local(note, "ins"));
			EXPECT_FALSE(first_descendant_local(note, "del"));
		}
	}
	EXPECT_TRUE(saw_stable);
	EXPECT_EQ(wml_get_revisions(result.document).size(), result.changes.size());
}

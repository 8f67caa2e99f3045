/* wml_property_tests.cpp - invariants of word-processing comparison output.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "test_documents.hpp"
#include "wml_comparer.hpp"
#include "wml_markup.hpp"
#include "xml_utils.hpp"
#include <algorithm>
#include <gtest/gtest.h>
#include <set>
#include <string>
#include <vector>

namespace {
wml_comparer_settings fixed_settings() {
	wml_comparer_settings settings;
	settings.author = "Reviewer";
	settings.date_time = "2025-01-01T00:00:00Z";
	settings.track_formatting_changes = true;
	return settings;
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

std::set<int> all_revision_ids(const wml_comparison_result& result) {
	std::set<int> ids;
	for (const auto& change : result.changes) {
		ids.insert(change.revision_id);
	}
	return ids;
}

const std::vector<std::string> OLD_TEXT{"Shared opening line.", "The committee approved the proposal on Monday.", "This paragraph is removed."};
const std::vector<std::string> NEW_TEXT{"Shared opening line.", "The board rejected the proposal on Friday.", "A closing paragraph appears."};
} // namespace

TEST(wml_property, ComparingADocumentWithItselfFindsNothing) {
	docx_content content;
	content.body = wml_paragraph("Plain text.") + wml_paragraph("Bold text.", "<w:b/>") + R"(<w:tbl><w:tblPr><w:tblW w:w="0" w:type="auto"/></w:tblPr><w:tblGrid><w:gridCol w:w="2000"/></w:tblGrid><w:tr><w:tc>)" + wml_paragraph("cell") + "</w:tc></w:tr></w:tbl>";
	const std::string document = make_docx(content);
	const auto result = wml_compare(document, document, fixed_settings());
	EXPECT_TRUE(result.changes.empty());
	EXPECT_EQ(result.correlated.inserted, 0u);
	EXPECT_EQ(result.correlated.deleted, 0u);
	EXPECT_EQ(result.correlated.format_changed, 0u);
	EXPECT_EQ(paragraph_texts(result.document), paragraph_texts(document));
	EXPECT_TRUE(wml_get_revisions(result.document).empty());
}

TEST(wml_property, CoalescedAtomCountMatchesCorrelation) {
	const auto result = wml_compare(make_paragraphs_docx(OLD_TEXT), make_paragraphs_docx(NEW_TEXT), fixed_settings());
	EXPECT_GT(result.correlated.total(), 0u);
	EXPECT_EQ(result.coalesced.total(), result.correlated.total());
	EXPECT_EQ(result.coalesced.equal, result.correlated.equal);
	EXPECT_EQ(result.coalesced.inserted, result.correlated.inserted);
	EXPECT_EQ(result.coalesced.deleted, result.correlated.deleted);
	EXPECT_EQ(result.coalesced.format_changed, result.correlated.format_changed);
}

TEST(wml_property, PropertiesComeFirstInSchemaOrder) {
	docx_content older;
	older.body = R"(<w:p><w:pPr><w:jc w:val="center"/><w:pStyle w:val="Heading1"/></w:pPr><w:r><w:rPr><w:sz w:val="28"/><w:b/></w:rPr><w:t>Title here</w:t></w:r></w:p>)" + wml_paragraph("Body text");
	docx_content newer;
	newer.body = R"(<w:p><w:pPr><w:jc w:val="left"/><w:pStyle w:val="Heading1"/></w:pPr><w:r><w:rPr><w:sz w:val="28"/><w:i/></w:rPr><w:t>Title there</w:t></w:r></w:p>)" + wml_paragraph("Body text changed");
	const auto result = wml_compare(make_docx(older), make_docx(newer), fixed_settings());
	pugi::xml_document doc;
	load_part(doc, result.document, "word/document.xml");
	const std::vector<std::pair<const char*, const char*>> containers{{"p", "pPr"}, {"r", "rPr"}, {"tbl", "tblPr"}, {"tr", "trPr"}, {"tc", "tcPr"}};
	for (const auto& [container, properties] : containers) {
		for (auto node : descendants_local(doc.document_element(), container)) {
			const auto props = first_child_local(node, properties);
			if (props) {
				EXPECT_EQ(element_children(node).front(), props) << container;
			}
		}
	}
	for (auto p_pr : descendants_local(doc.document_element(), "pPr")) {
		const auto style = first_child_local(p_pr, "pStyle");
		const auto jc = first_child_local(p_pr, "jc");
		if (style && jc) {
			const auto children = element_children(p_pr);
			EXPECT_LT(std::find(children.begin(), children.end(), style), std::find(children.begin(), children.end(), jc));
		}
	}
}

TEST(wml_property, RevisionIdsAreUnique) {
	const auto result = wml_compare(make_paragraphs_docx(OLD_TEXT), make_paragraphs_docx(NEW_TEXT), fixed_settings());
	pugi::xml_document doc;
	load_part(doc, result.document, "word/document.xml");
	std::set<int> seen;
	size_t revisions = 0;
	std::vector<pugi::xml_node> stack{doc.document_element()};
	while (!stack.empty()) {
		const auto node = stack.back();
		stack.pop_back();
		if (is_revision_element(node)) {
			++revisions;
			EXPECT_TRUE(seen.insert(node.attribute("w:id").as_int(-1)).second) << node.name();
		}
		for (auto child : element_children(node)) {
			stack.push_back(child);
		}
	}
	EXPECT_GT(revisions, 0u);
}

TEST(wml_property, StartingRevisionIdSeedsNumbering) {
	auto settings = fixed_settings();
	settings.starting_revision_id = 100;
	const auto result = wml_compare(make_paragraphs_docx({"one"}), make_paragraphs_docx({"two"}), settings);
	ASSERT_FALSE(result.changes.empty());
	for (const auto& change : result.changes) {
		EXPECT_GE(change.revision_id, 100);
	}
}

TEST(wml_property, SameImageThroughDifferentRelationshipsIsEqual) {
	const std::string image_bytes = "\x89PNG\r\n\x1a\nfake image payload";
	docx_content older;
	older.body = wml_paragraph("Caption") + wml_picture_paragraph("rIdImage1");
	older.images = {{"rIdImage1", "media/image1.png", image_bytes}};
	docx_content newer;
	newer.body = wml_paragraph("Caption") + wml_picture_paragraph("rIdOther7");
	newer.images = {{"rIdOther7", "media/picture.png", image_bytes}};
	const auto result = wml_compare(make_docx(older), make_docx(newer), fixed_settings());
	for (const auto& change : result.changes) {
		EXPECT_NE(change.type, wml_change_type::image_inserted);
		EXPECT_NE(change.type, wml_change_type::image_deleted);
	}
	EXPECT_EQ(result.correlated.inserted, 0u);
	EXPECT_EQ(result.correlated.deleted, 0u);
}

TEST(wml_property, DifferentImageBytesAreReplaced) {
	docx_content older;
	older.body = wml_picture_paragraph("rId5");
	older.images = {{"rId5", "media/image1.png", "first picture"}};
	docx_content newer;
	newer.body = wml_picture_paragraph("rId5");
	newer.images = {{"rId5", "media/image1.png", "second picture"}};
	const auto result = wml_compare(make_docx(older), make_docx(newer), fixed_settings());
	EXPECT_GT(result.correlated.inserted, 0u);
	EXPECT_GT(result.correlated.deleted, 0u);
}

TEST(wml_property, AcceptingEveryRevisionYieldsTheNewerText) {
	const auto result = wml_compare(make_paragraphs_docx(OLD_TEXT), make_paragraphs_docx(NEW_TEXT), fixed_settings());
	const auto accepted = wml_apply_revision_ids(result.document, all_revision_ids(result));
	EXPECT_EQ(paragraph_texts(accepted), NEW_TEXT);
	EXPECT_TRUE(wml_get_revisions(accepted).empty());
}

TEST(wml_property, RejectingEveryRevisionRestoresTheOlderText) {
	const auto result = wml_compare(make_paragraphs_docx(OLD_TEXT), make_paragraphs_docx(NEW_TEXT), fixed_settings());
	const auto reverted = wml_revert_revision_ids(result.document, all_revision_ids(result));
	std::vector<std::string> texts;
	pugi::xml_document doc;
	load_part(doc, reverted, "word/document.xml");
	for (auto p : descendants_local(doc.document_element(), "p")) {
		texts.push_back(descendant_text(p, "t"));
	}
	EXPECT_EQ(texts, OLD_TEXT);
}

TEST(wml_property, PartialAcceptanceLeavesOtherRevisions) {
	const auto result = wml_compare(make_paragraphs_docx(OLD_TEXT), make_paragraphs_docx(NEW_TEXT), fixed_settings());
	ASSERT_GE(result.changes.size(), 2u);
	const int first = result.changes.front().revision_id;
	const auto accepted = wml_apply_revision_ids(result.document, {first});
	const auto remaining = wml_get_revisions(accepted);
	EXPECT_EQ(remaining.size(), result.changes.size() - 1);
	for (const auto& change : remaining) {
		EXPECT_NE(change.revision_id, first);
	}
}

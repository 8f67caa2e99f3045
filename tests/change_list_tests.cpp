/* change_list_tests.cpp - change extraction and reviewer pane item tests.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "pml_change_list.hpp"
#include "wml_change_extractor.hpp"
#include "wml_change_list.hpp"
#include "xml_utils.hpp"
#include <gtest/gtest.h>

namespace {
constexpr const char* REVISED_BODY = R"(<w:document xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main"><w:body>)"
	R"(<w:p><w:r><w:t xml:space="preserve">The </w:t></w:r>)"
	R"(<w:del w:id="1" w:author="Ann" w:date="2025-01-01T00:00:00Z"><w:r><w:delText>lazy dog</w:delText></w:r></w:del>)"
	R"(<w:ins w:id="2" w:author="Ann" w:date="2025-01-01T00:00:00Z"><w:r><w:t>active cat</w:t></w:r></w:ins></w:p>)"
	R"(<w:p><w:ins w:id="3"><w:r><w:t>added</w:t></w:r></w:ins></w:p>)"
	R"(</w:body></w:document>)";

wml_change text_change(wml_change_type type, int revision_id, size_t paragraph, const std::string& text) {
	wml_change change;
	change.type = type;
	change.revision_id = revision_id;
	change.paragraph_index = paragraph;
	if (type == wml_change_type::text_deleted) {
		change.old_text = text;
	} else {
		change.new_text = text;
	}
	return change;
}

pml_change shape_change(pml_change_type type, int slide, const std::string& shape) {
	pml_change change;
	change.type = type;
	change.slide_index = slide;
	change.shape_name = shape;
	change.shape_id = "7";
	return change;
}
} // namespace

TEST(wml_change_extractor, ReadsRevisionsInDocumentOrder) {
	pugi::xml_document doc;
	load_xml(doc, REVISED_BODY, "word/document.xml");
	const auto changes = wml_extract_changes(doc.document_element(), "Reviewer", "2024-06-01T00:00:00Z");
	ASSERT_EQ(changes.size(), 3u);
	EXPECT_EQ(changes[0].type, wml_change_type::text_deleted);
	EXPECT_EQ(changes[0].old_text, "lazy dog");
	EXPECT_EQ(changes[0].word_count.deleted, 2u);
	EXPECT_EQ(changes[0].author, "Ann");
	EXPECT_EQ(changes[1].type, wml_change_type::text_inserted);
	EXPECT_EQ(changes[1].new_text, "active cat");
	EXPECT_EQ(changes[1].paragraph_index, 1u);
	EXPECT_EQ(changes[2].paragraph_index, 2u);
	EXPECT_EQ(changes[2].author, "Reviewer");
	EXPECT_EQ(changes[2].date, "2024-06-01T00:00:00Z");
}

TEST(wml_change_extractor, CountsWords) {
	EXPECT_EQ(count_words(""), 0u);
	EXPECT_EQ(count_words("  one   two\tthree "), 3u);
}

TEST(wml_change_list, AdjacentDeleteAndInsertBecomeAReplacement) {
	const std::vector<wml_change> changes{text_change(wml_change_type::text_deleted, 1, 1, "lazy dog"), text_change(wml_change_type::text_inserted, 2, 1, "active cat")};
	const auto items = wml_build_change_list(changes);
	ASSERT_EQ(items.size(), 1u);
	EXPECT_EQ(items[0].id, "change-1");
	EXPECT_EQ(items[0].type, wml_change_type::text_replaced);
	EXPECT_EQ(items[0].summary, "Replaced");
	EXPECT_EQ(items[0].preview_text, "lazy dog → active cat");
	EXPECT_EQ(items[0].revision_ids, (std::vector<int>{1, 2}));
	EXPECT_EQ(items[0].details.old_text, "lazy dog");
	EXPECT_EQ(items[0].details.new_text, "active cat");
	EXPECT_EQ(items[0].anchor, "revision-1");
}

TEST(wml_change_list, ReplacementsStayApartWhenMergingIsOff) {
	const std::vector<wml_change> changes{text_change(wml_change_type::text_deleted, 1, 1, "a"), text_change(wml_change_type::text_inserted, 2, 1, "b")};
	wml_change_list_options options;
	options.merge_replacements = false;
	const auto items = wml_build_change_list(changes, options);
	ASSERT_EQ(items.size(), 2u);
	EXPECT_EQ(items[1].id, "change-2");
	EXPECT_EQ(items[1].summary, "Inserted");
}

TEST(wml_change_list, DeleteAndInsertInDifferentParagraphsStayApart) {
	const std::vector<wml_change> changes{text_change(wml_change_type::text_deleted, 1, 1, "a"), text_change(wml_change_type::text_inserted, 2, 2, "b")};
	EXPECT_EQ(wml_build_change_list(changes).size(), 2u);
}

TEST(wml_change_list, FormatChangesInOneParagraphAreGrouped) {
	std::vector<wml_change> changes;
	for (int id = 1; id <= 3; ++id) {
		auto change = text_change(wml_change_type::format_changed, id, 4, "bold");
		change.format_description = "Bold";
		changes.push_back(change);
	}
	const auto items = wml_build_change_list(changes);
	ASSERT_EQ(items.size(), 1u);
	EXPECT_EQ(items[0].summary, "Format changed (3 revisions)");
	EXPECT_EQ(items[0].revision_ids, (std::vector<int>{1, 2, 3}));
	EXPECT_EQ(items[0].details.format_description, "Bold");
}

TEST(wml_change_list, PreviewIsTruncated) {
	wml_change_list_options options;
	options.max_preview_length = 10;
	const auto items = wml_build_change_list({text_change(wml_change_type::text_inserted, 1, 1, "a rather long inserted sentence")}, options);
	ASSERT_EQ(items.size(), 1u);
	EXPECT_LT(items[0].preview_text.size(), std::string("a rather long inserted sentence").size());
}

TEST(wml_change_list, LocationContextNamesContainers) {
	wml_change change;
	change.in_footnote = true;
	change.in_table = true;
	EXPECT_EQ(wml_location_context(change), "In footnote, In table");
	EXPECT_EQ(wml_location_context(wml_change{}), "");
}

TEST(pml_change_list, ChangesToOneShapeAreFolded) {
	const std::vector<pml_change> changes{shape_change(pml_change_type::shape_moved, 2, "Title 1"), shape_change(pml_change_type::text_changed, 2, "Title 1")};
	const auto items = pml_build_change_list(changes);
	ASSERT_EQ(items.size(), 1u);
	EXPECT_EQ(items[0].summary, "2 changes in 'Title 1' on slide 2");
	EXPECT_EQ(items[0].count, 2u);
	EXPECT_EQ(items[0].anchor, "slide-2-shape-7");
	EXPECT_FALSE(items[0].details);
}

TEST(pml_change_list, SlideChangesAreNeverFolded) {
	pml_change inserted;
	inserted.type = pml_change_type::slide_inserted;
	inserted.slide_index = 3;
	const std::vector<pml_change> changes{inserted, shape_change(pml_change_type::shape_inserted, 3, "Box"), shape_change(pml_change_type::text_changed, 4, "Box")};
	const auto items = pml_build_change_list(changes);
	ASSERT_EQ(items.size(), 3u);
	EXPECT_EQ(items[0].summary, "Slide 3 inserted");
	EXPECT_EQ(items[0].anchor, "slide-3");
	EXPECT_EQ(items[2].id, "change-3");
	ASSERT_TRUE(items[2].details);
	EXPECT_EQ(items[2].details->type, pml_change_type::text_changed);
}

TEST(pml_change_list, GroupingCanBeDisabled) {
	pml_change_list_options options;
	options.group_by_slide = false;
	const std::vector<pml_change> changes{shape_change(pml_change_type::shape_moved, 1, "A"), shape_change(pml_change_type::shape_resized, 1, "A")};
	EXPECT_EQ(pml_build_change_list(changes, options).size(), 2u);
}

TEST(pml_change_list, PresentationWideChangesHaveNoAnchor) {
	pml_change change;
	change.type = pml_change_type::slide_size_changed;
	change.new_value = "12192000x6858000";
	const auto items = pml_build_change_list({change});
	ASSERT_EQ(items.size(), 1u);
	EXPECT_FALSE(items[0].anchor);
	EXPECT_EQ(items[0].preview, "12192000x6858000");
}

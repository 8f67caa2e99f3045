/* pml_tests.cpp - presentation matching, comparison, patch and markup tests.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "package.hpp"
#include "pml_canonicalize.hpp"
#include "pml_comparer.hpp"
#include "pml_markup.hpp"
#include "pml_patch.hpp"
#include "pml_shape_match.hpp"
#include "pml_slide_match.hpp"
#include "test_documents.hpp"
#include <algorithm>
#include <gtest/gtest.h>

namespace {
test_shape title(const std::string& text) {
	test_shape shape;
	shape.id = 2;
	shape.name = "Title 1";
	shape.text = text;
	shape.placeholder = "title";
	return shape;
}

test_shape body(const std::string& text, unsigned id = 3, const std::string& name = "Content 2") {
	test_shape shape;
	shape.id = id;
	shape.name = name;
	shape.text = text;
	shape.y = 1600200;
	shape.cy = 4525963;
	return shape;
}

std::string shape_text(const std::string& presentation, int slide, const std::string& name) {
	const auto signature = pml_canonicalize(package::open(presentation), {});
	const auto& shapes = signature.slides.at(static_cast<size_t>(slide - 1)).shapes;
	for (const auto& shape : shapes) {
		if (shape.name == name) {
			return shape.plain_text();
		}
	}
	return "<no shape>";
}

const pml_comparer_settings defaults;
} // namespace

TEST(pml_compare, RetitledSlideIsATextChange) {
	const auto older = make_pptx({{title("Agenda"), body("First")}, {title("Intro"), body("Second")}, {title("Close"), body("Third")}});
	const auto newer = make_pptx({{title("Agenda"), body("First")}, {title("Welcome"), body("Second")}, {title("Close"), body("Third")}});
	const auto result = pml_compute_changes(older, newer, defaults);
	ASSERT_EQ(result.total_changes(), 1u);
	const auto& change = result.changes[0];
	EXPECT_EQ(change.type, pml_change_type::text_changed);
	EXPECT_EQ(change.slide_index, 2);
	EXPECT_EQ(change.shape_name, "Title 1");
	EXPECT_EQ(change.old_value, "Intro");
	EXPECT_EQ(change.new_value, "Welcome");
	EXPECT_EQ(result.slides_inserted(), 0u);
	EXPECT_EQ(result.slides_deleted(), 0u);
}

TEST(pml_compare, IdenticalPresentationsHaveNoChanges) {
	const auto presentation = make_pptx({{title("One"), body("Alpha\nBeta")}, {title("Two")}});
	EXPECT_EQ(pml_compute_changes(presentation, presentation, defaults).total_changes(), 0u);
}

TEST(pml_compare, InsertedSlide) {
	const auto older = make_pptx({{title("Start")}, {title("End")}});
	const auto newer = make_pptx({{title("Start")}, {title("Middle"), body("New material")}, {title("End")}});
	const auto result = pml_compute_changes(older, newer, defaults);
	ASSERT_EQ(result.slides_inserted(), 1u);
	EXPECT_EQ(result.count(pml_change_type::slide_moved), 0u);
	const auto it = std::find_if(result.changes.begin(), result.changes.end(), [](const pml_change& change) {
		return change.type == pml_change_type::slide_inserted;
	});
	EXPECT_EQ(it->slide_index, 2);
	EXPECT_EQ(it->description(), "Slide 2 inserted");
}

TEST(pml_compare, DeletedSlide) {
	const auto older = make_pptx({{title("Start")}, {title("Gone"), body("Old material")}, {title("End")}});
	const auto newer = make_pptx({{title("Start")}, {title("End")}});
	const auto result = pml_compute_changes(older, newer, defaults);
	ASSERT_EQ(result.slides_deleted(), 1u);
	EXPECT_EQ(result.count(pml_change_type::slide_moved), 0u);
}

TEST(pml_compare, ReorderedSlideIsMoved) {
	const auto older = make_pptx({{title("A")}, {title("B")}, {title("C")}});
	const auto newer = make_pptx({{title("C")}, {title("A")}, {title("B")}});
	const auto result = pml_compute_changes(older, newer, defaults);
	ASSERT_EQ(result.count(pml_change_type::slide_moved), 1u);
	const auto it = std::find_if(result.changes.begin(), result.changes.end(), [](const pml_change& change) {
		return change.type == pml_change_type::slide_moved;
	});
	EXPECT_EQ(it->slide_index, 1);
	EXPECT_EQ(it->old_slide_index, 3);
}

TEST(pml_compare, MovedShapeOutsideTolerance) {
	auto moved = body("Text");
	moved.x += 1000000;
	const auto result = pml_compute_changes(make_pptx({{title("T"), body("Text")}}), make_pptx({{title("T"), moved}}), defaults);
	ASSERT_EQ(result.total_changes(), 1u);
	EXPECT_EQ(result.changes[0].type, pml_change_type::shape_moved);
	EXPECT_EQ(result.changes[0].new_x, moved.x);
}

TEST(pml_compare, SmallShiftWithinToleranceIsIgnored) {
	auto nudged = body("Text");
	nudged.x += 1000;
	EXPECT_EQ(pml_compute_changes(make_pptx({{title("T"), body("Text")}}), make_pptx({{title("T"), nudged}}), defaults).total_changes(), 0u);
}

TEST(pml_compare, InsertedShape) {
	const auto result = pml_compute_changes(make_pptx({{title("T")}}), make_pptx({{title("T"), body("Added", 4, "TextBox 3")}}), defaults);
	ASSERT_EQ(result.shapes_inserted(), 1u);
	EXPECT_EQ(result.changes[0].shape_name, "TextBox 3");
}

TEST(pml_match, WordSimilarityIgnoresCase) {
	EXPECT_DOUBLE_EQ(pml_word_similarity("Quarterly results", "quarterly Results"), 1.0);
	EXPECT_DOUBLE_EQ(pml_word_similarity("a b", "b c"), 1.0 / 3.0);
	EXPECT_DOUBLE_EQ(pml_word_similarity("", "words"), 0.0);
}

TEST(pml_match, SlidesMatchByTitleFirst) {
	const auto older = pml_canonicalize(package::open(make_pptx({{title("A")}, {title("B")}})), defaults);
	const auto newer = pml_canonicalize(package::open(make_pptx({{title("B")}, {title("A")}})), defaults);
	const auto matches = pml_match_slides(older, newer, defaults);
	ASSERT_EQ(matches.size(), 2u);
	for (const auto& match : matches) {
		ASSERT_EQ(match.kind, pml_slide_match_kind::matched);
		EXPECT_EQ(match.old_slide->title_text, match.new_slide->title_text);
	}
	EXPECT_EQ(matches[0].new_slide->index, 1);
}

TEST(pml_match, PlaceholderMatchSurvivesRename) {
	auto renamed = title("Same");
	renamed.name = "Heading";
	const auto older = pml_canonicalize(package::open(make_pptx({{title("Same")}})), defaults);
	const auto newer = pml_canonicalize(package::open(make_pptx({{renamed}})), defaults);
	const auto matches = pml_match_shapes(older.slides[0], newer.slides[0], defaults);
	ASSERT_EQ(matches.size(), 1u);
	EXPECT_EQ(matches[0].kind, pml_shape_match_kind::matched);
	EXPECT_EQ(matches[0].method, pml_shape_match_method::placeholder);
}

TEST(pml_patch, ApplyAndRevertText) {
	const auto older = make_pptx({{title("Intro"), body("Old body")}});
	const auto newer = make_pptx({{title("Welcome"), body("New body")}});
	const auto result = pml_compute_changes(older, newer, defaults);
	ASSERT_EQ(result.text_changes(), 2u);
	const auto applied = pml_apply_changes(older, result.changes);
	EXPECT_EQ(shape_text(applied, 1, "Title 1"), "Welcome");
	EXPECT_EQ(shape_text(applied, 1, "Content 2"), "New body");
	const auto reverted = pml_revert_changes(applied, result.changes);
	EXPECT_EQ(shape_text(reverted, 1, "Title 1"), "Intro");
	EXPECT_EQ(pml_compute_changes(reverted, older, defaults).total_changes(), 0u);
}

TEST(pml_patch, InverseSwapsGeometry) {
	pml_change change;
	change.type = pml_change_type::shape_moved;
	change.old_x = 1;
	change.new_x = 2;
	const auto inverse = pml_invert_change(change);
	EXPECT_EQ(inverse.old_x, 2);
	EXPECT_EQ(inverse.new_x, 1);
}

TEST(pml_markup, LabelsChangesAndAppendsSummary) {
	const auto older = make_pptx({{title("Agenda")}, {title("Intro")}});
	const auto newer = make_pptx({{title("Agenda")}, {title("Welcome")}});
	const auto output = pml_compare(older, newer, defaults);
	ASSERT_EQ(output.result.total_changes(), 1u);
	const auto pkg = package::open(output.document);
	const auto slides = pml_slide_parts(pkg);
	ASSERT_EQ(slides.size(), 3u);
	EXPECT_NE(read_part(output.document, slides[1]).find("TEXT CHANGED"), std::string::npos);
	EXPECT_EQ(read_part(output.document, slides[0]).find("ChangeLabel_"), std::string::npos);
	const std::string summary = read_part(output.document, slides[2]);
	EXPECT_NE(summary.find(PML_SUMMARY_TITLE), std::string::npos);
	EXPECT_NE(summary.find("Total Changes: 1"), std::string::npos);
	EXPECT_FALSE(pkg.get_relationships(slides[2]).empty());
}

TEST(pml_markup, SummarySlideCanBeDisabled) {
	pml_comparer_settings settings;
	settings.add_summary_slide = false;
	const auto output = pml_compare(make_pptx({{title("Intro")}}), make_pptx({{title("Welcome")}}), settings);
	EXPECT_EQ(pml_slide_parts(package::open(output.document)).size(), 1u);
}

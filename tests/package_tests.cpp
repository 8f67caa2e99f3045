/* package_tests.cpp - package container tests.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "compare_exception.hpp"
#include "package.hpp"
#include "test_documents.hpp"
#include <functional>
#include <gtest/gtest.h>
#include <wx/filefn.h>
#include <wx/filename.h>

namespace {
package minimal_package() {
	package pkg;
	pkg.put_part("[Content_Types].xml", R"(<?xml version="1.0"?><Types xmlns="http://schemas.openxmlformats.org/package/2006/content-types"><Default Extension="xml" ContentType="application/xml"/></Types>)");
	pkg.put_part("b.xml", "<b/>");
	pkg.put_part("a.xml", "<a/>");
	return pkg;
}

error_kind kind_of(const std::function<void()>& action) {
	try {
		action();
	} catch (const compare_exception& e) {
		return e.get_kind();
	}
	return error_kind::internal;
}
} // namespace

TEST(package, RoundTripPreservesPartsAndOrder) {
	const auto reopened = package::open(minimal_package().save());
	ASSERT_EQ(reopened.part_names().size(), 3u);
	EXPECT_EQ(reopened.part_names()[1], "b.xml");
	EXPECT_EQ(reopened.part_names()[2], "a.xml");
	ASSERT_NE(reopened.get_part("a.xml"), nullptr);
	EXPECT_EQ(*reopened.get_part("a.xml"), "<a/>");
	EXPECT_EQ(reopened.get_part("missing.xml"), nullptr);
}

TEST(package, GarbageIsAPackageError) {
	EXPECT_EQ(kind_of([] { (void)package::open("definitely not a zip"); }), error_kind::package);
	EXPECT_EQ(kind_of([] { (void)package::open(""); }), error_kind::package);
}

TEST(package, ContentTypesAreRequired) {
	package pkg;
	pkg.put_part("word/document.xml", "<w/>");
	const std::string bytes = pkg.save();
	EXPECT_EQ(kind_of([&] { (void)package::open(bytes); }), error_kind::package);
}

TEST(package, XmlPartErrorsCarryTheirKind) {
	auto pkg = minimal_package();
	pkg.put_part("broken.xml", "<open>");
	EXPECT_EQ(kind_of([&] { (void)pkg.get_xml_part("nowhere.xml"); }), error_kind::missing_part);
	EXPECT_EQ(kind_of([&] { (void)pkg.get_xml_part("broken.xml"); }), error_kind::xml_parse);
	EXPECT_EQ(pkg.try_get_xml_part("broken.xml"), nullptr);
}

TEST(package, RemovedPartsAreGone) {
	auto pkg = minimal_package();
	pkg.remove_part("a.xml");
	EXPECT_FALSE(pkg.has_part("a.xml"));
	EXPECT_FALSE(package::open(pkg.save()).has_part("a.xml"));
}

TEST(package, RelationshipPaths) {
	EXPECT_EQ(package::relationships_path("word/document.xml"), "word/_rels/document.xml.rels");
	EXPECT_EQ(package::relationships_path(""), "_rels/.rels");
	EXPECT_EQ(package::relationships_path("/root.xml"), "_rels/root.xml.rels");
}

TEST(package, ResolvesRelativeAbsoluteAndEncodedTargets) {
	EXPECT_EQ(package::resolve_target("word/document.xml", "media/image1.png"), "word/media/image1.png");
	EXPECT_EQ(package::resolve_target("ppt/slides/slide1.xml", "../slideLayouts/slideLayout1.xml"), "ppt/slideLayouts/slideLayout1.xml");
	EXPECT_EQ(package::resolve_target("xl/workbook.xml", "/xl/worksheets/sheet1.xml"), "xl/worksheets/sheet1.xml");
	EXPECT_EQ(package::resolve_target("word/document.xml", "media/my%20image.png"), "word/media/my image.png");
}

TEST(package, AddedRelationshipsGetFreshIds) {
	auto pkg = minimal_package();
	const auto first = pkg.add_relationship("a.xml", "urn:test", "b.xml");
	const auto second = pkg.add_relationship("a.xml", "urn:test", "c.xml");
	EXPECT_EQ(first, "rId1");
	EXPECT_EQ(second, "rId2");
	const auto* rel = pkg.find_relationship("a.xml", "rId2");
	ASSERT_NE(rel, nullptr);
	EXPECT_EQ(rel->target, "c.xml");
	EXPECT_EQ(pkg.get_relationships("a.xml").size(), 2u);
}

TEST(package, ContentTypeOverridesWinOverDefaults) {
	auto pkg = minimal_package();
	EXPECT_EQ(pkg.content_type("a.xml"), "application/xml");
	pkg.add_content_type_override("a.xml", "application/test+xml");
	EXPECT_EQ(pkg.content_type("/a.xml"), "application/test+xml");
	EXPECT_EQ(pkg.content_type("image.png"), "");
}

TEST(package, GeneratedDocumentsOpen) {
	const auto pkg = package::open(make_paragraphs_docx({"hello"}));
	EXPECT_TRUE(pkg.has_part("word/document.xml"));
	EXPECT_EQ(pkg.get_relationships("").size(), 1u);
}

TEST(package, SavesAndOpensFiles) {
	const wxString path = wxFileName::CreateTempFileName("ooxdiff");
	ASSERT_FALSE(path.empty());
	minimal_package().save_file(path);
	const auto reopened = package::open_file(path);
	wxRemoveFile(path);
	EXPECT_EQ(reopened.part_names().size(), 3u);
	EXPECT_TRUE(reopened.has_part("b.xml"));
}

TEST(package, MissingFileIsAPackageError) {
	const wxString path = wxFileName(wxFileName::GetTempDir(), "ooxdiff-missing.docx").GetFullPath();
	EXPECT_EQ(kind_of([&] { (void)package::open_file(path); }), error_kind::package);
}

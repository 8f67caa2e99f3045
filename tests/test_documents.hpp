/* test_documents.hpp - in-memory OOXML packages for tests.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <pugixml.hpp>
#include <string>
#include <utility>
#include <vector>

struct test_image {
	std::string relationship_id;
	std::string target;
	std::string bytes;
};

struct docx_content {
	// Children of w:body.
	std::string body;
	// w:footnote elements; empty means the package has no footnotes part.
	std::string footnotes;
	// w:endnote elements, likewise.
	std::string endnotes;
	std::vector<test_image> images;
};

[[nodiscard]] std::string wml_paragraph(const std::string& text, const std::string& run_properties = {});
// A paragraph holding one inline picture that embeds relationship_id.
[[nodiscard]] std::string wml_picture_paragraph(const std::string& relationship_id);
[[nodiscard]] std::string make_docx(const docx_content& content);
[[nodiscard]] std::string make_paragraphs_docx(const std::vector<std::string>& paragraph_texts);

struct test_cell {
	std::string reference;
	std::string value;
	bool is_text{false};
	std::string formula;
};

using test_sheet = std::pair<std::string, std::vector<test_cell>>;

[[nodiscard]] std::string make_xlsx(const std::vector<test_sheet>& sheets);

struct test_shape {
	unsigned id{2};
	std::string name;
	std::string text;
	long long x{457200};
	long long y{274638};
	long long cx{8229600};
	long long cy{1143000};
	// Placeholder type such as "title"; empty for a free shape.
	std::string placeholder;
};

using test_slide = std::vector<test_shape>;

[[nodiscard]] std::string make_pptx(const std::vector<test_slide>& slides);

// Loads one part of a saved package.
[[nodiscard]] std::string read_part(const std::string& package_bytes, const std::string& part);
void load_part(pugi::xml_document& doc, const std::string& package_bytes, const std::string& part);

/* test_documents.cpp - in-memory OOXML packages for tests.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "test_documents.hpp"
#include "package.hpp"
#include "xml_utils.hpp"
#include <gtest/gtest.h>

namespace {
const std::string XML_HEAD = R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)";
const std::string W_NS = R"(xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main" xmlns:r="http://schemas.openxmlformats.org/officeDocument/2006/relationships" xmlns:v="urn:schemas-microsoft-com:vml")";
const std::string DRAWING_NS = R"(xmlns:wp="http://schemas.openxmlformats.org/drawingml/2006/wordprocessingDrawing" xmlns:a="http://schemas.openxmlformats.org/drawingml/2006/main" xmlns:pic="http://schemas.openxmlformats.org/drawingml/2006/picture")";
const std::string P_NS = R"(xmlns:a="http://schemas.openxmlformats.org/drawingml/2006/main" xmlns:r="http://schemas.openxmlformats.org/officeDocument/2006/relationships" xmlns:p="http://schemas.openxmlformats.org/presentationml/2006/main")";
const std::string REL_PREFIX = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/";

std::string escape(const std::string& text) {
	std::string out;
	for (const char ch : text) {
		switch (ch) {
			case '&':
				out += "&amp;";
				break;
			case '<':
				out += "&lt;";
				break;
			case '>':
				out += "&gt;";
				break;
			default:
				out += ch;
		}
	}
	return out;
}

std::string relationships(const std::vector<std::pair<std::string, std::string>>& typed_targets) {
	std::string xml = XML_HEAD + R"(<Relationships xmlns="http://schemas.openxmlformats.org/package/2006/relationships">)";
	for (size_t i = 0; i < typed_targets.size(); ++i) {
		xml += R"(<Relationship Id="rId)" + std::to_string(i + 1) + R"(" Type=")" + REL_PREFIX + typed_targets[i].first + R"(" Target=")" + typed_targets[i].second + R"("/>)";
	}
	return xml + "</Relationships>";
}

std::string content_types(const std::vector<std::pair<std::string, std::string>>& overrides) {
	std::string xml = XML_HEAD + R"(<Types xmlns="http://schemas.openxmlformats.org/package/2006/content-types">)";
	xml += R"(<Default Extension="rels" ContentType="application/vnd.openxmlformats-package.relationships+xml"/>)";
	xml += R"(<Default Extension="xml" ContentType="application/xml"/>)";
	xml += R"(<Default Extension="png" ContentType="image/png"/>)";
	for (const auto& [part, type] : overrides) {
		xml += R"(<Override PartName="/)" + part + R"(" ContentType=")" + type + R"("/>)";
	}
	return xml + "</Types>";
}

std::string presentation_paragraphs(const std::string& text) {
	std::string xml;
	size_t start = 0;
	while (true) {
		const auto end = text.find('\n', start);
		xml += "<a:p><a:r><a:rPr lang=\"en-US\"/><a:t>" + escape(text.substr(start, end - start)) + "</a:t></a:r></a:p>";
		if (end == std::string::npos) {
			break;
		}
		start = end + 1;
	}
	return xml;
}

std::string slide_xml(const test_slide& shapes) {
	std::string xml = XML_HEAD + "<p:sld " + P_NS + "><p:cSld><p:spTree>";
	xml += R"(<p:nvGrpSpPr><p:cNvPr id="1" name=""/><p:cNvGrpSpPr/><p:nvPr/></p:nvGrpSpPr><p:grpSpPr/>)";
	for (const auto& shape : shapes) {
		xml += "<p:sp><p:nvSpPr><p:cNvPr id=\"" + std::to_string(shape.id) + "\" name=\"" + escape(shape.name) + "\"/><p:cNvSpPr/><p:nvPr>";
		if (!shape.placeholder.empty()) {
			xml += "<p:ph type=\"" + shape.placeholder + "\"/>";
		}
		xml += "</p:nvPr></p:nvSpPr><p:spPr><a:xfrm><a:off x=\"" + std::to_string(shape.x) + "\" y=\"" + std::to_string(shape.y) + "\"/><a:ext cx=\"" + std::to_string(shape.cx) + "\" cy=\"" + std::to_string(shape.cy) + "\"/></a:xfrm><a:prstGeom prst=\"rect\"><a:avLst/></a:prstGeom></p:spPr>";
		xml += "<p:txBody><a:bodyPr/><a:lstStyle/>" + presentation_paragraphs(shape.text) + "</p:txBody></p:sp>";
	}
	return xml + "</p:spTree></p:cSld><p:clrMapOvr><a:masterClrMapping/></p:clrMapOvr></p:sld>";
}
} // namespace

std::string wml_paragraph(const std::string& text, const std::string& run_properties) {
	std::string run = "<w:r>";
	if (!run_properties.empty()) {
		run += "<w:rPr>" + run_properties + "</w:rPr>";
	}
	run += "<w:t xml:space=\"preserve\">" + escape(text) + "</w:t></w:r>";
	return "<w:p>" + run + "</w:p>";
}

std::string wml_picture_paragraph(const std::string& relationship_id) {
	return "<w:p><w:r><w:drawing><wp:inline " + DRAWING_NS + R"(><wp:extent cx="952500" cy="952500"/><wp:docPr id="1" name="Picture 1"/>)"
		   R"(<a:graphic><a:graphicData uri="http://schemas.openxmlformats.org/drawingml/2006/picture"><pic:pic><pic:nvPicPr><pic:cNvPr id="0" name="image.png"/><pic:cNvPicPr/></pic:nvPicPr>)"
		   R"(<pic:blipFill><a:blip r:embed=")" +
		relationship_id + R"("/></pic:blipFill><pic:spPr/></pic:pic></a:graphicData></a:graphic></wp:inline></w:drawing></w:r></w:p>)";
}

std::string make_docx(const docx_content& content) {
	package pkg;
	std::vector<std::pair<std::string, std::string>> overrides{{"word/document.xml", "application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml"}};
	if (!content.footnotes.empty()) {
		overrides.emplace_back("word/footnotes.xml", "application/vnd.openxmlformats-officedocument.wordprocessingml.footnotes+xml");
	}
	if (!content.endnotes.empty()) {
		overrides.emplace_back("word/endnotes.xml", "application/vnd.openxmlformats-officedocument.wordprocessingml.endnotes+xml");
	}
	pkg.put_part("[Content_Types].xml", content_types(overrides));
	pkg.put_part("_rels/.rels", relationships({{"officeDocument", "word/document.xml"}}));
	pkg.put_part("word/document.xml", XML_HEAD + "<w:document " + W_NS + "><w:body>" + content.body + "</w:body></w:document>");
	std::string rels = XML_HEAD + R"(<Relationships xmlns="http://schemas.openxmlformats.org/package/2006/relationships">)";
	if (!content.footnotes.empty()) {
		pkg.put_part("word/footnotes.xml", XML_HEAD + "<w:footnotes " + W_NS + ">" + content.footnotes + "</w:footnotes>");
		rels += R"(<Relationship Id="rIdFootnotes" Type=")" + REL_PREFIX + R"(footnotes" Target="footnotes.xml"/>)";
	}
	if (!content.endnotes.empty()) {
		pkg.put_part("word/endnotes.xml", XML_HEAD + "<w:endnotes " + W_NS + ">" + content.endnotes + "</w:endnotes>");
		rels += R"(<Relationship Id="rIdEndnotes" Type=")" + REL_PREFIX + R"(endnotes" Target="endnotes.xml"/>)";
	}
	for (const auto& image : content.images) {
		pkg.put_part("word/" + image.target, image.bytes);
		rels += R"(<Relationship Id=")" + image.relationship_id + R"(" Type=")" + REL_PREFIX + R"(image" Target=")" + image.target + R"("/>)";
	}
	pkg.put_part("word/_rels/document.xml.rels", rels + "</Relationships>");
	return pkg.save();
}

std::string make_paragraphs_docx(const std::vector<std::string>& paragraph_texts) {
	docx_content content;
	for (const auto& text : paragraph_texts) {
		content.body += wml_paragraph(text);
	}
	return make_docx(content);
}

std::string make_xlsx(const std::vector<test_sheet>& sheets) {
	package pkg;
	std::vector<std::pair<std::string, std::string>> overrides{{"xl/workbook.xml", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet.main+xml"}};
	std::vector<std::pair<std::string, std::string>> workbook_rels;
	std::string workbook = XML_HEAD + R"(<workbook xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main" xmlns:r="http://schemas.openxmlformats.org/officeDocument/2006/relationships"><sheets>)";
	for (size_t i = 0; i < sheets.size(); ++i) {
		const std::string number = std::to_string(i + 1);
		const std::string part = "worksheets/sheet" + number + ".xml";
		workbook += "<sheet name=\"" + escape(sheets[i].first) + "\" sheetId=\"" + number + "\" r:id=\"rId" + number + "\"/>";
		workbook_rels.emplace_back("worksheet", part);
		overrides.emplace_back("xl/" + part, "application/vnd.openxmlformats-officedocument.spreadsheetml.worksheet+xml");
		std::string sheet = XML_HEAD + R"(<worksheet xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main"><sheetData>)";
		int open_row = 0;
		for (const auto& cell : sheets[i].second) {
			const int row = std::stoi(cell.reference.substr(cell.reference.find_first_of("0123456789")));
			if (row != open_row) {
				if (open_row != 0) {
					sheet += "</row>";
				}
				sheet += "<row r=\"" + std::to_string(row) + "\">";
				open_row = row;
			}
			sheet += "<c r=\"" + cell.reference + "\"";
			if (cell.is_text) {
				sheet += " t=\"inlineStr\"><is><t>" + escape(cell.value) + "</t></is></c>";
				continue;
			}
			sheet += ">";
			if (!cell.formula.empty()) {
				sheet += "<f>" + escape(cell.formula) + "</f>";
			}
			sheet += "<v>" + cell.value + "</v></c>";
		}
		if (open_row != 0) {
			sheet += "</row>";
		}
		pkg.put_part("xl/" + part, sheet + "</sheetData></worksheet>");
	}
	pkg.put_part("[Content_Types].xml", content_types(overrides));
	pkg.put_part("_rels/.rels", relationships({{"officeDocument", "xl/workbook.xml"}}));
	pkg.put_part("xl/workbook.xml", workbook + "</sheets></workbook>");
	pkg.put_part("xl/_rels/workbook.xml.rels", relationships(workbook_rels));
	return pkg.save();
}

std::string make_pptx(const std::vector<test_slide>& slides) {
	package pkg;
	const std::string slide_type = "application/vnd.openxmlformats-officedocument.presentationml.slide+xml";
	std::vector<std::pair<std::string, std::string>> overrides{
		{"ppt/presentation.xml", "application/vnd.openxmlformats-officedocument.presentationml.presentation.main+xml"},
		{"ppt/slideLayouts/slideLayout1.xml", "application/vnd.openxmlformats-officedocument.presentationml.slideLayout+xml"},
	};
	// The layout is the last relationship so slide N keeps rIdN.
	std::vector<std::pair<std::string, std::string>> presentation_rels;
	std::string presentation = XML_HEAD + "<p:presentation " + P_NS + "><p:sldIdLst>";
	for (size_t i = 0; i < slides.size(); ++i) {
		const std::string number = std::to_string(i + 1);
		const std::string part = "ppt/slides/slide" + number + ".xml";
		presentation += "<p:sldId id=\"" + std::to_string(256 + i) + "\" r:id=\"rId" + number + "\"/>";
		presentation_rels.emplace_back("slide", "slides/slide" + number + ".xml");
		overrides.emplace_back(part, slide_type);
		pkg.put_part(part, slide_xml(slides[i]));
		pkg.put_part("ppt/slides/_rels/slide" + number + ".xml.rels", relationships({{"slideLayout", "../slideLayouts/slideLayout1.xml"}}));
	}
	presentation += R"(</p:sldIdLst><p:sldSz cx="9144000" cy="6858000"/><p:notesSz cx="6858000" cy="9144000"/></p:presentation>)";
	pkg.put_part("[Content_Types].xml", content_types(overrides));
	pkg.put_part("_rels/.rels", relationships({{"officeDocument", "ppt/presentation.xml"}}));
	pkg.put_part("ppt/presentation.xml", presentation);
	pkg.put_part("ppt/_rels/presentation.xml.rels", relationships(presentation_rels));
	pkg.put_part("ppt/slideLayouts/slideLayout1.xml", XML_HEAD + "<p:sldLayout " + P_NS + R"( type="title"><p:cSld name="Title Slide"><p:spTree><p:nvGrpSpPr><p:cNvPr id="1" name=""/><p:cNvGrpSpPr/><p:nvPr/></p:nvGrpSpPr><p:grpSpPr/></p:spTree></p:cSld></p:sldLayout>)");
	return pkg.save();
}

std::string read_part(const std::string& package_bytes, const std::string& part) {
	const auto pkg = package::open(package_bytes);
	const auto* data = pkg.get_part(part);
	return data == nullptr ? std::string{} : *data;
}

void load_part(pugi::xml_document& doc, const std::string& package_bytes, const std::string& part) {
	const std::string data = read_part(package_bytes, part);
	ASSERT_FALSE(data.empty()) << part;
	load_xml(doc, data, part);
}

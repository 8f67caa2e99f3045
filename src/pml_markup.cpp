/* pml_markup.cpp - annotated presentation output.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "pml_markup.hpp"
#include "compare_exception.hpp"
#include "constants.hpp"
#include "package.hpp"
#include "pml_canonicalize.hpp"
#include "utils.hpp"
#include "xml_utils.hpp"
#include <algorithm>
#include <initializer_list>
#include <map>
#include <optional>
#include <sstream>
#include <vector>
#include <wx/log.h>

namespace {
constexpr long long DEFAULT_LABEL_X = 914400;
constexpr long long DEFAULT_LABEL_Y = 457200;
constexpr long long LABEL_OFFSET = 300000;
constexpr long long LABEL_WIDTH = 1828800;
constexpr long long LABEL_HEIGHT = 274320;

struct change_label {
	const char* text;
	std::string color;
};

std::optional<change_label> label_for(pml_change_type type, const pml_comparer_settings& settings) {
	switch (type) {
		case pml_change_type::shape_inserted:
			return change_label{"NEW", settings.inserted_color};
		case pml_change_type::shape_deleted:
			return change_label{"DELETED", settings.deleted_color};
		case pml_change_type::shape_moved:
			return change_label{"MOVED", settings.moved_color};
		case pml_change_type::shape_resized:
			return change_label{"RESIZED", settings.modified_color};
		case pml_change_type::text_changed:
			return change_label{"TEXT CHANGED", settings.modified_color};
		case pml_change_type::text_formatting_changed:
			return change_label{"FORMATTING", settings.formatting_color};
		case pml_change_type::image_replaced:
			return change_label{"IMAGE REPLACED", settings.modified_color};
		case pml_change_type::table_content_changed:
			return change_label{"TABLE CHANGED", settings.modified_color};
		case pml_change_type::chart_data_changed:
			return change_label{"CHART CHANGED", settings.modified_color};
		default:
			return std::nullopt;
	}
}

// Appends PresentationML shapes to a p:spTree, using the prefixes bound in its document.
class shape_writer {
public:
	explicit shape_writer(pugi::xml_node tree) : tree{tree} {
		auto root = tree.root().document_element();
		p = get_prefix(tree.name());
		a = declare_namespace(root, DRAWINGML_NS, "a");
	}

	void add_label(unsigned id, const std::string& text, const std::string& color, long long x, long long y) {
		auto sp = add_shape(id, "ChangeLabel_" + std::to_string(id), x, y, LABEL_WIDTH, LABEL_HEIGHT, true);
		auto sp_pr = first_child_local(sp, "spPr");
		child(child(sp_pr, a, "solidFill"), a, "srgbClr").append_attribute("val") = color.c_str();
		auto ln = child(sp_pr, a, "ln");
		ln.append_attribute("w") = 9525;
		child(ln, a, "noFill");
		auto body = add_text_body(sp);
		add_paragraph(body, text, 1100, true);
	}

	void add_text(unsigned id, const char* name, const std::vector<std::string>& lines, long long x, long long y, long long cx, long long cy, int size, bool bold) {
		auto sp = add_shape(id, name, x, y, cx, cy, false);
		auto body = add_text_body(sp);
		for (const auto& line : lines) {
			add_paragraph(body, line, size, bold);
		}
	}

private:
	pugi::xml_node tree;
	std::string p;
	std::string a;

	static std::string qualify(const std::string& prefix, const char* local) {
		return prefix.empty() ? std::string(local) : prefix + ":" + local;
	}

	static pugi::xml_node child(pugi::xml_node parent, const std::string& prefix, const char* local) {
		return parent.append_child(qualify(prefix, local).c_str());
	}

	pugi::xml_node add_shape(unsigned id, const std::string& name, long long x, long long y, long long cx, long long cy, bool locked) {
		auto sp = child(tree, p, "sp");
		auto nv = child(sp, p, "nvSpPr");
		auto c_nv_pr = child(nv, p, "cNvPr");
		c_nv_pr.append_attribute("id") = id;
		c_nv_pr.append_attribute("name") = name.c_str();
		auto c_nv_sp_pr = child(nv, p, "cNvSpPr");
		if (locked) {
			child(c_nv_sp_pr, a, "spLocks").append_attribute("noGrp") = 1;
		}
		child(nv, p, "nvPr");
		auto sp_pr = child(sp, p, "spPr");
		auto xfrm = child(sp_pr, a, "xfrm");
		auto off = child(xfrm, a, "off");
		off.append_attribute("x") = x;
		off.append_attribute("y") = y;
		auto ext = child(xfrm, a, "ext");
		ext.append_attribute("cx") = cx;
		ext.append_attribute("cy") = cy;
		auto geometry = child(sp_pr, a, "prstGeom");
		geometry.append_attribute("prst") = "rect";
		child(geometry, a, "avLst");
		return sp;
	}

	pugi::xml_node add_text_body(pugi::xml_node sp) {
		auto body = child(sp, p, "txBody");
		auto body_pr = child(body, a, "bodyPr");
		body_pr.append_attribute("wrap") = "square";
		body_pr.append_attribute("rtlCol") = 0;
		child(body, a, "lstStyle");
		return body;
	}

	void add_paragraph(pugi::xml_node body, const std::string& text, int size, bool bold) {
		auto run = child(child(body, a, "p"), a, "r");
		auto r_pr = child(run, a, "rPr");
		r_pr.append_attribute("lang") = "en-US";
		r_pr.append_attribute("sz") = size;
		if (bold) {
			r_pr.append_attribute("b") = 1;
		}
		child(run, a, "t").text().set(text.c_str());
	}
};

unsigned next_shape_id(pugi::xml_node tree) {
	unsigned max_id = 0;
	for (auto c_nv_pr : descendants_local(tree, "cNvPr")) {
		max_id = std::max(max_id, c_nv_pr.attribute("id").as_uint(0));
	}
	return max_id + 1;
}

std::pair<long long, long long> label_position(const pml_change& change) {
	const auto x = change.new_x ? change.new_x : change.old_x;
	const auto y = change.new_y ? change.new_y : change.old_y;
	return {x.value_or(DEFAULT_LABEL_X), y ? std::max(0LL, *y - LABEL_OFFSET) : DEFAULT_LABEL_Y};
}

// Returns one "Slide N: LABEL 'shape'" line per labelled slide.
std::vector<std::string> label_slides(package& pkg, const pml_comparison_result& result, const pml_comparer_settings& settings) {
	const auto parts = pml_slide_parts(pkg);
	std::map<int, std::vector<const pml_change*>> by_slide;
	for (const auto& change : result.changes) {
		if (change.type != pml_change_type::slide_deleted && change.slide_index > 0 && label_for(change.type, settings)) {
			by_slide[change.slide_index].push_back(&change);
		}
	}
	std::vector<std::string> annotations;
	for (const auto& [slide, changes] : by_slide) {
		if (slide > static_cast<int>(parts.size())) {
			wxLogWarning("Change refers to slide %d, but the presentation has %zu slides", slide, parts.size());
			continue;
		}
		const std::string& part = parts[static_cast<size_t>(slide - 1)];
		auto doc = pkg.get_xml_part(part);
		auto tree = first_descendant_local(doc->document_element(), "spTree");
		if (!tree) {
			throw compare_exception(error_kind::invalid_package, "slide has no shape tree", part);
		}
		shape_writer writer{tree};
		unsigned id = next_shape_id(tree);
		std::string annotation = "Slide " + std::to_string(slide) + ":";
		for (const auto* change : changes) {
			const auto label = label_for(change->type, settings);
			const auto [x, y] = label_position(*change);
			writer.add_label(id++, label->text, label->color, x, y);
			annotation += std::string(annotation.back() == ':' ? " " : ", ") + label->text;
			if (change->shape_name) {
				annotation += " '" + *change->shape_name + "'";
			}
		}
		pkg.put_xml_part(part, *doc);
		annotations.push_back(std::move(annotation));
	}
	return annotations;
}

std::vector<std::string> summary_lines(const pml_comparison_result& result) {
	std::vector<std::string> lines = {
		"Total Changes: " + std::to_string(result.total_changes()),
		"Slides Inserted: " + std::to_string(result.slides_inserted()),
		"Slides Deleted: " + std::to_string(result.slides_deleted()),
		"Shapes Inserted: " + std::to_string(result.shapes_inserted()),
		"Shapes Deleted: " + std::to_string(result.shapes_deleted()),
		"Shapes Moved: " + std::to_string(result.shapes_moved()),
		"Shapes Resized: " + std::to_string(result.shapes_resized()),
		"Text Changes: " + std::to_string(result.text_changes()),
		"",
		"Changes:",
	};
	const size_t shown = std::min(result.changes.size(), PML_SUMMARY_CHANGE_LIMIT);
	for (size_t i = 0; i < shown; ++i) {
		lines.push_back(std::to_string(i + 1) + ". " + result.changes[i].description());
	}
	if (result.changes.size() > shown) {
		lines.push_back("... and " + std::to_string(result.changes.size() - shown) + " more");
	}
	return lines;
}

int next_slide_number(const package& pkg) {
	int max_number = 0;
	const std::string prefix = "ppt/slides/slide";
	for (const auto& name : pkg.part_names()) {
		if (name.rfind(prefix, 0) != 0 || name.size() <= prefix.size() + 4 || name.compare(name.size() - 4, 4, ".xml") != 0) {
			continue;
		}
		const std::string digits = name.substr(prefix.size(), name.size() - prefix.size() - 4);
		if (std::all_of(digits.begin(), digits.end(), [](char ch) { return ch >= '0' && ch <= '9'; })) {
			max_number = std::max(max_number, std::stoi(digits));
		}
	}
	return max_number + 1;
}

void register_slide(package& pkg, const std::string& target) {
	const std::string rel_id = pkg.add_relationship(PML_PRESENTATION_PART, REL_TYPE_SLIDE, target);
	auto presentation = pkg.get_xml_part(PML_PRESENTATION_PART);
	auto root = presentation->document_element();
	const std::string p = get_prefix(root.name());
	const auto qualify = [&](const char* local) {
		return p.empty() ? std::string(local) : p + ":" + local;
	};
	auto list = first_child_local(root, "sldIdLst");
	if (!list) {
		pugi::xml_node before;
		for (const char* later : {"sldSz", "notesSz", "embeddedFontLst", "custShowLst", "photoAlbum", "custDataLst", "kinsoku", "defaultTextStyle", "modifyVerifier", "extLst"}) {
			if ((before = first_child_local(root, later))) {
				break;
			}
		}
		list = before ? root.insert_child_before(qualify("sldIdLst").c_str(), before) : root.append_child(qualify("sldIdLst").c_str());
	}
	unsigned max_id = 255;
	for (auto sld_id : children_local(list, "sldId")) {
		max_id = std::max(max_id, sld_id.attribute("id").as_uint(0));
	}
	auto entry = list.append_child(qualify("sldId").c_str());
	entry.append_attribute("id") = max_id + 1;
	entry.append_attribute((declare_namespace(root, REL_NS, "r") + ":id").c_str()) = rel_id.c_str();
	pkg.put_xml_part(PML_PRESENTATION_PART, *presentation);
}

void add_summary_slide(package& pkg, const pml_comparison_result& result, const std::vector<std::string>& annotations) {
	std::ostringstream xml;
	xml << XML_DECLARATION << "<p:sld xmlns:a=\"" << DRAWINGML_NS << "\" xmlns:r=\"" << REL_NS << "\" xmlns:p=\"" << PRESENTATIONML_NS << "\">"
		<< "<p:cSld><p:spTree><p:nvGrpSpPr><p:cNvPr id=\"1\" name=\"\"/><p:cNvGrpSpPr/><p:nvPr/></p:nvGrpSpPr>"
		<< "<p:grpSpPr><a:xfrm><a:off x=\"0\" y=\"0\"/><a:ext cx=\"0\" cy=\"0\"/><a:chOff x=\"0\" y=\"0\"/><a:chExt cx=\"0\" cy=\"0\"/></a:xfrm></p:grpSpPr>"
		<< "</p:spTree></p:cSld><p:clrMapOvr><a:masterClrMapping/></p:clrMapOvr></p:sld>";
	const int number = next_slide_number(pkg);
	const std::string target = "slides/slide" + std::to_string(number) + ".xml";
	const std::string part = "ppt/" + target;
	pugi::xml_document doc;
	load_xml(doc, xml.str(), part);
	shape_writer writer{first_descendant_local(doc.document_element(), "spTree")};
	writer.add_text(2, "Title", {PML_SUMMARY_TITLE}, 457200, 274638, 8229600, 1143000, 4400, true);
	auto lines = summary_lines(result);
	if (!annotations.empty()) {
		lines.emplace_back("");
		lines.emplace_back("Annotations:");
		lines.insert(lines.end(), annotations.begin(), annotations.end());
	}
	writer.add_text(3, "Content", lines, 457200, 1600200, 8229600, 4525963, 1800, false);
	pkg.put_xml_part(part, doc);
	pkg.add_content_type_override(part, CONTENT_TYPE_SLIDE);
	const auto slides = pml_slide_parts(pkg);
	if (!slides.empty()) {
		for (const auto& rel : pkg.get_relationships(slides.front())) {
			if (rel.type == REL_TYPE_SLIDE_LAYOUT) {
				pkg.add_relationship(part, REL_TYPE_SLIDE_LAYOUT, rel.target);
				break;
			}
		}
	}
	register_slide(pkg, target);
}
}

void pml_render_markup(package& pkg, const pml_comparison_result& result, const pml_comparer_settings& settings) {
	const auto annotations = label_slides(pkg, result, settings);
	if (settings.add_summary_slide) {
		add_summary_slide(pkg, result, settings.add_notes_annotations ? annotations : std::vector<std::string>{});
	}
	wxLogVerbose("Labelled %zu slides", annotations.size());
}

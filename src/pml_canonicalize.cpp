/* pml_canonicalize.cpp - presentation signatures.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "pml_canonicalize.hpp"
#include "compare_exception.hpp"
#include "constants.hpp"
#include "hashing.hpp"
#include "package.hpp"
#include "xml_utils.hpp"
#include <algorithm>
#include <cstdlib>
#include <wx/log.h>

namespace {
constexpr const char* TABLE_URI = "http://schemas.openxmlformats.org/drawingml/2006/table";
constexpr const char* CHART_URI = "http://schemas.openxmlformats.org/drawingml/2006/chart";
constexpr const char* DIAGRAM_URI = "http://schemas.openxmlformats.org/drawingml/2006/diagram";

long long integer_attribute(pugi::xml_node node, const char* name, long long fallback = 0) {
	const std::string value = attribute_local(node, name);
	if (value.empty()) {
		return fallback;
	}
	char* end = nullptr;
	const long long parsed = std::strtoll(value.c_str(), &end, 10);
	return end == value.c_str() ? fallback : parsed;
}

bool flag_attribute(pugi::xml_node node, const char* name) {
	const std::string value = attribute_local(node, name);
	return value == "1" || value == "true";
}

std::string hash_or_empty(const std::string& content) {
	return content.empty() ? std::string{} : sha256_base64(content);
}

// The p:nvSpPr, p:nvPicPr or similar child that carries cNvPr and nvPr.
pugi::xml_node non_visual_properties(pugi::xml_node shape) {
	for (auto child : element_children(shape)) {
		if (local_name(child).rfind("nv", 0) == 0) {
			return child;
		}
	}
	return {};
}

pugi::xml_node shape_properties(pugi::xml_node shape) {
	if (auto sp_pr = first_child_local(shape, "spPr")) {
		return sp_pr;
	}
	return first_child_local(shape, "grpSpPr");
}

std::optional<pml_transform> read_transform(pugi::xml_node shape) {
	auto xfrm = first_child_local(shape, "xfrm");
	if (!xfrm) {
		xfrm = first_child_local(shape_properties(shape), "xfrm");
	}
	if (!xfrm) {
		return std::nullopt;
	}
	pml_transform transform;
	const auto off = first_child_local(xfrm, "off");
	const auto ext = first_child_local(xfrm, "ext");
	transform.x = integer_attribute(off, "x");
	transform.y = integer_attribute(off, "y");
	transform.cx = integer_attribute(ext, "cx");
	transform.cy = integer_attribute(ext, "cy");
	transform.rotation = static_cast<int>(integer_attribute(xfrm, "rot"));
	transform.flip_h = flag_attribute(xfrm, "flipH");
	transform.flip_v = flag_attribute(xfrm, "flipV");
	return transform;
}

std::string geometry_hash(pugi::xml_node shape) {
	const auto sp_pr = shape_properties(shape);
	if (auto preset = first_child_local(sp_pr, "prstGeom")) {
		return attribute_local(preset, "prst");
	}
	if (auto custom = first_child_local(sp_pr, "custGeom")) {
		return sha256_base64(node_to_string(custom));
	}
	return {};
}

std::string fill_hash(pugi::xml_node shape) {
	for (auto child : element_children(shape_properties(shape))) {
		const std::string name = local_name(child);
		if (name == "solidFill" || name == "gradFill" || name == "pattFill" || name == "blipFill" || name == "noFill" || name == "grpFill") {
			return sha256_base64(node_to_string(child));
		}
	}
	return {};
}

std::string child_hash(pugi::xml_node parent, const char* name) {
	const auto child = first_child_local(parent, name);
	return child ? sha256_base64(node_to_string(child)) : std::string{};
}

pml_run_properties read_run_properties(pugi::xml_node run) {
	pml_run_properties props;
	const auto r_pr = first_child_local(run, "rPr");
	if (!r_pr) {
		return props;
	}
	props.bold = flag_attribute(r_pr, "b");
	props.italic = flag_attribute(r_pr, "i");
	const std::string underline = attribute_local(r_pr, "u");
	props.underline = !underline.empty() && underline != "none";
	const std::string strike = attribute_local(r_pr, "strike");
	props.strikethrough = !strike.empty() && strike != "noStrike";
	if (const std::string size = attribute_local(r_pr, "sz"); !size.empty()) {
		props.font_size = static_cast<int>(integer_attribute(r_pr, "sz"));
	}
	if (auto latin = first_child_local(r_pr, "latin")) {
		props.font_name = attribute_local(latin, "typeface");
	}
	if (auto color = first_child_local(first_child_local(r_pr, "solidFill"), "srgbClr")) {
		props.font_color = attribute_local(color, "val");
	}
	return props;
}

std::optional<pml_text_body> read_text_body(pugi::xml_node shape) {
	const auto tx_body = first_child_local(shape, "txBody");
	if (!tx_body) {
		return std::nullopt;
	}
	pml_text_body body;
	body.markup = node_to_string(tx_body);
	std::vector<std::string> texts;
	for (auto p : children_local(tx_body, "p")) {
		pml_paragraph paragraph;
		if (auto p_pr = first_child_local(p, "pPr")) {
			if (const std::string algn = attribute_local(p_pr, "algn"); !algn.empty()) {
				paragraph.alignment = algn;
			}
			paragraph.has_bullet = first_child_local(p_pr, "buChar") || first_child_local(p_pr, "buAutoNum");
		}
		for (auto child : element_children(p)) {
			const std::string name = local_name(child);
			if (name != "r" && name != "fld") {
				continue;
			}
			pml_run run;
			run.text = first_child_local(child, "t").text().get();
			run.properties = read_run_properties(child);
			paragraph.runs.push_back(std::move(run));
		}
		texts.push_back(paragraph.plain_text());
		body.paragraphs.push_back(std::move(paragraph));
	}
	for (size_t i = 0; i < texts.size(); ++i) {
		if (i > 0) {
			body.plain_text += '\n';
		}
		body.plain_text += texts[i];
	}
	return body;
}

std::string table_grid(pugi::xml_node table) {
	const auto rows = children_local(table, "tr").size();
	const auto columns = children_local(first_child_local(table, "tblGrid"), "gridCol").size();
	return std::to_string(rows) + "x" + std::to_string(columns);
}

std::string table_hash(pugi::xml_node table) {
	std::string content;
	for (auto row : children_local(table, "tr")) {
		for (auto cell : children_local(row, "tc")) {
			content += descendant_text(cell, "t");
			content += '|';
		}
		content += "||";
	}
	return hash_or_empty(content);
}

class slide_reader {
public:
	slide_reader(const package& pkg, std::string part, const pml_comparer_settings& settings) : pkg{pkg}, part{std::move(part)}, settings{settings} {
	}

	std::vector<pml_shape_signature> read_shapes(pugi::xml_node tree) {
		std::vector<pml_shape_signature> shapes;
		int z_order = 0;
		for (auto child : element_children(tree)) {
			if (auto shape = read_shape(child, z_order)) {
				shapes.push_back(std::move(*shape));
				++z_order;
			}
		}
		return shapes;
	}

private:
	const package& pkg;
	std::string part;
	const pml_comparer_settings& settings;

	std::optional<pml_shape_signature> read_shape(pugi::xml_node node, int z_order) {
		const std::string name = local_name(node);
		pml_shape_signature shape;
		if (name == "sp") {
			shape.kind = pml_shape_kind::auto_shape;
		} else if (name == "pic") {
			shape.kind = pml_shape_kind::picture;
		} else if (name == "graphicFrame") {
			shape.kind = frame_kind(node);
		} else if (name == "grpSp") {
			shape.kind = pml_shape_kind::group;
		} else if (name == "cxnSp") {
			shape.kind = pml_shape_kind::connector;
		} else {
			return std::nullopt;
		}
		shape.z_order = z_order;
		const auto nv = non_visual_properties(node);
		const auto c_nv_pr = first_child_local(nv, "cNvPr");
		shape.name = attribute_local(c_nv_pr, "name");
		shape.id = static_cast<unsigned>(integer_attribute(c_nv_pr, "id"));
		if (auto ph = first_child_local(first_child_local(nv, "nvPr"), "ph")) {
			pml_placeholder placeholder;
			placeholder.type = attribute_local(ph, "type");
			if (placeholder.type.empty()) {
				placeholder.type = "body";
			}
			if (!attribute_local(ph, "idx").empty()) {
				placeholder.index = static_cast<unsigned>(integer_attribute(ph, "idx"));
			}
			shape.placeholder = placeholder;
		}
		shape.transform = read_transform(node);
		shape.geometry_hash = geometry_hash(node);
		shape.fill_hash = fill_hash(node);
		shape.line_hash = child_hash(shape_properties(node), "ln");
		shape.effects_hash = child_hash(shape_properties(node), "effectLst");
		shape.text_body = read_text_body(node);
		if (shape.kind == pml_shape_kind::auto_shape && shape.text_body && !shape.text_body->plain_text.empty()) {
			shape.kind = pml_shape_kind::text_box;
		}
		if (shape.kind == pml_shape_kind::picture) {
			shape.image_hash = image_hash(node);
		} else if (shape.kind == pml_shape_kind::table) {
			const auto table = first_descendant_local(node, "tbl");
			shape.table_hash = table_hash(table);
			shape.table_grid = table_grid(table);
		} else if (shape.kind == pml_shape_kind::chart) {
			shape.chart_hash = chart_hash(node);
		} else if (shape.kind == pml_shape_kind::group) {
			shape.children = read_shapes(node);
		}
		shape.content_hash = content_hash(shape);
		return shape;
	}

	static pml_shape_kind frame_kind(pugi::xml_node frame) {
		const std::string uri = attribute_local(first_descendant_local(frame, "graphicData"), "uri");
		if (uri == TABLE_URI) {
			return pml_shape_kind::table;
		}
		if (uri == CHART_URI) {
			return pml_shape_kind::chart;
		}
		if (uri == DIAGRAM_URI) {
			return pml_shape_kind::smart_art;
		}
		return pml_shape_kind::ole_object;
	}

	std::optional<std::string> image_hash(pugi::xml_node picture) const {
		const auto blip = first_descendant_local(first_child_local(picture, "blipFill"), "blip");
		const std::string id = qualified_attribute_local(blip, "embed");
		if (id.empty()) {
			return std::nullopt;
		}
		if (!settings.compare_image_content) {
			return id;
		}
		if (const auto* rel = pkg.find_relationship(part, id); rel != nullptr && !rel->external) {
			const std::string target = package::resolve_target(part, rel->target);
			if (const auto* data = pkg.get_part(target)) {
				return sha256_base64(*data);
			}
		}
		wxLogWarning("Image relationship %s of %s does not resolve; hashing its markup", id, part);
		return sha256_base64(node_to_string(blip));
	}

	std::optional<std::string> chart_hash(pugi::xml_node frame) const {
		const auto chart = first_descendant_local(first_descendant_local(frame, "graphicData"), "chart");
		const std::string id = qualified_attribute_local(chart, "id");
		const auto* rel = id.empty() ? nullptr : pkg.find_relationship(part, id);
		if (rel == nullptr) {
			return std::nullopt;
		}
		const auto* data = pkg.get_part(package::resolve_target(part, rel->target));
		if (data == nullptr) {
			wxLogWarning("Chart relationship %s of %s does not resolve", id, part);
			return std::nullopt;
		}
		return sha256_base64(*data);
	}

	static std::string content_hash(const pml_shape_signature& shape) {
		std::string content = pml_shape_kind_name(shape.kind);
		content += '|';
		content += shape.text_body ? shape.text_body->plain_text : std::string{};
		content += '|';
		content += shape.image_hash.value_or("");
		content += '|';
		content += shape.table_hash.value_or("");
		content += '|';
		content += shape.chart_hash.value_or("");
		for (const auto& child : shape.children) {
			content += '|';
			content += child.content_hash;
		}
		return sha256_base64(content);
	}
};

std::optional<std::string> read_layout(const package& pkg, const std::string& slide_part, std::optional<std::string>& relationship_id) {
	for (const auto& rel : pkg.get_relationships(slide_part)) {
		if (rel.type != REL_TYPE_SLIDE_LAYOUT) {
			continue;
		}
		relationship_id = rel.id;
		const std::string layout_part = package::resolve_target(slide_part, rel.target);
		const auto doc = pkg.try_get_xml_part(layout_part);
		if (!doc) {
			wxLogWarning("Layout part %s is unavailable", layout_part);
			return sha256_base64(layout_part);
		}
		const auto root = doc->document_element();
		std::string type = attribute_local(root, "type");
		if (type.empty()) {
			type = "custom";
		}
		return sha256_base64(type + "|" + attribute_local(first_child_local(root, "cSld"), "name"));
	}
	return std::nullopt;
}

std::optional<std::string> read_notes(const package& pkg, const std::string& slide_part) {
	for (const auto& rel : pkg.get_relationships(slide_part)) {
		if (rel.type != REL_TYPE_NOTES_SLIDE) {
			continue;
		}
		const std::string notes_part = package::resolve_target(slide_part, rel.target);
		const auto doc = pkg.try_get_xml_part(notes_part);
		if (!doc) {
			wxLogWarning("Notes part %s is unavailable", notes_part);
			return std::nullopt;
		}
		std::string notes;
		const auto tree = first_descendant_local(doc->document_element(), "spTree");
		for (auto sp : children_local(tree, "sp")) {
			const auto ph = first_child_local(first_child_local(non_visual_properties(sp), "nvPr"), "ph");
			const std::string type = attribute_local(ph, "type");
			if (ph && !type.empty() && type != "body" && type != "obj") {
				continue;
			}
			const auto body = read_text_body(sp);
			if (!body || body->plain_text.empty()) {
				continue;
			}
			if (!notes.empty()) {
				notes += '\n';
			}
			notes += body->plain_text;
		}
		return notes;
	}
	return std::nullopt;
}

std::optional<std::string> title_of(const std::vector<pml_shape_signature>& shapes) {
	for (const auto& shape : shapes) {
		if (shape.placeholder && (shape.placeholder->type == "title" || shape.placeholder->type == "ctrTitle")) {
			return shape.plain_text();
		}
	}
	return std::nullopt;
}

std::string slide_content_hash(const pml_slide_signature& slide) {
	std::string content = slide.title_text.value_or("");
	for (const auto& shape : slide.shapes) {
		content += "|" + shape.name + ":" + pml_shape_kind_name(shape.kind) + ":" + shape.plain_text();
	}
	return sha256_base64(content);
}

pml_slide_signature canonicalize_slide(const package& pkg, int index, const std::string& relationship_id, const std::string& part, const pml_comparer_settings& settings) {
	pml_slide_signature slide;
	slide.index = index;
	slide.relationship_id = relationship_id;
	slide.part = part;
	const auto doc = pkg.get_xml_part(part);
	const auto root = doc->document_element();
	const auto c_sld = first_child_local(root, "cSld");
	if (auto background = first_child_local(c_sld, "bg")) {
		slide.background_hash = sha256_base64(node_to_string(background));
	}
	if (auto transition = first_descendant_local(root, "transition")) {
		slide.transition_hash = sha256_base64(node_to_string(transition));
	}
	slide_reader reader{pkg, part, settings};
	slide.shapes = reader.read_shapes(first_child_local(c_sld, "spTree"));
	slide.layout_hash = read_layout(pkg, part, slide.layout_relationship_id);
	if (settings.compare_notes) {
		slide.notes_text = read_notes(pkg, part);
	}
	slide.title_text = title_of(slide.shapes);
	slide.content_hash = slide_content_hash(slide);
	return slide;
}

std::vector<std::pair<std::string, std::string>> slide_entries(const package& pkg, const pugi::xml_document& presentation) {
	std::vector<std::pair<std::string, std::string>> entries;
	const auto list = first_child_local(presentation.document_element(), "sldIdLst");
	for (auto sld_id : children_local(list, "sldId")) {
		const std::string id = qualified_attribute_local(sld_id, "id");
		const auto* rel = pkg.find_relationship(PML_PRESENTATION_PART, id);
		if (rel == nullptr) {
			throw compare_exception(error_kind::missing_part, "slide " + id + " has no relationship", PML_PRESENTATION_PART);
		}
		entries.emplace_back(id, package::resolve_target(PML_PRESENTATION_PART, rel->target));
	}
	return entries;
}
}

const char* pml_shape_kind_name(pml_shape_kind kind) noexcept {
	switch (kind) {
		case pml_shape_kind::auto_shape:
			return "AutoShape";
		case pml_shape_kind::text_box:
			return "TextBox";
		case pml_shape_kind::picture:
			return "Picture";
		case pml_shape_kind::table:
			return "Table";
		case pml_shape_kind::chart:
			return "Chart";
		case pml_shape_kind::smart_art:
			return "SmartArt";
		case pml_shape_kind::group:
			return "Group";
		case pml_shape_kind::connector:
			return "Connector";
		case pml_shape_kind::ole_object:
			return "OleObject";
	}
	return "Unknown";
}

bool pml_transform::is_near(const pml_transform& other, long long tolerance) const noexcept {
	return std::llabs(x - other.x) <= tolerance && std::llabs(y - other.y) <= tolerance;
}

bool pml_transform::is_same_size(const pml_transform& other, long long tolerance) const noexcept {
	return std::llabs(cx - other.cx) <= tolerance && std::llabs(cy - other.cy) <= tolerance;
}

std::string pml_paragraph::plain_text() const {
	std::string text;
	for (const auto& run : runs) {
		text += run.text;
	}
	return text;
}

std::string pml_shape_signature::plain_text() const {
	return text_body ? text_body->plain_text : std::string{};
}

std::string pml_slide_signature::fingerprint() const {
	std::vector<const pml_shape_signature*> ordered;
	for (const auto& shape : shapes) {
		ordered.push_back(&shape);
	}
	std::stable_sort(ordered.begin(), ordered.end(), [](const auto* a, const auto* b) {
		return a->z_order < b->z_order;
	});
	std::string content = title_text.value_or("") + "|";
	for (const auto* shape : ordered) {
		content += shape->name + ":" + pml_shape_kind_name(shape->kind) + ":" + shape->plain_text() + "|";
	}
	return sha256_base64(content);
}

std::vector<std::string> pml_slide_parts(const package& pkg) {
	const auto presentation = pkg.get_xml_part(PML_PRESENTATION_PART);
	std::vector<std::string> parts;
	for (auto& [id, part] : slide_entries(pkg, *presentation)) {
		parts.push_back(std::move(part));
	}
	return parts;
}

pml_presentation_signature pml_canonicalize(const package& pkg, const pml_comparer_settings& settings) {
	const auto presentation = pkg.get_xml_part(PML_PRESENTATION_PART);
	const auto root = presentation->document_element();
	pml_presentation_signature signature;
	if (auto size = first_child_local(root, "sldSz")) {
		signature.slide_cx = integer_attribute(size, "cx", signature.slide_cx);
		signature.slide_cy = integer_attribute(size, "cy", signature.slide_cy);
	}
	int index = 1;
	for (const auto& [id, part] : slide_entries(pkg, *presentation)) {
		signature.slides.push_back(canonicalize_slide(pkg, index++, id, part, settings));
	}
	for (const auto& rel : pkg.get_relationships(PML_PRESENTATION_PART)) {
		if (rel.type != REL_TYPE_THEME) {
			continue;
		}
		if (const auto* data = pkg.get_part(package::resolve_target(PML_PRESENTATION_PART, rel.target))) {
			signature.theme_hash = sha256_base64(*data);
		}
		break;
	}
	wxLogVerbose("Canonicalized %zu slides", signature.slides.size());
	return signature;
}

/* pml_types.cpp - presentation change records.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "pml_types.hpp"
#include <algorithm>
#include <array>
#include <utility>

namespace {
constexpr std::array<std::pair<pml_change_type, const char*>, 27> CHANGE_TYPE_NAMES = {{
	{pml_change_type::slide_size_changed, "SlideSizeChanged"},
	{pml_change_type::theme_changed, "ThemeChanged"},
	{pml_change_type::slide_inserted, "SlideInserted"},
	{pml_change_type::slide_deleted, "SlideDeleted"},
	{pml_change_type::slide_moved, "SlideMoved"},
	{pml_change_type::slide_layout_changed, "SlideLayoutChanged"},
	{pml_change_type::slide_background_changed, "SlideBackgroundChanged"},
	{pml_change_type::slide_transition_changed, "SlideTransitionChanged"},
	{pml_change_type::slide_notes_changed, "SlideNotesChanged"},
	{pml_change_type::shape_inserted, "ShapeInserted"},
	{pml_change_type::shape_deleted, "ShapeDeleted"},
	{pml_change_type::shape_moved, "ShapeMoved"},
	{pml_change_type::shape_resized, "ShapeResized"},
	{pml_change_type::shape_rotated, "ShapeRotated"},
	{pml_change_type::shape_z_order_changed, "ShapeZOrderChanged"},
	{pml_change_type::shape_type_changed, "ShapeTypeChanged"},
	{pml_change_type::text_changed, "TextChanged"},
	{pml_change_type::text_formatting_changed, "TextFormattingChanged"},
	{pml_change_type::image_replaced, "ImageReplaced"},
	{pml_change_type::table_content_changed, "TableContentChanged"},
	{pml_change_type::table_structure_changed, "TableStructureChanged"},
	{pml_change_type::chart_data_changed, "ChartDataChanged"},
	{pml_change_type::chart_format_changed, "ChartFormatChanged"},
	{pml_change_type::shape_fill_changed, "ShapeFillChanged"},
	{pml_change_type::shape_line_changed, "ShapeLineChanged"},
	{pml_change_type::shape_effects_changed, "ShapeEffectsChanged"},
	{pml_change_type::group_membership_changed, "GroupMembershipChanged"},
}};

constexpr std::array<std::pair<pml_text_change_type, const char*>, 4> TEXT_CHANGE_TYPE_NAMES = {{
	{pml_text_change_type::insert, "Insert"},
	{pml_text_change_type::remove, "Delete"},
	{pml_text_change_type::replace, "Replace"},
	{pml_text_change_type::format_only, "FormatOnly"},
}};
}

const char* pml_change_type_name(pml_change_type type) noexcept {
	for (const auto& [value, name] : CHANGE_TYPE_NAMES) {
		if (value == type) {
			return name;
		}
	}
	return "Unknown";
}

std::optional<pml_change_type> parse_pml_change_type(const std::string& name) {
	for (const auto& [value, text] : CHANGE_TYPE_NAMES) {
		if (name == text) {
			return value;
		}
	}
	return std::nullopt;
}

bool is_slide_change(pml_change_type type) noexcept {
	switch (type) {
		case pml_change_type::slide_inserted:
		case pml_change_type::slide_deleted:
		case pml_change_type::slide_moved:
		case pml_change_type::slide_layout_changed:
		case pml_change_type::slide_background_changed:
		case pml_change_type::slide_transition_changed:
		case pml_change_type::slide_notes_changed:
		case pml_change_type::slide_size_changed:
		case pml_change_type::theme_changed:
			return true;
		default:
			return false;
	}
}

const char* pml_text_change_type_name(pml_text_change_type type) noexcept {
	for (const auto& [value, name] : TEXT_CHANGE_TYPE_NAMES) {
		if (value == type) {
			return name;
		}
	}
	return "Unknown";
}

std::optional<pml_text_change_type> parse_pml_text_change_type(const std::string& name) {
	for (const auto& [value, text] : TEXT_CHANGE_TYPE_NAMES) {
		if (name == text) {
			return value;
		}
	}
	return std::nullopt;
}

std::string pml_change::description() const {
	const std::string slide = std::to_string(slide_index);
	const std::string shape = "'" + shape_name.value_or("") + "'";
	switch (type) {
		case pml_change_type::slide_inserted:
			return "Slide " + slide + " inserted";
		case pml_change_type::slide_deleted:
			return "Slide " + std::to_string(old_slide_index.value_or(0)) + " deleted";
		case pml_change_type::slide_moved:
			return "Slide moved from position " + std::to_string(old_slide_index.value_or(0)) + " to " + slide;
		case pml_change_type::slide_layout_changed:
			return "Slide " + slide + " layout changed";
		case pml_change_type::slide_background_changed:
			return "Slide " + slide + " background changed";
		case pml_change_type::slide_notes_changed:
			return "Slide " + slide + " notes changed";
		case pml_change_type::shape_inserted:
			return "Shape " + shape + " inserted on slide " + slide;
		case pml_change_type::shape_deleted:
			return "Shape " + shape + " deleted from slide " + slide;
		case pml_change_type::shape_moved:
			return "Shape " + shape + " moved on slide " + slide;
		case pml_change_type::shape_resized:
			return "Shape " + shape + " resized on slide " + slide;
		case pml_change_type::shape_rotated:
			return "Shape " + shape + " rotated on slide " + slide;
		case pml_change_type::shape_z_order_changed:
			return "Shape " + shape + " z-order changed on slide " + slide;
		case pml_change_type::text_changed:
			return "Text changed in " + shape + " on slide " + slide;
		case pml_change_type::text_formatting_changed:
			return "Text formatting changed in " + shape + " on slide " + slide;
		case pml_change_type::image_replaced:
			return "Image replaced in " + shape + " on slide " + slide;
		case pml_change_type::table_content_changed:
			return "Table content changed in " + shape + " on slide " + slide;
		case pml_change_type::chart_data_changed:
			return "Chart data changed in " + shape + " on slide " + slide;
		default:
			return std::string(pml_change_type_name(type)) + " on slide " + slide;
	}
}

size_t pml_comparison_result::count(pml_change_type type) const noexcept {
	return static_cast<size_t>(std::count_if(changes.begin(), changes.end(), [type](const pml_change& change) {
		return change.type == type;
	}));
}

size_t pml_comparison_result::slides_inserted() const noexcept {
	return count(pml_change_type::slide_inserted);
}

size_t pml_comparison_result::slides_deleted() const noexcept {
	return count(pml_change_type::slide_deleted);
}

size_t pml_comparison_result::shapes_inserted() const noexcept {
	return count(pml_change_type::shape_inserted);
}

size_t pml_comparison_result::shapes_deleted() const noexcept {
	return count(pml_change_type::shape_deleted);
}

size_t pml_comparison_result::shapes_moved() const noexcept {
	return count(pml_change_type::shape_moved);
}

size_t pml_comparison_result::shapes_resized() const noexcept {
	return count(pml_change_type::shape_resized);
}

size_t pml_comparison_result::text_changes() const noexcept {
	return count(pml_change_type::text_changed) + count(pml_change_type::text_formatting_changed);
}

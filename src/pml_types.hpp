/* pml_types.hpp - presentation change records.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

enum class pml_change_type {
	slide_size_changed,
	theme_changed,
	slide_inserted,
	slide_deleted,
	slide_moved,
	slide_layout_changed,
	slide_background_changed,
	slide_transition_changed,
	slide_notes_changed,
	shape_inserted,
	shape_deleted,
	shape_moved,
	shape_resized,
	shape_rotated,
	shape_z_order_changed,
	shape_type_changed,
	text_changed,
	text_formatting_changed,
	image_replaced,
	table_content_changed,
	table_structure_changed,
	chart_data_changed,
	chart_format_changed,
	shape_fill_changed,
	shape_line_changed,
	shape_effects_changed,
	group_membership_changed,
};

[[nodiscard]] const char* pml_change_type_name(pml_change_type type) noexcept;
[[nodiscard]] std::optional<pml_change_type> parse_pml_change_type(const std::string& name);
// Slide level changes are never folded into per-shape groups.
[[nodiscard]] bool is_slide_change(pml_change_type type) noexcept;

enum class pml_text_change_type {
	insert,
	remove,
	replace,
	format_only,
};

[[nodiscard]] const char* pml_text_change_type_name(pml_text_change_type type) noexcept;
[[nodiscard]] std::optional<pml_text_change_type> parse_pml_text_change_type(const std::string& name);

struct pml_text_change {
	pml_text_change_type type{pml_text_change_type::replace};
	int paragraph_index{0};
	int run_index{0};
	std::optional<std::string> old_text;
	std::optional<std::string> new_text;
};

struct pml_change {
	pml_change_type type{pml_change_type::text_changed};
	// 1-based; 0 for presentation-wide changes.
	int slide_index{0};
	std::optional<int> old_slide_index;
	std::optional<std::string> shape_name;
	std::optional<std::string> shape_id;
	std::optional<std::string> old_value;
	std::optional<std::string> new_value;
	std::optional<long long> old_x;
	std::optional<long long> old_y;
	std::optional<long long> old_cx;
	std::optional<long long> old_cy;
	std::optional<long long> new_x;
	std::optional<long long> new_y;
	std::optional<long long> new_cx;
	std::optional<long long> new_cy;
	// Serialized p:txBody of each side, carried so a text change can be replayed.
	std::optional<std::string> old_text_body;
	std::optional<std::string> new_text_body;
	std::vector<pml_text_change> text_changes;
	std::optional<double> match_confidence;

	[[nodiscard]] std::string description() const;
};

struct pml_comparison_result {
	std::vector<pml_change> changes;

	[[nodiscard]] size_t total_changes() const noexcept {
		return changes.size();
	}

	[[nodiscard]] size_t count(pml_change_type type) const noexcept;
	[[nodiscard]] size_t slides_inserted() const noexcept;
	[[nodiscard]] size_t slides_deleted() const noexcept;
	[[nodiscard]] size_t shapes_inserted() const noexcept;
	[[nodiscard]] size_t shapes_deleted() const noexcept;
	[[nodiscard]] size_t shapes_moved() const noexcept;
	[[nodiscard]] size_t shapes_resized() const noexcept;
	// Text and text formatting changes together.
	[[nodiscard]] size_t text_changes() const noexcept;
};

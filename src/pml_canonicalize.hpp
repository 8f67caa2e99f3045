/* pml_canonicalize.hpp - presentation signatures.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "pml_settings.hpp"
#include <optional>
#include <string>
#include <vector>

class package;

inline constexpr const char* PML_PRESENTATION_PART = "ppt/presentation.xml";

enum class pml_shape_kind {
	auto_shape,
	text_box,
	picture,
	table,
	chart,
	smart_art,
	group,
	connector,
	ole_object,
};

[[nodiscard]] const char* pml_shape_kind_name(pml_shape_kind kind) noexcept;

struct pml_placeholder {
	std::string type;
	std::optional<unsigned> index;

	bool operator==(const pml_placeholder& other) const = default;
};

// Offsets and extents in EMU, rotation in 60000ths of a degree.
struct pml_transform {
	long long x{0};
	long long y{0};
	long long cx{0};
	long long cy{0};
	int rotation{0};
	bool flip_h{false};
	bool flip_v{false};

	[[nodiscard]] bool is_near(const pml_transform& other, long long tolerance) const noexcept;
	[[nodiscard]] bool is_same_size(const pml_transform& other, long long tolerance) const noexcept;
	bool operator==(const pml_transform& other) const = default;
};

struct pml_run_properties {
	bool bold{false};
	bool italic{false};
	bool underline{false};
	bool strikethrough{false};
	// Hundredths of a point.
	std::optional<int> font_size;
	std::optional<std::string> font_name;
	std::optional<std::string> font_color;

	bool operator==(const pml_run_properties& other) const = default;
};

struct pml_run {
	std::string text;
	pml_run_properties properties;
};

struct pml_paragraph {
	std::vector<pml_run> runs;
	std::optional<std::string> alignment;
	bool has_bullet{false};

	[[nodiscard]] std::string plain_text() const;
};

struct pml_text_body {
	std::vector<pml_paragraph> paragraphs;
	// Paragraph texts joined by newlines.
	std::string plain_text;
	// The serialized p:txBody element.
	std::string markup;
};

struct pml_shape_signature {
	std::string name;
	unsigned id{0};
	pml_shape_kind kind{pml_shape_kind::auto_shape};
	std::optional<pml_placeholder> placeholder;
	std::optional<pml_transform> transform;
	int z_order{0};
	std::string geometry_hash;
	std::optional<pml_text_body> text_body;
	std::optional<std::string> image_hash;
	std::optional<std::string> table_hash;
	// Rows by columns, for tables.
	std::optional<std::string> table_grid;
	std::optional<std::string> chart_hash;
	std::string fill_hash;
	std::string line_hash;
	std::string effects_hash;
	std::vector<pml_shape_signature> children;
	std::string content_hash;

	[[nodiscard]] std::string plain_text() const;
};

struct pml_slide_signature {
	// 1-based position in the slide list.
	int index{0};
	std::string relationship_id;
	std::string part;
	std::optional<std::string> layout_relationship_id;
	std::optional<std::string> layout_hash;
	std::vector<pml_shape_signature> shapes;
	std::optional<std::string> notes_text;
	std::optional<std::string> title_text;
	std::string content_hash;
	std::optional<std::string> background_hash;
	std::optional<std::string> transition_hash;

	// Title plus the name, kind and text of every shape in z-order.
	[[nodiscard]] std::string fingerprint() const;
};

struct pml_presentation_signature {
	long long slide_cx{9144000};
	long long slide_cy{6858000};
	std::vector<pml_slide_signature> slides;
	std::optional<std::string> theme_hash;
};

// Throws compare_exception(missing_part) when the presentation part is absent.
[[nodiscard]] pml_presentation_signature pml_canonicalize(const package& pkg, const pml_comparer_settings& settings);
// Slide parts in presentation order.
[[nodiscard]] std::vector<std::string> pml_slide_parts(const package& pkg);

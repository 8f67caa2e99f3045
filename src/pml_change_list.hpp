/* pml_change_list.hpp - reviewer-pane items for presentation changes.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "pml_types.hpp"
#include <optional>
#include <string>
#include <vector>

struct pml_change_list_options {
	bool group_by_slide{true};
	size_t max_preview_length{100};
};

struct pml_change_list_item {
	std::string id;
	pml_change_type type{pml_change_type::text_changed};
	int slide_index{0};
	std::optional<std::string> shape_name;
	std::optional<std::string> shape_id;
	std::string summary;
	std::optional<std::string> preview;
	// Number of folded changes, for a per-shape group.
	std::optional<size_t> count;
	std::optional<pml_change> details;
	std::optional<std::string> anchor;
};

[[nodiscard]] std::vector<pml_change_list_item> pml_build_change_list(const std::vector<pml_change>& changes, const pml_change_list_options& options = {});

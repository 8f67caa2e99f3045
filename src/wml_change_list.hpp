/* wml_change_list.hpp - reviewer pane items built from word-processing changes.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "wml_change_extractor.hpp"
#include <string>
#include <vector>

struct wml_change_list_options {
	bool group_adjacent_changes{true};
	bool merge_replacements{true};
	size_t max_preview_length{100};
};

struct wml_change_details {
	std::string old_text;
	std::string new_text;
	std::string format_description;
	std::string author;
	std::string date;
	std::string location_context;
};

struct wml_change_list_item {
	std::string id;
	wml_change_type type{wml_change_type::text_inserted};
	std::string summary;
	std::string preview_text;
	wml_word_count word_count;
	size_t paragraph_index{0};
	int revision_id{0};
	// Every revision the item stands for, for accepting or rejecting it as a whole.
	std::vector<int> revision_ids;
	std::string anchor;
	wml_change_details details;
};

[[nodiscard]] std::vector<wml_change_list_item> wml_build_change_list(const std::vector<wml_change>& changes, const wml_change_list_options& options = {});
[[nodiscard]] std::string wml_location_context(const wml_change& change);
[[nodiscard]] std::string wml_change_summary(wml_change_type type);

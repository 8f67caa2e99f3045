/* wml_change_extractor.hpp - structured change records from word-processing revision markup.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <optional>
#include <pugixml.hpp>
#include <string>
#include <vector>

enum class wml_change_type {
	text_inserted,
	text_deleted,
	text_replaced,
	paragraph_inserted,
	paragraph_deleted,
	format_changed,
	table_row_inserted,
	table_row_deleted,
	table_cell_changed,
	note_changed,
	image_inserted,
	image_deleted,
	image_replaced,
};

[[nodiscard]] const char* wml_change_type_name(wml_change_type type) noexcept;

struct wml_word_count {
	size_t deleted{0};
	size_t inserted{0};
};

struct wml_change {
	wml_change_type type{wml_change_type::text_inserted};
	int revision_id{0};
	// Ordinal of the enclosing paragraph within its part, counting from 1.
	size_t paragraph_index{0};
	std::optional<size_t> table_row;
	std::optional<size_t> table_cell;
	std::string old_text;
	std::string new_text;
	wml_word_count word_count;
	std::string format_description;
	std::string before_rpr;
	std::string after_rpr;
	std::string author;
	std::string date;
	bool in_footnote{false};
	bool in_endnote{false};
	bool in_table{false};
	bool in_textbox{false};
};

// Changes in document order. Revisions without author or date take the defaults.
[[nodiscard]] std::vector<wml_change> wml_extract_changes(pugi::xml_node root, const std::string& default_author = {}, const std::string& default_date = {});
[[nodiscard]] size_t count_words(const std::string& text);

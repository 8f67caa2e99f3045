/* wml_change_extractor.cpp - structured change records from word-processing revision markup.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "wml_change_extractor.hpp"
#include "utils.hpp"
#include "xml_utils.hpp"
#include <array>
#include <utility>

namespace {
constexpr std::array<std::pair<wml_change_type, const char*>, 13> CHANGE_TYPE_NAMES = {{
	{wml_change_type::text_inserted, "TextInserted"},
	{wml_change_type::text_deleted, "TextDeleted"},
	{wml_change_type::text_replaced, "TextReplaced"},
	{wml_change_type::paragraph_inserted, "ParagraphInserted"},
	{wml_change_type::paragraph_deleted, "ParagraphDeleted"},
	{wml_change_type::format_changed, "FormatChanged"},
	{wml_change_type::table_row_inserted, "TableRowInserted"},
	{wml_change_type::table_row_deleted, "TableRowDeleted"},
	{wml_change_type::table_cell_changed, "TableCellChanged"},
	{wml_change_type::note_changed, "NoteChanged"},
	{wml_change_type::image_inserted, "ImageInserted"},
	{wml_change_type::image_deleted, "ImageDeleted"},
	{wml_change_type::image_replaced, "ImageReplaced"},
}};

struct extraction_context {
	size_t paragraph_index{0};
	std::optional<size_t> table_row;
	std::optional<size_t> table_cell;
	bool in_table{false};
	bool in_footnote{false};
	bool in_endnote{false};
	bool in_textbox{false};
};

bool has_visual(pugi::xml_node node) {
	return first_descendant_local(node, "drawing") || first_descendant_local(node, "pict") || first_descendant_local(node, "object");
}

class change_walker {
public:
	change_walker(const std::string& author, const std::string& date) : default_author{author}, default_date{date} {
	}

	void walk(pugi::xml_node node) {
		if (node.type() != pugi::node_element) {
			return;
		}
		const std::string local = local_name(node);
		const auto saved = context;
		if (local == "p") {
			++context.paragraph_index;
		} else if (local == "tbl") {
			context.in_table = true;
			context.table_row.reset();
			context.table_cell.reset();
		} else if (local == "tr") {
			context.table_row = context.table_row ? *context.table_row + 1 : 0;
			context.table_cell.reset();
		} else if (local == "tc") {
			context.table_cell = context.table_cell ? *context.table_cell + 1 : 0;
		} else if (local == "txbxContent") {
			context.in_textbox = true;
		} else if (local == "footnote") {
			context.in_footnote = true;
		} else if (local == "endnote") {
			context.in_endnote = true;
		} else if (local == "ins" || local == "del") {
			record_insert_or_delete(node, local == "ins");
			return;
		} else if (local == "rPrChange" || local == "pPrChange") {
			record_format_change(node, local == "rPrChange");
			return;
		}
		for (auto child : node.children()) {
			walk(child);
		}
		if (local == "tbl" || local == "txbxContent" || local == "footnote" || local == "endnote") {
			// Leaving a container restores its flags but keeps counting paragraphs.
			const size_t paragraphs = context.paragraph_index;
			context = saved;
			context.paragraph_index = paragraphs;
		}
	}

	std::vector<wml_change> changes;

private:
	std::string default_author;
	std::string default_date;
	extraction_context context;

	wml_change make_change(pugi::xml_node revision, wml_change_type type) const {
		wml_change change;
		change.type = type;
		change.revision_id = revision.attribute("w:id").as_int(0);
		change.author = revision.attribute("w:author") ? revision.attribute("w:author").as_string() : default_author;
		change.date = revision.attribute("w:date") ? revision.attribute("w:date").as_string() : default_date;
		change.paragraph_index = context.paragraph_index;
		change.table_row = context.table_row;
		change.table_cell = context.table_cell;
		change.in_table = context.in_table;
		change.in_footnote = context.in_footnote;
		change.in_endnote = context.in_endnote;
		change.in_textbox = context.in_textbox;
		return change;
	}

	void record_insert_or_delete(pugi::xml_node node, bool inserted) {
		const auto parent = node.parent();
		wml_change_type type;
		if (has_local_name(parent, "rPr") && has_local_name(parent.parent(), "pPr")) {
			type = inserted ? wml_change_type::paragraph_inserted : wml_change_type::paragraph_deleted;
		} else if (has_local_name(parent, "trPr")) {
			type = inserted ? wml_change_type::table_row_inserted : wml_change_type::table_row_deleted;
		} else {
			const std::string text = descendant_text(node, inserted ? "t" : "delText");
			type = text.empty() && has_visual(node) ? (inserted ? wml_change_type::image_inserted : wml_change_type::image_deleted) : (inserted ? wml_change_type::text_inserted : wml_change_type::text_deleted);
		}
		auto change = make_change(node, type);
		if (type == wml_change_type::text_inserted) {
			change.new_text = descendant_text(node, "t");
			change.word_count.inserted = count_words(change.new_text);
		} else if (type == wml_change_type::text_deleted) {
			change.old_text = descendant_text(node, "delText");
			change.word_count.deleted = count_words(change.old_text);
		}
		changes.push_back(std::move(change));
	}

	void record_format_change(pugi::xml_node node, bool run_properties) {
		auto change = make_change(node, wml_change_type::format_changed);
		change.format_description = run_properties ? "Format changed" : "Paragraph format changed";
		if (run_properties) {
			if (auto previous = first_child_local(node, "rPr")) {
				change.before_rpr = node_to_string(previous);
			}
			pugi::xml_document current;
			auto copy = current.append_copy(node.parent());
			if (auto nested = first_child_local(copy, "rPrChange")) {
				copy.remove_child(nested);
			}
			change.after_rpr = node_to_string(copy);
			if (auto run = node.parent().parent(); has_local_name(run, "r")) {
				change.new_text = descendant_text(run, "t");
			}
		}
		changes.push_back(std::move(change));
	}
};
}

const char* wml_change_type_name(wml_change_type type) noexcept {
	for (const auto& [value, name] : CHANGE_TYPE_NAMES) {
		if (value == type) {
			return name;
		}
	}
	return "Unknown";
}

size_t count_words(const std::string& text) {
	return split_whitespace(text).size();
}

std::vector<wml_change> wml_extract_changes(pugi::xml_node root, const std::string& default_author, const std::string& default_date) {
	change_walker walker(default_author, default_date);
	walker.walk(root);
	return std::move(walker.changes);
}

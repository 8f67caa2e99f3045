/* wml_change_list.cpp - reviewer pane items built from word-processing changes.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "wml_change_list.hpp"
#include "utils.hpp"

namespace {
bool groupable(wml_change_type type) {
	return type == wml_change_type::format_changed || type == wml_change_type::image_inserted || type == wml_change_type::image_deleted || type == wml_change_type::paragraph_inserted || type == wml_change_type::paragraph_deleted;
}

bool same_group(const wml_change& a, const wml_change& b) {
	return a.type == b.type && a.paragraph_index == b.paragraph_index && a.author == b.author && a.date == b.date && a.in_footnote == b.in_footnote && a.in_endnote == b.in_endnote;
}

wml_change_list_item to_item(const wml_change& change, size_t index, size_t max_preview_length) {
	wml_change_list_item item;
	item.id = "change-" + std::to_string(index);
	item.type = change.type;
	item.summary = wml_change_summary(change.type);
	item.preview_text = truncate_text(change.new_text.empty() ? change.old_text : change.new_text, max_preview_length);
	item.word_count = change.word_count;
	item.paragraph_index = change.paragraph_index;
	item.revision_id = change.revision_id;
	item.revision_ids.push_back(change.revision_id);
	item.anchor = "revision-" + std::to_string(change.revision_id);
	item.details.old_text = change.old_text;
	item.details.new_text = change.new_text;
	item.details.format_description = change.format_description;
	item.details.author = change.author;
	item.details.date = change.date;
	item.details.location_context = wml_location_context(change);
	return item;
}
}

std::string wml_change_summary(wml_change_type type) {
	switch (type) {
		case wml_change_type::text_inserted:
			return "Inserted";
		case wml_change_type::text_deleted:
			return "Deleted";
		case wml_change_type::text_replaced:
			return "Replaced";
		case wml_change_type::paragraph_inserted:
			return "Paragraph inserted";
		case wml_change_type::paragraph_deleted:
			return "Paragraph deleted";
		case wml_change_type::format_changed:
			return "Format changed";
		case wml_change_type::table_row_inserted:
			return "Table row inserted";
		case wml_change_type::table_row_deleted:
			return "Table row deleted";
		case wml_change_type::table_cell_changed:
			return "Table cell changed";
		case wml_change_type::note_changed:
			return "Note changed";
		case wml_change_type::image_inserted:
			return "Image inserted";
		case wml_change_type::image_deleted:
			return "Image deleted";
		case wml_change_type::image_replaced:
			return "Image replaced";
	}
	return {};
}

std::string wml_location_context(const wml_change& change) {
	std::string context;
	auto add = [&](const char* part) {
		if (!context.empty()) {
			context += ", ";
		}
		context += part;
	};
	if (change.in_footnote) {
		add("In footnote");
	}
	if (change.in_endnote) {
		add("In endnote");
	}
	if (change.in_table) {
		add("In table");
	}
	if (change.in_textbox) {
		add("In textbox");
	}
	return context;
}

std::vector<wml_change_list_item> wml_build_change_list(const std::vector<wml_change>& changes, const wml_change_list_options& options) {
	std::vector<wml_change_list_item> items;
	size_t i{0};
	while (i < changes.size()) {
		const auto& change = changes[i];
		const wml_change* next = i + 1 < changes.size() ? &changes[i + 1] : nullptr;
		if (options.merge_replacements && change.type == wml_change_type::text_deleted && next && next->type == wml_change_type::text_inserted && next->paragraph_index == change.paragraph_index) {
			auto item = to_item(change, items.size() + 1, options.max_preview_length);
			item.type = wml_change_type::text_replaced;
			item.summary = wml_change_summary(wml_change_type::text_replaced);
			const size_t half = options.max_preview_length / 2;
			item.preview_text = truncate_text(change.old_text, half) + " → " + truncate_text(next->new_text, half);
			item.word_count.inserted = next->word_count.inserted;
			item.revision_ids.push_back(next->revision_id);
			item.details.new_text = next->new_text;
			items.push_back(std::move(item));
			i += 2;
			continue;
		}
		if (options.group_adjacent_changes && groupable(change.type)) {
			size_t j = i + 1;
			while (j < changes.size() && same_group(change, changes[j])) {
				++j;
			}
			auto item = to_item(change, items.size() + 1, options.max_preview_length);
			for (size_t k = i + 1; k < j; ++k) {
				item.revision_ids.push_back(changes[k].revision_id);
			}
			if (j - i > 1) {
				item.summary += " (" + std::to_string(j - i) + " revisions)";
			}
			items.push_back(std::move(item));
			i = j;
			continue;
		}
		items.push_back(to_item(change, items.size() + 1, options.max_preview_length));
		++i;
	}
	return items;
}

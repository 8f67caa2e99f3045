/* pml_change_list.cpp - reviewer-pane items for presentation changes.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "pml_change_list.hpp"
#include "utils.hpp"
#include <algorithm>
#include <utility>

namespace {
std::optional<std::string> anchor_for(const pml_change& change) {
	if (change.slide_index <= 0) {
		return std::nullopt;
	}
	std::string anchor = "slide-" + std::to_string(change.slide_index);
	if (change.shape_id) {
		anchor += "-shape-" + *change.shape_id;
	}
	return anchor;
}

std::optional<std::string> preview_of(const pml_change& change, size_t max_length) {
	if (!change.text_changes.empty()) {
		const auto& first = change.text_changes.front();
		return truncate_text(first.new_text.value_or(first.old_text.value_or("")), max_length);
	}
	if (change.new_value) {
		return truncate_text(*change.new_value, max_length);
	}
	if (change.old_value) {
		return truncate_text(*change.old_value, max_length);
	}
	return std::nullopt;
}

class change_list_builder {
public:
	explicit change_list_builder(const pml_change_list_options& options) : options{options} {
	}

	void add_single(const pml_change& change) {
		auto& item = next_item(change);
		item.summary = change.description();
		item.preview = preview_of(change, options.max_preview_length);
		item.details = change;
	}

	void add_shape_group(const std::vector<const pml_change*>& group) {
		const pml_change& first = *group.front();
		auto& item = next_item(first);
		item.summary = std::to_string(group.size()) + " changes in '" + first.shape_name.value_or("Shape") + "' on slide " + std::to_string(first.slide_index);
		item.count = group.size();
	}

	// Splits a run of same-slide changes by shape, keeping the order in which shapes first appear.
	void flush(std::vector<const pml_change*>& run) {
		if (run.size() < 2 || !options.group_by_slide) {
			for (const auto* change : run) {
				add_single(*change);
			}
			run.clear();
			return;
		}
		std::vector<std::pair<std::string, std::vector<const pml_change*>>> by_shape;
		std::vector<const pml_change*> unnamed;
		for (const auto* change : run) {
			if (!change->shape_name) {
				unnamed.push_back(change);
				continue;
			}
			auto it = std::find_if(by_shape.begin(), by_shape.end(), [&](const auto& entry) {
				return entry.first == *change->shape_name;
			});
			if (it == by_shape.end()) {
				by_shape.emplace_back(*change->shape_name, std::vector<const pml_change*>{change});
			} else {
				it->second.push_back(change);
			}
		}
		for (const auto& [name, group] : by_shape) {
			if (group.size() > 1) {
				add_shape_group(group);
			} else {
				add_single(*group.front());
			}
		}
		for (const auto* change : unnamed) {
			add_single(*change);
		}
		run.clear();
	}

	std::vector<pml_change_list_item> take() {
		return std::move(items);
	}

private:
	const pml_change_list_options& options;
	std::vector<pml_change_list_item> items;

	pml_change_list_item& next_item(const pml_change& change) {
		pml_change_list_item item;
		item.id = "change-" + std::to_string(items.size() + 1);
		item.type = change.type;
		item.slide_index = change.slide_index;
		item.shape_name = change.shape_name;
		item.shape_id = change.shape_id;
		item.anchor = anchor_for(change);
		items.push_back(std::move(item));
		return items.back();
	}
};

bool groupable(const pml_change& change) {
	return change.slide_index > 0 && !is_slide_change(change.type);
}
}

std::vector<pml_change_list_item> pml_build_change_list(const std::vector<pml_change>& changes, const pml_change_list_options& options) {
	change_list_builder builder{options};
	std::vector<const pml_change*> run;
	for (const auto& change : changes) {
		if (!run.empty()) {
			const auto* last = run.back();
			const bool extends = options.group_by_slide && groupable(change) && groupable(*last) && change.slide_index == last->slide_index;
			if (!extends) {
				builder.flush(run);
			}
		}
		run.push_back(&change);
	}
	builder.flush(run);
	return builder.take();
}

/* pml_diff.cpp - change records between two presentation signatures.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "pml_diff.hpp"
#include "pml_shape_match.hpp"
#include "pml_slide_match.hpp"
#include "sequence_alignment.hpp"
#include <algorithm>
#include <map>
#include <wx/log.h>

namespace {
bool is_text_kind(pml_shape_kind kind) noexcept {
	return kind == pml_shape_kind::auto_shape || kind == pml_shape_kind::text_box;
}

void set_old_transform(pml_change& change, const std::optional<pml_transform>& transform) {
	if (transform) {
		change.old_x = transform->x;
		change.old_y = transform->y;
		change.old_cx = transform->cx;
		change.old_cy = transform->cy;
	}
}

void set_new_transform(pml_change& change, const std::optional<pml_transform>& transform) {
	if (transform) {
		change.new_x = transform->x;
		change.new_y = transform->y;
		change.new_cx = transform->cx;
		change.new_cy = transform->cy;
	}
}

// Index of the first run whose formatting differs, or -1 when the paragraphs are formatted alike.
int first_format_difference(const pml_paragraph& older, const pml_paragraph& newer) {
	if (older.alignment != newer.alignment || older.has_bullet != newer.has_bullet) {
		return 0;
	}
	if (older.runs.size() != newer.runs.size()) {
		return static_cast<int>(std::min(older.runs.size(), newer.runs.size()));
	}
	for (size_t i = 0; i < older.runs.size(); ++i) {
		if (older.runs[i].properties != newer.runs[i].properties) {
			return static_cast<int>(i);
		}
	}
	return -1;
}

std::vector<pml_text_change> formatting_changes(const pml_text_body& older, const pml_text_body& newer) {
	std::vector<pml_text_change> changes;
	if (older.paragraphs.size() != newer.paragraphs.size()) {
		pml_text_change change;
		change.type = pml_text_change_type::format_only;
		change.paragraph_index = static_cast<int>(std::min(older.paragraphs.size(), newer.paragraphs.size()));
		changes.push_back(change);
		return changes;
	}
	for (size_t i = 0; i < older.paragraphs.size(); ++i) {
		const int run = first_format_difference(older.paragraphs[i], newer.paragraphs[i]);
		if (run < 0) {
			continue;
		}
		pml_text_change change;
		change.type = pml_text_change_type::format_only;
		change.paragraph_index = static_cast<int>(i);
		change.run_index = run;
		change.old_text = older.paragraphs[i].plain_text();
		change.new_text = newer.paragraphs[i].plain_text();
		changes.push_back(change);
	}
	return changes;
}

class presentation_diff {
public:
	presentation_diff(const pml_comparer_settings& settings, pml_comparison_result& result) : settings{settings}, result{result} {
	}

	void compare_properties(const pml_presentation_signature& older, const pml_presentation_signature& newer) {
		if (older.slide_cx != newer.slide_cx || older.slide_cy != newer.slide_cy) {
			pml_change change;
			change.type = pml_change_type::slide_size_changed;
			change.old_value = std::to_string(older.slide_cx) + "x" + std::to_string(older.slide_cy);
			change.new_value = std::to_string(newer.slide_cx) + "x" + std::to_string(newer.slide_cy);
			result.changes.push_back(change);
		}
		if (older.theme_hash != newer.theme_hash) {
			pml_change change;
			change.type = pml_change_type::theme_changed;
			change.old_value = older.theme_hash;
			change.new_value = newer.theme_hash;
			result.changes.push_back(change);
		}
	}

	void process(const pml_slide_match& match) {
		switch (match.kind) {
			case pml_slide_match_kind::inserted:
				if (settings.compare_slide_structure) {
					pml_change change;
					change.type = pml_change_type::slide_inserted;
					change.slide_index = match.new_slide->index;
					change.new_value = match.new_slide->title_text;
					result.changes.push_back(change);
				}
				break;
			case pml_slide_match_kind::deleted:
				if (settings.compare_slide_structure) {
					pml_change change;
					change.type = pml_change_type::slide_deleted;
					change.slide_index = match.old_slide->index;
					change.old_slide_index = match.old_slide->index;
					change.old_value = match.old_slide->title_text;
					result.changes.push_back(change);
				}
				break;
			case pml_slide_match_kind::matched:
				if (settings.compare_slide_structure && match.moved) {
					pml_change change;
					change.type = pml_change_type::slide_moved;
					change.slide_index = match.new_slide->index;
					change.old_slide_index = match.old_slide->index;
					change.match_confidence = match.similarity;
					result.changes.push_back(change);
				}
				compare_slides(*match.old_slide, *match.new_slide);
				break;
		}
	}

private:
	const pml_comparer_settings& settings;
	pml_comparison_result& result;

	pml_change slide_change(pml_change_type type, int slide_index) {
		pml_change change;
		change.type = type;
		change.slide_index = slide_index;
		return change;
	}

	pml_change shape_change(pml_change_type type, int slide_index, const pml_shape_signature& shape) {
		auto change = slide_change(type, slide_index);
		change.shape_name = shape.name;
		change.shape_id = std::to_string(shape.id);
		return change;
	}

	void compare_slides(const pml_slide_signature& older, const pml_slide_signature& newer) {
		const int slide = newer.index;
		if (older.layout_hash != newer.layout_hash) {
			result.changes.push_back(slide_change(pml_change_type::slide_layout_changed, slide));
		}
		if (older.background_hash != newer.background_hash) {
			result.changes.push_back(slide_change(pml_change_type::slide_background_changed, slide));
		}
		if (settings.compare_transitions && older.transition_hash != newer.transition_hash) {
			result.changes.push_back(slide_change(pml_change_type::slide_transition_changed, slide));
		}
		if (settings.compare_text_content && settings.compare_notes && older.notes_text != newer.notes_text) {
			auto change = slide_change(pml_change_type::slide_notes_changed, slide);
			change.old_value = older.notes_text;
			change.new_value = newer.notes_text;
			result.changes.push_back(change);
		}
		if (!settings.compare_shape_structure) {
			return;
		}
		for (const auto& match : pml_match_shapes(older, newer, settings)) {
			switch (match.kind) {
				case pml_shape_match_kind::inserted: {
					auto change = shape_change(pml_change_type::shape_inserted, slide, *match.new_shape);
					set_new_transform(change, match.new_shape->transform);
					if (match.new_shape->text_body) {
						change.new_value = match.new_shape->text_body->plain_text;
					}
					result.changes.push_back(change);
					break;
				}
				case pml_shape_match_kind::deleted: {
					auto change = shape_change(pml_change_type::shape_deleted, slide, *match.old_shape);
					set_old_transform(change, match.old_shape->transform);
					if (match.old_shape->text_body) {
						change.old_value = match.old_shape->text_body->plain_text;
					}
					result.changes.push_back(change);
					break;
				}
				case pml_shape_match_kind::matched:
					compare_shapes(*match.old_shape, *match.new_shape, slide, match.score);
					break;
			}
		}
	}

	void compare_shapes(const pml_shape_signature& older, const pml_shape_signature& newer, int slide, double score) {
		if (settings.compare_shape_transforms && older.transform && newer.transform) {
			const auto& from = *older.transform;
			const auto& to = *newer.transform;
			if (!from.is_near(to, settings.position_tolerance)) {
				add_transform_change(pml_change_type::shape_moved, older, newer, slide);
			}
			if (!from.is_same_size(to, settings.position_tolerance)) {
				add_transform_change(pml_change_type::shape_resized, older, newer, slide);
			}
			if (from.rotation != to.rotation) {
				auto change = shape_change(pml_change_type::shape_rotated, slide, newer);
				change.old_value = std::to_string(from.rotation);
				change.new_value = std::to_string(to.rotation);
				result.changes.push_back(change);
			}
		}
		if (older.z_order != newer.z_order) {
			auto change = shape_change(pml_change_type::shape_z_order_changed, slide, newer);
			change.old_value = std::to_string(older.z_order);
			change.new_value = std::to_string(newer.z_order);
			result.changes.push_back(change);
		}
		if (older.kind != newer.kind && !(is_text_kind(older.kind) && is_text_kind(newer.kind))) {
			auto change = shape_change(pml_change_type::shape_type_changed, slide, newer);
			change.old_value = pml_shape_kind_name(older.kind);
			change.new_value = pml_shape_kind_name(newer.kind);
			result.changes.push_back(change);
			return;
		}
		if (settings.compare_shape_styles) {
			compare_styles(older, newer, slide);
		}
		switch (older.kind) {
			case pml_shape_kind::auto_shape:
			case pml_shape_kind::text_box:
				if (settings.compare_text_content) {
					compare_text(older, newer, slide, score);
				}
				break;
			case pml_shape_kind::picture:
				if (settings.compare_image_content && older.image_hash != newer.image_hash) {
					result.changes.push_back(shape_change(pml_change_type::image_replaced, slide, newer));
				}
				break;
			case pml_shape_kind::table:
				if (!settings.compare_tables) {
					break;
				}
				if (older.table_grid != newer.table_grid) {
					auto change = shape_change(pml_change_type::table_structure_changed, slide, newer);
					change.old_value = older.table_grid;
					change.new_value = newer.table_grid;
					result.changes.push_back(change);
				} else if (older.table_hash != newer.table_hash) {
					result.changes.push_back(shape_change(pml_change_type::table_content_changed, slide, newer));
				}
				break;
			case pml_shape_kind::chart:
				if (settings.compare_charts && older.chart_hash != newer.chart_hash) {
					result.changes.push_back(shape_change(pml_change_type::chart_data_changed, slide, newer));
				}
				break;
			case pml_shape_kind::group:
				compare_group(older, newer, slide);
				break;
			default:
				break;
		}
	}

	void add_transform_change(pml_change_type type, const pml_shape_signature& older, const pml_shape_signature& newer, int slide) {
		auto change = shape_change(type, slide, newer);
		set_old_transform(change, older.transform);
		set_new_transform(change, newer.transform);
		result.changes.push_back(change);
	}

	void compare_styles(const pml_shape_signature& older, const pml_shape_signature& newer, int slide) {
		if (older.fill_hash != newer.fill_hash) {
			result.changes.push_back(shape_change(pml_change_type::shape_fill_changed, slide, newer));
		}
		if (older.line_hash != newer.line_hash) {
			result.changes.push_back(shape_change(pml_change_type::shape_line_changed, slide, newer));
		}
		if (older.effects_hash != newer.effects_hash) {
			result.changes.push_back(shape_change(pml_change_type::shape_effects_changed, slide, newer));
		}
	}

	void compare_text(const pml_shape_signature& older, const pml_shape_signature& newer, int slide, double score) {
		if (!older.text_body && !newer.text_body) {
			return;
		}
		const bool text_differs = !older.text_body || !newer.text_body || older.text_body->plain_text != newer.text_body->plain_text;
		std::vector<pml_text_change> formatting;
		if (!text_differs) {
			if (!settings.compare_text_formatting) {
				return;
			}
			formatting = formatting_changes(*older.text_body, *newer.text_body);
			if (formatting.empty()) {
				return;
			}
		}
		auto change = shape_change(text_differs ? pml_change_type::text_changed : pml_change_type::text_formatting_changed, slide, newer);
		change.match_confidence = score;
		if (older.text_body) {
			change.old_value = older.text_body->plain_text;
			change.old_text_body = older.text_body->markup;
		}
		if (newer.text_body) {
			change.new_value = newer.text_body->plain_text;
			change.new_text_body = newer.text_body->markup;
		}
		if (!text_differs) {
			change.text_changes = std::move(formatting);
		} else if (older.text_body && newer.text_body) {
			change.text_changes = pml_text_changes(*older.text_body, *newer.text_body);
		}
		result.changes.push_back(std::move(change));
	}

	void compare_group(const pml_shape_signature& older, const pml_shape_signature& newer, int slide) {
		std::map<std::string, const pml_shape_signature*> old_members;
		std::map<std::string, const pml_shape_signature*> new_members;
		for (const auto& child : older.children) {
			old_members.emplace(child.name, &child);
		}
		for (const auto& child : newer.children) {
			new_members.emplace(child.name, &child);
		}
		bool same_members = old_members.size() == new_members.size();
		for (auto it = old_members.begin(); same_members && it != old_members.end(); ++it) {
			same_members = new_members.count(it->first) > 0;
		}
		if (!same_members) {
			auto change = shape_change(pml_change_type::group_membership_changed, slide, newer);
			change.old_value = std::to_string(older.children.size());
			change.new_value = std::to_string(newer.children.size());
			result.changes.push_back(change);
			return;
		}
		for (const auto& [name, member] : old_members) {
			const auto* counterpart = new_members.at(name);
			if (member->content_hash != counterpart->content_hash || member->transform != counterpart->transform) {
				compare_shapes(*member, *counterpart, slide, 1.0);
			}
		}
	}
};
}

std::vector<pml_text_change> pml_text_changes(const pml_text_body& older, const pml_text_body& newer) {
	std::vector<std::string> old_texts;
	std::vector<std::string> new_texts;
	for (const auto& paragraph : older.paragraphs) {
		old_texts.push_back(paragraph.plain_text());
	}
	for (const auto& paragraph : newer.paragraphs) {
		new_texts.push_back(paragraph.plain_text());
	}
	std::vector<pml_text_change> changes;
	std::vector<size_t> removed;
	std::vector<size_t> inserted;
	const auto flush = [&] {
		const size_t paired = std::min(removed.size(), inserted.size());
		for (size_t k = 0; k < paired; ++k) {
			changes.push_back({pml_text_change_type::replace, static_cast<int>(inserted[k]), 0, old_texts[removed[k]], new_texts[inserted[k]]});
		}
		for (size_t k = paired; k < removed.size(); ++k) {
			changes.push_back({pml_text_change_type::remove, static_cast<int>(removed[k]), 0, old_texts[removed[k]], std::nullopt});
		}
		for (size_t k = paired; k < inserted.size(); ++k) {
			changes.push_back({pml_text_change_type::insert, static_cast<int>(inserted[k]), 0, std::nullopt, new_texts[inserted[k]]});
		}
		removed.clear();
		inserted.clear();
	};
	for (const auto& [first, second] : align_sequences(old_texts, new_texts)) {
		if (first && second) {
			flush();
		} else if (first) {
			removed.push_back(*first);
		} else if (second) {
			inserted.push_back(*second);
		}
	}
	flush();
	return changes;
}

pml_comparison_result pml_compute_diff(const pml_presentation_signature& older, const pml_presentation_signature& newer, const pml_comparer_settings& settings) {
	pml_comparison_result result;
	presentation_diff diff{settings, result};
	diff.compare_properties(older, newer);
	for (const auto& match : pml_match_slides(older, newer, settings)) {
		diff.process(match);
	}
	wxLogVerbose("Presentation comparison: %zu changes, %zu slides inserted, %zu slides deleted", result.total_changes(), result.slides_inserted(), result.slides_deleted());
	return result;
}

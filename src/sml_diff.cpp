/* sml_diff.cpp - computes the changes between two workbook signatures.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "sml_diff.hpp"
#include "sequence_alignment.hpp"
#include "utils.hpp"
#include <cmath>
#include <map>
#include <set>
#include <wx/log.h>

namespace {
enum class sheet_match_kind {
	matched,
	renamed,
	deleted,
	added,
};

struct sheet_match {
	sheet_match_kind kind;
	const sml_worksheet_signature* older{nullptr};
	const sml_worksheet_signature* newer{nullptr};
};

using row_index_map = std::map<int, std::map<int, const sml_cell_signature*>>;

row_index_map index_by_row(const sml_worksheet_signature& sheet) {
	row_index_map rows;
	for (const auto& [address, cell] : sheet.cells) {
		rows[cell.row][cell.column] = &cell;
	}
	return rows;
}

bool values_equal(const std::string& first, const std::string& second, const sml_comparer_settings& settings) {
	if (settings.numeric_tolerance > 0.0) {
		const auto a = parse_double(first);
		const auto b = parse_double(second);
		if (a && b) {
			return std::fabs(*a - *b) <= settings.numeric_tolerance;
		}
	}
	if (settings.case_insensitive_values) {
		return to_lower_ascii(first) == to_lower_ascii(second);
	}
	return first == second;
}

std::vector<sheet_match> detect_renames(std::vector<const sml_worksheet_signature*>& unmatched_old, std::vector<const sml_worksheet_signature*>& unmatched_new, const sml_comparer_settings& settings) {
	std::vector<sheet_match> renames;
	std::map<const sml_worksheet_signature*, std::string> new_hashes;
	for (const auto* sheet : unmatched_new) {
		new_hashes[sheet] = sheet->content_hash();
	}
	std::set<const sml_worksheet_signature*> used_old;
	std::set<const sml_worksheet_signature*> used_new;
	for (const auto* old_sheet : unmatched_old) {
		const std::string hash = old_sheet->content_hash();
		for (const auto* new_sheet : unmatched_new) {
			if (!used_new.contains(new_sheet) && new_hashes[new_sheet] == hash) {
				renames.push_back({sheet_match_kind::renamed, old_sheet, new_sheet});
				used_old.insert(old_sheet);
				used_new.insert(new_sheet);
				break;
			}
		}
	}
	for (const auto* old_sheet : unmatched_old) {
		if (used_old.contains(old_sheet)) {
			continue;
		}
		double best_similarity = 0.0;
		const sml_worksheet_signature* best = nullptr;
		for (const auto* new_sheet : unmatched_new) {
			if (used_new.contains(new_sheet)) {
				continue;
			}
			const double similarity = sml_sheet_similarity(*old_sheet, *new_sheet);
			if (similarity > best_similarity && similarity >= settings.sheet_rename_similarity_threshold) {
				best_similarity = similarity;
				best = new_sheet;
			}
		}
		if (best != nullptr) {
			wxLogVerbose("Sheet '%s' matched '%s' with similarity %.2f", old_sheet->name, best->name, best_similarity);
			renames.push_back({sheet_match_kind::renamed, old_sheet, best});
			used_old.insert(old_sheet);
			used_new.insert(best);
		}
	}
	std::erase_if(unmatched_old, [&](const auto* sheet) { return used_old.contains(sheet); });
	std::erase_if(unmatched_new, [&](const auto* sheet) { return used_new.contains(sheet); });
	return renames;
}

std::vector<sheet_match> match_sheets(const sml_workbook_signature& older, const sml_workbook_signature& newer, const sml_comparer_settings& settings) {
	std::vector<sheet_match> matches;
	std::vector<const sml_worksheet_signature*> unmatched_old;
	std::vector<const sml_worksheet_signature*> unmatched_new;
	for (const auto& sheet : newer.sheets) {
		if (const auto* old_sheet = older.find_sheet(sheet.name)) {
			matches.push_back({sheet_match_kind::matched, old_sheet, &sheet});
		} else {
			unmatched_new.push_back(&sheet);
		}
	}
	for (const auto& sheet : older.sheets) {
		if (newer.find_sheet(sheet.name) == nullptr) {
			unmatched_old.push_back(&sheet);
		}
	}
	if (settings.enable_sheet_rename_detection && !unmatched_old.empty() && !unmatched_new.empty()) {
		auto renames = detect_renames(unmatched_old, unmatched_new, settings);
		matches.insert(matches.end(), renames.begin(), renames.end());
	}
	for (const auto* sheet : unmatched_old) {
		matches.push_back({sheet_match_kind::deleted, sheet, nullptr});
	}
	for (const auto* sheet : unmatched_new) {
		matches.push_back({sheet_match_kind::added, nullptr, sheet});
	}
	return matches;
}

// Pairs every populated index of both sheets: through the signatures when aligning, by equal index otherwise.
std::vector<std::pair<std::optional<int>, std::optional<int>>> align_indices(const std::set<int>& first, const std::set<int>& second, const std::map<int, std::string>& first_signatures, const std::map<int, std::string>& second_signatures, bool align) {
	std::vector<std::pair<std::optional<int>, std::optional<int>>> pairs;
	if (!align) {
		std::set<int> all = first;
		all.insert(second.begin(), second.end());
		for (const int index : all) {
			pairs.emplace_back(index, index);
		}
		return pairs;
	}
	const std::vector<int> first_indices(first.begin(), first.end());
	const std::vector<int> second_indices(second.begin(), second.end());
	const auto signatures_of = [](const std::vector<int>& indices, const std::map<int, std::string>& signatures) {
		std::vector<std::string> keys;
		keys.reserve(indices.size());
		for (const int index : indices) {
			const auto it = signatures.find(index);
			keys.push_back(it == signatures.end() ? std::string{} : it->second);
		}
		return keys;
	};
	for (const auto& [a, b] : align_sequences(signatures_of(first_indices, first_signatures), signatures_of(second_indices, second_signatures))) {
		pairs.emplace_back(a ? std::optional<int>(first_indices[*a]) : std::nullopt, b ? std::optional<int>(second_indices[*b]) : std::nullopt);
	}
	return pairs;
}

class sheet_comparison {
public:
	sheet_comparison(const sml_worksheet_signature& old_sheet, const sml_worksheet_signature& new_sheet, const sml_comparer_settings& options, sml_comparison_result& output) : older{old_sheet}, newer{new_sheet}, settings{options}, result{output} {
	}

	void run() {
		compare_cells();
		if (settings.compare_comments) {
			compare_comments();
		}
		if (settings.compare_data_validation) {
			compare_data_validations();
		}
		if (settings.compare_merged_cells) {
			compare_merged_cells();
		}
		if (settings.compare_conditional_formatting) {
			compare_conditional_formats();
		}
		if (settings.compare_hyperlinks) {
			compare_hyperlinks();
		}
	}

private:
	const sml_worksheet_signature& older;
	const sml_worksheet_signature& newer;
	const sml_comparer_settings& settings;
	sml_comparison_result& result;

	sml_change make(sml_change_type type) const {
		sml_change change;
		change.type = type;
		change.sheet_name = newer.name;
		return change;
	}

	void compare_cells() {
		const auto rows = align_indices(older.populated_rows, newer.populated_rows, older.row_signatures, newer.row_signatures, settings.enable_row_alignment);
		const auto columns = align_indices(older.populated_columns, newer.populated_columns, older.column_signatures, newer.column_signatures, settings.enable_column_alignment);
		std::map<int, size_t> old_column_step;
		std::map<int, size_t> new_column_step;
		for (size_t i = 0; i < columns.size(); ++i) {
			const auto& [old_column, new_column] = columns[i];
			if (old_column) {
				old_column_step[*old_column] = i;
			}
			if (new_column) {
				new_column_step[*new_column] = i;
			}
			if (old_column && !new_column) {
				auto change = make(sml_change_type::column_deleted);
				change.column_index = *old_column;
				result.changes.push_back(std::move(change));
			} else if (!old_column && new_column) {
				auto change = make(sml_change_type::column_inserted);
				change.column_index = *new_column;
				result.changes.push_back(std::move(change));
			}
		}
		const auto old_rows = index_by_row(older);
		const auto new_rows = index_by_row(newer);
		static const std::map<int, const sml_cell_signature*> empty_row;
		const auto row_cells = [&](const row_index_map& rows_map, int row) -> const std::map<int, const sml_cell_signature*>& {
			const auto it = rows_map.find(row);
			return it == rows_map.end() ? empty_row : it->second;
		};
		for (const auto& [old_row, new_row] : rows) {
			if (old_row && !new_row) {
				auto change = make(sml_change_type::row_deleted);
				change.row_index = *old_row;
				result.changes.push_back(std::move(change));
				continue;
			}
			if (!old_row && new_row) {
				auto change = make(sml_change_type::row_inserted);
				change.row_index = *new_row;
				result.changes.push_back(std::move(change));
				continue;
			}
			const auto& cells1 = row_cells(old_rows, *old_row);
			const auto& cells2 = row_cells(new_rows, *new_row);
			std::set<size_t> steps;
			for (const auto& [column, cell] : cells1) {
				const size_t step = old_column_step.at(column);
				if (columns[step].second) {
					steps.insert(step);
				}
			}
			for (const auto& [column, cell] : cells2) {
				const size_t step = new_column_step.at(column);
				if (columns[step].first) {
					steps.insert(step);
				}
			}
			for (const size_t step : steps) {
				const int old_column = *columns[step].first;
				const int new_column = *columns[step].second;
				const auto first = cells1.find(old_column);
				const auto second = cells2.find(new_column);
				const sml_cell_signature* cell1 = first == cells1.end() ? nullptr : first->second;
				const sml_cell_signature* cell2 = second == cells2.end() ? nullptr : second->second;
				if (cell1 == nullptr) {
					auto change = make(sml_change_type::cell_added);
					change.cell_address = cell2->address;
					change.new_value = cell2->resolved_value;
					change.new_formula = cell2->formula;
					change.new_format = cell2->format;
					result.changes.push_back(std::move(change));
				} else if (cell2 == nullptr) {
					auto change = make(sml_change_type::cell_deleted);
					change.cell_address = cell1->address;
					change.old_value = cell1->resolved_value;
					change.old_formula = cell1->formula;
					change.old_format = cell1->format;
					result.changes.push_back(std::move(change));
				} else {
					compare_cell(*cell1, *cell2);
				}
			}
		}
	}

	// Value, then formula, then formatting; only the first difference found is reported.
	void compare_cell(const sml_cell_signature& cell1, const sml_cell_signature& cell2) {
		if (cell1.content_hash == cell2.content_hash && (!settings.compare_formatting || cell1.format == cell2.format)) {
			return;
		}
		const auto make_cell_change = [&](sml_change_type type) {
			auto change = make(type);
			change.cell_address = cell2.address;
			change.old_value = cell1.resolved_value;
			change.new_value = cell2.resolved_value;
			change.old_formula = cell1.formula;
			change.new_formula = cell2.formula;
			return change;
		};
		if (settings.compare_values && !values_equal(cell1.resolved_value.value_or(""), cell2.resolved_value.value_or(""), settings)) {
			result.changes.push_back(make_cell_change(sml_change_type::value_changed));
			return;
		}
		if (settings.compare_formulas && cell1.formula.value_or("") != cell2.formula.value_or("")) {
			result.changes.push_back(make_cell_change(sml_change_type::formula_changed));
			return;
		}
		if (settings.compare_formatting && cell1.format != cell2.format) {
			auto change = make_cell_change(sml_change_type::format_changed);
			change.old_formula.reset();
			change.new_formula.reset();
			change.old_format = cell1.format;
			change.new_format = cell2.format;
			result.changes.push_back(std::move(change));
		}
	}

	void compare_comments() {
		std::set<std::string> addresses;
		for (const auto& [address, comment] : older.comments) {
			addresses.insert(address);
		}
		for (const auto& [address, comment] : newer.comments) {
			addresses.insert(address);
		}
		for (const auto& address : addresses) {
			const auto first = older.comments.find(address);
			const auto second = newer.comments.find(address);
			const bool in_old = first != older.comments.end();
			const bool in_new = second != newer.comments.end();
			if (in_old && in_new && first->second.text == second->second.text && first->second.author == second->second.author) {
				continue;
			}
			auto change = make(!in_old ? sml_change_type::comment_added : !in_new ? sml_change_type::comment_deleted : sml_change_type::comment_changed);
			change.cell_address = address;
			if (in_old) {
				change.old_comment = first->second.text;
				change.comment_author = first->second.author;
			}
			if (in_new) {
				change.new_comment = second->second.text;
				change.comment_author = second->second.author;
			}
			result.changes.push_back(std::move(change));
		}
	}

	void compare_data_validations() {
		std::set<std::string> keys;
		for (const auto& [key, validation] : older.data_validations) {
			keys.insert(key);
		}
		for (const auto& [key, validation] : newer.data_validations) {
			keys.insert(key);
		}
		for (const auto& key : keys) {
			const auto first = older.data_validations.find(key);
			const auto second = newer.data_validations.find(key);
			const bool in_old = first != older.data_validations.end();
			const bool in_new = second != newer.data_validations.end();
			if (in_old && in_new && first->second.hash() == second->second.hash()) {
				continue;
			}
			auto change = make(!in_old ? sml_change_type::data_validation_added : !in_new ? sml_change_type::data_validation_deleted : sml_change_type::data_validation_changed);
			change.cell_address = key;
			if (in_old) {
				change.data_validation_type = first->second.validation_type;
				change.old_data_validation = first->second.to_string();
			}
			if (in_new) {
				change.data_validation_type = second->second.validation_type;
				change.new_data_validation = second->second.to_string();
			}
			result.changes.push_back(std::move(change));
		}
	}

	void compare_merged_cells() {
		for (const auto& range : older.merged_ranges) {
			if (!newer.merged_ranges.contains(range)) {
				auto change = make(sml_change_type::merged_cell_deleted);
				change.merged_cell_range = range;
				result.changes.push_back(std::move(change));
			}
		}
		for (const auto& range : newer.merged_ranges) {
			if (!older.merged_ranges.contains(range)) {
				auto change = make(sml_change_type::merged_cell_added);
				change.merged_cell_range = range;
				result.changes.push_back(std::move(change));
			}
		}
	}

	void compare_conditional_formats() {
		std::set<std::string> ranges;
		for (const auto& [range, rules] : older.conditional_formats) {
			ranges.insert(range);
		}
		for (const auto& [range, rules] : newer.conditional_formats) {
			ranges.insert(range);
		}
		for (const auto& range : ranges) {
			const auto first = older.conditional_formats.find(range);
			const auto second = newer.conditional_formats.find(range);
			const bool in_old = first != older.conditional_formats.end();
			const bool in_new = second != newer.conditional_formats.end();
			if (in_old && in_new && first->second == second->second) {
				continue;
			}
			auto change = make(!in_old ? sml_change_type::conditional_format_added : !in_new ? sml_change_type::conditional_format_deleted : sml_change_type::conditional_format_changed);
			change.conditional_format_range = range;
			if (in_old) {
				change.old_conditional_format = first->second;
			}
			if (in_new) {
				change.new_conditional_format = second->second;
			}
			result.changes.push_back(std::move(change));
		}
	}

	void compare_hyperlinks() {
		std::set<std::string> addresses;
		for (const auto& [address, link] : older.hyperlinks) {
			addresses.insert(address);
		}
		for (const auto& [address, link] : newer.hyperlinks) {
			addresses.insert(address);
		}
		for (const auto& address : addresses) {
			const auto first = older.hyperlinks.find(address);
			const auto second = newer.hyperlinks.find(address);
			const bool in_old = first != older.hyperlinks.end();
			const bool in_new = second != newer.hyperlinks.end();
			if (in_old && in_new && first->second.hash() == second->second.hash()) {
				continue;
			}
			auto change = make(!in_old ? sml_change_type::hyperlink_added : !in_new ? sml_change_type::hyperlink_deleted : sml_change_type::hyperlink_changed);
			change.cell_address = address;
			if (in_old) {
				change.old_hyperlink = first->second.target;
			}
			if (in_new) {
				change.new_hyperlink = second->second.target;
			}
			result.changes.push_back(std::move(change));
		}
	}
};

void compare_named_ranges(const sml_workbook_signature& older, const sml_workbook_signature& newer, sml_comparison_result& result) {
	std::set<std::string> names;
	for (const auto& [name, value] : older.defined_names) {
		names.insert(name);
	}
	for (const auto& [name, value] : newer.defined_names) {
		names.insert(name);
	}
	for (const auto& name : names) {
		const auto first = older.defined_names.find(name);
		const auto second = newer.defined_names.find(name);
		const bool in_old = first != older.defined_names.end();
		const bool in_new = second != newer.defined_names.end();
		if (in_old && in_new && first->second == second->second) {
			continue;
		}
		sml_change change;
		change.type = !in_old ? sml_change_type::named_range_added : !in_new ? sml_change_type::named_range_deleted : sml_change_type::named_range_changed;
		change.named_range_name = name;
		if (in_old) {
			change.old_named_range_value = first->second;
		}
		if (in_new) {
			change.new_named_range_value = second->second;
		}
		result.changes.push_back(std::move(change));
	}
}
}

double sml_sheet_similarity(const sml_worksheet_signature& first, const sml_worksheet_signature& second) {
	if (first.cells.empty() && second.cells.empty()) {
		return 1.0;
	}
	if (first.cells.empty() || second.cells.empty()) {
		return 0.0;
	}
	size_t union_size = first.cells.size();
	size_t matching = 0;
	for (const auto& [address, cell] : second.cells) {
		const auto it = first.cells.find(address);
		if (it == first.cells.end()) {
			++union_size;
		} else if (it->second.resolved_value == cell.resolved_value) {
			++matching;
		}
	}
	return static_cast<double>(matching) / static_cast<double>(union_size);
}

sml_comparison_result sml_compute_diff(const sml_workbook_signature& older, const sml_workbook_signature& newer, const sml_comparer_settings& settings) {
	sml_comparison_result result;
	const auto matches = match_sheets(older, newer, settings);
	if (settings.compare_sheet_structure) {
		for (const auto& match : matches) {
			sml_change change;
			switch (match.kind) {
				case sheet_match_kind::matched:
					continue;
				case sheet_match_kind::renamed:
					change.type = sml_change_type::sheet_renamed;
					change.sheet_name = match.newer->name;
					change.old_sheet_name = match.older->name;
					break;
				case sheet_match_kind::deleted:
					change.type = sml_change_type::sheet_deleted;
					change.sheet_name = match.older->name;
					break;
				case sheet_match_kind::added:
					change.type = sml_change_type::sheet_added;
					change.sheet_name = match.newer->name;
					break;
			}
			result.changes.push_back(std::move(change));
		}
	}
	for (const auto& match : matches) {
		if (match.kind == sheet_match_kind::matched || match.kind == sheet_match_kind::renamed) {
			sheet_comparison(*match.older, *match.newer, settings, result).run();
		}
	}
	if (settings.compare_named_ranges) {
		compare_named_ranges(older, newer, result);
	}
	wxLogVerbose("Spreadsheet diff found %zu changes over %zu sheet pairs", result.total_changes(), matches.size());
	return result;
}

/* sml_settings.hpp - spreadsheet comparison settings.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "constants.hpp"
#include <string>

struct sml_comparer_settings {
	bool compare_values{true};
	bool compare_formulas{true};
	bool compare_formatting{true};
	bool compare_sheet_structure{true};
	bool case_insensitive_values{false};
	double numeric_tolerance{0.0};
	std::string author{DEFAULT_AUTHOR};
	std::string added_cell_color{"90EE90"};
	std::string deleted_cell_color{"FFCCCB"};
	std::string modified_value_color{"FFD700"};
	std::string modified_formula_color{"87CEEB"};
	std::string modified_format_color{"E6E6FA"};
	bool enable_row_alignment{false};
	bool enable_column_alignment{false};
	bool enable_sheet_rename_detection{true};
	double sheet_rename_similarity_threshold{0.7};
	int row_signature_sample_size{10};
	bool compare_named_ranges{true};
	bool compare_comments{true};
	bool compare_data_validation{true};
	bool compare_merged_cells{true};
	bool compare_conditional_formatting{true};
	bool compare_hyperlinks{true};
};

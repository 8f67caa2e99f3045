/* pml_settings.hpp - presentation comparer settings.
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

struct pml_comparer_settings {
	bool compare_slide_structure{true};
	bool compare_shape_structure{true};
	bool compare_text_content{true};
	bool compare_text_formatting{true};
	bool compare_shape_transforms{true};
	bool compare_shape_styles{false};
	bool compare_image_content{true};
	bool compare_charts{true};
	bool compare_tables{true};
	bool compare_notes{true};
	bool compare_transitions{false};
	bool use_slide_alignment_lcs{true};
	bool use_fuzzy_shape_matching{true};
	double slide_similarity_threshold{0.4};
	double shape_similarity_threshold{0.7};
	// EMU, 91440 is a tenth of an inch.
	long long position_tolerance{91440};
	bool add_summary_slide{true};
	bool add_notes_annotations{true};
	std::string inserted_color{"00AA00"};
	std::string deleted_color{"FF0000"};
	std::string modified_color{"FFA500"};
	std::string moved_color{"0000FF"};
	std::string formatting_color{"9932CC"};
	std::string author{DEFAULT_AUTHOR};
};

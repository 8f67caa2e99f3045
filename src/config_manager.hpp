/* config_manager.hpp - comparer settings file.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "pml_settings.hpp"
#include "sml_settings.hpp"
#include "wml_settings.hpp"
#include <functional>
#include <memory>
#include <wx/fileconf.h>
#include <wx/string.h>

template <typename T>
struct app_setting {
	const char* section;
	const char* key;
	T default_value;

	constexpr app_setting(const char* s, const char* k, const T& def) : section{s}, key{k}, default_value{def} {
	}
};

class config_manager {
public:
	static inline const app_setting<wxString> wml_author{"wml", "author", wxString("")};
	static inline const app_setting<wxString> wml_date_time{"wml", "date_time", wxString("")};
	static constexpr app_setting<bool> wml_case_insensitive{"wml", "case_insensitive", false};
	static constexpr app_setting<bool> wml_conflate_spaces{"wml", "conflate_spaces", false};
	static constexpr app_setting<bool> wml_track_formatting_changes{"wml", "track_formatting_changes", false};
	static constexpr app_setting<double> wml_detail_threshold{"wml", "detail_threshold", 0.0};
	// Empty keeps the built-in separators.
	static inline const app_setting<wxString> wml_word_separators{"wml", "word_separators", wxString("")};
	static constexpr app_setting<int> wml_starting_revision_id{"wml", "starting_revision_id", 0};

	static constexpr app_setting<bool> sml_compare_values{"sml", "compare_values", true};
	static constexpr app_setting<bool> sml_compare_formulas{"sml", "compare_formulas", true};
	static constexpr app_setting<bool> sml_compare_formatting{"sml", "compare_formatting", true};
	static constexpr app_setting<bool> sml_compare_sheet_structure{"sml", "compare_sheet_structure", true};
	static constexpr app_setting<bool> sml_case_insensitive_values{"sml", "case_insensitive_values", false};
	static constexpr app_setting<double> sml_numeric_tolerance{"sml", "numeric_tolerance", 0.0};
	static inline const app_setting<wxString> sml_author{"sml", "author", wxString(DEFAULT_AUTHOR)};
	static inline const app_setting<wxString> sml_added_cell_color{"sml", "added_cell_color", wxString("90EE90")};
	static inline const app_setting<wxString> sml_deleted_cell_color{"sml", "deleted_cell_color", wxString("FFCCCB")};
	static inline const app_setting<wxString> sml_modified_value_color{"sml", "modified_value_color", wxString("FFD700")};
	static inline const app_setting<wxString> sml_modified_formula_color{"sml", "modified_formula_color", wxString("87CEEB")};
	static inline const app_setting<wxString> sml_modified_format_color{"sml", "modified_format_color", wxString("E6E6FA")};
	static constexpr app_setting<bool> sml_enable_row_alignment{"sml", "enable_row_alignment", false};
	static constexpr app_setting<bool> sml_enable_column_alignment{"sml", "enable_column_alignment", false};
	static constexpr app_setting<bool> sml_enable_sheet_rename_detection{"sml", "enable_sheet_rename_detection", true};
	static constexpr app_setting<double> sml_sheet_rename_similarity_threshold{"sml", "sheet_rename_similarity_threshold", 0.7};
	static constexpr app_setting<int> sml_row_signature_sample_size{"sml", "row_signature_sample_size", 10};
	static constexpr app_setting<bool> sml_compare_named_ranges{"sml", "compare_named_ranges", true};
	static constexpr app_setting<bool> sml_compare_comments{"sml", "compare_comments", true};
	static constexpr app_setting<bool> sml_compare_data_validation{"sml", "compare_data_validation", true};
	static constexpr app_setting<bool> sml_compare_merged_cells{"sml", "compare_merged_cells", true};
	static constexpr app_setting<bool> sml_compare_conditional_formatting{"sml", "compare_conditional_formatting", true};
	static constexpr app_setting<bool> sml_compare_hyperlinks{"sml", "compare_hyperlinks", true};

	static constexpr app_setting<bool> pml_compare_slide_structure{"pml", "compare_slide_structure", true};
	static constexpr app_setting<bool> pml_compare_shape_structure{"pml", "compare_shape_structure", true};
	static constexpr app_setting<bool> pml_compare_text_content{"pml", "compare_text_content", true};
	static constexpr app_setting<bool> pml_compare_text_formatting{"pml", "compare_text_formatting", true};
	static constexpr app_setting<bool> pml_compare_shape_transforms{"pml", "compare_shape_transforms", true};
	static constexpr app_setting<bool> pml_compare_shape_styles{"pml", "compare_shape_styles", false};
	static constexpr app_setting<bool> pml_compare_image_content{"pml", "compare_image_content", true};
	static constexpr app_setting<bool> pml_compare_charts{"pml", "compare_charts", true};
	static constexpr app_setting<bool> pml_compare_tables{"pml", "compare_tables", true};
	static constexpr app_setting<bool> pml_compare_notes{"pml", "compare_notes", true};
	static constexpr app_setting<bool> pml_compare_transitions{"pml", "compare_transitions", false};
	static constexpr app_setting<bool> pml_use_slide_alignment_lcs{"pml", "use_slide_alignment_lcs", true};
	static constexpr app_setting<bool> pml_use_fuzzy_shape_matching{"pml", "use_fuzzy_shape_matching", true};
	static constexpr app_setting<double> pml_slide_similarity_threshold{"pml", "slide_similarity_threshold", 0.4};
	static constexpr app_setting<double> pml_shape_similarity_threshold{"pml", "shape_similarity_threshold", 0.7};
	static constexpr app_setting<long> pml_position_tolerance{"pml", "position_tolerance", 91440};
	static constexpr app_setting<bool> pml_add_summary_slide{"pml", "add_summary_slide", true};
	static constexpr app_setting<bool> pml_add_notes_annotations{"pml", "add_notes_annotations", true};
	static inline const app_setting<wxString> pml_inserted_color{"pml", "inserted_color", wxString("00AA00")};
	static inline const app_setting<wxString> pml_deleted_color{"pml", "deleted_color", wxString("FF0000")};
	static inline const app_setting<wxString> pml_modified_color{"pml", "modified_color", wxString("FFA500")};
	static inline const app_setting<wxString> pml_moved_color{"pml", "moved_color", wxString("0000FF")};
	static inline const app_setting<wxString> pml_formatting_color{"pml", "formatting_color", wxString("9932CC")};
	static inline const app_setting<wxString> pml_author{"pml", "author", wxString(DEFAULT_AUTHOR)};

	config_manager() = default;
	~config_manager();
	config_manager(const config_manager&) = delete;
	config_manager& operator=(const config_manager&) = delete;
	config_manager(config_manager&&) = default;
	config_manager& operator=(config_manager&&) = default;
	// Opens an INI file; false when it does not exist.
	bool initialize(const wxString& path);
	void shutdown();

	bool is_initialized() const {
		return config != nullptr;
	}

	template <typename T>
	T get(const app_setting<T>& setting) const {
		return get_app_setting(setting.section, wxString(setting.key), setting.default_value);
	}

	// Settings from the file over the built-in defaults. Without a file these are the defaults.
	[[nodiscard]] wml_comparer_settings wml_settings() const;
	[[nodiscard]] sml_comparer_settings sml_settings() const;
	[[nodiscard]] pml_comparer_settings pml_settings() const;

private:
	std::unique_ptr<wxFileConfig> config;

	template <typename T>
	T get_app_setting(const char* section, const wxString& key, const T& default_value) const;
	void with_section(const char* section, const std::function<void()>& func) const;
	void warn_unknown_keys() const;
	// Values outside [0, 1] are reported and replaced by the default.
	double get_ratio(const app_setting<double>& setting) const;
};

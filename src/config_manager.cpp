/* config_manager.cpp - comparer settings file.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "config_manager.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <initializer_list>
#include <set>
#include <wx/filename.h>
#include <wx/log.h>

namespace {
constexpr const char* SECTIONS[] = {"wml", "sml", "pml"};

inline bool read_config_value(wxFileConfig* cfg, const wxString& key, bool default_val) {
	return cfg->ReadBool(key, default_val);
}

inline long read_config_value(wxFileConfig* cfg, const wxString& key, long default_val) {
	return cfg->ReadLong(key, default_val);
}

inline int read_config_value(wxFileConfig* cfg, const wxString& key, int default_val) {
	return static_cast<int>(cfg->ReadLong(key, default_val));
}

inline double read_config_value(wxFileConfig* cfg, const wxString& key, double default_val) {
	return cfg->ReadDouble(key, default_val);
}

inline wxString read_config_value(wxFileConfig* cfg, const wxString& key, const wxString& default_val) {
	return cfg->Read(key, default_val);
}

std::string to_utf8(const wxString& value) {
	return std::string(value.utf8_str());
}

// Known keys per section, for reporting typos in a settings file.
const std::set<std::pair<std::string, std::string>>& known_keys() {
	static const std::set<std::pair<std::string, std::string>> keys = [] {
		std::set<std::pair<std::string, std::string>> all;
		const auto add = [&all](const auto& setting) {
			all.emplace(setting.section, setting.key);
		};
		using cm = config_manager;
		add(cm::wml_author);
		add(cm::wml_date_time);
		add(cm::wml_case_insensitive);
		add(cm::wml_conflate_spaces);
		add(cm::wml_track_formatting_changes);
		add(cm::wml_detail_threshold);
		add(cm::wml_word_separators);
		add(cm::wml_starting_revision_id);
		add(cm::sml_compare_values);
		add(cm::sml_compare_formulas);
		add(cm::sml_compare_formatting);
		add(cm::sml_compare_sheet_structure);
		add(cm::sml_case_insensitive_values);
		add(cm::sml_numeric_tolerance);
		add(cm::sml_author);
		add(cm::sml_added_cell_color);
		add(cm::sml_deleted_cell_color);
		add(cm::sml_modified_value_color);
		add(cm::sml_modified_formula_color);
		add(cm::sml_modified_format_color);
		add(cm::sml_enable_row_alignment);
		add(cm::sml_enable_column_alignment);
		add(cm::sml_enable_sheet_rename_detection);
		add(cm::sml_sheet_rename_similarity_threshold);
		add(cm::sml_row_signature_sample_size);
		add(cm::sml_compare_named_ranges);
		add(cm::sml_compare_comments);
		add(cm::sml_compare_data_validation);
		add(cm::sml_compare_merged_cells);
		add(cm::sml_compare_conditional_formatting);
		add(cm::sml_compare_hyperlinks);
		add(cm::pml_compare_slide_structure);
		add(cm::pml_compare_shape_structure);
		add(cm::pml_compare_text_content);
		add(cm::pml_compare_text_formatting);
		add(cm::pml_compare_shape_transforms);
		add(cm::pml_compare_shape_styles);
		add(cm::pml_compare_image_content);
		add(cm::pml_compare_charts);
		add(cm::pml_compare_tables);
		add(cm::pml_compare_notes);
		add(cm::pml_compare_transitions);
		add(cm::pml_use_slide_alignment_lcs);
		add(cm::pml_use_fuzzy_shape_matching);
		add(cm::pml_slide_similarity_threshold);
		add(cm::pml_shape_similarity_threshold);
		add(cm::pml_position_tolerance);
		add(cm::pml_add_summary_slide);
		add(cm::pml_add_notes_annotations);
		add(cm::pml_inserted_color);
		add(cm::pml_deleted_color);
		add(cm::pml_modified_color);
		add(cm::pml_moved_color);
		add(cm::pml_formatting_color);
		add(cm::pml_author);
		return all;
	}();
	return keys;
}
} // namespace

config_manager::~config_manager() {
	if (config) {
		shutdown();
	}
}

bool config_manager::initialize(const wxString& path) {
	if (!wxFileName::FileExists(path)) {
		wxLogError("Settings file %s does not exist", path);
		return false;
	}
	config = std::make_unique<wxFileConfig>(APP_NAME, "", path, "", wxCONFIG_USE_LOCAL_FILE);
	warn_unknown_keys();
	wxLogVerbose("Loaded settings from %s", path);
	return true;
}

void config_manager::shutdown() {
	config.reset();
}

template <typename T>
T config_manager::get_app_setting(const char* section, const wxString& key, const T& default_value) const {
	T result = default_value;
	with_section(section, [this, &key, &default_value, &result]() {
		result = read_config_value(config.get(), key, default_value);
	});
	return result;
}

void config_manager::with_section(const char* section, const std::function<void()>& func) const {
	if (!config) {
		return;
	}
	config->SetPath("/" + wxString(section));
	func();
	config->SetPath("/");
}

void config_manager::warn_unknown_keys() const {
	for (const char* section : SECTIONS) {
		with_section(section, [this, section]() {
			wxString key;
			long cookie = 0;
			for (bool more = config->GetFirstEntry(key, cookie); more; more = config->GetNextEntry(key, cookie)) {
				if (known_keys().count({section, to_utf8(key)}) == 0) {
					wxLogWarning("Unknown setting %s in [%s]", key, section);
				}
			}
		});
	}
}

double config_manager::get_ratio(const app_setting<double>& setting) const {
	const double value = get(setting);
	if (value < 0.0 || value > 1.0) {
		wxLogWarning("Setting %s.%s must lie between 0 and 1; using %g", setting.section, setting.key, setting.default_value);
		return setting.default_value;
	}
	return value;
}

wml_comparer_settings config_manager::wml_settings() const {
	wml_comparer_settings settings;
	settings.author = to_utf8(get(wml_author));
	settings.date_time = to_utf8(get(wml_date_time));
	settings.case_insensitive = get(wml_case_insensitive);
	settings.conflate_spaces = get(wml_conflate_spaces);
	settings.track_formatting_changes = get(wml_track_formatting_changes);
	settings.detail_threshold = get_ratio(wml_detail_threshold);
	if (const auto separators = to_utf8(get(wml_word_separators)); !separators.empty()) {
		const auto chars = utf8_to_u32(separators);
		settings.word_separators.assign(chars.begin(), chars.end());
	}
	settings.starting_revision_id = get(wml_starting_revision_id);
	return settings;
}

sml_comparer_settings config_manager::sml_settings() const {
	sml_comparer_settings settings;
	settings.compare_values = get(sml_compare_values);
	settings.compare_formulas = get(sml_compare_formulas);
	settings.compare_formatting = get(sml_compare_formatting);
	settings.compare_sheet_structure = get(sml_compare_sheet_structure);
	settings.case_insensitive_values = get(sml_case_insensitive_values);
	settings.numeric_tolerance = get(sml_numeric_tolerance);
	settings.author = to_utf8(get(sml_author));
	settings.added_cell_color = to_utf8(get(sml_added_cell_color));
	settings.deleted_cell_color = to_utf8(get(sml_deleted_cell_color));
	settings.modified_value_color = to_utf8(get(sml_modified_value_color));
	settings.modified_formula_color = to_utf8(get(sml_modified_formula_color));
	settings.modified_format_color = to_utf8(get(sml_modified_format_color));
	settings.enable_row_alignment = get(sml_enable_row_alignment);
	settings.enable_column_alignment = get(sml_enable_column_alignment);
	settings.enable_sheet_rename_detection = get(sml_enable_sheet_rename_detection);
	settings.sheet_rename_similarity_threshold = get_ratio(sml_sheet_rename_similarity_threshold);
	settings.row_signature_sample_size = get(sml_row_signature_sample_size);
	settings.compare_named_ranges = get(sml_compare_named_ranges);
	settings.compare_comments = get(sml_compare_comments);
	settings.compare_data_validation = get(sml_compare_data_validation);
	settings.compare_merged_cells = get(sml_compare_merged_cells);
	settings.compare_conditional_formatting = get(sml_compare_conditional_formatting);
	settings.compare_hyperlinks = get(sml_compare_hyperlinks);
	return settings;
}

pml_comparer_settings config_manager::pml_settings() const {
	pml_comparer_settings settings;
	settings.compare_slide_structure = get(pml_compare_slide_structure);
	settings.compare_shape_structure = get(pml_compare_shape_structure);
	settings.compare_text_content = get(pml_compare_text_content);
	settings.compare_text_formatting = get(pml_compare_text_formatting);
	settings.compare_shape_transforms = get(pml_compare_shape_transforms);
	settings.compare_shape_styles = get(pml_compare_shape_styles);
	settings.compare_image_content = get(pml_compare_image_content);
	settings.compare_charts = get(pml_compare_charts);
	settings.compare_tables = get(pml_compare_tables);
	settings.compare_notes = get(pml_compare_notes);
	settings.compare_transitions = get(pml_compare_transitions);
	settings.use_slide_alignment_lcs = get(pml_use_slide_alignment_lcs);
	settings.use_fuzzy_shape_matching = get(pml_use_fuzzy_shape_matching);
	settings.slide_similarity_threshold = get_ratio(pml_slide_similarity_threshold);
	settings.shape_similarity_threshold = get_ratio(pml_shape_similarity_threshold);
	settings.position_tolerance = get(pml_position_tolerance);
	settings.add_summary_slide = get(pml_add_summary_slide);
	settings.add_notes_annotations = get(pml_add_notes_annotations);
	settings.inserted_color = to_utf8(get(pml_inserted_color));
	settings.deleted_color = to_utf8(get(pml_deleted_color));
	settings.modified_color = to_utf8(get(pml_modified_color));
	settings.moved_color = to_utf8(get(pml_moved_color));
	settings.formatting_color = to_utf8(get(pml_formatting_color));
	settings.author = to_utf8(get(pml_author));
	return settings;
}

template bool config_manager::get_app_setting<bool>(const char*, const wxString&, const bool&) const;
template int config_manager::get_app_setting<int>(const char*, const wxString&, const int&) const;
template long config_manager::get_app_setting<long>(const char*, const wxString&, const long&) const;
template double config_manager::get_app_setting<double>(const char*, const wxString&, const double&) const;
template wxString config_manager::get_app_setting<wxString>(const char*, const wxString&, const wxString&) const;

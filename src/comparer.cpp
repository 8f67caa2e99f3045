/* comparer.cpp - base comparer interface and registry.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "comparer.hpp"
#include <wx/filename.h>

comparer_settings make_comparer_settings(const config_manager& config, const compare_overrides& overrides) {
	comparer_settings settings{config.wml_settings(), config.sml_settings(), config.pml_settings()};
	if (overrides.author) {
		settings.wml.author = *overrides.author;
		settings.sml.author = *overrides.author;
		settings.pml.author = *overrides.author;
	}
	if (overrides.date_time) {
		settings.wml.date_time = *overrides.date_time;
	}
	if (overrides.detail_threshold) {
		settings.wml.detail_threshold = *overrides.detail_threshold;
	}
	if (overrides.track_formatting) {
		settings.wml.track_formatting_changes = true;
	}
	return settings;
}

const document_comparer* find_comparer_by_extension(const wxString& extension) noexcept {
	const wxString normalized = extension.Lower();
	for (auto* comp : comparer_registry::get_all()) {
		for (const auto& ext : comp->extensions()) {
			if (ext.Lower() == normalized) {
				return comp;
			}
		}
	}
	return nullptr;
}

const document_comparer* find_comparer_for_file(const wxString& path) noexcept {
	return find_comparer_by_extension(wxFileName(path).GetExt());
}

wxString get_supported_extensions() {
	wxString result;
	for (const document_comparer* c : comparer_registry::get_all()) {
		for (const auto& ext : c->extensions()) {
			if (!result.empty()) {
				result += ", ";
			}
			result += ext;
		}
	}
	return result;
}

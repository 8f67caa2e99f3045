/* comparer.hpp - base comparer interface and registry.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "config_manager.hpp"
#include "pml_settings.hpp"
#include "sml_settings.hpp"
#include "wml_settings.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include <wx/string.h>

// Command line values that win over the settings file.
struct compare_overrides {
	std::optional<std::string> author;
	std::optional<std::string> date_time;
	std::optional<double> detail_threshold;
	bool track_formatting{false};
};

struct comparer_settings {
	wml_comparer_settings wml;
	sml_comparer_settings sml;
	pml_comparer_settings pml;
};

[[nodiscard]] comparer_settings make_comparer_settings(const config_manager& config, const compare_overrides& overrides);

class document_comparer {
public:
	virtual ~document_comparer() = default;
	[[nodiscard]] virtual wxString name() const = 0;
	[[nodiscard]] virtual std::span<const wxString> extensions() const = 0;
	// Tag written into change reports, such as "docx".
	[[nodiscard]] virtual std::string format() const = 0;
	// The newer document with the differences marked up.
	[[nodiscard]] virtual std::string compare(const std::string& older, const std::string& newer, const comparer_settings& settings) const = 0;
	[[nodiscard]] virtual nlohmann::json changes(const std::string& older, const std::string& newer, const comparer_settings& settings) const = 0;
	[[nodiscard]] virtual std::string apply(const std::string& base, const nlohmann::json& report) const = 0;
	[[nodiscard]] virtual std::string revert(const std::string& result, const nlohmann::json& report) const = 0;
};

class comparer_registry {
public:
	static void register_comparer(const document_comparer& c) { get_comparers().push_back(&c); }
	[[nodiscard]] static std::span<const document_comparer* const> get_all() noexcept { return get_comparers(); }

private:
	static std::vector<const document_comparer*>& get_comparers() {
		static std::vector<const document_comparer*> comparers;
		return comparers;
	}
};

template <typename ComparerType>
class comparer_registrar {
public:
	comparer_registrar() { comparer_registry::register_comparer(instance); }

private:
	static inline ComparerType instance{};
};

#define REGISTER_COMPARER(comparer_type) static comparer_registrar<comparer_type> comparer_type##_registrar;

[[nodiscard]] const document_comparer* find_comparer_by_extension(const wxString& extension) noexcept;
[[nodiscard]] const document_comparer* find_comparer_for_file(const wxString& path) noexcept;
// "docx, xlsx, pptx" for usage messages.
[[nodiscard]] wxString get_supported_extensions();

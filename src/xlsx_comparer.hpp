/* xlsx_comparer.hpp - spreadsheet comparer.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "comparer.hpp"

class xlsx_comparer : public document_comparer {
public:
	xlsx_comparer() = default;
	~xlsx_comparer() = default;
	xlsx_comparer(const xlsx_comparer&) = delete;
	xlsx_comparer& operator=(const xlsx_comparer&) = delete;
	xlsx_comparer(xlsx_comparer&&) = delete;
	xlsx_comparer& operator=(xlsx_comparer&&) = delete;

	[[nodiscard]] wxString name() const override {
		return "Excel Workbooks";
	}

	[[nodiscard]] std::span<const wxString> extensions() const override {
		static const wxString exts[] = {"xlsx", "xlsm"};
		return exts;
	}

	[[nodiscard]] std::string format() const override {
		return "xlsx";
	}

	[[nodiscard]] std::string compare(const std::string& older, const std::string& newer, const comparer_settings& settings) const override;
	[[nodiscard]] nlohmann::json changes(const std::string& older, const std::string& newer, const comparer_settings& settings) const override;
	[[nodiscard]] std::string apply(const std::string& base, const nlohmann::json& report) const override;
	[[nodiscard]] std::string revert(const std::string& result, const nlohmann::json& report) const override;
};

/* change_json.hpp - JSON form of change records and change-list items.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "pml_change_list.hpp"
#include "pml_types.hpp"
#include "sml_change_list.hpp"
#include "sml_types.hpp"
#include "wml_change_extractor.hpp"
#include "wml_change_list.hpp"
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>

void to_json(nlohmann::json& j, const wml_change& change);
void to_json(nlohmann::json& j, const wml_change_list_item& item);
void to_json(nlohmann::json& j, const sml_cell_format& format);
void from_json(const nlohmann::json& j, sml_cell_format& format);
void to_json(nlohmann::json& j, const sml_change& change);
void from_json(const nlohmann::json& j, sml_change& change);
void to_json(nlohmann::json& j, const sml_change_list_item& item);
void to_json(nlohmann::json& j, const pml_text_change& change);
void from_json(const nlohmann::json& j, pml_text_change& change);
void to_json(nlohmann::json& j, const pml_change& change);
void from_json(const nlohmann::json& j, pml_change& change);
void to_json(nlohmann::json& j, const pml_change_list_item& item);

// {"format", "changes", "items"} as written by `changes --json`.
[[nodiscard]] nlohmann::json make_change_report(const std::string& format, nlohmann::json changes, nlohmann::json items);
// Throws compare_exception(invalid_package) when the text is not a change report.
[[nodiscard]] nlohmann::json parse_change_report(const std::string& text, const std::string& locator);
// Revision ids named by the items of a report, falling back to its change records.
[[nodiscard]] std::set<int> revision_ids_from_report(const nlohmann::json& report);
[[nodiscard]] std::vector<sml_change> sml_changes_from_report(const nlohmann::json& report);
[[nodiscard]] std::vector<pml_change> pml_changes_from_report(const nlohmann::json& report);

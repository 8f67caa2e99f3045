/* sml_sheet_xml.hpp - editing helpers for worksheet markup.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <optional>
#include <pugixml.hpp>
#include <string>

// Qualifies a local name with the prefix of context, so inserted elements match their siblings.
[[nodiscard]] std::string sml_qualified_name(pugi::xml_node context, const char* local);
[[nodiscard]] pugi::xml_node sml_find_cell(pugi::xml_node sheet_data, const std::string& address);
// Rows and cells are created in index order when missing.
pugi::xml_node sml_find_or_create_row(pugi::xml_node sheet_data, int row);
pugi::xml_node sml_find_or_create_cell(pugi::xml_node sheet_data, const std::string& address);
// Replaces the stored value and formula. Numbers are written as values, other text inline.
void sml_set_cell_content(pugi::xml_node cell, const std::optional<std::string>& value, const std::optional<std::string>& formula);

/* wml_atomizer.hpp - flattening of word-processing content into atoms.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "wml_atom.hpp"
#include "wml_settings.hpp"
#include <pugixml.hpp>
#include <string>
#include <string_view>
#include <vector>

class package;

// content_parent is a body, footnote or endnote element. pkg resolves image relationships
// of part and may be null.
[[nodiscard]] std::vector<atom_ptr> wml_create_atom_list(pugi::xml_node content_parent, const std::string& part, const package* pkg, const wml_comparer_settings& settings);
// Property children of a container that carry no comparable content.
[[nodiscard]] const std::vector<std::string_view>& wml_container_properties(std::string_view local);

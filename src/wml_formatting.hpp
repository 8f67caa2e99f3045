/* wml_formatting.hpp - run formatting signatures and format-change detection.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "wml_atom.hpp"
#include <pugixml.hpp>
#include <string>
#include <vector>

// SHA-1 of the run's normalized allow-listed properties; empty when nothing formatting-relevant remains.
[[nodiscard]] std::string wml_formatting_signature(pugi::xml_node run);
// The run's rPr as markup, scaffolding removed. Empty when the run has none.
[[nodiscard]] std::string wml_run_properties_xml(pugi::xml_node run);
// Retags equal atoms whose paired "before" atom carried different formatting.
// Returns the number of atoms retagged.
size_t wml_reconcile_formatting(std::vector<atom_ptr>& atoms);

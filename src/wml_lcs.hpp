/* wml_lcs.hpp - longest common subsequence over comparison units.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "wml_comparison_unit.hpp"
#include "wml_settings.hpp"
#include <vector>

struct correlated_sequence {
	correlation_status status{correlation_status::unknown};
	std::vector<unit_ptr> units1;
	std::vector<unit_ptr> units2;
};

// Resolves the two unit lists into a sequence where nothing is left unknown.
[[nodiscard]] std::vector<correlated_sequence> wml_lcs(const std::vector<unit_ptr>& units1, const std::vector<unit_ptr>& units2, const wml_comparer_settings& settings);
// One cloned atom per compared atom, carrying its final status. Equal atoms keep the older atom in before.
[[nodiscard]] std::vector<atom_ptr> wml_flatten_to_atoms(const std::vector<correlated_sequence>& sequences);

/* wml_coalesce.hpp - rebuilding word-processing markup from resolved atoms.
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

class package;

struct wml_coalesce_context {
	// Content copied from the older document resolves its relationships here.
	const package* old_package{nullptr};
	package* output_package{nullptr};
	std::string part;
};

struct wml_coalesce_stats {
	size_t equal{0};
	size_t inserted{0};
	size_t deleted{0};
	size_t format_changed{0};

	[[nodiscard]] size_t total() const noexcept {
		return equal + inserted + deleted + format_changed;
	}
};

// Rewrites ancestor unids so deleted content lands inside the containers of the newer document it was matched against.
void wml_assemble_ancestor_unids(std::vector<atom_ptr>& atoms);
// Appends the rebuilt content under parent, marking changed runs and paragraph marks with pt14:Status.
wml_coalesce_stats wml_coalesce(pugi::xml_node parent, const std::vector<atom_ptr>& atoms, const wml_coalesce_context& context);

/* pml_shape_match.hpp - shape correlation within a matched slide pair.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "pml_canonicalize.hpp"
#include "pml_settings.hpp"
#include <vector>

enum class pml_shape_match_kind {
	matched,
	inserted,
	deleted,
};

enum class pml_shape_match_method {
	none,
	placeholder,
	name_and_kind,
	name_only,
	fuzzy,
};

struct pml_shape_match {
	pml_shape_match_kind kind{pml_shape_match_kind::matched};
	const pml_shape_signature* old_shape{nullptr};
	const pml_shape_signature* new_shape{nullptr};
	double score{0.0};
	pml_shape_match_method method{pml_shape_match_method::none};
};

[[nodiscard]] std::vector<pml_shape_match> pml_match_shapes(const pml_slide_signature& older, const pml_slide_signature& newer, const pml_comparer_settings& settings);
// Zero unless both shapes have the same kind.
[[nodiscard]] double pml_shape_match_score(const pml_shape_signature& first, const pml_shape_signature& second, const pml_comparer_settings& settings);

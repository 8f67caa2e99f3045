/* pml_slide_match.hpp - slide correlation between two presentations.
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

enum class pml_slide_match_kind {
	matched,
	inserted,
	deleted,
};

struct pml_slide_match {
	pml_slide_match_kind kind{pml_slide_match_kind::matched};
	const pml_slide_signature* old_slide{nullptr};
	const pml_slide_signature* new_slide{nullptr};
	double similarity{0.0};
	// Set for matched slides whose order relative to the other matched slides changed.
	bool moved{false};
};

// Matches by title, then by fingerprint, then by best similarity (or position when alignment is
// disabled). Results are ordered by new slide index with deletions at their old position.
[[nodiscard]] std::vector<pml_slide_match> pml_match_slides(const pml_presentation_signature& older, const pml_presentation_signature& newer, const pml_comparer_settings& settings);
// Weighted score in [0, 1] over title, content, shape count, shape kinds and shape names.
[[nodiscard]] double pml_slide_similarity(const pml_slide_signature& first, const pml_slide_signature& second);
// Jaccard similarity of the lowercased word sets.
[[nodiscard]] double pml_word_similarity(const std::string& first, const std::string& second);

/* pml_shape_match.cpp - shape correlation within a matched slide pair.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "pml_shape_match.hpp"
#include "sequence_alignment.hpp"
#include <cmath>
#include <functional>

namespace {
class shape_matcher {
public:
	shape_matcher(const pml_slide_signature& older, const pml_slide_signature& newer) : older{older}, newer{newer}, used_old(older.shapes.size(), false), used_new(newer.shapes.size(), false) {
	}

	// Pairs each unused old shape with the first unused new shape satisfying the predicate.
	void match_first(const std::function<bool(const pml_shape_signature&, const pml_shape_signature&)>& predicate, double score, pml_shape_match_method method) {
		for (size_t i = 0; i < older.shapes.size(); ++i) {
			if (used_old[i]) {
				continue;
			}
			for (size_t j = 0; j < newer.shapes.size(); ++j) {
				if (!used_new[j] && predicate(older.shapes[i], newer.shapes[j])) {
					add(i, j, score, method);
					break;
				}
			}
		}
	}

	void match_fuzzy(const pml_comparer_settings& settings) {
		for (size_t i = 0; i < older.shapes.size(); ++i) {
			if (used_old[i]) {
				continue;
			}
			double best = 0.0;
			size_t best_j = newer.shapes.size();
			for (size_t j = 0; j < newer.shapes.size(); ++j) {
				if (used_new[j]) {
					continue;
				}
				const double score = pml_shape_match_score(older.shapes[i], newer.shapes[j], settings);
				if (score > best && score >= settings.shape_similarity_threshold) {
					best = score;
					best_j = j;
				}
			}
			if (best_j < newer.shapes.size()) {
				add(i, best_j, best, pml_shape_match_method::fuzzy);
			}
		}
	}

	std::vector<pml_shape_match> finish() {
		for (size_t i = 0; i < older.shapes.size(); ++i) {
			if (!used_old[i]) {
				matches.push_back({pml_shape_match_kind::deleted, &older.shapes[i], nullptr, 0.0, pml_shape_match_method::none});
			}
		}
		for (size_t j = 0; j < newer.shapes.size(); ++j) {
			if (!used_new[j]) {
				matches.push_back({pml_shape_match_kind::inserted, nullptr, &newer.shapes[j], 0.0, pml_shape_match_method::none});
			}
		}
		return std::move(matches);
	}

private:
	const pml_slide_signature& older;
	const pml_slide_signature& newer;
	std::vector<bool> used_old;
	std::vector<bool> used_new;
	std::vector<pml_shape_match> matches;

	void add(size_t i, size_t j, double score, pml_shape_match_method method) {
		matches.push_back({pml_shape_match_kind::matched, &older.shapes[i], &newer.shapes[j], score, method});
		used_old[i] = true;
		used_new[j] = true;
	}
};
}

double pml_shape_match_score(const pml_shape_signature& first, const pml_shape_signature& second, const pml_comparer_settings& settings) {
	if (first.kind != second.kind) {
		return 0.0;
	}
	double score = 0.2;
	if (first.transform && second.transform) {
		if (first.transform->is_near(*second.transform, settings.position_tolerance)) {
			score += 0.3;
		} else {
			const double dx = static_cast<double>(first.transform->x - second.transform->x);
			const double dy = static_cast<double>(first.transform->y - second.transform->y);
			if (std::sqrt(dx * dx + dy * dy) < static_cast<double>(settings.position_tolerance * 5)) {
				score += 0.1;
			}
		}
	}
	if (first.kind == pml_shape_kind::picture) {
		if (first.image_hash && first.image_hash == second.image_hash) {
			score += 0.5;
		}
	} else if (first.text_body && second.text_body) {
		score += text_similarity(first.text_body->plain_text, second.text_body->plain_text) * 0.5;
	} else if (first.content_hash == second.content_hash) {
		score += 0.5;
	}
	return score;
}

std::vector<pml_shape_match> pml_match_shapes(const pml_slide_signature& older, const pml_slide_signature& newer, const pml_comparer_settings& settings) {
	shape_matcher matcher{older, newer};
	matcher.match_first([](const auto& a, const auto& b) {
		return a.placeholder && b.placeholder && a.placeholder == b.placeholder;
	}, 1.0, pml_shape_match_method::placeholder);
	matcher.match_first([](const auto& a, const auto& b) {
		return !a.name.empty() && a.name == b.name && a.kind == b.kind;
	}, 0.95, pml_shape_match_method::name_and_kind);
	matcher.match_first([](const auto& a, const auto& b) {
		return !a.name.empty() && a.name == b.name;
	}, 0.8, pml_shape_match_method::name_only);
	if (settings.use_fuzzy_shape_matching) {
		matcher.match_fuzzy(settings);
	}
	return matcher.finish();
}

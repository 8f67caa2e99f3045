/* pml_slide_match.cpp - slide correlation between two presentations.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "pml_slide_match.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cstdlib>
#include <set>
#include <utility>
#include <wx/log.h>

namespace {
class slide_matcher {
public:
	slide_matcher(const pml_presentation_signature& older, const pml_presentation_signature& newer) : older{older}, newer{newer}, used_old(older.slides.size(), false), used_new(newer.slides.size(), false) {
	}

	void match_by_title() {
		for (size_t i = 0; i < older.slides.size(); ++i) {
			const auto& title = older.slides[i].title_text;
			if (used_old[i] || !title || title->empty()) {
				continue;
			}
			for (size_t j = 0; j < newer.slides.size(); ++j) {
				if (!used_new[j] && newer.slides[j].title_text == title) {
					add(i, j, 1.0);
					break;
				}
			}
		}
	}

	void match_by_fingerprint() {
		std::vector<std::string> fingerprints;
		for (const auto& slide : newer.slides) {
			fingerprints.push_back(slide.fingerprint());
		}
		for (size_t i = 0; i < older.slides.size(); ++i) {
			if (used_old[i]) {
				continue;
			}
			const std::string fingerprint = older.slides[i].fingerprint();
			for (size_t j = 0; j < newer.slides.size(); ++j) {
				if (!used_new[j] && fingerprints[j] == fingerprint) {
					add(i, j, 1.0);
					break;
				}
			}
		}
	}

	// Repeatedly pairs the most similar remaining slides until the best score drops below the threshold.
	void match_by_similarity(double threshold) {
		std::vector<std::vector<double>> scores(older.slides.size(), std::vector<double>(newer.slides.size(), 0.0));
		for (size_t i = 0; i < older.slides.size(); ++i) {
			for (size_t j = 0; j < newer.slides.size(); ++j) {
				if (!used_old[i] && !used_new[j]) {
					scores[i][j] = pml_slide_similarity(older.slides[i], newer.slides[j]);
				}
			}
		}
		while (true) {
			double best = 0.0;
			size_t best_i = older.slides.size();
			size_t best_j = newer.slides.size();
			for (size_t i = 0; i < older.slides.size(); ++i) {
				if (used_old[i]) {
					continue;
				}
				for (size_t j = 0; j < newer.slides.size(); ++j) {
					if (!used_new[j] && scores[i][j] > best) {
						best = scores[i][j];
						best_i = i;
						best_j = j;
					}
				}
			}
			if (best_i == older.slides.size() || best < threshold) {
				return;
			}
			add(best_i, best_j, best);
		}
	}

	void match_by_position() {
		size_t j = 0;
		for (size_t i = 0; i < older.slides.size(); ++i) {
			if (used_old[i]) {
				continue;
			}
			while (j < newer.slides.size() && used_new[j]) {
				++j;
			}
			if (j == newer.slides.size()) {
				return;
			}
			add(i, j, pml_slide_similarity(older.slides[i], newer.slides[j]));
		}
	}

	std::vector<pml_slide_match> finish() {
		mark_moves();
		for (size_t i = 0; i < older.slides.size(); ++i) {
			if (!used_old[i]) {
				matches.push_back({pml_slide_match_kind::deleted, &older.slides[i], nullptr, 0.0, false});
			}
		}
		for (size_t j = 0; j < newer.slides.size(); ++j) {
			if (!used_new[j]) {
				matches.push_back({pml_slide_match_kind::inserted, nullptr, &newer.slides[j], 0.0, false});
			}
		}
		std::stable_sort(matches.begin(), matches.end(), [](const pml_slide_match& a, const pml_slide_match& b) {
			return sort_key(a) < sort_key(b);
		});
		return std::move(matches);
	}

private:
	const pml_presentation_signature& older;
	const pml_presentation_signature& newer;
	std::vector<bool> used_old;
	std::vector<bool> used_new;
	std::vector<pml_slide_match> matches;

	void add(size_t i, size_t j, double similarity) {
		matches.push_back({pml_slide_match_kind::matched, &older.slides[i], &newer.slides[j], similarity, false});
		used_old[i] = true;
		used_new[j] = true;
	}

	// A matched slide moved when it falls outside the longest run of matches that keep their relative order.
	void mark_moves() {
		std::vector<pml_slide_match*> ordered;
		for (auto& match : matches) {
			ordered.push_back(&match);
		}
		std::sort(ordered.begin(), ordered.end(), [](const auto* a, const auto* b) {
			return a->new_slide->index < b->new_slide->index;
		});
		const size_t n = ordered.size();
		std::vector<size_t> length(n, 1);
		std::vector<size_t> previous(n, n);
		size_t best_end = n;
		for (size_t k = 0; k < n; ++k) {
			for (size_t m = 0; m < k; ++m) {
				if (ordered[m]->old_slide->index < ordered[k]->old_slide->index && length[m] + 1 > length[k]) {
					length[k] = length[m] + 1;
					previous[k] = m;
				}
			}
			if (best_end == n || length[k] > length[best_end]) {
				best_end = k;
			}
		}
		std::vector<bool> stable(n, false);
		for (size_t k = best_end; k < n; k = previous[k]) {
			stable[k] = true;
		}
		for (size_t k = 0; k < n; ++k) {
			ordered[k]->moved = !stable[k];
		}
	}

	static std::pair<int, int> sort_key(const pml_slide_match& match) {
		if (match.new_slide != nullptr) {
			return {match.new_slide->index, match.old_slide != nullptr ? match.old_slide->index : 0};
		}
		return {match.old_slide->index, match.old_slide->index};
	}
};

std::set<std::string> lowercase_words(const std::string& text) {
	std::set<std::string> words;
	for (const auto& word : split_whitespace(to_lower_ascii(text))) {
		words.insert(word);
	}
	return words;
}

template <typename T>
double overlap(const std::set<T>& first, const std::set<T>& second) {
	const size_t total = std::max(first.size(), second.size());
	if (total == 0) {
		return 0.0;
	}
	size_t common = 0;
	for (const auto& item : first) {
		common += second.count(item);
	}
	return static_cast<double>(common) / static_cast<double>(total);
}
}

double pml_word_similarity(const std::string& first, const std::string& second) {
	if (first == second) {
		return 1.0;
	}
	if (first.empty() || second.empty()) {
		return 0.0;
	}
	const auto words1 = lowercase_words(first);
	const auto words2 = lowercase_words(second);
	std::set<std::string> all = words1;
	all.insert(words2.begin(), words2.end());
	if (all.empty()) {
		return 0.0;
	}
	size_t common = 0;
	for (const auto& word : words1) {
		common += words2.count(word);
	}
	return static_cast<double>(common) / static_cast<double>(all.size());
}

double pml_slide_similarity(const pml_slide_signature& first, const pml_slide_signature& second) {
	double score = 0.0;
	double max_score = 0.0;
	const std::string title1 = first.title_text.value_or("");
	const std::string title2 = second.title_text.value_or("");
	if (!title1.empty() || !title2.empty()) {
		max_score += 3.0;
		if (!title1.empty() && title1 == title2) {
			score += 3.0;
		} else if (!title1.empty() && !title2.empty()) {
			score += pml_word_similarity(title1, title2) * 2.0;
		}
	}
	max_score += 1.0;
	if (first.content_hash == second.content_hash) {
		score += 1.0;
	}
	max_score += 1.0;
	const auto count1 = static_cast<long>(first.shapes.size());
	const auto count2 = static_cast<long>(second.shapes.size());
	if (count1 == count2) {
		score += 1.0;
	} else if (std::labs(count1 - count2) <= 2) {
		score += 0.5;
	}
	std::set<pml_shape_kind> kinds1;
	std::set<pml_shape_kind> kinds2;
	std::set<std::string> names1;
	std::set<std::string> names2;
	for (const auto& shape : first.shapes) {
		kinds1.insert(shape.kind);
		if (!shape.name.empty()) {
			names1.insert(shape.name);
		}
	}
	for (const auto& shape : second.shapes) {
		kinds2.insert(shape.kind);
		if (!shape.name.empty()) {
			names2.insert(shape.name);
		}
	}
	max_score += 1.0;
	score += overlap(kinds1, kinds2);
	max_score += 2.0;
	score += 2.0 * overlap(names1, names2);
	return score / max_score;
}

std::vector<pml_slide_match> pml_match_slides(const pml_presentation_signature& older, const pml_presentation_signature& newer, const pml_comparer_settings& settings) {
	slide_matcher matcher{older, newer};
	matcher.match_by_title();
	matcher.match_by_fingerprint();
	if (settings.use_slide_alignment_lcs) {
		matcher.match_by_similarity(settings.slide_similarity_threshold);
	} else {
		matcher.match_by_position();
	}
	auto matches = matcher.finish();
	wxLogVerbose("Matched %zu of %zu slides", static_cast<size_t>(std::count_if(matches.begin(), matches.end(), [](const auto& match) {
		return match.kind == pml_slide_match_kind::matched;
	})), newer.slides.size());
	return matches;
}

/* sequence_alignment.cpp - longest common subsequence alignment over hashed keys.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "sequence_alignment.hpp"
#include "utils.hpp"
#include <algorithm>

namespace {
std::vector<std::vector<size_t>> lcs_table(const std::vector<std::string>& first, const std::vector<std::string>& second) {
	std::vector<std::vector<size_t>> table(first.size() + 1, std::vector<size_t>(second.size() + 1, 0));
	for (size_t i = first.size(); i-- > 0;) {
		for (size_t j = second.size(); j-- > 0;) {
			if (first[i] == second[j]) {
				table[i][j] = table[i + 1][j + 1] + 1;
			} else {
				table[i][j] = std::max(table[i + 1][j], table[i][j + 1]);
			}
		}
	}
	return table;
}
}

std::vector<alignment_step> align_sequences(const std::vector<std::string>& first, const std::vector<std::string>& second) {
	const auto table = lcs_table(first, second);
	std::vector<alignment_step> steps;
	std::vector<size_t> pending_first;
	std::vector<size_t> pending_second;
	auto flush = [&] {
		for (const size_t i : pending_first) {
			steps.emplace_back(i, std::nullopt);
		}
		for (const size_t j : pending_second) {
			steps.emplace_back(std::nullopt, j);
		}
		pending_first.clear();
		pending_second.clear();
	};
	size_t i = 0;
	size_t j = 0;
	while (i < first.size() && j < second.size()) {
		if (first[i] == second[j]) {
			flush();
			steps.emplace_back(i, j);
			++i;
			++j;
		} else if (table[i + 1][j] >= table[i][j + 1]) {
			pending_first.push_back(i++);
		} else {
			pending_second.push_back(j++);
		}
	}
	for (; i < first.size(); ++i) {
		pending_first.push_back(i);
	}
	for (; j < second.size(); ++j) {
		pending_second.push_back(j);
	}
	flush();
	return steps;
}

size_t levenshtein_distance(const std::u32string& first, const std::u32string& second) {
	std::vector<size_t> previous(second.size() + 1);
	std::vector<size_t> current(second.size() + 1);
	for (size_t j = 0; j <= second.size(); ++j) {
		previous[j] = j;
	}
	for (size_t i = 1; i <= first.size(); ++i) {
		current[0] = i;
		for (size_t j = 1; j <= second.size(); ++j) {
			const size_t cost = first[i - 1] == second[j - 1] ? 0 : 1;
			current[j] = std::min({previous[j] + 1, current[j - 1] + 1, previous[j - 1] + cost});
		}
		std::swap(previous, current);
	}
	return previous[second.size()];
}

double text_similarity(const std::string& first, const std::string& second) {
	if (first == second) {
		return 1.0;
	}
	const auto a = utf8_to_u32(first);
	const auto b = utf8_to_u32(second);
	const size_t longest = std::max(a.size(), b.size());
	if (longest == 0) {
		return 1.0;
	}
	return 1.0 - static_cast<double>(levenshtein_distance(a, b)) / static_cast<double>(longest);
}

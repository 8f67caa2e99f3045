/* sequence_alignment.hpp - longest common subsequence alignment over hashed keys.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

// One step of an alignment: both indices set for a match, one of them for an insertion or deletion.
using alignment_step = std::pair<std::optional<size_t>, std::optional<size_t>>;

// Aligns two key sequences along a longest common subsequence. Unmatched keys of the first
// sequence are emitted before unmatched keys of the second at each gap.
[[nodiscard]] std::vector<alignment_step> align_sequences(const std::vector<std::string>& first, const std::vector<std::string>& second);
// Edit distance over code points.
[[nodiscard]] size_t levenshtein_distance(const std::u32string& first, const std::u32string& second);
// 1 - distance / longer length, computed on UTF-8 input.
[[nodiscard]] double text_similarity(const std::string& first, const std::string& second);

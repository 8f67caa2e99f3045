/* utils.hpp - various helper functions that didn't belong anywhere else.
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
#include <string_view>
#include <vector>
#include <wx/string.h>
#include <wx/zipstrm.h>

[[nodiscard]] std::string get_local_name(const char* qname);
[[nodiscard]] std::string get_prefix(const char* qname);
[[nodiscard]] std::string trim_string(const std::string& str);
[[nodiscard]] std::string remove_soft_hyphens(std::string_view input);
[[nodiscard]] std::string url_decode(std::string_view encoded);
[[nodiscard]] std::string read_zip_entry(wxZipInputStream& zip);
[[nodiscard]] std::u32string utf8_to_u32(std::string_view input);
[[nodiscard]] std::string u32_to_utf8(std::u32string_view input);
[[nodiscard]] std::string u32_to_utf8(char32_t ch);
[[nodiscard]] std::vector<std::string> split_whitespace(std::string_view input);
[[nodiscard]] std::string to_lower_ascii(std::string_view input);
// Case folding for case-insensitive comparison. Every stage that compares text folds through these.
[[nodiscard]] char32_t fold_case(char32_t ch);
[[nodiscard]] std::string fold_case(std::string_view input);
[[nodiscard]] std::string truncate_text(const std::string& text, size_t max_length);
[[nodiscard]] bool is_unicode_whitespace(char32_t ch) noexcept;
[[nodiscard]] std::string format_double(double value);
// Locale-independent counterpart of format_double. nullopt unless the whole text is one finite number.
[[nodiscard]] std::optional<double> parse_double(std::string_view text);
// nullopt when the file cannot be opened or fully read.
[[nodiscard]] std::optional<std::string> read_file_bytes(const wxString& path);
[[nodiscard]] bool write_file_bytes(const wxString& path, const std::string& bytes);

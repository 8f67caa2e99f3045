/* utils.cpp - various helper functions that didn't belong anywhere else.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cwctype>
#include <iterator>
#include <sstream>
#include <system_error>
#include <wx/ffile.h>

std::string get_local_name(const char* qname) {
	if (qname == nullptr) {
		return {};
	}
	std::string s(qname);
	size_t pos{s.find(':')};
	return pos == std::string::npos ? s : s.substr(pos + 1);
}

std::string get_prefix(const char* qname) {
	if (qname == nullptr) {
		return {};
	}
	std::string_view s(qname);
	size_t pos{s.find(':')};
	return pos == std::string_view::npos ? std::string{} : std::string(s.substr(0, pos));
}

std::string trim_string(const std::string& str) {
	auto start = str.begin();
	auto end = str.end();
	while (start != end && std::isspace(static_cast<unsigned char>(*start)) != 0) {
		++start;
	}
	while (start != end && std::isspace(static_cast<unsigned char>(*std::prev(end))) != 0) {
		--end;
	}
	return {start, end};
}

std::string remove_soft_hyphens(std::string_view input) {
	std::string result(input);
	const std::string sh = "\xC2\xAD";
	size_t pos = 0;
	while ((pos = result.find(sh, pos)) != std::string::npos) {
		result.erase(pos, sh.size());
	}
	return result;
}

std::string url_decode(std::string_view encoded) {
	auto hex = [](char c) -> int {
		if (c >= '0' && c <= '9') {
			return c - '0';
		}
		if (c >= 'a' && c <= 'f') {
			return c - 'a' + 10;
		}
		if (c >= 'A' && c <= 'F') {
			return c - 'A' + 10;
		}
		return -1;
	};
	std::string out;
	out.reserve(encoded.size());
	for (size_t i = 0; i < encoded.size(); ++i) {
		char c = encoded[i];
		if (c == '%' && i + 2 < encoded.size()) {
			int hi = hex(encoded[i + 1]);
			int lo = hex(encoded[i + 2]);
			if (hi >= 0 && lo >= 0) {
				out.push_back(static_cast<char>((hi << 4) | lo));
				i += 2;
				continue;
			}
		}
		out.push_back(c);
	}
	return out;
}

std::string read_zip_entry(wxZipInputStream& zip) {
	constexpr int buffer_size = 4096;
	std::ostringstream buffer;
	char buf[buffer_size];
	while (zip.Read(buf, sizeof(buf)).LastRead() > 0) {
		buffer.write(buf, static_cast<std::streamsize>(zip.LastRead()));
	}
	return buffer.str();
}

std::u32string utf8_to_u32(std::string_view input) {
	std::u32string out;
	out.reserve(input.size());
	size_t i = 0;
	while (i < input.size()) {
		const auto c = static_cast<unsigned char>(input[i]);
		char32_t cp = 0;
		size_t extra = 0;
		if (c < 0x80) {
			cp = c;
		} else if ((c & 0xE0) == 0xC0) {
			cp = c & 0x1F;
			extra = 1;
		} else if ((c & 0xF0) == 0xE0) {
			cp = c & 0x0F;
			extra = 2;
		} else if ((c & 0xF8) == 0xF0) {
			cp = c & 0x07;
			extra = 3;
		} else {
			out.push_back(U'\uFFFD');
			++i;
			continue;
		}
		if (i + extra >= input.size()) {
			out.push_back(U'\uFFFD');
			break;
		}
		bool valid = true;
		for (size_t k = 1; k <= extra; ++k) {
			const auto cc = static_cast<unsigned char>(input[i + k]);
			if ((cc & 0xC0) != 0x80) {
				valid = false;
				break;
			}
			cp = (cp << 6) | (cc & 0x3F);
		}
		if (!valid) {
			out.push_back(U'\uFFFD');
			++i;
			continue;
		}
		out.push_back(cp);
		i += extra + 1;
	}
	return out;
}

std::string u32_to_utf8(char32_t ch) {
	std::string out;
	if (ch < 0x80) {
		out.push_back(static_cast<char>(ch));
	} else if (ch < 0x800) {
		out.push_back(static_cast<char>(0xC0 | (ch >> 6)));
		out.push_back(static_cast<char>(0x80 | (ch & 0x3F)));
	} else if (ch < 0x10000) {
		out.push_back(static_cast<char>(0xE0 | (ch >> 12)));
		out.push_back(static_cast<char>(0x80 | ((ch >> 6) & 0x3F)));
		out.push_back(static_cast<char>(0x80 | (ch & 0x3F)));
	} else {
		out.push_back(static_cast<char>(0xF0 | (ch >> 18)));
		out.push_back(static_cast<char>(0x80 | ((ch >> 12) & 0x3F)));
		out.push_back(static_cast<char>(0x80 | ((ch >> 6) & 0x3F)));
		out.push_back(static_cast<char>(0x80 | (ch & 0x3F)));
	}
	return out;
}

std::string u32_to_utf8(std::u32string_view input) {
	std::string out;
	out.reserve(input.size());
	for (char32_t ch : input) {
		out += u32_to_utf8(ch);
	}
	return out;
}

std::vector<std::string> split_whitespace(std::string_view input) {
	std::vector<std::string> words;
	std::string current;
	for (char c : input) {
		if (std::isspace(static_cast<unsigned char>(c)) != 0) {
			if (!current.empty()) {
				words.push_back(std::move(current));
				current.clear();
			}
		} else {
			current.push_back(c);
		}
	}
	if (!current.empty()) {
		words.push_back(std::move(current));
	}
	return words;
}

std::string to_lower_ascii(std::string_view input) {
	std::string out(input);
	std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return out;
}

// Cuts on code point boundaries so previews never end in half a character.
char32_t fold_case(char32_t ch) {
	return static_cast<char32_t>(std::towupper(static_cast<wint_t>(ch)));
}

std::string fold_case(std::string_view input) {
	std::u32string chars = utf8_to_u32(input);
	for (auto& ch : chars) {
		ch = fold_case(ch);
	}
	return u32_to_utf8(chars);
}

std::string truncate_text(const std::string& text, size_t max_length) {
	const auto chars = utf8_to_u32(text);
	if (chars.size() <= max_length) {
		return text;
	}
	if (max_length <= 3) {
		return "...";
	}
	return u32_to_utf8(std::u32string_view(chars).substr(0, max_length - 3)) + "...";
}

bool is_unicode_whitespace(char32_t ch) noexcept {
	switch (ch) {
		case U'\t':
		case U'\n':
		case U'\v':
		case U'\f':
		case U'\r':
		case U' ':
		case U'\u0085':
		case U'\u00A0':
		case U'\u1680':
		case U'\u2028':
		case U'\u2029':
		case U'\u202F':
		case U'\u205F':
		case U'\u3000':
			return true;
		default:
			return ch >= U'\u2000' && ch <= U'\u200A';
	}
}

std::optional<double> parse_double(std::string_view text) {
	if (!text.empty() && text.front() == '+') {
		text.remove_prefix(1);
		if (!text.empty() && text.front() == '-') {
			return std::nullopt;
		}
	}
	if (text.empty()) {
		return std::nullopt;
	}
	double value = 0.0;
	const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
	if (ec != std::errc{} || ptr != text.data() + text.size() || !std::isfinite(value)) {
		return std::nullopt;
	}
	return value;
}

std::string format_double(double value) {
	if (std::isnan(value) || std::isinf(value)) {
		return value > 0 ? "inf" : (value < 0 ? "-inf" : "NaN");
	}
	if (value == 0.0) {
		return "0";
	}
	char buf[64];
	const auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
	if (ec != std::errc{}) {
		return std::to_string(value);
	}
	return std::string(buf, ptr);
}

std::optional<std::string> read_file_bytes(const wxString& path) {
	wxFFile file(path, "rb");
	if (!file.IsOpened()) {
		return std::nullopt;
	}
	const auto length = file.Length();
	std::string bytes(static_cast<size_t>(std::max<wxFileOffset>(length, 0)), '\0');
	if (!bytes.empty() && file.Read(bytes.data(), bytes.size()) != bytes.size()) {
		return std::nullopt;
	}
	return bytes;
}

bool write_file_bytes(const wxString& path, const std::string& bytes) {
	wxFFile file(path, "wb");
	if (!file.IsOpened()) {
		return false;
	}
	if (file.Write(bytes.data(), bytes.size()) != bytes.size()) {
		return false;
	}
	return file.Close();
}

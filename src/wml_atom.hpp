/* wml_atom.hpp - atoms, the smallest units of word-processing comparison.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <memory>
#include <pugixml.hpp>
#include <string>
#include <vector>

enum class wml_content_kind {
	text,
	paragraph_mark,
	run_properties,
	break_,
	tab,
	drawing,
	picture,
	math,
	footnote_ref,
	endnote_ref,
	field_begin,
	field_separator,
	field_end,
	simple_field,
	symbol,
	object,
	unknown,
};

enum class correlation_status {
	nil,
	normal,
	unknown,
	inserted,
	deleted,
	equal,
	format_changed,
	group,
};

[[nodiscard]] const char* correlation_status_name(correlation_status status) noexcept;

// One element above an atom. Atoms under the same element share the handle.
struct wml_ancestor {
	pugi::xml_node node;
	std::string local;
	std::string unid;
	std::string correlated_hash;
};

using ancestor_ptr = std::shared_ptr<const wml_ancestor>;

struct wml_atom;
using atom_ptr = std::shared_ptr<wml_atom>;

struct wml_atom {
	wml_content_kind kind{wml_content_kind::unknown};
	char32_t ch{0};
	// Note id, field instruction, symbol font:char or content hash, depending on kind.
	std::string value;
	std::string hash;
	pugi::xml_node content;
	std::vector<ancestor_ptr> ancestors;
	std::vector<std::string> ancestor_unids;
	correlation_status status{correlation_status::nil};
	std::string formatting_signature;
	std::string part;
	atom_ptr before;
	std::string before_rpr;
	std::string before_signature;

	[[nodiscard]] bool is_text() const noexcept {
		return kind == wml_content_kind::text;
	}

	[[nodiscard]] bool is_paragraph_mark() const noexcept {
		return kind == wml_content_kind::paragraph_mark;
	}

	// Innermost ancestor with the given local name, or nullptr.
	[[nodiscard]] ancestor_ptr find_ancestor(const std::string& local) const;
	[[nodiscard]] std::string display_text() const;
};

// Identity key hashed into wml_atom::hash. Text keys are already case and space normalized.
[[nodiscard]] std::string atom_identity_key(wml_content_kind kind, char32_t ch, const std::string& value);

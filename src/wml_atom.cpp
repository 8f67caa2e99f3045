/* wml_atom.cpp - atoms, the smallest units of word-processing comparison.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "wml_atom.hpp"
#include "utils.hpp"

const char* correlation_status_name(correlation_status status) noexcept {
	switch (status) {
		case correlation_status::nil:
			return "Nil";
		case correlation_status::normal:
			return "Normal";
		case correlation_status::unknown:
			return "Unknown";
		case correlation_status::inserted:
			return "Inserted";
		case correlation_status::deleted:
			return "Deleted";
		case correlation_status::equal:
			return "Equal";
		case correlation_status::format_changed:
			return "FormatChanged";
		case correlation_status::group:
			return "Group";
	}
	return "Nil";
}

ancestor_ptr wml_atom::find_ancestor(const std::string& local) const {
	for (auto it = ancestors.rbegin(); it != ancestors.rend(); ++it) {
		if ((*it)->local == local) {
			return *it;
		}
	}
	return nullptr;
}

std::string wml_atom::display_text() const {
	switch (kind) {
		case wml_content_kind::text:
			return u32_to_utf8(ch);
		case wml_content_kind::paragraph_mark:
			return "\xC2\xB6";
		case wml_content_kind::break_:
			return "\xE2\x8F\x8E";
		case wml_content_kind::tab:
			return "\xE2\x86\x92";
		default:
			return {};
	}
}

std::string atom_identity_key(wml_content_kind kind, char32_t ch, const std::string& value) {
	switch (kind) {
		case wml_content_kind::text:
			return "t" + u32_to_utf8(ch);
		case wml_content_kind::paragraph_mark:
			return "pPr";
		case wml_content_kind::run_properties:
			return "rPr";
		case wml_content_kind::break_:
			return "br";
		case wml_content_kind::tab:
			return "tab";
		case wml_content_kind::drawing:
			return "drawing" + value;
		case wml_content_kind::picture:
			return "pict" + value;
		case wml_content_kind::math:
			return "math" + value;
		case wml_content_kind::footnote_ref:
			return "footnoteRef" + value;
		case wml_content_kind::endnote_ref:
			return "endnoteRef" + value;
		case wml_content_kind::field_begin:
			return "fldBegin";
		case wml_content_kind::field_separator:
			return "fldSep";
		case wml_content_kind::field_end:
			return "fldEnd";
		case wml_content_kind::simple_field:
			return "fldSimple" + value;
		case wml_content_kind::symbol:
			return "sym" + value;
		case wml_content_kind::object:
			return "object" + value;
		case wml_content_kind::unknown:
			return "unknown" + value;
	}
	return "unknown" + value;
}

/* wml_preprocess.hpp - markup simplification and element identifiers.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <pugixml.hpp>
#include <string>

struct wml_simplify_settings {
	bool remove_bookmarks{true};
	bool remove_comments{true};
	bool remove_content_controls{true};
	bool remove_field_codes{true};
	bool remove_hyperlinks{true};
	bool remove_last_rendered_page_break{true};
	bool remove_permissions{true};
	bool remove_proof{true};
	bool remove_rsid_info{true};
	bool remove_smart_tags{true};
	bool remove_soft_hyphens{true};
};

void wml_simplify_markup(pugi::xml_node root, const wml_simplify_settings& settings = {});

// Hands out element identifiers that are unique across every tree of one comparison.
class unid_generator {
public:
	[[nodiscard]] std::string next();

private:
	unsigned long counter{0};
};

// Gives every element below root a pt14:Unid, keeping the ones it already has.
void assign_unids(pugi::xml_node root, unid_generator& generator);
void ensure_powertools_namespace(pugi::xml_node document_element);
void strip_powertools_markup(pugi::xml_node root);
[[nodiscard]] bool is_rsid_attribute(const char* name);

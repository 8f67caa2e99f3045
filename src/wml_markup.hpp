/* wml_markup.hpp - native revision markup for compared word-processing parts.
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

class revision_id_generator {
public:
	explicit revision_id_generator(int start = 0) : next_id{start} {
	}

	int next() noexcept {
		return next_id++;
	}

private:
	int next_id;
};

struct wml_revision_stamp {
	std::string author;
	std::string date;
};

// Turns pt14:Status markers into ins/del wrappers, paragraph mark revisions, row revisions and rPrChange stamps.
void wml_mark_revisions(pugi::xml_node root, const wml_revision_stamp& stamp);
// Sorts property children into schema order and moves container properties to the front.
void wml_order_elements(pugi::xml_node root);
// Every revision element gets the next id, written as its first attribute.
void wml_renumber_revisions(pugi::xml_node root, revision_id_generator& ids);
[[nodiscard]] bool is_revision_element(pugi::xml_node node);
void wml_decorate(pugi::xml_node root, const wml_revision_stamp& stamp, revision_id_generator& ids);

/* package.hpp - OOXML package container over wx zip streams.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <map>
#include <memory>
#include <pugixml.hpp>
#include <string>
#include <vector>
#include <wx/string.h>

struct relationship {
	std::string id;
	std::string type;
	std::string target;
	bool external{false};
};

class package {
public:
	package() = default;

	[[nodiscard]] static package open(const std::string& bytes);
	[[nodiscard]] static package open_file(const wxString& path);
	[[nodiscard]] bool has_part(const std::string& path) const;
	// Returns nullptr when the part does not exist.
	[[nodiscard]] const std::string* get_part(const std::string& path) const;
	void put_part(const std::string& path, std::string data);
	void remove_part(const std::string& path);
	// Throws compare_exception(missing_part) when absent and (xml_parse) when ill-formed.
	[[nodiscard]] std::unique_ptr<pugi::xml_document> get_xml_part(const std::string& path) const;
	// Returns nullptr when absent or unreadable, for auxiliary parts.
	[[nodiscard]] std::unique_ptr<pugi::xml_document> try_get_xml_part(const std::string& path) const;
	void put_xml_part(const std::string& path, const pugi::xml_document& doc);
	[[nodiscard]] std::string save() const;
	void save_file(const wxString& path) const;

	[[nodiscard]] const std::vector<std::string>& part_names() const noexcept {
		return order;
	}

	[[nodiscard]] std::vector<relationship> get_relationships(const std::string& source_part) const;
	[[nodiscard]] const relationship* find_relationship(const std::string& source_part, const std::string& id) const;
	// Adds a relationship and returns its id; when id is empty a fresh rIdN is chosen.
	std::string add_relationship(const std::string& source_part, const std::string& type, const std::string& target, std::string id = {}, bool external = false);
	void add_content_type_override(const std::string& part, const std::string& content_type);
	// Override for the part, else the default for its extension, else empty.
	[[nodiscard]] std::string content_type(const std::string& part) const;

	[[nodiscard]] static std::string relationships_path(const std::string& part);
	[[nodiscard]] static std::string resolve_target(const std::string& source_part, const std::string& target);
	[[nodiscard]] static std::string normalize_path(const std::string& path);

private:
	std::vector<std::string> order;
	std::map<std::string, std::string> parts;
	mutable std::map<std::string, std::vector<relationship>> rels_cache;
};

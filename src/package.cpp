/* package.cpp - OOXML package container over wx zip streams.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "package.hpp"
#include "compare_exception.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include "xml_utils.hpp"
#include <Poco/Path.h>
#include <algorithm>
#include <wx/log.h>
#include <wx/mstream.h>
#include <wx/wfstream.h>
#include <wx/zipstrm.h>

namespace {
constexpr const char* CONTENT_TYPES_PART = "[Content_Types].xml";

std::string strip_leading_slash(const std::string& path) {
	if (!path.empty() && path.front() == '/') {
		return path.substr(1);
	}
	return path;
}
}

package package::open(const std::string& bytes) {
	if (bytes.empty()) {
		throw compare_exception(error_kind::package, "empty input");
	}
	wxMemoryInputStream mem(bytes.data(), bytes.size());
	wxZipInputStream zip(mem);
	if (!zip.IsOk()) {
		throw compare_exception(error_kind::package, "not a zip archive");
	}
	package pkg;
	std::unique_ptr<wxZipEntry> entry;
	while ((entry.reset(zip.GetNextEntry())), entry != nullptr) {
		if (entry->IsDir()) {
			continue;
		}
		const std::string name = strip_leading_slash(entry->GetInternalName().ToStdString(wxConvUTF8));
		std::string data = read_zip_entry(zip);
		if (zip.GetLastError() == wxSTREAM_READ_ERROR) {
			throw compare_exception(error_kind::package, "failed to read zip entry", name);
		}
		if (pkg.parts.find(name) == pkg.parts.end()) {
			pkg.order.push_back(name);
		}
		pkg.parts[name] = std::move(data);
	}
	if (pkg.parts.empty()) {
		throw compare_exception(error_kind::package, "archive contains no parts");
	}
	if (!pkg.has_part(CONTENT_TYPES_PART)) {
		throw compare_exception(error_kind::package, "missing content types", CONTENT_TYPES_PART);
	}
	return pkg;
}

package package::open_file(const wxString& path) {
	const auto bytes = read_file_bytes(path);
	if (!bytes) {
		throw compare_exception(error_kind::package, "cannot read file", path.ToStdString(wxConvUTF8));
	}
	try {
		return open(*bytes);
	} catch (const compare_exception& e) {
		if (e.get_locator().empty()) {
			throw compare_exception(e.get_kind(), e.get_message(), path.ToStdString(wxConvUTF8));
		}
		throw;
	}
}

bool package::has_part(const std::string& path) const {
	return parts.find(strip_leading_slash(path)) != parts.end();
}

const std::string* package::get_part(const std::string& path) const {
	const auto it = parts.find(strip_leading_slash(path));
	return it == parts.end() ? nullptr : &it->second;
}

void package::put_part(const std::string& path, std::string data) {
	const std::string name = strip_leading_slash(path);
	if (parts.find(name) == parts.end()) {
		order.push_back(name);
	}
	parts[name] = std::move(data);
	if (name.find("_rels/") != std::string::npos) {
		rels_cache.clear();
	}
}

void package::remove_part(const std::string& path) {
	const std::string name = strip_leading_slash(path);
	parts.erase(name);
	order.erase(std::remove(order.begin(), order.end(), name), order.end());
	rels_cache.clear();
}

std::unique_ptr<pugi::xml_document> package::get_xml_part(const std::string& path) const {
	const auto* data = get_part(path);
	if (data == nullptr) {
		throw compare_exception(error_kind::missing_part, "required part is missing", path);
	}
	auto doc = std::make_unique<pugi::xml_document>();
	load_xml(*doc, *data, path);
	return doc;
}

std::unique_ptr<pugi::xml_document> package::try_get_xml_part(const std::string& path) const {
	const auto* data = get_part(path);
	if (data == nullptr) {
		return nullptr;
	}
	auto doc = std::make_unique<pugi::xml_document>();
	if (const auto parsed = doc->load_buffer(data->data(), data->size(), XML_PARSE_FLAGS); !parsed) {
		wxLogWarning("Ignoring unreadable part %s: %s", path, parsed.description());
		return nullptr;
	}
	return doc;
}

void package::put_xml_part(const std::string& path, const pugi::xml_document& doc) {
	put_part(path, serialize_xml(doc));
}

std::string package::save() const {
	wxMemoryOutputStream mem;
	{
		wxZipOutputStream zip(mem);
		for (const auto& name : order) {
			const auto& data = parts.at(name);
			if (!zip.PutNextEntry(wxString::FromUTF8(name))) {
				throw compare_exception(error_kind::package, "failed to add zip entry", name);
			}
			if (!data.empty()) {
				zip.Write(data.data(), data.size());
			}
		}
		if (!zip.Close()) {
			throw compare_exception(error_kind::package, "failed to finish zip archive");
		}
	}
	std::string out(mem.GetSize(), '\0');
	if (!out.empty()) {
		mem.CopyTo(out.data(), out.size());
	}
	return out;
}

void package::save_file(const wxString& path) const {
	if (!write_file_bytes(path, save())) {
		throw compare_exception(error_kind::package, "cannot write output file", path.ToStdString(wxConvUTF8));
	}
}

std::string package::relationships_path(const std::string& part) {
	const std::string name = strip_leading_slash(part);
	if (name.empty()) {
		return "_rels/.rels";
	}
	const auto slash = name.rfind('/');
	if (slash == std::string::npos) {
		return "_rels/" + name + ".rels";
	}
	return name.substr(0, slash) + "/_rels/" + name.substr(slash + 1) + ".rels";
}

std::string package::normalize_path(const std::string& path) {
	const Poco::Path parsed(path, Poco::Path::PATH_UNIX);
	std::vector<std::string> segments;
	for (int i = 0; i <= parsed.depth(); ++i) {
		const std::string& segment = i < parsed.depth() ? parsed[i] : parsed.getFileName();
		if (segment == "..") {
			if (!segments.empty()) {
				segments.pop_back();
			}
		} else if (!segment.empty() && segment != ".") {
			segments.push_back(segment);
		}
	}
	std::string result;
	for (const auto& segment : segments) {
		if (!result.empty()) {
			result += '/';
		}
		result += segment;
	}
	return result;
}

std::string package::resolve_target(const std::string& source_part, const std::string& target) {
	const std::string decoded = url_decode(target);
	if (!decoded.empty() && decoded.front() == '/') {
		return normalize_path(decoded.substr(1));
	}
	Poco::Path source(strip_leading_slash(source_part), Poco::Path::PATH_UNIX);
	source.makeParent();
	source.append(Poco::Path(decoded, Poco::Path::PATH_UNIX));
	return normalize_path(source.toString(Poco::Path::PATH_UNIX));
}

std::vector<relationship> package::get_relationships(const std::string& source_part) const {
	const std::string rels_path = relationships_path(source_part);
	const auto cached = rels_cache.find(rels_path);
	if (cached != rels_cache.end()) {
		return cached->second;
	}
	std::vector<relationship> rels;
	if (auto doc = try_get_xml_part(rels_path)) {
		for (auto rel : doc->document_element().children()) {
			if (!has_local_name(rel, "Relationship")) {
				continue;
			}
			relationship r;
			r.id = rel.attribute("Id").as_string();
			r.type = rel.attribute("Type").as_string();
			r.target = rel.attribute("Target").as_string();
			r.external = std::string(rel.attribute("TargetMode").as_string()) == "External";
			rels.push_back(std::move(r));
		}
	}
	rels_cache[rels_path] = rels;
	return rels;
}

const relationship* package::find_relationship(const std::string& source_part, const std::string& id) const {
	get_relationships(source_part);
	const auto& rels = rels_cache[relationships_path(source_part)];
	const auto it = std::find_if(rels.begin(), rels.end(), [&](const relationship& r) { return r.id == id; });
	return it == rels.end() ? nullptr : &*it;
}

std::string package::add_relationship(const std::string& source_part, const std::string& type, const std::string& target, std::string id, bool external) {
	const std::string rels_path = relationships_path(source_part);
	auto doc = try_get_xml_part(rels_path);
	if (!doc) {
		doc = std::make_unique<pugi::xml_document>();
		auto root = doc->append_child("Relationships");
		root.append_attribute("xmlns") = PACKAGE_REL_NS;
	}
	auto root = doc->document_element();
	if (id.empty()) {
		int next = 1;
		for (auto rel : root.children()) {
			const std::string existing = rel.attribute("Id").as_string();
			if (existing.rfind("rId", 0) == 0) {
				try {
					next = std::max(next, std::stoi(existing.substr(3)) + 1);
				} catch (const std::exception&) {
					continue;
				}
			}
		}
		id = "rId" + std::to_string(next);
	}
	auto rel = root.append_child("Relationship");
	rel.append_attribute("Id") = id.c_str();
	rel.append_attribute("Type") = type.c_str();
	rel.append_attribute("Target") = target.c_str();
	if (external) {
		rel.append_attribute("TargetMode") = "External";
	}
	put_xml_part(rels_path, *doc);
	rels_cache.erase(rels_path);
	return id;
}

void package::add_content_type_override(const std::string& part, const std::string& content_type) {
	auto doc = get_xml_part(CONTENT_TYPES_PART);
	auto root = doc->document_element();
	const std::string part_name = "/" + strip_leading_slash(part);
	for (auto node : root.children()) {
		if (has_local_name(node, "Override") && part_name == node.attribute("PartName").as_string()) {
			node.attribute("ContentType").set_value(content_type.c_str());
			put_xml_part(CONTENT_TYPES_PART, *doc);
			return;
		}
	}
	auto node = root.append_child("Override");
	node.append_attribute("PartName") = part_name.c_str();
	node.append_attribute("ContentType") = content_type.c_str();
	put_xml_part(CONTENT_TYPES_PART, *doc);
}

std::string package::content_type(const std::string& part) const {
	auto doc = try_get_xml_part(CONTENT_TYPES_PART);
	if (!doc) {
		return {};
	}
	const std::string part_name = "/" + strip_leading_slash(part);
	const auto dot = part_name.rfind('.');
	const std::string extension = dot == std::string::npos ? std::string{} : to_lower_ascii(part_name.substr(dot + 1));
	std::string fallback;
	for (auto node : doc->document_element().children()) {
		if (has_local_name(node, "Override") && part_name == node.attribute("PartName").as_string()) {
			return node.attribute("ContentType").as_string();
		}
		if (has_local_name(node, "Default") && !extension.empty() && extension == to_lower_ascii(node.attribute("Extension").as_string())) {
			fallback = node.attribute("ContentType").as_string();
		}
	}
	return fallback;
}

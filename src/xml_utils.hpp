/* xml_utils.hpp - pugixml helpers shared by every comparer.
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
#include <string_view>
#include <vector>

inline constexpr unsigned int XML_PARSE_FLAGS = pugi::parse_default | pugi::parse_ws_pcdata;
inline constexpr const char* XML_DECLARATION = "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\r\n";

// Throws compare_exception(xml_parse) with the locator on failure.
void load_xml(pugi::xml_document& doc, std::string_view content, const std::string& locator);
[[nodiscard]] std::string serialize_xml(const pugi::xml_document& doc);
[[nodiscard]] std::string node_to_string(pugi::xml_node node);
[[nodiscard]] std::string local_name(pugi::xml_node node);
[[nodiscard]] bool has_local_name(pugi::xml_node node, std::string_view name);
[[nodiscard]] pugi::xml_node first_child_local(pugi::xml_node node, std::string_view name);
[[nodiscard]] std::vector<pugi::xml_node> children_local(pugi::xml_node node, std::string_view name);
[[nodiscard]] std::vector<pugi::xml_node> element_children(pugi::xml_node node);
[[nodiscard]] std::vector<pugi::xml_node> descendants_local(pugi::xml_node node, std::string_view name);
[[nodiscard]] pugi::xml_node first_descendant_local(pugi::xml_node node, std::string_view name);
[[nodiscard]] pugi::xml_node ancestor_local(pugi::xml_node node, std::string_view name);
[[nodiscard]] std::string attribute_local(pugi::xml_node node, std::string_view name);
// Like attribute_local, but only namespace-qualified attributes match (r:id rather than id).
[[nodiscard]] std::string qualified_attribute_local(pugi::xml_node node, std::string_view name);
// Text of every descendant element with the given local name, concatenated in document order.
[[nodiscard]] std::string descendant_text(pugi::xml_node node, std::string_view name);
// Moves every child of node into its parent at node's position, then removes node.
void unwrap_node(pugi::xml_node node);
void remove_children(pugi::xml_node node);
// Prefix bound to uri on root, declaring preferred_prefix for it when no binding exists.
std::string declare_namespace(pugi::xml_node root, const char* uri, const char* preferred_prefix);

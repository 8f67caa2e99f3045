/* wml_coalesce.cpp - rebuilding word-processing markup from resolved atoms.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "wml_coalesce.hpp"
#include "constants.hpp"
#include "package.hpp"
#include "utils.hpp"
#include "wml_atomizer.hpp"
#include "xml_utils.hpp"
#include <algorithm>
#include <map>
#include <unordered_map>
#include <wx/log.h>

namespace {
using atom_list = std::vector<atom_ptr>;

bool is_before_paired(const wml_atom& atom) {
	return atom.before && (atom.status == correlation_status::equal || atom.status == correlation_status::format_changed);
}

std::string key_at(const wml_atom& atom, size_t level) {
	return level < atom.ancestor_unids.size() ? atom.ancestor_unids[level] : std::string{};
}

std::string qualified(pugi::xml_node like, const char* local) {
	const std::string prefix = get_prefix(like.name());
	return prefix.empty() ? std::string(local) : prefix + ":" + local;
}

void copy_attributes(pugi::xml_node source, pugi::xml_node dest) {
	for (auto attr : source.attributes()) {
		if (std::string_view(attr.name()).rfind("pt14:", 0) == 0) {
			continue;
		}
		dest.append_attribute(attr.name()) = attr.value();
	}
}

void mark_status(pugi::xml_node node, correlation_status status) {
	if (status == correlation_status::deleted || status == correlation_status::inserted || status == correlation_status::format_changed) {
		auto attr = node.attribute(PT_STATUS);
		if (!attr) {
			attr = node.append_attribute(PT_STATUS);
		}
		attr = correlation_status_name(status);
	}
}

class coalescer {
public:
	coalescer(const wml_coalesce_context& context) : context{context} {
	}

	void build(pugi::xml_node parent, const atom_list& atoms, size_t level) {
		size_t i{0};
		while (i < atoms.size()) {
			const std::string key = key_at(*atoms[i], level);
			size_t j = i + 1;
			while (j < atoms.size() && key_at(*atoms[j], level) == key) {
				++j;
			}
			const atom_list group(atoms.begin() + static_cast<std::ptrdiff_t>(i), atoms.begin() + static_cast<std::ptrdiff_t>(j));
			if (key.empty()) {
				emit_loose(parent, group);
			} else {
				build_container(parent, group, level);
			}
			i = j;
		}
	}

	wml_coalesce_stats stats;

private:
	const wml_coalesce_context& context;
	std::unordered_map<std::string, std::string> imported_ids;

	void count(const wml_atom& atom) {
		switch (atom.status) {
			case correlation_status::inserted:
				++stats.inserted;
				break;
			case correlation_status::deleted:
				++stats.deleted;
				break;
			case correlation_status::format_changed:
				++stats.format_changed;
				break;
			default:
				++stats.equal;
				break;
		}
	}

	// The element whose unid the group carries; remapped atoms still point at their own source element.
	static ancestor_ptr owner(const atom_list& group, size_t level) {
		const std::string& key = group.front()->ancestor_unids[level];
		for (const auto& atom : group) {
			if (atom->ancestors[level]->unid == key) {
				return atom->ancestors[level];
			}
		}
		return group.front()->ancestors[level];
	}

	void build_container(pugi::xml_node parent, const atom_list& group, size_t level) {
		const auto source = owner(group, level);
		if (source->local == "p") {
			build_paragraphs(parent, group, level, source->node);
		} else if (source->local == "r") {
			build_runs(parent, group, level);
		} else {
			auto element = parent.append_child(source->node.name());
			copy_attributes(source->node, element);
			const auto& properties = wml_container_properties(source->local);
			for (auto child : source->node.children()) {
				if (child.type() == pugi::node_element && std::find(properties.begin(), properties.end(), get_local_name(child.name())) != properties.end()) {
					element.append_copy(child);
				}
			}
			build(element, group, level + 1);
		}
	}

	// A group holding more than one paragraph mark is split after each mark.
	void build_paragraphs(pugi::xml_node parent, const atom_list& group, size_t level, pugi::xml_node source) {
		atom_list content;
		for (const auto& atom : group) {
			if (atom->is_paragraph_mark() && atom->ancestors.size() == level + 1) {
				emit_paragraph(parent, content, atom, level, source);
				content.clear();
			} else {
				content.push_back(atom);
			}
		}
		if (!content.empty()) {
			emit_paragraph(parent, content, nullptr, level, source);
		}
	}

	void emit_paragraph(pugi::xml_node parent, const atom_list& content, const atom_ptr& mark, size_t level, pugi::xml_node source) {
		auto paragraph = parent.append_child(source.name());
		copy_attributes(mark ? mark->ancestors[level]->node : source, paragraph);
		build(paragraph, content, level + 1);
		if (!mark) {
			return;
		}
		count(*mark);
		pugi::xml_node properties;
		if (mark->content) {
			properties = paragraph.prepend_copy(mark->content);
		} else if (mark->status == correlation_status::deleted || mark->status == correlation_status::inserted) {
			properties = paragraph.prepend_child(qualified(paragraph, "pPr").c_str());
		}
		if (properties && mark->status != correlation_status::format_changed) {
			mark_status(properties, mark->status);
		}
	}

	static std::string run_key(const wml_atom& atom, size_t level) {
		if (atom.ancestors.size() > level + 1) {
			return "nested";
		}
		std::string key = correlation_status_name(atom.status);
		key += "|" + atom.formatting_signature;
		if (atom.status == correlation_status::format_changed) {
			key += "|" + atom.before_signature;
		}
		return key;
	}

	void build_runs(pugi::xml_node parent, const atom_list& group, size_t level) {
		size_t i{0};
		while (i < group.size()) {
			const std::string key = run_key(*group[i], level);
			size_t j = i + 1;
			while (j < group.size() && run_key(*group[j], level) == key) {
				++j;
			}
			const atom_list segment(group.begin() + static_cast<std::ptrdiff_t>(i), group.begin() + static_cast<std::ptrdiff_t>(j));
			const auto& first = segment.front();
			const auto source = first->ancestors[level]->node;
			auto run = parent.append_child(source.name());
			copy_attributes(source, run);
			if (auto rpr = first_child_local(source, "rPr")) {
				run.append_copy(rpr);
			}
			if (key == "nested") {
				build(run, segment, level + 1);
			} else {
				mark_status(run, first->status);
				if (first->status == correlation_status::format_changed) {
					add_previous_properties(run, *first);
				}
				emit_run_content(run, segment);
			}
			i = j;
		}
	}

	void add_previous_properties(pugi::xml_node run, const wml_atom& atom) {
		auto rpr = first_child_local(run, "rPr");
		if (!rpr) {
			rpr = run.prepend_child(qualified(run, "rPr").c_str());
		}
		auto change = rpr.append_child(qualified(run, "rPrChange").c_str());
		auto previous = change.append_child(qualified(run, "rPr").c_str());
		const auto before_run = atom.before ? atom.before->find_ancestor("r") : nullptr;
		if (!before_run) {
			return;
		}
		if (auto before_rpr = first_child_local(before_run->node, "rPr")) {
			for (auto child : before_rpr.children()) {
				if (child.type() == pugi::node_element && !has_local_name(child, "rPrChange")) {
					previous.append_copy(child);
				}
			}
		}
	}

	void emit_run_content(pugi::xml_node run, const atom_list& atoms) {
		std::u32string text;
		const wml_atom* text_owner{nullptr};
		auto flush = [&]() {
			if (text.empty()) {
				return;
			}
			const bool deleted = text_owner->status == correlation_status::deleted;
			auto element = run.append_child(qualified(text_owner->content ? text_owner->content : run, deleted ? "delText" : "t").c_str());
			if (is_unicode_whitespace(text.front()) || is_unicode_whitespace(text.back())) {
				element.append_attribute("xml:space") = "preserve";
			}
			element.text().set(u32_to_utf8(text).c_str());
			text.clear();
		};
		for (const auto& atom : atoms) {
			count(*atom);
			if (atom->is_text()) {
				text_owner = atom.get();
				text.push_back(atom->ch);
				continue;
			}
			flush();
			if (!atom->content) {
				continue;
			}
			auto copy = run.append_copy(atom->content);
			if (atom->status == correlation_status::deleted) {
				if (has_local_name(copy, "instrText")) {
					copy.set_name(qualified(copy, "delInstrText").c_str());
				}
				import_relationships(copy);
			}
		}
		flush();
	}

	// Content with no container at this depth, such as math directly inside a paragraph.
	void emit_loose(pugi::xml_node parent, const atom_list& atoms) {
		for (const auto& atom : atoms) {
			count(*atom);
			if (!atom->content || atom->is_paragraph_mark()) {
				continue;
			}
			auto copy = parent.append_copy(atom->content);
			mark_status(copy, atom->status);
			if (atom->status == correlation_status::deleted) {
				import_relationships(copy);
			}
		}
	}

	void import_relationships(pugi::xml_node node) {
		if (!context.old_package || !context.output_package) {
			return;
		}
		for (auto attr : node.attributes()) {
			if (std::string_view(attr.name()).rfind("r:", 0) != 0) {
				continue;
			}
			const std::string mapped = import_relationship(attr.value());
			if (!mapped.empty()) {
				attr.set_value(mapped.c_str());
			}
		}
		for (auto child : node.children()) {
			if (child.type() == pugi::node_element) {
				import_relationships(child);
			}
		}
	}

	std::string import_relationship(const std::string& id) {
		const auto cached = imported_ids.find(id);
		if (cached != imported_ids.end()) {
			return cached->second;
		}
		const relationship* rel = context.old_package->find_relationship(context.part, id);
		if (!rel) {
			return {};
		}
		package& output = *context.output_package;
		std::string new_id;
		if (rel->external) {
			new_id = output.add_relationship(context.part, rel->type, rel->target, {}, true);
		} else {
			const std::string source_path = package::resolve_target(context.part, rel->target);
			const std::string* bytes = context.old_package->get_part(source_path);
			if (!bytes) {
				wxLogWarning("Relationship %s of %s points at missing part %s", id, context.part, source_path);
				return {};
			}
			std::string dest = source_path;
			for (int n = 1; output.get_part(dest) && *output.get_part(dest) != *bytes; ++n) {
				const auto dot = source_path.rfind('.');
				const auto slash = source_path.rfind('/');
				const bool has_extension = dot != std::string::npos && (slash == std::string::npos || dot > slash);
				dest = has_extension ? source_path.substr(0, dot) + "_old" + std::to_string(n) + source_path.substr(dot) : source_path + "_old" + std::to_string(n);
			}
			if (!output.get_part(dest)) {
				output.put_part(dest, *bytes);
				const std::string type = context.old_package->content_type(source_path);
				if (!type.empty() && output.content_type(dest) != type) {
					output.add_content_type_override(dest, type);
				}
			}
			for (const auto& existing : output.get_relationships(context.part)) {
				if (!existing.external && existing.type == rel->type && package::resolve_target(context.part, existing.target) == dest) {
					new_id = existing.id;
					break;
				}
			}
			if (new_id.empty()) {
				new_id = output.add_relationship(context.part, rel->type, "/" + dest);
			}
		}
		imported_ids[id] = new_id;
		return new_id;
	}
};

struct paragraph_frame {
	std::vector<std::string> unids;
	std::vector<std::string> locals;
};

bool prefix_matches(const wml_atom& atom, const paragraph_frame& frame) {
	if (atom.ancestors.size() < frame.locals.size()) {
		return false;
	}
	for (size_t i = 0; i < frame.locals.size(); ++i) {
		if (atom.ancestors[i]->local != frame.locals[i]) {
			return false;
		}
	}
	return true;
}

void adopt_frame(wml_atom& atom, const std::map<size_t, paragraph_frame>& frames, size_t below) {
	for (auto it = frames.rbegin(); it != frames.rend(); ++it) {
		if (it->first >= below || !prefix_matches(atom, it->second)) {
			continue;
		}
		std::copy(it->second.unids.begin(), it->second.unids.end(), atom.ancestor_unids.begin());
		return;
	}
}
}

void wml_assemble_ancestor_unids(std::vector<atom_ptr>& atoms) {
	std::unordered_map<std::string, std::string> older_to_newer;
	for (const auto& atom : atoms) {
		if (!is_before_paired(*atom) || atom->before->ancestors.size() != atom->ancestors.size()) {
			continue;
		}
		for (size_t i = 0; i < atom->ancestors.size(); ++i) {
			if (atom->before->ancestors[i]->local == atom->ancestors[i]->local) {
				older_to_newer.emplace(atom->before->ancestors[i]->unid, atom->ancestors[i]->unid);
			}
		}
	}
	for (auto& atom : atoms) {
		if (atom->status != correlation_status::deleted) {
			continue;
		}
		for (auto& unid : atom->ancestor_unids) {
			const auto mapped = older_to_newer.find(unid);
			if (mapped != older_to_newer.end()) {
				unid = mapped->second;
			}
		}
	}
	// Walking backwards, every atom joins the paragraph whose mark follows it.
	std::map<size_t, paragraph_frame> frames;
	for (auto it = atoms.rbegin(); it != atoms.rend(); ++it) {
		auto& atom = **it;
		const size_t depth = atom.ancestors.size();
		if (!atom.is_paragraph_mark()) {
			adopt_frame(atom, frames, depth);
			continue;
		}
		adopt_frame(atom, frames, depth);
		frames.erase(frames.upper_bound(depth), frames.end());
		paragraph_frame frame;
		frame.unids = atom.ancestor_unids;
		for (const auto& ancestor : atom.ancestors) {
			frame.locals.push_back(ancestor->local);
		}
		frames[depth] = std::move(frame);
	}
}

wml_coalesce_stats wml_coalesce(pugi::xml_node parent, const std::vector<atom_ptr>& atoms, const wml_coalesce_context& context) {
	coalescer builder(context);
	builder.build(parent, atoms, 0);
	wxLogVerbose("Coalesced %zu atoms into %s", builder.stats.total(), context.part);
	return builder.stats;
}

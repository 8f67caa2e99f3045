/* wml_comparer.cpp - drives the word-processing comparison pipeline over a pair of packages.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "wml_comparer.hpp"
#include "compare_exception.hpp"
#include "constants.hpp"
#include "package.hpp"
#include "wml_atomizer.hpp"
#include "wml_block_hash.hpp"
#include "wml_comparison_unit.hpp"
#include "wml_formatting.hpp"
#include "wml_lcs.hpp"
#include "wml_markup.hpp"
#include "wml_preprocess.hpp"
#include "wml_revision_accepter.hpp"
#include "xml_utils.hpp"
#include <map>
#include <memory>
#include <wx/log.h>

namespace {
constexpr const char* DOCUMENT_PART = "word/document.xml";
constexpr const char* FOOTNOTES_PART = "word/footnotes.xml";
constexpr const char* ENDNOTES_PART = "word/endnotes.xml";

// Brings a source tree into the form every later stage expects.
void prepare_tree(pugi::xml_document& doc, unid_generator& unids, const wml_comparer_settings& settings) {
	auto root = doc.document_element();
	wml_simplify_markup(root);
	wml_accept_all_revisions(root);
	ensure_powertools_namespace(root);
	assign_unids(root, unids);
	wml_assign_block_hashes(root, settings);
}

void count_statuses(const std::vector<atom_ptr>& atoms, wml_coalesce_stats& stats) {
	for (const auto& atom : atoms) {
		switch (atom->status) {
			case correlation_status::equal:
				++stats.equal;
				break;
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
				throw compare_exception(error_kind::internal, "atom left without a terminal status", atom->part);
		}
	}
}

void add_stats(wml_coalesce_stats& total, const wml_coalesce_stats& part) {
	total.equal += part.equal;
	total.inserted += part.inserted;
	total.deleted += part.deleted;
	total.format_changed += part.format_changed;
}

void merge_namespaces(pugi::xml_node from, pugi::xml_node into) {
	for (auto attr : from.attributes()) {
		const std::string name = attr.name();
		if (name.rfind("xmlns", 0) == 0 && !into.attribute(attr.name())) {
			into.append_attribute(attr.name()).set_value(attr.value());
		}
	}
}

class comparison {
public:
	comparison(const package& older, const package& newer, const wml_comparer_settings& settings) : older{older}, newer{newer}, settings{settings}, output{newer}, revision_ids{settings.starting_revision_id} {
		stamp.author = settings.effective_author();
		stamp.date = settings.effective_date();
	}

	wml_comparison_result run() {
		compare_document();
		compare_notes(FOOTNOTES_PART, "footnote");
		compare_notes(ENDNOTES_PART, "endnote");
		result.document = output.save();
		for (const auto& change : result.changes) {
			switch (change.type) {
				case wml_change_type::text_inserted:
				case wml_change_type::paragraph_inserted:
				case wml_change_type::table_row_inserted:
				case wml_change_type::image_inserted:
					++result.insertions;
					break;
				case wml_change_type::text_deleted:
				case wml_change_type::paragraph_deleted:
				case wml_change_type::table_row_deleted:
				case wml_change_type::image_deleted:
					++result.deletions;
					break;
				case wml_change_type::format_changed:
					++result.format_changes;
					break;
				default:
					break;
			}
		}
		wxLogVerbose("Comparison produced %zu insertions, %zu deletions and %zu format changes", result.insertions, result.deletions, result.format_changes);
		return std::move(result);
	}

private:
	const package& older;
	const package& newer;
	const wml_comparer_settings& settings;
	package output;
	unid_generator unids;
	revision_id_generator revision_ids;
	wml_revision_stamp stamp;
	wml_comparison_result result;

	// Correlates two content parents and writes the merged content under target.
	// A non-empty pinned_root makes every atom share one outermost container.
	void compare_content(pugi::xml_node content1, pugi::xml_node content2, pugi::xml_node target, const std::string& part, const std::string& pinned_root) {
		std::vector<atom_ptr> atoms1;
		std::vector<atom_ptr> atoms2;
		if (content1) {
			atoms1 = wml_create_atom_list(content1, part, &older, settings);
		}
		if (content2) {
			atoms2 = wml_create_atom_list(content2, part, &newer, settings);
		}
		wxLogVerbose("%s: %zu atoms in the older document, %zu in the newer", part, atoms1.size(), atoms2.size());
		const auto units1 = wml_get_comparison_units(atoms1, settings);
		const auto units2 = wml_get_comparison_units(atoms2, settings);
		const auto sequences = wml_lcs(units1, units2, settings);
		wxLogVerbose("%s: %zu correlated sequences", part, sequences.size());
		auto atoms = wml_flatten_to_atoms(sequences);
		if (settings.track_formatting_changes) {
			const size_t retagged = wml_reconcile_formatting(atoms);
			wxLogVerbose("%s: %zu atoms changed formatting", part, retagged);
		}
		count_statuses(atoms, result.correlated);
		if (!pinned_root.empty()) {
			for (auto& atom : atoms) {
				if (!atom->ancestor_unids.empty()) {
					atom->ancestor_unids.front() = pinned_root;
				}
			}
		}
		wml_assemble_ancestor_unids(atoms);
		add_stats(result.coalesced, wml_coalesce(target, atoms, {&older, &output, part}));
	}

	void compare_document() {
		auto doc1 = older.get_xml_part(DOCUMENT_PART);
		auto doc2 = newer.get_xml_part(DOCUMENT_PART);
		prepare_tree(*doc1, unids, settings);
		prepare_tree(*doc2, unids, settings);
		const auto body1 = first_child_local(doc1->document_element(), "body");
		const auto body2 = first_child_local(doc2->document_element(), "body");
		if (!body1 || !body2) {
			throw compare_exception(error_kind::invalid_package, "document has no body", DOCUMENT_PART);
		}
		pugi::xml_document out;
		auto root = out.append_copy(doc2->document_element());
		merge_namespaces(doc1->document_element(), root);
		auto body = first_child_local(root, "body");
		remove_children(body);
		compare_content(body1, body2, body, DOCUMENT_PART, {});
		pugi::xml_node final_section;
		for (auto child : body2.children()) {
			if (has_local_name(child, "sectPr")) {
				final_section = child;
			}
		}
		if (final_section) {
			body.append_copy(final_section);
		}
		wml_decorate(root, stamp, revision_ids);
		output.put_xml_part(DOCUMENT_PART, out);
		auto changes = wml_extract_changes(root, stamp.author, stamp.date);
		result.changes.insert(result.changes.end(), changes.begin(), changes.end());
	}

	void compare_notes(const char* part, const char* note_local) {
		auto notes1 = older.try_get_xml_part(part);
		auto notes2 = newer.try_get_xml_part(part);
		if (!notes2) {
			return;
		}
		prepare_tree(*notes2, unids, settings);
		std::map<std::string, pugi::xml_node> old_notes;
		if (notes1) {
			prepare_tree(*notes1, unids, settings);
			for (auto note : children_local(notes1->document_element(), note_local)) {
				old_notes[attribute_local(note, "id")] = note;
			}
		}
		pugi::xml_document out;
		auto root = out.append_copy(notes2->document_element());
		if (notes1) {
			merge_namespaces(notes1->document_element(), root);
		}
		const auto new_notes = children_local(notes2->document_element(), note_local);
		const auto out_notes = children_local(root, note_local);
		for (size_t i = 0; i < new_notes.size() && i < out_notes.size(); ++i) {
			const std::string id = attribute_local(new_notes[i], "id");
			pugi::xml_node old_note;
			if (const auto it = old_notes.find(id); it != old_notes.end()) {
				old_note = it->second;
				old_notes.erase(it);
			}
			replace_note(old_note, new_notes[i], out_notes[i], part);
		}
		// Notes whose references were deleted keep their text, marked deleted.
		for (const auto& [id, old_note] : old_notes) {
			auto placeholder = root.append_child(old_note.name());
			replace_note(old_note, {}, placeholder, part);
		}
		wml_decorate(root, stamp, revision_ids);
		output.put_xml_part(part, out);
		auto changes = wml_extract_changes(root, stamp.author, stamp.date);
		result.changes.insert(result.changes.end(), changes.begin(), changes.end());
	}

	void replace_note(pugi::xml_node old_note, pugi::xml_node new_note, pugi::xml_node slot, const std::string& part) {
		const auto pinned = new_note ? new_note : old_note;
		pugi::xml_document scratch;
		auto holder = scratch.append_child("holder");
		compare_content(old_note, new_note, holder, part, pinned.attribute(PT_UNID).as_string());
		const auto merged = holder.first_child();
		if (!merged) {
			return;
		}
		slot.parent().insert_copy_before(merged, slot);
		slot.parent().remove_child(slot);
	}
};

std::vector<wml_change> extract_part(const package& pkg, const char* part) {
	auto doc = pkg.try_get_xml_part(part);
	if (!doc) {
		return {};
	}
	return wml_extract_changes(doc->document_element());
}

std::string rewrite_revisions(const std::string& document, const revision_selection& selection) {
	auto pkg = package::open(document);
	if (!pkg.has_part(DOCUMENT_PART)) {
		throw compare_exception(error_kind::missing_part, "main document part is missing", DOCUMENT_PART);
	}
	for (const char* part : {DOCUMENT_PART, FOOTNOTES_PART, ENDNOTES_PART}) {
		if (!pkg.has_part(part)) {
			continue;
		}
		auto doc = pkg.get_xml_part(part);
		wml_apply_revisions(doc->document_element(), selection);
		pkg.put_xml_part(part, *doc);
	}
	return pkg.save();
}
}

wml_comparison_result wml_compare(const std::string& older, const std::string& newer, const wml_comparer_settings& settings) {
	const auto package1 = package::open(older);
	const auto package2 = package::open(newer);
	comparison run(package1, package2, settings);
	return run.run();
}

std::vector<wml_change> wml_get_revisions(const std::string& document) {
	const auto pkg = package::open(document);
	const auto doc = pkg.get_xml_part(DOCUMENT_PART);
	auto result = wml_extract_changes(doc->document_element());
	for (const char* part : {FOOTNOTES_PART, ENDNOTES_PART}) {
		auto notes = extract_part(pkg, part);
		result.insert(result.end(), notes.begin(), notes.end());
	}
	return result;
}

std::string wml_apply_revision_ids(const std::string& document, const std::set<int>& revision_ids) {
	return rewrite_revisions(document, {revision_strategy::accept_by_ids, revision_ids});
}

std::string wml_revert_revision_ids(const std::string& document, const std::set<int>& revision_ids) {
	return rewrite_revisions(document, {revision_strategy::reject_by_ids, revision_ids});
}

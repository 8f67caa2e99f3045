/* wml_lcs_tests.cpp - word breaking and correlation tests.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "test_documents.hpp"
#include "wml_atomizer.hpp"
#include "wml_block_hash.hpp"
#include "wml_comparison_unit.hpp"
#include "wml_lcs.hpp"
#include "wml_preprocess.hpp"
#include "xml_utils.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

namespace {
const char* W_NS = R"(xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main")";

class wml_lcs_test : public ::testing::Test {
protected:
	wml_comparer_settings settings;
	unid_generator unids;
	std::vector<std::unique_ptr<pugi::xml_document>> trees;

	std::vector<atom_ptr> atoms_of(const std::string& body) {
		auto doc = std::make_unique<pugi::xml_document>();
		load_xml(*doc, std::string("<w:document ") + W_NS + "><w:body>" + body + "</w:body></w:document>", "test");
		auto root = doc->document_element();
		wml_simplify_markup(root);
		ensure_powertools_namespace(root);
		assign_unids(root, unids);
		wml_assign_block_hashes(root, settings);
		auto atoms = wml_create_atom_list(first_child_local(root, "body"), "word/document.xml", nullptr, settings);
		trees.push_back(std::move(doc));
		return atoms;
	}

	std::vector<std::string> words_of(const std::string& text) {
		std::vector<std::string> words;
		for (const auto& unit : wml_split_into_words(atoms_of(wml_paragraph(text)), settings)) {
			if (!unit->word().is_paragraph_mark()) {
				words.push_back(unit->word().text());
			}
		}
		return words;
	}

	std::vector<atom_ptr> correlate(const std::string& body1, const std::string& body2) {
		const auto units1 = wml_get_comparison_units(atoms_of(body1), settings);
		const auto units2 = wml_get_comparison_units(atoms_of(body2), settings);
		return wml_flatten_to_atoms(wml_lcs(units1, units2, settings));
	}

	static std::string text_with_status(const std::vector<atom_ptr>& atoms, correlation_status status) {
		std::string text;
		for (const auto& atom : atoms) {
			if (atom->status == status && atom->is_text()) {
				text += atom->display_text();
			}
		}
		return text;
	}
};
} // namespace

TEST_F(wml_lcs_test, SpacesSeparateWords) {
	EXPECT_EQ(words_of("one two"), (std::vector<std::string>{"one", " ", "two"}));
}

TEST_F(wml_lcs_test, DecimalPointsStayInsideNumbers) {
	EXPECT_EQ(words_of("12.34"), (std::vector<std::string>{"12.34"}));
	EXPECT_EQ(words_of("Test."), (std::vector<std::string>{"Test", "."}));
}

TEST_F(wml_lcs_test, HyphensAndParenthesesStandAlone) {
	EXPECT_EQ(words_of("a-b(c)"), (std::vector<std::string>{"a", "-", "b", "(", "c", ")"}));
}

TEST_F(wml_lcs_test, IdeographsAreWordsOfTheirOwn) {
	EXPECT_EQ(words_of("\xE4\xB8\xAD\xE6\x96\x87"), (std::vector<std::string>{"\xE4\xB8\xAD", "\xE6\x96\x87"}));
}

TEST_F(wml_lcs_test, CustomSeparatorsReplaceTheDefaults) {
	settings.word_separators = {U'|'};
	EXPECT_EQ(words_of("a|b-c"), (std::vector<std::string>{"a", "|", "b-c"}));
}

TEST_F(wml_lcs_test, IdenticalContentIsEqual) {
	const auto atoms = correlate(wml_paragraph("same words here"), wml_paragraph("same words here"));
	ASSERT_FALSE(atoms.empty());
	for (const auto& atom : atoms) {
		EXPECT_EQ(atom->status, correlation_status::equal);
	}
}

TEST_F(wml_lcs_test, ChangedWordsAreDeletedAndInserted) {
	const auto atoms = correlate(wml_paragraph("the lazy dog"), wml_paragraph("the active dog"));
	EXPECT_EQ(text_with_status(atoms, correlation_status::deleted), "lazy");
	EXPECT_EQ(text_with_status(atoms, correlation_status::inserted), "active");
	EXPECT_EQ(text_with_status(atoms, correlation_status::equal), "the  dog");
}

TEST_F(wml_lcs_test, NothingStaysUnknown) {
	const std::string old_body = wml_paragraph("First paragraph stays.") + wml_paragraph("Second one changes a lot.") + wml_paragraph("Gone entirely");
	const std::string new_body = wml_paragraph("First paragraph stays.") + wml_paragraph("Second one is rewritten.") + wml_paragraph("Brand new closing line");
	for (const auto& atom : correlate(old_body, new_body)) {
		EXPECT_NE(atom->status, correlation_status::unknown);
		EXPECT_NE(atom->status, correlation_status::nil);
	}
}

TEST_F(wml_lcs_test, EmptySideInsertsEverything) {
	const auto atoms = correlate("", wml_paragraph("fresh"));
	ASSERT_FALSE(atoms.empty());
	for (const auto& atom : atoms) {
		EXPECT_EQ(atom->status, correlation_status::inserted);
	}
}

TEST_F(wml_lcs_test, FormattingSignatureIsAHashOfRelevantProperties) {
	settings.track_formatting_changes = true;
	const auto bold = atoms_of(R"(<w:p><w:r><w:rPr><w:b/><w:color w:val="FF0000" w:themeColor="accent1"/></w:rPr><w:t>A</w:t></w:r></w:p>)");
	const auto same = atoms_of(R"(<w:p><w:r><w:rPr><w:b/><w:color w:val="FF0000"/><w:lang w:val="en-US"/></w:rPr><w:t>A</w:t></w:r></w:p>)");
	const auto italic = atoms_of(R"(<w:p><w:r><w:rPr><w:i/><w:color w:val="FF0000"/></w:rPr><w:t>A</w:t></w:r></w:p>)");
	const auto plain = atoms_of(R"(<w:p><w:r><w:t>A</w:t></w:r></w:p>)");
	const std::string& signature = bold.front()->formatting_signature;
	ASSERT_EQ(signature.size(), 40u);
	EXPECT_EQ(signature.find_first_not_of("0123456789abcdef"), std::string::npos);
	EXPECT_EQ(same.front()->formatting_signature, signature);
	EXPECT_NE(italic.front()->formatting_signature, signature);
	EXPECT_TRUE(plain.front()->formatting_signature.empty());
}

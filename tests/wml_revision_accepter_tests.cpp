/* wml_revision_accepter_tests.cpp - revision acceptance and rejection tests.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "wml_revision_accepter.hpp"
#include "xml_utils.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>
#include <wx/log.h>

namespace {
const std::string W_NS = R"(xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main" xmlns:m="http://schemas.openxmlformats.org/officeDocument/2006/math")";
const std::string REVISED_BODY = R"(<w:p><w:r><w:t xml:space="preserve">Keep </w:t></w:r>)"
								 R"(<w:del w:id="1" w:author="A" w:date="2025-01-01T00:00:00Z"><w:r><w:delText>old</w:delText></w:r></w:del>)"
								 R"(<w:ins w:id="2" w:author="A" w:date="2025-01-01T00:00:00Z"><w:r><w:t>new</w:t></w:r></w:ins></w:p>)";

// One fraction; a deleted control marks the whole fraction deleted.
std::string fraction(bool deleted) {
	std::string ctrl = "<m:ctrlPr>";
	if (deleted) {
		ctrl += R"(<w:del w:id="9" w:author="A" w:date="2025-01-01T00:00:00Z"/>)";
	}
	ctrl += "</m:ctrlPr>";
	return "<m:f><m:fPr>" + ctrl + "</m:fPr><m:num><m:r><m:t>1</m:t></m:r></m:num><m:den><m:r><m:t>2</m:t></m:r></m:den></m:f>";
}

class recording_log : public wxLog {
public:
	std::vector<wxString> warnings;

protected:
	void DoLogTextAtLevel(wxLogLevel level, const wxString& msg) override {
		if (level == wxLOG_Warning) {
			warnings.push_back(msg);
		}
	}
};

class revision_accepter_test : public ::testing::Test {
protected:
	pugi::xml_document doc;

	void load(const std::string& body) {
		load_xml(doc, "<w:document " + W_NS + "><w:body>" + body + "</w:body></w:document>", "test");
	}

	std::string body_text() const {
		std::string text;
		for (auto p : descendants_local(doc.document_element(), "p")) {
			if (!text.empty()) {
				text += '|';
			}
			text += descendant_text(p, "t");
		}
		return text;
	}

	size_t count(const char* local) const {
		return descendants_local(doc.document_element(), local).size();
	}
};
} // namespace

TEST_F(revision_accepter_test, AcceptAllKeepsInsertionsAndDropsDeletions) {
	load(REVISED_BODY);
	wml_accept_all_revisions(doc.document_element());
	EXPECT_EQ(body_text(), "Keep new");
	EXPECT_EQ(count("ins"), 0u);
	EXPECT_EQ(count("del"), 0u);
	EXPECT_EQ(count("delText"), 0u);
}

TEST_F(revision_accepter_test, RejectByIdsRestoresDeletedText) {
	load(REVISED_BODY);
	wml_apply_revisions(doc.document_element(), {revision_strategy::reject_by_ids, {1, 2}});
	EXPECT_EQ(body_text(), "Keep old");
	EXPECT_EQ(count("delText"), 0u);
}

TEST_F(revision_accepter_test, AcceptByIdsTouchesOnlyListedRevisions) {
	load(REVISED_BODY);
	wml_apply_revisions(doc.document_element(), {revision_strategy::accept_by_ids, {2}});
	EXPECT_EQ(count("ins"), 0u);
	ASSERT_EQ(count("del"), 1u);
	EXPECT_EQ(descendant_text(doc.document_element(), "delText"), "old");
	EXPECT_EQ(body_text(), "Keep new");
}

TEST_F(revision_accepter_test, AcceptedParagraphMarkDeletionMergesParagraphs) {
	load(R"(<w:p><w:pPr><w:rPr><w:del w:id="5" w:author="A" w:date="2025-01-01T00:00:00Z"/></w:rPr></w:pPr><w:r><w:t xml:space="preserve">first </w:t></w:r></w:p>)"
		 R"(<w:p><w:r><w:t>second</w:t></w:r></w:p>)");
	wml_accept_all_revisions(doc.document_element());
	EXPECT_EQ(count("p"), 1u);
	EXPECT_EQ(body_text(), "first second");
}

TEST_F(revision_accepter_test, RejectedRowInsertionRemovesTheRow) {
	load(R"(<w:tbl><w:tr><w:tc><w:p><w:r><w:t>kept</w:t></w:r></w:p></w:tc></w:tr>)"
		 R"(<w:tr><w:trPr><w:ins w:id="7" w:author="A" w:date="2025-01-01T00:00:00Z"/></w:trPr><w:tc><w:p><w:ins w:id="8" w:author="A" w:date="2025-01-01T00:00:00Z"><w:r><w:t>added</w:t></w:r></w:ins></w:p></w:tc></w:tr></w:tbl>)");
	wml_apply_revisions(doc.document_element(), {revision_strategy::reject_by_ids, {7, 8}});
	EXPECT_EQ(count("tr"), 1u);
	EXPECT_EQ(body_text(), "kept");
}

TEST_F(revision_accepter_test, RejectedFormatChangeRestoresPreviousProperties) {
	load(R"(<w:p><w:r><w:rPr><w:i/><w:rPrChange w:id="3" w:author="A" w:date="2025-01-01T00:00:00Z"><w:rPr><w:b/></w:rPr></w:rPrChange></w:rPr><w:t>Hello</w:t></w:r></w:p>)");
	wml_apply_revisions(doc.document_element(), {revision_strategy::reject_by_ids, {3}});
	const auto r_pr = first_descendant_local(doc.document_element(), "rPr");
	ASSERT_TRUE(r_pr);
	EXPECT_TRUE(first_child_local(r_pr, "b"));
	EXPECT_FALSE(first_child_local(r_pr, "i"));
	EXPECT_EQ(count("rPrChange"), 0u);
}

TEST_F(revision_accepter_test, AcceptedFormatChangeKeepsCurrentProperties) {
	load(R"(<w:p><w:r><w:rPr><w:i/><w:rPrChange w:id="3" w:author="A" w:date="2025-01-01T00:00:00Z"><w:rPr><w:b/></w:rPr></w:rPrChange></w:rPr><w:t>Hello</w:t></w:r></w:p>)");
	wml_accept_all_revisions(doc.document_element());
	const auto r_pr = first_descendant_local(doc.document_element(), "rPr");
	ASSERT_TRUE(r_pr);
	EXPECT_TRUE(first_child_local(r_pr, "i"));
	EXPECT_FALSE(first_child_local(r_pr, "b"));
}

TEST_F(revision_accepter_test, RevisionsWithoutIdsAreNotSelectedById) {
	load(R"(<w:p><w:ins w:author="A"><w:r><w:t>anonymous</w:t></w:r></w:ins></w:p>)");
	wml_apply_revisions(doc.document_element(), {revision_strategy::reject_by_ids, {0}});
	EXPECT_EQ(body_text(), "anonymous");
}

TEST_F(revision_accepter_test, AcceptAllDropsDeletedTextOutsideADeletion) {
	load(R"(<w:p><w:r><w:t xml:space="preserve">kept </w:t></w:r><w:r><w:delText>stray</w:delText></w:r></w:p>)");
	recording_log log;
	wxLog* previous = wxLog::SetActiveTarget(&log);
	const bool was_enabled = wxLog::EnableLogging(true);
	wml_accept_all_revisions(doc.document_element());
	wxLog::EnableLogging(was_enabled);
	wxLog::SetActiveTarget(previous);
	EXPECT_EQ(count("delText"), 0u);
	EXPECT_EQ(body_text(), "kept ");
	ASSERT_EQ(log.warnings.size(), 1u);
	EXPECT_NE(log.warnings[0].Find("outside a deletion"), wxNOT_FOUND);
}

TEST_F(revision_accepter_test, RejectLeavesStrayDeletedTextAlone) {
	load(R"(<w:p><w:r><w:delText>stray</w:delText></w:r></w:p>)");
	wml_apply_revisions(doc.document_element(), {revision_strategy::reject_by_ids, {1}});
	EXPECT_EQ(count("delText"), 1u);
}

TEST_F(revision_accepter_test, AcceptAllRemovesDeletedMath) {
	load("<w:p><m:oMath>" + fraction(true) + fraction(false) + "</m:oMath></w:p>");
	wml_accept_all_revisions(doc.document_element());
	const auto fractions = descendants_local(doc.document_element(), "f");
	ASSERT_EQ(fractions.size(), 1u);
	EXPECT_FALSE(first_descendant_local(fractions[0], "del"));
	EXPECT_EQ(count("del"), 0u);
}

TEST_F(revision_accepter_test, RejectedMathDeletionKeepsTheFraction) {
	load("<w:p><m:oMath>" + fraction(true) + "</m:oMath></w:p>");
	wml_apply_revisions(doc.document_element(), {revision_strategy::reject_by_ids, {9}});
	EXPECT_EQ(count("f"), 1u);
	EXPECT_EQ(count("del"), 0u);
}

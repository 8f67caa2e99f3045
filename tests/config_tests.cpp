/* config_tests.cpp - settings file and comparer registry tests.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "comparer.hpp"
#include "config_manager.hpp"
#include "utils.hpp"
#include <gtest/gtest.h>
#include <wx/filefn.h>
#include <wx/filename.h>

namespace {
class config_test : public ::testing::Test {
protected:
	wxString path;

	void TearDown() override {
		if (!path.empty()) {
			wxRemoveFile(path);
		}
	}

	void write_config(const std::string& text) {
		path = wxFileName::CreateTempFileName("ooxdiff");
		ASSERT_FALSE(path.empty());
		ASSERT_TRUE(write_file_bytes(path, text));
	}
};
} // namespace

TEST_F(config_test, MissingFileIsReported) {
	config_manager config;
	EXPECT_FALSE(config.initialize(wxFileName(wxFileName::GetTempDir(), "ooxdiff-no-such-file.ini").GetFullPath()));
	EXPECT_FALSE(config.is_initialized());
}

TEST_F(config_test, DefaultsWithoutAFile) {
	config_manager config;
	const auto wml = config.wml_settings();
	EXPECT_FALSE(wml.case_insensitive);
	EXPECT_DOUBLE_EQ(wml.detail_threshold, 0.0);
	EXPECT_EQ(wml.word_separators, default_word_separators());
	const auto sml = config.sml_settings();
	EXPECT_EQ(sml.author, sml_comparer_settings{}.author);
	EXPECT_DOUBLE_EQ(sml.sheet_rename_similarity_threshold, 0.7);
	const auto pml = config.pml_settings();
	EXPECT_EQ(pml.position_tolerance, 91440);
	EXPECT_EQ(pml.inserted_color, "00AA00");
}

TEST_F(config_test, FileValuesOverrideDefaults) {
	write_config("[wml]\nauthor=Reviewer\ncase_insensitive=1\ndetail_threshold=0.25\nstarting_revision_id=100\n"
		"[sml]\nnumeric_tolerance=0.5\ncompare_formatting=0\n"
		"[pml]\nposition_tolerance=1000\nadd_summary_slide=0\nmoved_color=123456\n");
	config_manager config;
	ASSERT_TRUE(config.initialize(path));
	const auto wml = config.wml_settings();
	EXPECT_EQ(wml.author, "Reviewer");
	EXPECT_TRUE(wml.case_insensitive);
	EXPECT_DOUBLE_EQ(wml.detail_threshold, 0.25);
	EXPECT_EQ(wml.starting_revision_id, 100);
	const auto sml = config.sml_settings();
	EXPECT_DOUBLE_EQ(sml.numeric_tolerance, 0.5);
	EXPECT_FALSE(sml.compare_formatting);
	EXPECT_TRUE(sml.compare_values);
	const auto pml = config.pml_settings();
	EXPECT_EQ(pml.position_tolerance, 1000);
	EXPECT_FALSE(pml.add_summary_slide);
	EXPECT_EQ(pml.moved_color, "123456");
}

TEST_F(config_test, ShutdownLeavesTheFileUntouched) {
	const std::string text = "[wml]\nauthor=Reviewer\n";
	write_config(text);
	config_manager config;
	ASSERT_TRUE(config.initialize(path));
	EXPECT_EQ(config.wml_settings().author, "Reviewer");
	config.shutdown();
	EXPECT_FALSE(config.is_initialized());
	EXPECT_EQ(config.wml_settings().author, wml_comparer_settings{}.author);
	const auto bytes = read_file_bytes(path);
	ASSERT_TRUE(bytes.has_value());
	EXPECT_EQ(*bytes, text);
}

TEST_F(config_test, OutOfRangeRatioFallsBackToDefault) {
	write_config("[wml]\ndetail_threshold=1.5\n[pml]\nslide_similarity_threshold=-0.2\n");
	config_manager config;
	ASSERT_TRUE(config.initialize(path));
	EXPECT_DOUBLE_EQ(config.wml_settings().detail_threshold, 0.0);
	EXPECT_DOUBLE_EQ(config.pml_settings().slide_similarity_threshold, 0.4);
}

TEST_F(config_test, WordSeparatorsReplaceTheDefaults) {
	write_config("[wml]\nword_separators=|/\n");
	config_manager config;
	ASSERT_TRUE(config.initialize(path));
	const auto wml = config.wml_settings();
	EXPECT_EQ(wml.word_separators, (std::vector<char32_t>{U'|', U'/'}));
	EXPECT_TRUE(wml.is_word_separator(U'|'));
	EXPECT_FALSE(wml.is_word_separator(U'-'));
}

TEST_F(config_test, UnknownKeysAreTolerated) {
	write_config("[wml]\nnot_a_setting=3\n[other]\nkey=value\n");
	config_manager config;
	EXPECT_TRUE(config.initialize(path));
	EXPECT_FALSE(config.wml_settings().case_insensitive);
}

TEST_F(config_test, CommandLineOverridesWin) {
	write_config("[wml]\nauthor=From file\ndetail_threshold=0.2\n");
	config_manager config;
	ASSERT_TRUE(config.initialize(path));
	compare_overrides overrides;
	overrides.author = "From flag";
	overrides.detail_threshold = 0.6;
	overrides.track_formatting = true;
	const auto settings = make_comparer_settings(config, overrides);
	EXPECT_EQ(settings.wml.author, "From flag");
	EXPECT_EQ(settings.sml.author, "From flag");
	EXPECT_EQ(settings.pml.author, "From flag");
	EXPECT_DOUBLE_EQ(settings.wml.detail_threshold, 0.6);
	EXPECT_TRUE(settings.wml.track_formatting_changes);
}

TEST(comparer_registry, FindsComparersByExtension) {
	const auto* docx = find_comparer_by_extension("DOCX");
	ASSERT_NE(docx, nullptr);
	EXPECT_EQ(docx->format(), "docx");
	ASSERT_NE(find_comparer_by_extension("xlsm"), nullptr);
	EXPECT_EQ(find_comparer_by_extension("xlsm")->format(), "xlsx");
	EXPECT_EQ(find_comparer_for_file("deck.pptx")->format(), "pptx");
	EXPECT_EQ(find_comparer_by_extension("odt"), nullptr);
	EXPECT_EQ(find_comparer_for_file("no_extension"), nullptr);
}

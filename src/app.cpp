/* app.cpp - console application and subcommands.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "app.hpp"
#include "change_json.hpp"
#include "compare_exception.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <optional>
#include <wx/datetime.h>
#include <wx/log.h>

wxIMPLEMENT_APP_CONSOLE(app);

namespace {
const wxCmdLineEntryDesc COMMAND_LINE_DESC[] = {
	{wxCMD_LINE_SWITCH, "h", "help", "show this help message", wxCMD_LINE_VAL_NONE, wxCMD_LINE_OPTION_HELP},
	{wxCMD_LINE_SWITCH, "v", "verbose", "log every pipeline stage"},
	{wxCMD_LINE_OPTION, nullptr, "config", "settings file", wxCMD_LINE_VAL_STRING},
	{wxCMD_LINE_OPTION, nullptr, "old", "older document", wxCMD_LINE_VAL_STRING},
	{wxCMD_LINE_OPTION, nullptr, "new", "newer document", wxCMD_LINE_VAL_STRING},
	{wxCMD_LINE_OPTION, nullptr, "out", "output document", wxCMD_LINE_VAL_STRING},
	{wxCMD_LINE_OPTION, nullptr, "base", "document to apply changes to", wxCMD_LINE_VAL_STRING},
	{wxCMD_LINE_OPTION, nullptr, "result", "document to revert changes in", wxCMD_LINE_VAL_STRING},
	{wxCMD_LINE_OPTION, nullptr, "changes", "change report written by the changes command", wxCMD_LINE_VAL_STRING},
	{wxCMD_LINE_OPTION, nullptr, "author", "author stamped on revisions", wxCMD_LINE_VAL_STRING},
	{wxCMD_LINE_OPTION, nullptr, "date", "revision date (RFC 3339)", wxCMD_LINE_VAL_STRING},
	{wxCMD_LINE_OPTION, nullptr, "detail-threshold", "minimum similarity for word-level detail, 0 to 1", wxCMD_LINE_VAL_DOUBLE},
	{wxCMD_LINE_SWITCH, nullptr, "track-formatting", "record formatting changes"},
	{wxCMD_LINE_SWITCH, nullptr, "json", "print changes as JSON"},
	{wxCMD_LINE_PARAM, nullptr, nullptr, "compare|changes|apply|revert", wxCMD_LINE_VAL_STRING},
	wxCMD_LINE_DESC_END,
};

std::string utf8(const wxString& value) {
	return std::string(value.utf8_str());
}

// Accepts YYYY-MM-DDTHH:MM:SS with an optional Z or numeric offset.
bool is_rfc3339(const wxString& value) {
	wxDateTime date;
	wxString::const_iterator end;
	if (!date.ParseFormat(value, "%Y-%m-%dT%H:%M:%S", &end)) {
		return false;
	}
	const wxString rest(end, value.end());
	return rest.empty() || rest == "Z" || rest.StartsWith("+") || rest.StartsWith("-");
}

std::optional<wxString> required_option(const wxCmdLineParser& parser, const char* name) {
	wxString value;
	if (!parser.Found(name, &value) || value.empty()) {
		wxLogError("Missing required option --%s", name);
		return std::nullopt;
	}
	return value;
}

const document_comparer* comparer_for(const wxString& path) {
	const auto* comp = find_comparer_for_file(path);
	if (comp == nullptr) {
		wxLogError("Unsupported file type: %s (expected one of %s)", path, get_supported_extensions());
	}
	return comp;
}

std::optional<std::string> read_input(const wxString& path) {
	auto bytes = read_file_bytes(path);
	if (!bytes) {
		wxLogError("Cannot read %s", path);
	}
	return bytes;
}

int write_output(const wxString& path, const std::string& bytes) {
	if (!write_file_bytes(path, bytes)) {
		wxLogError("Cannot write %s", path);
		return EXIT_WRITE_ERROR;
	}
	wxLogVerbose("Wrote %s", path);
	return EXIT_OK;
}

void print_report(const nlohmann::json& report) {
	const auto& items = report["items"];
	wxPrintf("%lu changes\n", static_cast<unsigned long>(items.size()));
	for (const auto& item : items) {
		wxPrintf("%s\t%s\n", wxString::FromUTF8(item.value("id", "")), wxString::FromUTF8(item.value("summary", "")));
		const std::string preview = item.value("preview", "");
		if (!preview.empty()) {
			wxPrintf("\t%s\n", wxString::FromUTF8(preview));
		}
	}
}
} // namespace

bool app::OnInit() {
	// Command line handling lives in OnRun so usage errors map to exit codes.
	delete wxLog::SetActiveTarget(new wxLogStderr());
	wxLog::DisableTimestamps();
	return true;
}

int app::OnRun() {
	wxCmdLineParser parser(COMMAND_LINE_DESC, argc, argv);
	parser.SetLogo(APP_NAME + " " + APP_VERSION);
	const int parsed = parser.Parse();
	if (parsed == -1) {
		return EXIT_OK;
	}
	if (parsed != 0) {
		return EXIT_USAGE;
	}
	if (parser.Found("verbose")) {
		wxLog::SetVerbose(true);
	}
	wxString config_path;
	if (parser.Found("config", &config_path) && !config_mgr.initialize(config_path)) {
		return EXIT_USAGE;
	}
	const wxString command = parser.GetParam(0);
	try {
		if (command == "apply") {
			return run_patch(parser, false);
		}
		if (command == "revert") {
			return run_patch(parser, true);
		}
		compare_overrides overrides;
		if (!read_overrides(parser, overrides)) {
			return EXIT_USAGE;
		}
		const auto settings = make_comparer_settings(config_mgr, overrides);
		if (command == "compare") {
			return run_compare(parser, settings);
		}
		if (command == "changes") {
			return run_changes(parser, settings);
		}
	} catch (const compare_exception& e) {
		wxLogError("%s error: %s", error_kind_name(e.get_kind()), wxString::FromUTF8(e.get_display_message()));
		return EXIT_PARSE_ERROR;
	} catch (const nlohmann::json::exception& e) {
		wxLogError("Malformed change report: %s", e.what());
		return EXIT_PARSE_ERROR;
	}
	wxLogError("Unknown command '%s'", command);
	parser.Usage();
	return EXIT_USAGE;
}

int app::OnExit() {
	config_mgr.shutdown();
	return wxAppConsole::OnExit();
}

bool app::read_overrides(const wxCmdLineParser& parser, compare_overrides& overrides) {
	wxString value;
	if (parser.Found("author", &value)) {
		overrides.author = utf8(value);
	}
	if (parser.Found("date", &value)) {
		if (!is_rfc3339(value)) {
			wxLogError("Invalid --date '%s'; expected an RFC 3339 timestamp", value);
			return false;
		}
		overrides.date_time = utf8(value);
	}
	double threshold = 0.0;
	if (parser.Found("detail-threshold", &threshold)) {
		if (threshold < 0.0 || threshold > 1.0) {
			wxLogError("--detail-threshold must lie between 0 and 1");
			return false;
		}
		overrides.detail_threshold = threshold;
	}
	overrides.track_formatting = parser.Found("track-formatting");
	return true;
}

int app::run_compare(const wxCmdLineParser& parser, const comparer_settings& settings) {
	const auto old_path = required_option(parser, "old");
	const auto new_path = required_option(parser, "new");
	const auto out_path = required_option(parser, "out");
	if (!old_path || !new_path || !out_path) {
		return EXIT_USAGE;
	}
	const auto* comp = comparer_for(*old_path);
	if (comp == nullptr) {
		return EXIT_USAGE;
	}
	if (find_comparer_for_file(*new_path) != comp) {
		wxLogError("%s and %s are not the same kind of document", *old_path, *new_path);
		return EXIT_USAGE;
	}
	const auto older = read_input(*old_path);
	const auto newer = read_input(*new_path);
	if (!older || !newer) {
		return EXIT_PARSE_ERROR;
	}
	wxLogVerbose("Comparing %s documents", comp->name());
	return write_output(*out_path, comp->compare(*older, *newer, settings));
}

int app::run_changes(const wxCmdLineParser& parser, const comparer_settings& settings) {
	const auto old_path = required_option(parser, "old");
	const auto new_path = required_option(parser, "new");
	if (!old_path || !new_path) {
		return EXIT_USAGE;
	}
	const auto* comp = comparer_for(*old_path);
	if (comp == nullptr) {
		return EXIT_USAGE;
	}
	if (find_comparer_for_file(*new_path) != comp) {
		wxLogError("%s and %s are not the same kind of document", *old_path, *new_path);
		return EXIT_USAGE;
	}
	const auto older = read_input(*old_path);
	const auto newer = read_input(*new_path);
	if (!older || !newer) {
		return EXIT_PARSE_ERROR;
	}
	const auto report = comp->changes(*older, *newer, settings);
	if (parser.Found("json")) {
		wxPrintf("%s\n", wxString::FromUTF8(report.dump(2)));
	} else {
		print_report(report);
	}
	return EXIT_OK;
}

int app::run_patch(const wxCmdLineParser& parser, bool revert) {
	const auto input_path = required_option(parser, revert ? "result" : "base");
	const auto changes_path = required_option(parser, "changes");
	const auto out_path = required_option(parser, "out");
	if (!input_path || !changes_path || !out_path) {
		return EXIT_USAGE;
	}
	const auto* comp = comparer_for(*input_path);
	if (comp == nullptr) {
		return EXIT_USAGE;
	}
	const auto input = read_input(*input_path);
	const auto report_text = read_input(*changes_path);
	if (!input || !report_text) {
		return EXIT_PARSE_ERROR;
	}
	const auto report = parse_change_report(*report_text, utf8(*changes_path));
	const std::string format = report["format"].get<std::string>();
	if (format != comp->format()) {
		wxLogError("%s holds %s changes, not %s", *changes_path, wxString::FromUTF8(format), wxString::FromUTF8(comp->format()));
		return EXIT_USAGE;
	}
	const std::string output = revert ? comp->revert(*input, report) : comp->apply(*input, report);
	return write_output(*out_path, output);
}

/* constants.hpp - application-wide constants.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <wx/string.h>

inline const wxString APP_NAME = "ooxdiff";
inline const wxString APP_VERSION = "0.3";

inline const char* DEFAULT_AUTHOR = "Open-Xml-PowerTools";

inline const char* SPREADSHEETML_NS = "http://schemas.openxmlformats.org/spreadsheetml/2006/main";
inline const char* PRESENTATIONML_NS = "http://schemas.openxmlformats.org/presentationml/2006/main";
inline const char* DRAWINGML_NS = "http://schemas.openxmlformats.org/drawingml/2006/main";
inline const char* REL_NS = "http://schemas.openxmlformats.org/officeDocument/2006/relationships";
inline const char* PACKAGE_REL_NS = "http://schemas.openxmlformats.org/package/2006/relationships";
inline const char* POWERTOOLS_NS = "http://powertools.codeplex.com/2011";

// Scaffolding attributes live under this prefix and never survive into output.
inline const char* PT_PREFIX = "pt14";
inline const char* PT_UNID = "pt14:Unid";
inline const char* PT_CORRELATED_HASH = "pt14:CorrelatedSHA1Hash";
inline const char* PT_STATUS = "pt14:Status";

inline const char* REL_TYPE_COMMENTS = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/comments";
inline const char* REL_TYPE_WORKSHEET = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet";
inline const char* REL_TYPE_SLIDE = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/slide";
inline const char* REL_TYPE_SLIDE_LAYOUT = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/slideLayout";
inline const char* REL_TYPE_NOTES_SLIDE = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/notesSlide";
inline const char* REL_TYPE_THEME = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/theme";
inline const char* REL_TYPE_STYLES = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles";

inline const char* CONTENT_TYPE_WORKSHEET = "application/vnd.openxmlformats-officedocument.spreadsheetml.worksheet+xml";
inline const char* CONTENT_TYPE_SML_STYLES = "application/vnd.openxmlformats-officedocument.spreadsheetml.styles+xml";
inline const char* CONTENT_TYPE_SLIDE = "application/vnd.openxmlformats-officedocument.presentationml.slide+xml";

enum exit_code {
	EXIT_OK = 0,
	EXIT_USAGE = 1,
	EXIT_PARSE_ERROR = 2,
	EXIT_WRITE_ERROR = 3,
};

/* compare_exception.cpp - error kind names.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "compare_exception.hpp"

const char* error_kind_name(error_kind kind) noexcept {
	switch (kind) {
		case error_kind::package:
			return "PackageError";
		case error_kind::xml_parse:
			return "XmlParse";
		case error_kind::missing_part:
			return "MissingPart";
		case error_kind::invalid_package:
			return "InvalidPackage";
		case error_kind::unsupported_feature:
			return "UnsupportedFeature";
		case error_kind::internal:
			return "Internal";
	}
	return "Internal";
}

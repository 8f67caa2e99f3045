/* hashing.cpp - content digests used for correlation.
 *
 * ooxdiff.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "hashing.hpp"
#include "compare_exception.hpp"
#include <cstdint>
#include <mbedtls/sha1.h>
#include <mbedtls/sha256.h>
#include <mbedtls/version.h>

namespace {
static int sha1_compute(const unsigned char* data, size_t len, unsigned char out[20]) {
#if MBEDTLS_VERSION_NUMBER >= 0x03000000
	return mbedtls_sha1(data, len, out);
#else
	return mbedtls_sha1_ret(data, len, out);
#endif
}

static int sha256_compute(const unsigned char* data, size_t len, unsigned char out[32]) {
#if MBEDTLS_VERSION_NUMBER >= 0x03000000
	return mbedtls_sha256(data, len, out, 0);
#else
	return mbedtls_sha256_ret(data, len, out, 0);
#endif
}

static std::string to_hex(const unsigned char* digest, size_t len) {
	static constexpr char k_hex[] = "0123456789abcdef";
	std::string out;
	out.reserve(len * 2);
	for (size_t i = 0; i < len; ++i) {
		out.push_back(k_hex[digest[i] >> 4]);
		out.push_back(k_hex[digest[i] & 0x0F]);
	}
	return out;
}

static std::string b64_encode(const unsigned char* data, size_t len) {
	static constexpr char k_alpha[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
	std::string out;
	out.reserve(((len + 2) / 3) * 4);
	size_t i{0};
	while (i + 3 <= len) {
		uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | uint32_t(data[i + 2]);
		out.push_back(k_alpha[(n >> 18) & 63]);
		out.push_back(k_alpha[(n >> 12) & 63]);
		out.push_back(k_alpha[(n >> 6) & 63]);
		out.push_back(k_alpha[n & 63]);
		i += 3;
	}
	size_t rem{len - i};
	if (rem == 1) {
		uint32_t n = (uint32_t(data[i]) << 16);
		out.push_back(k_alpha[(n >> 18) & 63]);
		out.push_back(k_alpha[(n >> 12) & 63]);
		out.append("==");
	} else if (rem == 2) {
		uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8);
		out.push_back(k_alpha[(n >> 18) & 63]);
		out.push_back(k_alpha[(n >> 12) & 63]);
		out.push_back(k_alpha[(n >> 6) & 63]);
		out.push_back('=');
	}
	return out;
}

static const unsigned char* bytes_of(std::string_view data) {
	return reinterpret_cast<const unsigned char*>(data.data());
}
}

std::string sha1_hex(std::string_view data) {
	unsigned char digest[20]{};
	if (sha1_compute(bytes_of(data), data.size(), digest) != 0) {
		throw compare_exception(error_kind::internal, "sha1 computation failed");
	}
	return to_hex(digest, sizeof(digest));
}

std::string sha256_hex(std::string_view data) {
	unsigned char digest[32]{};
	if (sha256_compute(bytes_of(data), data.size(), digest) != 0) {
		throw compare_exception(error_kind::internal, "sha256 computation failed");
	}
	return to_hex(digest, sizeof(digest));
}

std::string sha256_base64(std::string_view data) {
	unsigned char digest[32]{};
	if (sha256_compute(bytes_of(data), data.size(), digest) != 0) {
		throw compare_exception(error_kind::internal, "sha256 computation failed");
	}
	return b64_encode(digest, sizeof(digest));
}

std::string base64_encode(std::string_view data) {
	return b64_encode(bytes_of(data), data.size());
}

#pragma once

#include <cstddef>
#include <ctime>
#include <string>
#include <vector>

namespace edfrec {

std::string trim(const std::string& s);

std::vector<std::string> split(const std::string& s, char delim);

std::string to_lower(std::string s);

bool ends_with(const std::string& s, const std::string& suffix);

// Strict numeric parsing helpers.
//
// These functions trim leading/trailing whitespace and then require that the
// entire remaining string is a valid number (no trailing "abc" fragments).
// to_double() parses with the classic "C" locale.
int to_int(const std::string& s);
double to_double(const std::string& s);

// Convert UTF-8 text to Latin-1 (ISO 8859-1).
//
// Code points above U+00FF and malformed UTF-8 bytes are replaced by '?'.
// Embedded NUL bytes are dropped so the result is safe to pass as a C string.
std::string utf8_to_latin1(const std::string& utf8);

// Convert Latin-1 bytes to UTF-8 (lossless).
std::string latin1_to_utf8(const std::string& latin1);

// Reduce Latin-1 text to printable ASCII (0x20..0x7E) for EDF header fields.
//
// Accented Latin-1 letters are folded to their base letter (e.g. 0xE9 'e'),
// everything else outside the printable range becomes '_'.
std::string latin1_to_header_ascii(const std::string& latin1);

// Escape a string for embedding inside a JSON string literal.
std::string json_escape(const std::string& s);

// Thread-safe localtime (localtime_r / localtime_s).
bool localtime_safe(std::time_t t, std::tm* out);

} // namespace edfrec

#pragma once
// ASCII string helpers shared by the parsers and the narration engine
#include <string>
#include <string_view>
#include <vector>

namespace stmt::text {

std::string to_lower(std::string_view s);
std::string to_upper(std::string_view s);

// Strips ASCII whitespace (and NBSP) from both ends
std::string trim(std::string_view s);

// Replaces every whitespace run (including newlines) with a single space and trims
std::string collapse_whitespace(std::string_view s);

// "swIGGY   instamart" -> "Swiggy Instamart"
std::string title_case(std::string_view s);

bool starts_with(std::string_view s, std::string_view prefix);
bool contains(std::string_view haystack, std::string_view needle);

// Regex-style \b<word>\b search; word characters are [A-Za-z0-9_]
bool contains_word(std::string_view haystack, std::string_view word);

// Splits on any of the given delimiter characters; empty pieces are kept
std::vector<std::string> split_any(std::string_view s, std::string_view delims);

// Lower-cases and drops everything that is not [a-z0-9]
std::string alnum_key(std::string_view s);

bool is_word_char(char c);
bool is_space(char c);

} // namespace stmt::text

#pragma once

#include <string>
#include <vector>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Trim trailing whitespace in-place.
inline void trim_right(std::string& s) {
    auto end = s.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) { s.clear(); return; }
    s.erase(end + 1);
}

std::string to_lower(std::string s);

// Replace every occurrence of `from` with `to`.
std::string replace_all(std::string s, const std::string& from, const std::string& to);

// Random string of letters and digits (temporary remote file names).
std::string random_id(size_t size = 6);

// application/x-www-form-urlencoded encoding (space becomes '+').
std::string quote_plus(const std::string& s);

// Wrap in single quotes for a POSIX shell, escaping embedded single quotes.
std::string shell_single_quote(const std::string& s);

// True when the bytes form valid UTF-8.
bool is_valid_utf8(const std::string& s);

#pragma once
#include <string>
#include <regex>
#include <algorithm>
#include <cctype>   // for std::isspace

/*
-------------------------------------------------------------------------------
 validation.hpp - Input validation helpers (ASCII only)
-------------------------------------------------------------------------------
What this file provides:
  - trim: basic whitespace trimming helper.
  - is_valid_dataset_name: dataset names that are safe to turn into a path.
  - sql_tail_is_empty: decides whether the text sqlite3_prepare_v2 left
    unconsumed holds another statement.

Conventions:
  - A dataset name is 1..64 chars of letters, digits, '_' and '-'. No dots,
    so "../x" and "x.sql" are both rejected.
  - A tail is "empty" when it holds only whitespace, line comments
    (dash-dash), block comments (slash-star ... star-slash) and stray ';'
    separators.
-------------------------------------------------------------------------------
*/

// Trim leading and trailing whitespace.
inline std::string trim(std::string s) {
    auto ws = [](int ch) { return std::isspace(ch); };
    s.erase(s.begin(), std::find_if_not(s.begin(), s.end(), ws));
    s.erase(std::find_if_not(s.rbegin(), s.rend(), ws).base(), s.end());
    return s;
}

// e.g. rating, social_network, movies-2024
inline bool is_valid_dataset_name(const std::string& x) {
    static const std::regex re("^[A-Za-z0-9_\\-]{1,64}$");
    return std::regex_match(x, re);
}

// True if `tail` has no further statement in it.
inline bool sql_tail_is_empty(const char* tail) {
    if (!tail) return true;
    const char* p = tail;
    while (*p) {
        unsigned char c = static_cast<unsigned char>(*p);
        if (std::isspace(c) || c == ';') {
            ++p;
        }
        else if (p[0] == '-' && p[1] == '-') {
            while (*p && *p != '\n') ++p;
        }
        else if (p[0] == '/' && p[1] == '*') {
            p += 2;
            while (*p && !(p[0] == '*' && p[1] == '/')) ++p;
            if (!*p) return true;   // unterminated comment runs to the end
            p += 2;
        }
        else {
            return false;
        }
    }
    return true;
}

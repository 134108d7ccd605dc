#include "compare.hpp"
#include "helpers.hpp"
#include <algorithm>
#include <string>
#include <utility>

// Copy of `rows` sorted by their text form. Keys are built once per row.
static Rows sorted_by_text(const Rows& rows) {
    std::vector<std::pair<std::string, const Row*>> keyed;
    keyed.reserve(rows.size());
    for (const auto& r : rows)
        keyed.emplace_back(row_to_string(r), &r);
    std::stable_sort(keyed.begin(), keyed.end(),
        [](const auto& a, const auto& b) { return a.first < b.first; });

    Rows out;
    out.reserve(rows.size());
    for (const auto& k : keyed)
        out.push_back(*k.second);
    return out;
}

bool compare_rows(const Rows& expected, const Rows& actual, bool is_ordered) {
    if (expected.size() != actual.size()) return false;

    if (!is_ordered) {
        Rows e = sorted_by_text(expected);
        Rows a = sorted_by_text(actual);
        return std::equal(e.begin(), e.end(), a.begin(), row_equal);
    }
    return std::equal(expected.begin(), expected.end(), actual.begin(), row_equal);
}

bool compare_results(const QueryResult& expected, const QueryResult& actual, bool is_ordered) {
    static const Rows none;
    return compare_rows(expected.has_rows ? expected.rows : none,
        actual.has_rows ? actual.rows : none, is_ordered);
}

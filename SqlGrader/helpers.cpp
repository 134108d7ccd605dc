#include "helpers.hpp"
#include <cmath>
#include <cstdio>

/*
-------------------------------------------------------------------------------
 helpers.cpp — Value and row helpers
-------------------------------------------------------------------------------
Column reads copy out of SQLite immediately: the pointers returned by
sqlite3_column_text / sqlite3_column_blob are only valid until the next
sqlite3_step, and rows must outlive the sandbox they came from.

REAL formatting uses %.17g so two different doubles never print the same,
which keeps the unordered sort key total.
-------------------------------------------------------------------------------
*/

Value value_from_column(sqlite3_stmt* st, int col) {
    switch (sqlite3_column_type(st, col)) {
    case SQLITE_INTEGER:
        return Value::from_int(sqlite3_column_int64(st, col));
    case SQLITE_FLOAT:
        return Value::from_real(sqlite3_column_double(st, col));
    case SQLITE_TEXT: {
        const unsigned char* p = sqlite3_column_text(st, col);
        int n = sqlite3_column_bytes(st, col);
        // nullptr only when SQLite runs out of memory
        if (!p) return Value::from_text(std::string());
        return Value::from_text(std::string(reinterpret_cast<const char*>(p), n));
    }
    case SQLITE_BLOB: {
        const void* p = sqlite3_column_blob(st, col);
        int n = sqlite3_column_bytes(st, col);
        if (!p) return Value::from_blob(std::string());
        return Value::from_blob(std::string(static_cast<const char*>(p), n));
    }
    default:
        return Value::null();
    }
}

Row row_from_statement(sqlite3_stmt* st) {
    Row row;
    int n = sqlite3_column_count(st);
    row.reserve(n);
    for (int i = 0; i < n; ++i)
        row.push_back(value_from_column(st, i));
    return row;
}

static bool is_numeric(const Value& v) {
    return v.type == ValueType::Integer || v.type == ValueType::Real;
}

// Exact INTEGER / REAL equality. Converting the integer to double would make
// integers past 2^53 equal to their rounded neighbours; SQLite does not.
static bool int_equals_real(std::int64_t i, double r) {
    // [-2^63, 2^63); NaN fails both tests
    if (!(r >= -9223372036854775808.0 && r < 9223372036854775808.0)) return false;
    if (r != std::trunc(r)) return false;
    return static_cast<std::int64_t>(r) == i;
}

bool value_equal(const Value& a, const Value& b) {
    if (is_numeric(a) && is_numeric(b)) {
        if (a.type == ValueType::Integer && b.type == ValueType::Integer)
            return a.integer == b.integer;
        if (a.type == ValueType::Real && b.type == ValueType::Real)
            return a.real == b.real;
        if (a.type == ValueType::Integer)
            return int_equals_real(a.integer, b.real);
        return int_equals_real(b.integer, a.real);
    }
    if (a.type != b.type) return false;
    switch (a.type) {
    case ValueType::Null: return true;
    case ValueType::Text:
    case ValueType::Blob: return a.bytes == b.bytes;
    default: return false;
    }
}

bool row_equal(const Row& a, const Row& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i)
        if (!value_equal(a[i], b[i])) return false;
    return true;
}

std::string value_to_string(const Value& v) {
    switch (v.type) {
    case ValueType::Null:
        return "NULL";
    case ValueType::Integer:
        return std::to_string(v.integer);
    case ValueType::Real: {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.17g", v.real);
        return buf;
    }
    case ValueType::Text: {
        std::string out = "'";
        for (char c : v.bytes) {
            if (c == '\'') out += '\'';
            out += c;
        }
        out += '\'';
        return out;
    }
    case ValueType::Blob: {
        static const char* hex = "0123456789ABCDEF";
        std::string out = "X'";
        for (unsigned char c : v.bytes) {
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
        out += '\'';
        return out;
    }
    }
    return "NULL";
}

std::string row_to_string(const Row& r) {
    std::string out = "(";
    for (size_t i = 0; i < r.size(); ++i) {
        if (i) out += ", ";
        out += value_to_string(r[i]);
    }
    out += ')';
    return out;
}

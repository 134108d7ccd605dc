/*
-------------------------------------------------------------------------------
 db.cpp — SQLite layer for the SQL grader
-------------------------------------------------------------------------------
Purpose
  - Opens private in-memory databases, loads dataset scripts into them, and
    copies a reference database into a throwaway sandbox.

Design notes
  - Cloning is dump + replay, not sqlite3_backup: the dump is plain SQL, it
    takes no lock on the source beyond the reads themselves, and the replay
    goes into a connection that shares nothing with the source.
  - The dump lists user tables by name, then internal tables, then indexes,
    triggers and views in creation order. Triggers come after the data so
    they do not fire during replay.
  - Virtual tables are not cloned. Their shadow tables would collide with the
    CREATE VIRTUAL TABLE on replay.

Caveats
  - Reads that stream many rows use sqlite3_prepare_v2 / sqlite3_step loops.
    NULL text columns are read as empty strings where a name is expected.
-------------------------------------------------------------------------------
*/

#include "db.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>

// "name" with embedded double quotes doubled.
static std::string quote_ident(const std::string& name) {
    std::string out = "\"";
    for (char c : name) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

// 'text' with embedded single quotes doubled.
static std::string quote_literal(const std::string& text) {
    std::string out = "'";
    for (char c : text) {
        if (c == '\'') out += '\'';
        out += c;
    }
    out += '\'';
    return out;
}

// Run a query and collect every row as text columns (NULL -> "").
static bool query_text_rows(sqlite3* db, const std::string& sql,
    std::vector<std::vector<std::string>>& out) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
        std::cerr << "SQL error: " << sqlite3_errmsg(db) << "\n";
        sqlite3_finalize(st);
        return false;
    }
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        std::vector<std::string> row;
        int n = sqlite3_column_count(st);
        for (int i = 0; i < n; ++i) {
            const unsigned char* p = sqlite3_column_text(st, i);
            row.emplace_back(p ? reinterpret_cast<const char*>(p) : "");
        }
        out.push_back(std::move(row));
    }
    bool ok = (rc == SQLITE_DONE);
    if (!ok) std::cerr << "SQL error: " << sqlite3_errmsg(db) << "\n";
    sqlite3_finalize(st);
    return ok;
}

// Append one INSERT statement per row of `table` to `out`.
static bool dump_rows(sqlite3* db, const std::string& table, std::string& out) {
    std::vector<std::vector<std::string>> columns;
    if (!query_text_rows(db, "PRAGMA table_info(" + quote_ident(table) + ");", columns))
        return false;
    if (columns.empty()) return true;

    // SELECT 'INSERT INTO "t" VALUES(' || quote("a") || ',' || quote("b") || ')' FROM "t";
    std::string select = "SELECT " + quote_literal("INSERT INTO " + quote_ident(table) + " VALUES(");
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i) select += " || ','";
        select += " || quote(" + quote_ident(columns[i][1]) + ")";
    }
    select += " || ')' FROM " + quote_ident(table) + ";";

    std::vector<std::vector<std::string>> inserts;
    if (!query_text_rows(db, select, inserts)) return false;
    for (const auto& r : inserts)
        out += r[0] + ";\n";
    return true;
}

// Open a new in-memory database. Serialized mode lets a shared reference
// handle be cloned from several threads.
bool db_open_memory(sqlite3*& db) {
    db = nullptr;
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(":memory:", &db, flags, nullptr) != SQLITE_OK) {
        std::cerr << "Failed to open DB: " << (db ? sqlite3_errmsg(db) : "out of memory") << "\n";
        sqlite3_close(db);
        db = nullptr;
        return false;
    }
    return true;
}

// Close the database handle if non-null. Safe to call multiple times.
void db_close(sqlite3* db) {
    if (db) sqlite3_close(db);
}

bool db_exec(sqlite3* db, const std::string& sql, std::string& error) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        error = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        return false;
    }
    return true;
}

bool db_create_from_sql(sqlite3*& db, const std::string& script, std::string& error) {
    if (!db_open_memory(db)) {
        error = "could not open in-memory database";
        return false;
    }
    if (!db_exec(db, script, error)) {
        std::cerr << "SQL error: " << error << "\n";
        db_close(db);
        db = nullptr;
        return false;
    }
    return true;
}

bool read_text_file(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) return false;
    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad()) return false;
    out = buf.str();
    return true;
}

bool db_create_from_file(sqlite3*& db, const std::string& path, std::string& error) {
    db = nullptr;
    std::string script;
    if (!read_text_file(path, script)) {
        error = "cannot read dataset file: " + path;
        std::cerr << error << "\n";
        return false;
    }
    return db_create_from_sql(db, script, error);
}

bool db_dump(sqlite3* db, std::string& out) {
    out = "BEGIN TRANSACTION;\n";

    // --- user tables, then internal ones ----------------------------------
    std::vector<std::vector<std::string>> tables;
    if (!query_text_rows(db,
        "SELECT name, sql FROM sqlite_master "
        "WHERE sql NOT NULL AND type == 'table' ORDER BY name;", tables))
        return false;

    std::vector<std::string> internal;
    for (const auto& t : tables) {
        const std::string& name = t[0];
        const std::string& sql = t[1];
        if (name.compare(0, 7, "sqlite_") == 0) {
            internal.push_back(name);
            continue;
        }
        if (sql.compare(0, 20, "CREATE VIRTUAL TABLE") == 0) {
            std::cerr << "Skipping virtual table in dump: " << name << "\n";
            continue;
        }
        out += sql + ";\n";
        if (!dump_rows(db, name, out)) return false;
    }

    for (const auto& name : internal) {
        if (name == "sqlite_sequence")
            out += "DELETE FROM \"sqlite_sequence\";\n";
        else if (name == "sqlite_stat1")
            out += "ANALYZE \"sqlite_master\";\n";
        else
            continue;
        if (!dump_rows(db, name, out)) return false;
    }

    // --- schema objects that depend on tables ------------------------------
    std::vector<std::vector<std::string>> objects;
    if (!query_text_rows(db,
        "SELECT sql FROM sqlite_master "
        "WHERE sql NOT NULL AND type IN ('index', 'trigger', 'view') ORDER BY rowid;", objects))
        return false;
    for (const auto& o : objects)
        out += o[0] + ";\n";

    out += "COMMIT;\n";
    return true;
}

bool db_clone(sqlite3* source, sqlite3*& out, std::string& error) {
    out = nullptr;
    if (!source) {
        error = "no reference database";
        return false;
    }
    std::string script;
    if (!db_dump(source, script)) {
        error = std::string("could not read reference database: ") + sqlite3_errmsg(source);
        std::cerr << error << "\n";
        return false;
    }
    if (!db_open_memory(out)) {
        error = "could not open sandbox database";
        return false;
    }
    if (!db_exec(out, script, error)) {
        std::cerr << "Clone replay failed: " << error << "\n";
        db_close(out);
        out = nullptr;
        return false;
    }
    return true;
}

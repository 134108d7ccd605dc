#include "datasets.hpp"
#include "db.hpp"
#include "validation.hpp"
#include <algorithm>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

std::vector<std::string> list_datasets(const std::string& dir) {
    std::vector<std::string> names;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) return names;

    // increment(ec) instead of ++ so a read error ends the scan, not the caller
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) continue;
        const fs::path& p = it->path();
        if (p.extension() == ".sql")
            names.push_back(p.stem().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool db_create_dataset(sqlite3*& db, const std::string& dir, const std::string& name,
    SqlError& kind, std::string& error) {
    db = nullptr;
    if (!is_valid_dataset_name(name)) {
        kind = SqlError::InvalidName;
        error = "invalid dataset name: " + name;
        return false;
    }

    fs::path path = fs::path(dir) / (name + ".sql");
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        kind = SqlError::Io;
        error = "no such dataset: " + name;
        return false;
    }

    std::string script;
    if (!read_text_file(path.string(), script)) {
        kind = SqlError::Io;
        error = "cannot read dataset file: " + path.string();
        return false;
    }
    if (!db_create_from_sql(db, script, error)) {
        kind = SqlError::Execution;
        return false;
    }
    kind = SqlError::None;
    return true;
}

#pragma once

#include <nixup/result.hpp>
#include <nixup/store/store_path.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace nixup {

// One row of the ValidPaths table
struct ValidPathRow {
    int64_t id = 0;
    std::string path;
    int64_t registration_time = 0;
};

// Read-only view of the Nix store database (ValidPaths + Refs)
class NixDatabase {
public:
    static constexpr const char* DEFAULT_PATH = "/nix/var/nix/db/db.sqlite";

    NixDatabase();
    ~NixDatabase();
    NixDatabase(NixDatabase&&) noexcept;
    NixDatabase& operator=(NixDatabase&&) noexcept;

    // Tries an immutable read-only URI first, which does not need root. Falls
    // back to a locking read-only open when running as root.
    Status open(const std::string& db_path = DEFAULT_PATH);
    void close();
    bool is_open() const;
    const std::string& path() const;

    // Every non content-addressed path, newest first. Shell completions and
    // tarballs are left out.
    Result<std::vector<ValidPathRow>> system_paths();

    // Transitive references of `id`, excluding `id` itself, newest first
    Result<std::vector<ValidPathRow>> closure(int64_t id);

    // Parsed, deduplicated system_paths()
    Result<StorePathMap> query_system_roots();

    // Parsed closure of a root read from this database
    Result<std::vector<StorePath>> query_closure(const StorePath& root);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Rows to records, skipping paths that are not packages
std::vector<StorePath> parse_rows(const std::vector<ValidPathRow>& rows);

} // namespace nixup

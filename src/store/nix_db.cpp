#include <nixup/store/nix_db.hpp>
#include <nixup/store/dedupe.hpp>
#include <nixup/log.hpp>
#include <sqlite3.h>

#include <unistd.h>

namespace nixup {

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

// The ca column is set on .drv files and most fixed-output archives
static const char* const SQL_SYSTEM_PATHS =
    "SELECT id, path, registrationTime FROM ValidPaths "
    "WHERE ca IS NULL "
    "  AND path NOT LIKE '%-completions' "
    "  AND path NOT LIKE '%.tar.%' "
    "ORDER BY registrationTime DESC";

static const char* const SQL_CLOSURE =
    "WITH RECURSIVE closure(id) AS ("
    "  SELECT reference FROM Refs WHERE referrer = ?1"
    "  UNION"
    "  SELECT Refs.reference FROM Refs JOIN closure ON Refs.referrer = closure.id"
    ") "
    "SELECT id, path, registrationTime FROM ValidPaths "
    "WHERE ca IS NULL "
    "  AND id != ?1 "
    "  AND id IN (SELECT id FROM closure) "
    "ORDER BY registrationTime DESC";

static const char* const SQL_PROBE = "SELECT count(*) FROM ValidPaths LIMIT 1";

// ---------------------------------------------------------------------------
// pImpl
// ---------------------------------------------------------------------------

struct NixDatabase::Impl {
    sqlite3* db = nullptr;
    std::string path;

    sqlite3_stmt* stmt_system_paths = nullptr;
    sqlite3_stmt* stmt_closure = nullptr;

    ~Impl() { close(); }

    void close() {
        auto fin = [](sqlite3_stmt*& s) {
            if (s) { sqlite3_finalize(s); s = nullptr; }
        };
        fin(stmt_system_paths);
        fin(stmt_closure);
        if (db) {
            sqlite3_close(db);
            db = nullptr;
        }
    }

    NixupError db_error(const std::string& what) const {
        return NixupError{NixupError::Database,
            what + ": " + (db ? sqlite3_errmsg(db) : "no connection"),
            "", path};
    }

    Status try_open(const std::string& target, int flags) {
        int rc = sqlite3_open_v2(target.c_str(), &db, flags, nullptr);
        if (rc != SQLITE_OK) {
            auto err = db_error("failed to open store database");
            close();
            return err;
        }

        // Opening is lazy; make sure the file is readable and has the schema
        sqlite3_stmt* probe = nullptr;
        rc = sqlite3_prepare_v2(db, SQL_PROBE, -1, &probe, nullptr);
        if (rc == SQLITE_OK) rc = sqlite3_step(probe);
        if (probe) sqlite3_finalize(probe);
        if (rc != SQLITE_ROW) {
            auto err = db_error("store database is not readable");
            close();
            return err;
        }
        return ok_status();
    }

    Status prepare(const char* sql, sqlite3_stmt*& out) {
        if (out) return ok_status();
        if (sqlite3_prepare_v2(db, sql, -1, &out, nullptr) != SQLITE_OK) {
            return db_error("SQLite prepare failed");
        }
        return ok_status();
    }

    Result<std::vector<ValidPathRow>> collect(sqlite3_stmt* stmt) {
        std::vector<ValidPathRow> rows;
        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            ValidPathRow row;
            row.id = sqlite3_column_int64(stmt, 0);
            const unsigned char* text = sqlite3_column_text(stmt, 1);
            row.path = text ? reinterpret_cast<const char*>(text) : "";
            row.registration_time = sqlite3_column_int64(stmt, 2);
            rows.push_back(std::move(row));
        }
        sqlite3_reset(stmt);

        if (rc != SQLITE_DONE) {
            return db_error("SQLite query failed");
        }
        return Result<std::vector<ValidPathRow>>::ok(std::move(rows));
    }
};

// ---------------------------------------------------------------------------
// NixDatabase public interface
// ---------------------------------------------------------------------------

NixDatabase::NixDatabase() : impl_(std::make_unique<Impl>()) {}
NixDatabase::~NixDatabase() = default;
NixDatabase::NixDatabase(NixDatabase&&) noexcept = default;
NixDatabase& NixDatabase::operator=(NixDatabase&&) noexcept = default;

Status NixDatabase::open(const std::string& db_path) {
    close();
    impl_->path = db_path;

    std::string uri = "file:" + db_path + "?mode=ro&immutable=1";
    auto immutable = impl_->try_open(uri, SQLITE_OPEN_READONLY | SQLITE_OPEN_URI);
    if (immutable.is_ok()) {
        log::debug("opened %s (immutable)", db_path.c_str());
        return ok_status();
    }

    if (geteuid() != 0) {
        return NixupError{NixupError::Permission,
            "cannot open the Nix store database without root: "
                + immutable.error().message,
            "run as root, or use a SQLite built with SQLITE_USE_URI=1",
            db_path};
    }

    log::debug("immutable open failed, retrying with locking: %s",
               immutable.error().message.c_str());
    NIXUP_TRY(impl_->try_open(db_path, SQLITE_OPEN_READONLY));
    return ok_status();
}

void NixDatabase::close() {
    impl_->close();
}

bool NixDatabase::is_open() const {
    return impl_->db != nullptr;
}

const std::string& NixDatabase::path() const {
    return impl_->path;
}

Result<std::vector<ValidPathRow>> NixDatabase::system_paths() {
    if (!is_open()) {
        return NixupError{NixupError::Database, "store database is not open"};
    }
    NIXUP_TRY(impl_->prepare(SQL_SYSTEM_PATHS, impl_->stmt_system_paths));
    return impl_->collect(impl_->stmt_system_paths);
}

Result<std::vector<ValidPathRow>> NixDatabase::closure(int64_t id) {
    if (!is_open()) {
        return NixupError{NixupError::Database, "store database is not open"};
    }
    NIXUP_TRY(impl_->prepare(SQL_CLOSURE, impl_->stmt_closure));

    sqlite3_reset(impl_->stmt_closure);
    sqlite3_bind_int64(impl_->stmt_closure, 1, id);
    return impl_->collect(impl_->stmt_closure);
}

Result<StorePathMap> NixDatabase::query_system_roots() {
    auto rows = system_paths();
    if (rows.is_err()) return std::move(rows).error();

    auto roots = dedupe(parse_rows(rows.value()));
    log::debug("store database lists %zu paths, %zu usable roots",
               rows.value().size(), roots.size());
    return Result<StorePathMap>::ok(std::move(roots));
}

Result<std::vector<StorePath>> NixDatabase::query_closure(const StorePath& root) {
    if (!root.db_id) {
        return NixupError{NixupError::InvalidArg,
            "'" + root.key() + "' was not read from the store database"};
    }

    auto rows = closure(*root.db_id);
    if (rows.is_err()) {
        return with_context(Result<std::vector<StorePath>>(std::move(rows).error()),
                            "querying dependencies of " + root.key());
    }
    return Result<std::vector<StorePath>>::ok(parse_rows(rows.value()));
}

std::vector<StorePath> parse_rows(const std::vector<ValidPathRow>& rows) {
    std::vector<StorePath> parsed;
    parsed.reserve(rows.size());

    for (const auto& row : rows) {
        auto sp = StorePath::parse(row.path);
        if (!sp) {
            log::debug("skipping unrecognized store path: %s", row.path.c_str());
            continue;
        }
        sp->db_id = row.id;
        sp->registration_time = row.registration_time;
        parsed.push_back(std::move(*sp));
    }
    return parsed;
}

} // namespace nixup

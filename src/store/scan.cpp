#include <nixup/store/scan.hpp>
#include <nixup/store/nix_cli.hpp>
#include <nixup/store/nix_db.hpp>
#include <nixup/log.hpp>

namespace nixup {

Result<Backend> parse_backend(const std::string& name) {
    if (name == "database" || name == "db") return Result<Backend>::ok(Backend::Database);
    if (name == "command" || name == "cli") return Result<Backend>::ok(Backend::Command);
    return NixupError{NixupError::InvalidArg,
        "unknown backend '" + name + "'",
        "expected 'database' or 'command'"};
}

const char* backend_name(Backend backend) {
    switch (backend) {
        case Backend::Database: return "database";
        case Backend::Command:  return "command";
    }
    return "unknown";
}

static Result<PackageMap> scan_database(const ScanOptions& options) {
    NixDatabase db;
    std::string path = options.database_path.empty()
        ? NixDatabase::DEFAULT_PATH : options.database_path;
    NIXUP_TRY(db.open(path));

    auto roots = db.query_system_roots();
    if (roots.is_err()) return std::move(roots).error();

    // One connection, one job
    DependencyLookup lookup = [&db](const StorePath& root) {
        return db.query_closure(root);
    };
    return build_packages(roots.value(), lookup, 1);
}

static Result<PackageMap> scan_commands(const ScanOptions& options) {
    NixCli cli;
    cli.set_timeout(options.command_timeout);

    auto roots = cli.query_system_roots();
    if (roots.is_err()) return std::move(roots).error();

    DependencyLookup lookup = [&cli](const StorePath& root) {
        return cli.query_closure(root);
    };
    return build_packages(roots.value(), lookup, options.jobs);
}

Result<PackageMap> scan_system(const ScanOptions& options) {
    log::debug("scanning installed packages via %s backend",
               backend_name(options.backend));

    auto packages = options.backend == Backend::Database
        ? scan_database(options)
        : scan_commands(options);
    if (packages.is_err()) return packages;

    log::info("found %zu installed packages", packages.value().size());
    return packages;
}

} // namespace nixup

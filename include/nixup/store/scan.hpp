#pragma once

#include <nixup/result.hpp>
#include <nixup/store/package.hpp>
#include <string>

namespace nixup {

enum class Backend {
    Database,  // read /nix/var/nix/db/db.sqlite directly
    Command,   // nixos-option + nix-store -qR
};

Result<Backend> parse_backend(const std::string& name);
const char* backend_name(Backend backend);

struct ScanOptions {
    Backend backend = Backend::Database;
    std::string database_path;
    int jobs = 4;                  // command backend only
    int command_timeout = 120;     // seconds
};

// Every installed package with its dependency closure, before partitioning
Result<PackageMap> scan_system(const ScanOptions& options);

} // namespace nixup

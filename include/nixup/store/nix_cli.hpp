#pragma once

#include <nixup/result.hpp>
#include <nixup/store/store_path.hpp>
#include <string>
#include <vector>

namespace nixup {

// Extract the quoted store paths of `nixos-option environment.systemPackages`.
// Output without a "[ ... ]" list is a Command error.
Result<std::vector<std::string>> parse_system_packages_output(const std::string& output);

// One store path per line (`nix-store -qR`), minus blanks and `self_path`
std::vector<std::string> parse_requisites_output(const std::string& output,
                                                 const std::string& self_path);

// Parses each raw path, silently skipping the ones that are not packages
std::vector<StorePath> parse_store_paths(const std::vector<std::string>& raw_paths);

// Queries the running system through the nixos-option and nix-store CLIs
class NixCli {
public:
    // Top-level packages from environment.systemPackages, deduplicated
    Result<StorePathMap> query_system_roots();

    // Dependency closure of one store path. Safe to call concurrently.
    Result<std::vector<StorePath>> query_closure(const StorePath& root) const;

    void set_timeout(int seconds) { timeout_seconds_ = seconds; }
    int timeout() const { return timeout_seconds_; }

private:
    int timeout_seconds_ = 120;
};

} // namespace nixup

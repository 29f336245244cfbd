#pragma once

#include <nixup/store/partition.hpp>
#include <optional>
#include <string>
#include <vector>

namespace nixup {

// A version change of one store path between two generations
struct StoreChange {
    std::string name;
    std::optional<std::string> suffix;
    std::string old_version;
    std::string new_version;

    std::string key() const;
};

struct PackageChange {
    std::string name;
    std::optional<StoreChange> primary;
    std::vector<StoreChange> deps;
};

// Everything that changed between two system generations, in display order
struct SystemDiff {
    std::vector<PackageChange> packages;
    std::vector<StoreChange> shared;
};

// None when the versions match, or when the suffixes differ (a differently
// tagged build output is not comparable).
std::optional<StoreChange> diff_store(const StorePath& new_path,
                                      const StorePath& old_path);

// Paths only present in `new_stores` are not changes
std::vector<StoreChange> diff_stores(const StorePathMap& new_stores,
                                     const StorePathMap& old_stores);

std::vector<PackageChange> diff_packages(const PackageMap& new_pkgs,
                                         const PackageMap& old_pkgs);

// Packages with a changed primary first, then by dependency change count
// (descending), then by name. Also sorts each package's deps by name.
void sort_package_changes(std::vector<PackageChange>& changes);
void sort_store_changes(std::vector<StoreChange>& changes);

SystemDiff diff_snapshots(const SystemSnapshot& new_snap,
                          const SystemSnapshot& old_snap);

// Isolates the global dependencies of both generations, then diffs
SystemDiff diff_systems(PackageMap new_pkgs, PackageMap old_pkgs);

} // namespace nixup

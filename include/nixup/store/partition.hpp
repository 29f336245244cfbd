#pragma once

#include <nixup/store/package.hpp>
#include <string>
#include <vector>

namespace nixup {

// Moves every dependency that has exactly one version across all packages
// out of the packages and into the returned map. Dependencies that different
// packages pin to different versions stay with their packages.
StorePathMap isolate_global_dependencies(PackageMap& packages);

// One observation of the installed system, after partitioning
struct SystemSnapshot {
    PackageMap packages;
    StorePathMap shared_deps;

    static SystemSnapshot from_packages(PackageMap packages);
};

// Keys present both in some package's deps and in `shared`, sorted.
// Empty after isolate_global_dependencies().
std::vector<std::string> partition_overlap(const PackageMap& packages,
                                           const StorePathMap& shared);

} // namespace nixup

#pragma once

#include <nixup/result.hpp>
#include <nixup/store/store_path.hpp>

#include <functional>
#include <map>
#include <vector>

namespace nixup {

// A top-level installed package and the store paths it depends on
struct Package {
    StorePath primary;
    StorePathMap deps;  // never contains primary.key()
};

// Keyed by the primary's StorePath::key(); ordered for deterministic output
using PackageMap = std::map<std::string, Package>;

// Returns the parsed dependency closure of a top-level store path. The
// closure may contain the package itself.
using DependencyLookup =
    std::function<Result<std::vector<StorePath>>(const StorePath&)>;

Result<Package> build_package(StorePath primary, const DependencyLookup& lookup);

// Builds every root with up to `jobs` lookups in flight. The lookup must be
// safe to call concurrently when jobs > 1. Stops at the first failure.
Result<PackageMap> build_packages(const StorePathMap& roots,
                                  const DependencyLookup& lookup,
                                  int jobs = 1);

} // namespace nixup

#include <nixup/store/partition.hpp>
#include <nixup/log.hpp>

#include <algorithm>
#include <unordered_map>

namespace nixup {

namespace {

struct DependencyScan {
    const std::string* last_version;
    bool has_multiple_versions;
};

StorePathMap take_shared(Package& pkg, const std::vector<std::string>& shared_keys) {
    StorePathMap taken;
    for (const auto& key : shared_keys) {
        auto it = pkg.deps.find(key);
        if (it == pkg.deps.end()) continue;
        taken.emplace(key, std::move(it->second));
        pkg.deps.erase(it);
    }
    return taken;
}

StorePathMap merge_shared(StorePathMap acc, StorePathMap part) {
    // Every package carries the same version of a shared key, so whichever
    // copy lands first is the one kept
    for (auto& [key, sp] : part) {
        acc.emplace(key, std::move(sp));
    }
    return acc;
}

} // anonymous namespace

StorePathMap isolate_global_dependencies(PackageMap& packages) {
    // Scan: a key can only be judged once every consumer has been seen
    std::unordered_map<std::string, DependencyScan> scans;
    for (const auto& [name, pkg] : packages) {
        for (const auto& [key, dep] : pkg.deps) {
            auto [it, inserted] = scans.try_emplace(key, DependencyScan{&dep.version, false});
            if (!inserted && *it->second.last_version != dep.version) {
                it->second.has_multiple_versions = true;
                it->second.last_version = &dep.version;
            }
        }
    }

    std::vector<std::string> shared_keys;
    for (const auto& [key, scan] : scans) {
        if (!scan.has_multiple_versions) shared_keys.push_back(key);
    }
    std::sort(shared_keys.begin(), shared_keys.end());

    // Remove: per-package fold, then a set-union reduction
    std::vector<StorePathMap> parts;
    parts.reserve(packages.size());
    for (auto& [name, pkg] : packages) {
        parts.push_back(take_shared(pkg, shared_keys));
    }

    StorePathMap shared;
    for (auto& part : parts) {
        shared = merge_shared(std::move(shared), std::move(part));
    }

    log::debug("isolated %zu global dependencies from %zu packages",
               shared.size(), packages.size());
    return shared;
}

SystemSnapshot SystemSnapshot::from_packages(PackageMap packages) {
    SystemSnapshot snap;
    snap.shared_deps = isolate_global_dependencies(packages);
    snap.packages = std::move(packages);
    return snap;
}

std::vector<std::string> partition_overlap(const PackageMap& packages,
                                           const StorePathMap& shared) {
    std::vector<std::string> overlap;
    for (const auto& [name, pkg] : packages) {
        for (const auto& [key, dep] : pkg.deps) {
            if (shared.count(key)) overlap.push_back(key);
        }
    }
    std::sort(overlap.begin(), overlap.end());
    overlap.erase(std::unique(overlap.begin(), overlap.end()), overlap.end());
    return overlap;
}

} // namespace nixup

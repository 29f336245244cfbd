#include <nixup/store/diff.hpp>

#include <algorithm>

namespace nixup {

std::string StoreChange::key() const {
    if (!suffix) return name;
    return name + "|" + *suffix;
}

std::optional<StoreChange> diff_store(const StorePath& new_path,
                                      const StorePath& old_path) {
    if (new_path.version == old_path.version) return std::nullopt;
    if (new_path.suffix != old_path.suffix) return std::nullopt;

    StoreChange change;
    change.name = new_path.name;
    change.suffix = new_path.suffix;
    change.old_version = old_path.version;
    change.new_version = new_path.version;
    return change;
}

std::vector<StoreChange> diff_stores(const StorePathMap& new_stores,
                                     const StorePathMap& old_stores) {
    std::vector<StoreChange> changes;
    for (const auto& [key, new_path] : new_stores) {
        auto old_it = old_stores.find(key);
        if (old_it == old_stores.end()) continue;

        if (auto change = diff_store(new_path, old_it->second)) {
            changes.push_back(std::move(*change));
        }
    }
    return changes;
}

std::vector<PackageChange> diff_packages(const PackageMap& new_pkgs,
                                         const PackageMap& old_pkgs) {
    std::vector<PackageChange> changes;
    for (const auto& [key, new_pkg] : new_pkgs) {
        auto old_it = old_pkgs.find(key);
        if (old_it == old_pkgs.end()) continue;

        const Package& old_pkg = old_it->second;
        auto primary = diff_store(new_pkg.primary, old_pkg.primary);
        auto deps = diff_stores(new_pkg.deps, old_pkg.deps);

        if (!primary && deps.empty()) continue;

        PackageChange change;
        change.name = new_pkg.primary.display_name();
        change.primary = std::move(primary);
        change.deps = std::move(deps);
        changes.push_back(std::move(change));
    }
    return changes;
}

void sort_store_changes(std::vector<StoreChange>& changes) {
    std::sort(changes.begin(), changes.end(),
              [](const StoreChange& a, const StoreChange& b) {
                  if (a.name != b.name) return a.name < b.name;
                  return a.suffix < b.suffix;
              });
}

void sort_package_changes(std::vector<PackageChange>& changes) {
    for (auto& change : changes) {
        sort_store_changes(change.deps);
    }

    std::sort(changes.begin(), changes.end(),
              [](const PackageChange& a, const PackageChange& b) {
                  if (a.primary.has_value() != b.primary.has_value()) {
                      return a.primary.has_value();
                  }
                  if (a.deps.size() != b.deps.size()) {
                      return a.deps.size() > b.deps.size();
                  }
                  return a.name < b.name;
              });
}

SystemDiff diff_snapshots(const SystemSnapshot& new_snap,
                          const SystemSnapshot& old_snap) {
    SystemDiff diff;
    diff.packages = diff_packages(new_snap.packages, old_snap.packages);
    diff.shared = diff_stores(new_snap.shared_deps, old_snap.shared_deps);

    sort_package_changes(diff.packages);
    sort_store_changes(diff.shared);
    return diff;
}

SystemDiff diff_systems(PackageMap new_pkgs, PackageMap old_pkgs) {
    return diff_snapshots(SystemSnapshot::from_packages(std::move(new_pkgs)),
                          SystemSnapshot::from_packages(std::move(old_pkgs)));
}

} // namespace nixup

#include <nixup/store/package.hpp>
#include <nixup/store/dedupe.hpp>
#include <nixup/log.hpp>

#include <algorithm>
#include <future>

namespace nixup {

Result<Package> build_package(StorePath primary, const DependencyLookup& lookup) {
    auto closure = lookup(primary);
    if (closure.is_err()) return std::move(closure).error();

    Package pkg;
    pkg.deps = dedupe(std::move(closure).value());
    pkg.deps.erase(primary.key());
    pkg.primary = std::move(primary);

    return Result<Package>::ok(std::move(pkg));
}

Result<PackageMap> build_packages(const StorePathMap& roots,
                                  const DependencyLookup& lookup,
                                  int jobs) {
    std::vector<const StorePath*> pending;
    pending.reserve(roots.size());
    for (const auto& [key, sp] : roots) {
        pending.push_back(&sp);
    }
    // Stable order so the first reported failure does not depend on hashing
    std::sort(pending.begin(), pending.end(),
              [](const StorePath* a, const StorePath* b) {
                  return a->key() < b->key();
              });

    PackageMap packages;
    size_t batch_size = static_cast<size_t>(std::max(jobs, 1));

    for (size_t start = 0; start < pending.size(); start += batch_size) {
        size_t end = std::min(start + batch_size, pending.size());

        std::vector<Result<Package>> built;
        built.reserve(end - start);

        if (batch_size == 1) {
            built.push_back(build_package(*pending[start], lookup));
        } else {
            std::vector<std::future<Result<Package>>> futures;
            futures.reserve(end - start);
            for (size_t i = start; i < end; ++i) {
                const StorePath* root = pending[i];
                futures.push_back(std::async(std::launch::async, [root, &lookup] {
                    return build_package(*root, lookup);
                }));
            }
            // Every worker of the batch finishes before results are merged
            for (auto& f : futures) {
                built.push_back(f.get());
            }
        }

        for (auto& r : built) {
            if (r.is_err()) return std::move(r).error();
            auto pkg = std::move(r).value();
            log::debug("%s %s: %zu dependencies",
                       pkg.primary.key().c_str(), pkg.primary.version.c_str(),
                       pkg.deps.size());
            auto key = pkg.primary.key();
            packages.emplace(std::move(key), std::move(pkg));
        }
    }

    return Result<PackageMap>::ok(std::move(packages));
}

} // namespace nixup

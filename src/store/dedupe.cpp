#include <nixup/store/dedupe.hpp>
#include <nixup/log.hpp>

#include <algorithm>

namespace nixup {

namespace {

// Newest first; records without a registration time sort last
bool newer_than(const StorePath& a, const StorePath& b) {
    if (a.registration_time && b.registration_time) {
        return *a.registration_time > *b.registration_time;
    }
    return a.registration_time.has_value() && !b.registration_time.has_value();
}

bool is_ambiguous(const StorePath& newest, const StorePath& other) {
    if (other.version == newest.version) return false;
    if (!newest.registration_time || !other.registration_time) return true;
    return *newest.registration_time - *other.registration_time
           < SAME_UPDATE_WINDOW_SECONDS;
}

} // anonymous namespace

StorePathMap dedupe(std::vector<StorePath> records) {
    // Phase 1: group by identity
    std::unordered_map<std::string, std::vector<StorePath>> groups;
    for (auto& sp : records) {
        auto key = sp.key();
        groups[key].push_back(std::move(sp));
    }

    // Phase 2: decide each group against its newest member
    StorePathMap unique;
    unique.reserve(groups.size());

    for (auto& [key, group] : groups) {
        std::stable_sort(group.begin(), group.end(), newer_than);
        const StorePath& newest = group.front();

        bool ambiguous = std::any_of(group.begin() + 1, group.end(),
            [&](const StorePath& other) { return is_ambiguous(newest, other); });

        if (ambiguous) {
            log::trace("dropping ambiguous store path '%s' (%zu registrations)",
                       key.c_str(), group.size());
            continue;
        }

        unique.emplace(key, std::move(group.front()));
    }

    return unique;
}

} // namespace nixup

#pragma once

#include <nixup/store/store_path.hpp>
#include <cstdint>
#include <vector>

namespace nixup {

// Two registrations of one name closer together than this are assumed to come
// from the same system update.
constexpr int64_t SAME_UPDATE_WINDOW_SECONDS = 3600;

// Collapse records to one per identity key.
//
// A key seen with more than one version is ambiguous. When both registration
// times are known and at least SAME_UPDATE_WINDOW_SECONDS apart, the newest
// record wins. Otherwise the key is dropped from the result entirely: a
// missing entry only hides an update, a wrong one reports a bogus change.
StorePathMap dedupe(std::vector<StorePath> records);

} // namespace nixup

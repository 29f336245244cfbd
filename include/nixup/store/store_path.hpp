#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace nixup {

// One parsed store path: "/nix/store/<hash>-<name>-<version>[-<suffix>]"
//
// Identity is key(): the name, plus "|<suffix>" when a suffix was detected.
// The version never takes part in identity, so the same package can be
// looked up across generations after its version changed.
struct StorePath {
    std::string name;
    std::string version;
    std::optional<std::string> suffix;  // e.g. "bin", "staging"

    // Only known for paths read from the store database
    std::optional<int64_t> registration_time;

    // Where the record came from. Not persisted.
    std::string path;               // full store path
    std::optional<int64_t> db_id;   // ValidPaths.id

    static std::optional<StorePath> parse(std::string_view raw);

    // "<hash>-" prefix removal. Empty optional when nothing follows the dash.
    static std::optional<std::string_view> strip_prefix(std::string_view raw);

    // Starts with a digit (or 'v' + digit), then only [0-9a-z._]
    static bool is_version_fragment(std::string_view fragment);

    std::string key() const;
    std::string display_name() const;
};

// Records keyed by StorePath::key()
using StorePathMap = std::unordered_map<std::string, StorePath>;

} // namespace nixup

#pragma once

#include <nixup/result.hpp>
#include <nixup/store/package.hpp>
#include <cstdint>
#include <string>

namespace nixup {

// Saved package state: the pre-partition package map of one run, so a later
// run can diff against it.
//
//   format = 1
//   created_at = 1700000000
//
//   [[package]]
//   name = "ffmpeg"
//   version = "3.4.5"
//   suffix = "bin"
//   deps = [ { name = "glibc", version = "2.27" }, ... ]
struct StateFile {
    static constexpr int64_t FORMAT_VERSION = 1;

    int64_t created_at = 0;
    PackageMap packages;

    static Result<StateFile> load(const std::string& path);
    static Result<StateFile> parse(const std::string& toml_str,
                                   const std::string& origin = "<state>");

    // Writes through a temporary file, creating parent directories
    Status save(const std::string& path) const;
    std::string serialize() const;
};

// $XDG_DATA_HOME/nixup/packages.toml, else ~/.local/share/nixup/packages.toml
std::string default_state_path();

} // namespace nixup

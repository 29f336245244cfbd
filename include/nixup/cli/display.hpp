#pragma once

#include <nixup/store/diff.hpp>
#include <string>

namespace nixup {

// "<old> -> <new>". With color, the characters of the new version that differ
// from the old one at the same position are highlighted.
std::string format_version_change(const StoreChange& change, bool color);

// Full report: package updates, then global dependency updates
std::string render_system_diff(const SystemDiff& diff, bool color);

} // namespace nixup

#include <nixup/cli/display.hpp>

namespace nixup {

namespace {

const char* const BLUE = "\033[34m";
const char* const YELLOW = "\033[33m";
const char* const RED = "\033[31m";
const char* const GREEN = "\033[32m";
const char* const CHANGED = "\033[92;4m";  // bright green, underlined
const char* const RESET = "\033[0m";

std::string paint(const std::string& text, const char* code, bool color) {
    if (!color) return text;
    return code + text + RESET;
}

std::string display_name(const std::string& name,
                         const std::optional<std::string>& suffix) {
    if (!suffix) return name;
    return name + " (" + *suffix + ")";
}

std::string highlight_changes(const std::string& from, const std::string& to) {
    std::string out;
    bool in_changed = false;

    out += GREEN;
    for (size_t i = 0; i < to.size(); ++i) {
        bool same = i < from.size() && from[i] == to[i];
        if (!same && !in_changed) {
            out += CHANGED;
            in_changed = true;
        } else if (same && in_changed) {
            out += RESET;
            out += GREEN;
            in_changed = false;
        }
        out += to[i];
    }
    out += RESET;
    return out;
}

void render_change_line(std::string& out, const StoreChange& change, bool color) {
    out += paint(display_name(change.name, change.suffix), BLUE, color);
    out += ": ";
    out += format_version_change(change, color);
    out += '\n';
}

} // anonymous namespace

std::string format_version_change(const StoreChange& change, bool color) {
    if (!color) return change.old_version + " -> " + change.new_version;
    return paint(change.old_version, RED, true) + " -> "
           + highlight_changes(change.old_version, change.new_version);
}

std::string render_system_diff(const SystemDiff& diff, bool color) {
    std::string out;

    out += paint(std::to_string(diff.packages.size()), BLUE, color);
    out += " package update(s)\n\n";

    for (const auto& pkg : diff.packages) {
        out += paint(pkg.name, BLUE, color);
        if (pkg.primary) {
            out += ": ";
            out += format_version_change(*pkg.primary, color);
        }
        out += '\n';

        for (const auto& dep : pkg.deps) {
            out += paint("^", YELLOW, color);
            out += ' ';
            render_change_line(out, dep, color);
        }
    }

    out += '\n';
    out += paint(std::to_string(diff.shared.size()), BLUE, color);
    out += " global dependency update(s)\n\n";

    for (const auto& dep : diff.shared) {
        render_change_line(out, dep, color);
    }

    return out;
}

} // namespace nixup

#include <nixup/store/nix_cli.hpp>
#include <nixup/store/dedupe.hpp>
#include <nixup/process.hpp>
#include <nixup/log.hpp>

#include <regex>
#include <sstream>

namespace nixup {

namespace {

const std::regex QUOTED_PATH("\"(.+?)\"");

std::string trim_line(const std::string& line) {
    size_t start = line.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    size_t end = line.find_last_not_of(" \t\r");
    return line.substr(start, end - start + 1);
}

Result<std::string> run_nix_tool(const std::vector<std::string>& args, int timeout) {
    auto r = run_command(args, "", timeout);
    if (r.is_err()) {
        return with_context(Result<std::string>(std::move(r).error()),
                            "failed to run '" + command_line(args) + "'");
    }

    auto& cmd = r.value();
    if (cmd.exit_code == 127) {
        return NixupError{NixupError::NotFound,
            "'" + args[0] + "' not found",
            "nixup must run on a NixOS system with " + args[0] + " in PATH"};
    }
    if (cmd.exit_code != 0) {
        std::string detail = trim_line(cmd.stderr_str);
        return NixupError{NixupError::Command,
            "'" + command_line(args) + "' exited with status "
                + std::to_string(cmd.exit_code)
                + (detail.empty() ? "" : ": " + detail)};
    }

    return Result<std::string>::ok(std::move(cmd.stdout_str));
}

} // anonymous namespace

Result<std::vector<std::string>> parse_system_packages_output(const std::string& output) {
    size_t start = output.find("[ ");
    size_t end = start == std::string::npos
        ? std::string::npos : output.find(']', start);
    if (start == std::string::npos || end == std::string::npos) {
        return NixupError{NixupError::Command,
            "received unexpected command output",
            "expected a '[ ... ]' list from nixos-option"};
    }

    std::istringstream list(output.substr(start + 2, end - start - 2));
    std::vector<std::string> paths;
    std::string token;
    std::smatch match;

    while (list >> token) {
        if (std::regex_search(token, match, QUOTED_PATH)) {
            paths.push_back(match[1].str());
        }
    }

    return Result<std::vector<std::string>>::ok(std::move(paths));
}

std::vector<std::string> parse_requisites_output(const std::string& output,
                                                 const std::string& self_path) {
    std::vector<std::string> paths;
    std::istringstream stream(output);
    std::string line;

    while (std::getline(stream, line)) {
        line = trim_line(line);
        if (line.empty() || line == self_path) continue;
        paths.push_back(std::move(line));
    }
    return paths;
}

std::vector<StorePath> parse_store_paths(const std::vector<std::string>& raw_paths) {
    std::vector<StorePath> parsed;
    parsed.reserve(raw_paths.size());

    for (const auto& raw : raw_paths) {
        auto sp = StorePath::parse(raw);
        if (!sp) {
            log::debug("skipping unrecognized store path: %s", raw.c_str());
            continue;
        }
        parsed.push_back(std::move(*sp));
    }
    return parsed;
}

Result<StorePathMap> NixCli::query_system_roots() {
    auto output = run_nix_tool({"nixos-option", "environment.systemPackages"},
                               timeout_seconds_);
    if (output.is_err()) return std::move(output).error();

    auto raw = parse_system_packages_output(output.value());
    if (raw.is_err()) return std::move(raw).error();

    auto roots = dedupe(parse_store_paths(raw.value()));
    log::debug("nixos-option listed %zu paths, %zu usable roots",
               raw.value().size(), roots.size());
    return Result<StorePathMap>::ok(std::move(roots));
}

Result<std::vector<StorePath>> NixCli::query_closure(const StorePath& root) const {
    if (root.path.empty()) {
        return NixupError{NixupError::InvalidArg,
            "cannot query dependencies of '" + root.key() + "' without a store path"};
    }

    auto output = run_nix_tool({"nix-store", "--query", "--requisites", root.path},
                               timeout_seconds_);
    if (output.is_err()) {
        return with_context(Result<std::vector<StorePath>>(std::move(output).error()),
                            "querying dependencies of " + root.key());
    }

    return Result<std::vector<StorePath>>::ok(
        parse_store_paths(parse_requisites_output(output.value(), root.path)));
}

} // namespace nixup

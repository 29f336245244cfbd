// nixup: report which installed NixOS packages changed version since the
// last saved state.
//
//     nixup --save-state     # before `nixos-rebuild switch --upgrade`
//     nixup                  # afterwards

#include <nixup/cli/args.hpp>
#include <nixup/cli/display.hpp>
#include <nixup/config.hpp>
#include <nixup/log.hpp>
#include <nixup/store/diff.hpp>
#include <nixup/store/scan.hpp>
#include <nixup/store/state_file.hpp>

#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <string>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;
using namespace nixup;

static Result<Config> load_config(const CliArgs& cli) {
    std::optional<Config> global;
    std::string global_path = global_config_path();
    if (!global_path.empty() && fs::exists(global_path)) {
        auto r = Config::load(global_path);
        if (r.is_err()) return std::move(r).error();
        global = std::move(r).value();
    }

    std::optional<Config> local;
    if (!cli.config_path.empty()) {
        auto r = Config::load(cli.config_path);
        if (r.is_err()) return std::move(r).error();
        local = std::move(r).value();
    }

    Config cfg = Config::effective(global, local);
    cfg.merge(cli.overrides);
    return Result<Config>::ok(std::move(cfg));
}

static bool use_color(ColorMode mode) {
    switch (mode) {
        case ColorMode::Always: return true;
        case ColorMode::Never:  return false;
        case ColorMode::Auto:   break;
    }
    return isatty(fileno(stdout)) && std::getenv("NO_COLOR") == nullptr;
}

static Status save_state(const Config& cfg) {
    auto packages = scan_system(cfg.scan_options());
    if (packages.is_err()) return std::move(packages).error();

    StateFile state;
    state.created_at = static_cast<int64_t>(std::time(nullptr));
    state.packages = std::move(packages).value();

    std::string path = cfg.resolved_state_path();
    NIXUP_TRY(state.save(path));
    log::info("saved state of %zu packages to %s",
              state.packages.size(), path.c_str());
    return ok_status();
}

static Status show_diff(const Config& cfg) {
    std::string path = cfg.resolved_state_path();

    // Load first: a missing state file should fail before the slow scan
    auto old_state = StateFile::load(path);
    if (old_state.is_err()) return std::move(old_state).error();

    auto current = scan_system(cfg.scan_options());
    if (current.is_err()) return std::move(current).error();

    SystemDiff diff = diff_systems(std::move(current).value(),
                                   std::move(old_state.value().packages));

    std::string report = render_system_diff(diff, use_color(cfg.color));
    std::fputs(report.c_str(), stdout);
    return ok_status();
}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    auto cli = parse_args(args);
    if (cli.is_err()) {
        std::fprintf(stderr, "%s\n", cli.error().format().c_str());
        return 2;
    }
    if (cli.value().help) {
        std::fputs(usage().c_str(), stdout);
        return 0;
    }

    auto cfg = load_config(cli.value());
    if (cfg.is_err()) {
        std::fprintf(stderr, "%s\n", cfg.error().format().c_str());
        return 1;
    }
    log::set_level(cfg.value().log_level);

    Status status = cli.value().save_state
        ? save_state(cfg.value())
        : show_diff(cfg.value());

    if (status.is_err()) {
        std::fprintf(stderr, "%s\n", status.error().format().c_str());
        return 1;
    }
    return 0;
}

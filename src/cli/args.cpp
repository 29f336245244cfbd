#include <nixup/cli/args.hpp>

#include <cstdlib>

namespace nixup {

std::string usage() {
    return
        "usage: nixup [options]\n"
        "\n"
        "Run with --save-state before a system update, then without it after\n"
        "updating to see which packages changed.\n"
        "\n"
        "options:\n"
        "  -s, --save-state         save the current package state and exit\n"
        "      --state-file <path>  state file location\n"
        "      --config <path>      additional config file\n"
        "      --backend <name>     'database' (default) or 'command'\n"
        "      --database <path>    Nix store database\n"
        "  -j, --jobs <n>           concurrent queries (command backend)\n"
        "      --timeout <seconds>  per-command timeout (command backend)\n"
        "      --color <mode>       auto, always or never\n"
        "      --no-color           same as --color never\n"
        "  -v, --verbose            more logging (repeat for trace)\n"
        "  -q, --quiet              only log errors\n"
        "  -h, --help               print this help\n";
}

static Result<int> parse_positive(const std::string& flag, const std::string& value) {
    char* end = nullptr;
    long n = std::strtol(value.c_str(), &end, 10);
    if (value.empty() || *end != '\0' || n < 1 || n > 100000) {
        return NixupError{NixupError::InvalidArg,
            "invalid value '" + value + "' for " + flag,
            "expected a positive integer"};
    }
    return Result<int>::ok(static_cast<int>(n));
}

Result<CliArgs> parse_args(const std::vector<std::string>& args) {
    CliArgs cli;
    Config& cfg = cli.overrides;
    int verbosity = 0;
    bool quiet = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        // Flags that take a value accept both "--flag value" and "--flag=value"
        std::string flag = arg;
        std::optional<std::string> inline_value;
        if (arg.rfind("--", 0) == 0) {
            auto eq = arg.find('=');
            if (eq != std::string::npos) {
                flag = arg.substr(0, eq);
                inline_value = arg.substr(eq + 1);
            }
        }

        auto take_value = [&]() -> Result<std::string> {
            if (inline_value) return Result<std::string>::ok(*inline_value);
            if (i + 1 >= args.size()) {
                return NixupError{NixupError::InvalidArg,
                    "missing value for " + flag};
            }
            return Result<std::string>::ok(args[++i]);
        };

        if (flag == "-h" || flag == "--help") {
            cli.help = true;
        } else if (flag == "-s" || flag == "--save-state") {
            cli.save_state = true;
        } else if (flag == "--state-file") {
            auto v = take_value();
            if (v.is_err()) return std::move(v).error();
            cfg.state_path = v.value();
            cfg.state_path_set = true;
        } else if (flag == "--config") {
            auto v = take_value();
            if (v.is_err()) return std::move(v).error();
            cli.config_path = v.value();
        } else if (flag == "--backend") {
            auto v = take_value();
            if (v.is_err()) return std::move(v).error();
            auto backend = parse_backend(v.value());
            if (backend.is_err()) return std::move(backend).error();
            cfg.source.backend = backend.value();
            cfg.backend_set = true;
        } else if (flag == "--database") {
            auto v = take_value();
            if (v.is_err()) return std::move(v).error();
            cfg.source.database = v.value();
            cfg.database_set = true;
        } else if (flag == "-j" || flag == "--jobs") {
            auto v = take_value();
            if (v.is_err()) return std::move(v).error();
            auto n = parse_positive(flag, v.value());
            if (n.is_err()) return std::move(n).error();
            cfg.source.jobs = n.value();
            cfg.jobs_set = true;
        } else if (flag == "--timeout") {
            auto v = take_value();
            if (v.is_err()) return std::move(v).error();
            auto n = parse_positive(flag, v.value());
            if (n.is_err()) return std::move(n).error();
            cfg.source.timeout = n.value();
            cfg.timeout_set = true;
        } else if (flag == "--color") {
            auto v = take_value();
            if (v.is_err()) return std::move(v).error();
            auto mode = parse_color_mode(v.value());
            if (mode.is_err()) {
                return NixupError{NixupError::InvalidArg, mode.error().message,
                                  mode.error().hint};
            }
            cfg.color = mode.value();
            cfg.color_set = true;
        } else if (flag == "--no-color") {
            cfg.color = ColorMode::Never;
            cfg.color_set = true;
        } else if (flag == "-v" || flag == "--verbose") {
            ++verbosity;
        } else if (flag == "-vv") {
            verbosity += 2;
        } else if (flag == "-q" || flag == "--quiet") {
            quiet = true;
        } else {
            return NixupError{NixupError::InvalidArg,
                "unknown argument '" + arg + "'",
                "see nixup --help"};
        }
    }

    if (quiet) {
        cfg.log_level = log::Error;
        cfg.log_level_set = true;
    } else if (verbosity > 0) {
        cfg.log_level = verbosity == 1 ? log::Debug : log::Trace;
        cfg.log_level_set = true;
    }

    return Result<CliArgs>::ok(std::move(cli));
}

} // namespace nixup

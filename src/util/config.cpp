#include <nixup/config.hpp>
#include <nixup/store/state_file.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace nixup {

Result<ColorMode> parse_color_mode(const std::string& name) {
    if (name == "auto") return Result<ColorMode>::ok(ColorMode::Auto);
    if (name == "always") return Result<ColorMode>::ok(ColorMode::Always);
    if (name == "never") return Result<ColorMode>::ok(ColorMode::Never);
    return NixupError{NixupError::Config,
        "unknown color mode '" + name + "'",
        "expected one of: auto, always, never"};
}

static NixupError bad_value(const std::string& key, const std::string& what,
                            const std::string& origin) {
    return NixupError{NixupError::Config,
        "invalid value for '" + key + "': " + what, "", origin};
}

Result<Config> Config::parse(const std::string& toml_str, const std::string& origin) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str, origin);
    } catch (const toml::parse_error& e) {
        return NixupError{NixupError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", origin, static_cast<int>(e.source().begin.line)};
    }

    Config cfg;

    // [source]
    if (auto source = doc["source"].as_table()) {
        if (auto v = (*source)["backend"].value<std::string>()) {
            auto backend = parse_backend(*v);
            if (backend.is_err()) {
                return bad_value("source.backend", backend.error().message, origin);
            }
            cfg.source.backend = backend.value();
            cfg.backend_set = true;
        }
        if (auto v = (*source)["database"].value<std::string>()) {
            cfg.source.database = *v;
            cfg.database_set = true;
        }
        if (auto v = (*source)["jobs"].value<int64_t>()) {
            if (*v < 1) return bad_value("source.jobs", "must be at least 1", origin);
            cfg.source.jobs = static_cast<int>(*v);
            cfg.jobs_set = true;
        }
        if (auto v = (*source)["timeout"].value<int64_t>()) {
            if (*v < 1) return bad_value("source.timeout", "must be at least 1", origin);
            cfg.source.timeout = static_cast<int>(*v);
            cfg.timeout_set = true;
        }
    }

    // [state]
    if (auto v = doc["state"]["path"].value<std::string>()) {
        cfg.state_path = *v;
        cfg.state_path_set = true;
    }

    // [display]
    if (auto v = doc["display"]["color"].value<std::string>()) {
        auto mode = parse_color_mode(*v);
        if (mode.is_err()) {
            return bad_value("display.color", mode.error().message, origin);
        }
        cfg.color = mode.value();
        cfg.color_set = true;
    }

    // [log]
    if (auto v = doc["log"]["level"].value<std::string>()) {
        auto level = log::parse_level(*v);
        if (level.is_err()) {
            return bad_value("log.level", level.error().message, origin);
        }
        cfg.log_level = level.value();
        cfg.log_level_set = true;
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return NixupError{NixupError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str(), path);
}

void Config::merge(const Config& other) {
    if (other.backend_set) {
        source.backend = other.source.backend;
        backend_set = true;
    }
    if (other.database_set) {
        source.database = other.source.database;
        database_set = true;
    }
    if (other.jobs_set) {
        source.jobs = other.source.jobs;
        jobs_set = true;
    }
    if (other.timeout_set) {
        source.timeout = other.source.timeout;
        timeout_set = true;
    }
    if (other.state_path_set) {
        state_path = other.state_path;
        state_path_set = true;
    }
    if (other.color_set) {
        color = other.color;
        color_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

ScanOptions Config::scan_options() const {
    ScanOptions opts;
    opts.backend = source.backend;
    opts.database_path = source.database;
    opts.jobs = source.jobs;
    opts.command_timeout = source.timeout;
    return opts;
}

std::string Config::resolved_state_path() const {
    return state_path.empty() ? default_state_path() : state_path;
}

std::string global_config_path() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::string(xdg) + "/nixup/config.toml";
    }
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.config/nixup/config.toml";
}

} // namespace nixup

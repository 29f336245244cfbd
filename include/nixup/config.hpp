#pragma once

#include <nixup/result.hpp>
#include <nixup/log.hpp>
#include <nixup/store/scan.hpp>
#include <optional>
#include <string>

namespace nixup {

enum class ColorMode { Auto, Always, Never };

Result<ColorMode> parse_color_mode(const std::string& name);

struct SourceConfig {
    Backend backend = Backend::Database;
    std::string database;          // empty = NixDatabase::DEFAULT_PATH
    int jobs = 4;
    int timeout = 120;
};

// Layered configuration: global < --config file < command line.
// A layer only overrides the fields it sets.
struct Config {
    SourceConfig source;
    std::string state_path;        // empty = default_state_path()
    ColorMode color = ColorMode::Auto;
    log::Level log_level = log::Info;

    // Track which fields were explicitly set (for merge)
    bool backend_set = false;
    bool database_set = false;
    bool jobs_set = false;
    bool timeout_set = false;
    bool state_path_set = false;
    bool color_set = false;
    bool log_level_set = false;

    static Result<Config> load(const std::string& path);
    static Result<Config> parse(const std::string& toml_str,
                                const std::string& origin = "<config>");

    // Merge another config on top (other's set values override this)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    ScanOptions scan_options() const;
    std::string resolved_state_path() const;
};

// $XDG_CONFIG_HOME/nixup/config.toml, else ~/.config/nixup/config.toml
std::string global_config_path();

} // namespace nixup

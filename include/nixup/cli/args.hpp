#pragma once

#include <nixup/config.hpp>
#include <nixup/result.hpp>
#include <string>
#include <vector>

namespace nixup {

struct CliArgs {
    bool help = false;
    bool save_state = false;
    std::string config_path;   // extra config layer from --config
    Config overrides;          // only flags given on the command line are set
};

// args excludes argv[0]
Result<CliArgs> parse_args(const std::vector<std::string>& args);

std::string usage();

} // namespace nixup

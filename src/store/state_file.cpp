#include <nixup/store/state_file.hpp>
#include <nixup/log.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace nixup {

// ---------------------------------------------------------------------------
// Encoding
// ---------------------------------------------------------------------------

static toml::table encode_path(const StorePath& sp) {
    toml::table t;
    t.insert("name", sp.name);
    t.insert("version", sp.version);
    if (sp.suffix) t.insert("suffix", *sp.suffix);
    return t;
}

static Result<StorePath> decode_path(const toml::table& t, const std::string& where) {
    auto name = t["name"].value<std::string>();
    auto version = t["version"].value<std::string>();
    if (!name || !version) {
        return NixupError{NixupError::State,
            where + " is missing 'name' or 'version'"};
    }

    StorePath sp;
    sp.name = *name;
    sp.version = *version;
    if (auto suffix = t["suffix"].value<std::string>()) {
        sp.suffix = *suffix;
    }
    return Result<StorePath>::ok(std::move(sp));
}

std::string StateFile::serialize() const {
    toml::array pkgs;
    for (const auto& [key, pkg] : packages) {
        toml::table entry = encode_path(pkg.primary);

        // Sorted so the same state always produces the same file
        std::vector<const StorePath*> deps;
        deps.reserve(pkg.deps.size());
        for (const auto& [dep_key, dep] : pkg.deps) deps.push_back(&dep);
        std::sort(deps.begin(), deps.end(), [](const StorePath* a, const StorePath* b) {
            return a->key() < b->key();
        });

        toml::array dep_array;
        for (const StorePath* dep : deps) {
            dep_array.push_back(encode_path(*dep));
        }
        entry.insert("deps", std::move(dep_array));
        pkgs.push_back(std::move(entry));
    }

    toml::table doc;
    doc.insert("format", FORMAT_VERSION);
    doc.insert("created_at", created_at);
    doc.insert("package", std::move(pkgs));

    std::ostringstream ss;
    ss << doc << "\n";
    return ss.str();
}

Result<StateFile> StateFile::parse(const std::string& toml_str, const std::string& origin) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str, origin);
    } catch (const toml::parse_error& e) {
        return NixupError{NixupError::State,
            std::string("state file is not valid TOML: ") + std::string(e.description()),
            "delete it and run with --save-state again",
            origin, static_cast<int>(e.source().begin.line)};
    }

    auto format = doc["format"].value<int64_t>();
    if (!format) {
        return NixupError{NixupError::State, "state file has no 'format' field",
            "", origin};
    }
    if (*format != FORMAT_VERSION) {
        return NixupError{NixupError::State,
            "unsupported state format " + std::to_string(*format),
            "run with --save-state to rewrite it", origin};
    }

    StateFile state;
    state.created_at = doc["created_at"].value_or<int64_t>(0);

    if (auto pkgs = doc["package"].as_array()) {
        size_t index = 0;
        for (const auto& node : *pkgs) {
            std::string where = "package #" + std::to_string(index++);
            const toml::table* entry = node.as_table();
            if (!entry) {
                return NixupError{NixupError::State, where + " is not a table", "", origin};
            }

            auto primary = decode_path(*entry, where);
            if (primary.is_err()) return std::move(primary).error();

            Package pkg;
            pkg.primary = std::move(primary).value();

            if (auto deps = (*entry)["deps"].as_array()) {
                for (const auto& dep_node : *deps) {
                    const toml::table* dep_entry = dep_node.as_table();
                    if (!dep_entry) {
                        return NixupError{NixupError::State,
                            where + " has a malformed dependency", "", origin};
                    }
                    auto dep = decode_path(*dep_entry, where + " dependency");
                    if (dep.is_err()) return std::move(dep).error();
                    auto dep_key = dep.value().key();
                    pkg.deps.emplace(std::move(dep_key), std::move(dep).value());
                }
            }

            auto key = pkg.primary.key();
            state.packages.emplace(std::move(key), std::move(pkg));
        }
    }

    return Result<StateFile>::ok(std::move(state));
}

Result<StateFile> StateFile::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return NixupError{NixupError::NotFound,
            "no saved package state at " + path,
            "run with --save-state before updating the system"};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return StateFile::parse(ss.str(), path);
}

Status StateFile::save(const std::string& path) const {
    fs::path target(path);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return NixupError{NixupError::IO,
                "failed to create state directory: " + ec.message(),
                "", target.parent_path().string()};
        }
    }

    fs::path tmp = target;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            return NixupError{NixupError::IO,
                "cannot write state file", "", tmp.string()};
        }
        out << serialize();
        out.flush();
        if (!out) {
            return NixupError{NixupError::IO,
                "failed writing state file", "", tmp.string()};
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        std::string reason = ec.message();
        fs::remove(tmp, ec);
        return NixupError{NixupError::IO,
            "failed to move state file into place: " + reason, "", path};
    }

    log::debug("saved %zu packages to %s", packages.size(), path.c_str());
    return ok_status();
}

std::string default_state_path() {
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        return std::string(xdg) + "/nixup/packages.toml";
    }
    const char* home = std::getenv("HOME");
    if (!home) home = "/tmp";
    return std::string(home) + "/.local/share/nixup/packages.toml";
}

} // namespace nixup

#include <catch2/catch.hpp>
#include <nixup/store/store_path.hpp>

#include <string>

using namespace nixup;

static const std::string STORE = "/nix/store/zx6vs1b6xf07cprslk9is1fhwih21ix5-";

struct Fixture {
    std::string raw;
    std::string name;
    std::string version;
    std::optional<std::string> suffix;
};

// ===== Prefix stripping =====

TEST_CASE("strip_prefix removes store directory and hash", "[store_path]") {
    auto stripped = StorePath::strip_prefix(
        "/nix/store/03lp4drizbh8cl3f9mjysrrzrg3ssakv-glxinfo-8.4.0");
    REQUIRE(stripped.has_value());
    REQUIRE(*stripped == "glxinfo-8.4.0");
}

TEST_CASE("strip_prefix rejects a dash with nothing after it", "[store_path]") {
    REQUIRE_FALSE(StorePath::strip_prefix(STORE).has_value());
    REQUIRE_FALSE(StorePath::strip_prefix("/nix/store/nodash").has_value());
}

TEST_CASE("strip_prefix handles short hashes", "[store_path]") {
    auto stripped = StorePath::strip_prefix("/nix/store/123shortprefix-short-prefix-1.0");
    REQUIRE(stripped.has_value());
    REQUIRE(*stripped == "short-prefix-1.0");
}

// ===== Version fragments =====

TEST_CASE("is_version_fragment", "[store_path]") {
    REQUIRE(StorePath::is_version_fragment("8.4.0"));
    REQUIRE(StorePath::is_version_fragment("4.0"));
    REQUIRE(StorePath::is_version_fragment("v1.4.6"));
    REQUIRE(StorePath::is_version_fragment("2019"));
    REQUIRE(StorePath::is_version_fragment("1_2_3"));
    REQUIRE(StorePath::is_version_fragment("7788"));

    REQUIRE_FALSE(StorePath::is_version_fragment(""));
    REQUIRE_FALSE(StorePath::is_version_fragment("v"));
    REQUIRE_FALSE(StorePath::is_version_fragment("vx1"));
    REQUIRE_FALSE(StorePath::is_version_fragment("wow"));
    REQUIRE_FALSE(StorePath::is_version_fragment("r550"));
    REQUIRE_FALSE(StorePath::is_version_fragment("1.0-Beta"));
    REQUIRE_FALSE(StorePath::is_version_fragment("1.0B"));
}

// ===== Parsing =====

TEST_CASE("parse well-formed store paths", "[store_path]") {
    const Fixture fixtures[] = {
        {"glxinfo-8.4.0", "glxinfo", "8.4.0", std::nullopt},
        {"pcre-8.42", "pcre", "8.42", std::nullopt},
        {"dxvk-v1.4.6", "dxvk", "v1.4.6", std::nullopt},
        {"dxvk-c47095a8dcfa4c376d8e9c4276865b7f298137d8", "dxvk",
         "c47095a8dcfa4c376d8e9c4276865b7f298137d8", std::nullopt},
        {"rpcs3-7788-4c59395", "rpcs3", "7788-4c59395", std::nullopt},
        {"rpcs3-9165-8ca53f9", "rpcs3", "9165-8ca53f9", std::nullopt},
        {"single-version-8", "single-version", "8", std::nullopt},
        {"single-4", "single", "4", std::nullopt},
        {"wine-wow-4.21-staging", "wine-wow", "4.21", std::string("staging")},
        {"wine-wow-4.0-rc5-staging", "wine-wow", "4.0-rc5", std::string("staging")},
        {"ffmpeg-3.4.5-bin", "ffmpeg", "3.4.5", std::string("bin")},
        {"vulkan-loader-1.1.85", "vulkan-loader", "1.1.85", std::nullopt},
        {"vpnc-0.5.3-post-r550", "vpnc", "0.5.3-post-r550", std::nullopt},
        {"steam-runtime-2016-08-26", "steam-runtime", "2016-08-26", std::nullopt},
    };

    for (const auto& f : fixtures) {
        INFO(f.raw);
        auto sp = StorePath::parse(STORE + f.raw);
        REQUIRE(sp.has_value());
        CHECK(sp->name == f.name);
        CHECK(sp->version == f.version);
        CHECK(sp->suffix == f.suffix);
        CHECK(sp->path == STORE + f.raw);
        CHECK_FALSE(sp->registration_time.has_value());
        CHECK_FALSE(sp->db_id.has_value());
    }
}

TEST_CASE("parse with a short hash prefix", "[store_path]") {
    auto sp = StorePath::parse("/nix/store/123shortprefix-short-prefix-1.0");
    REQUIRE(sp.has_value());
    REQUIRE(sp->name == "short-prefix");
    REQUIRE(sp->version == "1.0");
}

TEST_CASE("parse rejects non-package paths", "[store_path]") {
    const char* rejects[] = {
        "fix-static.patch",
        "some-deriv.drv",
        "dash-edge-case-",
        "dash-short-",
        "nixos-system-completions",
        "hello",
        "source",
    };

    for (const char* raw : rejects) {
        INFO(raw);
        REQUIRE_FALSE(StorePath::parse(STORE + raw).has_value());
    }
    REQUIRE_FALSE(StorePath::parse(STORE).has_value());
    REQUIRE_FALSE(StorePath::parse("").has_value());
}

TEST_CASE("an all-digit final fragment is not a suffix", "[store_path]") {
    auto sp = StorePath::parse(STORE + "foo-bar-2019-02-15");
    REQUIRE(sp.has_value());
    REQUIRE(sp->name == "foo-bar");
    REQUIRE(sp->version == "2019-02-15");
    REQUIRE_FALSE(sp->suffix.has_value());
}

TEST_CASE("a bare 'v' fragment belongs to the name", "[store_path]") {
    auto sp = StorePath::parse(STORE + "tool-v-2.0");
    REQUIRE(sp.has_value());
    REQUIRE(sp->name == "tool-v");
    REQUIRE(sp->version == "2.0");
}

TEST_CASE("the first fragment is never the version", "[store_path]") {
    auto sp = StorePath::parse(STORE + "7zip-tools-9.20");
    REQUIRE(sp.has_value());
    REQUIRE(sp->name == "7zip-tools");
    REQUIRE(sp->version == "9.20");
}

// ===== Identity =====

TEST_CASE("key() folds in the suffix", "[store_path]") {
    auto plain = StorePath::parse(STORE + "ffmpeg-3.4.5").value();
    auto bin = StorePath::parse(STORE + "ffmpeg-3.4.5-bin").value();

    REQUIRE(plain.key() == "ffmpeg");
    REQUIRE(bin.key() == "ffmpeg|bin");
    REQUIRE(plain.key() != bin.key());
}

TEST_CASE("key() ignores the version", "[store_path]") {
    auto old_sp = StorePath::parse(STORE + "glxinfo-8.4.0").value();
    auto new_sp = StorePath::parse(STORE + "glxinfo-8.5.0").value();
    REQUIRE(old_sp.key() == new_sp.key());

    StorePathMap map;
    map.emplace(old_sp.key(), old_sp);
    REQUIRE(map.count(new_sp.key()) == 1);
    REQUIRE(map.at(new_sp.key()).version == "8.4.0");
}

TEST_CASE("display_name() shows the suffix in parentheses", "[store_path]") {
    auto sp = StorePath::parse(STORE + "wine-wow-4.1-staging").value();
    REQUIRE(sp.display_name() == "wine-wow (staging)");

    auto plain = StorePath::parse(STORE + "glxinfo-8.5.0").value();
    REQUIRE(plain.display_name() == "glxinfo");
}

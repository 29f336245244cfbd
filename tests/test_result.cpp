#include <catch2/catch.hpp>
#include <nixup/result.hpp>
#include <memory>
#include <string>

using namespace nixup;

static Result<int> try_double(Result<int> input) {
    NIXUP_TRY(input);
    return Result<int>::ok(input.value() * 2);
}

static Result<std::string> lookup_version(bool fail) {
    if (fail) {
        return NixupError{NixupError::Command, "nix-store exited with status 1"};
    }
    return Result<std::string>::ok("2.27");
}

TEST_CASE("Create Ok result and access value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(r.value() == 42);
}

TEST_CASE("Create Err result and access error", "[result]") {
    auto r = Result<int>::err(NixupError{NixupError::NotFound, "missing state"});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == NixupError::NotFound);
    REQUIRE(r.error().message == "missing state");
    REQUIRE_FALSE(static_cast<bool>(r));
}

TEST_CASE("Value access on Err throws bad_variant_access", "[result]") {
    auto r = Result<int>::err(NixupError{NixupError::IO, "fail"});
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}

TEST_CASE("map() transforms Ok and passes through Err", "[result]") {
    auto ok = Result<int>::ok(5).map([](int x) { return x * 2; });
    REQUIRE(ok.is_ok());
    REQUIRE(ok.value() == 10);

    bool called = false;
    auto err = Result<int>::err(NixupError{NixupError::Parse, "bad"})
        .map([&](int x) { called = true; return x; });
    REQUIRE(err.is_err());
    REQUIRE_FALSE(called);
    REQUIRE(err.error().code == NixupError::Parse);
}

TEST_CASE("and_then() chains and short-circuits", "[result]") {
    auto chained = Result<int>::ok(5).and_then([](int x) {
        return Result<int>::ok(x + 10);
    });
    REQUIRE(chained.value() == 15);

    auto failed = Result<int>::err(NixupError{NixupError::Database, "locked"})
        .and_then([](int x) { return Result<int>::ok(x); });
    REQUIRE(failed.is_err());
    REQUIRE(failed.error().code == NixupError::Database);
}

TEST_CASE("or_else() recovers from Err only", "[result]") {
    auto kept = Result<int>::ok(5).or_else([](NixupError&) {
        return Result<int>::ok(99);
    });
    REQUIRE(kept.value() == 5);

    auto recovered = Result<int>::err(NixupError{NixupError::IO, "disk full"})
        .or_else([](NixupError&) { return Result<int>::ok(0); });
    REQUIRE(recovered.value() == 0);
}

TEST_CASE("NIXUP_TRY propagates errors and passes Ok", "[result]") {
    auto failed = try_double(Result<int>::err(NixupError{NixupError::Parse, "syntax"}));
    REQUIRE(failed.is_err());
    REQUIRE(failed.error().message == "syntax");

    auto passed = try_double(Result<int>::ok(7));
    REQUIRE(passed.value() == 14);
}

TEST_CASE("with_context prefixes error messages", "[result]") {
    auto r = with_context(lookup_version(true), "querying dependencies of firefox");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == NixupError::Command);
    REQUIRE(r.error().message ==
            "querying dependencies of firefox: nix-store exited with status 1");

    auto ok = with_context(lookup_version(false), "unused");
    REQUIRE(ok.value() == "2.27");
}

TEST_CASE("Status (void result)", "[result]") {
    REQUIRE(ok_status().is_ok());
    auto s = Status::err(NixupError{NixupError::Config, "bad config"});
    REQUIRE(s.error().code == NixupError::Config);
}

TEST_CASE("NixupError format() output", "[error]") {
    NixupError e{NixupError::State, "state file is not valid TOML",
                 "delete it", "/var/lib/nixup/packages.toml", 12};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[State]") != std::string::npos);
    REQUIRE(formatted.find("state file is not valid TOML") != std::string::npos);
    REQUIRE(formatted.find("hint: delete it") != std::string::npos);
    REQUIRE(formatted.find("--> /var/lib/nixup/packages.toml:12") != std::string::npos);
}

TEST_CASE("NixupError format() without hint or path", "[error]") {
    NixupError e{NixupError::Parse, "unexpected token"};
    REQUIRE(e.format() == "error[Parse]: unexpected token");
}

TEST_CASE("NixupError format() path without line", "[error]") {
    NixupError e{NixupError::Database, "locked", "", "/nix/var/nix/db/db.sqlite"};
    auto formatted = e.format();
    REQUIRE(formatted.find("--> /nix/var/nix/db/db.sqlite") != std::string::npos);
    REQUIRE(formatted.find("db.sqlite:") == std::string::npos);
}

TEST_CASE("NixupError code_name() for all codes", "[error]") {
    REQUIRE(std::string(NixupError::code_name(NixupError::IO)) == "IO");
    REQUIRE(std::string(NixupError::code_name(NixupError::Parse)) == "Parse");
    REQUIRE(std::string(NixupError::code_name(NixupError::Config)) == "Config");
    REQUIRE(std::string(NixupError::code_name(NixupError::State)) == "State");
    REQUIRE(std::string(NixupError::code_name(NixupError::Database)) == "Database");
    REQUIRE(std::string(NixupError::code_name(NixupError::Command)) == "Command");
    REQUIRE(std::string(NixupError::code_name(NixupError::NotFound)) == "NotFound");
    REQUIRE(std::string(NixupError::code_name(NixupError::Permission)) == "Permission");
    REQUIRE(std::string(NixupError::code_name(NixupError::InvalidArg)) == "InvalidArg");
}

TEST_CASE("Result with move-only type (unique_ptr)", "[result]") {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(99));
    REQUIRE(*r.value() == 99);
}

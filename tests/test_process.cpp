#include <catch2/catch.hpp>
#include <nixup/process.hpp>

using namespace nixup;

TEST_CASE("run_command captures stdout", "[process]") {
    auto r = run_command({"echo", "hello", "world"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 0);
    REQUIRE(r.value().stdout_str == "hello world\n");
    REQUIRE(r.value().stderr_str.empty());
}

TEST_CASE("run_command captures stderr and exit status", "[process]") {
    auto r = run_command({"sh", "-c", "echo oops >&2; exit 3"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 3);
    REQUIRE(r.value().stderr_str == "oops\n");
}

TEST_CASE("run_command reports a non-zero exit", "[process]") {
    auto r = run_command({"false"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code != 0);
}

TEST_CASE("run_command reads large output", "[process]") {
    auto r = run_command({"sh", "-c", "i=0; while [ $i -lt 5000 ]; do "
                                      "echo /nix/store/aaaa-pkg-$i; i=$((i+1)); done"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 0);
    REQUIRE(r.value().stdout_str.size() > 5000 * 20);
}

TEST_CASE("run_command honors the working directory", "[process]") {
    auto r = run_command({"pwd"}, "/tmp");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().stdout_str.find("/tmp") != std::string::npos);
}

TEST_CASE("run_command with a missing binary exits 127", "[process]") {
    auto r = run_command({"nixup-definitely-not-a-real-binary"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 127);
}

TEST_CASE("run_command rejects empty args", "[process]") {
    auto r = run_command({});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == NixupError::InvalidArg);
}

TEST_CASE("run_command times out", "[process]") {
    auto r = run_command({"sleep", "5"}, "", 1);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == NixupError::IO);
    REQUIRE(r.error().message.find("timed out") != std::string::npos);
    REQUIRE(r.error().path == "sleep 5");
}

TEST_CASE("command_line quotes arguments with spaces", "[process]") {
    REQUIRE(command_line({"nix-store", "-qR", "/nix/store/abc-hello-2.10"}) ==
            "nix-store -qR /nix/store/abc-hello-2.10");
    REQUIRE(command_line({"sh", "-c", "echo hi"}) == "sh -c 'echo hi'");
    REQUIRE(command_line({}).empty());
}

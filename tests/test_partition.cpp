#include <catch2/catch.hpp>
#include <nixup/store/partition.hpp>

#include <map>
#include <set>

using namespace nixup;

static StorePath record(const std::string& name, const std::string& version) {
    StorePath sp;
    sp.name = name;
    sp.version = version;
    return sp;
}

static Package package(const std::string& name,
                       std::initializer_list<StorePath> deps) {
    Package pkg;
    pkg.primary = record(name, "1.0");
    for (const auto& dep : deps) {
        pkg.deps.emplace(dep.key(), dep);
    }
    return pkg;
}

static PackageMap three_packages() {
    PackageMap pkgs;
    pkgs.emplace("test1", package("test1", {record("db", "4.8.30"), record("glibc", "2.27")}));
    pkgs.emplace("test2", package("test2", {record("db", "5.0.0"), record("glibc", "2.27")}));
    pkgs.emplace("test3", package("test3", {record("db", "4.8.30"), record("glibc", "2.27")}));
    return pkgs;
}

TEST_CASE("isolate_global_dependencies extracts single-version deps", "[partition]") {
    auto pkgs = three_packages();
    auto shared = isolate_global_dependencies(pkgs);

    REQUIRE(shared.size() == 1);
    REQUIRE(shared.at("glibc").version == "2.27");

    REQUIRE(pkgs.at("test1").deps.size() == 1);
    REQUIRE(pkgs.at("test1").deps.at("db").version == "4.8.30");
    REQUIRE(pkgs.at("test2").deps.at("db").version == "5.0.0");
    REQUIRE(pkgs.at("test3").deps.at("db").version == "4.8.30");
    REQUIRE(pkgs.at("test3").deps.count("glibc") == 0);
}

TEST_CASE("isolate_global_dependencies leaves no overlap", "[partition]") {
    auto pkgs = three_packages();
    pkgs.emplace("test4", package("test4", {record("zlib", "1.2.11"),
                                            record("db", "6.0"),
                                            record("curl", "7.64")}));
    pkgs.emplace("test5", package("test5", {record("curl", "7.65")}));

    auto shared = isolate_global_dependencies(pkgs);
    REQUIRE(partition_overlap(pkgs, shared).empty());

    REQUIRE(shared.count("zlib") == 1);
    REQUIRE(shared.count("glibc") == 1);
    REQUIRE(shared.count("db") == 0);
    REQUIRE(shared.count("curl") == 0);
    REQUIRE(pkgs.at("test4").deps.at("curl").version == "7.64");
    REQUIRE(pkgs.at("test5").deps.at("curl").version == "7.65");
}

TEST_CASE("a dependency is shared iff all consumers agree", "[partition]") {
    auto pkgs = three_packages();
    auto before = pkgs;
    auto shared = isolate_global_dependencies(pkgs);

    std::map<std::string, std::set<std::string>> versions;
    for (const auto& [name, pkg] : before) {
        for (const auto& [key, dep] : pkg.deps) {
            versions[key].insert(dep.version);
        }
    }

    for (const auto& [key, seen] : versions) {
        INFO(key);
        if (seen.size() == 1) {
            REQUIRE(shared.count(key) == 1);
            REQUIRE(shared.at(key).version == *seen.begin());
        } else {
            REQUIRE(shared.count(key) == 0);
            for (const auto& [name, pkg] : before) {
                if (pkg.deps.count(key)) {
                    REQUIRE(pkgs.at(name).deps.at(key).version ==
                            pkg.deps.at(key).version);
                }
            }
        }
    }
}

TEST_CASE("a dependency of a single package is shared", "[partition]") {
    PackageMap pkgs;
    pkgs.emplace("hello", package("hello", {record("glibc", "2.27")}));

    auto shared = isolate_global_dependencies(pkgs);
    REQUIRE(shared.count("glibc") == 1);
    REQUIRE(pkgs.at("hello").deps.empty());
}

TEST_CASE("isolate_global_dependencies on an empty map", "[partition]") {
    PackageMap pkgs;
    REQUIRE(isolate_global_dependencies(pkgs).empty());
}

TEST_CASE("SystemSnapshot::from_packages partitions", "[partition]") {
    auto snap = SystemSnapshot::from_packages(three_packages());
    REQUIRE(snap.packages.size() == 3);
    REQUIRE(snap.shared_deps.size() == 1);
    REQUIRE(snap.shared_deps.count("glibc") == 1);
}

TEST_CASE("partition_overlap reports keys in both places", "[partition]") {
    auto pkgs = three_packages();
    StorePathMap shared;
    shared.emplace("glibc", record("glibc", "2.27"));

    auto overlap = partition_overlap(pkgs, shared);
    REQUIRE(overlap == std::vector<std::string>{"glibc"});
}

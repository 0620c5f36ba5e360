// tests/test_determinism_verifier.cpp
#include <catch2/catch_test_macros.hpp>
#include "gantry/common/errors.h"
#include "gantry/verify/determinism_verifier.h"

using namespace gantry;

TEST_CASE("Normalize replaces every ignorable token", "[verify]") {
    std::string out = DeterminismVerifier::normalize("a /tmp/x b /tmp/x", {"/tmp/x"}, "@");
    REQUIRE(out == "a @ b @");
}

TEST_CASE("Normalize prefers the longest token at each position", "[verify]") {
    std::string out = DeterminismVerifier::normalize("/tmp/build-42/obj", {"/tmp", "/tmp/build-42"}, "@");
    REQUIRE(out == "@/obj");

    // Empty tokens are ignored rather than matching everywhere
    REQUIRE(DeterminismVerifier::normalize("abc", {""}, "@") == "abc");
}

// Test 1: only ignorable content differs
TEST_CASE("Artifacts that differ only in ignorable content are identical", "[verify]") {
    DeterminismVerifier verifier;
    BuildArtifact a{"linux-amd64", "toolchain\nbuilt in /tmp/go-build111\ndone\n", {"/tmp/go-build111"}};
    BuildArtifact b{"linux-arm64", "toolchain\nbuilt in /tmp/go-build222\ndone\n", {"/tmp/go-build222"}};

    auto diff = verifier.compare(a, b);
    REQUIRE(diff.identical);
    REQUIRE_FALSE(diff.first_differing_offset.has_value());
    REQUIRE(diff.hunks.empty());
}

// Test 2: a real difference is located by offset and by line
TEST_CASE("Differing artifacts report offset and hunks", "[verify]") {
    DeterminismVerifier verifier;
    BuildArtifact a{"a", "header\nversion=1\ntrailer\n", {}};
    BuildArtifact b{"b", "header\nversion=2\ntrailer\n", {}};

    auto diff = verifier.compare(a, b);
    REQUIRE_FALSE(diff.identical);
    REQUIRE(diff.first_differing_offset.value() == 15);
    REQUIRE(diff.hunks.size() == 1);
    REQUIRE(diff.hunks[0].a_start == 2);
    REQUIRE(diff.hunks[0].a_count == 1);
    REQUIRE(diff.hunks[0].b_start == 2);
    REQUIRE(diff.hunks[0].b_count == 1);
    REQUIRE(diff.hunks[0].a_lines == std::vector<std::string>{"version=1"});
    REQUIRE(diff.hunks[0].b_lines == std::vector<std::string>{"version=2"});

    auto j = diff.to_json();
    REQUIRE(j["identical"] == false);
    REQUIRE(j["first_differing_offset"] == 15);
}

TEST_CASE("Separate changes produce separate hunks", "[verify]") {
    DeterminismVerifier verifier;
    BuildArtifact a{"a", "1\n2\n3\n4\n5\n6\n", {}};
    BuildArtifact b{"b", "1\nX\n3\n4\n5\nY\nZ\n", {}};

    auto diff = verifier.compare(a, b);
    REQUIRE(diff.hunks.size() == 2);
    REQUIRE(diff.hunks[0].a_start == 2);
    REQUIRE(diff.hunks[1].a_start == 6);
    REQUIRE(diff.hunks[1].a_count == 1);
    REQUIRE(diff.hunks[1].b_count == 2);
}

TEST_CASE("Hunk count is capped", "[verify]") {
    DeterminismVerifier::Config config;
    config.max_hunks = 2;
    DeterminismVerifier verifier(config);

    BuildArtifact a{"a", "a\n=\nb\n=\nc\n=\nd\n", {}};
    BuildArtifact b{"b", "A\n=\nB\n=\nC\n=\nD\n", {}};
    auto diff = verifier.compare(a, b);
    REQUIRE(diff.hunks.size() == 2);
    REQUIRE(diff.hunks_truncated);
}

TEST_CASE("Length difference is reported at the end of the shorter artifact", "[verify]") {
    DeterminismVerifier verifier;
    auto diff = verifier.compare(BuildArtifact{"a", "same\n", {}}, BuildArtifact{"b", "same\nextra\n", {}});
    REQUIRE(diff.first_differing_offset.value() == 5);
    REQUIRE(diff.hunks.size() == 1);
    REQUIRE(diff.hunks[0].a_count == 0);
    REQUIRE(diff.hunks[0].b_lines == std::vector<std::string>{"extra"});
}

TEST_CASE("Verify builds both configurations", "[verify]") {
    DeterminismVerifier verifier;
    BuildConfiguration first{"gopath-a", {{"GOPATH", "/a"}}, "", {}};
    BuildConfiguration second{"gopath-b", {{"GOPATH", "/b"}}, "", {}};

    SECTION("identical builds pass") {
        std::vector<std::string> built;
        auto diff = verifier.verify([&built](const BuildConfiguration& c) {
            built.push_back(c.name);
            return BuildArtifact{c.name, "go1.99 built from " + c.environment.at("GOPATH"),
                                 {c.environment.at("GOPATH")}};
        }, first, second);
        REQUIRE(diff.identical);
        REQUIRE(built == std::vector<std::string>{"gopath-a", "gopath-b"});
    }

    SECTION("leaked paths are a violation carrying the diff") {
        auto build = [](const BuildConfiguration& c) {
            return BuildArtifact{c.name, "go1.99 built from " + c.environment.at("GOPATH") + "\n", {}};
        };
        try {
            verifier.verify(build, first, second);
            FAIL("expected DeterminismViolation");
        } catch (const DeterminismViolation& e) {
            REQUIRE(e.failure_class() == FailureClass::DETERMINISM);
            REQUIRE(e.diff()["a"] == "gopath-a");
            REQUIRE(e.diff()["first_differing_offset"] == 19);
        }
    }

    SECTION("a failing build is a build failure, not a violation") {
        auto build = [](const BuildConfiguration& c) -> BuildArtifact {
            if (c.name == "gopath-b") throw BuildFailure("make.bash failed", 2);
            return BuildArtifact{c.name, "ok", {}};
        };
        REQUIRE_THROWS_AS(verifier.verify(build, first, second), BuildFailure);
    }

    SECTION("identical configuration names are rejected") {
        REQUIRE_THROWS_AS(verifier.verify([](const BuildConfiguration& c) {
            return BuildArtifact{c.name, "", {}};
        }, first, first), ConfigError);
    }
}

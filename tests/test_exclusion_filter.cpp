// tests/test_exclusion_filter.cpp
#include <catch2/catch_test_macros.hpp>
#include "gantry/common/errors.h"
#include "gantry/filter/exclusion_filter.h"
#include <filesystem>
#include <fstream>
#include <string>

using namespace gantry;

TEST_CASE("Exclusion filter removes exact matches only", "[filter]") {
    ExclusionFilter filter({"crypto/x509", "os/exec"});
    std::vector<TestId> candidates = {"fmt", "crypto/x509", "crypto/x509/pkix", "os/exec", "strings"};

    FilterResult result = filter.apply(candidates);
    REQUIRE(result.removed == 2);
    REQUIRE(result.kept == std::vector<TestId>{"fmt", "crypto/x509/pkix", "strings"});
}

TEST_CASE("No matches is not an error", "[filter]") {
    ExclusionFilter filter({"net/http"});
    FilterResult result = filter.apply({"fmt", "log"});
    REQUIRE(result.removed == 0);
    REQUIRE(result.kept.size() == 2);
}

TEST_CASE("Denylist text ignores comments, blanks and trailing whitespace", "[filter]") {
    auto filter = ExclusionFilter::from_string(
        "# packages that need a real OS\n"
        "os/exec   \n"
        "\n"
        "plugin\t\n"
        "   # indented comment\n");
    REQUIRE(filter.size() == 2);
    REQUIRE(filter.excludes("os/exec"));
    REQUIRE(filter.excludes("plugin"));
    REQUIRE_FALSE(filter.excludes("# packages that need a real OS"));
}

TEST_CASE("Denylist loads from a file", "[filter]") {
    auto path = std::filesystem::temp_directory_path() / "gantry_test_exclusions.txt";
    {
        std::ofstream out(path);
        out << "runtime/pprof\nsyscall\n";
    }
    auto filter = ExclusionFilter::from_file(path.string());
    REQUIRE(filter.size() == 2);
    REQUIRE(filter.apply({"syscall", "sort"}).kept == std::vector<TestId>{"sort"});
    std::filesystem::remove(path);
}

TEST_CASE("Unreadable denylist is a ConfigError", "[filter]") {
    REQUIRE_THROWS_AS(ExclusionFilter::from_file("/nonexistent/gantry/exclusions.txt"), ConfigError);
}

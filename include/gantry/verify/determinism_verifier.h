// gantry/verify/determinism_verifier.h
#ifndef GANTRY_VERIFY_DETERMINISM_VERIFIER_H
#define GANTRY_VERIFY_DETERMINISM_VERIFIER_H

#include "gantry/common/types.h"
#include <nlohmann/json.hpp>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace gantry {

// Output of one build plus the substrings expected to vary between builds
// (temporary paths, build ids, timestamps).
struct BuildArtifact {
    std::string name;
    std::string bytes;
    std::vector<std::string> ignorable;
};

// One environment a build is run under
struct BuildConfiguration {
    std::string name;
    EnvMap environment;
    std::string artifact_path;               // file the build writes its artifact to
    std::vector<std::string> ignore;         // ignorable substrings for this configuration
};

// Lines are 1-based; a count of 0 means the hunk is a pure insertion on the
// other side, positioned after line `start - 1`.
struct DiffHunk {
    size_t a_start = 0;
    size_t a_count = 0;
    size_t b_start = 0;
    size_t b_count = 0;
    std::vector<std::string> a_lines;   // first few lines only
    std::vector<std::string> b_lines;
};

struct ArtifactDiff {
    std::string a_name;
    std::string b_name;
    bool identical = true;
    std::optional<size_t> first_differing_offset;   // into the normalized bytes
    size_t a_size = 0;
    size_t b_size = 0;
    std::vector<DiffHunk> hunks;
    bool hunks_truncated = false;

    nlohmann::json to_json() const;
};

class DeterminismVerifier {
public:
    struct Config {
        std::string placeholder;
        size_t max_sample_lines;   // per side, per hunk
        size_t max_hunks;
        size_t max_lcs_cells;      // larger middles are reported as a single hunk
        Config() : placeholder("<GANTRY-IGNORED>"), max_sample_lines(5), max_hunks(20),
                   max_lcs_cells(4u * 1024u * 1024u) {}
    };

    // Produces the artifact for one configuration; throws BuildFailure when the
    // build itself fails.
    using BuildFn = std::function<BuildArtifact(const BuildConfiguration&)>;

    explicit DeterminismVerifier(Config config = {});

    // Replaces every occurrence of an ignorable substring with `placeholder`.
    // Scanning is left to right; at each position the longest token wins.
    static std::string normalize(const std::string& bytes,
                                 const std::vector<std::string>& ignorable,
                                 const std::string& placeholder);

    // Normalizes both artifacts and diffs them
    ArtifactDiff compare(const BuildArtifact& a, const BuildArtifact& b) const;

    // Builds under both configurations and compares. Returns the (identical)
    // diff on success, throws DeterminismViolation carrying it otherwise.
    ArtifactDiff verify(const BuildFn& build,
                        const BuildConfiguration& a,
                        const BuildConfiguration& b) const;

    const Config& config() const { return config_; }

private:
    std::vector<DiffHunk> line_hunks(const std::string& a, const std::string& b, bool& truncated) const;

    Config config_;
};

} // namespace gantry

#endif // GANTRY_VERIFY_DETERMINISM_VERIFIER_H

// verify/determinism_verifier.cpp
#include "gantry/verify/determinism_verifier.h"
#include "gantry/common/errors.h"
#include "gantry/common/logger.h"
#include <algorithm>
#include <cstdint>

namespace gantry {

namespace {

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

// Accumulates one hunk while walking an edit script
class HunkBuilder {
public:
    HunkBuilder(const std::vector<std::string>& a, const std::vector<std::string>& b,
                size_t max_samples, size_t max_hunks, std::vector<DiffHunk>& out, bool& truncated)
        : a_(a), b_(b), max_samples_(max_samples), max_hunks_(max_hunks), out_(out), truncated_(truncated) {}

    void removed(size_t i) {
        open(i, current_b_);
        ++hunk_.a_count;
        if (hunk_.a_lines.size() < max_samples_) hunk_.a_lines.push_back(a_[i]);
    }

    void added(size_t j) {
        open(current_a_, j);
        ++hunk_.b_count;
        if (hunk_.b_lines.size() < max_samples_) hunk_.b_lines.push_back(b_[j]);
    }

    // Both sides agree at (i, j)
    void matched(size_t i, size_t j) {
        close();
        current_a_ = i + 1;
        current_b_ = j + 1;
    }

    void close() {
        if (!open_) return;
        open_ = false;
        if (out_.size() >= max_hunks_) {
            truncated_ = true;
            return;
        }
        out_.push_back(std::move(hunk_));
        hunk_ = DiffHunk{};
    }

    void seek(size_t i, size_t j) {
        current_a_ = i;
        current_b_ = j;
    }

private:
    void open(size_t i, size_t j) {
        if (open_) return;
        open_ = true;
        hunk_ = DiffHunk{};
        hunk_.a_start = i + 1;
        hunk_.b_start = j + 1;
    }

    const std::vector<std::string>& a_;
    const std::vector<std::string>& b_;
    size_t max_samples_;
    size_t max_hunks_;
    std::vector<DiffHunk>& out_;
    bool& truncated_;
    DiffHunk hunk_;
    bool open_ = false;
    size_t current_a_ = 0;
    size_t current_b_ = 0;
};

} // namespace

nlohmann::json ArtifactDiff::to_json() const {
    nlohmann::json hunks_json = nlohmann::json::array();
    for (const auto& h : hunks) {
        hunks_json.push_back({
            {"a_start", h.a_start}, {"a_count", h.a_count}, {"a_lines", h.a_lines},
            {"b_start", h.b_start}, {"b_count", h.b_count}, {"b_lines", h.b_lines}
        });
    }
    nlohmann::json j = {
        {"a", a_name},
        {"b", b_name},
        {"identical", identical},
        {"a_size", a_size},
        {"b_size", b_size},
        {"hunks", hunks_json},
        {"hunks_truncated", hunks_truncated}
    };
    j["first_differing_offset"] = first_differing_offset.has_value()
        ? nlohmann::json(*first_differing_offset) : nlohmann::json(nullptr);
    return j;
}

DeterminismVerifier::DeterminismVerifier(Config config) : config_(std::move(config)) {}

std::string DeterminismVerifier::normalize(const std::string& bytes,
                                           const std::vector<std::string>& ignorable,
                                           const std::string& placeholder) {
    std::vector<std::string> tokens;
    for (const auto& t : ignorable) {
        if (!t.empty()) tokens.push_back(t);
    }
    if (tokens.empty()) return bytes;

    // Longest first; equal lengths ordered so the result never depends on input order
    std::sort(tokens.begin(), tokens.end(), [](const std::string& x, const std::string& y) {
        return x.size() != y.size() ? x.size() > y.size() : x < y;
    });
    tokens.erase(std::unique(tokens.begin(), tokens.end()), tokens.end());

    std::string out;
    out.reserve(bytes.size());
    size_t pos = 0;
    while (pos < bytes.size()) {
        bool replaced = false;
        for (const auto& token : tokens) {
            if (bytes.compare(pos, token.size(), token) == 0) {
                out += placeholder;
                pos += token.size();
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            out += bytes[pos];
            ++pos;
        }
    }
    return out;
}

std::vector<DiffHunk> DeterminismVerifier::line_hunks(const std::string& a_text, const std::string& b_text,
                                                      bool& truncated) const {
    std::vector<std::string> a = split_lines(a_text);
    std::vector<std::string> b = split_lines(b_text);
    std::vector<DiffHunk> hunks;
    HunkBuilder builder(a, b, config_.max_sample_lines, config_.max_hunks, hunks, truncated);

    size_t prefix = 0;
    while (prefix < a.size() && prefix < b.size() && a[prefix] == b[prefix]) ++prefix;
    size_t suffix = 0;
    while (suffix < a.size() - prefix && suffix < b.size() - prefix &&
           a[a.size() - 1 - suffix] == b[b.size() - 1 - suffix]) {
        ++suffix;
    }

    const size_t n = a.size() - prefix - suffix;
    const size_t m = b.size() - prefix - suffix;
    builder.seek(prefix, prefix);

    if (n == 0 && m == 0) {
        // Lines agree; the difference is in line endings only
        return hunks;
    }

    if (n == 0 || m == 0 || (n + 1) * (m + 1) > config_.max_lcs_cells) {
        for (size_t i = 0; i < n; ++i) builder.removed(prefix + i);
        for (size_t j = 0; j < m; ++j) builder.added(prefix + j);
        builder.close();
        return hunks;
    }

    // lcs[i][j]: common subsequence length of a[prefix+i..] and b[prefix+j..]
    std::vector<uint32_t> lcs((n + 1) * (m + 1), 0);
    auto at = [m](size_t i, size_t j) { return i * (m + 1) + j; };
    for (size_t i = n; i-- > 0;) {
        for (size_t j = m; j-- > 0;) {
            if (a[prefix + i] == b[prefix + j]) {
                lcs[at(i, j)] = lcs[at(i + 1, j + 1)] + 1;
            } else {
                lcs[at(i, j)] = std::max(lcs[at(i + 1, j)], lcs[at(i, j + 1)]);
            }
        }
    }

    size_t i = 0;
    size_t j = 0;
    while (i < n && j < m) {
        if (a[prefix + i] == b[prefix + j]) {
            builder.matched(prefix + i, prefix + j);
            ++i;
            ++j;
        } else if (lcs[at(i + 1, j)] >= lcs[at(i, j + 1)]) {
            builder.removed(prefix + i);
            ++i;
        } else {
            builder.added(prefix + j);
            ++j;
        }
    }
    while (i < n) builder.removed(prefix + i++);
    while (j < m) builder.added(prefix + j++);
    builder.close();
    return hunks;
}

ArtifactDiff DeterminismVerifier::compare(const BuildArtifact& a, const BuildArtifact& b) const {
    const std::string na = normalize(a.bytes, a.ignorable, config_.placeholder);
    const std::string nb = normalize(b.bytes, b.ignorable, config_.placeholder);

    ArtifactDiff diff;
    diff.a_name = a.name;
    diff.b_name = b.name;
    diff.a_size = na.size();
    diff.b_size = nb.size();
    diff.identical = (na == nb);
    if (diff.identical) {
        return diff;
    }

    auto mismatch = std::mismatch(na.begin(), na.begin() + static_cast<std::ptrdiff_t>(std::min(na.size(), nb.size())),
                                  nb.begin());
    diff.first_differing_offset = static_cast<size_t>(mismatch.first - na.begin());
    diff.hunks = line_hunks(na, nb, diff.hunks_truncated);
    return diff;
}

ArtifactDiff DeterminismVerifier::verify(const BuildFn& build,
                                         const BuildConfiguration& a,
                                         const BuildConfiguration& b) const {
    if (a.name == b.name) {
        throw ConfigError("Determinism check needs two distinct configurations, got '" + a.name + "' twice");
    }

    GANTRY_LOG_INFO("Determinism: building configuration '" + a.name + "'");
    BuildArtifact artifact_a = build(a);
    GANTRY_LOG_INFO("Determinism: building configuration '" + b.name + "'");
    BuildArtifact artifact_b = build(b);

    ArtifactDiff diff = compare(artifact_a, artifact_b);
    if (!diff.identical) {
        std::string message = "Artifacts of '" + a.name + "' and '" + b.name +
                              "' differ at byte " + std::to_string(*diff.first_differing_offset);
        GANTRY_LOG_ERROR(message);
        throw DeterminismViolation(message, diff.to_json());
    }
    GANTRY_LOG_INFO("Determinism: '" + a.name + "' and '" + b.name + "' produced identical artifacts (" +
                    std::to_string(diff.a_size) + " bytes normalized)");
    return diff;
}

} // namespace gantry

// gantry/filter/exclusion_filter.h
#ifndef GANTRY_FILTER_EXCLUSION_FILTER_H
#define GANTRY_FILTER_EXCLUSION_FILTER_H

#include "gantry/common/types.h"
#include <string>
#include <unordered_set>
#include <vector>

namespace gantry {

struct FilterResult {
    std::vector<TestId> kept;   // input order preserved
    size_t removed = 0;
};

// Exact-match denylist of test identifiers known not to work on the target.
class ExclusionFilter {
public:
    ExclusionFilter() = default;
    explicit ExclusionFilter(std::vector<TestId> denylist);

    // One identifier per line; blank lines and `#` comments are ignored.
    // Throws ConfigError if the file cannot be read.
    static ExclusionFilter from_file(const std::string& path);
    static ExclusionFilter from_string(const std::string& content);

    FilterResult apply(const std::vector<TestId>& candidates) const;

    bool excludes(const TestId& id) const { return denylist_.count(id) > 0; }
    size_t size() const { return denylist_.size(); }

private:
    std::unordered_set<TestId> denylist_;
};

} // namespace gantry

#endif // GANTRY_FILTER_EXCLUSION_FILTER_H

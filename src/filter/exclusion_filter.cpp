// filter/exclusion_filter.cpp
#include "gantry/filter/exclusion_filter.h"
#include "gantry/common/errors.h"
#include "gantry/common/logger.h"
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>

namespace gantry {

ExclusionFilter::ExclusionFilter(std::vector<TestId> denylist)
    : denylist_(std::make_move_iterator(denylist.begin()), std::make_move_iterator(denylist.end())) {}

ExclusionFilter ExclusionFilter::from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot load exclusion list: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw ConfigError("Error reading exclusion list: " + path);
    }
    auto filter = from_string(buffer.str());
    GANTRY_LOG_DEBUG("Loaded " + std::to_string(filter.size()) + " exclusions from " + path);
    return filter;
}

ExclusionFilter ExclusionFilter::from_string(const std::string& content) {
    std::vector<TestId> entries;
    std::istringstream lines(content);
    std::string line;
    while (std::getline(lines, line)) {
        while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') continue;
        entries.push_back(line);
    }
    return ExclusionFilter(std::move(entries));
}

FilterResult ExclusionFilter::apply(const std::vector<TestId>& candidates) const {
    FilterResult result;
    result.kept.reserve(candidates.size());
    for (const auto& id : candidates) {
        if (denylist_.count(id) > 0) {
            ++result.removed;
        } else {
            result.kept.push_back(id);
        }
    }
    return result;
}

} // namespace gantry

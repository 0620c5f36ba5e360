// scheduler/job_graph.cpp
#include "gantry/scheduler/job_graph.h"
#include "gantry/common/errors.h"
#include "gantry/common/logger.h"
#include <algorithm>
#include <queue>
#include <unordered_set>

namespace gantry {

JobGraph::JobGraph(std::vector<Job> jobs) : jobs_(std::move(jobs)) {
    for (size_t i = 0; i < jobs_.size(); ++i) {
        const auto& name = jobs_[i].name;
        if (name.empty()) {
            throw ConfigError("Job with empty name at position " + std::to_string(i));
        }
        if (!index_.emplace(name, i).second) {
            throw ConfigError("Duplicate job name: " + name);
        }
        dependents_[name];
    }

    std::unordered_map<JobName, int> in_degree;
    for (auto& job : jobs_) {
        // Repeated entries would count twice against the in-degree
        std::unordered_set<JobName> seen;
        std::vector<JobName> unique_deps;
        for (const auto& dep : job.dependencies) {
            if (!seen.insert(dep).second) {
                GANTRY_LOG_DEBUG("Job " + job.name + " requires " + dep + " more than once");
                continue;
            }
            if (index_.count(dep) == 0) {
                throw ConfigError("Job " + job.name + " requires unknown job: " + dep);
            }
            unique_deps.push_back(dep);
            dependents_[dep].push_back(job.name);
        }
        job.dependencies = std::move(unique_deps);
        in_degree[job.name] = static_cast<int>(job.dependencies.size());
    }

    std::queue<JobName> ready;
    for (const auto& job : jobs_) {
        if (in_degree[job.name] == 0) ready.push(job.name);
    }
    while (!ready.empty()) {
        JobName current = ready.front();
        ready.pop();
        order_.push_back(current);
        for (const auto& succ : dependents_[current]) {
            if (--in_degree[succ] == 0) ready.push(succ);
        }
    }

    if (order_.size() != jobs_.size()) {
        std::vector<JobName> members;
        for (const auto& [name, degree] : in_degree) {
            if (degree > 0) members.push_back(name);
        }
        std::sort(members.begin(), members.end());
        std::string list;
        for (const auto& m : members) list += (list.empty() ? "" : ", ") + m;
        throw CycleError("Job dependencies contain a cycle through: " + list, members);
    }
}

const Job& JobGraph::job(const JobName& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        throw ConfigError("Unknown job: " + name);
    }
    return jobs_[it->second];
}

const std::vector<JobName>& JobGraph::dependents(const JobName& name) const {
    auto it = dependents_.find(name);
    if (it == dependents_.end()) {
        throw ConfigError("Unknown job: " + name);
    }
    return it->second;
}

JobGraph JobGraph::closure(const std::vector<JobName>& roots) const {
    std::unordered_set<JobName> selected;
    std::vector<JobName> stack;
    for (const auto& root : roots) {
        if (!contains(root)) {
            throw ConfigError("Unknown job: " + root);
        }
        stack.push_back(root);
    }
    while (!stack.empty()) {
        JobName current = stack.back();
        stack.pop_back();
        if (!selected.insert(current).second) continue;
        for (const auto& dep : job(current).dependencies) {
            stack.push_back(dep);
        }
    }

    std::vector<Job> subset;
    for (const auto& j : jobs_) {
        if (selected.count(j.name) > 0) subset.push_back(j);
    }
    return JobGraph(std::move(subset));
}

} // namespace gantry

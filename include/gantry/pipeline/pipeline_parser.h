// gantry/pipeline/pipeline_parser.h
#ifndef GANTRY_PIPELINE_PIPELINE_PARSER_H
#define GANTRY_PIPELINE_PIPELINE_PARSER_H

#include "gantry/common/types.h"
#include "gantry/scheduler/job_graph.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gantry {

enum class ParameterType : uint8_t {
    STRING,
    INTEGER,
    BOOLEAN,
    ENUM
};

struct ParameterSpec {
    std::string name;
    ParameterType type = ParameterType::STRING;
    std::optional<Value> default_value;
    std::vector<std::string> enum_values;
    std::string description;
};

struct WorkflowJob {
    JobName name;
    std::vector<JobName> requires_jobs;
};

struct Workflow {
    std::string name;
    std::vector<WorkflowJob> jobs;
};

struct PipelineDefinition {
    std::string version;
    std::vector<ParameterSpec> parameters;
    Value parameter_values = Value::object();   // after defaults and overrides
    std::vector<Job> jobs;                      // definition order
    std::vector<Workflow> workflows;            // definition order

    const Workflow* find_workflow(const std::string& name) const;

    // The jobs of `workflow` (or of the only workflow, or every job when the
    // file has none), narrowed to `only` and its dependency closure.
    JobGraph graph_for(const std::optional<std::string>& workflow,
                       const std::vector<JobName>& only = {}) const;
};

// Parses a pipeline YAML file into jobs ready to run. Parameter references
// (`<< pipeline.parameters.x >>`, `<< parameters.x >>`) are substituted and
// `commands:` invocations expanded while parsing; every structural problem is
// reported as ConfigError.
class PipelineParser {
public:
    // `overrides` come from `--param name=value`
    static PipelineDefinition parse_file(const std::string& path,
                                         const std::map<std::string, std::string>& overrides = {});
    static PipelineDefinition parse_string(const std::string& yaml,
                                           const std::map<std::string, std::string>& overrides = {});

    static ParameterType parse_parameter_type(const std::string& name);
    static std::vector<ParameterSpec> parse_parameter_specs(const nlohmann::json& j, const std::string& where);

    // Checks `value` against `spec`; strings from the command line are converted
    static Value coerce_parameter(const ParameterSpec& spec, const Value& value);

    // "1h", "10m30s", "45s", "90" (seconds)
    static std::chrono::milliseconds parse_duration(const Value& value);
};

} // namespace gantry

#endif // GANTRY_PIPELINE_PIPELINE_PARSER_H

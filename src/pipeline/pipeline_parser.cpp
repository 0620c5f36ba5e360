// pipeline/pipeline_parser.cpp
#include "gantry/pipeline/pipeline_parser.h"
#include "gantry/common/errors.h"
#include "gantry/common/logger.h"
#include "gantry/common/template_renderer.h"
#include "gantry/common/yaml_json.h"
#include "gantry/executor/actions.h"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>
#include <unordered_set>

namespace gantry {

namespace {

using json = nlohmann::json;

std::vector<std::string> ordered_keys(const YAML::Node& node) {
    std::vector<std::string> keys;
    if (!node || !node.IsMap()) return keys;
    for (const auto& kv : node) {
        keys.push_back(kv.first.as<std::string>());
    }
    return keys;
}

std::string expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path;   // ~user is left alone
    const char* home = std::getenv("HOME");
    return std::string(home != nullptr ? home : "") + path.substr(1);
}

std::string require_string(const json& j, const std::string& key, const std::string& where) {
    if (!j.contains(key)) {
        throw ConfigError(where + ": missing '" + key + "'");
    }
    if (!j[key].is_string() && !j[key].is_number() && !j[key].is_boolean()) {
        throw ConfigError(where + ": '" + key + "' must be a scalar");
    }
    return scalar_to_string(j[key]);
}

std::string optional_string(const json& j, const std::string& key, const std::string& fallback = "") {
    if (!j.contains(key) || j[key].is_null()) return fallback;
    if (j[key].is_object() || j[key].is_array()) {
        throw ConfigError("'" + key + "' must be a scalar");
    }
    return scalar_to_string(j[key]);
}

std::vector<std::string> string_list(const json& j, const std::string& key, const std::string& where) {
    std::vector<std::string> out;
    if (!j.contains(key) || j[key].is_null()) return out;
    const auto& value = j[key];
    if (value.is_string()) {
        out.push_back(value.get<std::string>());
        return out;
    }
    if (!value.is_array()) {
        throw ConfigError(where + ": '" + key + "' must be a list");
    }
    for (const auto& item : value) {
        if (item.is_object() || item.is_array() || item.is_null()) {
            throw ConfigError(where + ": '" + key + "' entries must be scalars");
        }
        out.push_back(scalar_to_string(item));
    }
    return out;
}

EnvMap env_map(const json& j, const std::string& where) {
    EnvMap env;
    if (j.is_null()) return env;
    if (!j.is_object()) {
        throw ConfigError(where + ": environment must be a mapping");
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.value().is_object() || it.value().is_array()) {
            throw ConfigError(where + ": environment value for " + it.key() + " must be a scalar");
        }
        env[it.key()] = it.value().is_null() ? "" : scalar_to_string(it.value());
    }
    return env;
}

int to_int(const json& value, const std::string& what) {
    if (value.is_number_integer()) return value.get<int>();
    if (value.is_string()) {
        const std::string& s = value.get_ref<const std::string&>();
        try {
            size_t consumed = 0;
            int parsed = std::stoi(s, &consumed);
            if (consumed == s.size()) return parsed;
        } catch (const std::exception&) {
        }
    }
    throw ConfigError(what + " must be an integer, got " + value.dump());
}

StepKind parse_kind(const std::string& name, const std::string& where) {
    if (name == "setup") return StepKind::SETUP;
    if (name == "build") return StepKind::BUILD;
    if (name == "test") return StepKind::TEST;
    if (name == "determinism") return StepKind::DETERMINISM;
    throw ConfigError(where + ": unknown step kind '" + name + "'");
}

StepCondition parse_when(const std::string& name, const std::string& where) {
    if (name == "on_success") return StepCondition::ON_SUCCESS;
    if (name == "always") return StepCondition::ALWAYS;
    throw ConfigError(where + ": 'when' must be on_success or always, got '" + name + "'");
}

std::string first_line(const std::string& text) {
    std::string line = text.substr(0, text.find('\n'));
    return line.size() > 60 ? line.substr(0, 57) + "..." : line;
}

// Expands the step lists of jobs and commands against a template context
class StepExpander {
public:
    StepExpander(const json& commands, const json& pipeline_context)
        : commands_(commands), pipeline_context_(pipeline_context) {}

    void expand(const json& steps, const json& context, const std::string& where,
                int parallelism, std::vector<Step>& out) {
        if (steps.is_null()) return;
        if (!steps.is_array()) {
            throw ConfigError(where + ": steps must be a list");
        }
        for (size_t i = 0; i < steps.size(); ++i) {
            const std::string step_where = where + " step " + std::to_string(i + 1);
            const json& item = steps[i];
            if (item.is_string()) {
                expand_named(item.get<std::string>(), json::object(), context, step_where, parallelism, out);
                continue;
            }
            if (!item.is_object() || item.size() != 1) {
                throw ConfigError(step_where + ": a step is a name or a single-key mapping");
            }
            const std::string key = item.begin().key();
            const json& body = item.begin().value();
            expand_named(key, body, context, step_where, parallelism, out);
        }
    }

private:
    void expand_named(const std::string& key, const json& raw_body, const json& context,
                      const std::string& where, int parallelism, std::vector<Step>& out) {
        json body = ParameterRenderer::render_strings(raw_body, context);

        if (key == "checkout") {
            out.emplace_back("Checkout code", StepKind::SETUP, StepCondition::ON_SUCCESS,
                             std::make_unique<CheckoutAction>());
        } else if (key == "run") {
            out.push_back(run_step(body, where));
        } else if (key == "store_test_results") {
            if (!body.is_object()) throw ConfigError(where + ": store_test_results needs a mapping");
            std::string path = expand_home(require_string(body, "path", where));
            out.emplace_back(optional_string(body, "name", "Store test results"), StepKind::BUILD,
                             parse_when(optional_string(body, "when", "always"), where),
                             std::make_unique<StoreTestResultsAction>(path));
        } else if (key == "sharded_tests") {
            out.push_back(sharded_step(body, where, parallelism));
        } else if (key == "verify_determinism") {
            out.push_back(determinism_step(body, where));
        } else if (commands_.contains(key)) {
            expand_command(key, body, where, parallelism, out);
        } else {
            throw ConfigError(where + ": unknown step or command '" + key + "'");
        }
    }

    void expand_command(const std::string& name, const json& args, const std::string& where,
                        int parallelism, std::vector<Step>& out) {
        if (std::find(stack_.begin(), stack_.end(), name) != stack_.end()) {
            throw ConfigError(where + ": command '" + name + "' invokes itself");
        }
        const json& command = commands_[name];
        if (!command.is_object()) {
            throw ConfigError("Command '" + name + "' must be a mapping");
        }
        if (!args.is_null() && !args.is_object()) {
            throw ConfigError(where + ": arguments to '" + name + "' must be a mapping");
        }

        auto specs = PipelineParser::parse_parameter_specs(command.value("parameters", json::object()),
                                                           "command " + name);
        json values = json::object();
        std::unordered_set<std::string> known;
        for (const auto& spec : specs) {
            known.insert(spec.name);
            if (args.is_object() && args.contains(spec.name)) {
                values[spec.name] = PipelineParser::coerce_parameter(spec, args[spec.name]);
            } else if (spec.default_value.has_value()) {
                values[spec.name] = PipelineParser::coerce_parameter(spec, *spec.default_value);
            } else {
                throw ConfigError(where + ": command '" + name + "' requires parameter '" + spec.name + "'");
            }
        }
        if (args.is_object()) {
            for (auto it = args.begin(); it != args.end(); ++it) {
                if (known.count(it.key()) == 0) {
                    throw ConfigError(where + ": command '" + name + "' has no parameter '" + it.key() + "'");
                }
            }
        }

        json context = pipeline_context_;
        context["parameters"] = values;
        stack_.push_back(name);
        expand(command.value("steps", json::array()), context, "command " + name, parallelism, out);
        stack_.pop_back();
    }

    Step run_step(const json& body, const std::string& where) {
        json spec = body.is_string() ? json{{"command", body}} : body;
        if (!spec.is_object()) throw ConfigError(where + ": run needs a command");
        std::string command = require_string(spec, "command", where);

        std::optional<std::chrono::milliseconds> timeout;
        if (spec.contains("no_output_timeout")) {
            timeout = PipelineParser::parse_duration(spec["no_output_timeout"]);
        }
        ReportFormat report = parse_report_format(optional_string(spec, "report"));
        auto action = std::make_unique<ShellAction>(
            command, env_map(spec.value("environment", json()), where), timeout, report);
        // A step that reports test results is a test step unless it says otherwise
        const std::string default_kind = report == ReportFormat::NONE ? "build" : "test";
        return Step(optional_string(spec, "name", first_line(command)),
                    parse_kind(optional_string(spec, "kind", default_kind), where),
                    parse_when(optional_string(spec, "when", "on_success"), where),
                    std::move(action));
    }

    Step sharded_step(const json& body, const std::string& where, int parallelism) {
        if (!body.is_object()) throw ConfigError(where + ": sharded_tests needs a mapping");
        auto action = std::make_unique<ShardedTestAction>();
        action->list_command = optional_string(body, "list");
        action->tests = string_list(body, "tests", where);
        if (action->list_command.empty() && !body.contains("tests")) {
            throw ConfigError(where + ": sharded_tests needs 'list' or 'tests'");
        }
        action->exclusions_path = expand_home(optional_string(body, "exclusions"));
        action->timings_path = expand_home(optional_string(body, "timings"));
        if (body.contains("fallback_weight")) {
            if (!body["fallback_weight"].is_number() || body["fallback_weight"].get<double>() < 0) {
                throw ConfigError(where + ": fallback_weight must be a non-negative number");
            }
            action->fallback_weight = body["fallback_weight"].get<double>();
        }
        action->command = require_string(body, "command", where);
        action->shards = parallelism;
        action->report = parse_report_format(optional_string(body, "report", "go-test"));
        if (body.contains("no_output_timeout")) {
            action->no_output_timeout = PipelineParser::parse_duration(body["no_output_timeout"]);
        }
        return Step(optional_string(body, "name", "Sharded tests"),
                    parse_kind(optional_string(body, "kind", "test"), where),
                    parse_when(optional_string(body, "when", "on_success"), where),
                    std::move(action));
    }

    Step determinism_step(const json& body, const std::string& where) {
        if (!body.is_object()) throw ConfigError(where + ": verify_determinism needs a mapping");
        auto action = std::make_unique<DeterminismAction>();
        action->command = require_string(body, "command", where);
        if (body.contains("placeholder")) {
            action->verifier_config.placeholder = require_string(body, "placeholder", where);
        }
        const json& configs = body.value("configurations", json::array());
        if (!configs.is_array() || configs.size() != 2) {
            throw ConfigError(where + ": verify_determinism needs exactly two configurations");
        }
        for (size_t i = 0; i < configs.size(); ++i) {
            const json& c = configs[i];
            const std::string config_where = where + " configuration " + std::to_string(i + 1);
            if (!c.is_object()) throw ConfigError(config_where + ": must be a mapping");
            BuildConfiguration cfg;
            cfg.name = optional_string(c, "name", i == 0 ? "a" : "b");
            cfg.environment = env_map(c.value("environment", json()), config_where);
            cfg.artifact_path = expand_home(require_string(c, "artifact", config_where));
            cfg.ignore = string_list(c, "ignore", config_where);
            action->configurations.push_back(std::move(cfg));
        }
        if (action->configurations[0].name == action->configurations[1].name) {
            throw ConfigError(where + ": configuration names must differ");
        }
        return Step(optional_string(body, "name", "Verify build determinism"),
                    parse_kind(optional_string(body, "kind", "determinism"), where),
                    parse_when(optional_string(body, "when", "on_success"), where),
                    std::move(action));
    }

    const json& commands_;
    const json& pipeline_context_;
    std::vector<std::string> stack_;
};

} // namespace

// --- PipelineDefinition ---

const Workflow* PipelineDefinition::find_workflow(const std::string& name) const {
    for (const auto& wf : workflows) {
        if (wf.name == name) return &wf;
    }
    return nullptr;
}

JobGraph PipelineDefinition::graph_for(const std::optional<std::string>& workflow,
                                       const std::vector<JobName>& only) const {
    if (workflows.empty()) {
        if (workflow.has_value()) {
            throw ConfigError("Pipeline defines no workflows, cannot select '" + *workflow + "'");
        }
        JobGraph graph(jobs);
        if (only.empty()) return graph;
        return graph.closure(only);
    }

    const Workflow* wf = nullptr;
    if (workflow.has_value()) {
        wf = find_workflow(*workflow);
        if (wf == nullptr) throw ConfigError("Unknown workflow: " + *workflow);
    } else if (workflows.size() == 1) {
        wf = &workflows.front();
    } else {
        std::string names;
        for (const auto& w : workflows) names += (names.empty() ? "" : ", ") + w.name;
        throw ConfigError("Several workflows defined (" + names + "); choose one with --workflow");
    }

    // Workflow requires add edges on top of the job-level ones
    std::vector<Job> all = jobs;
    std::vector<JobName> listed;
    for (const auto& entry : wf->jobs) {
        auto it = std::find_if(all.begin(), all.end(), [&entry](const Job& j) { return j.name == entry.name; });
        for (const auto& dep : entry.requires_jobs) {
            if (std::find(it->dependencies.begin(), it->dependencies.end(), dep) == it->dependencies.end()) {
                it->dependencies.push_back(dep);
            }
        }
        listed.push_back(entry.name);
    }

    // A workflow runs its jobs together with everything they require
    JobGraph graph = JobGraph(std::move(all)).closure(listed);
    if (only.empty()) return graph;
    return graph.closure(only);
}

// --- PipelineParser ---

ParameterType PipelineParser::parse_parameter_type(const std::string& name) {
    if (name == "string") return ParameterType::STRING;
    if (name == "integer") return ParameterType::INTEGER;
    if (name == "boolean") return ParameterType::BOOLEAN;
    if (name == "enum") return ParameterType::ENUM;
    throw ConfigError("Unsupported parameter type: " + name);
}

std::vector<ParameterSpec> PipelineParser::parse_parameter_specs(const nlohmann::json& j, const std::string& where) {
    std::vector<ParameterSpec> specs;
    if (j.is_null()) return specs;
    if (!j.is_object()) {
        throw ConfigError(where + ": parameters must be a mapping");
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string param_where = where + " parameter '" + it.key() + "'";
        const json& decl = it.value();
        if (!decl.is_object()) throw ConfigError(param_where + ": must be a mapping");

        ParameterSpec spec;
        spec.name = it.key();
        spec.type = parse_parameter_type(require_string(decl, "type", param_where));
        spec.description = optional_string(decl, "description");
        if (spec.type == ParameterType::ENUM) {
            spec.enum_values = string_list(decl, "enum", param_where);
            if (spec.enum_values.empty()) throw ConfigError(param_where + ": enum needs values");
        }
        if (decl.contains("default")) {
            spec.default_value = coerce_parameter(spec, decl["default"]);
        }
        specs.push_back(std::move(spec));
    }
    return specs;
}

Value PipelineParser::coerce_parameter(const ParameterSpec& spec, const Value& value) {
    const std::string mismatch = "Parameter '" + spec.name + "' ";
    switch (spec.type) {
        case ParameterType::STRING:
            if (!value.is_string()) throw ConfigError(mismatch + "expects a string, got " + value.dump());
            return value;
        case ParameterType::INTEGER:
            if (value.is_number_integer()) return value;
            if (value.is_string()) {
                const std::string& s = value.get_ref<const std::string&>();
                try {
                    size_t consumed = 0;
                    long long parsed = std::stoll(s, &consumed);
                    if (consumed == s.size()) return parsed;
                } catch (const std::exception&) {
                }
            }
            throw ConfigError(mismatch + "expects an integer, got " + value.dump());
        case ParameterType::BOOLEAN:
            if (value.is_boolean()) return value;
            if (value.is_string() && (value == "true" || value == "false")) return value == "true";
            throw ConfigError(mismatch + "expects a boolean, got " + value.dump());
        case ParameterType::ENUM: {
            if (value.is_object() || value.is_array() || value.is_null()) {
                throw ConfigError(mismatch + "expects one of its enum values, got " + value.dump());
            }
            std::string s = scalar_to_string(value);
            if (std::find(spec.enum_values.begin(), spec.enum_values.end(), s) == spec.enum_values.end()) {
                throw ConfigError(mismatch + "does not allow '" + s + "'");
            }
            return s;
        }
    }
    throw ConfigError(mismatch + "has an unknown type");
}

std::chrono::milliseconds PipelineParser::parse_duration(const Value& value) {
    long long seconds = -1;
    if (value.is_number()) {
        seconds = static_cast<long long>(value.get<double>());
    } else if (value.is_string()) {
        static const std::regex re(R"(^\s*(?:(\d+)h)?\s*(?:(\d+)m)?\s*(?:(\d+)s?)?\s*$)");
        std::smatch m;
        const std::string& s = value.get_ref<const std::string&>();
        if (!s.empty() && std::regex_match(s, m, re) && (m[1].matched || m[2].matched || m[3].matched)) {
            seconds = 0;
            if (m[1].matched) seconds += std::stoll(m[1].str()) * 3600;
            if (m[2].matched) seconds += std::stoll(m[2].str()) * 60;
            if (m[3].matched) seconds += std::stoll(m[3].str());
        }
    }
    if (seconds <= 0) {
        throw ConfigError("Invalid duration: " + value.dump());
    }
    return std::chrono::seconds(seconds);
}

PipelineDefinition PipelineParser::parse_file(const std::string& path,
                                              const std::map<std::string, std::string>& overrides) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open pipeline file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    try {
        return parse_string(buffer.str(), overrides);
    } catch (const ConfigError& e) {
        throw ConfigError(path + ": " + e.what());
    }
}

PipelineDefinition PipelineParser::parse_string(const std::string& yaml,
                                                const std::map<std::string, std::string>& overrides) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("YAML parse error: ") + e.what());
    }
    if (!root.IsMap()) {
        throw ConfigError("Pipeline definition must be a mapping");
    }
    const json doc = yaml_to_json(root);

    PipelineDefinition def;
    def.version = optional_string(doc, "version", "1");

    // Parameters: defaults, then command-line overrides
    def.parameters = parse_parameter_specs(doc.value("parameters", json::object()), "pipeline");
    for (const auto& [name, raw] : overrides) {
        bool declared = std::any_of(def.parameters.begin(), def.parameters.end(),
                                    [&name](const ParameterSpec& s) { return s.name == name; });
        if (!declared) throw ConfigError("Unknown pipeline parameter: " + name);
    }
    for (const auto& spec : def.parameters) {
        auto it = overrides.find(spec.name);
        if (it != overrides.end()) {
            def.parameter_values[spec.name] = coerce_parameter(spec, Value(it->second));
        } else if (spec.default_value.has_value()) {
            def.parameter_values[spec.name] = *spec.default_value;
        } else {
            throw ConfigError("Pipeline parameter '" + spec.name + "' has no default and no value");
        }
    }
    const json pipeline_context = {{"pipeline", {{"parameters", def.parameter_values}}}};

    const json executors = doc.value("executors", json::object());
    const json commands = doc.value("commands", json::object());
    if (!executors.is_object()) throw ConfigError("'executors' must be a mapping");
    if (!commands.is_object()) throw ConfigError("'commands' must be a mapping");
    const json jobs = doc.value("jobs", json::object());
    if (!jobs.is_object() || jobs.empty()) {
        throw ConfigError("Pipeline defines no jobs");
    }

    StepExpander expander(commands, pipeline_context);
    for (const auto& name : ordered_keys(root["jobs"])) {
        const std::string where = "job '" + name + "'";
        const json& raw = jobs[name];
        if (!raw.is_object()) throw ConfigError(where + ": must be a mapping");

        json settings = raw;
        settings.erase("steps");
        settings = ParameterRenderer::render_strings(settings, pipeline_context);

        Job job;
        job.name = name;

        json executor = json::object();
        if (settings.contains("executor")) {
            const json& ref = settings["executor"];
            if (ref.is_string()) {
                if (!executors.contains(ref.get<std::string>())) {
                    throw ConfigError(where + ": unknown executor '" + ref.get<std::string>() + "'");
                }
                executor = ParameterRenderer::render_strings(executors[ref.get<std::string>()], pipeline_context);
            } else if (ref.is_object()) {
                executor = ref;
            } else {
                throw ConfigError(where + ": executor must be a name or a mapping");
            }
            if (executor.contains("docker")) {
                GANTRY_LOG_DEBUG(where + ": container images are ignored, steps run on the host");
            }
        }

        job.working_directory = expand_home(optional_string(settings, "working_directory",
                                                            optional_string(executor, "working_directory")));
        job.environment = env_map(executor.value("environment", json()), where);
        for (const auto& [k, v] : env_map(settings.value("environment", json()), where)) {
            job.environment[k] = v;
        }
        if (settings.contains("parallelism")) {
            job.parallelism = to_int(settings["parallelism"], where + " parallelism");
            if (job.parallelism < 1) throw ConfigError(where + ": parallelism must be >= 1");
        }
        job.dependencies = string_list(settings, "requires", where);
        job.locks = string_list(settings, "locks", where);

        if (!raw.contains("steps")) throw ConfigError(where + ": missing steps");
        expander.expand(raw["steps"], pipeline_context, where, job.parallelism, job.steps);
        def.jobs.push_back(std::move(job));
    }

    const json workflows = doc.value("workflows", json::object());
    for (const auto& name : ordered_keys(root["workflows"])) {
        const json& body = workflows[name];
        if (!body.is_object()) continue;   // `version: 2` and similar scalars
        const std::string where = "workflow '" + name + "'";

        Workflow wf;
        wf.name = name;
        std::unordered_set<std::string> seen;
        for (const auto& entry : body.value("jobs", json::array())) {
            WorkflowJob wj;
            if (entry.is_string()) {
                wj.name = entry.get<std::string>();
            } else if (entry.is_object() && entry.size() == 1) {
                wj.name = entry.begin().key();
                const json& opts = entry.begin().value();
                if (opts.is_object()) wj.requires_jobs = string_list(opts, "requires", where);
            } else {
                throw ConfigError(where + ": job entries are names or single-key mappings");
            }
            if (!jobs.contains(wj.name)) throw ConfigError(where + ": unknown job '" + wj.name + "'");
            if (!seen.insert(wj.name).second) throw ConfigError(where + ": job '" + wj.name + "' listed twice");
            wf.jobs.push_back(std::move(wj));
        }
        if (wf.jobs.empty()) throw ConfigError(where + ": no jobs");
        def.workflows.push_back(std::move(wf));
    }

    GANTRY_LOG_DEBUG("Parsed pipeline with " + std::to_string(def.jobs.size()) + " jobs and " +
                     std::to_string(def.workflows.size()) + " workflows");
    return def;
}

} // namespace gantry

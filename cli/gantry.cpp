// cli/gantry.cpp
#include "gantry/common/cancellation.h"
#include "gantry/common/errors.h"
#include "gantry/common/logger.h"
#include "gantry/common/run_config.h"
#include "gantry/common/yaml_json.h"
#include "gantry/filter/exclusion_filter.h"
#include "gantry/partition/partitioner.h"
#include "gantry/partition/timing_snapshot.h"
#include "gantry/pipeline/pipeline.h"
#include "gantry/report/result_aggregator.h"
#include "gantry/verify/determinism_verifier.h"
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <vector>

using namespace gantry;

constexpr const char* VERSION = "0.3.0";

namespace {

CancellationToken* g_token = nullptr;

void signal_handler(int signal) {
    (void)signal;
    if (g_token != nullptr) {
        g_token->request_cancel();
    }
}

void install_signal_handlers(CancellationToken& token) {
    g_token = &token;
    struct sigaction sa {};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

void print_usage() {
    std::cout <<
        "gantry " << VERSION << " - build and test pipeline runner\n"
        "\n"
        "  gantry run <pipeline.yml> [--workflow W] [--job J]... [--param k=v]...\n"
        "             [--concurrency N] [--output DIR] [--config FILE] [--grace SEC]\n"
        "             [--timings FILE] [--log-level LEVEL]\n"
        "  gantry validate <pipeline.yml> [--workflow W] [--param k=v]...\n"
        "  gantry split --total N --index I [--timings F] [--exclusions F] [--fallback-weight W]\n"
        "  gantry report [--format json|junit] [--suite NAME]\n"
        "  gantry verify <a> <b> [--ignore-a T]... [--ignore-b T]... [--placeholder P]\n"
        "\n"
        "Exit codes: 0 ok, 1 test, 2 build, 3 determinism, 4 setup, 5 config, 130 cancelled\n";
}

struct Args {
    std::vector<std::string> positional;
    std::multimap<std::string, std::string> options;

    bool has(const std::string& key) const { return options.count(key) > 0; }

    std::string get(const std::string& key, const std::string& fallback = "") const {
        auto it = options.find(key);
        return it == options.end() ? fallback : it->second;
    }

    std::vector<std::string> all(const std::string& key) const {
        std::vector<std::string> values;
        auto range = options.equal_range(key);
        for (auto it = range.first; it != range.second; ++it) values.push_back(it->second);
        return values;
    }
};

// Every option takes a value, given as `--name value` or `--name=value`
Args parse_args(int argc, char* argv[], int start, const std::set<std::string>& allowed) {
    Args args;
    for (int i = start; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0 || arg == "--") {
            args.positional.push_back(arg);
            continue;
        }
        std::string key = arg.substr(2);
        std::string value;
        auto eq = key.find('=');
        if (eq != std::string::npos) {
            value = key.substr(eq + 1);
            key = key.substr(0, eq);
        } else if (i + 1 < argc) {
            value = argv[++i];
        } else {
            throw ConfigError("Option --" + key + " needs a value");
        }
        if (allowed.count(key) == 0) {
            throw ConfigError("Unknown option --" + key);
        }
        args.options.emplace(key, value);
    }
    return args;
}

int parse_int(const std::string& value, const std::string& what) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed == value.size()) return parsed;
    } catch (const std::exception&) {
    }
    throw ConfigError(what + " must be an integer, got '" + value + "'");
}

double parse_double(const std::string& value, const std::string& what) {
    try {
        size_t consumed = 0;
        double parsed = std::stod(value, &consumed);
        if (consumed == value.size()) return parsed;
    } catch (const std::exception&) {
    }
    throw ConfigError(what + " must be a number, got '" + value + "'");
}

std::map<std::string, std::string> parse_params(const std::vector<std::string>& raw) {
    std::map<std::string, std::string> params;
    for (const auto& entry : raw) {
        auto eq = entry.find('=');
        if (eq == std::string::npos || eq == 0) {
            throw ConfigError("--param expects name=value, got '" + entry + "'");
        }
        params[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    return params;
}

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ConfigError("Cannot read " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

int cmd_run(int argc, char* argv[]) {
    Args args = parse_args(argc, argv, 2, {"workflow", "job", "param", "concurrency", "output", "config",
                                           "grace", "timings", "log-level"});
    if (args.positional.size() != 1) {
        throw ConfigError("run expects exactly one pipeline file");
    }

    RunConfig config = load_run_config(args.get("config", "gantry.json"));
    if (args.has("concurrency")) config.concurrency = parse_int(args.get("concurrency"), "--concurrency");
    if (config.concurrency < 1) throw ConfigError("--concurrency must be >= 1");
    if (args.has("output")) config.output_dir = args.get("output");
    if (args.has("timings")) config.timings_path = args.get("timings");
    if (args.has("grace")) {
        double seconds = parse_double(args.get("grace"), "--grace");
        if (seconds < 0) throw ConfigError("--grace must be >= 0");
        config.grace_period = std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
    }
    if (args.has("log-level")) config.log_level = args.get("log-level");
    if (!std::getenv("GANTRY_LOG_LEVEL")) {
        Logger::set_level(Logger::parse_level(config.log_level));
    }

    Pipeline pipeline = Pipeline::from_file(args.positional[0], parse_params(args.all("param")), config);

    RunOptions options;
    if (args.has("workflow")) options.workflow = args.get("workflow");
    options.jobs = args.all("job");

    CancellationToken token(config.grace_period);
    install_signal_handlers(token);
    RunResult result = pipeline.run(options, token);

    for (const auto& [name, outcome] : result.schedule.outcomes) {
        std::cout << name << ": " << to_string(outcome.status);
        if (!outcome.message.empty()) std::cout << " (" << outcome.message << ")";
        std::cout << "\n";
    }
    return result.exit_code;
}

int cmd_validate(int argc, char* argv[]) {
    Args args = parse_args(argc, argv, 2, {"workflow", "param"});
    if (args.positional.size() != 1) {
        throw ConfigError("validate expects exactly one pipeline file");
    }
    PipelineDefinition def = PipelineParser::parse_file(args.positional[0], parse_params(args.all("param")));

    std::vector<std::optional<std::string>> selections;
    if (args.has("workflow")) {
        selections.emplace_back(args.get("workflow"));
    } else if (def.workflows.empty()) {
        selections.emplace_back(std::nullopt);
    } else {
        for (const auto& wf : def.workflows) selections.emplace_back(wf.name);
    }

    for (const auto& selection : selections) {
        JobGraph graph = def.graph_for(selection);
        std::cout << (selection ? "workflow " + *selection : std::string("all jobs")) << ":";
        for (const auto& name : graph.topological_order()) {
            const Job& job = graph.job(name);
            std::cout << " " << name;
            if (job.parallelism > 1) std::cout << "[x" << job.parallelism << "]";
        }
        std::cout << "\n";
    }
    std::cout << "OK: " << def.jobs.size() << " jobs, " << def.parameters.size() << " parameters\n";
    return 0;
}

int cmd_split(int argc, char* argv[]) {
    Args args = parse_args(argc, argv, 2, {"total", "index", "timings", "exclusions", "fallback-weight"});
    if (!args.has("total") || !args.has("index")) {
        throw ConfigError("split needs --total and --index");
    }
    int total = parse_int(args.get("total"), "--total");
    int index = parse_int(args.get("index"), "--index");
    if (index < 0 || index >= total) {
        throw ConfigError("--index must be in [0, " + std::to_string(total) + ")");
    }

    std::vector<TestId> tests;
    std::string line;
    while (std::getline(std::cin, line)) {
        size_t start = line.find_first_not_of(" \t\r");
        if (start == std::string::npos) continue;
        size_t end = line.find_last_not_of(" \t\r");
        tests.push_back(line.substr(start, end - start + 1));
    }

    ExclusionFilter filter;
    if (args.has("exclusions")) filter = ExclusionFilter::from_file(args.get("exclusions"));
    FilterResult filtered = filter.apply(tests);

    TimingSnapshot timings;
    if (args.has("timings")) timings = TimingSnapshot::load(args.get("timings"));

    TestPartitioner::Config config;
    if (args.has("fallback-weight")) {
        config.fallback_weight = parse_double(args.get("fallback-weight"), "--fallback-weight");
        if (config.fallback_weight < 0) throw ConfigError("--fallback-weight must be >= 0");
    }
    PartitionResult plan = TestPartitioner(config).partition(filtered.kept, timings, total);
    for (const auto& id : plan.shards[static_cast<size_t>(index)].tests) {
        std::cout << id << "\n";
    }
    return 0;
}

int cmd_report(int argc, char* argv[]) {
    Args args = parse_args(argc, argv, 2, {"format", "suite"});
    std::string format = args.get("format", "json");
    if (format != "json" && format != "junit") {
        throw ConfigError("--format must be json or junit");
    }

    GoTestOutputParser parser(args.get("suite"));
    char buffer[8192];
    while (std::cin.read(buffer, sizeof(buffer)) || std::cin.gcount() > 0) {
        parser.feed(std::string_view(buffer, static_cast<size_t>(std::cin.gcount())));
    }
    ParsedOutput parsed = parser.finish();

    ResultAggregator aggregator(args.get("suite", "report"));
    aggregator.append(std::move(parsed));
    Report report = aggregator.snapshot();
    report.job_status = report.passed() ? JobStatus::SUCCEEDED : JobStatus::FAILED;
    report.failure_class = report.passed() ? FailureClass::NONE : FailureClass::TEST;

    if (format == "junit") {
        std::cout << report.to_junit_xml();
    } else {
        std::cout << dump_json(report.to_json()) << "\n";
    }
    return report.passed() ? 0 : exit_code_for(FailureClass::TEST);
}

int cmd_verify(int argc, char* argv[]) {
    Args args = parse_args(argc, argv, 2, {"ignore-a", "ignore-b", "placeholder"});
    if (args.positional.size() != 2) {
        throw ConfigError("verify expects two files");
    }
    DeterminismVerifier::Config config;
    if (args.has("placeholder")) config.placeholder = args.get("placeholder");
    DeterminismVerifier verifier(config);

    BuildArtifact a{args.positional[0], read_file(args.positional[0]), args.all("ignore-a")};
    BuildArtifact b{args.positional[1], read_file(args.positional[1]), args.all("ignore-b")};
    ArtifactDiff diff = verifier.compare(a, b);
    if (diff.identical) {
        std::cout << "identical (" << diff.a_size << " bytes normalized)\n";
        return 0;
    }
    std::cout << dump_json(diff.to_json()) << "\n";
    return exit_code_for(FailureClass::DETERMINISM);
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return exit_code_for(FailureClass::CONFIG);
    }
    std::string command = argv[1];
    if (command == "-h" || command == "--help" || command == "help") {
        print_usage();
        return 0;
    }
    if (command == "-v" || command == "--version") {
        std::cout << VERSION << "\n";
        return 0;
    }

    try {
        if (command == "run") return cmd_run(argc, argv);
        if (command == "validate") return cmd_validate(argc, argv);
        if (command == "split") return cmd_split(argc, argv);
        if (command == "report") return cmd_report(argc, argv);
        if (command == "verify") return cmd_verify(argc, argv);
        std::cerr << "Unknown command: " << command << "\n\n";
        print_usage();
        return exit_code_for(FailureClass::CONFIG);
    } catch (const PipelineError& e) {
        GANTRY_LOG_ERROR(e.what());
        return exit_code_for(e.failure_class());
    } catch (const std::exception& e) {
        GANTRY_LOG_ERROR(std::string("Unexpected error: ") + e.what());
        return exit_code_for(FailureClass::SETUP);
    }
}

// report/report.cpp
#include "gantry/report/report.h"
#include "gantry/common/yaml_json.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace gantry {

namespace {

void ensure_parent(const std::string& path) {
    std::filesystem::path target(path);
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path());
    }
}

// Test name without the "<suite>." prefix
std::string short_name(const TestResult& r) {
    if (!r.suite.empty() && r.id.size() > r.suite.size() && r.id.compare(0, r.suite.size(), r.suite) == 0 &&
        r.id[r.suite.size()] == '.') {
        return r.id.substr(r.suite.size() + 1);
    }
    return r.id;
}

// A literal "]]>" would close the section early
std::string cdata(const std::string& text) {
    std::string out = "<![CDATA[";
    size_t start = 0;
    size_t pos;
    while ((pos = text.find("]]>", start)) != std::string::npos) {
        out.append(text, start, pos - start);
        out += "]]]]><![CDATA[>";
        start = pos + 3;
    }
    out.append(text, start, std::string::npos);
    out += "]]>";
    return out;
}

} // namespace

bool Report::passed() const {
    return std::none_of(results.begin(), results.end(),
                        [](const TestResult& r) { return r.status == TestStatus::FAIL; });
}

size_t Report::count(TestStatus status) const {
    return static_cast<size_t>(std::count_if(results.begin(), results.end(),
                                             [status](const TestResult& r) { return r.status == status; }));
}

const TestResult* Report::find(const TestId& id) const {
    auto it = std::find_if(results.begin(), results.end(),
                           [&id](const TestResult& r) { return r.id == id; });
    return it != results.end() ? &*it : nullptr;
}

double Report::total_duration() const {
    double total = 0.0;
    for (const auto& r : results) total += r.duration_sec;
    return total;
}

nlohmann::json Report::to_json() const {
    nlohmann::json j;
    j["job"] = job;
    j["status"] = to_string(job_status);
    j["tests_passed"] = passed();
    j["failure_class"] = to_string(failure_class);
    if (!message.empty()) j["message"] = message;

    j["summary"] = {
        {"total", results.size()},
        {"pass", count(TestStatus::PASS)},
        {"fail", count(TestStatus::FAIL)},
        {"skip", count(TestStatus::SKIP)},
        {"duration_sec", total_duration()}
    };

    nlohmann::json tests = nlohmann::json::array();
    for (const auto& r : results) {
        nlohmann::json t{{"id", r.id}, {"status", to_string(r.status)}, {"duration_sec", r.duration_sec}};
        if (!r.suite.empty()) t["suite"] = r.suite;
        if (!r.output.empty()) t["output"] = r.output;
        tests.push_back(std::move(t));
    }
    j["tests"] = std::move(tests);

    nlohmann::json steps_json = nlohmann::json::array();
    for (const auto& s : steps) {
        nlohmann::json sj{{"name", s.name}, {"kind", to_string(s.kind)}, {"status", s.status},
                          {"duration_sec", s.duration_sec}};
        if (s.exit_code.has_value()) sj["exit_code"] = *s.exit_code;
        if (!s.message.empty()) sj["message"] = s.message;
        steps_json.push_back(std::move(sj));
    }
    j["steps"] = std::move(steps_json);
    j["diagnostics"] = diagnostics;
    if (determinism_diff.has_value()) j["determinism_diff"] = *determinism_diff;
    return j;
}

std::string Report::to_junit_xml() const {
    std::ostringstream out;
    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    out << "<testsuite name=\"" << escape_xml(job) << "\" tests=\"" << results.size()
        << "\" failures=\"" << count(TestStatus::FAIL) << "\" skipped=\"" << count(TestStatus::SKIP)
        << "\" time=\"" << total_duration() << "\">\n";
    for (const auto& r : results) {
        out << "  <testcase classname=\"" << escape_xml(r.suite) << "\" name=\"" << escape_xml(short_name(r))
            << "\" time=\"" << r.duration_sec << "\"";
        if (r.status == TestStatus::PASS) {
            out << "/>\n";
            continue;
        }
        out << ">\n";
        if (r.status == TestStatus::SKIP) {
            out << "    <skipped/>\n";
        } else {
            out << "    <failure message=\"Failed\">" << cdata(r.output) << "</failure>\n";
        }
        out << "  </testcase>\n";
    }
    if (!diagnostics.empty()) {
        std::string text;
        for (const auto& line : diagnostics) text += line + "\n";
        out << "  <system-out>" << cdata(text) << "</system-out>\n";
    }
    out << "</testsuite>\n";
    return out.str();
}

void Report::write_json(const std::string& path) const {
    ensure_parent(path);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot write report: " + path);
    }
    out << dump_json(to_json()) << "\n";
}

void Report::write_junit(const std::string& path) const {
    ensure_parent(path);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot write report: " + path);
    }
    out << to_junit_xml();
}

std::string escape_xml(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char ch : s) {
        switch (ch) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: out.push_back(ch); break;
        }
    }
    return out;
}

} // namespace gantry

/**
 * Rich-output code interpreter
 *
 * Runs code in a Sandbox and gathers what it drew. Python code is
 * wrapped so matplotlib figures (and, on request, plotly figures) are
 * written to an artifact directory in the workspace, which is read
 * back after the run. Failed runs carry the Python traceback split
 * out of stderr.
 */
#pragma once
#include <map>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "runtime/sandbox.hpp"

namespace warden::runtime {

struct Artifact {
    std::string type;               // "image/png", "chart", "error", ...
    std::string name;
    nlohmann::json content;
    nlohmann::json metadata = nlohmann::json::object();

    nlohmann::json to_json() const;
};

struct InterpreterResult {
    ExecutionResult execution;
    std::vector<Artifact> artifacts;
    std::string error_message;
    std::string error_traceback;    // empty when stderr held none

    bool ok() const { return execution.ok(); }
    nlohmann::json to_json() const;
};

class CodeInterpreter {
public:
    // Relative to the workspace; cleared at the start of every wrapped run
    static constexpr const char* ARTIFACT_DIR = ".artifacts";

    explicit CodeInterpreter(Sandbox& sandbox) : sandbox_(sandbox) {}

    // Sandbox errors (timeouts, rejected files) propagate unchanged
    InterpreterResult run(const std::string& code, const std::string& language = "python",
                          const std::map<std::string, std::string>& files = {},
                          bool extract_artifacts = true);

    // Python only; figures passed to show() come back as "chart" artifacts
    InterpreterResult run_plotly(const std::string& code,
                                 const std::map<std::string, std::string>& files = {});

    static std::string wrap_matplotlib(const std::string& code);
    static std::string wrap_plotly(const std::string& code);

    // (message, traceback): the last traceback line and the traceback
    // itself, or (stderr, "") when there is none
    static std::pair<std::string, std::string> split_traceback(const std::string& stderr_text);

private:
    Sandbox& sandbox_;

    std::vector<Artifact> collect_artifacts();
};

} // namespace warden::runtime

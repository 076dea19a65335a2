#include "runtime/interpreter.hpp"
#include "util/errors.hpp"
#include "util/ids.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace warden::runtime {

namespace {

constexpr const char* TRACEBACK_MARKER = "Traceback (most recent call last):";

const char* MATPLOTLIB_PRELUDE = R"PY(import os as _warden_os
import shutil as _warden_shutil
_warden_shutil.rmtree('.artifacts', ignore_errors=True)
_warden_os.makedirs('.artifacts', exist_ok=True)
try:
    import matplotlib as _warden_mpl
    _warden_mpl.use('Agg')
    import matplotlib.pyplot as _warden_plt
except ImportError:
    _warden_plt = None
_warden_plot_count = [0]

def _warden_save_figures():
    if _warden_plt is None:
        return
    for _warden_num in _warden_plt.get_fignums():
        _warden_fig = _warden_plt.figure(_warden_num)
        _warden_fig.savefig('.artifacts/plot_%d.png' % _warden_plot_count[0],
                            format='png', dpi=100, bbox_inches='tight')
        _warden_plot_count[0] += 1
        _warden_plt.close(_warden_fig)

if _warden_plt is not None:
    _warden_plt.show = lambda *args, **kwargs: _warden_save_figures()

)PY";

const char* MATPLOTLIB_EPILOGUE = R"PY(

_warden_save_figures()
)PY";

const char* PLOTLY_PRELUDE = R"PY(import os as _warden_os
import plotly.graph_objects as _warden_go
_warden_os.makedirs('.artifacts', exist_ok=True)
_warden_figures = []

def _warden_show(self, *args, **kwargs):
    _warden_figures.append(self)
    with open('.artifacts/plotly_chart_%d.json' % len(_warden_figures), 'w') as _warden_out:
        _warden_out.write(self.to_json())

_warden_go.Figure.show = _warden_show

)PY";

std::string lowercase_extension(const std::string& name) {
    size_t dot = name.rfind('.');
    if (dot == std::string::npos) return "";
    std::string ext = name.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string stem(const std::string& name) {
    size_t dot = name.rfind('.');
    return dot == std::string::npos ? name : name.substr(0, dot);
}

std::string image_type(const std::string& ext) {
    if (ext == ".png") return "image/png";
    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".svg") return "image/svg+xml";
    return "";
}

} // namespace

json Artifact::to_json() const {
    return {{"type", type}, {"name", name}, {"content", content}, {"metadata", metadata}};
}

json InterpreterResult::to_json() const {
    json j = execution.to_json();
    json list = json::array();
    for (const auto& artifact : artifacts) {
        list.push_back(artifact.to_json());
    }
    j["artifacts"] = list;
    j["error_message"] = error_message.empty() ? json() : json(error_message);
    j["error_traceback"] = error_traceback.empty() ? json() : json(error_traceback);
    return j;
}

std::string CodeInterpreter::wrap_matplotlib(const std::string& code) {
    return std::string(MATPLOTLIB_PRELUDE) + code + MATPLOTLIB_EPILOGUE;
}

std::string CodeInterpreter::wrap_plotly(const std::string& code) {
    return std::string(PLOTLY_PRELUDE) + code;
}

std::pair<std::string, std::string> CodeInterpreter::split_traceback(const std::string& stderr_text) {
    size_t start = stderr_text.find(TRACEBACK_MARKER);
    if (start == std::string::npos) {
        return {stderr_text, ""};
    }
    std::string traceback = stderr_text.substr(start);
    size_t end = traceback.find_last_not_of(" \t\r\n");
    traceback.resize(end + 1);

    size_t line_start = traceback.rfind('\n');
    std::string message = line_start == std::string::npos ? traceback : traceback.substr(line_start + 1);
    return {message, traceback};
}

InterpreterResult CodeInterpreter::run(const std::string& code, const std::string& language,
                                       const std::map<std::string, std::string>& files,
                                       bool extract_artifacts) {
    bool python = launch_plan_for(language).source_file == "main.py";
    std::string source = extract_artifacts && python ? wrap_matplotlib(code) : code;

    InterpreterResult result;
    result.execution = sandbox_.run(source, language, files);

    if (!result.execution.ok() && result.execution.exit_code != 0) {
        auto [message, traceback] = split_traceback(result.execution.stderr_text);
        result.error_message = message;
        result.error_traceback = traceback;

        Artifact error;
        error.type = "error";
        error.name = "execution_error";
        error.content = {
            {"message", message},
            {"traceback", traceback.empty() ? json() : json(traceback)}
        };
        error.metadata = {{"exit_code", result.execution.exit_code}};
        result.artifacts.push_back(std::move(error));
        return result;
    }

    if (extract_artifacts && python) {
        result.artifacts = collect_artifacts();
    }
    return result;
}

InterpreterResult CodeInterpreter::run_plotly(const std::string& code,
                                              const std::map<std::string, std::string>& files) {
    return run(wrap_plotly(code), "python", files, true);
}

std::vector<Artifact> CodeInterpreter::collect_artifacts() {
    std::vector<Artifact> artifacts;
    auto listing = sandbox_.list_directory(ARTIFACT_DIR, true);
    if (!listing) {
        return artifacts;
    }

    for (const auto& entry : *listing) {
        if (entry.type != "file") continue;
        std::string ext = lowercase_extension(entry.name);
        std::string path = std::string(ARTIFACT_DIR) + "/" + entry.name;

        try {
            if (ext == ".json") {
                auto file = sandbox_.read_file(path);
                if (!file) continue;
                json data = json::parse(file->content);

                Artifact artifact;
                artifact.name = stem(entry.name);
                if (entry.name.rfind("plotly", 0) == 0) {
                    artifact.type = "chart";
                    artifact.content = std::move(data);
                    artifact.metadata = {{"source", "plotly"}, {"library", "plotly"}};
                } else if (data.is_object()) {
                    artifact.type = data.value("type", "text");
                    artifact.content = data.value("data", json(""));
                    artifact.metadata = {{"source", "matplotlib"}};
                } else {
                    artifact.type = "json";
                    artifact.content = std::move(data);
                }
                artifacts.push_back(std::move(artifact));
                continue;
            }

            std::string type = image_type(ext);
            if (type.empty()) continue;
            auto file = sandbox_.read_file(path);
            if (!file) continue;

            Artifact artifact;
            artifact.type = type;
            artifact.name = entry.name;
            artifact.content = file->is_binary ? util::base64_encode(file->content) : file->content;
            artifact.metadata = {
                {"filename", entry.name},
                {"encoding", file->is_binary ? "base64" : "utf-8"},
                {"size", file->content.size()}
            };
            if (entry.name.rfind("plot_", 0) == 0) {
                artifact.metadata["source"] = "matplotlib";
            }
            artifacts.push_back(std::move(artifact));
        } catch (const json::parse_error& e) {
            spdlog::debug("Skipping unreadable artifact {}: {}", entry.name, e.what());
        } catch (const Error& e) {
            spdlog::warn("Failed to collect artifact {} from {}: {}", entry.name, sandbox_.name(), e.what());
        }
    }

    spdlog::debug("Collected {} artifacts from {}", artifacts.size(), sandbox_.name());
    return artifacts;
}

} // namespace warden::runtime

#include "sandbox/bootstrap_script.hpp"

namespace agentrun::sandbox {
namespace {

constexpr const char* kScriptBody = R"PY(

def write_output(output):
    print("Writing output to " + OUTPUT_PATH, file=sys.stderr)
    with open(OUTPUT_PATH, "w") as handle:
        json.dump(output, handle, indent=2, default=str)


def snapshot_files(files_dir):
    os.chdir(files_dir)
    if os.path.exists(".git"):
        return
    for command in (
        ["git", "init", "-q"],
        ["git", "config", "user.email", "agent@agentrun.local"],
        ["git", "config", "user.name", "agentrun"],
        ["git", "add", "-A"],
        ["git", "commit", "-q", "--allow-empty", "-m", "Initial commit"],
    ):
        subprocess.run(command, check=False)


def diff_against_snapshot():
    try:
        result = subprocess.run(["git", "diff", "HEAD"], capture_output=True, text=True)
    except OSError:
        return None
    if result.returncode == 0 and result.stdout:
        return result.stdout
    return None


def failure(error_type, message, trace=None):
    output = {"success": False, "error": message, "error_type": error_type}
    if trace:
        output["traceback"] = trace
    return output


def load_agent():
    spec = importlib.util.spec_from_file_location("agent", os.path.join(WORKSPACE, "agent.py"))
    module = importlib.util.module_from_spec(spec)
    sys.modules["agent"] = module
    spec.loader.exec_module(module)
    return module


def main():
    with open(os.path.join(WORKSPACE, "input.json")) as handle:
        params = json.load(handle)
    input_dict = {
        "problem_statement": params["problem_statement"],
        "run_id": params["run_id"],
        "proxy_url": os.environ.get("AI_PROXY_URL", params.get("proxy_url", "")),
    }

    try:
        agent = load_agent()
    except BaseException as exc:
        print("Error importing agent: %s" % exc, file=sys.stderr)
        return failure("agent_load_error", "failed to load agent: %s" % exc, traceback.format_exc())

    entry = getattr(agent, "agent_main", None)
    if not callable(entry):
        return failure(
            "unsupported_agent",
            "unsupported agent: agent_main(input_dict, repo_dir) is not defined")

    repo_dir = WORKSPACE
    files_dir = os.path.join(WORKSPACE, "files")
    if HAS_FILES and os.path.isdir(files_dir):
        snapshot_files(files_dir)
        repo_dir = "."

    try:
        result = entry(input_dict, repo_dir=repo_dir)
    except BaseException as exc:
        trace = traceback.format_exc()
        print("Error running agent: %s" % exc, file=sys.stderr)
        print(trace, file=sys.stderr)
        return failure("agent_error", str(exc), trace)

    patch = None
    if isinstance(result, dict) and "patch" in result:
        patch = result["patch"]
    elif isinstance(result, str):
        patch = result
    if not patch and HAS_FILES:
        patch = diff_against_snapshot()

    return {"result": result, "patch": patch, "success": True}


if __name__ == "__main__":
    try:
        output = main()
    except BaseException as exc:
        output = failure("bootstrap_error", str(exc), traceback.format_exc())
    try:
        write_output(output)
    except BaseException as exc:
        print("Error writing output: %s" % exc, file=sys.stderr)
    print("Agent execution completed")
    sys.exit(0)
)PY";

}  // namespace

std::string BuildBootstrapScript(const BootstrapOptions& options) {
    std::string script;
    script.append(
        "import importlib.util\n"
        "import json\n"
        "import os\n"
        "import subprocess\n"
        "import sys\n"
        "import traceback\n"
        "\n");
    script.append("WORKSPACE = ").append(nlohmann::json(options.mount_point).dump()).append("\n");
    script.append("OUTPUT_PATH = os.path.join(WORKSPACE, \"output.json\")\n");
    script.append("HAS_FILES = ").append(options.has_files ? "True" : "False").append("\n");
    script.append(kScriptBody);
    return script;
}

nlohmann::json BuildInputDocument(const std::string& problem_statement,
                                  const std::string& run_id,
                                  const std::string& proxy_url) {
    return {
        {"problem_statement", problem_statement},
        {"run_id", run_id},
        {"proxy_url", proxy_url}
    };
}

const std::string& DefaultRequirements() {
    static const std::string kRequirements =
        "requests>=2.31.0\n"
        "pytest>=7.4.0\n"
        "numpy>=1.24.0\n"
        "pandas>=2.0.0\n"
        "scipy>=1.10.0\n"
        "matplotlib>=3.7.0\n"
        "scikit-learn>=1.3.0\n"
        "python-dotenv>=1.0.0\n"
        "aiohttp>=3.9.0\n"
        "beautifulsoup4>=4.12.0\n"
        "lxml>=4.9.0\n";
    return kRequirements;
}

}  // namespace agentrun::sandbox

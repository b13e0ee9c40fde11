#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>

#include "errors/errors.hpp"

namespace agentrun::sandbox {

// Relative path -> file contents of the caller-supplied file context.
using FileMap = std::map<std::string, std::string>;

// Rejects empty, absolute and parent-escaping paths.
agentrun::errors::Error ValidateRelativePath(const std::string& path);
agentrun::errors::Error ValidateFiles(const FileMap& files);

// Temporary per-run directory. Removed recursively on destruction.
class Workspace {
public:
    static constexpr const char* kAgentFile = "agent.py";
    static constexpr const char* kRunnerFile = "runner.py";
    static constexpr const char* kInputFile = "input.json";
    static constexpr const char* kRequirementsFile = "requirements.txt";
    static constexpr const char* kOutputFile = "output.json";
    static constexpr const char* kFilesDir = "files";

    static std::unique_ptr<Workspace> Create(const std::filesystem::path& root,
                                             const std::string& run_id,
                                             agentrun::errors::Error& error);
    ~Workspace();

    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    const std::filesystem::path& Path() const { return path_; }
    std::filesystem::path OutputPath() const { return path_ / kOutputFile; }
    std::filesystem::path FilesPath() const { return path_ / kFilesDir; }

    agentrun::errors::Error CopyAgent(const std::filesystem::path& artifact);
    agentrun::errors::Error WriteFiles(const FileMap& files);
    agentrun::errors::Error WriteText(const std::string& name, const std::string& content);

    // Idempotent; returns false if the directory could not be fully removed.
    bool Remove();

private:
    explicit Workspace(std::filesystem::path path);

    std::filesystem::path path_;
    bool removed_ = false;
};

}  // namespace agentrun::sandbox

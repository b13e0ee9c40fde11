#include "sandbox/workspace.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <vector>
#include <stdlib.h>

#include "utils/logging.hpp"

namespace agentrun::sandbox {
namespace {

using agentrun::errors::ErrorKind;
using agentrun::errors::MakeError;

agentrun::errors::Error WriteFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        return MakeError(ErrorKind::kExecution, "cannot write " + path.string());
    }
    output << content;
    if (!output.good()) {
        return MakeError(ErrorKind::kExecution, "short write to " + path.string());
    }
    return {};
}

}  // namespace

agentrun::errors::Error ValidateRelativePath(const std::string& path) {
    if (path.empty()) {
        return MakeError(ErrorKind::kValidation, "file path is empty");
    }
    const std::filesystem::path candidate(path);
    if (candidate.is_absolute() || path.front() == '/') {
        return MakeError(ErrorKind::kValidation, "file path must be relative: " + path);
    }
    for (const auto& part : candidate) {
        if (part == "..") {
            return MakeError(ErrorKind::kValidation, "file path escapes the workspace: " + path);
        }
    }
    const auto filename = candidate.lexically_normal().filename();
    if (path.back() == '/' || filename.empty() || filename == ".") {
        return MakeError(ErrorKind::kValidation, "file path names a directory: " + path);
    }
    return {};
}

agentrun::errors::Error ValidateFiles(const FileMap& files) {
    for (const auto& [path, content] : files) {
        auto error = ValidateRelativePath(path);
        if (error) {
            return error;
        }
    }
    return {};
}

std::unique_ptr<Workspace> Workspace::Create(const std::filesystem::path& root,
                                             const std::string& run_id,
                                             agentrun::errors::Error& error) {
    std::error_code ec;
    const auto base = root.empty() ? std::filesystem::temp_directory_path(ec) : root;
    if (ec) {
        error = MakeError(ErrorKind::kExecution, "no temporary directory: " + ec.message());
        return nullptr;
    }
    std::filesystem::create_directories(base, ec);
    if (ec) {
        error = MakeError(ErrorKind::kExecution, "cannot create " + base.string() + ": " + ec.message());
        return nullptr;
    }

    auto pattern = (base / ("agent_run_" + run_id + "_XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr) {
        error = MakeError(ErrorKind::kExecution, std::string("mkdtemp failed: ") + std::strerror(errno));
        return nullptr;
    }
    return std::unique_ptr<Workspace>(new Workspace(std::filesystem::path(buffer.data())));
}

Workspace::Workspace(std::filesystem::path path)
    : path_(std::move(path)) {}

Workspace::~Workspace() {
    Remove();
}

agentrun::errors::Error Workspace::CopyAgent(const std::filesystem::path& artifact) {
    std::error_code ec;
    std::filesystem::copy_file(
        artifact, path_ / kAgentFile, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return MakeError(ErrorKind::kExecution,
                         "cannot copy agent " + artifact.string() + ": " + ec.message());
    }
    return {};
}

agentrun::errors::Error Workspace::WriteFiles(const FileMap& files) {
    if (files.empty()) {
        return {};
    }
    const auto files_dir = FilesPath();
    std::error_code ec;
    std::filesystem::create_directories(files_dir, ec);
    if (ec) {
        return MakeError(ErrorKind::kExecution, "cannot create files directory: " + ec.message());
    }
    for (const auto& [relative, content] : files) {
        auto error = ValidateRelativePath(relative);
        if (error) {
            return error;
        }
        const auto target = files_dir / relative;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            return MakeError(ErrorKind::kExecution,
                             "cannot create " + target.parent_path().string() + ": " + ec.message());
        }
        error = WriteFile(target, content);
        if (error) {
            return error;
        }
    }
    agentrun::utils::LogDebug(
        "sandbox", "wrote " + std::to_string(files.size()) + " files into " + files_dir.string());
    return {};
}

agentrun::errors::Error Workspace::WriteText(const std::string& name, const std::string& content) {
    return WriteFile(path_ / name, content);
}

bool Workspace::Remove() {
    if (removed_) {
        return true;
    }
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        agentrun::utils::LogWarn(
            "sandbox", "failed to remove workspace " + path_.string() + ": " + ec.message());
        return false;
    }
    removed_ = true;
    return true;
}

}  // namespace agentrun::sandbox

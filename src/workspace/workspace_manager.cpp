#include "workspace/workspace_manager.hpp"

#include <fstream>
#include <iostream>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "sandbox/errors.hpp"

namespace socrates::workspace {
namespace {

std::string NewDirectoryName() {
    // random_generator is not thread-safe; one per call keeps requests independent.
    boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

bool EscapesRoot(const std::filesystem::path& relative) {
    if (relative.empty() || relative.is_absolute()) {
        return true;
    }
    for (const auto& part : relative.lexically_normal()) {
        if (part == "..") {
            return true;
        }
    }
    return false;
}

}  // namespace

WorkspaceManager::WorkspaceManager(std::filesystem::path root)
    : root_(std::move(root)) {}

Workspace WorkspaceManager::Create() const {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        throw sandbox::SandboxError("Failed to create temp directory " + root_.string() + ": " + ec.message());
    }
    Workspace workspace{root_ / NewDirectoryName()};
    if (!std::filesystem::create_directory(workspace.path, ec) || ec) {
        throw sandbox::SandboxError("Failed to create workspace " + workspace.path.string() +
                                    (ec ? ": " + ec.message() : ": already exists"));
    }
    return workspace;
}

std::filesystem::path WorkspaceManager::Write(const Workspace& workspace,
                                              const std::string& relative_path,
                                              const std::string& content) const {
    const std::filesystem::path relative(relative_path);
    if (EscapesRoot(relative)) {
        throw std::invalid_argument("Workspace path escapes the workspace: " + relative_path);
    }
    const auto target = workspace.path / relative;
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    std::ofstream file(target, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw sandbox::SandboxError("Failed to open " + target.string() + " for writing");
    }
    file << content;
    file.flush();
    if (!file) {
        throw sandbox::SandboxError("Failed to write " + target.string());
    }
    return target;
}

void WorkspaceManager::Destroy(const Workspace& workspace) const noexcept {
    if (workspace.path.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(workspace.path, ec);
    if (ec) {
        std::cerr << "[workspace] failed to cleanup path=" << workspace.path.string()
                  << " error=" << ec.message() << std::endl;
    }
}

void WorkspaceManager::ValidateSize(const std::string& content, std::size_t max_bytes) {
    if (content.size() > max_bytes) {
        throw sandbox::CodeTooLarge(content.size(), max_bytes);
    }
}

ScopedWorkspace::ScopedWorkspace(const WorkspaceManager& manager)
    : manager_(manager)
    , workspace_(manager.Create()) {}

ScopedWorkspace::~ScopedWorkspace() {
    manager_.Destroy(workspace_);
}

std::filesystem::path DefaultWorkspaceRoot() {
    std::error_code ec;
    auto temp = std::filesystem::temp_directory_path(ec);
    if (ec) {
        temp = "/tmp";
    }
    return temp / "socrates";
}

}  // namespace socrates::workspace

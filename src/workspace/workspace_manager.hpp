#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace socrates::workspace {

struct Workspace {
    std::filesystem::path path;
};

class WorkspaceManager {
public:
    explicit WorkspaceManager(std::filesystem::path root);

    // Allocates a fresh, uniquely named directory under the root.
    Workspace Create() const;
    std::filesystem::path Write(const Workspace& workspace,
                                const std::string& relative_path,
                                const std::string& content) const;
    // Best-effort recursive removal. Failures are logged, never thrown.
    void Destroy(const Workspace& workspace) const noexcept;

    static void ValidateSize(const std::string& content, std::size_t max_bytes);

    const std::filesystem::path& Root() const { return root_; }

private:
    std::filesystem::path root_;
};

// Owns one workspace and destroys it when leaving scope.
class ScopedWorkspace {
public:
    explicit ScopedWorkspace(const WorkspaceManager& manager);
    ~ScopedWorkspace();

    ScopedWorkspace(const ScopedWorkspace&) = delete;
    ScopedWorkspace& operator=(const ScopedWorkspace&) = delete;

    const Workspace& Get() const { return workspace_; }

private:
    const WorkspaceManager& manager_;
    Workspace workspace_;
};

std::filesystem::path DefaultWorkspaceRoot();

}  // namespace socrates::workspace

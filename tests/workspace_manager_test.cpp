#include "workspace/workspace_manager.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#include <gtest/gtest.h>

#include "sandbox/errors.hpp"

namespace {

using socrates::workspace::ScopedWorkspace;
using socrates::workspace::Workspace;
using socrates::workspace::WorkspaceManager;

class WorkspaceManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = std::filesystem::temp_directory_path() /
                ("socrates_ws_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(root_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    static std::string ReadFile(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        std::ostringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    std::filesystem::path root_;
};

TEST_F(WorkspaceManagerTest, CreateMakesDistinctDirectoriesUnderRoot) {
    WorkspaceManager manager(root_);
    const auto first = manager.Create();
    const auto second = manager.Create();

    EXPECT_TRUE(std::filesystem::is_directory(first.path));
    EXPECT_TRUE(std::filesystem::is_directory(second.path));
    EXPECT_NE(first.path, second.path);
    EXPECT_EQ(first.path.parent_path(), root_);
}

TEST_F(WorkspaceManagerTest, WriteStoresContentInsideWorkspace) {
    WorkspaceManager manager(root_);
    const auto workspace = manager.Create();

    const auto path = manager.Write(workspace, "main.cpp", "int main() { return 0; }\n");

    EXPECT_EQ(path, workspace.path / "main.cpp");
    EXPECT_EQ(ReadFile(path), "int main() { return 0; }\n");
}

TEST_F(WorkspaceManagerTest, WriteRejectsPathsOutsideWorkspace) {
    WorkspaceManager manager(root_);
    const auto workspace = manager.Create();

    EXPECT_THROW(manager.Write(workspace, "../escape.cpp", "x"), std::invalid_argument);
    EXPECT_THROW(manager.Write(workspace, "/etc/passwd", "x"), std::invalid_argument);
    EXPECT_THROW(manager.Write(workspace, "a/../../escape.cpp", "x"), std::invalid_argument);
    EXPECT_FALSE(std::filesystem::exists(root_ / "escape.cpp"));
}

TEST_F(WorkspaceManagerTest, DestroyRemovesEverythingAndToleratesMissingDirectory) {
    WorkspaceManager manager(root_);
    const auto workspace = manager.Create();
    manager.Write(workspace, "solution.hpp", "class Solution {};\n");

    manager.Destroy(workspace);
    EXPECT_FALSE(std::filesystem::exists(workspace.path));

    EXPECT_NO_THROW(manager.Destroy(workspace));
    EXPECT_NO_THROW(manager.Destroy(Workspace{}));
}

TEST_F(WorkspaceManagerTest, ScopedWorkspaceCleansUpOnException) {
    WorkspaceManager manager(root_);
    std::filesystem::path created;
    try {
        ScopedWorkspace workspace(manager);
        created = workspace.Get().path;
        ASSERT_TRUE(std::filesystem::exists(created));
        throw std::runtime_error("boom");
    } catch (const std::runtime_error&) {
    }
    EXPECT_FALSE(created.empty());
    EXPECT_FALSE(std::filesystem::exists(created));
}

TEST(ValidateSizeTest, AcceptsPayloadAtLimitAndRejectsOneByteOver) {
    const std::string at_limit(10240, 'x');
    EXPECT_NO_THROW(WorkspaceManager::ValidateSize(at_limit, 10240));

    const std::string over(10241, 'x');
    try {
        WorkspaceManager::ValidateSize(over, 10240);
        FAIL() << "expected CodeTooLarge";
    } catch (const socrates::sandbox::CodeTooLarge& ex) {
        EXPECT_EQ(ex.Actual(), 10241u);
        EXPECT_EQ(ex.Maximum(), 10240u);
        EXPECT_STREQ(ex.what(), "Code size (10241 bytes) exceeds maximum allowed size (10240 bytes)");
    }
}

TEST(ValidateSizeTest, CountsBytesNotCharacters) {
    const std::string accented = "\xC3\xA9\xC3\xA9";
    EXPECT_NO_THROW(WorkspaceManager::ValidateSize(accented, 4));
    EXPECT_THROW(WorkspaceManager::ValidateSize(accented, 3), socrates::sandbox::CodeTooLarge);
}

}  // namespace

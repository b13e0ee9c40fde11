#include "sandbox/workspace.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>

#include "unit/test_fakes.hpp"

using namespace agentrun::sandbox;
using agentrun::errors::ErrorKind;

namespace {

std::string Slurp(const std::filesystem::path& path) {
    std::ifstream input(path);
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

}  // namespace

class WorkspaceTest : public ::testing::Test {
protected:
    std::filesystem::path root_;

    void SetUp() override {
        root_ = agentrun::testing::MakeTempDir("agentrun_workspace_test");
    }

    void TearDown() override {
        std::filesystem::remove_all(root_);
    }
};

TEST(ValidateRelativePathTest, RejectsEscapes) {
    EXPECT_FALSE(ValidateRelativePath("src/main.py"));
    EXPECT_FALSE(ValidateRelativePath("a/./b.txt"));
    EXPECT_EQ(ValidateRelativePath("").kind, ErrorKind::kValidation);
    EXPECT_EQ(ValidateRelativePath("/etc/passwd").kind, ErrorKind::kValidation);
    EXPECT_EQ(ValidateRelativePath("../outside.txt").kind, ErrorKind::kValidation);
    EXPECT_EQ(ValidateRelativePath("a/../../b").kind, ErrorKind::kValidation);
    EXPECT_EQ(ValidateRelativePath("dir/").kind, ErrorKind::kValidation);
}

TEST(ValidateRelativePathTest, RejectsPathsNamingADirectory) {
    EXPECT_EQ(ValidateRelativePath(".").kind, ErrorKind::kValidation);
    EXPECT_EQ(ValidateRelativePath("a/.").kind, ErrorKind::kValidation);
    EXPECT_EQ(ValidateRelativePath("a/b/./.").kind, ErrorKind::kValidation);
    EXPECT_FALSE(ValidateRelativePath("a/./b.txt"));
    EXPECT_FALSE(ValidateRelativePath(".env"));
}

TEST(ValidateRelativePathTest, ValidateFilesStopsAtFirstBadPath) {
    FileMap files = {{"ok.txt", "x"}, {"../bad.txt", "y"}};
    EXPECT_EQ(ValidateFiles(files).kind, ErrorKind::kValidation);
}

TEST_F(WorkspaceTest, CreateUsesUniqueDirectoryPerRun) {
    agentrun::errors::Error error;
    auto first = Workspace::Create(root_, "r1", error);
    auto second = Workspace::Create(root_, "r1", error);
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_NE(first->Path(), second->Path());
    EXPECT_EQ(first->Path().parent_path(), root_);
    EXPECT_EQ(first->Path().filename().string().rfind("agent_run_r1_", 0), 0u);
}

TEST_F(WorkspaceTest, WritesNestedFilesUnderFilesDir) {
    agentrun::errors::Error error;
    auto workspace = Workspace::Create(root_, "r1", error);
    ASSERT_TRUE(workspace);

    ASSERT_FALSE(workspace->WriteFiles({{"src/pkg/mod.py", "print(1)\n"}, {"README.md", "hi"}}));
    EXPECT_EQ(Slurp(workspace->FilesPath() / "src/pkg/mod.py"), "print(1)\n");
    EXPECT_EQ(Slurp(workspace->FilesPath() / "README.md"), "hi");
}

TEST_F(WorkspaceTest, NoFilesDirWithoutFiles) {
    agentrun::errors::Error error;
    auto workspace = Workspace::Create(root_, "r1", error);
    ASSERT_FALSE(workspace->WriteFiles({}));
    EXPECT_FALSE(std::filesystem::exists(workspace->FilesPath()));
}

TEST_F(WorkspaceTest, CopyAgentAndMissingArtifact) {
    const auto artifact = root_ / "agent_src.py";
    agentrun::testing::WriteTextFile(artifact, "def agent_main(input_dict, repo_dir=None):\n    return ''\n");

    agentrun::errors::Error error;
    auto workspace = Workspace::Create(root_, "r1", error);
    ASSERT_FALSE(workspace->CopyAgent(artifact));
    EXPECT_EQ(Slurp(workspace->Path() / Workspace::kAgentFile), Slurp(artifact));

    EXPECT_TRUE(workspace->CopyAgent(root_ / "missing.py"));
}

TEST_F(WorkspaceTest, DestructorRemovesDirectory) {
    std::filesystem::path path;
    {
        agentrun::errors::Error error;
        auto workspace = Workspace::Create(root_, "r1", error);
        path = workspace->Path();
        workspace->WriteText("input.json", "{}");
        EXPECT_TRUE(std::filesystem::exists(path));
    }
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(WorkspaceTest, RemoveIsIdempotent) {
    agentrun::errors::Error error;
    auto workspace = Workspace::Create(root_, "r1", error);
    EXPECT_TRUE(workspace->Remove());
    EXPECT_TRUE(workspace->Remove());
}

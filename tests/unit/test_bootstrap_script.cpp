#include "sandbox/bootstrap_script.hpp"

#include <gtest/gtest.h>

using namespace agentrun::sandbox;

TEST(BootstrapScriptTest, ChecksEntryPointAndAlwaysExitsZero) {
    const auto script = BuildBootstrapScript(BootstrapOptions{});
    EXPECT_NE(script.find("WORKSPACE = \"/workspace\""), std::string::npos);
    EXPECT_NE(script.find("getattr(agent, \"agent_main\", None)"), std::string::npos);
    EXPECT_NE(script.find("\"unsupported_agent\""), std::string::npos);
    EXPECT_NE(script.find("sys.exit(0)"), std::string::npos);
    EXPECT_EQ(script.find("sys.exit(1)"), std::string::npos);
}

TEST(BootstrapScriptTest, FileContextFlag) {
    BootstrapOptions options{};
    EXPECT_NE(BuildBootstrapScript(options).find("HAS_FILES = False"), std::string::npos);
    options.has_files = true;
    const auto script = BuildBootstrapScript(options);
    EXPECT_NE(script.find("HAS_FILES = True"), std::string::npos);
    EXPECT_NE(script.find("\"git\", \"diff\", \"HEAD\""), std::string::npos);
}

TEST(BootstrapScriptTest, MountPointIsQuoted) {
    BootstrapOptions options{};
    options.mount_point = "/work \"space\"";
    const auto script = BuildBootstrapScript(options);
    EXPECT_NE(script.find("WORKSPACE = \"/work \\\"space\\\"\""), std::string::npos);
}

TEST(BootstrapScriptTest, InputDocumentFields) {
    const auto input = BuildInputDocument("fix it", "r1", "http://proxy:8001");
    EXPECT_EQ(input["problem_statement"], "fix it");
    EXPECT_EQ(input["run_id"], "r1");
    EXPECT_EQ(input["proxy_url"], "http://proxy:8001");
}

TEST(BootstrapScriptTest, RequirementsListPackages) {
    const auto& requirements = DefaultRequirements();
    EXPECT_NE(requirements.find("requests"), std::string::npos);
    EXPECT_EQ(requirements.back(), '\n');
}

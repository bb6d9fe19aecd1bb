#include <gtest/gtest.h>
#include <managers/prereq_checker.hpp>
#include "fake_process_runner.hpp"

TEST(VersionParsing, ExtractsFromToolOutput) {
    EXPECT_EQ(PrereqChecker::extract_version("go version go1.24.2 linux/amd64",
                                             R"(go(\d+\.\d+(?:\.\d+)?))"), "1.24.2");
    EXPECT_EQ(PrereqChecker::extract_version("kind v0.26.0 go1.23.4 linux/amd64",
                                             R"((\d+\.\d+\.\d+))"), "0.26.0");
    EXPECT_EQ(PrereqChecker::extract_version("Client Version: v1.31.1\nKustomize Version: v5.4.2",
                                             R"(v?(\d+\.\d+\.\d+))"), "1.31.1");
    EXPECT_EQ(PrereqChecker::extract_version("no digits here", R"((\d+\.\d+\.\d+))"), "");
}

TEST(VersionParsing, BadPatternYieldsEmpty) {
    EXPECT_EQ(PrereqChecker::extract_version("1.2.3", "(unclosed"), "");
}

TEST(VersionParsing, Comparison) {
    EXPECT_TRUE(PrereqChecker::version_at_least("1.31.1", "1.31.1"));
    EXPECT_TRUE(PrereqChecker::version_at_least("1.32.0", "1.31.1"));
    EXPECT_TRUE(PrereqChecker::version_at_least("2.0", "1.99.99"));
    EXPECT_TRUE(PrereqChecker::version_at_least("v3.16.2", "3.0.0"));
    EXPECT_FALSE(PrereqChecker::version_at_least("1.31.0", "1.31.1"));
    EXPECT_FALSE(PrereqChecker::version_at_least("0.9", "0.26.0"));
    EXPECT_TRUE(PrereqChecker::version_at_least("1.24", "1.24.0"));
}

class PrereqCheckerTest : public ::testing::Test {
protected:
    FakeProcessRunner runner;

    void all_installed() {
        runner.on({"go", "version"}, {0, "go version go1.24.2 linux/amd64\n"});
        runner.on({"kind", "--version"}, {0, "kind version 0.27.0\n"});
        runner.on({"kubectl", "version", "--client"}, {0, "Client Version: v1.32.2\n"});
        runner.on({"docker", "--version"}, {0, "Docker version 27.3.1, build ce12230\n"});
        runner.on({"git", "--version"}, {0, "git version 2.47.1\n"});
        runner.on({"helm", "version", "--short"}, {0, "v3.16.2+g13654a5\n"});
    }
};

TEST_F(PrereqCheckerTest, AllToolsPresent) {
    all_installed();
    PrereqChecker checker(runner);
    auto report = checker.check_all(CancelToken());

    EXPECT_TRUE(report.all_met);
    EXPECT_TRUE(report.errors.empty());
    EXPECT_EQ(report.tools.at("kubectl").version, "1.32.2");
    EXPECT_EQ(report.tools.at("helm").status, "ok");
    EXPECT_EQ(report.tools.count("podman"), 0u);
}

TEST_F(PrereqCheckerTest, MissingTool) {
    all_installed();
    runner.on({"helm", "version", "--short"}, {127, "", "helm: not found"});
    PrereqChecker checker(runner);
    auto report = checker.check_all(CancelToken());

    EXPECT_FALSE(report.all_met);
    const auto& helm = report.tools.at("helm");
    EXPECT_FALSE(helm.installed);
    EXPECT_EQ(helm.status, "missing");
    EXPECT_EQ(helm.version, "Not Found");
    ASSERT_EQ(report.errors.size(), 1u);
    EXPECT_EQ(report.errors[0], "helm is not installed");
}

TEST_F(PrereqCheckerTest, SpawnFailureCountsAsMissing) {
    all_installed();
    runner.on({"git", "--version"}, {0, "", "", ErrorKind::ToolUnavailable});
    PrereqChecker checker(runner);
    auto report = checker.check_all(CancelToken());
    EXPECT_EQ(report.tools.at("git").status, "missing");
}

TEST_F(PrereqCheckerTest, OutdatedTool) {
    all_installed();
    runner.on({"kind", "--version"}, {0, "kind version 0.20.0\n"});
    PrereqChecker checker(runner);
    auto report = checker.check_all(CancelToken());

    EXPECT_FALSE(report.all_met);
    EXPECT_EQ(report.tools.at("kind").status, "outdated");
    EXPECT_TRUE(report.tools.at("kind").installed);
    ASSERT_EQ(report.errors.size(), 1u);
    EXPECT_EQ(report.errors[0], "kind version 0.20.0 is below minimum requirement 0.26.0");
}

TEST_F(PrereqCheckerTest, UnparseableVersionIsUnknown) {
    all_installed();
    runner.on({"go", "version"}, {0, "go version devel +abcdef\n"});
    PrereqChecker checker(runner);
    auto report = checker.check_all(CancelToken());

    EXPECT_EQ(report.tools.at("go").status, "unknown");
    EXPECT_EQ(report.tools.at("go").version, "Unknown");
    EXPECT_FALSE(report.all_met);
}

TEST_F(PrereqCheckerTest, PodmanStandsInForDocker) {
    all_installed();
    runner.on({"docker", "--version"}, {127, ""});
    runner.on({"podman", "--version"}, {0, "podman version 5.4.0\n"});
    PrereqChecker checker(runner);
    auto report = checker.check_all(CancelToken());

    EXPECT_TRUE(report.all_met);
    EXPECT_TRUE(report.errors.empty());
    EXPECT_EQ(report.tools.at("docker").status, "missing");
    EXPECT_EQ(report.tools.at("podman").status, "ok");
}

TEST_F(PrereqCheckerTest, NeitherDockerNorPodman) {
    all_installed();
    runner.on({"docker", "--version"}, {127, ""});
    PrereqChecker checker(runner);
    auto report = checker.check_all(CancelToken());

    EXPECT_FALSE(report.all_met);
    EXPECT_EQ(report.tools.at("podman").status, "missing");
    ASSERT_EQ(report.errors.size(), 2u);
    EXPECT_EQ(report.errors[0], "docker is not installed");
    EXPECT_EQ(report.errors[1], "Neither Docker nor Podman is available");
}

TEST_F(PrereqCheckerTest, ReportJson) {
    all_installed();
    runner.on({"helm", "version", "--short"}, {127, ""});
    PrereqChecker checker(runner);
    auto j = to_json(checker.check_all(CancelToken()));

    EXPECT_EQ(j["all_met"], false);
    EXPECT_EQ(j["prerequisites"]["helm"]["status"], "missing");
    EXPECT_EQ(j["prerequisites"]["go"]["version"], "1.24.2");
    EXPECT_EQ(j["errors"][0], "helm is not installed");
}

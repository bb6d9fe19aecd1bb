#include <gtest/gtest.h>
#include <managers/cluster_manager.hpp>
#include <core/constants.hpp>
#include "fake_process_runner.hpp"
#include <filesystem>
#include <fstream>
#include <fmt/format.h>

namespace fs = std::filesystem;

static const std::vector<std::string> CREATE = {"kind", "create", "cluster"};
static const std::vector<std::string> DELETE = {"kind", "delete", "cluster"};
static const std::vector<std::string> LIST = {"kind", "get", "clusters"};
static const std::vector<std::string> PROBE = {"kubectl", "cluster-info"};

class ClusterManagerTest : public ::testing::Test {
protected:
    FakeProcessRunner runner;
    ClusterConfig config;
};

TEST_F(ClusterManagerTest, CreatePassesNameAndProvider) {
    runner.on(CREATE, {0, "Creating cluster \"konflux\" ...\n"});
    ClusterManager mgr(runner, config);

    auto r = mgr.create(CancelToken());
    ASSERT_TRUE(r.is_ok()) << r.error;

    auto calls = runner.calls();
    ASSERT_EQ(calls.size(), 1u);
    std::vector<std::string> expected = {"kind", "create", "cluster", "--name", "konflux"};
    EXPECT_EQ(calls[0].argv, expected);
    EXPECT_EQ(calls[0].env.at("KIND_EXPERIMENTAL_PROVIDER"), "podman");
    EXPECT_TRUE(calls[0].combine_output);
}

TEST_F(ClusterManagerTest, CreateUsesKindConfig) {
    config.kind_config = "/work/kind-config.yaml";
    runner.on(CREATE, {0, ""});
    ClusterManager mgr(runner, config);

    ASSERT_TRUE(mgr.create(CancelToken()).is_ok());
    auto argv = runner.calls()[0].argv;
    ASSERT_GE(argv.size(), 7u);
    EXPECT_EQ(argv[5], "--config");
    EXPECT_EQ(argv[6], "/work/kind-config.yaml");
}

TEST_F(ClusterManagerTest, CreateFailureCarriesFullOutput) {
    runner.on(CREATE, {1, "Creating cluster \"konflux\" ...\n",
                       "ERROR: failed to create cluster: node(s) already exist for a cluster "
                       "with the name \"konflux\"\n"});
    ClusterManager mgr(runner, config);

    auto r = mgr.create(CancelToken());
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::ClusterCreateFailed);
    EXPECT_NE(r.error.find("Creating cluster"), std::string::npos);
    EXPECT_NE(r.error.find("already exist"), std::string::npos);
}

TEST_F(ClusterManagerTest, CreateWithoutToolIsFailure) {
    FakeResponse unavailable;
    unavailable.error = ErrorKind::ToolUnavailable;
    unavailable.err = "kind: not found";
    runner.on(CREATE, unavailable);
    ClusterManager mgr(runner, config);

    auto r = mgr.create(CancelToken());
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::ClusterCreateFailed);
    EXPECT_NE(r.error.find("kind: not found"), std::string::npos);
}

TEST_F(ClusterManagerTest, CreateCanceledStaysCanceled) {
    FakeResponse slow;
    slow.delay_ms = 30000;
    runner.on(CREATE, slow);
    ClusterManager mgr(runner, config);

    CancelToken token;
    token.cancel();
    auto r = mgr.create(token);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Canceled);
}

TEST_F(ClusterManagerTest, DestroySuccess) {
    runner.on(DELETE, {0, "", "Deleting cluster \"konflux\" ...\n"});
    ClusterManager mgr(runner, config);

    ASSERT_TRUE(mgr.destroy(CancelToken()).is_ok());
    std::vector<std::string> expected = {"kind", "delete", "cluster", "--name", "konflux"};
    EXPECT_EQ(runner.calls()[0].argv, expected);
}

TEST_F(ClusterManagerTest, DestroyIsIdempotentForEveryNotFoundPhrasing) {
    for (const char* phrase : CLUSTER_NOT_FOUND_PHRASES) {
        FakeProcessRunner local;
        std::string msg = "ERROR: " + fmt::format(fmt::runtime(phrase), "konflux") + "\n";
        local.on(DELETE, {1, "", msg});
        ClusterManager mgr(local, config);

        auto r = mgr.destroy(CancelToken());
        EXPECT_TRUE(r.is_ok()) << "phrasing not treated as success: " << msg;
    }
}

TEST_F(ClusterManagerTest, DestroyUnrecognisedFailureFailsClosed) {
    runner.on(DELETE, {1, "", "ERROR: failed to delete nodes: permission denied\n"});
    ClusterManager mgr(runner, config);

    auto r = mgr.destroy(CancelToken());
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::ClusterDestroyFailed);
    EXPECT_NE(r.error.find("permission denied"), std::string::npos);
}

TEST_F(ClusterManagerTest, NotFoundForAnotherClusterIsAFailure) {
    runner.on(DELETE, {1, "", "ERROR: unknown cluster \"other\"\n"});
    ClusterManager mgr(runner, config);

    auto r = mgr.destroy(CancelToken());
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::ClusterDestroyFailed);
}

TEST(ClusterNotFound, RecognisedPhrasings) {
    EXPECT_TRUE(ClusterManager::is_not_found_message("No kind clusters found.", "konflux"));
    EXPECT_TRUE(ClusterManager::is_not_found_message(
        "ERROR: unknown cluster \"konflux\"", "konflux"));
    EXPECT_TRUE(ClusterManager::is_not_found_message(
        "ERROR: cluster \"konflux\" not found", "konflux"));
    EXPECT_FALSE(ClusterManager::is_not_found_message("not found", "konflux"));
    EXPECT_FALSE(ClusterManager::is_not_found_message("", "konflux"));
}

TEST_F(ClusterManagerTest, WaitUntilRunningReportsProgress) {
    runner.on(LIST, {0, "konflux\n"});
    runner.on_sequence(PROBE, {{1, "", "refused"}, {0, "running"}});
    ClusterManager mgr(runner, config);

    std::vector<std::string> progress;
    auto r = mgr.wait_until_running(CancelToken(), 10,
                                    [&](const std::string& m) { progress.push_back(m); });
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(progress.size(), 2u);
    EXPECT_NE(progress[0].find("Initializing"), std::string::npos);
    EXPECT_NE(progress[1].find("Running"), std::string::npos);
}

TEST_F(ClusterManagerTest, WaitUntilRunningTimesOut) {
    runner.on(LIST, {0, "konflux\n"});
    runner.on(PROBE, {1, "", "refused"});
    ClusterManager mgr(runner, config);

    auto r = mgr.wait_until_running(
        CancelToken::with_deadline_in(std::chrono::milliseconds(200)), 20);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::TimedOut);
}

// Real processes: a registered cluster whose probe never answers must not
// hold up a status read past the probe timeout.
class ClusterManagerProcessTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "mpcdev_cluster_manager_test";
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    std::string write_script(const std::string& name, const std::string& body) {
        auto path = test_dir / name;
        std::ofstream(path) << "#!/bin/sh\n" << body << "\n";
        fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::others_read);
        return path.string();
    }
};

TEST_F(ClusterManagerProcessTest, HungProbeIsBoundedByProbeTimeout) {
    ClusterConfig config;
    config.kind_binary = write_script("kind", "echo konflux");
    config.kubectl_binary = write_script("kubectl", "sleep 30");
    config.probe_timeout_secs = 1;

    SystemProcessRunner runner;
    ClusterManager mgr(runner, config);

    auto start = std::chrono::steady_clock::now();
    auto report = mgr.status(CancelToken());
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(report.status, ClusterStatus::Initializing);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST_F(ClusterManagerProcessTest, ProbeIgnoringSigtermIsBoundedByProbeTimeout) {
    ClusterConfig config;
    config.kind_binary = write_script("kind", "echo konflux");
    config.kubectl_binary = write_script("kubectl", "trap '' TERM\nwhile :; do :; done");
    config.probe_timeout_secs = 1;

    SystemProcessRunner runner;
    ClusterManager mgr(runner, config);

    auto start = std::chrono::steady_clock::now();
    auto report = mgr.status(CancelToken());
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(report.status, ClusterStatus::Initializing);
    EXPECT_LT(elapsed, std::chrono::milliseconds(1500));
}

TEST_F(ClusterManagerProcessTest, HungRegistryListingIsBoundedByProbeTimeout) {
    ClusterConfig config;
    config.kind_binary = write_script("kind", "trap '' TERM\nwhile :; do :; done");
    config.probe_timeout_secs = 1;

    SystemProcessRunner runner;
    ClusterManager mgr(runner, config);

    auto start = std::chrono::steady_clock::now();
    auto report = mgr.status(CancelToken());
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(report.status, ClusterStatus::Error);
    EXPECT_LT(elapsed, std::chrono::milliseconds(1500));
}

TEST_F(ClusterManagerProcessTest, DestroyMissingClusterWithRealProcess) {
    ClusterConfig config;
    config.kind_binary = write_script("kind",
        "echo 'ERROR: unknown cluster \"konflux\"' >&2\nexit 1");

    SystemProcessRunner runner;
    ClusterManager mgr(runner, config);
    EXPECT_TRUE(mgr.destroy(CancelToken()).is_ok());
}

TEST_F(ClusterManagerProcessTest, MissingKindIsError) {
    ClusterConfig config;
    config.kind_binary = (test_dir / "no-such-kind").string();

    SystemProcessRunner runner;
    ClusterManager mgr(runner, config);
    EXPECT_EQ(mgr.status(CancelToken()).status, ClusterStatus::Error);
}

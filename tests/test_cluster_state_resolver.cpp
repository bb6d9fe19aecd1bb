#include <gtest/gtest.h>
#include <managers/cluster_state_resolver.hpp>
#include "fake_process_runner.hpp"

static const std::vector<std::string> LIST = {"kind", "get", "clusters"};
static const std::vector<std::string> PROBE = {"kubectl", "cluster-info"};

class ClusterStateResolverTest : public ::testing::Test {
protected:
    FakeProcessRunner runner;
    ClusterConfig config;
};

TEST_F(ClusterStateResolverTest, EmptyRegistryIsNotRunning) {
    runner.on(LIST, {0, "", "No kind clusters found.\n"});
    ClusterStateResolver resolver(runner, config);

    auto r = resolver.resolve(CancelToken());
    EXPECT_EQ(r.status, ClusterStatus::NotRunning);
    EXPECT_EQ(runner.count(PROBE), 0);
}

TEST_F(ClusterStateResolverTest, OtherClustersOnlyIsNotRunning) {
    runner.on(LIST, {0, "dev\nkonflux-old\n"});
    ClusterStateResolver resolver(runner, config);

    EXPECT_EQ(resolver.resolve(CancelToken()).status, ClusterStatus::NotRunning);
    EXPECT_EQ(runner.count(PROBE), 0);
}

TEST_F(ClusterStateResolverTest, RegisteredButUnreachableIsInitializing) {
    runner.on(LIST, {0, "konflux\n"});
    runner.on(PROBE, {1, "", "The connection to the server 127.0.0.1:6443 was refused\n"});
    ClusterStateResolver resolver(runner, config);

    auto r = resolver.resolve(CancelToken());
    EXPECT_EQ(r.status, ClusterStatus::Initializing);
    EXPECT_NE(r.detail.find("refused"), std::string::npos);
}

TEST_F(ClusterStateResolverTest, RegisteredAndReachableIsRunning) {
    runner.on(LIST, {0, "dev\nkonflux\n"});
    runner.on(PROBE, {0, "Kubernetes control plane is running at https://127.0.0.1:6443\n"});
    ClusterStateResolver resolver(runner, config);

    EXPECT_EQ(resolver.resolve(CancelToken()).status, ClusterStatus::Running);
}

TEST_F(ClusterStateResolverTest, ListFailureIsError) {
    runner.on(LIST, {1, "", "failed to list clusters: podman not found\n"});
    ClusterStateResolver resolver(runner, config);

    auto r = resolver.resolve(CancelToken());
    EXPECT_EQ(r.status, ClusterStatus::Error);
    EXPECT_NE(r.detail.find("podman not found"), std::string::npos);
    EXPECT_EQ(runner.count(PROBE), 0);
}

TEST_F(ClusterStateResolverTest, MissingToolIsError) {
    // Nothing scripted: the fake reports exit 127 like a missing binary
    ClusterStateResolver resolver(runner, config);
    EXPECT_EQ(resolver.resolve(CancelToken()).status, ClusterStatus::Error);
}

TEST_F(ClusterStateResolverTest, SpawnFailureIsError) {
    FakeResponse unavailable;
    unavailable.error = ErrorKind::ToolUnavailable;
    runner.on(LIST, unavailable);
    ClusterStateResolver resolver(runner, config);
    EXPECT_EQ(resolver.resolve(CancelToken()).status, ClusterStatus::Error);
}

TEST_F(ClusterStateResolverTest, ErrorIsNotSticky) {
    runner.on_sequence(LIST, {{1, "", "boom"}, {0, "konflux\n"}});
    runner.on(PROBE, {0, "ok"});
    ClusterStateResolver resolver(runner, config);

    EXPECT_EQ(resolver.resolve(CancelToken()).status, ClusterStatus::Error);
    EXPECT_EQ(resolver.resolve(CancelToken()).status, ClusterStatus::Running);
}

TEST_F(ClusterStateResolverTest, HungProbeIsInitializing) {
    config.probe_timeout_secs = 1;
    runner.on(LIST, {0, "konflux\n"});
    FakeResponse hang;
    hang.delay_ms = 30000;
    runner.on(PROBE, hang);
    ClusterStateResolver resolver(runner, config);

    auto start = std::chrono::steady_clock::now();
    auto r = resolver.resolve(CancelToken());
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(r.status, ClusterStatus::Initializing);
    EXPECT_LT(elapsed, std::chrono::seconds(3));
}

TEST_F(ClusterStateResolverTest, HungListingIsBoundedError) {
    config.probe_timeout_secs = 1;
    FakeResponse hang;
    hang.delay_ms = 30000;
    runner.on(LIST, hang);
    ClusterStateResolver resolver(runner, config);

    auto start = std::chrono::steady_clock::now();
    auto r = resolver.resolve(CancelToken());
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(r.status, ClusterStatus::Error);
    EXPECT_LT(elapsed, std::chrono::seconds(3));
    EXPECT_EQ(runner.count(PROBE), 0);
}

TEST_F(ClusterStateResolverTest, ReadsAreKilledWithoutGrace) {
    ClusterStateResolver resolver(runner, config);
    EXPECT_EQ(resolver.list_request().term_grace_ms, 0);
    EXPECT_EQ(resolver.probe_request().term_grace_ms, 0);
}

TEST_F(ClusterStateResolverTest, CanceledProbeIsError) {
    runner.on(LIST, {0, "konflux\n"});
    FakeResponse canceled;
    canceled.error = ErrorKind::Canceled;
    runner.on(PROBE, canceled);
    ClusterStateResolver resolver(runner, config);

    EXPECT_EQ(resolver.resolve(CancelToken()).status, ClusterStatus::Error);
}

TEST_F(ClusterStateResolverTest, ProbeUsesClusterContextAndProvider) {
    config.name = "dev";
    config.kubeconfig_path = "/tmp/kubeconfig";
    ClusterStateResolver resolver(runner, config);

    auto list = resolver.list_request();
    EXPECT_EQ(list.env.at("KIND_EXPERIMENTAL_PROVIDER"), "podman");

    auto probe = resolver.probe_request();
    std::vector<std::string> expected = {"kubectl", "cluster-info", "--context", "kind-dev",
                                         "--kubeconfig", "/tmp/kubeconfig"};
    EXPECT_EQ(probe.argv, expected);
}

TEST(ClusterRegistry, MatchesWholeLinesOnly) {
    EXPECT_TRUE(ClusterStateResolver::registry_contains("konflux\n", "konflux"));
    EXPECT_TRUE(ClusterStateResolver::registry_contains("a\r\n  konflux  \nb\n", "konflux"));
    EXPECT_FALSE(ClusterStateResolver::registry_contains("konflux-2\nmy-konflux\n", "konflux"));
    EXPECT_FALSE(ClusterStateResolver::registry_contains("", "konflux"));
}

// Simulated bring-up: registry entry appears first, control plane later.
TEST_F(ClusterStateResolverTest, BringUpIsMonotonic) {
    runner.on_sequence(LIST, {{0, ""}, {0, "konflux\n"}});
    runner.on_sequence(PROBE, {{1, "", "refused"}, {1, "", "refused"}, {0, "running"}});
    ClusterStateResolver resolver(runner, config);

    std::vector<ClusterStatus> seen;
    for (int i = 0; i < 6; i++) seen.push_back(resolver.resolve(CancelToken()).status);

    auto rank = [](ClusterStatus s) {
        switch (s) {
            case ClusterStatus::NotRunning:   return 0;
            case ClusterStatus::Initializing: return 1;
            case ClusterStatus::Running:      return 2;
            case ClusterStatus::Error:        return -1;
        }
        return -1;
    };

    bool saw_initializing = false;
    for (size_t i = 0; i < seen.size(); i++) {
        ASSERT_NE(seen[i], ClusterStatus::Error);
        if (i > 0) EXPECT_GE(rank(seen[i]), rank(seen[i - 1]));
        if (seen[i] == ClusterStatus::Initializing) saw_initializing = true;
        if (seen[i] == ClusterStatus::Running) EXPECT_TRUE(saw_initializing);
    }
    EXPECT_EQ(seen.front(), ClusterStatus::NotRunning);
    EXPECT_EQ(seen.back(), ClusterStatus::Running);
}

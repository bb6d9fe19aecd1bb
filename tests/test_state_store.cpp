#include <gtest/gtest.h>
#include <managers/state_store.hpp>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

class StateStoreTest : public ::testing::Test {
protected:
    fs::path tmp_dir;

    void SetUp() override {
        tmp_dir = fs::temp_directory_path() / ("mpcdev_state_test_" + std::to_string(getpid()));
        fs::remove_all(tmp_dir);
    }

    void TearDown() override {
        fs::remove_all(tmp_dir);
    }

    void write_raw(const std::string& content) {
        fs::create_directories(tmp_dir);
        std::ofstream(tmp_dir / "environment.yaml") << content;
    }
};

TEST_F(StateStoreTest, MissingFileLoadsNothing) {
    StateStore store(tmp_dir);
    EXPECT_FALSE(store.load().has_value());
}

TEST_F(StateStoreTest, SaveCreatesDirectoryAndLoadsBack) {
    StateStore store(tmp_dir / "nested");

    SessionRecord rec;
    rec.session_id = "0f3c2a1e-0000-4000-8000-000000000001";
    rec.created_at = "2025-01-15T10:00:00Z";
    ClusterState c;
    c.name = "konflux";
    c.created_at = "2025-01-15T10:01:00Z";
    c.status = DeclaredClusterStatus::Stopped;
    c.kubeconfig_path = "/home/dev/.kube/config";
    rec.cluster = c;
    MpcDeployment d;
    d.controller_image = "localhost/multi-platform-controller:dev";
    d.source_git_hash = "0123abcd";
    rec.mpc_deployment = d;
    rec.features.metrics_enabled = true;

    ASSERT_TRUE(store.save(rec).is_ok());
    EXPECT_TRUE(fs::exists(store.path()));

    auto loaded = store.load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->session_id, rec.session_id);
    EXPECT_EQ(loaded->created_at, rec.created_at);
    ASSERT_TRUE(loaded->cluster.has_value());
    EXPECT_EQ(loaded->cluster->name, "konflux");
    EXPECT_EQ(loaded->cluster->status, DeclaredClusterStatus::Stopped);
    EXPECT_EQ(loaded->cluster->kubeconfig_path, "/home/dev/.kube/config");
    ASSERT_TRUE(loaded->mpc_deployment.has_value());
    EXPECT_EQ(loaded->mpc_deployment->source_git_hash, "0123abcd");
    EXPECT_TRUE(loaded->features.metrics_enabled);
    EXPECT_FALSE(loaded->features.aws_enabled);
}

TEST_F(StateStoreTest, SaveLeavesNoTempFile) {
    StateStore store(tmp_dir);
    SessionRecord rec;
    rec.session_id = "s1";
    ASSERT_TRUE(store.save(rec).is_ok());
    ASSERT_TRUE(store.save(rec).is_ok());

    int files = 0;
    for (const auto& entry : fs::directory_iterator(tmp_dir)) {
        (void)entry;
        files++;
    }
    EXPECT_EQ(files, 1);
}

TEST_F(StateStoreTest, AbsentClusterStaysAbsent) {
    StateStore store(tmp_dir);
    SessionRecord rec;
    rec.session_id = "s1";
    ASSERT_TRUE(store.save(rec).is_ok());

    auto loaded = store.load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_FALSE(loaded->cluster.has_value());
    EXPECT_FALSE(loaded->mpc_deployment.has_value());
}

TEST_F(StateStoreTest, CorruptFileIsIgnored) {
    write_raw("session_id: [unterminated\n  : :");
    StateStore store(tmp_dir);
    EXPECT_FALSE(store.load().has_value());
}

TEST_F(StateStoreTest, NonMapFileIsIgnored) {
    write_raw("- just\n- a\n- list\n");
    StateStore store(tmp_dir);
    EXPECT_FALSE(store.load().has_value());
}

TEST_F(StateStoreTest, MissingSessionIdIsIgnored) {
    write_raw("created_at: 2025-01-15T10:00:00Z\n");
    StateStore store(tmp_dir);
    EXPECT_FALSE(store.load().has_value());
}

TEST_F(StateStoreTest, UnknownClusterStatusReadsAsStopped) {
    write_raw("session_id: s1\ncluster:\n  name: konflux\n  status: hibernating\n");
    StateStore store(tmp_dir);
    auto loaded = store.load();
    ASSERT_TRUE(loaded.has_value());
    ASSERT_TRUE(loaded->cluster.has_value());
    EXPECT_EQ(loaded->cluster->status, DeclaredClusterStatus::Stopped);
}

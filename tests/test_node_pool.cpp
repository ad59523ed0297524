#include <gtest/gtest.h>
#include <managers/node_pool.hpp>
#include <platform/archive.hpp>
#include "fake_remote.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class NodePoolTest : public ::testing::Test {
protected:
    FakeTransport transport;
    std::unique_ptr<NodePool> pool;
    fs::path test_dir;
    fs::path archive;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "delta_node_pool_test";
        fs::create_directories(test_dir / "dist" / "bin");
        std::ofstream(test_dir / "dist" / "bin" / "visao") << "#!/bin/sh\necho visao\n";
        archive = test_dir / "visao.tar";
        platform::create_tar(archive, test_dir / "dist", {"bin/visao"});

        pool = std::make_unique<NodePool>(transport);
        pool->set_startup_pause(0);
    }

    void TearDown() override {
        pool.reset();
        fs::remove_all(test_dir);
    }

    void add_node(const std::string& name = "n1", const std::string& address = "host:22") {
        ASSERT_EQ(pool->add(name, address, {{"username", "op"},
                                            {"password", "secret"},
                                            {"distr", archive.string()}}),
                  AddResult::Ok);
    }
};

TEST_F(NodePoolTest, UnknownNodeIsNotFoundEverywhere) {
    EXPECT_EQ(pool->remove("ghost"), RemoveResult::NodeNotFound);
    EXPECT_EQ(pool->connect("ghost"), ConnectResult::NodeNotFound);
    EXPECT_EQ(pool->disconnect("ghost"), DisconnectResult::NodeNotFound);
    EXPECT_EQ(pool->deploy("ghost", DeploySubject::Visao), DeployResult::NodeNotFound);
    EXPECT_EQ(pool->run("ghost", DeploySubject::Visao), RunResult::NodeNotFound);

    EXPECT_FALSE(pool->is_connected("ghost").connected);
    EXPECT_FALSE(pool->is_alive("ghost").alive);
    EXPECT_TRUE(transport.hosts_.empty());
}

TEST_F(NodePoolTest, DuplicateAddKeepsOriginal) {
    add_node();
    EXPECT_EQ(pool->add("n1", "other:2222", {{"username", "intruder"}}),
              AddResult::NodeAlreadyExists);
    EXPECT_EQ(pool->get_param("n1", NodeParameter::Username), "op");

    ASSERT_EQ(pool->connect("n1"), ConnectResult::Ok);
    EXPECT_EQ(transport.host("host:22")->opened, 1);
    EXPECT_EQ(transport.host("other:2222")->opened, 0);
}

TEST_F(NodePoolTest, ParameterResolution) {
    pool->set_default_param("bind_port", "6000");
    pool->set_default_param("username", "fallback");
    ASSERT_EQ(pool->add("n1", "host", {{"bind_port", "6001"}}), AddResult::Ok);

    EXPECT_EQ(pool->get_param("n1", NodeParameter::BindPort), "6001");
    EXPECT_EQ(pool->get_param("n1", NodeParameter::Username), "fallback");
    EXPECT_EQ(pool->get_param("n1", NodeParameter::Distr), "");
    EXPECT_EQ(pool->get_param("n1", "custom"), "");
}

TEST_F(NodePoolTest, ConnectCapturesPlatform) {
    add_node();
    ASSERT_EQ(pool->connect("n1"), ConnectResult::Ok);

    auto status = pool->is_connected("n1");
    EXPECT_TRUE(status.connected);
    EXPECT_EQ(status.platform, "Linux node1 6.1.0 x86_64 GNU/Linux");
    EXPECT_EQ(transport.host("host:22")->last_user, "op");
    EXPECT_EQ(transport.host("host:22")->last_password, "secret");
}

TEST_F(NodePoolTest, RejectedCredentialsLeaveNodeDisconnected) {
    add_node();
    auto host = transport.host("host:22");
    host->accept_auth = false;

    EXPECT_EQ(pool->connect("n1"), ConnectResult::NotAuthenticated);
    EXPECT_FALSE(pool->is_connected("n1").connected);
    EXPECT_EQ(host->closed, 1);
    EXPECT_EQ(host->destroyed, 1);
}

TEST_F(NodePoolTest, UnreachableHostIsNotAuthenticated) {
    add_node();
    transport.host("host:22")->reachable = false;

    EXPECT_EQ(pool->connect("n1"), ConnectResult::NotAuthenticated);
    EXPECT_FALSE(pool->is_connected("n1").connected);
}

TEST_F(NodePoolTest, ReconnectReplacesSession) {
    add_node();
    auto host = transport.host("host:22");
    ASSERT_EQ(pool->connect("n1"), ConnectResult::Ok);
    ASSERT_EQ(pool->deploy("n1", DeploySubject::Visao), DeployResult::Ok);

    host->platform = "Linux node1 6.2.0 aarch64 GNU/Linux\n";
    ASSERT_EQ(pool->connect("n1"), ConnectResult::Ok);

    // First session is torn down before the second is opened
    EXPECT_EQ(host->opened, 2);
    EXPECT_EQ(host->closed, 1);
    EXPECT_EQ(host->destroyed, 1);

    auto status = pool->is_connected("n1");
    EXPECT_EQ(status.platform, "Linux node1 6.2.0 aarch64 GNU/Linux");
    EXPECT_FALSE(status.get_subject(DeploySubject::Visao).deployed);
}

TEST_F(NodePoolTest, FailedReconnectDropsOldSession) {
    add_node();
    auto host = transport.host("host:22");
    ASSERT_EQ(pool->connect("n1"), ConnectResult::Ok);

    host->accept_auth = false;
    EXPECT_EQ(pool->connect("n1"), ConnectResult::NotAuthenticated);
    EXPECT_FALSE(pool->is_connected("n1").connected);
    EXPECT_EQ(host->destroyed, 2);
}

TEST_F(NodePoolTest, RemoveThenConnectIsNotFound) {
    add_node();
    auto host = transport.host("host:22");
    ASSERT_EQ(pool->connect("n1"), ConnectResult::Ok);

    EXPECT_EQ(pool->remove("n1"), RemoveResult::Ok);
    EXPECT_EQ(host->closed, 1);
    EXPECT_EQ(host->destroyed, 1);

    EXPECT_EQ(pool->connect("n1"), ConnectResult::NodeNotFound);
    EXPECT_EQ(host->opened, 1);
    EXPECT_FALSE(pool->is_connected("n1").connected);
}

TEST_F(NodePoolTest, RemoveDuringConnectLeavesNoOrphan) {
    add_node();
    auto host = transport.host("host:22");
    host->on_authenticate = [this] { pool->remove("n1"); };

    EXPECT_EQ(pool->connect("n1"), ConnectResult::NodeNotFound);
    EXPECT_FALSE(pool->is_connected("n1").connected);
    EXPECT_EQ(host->destroyed, 1);
    EXPECT_TRUE(pool->node_names().empty());
}

TEST_F(NodePoolTest, DisconnectIsIdempotent) {
    add_node();
    auto host = transport.host("host:22");
    ASSERT_EQ(pool->connect("n1"), ConnectResult::Ok);

    EXPECT_EQ(pool->disconnect("n1"), DisconnectResult::Ok);
    EXPECT_EQ(pool->disconnect("n1"), DisconnectResult::Ok);
    EXPECT_EQ(host->closed, 1);
    EXPECT_FALSE(pool->is_connected("n1").connected);

    // Node stays registered
    EXPECT_EQ(pool->node_names(), std::vector<std::string>{"n1"});
}

TEST_F(NodePoolTest, DroppedSessionCountsAsNotConnected) {
    add_node();
    auto host = transport.host("host:22");
    ASSERT_EQ(pool->connect("n1"), ConnectResult::Ok);
    ASSERT_EQ(pool->run("n1", DeploySubject::Visao), RunResult::Ok);

    host->link_up = false;
    size_t commands = host->commands.size();
    size_t scripts = host->scripts.size();

    EXPECT_EQ(pool->deploy("n1", DeploySubject::Visao), DeployResult::NodeNotConnected);
    EXPECT_EQ(pool->run("n1", DeploySubject::Visao), RunResult::NodeNotConnected);
    EXPECT_FALSE(pool->is_alive("n1").alive);
    EXPECT_TRUE(host->uploads.empty());
    EXPECT_EQ(host->commands.size(), commands);
    EXPECT_EQ(host->scripts.size(), scripts);

    // Reconnecting restores a working session
    host->link_up = true;
    ASSERT_EQ(pool->connect("n1"), ConnectResult::Ok);
    EXPECT_EQ(pool->deploy("n1", DeploySubject::Visao), DeployResult::Ok);
}

TEST_F(NodePoolTest, DeployRejectsSelfSubject) {
    EXPECT_EQ(pool->deploy("ghost", DeploySubject::Delta), DeployResult::InvalidArgument);

    add_node();
    EXPECT_EQ(pool->deploy("n1", DeploySubject::Delta), DeployResult::InvalidArgument);
    ASSERT_EQ(pool->connect("n1"), ConnectResult::Ok);
    EXPECT_EQ(pool->deploy("n1", DeploySubject::Delta), DeployResult::InvalidArgument);
    EXPECT_TRUE(transport.host("host:22")->uploads.empty());
}

TEST_F(NodePoolTest, DeployAndRunRequireConnection) {
    add_node();
    EXPECT_EQ(pool->deploy("n1", DeploySubject::Visao), DeployResult::NodeNotConnected);
    EXPECT_EQ(pool->run("n1", DeploySubject::Visao), RunResult::NodeNotConnected);
}

TEST_F(NodePoolTest, DeployCopyFailureLeavesAllFlagsFalse) {
    add_node();
    ASSERT_EQ(pool->connect("n1"), ConnectResult::Ok);
    transport.host("host:22")->upload_ok = false;

    EXPECT_EQ(pool->deploy("n1", DeploySubject::Visao), DeployResult::DeployCopyFailed);
    auto s = pool->is_connected("n1").get_subject(DeploySubject::Visao);
    EXPECT_FALSE(s.deploy_archive_copied);
    EXPECT_FALSE(s.deploy_archive_extracted);
    EXPECT_FALSE(s.deploy_archive_tested);
    EXPECT_FALSE(s.deployed);
}

TEST_F(NodePoolTest, DeployExtractionFailureStopsAfterCopy) {
    add_node();
    ASSERT_EQ(pool->connect("n1"), ConnectResult::Ok);
    transport.host("host:22")->extract_ok = false;

    EXPECT_EQ(pool->deploy("n1", DeploySubject::Visao), DeployResult::DeployExtractionFailed);
    auto s = pool->is_connected("n1").get_subject(DeploySubject::Visao);
    EXPECT_TRUE(s.deploy_archive_copied);
    EXPECT_FALSE(s.deploy_archive_extracted);
    EXPECT_FALSE(s.deployed);
}

TEST_F(NodePoolTest, RedeployResetsStageFlags) {
    add_node();
    ASSERT_EQ(pool->connect("n1"), ConnectResult::Ok);
    ASSERT_EQ(pool->deploy("n1", DeploySubject::Visao), DeployResult::Ok);

    transport.host("host:22")->version_ok = false;
    EXPECT_EQ(pool->deploy("n1", DeploySubject::Visao), DeployResult::DeployTestFailed);
    auto s = pool->is_connected("n1").get_subject(DeploySubject::Visao);
    EXPECT_TRUE(s.deploy_archive_copied);
    EXPECT_TRUE(s.deploy_archive_extracted);
    EXPECT_FALSE(s.deploy_archive_tested);
    EXPECT_FALSE(s.deployed);
}

TEST_F(NodePoolTest, RunSanitizesBindEndpoint) {
    add_node();
    pool->set_default_param("bind_port", "notaport");
    pool->set_default_param("bind_addr", "0.0.0.0'; rm -rf /; echo '");
    ASSERT_EQ(pool->connect("n1"), ConnectResult::Ok);

    EXPECT_EQ(pool->run("n1", DeploySubject::Visao), RunResult::Ok);

    auto host = transport.host("host:22");
    ASSERT_EQ(host->scripts.size(), 1u);
    for (const auto& line : host->scripts[0]) {
        EXPECT_EQ(line.find("notaport"), std::string::npos) << line;
        EXPECT_EQ(line.find("rm -rf"), std::string::npos) << line;
    }
    EXPECT_NE(host->scripts[0][0].find("tcp://127.0.0.1:5700"), std::string::npos);
}

TEST_F(NodePoolTest, RunFailureClearsRunning) {
    add_node();
    ASSERT_EQ(pool->connect("n1"), ConnectResult::Ok);
    ASSERT_EQ(pool->run("n1", DeploySubject::Visao), RunResult::Ok);
    EXPECT_TRUE(pool->is_connected("n1").get_subject(DeploySubject::Visao).running);

    transport.host("host:22")->launch_ok = false;
    EXPECT_EQ(pool->run("n1", DeploySubject::Visao), RunResult::RunFailed);
    EXPECT_FALSE(pool->is_connected("n1").get_subject(DeploySubject::Visao).running);
}

TEST_F(NodePoolTest, RunStopsPreviousInstance) {
    add_node();
    auto host = transport.host("host:22");
    ASSERT_EQ(pool->connect("n1"), ConnectResult::Ok);
    ASSERT_EQ(pool->run("n1", DeploySubject::Visao), RunResult::Ok);
    ASSERT_EQ(pool->run("n1", DeploySubject::Visao), RunResult::Ok);

    ASSERT_EQ(host->killed.size(), 1u);
    EXPECT_EQ(host->killed[0], 4242u);
    EXPECT_EQ(pool->is_alive("n1").alive, true);
}

TEST_F(NodePoolTest, AliveOnDisconnectedNode) {
    add_node();
    auto status = pool->is_alive("n1");
    EXPECT_FALSE(status.alive);
    EXPECT_EQ(status.bind_addr, "");
    EXPECT_EQ(status.bind_port, 0);
}

TEST_F(NodePoolTest, AliveForSelfSubjectIsDefault) {
    add_node();
    ASSERT_EQ(pool->connect("n1"), ConnectResult::Ok);
    EXPECT_FALSE(pool->is_alive("n1", DeploySubject::Delta).alive);
    EXPECT_EQ(pool->run("n1", DeploySubject::Delta), RunResult::RunFailed);
}

TEST_F(NodePoolTest, EndToEnd) {
    add_node();
    pool->set_default_param("bind_addr", "10.0.0.5");
    pool->set_default_param("bind_port", "5710");

    ASSERT_EQ(pool->connect("n1"), ConnectResult::Ok);

    ASSERT_EQ(pool->deploy("n1", DeploySubject::Visao), DeployResult::Ok);
    auto s = pool->is_connected("n1").get_subject(DeploySubject::Visao);
    EXPECT_TRUE(s.deploy_archive_copied);
    EXPECT_TRUE(s.deploy_archive_extracted);
    EXPECT_TRUE(s.deploy_archive_tested);
    EXPECT_TRUE(s.deployed);
    EXPECT_FALSE(s.running);

    auto host = transport.host("host:22");
    ASSERT_EQ(host->uploads.size(), 1u);
    EXPECT_EQ(host->uploads[0].first, archive.string());
    EXPECT_EQ(host->uploads[0].second, "/tmp/visao-archive.tar.xz");

    ASSERT_EQ(pool->run("n1", DeploySubject::Visao), RunResult::Ok);
    EXPECT_TRUE(pool->is_connected("n1").get_subject(DeploySubject::Visao).running);

    auto alive = pool->is_alive("n1");
    EXPECT_TRUE(alive.alive);
    EXPECT_EQ(alive.bind_addr, "10.0.0.5");
    EXPECT_EQ(alive.bind_port, 5710);

    auto all = pool->is_alive_all("n1");
    ASSERT_EQ(all.subjects.count(DeploySubject::Visao), 1u);
    EXPECT_TRUE(all.subjects[DeploySubject::Visao].alive);
    EXPECT_EQ(all.subjects.count(DeploySubject::Delta), 0u);
}

TEST_F(NodePoolTest, ApplyConfigSeedsPool) {
    auto config = Config::parse(R"(
defaults:
  username: op
startup_pause: 7
nodes:
  a: "host-a:22"
  b:
    address: host-b
    params:
      username: other
)");
    ASSERT_TRUE(config.is_ok()) << config.error;

    add_node("a", "elsewhere");
    auto dups = pool->apply(config.value);
    EXPECT_EQ(dups, std::vector<std::string>{"a"});
    EXPECT_EQ(pool->startup_pause(), 7);
    EXPECT_EQ(pool->get_param("b", NodeParameter::Username), "other");
    EXPECT_EQ(pool->node_names(), (std::vector<std::string>{"a", "b"}));
}

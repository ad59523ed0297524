#include <gtest/gtest.h>
#include <managers/run_controller.hpp>
#include <managers/liveness_prober.hpp>
#include "fake_remote.hpp"

TEST(BindEndpointTest, PassesValidValues) {
    auto ep = sanitize_bind_endpoint("0.0.0.0", "6000");
    EXPECT_EQ(ep.addr, "0.0.0.0");
    EXPECT_EQ(ep.port, "6000");
}

TEST(BindEndpointTest, PortIsNormalized) {
    EXPECT_EQ(sanitize_bind_endpoint("h", "+5701").port, "5701");
    EXPECT_EQ(sanitize_bind_endpoint("h", "05701").port, "5701");
}

TEST(BindEndpointTest, EmptyValuesTakeDefaults) {
    auto ep = sanitize_bind_endpoint("", "");
    EXPECT_EQ(ep.addr, "127.0.0.1");
    EXPECT_EQ(ep.port, "5700");
}

TEST(BindEndpointTest, BadPortFallsBack) {
    EXPECT_EQ(sanitize_bind_endpoint("h", "notaport").port, "5700");
    EXPECT_EQ(sanitize_bind_endpoint("h", "65536").port, "5700");
    EXPECT_EQ(sanitize_bind_endpoint("h", "-1").port, "5700");
    EXPECT_EQ(sanitize_bind_endpoint("h", "80; reboot").port, "5700");
}

TEST(BindEndpointTest, QuotedAddressFallsBack) {
    EXPECT_EQ(sanitize_bind_endpoint("a'b", "1").addr, "127.0.0.1");
    EXPECT_EQ(sanitize_bind_endpoint("a\"b", "1").addr, "127.0.0.1");
}

class RunControllerTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeHost> host = std::make_shared<FakeHost>();
    FakeSession session{host};
    SubjectLayout layout = *subject_layout(DeploySubject::Visao);

    void SetUp() override {
        ASSERT_FALSE(session.authenticate("op", "pw").failed());
    }
};

TEST_F(RunControllerTest, StopPreviousWithoutPidFile) {
    RunController controller(session, layout, "n1", 0);
    controller.stop_previous();

    ASSERT_EQ(host->commands.size(), 1u);
    EXPECT_EQ(host->commands[0], "cat '/tmp/visao/pid' 2> /dev/null");
    EXPECT_TRUE(host->killed.empty());
}

TEST_F(RunControllerTest, StopPreviousIgnoresGarbagePid) {
    host->files["/tmp/visao/pid"] = "12; rm -rf /\n";
    RunController controller(session, layout, "n1", 0);
    controller.stop_previous();
    EXPECT_TRUE(host->killed.empty());
}

TEST_F(RunControllerTest, StopPreviousTerminatesRecordedPid) {
    host->files["/tmp/visao/pid"] = "777\n";
    host->live_pids.insert(777);
    RunController controller(session, layout, "n1", 0);
    controller.stop_previous();
    EXPECT_EQ(host->killed, std::vector<uint64_t>{777});
}

TEST_F(RunControllerTest, StartWritesSentinels) {
    RunController controller(session, layout, "n1", 3);
    SubjectStatus status;

    EXPECT_EQ(controller.start({"10.1.1.1", "5701"}, status), RunResult::Ok);
    EXPECT_TRUE(status.running);

    ASSERT_EQ(host->scripts.size(), 1u);
    const auto& script = host->scripts[0];
    ASSERT_EQ(script.size(), 6u);
    EXPECT_EQ(script[0], "'/tmp/visao/bin/visao' --server 'tcp://10.1.1.1:5701' "
                         "< /dev/null > /dev/null 2> /dev/null &");
    EXPECT_EQ(script[4], "sleep 3");
    // The marker never appears verbatim in the command text
    for (const auto& line : script) {
        EXPECT_EQ(line.find(DELTA_ALIVE_MARKER), std::string::npos);
    }
    EXPECT_EQ(host->files["/tmp/visao/bind_port"], "5701\n");
}

TEST_F(RunControllerTest, StartWithoutMarkerFails) {
    host->launch_ok = false;
    RunController controller(session, layout, "n1", 0);
    SubjectStatus status;
    status.running = true;

    EXPECT_EQ(controller.start({"127.0.0.1", "5700"}, status), RunResult::RunFailed);
    EXPECT_FALSE(status.running);
}

class LivenessProberTest : public RunControllerTest {};

TEST_F(LivenessProberTest, NoPidMeansNotAlive) {
    LivenessProber prober(session, layout, "n1");
    auto status = prober.probe();
    EXPECT_FALSE(status.alive);
    EXPECT_EQ(host->commands.size(), 1u);
}

TEST_F(LivenessProberTest, DeadPidMeansNotAlive) {
    host->files["/tmp/visao/pid"] = "999\n";
    host->files["/tmp/visao/bind_port"] = "5700\n";
    LivenessProber prober(session, layout, "n1");
    EXPECT_FALSE(prober.probe().alive);
}

TEST_F(LivenessProberTest, MalformedPortMeansNotAlive) {
    host->files["/tmp/visao/pid"] = "999\n";
    host->files["/tmp/visao/bind_addr"] = "127.0.0.1\n";
    host->files["/tmp/visao/bind_port"] = "http\n";
    host->live_pids.insert(999);
    LivenessProber prober(session, layout, "n1");

    auto status = prober.probe();
    EXPECT_FALSE(status.alive);
    EXPECT_EQ(status.bind_addr, "");
    EXPECT_EQ(status.bind_port, 0);
}

TEST_F(LivenessProberTest, LiveProcessReportsEndpoint) {
    host->files["/tmp/visao/pid"] = "999\n";
    host->files["/tmp/visao/bind_addr"] = "0.0.0.0\n";
    host->files["/tmp/visao/bind_port"] = "5702\n";
    host->live_pids.insert(999);
    LivenessProber prober(session, layout, "n1");

    auto status = prober.probe();
    EXPECT_TRUE(status.alive);
    EXPECT_EQ(status.bind_addr, "0.0.0.0");
    EXPECT_EQ(status.bind_port, 5702);
    EXPECT_TRUE(host->killed.empty());
}

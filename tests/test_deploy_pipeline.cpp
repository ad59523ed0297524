#include <gtest/gtest.h>
#include <managers/deploy_pipeline.hpp>
#include <platform/archive.hpp>
#include "fake_remote.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class DeployPipelineTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeHost> host = std::make_shared<FakeHost>();
    FakeSession session{host};
    SubjectLayout layout = *subject_layout(DeploySubject::Visao);
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "delta_deploy_test";
        fs::create_directories(test_dir / "dist" / "bin");
        fs::create_directories(test_dir / "dist" / "lib");
        std::ofstream(test_dir / "dist" / "bin" / "visao") << "binary";
        std::ofstream(test_dir / "dist" / "lib" / "libvisao.so") << "library";
        ASSERT_FALSE(session.authenticate("op", "pw").failed());
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    std::string make_archive(const std::vector<std::string>& files) {
        auto path = test_dir / "visao.tar";
        platform::create_tar(path, test_dir / "dist", files);
        return path.string();
    }
};

TEST_F(DeployPipelineTest, FullSuccess) {
    auto archive = make_archive({"bin/visao", "lib/libvisao.so"});
    SubjectStatus status;
    DeployPipeline pipeline(session, layout, "n1");

    EXPECT_EQ(pipeline.execute(archive, status), DeployResult::Ok);
    EXPECT_TRUE(status.deploy_archive_copied);
    EXPECT_TRUE(status.deploy_archive_extracted);
    EXPECT_TRUE(status.deploy_archive_tested);
    EXPECT_TRUE(status.deployed);

    ASSERT_EQ(host->commands.size(), 2u);
    EXPECT_EQ(host->commands[0], extract_command(layout));
    EXPECT_EQ(host->commands[1], "'/tmp/visao/bin/visao' --version");
}

TEST_F(DeployPipelineTest, MissingArchiveParameter) {
    SubjectStatus status;
    status.deployed = true;
    status.running = true;
    DeployPipeline pipeline(session, layout, "n1");

    EXPECT_EQ(pipeline.execute("", status), DeployResult::DeployCopyFailed);
    EXPECT_FALSE(status.deployed);
    EXPECT_FALSE(status.deploy_archive_copied);
    EXPECT_TRUE(host->uploads.empty());
    // Deploy never touches the running flag
    EXPECT_TRUE(status.running);
}

TEST_F(DeployPipelineTest, UnreadableArchiveIsNotUploaded) {
    auto bogus = test_dir / "bogus.tar.xz";
    std::ofstream(bogus) << "definitely not an archive";
    SubjectStatus status;
    DeployPipeline pipeline(session, layout, "n1");

    EXPECT_EQ(pipeline.execute(bogus.string(), status), DeployResult::DeployCopyFailed);
    EXPECT_TRUE(host->uploads.empty());
}

TEST_F(DeployPipelineTest, NestedArchiveFailsAtTestStage) {
    // tar cJf visao.tar.xz visao/ puts the binary at visao/bin/visao
    fs::create_directories(test_dir / "dist" / "visao" / "bin");
    std::ofstream(test_dir / "dist" / "visao" / "bin" / "visao") << "binary";
    auto archive = make_archive({"visao/bin/visao"});
    host->version_ok = false;  // nothing at /tmp/visao/bin/visao after extraction
    SubjectStatus status;
    DeployPipeline pipeline(session, layout, "n1");

    EXPECT_EQ(pipeline.execute(archive, status), DeployResult::DeployTestFailed);
    ASSERT_EQ(host->uploads.size(), 1u);
    EXPECT_EQ(host->uploads[0].second, "/tmp/visao-archive.tar.xz");
    EXPECT_TRUE(status.deploy_archive_copied);
    EXPECT_TRUE(status.deploy_archive_extracted);
    EXPECT_FALSE(status.deploy_archive_tested);
    EXPECT_FALSE(status.deployed);
}

TEST_F(DeployPipelineTest, UploadFailure) {
    auto archive = make_archive({"bin/visao"});
    host->upload_ok = false;
    SubjectStatus status;
    DeployPipeline pipeline(session, layout, "n1");

    EXPECT_EQ(pipeline.execute(archive, status), DeployResult::DeployCopyFailed);
    EXPECT_FALSE(status.deploy_archive_copied);
    EXPECT_TRUE(host->commands.empty());
}

TEST_F(DeployPipelineTest, TestFailureKeepsEarlierStages) {
    auto archive = make_archive({"bin/visao"});
    host->version_ok = false;
    SubjectStatus status;
    DeployPipeline pipeline(session, layout, "n1");

    EXPECT_EQ(pipeline.execute(archive, status), DeployResult::DeployTestFailed);
    EXPECT_TRUE(status.deploy_archive_copied);
    EXPECT_TRUE(status.deploy_archive_extracted);
    EXPECT_FALSE(status.deploy_archive_tested);
    EXPECT_FALSE(status.deployed);
}

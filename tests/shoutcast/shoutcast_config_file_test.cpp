// StreamProv - Dedicated stream provisioning service
// Tests for the managed streaming-server configuration file

#include <gtest/gtest.h>
#include "streamprov/shoutcast/shoutcast_config_file.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace streamprov {
namespace shoutcast {
namespace test {

namespace fs = std::filesystem;

class ShoutcastConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        dir_ = fs::path(::testing::TempDir()) / ("streamprov_sc_" + std::to_string(stamp));
        fs::create_directories(dir_);
        path_ = (dir_ / "streams.conf").string();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    static StreamServerConfig makeConfig(StreamRef sid) {
        StreamServerConfig config;
        config.sid = sid;
        config.sourcePassword = "src" + std::to_string(sid);
        config.adminPassword = "adm" + std::to_string(sid);
        config.maxListeners = 50;
        config.bitrateKbps = 128;
        config.publicServer = false;
        return config;
    }

    std::string readBack() const {
        std::ifstream in(path_);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    fs::path dir_;
    std::string path_;
};

TEST_F(ShoutcastConfigFileTest, MissingFileLoadsEmpty) {
    ShoutcastConfigFile file(path_);
    ASSERT_TRUE(file.load().isSuccess());
    EXPECT_EQ(file.render(), "");
    EXPECT_FALSE(file.hasStream(8100));
}

TEST_F(ShoutcastConfigFileTest, UpsertWritesStreamKeys) {
    ShoutcastConfigFile file(path_);
    ASSERT_TRUE(file.load().isSuccess());
    file.upsertStream(makeConfig(8100));

    EXPECT_TRUE(file.hasStream(8100));
    EXPECT_EQ(file.streamValue("streampassword", 8100), "src8100");
    EXPECT_EQ(file.streamValue("streamadminpassword", 8100), "adm8100");
    EXPECT_EQ(file.streamValue("streammaxuser", 8100), "50");
    EXPECT_EQ(file.streamValue("streammaxbitrate", 8100), "128000");
    EXPECT_EQ(file.streamValue("streampublic", 8100), "never");
    EXPECT_EQ(file.streamValue("streampath", 8100), "/stream/8100");
}

TEST_F(ShoutcastConfigFileTest, UpsertReplacesExistingBlock) {
    ShoutcastConfigFile file(path_);
    file.upsertStream(makeConfig(8100));

    StreamServerConfig changed = makeConfig(8100);
    changed.sourcePassword = "rotated";
    file.upsertStream(changed);

    EXPECT_EQ(file.streamValue("streampassword", 8100), "rotated");
    const std::string text = file.render();
    EXPECT_EQ(text.find("src8100"), std::string::npos);
    EXPECT_EQ(text.find("streamid_8100="), text.rfind("streamid_8100="));
}

TEST_F(ShoutcastConfigFileTest, GlobalLinesSurviveSaveAndReload) {
    {
        std::ofstream out(path_);
        out << "; global settings\n"
            << "portbase=8000\n"
            << "adminpassword=global\n";
    }

    ShoutcastConfigFile file(path_);
    ASSERT_TRUE(file.load().isSuccess());
    file.upsertStream(makeConfig(8100));
    file.upsertStream(makeConfig(8101));
    ASSERT_TRUE(file.save().isSuccess());

    ShoutcastConfigFile reloaded(path_);
    ASSERT_TRUE(reloaded.load().isSuccess());
    EXPECT_TRUE(reloaded.hasStream(8100));
    EXPECT_TRUE(reloaded.hasStream(8101));

    const std::string text = readBack();
    EXPECT_NE(text.find("portbase=8000\n"), std::string::npos);
    EXPECT_NE(text.find("adminpassword=global\n"), std::string::npos);
    EXPECT_FALSE(fs::exists(path_ + ".tmp"));
}

TEST_F(ShoutcastConfigFileTest, RemoveLeavesOtherStreams) {
    ShoutcastConfigFile file(path_);
    file.upsertStream(makeConfig(8100));
    file.upsertStream(makeConfig(8101));

    EXPECT_TRUE(file.removeStream(8100));
    EXPECT_FALSE(file.hasStream(8100));
    EXPECT_TRUE(file.hasStream(8101));
    EXPECT_EQ(file.render().find("_8100="), std::string::npos);

    EXPECT_FALSE(file.removeStream(8100));
}

TEST_F(ShoutcastConfigFileTest, SidSuffixMatchIsExact) {
    ShoutcastConfigFile file(path_);
    file.upsertStream(makeConfig(18100));
    EXPECT_FALSE(file.removeStream(8100));
    EXPECT_TRUE(file.hasStream(18100));
}

TEST_F(ShoutcastConfigFileTest, SaveIntoMissingDirectoryFails) {
    ShoutcastConfigFile file((dir_ / "absent" / "streams.conf").string());
    file.upsertStream(makeConfig(8100));

    auto saved = file.save();
    ASSERT_TRUE(saved.isError());
    EXPECT_EQ(saved.error().code, ConfigFileError::Code::WriteFailed);
}

} // namespace test
} // namespace shoutcast
} // namespace streamprov

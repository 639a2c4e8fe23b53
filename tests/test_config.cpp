#include <filesystem>
#include <fstream>

#include "mnemonic/config.hpp"

#include <gtest/gtest.h>

namespace fs = std::filesystem;
using namespace mnemonic;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = fs::temp_directory_path() /
                   (std::string("mnemonic_test_config_") +
                    ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(tempDir_);
    }

    void TearDown() override { fs::remove_all(tempDir_); }

    fs::path write(const std::string& name, const std::string& text) {
        fs::path path = tempDir_ / name;
        std::ofstream(path) << text;
        return path;
    }

    fs::path tempDir_;
};

TEST_F(ConfigTest, EmptyDocumentGivesDefaults) {
    auto config = parse_project_config("", tempDir_);
    ASSERT_TRUE(config.ok()) << config.error().full_message();
    EXPECT_EQ(config.value().convert_audio_to, "ogg");
    EXPECT_EQ(config.value().convert_video_to, "mp4");
    EXPECT_TRUE(config.value().extra_assets.empty());
    EXPECT_EQ(config.value().worker_count, 0u);
    EXPECT_EQ(config.value().transcode_timeout, std::chrono::seconds(300));
    EXPECT_EQ(config.value().retry.max_attempts, 1);
    EXPECT_EQ(config.value().version_name, "1.0.0");
}

TEST_F(ConfigTest, ParsesAllKeys) {
    auto config = parse_project_config(R"(
convert_audio_to: .AAC
convert_video_to: webm
worker_count: 3
package_name: com.example.novel
app_name: Example Novel
version_code: 7
version_name: "2.1"
exclude:
  - "*.psd"
conversion_rules:
  - pattern: "voice/*"
    format: opus
  - pattern: "se/*"
    converter: copy
timeouts:
  ffmpeg: 45
retry:
  max_attempts: 3
  backoff_ms: 10
extra_assets:
  icon.png: res/icon.png
  abs.txt: /tmp/abs.txt
)", tempDir_);
    ASSERT_TRUE(config.ok()) << config.error().full_message();
    const auto& c = config.value();

    EXPECT_EQ(c.convert_audio_to, "aac");
    EXPECT_EQ(c.convert_video_to, "webm");
    EXPECT_EQ(c.worker_count, 3u);
    EXPECT_EQ(c.effective_workers(), 3u);
    EXPECT_EQ(c.package_name, "com.example.novel");
    EXPECT_EQ(c.app_name, "Example Novel");
    EXPECT_EQ(c.version_code, 7);
    EXPECT_EQ(c.version_name, "2.1");
    EXPECT_EQ(c.exclude, (std::vector<std::string>{"*.psd"}));
    ASSERT_EQ(c.conversion_rules.size(), 2u);
    EXPECT_EQ(c.conversion_rules[0].pattern, "voice/*");
    EXPECT_EQ(c.conversion_rules[0].format, "opus");
    EXPECT_EQ(c.conversion_rules[1].format, "copy");
    EXPECT_EQ(c.transcode_timeout, std::chrono::seconds(45));
    EXPECT_EQ(c.retry.max_attempts, 3);
    EXPECT_EQ(c.retry.backoff_base, std::chrono::milliseconds(10));

    ASSERT_EQ(c.extra_assets.size(), 2u);
    EXPECT_EQ(c.extra_assets[0].name, "icon.png");
    EXPECT_EQ(c.extra_assets[0].path, (tempDir_ / "res/icon.png").lexically_normal());
    EXPECT_EQ(c.extra_assets[1].path, fs::path("/tmp/abs.txt"));
}

TEST_F(ConfigTest, ExtraAssetsKeepDocumentOrder) {
    auto config = parse_project_config("extra_assets:\n  z.txt: z\n  a.txt: a\n  m.txt: m\n", tempDir_);
    ASSERT_TRUE(config.ok());
    ASSERT_EQ(config.value().extra_assets.size(), 3u);
    EXPECT_EQ(config.value().extra_assets[0].name, "z.txt");
    EXPECT_EQ(config.value().extra_assets[1].name, "a.txt");
    EXPECT_EQ(config.value().extra_assets[2].name, "m.txt");
}

TEST_F(ConfigTest, ZeroWorkersMeansHardwareConcurrency) {
    ProjectConfig config;
    config.worker_count = 0;
    EXPECT_GE(config.effective_workers(), 1u);
}

TEST_F(ConfigTest, UnknownKeysAreIgnored) {
    auto config = parse_project_config("convert_audio_to: mp3\nsplash_screen: yes\n", tempDir_);
    ASSERT_TRUE(config.ok());
    EXPECT_EQ(config.value().convert_audio_to, "mp3");
}

TEST_F(ConfigTest, InvalidDocumentsAreConfigErrors) {
    const char* documents[] = {
        "convert_audio_to: [aac\n",              // YAML syntax
        "- just\n- a list\n",                    // root is not a mapping
        "worker_count: many\n",                  // wrong type
        "worker_count: -1\n",                    // out of range
        "convert_audio_to: \"a/b\"\n",           // not a format
        "extra_assets: [a, b]\n",                // wrong shape
        "conversion_rules:\n  - format: ogg\n",  // missing pattern
        "timeouts: 5\n",
        "retry:\n  max_attempts: 0\n",
    };
    for (const char* doc : documents) {
        auto config = parse_project_config(doc, tempDir_);
        ASSERT_FALSE(config.ok()) << doc;
        EXPECT_EQ(config.error().code, Error::Code::ConfigError) << doc;
    }
}

TEST_F(ConfigTest, OversizedIntegersAreConfigErrors) {
    const char* documents[] = {
        "worker_count: 4294967297\n",
        "worker_count: 100000\n",
        "version_code: 4294967297\n",
        "retry:\n  max_attempts: 2147483648\n",
        "timeouts:\n  ffmpeg: 9999999999\n",
        "worker_count: 99999999999999999999999\n",
    };
    for (const char* doc : documents) {
        auto config = parse_project_config(doc, tempDir_);
        ASSERT_FALSE(config.ok()) << doc;
        EXPECT_EQ(config.error().code, Error::Code::ConfigError) << doc;
    }

    auto largest = parse_project_config("worker_count: 256\nversion_code: 2100000000\n", tempDir_);
    ASSERT_TRUE(largest.ok()) << largest.error().full_message();
    EXPECT_EQ(largest.value().worker_count, 256u);
    EXPECT_EQ(largest.value().version_code, 2100000000);
}

TEST_F(ConfigTest, DuplicateExtraAssetIsConfigError) {
    auto config = parse_project_config("extra_assets:\n  a.txt: one\n  a.txt: two\n", tempDir_);
    ASSERT_FALSE(config.ok());
    EXPECT_EQ(config.error().code, Error::Code::ConfigError);
}

TEST_F(ConfigTest, LoadResolvesPathsAgainstConfigDirectory) {
    fs::create_directories(tempDir_ / "project");
    auto path = write("project/mnemonic.yml", "extra_assets:\n  logo.png: art/logo.png\n");

    auto config = load_project_config(path);
    ASSERT_TRUE(config.ok()) << config.error().full_message();
    EXPECT_EQ(config.value().source_path, path);
    ASSERT_EQ(config.value().extra_assets.size(), 1u);
    EXPECT_EQ(config.value().extra_assets[0].path, (tempDir_ / "project" / "art" / "logo.png").lexically_normal());
}

TEST_F(ConfigTest, LoadReportsFileInErrors) {
    auto path = write("broken.yml", "worker_count: lots\n");
    auto config = load_project_config(path);
    ASSERT_FALSE(config.ok());
    EXPECT_EQ(config.error().code, Error::Code::ConfigError);
    EXPECT_EQ(config.error().context, path.string());
}

TEST_F(ConfigTest, ExplicitMissingPathIsConfigError) {
    auto config = resolve_project_config(tempDir_ / "missing.yml", tempDir_ / "game.xp3");
    ASSERT_FALSE(config.ok());
    EXPECT_EQ(config.error().code, Error::Code::ConfigError);
}

TEST_F(ConfigTest, ResolveFindsConfigBesideArchive) {
    write("mnemonic.yml", "convert_audio_to: aac\n");
    auto config = resolve_project_config({}, tempDir_ / "game.xp3");
    ASSERT_TRUE(config.ok());
    EXPECT_EQ(config.value().convert_audio_to, "aac");
}

TEST_F(ConfigTest, ResolveWithoutConfigUsesDefaults) {
    auto config = resolve_project_config({}, tempDir_ / "game.xp3");
    ASSERT_TRUE(config.ok());
    EXPECT_EQ(config.value().convert_audio_to, "ogg");
    EXPECT_TRUE(config.value().source_path.empty());
}

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <thread>

#include "mnemonic/pipeline.hpp"
#include "fake_transcoder.hpp"
#include "xp3_builder.hpp"

#include <gtest/gtest.h>

namespace fs = std::filesystem;
using namespace mnemonic;
using mnemonic_test::FakeTranscoder;
using mnemonic_test::Xp3Builder;
using mnemonic_test::Xp3FileSpec;
using mnemonic_test::bytes_of;

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = fs::temp_directory_path() /
                   (std::string("mnemonic_test_pipeline_") +
                    ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(tempDir_);
    }

    void TearDown() override { fs::remove_all(tempDir_); }

    fs::path game_archive() {
        return Xp3Builder()
            .add("script.ks", "*start\nHello world.[p]\n")
            .add("bgm.ogg", "OggS-title-theme", true)
            .write(tempDir_ / "game.xp3");
    }

    fs::path write(const std::string& name, const std::string& text) {
        fs::path path = tempDir_ / name;
        fs::create_directories(path.parent_path());
        std::ofstream(path) << text;
        return path;
    }

    Result<BuildManifest> run(Pipeline& pipeline) {
        pipeline.set_state_observer([this](PipelineState state) { states_.push_back(state); });
        return pipeline.run(cancel_);
    }

    static std::string text(const std::vector<uint8_t>& data) {
        return std::string(data.begin(), data.end());
    }

    fs::path tempDir_;
    CancellationToken cancel_;
    std::vector<PipelineState> states_;
};

TEST_F(PipelineTest, MinimalProjectPassesThrough) {
    FakeTranscoder fake;
    Pipeline pipeline({game_archive()}, fake);

    auto manifest = run(pipeline);
    ASSERT_TRUE(manifest.ok()) << manifest.error().full_message();

    EXPECT_EQ(manifest.value().names(), (std::vector<std::string>{"script.ks", "bgm.ogg"}));
    EXPECT_EQ(text(manifest.value().assets[1].data), "OggS-title-theme");
    EXPECT_EQ(fake.calls(), 0);
    EXPECT_EQ(pipeline.state(), PipelineState::Done);
    EXPECT_EQ(states_, (std::vector<PipelineState>{
        PipelineState::Opening, PipelineState::Classifying, PipelineState::Converting,
        PipelineState::Assembling, PipelineState::Done}));
}

TEST_F(PipelineTest, AudioIsTranscodedWhenConfigured) {
    write("mnemonic.yml", "convert_audio_to: aac\n");
    FakeTranscoder fake;
    Pipeline pipeline({game_archive()}, fake);

    auto manifest = run(pipeline);
    ASSERT_TRUE(manifest.ok()) << manifest.error().full_message();

    EXPECT_EQ(manifest.value().names(), (std::vector<std::string>{"script.ks", "bgm.aac"}));
    EXPECT_EQ(manifest.value().assets[0].origin, AssetOrigin::Archive);
    EXPECT_EQ(text(manifest.value().assets[0].data), "*start\nHello world.[p]\n");
    EXPECT_EQ(manifest.value().assets[1].origin, AssetOrigin::Converted);
    EXPECT_EQ(manifest.value().assets[1].format, "aac");
    EXPECT_EQ(text(manifest.value().assets[1].data), "aac:OggS-title-theme");
    EXPECT_EQ(fake.calls(), 1);
}

TEST_F(PipelineTest, CustomConfigAddsExtrasAndOverrides) {
    write("project/res/icon.png", "PNG-icon");
    write("project/patch/script.ks", "*start\nPatched.[p]\n");
    auto config = write("project/mnemonic.yml",
                        "app_name: Test Novel\n"
                        "worker_count: 8\n"
                        "extra_assets:\n"
                        "  icon.png: res/icon.png\n"
                        "  script.ks: patch/script.ks\n");

    FakeTranscoder fake;
    PipelineOptions options;
    options.archive_path = game_archive();
    options.config_path = config;
    options.worker_count = 1;
    Pipeline pipeline(options, fake);

    auto manifest = run(pipeline);
    ASSERT_TRUE(manifest.ok()) << manifest.error().full_message();

    EXPECT_EQ(manifest.value().names(), (std::vector<std::string>{"bgm.ogg", "icon.png", "script.ks"}));
    EXPECT_EQ(text(manifest.value().find("script.ks")->data), "*start\nPatched.[p]\n");
    ASSERT_EQ(manifest.value().overrides.size(), 1u);
    EXPECT_EQ(manifest.value().overrides[0].name, "script.ks");
    EXPECT_EQ(manifest.value().config.app_name, "Test Novel");
    EXPECT_EQ(manifest.value().config.worker_count, 1u);
}

TEST_F(PipelineTest, EncryptedArchiveFailsAtOpening) {
    Xp3FileSpec secret{"bgm.ogg", bytes_of("scrambled")};
    secret.flags = XP3_FILE_PROTECTED;
    auto path = Xp3Builder().add("script.ks", "text").add(secret).write(tempDir_ / "encrypted.xp3");

    FakeTranscoder fake;
    Pipeline pipeline({path}, fake);

    auto manifest = run(pipeline);
    ASSERT_FALSE(manifest.ok());
    EXPECT_EQ(manifest.error().code, Error::Code::EncryptedArchive);
    EXPECT_NE(manifest.error().message.find("this archive format is not supported - encryption is not handled"),
              std::string::npos);
    EXPECT_EQ(pipeline.state(), PipelineState::Failed);
    EXPECT_EQ(pipeline.failure().code, Error::Code::EncryptedArchive);
    EXPECT_EQ(states_, (std::vector<PipelineState>{PipelineState::Opening, PipelineState::Failed}));
    EXPECT_EQ(fake.calls(), 0);
}

TEST_F(PipelineTest, MalformedHeaderFailsAtOpening) {
    auto path = write("broken.xp3", "PK\x03\x04 definitely not xp3 data");
    FakeTranscoder fake;
    Pipeline pipeline({path}, fake);

    auto manifest = run(pipeline);
    ASSERT_FALSE(manifest.ok());
    EXPECT_EQ(manifest.error().code, Error::Code::MalformedHeader);
    EXPECT_EQ(pipeline.state(), PipelineState::Failed);
}

TEST_F(PipelineTest, ConfigErrorComesBeforeOpening) {
    auto config = write("bad.yml", "convert_audio_to: [unterminated\n");
    FakeTranscoder fake;
    PipelineOptions options;
    options.archive_path = tempDir_ / "missing.xp3";
    options.config_path = config;
    Pipeline pipeline(options, fake);

    auto manifest = run(pipeline);
    ASSERT_FALSE(manifest.ok());
    EXPECT_EQ(manifest.error().code, Error::Code::ConfigError);
    EXPECT_EQ(states_, (std::vector<PipelineState>{PipelineState::Failed}));
}

TEST_F(PipelineTest, AllFailedConversionsAreReported) {
    write("mnemonic.yml", "convert_audio_to: aac\nworker_count: 2\n");
    auto path = Xp3Builder()
        .add("voice1.wav", "v1").add("script.ks", "s").add("voice2.wav", "v2").add("voice3.ogg", "ok")
        .write(tempDir_ / "game.xp3");

    FakeTranscoder fake([](const TranscodeRequest& request) {
        if (request.input.extension() == ".wav") {
            return FakeTranscoder::status(TranscodeStatus::NonZeroExit, 1);
        }
        return FakeTranscoder::convert_ok(request);
    });
    Pipeline pipeline({path}, fake);

    auto manifest = run(pipeline);
    ASSERT_FALSE(manifest.ok());
    EXPECT_EQ(manifest.error().code, Error::Code::ConversionFailed);
    EXPECT_EQ(manifest.error().entries, (std::vector<std::string>{"voice1.wav", "voice2.wav"}));
    EXPECT_EQ(states_.back(), PipelineState::Failed);
    EXPECT_EQ(std::count(states_.begin(), states_.end(), PipelineState::Assembling), 0);
}

TEST_F(PipelineTest, CorruptEntriesAreReported) {
    Xp3Builder builder;
    builder.add("a.ks", "aaaaaaaa").add("b.ks", "bbbbbbbb").add("c.ks", "cccccccc");
    auto bytes = builder.build();
    bytes[builder.header_size() + 1] ^= 0xFF;        // a.ks
    bytes[builder.header_size() + 16 + 1] ^= 0xFF;   // c.ks
    auto path = tempDir_ / "corrupt.xp3";
    Xp3Builder::write_bytes(path, bytes);

    FakeTranscoder fake;
    Pipeline pipeline({path}, fake);

    auto manifest = run(pipeline);
    ASSERT_FALSE(manifest.ok());
    EXPECT_EQ(manifest.error().code, Error::Code::CorruptEntry);
    EXPECT_EQ(manifest.error().entries, (std::vector<std::string>{"a.ks", "c.ks"}));
}

TEST_F(PipelineTest, UnreadableAndUnconvertibleEntriesAreReportedTogether) {
    write("mnemonic.yml", "convert_audio_to: aac\n");
    Xp3Builder builder;
    builder.add("a.ks", "aaaaaaaa").add("bgm.wav", "RIFF-title");
    auto bytes = builder.build();
    bytes[builder.header_size() + 1] ^= 0xFF;   // a.ks
    auto path = tempDir_ / "game.xp3";
    Xp3Builder::write_bytes(path, bytes);

    FakeTranscoder fake([](const TranscodeRequest&) {
        return FakeTranscoder::status(TranscodeStatus::NonZeroExit, 1);
    });
    Pipeline pipeline({path}, fake);

    auto manifest = run(pipeline);
    ASSERT_FALSE(manifest.ok());
    EXPECT_EQ(manifest.error().code, Error::Code::CorruptEntry);
    EXPECT_EQ(manifest.error().entries, (std::vector<std::string>{"a.ks", "bgm.wav"}));
    EXPECT_EQ(fake.calls(), 1);
    EXPECT_EQ(states_.back(), PipelineState::Failed);
}

TEST_F(PipelineTest, ImplausibleEntrySizeFailsInsteadOfAllocating) {
    Xp3FileSpec spec{"bgm.ogg", bytes_of("hello"), true};
    spec.declared_size = uint64_t{1} << 62;
    auto path = Xp3Builder().add("script.ks", "ok").add(spec).write(tempDir_ / "huge.xp3");

    FakeTranscoder fake;
    Pipeline pipeline({path}, fake);

    auto manifest = run(pipeline);
    ASSERT_FALSE(manifest.ok());
    EXPECT_EQ(manifest.error().code, Error::Code::CorruptIndex);
    EXPECT_EQ(states_.back(), PipelineState::Failed);
    EXPECT_EQ(pipeline.state(), PipelineState::Failed);
    EXPECT_EQ(fake.calls(), 0);
}

TEST_F(PipelineTest, CancellationDuringConversionReturnsNoManifest) {
    write("mnemonic.yml", "convert_audio_to: aac\nworker_count: 1\n");
    FakeTranscoder fake([this](const TranscodeRequest&) {
        cancel_.cancel();
        return FakeTranscoder::status(TranscodeStatus::Cancelled);
    });
    Pipeline pipeline({game_archive()}, fake);

    auto manifest = run(pipeline);
    ASSERT_FALSE(manifest.ok());
    EXPECT_EQ(manifest.error().code, Error::Code::Cancelled);
    EXPECT_EQ(pipeline.state(), PipelineState::Failed);
}

TEST_F(PipelineTest, CancelledBeforeStartNeverOpens) {
    cancel_.cancel();
    FakeTranscoder fake;
    Pipeline pipeline({game_archive()}, fake);

    auto manifest = run(pipeline);
    ASSERT_FALSE(manifest.ok());
    EXPECT_EQ(manifest.error().code, Error::Code::Cancelled);
    EXPECT_EQ(states_, (std::vector<PipelineState>{PipelineState::Failed}));
}

TEST_F(PipelineTest, ManifestOrderIsIndependentOfCompletionOrder) {
    write("mnemonic.yml", "convert_audio_to: aac\nworker_count: 4\n");
    Xp3Builder builder;
    std::vector<std::string> expected;
    for (int i = 9; i >= 0; --i) {
        builder.add("bgm" + std::to_string(i) + ".ogg", std::to_string(i));
        expected.push_back("bgm" + std::to_string(i) + ".aac");
    }
    auto path = builder.write(tempDir_ / "game.xp3");

    FakeTranscoder fake([](const TranscodeRequest& request) {
        int n = std::stoi(FakeTranscoder::read_text(request.input));
        std::this_thread::sleep_for(std::chrono::milliseconds(5 * n));
        return FakeTranscoder::convert_ok(request);
    });
    Pipeline pipeline({path}, fake);

    auto manifest = run(pipeline);
    ASSERT_TRUE(manifest.ok()) << manifest.error().full_message();
    EXPECT_EQ(manifest.value().names(), expected);
}

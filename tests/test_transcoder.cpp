#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

#include "mnemonic/transcoder.hpp"

#include <gtest/gtest.h>

namespace fs = std::filesystem;
using namespace mnemonic;

class TranscoderTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = fs::temp_directory_path() /
                   (std::string("mnemonic_test_transcoder_") +
                    ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(tempDir_);
        input_ = tempDir_ / "in.wav";
        output_ = tempDir_ / "out.aac";
        std::ofstream(input_) << "RIFF-fake-wave";
    }

    void TearDown() override { fs::remove_all(tempDir_); }

    TranscodeRequest request(std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
        TranscodeRequest req;
        req.input = input_;
        req.output = output_;
        req.target_format = "aac";
        req.timeout = timeout;
        return req;
    }

    static FfmpegTranscoder shell(const std::string& script) {
        return FfmpegTranscoder("/bin/sh", {"-c", script, "{input}", "{output}", "{format}"});
    }

    static std::string slurp(const fs::path& path) {
        std::ifstream file(path);
        std::stringstream ss;
        ss << file.rdbuf();
        return ss.str();
    }

    fs::path tempDir_;
    fs::path input_;
    fs::path output_;
};

TEST_F(TranscoderTest, DefaultArgumentsUseFfmpegPlaceholders) {
    FfmpegTranscoder ffmpeg;
    EXPECT_EQ(ffmpeg.name(), "ffmpeg");
    const auto& args = ffmpeg.arguments();
    EXPECT_NE(std::find(args.begin(), args.end(), "{input}"), args.end());
    EXPECT_EQ(args.back(), "{output}");
}

TEST_F(TranscoderTest, RunsProgramWithExpandedArguments) {
    auto transcoder = shell("cp \"$0\" \"$1\" && printf %s \"$2\" > \"$1.fmt\"");
    auto response = transcoder.transcode(request());

    ASSERT_TRUE(response.ok()) << transcode_status_name(response.status) << ": " << response.diagnostics;
    EXPECT_EQ(response.exit_code, 0);
    EXPECT_EQ(slurp(output_), "RIFF-fake-wave");
    EXPECT_EQ(slurp(tempDir_ / "out.aac.fmt"), "aac");
}

TEST_F(TranscoderTest, ArgumentsAreNotShellExpanded) {
    input_ = tempDir_ / "it's $(odd) name.wav";
    std::ofstream(input_) << "quoted";

    auto transcoder = shell("cp \"$0\" \"$1\"");
    auto response = transcoder.transcode(request());
    ASSERT_TRUE(response.ok()) << response.diagnostics;
    EXPECT_EQ(slurp(output_), "quoted");
}

TEST_F(TranscoderTest, NonZeroExitIsReportedWithDiagnostics) {
    auto transcoder = shell("echo 'Invalid data found' >&2; exit 3");
    auto response = transcoder.transcode(request());

    EXPECT_EQ(response.status, TranscodeStatus::NonZeroExit);
    EXPECT_EQ(response.exit_code, 3);
    EXPECT_NE(response.diagnostics.find("Invalid data found"), std::string::npos);
}

TEST_F(TranscoderTest, TimeoutKillsTheChild) {
    auto transcoder = shell("sleep 30");
    auto start = std::chrono::steady_clock::now();
    auto response = transcoder.transcode(request(std::chrono::milliseconds(200)));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(response.status, TranscodeStatus::Timeout);
    EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST_F(TranscoderTest, CancellationKillsTheChild) {
    CancellationToken cancel;
    auto req = request(std::chrono::seconds(30));
    req.cancel = &cancel;

    std::thread canceller([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        cancel.cancel();
    });

    auto transcoder = shell("sleep 30");
    auto start = std::chrono::steady_clock::now();
    auto response = transcoder.transcode(req);
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    EXPECT_EQ(response.status, TranscodeStatus::Cancelled);
    EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST_F(TranscoderTest, AlreadyCancelledDoesNotSpawn) {
    CancellationToken cancel;
    cancel.cancel();
    auto req = request();
    req.cancel = &cancel;

    auto transcoder = shell("touch \"$1\"");
    auto response = transcoder.transcode(req);
    EXPECT_EQ(response.status, TranscodeStatus::Cancelled);
    EXPECT_FALSE(fs::exists(output_));
}

TEST_F(TranscoderTest, MissingProgramIsSpawnFailure) {
    FfmpegTranscoder missing((tempDir_ / "no-such-ffmpeg").string());
    EXPECT_FALSE(missing.is_available());

    auto response = missing.transcode(request());
    EXPECT_EQ(response.status, TranscodeStatus::SpawnFailed);
    EXPECT_FALSE(response.diagnostics.empty());
}

TEST_F(TranscoderTest, AvailabilitySearchesPath) {
    EXPECT_TRUE(FfmpegTranscoder("sh").is_available());
    EXPECT_TRUE(FfmpegTranscoder("/bin/sh").is_available());
    EXPECT_FALSE(FfmpegTranscoder("mnemonic-definitely-not-installed").is_available());
}

#include <gtest/gtest.h>
#include "infrastructure/subprocess_transcoder.hpp"
#include "test_support.hpp"

using namespace relay_service;
using namespace std::chrono_literals;
using relay_service::testing::TempDir;

class SubprocessTranscoderTest : public ::testing::Test {
protected:
  void SetUp() override {
    script_ = relay_service::testing::writeFakeTranscoder(dir_.path()).string();
    input_ = (dir_.path() / "in.bin").string();
    output_ = (dir_.path() / "out.bin").string();
    relay_service::testing::writeFile(input_, "payload");
  }

  TempDir dir_;
  std::string script_;
  std::string input_;
  std::string output_;
};

TEST_F(SubprocessTranscoderTest, CapturesStdoutAndExitCode) {
  SubprocessTranscoder transcoder(10s);
  auto result = transcoder.run({script_, "-i", input_, "-c", "copy", output_});
  ASSERT_TRUE(result.has_value()) << result.error();
  EXPECT_EQ(result->exit_code, 0);
  EXPECT_NE(result->std_out.find("fake transcoder writing"), std::string::npos);
  EXPECT_EQ(relay_service::testing::readFile(output_), "payload");
}

TEST_F(SubprocessTranscoderTest, ArgumentsAreNotReinterpretedByAShell) {
  SubprocessTranscoder transcoder(10s);
  auto result = transcoder.run({script_, "-i", input_, "--args", "a b", "$HOME", "; rm -rf /", output_});
  ASSERT_TRUE(result.has_value()) << result.error();
  EXPECT_EQ(relay_service::testing::readFile(output_),
            "-i\n" + input_ + "\n--args\na b\n$HOME\n; rm -rf /\n" + output_ + "\n");
}

TEST_F(SubprocessTranscoderTest, ReportsNonZeroExitWithStderr) {
  SubprocessTranscoder transcoder(10s);
  auto result = transcoder.run({script_, "-i", input_, "--fail", output_});
  ASSERT_TRUE(result.has_value()) << result.error();
  EXPECT_EQ(result->exit_code, 1);
  EXPECT_NE(result->std_err.find("Invalid filter specification"), std::string::npos);
}

TEST_F(SubprocessTranscoderTest, LaunchFailureIsAnError) {
  SubprocessTranscoder transcoder(10s);
  auto result = transcoder.run({(dir_.path() / "does-not-exist").string(), "-i", input_, output_});
  EXPECT_FALSE(result.has_value());
}

TEST_F(SubprocessTranscoderTest, EmptyCommandIsAnError) {
  SubprocessTranscoder transcoder(10s);
  EXPECT_FALSE(transcoder.run({}).has_value());
}

TEST_F(SubprocessTranscoderTest, KillsChildAfterTimeout) {
  SubprocessTranscoder transcoder(500ms);
  auto start = std::chrono::steady_clock::now();
  auto result = transcoder.run({script_, "-i", input_, "--sleep", output_});
  auto elapsed = std::chrono::steady_clock::now() - start;
  ASSERT_FALSE(result.has_value());
  EXPECT_NE(result.error().find("timed out"), std::string::npos);
  EXPECT_LT(elapsed, 20s);
}

#include <gtest/gtest.h>
#include "audio/decoder.hpp"
#include "audio/subprocess.hpp"
#include "utils/error_handler.hpp"
#include <csignal>
#include <thread>

using namespace meddictate::audio;
using namespace std::chrono_literals;

TEST(SubprocessTest, CatEchoesInput) {
    Subprocess process;
    ASSERT_TRUE(process.start({"cat"}));
    EXPECT_GT(process.getPid(), 0);
    EXPECT_TRUE(process.isRunning());
    
    std::vector<uint8_t> input(100000);
    for (size_t i = 0; i < input.size(); ++i) {
        input[i] = static_cast<uint8_t>(i % 251);
    }
    ASSERT_TRUE(process.write(input));
    process.closeInput();
    
    auto code = process.waitFor(5000ms);
    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(*code, 0);
    EXPECT_EQ(process.takeOutput(), input);
    EXPECT_FALSE(process.hasOutput());
}

TEST(SubprocessTest, ReportsExitCodeAndStderr) {
    Subprocess process;
    ASSERT_TRUE(process.start({"sh", "-c", "echo broken >&2; exit 3"}));
    
    auto code = process.waitFor(5000ms);
    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(*code, 3);
    EXPECT_EQ(process.exitCode(), 3);
    EXPECT_NE(process.getStderr().find("broken"), std::string::npos);
}

TEST(SubprocessTest, MissingProgramFailsToStart) {
    Subprocess process;
    EXPECT_FALSE(process.start({"/nonexistent/program"}));
    EXPECT_FALSE(process.getLastError().empty());
    
    Subprocess empty;
    EXPECT_FALSE(empty.start({}));
}

TEST(SubprocessTest, WaitTimesOutAndTerminate) {
    Subprocess process;
    ASSERT_TRUE(process.start({"sleep", "10"}));
    
    EXPECT_FALSE(process.waitFor(50ms).has_value());
    process.terminate(200ms);
    EXPECT_FALSE(process.isRunning());
    ASSERT_TRUE(process.exitCode().has_value());
    EXPECT_EQ(*process.exitCode(), 128 + SIGTERM);
}

TEST(SubprocessTest, WriteAfterExitFails) {
    Subprocess process;
    ASSERT_TRUE(process.start({"true"}));
    ASSERT_TRUE(process.waitFor(5000ms).has_value());
    
    std::vector<uint8_t> data(1 << 16, 1);
    EXPECT_FALSE(process.write(data));
}

TEST(ProcessDecoderTest, CatStreamsThrough) {
    DecoderCommand command;
    command.program = "cat";
    command.args = {};
    auto decoder = makeProcessDecoderFactory(command)();
    
    std::vector<uint8_t> input(5000, 7);
    ASSERT_TRUE(decoder->feed(input));
    auto out = decoder->drain();
    auto tail = decoder->close(2000ms);
    out.insert(out.end(), tail.begin(), tail.end());
    
    EXPECT_EQ(out, input);
    EXPECT_FALSE(decoder->hasError());
    EXPECT_FALSE(decoder->feed(input));
}

TEST(ProcessDecoderTest, NonZeroExitIsAnError) {
    DecoderCommand command;
    command.program = "sh";
    command.args = {"-c", "cat >/dev/null; echo bad input >&2; exit 1"};
    auto decoder = makeProcessDecoderFactory(command)();
    
    ASSERT_TRUE(decoder->feed({1, 2, 3}));
    decoder->close(2000ms);
    EXPECT_TRUE(decoder->hasError());
    EXPECT_NE(decoder->getErrorMessage().find("bad input"), std::string::npos);
}

TEST(ProcessDecoderTest, EarlyExitIsAnError) {
    DecoderCommand command;
    command.program = "true";
    command.args = {};
    auto decoder = makeProcessDecoderFactory(command)();
    
    std::this_thread::sleep_for(100ms);
    decoder->drain();
    EXPECT_TRUE(decoder->hasError());
    EXPECT_FALSE(decoder->feed({1, 2, 3}));
}

TEST(ProcessDecoderTest, MissingProgramThrows) {
    DecoderCommand command;
    command.program = "/nonexistent/ffmpeg";
    EXPECT_THROW(makeProcessDecoderFactory(command)(), meddictate::utils::DecodeException);
}

TEST(DecodeOnceTest, ReturnsWholeOutput) {
    DecoderCommand command;
    command.program = "cat";
    command.args = {};
    std::vector<uint8_t> input(70000, 3);
    
    auto pcm = decodeOnce(makeProcessDecoderFactory(command), input, 5000ms);
    EXPECT_EQ(pcm, input);
}

TEST(DecodeOnceTest, FailureThrows) {
    DecoderCommand command;
    command.program = "sh";
    command.args = {"-c", "cat >/dev/null; exit 2"};
    
    EXPECT_THROW(decodeOnce(makeProcessDecoderFactory(command), {1, 2, 3}, 5000ms),
                 meddictate::utils::DecodeException);
}

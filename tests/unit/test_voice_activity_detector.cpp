#include <gtest/gtest.h>
#include "audio/voice_activity_detector.hpp"
#include "../fixtures/test_data_generator.hpp"
#include <cmath>
#include <stdexcept>
#include <vector>

using namespace meddictate::audio;
using fixtures::TestDataGenerator;

class VoiceActivityDetectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = VadConfig{};
        config_.speechThreshold = 3;
        config_.silenceThreshold = 5;
        
        vad_ = std::make_unique<VoiceActivityDetector>(config_);
        events_.clear();
        vad_->setVadCallback([this](const VadEvent& event) {
            events_.push_back(event);
        });
    }
    
    // Frames of 20 ms at 16 kHz
    std::vector<uint8_t> speechFrames(size_t count) {
        float seconds = 0.02f * static_cast<float>(count);
        return TestDataGenerator::toPcm(generator_.generateSpeechLikeAudio(seconds));
    }
    
    std::vector<uint8_t> silenceFrames(size_t count) {
        float seconds = 0.02f * static_cast<float>(count);
        return TestDataGenerator::toPcm(generator_.generateSilence(seconds));
    }
    
    void feedFrames(const std::vector<uint8_t>& pcm) {
        const size_t frameBytes = config_.getFrameBytes();
        for (size_t offset = 0; offset < pcm.size(); offset += frameBytes) {
            std::vector<uint8_t> frame(pcm.begin() + static_cast<std::ptrdiff_t>(offset),
                                       pcm.begin() + static_cast<std::ptrdiff_t>(offset + frameBytes));
            vad_->process(frame);
        }
    }
    
    VadConfig config_;
    std::unique_ptr<VoiceActivityDetector> vad_;
    std::vector<VadEvent> events_;
    TestDataGenerator generator_;
};

TEST_F(VoiceActivityDetectorTest, FrameGeometry) {
    EXPECT_EQ(config_.getFrameSamples(), 320u);
    EXPECT_EQ(config_.getFrameBytes(), 640u);
    EXPECT_TRUE(config_.isValid());
}

TEST_F(VoiceActivityDetectorTest, InvalidConfigurationThrows) {
    VadConfig bad;
    bad.frameDurationMs = 0;
    EXPECT_THROW(VoiceActivityDetector{bad}, std::invalid_argument);
    
    bad = VadConfig{};
    bad.speechThreshold = 0;
    EXPECT_THROW(VoiceActivityDetector{bad}, std::invalid_argument);
    
    bad = VadConfig{};
    bad.minHistoryFrames = bad.historyFrames + 1;
    EXPECT_THROW(vad_->setConfig(bad), std::invalid_argument);
}

TEST_F(VoiceActivityDetectorTest, SilenceNeverTriggers) {
    auto result = vad_->process(silenceFrames(100));
    
    EXPECT_FALSE(result.has_value());
    EXPECT_FALSE(vad_->isSpeaking());
    EXPECT_EQ(vad_->getCurrentState(), VadState::IDLE);
    
    auto stats = vad_->getStatistics();
    EXPECT_EQ(stats.totalFrames, 100u);
    EXPECT_EQ(stats.speechFrames, 0u);
    EXPECT_EQ(stats.speechSegments, 0u);
    EXPECT_TRUE(events_.empty());
}

TEST_F(VoiceActivityDetectorTest, QuietBackgroundIsNotSpeech) {
    auto hiss = TestDataGenerator::toPcm(generator_.generateNoiseAudio(1.0f));
    vad_->process(hiss);
    
    EXPECT_FALSE(vad_->isSpeaking());
    EXPECT_EQ(vad_->getStatistics().speechFrames, 0u);
    EXPECT_GE(vad_->getCurrentThreshold(), config_.noiseFloor);
}

TEST_F(VoiceActivityDetectorTest, SpeechNeedsConsecutiveFrames) {
    auto speech = speechFrames(3);
    const size_t frameBytes = config_.getFrameBytes();
    
    std::vector<uint8_t> first(speech.begin(), speech.begin() + frameBytes);
    std::vector<uint8_t> second(speech.begin() + frameBytes, speech.begin() + 2 * frameBytes);
    std::vector<uint8_t> third(speech.begin() + 2 * frameBytes, speech.end());
    
    EXPECT_FALSE(vad_->process(first).has_value());
    EXPECT_EQ(vad_->getCurrentState(), VadState::SPEECH_DETECTED);
    EXPECT_FALSE(vad_->process(second).has_value());
    
    auto result = vad_->process(third);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, third);
    EXPECT_TRUE(vad_->isSpeaking());
    EXPECT_EQ(vad_->getCurrentState(), VadState::SPEAKING);
    
    ASSERT_EQ(events_.size(), 1u);
    EXPECT_TRUE(events_[0].isSpeaking());
    EXPECT_EQ(events_[0].previousState, VadState::SPEECH_DETECTED);
    EXPECT_EQ(events_[0].frameIndex, 2u);
}

TEST_F(VoiceActivityDetectorTest, InterruptedSpeechDoesNotTrigger) {
    feedFrames(speechFrames(2));
    feedFrames(silenceFrames(1));
    feedFrames(speechFrames(2));
    
    EXPECT_FALSE(vad_->isSpeaking());
    EXPECT_TRUE(events_.empty());
}

TEST_F(VoiceActivityDetectorTest, SilenceHysteresisKeepsSpeaking) {
    feedFrames(speechFrames(10));
    ASSERT_TRUE(vad_->isSpeaking());
    
    feedFrames(silenceFrames(4));
    EXPECT_TRUE(vad_->isSpeaking());
    EXPECT_EQ(vad_->getCurrentState(), VadState::PAUSE_DETECTED);
    
    // A speech frame inside the pause resets the silence run
    feedFrames(speechFrames(1));
    feedFrames(silenceFrames(4));
    EXPECT_TRUE(vad_->isSpeaking());
    
    feedFrames(silenceFrames(1));
    EXPECT_FALSE(vad_->isSpeaking());
    EXPECT_EQ(vad_->getCurrentState(), VadState::IDLE);
    
    ASSERT_EQ(events_.size(), 2u);
    EXPECT_TRUE(events_[0].isSpeaking());
    EXPECT_FALSE(events_[1].isSpeaking());
    EXPECT_EQ(events_[1].previousState, VadState::PAUSE_DETECTED);
    EXPECT_EQ(vad_->getStatistics().speechSegments, 1u);
}

TEST_F(VoiceActivityDetectorTest, ReturnsChunkOnlyWhileSpeaking) {
    EXPECT_FALSE(vad_->process(silenceFrames(5)).has_value());
    
    auto speech = speechFrames(5);
    auto result = vad_->process(speech);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->size(), speech.size());
    
    EXPECT_TRUE(vad_->process(silenceFrames(3)).has_value());
    EXPECT_FALSE(vad_->process(silenceFrames(2)).has_value());
}

TEST_F(VoiceActivityDetectorTest, PartialFramesCarryOver) {
    auto speech = speechFrames(1);
    std::vector<uint8_t> head(speech.begin(), speech.begin() + 100);
    std::vector<uint8_t> tail(speech.begin() + 100, speech.end());
    
    vad_->process(head);
    EXPECT_EQ(vad_->getPendingBytes(), 100u);
    EXPECT_EQ(vad_->getStatistics().totalFrames, 0u);
    
    vad_->process(tail);
    EXPECT_EQ(vad_->getPendingBytes(), 0u);
    EXPECT_EQ(vad_->getStatistics().totalFrames, 1u);
    EXPECT_EQ(vad_->getStatistics().speechFrames, 1u);
}

TEST_F(VoiceActivityDetectorTest, OddByteCountIsBuffered) {
    std::vector<uint8_t> odd(641, 0);
    vad_->process(odd);
    EXPECT_EQ(vad_->getPendingBytes(), 1u);
    EXPECT_EQ(vad_->getStatistics().totalFrames, 1u);
}

TEST_F(VoiceActivityDetectorTest, SustainedSpeechDoesNotRaiseThreshold) {
    feedFrames(silenceFrames(20));
    float ambient = vad_->getCurrentThreshold();
    EXPECT_FLOAT_EQ(ambient, config_.noiseFloor);
    
    feedFrames(speechFrames(100));
    
    EXPECT_FLOAT_EQ(vad_->getCurrentThreshold(), ambient);
    EXPECT_TRUE(vad_->isSpeaking());
    EXPECT_EQ(vad_->getStatistics().speechSegments, 1u);
}

// A voiced vowel: loud, with almost no zero crossings
TEST_F(VoiceActivityDetectorTest, SustainedToneStaysSpeakingUntilSilence) {
    feedFrames(silenceFrames(50));
    
    auto tone = TestDataGenerator::toPcm(generator_.generateTone(200.0f, 4.0f, 16000, 0.3f));
    const size_t frameBytes = config_.getFrameBytes();
    ASSERT_EQ(tone.size(), 200 * frameBytes);
    
    for (size_t frame = 0; frame < 200; ++frame) {
        std::vector<uint8_t> chunk(tone.begin() + static_cast<std::ptrdiff_t>(frame * frameBytes),
                                   tone.begin() + static_cast<std::ptrdiff_t>((frame + 1) * frameBytes));
        vad_->process(chunk);
        if (frame + 1 >= config_.speechThreshold) {
            ASSERT_TRUE(vad_->isSpeaking()) << "left speaking at loud frame " << frame;
        }
    }
    EXPECT_EQ(vad_->getStatistics().speechSegments, 1u);
    EXPECT_EQ(events_.size(), 1u);
    
    feedFrames(silenceFrames(config_.silenceThreshold - 1));
    EXPECT_TRUE(vad_->isSpeaking());
    feedFrames(silenceFrames(1));
    EXPECT_FALSE(vad_->isSpeaking());
}

TEST_F(VoiceActivityDetectorTest, ThresholdTracksAmbientHum) {
    // 50 Hz mains hum, RMS about 0.0085 and below the initial threshold
    auto hum = TestDataGenerator::toPcm(generator_.generateTone(50.0f, 1.0f, 16000, 0.012f));
    vad_->process(hum);
    
    EXPECT_FALSE(vad_->isSpeaking());
    EXPECT_NEAR(vad_->getCurrentThreshold(), 0.012f / std::sqrt(2.0f) * config_.adaptiveMultiplier, 5e-4);
    EXPECT_GT(vad_->getCurrentThreshold(), config_.noiseFloor);
}

TEST_F(VoiceActivityDetectorTest, ResetClearsState) {
    feedFrames(speechFrames(10));
    vad_->process(std::vector<uint8_t>(10, 0));
    ASSERT_TRUE(vad_->isSpeaking());
    
    vad_->reset();
    
    EXPECT_FALSE(vad_->isSpeaking());
    EXPECT_EQ(vad_->getPendingBytes(), 0u);
    EXPECT_FLOAT_EQ(vad_->getCurrentThreshold(), config_.energyThreshold);
    EXPECT_EQ(vad_->getCurrentState(), VadState::IDLE);
}

TEST_F(VoiceActivityDetectorTest, StatisticsAverageEnergy) {
    feedFrames(silenceFrames(10));
    auto stats = vad_->getStatistics();
    EXPECT_DOUBLE_EQ(stats.averageEnergy, 0.0);
    
    vad_->resetStatistics();
    EXPECT_EQ(vad_->getStatistics().totalFrames, 0u);
}

TEST(VadStateTest, Names) {
    EXPECT_STREQ(vadStateToString(VadState::IDLE), "idle");
    EXPECT_STREQ(vadStateToString(VadState::SPEAKING), "speaking");
    EXPECT_STREQ(vadStateToString(VadState::PAUSE_DETECTED), "pause_detected");
}

#include <gtest/gtest.h>
#include "audio/pcm_utils.hpp"
#include <cmath>

using namespace meddictate::audio;

TEST(PcmUtilsTest, FloatConversionKeepsSamples) {
    std::vector<float> samples = {0.0f, 0.5f, -0.5f, 1.0f, -1.0f};
    auto pcm = floatToPcm(samples);
    ASSERT_EQ(pcm.size(), 10u);
    
    auto back = pcmToFloat(pcm);
    ASSERT_EQ(back.size(), samples.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        EXPECT_NEAR(back[i], samples[i], 1e-4f);
    }
}

TEST(PcmUtilsTest, FloatConversionClamps) {
    auto pcm = floatToPcm({2.0f, -3.0f});
    auto back = pcmToFloat(pcm);
    EXPECT_NEAR(back[0], 1.0f, 1e-4f);
    EXPECT_NEAR(back[1], -1.0f, 1e-4f);
}

TEST(PcmUtilsTest, LittleEndianLayout) {
    std::vector<uint8_t> pcm = {0x00, 0x40, 0x00, 0xC0, 0x01};
    auto samples = pcmToFloat(pcm);
    // Trailing odd byte is ignored
    ASSERT_EQ(samples.size(), 2u);
    EXPECT_FLOAT_EQ(samples[0], 0.5f);
    EXPECT_FLOAT_EQ(samples[1], -0.5f);
}

TEST(PcmUtilsTest, RmsAndZeroCrossings) {
    std::vector<float> square = {0.5f, -0.5f, 0.5f, -0.5f};
    EXPECT_FLOAT_EQ(calculateRms(square.data(), square.size()), 0.5f);
    EXPECT_FLOAT_EQ(calculateZeroCrossingRate(square.data(), square.size()), 1.0f);
    
    std::vector<float> flat = {0.2f, 0.2f, 0.2f};
    EXPECT_FLOAT_EQ(calculateZeroCrossingRate(flat.data(), flat.size()), 0.0f);
    EXPECT_FLOAT_EQ(calculateRms(nullptr, 0), 0.0f);
}

TEST(PcmUtilsTest, DetectsContainerMagic) {
    EXPECT_EQ(detectContainer({0x1A, 0x45, 0xDF, 0xA3, 0x01}), ContainerType::WEBM);
    EXPECT_EQ(detectContainer({'O', 'g', 'g', 'S', 0}), ContainerType::OGG);
    EXPECT_EQ(detectContainer(makeWavFile({})), ContainerType::WAV);
    EXPECT_EQ(detectContainer({'R', 'I', 'F', 'F'}), ContainerType::UNKNOWN);
    EXPECT_EQ(detectContainer({1, 2, 3}), ContainerType::UNKNOWN);
}

TEST(PcmUtilsTest, FindsHeaderAtOffset) {
    std::vector<uint8_t> data = {9, 9, 9, 'O', 'g', 'g', 'S', 1};
    ContainerType type = ContainerType::UNKNOWN;
    EXPECT_EQ(findContainerHeader(data, &type), 3u);
    EXPECT_EQ(type, ContainerType::OGG);
    
    EXPECT_EQ(findContainerHeader({1, 2, 3, 4, 5}, &type), std::string::npos);
    EXPECT_EQ(type, ContainerType::UNKNOWN);
    EXPECT_EQ(findContainerHeader({}), std::string::npos);
}

TEST(PcmUtilsTest, WavFileHeader) {
    std::vector<uint8_t> pcm(320, 0);
    auto wav = makeWavFile(pcm);
    ASSERT_EQ(wav.size(), 44u + pcm.size());
    EXPECT_EQ(std::string(wav.begin(), wav.begin() + 4), "RIFF");
    EXPECT_EQ(std::string(wav.begin() + 8, wav.begin() + 12), "WAVE");
    EXPECT_EQ(std::string(wav.begin() + 36, wav.begin() + 40), "data");
    // sample rate, little-endian
    uint32_t rate = wav[24] | (wav[25] << 8) | (wav[26] << 16) | (static_cast<uint32_t>(wav[27]) << 24);
    EXPECT_EQ(rate, 16000u);
    uint32_t dataSize = wav[40] | (wav[41] << 8) | (wav[42] << 16) | (static_cast<uint32_t>(wav[43]) << 24);
    EXPECT_EQ(dataSize, 320u);
}

TEST(PcmUtilsTest, AudioFormat) {
    AudioFormat format;
    EXPECT_EQ(format.getBytesPerSample(), 2u);
    EXPECT_EQ(format.bytesForMs(20), 640u);
    EXPECT_EQ(format.bytesForMs(1000), 32000u);
    EXPECT_STREQ(containerTypeToString(ContainerType::WEBM), "webm");
}

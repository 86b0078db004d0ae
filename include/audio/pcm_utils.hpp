#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace meddictate {
namespace audio {

// Audio format of everything downstream of the decoder
struct AudioFormat {
    uint32_t sampleRate;    // 16000 Hz
    uint16_t channels;      // 1 (mono)
    uint16_t bitsPerSample; // 16
    
    AudioFormat() : sampleRate(16000), channels(1), bitsPerSample(16) {}
    
    size_t getBytesPerSample() const {
        return bitsPerSample / 8;
    }
    
    size_t bytesForMs(uint32_t ms) const {
        return static_cast<size_t>(sampleRate) * ms / 1000 * channels * getBytesPerSample();
    }
};

enum class ContainerType {
    UNKNOWN,
    WEBM,   // EBML: Matroska / WebM
    OGG,
    WAV
};

const char* containerTypeToString(ContainerType type);

// s16le <-> normalized float
std::vector<float> pcmToFloat(const uint8_t* data, size_t size);
std::vector<float> pcmToFloat(const std::vector<uint8_t>& pcm);
std::vector<uint8_t> floatToPcm(const std::vector<float>& samples);

// Root mean square of normalized samples
float calculateRms(const float* samples, size_t count);

// Fraction of adjacent sample pairs whose sign differs
float calculateZeroCrossingRate(const float* samples, size_t count);

// Container magic at the start of the buffer
ContainerType detectContainer(const std::vector<uint8_t>& data);

// Offset of the first container header anywhere in the buffer, or npos
size_t findContainerHeader(const std::vector<uint8_t>& data, ContainerType* type = nullptr);

// 44-byte RIFF/WAVE header followed by the PCM payload
std::vector<uint8_t> makeWavFile(const std::vector<uint8_t>& pcm, const AudioFormat& format = AudioFormat{});

} // namespace audio
} // namespace meddictate

#include "audio/pcm_utils.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace meddictate {
namespace audio {

namespace {

const uint8_t kEbmlMagic[] = {0x1A, 0x45, 0xDF, 0xA3};
const uint8_t kOggMagic[] = {'O', 'g', 'g', 'S'};
const uint8_t kRiffMagic[] = {'R', 'I', 'F', 'F'};

bool matchesAt(const std::vector<uint8_t>& data, size_t offset, const uint8_t* magic, size_t length) {
    if (offset + length > data.size()) {
        return false;
    }
    return std::equal(magic, magic + length, data.begin() + offset);
}

void appendLe32(std::vector<uint8_t>& out, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

void appendLe16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
}

void appendTag(std::vector<uint8_t>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

} // namespace

const char* containerTypeToString(ContainerType type) {
    switch (type) {
        case ContainerType::WEBM: return "webm";
        case ContainerType::OGG: return "ogg";
        case ContainerType::WAV: return "wav";
        case ContainerType::UNKNOWN: return "unknown";
    }
    return "unknown";
}

std::vector<float> pcmToFloat(const uint8_t* data, size_t size) {
    std::vector<float> samples;
    size_t count = size / 2;
    samples.reserve(count);
    
    for (size_t i = 0; i < count; ++i) {
        int16_t sample = static_cast<int16_t>(
            static_cast<uint16_t>(data[2 * i]) | (static_cast<uint16_t>(data[2 * i + 1]) << 8));
        samples.push_back(static_cast<float>(sample) / 32768.0f);
    }
    return samples;
}

std::vector<float> pcmToFloat(const std::vector<uint8_t>& pcm) {
    return pcmToFloat(pcm.data(), pcm.size());
}

std::vector<uint8_t> floatToPcm(const std::vector<float>& samples) {
    std::vector<uint8_t> pcm;
    pcm.reserve(samples.size() * 2);
    
    for (float sample : samples) {
        float clamped = std::max(-1.0f, std::min(1.0f, sample));
        int16_t value = static_cast<int16_t>(clamped * 32767.0f);
        uint16_t bits = static_cast<uint16_t>(value);
        pcm.push_back(static_cast<uint8_t>(bits & 0xFF));
        pcm.push_back(static_cast<uint8_t>((bits >> 8) & 0xFF));
    }
    return pcm;
}

float calculateRms(const float* samples, size_t count) {
    if (count == 0) {
        return 0.0f;
    }
    double sum = 0.0;
    for (size_t i = 0; i < count; ++i) {
        sum += static_cast<double>(samples[i]) * samples[i];
    }
    return static_cast<float>(std::sqrt(sum / count));
}

float calculateZeroCrossingRate(const float* samples, size_t count) {
    if (count < 2) {
        return 0.0f;
    }
    size_t crossings = 0;
    for (size_t i = 1; i < count; ++i) {
        if ((samples[i] >= 0.0f) != (samples[i - 1] >= 0.0f)) {
            ++crossings;
        }
    }
    return static_cast<float>(crossings) / static_cast<float>(count - 1);
}

ContainerType detectContainer(const std::vector<uint8_t>& data) {
    if (matchesAt(data, 0, kEbmlMagic, sizeof(kEbmlMagic))) {
        return ContainerType::WEBM;
    }
    if (matchesAt(data, 0, kOggMagic, sizeof(kOggMagic))) {
        return ContainerType::OGG;
    }
    if (matchesAt(data, 0, kRiffMagic, sizeof(kRiffMagic)) && data.size() >= 12 &&
        data[8] == 'W' && data[9] == 'A' && data[10] == 'V' && data[11] == 'E') {
        return ContainerType::WAV;
    }
    return ContainerType::UNKNOWN;
}

size_t findContainerHeader(const std::vector<uint8_t>& data, ContainerType* type) {
    for (size_t offset = 0; offset + 4 <= data.size(); ++offset) {
        if (matchesAt(data, offset, kEbmlMagic, sizeof(kEbmlMagic))) {
            if (type) *type = ContainerType::WEBM;
            return offset;
        }
        if (matchesAt(data, offset, kOggMagic, sizeof(kOggMagic))) {
            if (type) *type = ContainerType::OGG;
            return offset;
        }
        if (matchesAt(data, offset, kRiffMagic, sizeof(kRiffMagic))) {
            if (type) *type = ContainerType::WAV;
            return offset;
        }
    }
    if (type) *type = ContainerType::UNKNOWN;
    return std::string::npos;
}

std::vector<uint8_t> makeWavFile(const std::vector<uint8_t>& pcm, const AudioFormat& format) {
    const uint32_t dataSize = static_cast<uint32_t>(pcm.size());
    const uint16_t blockAlign = static_cast<uint16_t>(format.channels * format.getBytesPerSample());
    const uint32_t byteRate = format.sampleRate * blockAlign;
    
    std::vector<uint8_t> wav;
    wav.reserve(44 + pcm.size());
    
    appendTag(wav, "RIFF");
    appendLe32(wav, 36 + dataSize);
    appendTag(wav, "WAVE");
    appendTag(wav, "fmt ");
    appendLe32(wav, 16);                 // PCM fmt chunk size
    appendLe16(wav, 1);                  // linear PCM
    appendLe16(wav, format.channels);
    appendLe32(wav, format.sampleRate);
    appendLe32(wav, byteRate);
    appendLe16(wav, blockAlign);
    appendLe16(wav, format.bitsPerSample);
    appendTag(wav, "data");
    appendLe32(wav, dataSize);
    wav.insert(wav.end(), pcm.begin(), pcm.end());
    
    return wav;
}

} // namespace audio
} // namespace meddictate

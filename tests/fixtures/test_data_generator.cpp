#include "test_data_generator.hpp"
#include "audio/pcm_utils.hpp"
#include <algorithm>
#include <cmath>

namespace fixtures {

namespace {
constexpr float kPi = 3.14159265358979f;

size_t sampleCount(float duration, int sampleRate) {
    return static_cast<size_t>(std::lround(duration * static_cast<float>(sampleRate)));
}
} // namespace

TestDataGenerator::TestDataGenerator(uint32_t seed) : rng_(seed) {}

std::vector<float> TestDataGenerator::generateSilence(float duration, int sampleRate) const {
    return std::vector<float>(sampleCount(duration, sampleRate), 0.0f);
}

std::vector<float> TestDataGenerator::generateSpeechLikeAudio(float duration, int sampleRate,
                                                              float amplitude) {
    std::uniform_real_distribution<float> dist(-amplitude, amplitude);
    std::vector<float> samples(sampleCount(duration, sampleRate));
    for (auto& sample : samples) {
        sample = dist(rng_);
    }
    return samples;
}

std::vector<float> TestDataGenerator::generateNoiseAudio(float duration, int sampleRate,
                                                         float amplitude) {
    return generateSpeechLikeAudio(duration, sampleRate, amplitude);
}

std::vector<float> TestDataGenerator::generateTone(float frequency, float duration,
                                                   int sampleRate, float amplitude) const {
    std::vector<float> samples(sampleCount(duration, sampleRate));
    for (size_t i = 0; i < samples.size(); ++i) {
        samples[i] = amplitude * std::sin(2.0f * kPi * frequency * static_cast<float>(i) /
                                          static_cast<float>(sampleRate));
    }
    return samples;
}

std::vector<float> TestDataGenerator::generateScenario(const std::vector<AudioSegment>& segments,
                                                       int sampleRate) {
    std::vector<float> audio;
    for (const auto& segment : segments) {
        std::vector<float> part;
        switch (segment.type) {
            case SegmentType::SPEECH:
                part = generateSpeechLikeAudio(segment.duration, sampleRate);
                break;
            case SegmentType::SILENCE:
                part = generateSilence(segment.duration, sampleRate);
                break;
            case SegmentType::NOISE:
                part = generateNoiseAudio(segment.duration, sampleRate);
                break;
        }
        audio.insert(audio.end(), part.begin(), part.end());
    }
    return audio;
}

std::vector<uint8_t> TestDataGenerator::toPcm(const std::vector<float>& samples) {
    return meddictate::audio::floatToPcm(samples);
}

std::vector<uint8_t> TestDataGenerator::toWavFile(const std::vector<float>& samples) {
    return meddictate::audio::makeWavFile(toPcm(samples));
}

std::vector<std::vector<uint8_t>> TestDataGenerator::splitIntoChunks(const std::vector<uint8_t>& data,
                                                                     size_t chunkSize) {
    std::vector<std::vector<uint8_t>> chunks;
    for (size_t offset = 0; offset < data.size(); offset += chunkSize) {
        size_t end = std::min(data.size(), offset + chunkSize);
        chunks.emplace_back(data.begin() + static_cast<std::ptrdiff_t>(offset),
                            data.begin() + static_cast<std::ptrdiff_t>(end));
    }
    return chunks;
}

std::string TestDataGenerator::sampleLexiconJson() {
    return R"json({
    "phonetic_corrections": {
        "Mammographie": ["Mamografie", "Mammografie"],
        "Befund": ["Befunt"],
        "Lymphknoten": ["Lymph Knoten", "Limfknoten"],
        "Zyste": ["Ziste"]
    },
    "medical_terms": {
        "mammography": {
            "procedures": ["Mammographie", "Biopsie"],
            "findings": ["Befund", "unauffällig", "Mikrokalk", "Zyste", "Karzinom"]
        },
        "general": ["Lymphknoten", "Diagnose", "rechts", "links"]
    },
    "hallucination_patterns": [
        {
            "pattern": "(Untertitel|Vielen Dank fürs Zuschauen)",
            "description": "Typical subtitle hallucination",
            "severity": "high",
            "flags": "i"
        },
        {
            "pattern": "\\bDr\\.? ?[A-Z][a-z]+\\b",
            "description": "Unexpected person name",
            "severity": "low",
            "exceptions": ["Dr. Med"]
        }
    ],
    "confidence_thresholds": {
        "minimum_for_final_transcription": 0.6,
        "flag_for_review_below": 0.75
    },
    "contextual_validation": {
        "mammography_context": ["Mammographie", "Mikrokalk", "Parenchym"]
    }
})json";
}

} // namespace fixtures

#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <vector>

namespace meddictate {
namespace audio {

// VAD state machine states
enum class VadState {
    IDLE,             // not speaking, no speech frames pending
    SPEECH_DETECTED,  // not speaking, speech frames accumulating
    SPEAKING,         // speaking
    PAUSE_DETECTED    // speaking, silence frames accumulating
};

const char* vadStateToString(VadState state);

// VAD configuration parameters
struct VadConfig {
    uint32_t sampleRate = 16000;
    uint32_t frameDurationMs = 20;
    uint32_t speechThreshold = 2;       // consecutive speech frames to enter SPEAKING
    uint32_t silenceThreshold = 40;     // consecutive silence frames to leave SPEAKING
    float energyThreshold = 0.01f;      // RMS threshold until enough history exists
    float noiseFloor = 0.005f;          // lower bound of the adaptive threshold
    float zcrThreshold = 0.15f;
    uint32_t historyFrames = 50;        // ~1 s of 20 ms non-speech frames
    uint32_t minHistoryFrames = 10;
    float adaptiveMultiplier = 1.2f;
    
    bool isValid() const {
        return sampleRate > 0 && frameDurationMs > 0 &&
               getFrameSamples() > 1 &&
               speechThreshold > 0 && silenceThreshold > 0 &&
               energyThreshold > 0.0f && noiseFloor >= 0.0f &&
               zcrThreshold >= 0.0f && zcrThreshold <= 1.0f &&
               historyFrames > 0 && minHistoryFrames <= historyFrames &&
               adaptiveMultiplier > 0.0f;
    }
    
    uint32_t getFrameSamples() const {
        return sampleRate * frameDurationMs / 1000;
    }
    
    size_t getFrameBytes() const {
        return static_cast<size_t>(getFrameSamples()) * sizeof(int16_t);
    }
};

// Fired on every speaking/not-speaking transition
struct VadEvent {
    VadState previousState;
    VadState currentState;
    uint64_t frameIndex;
    float energy;
    float threshold;
    
    bool isSpeaking() const {
        return currentState == VadState::SPEAKING || currentState == VadState::PAUSE_DETECTED;
    }
};

/**
 * Energy + zero-crossing-rate voice activity detector with an adaptive
 * noise floor and frame-count hysteresis. Operates on 16-bit little-endian
 * mono PCM. One instance per session; not thread-safe.
 */
class VoiceActivityDetector {
public:
    using VadCallback = std::function<void(const VadEvent& event)>;
    
    // Throws std::invalid_argument for an invalid configuration
    explicit VoiceActivityDetector(const VadConfig& config = VadConfig{});
    
    void setConfig(const VadConfig& config);
    const VadConfig& getConfig() const { return config_; }
    
    void setVadCallback(VadCallback callback);
    
    // Re-frames pcm, classifies each complete frame, and returns pcm unchanged if the
    // detector is speaking once all frames are processed. A trailing partial frame is
    // kept for the next call.
    std::optional<std::vector<uint8_t>> process(const std::vector<uint8_t>& pcm);
    
    // Single-frame classification, before hysteresis
    bool isSpeechFrame(float energy, float zcr) const;
    
    bool isSpeaking() const { return speaking_; }
    VadState getCurrentState() const;
    float getCurrentThreshold() const { return threshold_; }
    size_t getPendingBytes() const { return pending_.size(); }
    
    // Clears counters, history and any pending partial frame
    void reset();
    
    struct Statistics {
        uint64_t totalFrames;
        uint64_t speechFrames;
        uint64_t silenceFrames;
        uint64_t speechSegments;
        double averageEnergy;
        float currentThreshold;
    };
    
    Statistics getStatistics() const;
    void resetStatistics();
    
private:
    void processFrame(const uint8_t* frame);
    void updateThreshold(float energy);
    void transition(bool speaking, float energy);
    
    VadConfig config_;
    VadCallback vadCallback_;
    
    std::vector<uint8_t> pending_;
    std::deque<float> energyHistory_;
    double historySum_;
    float threshold_;
    
    uint32_t speechRun_;
    uint32_t silenceRun_;
    bool speaking_;
    uint64_t frameIndex_;
    
    Statistics stats_;
    double energySum_;
};

} // namespace audio
} // namespace meddictate

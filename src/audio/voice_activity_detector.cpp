#include "audio/voice_activity_detector.hpp"
#include "audio/pcm_utils.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <stdexcept>

namespace meddictate {
namespace audio {

const char* vadStateToString(VadState state) {
    switch (state) {
        case VadState::IDLE: return "idle";
        case VadState::SPEECH_DETECTED: return "speech_detected";
        case VadState::SPEAKING: return "speaking";
        case VadState::PAUSE_DETECTED: return "pause_detected";
    }
    return "idle";
}

VoiceActivityDetector::VoiceActivityDetector(const VadConfig& config)
    : config_(config) {
    if (!config_.isValid()) {
        throw std::invalid_argument("Invalid VAD configuration");
    }
    reset();
    resetStatistics();
    
    utils::Logger::debug("VoiceActivityDetector created: frame " +
                         std::to_string(config_.getFrameSamples()) + " samples, hysteresis " +
                         std::to_string(config_.speechThreshold) + "/" +
                         std::to_string(config_.silenceThreshold) + " frames");
}

void VoiceActivityDetector::setConfig(const VadConfig& config) {
    if (!config.isValid()) {
        throw std::invalid_argument("Invalid VAD configuration");
    }
    config_ = config;
    reset();
}

void VoiceActivityDetector::setVadCallback(VadCallback callback) {
    vadCallback_ = std::move(callback);
}

std::optional<std::vector<uint8_t>> VoiceActivityDetector::process(const std::vector<uint8_t>& pcm) {
    const size_t frameBytes = config_.getFrameBytes();
    
    pending_.insert(pending_.end(), pcm.begin(), pcm.end());
    
    size_t offset = 0;
    while (pending_.size() - offset >= frameBytes) {
        processFrame(pending_.data() + offset);
        offset += frameBytes;
    }
    if (offset > 0) {
        pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(offset));
    }
    
    if (speaking_) {
        return pcm;
    }
    return std::nullopt;
}

bool VoiceActivityDetector::isSpeechFrame(float energy, float zcr) const {
    if (energy > threshold_) {
        return true;
    }
    // Quiet fricatives and whispers: moderate energy with a high crossing rate
    return energy > 0.5f * threshold_ && zcr > config_.zcrThreshold;
}

VadState VoiceActivityDetector::getCurrentState() const {
    if (speaking_) {
        return silenceRun_ > 0 ? VadState::PAUSE_DETECTED : VadState::SPEAKING;
    }
    return speechRun_ > 0 ? VadState::SPEECH_DETECTED : VadState::IDLE;
}

void VoiceActivityDetector::reset() {
    pending_.clear();
    energyHistory_.clear();
    historySum_ = 0.0;
    threshold_ = config_.energyThreshold;
    speechRun_ = 0;
    silenceRun_ = 0;
    speaking_ = false;
    frameIndex_ = 0;
}

VoiceActivityDetector::Statistics VoiceActivityDetector::getStatistics() const {
    Statistics stats = stats_;
    stats.averageEnergy = stats_.totalFrames > 0 ? energySum_ / stats_.totalFrames : 0.0;
    stats.currentThreshold = threshold_;
    return stats;
}

void VoiceActivityDetector::resetStatistics() {
    stats_ = {};
    energySum_ = 0.0;
}

void VoiceActivityDetector::processFrame(const uint8_t* frame) {
    const uint32_t samples = config_.getFrameSamples();
    std::vector<float> normalized = pcmToFloat(frame, samples * sizeof(int16_t));
    
    float energy = calculateRms(normalized.data(), normalized.size());
    float zcr = calculateZeroCrossingRate(normalized.data(), normalized.size());
    bool speech = isSpeechFrame(energy, zcr);
    
    stats_.totalFrames++;
    energySum_ += energy;
    if (speech) {
        stats_.speechFrames++;
        speechRun_++;
        silenceRun_ = 0;
        if (!speaking_ && speechRun_ >= config_.speechThreshold) {
            transition(true, energy);
        }
    } else {
        stats_.silenceFrames++;
        silenceRun_++;
        speechRun_ = 0;
        if (speaking_ && silenceRun_ >= config_.silenceThreshold) {
            transition(false, energy);
        }
    }
    
    // The baseline follows ambient noise only; speech never raises it
    if (!speech) {
        updateThreshold(energy);
    }
    frameIndex_++;
}

void VoiceActivityDetector::updateThreshold(float energy) {
    energyHistory_.push_back(energy);
    historySum_ += energy;
    if (energyHistory_.size() > config_.historyFrames) {
        historySum_ -= energyHistory_.front();
        energyHistory_.pop_front();
    }
    
    if (energyHistory_.size() >= config_.minHistoryFrames) {
        float mean = static_cast<float>(historySum_ / energyHistory_.size());
        threshold_ = std::max(config_.noiseFloor, mean * config_.adaptiveMultiplier);
    }
}

void VoiceActivityDetector::transition(bool speaking, float energy) {
    VadState previous = getCurrentState();
    speaking_ = speaking;
    if (speaking) {
        stats_.speechSegments++;
        silenceRun_ = 0;
    } else {
        speechRun_ = 0;
    }
    
    utils::Logger::debug(std::string("VAD ") + (speaking ? "speech start" : "speech end") +
                         " at frame " + std::to_string(frameIndex_) +
                         " (energy " + std::to_string(energy) +
                         ", threshold " + std::to_string(threshold_) + ")");
    
    if (vadCallback_) {
        VadEvent event{previous, getCurrentState(), frameIndex_, energy, threshold_};
        vadCallback_(event);
    }
}

} // namespace audio
} // namespace meddictate

#pragma once

#include <atomic>
#include <cstdint>

namespace meddictate {
namespace validation {

/**
 * Observability counters for the transcript validator. Owned by the caller
 * and passed in by reference, so each validator (or test) can have its own.
 */
struct ValidationMetrics {
    std::atomic<uint64_t> totalValidations{0};
    std::atomic<uint64_t> streamingValidations{0};
    std::atomic<uint64_t> correctionsApplied{0};     // validations with at least one correction
    std::atomic<uint64_t> hallucinationsDetected{0};
    std::atomic<uint64_t> unknownTermFlags{0};
    std::atomic<uint64_t> lowConfidenceFlags{0};
    std::atomic<uint64_t> userCorrections{0};
    
    struct Snapshot {
        uint64_t totalValidations;
        uint64_t streamingValidations;
        uint64_t correctionsApplied;
        uint64_t hallucinationsDetected;
        uint64_t unknownTermFlags;
        uint64_t lowConfidenceFlags;
        uint64_t userCorrections;
        double correctionRate;       // percent of full validations
        double hallucinationRate;    // percent of full validations
    };
    
    Snapshot snapshot() const {
        Snapshot s;
        s.totalValidations = totalValidations.load();
        s.streamingValidations = streamingValidations.load();
        s.correctionsApplied = correctionsApplied.load();
        s.hallucinationsDetected = hallucinationsDetected.load();
        s.unknownTermFlags = unknownTermFlags.load();
        s.lowConfidenceFlags = lowConfidenceFlags.load();
        s.userCorrections = userCorrections.load();
        s.correctionRate = s.totalValidations > 0
            ? 100.0 * s.correctionsApplied / s.totalValidations : 0.0;
        s.hallucinationRate = s.totalValidations > 0
            ? 100.0 * s.hallucinationsDetected / s.totalValidations : 0.0;
        return s;
    }
    
    void reset() {
        totalValidations = 0;
        streamingValidations = 0;
        correctionsApplied = 0;
        hallucinationsDetected = 0;
        unknownTermFlags = 0;
        lowConfidenceFlags = 0;
        userCorrections = 0;
    }
};

} // namespace validation
} // namespace meddictate

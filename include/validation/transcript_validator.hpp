#pragma once

#include "validation/medical_lexicon.hpp"
#include "validation/validation_metrics.hpp"

#include <cstddef>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace meddictate {
namespace validation {

struct Correction {
    std::string type;        // "phonetic_correction"
    std::string original;    // variant as listed in the lexicon
    std::string corrected;   // canonical term
    size_t occurrences = 0;
};

struct ValidationWarning {
    std::string type;        // potential_hallucination, unknown_medical_terms, low_confidence
    std::string message;
    Severity severity = Severity::MEDIUM;
    std::vector<std::string> matches;
};

struct ValidationResult {
    std::string originalText;
    std::string correctedText;
    double confidence = 0.0;
    double qualityScore = 0.1;     // always within [0.1, 1.0]
    std::vector<Correction> corrections;
    std::vector<ValidationWarning> warnings;
    std::set<std::string> flags;
    bool isValid = false;
    
    // Informational, not folded into qualityScore
    double contextScore = 1.0;
    std::vector<std::string> recognizedTerms;
    
    bool hasFlag(const std::string& flag) const { return flags.count(flag) > 0; }
};

namespace flags {
constexpr const char* kPotentialHallucination = "potential_hallucination";
constexpr const char* kLowConfidence = "low_confidence";
}

/**
 * Dictionary-driven cleanup of raw recognizer output: phonetic
 * corrections, hallucination patterns, terminology heuristics and
 * confidence gating. Pure and synchronous; safe to call from any thread.
 */
class TranscriptValidator {
public:
    static constexpr size_t kStreamingCorrectionLimit = 10;
    static constexpr double kHallucinationPenalty = 0.7;
    static constexpr double kUnknownTermPenalty = 0.8;
    static constexpr double kMinQualityScore = 0.1;
    static constexpr double kMinValidQuality = 0.5;
    
    TranscriptValidator(std::shared_ptr<const MedicalLexicon> lexicon, ValidationMetrics& metrics);
    
    ValidationResult validate(const std::string& text, double confidence,
                              const std::string& context = "") const;
    
    // Interim results: first kStreamingCorrectionLimit correction entries and the
    // confidence check only
    ValidationResult validateStreaming(const std::string& text, double confidence,
                                       const std::string& context = "") const;
    
    // Lexicon terms most similar to term (positional character matches / longer length)
    std::vector<std::string> suggestCorrections(const std::string& term,
                                                const std::string& context = "",
                                                size_t maxSuggestions = 3) const;
    
    // Operator feedback; logged and counted only
    void recordUserCorrection(const std::string& original, const std::string& corrected,
                              const std::string& context = "") const;
    
    static bool isLikelyMedicalTerm(const std::string& lowerWord);
    static double similarity(const std::string& a, const std::string& b);
    
    const MedicalLexicon& getLexicon() const { return *lexicon_; }
    ValidationMetrics& getMetrics() const { return metrics_; }

private:
    size_t applyPhoneticCorrections(std::string& text, std::vector<Correction>& corrections,
                                    size_t maxEntries) const;
    std::vector<ValidationWarning> detectHallucinations(const std::string& text) const;
    void checkTerminology(const std::string& text, const std::string& context,
                          ValidationResult& result, std::vector<std::string>& unknownTerms) const;
    bool applyConfidenceGate(double confidence, ValidationResult& result) const;
    
    std::shared_ptr<const MedicalLexicon> lexicon_;
    ValidationMetrics& metrics_;
};

} // namespace validation
} // namespace meddictate

#pragma once

#include <map>
#include <memory>
#include <regex>
#include <string>
#include <unordered_set>
#include <vector>

namespace meddictate {
namespace validation {

enum class Severity {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

const char* severityToString(Severity severity);
// Unknown names map to MEDIUM
Severity severityFromString(const std::string& name);

struct PhoneticCorrection {
    std::string canonical;
    std::vector<std::string> variants;
};

struct HallucinationPattern {
    std::string source;
    std::regex regex;
    std::string description;
    Severity severity = Severity::MEDIUM;
    std::vector<std::string> exceptions;
    bool caseInsensitive = false;
};

struct ConfidenceThresholds {
    double minimumForFinal = 0.0;
    double flagForReviewBelow = 0.0;
};

/**
 * Dictionary driving the transcript validator, normalized once at load.
 *
 * On-disk JSON keys: phonetic_corrections, medical_terms,
 * hallucination_patterns, confidence_thresholds, contextual_validation.
 * Immutable after construction and safe to share between threads.
 */
class MedicalLexicon {
public:
    // Empty lexicon: validation passes text through unchanged
    MedicalLexicon() = default;
    
    // Never throw. Failures are reported and yield an empty lexicon.
    static MedicalLexicon loadFromFile(const std::string& path);
    static MedicalLexicon loadFromString(const std::string& json,
                                         const std::string& sourceName = "<memory>");
    
    // Throws utils::LexiconException on malformed input
    static MedicalLexicon parse(const std::string& json);
    
    const std::vector<PhoneticCorrection>& getPhoneticCorrections() const { return corrections_; }
    const std::vector<HallucinationPattern>& getHallucinationPatterns() const { return patterns_; }
    const ConfidenceThresholds& getConfidenceThresholds() const { return thresholds_; }
    
    // word must be lower-case
    bool isKnownTerm(const std::string& word) const;
    // Sorted, lower-case
    const std::vector<std::string>& getAllTerms() const { return sortedTerms_; }
    size_t getTermCount() const { return terms_.size(); }
    
    // Terms for a context such as "mammography"; nullptr if none configured
    const std::vector<std::string>* getContextTerms(const std::string& context) const;
    std::vector<std::string> getContextNames() const;
    
    bool isEmpty() const;
    const std::string& getSource() const { return source_; }

private:
    std::vector<PhoneticCorrection> corrections_;
    std::vector<HallucinationPattern> patterns_;
    ConfidenceThresholds thresholds_;
    std::unordered_set<std::string> terms_;
    std::vector<std::string> sortedTerms_;
    std::map<std::string, std::vector<std::string>> contextTerms_;
    std::string source_;
};

} // namespace validation
} // namespace meddictate

#include "validation/transcript_validator.hpp"
#include "utils/logging.hpp"
#include "utils/string_utils.hpp"
#include <algorithm>
#include <cmath>

namespace meddictate {
namespace validation {

namespace {

const char* const kMedicalSuffixes[] = {
    "graphie", "tomie", "skopie", "pathie", "itis", "ose", "isch", "om", "gen"
};
const char* const kMedicalStems[] = {"lymph", "karpal"};

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

double sanitizeConfidence(double confidence) {
    if (std::isnan(confidence)) {
        return 0.0;
    }
    return std::max(0.0, std::min(1.0, confidence));
}

void addUnique(std::vector<std::string>& list, const std::string& value) {
    if (std::find(list.begin(), list.end(), value) == list.end()) {
        list.push_back(value);
    }
}

} // namespace

TranscriptValidator::TranscriptValidator(std::shared_ptr<const MedicalLexicon> lexicon,
                                         ValidationMetrics& metrics)
    : lexicon_(lexicon ? std::move(lexicon) : std::make_shared<const MedicalLexicon>()),
      metrics_(metrics) {
}

ValidationResult TranscriptValidator::validate(const std::string& text, double confidence,
                                               const std::string& context) const {
    metrics_.totalValidations++;
    
    ValidationResult result;
    result.originalText = text;
    result.correctedText = text;
    result.confidence = sanitizeConfidence(confidence);
    double score = 1.0;
    
    // Phonetic corrections never lower the score
    applyPhoneticCorrections(result.correctedText, result.corrections,
                             lexicon_->getPhoneticCorrections().size());
    
    // Penalties below apply once per category, not per match
    auto hallucinations = detectHallucinations(result.correctedText);
    if (!hallucinations.empty()) {
        result.warnings.insert(result.warnings.end(), hallucinations.begin(), hallucinations.end());
        result.flags.insert(flags::kPotentialHallucination);
        score *= kHallucinationPenalty;
        metrics_.hallucinationsDetected++;
    }
    
    std::vector<std::string> unknownTerms;
    checkTerminology(result.correctedText, context, result, unknownTerms);
    if (!unknownTerms.empty()) {
        ValidationWarning warning;
        warning.type = "unknown_medical_terms";
        warning.message = "Unknown medical terms: " + utils::join(unknownTerms, ", ");
        warning.severity = Severity::MEDIUM;
        warning.matches = unknownTerms;
        result.warnings.push_back(std::move(warning));
        score *= kUnknownTermPenalty;
        metrics_.unknownTermFlags++;
    }
    
    applyConfidenceGate(result.confidence, result);
    
    result.qualityScore = std::max(kMinQualityScore, std::min(1.0, score * result.confidence));
    result.isValid = result.qualityScore >= kMinValidQuality &&
                     result.confidence >= lexicon_->getConfidenceThresholds().minimumForFinal;
    
    if (!result.corrections.empty()) {
        metrics_.correctionsApplied++;
    }
    
    return result;
}

ValidationResult TranscriptValidator::validateStreaming(const std::string& text, double confidence,
                                                        const std::string& context) const {
    metrics_.streamingValidations++;
    
    ValidationResult result;
    result.originalText = text;
    result.correctedText = text;
    result.confidence = sanitizeConfidence(confidence);
    
    applyPhoneticCorrections(result.correctedText, result.corrections, kStreamingCorrectionLimit);
    applyConfidenceGate(result.confidence, result);
    
    result.qualityScore = std::max(kMinQualityScore, std::min(1.0, result.confidence));
    result.isValid = result.qualityScore >= kMinValidQuality &&
                     result.confidence >= lexicon_->getConfidenceThresholds().minimumForFinal;
    
    if (!context.empty()) {
        utils::Logger::debug("Streaming validation skips context checks for '" + context + "'");
    }
    return result;
}

std::vector<std::string> TranscriptValidator::suggestCorrections(const std::string& term,
                                                                 const std::string& context,
                                                                 size_t maxSuggestions) const {
    const std::string needle = utils::toLower(utils::trim(term));
    if (needle.empty() || maxSuggestions == 0) {
        return {};
    }
    
    std::vector<std::string> pool = lexicon_->getAllTerms();
    if (!context.empty()) {
        if (const auto* contextTerms = lexicon_->getContextTerms(context)) {
            for (const auto& contextTerm : *contextTerms) {
                addUnique(pool, contextTerm);
            }
        }
    }
    
    std::vector<std::pair<double, std::string>> scored;
    for (const auto& candidate : pool) {
        double score = similarity(needle, candidate);
        if (score > 0.5) {
            scored.emplace_back(score, candidate);
        }
    }
    
    std::sort(scored.begin(), scored.end(),
              [](const std::pair<double, std::string>& a, const std::pair<double, std::string>& b) {
                  if (a.first != b.first) {
                      return a.first > b.first;
                  }
                  return a.second < b.second;
              });
    
    std::vector<std::string> suggestions;
    for (size_t i = 0; i < scored.size() && i < maxSuggestions; ++i) {
        suggestions.push_back(scored[i].second);
    }
    return suggestions;
}

void TranscriptValidator::recordUserCorrection(const std::string& original,
                                               const std::string& corrected,
                                               const std::string& context) const {
    metrics_.userCorrections++;
    utils::Logger::info("User correction recorded: \"" + original + "\" -> \"" + corrected +
                        "\" (context: " + (context.empty() ? "none" : context) + ")");
}

bool TranscriptValidator::isLikelyMedicalTerm(const std::string& lowerWord) {
    if (utils::utf8Length(lowerWord) <= 5) {
        return false;
    }
    for (const char* suffix : kMedicalSuffixes) {
        if (endsWith(lowerWord, suffix)) {
            return true;
        }
    }
    for (const char* stem : kMedicalStems) {
        if (lowerWord.find(stem) != std::string::npos) {
            return true;
        }
    }
    return false;
}

double TranscriptValidator::similarity(const std::string& a, const std::string& b) {
    std::vector<std::string> left = utils::utf8Split(a);
    std::vector<std::string> right = utils::utf8Split(b);
    size_t maxLength = std::max(left.size(), right.size());
    if (maxLength == 0) {
        return 1.0;
    }
    
    size_t matches = 0;
    size_t minLength = std::min(left.size(), right.size());
    for (size_t i = 0; i < minLength; ++i) {
        if (left[i] == right[i]) {
            ++matches;
        }
    }
    return static_cast<double>(matches) / static_cast<double>(maxLength);
}

size_t TranscriptValidator::applyPhoneticCorrections(std::string& text,
                                                     std::vector<Correction>& corrections,
                                                     size_t maxEntries) const {
    const auto& entries = lexicon_->getPhoneticCorrections();
    size_t limit = std::min(maxEntries, entries.size());
    size_t total = 0;
    
    for (size_t i = 0; i < limit; ++i) {
        const PhoneticCorrection& entry = entries[i];
        for (const auto& variant : entry.variants) {
            std::string before = text;
            size_t count = utils::replaceWholeWord(text, variant, entry.canonical);
            if (count == 0 || text == before) {
                continue;
            }
            corrections.push_back(Correction{"phonetic_correction", variant, entry.canonical, count});
            total += count;
        }
    }
    return total;
}

std::vector<ValidationWarning> TranscriptValidator::detectHallucinations(const std::string& text) const {
    std::vector<ValidationWarning> warnings;
    
    for (const auto& pattern : lexicon_->getHallucinationPatterns()) {
        std::vector<std::string> matches;
        auto begin = std::sregex_iterator(text.begin(), text.end(), pattern.regex);
        for (auto it = begin; it != std::sregex_iterator(); ++it) {
            std::string match = it->str();
            if (match.empty()) {
                continue;
            }
            
            // Exceptions cover legitimate phrases that look like the pattern
            std::string lowerMatch = utils::toLower(match);
            bool excepted = std::any_of(pattern.exceptions.begin(), pattern.exceptions.end(),
                [&lowerMatch](const std::string& exception) {
                    std::string lowerException = utils::toLower(exception);
                    return lowerMatch.find(lowerException) != std::string::npos ||
                           lowerException.find(lowerMatch) != std::string::npos;
                });
            if (!excepted) {
                matches.push_back(match);
            }
        }
        
        if (!matches.empty()) {
            ValidationWarning warning;
            warning.type = "potential_hallucination";
            warning.message = pattern.description + ": " + utils::join(matches, ", ");
            warning.severity = pattern.severity;
            warning.matches = std::move(matches);
            warnings.push_back(std::move(warning));
        }
    }
    return warnings;
}

void TranscriptValidator::checkTerminology(const std::string& text, const std::string& context,
                                           ValidationResult& result,
                                           std::vector<std::string>& unknownTerms) const {
    // Without a term list every word would look unknown
    if (lexicon_->getTermCount() == 0) {
        return;
    }
    
    std::vector<std::string> words = utils::extractWords(text, 4);
    for (const auto& word : words) {
        if (lexicon_->isKnownTerm(word)) {
            addUnique(result.recognizedTerms, word);
        } else if (isLikelyMedicalTerm(word)) {
            addUnique(unknownTerms, word);
        }
    }
    
    if (!context.empty()) {
        if (const auto* contextTerms = lexicon_->getContextTerms(context)) {
            bool related = std::any_of(words.begin(), words.end(), [contextTerms](const std::string& word) {
                return std::any_of(contextTerms->begin(), contextTerms->end(),
                                   [&word](const std::string& term) {
                                       return term.find(word) != std::string::npos ||
                                              word.find(term) != std::string::npos;
                                   });
            });
            result.contextScore = related ? 1.0 : 0.8;
        }
    }
}

bool TranscriptValidator::applyConfidenceGate(double confidence, ValidationResult& result) const {
    if (confidence >= lexicon_->getConfidenceThresholds().flagForReviewBelow) {
        return false;
    }
    
    result.flags.insert(flags::kLowConfidence);
    ValidationWarning warning;
    warning.type = "low_confidence";
    warning.message = "Low transcription confidence: " +
                      std::to_string(std::lround(confidence * 100.0)) + "%";
    warning.severity = Severity::HIGH;
    result.warnings.push_back(std::move(warning));
    metrics_.lowConfidenceFlags++;
    return true;
}

} // namespace validation
} // namespace meddictate

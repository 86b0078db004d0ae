#include "validation/medical_lexicon.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include "utils/string_utils.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace meddictate {
namespace validation {

namespace {

// Keeps phonetic_corrections in file order
using Json = nlohmann::ordered_json;

const std::string kContextSuffix = "_context";

void flattenTerms(const Json& node, std::unordered_set<std::string>& terms) {
    if (node.is_string()) {
        std::string term = utils::trim(node.get<std::string>());
        if (!term.empty()) {
            terms.insert(utils::toLower(term));
        }
    } else if (node.is_array() || node.is_object()) {
        for (const auto& child : node) {
            flattenTerms(child, terms);
        }
    }
}

std::vector<std::string> stringList(const Json& node, const std::string& where) {
    std::vector<std::string> out;
    if (node.is_string()) {
        out.push_back(node.get<std::string>());
        return out;
    }
    if (!node.is_array()) {
        utils::Logger::warn("Lexicon: expected a list of strings for " + where);
        return out;
    }
    for (const auto& item : node) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        } else {
            utils::Logger::warn("Lexicon: ignoring non-string entry in " + where);
        }
    }
    return out;
}

void requireObject(const Json& node, const char* key) {
    if (!node.is_object()) {
        throw utils::LexiconException(std::string("'") + key + "' must be an object");
    }
}

} // namespace

const char* severityToString(Severity severity) {
    switch (severity) {
        case Severity::LOW: return "low";
        case Severity::MEDIUM: return "medium";
        case Severity::HIGH: return "high";
        case Severity::CRITICAL: return "critical";
    }
    return "medium";
}

Severity severityFromString(const std::string& name) {
    std::string lower = utils::toLower(name);
    if (lower == "low") return Severity::LOW;
    if (lower == "high") return Severity::HIGH;
    if (lower == "critical") return Severity::CRITICAL;
    return Severity::MEDIUM;
}

MedicalLexicon MedicalLexicon::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        utils::ErrorHandler::getInstance().reportError(utils::ErrorInfo(
            utils::ErrorCategory::LEXICON, utils::ErrorSeverity::WARNING,
            "Medical lexicon not found, validation runs in pass-through mode", path, "MedicalLexicon"));
        return MedicalLexicon();
    }
    
    std::stringstream buffer;
    buffer << file.rdbuf();
    return loadFromString(buffer.str(), path);
}

MedicalLexicon MedicalLexicon::loadFromString(const std::string& json, const std::string& sourceName) {
    try {
        MedicalLexicon lexicon = parse(json);
        lexicon.source_ = sourceName;
        utils::Logger::info("Medical lexicon loaded from " + sourceName + ": " +
                            std::to_string(lexicon.corrections_.size()) + " corrections, " +
                            std::to_string(lexicon.terms_.size()) + " terms, " +
                            std::to_string(lexicon.patterns_.size()) + " hallucination patterns");
        return lexicon;
    } catch (const std::exception& e) {
        utils::ErrorHandler::getInstance().reportError(utils::ErrorInfo(
            utils::ErrorCategory::LEXICON, utils::ErrorSeverity::WARNING,
            "Medical lexicon invalid, validation runs in pass-through mode",
            e.what(), "MedicalLexicon"));
        return MedicalLexicon();
    }
}

MedicalLexicon MedicalLexicon::parse(const std::string& jsonText) {
    Json root;
    try {
        root = Json::parse(jsonText);
    } catch (const Json::parse_error& e) {
        throw utils::LexiconException(std::string("JSON syntax error: ") + e.what());
    }
    
    if (!root.is_object()) {
        throw utils::LexiconException("lexicon root must be an object");
    }
    
    MedicalLexicon lexicon;
    
    if (root.contains("phonetic_corrections")) {
        const auto& corrections = root["phonetic_corrections"];
        requireObject(corrections, "phonetic_corrections");
        for (const auto& entry : corrections.items()) {
            PhoneticCorrection correction;
            correction.canonical = entry.key();
            for (const auto& variant : stringList(entry.value(), "phonetic_corrections." + entry.key())) {
                if (!utils::trim(variant).empty()) {
                    correction.variants.push_back(variant);
                }
            }
            if (!correction.canonical.empty() && !correction.variants.empty()) {
                lexicon.corrections_.push_back(std::move(correction));
            }
        }
    }
    
    if (root.contains("medical_terms")) {
        flattenTerms(root["medical_terms"], lexicon.terms_);
    }
    lexicon.sortedTerms_.assign(lexicon.terms_.begin(), lexicon.terms_.end());
    std::sort(lexicon.sortedTerms_.begin(), lexicon.sortedTerms_.end());
    
    if (root.contains("hallucination_patterns")) {
        const auto& patterns = root["hallucination_patterns"];
        if (!patterns.is_array()) {
            throw utils::LexiconException("'hallucination_patterns' must be an array");
        }
        for (const auto& item : patterns) {
            if (!item.is_object() || !item.contains("pattern") || !item["pattern"].is_string()) {
                utils::Logger::warn("Lexicon: skipping hallucination pattern without 'pattern'");
                continue;
            }
            
            HallucinationPattern pattern;
            pattern.source = item["pattern"].get<std::string>();
            pattern.description = item.value("description", std::string("Potential hallucination"));
            pattern.severity = severityFromString(item.value("severity", std::string("medium")));
            if (item.contains("exceptions")) {
                pattern.exceptions = stringList(item["exceptions"], "exceptions of " + pattern.source);
            }
            pattern.caseInsensitive = item.value("flags", std::string()).find('i') != std::string::npos;
            
            auto flags = std::regex::ECMAScript;
            if (pattern.caseInsensitive) {
                flags |= std::regex::icase;
            }
            try {
                pattern.regex = std::regex(pattern.source, flags);
            } catch (const std::regex_error& e) {
                utils::Logger::warn("Lexicon: skipping invalid pattern '" + pattern.source +
                                    "': " + e.what());
                continue;
            }
            lexicon.patterns_.push_back(std::move(pattern));
        }
    }
    
    if (root.contains("confidence_thresholds")) {
        const auto& thresholds = root["confidence_thresholds"];
        requireObject(thresholds, "confidence_thresholds");
        lexicon.thresholds_.minimumForFinal =
            thresholds.value("minimum_for_final_transcription", 0.0);
        lexicon.thresholds_.flagForReviewBelow =
            thresholds.value("flag_for_review_below", 0.0);
    }
    
    if (root.contains("contextual_validation")) {
        const auto& contexts = root["contextual_validation"];
        requireObject(contexts, "contextual_validation");
        for (const auto& entry : contexts.items()) {
            std::string name = utils::toLower(entry.key());
            if (name.size() > kContextSuffix.size() &&
                name.compare(name.size() - kContextSuffix.size(), kContextSuffix.size(), kContextSuffix) == 0) {
                name.erase(name.size() - kContextSuffix.size());
            }
            std::vector<std::string> terms;
            for (const auto& term : stringList(entry.value(), "contextual_validation." + entry.key())) {
                terms.push_back(utils::toLower(term));
            }
            lexicon.contextTerms_[name] = std::move(terms);
        }
    }
    
    return lexicon;
}

bool MedicalLexicon::isKnownTerm(const std::string& word) const {
    return terms_.count(word) > 0;
}

const std::vector<std::string>* MedicalLexicon::getContextTerms(const std::string& context) const {
    auto it = contextTerms_.find(utils::toLower(context));
    if (it == contextTerms_.end() || it->second.empty()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<std::string> MedicalLexicon::getContextNames() const {
    std::vector<std::string> names;
    for (const auto& entry : contextTerms_) {
        names.push_back(entry.first);
    }
    return names;
}

bool MedicalLexicon::isEmpty() const {
    return corrections_.empty() && patterns_.empty() && terms_.empty() && contextTerms_.empty();
}

} // namespace validation
} // namespace meddictate

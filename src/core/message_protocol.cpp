#include "core/message_protocol.hpp"
#include "utils/base64.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include "utils/string_utils.hpp"

#include <nlohmann/json.hpp>

namespace meddictate {
namespace core {

using json = nlohmann::json;

namespace {

json makeEnvelope(MessageType type, const std::string& sessionId, json data) {
    if (!sessionId.empty()) {
        data["sessionId"] = sessionId;
    }
    json root;
    root["type"] = MessageProtocol::messageTypeToString(type);
    root["data"] = std::move(data);
    return root;
}

json configToJson(const SessionConfig& config) {
    json data;
    data["language"] = config.language;
    if (config.medicalContext) {
        data["medicalContext"] = medicalContextToString(*config.medicalContext);
    } else {
        data["medicalContext"] = nullptr;
    }
    return data;
}

void readSessionId(const json& root, Message& message) {
    auto it = root.find("sessionId");
    if (it == root.end() || it->is_null()) {
        return;
    }
    if (!it->is_string()) {
        throw utils::ProtocolException("sessionId", "sessionId must be a string");
    }
    message.setSessionId(it->get<std::string>());
}

SessionConfig parseSessionConfig(const json& node, const std::string& field) {
    if (!node.is_object()) {
        throw utils::ProtocolException(field, field + " must be an object");
    }
    
    SessionConfig config;
    auto language = node.find("language");
    if (language == node.end() || !language->is_string() || language->get<std::string>().empty()) {
        throw utils::ProtocolException(field + ".language", "language must be a non-empty string");
    }
    config.language = language->get<std::string>();
    
    auto context = node.find("medicalContext");
    if (context != node.end() && !context->is_null()) {
        if (!context->is_string()) {
            throw utils::ProtocolException(field + ".medicalContext", "medicalContext must be a string");
        }
        auto parsed = medicalContextFromString(context->get<std::string>());
        if (!parsed) {
            throw utils::ProtocolException(field + ".medicalContext",
                                           "unknown medical context: " + context->get<std::string>());
        }
        config.medicalContext = *parsed;
    }
    return config;
}

} // namespace

const char* medicalContextToString(MedicalContext context) {
    switch (context) {
        case MedicalContext::GENERAL: return "general";
        case MedicalContext::MAMMOGRAPHY: return "mammography";
        case MedicalContext::ULTRASOUND: return "ultrasound";
        case MedicalContext::SPINE: return "spine";
        case MedicalContext::RADIOLOGY: return "radiology";
        case MedicalContext::CARDIOLOGY: return "cardiology";
    }
    return "general";
}

std::optional<MedicalContext> medicalContextFromString(const std::string& name) {
    std::string lower = utils::toLower(name);
    if (lower == "general") return MedicalContext::GENERAL;
    if (lower == "mammography") return MedicalContext::MAMMOGRAPHY;
    if (lower == "ultrasound") return MedicalContext::ULTRASOUND;
    if (lower == "spine") return MedicalContext::SPINE;
    if (lower == "radiology") return MedicalContext::RADIOLOGY;
    if (lower == "cardiology") return MedicalContext::CARDIOLOGY;
    return std::nullopt;
}

std::string SessionConfig::getContextName() const {
    if (!medicalContext || *medicalContext == MedicalContext::GENERAL) {
        return "";
    }
    return medicalContextToString(*medicalContext);
}

// AudioMessage implementation
std::string AudioMessage::serialize() const {
    json root;
    root["type"] = "audio";
    root["data"] = utils::base64Encode(audio_);
    if (!sessionId_.empty()) {
        root["sessionId"] = sessionId_;
    }
    return root.dump();
}

// ConfigMessage implementation
std::string ConfigMessage::serialize() const {
    json root;
    root["type"] = "config";
    root["config"] = configToJson(config_);
    if (!sessionId_.empty()) {
        root["sessionId"] = sessionId_;
    }
    return root.dump();
}

// StartSessionMessage implementation
std::string StartSessionMessage::serialize() const {
    json root;
    root["type"] = "start_session";
    if (config_) {
        root["config"] = configToJson(*config_);
    }
    if (!sessionId_.empty()) {
        root["sessionId"] = sessionId_;
    }
    return root.dump();
}

// EndSessionMessage implementation
std::string EndSessionMessage::serialize() const {
    json root;
    root["type"] = "end_session";
    if (!sessionId_.empty()) {
        root["sessionId"] = sessionId_;
    }
    return root.dump();
}

// PingMessage implementation
std::string PingMessage::serialize() const {
    json root;
    root["type"] = "ping";
    return root.dump();
}

// AsrResultMessage implementation
std::string AsrResultMessage::serialize() const {
    json root;
    root["type"] = "asr_result";
    root["text"] = text_;
    root["confidence"] = confidence_;
    root["isPartial"] = isPartial_;
    if (!language_.empty()) {
        root["language"] = language_;
    }
    if (!sessionId_.empty()) {
        root["sessionId"] = sessionId_;
    }
    return root.dump();
}

// TranscriptionMessage implementation
std::string TranscriptionMessage::serialize() const {
    json data;
    data["text"] = result_.correctedText;
    data["originalText"] = result_.originalText;
    data["correctedText"] = result_.correctedText;
    data["language"] = language_;
    data["confidence"] = result_.confidence;
    data["qualityScore"] = result_.qualityScore;
    data["isFinal"] = isFinal_;
    data["isValid"] = result_.isValid;
    
    json corrections = json::array();
    for (const auto& correction : result_.corrections) {
        corrections.push_back({
            {"type", correction.type},
            {"original", correction.original},
            {"corrected", correction.corrected},
            {"occurrences", correction.occurrences}
        });
    }
    data["corrections"] = std::move(corrections);
    
    json warnings = json::array();
    for (const auto& warning : result_.warnings) {
        json entry = {
            {"type", warning.type},
            {"message", warning.message},
            {"severity", validation::severityToString(warning.severity)}
        };
        if (!warning.matches.empty()) {
            entry["matches"] = warning.matches;
        }
        warnings.push_back(std::move(entry));
    }
    data["warnings"] = std::move(warnings);
    
    data["flags"] = json(std::vector<std::string>(result_.flags.begin(), result_.flags.end()));
    data["recognizedTerms"] = result_.recognizedTerms;
    
    return makeEnvelope(type_, sessionId_, std::move(data)).dump();
}

// ConfigUpdatedMessage implementation
std::string ConfigUpdatedMessage::serialize() const {
    return makeEnvelope(type_, sessionId_, configToJson(config_)).dump();
}

// SessionStartedMessage implementation
std::string SessionStartedMessage::serialize() const {
    return makeEnvelope(type_, sessionId_, configToJson(config_)).dump();
}

// SessionEndedMessage implementation
std::string SessionEndedMessage::serialize() const {
    json data;
    data["totalTranscriptions"] = totalTranscriptions_;
    data["durationSeconds"] = durationSeconds_;
    data["transcript"] = transcript_;
    return makeEnvelope(type_, sessionId_, std::move(data)).dump();
}

// StatusUpdateMessage implementation
std::string StatusUpdateMessage::serialize() const {
    json data;
    data["state"] = MessageProtocol::stateToString(state_);
    return makeEnvelope(type_, sessionId_, std::move(data)).dump();
}

// PongMessage implementation
std::string PongMessage::serialize() const {
    return makeEnvelope(type_, sessionId_, json::object()).dump();
}

// ErrorMessage implementation
std::string ErrorMessage::serialize() const {
    json data;
    data["code"] = code_;
    data["message"] = message_;
    if (!field_.empty()) {
        data["field"] = field_;
    }
    return makeEnvelope(type_, sessionId_, std::move(data)).dump();
}

// MessageProtocol implementation
std::unique_ptr<Message> MessageProtocol::parseMessage(const std::string& text) {
    json root = json::parse(text, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        throw utils::ProtocolException("json", "message is not a JSON object");
    }
    
    auto typeIt = root.find("type");
    if (typeIt == root.end() || !typeIt->is_string()) {
        throw utils::ProtocolException("type", "missing message type");
    }
    
    std::string typeStr = typeIt->get<std::string>();
    std::unique_ptr<Message> message;
    
    switch (stringToMessageType(typeStr)) {
        case MessageType::AUDIO: {
            auto dataIt = root.find("data");
            if (dataIt == root.end() || !dataIt->is_string()) {
                throw utils::ProtocolException("data", "audio data must be a base64 string");
            }
            auto decoded = utils::base64Decode(dataIt->get<std::string>());
            if (!decoded) {
                throw utils::ProtocolException("data", "audio data is not valid base64");
            }
            message = std::make_unique<AudioMessage>(std::move(*decoded));
            break;
        }
        
        case MessageType::CONFIG: {
            auto configIt = root.find("config");
            if (configIt == root.end()) {
                throw utils::ProtocolException("config", "missing config object");
            }
            message = std::make_unique<ConfigMessage>(parseSessionConfig(*configIt, "config"));
            break;
        }
        
        case MessageType::START_SESSION: {
            auto start = std::make_unique<StartSessionMessage>();
            auto configIt = root.find("config");
            if (configIt != root.end() && !configIt->is_null()) {
                start->setConfig(parseSessionConfig(*configIt, "config"));
            }
            message = std::move(start);
            break;
        }
        
        case MessageType::END_SESSION:
            message = std::make_unique<EndSessionMessage>();
            break;
            
        case MessageType::PING:
            message = std::make_unique<PingMessage>();
            break;
            
        case MessageType::ASR_RESULT: {
            auto result = std::make_unique<AsrResultMessage>();
            auto textIt = root.find("text");
            if (textIt == root.end() || !textIt->is_string()) {
                throw utils::ProtocolException("text", "text must be a string");
            }
            auto confidenceIt = root.find("confidence");
            if (confidenceIt == root.end() || !confidenceIt->is_number()) {
                throw utils::ProtocolException("confidence", "confidence must be a number");
            }
            result->setText(textIt->get<std::string>());
            result->setConfidence(confidenceIt->get<double>());
            
            auto languageIt = root.find("language");
            if (languageIt != root.end() && !languageIt->is_null()) {
                if (!languageIt->is_string()) {
                    throw utils::ProtocolException("language", "language must be a string");
                }
                result->setLanguage(languageIt->get<std::string>());
            }
            auto partialIt = root.find("isPartial");
            if (partialIt != root.end() && !partialIt->is_null()) {
                if (!partialIt->is_boolean()) {
                    throw utils::ProtocolException("isPartial", "isPartial must be a boolean");
                }
                result->setPartial(partialIt->get<bool>());
            }
            message = std::move(result);
            break;
        }
        
        default:
            throw utils::ProtocolException("type", "unsupported message type: " + typeStr);
    }
    
    readSessionId(root, *message);
    return message;
}

bool MessageProtocol::validateMessage(const std::string& text) {
    try {
        return parseMessage(text) != nullptr;
    } catch (const utils::ProtocolException& e) {
        utils::Logger::debug("Rejected message, field '" + e.getField() + "': " + e.what());
        return false;
    }
}

MessageType MessageProtocol::stringToMessageType(const std::string& typeStr) {
    if (typeStr == "audio") return MessageType::AUDIO;
    if (typeStr == "config") return MessageType::CONFIG;
    if (typeStr == "start_session") return MessageType::START_SESSION;
    if (typeStr == "end_session") return MessageType::END_SESSION;
    if (typeStr == "ping") return MessageType::PING;
    if (typeStr == "asr_result") return MessageType::ASR_RESULT;
    if (typeStr == "transcription") return MessageType::TRANSCRIPTION;
    if (typeStr == "config_updated") return MessageType::CONFIG_UPDATED;
    if (typeStr == "session_started") return MessageType::SESSION_STARTED;
    if (typeStr == "session_ended") return MessageType::SESSION_ENDED;
    if (typeStr == "status_update") return MessageType::STATUS_UPDATE;
    if (typeStr == "pong") return MessageType::PONG;
    if (typeStr == "error") return MessageType::ERROR;
    return MessageType::UNKNOWN;
}

std::string MessageProtocol::messageTypeToString(MessageType type) {
    switch (type) {
        case MessageType::AUDIO: return "audio";
        case MessageType::CONFIG: return "config";
        case MessageType::START_SESSION: return "start_session";
        case MessageType::END_SESSION: return "end_session";
        case MessageType::PING: return "ping";
        case MessageType::ASR_RESULT: return "asr_result";
        case MessageType::TRANSCRIPTION: return "transcription";
        case MessageType::CONFIG_UPDATED: return "config_updated";
        case MessageType::SESSION_STARTED: return "session_started";
        case MessageType::SESSION_ENDED: return "session_ended";
        case MessageType::STATUS_UPDATE: return "status_update";
        case MessageType::PONG: return "pong";
        case MessageType::ERROR: return "error";
        default: return "unknown";
    }
}

std::string MessageProtocol::stateToString(StatusUpdateMessage::State state) {
    switch (state) {
        case StatusUpdateMessage::State::IDLE: return "idle";
        case StatusUpdateMessage::State::LISTENING: return "listening";
        default: return "idle";
    }
}

} // namespace core
} // namespace meddictate

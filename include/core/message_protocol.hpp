#pragma once

#include "validation/transcript_validator.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace meddictate {
namespace core {

// Message types
enum class MessageType {
    UNKNOWN,
    // Client to Server
    AUDIO,
    CONFIG,
    START_SESSION,
    END_SESSION,
    PING,
    ASR_RESULT,
    // Server to Client
    TRANSCRIPTION,
    CONFIG_UPDATED,
    SESSION_STARTED,
    SESSION_ENDED,
    STATUS_UPDATE,
    PONG,
    ERROR
};

enum class MedicalContext {
    GENERAL,
    MAMMOGRAPHY,
    ULTRASOUND,
    SPINE,
    RADIOLOGY,
    CARDIOLOGY
};

const char* medicalContextToString(MedicalContext context);
std::optional<MedicalContext> medicalContextFromString(const std::string& name);

struct SessionConfig {
    std::string language = "de";
    std::optional<MedicalContext> medicalContext;
    
    // Context name handed to the validator; empty when none is set
    std::string getContextName() const;
};

// Base message class
class Message {
public:
    explicit Message(MessageType type) : type_(type) {}
    virtual ~Message() = default;
    
    MessageType getType() const { return type_; }
    
    // Empty when the sender did not name a session
    const std::string& getSessionId() const { return sessionId_; }
    void setSessionId(const std::string& sessionId) { sessionId_ = sessionId; }
    
    virtual std::string serialize() const = 0;
    
protected:
    MessageType type_;
    std::string sessionId_;
};

// Client to Server Messages
class AudioMessage : public Message {
public:
    AudioMessage() : Message(MessageType::AUDIO) {}
    explicit AudioMessage(std::vector<uint8_t> audio)
        : Message(MessageType::AUDIO), audio_(std::move(audio)) {}
    
    const std::vector<uint8_t>& getAudio() const { return audio_; }
    std::vector<uint8_t>& getAudio() { return audio_; }
    void setAudio(std::vector<uint8_t> audio) { audio_ = std::move(audio); }
    
    std::string serialize() const override;
    
private:
    std::vector<uint8_t> audio_;
};

class ConfigMessage : public Message {
public:
    ConfigMessage() : Message(MessageType::CONFIG) {}
    explicit ConfigMessage(const SessionConfig& config)
        : Message(MessageType::CONFIG), config_(config) {}
    
    const SessionConfig& getConfig() const { return config_; }
    void setConfig(const SessionConfig& config) { config_ = config; }
    
    std::string serialize() const override;
    
private:
    SessionConfig config_;
};

class StartSessionMessage : public Message {
public:
    StartSessionMessage() : Message(MessageType::START_SESSION) {}
    
    const std::optional<SessionConfig>& getConfig() const { return config_; }
    void setConfig(const SessionConfig& config) { config_ = config; }
    
    std::string serialize() const override;
    
private:
    std::optional<SessionConfig> config_;
};

class EndSessionMessage : public Message {
public:
    EndSessionMessage() : Message(MessageType::END_SESSION) {}
    std::string serialize() const override;
};

class PingMessage : public Message {
public:
    PingMessage() : Message(MessageType::PING) {}
    std::string serialize() const override;
};

// Recognizer output reported by an out-of-process ASR client
class AsrResultMessage : public Message {
public:
    AsrResultMessage() : Message(MessageType::ASR_RESULT), confidence_(0.0), isPartial_(false) {}
    AsrResultMessage(const std::string& text, double confidence, bool isPartial = false)
        : Message(MessageType::ASR_RESULT), text_(text), confidence_(confidence), isPartial_(isPartial) {}
    
    const std::string& getText() const { return text_; }
    double getConfidence() const { return confidence_; }
    const std::string& getLanguage() const { return language_; }
    bool isPartial() const { return isPartial_; }
    
    void setText(const std::string& text) { text_ = text; }
    void setConfidence(double confidence) { confidence_ = confidence; }
    void setLanguage(const std::string& language) { language_ = language; }
    void setPartial(bool isPartial) { isPartial_ = isPartial; }
    
    std::string serialize() const override;
    
private:
    std::string text_;
    double confidence_;
    std::string language_;
    bool isPartial_;
};

// Server to Client Messages
class TranscriptionMessage : public Message {
public:
    TranscriptionMessage(const validation::ValidationResult& result, const std::string& language,
                         bool isFinal)
        : Message(MessageType::TRANSCRIPTION), result_(result), language_(language), isFinal_(isFinal) {}
    
    const validation::ValidationResult& getResult() const { return result_; }
    const std::string& getLanguage() const { return language_; }
    bool isFinal() const { return isFinal_; }
    
    std::string serialize() const override;
    
private:
    validation::ValidationResult result_;
    std::string language_;
    bool isFinal_;
};

class ConfigUpdatedMessage : public Message {
public:
    explicit ConfigUpdatedMessage(const SessionConfig& config)
        : Message(MessageType::CONFIG_UPDATED), config_(config) {}
    
    const SessionConfig& getConfig() const { return config_; }
    std::string serialize() const override;
    
private:
    SessionConfig config_;
};

class SessionStartedMessage : public Message {
public:
    explicit SessionStartedMessage(const SessionConfig& config)
        : Message(MessageType::SESSION_STARTED), config_(config) {}
    
    const SessionConfig& getConfig() const { return config_; }
    std::string serialize() const override;
    
private:
    SessionConfig config_;
};

class SessionEndedMessage : public Message {
public:
    SessionEndedMessage(uint64_t totalTranscriptions, double durationSeconds, const std::string& transcript)
        : Message(MessageType::SESSION_ENDED), totalTranscriptions_(totalTranscriptions),
          durationSeconds_(durationSeconds), transcript_(transcript) {}
    
    uint64_t getTotalTranscriptions() const { return totalTranscriptions_; }
    double getDurationSeconds() const { return durationSeconds_; }
    const std::string& getTranscript() const { return transcript_; }
    
    std::string serialize() const override;
    
private:
    uint64_t totalTranscriptions_;
    double durationSeconds_;
    std::string transcript_;
};

class StatusUpdateMessage : public Message {
public:
    enum class State {
        IDLE,
        LISTENING
    };
    
    explicit StatusUpdateMessage(State state = State::IDLE)
        : Message(MessageType::STATUS_UPDATE), state_(state) {}
    
    State getState() const { return state_; }
    void setState(State state) { state_ = state; }
    
    std::string serialize() const override;
    
private:
    State state_;
};

class PongMessage : public Message {
public:
    PongMessage() : Message(MessageType::PONG) {}
    std::string serialize() const override;
};

class ErrorMessage : public Message {
public:
    ErrorMessage(const std::string& message, const std::string& code, const std::string& field = "")
        : Message(MessageType::ERROR), message_(message), code_(code), field_(field) {}
    
    const std::string& getMessage() const { return message_; }
    const std::string& getCode() const { return code_; }
    const std::string& getField() const { return field_; }
    
    std::string serialize() const override;
    
private:
    std::string message_;
    std::string code_;
    std::string field_;
};

namespace error_codes {
constexpr const char* kMalformedMessage = "MALFORMED_MESSAGE";
constexpr const char* kUnknownSession = "UNKNOWN_SESSION";
constexpr const char* kInternalError = "INTERNAL_ERROR";
}

// Message factory and parser
class MessageProtocol {
public:
    /**
     * Parse an inbound text frame. Throws utils::ProtocolException naming
     * the missing or wrongly typed field.
     */
    static std::unique_ptr<Message> parseMessage(const std::string& json);
    
    // Non-throwing check used for logging and tests
    static bool validateMessage(const std::string& json);
    
    static std::string messageTypeToString(MessageType type);
    static MessageType stringToMessageType(const std::string& typeStr);
    static std::string stateToString(StatusUpdateMessage::State state);
};

} // namespace core
} // namespace meddictate

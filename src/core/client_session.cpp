#include "core/client_session.hpp"
#include "core/dictation_service.hpp"
#include "core/message_protocol.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

#include <iomanip>
#include <random>
#include <sstream>

namespace meddictate {
namespace core {

std::string generateSessionId() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);
    
    std::stringstream ss;
    for (int i = 0; i < 32; ++i) {
        if (i == 8 || i == 12 || i == 16 || i == 20) {
            ss << '-';
        }
        ss << std::hex << dis(gen);
    }
    return ss.str();
}

ClientSession::ClientSession(const std::string& connectionId, DictationService& service,
                             SendCallback send, ClaimCallback claim)
    : connectionId_(connectionId), service_(service), send_(std::move(send)),
      claim_(std::move(claim)), connected_(true) {
    utils::Logger::info("Client connected: " + connectionId_);
}

ClientSession::~ClientSession() {
    disconnect();
}

void ClientSession::handleMessage(const std::string& message) {
    if (!connected_) {
        utils::Logger::warn("Received message for disconnected client: " + connectionId_);
        return;
    }
    
    std::unique_ptr<Message> parsed;
    try {
        parsed = MessageProtocol::parseMessage(message);
    } catch (const utils::ProtocolException& e) {
        utils::Logger::warn("Malformed message from " + connectionId_ + " (field '" +
                            e.getField() + "'): " + e.getErrorInfo().message);
        utils::ErrorHandler::getInstance().reportError(e, "client_message", connectionId_);
        sendError(error_codes::kMalformedMessage, e.getErrorInfo().message, e.getField());
        return;
    }
    
    const std::string sessionId = resolveSessionId(*parsed);
    
    try {
        dispatch(*parsed, sessionId);
    } catch (const utils::SessionException& e) {
        rejectSession(e);
    }
}

void ClientSession::dispatch(Message& parsed, const std::string& sessionId) {
    switch (parsed.getType()) {
        case MessageType::AUDIO:
            processAudioMessage(static_cast<AudioMessage&>(parsed), sessionId);
            break;
        case MessageType::CONFIG:
            processConfigMessage(static_cast<const ConfigMessage&>(parsed), sessionId);
            break;
        case MessageType::START_SESSION:
            processStartSessionMessage(static_cast<const StartSessionMessage&>(parsed), sessionId);
            break;
        case MessageType::END_SESSION:
            processEndSessionMessage(sessionId);
            break;
        case MessageType::PING: {
            PongMessage pong;
            sendMessage(pong.serialize());
            break;
        }
        case MessageType::ASR_RESULT:
            processAsrResultMessage(static_cast<const AsrResultMessage&>(parsed), sessionId);
            break;
        default:
            utils::Logger::warn("Unexpected message type from client " + connectionId_);
            break;
    }
}

void ClientSession::handleBinaryMessage(std::string_view data) {
    if (!connected_) {
        utils::Logger::warn("Received binary data for disconnected client: " + connectionId_);
        return;
    }
    
    AudioMessage message(std::vector<uint8_t>(data.begin(), data.end()));
    try {
        processAudioMessage(message, getDefaultSessionId());
    } catch (const utils::SessionException& e) {
        rejectSession(e);
    }
}

void ClientSession::sendMessage(const std::string& message) {
    if (connected_ && send_) {
        send_(message);
    } else {
        utils::Logger::warn("Attempted to send message to disconnected client: " + connectionId_);
    }
}

void ClientSession::disconnect() {
    if (!connected_) {
        return;
    }
    connected_ = false;
    
    for (const auto& sessionId : getOwnedSessions()) {
        service_.endSession(sessionId);
    }
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        ownedSessions_.clear();
    }
    utils::Logger::info("Client disconnected: " + connectionId_);
}

bool ClientSession::ownsSession(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    return ownedSessions_.count(sessionId) > 0;
}

std::vector<std::string> ClientSession::getOwnedSessions() const {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    return std::vector<std::string>(ownedSessions_.begin(), ownedSessions_.end());
}

std::string ClientSession::resolveSessionId(const Message& message) const {
    return message.getSessionId().empty() ? getDefaultSessionId() : message.getSessionId();
}

void ClientSession::claimSession(const std::string& sessionId) {
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        if (ownedSessions_.count(sessionId) > 0) {
            return;
        }
    }
    
    if (claim_ && !claim_(sessionId)) {
        throw utils::SessionException("session belongs to another connection", sessionId);
    }
    
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    ownedSessions_.insert(sessionId);
}

void ClientSession::rejectSession(const utils::SessionException& e) {
    const std::string& sessionId = e.getErrorInfo().session_id;
    utils::Logger::warn("Client " + connectionId_ + " rejected for session " + sessionId + ": " +
                        e.getErrorInfo().message);
    utils::ErrorHandler::getInstance().reportError(e, "client_message");
    sendError(error_codes::kUnknownSession, e.getErrorInfo().message, "sessionId", sessionId);
}

void ClientSession::processAudioMessage(AudioMessage& message, const std::string& sessionId) {
    if (message.getAudio().empty()) {
        return;
    }
    claimSession(sessionId);
    utils::Logger::debug("Session " + sessionId + " received " +
                         std::to_string(message.getAudio().size()) + " audio bytes");
    service_.addAudio(sessionId, std::move(message.getAudio()));
}

void ClientSession::processConfigMessage(const ConfigMessage& message, const std::string& sessionId) {
    claimSession(sessionId);
    service_.updateConfig(sessionId, message.getConfig());
}

void ClientSession::processStartSessionMessage(const StartSessionMessage& message,
                                               const std::string& sessionId) {
    claimSession(sessionId);
    if (!service_.startSession(sessionId, message.getConfig())) {
        utils::Logger::info("Session " + sessionId + " already active");
    }
}

void ClientSession::processEndSessionMessage(const std::string& sessionId) {
    if (!ownsSession(sessionId)) {
        utils::Logger::info("end_session for inactive session " + sessionId);
        return;
    }
    service_.endSession(sessionId);
    
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    ownedSessions_.erase(sessionId);
}

void ClientSession::processAsrResultMessage(const AsrResultMessage& message, const std::string& sessionId) {
    if (!ownsSession(sessionId)) {
        throw utils::SessionException("no active session " + sessionId, sessionId);
    }
    
    AsrResult result;
    result.text = message.getText();
    result.confidence = message.getConfidence();
    result.language = message.getLanguage();
    result.isPartial = message.isPartial();
    
    if (!service_.handleAsrResult(sessionId, result)) {
        throw utils::SessionException("no active session " + sessionId, sessionId);
    }
}

void ClientSession::sendError(const std::string& code, const std::string& message,
                              const std::string& field, const std::string& sessionId) {
    ErrorMessage error(message, code, field);
    if (!sessionId.empty()) {
        error.setSessionId(sessionId);
    }
    sendMessage(error.serialize());
}

} // namespace core
} // namespace meddictate

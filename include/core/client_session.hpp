#pragma once

#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace meddictate {
namespace utils {
class SessionException;
}

namespace core {

class DictationService;
class Message;
class AudioMessage;
class ConfigMessage;
class StartSessionMessage;
class AsrResultMessage;

// Random UUID-shaped identifier
std::string generateSessionId();

/**
 * One client connection. Parses inbound frames, maps them onto the
 * connection's dictation sessions and answers protocol errors directly.
 * Transcription events flow from the DictationService to the transport
 * without passing through here.
 */
class ClientSession {
public:
    using SendCallback = std::function<void(const std::string& message)>;
    // Called before a session id is used; false rejects ids owned elsewhere
    using ClaimCallback = std::function<bool(const std::string& sessionId)>;
    
    ClientSession(const std::string& connectionId, DictationService& service,
                  SendCallback send, ClaimCallback claim = nullptr);
    ~ClientSession();
    
    ClientSession(const ClientSession&) = delete;
    ClientSession& operator=(const ClientSession&) = delete;
    
    const std::string& getConnectionId() const { return connectionId_; }
    // Used whenever a message carries no sessionId, and for binary frames
    const std::string& getDefaultSessionId() const { return connectionId_; }
    bool isConnected() const { return connected_; }
    
    // Message handling
    void handleMessage(const std::string& message);
    void handleBinaryMessage(std::string_view data);
    
    void sendMessage(const std::string& message);
    
    // Ends every session this connection used
    void disconnect();
    
    bool ownsSession(const std::string& sessionId) const;
    std::vector<std::string> getOwnedSessions() const;
    
private:
    std::string resolveSessionId(const Message& message) const;
    void dispatch(Message& parsed, const std::string& sessionId);
    
    // Throws SessionException when another connection owns the session
    void claimSession(const std::string& sessionId);
    void rejectSession(const utils::SessionException& e);
    
    // Message processing
    void processAudioMessage(AudioMessage& message, const std::string& sessionId);
    void processConfigMessage(const ConfigMessage& message, const std::string& sessionId);
    void processStartSessionMessage(const StartSessionMessage& message, const std::string& sessionId);
    void processEndSessionMessage(const std::string& sessionId);
    void processAsrResultMessage(const AsrResultMessage& message, const std::string& sessionId);
    
    void sendError(const std::string& code, const std::string& message,
                   const std::string& field = "", const std::string& sessionId = "");
    
    std::string connectionId_;
    DictationService& service_;
    SendCallback send_;
    ClaimCallback claim_;
    bool connected_;
    
    mutable std::mutex sessionsMutex_;
    std::set<std::string> ownedSessions_;
};

} // namespace core
} // namespace meddictate

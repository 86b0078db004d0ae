#pragma once

#include "core/dictation_service.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

struct us_listen_socket_t;

namespace uWS {
    struct Loop;
}

namespace meddictate {
namespace core {

class ClientSession;

// Per-socket data structure
struct PerSocketData {
    std::string connectionId;
};

/**
 * uWebSockets front end. All socket and ClientSession state lives on the
 * event-loop thread; events produced by session workers are handed over
 * with Loop::defer.
 */
class WebSocketServer {
public:
    explicit WebSocketServer(int port);
    ~WebSocketServer();
    
    // Must be set before run()
    void setDictationService(DictationService* service) { service_ = service; }
    
    // Sink to pass to the DictationService
    EventSink makeEventSink();
    
    bool run();
    void stop();
    
private:
    void handleNewConnection(const std::string& connectionId, void* ws);
    void handleMessage(const std::string& connectionId, std::string_view message, bool binary);
    void handleDisconnection(const std::string& connectionId);
    
    bool claimSession(const std::string& connectionId, const std::string& sessionId);
    void deliver(const std::string& sessionId, const std::string& message);
    void sendToConnection(const std::string& connectionId, const std::string& message);
    
    int port_;
    std::atomic<bool> running_;
    DictationService* service_;
    uWS::Loop* loop_;
    us_listen_socket_t* listenSocket_;
    
    // Event-loop thread only
    std::unordered_map<std::string, std::unique_ptr<ClientSession>> clients_;
    std::unordered_map<std::string, void*> websockets_;
    std::unordered_map<std::string, std::string> sessionOwners_;
};

} // namespace core
} // namespace meddictate

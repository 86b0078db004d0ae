#include "core/websocket_server.hpp"
#include "core/client_session.hpp"
#include "utils/logging.hpp"
#include "utils/error_handler.hpp"

#include <App.h>

#include <vector>

namespace meddictate {
namespace core {

using WebSocket = uWS::WebSocket<false, true, PerSocketData>;

WebSocketServer::WebSocketServer(int port)
    : port_(port), running_(false), service_(nullptr), loop_(nullptr), listenSocket_(nullptr) {
}

WebSocketServer::~WebSocketServer() {
    stop();
}

EventSink WebSocketServer::makeEventSink() {
    return [this](const std::string& sessionId, const std::string& message) {
        deliver(sessionId, message);
    };
}

bool WebSocketServer::run() {
    if (!service_) {
        utils::Logger::error("WebSocket server has no dictation service");
        return false;
    }
    
    utils::Logger::info("Starting WebSocket server on port " + std::to_string(port_));
    loop_ = uWS::Loop::get();
    
    uWS::App app;
    
    uWS::App::WebSocketBehavior<PerSocketData> behavior;
    behavior.maxPayloadLength = 4 * 1024 * 1024;
    behavior.idleTimeout = 120;
    
    behavior.open = [this](WebSocket* ws) {
        auto* data = ws->getUserData();
        data->connectionId = generateSessionId();
        handleNewConnection(data->connectionId, ws);
    };
    
    behavior.message = [this](WebSocket* ws, std::string_view message, uWS::OpCode opCode) {
        auto* data = ws->getUserData();
        if (opCode == uWS::OpCode::TEXT) {
            handleMessage(data->connectionId, message, false);
        } else if (opCode == uWS::OpCode::BINARY) {
            handleMessage(data->connectionId, message, true);
        }
    };
    
    behavior.close = [this](WebSocket* ws, int /*code*/, std::string_view /*message*/) {
        handleDisconnection(ws->getUserData()->connectionId);
    };
    
    app.ws<PerSocketData>("/*", std::move(behavior));
    
    app.get("/health", [this](auto* res, auto* /*req*/) {
        try {
            res->writeHeader("Content-Type", "application/json")
               ->writeHeader("Cache-Control", "no-cache")
               ->end(service_->buildHealthReport());
        } catch (const std::exception& e) {
            utils::Logger::error("Exception in health check endpoint: " + std::string(e.what()));
            utils::ErrorHandler::getInstance().reportError(e, "health_check");
            res->writeStatus("500 Internal Server Error")
               ->writeHeader("Content-Type", "application/json")
               ->end("{\"status\":\"error\",\"message\":\"Internal server error\"}");
        }
    });
    
    app.listen(port_, [this](us_listen_socket_t* listenSocket) {
        if (listenSocket) {
            listenSocket_ = listenSocket;
            running_ = true;
            utils::Logger::info("WebSocket server listening on port " + std::to_string(port_));
        } else {
            utils::ErrorHandler::getInstance().reportError(utils::ErrorInfo(
                utils::ErrorCategory::TRANSPORT, utils::ErrorSeverity::CRITICAL,
                "Failed to listen on port " + std::to_string(port_), "", "WebSocketServer"));
        }
    });
    
    if (!running_) {
        return false;
    }
    
    app.run();
    
    running_ = false;
    clients_.clear();
    websockets_.clear();
    sessionOwners_.clear();
    utils::Logger::info("WebSocket server stopped");
    return true;
}

void WebSocketServer::stop() {
    if (!running_ || !loop_) {
        return;
    }
    utils::Logger::info("Stopping WebSocket server");
    
    loop_->defer([this]() {
        if (listenSocket_) {
            us_listen_socket_close(0, listenSocket_);
            listenSocket_ = nullptr;
        }
        // close() re-enters handleDisconnection, which edits websockets_
        std::vector<void*> sockets;
        for (const auto& entry : websockets_) {
            sockets.push_back(entry.second);
        }
        for (void* ws : sockets) {
            static_cast<WebSocket*>(ws)->close();
        }
    });
}

void WebSocketServer::handleNewConnection(const std::string& connectionId, void* ws) {
    websockets_[connectionId] = ws;
    clients_[connectionId] = std::make_unique<ClientSession>(
        connectionId, *service_,
        [this, connectionId](const std::string& message) {
            sendToConnection(connectionId, message);
        },
        [this, connectionId](const std::string& sessionId) {
            return claimSession(connectionId, sessionId);
        });
    
    utils::Logger::info("New client connection " + connectionId + ". Total connections: " +
                        std::to_string(clients_.size()));
}

void WebSocketServer::handleMessage(const std::string& connectionId, std::string_view message, bool binary) {
    auto it = clients_.find(connectionId);
    if (it == clients_.end()) {
        utils::Logger::warn("Message from unknown connection: " + connectionId);
        return;
    }
    
    if (binary) {
        it->second->handleBinaryMessage(message);
    } else {
        it->second->handleMessage(std::string(message));
    }
}

void WebSocketServer::handleDisconnection(const std::string& connectionId) {
    // Socket is gone; events still in flight for it are dropped by sendToConnection
    websockets_.erase(connectionId);
    
    auto it = clients_.find(connectionId);
    if (it != clients_.end()) {
        it->second->disconnect();
        clients_.erase(it);
    }
    
    for (auto owner = sessionOwners_.begin(); owner != sessionOwners_.end();) {
        if (owner->second == connectionId) {
            owner = sessionOwners_.erase(owner);
        } else {
            ++owner;
        }
    }
    
    utils::Logger::info("Connection " + connectionId + " closed. Remaining connections: " +
                        std::to_string(clients_.size()));
}

bool WebSocketServer::claimSession(const std::string& connectionId, const std::string& sessionId) {
    auto it = sessionOwners_.find(sessionId);
    if (it != sessionOwners_.end() && it->second != connectionId) {
        return false;
    }
    sessionOwners_[sessionId] = connectionId;
    return true;
}

void WebSocketServer::deliver(const std::string& sessionId, const std::string& message) {
    if (!running_ || !loop_) {
        return;
    }
    loop_->defer([this, sessionId, message]() {
        auto owner = sessionOwners_.find(sessionId);
        if (owner == sessionOwners_.end()) {
            utils::Logger::debug("Dropping event for session without connection: " + sessionId);
            return;
        }
        sendToConnection(owner->second, message);
    });
}

void WebSocketServer::sendToConnection(const std::string& connectionId, const std::string& message) {
    auto it = websockets_.find(connectionId);
    if (it == websockets_.end()) {
        utils::Logger::debug("Attempted to send message to closed connection: " + connectionId);
        return;
    }
    static_cast<WebSocket*>(it->second)->send(message, uWS::OpCode::TEXT);
}

} // namespace core
} // namespace meddictate

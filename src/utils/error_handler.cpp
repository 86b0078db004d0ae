#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <sstream>
#include <iomanip>
#include <random>
#include <algorithm>
#include <mutex>

namespace meddictate {
namespace utils {

// Thread-local storage for error context
thread_local std::string ErrorContext::current_context_;
thread_local std::string ErrorContext::current_session_id_;

const char* categoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::TRANSPORT: return "Transport";
        case ErrorCategory::PROTOCOL: return "Protocol";
        case ErrorCategory::AUDIO_DECODING: return "AudioDecoding";
        case ErrorCategory::VOICE_ACTIVITY: return "VoiceActivity";
        case ErrorCategory::VALIDATION: return "Validation";
        case ErrorCategory::LEXICON: return "Lexicon";
        case ErrorCategory::ASR: return "ASR";
        case ErrorCategory::SESSION: return "Session";
        case ErrorCategory::SYSTEM: return "System";
        case ErrorCategory::UNKNOWN: return "Unknown";
    }
    return "Unknown";
}

const char* severityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::INFO: return "INFO";
        case ErrorSeverity::WARNING: return "WARN";
        case ErrorSeverity::ERROR: return "ERROR";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
    }
    return "ERROR";
}

// ErrorInfo implementation
ErrorInfo::ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg, 
                     const std::string& det, const std::string& ctx, const std::string& sid)
    : category(cat), severity(sev), message(msg), details(det), context(ctx), 
      timestamp(std::chrono::steady_clock::now()), session_id(sid) {
    
    static std::mutex id_mutex;
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<> dis(0, 15);
    
    std::stringstream ss;
    ss << "err_";
    std::lock_guard<std::mutex> lock(id_mutex);
    for (int i = 0; i < 8; ++i) {
        ss << std::hex << dis(gen);
    }
    id = ss.str();
}

MedDictateException::MedDictateException(const ErrorInfo& error_info) 
    : error_info_(error_info) {
}

const char* MedDictateException::what() const noexcept {
    if (what_message_.empty()) {
        what_message_ = error_info_.message;
        if (!error_info_.details.empty()) {
            what_message_ += ": " + error_info_.details;
        }
    }
    return what_message_.c_str();
}

ProtocolException::ProtocolException(const std::string& field, const std::string& message)
    : MedDictateException(ErrorInfo(ErrorCategory::PROTOCOL, ErrorSeverity::WARNING,
                                    message, field, "MessageProtocol")),
      field_(field) {
}

DecodeException::DecodeException(const std::string& message, const std::string& session_id)
    : MedDictateException(ErrorInfo(ErrorCategory::AUDIO_DECODING, ErrorSeverity::ERROR,
                                    message, "", "Decoder", session_id)) {
}

LexiconException::LexiconException(const std::string& message, const std::string& path)
    : MedDictateException(ErrorInfo(ErrorCategory::LEXICON, ErrorSeverity::ERROR,
                                    message, path, "Lexicon")) {
}

AsrException::AsrException(const std::string& message, const std::string& context)
    : MedDictateException(ErrorInfo(ErrorCategory::ASR, ErrorSeverity::ERROR,
                                    message, "", context.empty() ? "ASR" : context)) {
}

SessionException::SessionException(const std::string& message, const std::string& session_id)
    : MedDictateException(ErrorInfo(ErrorCategory::SESSION, ErrorSeverity::ERROR,
                                    message, "", "Session", session_id)) {
}

// ErrorHandler implementation
ErrorHandler& ErrorHandler::getInstance() {
    static ErrorHandler instance;
    return instance;
}

void ErrorHandler::reportError(const ErrorInfo& error) {
    ErrorInfo recorded = error;
    if (recorded.context.empty()) {
        recorded.context = ErrorContext::getCurrentContext();
    }
    if (recorded.session_id.empty()) {
        recorded.session_id = ErrorContext::getCurrentSessionId();
    }
    
    ErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        
        logError(recorded);
        
        error_history_.push_back(recorded);
        if (error_history_.size() > max_history_size_) {
            error_history_.erase(error_history_.begin());
        }
        
        callback = error_callback_;
    }
    
    // The callback runs unlocked so it may call back into the handler
    if (callback) {
        try {
            callback(recorded);
        } catch (const std::exception& e) {
            Logger::error("Error in error callback: " + std::string(e.what()));
        }
    }
}

void ErrorHandler::reportError(const std::exception& e, const std::string& context, 
                              const std::string& session_id) {
    ErrorCategory category = ErrorCategory::UNKNOWN;
    ErrorSeverity severity = ErrorSeverity::ERROR;
    std::string details;
    std::string sid = session_id;
    
    if (auto* typed = dynamic_cast<const MedDictateException*>(&e)) {
        const ErrorInfo& info = typed->getErrorInfo();
        category = info.category;
        severity = info.severity;
        details = info.details;
        if (sid.empty()) {
            sid = info.session_id;
        }
        ErrorInfo error(category, severity, info.message, details,
                        context.empty() ? info.context : context, sid);
        reportError(error);
        return;
    }
    
    ErrorInfo error(category, severity, e.what(), details, context, sid);
    reportError(error);
}

void ErrorHandler::setErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_callback_ = std::move(callback);
}

size_t ErrorHandler::getErrorCount(ErrorCategory category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (category == ErrorCategory::UNKNOWN) {
        return error_history_.size();
    }
    
    return std::count_if(error_history_.begin(), error_history_.end(),
                        [category](const ErrorInfo& error) {
                            return error.category == category;
                        });
}

std::vector<ErrorInfo> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (error_history_.size() <= count) {
        return error_history_;
    }
    
    return std::vector<ErrorInfo>(error_history_.end() - count, error_history_.end());
}

void ErrorHandler::clearErrorHistory() {
    std::lock_guard<std::mutex> lock(mutex_);
    error_history_.clear();
}

void ErrorHandler::logError(const ErrorInfo& error) {
    std::stringstream log_message;
    log_message << "[" << error.id << "] " << categoryToString(error.category)
                << " - " << error.message;
    
    if (!error.details.empty()) {
        log_message << " | Details: " << error.details;
    }
    
    if (!error.context.empty()) {
        log_message << " | Context: " << error.context;
    }
    
    if (!error.session_id.empty()) {
        log_message << " | Session: " << error.session_id;
    }
    
    switch (error.severity) {
        case ErrorSeverity::INFO:
            Logger::info(log_message.str());
            break;
        case ErrorSeverity::WARNING:
            Logger::warn(log_message.str());
            break;
        case ErrorSeverity::ERROR:
        case ErrorSeverity::CRITICAL:
            Logger::error(log_message.str());
            break;
    }
}

// ErrorContext implementation
ErrorContext::ErrorContext(const std::string& context, const std::string& session_id) 
    : previous_context_(current_context_), previous_session_id_(current_session_id_) {
    current_context_ = context;
    if (!session_id.empty()) {
        current_session_id_ = session_id;
    }
}

ErrorContext::~ErrorContext() {
    current_context_ = previous_context_;
    current_session_id_ = previous_session_id_;
}

std::string ErrorContext::getCurrentContext() {
    return current_context_;
}

std::string ErrorContext::getCurrentSessionId() {
    return current_session_id_;
}

} // namespace utils
} // namespace meddictate

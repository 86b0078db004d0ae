#pragma once

#include <string>
#include <exception>
#include <memory>
#include <functional>
#include <chrono>
#include <mutex>
#include <vector>

namespace meddictate {
namespace utils {

/**
 * Error severity levels
 */
enum class ErrorSeverity {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

/**
 * Error categories, one per pipeline stage
 */
enum class ErrorCategory {
    TRANSPORT,
    PROTOCOL,
    AUDIO_DECODING,
    VOICE_ACTIVITY,
    VALIDATION,
    LEXICON,
    ASR,
    SESSION,
    SYSTEM,
    UNKNOWN
};

const char* categoryToString(ErrorCategory category);
const char* severityToString(ErrorSeverity severity);

/**
 * Structured error information
 */
struct ErrorInfo {
    std::string id;
    ErrorCategory category;
    ErrorSeverity severity;
    std::string message;
    std::string details;
    std::string context;
    std::chrono::steady_clock::time_point timestamp;
    std::string session_id;
    
    ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg, 
              const std::string& det = "", const std::string& ctx = "", 
              const std::string& sid = "");
};

/**
 * Exception hierarchy
 */
class MedDictateException : public std::exception {
public:
    explicit MedDictateException(const ErrorInfo& error_info);
    const char* what() const noexcept override;
    const ErrorInfo& getErrorInfo() const { return error_info_; }

private:
    ErrorInfo error_info_;
    mutable std::string what_message_;
};

// Malformed inbound message. getField() names the offending field.
class ProtocolException : public MedDictateException {
public:
    ProtocolException(const std::string& field, const std::string& message);
    const std::string& getField() const { return field_; }

private:
    std::string field_;
};

class DecodeException : public MedDictateException {
public:
    DecodeException(const std::string& message, const std::string& session_id = "");
};

class LexiconException : public MedDictateException {
public:
    LexiconException(const std::string& message, const std::string& path = "");
};

class AsrException : public MedDictateException {
public:
    AsrException(const std::string& message, const std::string& context = "");
};

// Message names a session the connection may not use
class SessionException : public MedDictateException {
public:
    SessionException(const std::string& message, const std::string& session_id);
};

/**
 * Error handler callback type
 */
using ErrorCallback = std::function<void(const ErrorInfo&)>;

/**
 * Central error handler for the application
 */
class ErrorHandler {
public:
    static ErrorHandler& getInstance();
    
    // Error reporting. An empty context or session id is taken from the
    // thread's current ErrorContext.
    void reportError(const ErrorInfo& error);
    void reportError(const std::exception& e, const std::string& context = "", 
                    const std::string& session_id = "");
    
    // Error callbacks
    void setErrorCallback(ErrorCallback callback);
    
    // Error statistics. UNKNOWN counts every category.
    size_t getErrorCount(ErrorCategory category = ErrorCategory::UNKNOWN) const;
    std::vector<ErrorInfo> getRecentErrors(size_t count = 10) const;
    void clearErrorHistory();

private:
    ErrorHandler() = default;
    ~ErrorHandler() = default;
    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;
    
    void logError(const ErrorInfo& error);
    
    ErrorCallback error_callback_;
    std::vector<ErrorInfo> error_history_;
    size_t max_history_size_ = 1000;
    
    mutable std::mutex mutex_;
};

/**
 * RAII error context manager
 */
class ErrorContext {
public:
    ErrorContext(const std::string& context, const std::string& session_id = "");
    ~ErrorContext();
    
    static std::string getCurrentContext();
    static std::string getCurrentSessionId();

private:
    std::string previous_context_;
    std::string previous_session_id_;
    
    static thread_local std::string current_context_;
    static thread_local std::string current_session_id_;
};

/**
 * Utility macros for error handling
 */
#define MEDDICTATE_HANDLE_ERROR(category, severity, message, details) \
    do { \
        ::meddictate::utils::ErrorInfo error_info_(category, severity, message, details, \
                       ::meddictate::utils::ErrorContext::getCurrentContext(), \
                       ::meddictate::utils::ErrorContext::getCurrentSessionId()); \
        ::meddictate::utils::ErrorHandler::getInstance().reportError(error_info_); \
    } while(0)

#define MEDDICTATE_HANDLE_EXCEPTION(e, context) \
    ::meddictate::utils::ErrorHandler::getInstance().reportError(e, context)

} // namespace utils
} // namespace meddictate

#pragma once

#include "audio/decoder.hpp"
#include "audio/stream_reconstructor.hpp"
#include "audio/voice_activity_detector.hpp"
#include "core/asr_engine.hpp"
#include "core/message_protocol.hpp"
#include "core/task_queue.hpp"
#include "utils/config.hpp"
#include "validation/medical_lexicon.hpp"
#include "validation/transcript_validator.hpp"
#include "validation/validation_metrics.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace meddictate {
namespace core {

struct DictationOptions {
    audio::ReconstructorConfig reconstructor;
    audio::VadConfig vad;
    uint32_t maxUtteranceMs = 30000;
    bool suppressDuplicates = true;
    std::string defaultLanguage = "de";
};

DictationOptions optionsFromConfig(const utils::Config& config);

// Receives every outbound message as serialized JSON. Called from session
// worker threads as well as the calling thread; must be thread-safe.
using EventSink = std::function<void(const std::string& sessionId, const std::string& message)>;

// Same text after lower-casing and stripping punctuation, or one text
// containing the other when the contained one is longer than 50 characters
bool isDuplicateTranscription(const std::string& newText, const std::string& lastText);

/**
 * Per-session dictation pipeline:
 * chunk -> StreamReconstructor -> VAD -> utterance -> AsrEngine -> TranscriptValidator -> event.
 *
 * Every session owns a SerialWorker, so chunks are applied in arrival
 * order and a slow decoder only delays its own session. The public
 * methods never block on decoder or recognizer I/O.
 */
class DictationService {
public:
    DictationService(const DictationOptions& options,
                     audio::DecoderFactory decoderFactory,
                     std::shared_ptr<const validation::MedicalLexicon> lexicon,
                     std::shared_ptr<AsrEngine> asrEngine,
                     EventSink sink);
    ~DictationService();
    
    DictationService(const DictationService&) = delete;
    DictationService& operator=(const DictationService&) = delete;
    
    /**
     * Creates the session and emits session_started. For an existing
     * session only the config is applied; returns false in that case.
     */
    bool startSession(const std::string& sessionId,
                      const std::optional<SessionConfig>& config = std::nullopt);
    
    // Applies immediately and emits config_updated. Creates the session if needed.
    void updateConfig(const std::string& sessionId, const SessionConfig& config);
    
    // Queues a container chunk. Creates the session on first audio.
    void addAudio(const std::string& sessionId, std::vector<uint8_t> chunk);
    
    // Result from an external recognizer. False if the session is unknown.
    bool handleAsrResult(const std::string& sessionId, const AsrResult& result);
    
    /**
     * Idempotent. Queued chunks are still processed, the decoder is flushed,
     * a pending utterance is recognized and session_ended is emitted, all
     * on the session's worker. Returns false if the session was unknown.
     */
    bool endSession(const std::string& sessionId);
    
    void endAllSessions();
    
    bool hasSession(const std::string& sessionId) const;
    size_t getActiveSessionCount() const;
    std::vector<std::string> getSessionIds() const;
    std::optional<SessionConfig> getSessionConfig(const std::string& sessionId) const;
    
    // JSON body of the /health endpoint
    std::string buildHealthReport();
    
    // Blocks until everything queued for the session has run
    void waitIdle(const std::string& sessionId);
    
    // Blocks until every ended session has been torn down
    void waitForEndedSessions();
    
    const validation::TranscriptValidator& getValidator() const { return validator_; }
    validation::ValidationMetrics& getMetrics() { return metrics_; }
    const audio::StreamReconstructor& getReconstructor() const { return reconstructor_; }
    const DictationOptions& getOptions() const { return options_; }

private:
    struct Session {
        std::string id;
        // Reconstructor key; differs from id so a re-opened session never
        // touches the stream of one still shutting down
        std::string streamKey;
        std::chrono::steady_clock::time_point startTime;
        
        mutable std::mutex configMutex;
        SessionConfig config;
        
        // Owned by the worker thread
        std::unique_ptr<audio::VoiceActivityDetector> vad;
        std::vector<uint8_t> utterance;
        bool wasSpeaking = false;
        uint64_t totalTranscriptions = 0;
        std::vector<std::string> transcript;
        
        std::unique_ptr<SerialWorker> worker;
        
        SessionConfig getConfig() const {
            std::lock_guard<std::mutex> lock(configMutex);
            return config;
        }
    };
    
    std::shared_ptr<Session> findSession(const std::string& sessionId) const;
    std::shared_ptr<Session> getOrCreateSession(const std::string& sessionId,
                                                const std::optional<SessionConfig>& config,
                                                bool& created);
    
    // Worker-thread steps
    void processChunk(Session& session, const std::vector<uint8_t>& chunk);
    void processPcm(Session& session, const std::vector<uint8_t>& pcm);
    void submitUtterance(Session& session);
    void processAsrResult(Session& session, const AsrResult& result);
    void finishSession(Session& session);
    
    void emit(const std::string& sessionId, Message& message);
    
    DictationOptions options_;
    size_t maxUtteranceBytes_;
    audio::StreamReconstructor reconstructor_;
    validation::ValidationMetrics metrics_;
    validation::TranscriptValidator validator_;
    std::shared_ptr<AsrEngine> asrEngine_;
    EventSink sink_;
    
    mutable std::mutex sessionsMutex_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
    uint64_t nextStreamId_;
    
    // Joins the workers of ended sessions off the caller's thread
    SerialWorker reaper_;
};

} // namespace core
} // namespace meddictate

#pragma once

#include "audio/decoder.hpp"
#include "audio/pcm_utils.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace meddictate {
namespace audio {

enum class DecodeMode {
    STREAMING,  // long-lived decoder fed chunk by chunk
    BATCH       // buffer until a header is seen, decode in one shot
};

struct ReconstructorConfig {
    DecodeMode mode = DecodeMode::STREAMING;
    uint32_t flushTimeoutMs = 2000;
    uint32_t endSessionGraceMs = 200;
    // Headerless bytes tolerated before a one-shot decode is attempted
    size_t maxHeaderlessBytes = 64 * 1024;
    uint32_t batchTimeoutMs = 10000;
};

/**
 * Turns per-session container chunks (WebM/Ogg/WAV) into a contiguous
 * s16le PCM stream using one external decoder per session.
 *
 * All methods are thread-safe. Calls for one session are serialized;
 * different sessions never wait on each other's decoder I/O. Decode
 * failures are never thrown: the session is marked errored, further
 * chunks are dropped, and the caller simply sees no PCM until the
 * session is re-initialized.
 */
class StreamReconstructor {
public:
    struct SessionStats {
        uint64_t chunksReceived = 0;
        uint64_t bytesReceived = 0;
        uint64_t bytesDropped = 0;
        uint64_t pcmBytesProduced = 0;
        uint32_t decodeErrors = 0;
        ContainerType container = ContainerType::UNKNOWN;
        bool headerObserved = false;
        bool errored = false;
    };
    
    explicit StreamReconstructor(DecoderFactory factory,
                                 const ReconstructorConfig& config = ReconstructorConfig{});
    ~StreamReconstructor();
    
    StreamReconstructor(const StreamReconstructor&) = delete;
    StreamReconstructor& operator=(const StreamReconstructor&) = delete;
    
    // Idempotent. Re-initializing an errored session gives it a fresh decode state.
    void initSession(const std::string& sessionId);
    
    void addData(const std::string& sessionId, const std::vector<uint8_t>& chunk);
    
    // Returns and clears the PCM decoded so far.
    std::vector<uint8_t> getPCMData(const std::string& sessionId);
    bool hasPCMData(const std::string& sessionId);
    
    // Signals end-of-stream and waits up to flushTimeoutMs for the tail.
    // The session stays open; later chunks start a new stream.
    std::vector<uint8_t> flushSession(const std::string& sessionId);
    
    // Idempotent. Stops the decoder and discards all buffers.
    void endSession(const std::string& sessionId);
    
    bool hasSession(const std::string& sessionId) const;
    bool isErrored(const std::string& sessionId) const;
    std::optional<SessionStats> getSessionStats(const std::string& sessionId) const;
    size_t getActiveSessionCount() const;
    
    const ReconstructorConfig& getConfig() const { return config_; }

private:
    struct SessionState {
        std::string id;
        std::mutex mutex;
        std::vector<uint8_t> accumulator;
        std::vector<uint8_t> pcm;
        bool headerObserved = false;
        bool errored = false;
        SessionStats stats;
        
        // Written under both mutexes, read under either
        std::mutex decoderMutex;
        std::shared_ptr<Decoder> decoder;
    };
    
    std::shared_ptr<SessionState> findSession(const std::string& sessionId) const;
    
    void detectHeader(SessionState& state);
    bool startDecoder(SessionState& state);
    void feedDecoder(SessionState& state, const std::vector<uint8_t>& bytes);
    void collectDecoderOutput(SessionState& state);
    void decodeAccumulated(SessionState& state);
    void resetDecoder(SessionState& state, std::shared_ptr<Decoder> decoder);
    void markErrored(SessionState& state, const std::string& reason);
    void appendPcm(SessionState& state, const std::vector<uint8_t>& pcm);
    
    DecoderFactory factory_;
    ReconstructorConfig config_;
    
    mutable std::mutex sessionsMutex_;
    std::unordered_map<std::string, std::shared_ptr<SessionState>> sessions_;
};

} // namespace audio
} // namespace meddictate

#include "audio/stream_reconstructor.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace meddictate {
namespace audio {

StreamReconstructor::StreamReconstructor(DecoderFactory factory, const ReconstructorConfig& config)
    : factory_(std::move(factory)), config_(config) {
    utils::Logger::info(std::string("StreamReconstructor created in ") +
                        (config_.mode == DecodeMode::STREAMING ? "streaming" : "batch") + " mode");
}

StreamReconstructor::~StreamReconstructor() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        for (const auto& entry : sessions_) {
            ids.push_back(entry.first);
        }
    }
    for (const auto& id : ids) {
        endSession(id);
    }
}

void StreamReconstructor::initSession(const std::string& sessionId) {
    std::shared_ptr<SessionState> state;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        auto it = sessions_.find(sessionId);
        if (it == sessions_.end()) {
            state = std::make_shared<SessionState>();
            state->id = sessionId;
            sessions_.emplace(sessionId, state);
            utils::Logger::info("Decode state initialized for session " + sessionId);
            return;
        }
        state = it->second;
    }
    
    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->errored) {
        resetDecoder(*state, nullptr);
        state->accumulator.clear();
        state->headerObserved = false;
        state->errored = false;
        utils::Logger::info("Decode state reset for session " + sessionId);
    }
}

void StreamReconstructor::addData(const std::string& sessionId, const std::vector<uint8_t>& chunk) {
    auto state = findSession(sessionId);
    if (!state) {
        utils::Logger::warn("Dropping " + std::to_string(chunk.size()) +
                            " bytes for unknown session " + sessionId);
        return;
    }
    
    std::lock_guard<std::mutex> lock(state->mutex);
    state->stats.chunksReceived++;
    state->stats.bytesReceived += chunk.size();
    
    if (state->errored) {
        state->stats.bytesDropped += chunk.size();
        utils::Logger::debug("Session " + sessionId + " decoder errored, dropped " +
                             std::to_string(chunk.size()) + " bytes");
        return;
    }
    if (chunk.empty()) {
        return;
    }
    
    if (!state->headerObserved) {
        state->accumulator.insert(state->accumulator.end(), chunk.begin(), chunk.end());
        detectHeader(*state);
        return;
    }
    
    if (config_.mode == DecodeMode::STREAMING) {
        if (!state->decoder && !startDecoder(*state)) {
            return;
        }
        feedDecoder(*state, chunk);
    } else {
        state->accumulator.insert(state->accumulator.end(), chunk.begin(), chunk.end());
    }
}

std::vector<uint8_t> StreamReconstructor::getPCMData(const std::string& sessionId) {
    auto state = findSession(sessionId);
    if (!state) {
        return {};
    }
    
    std::lock_guard<std::mutex> lock(state->mutex);
    if (config_.mode == DecodeMode::STREAMING) {
        collectDecoderOutput(*state);
    } else if (state->headerObserved && !state->accumulator.empty() && !state->errored) {
        decodeAccumulated(*state);
    }
    
    std::vector<uint8_t> out;
    out.swap(state->pcm);
    return out;
}

bool StreamReconstructor::hasPCMData(const std::string& sessionId) {
    auto state = findSession(sessionId);
    if (!state) {
        return false;
    }
    
    std::lock_guard<std::mutex> lock(state->mutex);
    collectDecoderOutput(*state);
    return !state->pcm.empty();
}

std::vector<uint8_t> StreamReconstructor::flushSession(const std::string& sessionId) {
    auto state = findSession(sessionId);
    if (!state) {
        return {};
    }
    
    std::lock_guard<std::mutex> lock(state->mutex);
    
    if (config_.mode == DecodeMode::STREAMING && state->decoder) {
        auto decoder = state->decoder;
        appendPcm(*state, decoder->drain());
        appendPcm(*state, decoder->close(std::chrono::milliseconds(config_.flushTimeoutMs)));
        
        bool failed = decoder->hasError();
        std::string reason = decoder->getErrorMessage();
        resetDecoder(*state, nullptr);
        state->headerObserved = false;
        if (failed) {
            markErrored(*state, reason);
        }
    } else if (config_.mode == DecodeMode::BATCH && state->headerObserved &&
               !state->accumulator.empty() && !state->errored) {
        decodeAccumulated(*state);
    }
    
    if (!state->headerObserved && !state->accumulator.empty()) {
        utils::Logger::debug("Session " + sessionId + " discarding " +
                             std::to_string(state->accumulator.size()) +
                             " headerless bytes at flush");
        state->stats.bytesDropped += state->accumulator.size();
        state->accumulator.clear();
    }
    
    std::vector<uint8_t> out;
    out.swap(state->pcm);
    return out;
}

void StreamReconstructor::endSession(const std::string& sessionId) {
    std::shared_ptr<SessionState> state;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        auto it = sessions_.find(sessionId);
        if (it == sessions_.end()) {
            return;
        }
        state = it->second;
        sessions_.erase(it);
    }
    
    // A feed may be blocked on a stalled decoder; make it return first
    std::unique_lock<std::mutex> lock(state->mutex, std::try_to_lock);
    if (!lock.owns_lock()) {
        std::shared_ptr<Decoder> busy;
        {
            std::lock_guard<std::mutex> handle(state->decoderMutex);
            busy = state->decoder;
        }
        if (busy) {
            busy->abort();
        }
        lock.lock();
    }
    
    if (state->decoder) {
        state->decoder->close(std::chrono::milliseconds(config_.endSessionGraceMs));
        resetDecoder(*state, nullptr);
    }
    
    std::vector<uint8_t>().swap(state->accumulator);
    std::vector<uint8_t>().swap(state->pcm);
    
    utils::Logger::info("Decode state released for session " + sessionId + " (" +
                        std::to_string(state->stats.bytesReceived) + " bytes in, " +
                        std::to_string(state->stats.pcmBytesProduced) + " PCM bytes out)");
}

bool StreamReconstructor::hasSession(const std::string& sessionId) const {
    return findSession(sessionId) != nullptr;
}

bool StreamReconstructor::isErrored(const std::string& sessionId) const {
    auto state = findSession(sessionId);
    if (!state) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->errored;
}

std::optional<StreamReconstructor::SessionStats>
StreamReconstructor::getSessionStats(const std::string& sessionId) const {
    auto state = findSession(sessionId);
    if (!state) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    SessionStats stats = state->stats;
    stats.headerObserved = state->headerObserved;
    stats.errored = state->errored;
    return stats;
}

size_t StreamReconstructor::getActiveSessionCount() const {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    return sessions_.size();
}

std::shared_ptr<StreamReconstructor::SessionState>
StreamReconstructor::findSession(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    auto it = sessions_.find(sessionId);
    return it != sessions_.end() ? it->second : nullptr;
}

void StreamReconstructor::detectHeader(SessionState& state) {
    ContainerType type = ContainerType::UNKNOWN;
    size_t offset = findContainerHeader(state.accumulator, &type);
    
    if (offset == std::string::npos) {
        if (state.accumulator.size() >= config_.maxHeaderlessBytes) {
            utils::Logger::warn("Session " + state.id + ": no container header in " +
                                std::to_string(state.accumulator.size()) +
                                " bytes, attempting one-shot decode");
            decodeAccumulated(state);
        }
        return;
    }
    
    if (offset > 0) {
        utils::Logger::warn("Session " + state.id + ": discarding " + std::to_string(offset) +
                            " bytes before " + containerTypeToString(type) + " header");
        state.stats.bytesDropped += offset;
        state.accumulator.erase(state.accumulator.begin(),
                                state.accumulator.begin() + static_cast<std::ptrdiff_t>(offset));
    }
    
    state.headerObserved = true;
    state.stats.container = type;
    utils::Logger::debug("Session " + state.id + ": " + containerTypeToString(type) +
                         " header observed");
    
    if (config_.mode == DecodeMode::STREAMING && startDecoder(state)) {
        std::vector<uint8_t> pending;
        pending.swap(state.accumulator);
        feedDecoder(state, pending);
    }
}

bool StreamReconstructor::startDecoder(SessionState& state) {
    try {
        std::shared_ptr<Decoder> decoder(factory_());
        resetDecoder(state, decoder);
        return true;
    } catch (const std::exception& e) {
        markErrored(state, e.what());
        return false;
    }
}

void StreamReconstructor::feedDecoder(SessionState& state, const std::vector<uint8_t>& bytes) {
    if (!state.decoder->feed(bytes)) {
        markErrored(state, "decoder rejected input: " + state.decoder->getErrorMessage());
        return;
    }
    collectDecoderOutput(state);
}

void StreamReconstructor::collectDecoderOutput(SessionState& state) {
    if (!state.decoder) {
        return;
    }
    appendPcm(state, state.decoder->drain());
    if (state.decoder->hasError()) {
        markErrored(state, state.decoder->getErrorMessage());
    }
}

void StreamReconstructor::decodeAccumulated(SessionState& state) {
    std::vector<uint8_t> input;
    input.swap(state.accumulator);
    state.headerObserved = false;
    
    try {
        appendPcm(state, decodeOnce(factory_, input,
                                    std::chrono::milliseconds(config_.batchTimeoutMs)));
    } catch (const std::exception& e) {
        markErrored(state, e.what());
    }
}

void StreamReconstructor::resetDecoder(SessionState& state, std::shared_ptr<Decoder> decoder) {
    std::shared_ptr<Decoder> previous;
    {
        std::lock_guard<std::mutex> handle(state.decoderMutex);
        previous = std::move(state.decoder);
        state.decoder = std::move(decoder);
    }
    // previous is destroyed here, which stops and reaps its process
}

void StreamReconstructor::markErrored(SessionState& state, const std::string& reason) {
    if (state.errored) {
        return;
    }
    state.errored = true;
    state.stats.decodeErrors++;
    state.stats.bytesDropped += state.accumulator.size();
    state.accumulator.clear();
    state.headerObserved = false;
    resetDecoder(state, nullptr);
    
    // Stage and session come from the caller's ErrorContext
    MEDDICTATE_HANDLE_ERROR(utils::ErrorCategory::AUDIO_DECODING, utils::ErrorSeverity::WARNING,
                            "Decoding failed, dropping audio until the session is reset",
                            reason + " (stream " + state.id + ")");
}

void StreamReconstructor::appendPcm(SessionState& state, const std::vector<uint8_t>& pcm) {
    if (pcm.empty()) {
        return;
    }
    state.pcm.insert(state.pcm.end(), pcm.begin(), pcm.end());
    state.stats.pcmBytesProduced += pcm.size();
}

} // namespace audio
} // namespace meddictate

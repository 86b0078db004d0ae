#include "core/dictation_service.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include "utils/string_utils.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <stdexcept>

namespace meddictate {
namespace core {

namespace {

constexpr size_t kDuplicateContainmentLength = 50;

std::string normalizeForComparison(const std::string& text) {
    std::string lower = utils::toLower(text);
    std::string normalized;
    normalized.reserve(lower.size());
    for (unsigned char c : lower) {
        if (utils::isWordByte(c) || std::isspace(c)) {
            normalized.push_back(static_cast<char>(c));
        }
    }
    return utils::trim(normalized);
}

} // namespace

DictationOptions optionsFromConfig(const utils::Config& config) {
    DictationOptions options;
    
    const auto& decoder = config.getDecoder();
    options.reconstructor.mode = decoder.mode == "batch" ? audio::DecodeMode::BATCH
                                                         : audio::DecodeMode::STREAMING;
    options.reconstructor.flushTimeoutMs = decoder.flushTimeoutMs;
    options.reconstructor.maxHeaderlessBytes = decoder.maxHeaderlessBytes;
    options.reconstructor.batchTimeoutMs = decoder.batchTimeoutMs;
    
    const auto& vad = config.getVad();
    options.vad.speechThreshold = vad.speechThreshold;
    options.vad.silenceThreshold = vad.silenceThreshold;
    options.vad.energyThreshold = vad.energyThreshold;
    options.vad.noiseFloor = vad.noiseFloor;
    options.vad.zcrThreshold = vad.zcrThreshold;
    options.vad.historyFrames = vad.historyFrames;
    options.vad.minHistoryFrames = vad.minHistoryFrames;
    options.vad.adaptiveMultiplier = vad.adaptiveMultiplier;
    
    const auto& session = config.getSession();
    options.maxUtteranceMs = session.maxUtteranceMs;
    options.suppressDuplicates = session.suppressDuplicates;
    options.defaultLanguage = session.defaultLanguage;
    return options;
}

bool isDuplicateTranscription(const std::string& newText, const std::string& lastText) {
    std::string normalizedNew = normalizeForComparison(newText);
    std::string normalizedLast = normalizeForComparison(lastText);
    if (normalizedNew.empty() || normalizedLast.empty()) {
        return false;
    }
    
    if (normalizedNew == normalizedLast) {
        return true;
    }
    // Recognizer repeating part of the previous utterance
    if (normalizedNew.size() > kDuplicateContainmentLength &&
        normalizedLast.find(normalizedNew) != std::string::npos) {
        return true;
    }
    // Recognizer re-emitting an accumulated transcript
    if (normalizedLast.size() > kDuplicateContainmentLength &&
        normalizedNew.find(normalizedLast) != std::string::npos) {
        return true;
    }
    return false;
}

DictationService::DictationService(const DictationOptions& options,
                                   audio::DecoderFactory decoderFactory,
                                   std::shared_ptr<const validation::MedicalLexicon> lexicon,
                                   std::shared_ptr<AsrEngine> asrEngine,
                                   EventSink sink)
    : options_(options),
      maxUtteranceBytes_(audio::AudioFormat{}.bytesForMs(options.maxUtteranceMs)),
      reconstructor_(std::move(decoderFactory), options.reconstructor),
      validator_(std::move(lexicon), metrics_),
      asrEngine_(std::move(asrEngine)),
      sink_(std::move(sink)),
      nextStreamId_(1),
      reaper_("session-reaper") {
    if (!options_.vad.isValid()) {
        throw std::invalid_argument("Invalid VAD configuration");
    }
    if (maxUtteranceBytes_ == 0) {
        throw std::invalid_argument("maxUtteranceMs must be positive");
    }
    reaper_.start();
    
    if (!asrEngine_) {
        utils::Logger::warn("No speech recognizer configured; utterances are dropped unless "
                            "results arrive as asr_result messages");
    }
}

DictationService::~DictationService() {
    endAllSessions();
    reaper_.stop();
}

std::shared_ptr<DictationService::Session> DictationService::findSession(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    auto it = sessions_.find(sessionId);
    return it != sessions_.end() ? it->second : nullptr;
}

std::shared_ptr<DictationService::Session> DictationService::getOrCreateSession(
        const std::string& sessionId, const std::optional<SessionConfig>& config, bool& created) {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    created = false;
    
    auto it = sessions_.find(sessionId);
    if (it != sessions_.end()) {
        return it->second;
    }
    
    auto session = std::make_shared<Session>();
    session->id = sessionId;
    session->streamKey = sessionId + "#" + std::to_string(nextStreamId_++);
    session->startTime = std::chrono::steady_clock::now();
    if (config) {
        session->config = *config;
    } else {
        session->config.language = options_.defaultLanguage;
    }
    session->vad = std::make_unique<audio::VoiceActivityDetector>(options_.vad);
    session->worker = std::make_unique<SerialWorker>("session-" + sessionId);
    session->worker->start();
    
    reconstructor_.initSession(session->streamKey);
    sessions_[sessionId] = session;
    created = true;
    
    utils::Logger::info("Session " + sessionId + " created (" + std::to_string(sessions_.size()) +
                        " active)");
    return session;
}

bool DictationService::startSession(const std::string& sessionId,
                                    const std::optional<SessionConfig>& config) {
    bool created = false;
    auto session = getOrCreateSession(sessionId, config, created);
    
    if (!created) {
        if (config) {
            updateConfig(sessionId, *config);
        }
        return false;
    }
    
    SessionStartedMessage message(session->getConfig());
    emit(sessionId, message);
    return true;
}

void DictationService::updateConfig(const std::string& sessionId, const SessionConfig& config) {
    bool created = false;
    auto session = getOrCreateSession(sessionId, config, created);
    if (created) {
        SessionStartedMessage started(config);
        emit(sessionId, started);
    } else {
        std::lock_guard<std::mutex> lock(session->configMutex);
        session->config = config;
    }
    
    std::string context = config.getContextName();
    utils::Logger::info("Session " + sessionId + " config: language=" + config.language +
                        ", context=" + (context.empty() ? "none" : context));
    
    ConfigUpdatedMessage message(config);
    emit(sessionId, message);
}

void DictationService::addAudio(const std::string& sessionId, std::vector<uint8_t> chunk) {
    if (chunk.empty()) {
        return;
    }
    
    bool created = false;
    auto session = getOrCreateSession(sessionId, std::nullopt, created);
    if (created) {
        SessionStartedMessage started(session->getConfig());
        emit(sessionId, started);
    }
    
    auto payload = std::make_shared<std::vector<uint8_t>>(std::move(chunk));
    std::weak_ptr<Session> weak = session;
    bool queued = session->worker->submit([this, weak, payload]() {
        if (auto locked = weak.lock()) {
            processChunk(*locked, *payload);
        }
    });
    if (!queued) {
        utils::Logger::warn("Session " + sessionId + " is closing; dropped " +
                            std::to_string(payload->size()) + " bytes");
    }
}

bool DictationService::handleAsrResult(const std::string& sessionId, const AsrResult& result) {
    auto session = findSession(sessionId);
    if (!session) {
        utils::Logger::warn("Recognizer result for unknown session " + sessionId);
        return false;
    }
    
    std::weak_ptr<Session> weak = session;
    return session->worker->submit([this, weak, result]() {
        if (auto locked = weak.lock()) {
            processAsrResult(*locked, result);
        }
    });
}

bool DictationService::endSession(const std::string& sessionId) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        auto it = sessions_.find(sessionId);
        if (it == sessions_.end()) {
            return false;
        }
        session = it->second;
        sessions_.erase(it);
    }
    
    utils::Logger::info("Ending session " + sessionId);
    
    // The finish task holds the last strong reference until the reaper joins
    session->worker->submit([this, session]() {
        finishSession(*session);
    });
    reaper_.submit([session]() {
        session->worker->stop();
    });
    return true;
}

void DictationService::endAllSessions() {
    for (const auto& sessionId : getSessionIds()) {
        endSession(sessionId);
    }
    waitForEndedSessions();
}

bool DictationService::hasSession(const std::string& sessionId) const {
    return findSession(sessionId) != nullptr;
}

size_t DictationService::getActiveSessionCount() const {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    return sessions_.size();
}

std::vector<std::string> DictationService::getSessionIds() const {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& entry : sessions_) {
        ids.push_back(entry.first);
    }
    return ids;
}

std::optional<SessionConfig> DictationService::getSessionConfig(const std::string& sessionId) const {
    auto session = findSession(sessionId);
    if (!session) {
        return std::nullopt;
    }
    return session->getConfig();
}

std::string DictationService::buildHealthReport() {
    auto metrics = metrics_.snapshot();
    
    nlohmann::json report;
    report["status"] = "healthy";
    report["service"] = "meddictate";
    report["activeSessions"] = getActiveSessionCount();
    report["decoderSessions"] = reconstructor_.getActiveSessionCount();
    report["recognizer"] = asrEngine_ ? asrEngine_->getName() : "";
    report["lexiconTerms"] = validator_.getLexicon().getTermCount();
    report["validation"] = {
        {"totalValidations", metrics.totalValidations},
        {"streamingValidations", metrics.streamingValidations},
        {"correctionsApplied", metrics.correctionsApplied},
        {"hallucinationsDetected", metrics.hallucinationsDetected},
        {"unknownTermFlags", metrics.unknownTermFlags},
        {"lowConfidenceFlags", metrics.lowConfidenceFlags},
        {"userCorrections", metrics.userCorrections},
        {"correctionRate", metrics.correctionRate},
        {"hallucinationRate", metrics.hallucinationRate}
    };
    auto& errors = utils::ErrorHandler::getInstance();
    report["errors"] = errors.getErrorCount();
    report["recentErrors"] = nlohmann::json::array();
    for (const auto& error : errors.getRecentErrors(5)) {
        report["recentErrors"].push_back({
            {"category", utils::categoryToString(error.category)},
            {"severity", utils::severityToString(error.severity)},
            {"message", error.message},
            {"context", error.context},
            {"sessionId", error.session_id}
        });
    }
    return report.dump();
}

void DictationService::waitIdle(const std::string& sessionId) {
    if (auto session = findSession(sessionId)) {
        session->worker->waitIdle();
    }
}

void DictationService::waitForEndedSessions() {
    reaper_.waitIdle();
}

void DictationService::processChunk(Session& session, const std::vector<uint8_t>& chunk) {
    utils::ErrorContext context("audio_chunk", session.id);
    
    reconstructor_.addData(session.streamKey, chunk);
    processPcm(session, reconstructor_.getPCMData(session.streamKey));
}

void DictationService::processPcm(Session& session, const std::vector<uint8_t>& pcm) {
    if (pcm.empty()) {
        return;
    }
    
    auto speech = session.vad->process(pcm);
    bool speaking = session.vad->isSpeaking();
    
    if (speaking && !session.wasSpeaking) {
        utils::Logger::debug("Session " + session.id + ": speech started");
        StatusUpdateMessage status(StatusUpdateMessage::State::LISTENING);
        emit(session.id, status);
    }
    
    if (speech) {
        session.utterance.insert(session.utterance.end(), speech->begin(), speech->end());
    }
    
    if (!speaking && session.wasSpeaking) {
        utils::Logger::debug("Session " + session.id + ": speech ended");
        submitUtterance(session);
        StatusUpdateMessage status(StatusUpdateMessage::State::IDLE);
        emit(session.id, status);
    } else if (session.utterance.size() >= maxUtteranceBytes_) {
        utils::Logger::debug("Session " + session.id + ": utterance reached maximum length");
        submitUtterance(session);
    }
    
    session.wasSpeaking = speaking;
}

void DictationService::submitUtterance(Session& session) {
    if (session.utterance.empty()) {
        return;
    }
    
    std::vector<uint8_t> pcm;
    pcm.swap(session.utterance);
    
    if (!asrEngine_) {
        utils::Logger::debug("Session " + session.id + ": no recognizer, dropped utterance of " +
                             std::to_string(pcm.size()) + " bytes");
        return;
    }
    
    std::string language = session.getConfig().language;
    utils::Logger::info("Session " + session.id + ": recognizing " + std::to_string(pcm.size()) +
                        " bytes with " + asrEngine_->getName());
    
    try {
        AsrResult result = asrEngine_->transcribe(pcm, language);
        result.isPartial = false;
        processAsrResult(session, result);
    } catch (const std::exception& e) {
        // Any recognizer failure, including resource exhaustion, costs only this utterance
        utils::Logger::error("Session " + session.id + ": recognition failed: " + e.what());
        MEDDICTATE_HANDLE_EXCEPTION(e, "asr");
    }
}

void DictationService::processAsrResult(Session& session, const AsrResult& result) {
    utils::ErrorContext context("asr_result", session.id);
    
    if (utils::trim(result.text).empty()) {
        utils::Logger::debug("Session " + session.id + ": empty recognizer result ignored");
        return;
    }
    
    SessionConfig config = session.getConfig();
    std::string medicalContext = config.getContextName();
    std::string language = result.language.empty() ? config.language : result.language;
    
    validation::ValidationResult validated = result.isPartial
        ? validator_.validateStreaming(result.text, result.confidence, medicalContext)
        : validator_.validate(result.text, result.confidence, medicalContext);
    
    if (!result.isPartial) {
        if (options_.suppressDuplicates && !session.transcript.empty() &&
            isDuplicateTranscription(validated.correctedText, session.transcript.back())) {
            utils::Logger::info("Session " + session.id + ": skipping duplicate transcription");
            return;
        }
        session.transcript.push_back(validated.correctedText);
        session.totalTranscriptions++;
    }
    
    if (!validated.warnings.empty()) {
        utils::Logger::info("Session " + session.id + ": transcription has " +
                            std::to_string(validated.warnings.size()) + " warning(s), quality " +
                            std::to_string(validated.qualityScore));
    }
    
    TranscriptionMessage message(validated, language, !result.isPartial);
    emit(session.id, message);
}

void DictationService::finishSession(Session& session) {
    utils::ErrorContext context("end_session", session.id);
    
    try {
        processPcm(session, reconstructor_.flushSession(session.streamKey));
        submitUtterance(session);
    } catch (const std::exception& e) {
        utils::Logger::error("Session " + session.id + ": failed to drain audio at end: " + e.what());
        MEDDICTATE_HANDLE_EXCEPTION(e, "end_session");
    }
    // Teardown below runs on every path so the decoder process is always released
    reconstructor_.endSession(session.streamKey);
    
    if (session.wasSpeaking) {
        StatusUpdateMessage status(StatusUpdateMessage::State::IDLE);
        emit(session.id, status);
        session.wasSpeaking = false;
    }
    
    double duration = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - session.startTime).count();
    
    SessionEndedMessage message(session.totalTranscriptions, duration,
                                utils::join(session.transcript, " "));
    emit(session.id, message);
    
    session.vad->reset();
    session.transcript.clear();
    
    utils::Logger::info("Session " + session.id + " ended after " + std::to_string(duration) +
                        "s with " + std::to_string(session.totalTranscriptions) + " transcription(s)");
}

void DictationService::emit(const std::string& sessionId, Message& message) {
    if (!sink_) {
        return;
    }
    message.setSessionId(sessionId);
    try {
        sink_(sessionId, message.serialize());
    } catch (const std::exception& e) {
        utils::Logger::error("Failed to deliver " + MessageProtocol::messageTypeToString(message.getType()) +
                             " for session " + sessionId + ": " + e.what());
    }
}

} // namespace core
} // namespace meddictate

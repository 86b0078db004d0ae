#include <gtest/gtest.h>
#include "core/dictation_service.hpp"
#include "utils/error_handler.hpp"
#include "../fixtures/fake_components.hpp"
#include "../fixtures/test_data_generator.hpp"
#include <nlohmann/json.hpp>
#include <set>
#include <stdexcept>

using namespace meddictate;
using namespace meddictate::core;
using fixtures::EventRecorder;

class DictationServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        lexicon_ = std::make_shared<const validation::MedicalLexicon>(
            validation::MedicalLexicon::parse(fixtures::TestDataGenerator::sampleLexiconJson()));
        service_ = makeService(DictationOptions{});
    }
    
    void TearDown() override {
        service_.reset();
    }
    
    std::unique_ptr<DictationService> makeService(const DictationOptions& options) {
        return std::make_unique<DictationService>(options, fixtures::makePassthroughFactory(),
                                                  lexicon_, nullptr, events_.sink());
    }
    
    AsrResult result(const std::string& text, double confidence, bool isPartial = false) {
        AsrResult r;
        r.text = text;
        r.confidence = confidence;
        r.isPartial = isPartial;
        return r;
    }
    
    std::shared_ptr<const validation::MedicalLexicon> lexicon_;
    EventRecorder events_;
    std::unique_ptr<DictationService> service_;
};

TEST(DuplicateTranscriptionTest, NormalizedEquality) {
    EXPECT_TRUE(isDuplicateTranscription("Befund unauffällig.", "befund unauffällig"));
    EXPECT_TRUE(isDuplicateTranscription("  Befund, unauffällig!", "Befund unauffällig"));
    EXPECT_FALSE(isDuplicateTranscription("Befund auffällig", "Befund unauffällig"));
    EXPECT_FALSE(isDuplicateTranscription("", ""));
    EXPECT_FALSE(isDuplicateTranscription("...", "Befund"));
}

TEST(DuplicateTranscriptionTest, ContainmentNeedsLongText) {
    const std::string longText =
        "Mammographie beidseits ohne Nachweis von Mikrokalk oder Herdbefund";
    const std::string extended = longText + " im Vergleich zur Voruntersuchung";
    EXPECT_TRUE(isDuplicateTranscription(longText, extended));
    EXPECT_TRUE(isDuplicateTranscription(extended, longText));
    
    EXPECT_FALSE(isDuplicateTranscription("Befund", "Befund unauffällig"));
    EXPECT_FALSE(isDuplicateTranscription("Befund unauffällig rechts", "Befund"));
}

TEST_F(DictationServiceTest, InvalidOptionsThrow) {
    DictationOptions badVad;
    badVad.vad.frameDurationMs = 0;
    EXPECT_THROW(makeService(badVad), std::invalid_argument);
    
    DictationOptions noUtterance;
    noUtterance.maxUtteranceMs = 0;
    EXPECT_THROW(makeService(noUtterance), std::invalid_argument);
}

TEST_F(DictationServiceTest, StartSessionEmitsOnce) {
    EXPECT_TRUE(service_->startSession("s1"));
    EXPECT_FALSE(service_->startSession("s1"));
    
    EXPECT_TRUE(service_->hasSession("s1"));
    EXPECT_EQ(service_->getActiveSessionCount(), 1u);
    
    auto started = events_.ofType("session_started");
    ASSERT_EQ(started.size(), 1u);
    EXPECT_EQ(started[0]["data"]["sessionId"], "s1");
    EXPECT_EQ(started[0]["data"]["language"], "de");
    EXPECT_TRUE(started[0]["data"]["medicalContext"].is_null());
}

TEST_F(DictationServiceTest, DefaultLanguageComesFromOptions) {
    DictationOptions options;
    options.defaultLanguage = "en";
    auto service = makeService(options);
    
    service->startSession("s");
    EXPECT_EQ(service->getSessionConfig("s")->language, "en");
}

TEST_F(DictationServiceTest, StartWithConfigOnExistingSessionUpdatesIt) {
    service_->startSession("s1");
    
    SessionConfig config{"en", MedicalContext::SPINE};
    EXPECT_FALSE(service_->startSession("s1", config));
    EXPECT_EQ(service_->getSessionConfig("s1")->language, "en");
    EXPECT_EQ(events_.ofType("config_updated").size(), 1u);
}

TEST_F(DictationServiceTest, UpdateConfigCreatesSession) {
    SessionConfig config{"de", MedicalContext::MAMMOGRAPHY};
    service_->updateConfig("s2", config);
    
    EXPECT_EQ(events_.types(), (std::vector<std::string>{"session_started", "config_updated"}));
    auto stored = service_->getSessionConfig("s2");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->getContextName(), "mammography");
    
    service_->updateConfig("s2", SessionConfig{"en", std::nullopt});
    EXPECT_EQ(events_.ofType("config_updated").size(), 2u);
    EXPECT_EQ(service_->getSessionConfig("s2")->language, "en");
    EXPECT_EQ(events_.ofType("session_started").size(), 1u);
}

TEST_F(DictationServiceTest, UnknownSessionQueries) {
    EXPECT_FALSE(service_->hasSession("ghost"));
    EXPECT_FALSE(service_->getSessionConfig("ghost").has_value());
    EXPECT_FALSE(service_->handleAsrResult("ghost", result("Befund", 0.9)));
    EXPECT_FALSE(service_->endSession("ghost"));
    service_->waitIdle("ghost");
}

TEST_F(DictationServiceTest, FinalResultIsValidatedWithSessionContext) {
    service_->startSession("s", SessionConfig{"de", MedicalContext::MAMMOGRAPHY});
    ASSERT_TRUE(service_->handleAsrResult("s", result("Mamografie Befund unauffällig", 0.92)));
    service_->waitIdle("s");
    
    auto transcriptions = events_.ofType("transcription");
    ASSERT_EQ(transcriptions.size(), 1u);
    const auto& data = transcriptions[0]["data"];
    EXPECT_EQ(data["text"], "Mammographie Befund unauffällig");
    EXPECT_EQ(data["language"], "de");
    EXPECT_NEAR(data["qualityScore"].get<double>(), 0.92, 1e-9);
    EXPECT_TRUE(data["isFinal"].get<bool>());
    EXPECT_TRUE(data["isValid"].get<bool>());
    EXPECT_EQ(data["corrections"].size(), 1u);
    
    EXPECT_EQ(service_->getMetrics().snapshot().totalValidations, 1u);
}

TEST_F(DictationServiceTest, PartialResultUsesStreamingValidation) {
    service_->startSession("s");
    service_->handleAsrResult("s", result("Befunt Untertitel", 0.9, true));
    service_->waitIdle("s");
    
    auto transcriptions = events_.ofType("transcription");
    ASSERT_EQ(transcriptions.size(), 1u);
    EXPECT_FALSE(transcriptions[0]["data"]["isFinal"].get<bool>());
    EXPECT_EQ(transcriptions[0]["data"]["text"], "Befund Untertitel");
    EXPECT_TRUE(transcriptions[0]["data"]["flags"].empty());
    
    auto snapshot = service_->getMetrics().snapshot();
    EXPECT_EQ(snapshot.streamingValidations, 1u);
    EXPECT_EQ(snapshot.totalValidations, 0u);
    
    service_->endSession("s");
    service_->waitForEndedSessions();
    auto ended = events_.ofType("session_ended");
    ASSERT_EQ(ended.size(), 1u);
    EXPECT_EQ(ended[0]["data"]["totalTranscriptions"], 0);
    EXPECT_EQ(ended[0]["data"]["transcript"], "");
}

TEST_F(DictationServiceTest, ResultLanguageOverridesSessionLanguage) {
    service_->startSession("s");
    AsrResult r = result("Befund", 0.9);
    r.language = "en";
    service_->handleAsrResult("s", r);
    service_->waitIdle("s");
    
    ASSERT_EQ(events_.ofType("transcription").size(), 1u);
    EXPECT_EQ(events_.ofType("transcription")[0]["data"]["language"], "en");
}

TEST_F(DictationServiceTest, BlankResultIsIgnored) {
    service_->startSession("s");
    service_->handleAsrResult("s", result("   ", 0.9));
    service_->waitIdle("s");
    EXPECT_TRUE(events_.ofType("transcription").empty());
}

TEST_F(DictationServiceTest, DuplicateFinalResultsAreSuppressed) {
    service_->startSession("s");
    service_->handleAsrResult("s", result("Befund unauffällig", 0.9));
    service_->handleAsrResult("s", result("Befund unauffällig.", 0.9));
    service_->handleAsrResult("s", result("Zyste links", 0.9));
    service_->endSession("s");
    service_->waitForEndedSessions();
    
    EXPECT_EQ(events_.ofType("transcription").size(), 2u);
    auto ended = events_.ofType("session_ended");
    ASSERT_EQ(ended.size(), 1u);
    EXPECT_EQ(ended[0]["data"]["totalTranscriptions"], 2);
    EXPECT_EQ(ended[0]["data"]["transcript"], "Befund unauffällig Zyste links");
    EXPECT_GE(ended[0]["data"]["durationSeconds"].get<double>(), 0.0);
}

TEST_F(DictationServiceTest, DuplicateSuppressionCanBeDisabled) {
    DictationOptions options;
    options.suppressDuplicates = false;
    auto service = makeService(options);
    
    service->startSession("s");
    service->handleAsrResult("s", result("Befund unauffällig", 0.9));
    service->handleAsrResult("s", result("Befund unauffällig", 0.9));
    service->waitIdle("s");
    
    EXPECT_EQ(events_.ofType("transcription").size(), 2u);
}

TEST_F(DictationServiceTest, EndSessionIsIdempotent) {
    service_->startSession("s");
    EXPECT_TRUE(service_->endSession("s"));
    EXPECT_FALSE(service_->endSession("s"));
    EXPECT_FALSE(service_->hasSession("s"));
    
    service_->waitForEndedSessions();
    EXPECT_EQ(events_.ofType("session_ended").size(), 1u);
    EXPECT_EQ(service_->getReconstructor().getActiveSessionCount(), 0u);
}

TEST_F(DictationServiceTest, SessionCanBeReopenedAfterEnd) {
    service_->startSession("s");
    service_->handleAsrResult("s", result("Befund", 0.9));
    service_->endSession("s");
    
    EXPECT_TRUE(service_->startSession("s"));
    service_->handleAsrResult("s", result("Zyste", 0.9));
    service_->endSession("s");
    service_->waitForEndedSessions();
    
    auto ended = events_.ofType("session_ended");
    ASSERT_EQ(ended.size(), 2u);
    std::set<std::string> transcripts;
    for (const auto& event : ended) {
        transcripts.insert(event["data"]["transcript"].get<std::string>());
    }
    EXPECT_EQ(transcripts, (std::set<std::string>{"Befund", "Zyste"}));
}

TEST_F(DictationServiceTest, AudioCreatesSessionAndDecoderStream) {
    auto wav = fixtures::TestDataGenerator::toWavFile(std::vector<float>(320, 0.0f));
    service_->addAudio("audio", wav);
    service_->addAudio("audio", {});
    service_->waitIdle("audio");
    
    EXPECT_TRUE(service_->hasSession("audio"));
    EXPECT_EQ(events_.ofType("session_started").size(), 1u);
    EXPECT_EQ(service_->getReconstructor().getActiveSessionCount(), 1u);
}

TEST_F(DictationServiceTest, EndAllSessions) {
    service_->startSession("a");
    service_->startSession("b");
    service_->endAllSessions();
    
    EXPECT_EQ(service_->getActiveSessionCount(), 0u);
    EXPECT_EQ(events_.ofType("session_ended").size(), 2u);
}

TEST_F(DictationServiceTest, HealthReport) {
    service_->startSession("s");
    service_->handleAsrResult("s", result("Mamografie", 0.9));
    service_->waitIdle("s");
    
    auto report = nlohmann::json::parse(service_->buildHealthReport());
    EXPECT_EQ(report["status"], "healthy");
    EXPECT_EQ(report["service"], "meddictate");
    EXPECT_EQ(report["activeSessions"], 1);
    EXPECT_EQ(report["decoderSessions"], 1);
    EXPECT_EQ(report["recognizer"], "");
    EXPECT_EQ(report["lexiconTerms"], 11);
    EXPECT_EQ(report["validation"]["totalValidations"], 1);
    EXPECT_EQ(report["validation"]["correctionsApplied"], 1);
    EXPECT_TRUE(report.contains("errors"));
    EXPECT_TRUE(report["recentErrors"].is_array());
}

TEST_F(DictationServiceTest, DecodeFailureIsAttributedToSession) {
    auto service = std::make_unique<DictationService>(DictationOptions{}, fixtures::makeFailingFactory(),
                                                      lexicon_, nullptr, events_.sink());
    auto& handler = utils::ErrorHandler::getInstance();
    size_t decodeErrorsBefore = handler.getErrorCount(utils::ErrorCategory::AUDIO_DECODING);
    
    service->addAudio("broken", fixtures::TestDataGenerator::toWavFile(std::vector<float>(3200, 0.1f)));
    service->waitIdle("broken");
    
    EXPECT_EQ(handler.getErrorCount(utils::ErrorCategory::AUDIO_DECODING), decodeErrorsBefore + 1);
    auto recent = handler.getRecentErrors(1);
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_EQ(recent[0].category, utils::ErrorCategory::AUDIO_DECODING);
    EXPECT_EQ(recent[0].context, "audio_chunk");
    EXPECT_EQ(recent[0].session_id, "broken");
    
    auto report = nlohmann::json::parse(service->buildHealthReport());
    ASSERT_FALSE(report["recentErrors"].empty());
    const auto& last = report["recentErrors"].back();
    EXPECT_EQ(last["category"], "AudioDecoding");
    EXPECT_EQ(last["sessionId"], "broken");
}

class DictationServiceFailureTest : public DictationServiceTest {
protected:
    std::unique_ptr<DictationService> makeCrashingService() {
        return std::make_unique<DictationService>(DictationOptions{}, fixtures::makeWavStrippingFactory(),
                                                  lexicon_, asr_, events_.sink());
    }
    
    void stream(DictationService& service, const std::string& sessionId,
                const std::vector<fixtures::AudioSegment>& segments) {
        auto wav = fixtures::TestDataGenerator::toWavFile(generator_.generateScenario(segments));
        for (auto& chunk : fixtures::TestDataGenerator::splitIntoChunks(wav, 3200)) {
            service.addAudio(sessionId, std::move(chunk));
        }
    }
    
    std::shared_ptr<fixtures::CrashingAsrEngine> asr_ = std::make_shared<fixtures::CrashingAsrEngine>();
    fixtures::TestDataGenerator generator_;
};

TEST_F(DictationServiceFailureTest, UnexpectedRecognizerFailureStillEndsSession) {
    using fixtures::SegmentType;
    auto service = makeCrashingService();
    size_t errorsBefore = utils::ErrorHandler::getInstance().getErrorCount();
    
    // Speech still pending when the session ends
    stream(*service, "crash", {{SegmentType::SILENCE, 0.5f}, {SegmentType::SPEECH, 1.0f}});
    service->endSession("crash");
    service->waitForEndedSessions();
    
    EXPECT_EQ(asr_->getCallCount(), 1);
    auto ended = events_.ofType("session_ended");
    ASSERT_EQ(ended.size(), 1u);
    EXPECT_EQ(ended[0]["data"]["totalTranscriptions"], 0);
    EXPECT_EQ(service->getReconstructor().getActiveSessionCount(), 0u);
    
    auto& handler = utils::ErrorHandler::getInstance();
    EXPECT_GT(handler.getErrorCount(), errorsBefore);
    auto recent = handler.getRecentErrors(1);
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_EQ(recent[0].message, "Resource temporarily unavailable");
    EXPECT_EQ(recent[0].context, "asr");
    EXPECT_EQ(recent[0].session_id, "crash");
}

TEST_F(DictationServiceFailureTest, UnexpectedRecognizerFailureKeepsSessionRunning) {
    using fixtures::SegmentType;
    auto service = makeCrashingService();
    
    stream(*service, "crash", {{SegmentType::SPEECH, 1.0f}, {SegmentType::SILENCE, 1.0f},
                               {SegmentType::SPEECH, 1.0f}, {SegmentType::SILENCE, 1.0f}});
    service->waitIdle("crash");
    
    EXPECT_EQ(asr_->getCallCount(), 2);
    EXPECT_TRUE(service->hasSession("crash"));
    EXPECT_EQ(events_.ofType("status_update").size(), 4u);
}

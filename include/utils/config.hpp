#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>

namespace meddictate {
namespace utils {

struct DecoderSettings {
    std::string command = "ffmpeg";
    std::vector<std::string> args = {
        "-i", "pipe:0", "-vn", "-f", "s16le", "-acodec", "pcm_s16le",
        "-ar", "16000", "-ac", "1", "-loglevel", "error", "pipe:1"
    };
    std::string mode = "streaming";       // "streaming" or "batch"
    uint32_t flushTimeoutMs = 2000;
    size_t maxHeaderlessBytes = 64 * 1024;
    uint32_t batchTimeoutMs = 10000;
};

struct VadSettings {
    uint32_t speechThreshold = 2;         // frames
    uint32_t silenceThreshold = 40;       // frames
    float energyThreshold = 0.01f;
    float noiseFloor = 0.005f;
    float zcrThreshold = 0.15f;
    uint32_t historyFrames = 50;
    uint32_t minHistoryFrames = 10;
    float adaptiveMultiplier = 1.2f;
};

struct SessionSettings {
    uint32_t maxUtteranceMs = 30000;
    bool suppressDuplicates = true;
    std::string defaultLanguage = "de";
};

struct AsrSettings {
    std::string command;                  // empty disables recognition
    std::vector<std::string> args;
    uint32_t timeoutMs = 30000;
};

class Config {
public:
    Config() = default;
    
    // Missing or malformed file yields defaults; never throws.
    static Config load(const std::string& configPath);
    static Config fromJson(const std::string& json);
    
    int getPort() const { return port_; }
    std::string getLogLevel() const { return logLevel_; }
    const std::string& getLexiconPath() const { return lexiconPath_; }
    const DecoderSettings& getDecoder() const { return decoder_; }
    const VadSettings& getVad() const { return vad_; }
    const SessionSettings& getSession() const { return session_; }
    const AsrSettings& getAsr() const { return asr_; }
    
    void setPort(int port) { port_ = port; }
    void setLogLevel(const std::string& level) { logLevel_ = level; }
    void setLexiconPath(const std::string& path) { lexiconPath_ = path; }
    
private:
    int port_ = 8080;
    std::string logLevel_ = "INFO";
    std::string lexiconPath_ = "data/lexicon/de-medical.json";
    DecoderSettings decoder_;
    VadSettings vad_;
    SessionSettings session_;
    AsrSettings asr_;
};

} // namespace utils
} // namespace meddictate

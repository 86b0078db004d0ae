#include "utils/config.hpp"
#include "utils/logging.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <limits>
#include <sstream>

namespace meddictate {
namespace utils {

namespace {

using nlohmann::json;

// json::value() wraps a negative number into an unsigned target, so counts
// and durations are range-checked here and fall back when out of range
template <typename T>
T readUnsigned(const json& j, const char* key, T fallback) {
    auto it = j.find(key);
    if (it == j.end()) {
        return fallback;
    }
    if (!it->is_number_unsigned() ||
        it->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
        Logger::warn(std::string("Invalid value for '") + key + "': " + it->dump() +
                     ", using " + std::to_string(fallback));
        return fallback;
    }
    return it->get<T>();
}

bool isUsable(const VadSettings& vad) {
    return vad.speechThreshold > 0 && vad.silenceThreshold > 0 &&
           vad.energyThreshold > 0.0f && vad.noiseFloor >= 0.0f &&
           vad.zcrThreshold >= 0.0f && vad.zcrThreshold <= 1.0f &&
           vad.historyFrames > 0 && vad.minHistoryFrames <= vad.historyFrames &&
           vad.adaptiveMultiplier > 0.0f;
}

void parseDecoder(const json& j, DecoderSettings& decoder) {
    decoder.command = j.value("command", decoder.command);
    if (j.contains("args") && j["args"].is_array()) {
        decoder.args = j["args"].get<std::vector<std::string>>();
    }
    decoder.mode = j.value("mode", decoder.mode);
    decoder.flushTimeoutMs = readUnsigned(j, "flushTimeoutMs", decoder.flushTimeoutMs);
    decoder.maxHeaderlessBytes = readUnsigned(j, "maxHeaderlessBytes", decoder.maxHeaderlessBytes);
    decoder.batchTimeoutMs = readUnsigned(j, "batchTimeoutMs", decoder.batchTimeoutMs);
    
    if (decoder.mode != "streaming" && decoder.mode != "batch") {
        Logger::warn("Unknown decoder mode '" + decoder.mode + "', using streaming");
        decoder.mode = "streaming";
    }
}

void parseVad(const json& j, VadSettings& vad) {
    VadSettings parsed = vad;
    parsed.speechThreshold = readUnsigned(j, "speechThreshold", parsed.speechThreshold);
    parsed.silenceThreshold = readUnsigned(j, "silenceThreshold", parsed.silenceThreshold);
    parsed.energyThreshold = j.value("energyThreshold", parsed.energyThreshold);
    parsed.noiseFloor = j.value("noiseFloor", parsed.noiseFloor);
    parsed.zcrThreshold = j.value("zcrThreshold", parsed.zcrThreshold);
    parsed.historyFrames = readUnsigned(j, "historyFrames", parsed.historyFrames);
    parsed.minHistoryFrames = readUnsigned(j, "minHistoryFrames", parsed.minHistoryFrames);
    parsed.adaptiveMultiplier = j.value("adaptiveMultiplier", parsed.adaptiveMultiplier);
    
    // The detector refuses these, so one bad value keeps the whole block at defaults
    if (!isUsable(parsed)) {
        Logger::warn("VAD settings out of range, using defaults");
        return;
    }
    vad = parsed;
}

void parseSession(const json& j, SessionSettings& session) {
    uint32_t maxUtteranceMs = readUnsigned(j, "maxUtteranceMs", session.maxUtteranceMs);
    if (maxUtteranceMs == 0) {
        Logger::warn("session.maxUtteranceMs must be positive, using " +
                     std::to_string(session.maxUtteranceMs));
    } else {
        session.maxUtteranceMs = maxUtteranceMs;
    }
    session.suppressDuplicates = j.value("suppressDuplicates", session.suppressDuplicates);
    session.defaultLanguage = j.value("defaultLanguage", session.defaultLanguage);
}

void parseAsr(const json& j, AsrSettings& asr) {
    asr.command = j.value("command", asr.command);
    if (j.contains("args") && j["args"].is_array()) {
        asr.args = j["args"].get<std::vector<std::string>>();
    }
    asr.timeoutMs = readUnsigned(j, "timeoutMs", asr.timeoutMs);
}

} // namespace

Config Config::load(const std::string& configPath) {
    std::ifstream file(configPath);
    if (!file.is_open()) {
        Logger::warn("Config file not found: " + configPath + ", using defaults");
        return Config();
    }
    
    std::stringstream buffer;
    buffer << file.rdbuf();
    Logger::info("Loading configuration from " + configPath);
    return fromJson(buffer.str());
}

Config Config::fromJson(const std::string& jsonStr) {
    Config config;
    
    try {
        json j = json::parse(jsonStr);
        if (!j.is_object()) {
            Logger::warn("Configuration root is not an object, using defaults");
            return config;
        }
        
        config.port_ = j.value("port", config.port_);
        config.logLevel_ = j.value("logLevel", config.logLevel_);
        config.lexiconPath_ = j.value("lexiconPath", config.lexiconPath_);
        
        if (j.contains("decoder") && j["decoder"].is_object()) {
            parseDecoder(j["decoder"], config.decoder_);
        }
        if (j.contains("vad") && j["vad"].is_object()) {
            parseVad(j["vad"], config.vad_);
        }
        if (j.contains("session") && j["session"].is_object()) {
            parseSession(j["session"], config.session_);
        }
        if (j.contains("asr") && j["asr"].is_object()) {
            parseAsr(j["asr"], config.asr_);
        }
    } catch (const json::exception& e) {
        Logger::warn("Configuration parse error: " + std::string(e.what()) + ", using defaults");
        return Config();
    }
    
    return config;
}

} // namespace utils
} // namespace meddictate

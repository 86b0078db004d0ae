#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace meddictate {
namespace core {

struct AsrResult {
    std::string text;
    double confidence = 0.0;
    std::string language;
    bool isPartial = false;
};

/**
 * Speech recognizer boundary. Receives one utterance of 16 kHz mono s16le
 * PCM. Implementations throw utils::AsrException on failure.
 */
class AsrEngine {
public:
    virtual ~AsrEngine() = default;
    
    virtual AsrResult transcribe(const std::vector<uint8_t>& pcm, const std::string& language) = 0;
    virtual std::string getName() const = 0;
};

struct AsrCommand {
    std::string program;
    // "{language}" in any argument is replaced by the session language
    std::vector<std::string> args;
    std::chrono::milliseconds timeout{30000};
};

/**
 * Runs an external recognizer per utterance: a WAV file is written to its
 * stdin and a JSON object {text, confidence, language} is read from its
 * stdout.
 */
class CommandAsrEngine : public AsrEngine {
public:
    explicit CommandAsrEngine(const AsrCommand& command);
    
    AsrResult transcribe(const std::vector<uint8_t>& pcm, const std::string& language) override;
    std::string getName() const override { return command_.program; }
    
    // Parses recognizer stdout. Throws utils::AsrException.
    static AsrResult parseOutput(const std::string& output, const std::string& fallbackLanguage);
    
private:
    std::vector<std::string> buildArgv(const std::string& language) const;
    
    AsrCommand command_;
};

} // namespace core
} // namespace meddictate

#include "core/asr_engine.hpp"
#include "audio/pcm_utils.hpp"
#include "audio/subprocess.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace meddictate {
namespace core {

namespace {
const std::string kLanguagePlaceholder = "{language}";
}

CommandAsrEngine::CommandAsrEngine(const AsrCommand& command)
    : command_(command) {
    if (command_.program.empty()) {
        throw std::invalid_argument("ASR command must not be empty");
    }
}

std::vector<std::string> CommandAsrEngine::buildArgv(const std::string& language) const {
    std::vector<std::string> argv;
    argv.push_back(command_.program);
    for (std::string arg : command_.args) {
        size_t pos = arg.find(kLanguagePlaceholder);
        while (pos != std::string::npos) {
            arg.replace(pos, kLanguagePlaceholder.size(), language);
            pos = arg.find(kLanguagePlaceholder, pos + language.size());
        }
        argv.push_back(std::move(arg));
    }
    return argv;
}

AsrResult CommandAsrEngine::transcribe(const std::vector<uint8_t>& pcm, const std::string& language) {
    audio::Subprocess process;
    if (!process.start(buildArgv(language))) {
        throw utils::AsrException("Failed to start recognizer: " + process.getLastError(), command_.program);
    }
    
    std::vector<uint8_t> wav = audio::makeWavFile(pcm);
    if (!process.write(wav)) {
        utils::Logger::warn("Recognizer " + command_.program + " stopped reading input after " +
                            std::to_string(wav.size()) + " bytes");
    }
    process.closeInput();
    
    auto exitCode = process.waitFor(command_.timeout);
    if (!exitCode) {
        process.terminate();
        throw utils::AsrException("Recognizer timed out after " +
                                  std::to_string(command_.timeout.count()) + "ms", command_.program);
    }
    if (*exitCode != 0) {
        throw utils::AsrException("Recognizer exited with code " + std::to_string(*exitCode) +
                                  ": " + process.getStderr(), command_.program);
    }
    
    std::vector<uint8_t> output = process.takeOutput();
    return parseOutput(std::string(output.begin(), output.end()), language);
}

AsrResult CommandAsrEngine::parseOutput(const std::string& output, const std::string& fallbackLanguage) {
    nlohmann::json root = nlohmann::json::parse(output, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        throw utils::AsrException("Recognizer output is not a JSON object");
    }
    
    auto text = root.find("text");
    if (text == root.end() || !text->is_string()) {
        throw utils::AsrException("Recognizer output has no text");
    }
    
    AsrResult result;
    result.text = text->get<std::string>();
    result.language = fallbackLanguage;
    
    auto confidence = root.find("confidence");
    if (confidence != root.end() && confidence->is_number()) {
        result.confidence = confidence->get<double>();
    }
    auto language = root.find("language");
    if (language != root.end() && language->is_string() && !language->get<std::string>().empty()) {
        result.language = language->get<std::string>();
    }
    return result;
}

} // namespace core
} // namespace meddictate

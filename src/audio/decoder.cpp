#include "audio/decoder.hpp"
#include "audio/subprocess.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <csignal>

namespace meddictate {
namespace audio {

ProcessDecoder::ProcessDecoder(const DecoderCommand& command)
    : command_(command), process_(std::make_unique<Subprocess>()),
      error_(false), closed_(false) {
}

ProcessDecoder::~ProcessDecoder() = default;

void ProcessDecoder::start() {
    std::vector<std::string> argv;
    argv.reserve(command_.args.size() + 1);
    argv.push_back(command_.program);
    argv.insert(argv.end(), command_.args.begin(), command_.args.end());
    
    if (!process_->start(argv)) {
        error_ = true;
        errorMessage_ = process_->getLastError();
        throw utils::DecodeException("Failed to start decoder: " + errorMessage_);
    }
}

bool ProcessDecoder::feed(const std::vector<uint8_t>& bytes) {
    if (error_ || closed_) {
        return false;
    }
    
    if (!process_->write(bytes)) {
        error_ = true;
        errorMessage_ = process_->getLastError();
        std::string stderrText = process_->getStderr();
        if (!stderrText.empty()) {
            errorMessage_ += ": " + stderrText;
        }
        return false;
    }
    
    checkExit();
    return !error_;
}

std::vector<uint8_t> ProcessDecoder::drain() {
    checkExit();
    return process_->takeOutput();
}

std::vector<uint8_t> ProcessDecoder::close(std::chrono::milliseconds grace) {
    if (!closed_) {
        closed_ = true;
        process_->closeInput();
        
        auto code = process_->waitFor(grace);
        if (!code) {
            utils::Logger::warn("Decoder did not finish within " +
                                std::to_string(grace.count()) + "ms, terminating");
            process_->terminate(std::chrono::milliseconds(200));
            if (!error_) {
                error_ = true;
                errorMessage_ = "decoder timed out after " + std::to_string(grace.count()) + "ms";
            }
        } else if (*code != 0 && !error_) {
            error_ = true;
            errorMessage_ = "decoder exited with code " + std::to_string(*code) +
                            ": " + process_->getStderr();
        }
    }
    return process_->takeOutput();
}

void ProcessDecoder::abort() {
    process_->sendSignal(SIGTERM);
}

bool ProcessDecoder::hasError() const {
    return error_;
}

std::string ProcessDecoder::getErrorMessage() const {
    return errorMessage_;
}

void ProcessDecoder::checkExit() {
    if (closed_ || error_) {
        return;
    }
    // Exiting while input is still open is always a failure for a streaming decoder
    if (!process_->isRunning()) {
        auto code = process_->exitCode();
        std::string stderrText = process_->getStderr();
        error_ = true;
        errorMessage_ = "decoder exited early with code " +
                        std::to_string(code ? *code : -1) +
                        (stderrText.empty() ? "" : ": " + stderrText);
    }
}

DecoderFactory makeProcessDecoderFactory(const DecoderCommand& command) {
    return [command]() -> std::unique_ptr<Decoder> {
        auto decoder = std::make_unique<ProcessDecoder>(command);
        decoder->start();
        return decoder;
    };
}

std::vector<uint8_t> decodeOnce(const DecoderFactory& factory,
                                const std::vector<uint8_t>& input,
                                std::chrono::milliseconds timeout) {
    std::unique_ptr<Decoder> decoder = factory();
    
    if (!decoder->feed(input)) {
        std::string message = decoder->getErrorMessage();
        decoder->close(std::chrono::milliseconds(0));
        throw utils::DecodeException("Batch decode failed while writing input: " + message);
    }
    
    std::vector<uint8_t> pcm = decoder->drain();
    std::vector<uint8_t> tail = decoder->close(timeout);
    pcm.insert(pcm.end(), tail.begin(), tail.end());
    
    if (decoder->hasError()) {
        throw utils::DecodeException("Batch decode failed: " + decoder->getErrorMessage());
    }
    return pcm;
}

} // namespace audio
} // namespace meddictate

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace meddictate {
namespace audio {

/**
 * Codec behind the stream reconstructor: compressed container bytes in,
 * s16le mono PCM out. Implementations may decode asynchronously, so
 * drain() returns whatever is ready and never blocks on the codec.
 */
class Decoder {
public:
    virtual ~Decoder() = default;
    
    // False when the decoder can no longer accept input.
    virtual bool feed(const std::vector<uint8_t>& bytes) = 0;
    
    virtual std::vector<uint8_t> drain() = 0;
    
    // End of stream: waits up to grace for the codec to finish and returns the tail.
    virtual std::vector<uint8_t> close(std::chrono::milliseconds grace) = 0;
    
    // Asks the codec to stop. Safe to call from another thread while feed() blocks.
    virtual void abort() = 0;
    
    virtual bool hasError() const = 0;
    virtual std::string getErrorMessage() const = 0;
};

// Creates a ready-to-feed decoder. Throws utils::DecodeException when it cannot.
using DecoderFactory = std::function<std::unique_ptr<Decoder>()>;

struct DecoderCommand {
    std::string program = "ffmpeg";
    std::vector<std::string> args = {
        "-i", "pipe:0", "-vn", "-f", "s16le", "-acodec", "pcm_s16le",
        "-ar", "16000", "-ac", "1", "-loglevel", "error", "pipe:1"
    };
};

class Subprocess;

/**
 * Long-lived external decoder process (ffmpeg by default) reading the
 * container on stdin and writing raw PCM to stdout.
 */
class ProcessDecoder : public Decoder {
public:
    explicit ProcessDecoder(const DecoderCommand& command);
    ~ProcessDecoder() override;
    
    // Spawns the process. Throws utils::DecodeException on failure.
    void start();
    
    bool feed(const std::vector<uint8_t>& bytes) override;
    std::vector<uint8_t> drain() override;
    std::vector<uint8_t> close(std::chrono::milliseconds grace) override;
    void abort() override;
    bool hasError() const override;
    std::string getErrorMessage() const override;
    
private:
    void checkExit();
    
    DecoderCommand command_;
    std::unique_ptr<Subprocess> process_;
    bool error_;
    bool closed_;
    std::string errorMessage_;
};

DecoderFactory makeProcessDecoderFactory(const DecoderCommand& command);

// Feeds the whole input to a fresh decoder and waits for it to finish.
// Throws utils::DecodeException on decoder error or timeout.
std::vector<uint8_t> decodeOnce(const DecoderFactory& factory,
                                const std::vector<uint8_t>& input,
                                std::chrono::milliseconds timeout);

} // namespace audio
} // namespace meddictate

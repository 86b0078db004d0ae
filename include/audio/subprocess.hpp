#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>
#include <thread>
#include <vector>

namespace meddictate {
namespace audio {

/**
 * Child process with piped stdin/stdout/stderr.
 *
 * stdout and stderr are drained by a background reader thread so a child
 * never stalls on a full output pipe while the owner is still writing.
 * The destructor always kills and reaps the child.
 *
 * write(), closeInput(), waitFor() and terminate() belong to the owning
 * thread. sendSignal() may be called from any thread.
 */
class Subprocess {
public:
    Subprocess();
    ~Subprocess();
    
    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;
    
    // argv[0] is resolved through PATH. Returns false if the program could not be executed.
    bool start(const std::vector<std::string>& argv);
    
    // Blocks until everything is written. False once the child stopped reading.
    bool write(const uint8_t* data, size_t size);
    bool write(const std::vector<uint8_t>& data) { return write(data.data(), data.size()); }
    
    // Signals end-of-stream to the child.
    void closeInput();
    
    // Everything read from stdout since the last call.
    std::vector<uint8_t> takeOutput();
    bool hasOutput() const;
    
    // Exit status once the child has finished, nullopt on timeout.
    // Signalled children report 128 + signal number.
    std::optional<int> waitFor(std::chrono::milliseconds timeout);
    std::optional<int> exitCode() const;
    
    // SIGTERM, then SIGKILL if the child outlives the grace period. Reaps the child.
    void terminate(std::chrono::milliseconds grace = std::chrono::milliseconds(500));
    
    void sendSignal(int signal);
    
    bool isRunning();
    pid_t getPid() const;
    
    // Last few KB of stderr, for diagnostics
    std::string getStderr() const;
    const std::string& getLastError() const { return lastError_; }

private:
    void readerLoop(int stdoutFd, int stderrFd);
    bool reap(bool block);
    void joinReader();
    void closeFd(int& fd);
    
    pid_t pid_;
    int stdinFd_;
    int stdoutFd_;
    int stderrFd_;
    std::optional<int> exitCode_;
    std::string lastError_;
    
    mutable std::mutex pidMutex_;
    
    mutable std::mutex outputMutex_;
    std::vector<uint8_t> output_;
    std::string stderr_;
    
    std::thread reader_;
};

} // namespace audio
} // namespace meddictate

#include "audio/subprocess.hpp"
#include "utils/logging.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <initializer_list>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace meddictate {
namespace audio {

namespace {

constexpr size_t kMaxStderrBytes = 4096;
constexpr size_t kReadChunkSize = 8192;

void ignoreSigpipeOnce() {
    static std::once_flag once;
    std::call_once(once, []() {
        std::signal(SIGPIPE, SIG_IGN);
    });
}

bool makePipe(int fds[2]) {
    return ::pipe2(fds, O_CLOEXEC) == 0;
}

void closeQuietly(int fd) {
    if (fd >= 0) {
        ::close(fd);
    }
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace

Subprocess::Subprocess()
    : pid_(-1), stdinFd_(-1), stdoutFd_(-1), stderrFd_(-1) {
}

Subprocess::~Subprocess() {
    closeInput();
    if (isRunning()) {
        terminate(std::chrono::milliseconds(200));
    } else {
        reap(true);
    }
    joinReader();
    closeFd(stdoutFd_);
    closeFd(stderrFd_);
}

bool Subprocess::start(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        lastError_ = "empty command line";
        return false;
    }
    if (pid_ > 0) {
        lastError_ = "process already started";
        return false;
    }
    
    ignoreSigpipeOnce();
    
    int inPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int execPipe[2] = {-1, -1};
    
    if (!makePipe(inPipe) || !makePipe(outPipe) || !makePipe(errPipe) || !makePipe(execPipe)) {
        lastError_ = std::string("pipe failed: ") + std::strerror(errno);
        for (int fd : {inPipe[0], inPipe[1], outPipe[0], outPipe[1],
                       errPipe[0], errPipe[1], execPipe[0], execPipe[1]}) {
            closeQuietly(fd);
        }
        return false;
    }
    
    // Built before fork: the child may only make async-signal-safe calls
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);
    
    pid_t pid = ::fork();
    if (pid < 0) {
        lastError_ = std::string("fork failed: ") + std::strerror(errno);
        for (int fd : {inPipe[0], inPipe[1], outPipe[0], outPipe[1],
                       errPipe[0], errPipe[1], execPipe[0], execPipe[1]}) {
            closeQuietly(fd);
        }
        return false;
    }
    
    if (pid == 0) {
        ::dup2(inPipe[0], STDIN_FILENO);
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::execvp(args[0], args.data());
        int err = errno;
        ssize_t ignored = ::write(execPipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }
    
    closeQuietly(inPipe[0]);
    closeQuietly(outPipe[1]);
    closeQuietly(errPipe[1]);
    closeQuietly(execPipe[1]);
    
    {
        std::lock_guard<std::mutex> lock(pidMutex_);
        pid_ = pid;
        exitCode_.reset();
    }
    
    // EOF means exec succeeded (close-on-exec); an int means it failed
    int childErrno = 0;
    ssize_t n;
    do {
        n = ::read(execPipe[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    closeQuietly(execPipe[0]);
    
    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        lastError_ = "cannot execute '" + argv[0] + "': " + std::strerror(childErrno);
        closeQuietly(inPipe[1]);
        closeQuietly(outPipe[0]);
        closeQuietly(errPipe[0]);
        reap(true);
        return false;
    }
    
    stdinFd_ = inPipe[1];
    stdoutFd_ = outPipe[0];
    stderrFd_ = errPipe[0];
    
    reader_ = std::thread(&Subprocess::readerLoop, this, stdoutFd_, stderrFd_);
    
    utils::Logger::debug("Started process " + argv[0] + " (pid " + std::to_string(pid) + ")");
    return true;
}

bool Subprocess::write(const uint8_t* data, size_t size) {
    if (stdinFd_ < 0) {
        lastError_ = "input already closed";
        return false;
    }
    
    size_t written = 0;
    while (written < size) {
        ssize_t n = ::write(stdinFd_, data + written, size - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            lastError_ = std::string("write failed: ") + std::strerror(errno);
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

void Subprocess::closeInput() {
    closeFd(stdinFd_);
}

std::vector<uint8_t> Subprocess::takeOutput() {
    std::lock_guard<std::mutex> lock(outputMutex_);
    std::vector<uint8_t> out;
    out.swap(output_);
    return out;
}

bool Subprocess::hasOutput() const {
    std::lock_guard<std::mutex> lock(outputMutex_);
    return !output_.empty();
}

std::optional<int> Subprocess::waitFor(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    
    while (true) {
        if (reap(false)) {
            // Child is gone; the reader sees EOF and finishes collecting output
            joinReader();
            return exitCode();
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return std::nullopt;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

std::optional<int> Subprocess::exitCode() const {
    std::lock_guard<std::mutex> lock(pidMutex_);
    return exitCode_;
}

void Subprocess::terminate(std::chrono::milliseconds grace) {
    if (!reap(false)) {
        sendSignal(SIGTERM);
        if (!waitFor(grace)) {
            utils::Logger::warn("Process " + std::to_string(getPid()) +
                                " ignored SIGTERM, sending SIGKILL");
            sendSignal(SIGKILL);
            reap(true);
        }
    }
    closeInput();
    joinReader();
}

void Subprocess::sendSignal(int signal) {
    std::lock_guard<std::mutex> lock(pidMutex_);
    if (pid_ > 0) {
        ::kill(pid_, signal);
    }
}

bool Subprocess::isRunning() {
    return !reap(false) && getPid() > 0;
}

pid_t Subprocess::getPid() const {
    std::lock_guard<std::mutex> lock(pidMutex_);
    return pid_;
}

std::string Subprocess::getStderr() const {
    std::lock_guard<std::mutex> lock(outputMutex_);
    return stderr_;
}

void Subprocess::readerLoop(int stdoutFd, int stderrFd) {
    pollfd fds[2];
    fds[0] = {stdoutFd, POLLIN, 0};
    fds[1] = {stderrFd, POLLIN, 0};
    std::vector<uint8_t> buffer(kReadChunkSize);
    
    while (fds[0].fd >= 0 || fds[1].fd >= 0) {
        int ready = ::poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            ssize_t n = ::read(fds[i].fd, buffer.data(), buffer.size());
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                // Negative fd makes poll skip the entry
                fds[i].fd = -1;
                continue;
            }
            
            std::lock_guard<std::mutex> lock(outputMutex_);
            if (i == 0) {
                output_.insert(output_.end(), buffer.begin(), buffer.begin() + n);
            } else {
                stderr_.append(reinterpret_cast<const char*>(buffer.data()), static_cast<size_t>(n));
                if (stderr_.size() > kMaxStderrBytes) {
                    stderr_.erase(0, stderr_.size() - kMaxStderrBytes);
                }
            }
        }
    }
    
}

bool Subprocess::reap(bool block) {
    std::lock_guard<std::mutex> lock(pidMutex_);
    if (pid_ <= 0) {
        return exitCode_.has_value();
    }
    
    int status = 0;
    pid_t result;
    do {
        result = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (result < 0 && errno == EINTR);
    
    if (result == pid_) {
        exitCode_ = decodeStatus(status);
        pid_ = -1;
        return true;
    }
    if (result < 0) {
        // Already reaped elsewhere; nothing left to wait for
        exitCode_ = -1;
        pid_ = -1;
        return true;
    }
    return false;
}

void Subprocess::joinReader() {
    if (reader_.joinable()) {
        reader_.join();
    }
}

void Subprocess::closeFd(int& fd) {
    closeQuietly(fd);
    fd = -1;
}

} // namespace audio
} // namespace meddictate

#include "core/task_queue.hpp"
#include "utils/logging.hpp"

namespace meddictate {
namespace core {

TaskQueue::TaskQueue() : shutdown_(false) {
}

TaskQueue::~TaskQueue() {
    shutdown();
}

bool TaskQueue::enqueue(Task task) {
    if (!task) {
        return false;
    }
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            return false;
        }
        queue_.push_back(std::move(task));
    }
    condition_.notify_one();
    return true;
}

bool TaskQueue::dequeue(Task& task) {
    std::unique_lock<std::mutex> lock(mutex_);
    
    condition_.wait(lock, [this] { return !queue_.empty() || shutdown_; });
    
    if (queue_.empty()) {
        return false;
    }
    
    task = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

size_t TaskQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool TaskQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

size_t TaskQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t dropped = queue_.size();
    queue_.clear();
    return dropped;
}

void TaskQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
    }
    condition_.notify_all();
}

bool TaskQueue::isShuttingDown() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shutdown_;
}

// SerialWorker implementation

SerialWorker::SerialWorker(std::string name)
    : name_(std::move(name)), running_(false), submitted_(0), completed_(0) {
}

SerialWorker::~SerialWorker() {
    stop();
}

void SerialWorker::start() {
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (running_ || queue_.isShuttingDown()) {
        return;
    }
    running_ = true;
    thread_ = std::thread(&SerialWorker::workerLoop, this);
}

bool SerialWorker::submit(Task task) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (!running_) {
        return false;
    }
    if (!queue_.enqueue(std::move(task))) {
        return false;
    }
    submitted_++;
    return true;
}

void SerialWorker::waitIdle() {
    std::unique_lock<std::mutex> lock(stateMutex_);
    if (thread_.get_id() == std::this_thread::get_id()) {
        return;
    }
    idleCondition_.wait(lock, [this] { return completed_ >= submitted_ || !running_; });
}

void SerialWorker::stop() {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (!running_) {
            return;
        }
    }
    
    queue_.shutdown();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    } else if (thread_.joinable()) {
        thread_.detach();
    }
    
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        running_ = false;
    }
    idleCondition_.notify_all();
}

bool SerialWorker::isRunning() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return running_;
}

size_t SerialWorker::getPendingTasks() const {
    return queue_.size();
}

void SerialWorker::workerLoop() {
    Task task;
    while (queue_.dequeue(task)) {
        try {
            task();
        } catch (const std::exception& e) {
            utils::Logger::error("Worker " + name_ + " task failed: " + e.what());
        }
        task = nullptr;
        
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            completed_++;
        }
        idleCondition_.notify_all();
    }
}

} // namespace core
} // namespace meddictate

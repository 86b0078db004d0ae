#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace meddictate {
namespace core {

using Task = std::function<void()>;

/**
 * Thread-safe FIFO task queue
 */
class TaskQueue {
public:
    TaskQueue();
    ~TaskQueue();
    
    // Non-copyable, non-movable
    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;
    
    /**
     * Add a task to the back of the queue. Returns false once shut down.
     */
    bool enqueue(Task task);
    
    /**
     * Get the next task (blocks if empty).
     * Returns false when the queue is shut down and drained.
     */
    bool dequeue(Task& task);
    
    size_t size() const;
    bool empty() const;
    
    /**
     * Drop all pending tasks, returning how many were dropped
     */
    size_t clear();
    
    /**
     * Stop accepting tasks and wake up waiting consumers. Tasks already
     * queued are still handed out.
     */
    void shutdown();
    bool isShuttingDown() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<Task> queue_;
    bool shutdown_;
};

/**
 * Single worker thread draining a TaskQueue in submission order. Each
 * dictation session owns one, which serializes all of its pipeline work.
 */
class SerialWorker {
public:
    explicit SerialWorker(std::string name);
    ~SerialWorker();
    
    SerialWorker(const SerialWorker&) = delete;
    SerialWorker& operator=(const SerialWorker&) = delete;
    
    void start();
    
    /**
     * Queue a task. Returns false if the worker is stopped.
     */
    bool submit(Task task);
    
    /**
     * Block until every task submitted so far has run
     */
    void waitIdle();
    
    /**
     * Finish queued tasks and join the thread
     */
    void stop();
    
    bool isRunning() const;
    size_t getPendingTasks() const;
    const std::string& getName() const { return name_; }

private:
    void workerLoop();
    
    std::string name_;
    TaskQueue queue_;
    std::thread thread_;
    bool running_;
    
    mutable std::mutex stateMutex_;
    std::condition_variable idleCondition_;
    size_t submitted_;
    size_t completed_;
};

} // namespace core
} // namespace meddictate

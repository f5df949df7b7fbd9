#pragma once

#include "backend/audio_backend.h"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace roomcast::backend {

/**
 * @brief Runs backend calls one at a time, in submission order, with a bounded wait.
 *
 * A single worker thread owned by the invoker executes the queue. invoke()
 * waits at most timeout() for its call:
 *   - still queued at the deadline: the call is dropped and never runs
 *   - already running at the deadline: the caller gets BACKEND_TIMEOUT and the
 *     call finishes in the background, ahead of everything queued after it
 *
 * defer() queues a call without waiting for it. Deferred calls are never
 * dropped; they are how a caller undoes the effect of a call it gave up on.
 *
 * The destructor runs whatever is still queued and joins the worker.
 */
class BackendInvoker {
   public:
    using Call = std::function<BackendResult(AudioBackend&)>;

    BackendInvoker(std::shared_ptr<AudioBackend> backend, std::chrono::milliseconds timeout,
                   std::string name);
    ~BackendInvoker();

    BackendInvoker(const BackendInvoker&) = delete;
    BackendInvoker& operator=(const BackendInvoker&) = delete;

    BackendResult invoke(const std::string& what, Call call);
    void defer(const std::string& what, Call call);

    // Block until the queue is empty and nothing is running
    bool waitUntilIdle(std::chrono::milliseconds timeout);

    std::chrono::milliseconds timeout() const {
        return timeout_;
    }

   private:
    enum class TaskState : uint8_t { Queued, Running, Done, Dropped };

    struct Task {
        std::string what;
        Call call;
        bool deferred = false;
        TaskState state = TaskState::Queued;
        BackendResult result;
    };

    void workerLoop();
    BackendResult run(Task& task);

    std::shared_ptr<AudioBackend> backend_;
    std::chrono::milliseconds timeout_;
    std::string name_;

    std::mutex mutex_;
    std::condition_variable queueCv_;
    std::condition_variable doneCv_;
    std::deque<std::shared_ptr<Task>> queue_;
    bool running_ = false;
    bool stopping_ = false;
    std::thread worker_;
};

}  // namespace roomcast::backend

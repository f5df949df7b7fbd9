#include "backend/backend_invoker.h"

#include "logging/logger.h"

#include <exception>
#include <utility>

namespace roomcast::backend {

BackendInvoker::BackendInvoker(std::shared_ptr<AudioBackend> backend,
                               std::chrono::milliseconds timeout, std::string name)
    : backend_(std::move(backend)), timeout_(timeout), name_(std::move(name)) {
    worker_ = std::thread(&BackendInvoker::workerLoop, this);
}

BackendInvoker::~BackendInvoker() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    queueCv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

BackendResult BackendInvoker::invoke(const std::string& what, Call call) {
    if (!backend_) {
        return BackendResult::failure(ErrorCode::TRANSITION_NO_BACKEND, "no backend configured");
    }

    auto task = std::make_shared<Task>();
    task->what = what;
    task->call = std::move(call);

    std::unique_lock<std::mutex> lock(mutex_);
    queue_.push_back(task);
    queueCv_.notify_all();

    if (doneCv_.wait_for(lock, timeout_, [&task] { return task->state == TaskState::Done; })) {
        BackendResult result = std::move(task->result);
        lock.unlock();
        if (!result.ok()) {
            LOG_WARN("[{}] {} failed: {} ({})", name_, what, result.message,
                     errorCodeToString(result.code));
        }
        return result;
    }

    if (task->state == TaskState::Queued) {
        task->state = TaskState::Dropped;
        lock.unlock();
        LOG_WARN("[{}] {} dropped: backend still busy after {}ms", name_, what, timeout_.count());
        return BackendResult::failure(
            ErrorCode::BACKEND_TIMEOUT,
            what + " not started within " + std::to_string(timeout_.count()) + "ms");
    }

    lock.unlock();
    LOG_WARN("[{}] {} did not finish within {}ms", name_, what, timeout_.count());
    return BackendResult::failure(
        ErrorCode::BACKEND_TIMEOUT,
        what + " timed out after " + std::to_string(timeout_.count()) + "ms");
}

void BackendInvoker::defer(const std::string& what, Call call) {
    if (!backend_) {
        return;
    }

    auto task = std::make_shared<Task>();
    task->what = what;
    task->call = std::move(call);
    task->deferred = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(task));
    }
    queueCv_.notify_all();
    LOG_INFO("[{}] {} queued behind the running call", name_, what);
}

bool BackendInvoker::waitUntilIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return doneCv_.wait_for(lock, timeout, [this] { return queue_.empty() && !running_; });
}

void BackendInvoker::workerLoop() {
    while (true) {
        std::shared_ptr<Task> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            queueCv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                break;
            }
            task = queue_.front();
            queue_.pop_front();
            if (task->state == TaskState::Dropped) {
                lock.unlock();
                doneCv_.notify_all();
                continue;
            }
            task->state = TaskState::Running;
            running_ = true;
        }

        BackendResult result = run(*task);
        if (task->deferred && !result.ok()) {
            LOG_WARN("[{}] Deferred {} failed: {}", name_, task->what, result.message);
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            task->result = std::move(result);
            task->state = TaskState::Done;
            running_ = false;
        }
        doneCv_.notify_all();
    }
}

BackendResult BackendInvoker::run(Task& task) {
    try {
        return task.call(*backend_);
    } catch (const std::exception& e) {
        return BackendResult::failure(ErrorCode::BACKEND_COMMAND_FAILED,
                                      task.what + " threw: " + e.what());
    }
}

}  // namespace roomcast::backend

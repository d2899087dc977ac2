// StreamProv - Dedicated stream provisioning service
// Task Queue implementation

#include "streamprov/provisioning/task_queue.hpp"

#include <algorithm>
#include <exception>

namespace streamprov {
namespace provisioning {

using core::Result;

namespace {

const char* const CATEGORY = "TaskQueue";

} // anonymous namespace

TaskQueue::TaskQueue(size_t workerCount, std::shared_ptr<core::StructuredLogger> logger)
    : workerCount_(workerCount == 0 ? 1 : workerCount)
    , logger_(std::move(logger))
{
}

TaskQueue::~TaskQueue() {
    shutdown();
}

void TaskQueue::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_ || stopping_) {
        return;
    }
    running_ = true;
    for (size_t i = 0; i < workerCount_; ++i) {
        workers_.emplace_back(&TaskQueue::workerLoop, this);
    }
}

Result<TaskId, TaskError> TaskQueue::submit(TaskBody body, const TaskOptions& options) {
    if (!body) {
        return Result<TaskId, TaskError>::error(
            TaskError(TaskError::Code::InvalidTask, "Task body is empty"));
    }

    TaskId id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return Result<TaskId, TaskError>::error(
                TaskError(TaskError::Code::QueueStopped, "Task queue is shut down"));
        }
        Task task;
        task.id = nextId_++;
        task.body = std::move(body);
        task.options = options;
        if (task.options.maxAttempts == 0) {
            task.options.maxAttempts = 1;
        }
        task.notBefore = std::chrono::steady_clock::now();
        id = task.id;
        queue_.push_back(std::move(task));
        stats_.submitted++;
        stats_.pending++;
    }
    workCondition_.notify_one();
    return Result<TaskId, TaskError>::success(id);
}

bool TaskQueue::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idleCondition_.wait_for(lock, timeout, [this]() { return stats_.pending == 0; });
}

void TaskQueue::shutdown() {
    std::vector<std::thread> workers;
    std::deque<Task> dropped;
    CompletionCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && workers_.empty()) {
            return;
        }
        stopping_ = true;
        running_ = false;
        dropped.swap(queue_);
        workers.swap(workers_);
        stats_.pending -= dropped.size();
        stats_.failed += dropped.size();
        callback = completionCallback_;
    }
    workCondition_.notify_all();
    idleCondition_.notify_all();

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    if (!dropped.empty()) {
        STREAMPROV_LOG_WARNING(logger_, CATEGORY,
            std::to_string(dropped.size()) + " queued tasks dropped at shutdown");
    }
    if (callback) {
        for (const auto& task : dropped) {
            TaskOutcome outcome;
            outcome.id = task.id;
            outcome.name = task.options.name;
            outcome.succeeded = false;
            outcome.attempts = task.attempts;
            outcome.error = "Task queue shut down";
            callback(outcome);
        }
    }
}

bool TaskQueue::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

TaskQueueStats TaskQueue::getStatistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void TaskQueue::setCompletionCallback(CompletionCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    completionCallback_ = std::move(callback);
}

void TaskQueue::workerLoop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            while (true) {
                if (stopping_) {
                    return;
                }
                if (queue_.empty()) {
                    workCondition_.wait(lock);
                    continue;
                }
                auto next = std::min_element(queue_.begin(), queue_.end(),
                    [](const Task& a, const Task& b) { return a.notBefore < b.notBefore; });
                if (next->notBefore <= std::chrono::steady_clock::now()) {
                    task = std::move(*next);
                    queue_.erase(next);
                    break;
                }
                workCondition_.wait_until(lock, next->notBefore);
            }
        }

        // Execute outside the lock
        task.attempts++;
        Result<void, TaskError> outcome = Result<void, TaskError>::success();
        try {
            outcome = task.body();
        } catch (const std::exception& e) {
            outcome = Result<void, TaskError>::error(
                TaskError(TaskError::Code::Failed, std::string("Task threw: ") + e.what()));
        }

        if (outcome.isSuccess()) {
            finish(task, true, "");
            continue;
        }

        const TaskError& error = outcome.error();
        if (error.code == TaskError::Code::Retryable && task.attempts < task.options.maxAttempts) {
            STREAMPROV_LOG_DEBUG(logger_, CATEGORY,
                "Task " + task.options.name + " attempt " + std::to_string(task.attempts) +
                " failed, retrying: " + error.message);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!stopping_) {
                    stats_.retried++;
                    task.notBefore = std::chrono::steady_clock::now() + task.options.retryDelay;
                    queue_.push_back(std::move(task));
                    workCondition_.notify_one();
                    continue;
                }
            }
        }
        finish(task, false, error.message);
    }
}

void TaskQueue::finish(const Task& task, bool succeeded, const std::string& error) {
    CompletionCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (succeeded) {
            stats_.succeeded++;
        } else {
            stats_.failed++;
        }
        stats_.pending--;
        callback = completionCallback_;
    }
    idleCondition_.notify_all();

    if (!succeeded) {
        STREAMPROV_LOG_WARNING(logger_, CATEGORY,
            "Task " + task.options.name + " failed after " + std::to_string(task.attempts) +
            " attempt(s): " + error);
    }

    if (callback) {
        TaskOutcome outcome;
        outcome.id = task.id;
        outcome.name = task.options.name;
        outcome.succeeded = succeeded;
        outcome.attempts = task.attempts;
        outcome.error = error;
        callback(outcome);
    }
}

} // namespace provisioning
} // namespace streamprov

// StreamProv - Dedicated stream provisioning service
// Task Queue - Observable background work with retries
//
// Responsibilities:
// - Run submitted tasks on worker threads
// - Retry failed tasks after a delay, up to a per-task attempt limit
// - Report every final outcome through statistics and a callback
//
// Nothing submitted here is fire-and-forget: each task ends as
// succeeded or failed, and both are counted and reported.

#ifndef STREAMPROV_PROVISIONING_TASK_QUEUE_HPP
#define STREAMPROV_PROVISIONING_TASK_QUEUE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "streamprov/core/result.hpp"
#include "streamprov/core/structured_logger.hpp"

namespace streamprov {
namespace provisioning {

struct TaskError {
    enum class Code {
        None,
        Failed,         ///< Task body reported failure
        Retryable,      ///< Task body asked to be retried
        QueueStopped,   ///< Submitted after shutdown
        InvalidTask
    };

    Code code = Code::None;
    std::string message;

    TaskError() = default;
    TaskError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
};

using TaskId = uint64_t;
using TaskBody = std::function<core::Result<void, TaskError>()>;

struct TaskOptions {
    std::string name;
    uint32_t maxAttempts = 1;
    std::chrono::milliseconds retryDelay{0};
};

/**
 * @brief Final outcome of a task, reported once.
 */
struct TaskOutcome {
    TaskId id = 0;
    std::string name;
    bool succeeded = false;
    uint32_t attempts = 0;
    std::string error;
};

struct TaskQueueStats {
    uint64_t submitted = 0;
    uint64_t succeeded = 0;
    uint64_t failed = 0;
    uint64_t retried = 0;
    uint64_t pending = 0;    ///< Queued, waiting for a retry, or running
};

/**
 * @brief Worker-thread task queue.
 *
 * Only Code::Retryable failures are retried; any other failure ends the
 * task. shutdown() stops accepting work, drops tasks that have not
 * started, and joins the workers.
 *
 * @code
 * TaskQueue queue(1, logger);
 * queue.start();
 * TaskOptions options;
 * options.name = "verify-42";
 * options.maxAttempts = 3;
 * queue.submit([]() { return core::Result<void, TaskError>::success(); }, options);
 * queue.waitIdle(std::chrono::seconds(5));
 * @endcode
 */
class TaskQueue {
public:
    using CompletionCallback = std::function<void(const TaskOutcome&)>;

    explicit TaskQueue(
        size_t workerCount = 1,
        std::shared_ptr<core::StructuredLogger> logger = nullptr
    );

    /**
     * @brief Calls shutdown().
     */
    ~TaskQueue();

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    void start();

    core::Result<TaskId, TaskError> submit(TaskBody body, const TaskOptions& options = TaskOptions());

    /**
     * @brief Block until nothing is pending.
     * @return false when the timeout expired first
     */
    bool waitIdle(std::chrono::milliseconds timeout);

    void shutdown();

    bool isRunning() const;

    TaskQueueStats getStatistics() const;

    void setCompletionCallback(CompletionCallback callback);

private:
    struct Task {
        TaskId id = 0;
        TaskBody body;
        TaskOptions options;
        uint32_t attempts = 0;
        std::chrono::steady_clock::time_point notBefore;
    };

    void workerLoop();
    void finish(const Task& task, bool succeeded, const std::string& error);

    size_t workerCount_;
    std::shared_ptr<core::StructuredLogger> logger_;

    mutable std::mutex mutex_;
    std::condition_variable workCondition_;
    std::condition_variable idleCondition_;
    std::deque<Task> queue_;
    std::vector<std::thread> workers_;
    bool running_ = false;
    bool stopping_ = false;
    TaskId nextId_ = 1;
    TaskQueueStats stats_;
    CompletionCallback completionCallback_;
};

} // namespace provisioning
} // namespace streamprov

#endif // STREAMPROV_PROVISIONING_TASK_QUEUE_HPP

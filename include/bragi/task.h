#pragma once

#include "export.h"
#include "errors.h"
#include "progress.h"
#include <atomic>
#include <exception>
#include <functional>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

namespace bragi {

/**
 * @brief Task lifecycle
 */
enum class TaskState {
    NotStarted,
    Running,
    Succeeded,
    Failed
};

/**
 * @brief Observer callbacks for a Task
 *
 * All callbacks run on the task's worker thread. Exactly one of on_success
 * and on_error fires per started task. A std::exception thrown by either is
 * logged and dropped; anything else thrown from them terminates.
 */
template <typename Result>
struct TaskCallbacks {
    std::function<void(const std::string&)> on_progress;
    std::function<void(const Result&)> on_success;
    std::function<void(const std::string&)> on_error;
};

/**
 * @brief One-shot background job
 *
 * Runs a unit of work on its own thread, forwards its progress messages and
 * reports a single terminal event. A task is started at most once.
 *
 * Example usage:
 * @code
 * bragi::Task<std::string> task([&](const bragi::ProgressCallback& progress,
 *                                   const bragi::CancellationToken& token) {
 *     return pipeline.run(progress, token);
 * });
 *
 * bragi::TaskCallbacks<std::string> callbacks;
 * callbacks.on_progress = [](const std::string& m) { std::cout << m << "\n"; };
 * callbacks.on_error = [](const std::string& m) { std::cerr << m << "\n"; };
 * task.start(callbacks);
 * task.wait();
 * @endcode
 */
template <typename Result>
class Task {
public:
    using Work = std::function<Result(const ProgressCallback&, const CancellationToken&)>;

    explicit Task(Work work) : work_(std::move(work)), state_(TaskState::NotStarted) {}

    ~Task() { wait(); }

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    /**
     * @brief Start the work on a new thread
     * @throws std::logic_error if the task was already started
     */
    void start(TaskCallbacks<Result> callbacks) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (thread_.joinable() || state_.load() != TaskState::NotStarted) {
            throw std::logic_error("Task already started");
        }
        state_ = TaskState::Running;
        thread_ = std::thread(&Task::run, this, std::move(callbacks));
    }

    /**
     * @brief Request cooperative cancellation
     *
     * The work stops at its next checkpoint and the task reports on_error.
     */
    void cancel() { token_.cancel(); }

    /**
     * @brief Block until the worker thread has finished
     */
    void wait() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
            thread_.join();
        }
    }

    TaskState state() const { return state_.load(); }

    bool is_cancelled() const { return token_.is_cancelled(); }

private:
    void run(TaskCallbacks<Result> callbacks) {
        ProgressCallback progress = callbacks.on_progress;

        std::string error;
        bool failed = false;
        Result result{};

        try {
            result = work_(progress, token_);
        } catch (const std::exception& e) {
            failed = true;
            error = e.what();
        }

        try {
            if (failed) {
                state_ = TaskState::Failed;
                if (callbacks.on_error) {
                    callbacks.on_error(error);
                }
            } else {
                state_ = TaskState::Succeeded;
                if (callbacks.on_success) {
                    callbacks.on_success(result);
                }
            }
        } catch (const std::exception& e) {
            // The terminal event was delivered; an observer failure does not change the outcome
            std::cerr << "[Bragi] Task callback threw: " << e.what() << std::endl;
        }
    }

    Work work_;
    CancellationToken token_;
    std::atomic<TaskState> state_;
    std::mutex mutex_;
    std::thread thread_;
};

} // namespace bragi

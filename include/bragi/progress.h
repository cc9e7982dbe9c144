#pragma once

#include "export.h"
#include "errors.h"
#include <atomic>
#include <functional>
#include <memory>
#include <string>

namespace bragi {

/**
 * @brief Progress callback receiving human-readable status messages
 *
 * Called from the worker thread. May be empty.
 */
using ProgressCallback = std::function<void(const std::string& message)>;

/**
 * @brief Cooperative cancellation flag shared between a caller and a worker
 *
 * Copies share the same flag. The worker polls it between segments; an
 * in-flight collaborator call is never interrupted.
 */
class BRAGI_API CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true); }

    bool is_cancelled() const { return flag_->load(); }

    /**
     * @brief Throw CancelledError once cancellation has been requested
     */
    void throw_if_cancelled() const {
        if (is_cancelled()) {
            throw CancelledError();
        }
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

/**
 * @brief Invoke a progress callback if one is set
 */
inline void report(const ProgressCallback& progress, const std::string& message) {
    if (progress) {
        progress(message);
    }
}

} // namespace bragi

/**
 * @file test_task.cpp
 * @brief Background task lifecycle and terminal events
 */

#include <bragi/task.h>
#include "test_common.h"

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace bragi;

namespace {

struct Events {
    std::mutex mutex;
    std::vector<std::string> progress;
    int successes = 0;
    int errors = 0;
    std::string value;
    std::string error;

    TaskCallbacks<std::string> callbacks() {
        TaskCallbacks<std::string> cb;
        cb.on_progress = [this](const std::string& m) {
            std::lock_guard<std::mutex> lock(mutex);
            progress.push_back(m);
        };
        cb.on_success = [this](const std::string& v) {
            std::lock_guard<std::mutex> lock(mutex);
            successes++;
            value = v;
        };
        cb.on_error = [this](const std::string& e) {
            std::lock_guard<std::mutex> lock(mutex);
            errors++;
            error = e;
        };
        return cb;
    }
};

} // namespace

static void test_success() {
    bragi_test::section("successful work reports on_success once");

    Events events;
    Task<std::string> task([](const ProgressCallback& progress, const CancellationToken&) {
        report(progress, "step 1");
        report(progress, "step 2");
        return std::string("result");
    });

    CHECK(task.state() == TaskState::NotStarted);
    task.start(events.callbacks());
    task.wait();

    CHECK(task.state() == TaskState::Succeeded);
    CHECK(events.successes == 1);
    CHECK(events.errors == 0);
    CHECK(events.value == "result");
    CHECK(events.progress.size() == 2);
}

static void test_failure() {
    bragi_test::section("failing work reports on_error once");

    Events events;
    Task<std::string> task([](const ProgressCallback&, const CancellationToken&) -> std::string {
        throw std::runtime_error("disk on fire");
    });

    task.start(events.callbacks());
    task.wait();

    CHECK(task.state() == TaskState::Failed);
    CHECK(events.successes == 0);
    CHECK(events.errors == 1);
    CHECK(events.error == "disk on fire");
}

static void test_single_start() {
    bragi_test::section("a task starts at most once");

    Events events;
    Task<std::string> task([](const ProgressCallback&, const CancellationToken&) {
        return std::string("once");
    });

    task.start(events.callbacks());
    CHECK_THROWS(task.start(events.callbacks()), std::logic_error);
    task.wait();
    CHECK_THROWS(task.start(events.callbacks()), std::logic_error);
    CHECK(events.successes == 1);
}

static void test_cancel() {
    bragi_test::section("cancel ends the work with on_error");

    Events events;
    std::atomic<bool> started(false);
    Task<std::string> task([&started](const ProgressCallback&, const CancellationToken& token) {
        started = true;
        for (int i = 0; i < 1000; ++i) {
            token.throw_if_cancelled();
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return std::string("finished");
    });

    task.start(events.callbacks());
    while (!started) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    task.cancel();
    task.wait();

    CHECK(task.is_cancelled());
    CHECK(task.state() == TaskState::Failed);
    CHECK(events.successes == 0);
    CHECK(events.errors == 1);
    CHECK(events.error == "Cancelled");
}

static void test_throwing_observer() {
    bragi_test::section("a throwing terminal callback does not escape the worker");

    int errors = 0;
    TaskCallbacks<std::string> callbacks;
    callbacks.on_success = [](const std::string&) {
        throw std::runtime_error("observer broke");
    };
    callbacks.on_error = [&errors](const std::string&) { errors++; };

    Task<std::string> task([](const ProgressCallback&, const CancellationToken&) {
        return std::string("done");
    });
    task.start(callbacks);
    task.wait();

    CHECK(task.state() == TaskState::Succeeded);
    CHECK(errors == 0);

    Task<std::string> failing([](const ProgressCallback&, const CancellationToken&) -> std::string {
        throw std::runtime_error("work broke");
    });
    TaskCallbacks<std::string> rethrowing;
    rethrowing.on_error = [](const std::string& message) {
        throw std::runtime_error("observer saw: " + message);
    };
    failing.start(rethrowing);
    failing.wait();

    CHECK(failing.state() == TaskState::Failed);
}

int main() {
    test_success();
    test_failure();
    test_single_start();
    test_cancel();
    test_throwing_observer();
    return bragi_test::finish("test_task");
}

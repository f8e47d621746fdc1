/**
 * @file AsyncTaskManager.hpp
 * @brief Centralized management for background tasks.
 */

#pragma once

#include <string>
#include <vector>
#include <functional>
#include <thread>
#include <mutex>
#include <atomic>
#include <memory>
#include <algorithm>

namespace quietledger::application {

/**
 * @enum TaskType
 * @brief Categories of background work.
 */
enum class TaskType {
    Classification
};

/**
 * @struct TaskStatus
 * @brief Information about a running or completed task.
 *
 * A task abandoned by its waiter is flagged cancelled; the worker keeps
 * running until its own I/O timeout but its result is discarded.
 */
struct TaskStatus {
    int id;
    TaskType type;
    std::string description;
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::atomic<bool> cancelled{false};
    std::string errorMessage;
};

/**
 * @class AsyncTaskManager
 * @brief Runs detached background tasks and provides unified status tracking.
 */
class AsyncTaskManager {
public:
    AsyncTaskManager() = default;

    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    /**
     * @brief Submits a new task to be executed in the background.
     *
     * The callable receives the task status as its first argument. Tasks run
     * detached, so the callable must only capture state it co-owns.
     */
    template<typename F, typename... Args>
    std::shared_ptr<TaskStatus> SubmitTask(TaskType type, const std::string& description, F&& f, Args&&... args) {
        auto status = std::make_shared<TaskStatus>();
        status->id = m_state->nextId++;
        status->type = type;
        status->description = description;

        {
            std::lock_guard<std::mutex> lock(m_state->mutex);
            m_state->activeTasks.push_back(status);
        }

        std::thread([state = m_state, status](auto userFunc, auto... userArgs) {
            try {
                userFunc(status, std::move(userArgs)...);
            } catch (const std::exception& e) {
                status->failed = true;
                status->errorMessage = e.what();
            } catch (...) {
                status->failed = true;
                status->errorMessage = "Unknown error during task execution.";
            }
            status->isCompleted = true;
            CleanupCompletedTasks(*state);
        }, std::forward<F>(f), std::forward<Args>(args)...).detach();

        return status;
    }

    /** @brief Returns snapshots of all active tasks. */
    std::vector<std::shared_ptr<TaskStatus>> GetActiveTasks() const {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        return m_state->activeTasks;
    }

private:
    // Shared with detached workers so the manager may be destroyed first.
    struct SharedState {
        std::atomic<int> nextId{0};
        std::vector<std::shared_ptr<TaskStatus>> activeTasks;
        mutable std::mutex mutex;
    };

    static void CleanupCompletedTasks(SharedState& state) {
        std::lock_guard<std::mutex> lock(state.mutex);
        state.activeTasks.erase(
            std::remove_if(state.activeTasks.begin(), state.activeTasks.end(),
                [](const auto& s) { return s->isCompleted.load(); }),
            state.activeTasks.end()
        );
    }

    std::shared_ptr<SharedState> m_state = std::make_shared<SharedState>();
};

} // namespace quietledger::application

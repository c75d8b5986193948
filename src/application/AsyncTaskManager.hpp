/**
 * @file AsyncTaskManager.hpp
 * @brief Bounded pool of worker threads for background tasks.
 */

#pragma once

#include <string>
#include <vector>
#include <deque>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <memory>
#include <algorithm>
#include <iostream>

namespace longscribe::application {

/**
 * @enum TaskType
 * @brief Categories of background work.
 */
enum class TaskType {
    ChunkTranscription
};

/**
 * @struct TaskStatus
 * @brief Information about a queued, running or completed task.
 */
struct TaskStatus {
    int id = 0;
    TaskType type = TaskType::ChunkTranscription;
    std::string description;
    std::atomic<bool> isRunning{false};
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::string errorMessage; ///< Written before isCompleted is set.
};

/**
 * @class AsyncTaskManager
 * @brief Runs submitted tasks on at most maxConcurrency threads, in submission order.
 *
 * The destructor discards tasks that have not started and joins the workers,
 * so every task has finished or been dropped once the manager is gone.
 */
class AsyncTaskManager {
public:
    using TaskFn = std::function<void(std::shared_ptr<TaskStatus>)>;

    explicit AsyncTaskManager(std::size_t maxConcurrency)
        : m_maxConcurrency(std::max<std::size_t>(1, maxConcurrency)) {
        for (std::size_t i = 0; i < m_maxConcurrency; ++i) {
            m_workers.emplace_back(&AsyncTaskManager::WorkerLoop, this);
        }
    }

    ~AsyncTaskManager() {
        CancelPending();
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_running = false;
        }
        m_cv.notify_all();
        for (auto& w : m_workers) {
            if (w.joinable()) w.join();
        }
    }

    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    /** @brief Queues a task. The function receives its own status object. */
    std::shared_ptr<TaskStatus> SubmitTask(TaskType type, const std::string& description, TaskFn fn) {
        auto status = std::make_shared<TaskStatus>();
        status->id = m_nextId++;
        status->type = type;
        status->description = description;

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_queue.push_back({status, std::move(fn)});
            m_activeTasks.push_back(status);
        }
        m_cv.notify_one();
        return status;
    }

    /** @brief Drops every task that has not started yet. Returns how many were dropped. */
    std::size_t CancelPending() {
        std::deque<QueuedTask> dropped;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            dropped.swap(m_queue);
        }
        for (auto& task : dropped) {
            task.status->isCompleted = true;
        }
        CleanupCompletedTasks();
        return dropped.size();
    }

    /**
     * @brief Returns all tasks not yet completed, queued or running.
     *
     * A task leaves this list only after its function has returned.
     */
    std::vector<std::shared_ptr<TaskStatus>> GetActiveTasks() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_activeTasks;
    }

    std::size_t GetMaxConcurrency() const { return m_maxConcurrency; }

private:
    struct QueuedTask {
        std::shared_ptr<TaskStatus> status;
        TaskFn fn;
    };

    void WorkerLoop() {
        while (true) {
            QueuedTask task;
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_cv.wait(lock, [this] { return !m_queue.empty() || !m_running; });
                if (!m_running && m_queue.empty()) {
                    return;
                }
                task = std::move(m_queue.front());
                m_queue.pop_front();
            }

            task.status->isRunning = true;
            try {
                task.fn(task.status);
            } catch (const std::exception& e) {
                task.status->failed = true;
                task.status->errorMessage = e.what();
                std::cerr << "[AsyncTaskManager] Task '" << task.status->description
                          << "' failed: " << e.what() << std::endl;
            } catch (...) {
                task.status->failed = true;
                task.status->errorMessage = "Unknown error during task execution.";
                std::cerr << "[AsyncTaskManager] Task '" << task.status->description
                          << "' failed with an unknown error" << std::endl;
            }
            task.status->isRunning = false;
            task.status->isCompleted = true;
            CleanupCompletedTasks();
        }
    }

    void CleanupCompletedTasks() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_activeTasks.erase(
            std::remove_if(m_activeTasks.begin(), m_activeTasks.end(),
                [](const auto& s) { return s->isCompleted.load(); }),
            m_activeTasks.end()
        );
    }

    const std::size_t m_maxConcurrency;
    std::atomic<int> m_nextId{0};
    std::deque<QueuedTask> m_queue;
    std::vector<std::shared_ptr<TaskStatus>> m_activeTasks;
    std::vector<std::thread> m_workers;
    bool m_running = true;
    std::mutex m_mutex;
    std::condition_variable m_cv;
};

} // namespace longscribe::application

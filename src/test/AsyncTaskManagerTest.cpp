#undef NDEBUG
#include <iostream>
#include <cassert>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>
#include "application/AsyncTaskManager.hpp"

using namespace longscribe::application;
using namespace std::chrono_literals;

namespace {

void WaitUntilDrained(AsyncTaskManager& manager) {
    while (!manager.GetActiveTasks().empty()) std::this_thread::sleep_for(1ms);
}

} // namespace

int main() {
    std::cout << "[Test] Starting AsyncTaskManager tests..." << std::endl;

    std::cout << "[Test] Workers never exceed the configured concurrency..." << std::endl;
    {
        AsyncTaskManager manager(2);
        assert(manager.GetMaxConcurrency() == 2);
        std::atomic<int> running{0};
        std::atomic<int> peak{0};
        std::atomic<int> done{0};
        for (int i = 0; i < 8; ++i) {
            manager.SubmitTask(TaskType::ChunkTranscription, "task " + std::to_string(i),
                [&](std::shared_ptr<TaskStatus> status) {
                    assert(status->isRunning);
                    const int now = ++running;
                    int seen = peak.load();
                    while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
                    std::this_thread::sleep_for(20ms);
                    --running;
                    ++done;
                });
        }
        WaitUntilDrained(manager);
        assert(done == 8);
        assert(peak <= 2);
        assert(manager.GetActiveTasks().empty());
    }

    std::cout << "[Test] A throwing task is marked failed and the pool keeps going..." << std::endl;
    {
        AsyncTaskManager manager(1);
        auto failing = manager.SubmitTask(TaskType::ChunkTranscription, "boom",
            [](std::shared_ptr<TaskStatus>) { throw std::runtime_error("engine exploded"); });
        std::atomic<bool> ranAfter{false};
        auto next = manager.SubmitTask(TaskType::ChunkTranscription, "after",
            [&](std::shared_ptr<TaskStatus>) { ranAfter = true; });
        WaitUntilDrained(manager);
        assert(failing->isCompleted && failing->failed);
        assert(failing->errorMessage == "engine exploded");
        assert(next->isCompleted && !next->failed);
        assert(ranAfter);
    }

    std::cout << "[Test] Pending tasks can be cancelled..." << std::endl;
    {
        AsyncTaskManager manager(1);
        std::atomic<bool> release{false};
        std::atomic<int> ran{0};
        auto blocker = manager.SubmitTask(TaskType::ChunkTranscription, "blocker",
            [&](std::shared_ptr<TaskStatus>) {
                while (!release) std::this_thread::sleep_for(1ms);
                ++ran;
            });
        std::vector<std::shared_ptr<TaskStatus>> queued;
        for (int i = 0; i < 3; ++i) {
            queued.push_back(manager.SubmitTask(TaskType::ChunkTranscription, "queued",
                [&](std::shared_ptr<TaskStatus>) { ++ran; }));
        }
        while (!blocker->isRunning) std::this_thread::sleep_for(1ms);
        assert(manager.GetActiveTasks().size() == 4);

        assert(manager.CancelPending() == 3);
        auto active = manager.GetActiveTasks();
        assert(active.size() == 1 && active[0] == blocker);
        release = true;
        WaitUntilDrained(manager);
        assert(ran == 1);
        for (const auto& status : queued) {
            assert(status->isCompleted && !status->isRunning && !status->failed);
        }
    }

    std::cout << "[PASS] AsyncTaskManager tests passed." << std::endl;
    return 0;
}

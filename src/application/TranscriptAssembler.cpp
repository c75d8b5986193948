/**
 * @file TranscriptAssembler.cpp
 * @brief Implementation of TranscriptAssembler.
 */

#include "application/TranscriptAssembler.hpp"
#include "application/AsyncTaskManager.hpp"
#include "application/TranscriptFold.hpp"
#include "domain/ChunkPlanner.hpp"
#include "domain/Errors.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <future>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace longscribe::application {

using namespace std::chrono_literals;

namespace {

constexpr auto kPollInterval = 50ms;

struct ChunkSlot {
    bool ready = false;
    bool failed = false;
    domain::ChunkResult result;
    std::string error;
};

/**
 * Per-index result slots filled by workers in any order and drained by the
 * fold in index order.
 */
class ResultBoard {
public:
    explicit ResultBoard(std::size_t count) : m_slots(count) {}

    void fulfil(int index, domain::ChunkResult result) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto& slot = m_slots[static_cast<std::size_t>(index)];
            slot.result = std::move(result);
            slot.ready = true;
        }
        m_cv.notify_all();
    }

    void fail(int index, const std::string& error) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto& slot = m_slots[static_cast<std::size_t>(index)];
            slot.failed = true;
            slot.error = error;
            slot.ready = true;
        }
        m_cv.notify_all();
    }

    /** Blocks until slot @p index is ready. Returns false once the job is cancelled. */
    bool waitFor(int index, const domain::CancellationToken& token, ChunkSlot& out) {
        std::unique_lock<std::mutex> lock(m_mutex);
        auto& slot = m_slots[static_cast<std::size_t>(index)];
        while (true) {
            // Checked first so a job cancelled before its results arrive is never folded.
            if (token.isCancelled()) return false;
            if (slot.ready) break;
            m_cv.wait_for(lock, kPollInterval);
        }
        out = std::move(slot);
        return true;
    }

private:
    std::vector<ChunkSlot> m_slots;
    std::mutex m_mutex;
    std::condition_variable m_cv;
};

void SleepUnlessCancelled(std::chrono::milliseconds duration, const domain::CancellationToken& token) {
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (!token.isCancelled() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::min<std::chrono::milliseconds>(
            kPollInterval, std::chrono::duration_cast<std::chrono::milliseconds>(
                               deadline - std::chrono::steady_clock::now())));
    }
}

} // namespace

TranscriptAssembler::TranscriptAssembler(std::shared_ptr<domain::ChunkInvoker> invoker, AssemblerConfig config)
    : m_invoker(std::move(invoker)), m_config(config) {
    if (!m_invoker) {
        throw std::invalid_argument("TranscriptAssembler requires a chunk invoker");
    }
}

AssemblyOutcome TranscriptAssembler::assemble(std::shared_ptr<const domain::AudioBuffer> audio,
                                              const domain::CancellationToken& token,
                                              ProgressCallback progress) {
    if (!audio) {
        throw std::invalid_argument("TranscriptAssembler::assemble requires an audio buffer");
    }

    const auto startTime = std::chrono::steady_clock::now();
    auto elapsed = [&startTime]() {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
    };

    AssemblyOutcome outcome;
    m_state = AssemblyState::Planned;

    // Throws PlanningError before anything is dispatched.
    const auto windows = domain::ChunkPlanner::plan(audio->durationMs(), m_config.chunkDurationMs, m_config.overlapMs);
    outcome.chunkCount = windows.size();

    if (windows.empty()) {
        std::cout << "[TranscriptAssembler] Empty audio, nothing to transcribe" << std::endl;
        m_state = AssemblyState::Complete;
        outcome.state = AssemblyState::Complete;
        return outcome;
    }

    const int total = static_cast<int>(windows.size());
    auto board = std::make_shared<ResultBoard>(windows.size());

    m_state = AssemblyState::Dispatching;
    AsyncTaskManager pool(std::min(m_config.maxConcurrency, windows.size()));
    std::cout << "[TranscriptAssembler] Dispatching " << total << " chunk(s) to " << m_invoker->name()
              << " with concurrency " << pool.GetMaxConcurrency() << std::endl;

    for (const auto& window : windows) {
        domain::ChunkRequest request;
        request.window = window;
        request.audio = audio->slice(window.actualStartMs, window.actualEndMs);

        pool.SubmitTask(TaskType::ChunkTranscription, "chunk " + std::to_string(window.chunkIndex),
            [this, request, audio, board, token](std::shared_ptr<TaskStatus>) {
                try {
                    board->fulfil(request.window.chunkIndex, transcribeWithRetry(request, audio, token));
                } catch (const std::exception& e) {
                    board->fail(request.window.chunkIndex, e.what());
                } catch (...) {
                    board->fail(request.window.chunkIndex, "unknown error");
                }
            });
    }

    m_state = AssemblyState::Folding;
    TranscriptFold fold(FoldOptions{m_config.epsilonSec, m_config.maxOverlapChars});

    for (const auto& window : windows) {
        ChunkSlot slot;
        if (!board->waitFor(window.chunkIndex, token, slot)) {
            const std::size_t dropped = pool.CancelPending();
            std::string running;
            for (const auto& task : pool.GetActiveTasks()) {
                if (!task->isRunning) continue;
                running += running.empty() ? task->description : ", " + task->description;
            }
            std::cerr << "[TranscriptAssembler] Job cancelled at chunk " << window.chunkIndex
                      << " (" << dropped << " queued chunk(s) discarded, abandoning: "
                      << (running.empty() ? "none" : running) << ")" << std::endl;
            m_state = AssemblyState::Cancelled;
            outcome.state = AssemblyState::Cancelled;
            outcome.elapsedSeconds = elapsed();
            return outcome;
        }

        if (slot.failed) {
            fold.recordGap(window, slot.error);
        } else {
            fold.fold(window, std::move(slot.result));
        }

        if (progress) progress(window.chunkIndex + 1, total);
    }

    outcome.gaps = fold.gaps();
    outcome.droppedUnits = fold.droppedUnits();
    outcome.transcript = fold.release();
    outcome.state = outcome.gaps.empty() ? AssemblyState::Complete : AssemblyState::PartialFailure;
    outcome.elapsedSeconds = elapsed();
    m_state = outcome.state;

    std::cout << "[TranscriptAssembler] Finished: " << outcome.transcript.text.size() << " chars, "
              << outcome.transcript.words.size() << " words, " << outcome.transcript.segments.size()
              << " segments, " << outcome.gaps.size() << " gap(s) in " << outcome.elapsedSeconds << "s" << std::endl;
    return outcome;
}

domain::ChunkResult TranscriptAssembler::transcribeWithRetry(const domain::ChunkRequest& request,
                                                             const std::shared_ptr<const domain::AudioBuffer>& audio,
                                                             const domain::CancellationToken& token) {
    const int index = request.window.chunkIndex;
    const int attempts = std::max(0, m_config.retryCount) + 1;
    std::string lastError;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (token.isCancelled()) {
            throw domain::ChunkTranscriptionError(index, "cancelled");
        }

        std::cout << "[TranscriptAssembler] Transcribing chunk " << index << " (attempt " << attempt << "/"
                  << attempts << ", " << request.window.actualDurationMs() << "ms)" << std::endl;
        try {
            return invokeOnce(request, audio, token);
        } catch (const std::exception& e) {
            lastError = e.what();
            std::cerr << "[TranscriptAssembler] Chunk " << index << " attempt " << attempt
                      << " failed: " << lastError << std::endl;
        } catch (...) {
            lastError = "unknown error";
            std::cerr << "[TranscriptAssembler] Chunk " << index << " attempt " << attempt
                      << " failed with an unknown error" << std::endl;
        }

        if (attempt < attempts && m_config.retryBackoffMs > 0) {
            SleepUnlessCancelled(std::chrono::milliseconds(m_config.retryBackoffMs), token);
        }
    }

    throw domain::ChunkTranscriptionError(
        index, "failed after " + std::to_string(attempts) + " attempt(s): " + lastError);
}

domain::ChunkResult TranscriptAssembler::invokeOnce(const domain::ChunkRequest& request,
                                                    const std::shared_ptr<const domain::AudioBuffer>& audio,
                                                    const domain::CancellationToken& token) {
    const int index = request.window.chunkIndex;

    // The engine call runs on its own thread so a timed-out or cancelled attempt
    // can be abandoned. The thread keeps the invoker and the audio alive.
    auto promise = std::make_shared<std::promise<domain::ChunkResult>>();
    auto future = promise->get_future();
    std::thread([invoker = m_invoker, audio, request, promise]() {
        try {
            promise->set_value(invoker->transcribeChunk(request));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    const bool hasTimeout = m_config.chunkTimeoutMs > 0;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(m_config.chunkTimeoutMs);

    while (future.wait_for(kPollInterval) != std::future_status::ready) {
        if (token.isCancelled()) {
            throw domain::ChunkTranscriptionError(index, "cancelled");
        }
        if (hasTimeout && std::chrono::steady_clock::now() >= deadline) {
            throw domain::ChunkTranscriptionError(
                index, "timed out after " + std::to_string(m_config.chunkTimeoutMs) + "ms");
        }
    }
    return future.get();
}

} // namespace longscribe::application

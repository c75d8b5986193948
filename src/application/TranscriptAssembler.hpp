/**
 * @file TranscriptAssembler.hpp
 * @brief Plans, dispatches and folds the chunks of a long recording.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "domain/AudioBuffer.hpp"
#include "domain/CancellationToken.hpp"
#include "domain/TranscriptionService.hpp"
#include "domain/TranscriptTypes.hpp"

namespace longscribe::application {

/**
 * @struct AssemblerConfig
 * @brief Chunking and dispatch policy.
 */
struct AssemblerConfig {
    std::int64_t chunkDurationMs = 60000;
    std::int64_t overlapMs = 1500;
    std::size_t maxOverlapChars = 80;
    double epsilonSec = 0.01;
    std::size_t maxConcurrency = 4;   ///< Simultaneous in-flight chunk transcriptions.
    int retryCount = 2;               ///< Extra attempts after the first failure.
    std::int64_t retryBackoffMs = 500;
    std::int64_t chunkTimeoutMs = 0;  ///< Per attempt. 0 disables the timeout.
};

enum class AssemblyState {
    Planned,
    Dispatching,
    Folding,
    Complete,
    PartialFailure, ///< Finished with at least one gap.
    Cancelled
};

inline std::string AssemblyStateToString(AssemblyState state) {
    switch (state) {
        case AssemblyState::Planned: return "planned";
        case AssemblyState::Dispatching: return "dispatching";
        case AssemblyState::Folding: return "folding";
        case AssemblyState::Complete: return "complete";
        case AssemblyState::PartialFailure: return "partial";
        case AssemblyState::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

/**
 * @struct AssemblyOutcome
 * @brief Best-effort transcript plus the ranges that could not be transcribed.
 */
struct AssemblyOutcome {
    AssemblyState state = AssemblyState::Planned;
    domain::Transcript transcript;      ///< Empty when cancelled.
    std::vector<domain::GapRange> gaps;
    std::size_t chunkCount = 0;
    std::size_t droppedUnits = 0;
    double elapsedSeconds = 0.0;

    bool isFullySuccessful() const { return state == AssemblyState::Complete && gaps.empty(); }
};

/** @brief Called after each folded chunk with (foldedChunks, totalChunks). */
using ProgressCallback = std::function<void(int folded, int total)>;

/**
 * @class TranscriptAssembler
 * @brief Reassembles one transcript from concurrently transcribed chunks.
 *
 * Chunks are dispatched to the invoker on a bounded worker pool. Results are
 * buffered per chunk index and folded strictly in index order; the fold only
 * ever waits for the next index it needs. A chunk that fails every attempt
 * becomes a gap instead of failing the job. One assemble() call at a time.
 */
class TranscriptAssembler {
public:
    /** @throws std::invalid_argument if invoker is null. */
    TranscriptAssembler(std::shared_ptr<domain::ChunkInvoker> invoker, AssemblerConfig config);

    /**
     * @brief Runs the whole job for one recording.
     * @throws domain::PlanningError for invalid chunking configuration, before any dispatch.
     */
    AssemblyOutcome assemble(std::shared_ptr<const domain::AudioBuffer> audio,
                             const domain::CancellationToken& token = {},
                             ProgressCallback progress = nullptr);

    AssemblyState state() const { return m_state.load(); }
    const AssemblerConfig& config() const { return m_config; }

private:
    domain::ChunkResult transcribeWithRetry(const domain::ChunkRequest& request,
                                            const std::shared_ptr<const domain::AudioBuffer>& audio,
                                            const domain::CancellationToken& token);

    domain::ChunkResult invokeOnce(const domain::ChunkRequest& request,
                                   const std::shared_ptr<const domain::AudioBuffer>& audio,
                                   const domain::CancellationToken& token);

    std::shared_ptr<domain::ChunkInvoker> m_invoker;
    AssemblerConfig m_config;
    std::atomic<AssemblyState> m_state{AssemblyState::Planned};
};

} // namespace longscribe::application

#include "domain/ChunkPlanner.hpp"
#include "domain/Errors.hpp"

#include <algorithm>
#include <iostream>

namespace longscribe::domain {

void ChunkPlanner::validate(std::int64_t chunkDurationMs, std::int64_t overlapMs) {
    if (chunkDurationMs <= 0) {
        throw PlanningError("chunk_duration_ms must be positive (got " + std::to_string(chunkDurationMs) + ")");
    }
    if (overlapMs < 0) {
        throw PlanningError("overlap_ms must not be negative (got " + std::to_string(overlapMs) + ")");
    }
}

std::vector<ChunkWindow> ChunkPlanner::plan(std::int64_t audioLengthMs,
                                            std::int64_t chunkDurationMs,
                                            std::int64_t overlapMs) {
    validate(chunkDurationMs, overlapMs);
    if (audioLengthMs < 0) {
        throw PlanningError("audio length must not be negative (got " + std::to_string(audioLengthMs) + ")");
    }

    std::cout << "[ChunkPlanner] Planning " << audioLengthMs << "ms of audio: "
              << chunkDurationMs << "ms chunks with " << overlapMs << "ms overlap" << std::endl;

    std::vector<ChunkWindow> windows;
    int chunkIndex = 0;
    std::int64_t logicalStart = 0;

    while (logicalStart < audioLengthMs) {
        ChunkWindow w;
        w.chunkIndex = chunkIndex;
        w.logicalStartMs = logicalStart;
        w.logicalEndMs = std::min(logicalStart + chunkDurationMs, audioLengthMs);
        w.actualStartMs = std::max<std::int64_t>(0, logicalStart - overlapMs);
        w.actualEndMs = w.logicalEndMs;
        windows.push_back(w);

        std::cout << "[ChunkPlanner] Chunk " << w.chunkIndex
                  << ": logical=[" << w.logicalStartMs << "-" << w.logicalEndMs << "]ms"
                  << " actual=[" << w.actualStartMs << "-" << w.actualEndMs << "]ms" << std::endl;

        ++chunkIndex;
        // Next window starts exactly where this one ends.
        logicalStart = w.logicalEndMs;
    }

    std::cout << "[ChunkPlanner] Created " << windows.size() << " chunk(s)" << std::endl;
    return windows;
}

} // namespace longscribe::domain

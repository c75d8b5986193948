/**
 * @file ChunkPlanner.hpp
 * @brief Tiles a recording into gap-free logical windows with leading overlap.
 */

#pragma once

#include <cstdint>
#include <vector>
#include "ChunkWindow.hpp"

namespace longscribe::domain {

class ChunkPlanner {
public:
    /**
     * @brief Plans the chunk windows for a recording.
     *
     * Logical windows are [k*chunkDuration, min((k+1)*chunkDuration, audioLength)).
     * Each actual window starts overlapMs earlier (clamped to 0) and ends at the
     * logical end.
     *
     * @param audioLengthMs Total duration of the recording (>= 0).
     * @param chunkDurationMs Logical window length (> 0).
     * @param overlapMs Leading overlap (>= 0).
     * @return Windows ordered by chunk index. Empty for zero-length audio.
     * @throws PlanningError on invalid arguments.
     */
    static std::vector<ChunkWindow> plan(std::int64_t audioLengthMs,
                                         std::int64_t chunkDurationMs,
                                         std::int64_t overlapMs);

    /** @brief Throws PlanningError if the chunking parameters are unusable. */
    static void validate(std::int64_t chunkDurationMs, std::int64_t overlapMs);
};

} // namespace longscribe::domain

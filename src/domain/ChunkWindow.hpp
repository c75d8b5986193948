/**
 * @file ChunkWindow.hpp
 * @brief Value object describing one planned chunk of a long recording.
 */

#pragma once

#include <cstdint>

namespace longscribe::domain {

/**
 * @struct ChunkWindow
 * @brief Logical (owned) and actual (sent to the engine) time ranges of a chunk.
 *
 * Logical windows of a plan partition [0, audioLength) with no gaps. The actual
 * window starts up to the configured overlap earlier and never ends past the
 * logical end.
 */
struct ChunkWindow {
    int chunkIndex = 0;
    std::int64_t logicalStartMs = 0;
    std::int64_t logicalEndMs = 0;
    std::int64_t actualStartMs = 0;
    std::int64_t actualEndMs = 0;

    std::int64_t logicalDurationMs() const { return logicalEndMs - logicalStartMs; }
    std::int64_t actualDurationMs() const { return actualEndMs - actualStartMs; }

    /** @brief Global time (seconds) from which this chunk owns its output. */
    double ownedBoundarySec() const { return static_cast<double>(logicalStartMs) / 1000.0; }

    double actualStartSec() const { return static_cast<double>(actualStartMs) / 1000.0; }
    double actualEndSec() const { return static_cast<double>(actualEndMs) / 1000.0; }
};

inline bool operator==(const ChunkWindow& a, const ChunkWindow& b) {
    return a.chunkIndex == b.chunkIndex &&
           a.logicalStartMs == b.logicalStartMs && a.logicalEndMs == b.logicalEndMs &&
           a.actualStartMs == b.actualStartMs && a.actualEndMs == b.actualEndMs;
}

} // namespace longscribe::domain

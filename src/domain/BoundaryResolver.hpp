/**
 * @file BoundaryResolver.hpp
 * @brief Boundary ownership rules for timestamped units of overlapping chunks.
 */

#pragma once

#include <cstddef>
#include <vector>
#include "ChunkWindow.hpp"
#include "TranscriptTypes.hpp"

namespace longscribe::domain {

/**
 * @class BoundaryResolver
 * @brief Decides which timestamped units a chunk owns.
 *
 * The previous chunk owns every global timestamp strictly before the logical
 * start of the current chunk. Units the current chunk emitted inside the
 * leading overlap are therefore duplicates and are discarded.
 */
class BoundaryResolver {
public:
    static constexpr double kDefaultEpsilonSec = 0.01;

    /** @brief Keeps words with start >= ownedBoundarySec - epsilonSec, order preserved. */
    static std::vector<WordToken> trimWords(const std::vector<WordToken>& words,
                                            double ownedBoundarySec,
                                            double epsilonSec = kDefaultEpsilonSec);

    /** @brief Same rule as trimWords, applied to each segment's start. */
    static std::vector<Segment> trimSegments(const std::vector<Segment>& segments,
                                             double ownedBoundarySec,
                                             double epsilonSec = kDefaultEpsilonSec);

    /** @brief Shifts all unit times of a chunk-local result by offsetSec. */
    static void offsetToGlobal(ChunkResult& result, double offsetSec);

    /**
     * @brief Removes units that contradict the chunk's own window.
     *
     * A unit is inconsistent when it starts before the actual window, starts
     * after it, or ends before it starts (all with epsilon tolerance).
     * @return Number of units removed.
     */
    static std::size_t dropInconsistentUnits(ChunkResult& result,
                                             const ChunkWindow& window,
                                             double epsilonSec = kDefaultEpsilonSec);
};

} // namespace longscribe::domain

/**
 * @file TranscriptFold.hpp
 * @brief Accumulator that merges chunk results, in chunk order, into one transcript.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "domain/ChunkWindow.hpp"
#include "domain/TranscriptTypes.hpp"

namespace longscribe::application {

struct FoldOptions {
    double epsilonSec = 0.01;
    std::size_t maxOverlapChars = 80;
};

/**
 * @class TranscriptFold
 * @brief Explicit fold state for the merge step.
 *
 * Chunks must be folded (or recorded as gaps) strictly in increasing index
 * order starting at 0. The boundary rule trims against the current chunk's
 * logical start and relies on that ordering.
 */
class TranscriptFold {
public:
    explicit TranscriptFold(FoldOptions options = {});

    /**
     * @brief Folds one chunk's result into the transcript.
     *
     * Offsets chunk-local times to global time, drops units that contradict the
     * chunk window, trims units owned by the previous chunk, and appends the
     * remaining units and the seam-deduplicated text.
     * @throws std::logic_error if window.chunkIndex is not the next expected index.
     */
    void fold(const domain::ChunkWindow& window, domain::ChunkResult result);

    /** @brief Records the chunk's logical range as untranscribed and moves on. */
    void recordGap(const domain::ChunkWindow& window, const std::string& reason);

    int nextChunkIndex() const { return m_nextIndex; }
    const domain::Transcript& transcript() const { return m_transcript; }
    const std::vector<domain::GapRange>& gaps() const { return m_gaps; }
    std::size_t droppedUnits() const { return m_droppedUnits; }

    /** @brief Moves the transcript out. The fold must not be used afterwards. */
    domain::Transcript release();

private:
    void expectNext(const domain::ChunkWindow& window) const;
    void appendText(const std::string& chunkText);
    void appendSegments(std::vector<domain::Segment> segments);

    FoldOptions m_options;
    domain::Transcript m_transcript;
    std::vector<domain::GapRange> m_gaps;
    std::size_t m_droppedUnits = 0;
    int m_nextIndex = 0;
};

} // namespace longscribe::application

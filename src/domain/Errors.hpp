/**
 * @file Errors.hpp
 * @brief Exception types raised by the chunked transcription core.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace longscribe::domain {

/** @brief Invalid chunking configuration. Fatal, raised before any dispatch. */
class PlanningError : public std::runtime_error {
public:
    explicit PlanningError(const std::string& message)
        : std::runtime_error("Planning error: " + message) {}
};

/** @brief The engine failed or timed out for one chunk. Retried, then recorded as a gap. */
class ChunkTranscriptionError : public std::runtime_error {
public:
    ChunkTranscriptionError(int chunkIndex, const std::string& message)
        : std::runtime_error("Chunk " + std::to_string(chunkIndex) + ": " + message)
        , m_chunkIndex(chunkIndex) {}

    int chunkIndex() const { return m_chunkIndex; }

private:
    int m_chunkIndex;
};

} // namespace longscribe::domain

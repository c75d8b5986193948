/**
 * @file TranscriptionService.hpp
 * @brief Interface for the speech-to-text engine that transcribes one chunk.
 */

#pragma once

#include <string>
#include "AudioBuffer.hpp"
#include "ChunkWindow.hpp"
#include "TranscriptTypes.hpp"

namespace longscribe::domain {

/**
 * @struct ChunkRequest
 * @brief Everything the engine needs to transcribe one chunk.
 */
struct ChunkRequest {
    ChunkWindow window;
    AudioSlice audio; ///< Samples of [actualStartMs, actualEndMs).
};

/**
 * @class ChunkInvoker
 * @brief Abstract interface for engines that convert one chunk of audio to text.
 *
 * Implementations may be called concurrently from several worker threads and
 * must be safe for that (serializing internally if needed). Results are
 * expected in chunk-local time unless ChunkResult::timeBase says otherwise.
 */
class ChunkInvoker {
public:
    virtual ~ChunkInvoker() = default;

    /**
     * @brief Transcribes a single chunk synchronously.
     * @throws ChunkTranscriptionError (or any std::exception) on failure.
     */
    virtual ChunkResult transcribeChunk(const ChunkRequest& request) = 0;

    /** @brief Short human-readable engine name for logs. */
    virtual std::string name() const = 0;
};

} // namespace longscribe::domain

/**
 * @file TranscriptionResponseParser.hpp
 * @brief Converts transcription API responses into chunk results.
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "domain/TranscriptTypes.hpp"

namespace longscribe::infrastructure {

/**
 * @class TranscriptionResponseParser
 * @brief Pure parsing of OpenAI-style transcription payloads.
 *
 * Accepted shapes: a JSON object with "text" and optional "segments" and
 * "words" arrays, a JSON string, or a plain-text body. Timestamps are returned
 * unchanged, i.e. chunk-local.
 */
class TranscriptionResponseParser {
public:
    /** @brief Parses a raw HTTP body. Bodies that are not JSON are taken as plain text. */
    static domain::ChunkResult Parse(const std::string& body, int chunkIndex);

    /** @throws domain::ChunkTranscriptionError if the document is neither an object nor a string. */
    static domain::ChunkResult FromJson(const nlohmann::json& payload, int chunkIndex);
};

} // namespace longscribe::infrastructure

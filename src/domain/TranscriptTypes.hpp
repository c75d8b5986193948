/**
 * @file TranscriptTypes.hpp
 * @brief Word tokens, segments, per-chunk results and the merged transcript.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace longscribe::domain {

/**
 * @struct WordToken
 * @brief A single word with timing (seconds) and an optional speaker label.
 */
struct WordToken {
    std::string text;
    double start = 0.0;
    double end = 0.0;
    std::optional<std::string> speaker;
};

/**
 * @struct Segment
 * @brief Coarser timestamped unit. Engine-specific fields ride along in @c extra.
 */
struct Segment {
    double start = 0.0;
    double end = 0.0;
    std::string text;
    std::optional<std::string> speaker;
    nlohmann::json extra = nlohmann::json::object(); ///< Passthrough fields (id, avg_logprob, ...).
};

/**
 * @enum TimeBase
 * @brief Which clock the timestamps of a ChunkResult are expressed in.
 */
enum class TimeBase {
    ChunkLocal, ///< 0 = start of the chunk's actual window.
    Global      ///< Already offset by the invoker.
};

/**
 * @struct ChunkResult
 * @brief Output of the transcription engine for one chunk.
 */
struct ChunkResult {
    int chunkIndex = 0;
    std::vector<WordToken> words;
    std::vector<Segment> segments;
    std::string rawText;
    TimeBase timeBase = TimeBase::ChunkLocal;
};

/**
 * @struct GapRange
 * @brief Logical range of a chunk that could not be transcribed.
 */
struct GapRange {
    int chunkIndex = 0;
    std::int64_t logicalStartMs = 0;
    std::int64_t logicalEndMs = 0;
    std::string reason;
};

/**
 * @struct Transcript
 * @brief Final merged output in global time.
 */
struct Transcript {
    std::vector<WordToken> words;
    std::vector<Segment> segments;
    std::string text;
};

} // namespace longscribe::domain

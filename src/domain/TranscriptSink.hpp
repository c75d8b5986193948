/**
 * @file TranscriptSink.hpp
 * @brief Interface for persisting finished transcripts.
 */

#pragma once

#include <string>
#include <vector>
#include "TranscriptTypes.hpp"

namespace longscribe::domain {

/**
 * @struct TranscriptRecord
 * @brief A finished job as handed to the sink.
 */
struct TranscriptRecord {
    std::string name;           ///< Source name (file stem), used to derive output names.
    Transcript transcript;
    std::vector<GapRange> gaps;
    std::string status;         ///< "complete", "partial".
    std::string diarizedText;   ///< Empty unless speaker formatting was requested.
    double durationSeconds = 0.0;
    std::string language;
};

class TranscriptSink {
public:
    virtual ~TranscriptSink() = default;

    /** @brief Stores a record. May complete asynchronously. */
    virtual void save(const TranscriptRecord& record) = 0;
};

} // namespace longscribe::domain

/**
 * @file TranscriptionJobService.hpp
 * @brief Runs a full job: assembly, optional speaker formatting and persistence.
 */

#pragma once

#include "application/TranscriptAssembler.hpp"
#include "domain/Resegmentation.hpp"
#include "domain/TranscriptSink.hpp"
#include <memory>
#include <string>

namespace longscribe::application {

struct JobOptions {
    bool diarize = false;
    domain::ResegmentOptions resegment;
    bool saveToHistory = true;
    std::string language;
};

/**
 * @struct JobReport
 * @brief What a job produced. The outcome carries the raw merged transcript.
 */
struct JobReport {
    AssemblyOutcome outcome;
    std::vector<domain::Segment> segments; ///< Resegmented when diarize is on, merged otherwise.
    std::string text;
    std::string diarizedText;
};

/**
 * @class TranscriptionJobService
 * @brief Glue between the assembler and the transcript sink.
 */
class TranscriptionJobService {
public:
    /** @param sink May be null, in which case nothing is persisted. */
    TranscriptionJobService(std::shared_ptr<TranscriptAssembler> assembler,
                            std::shared_ptr<domain::TranscriptSink> sink,
                            JobOptions options);

    /**
     * @brief Transcribes one recording.
     * @param name Source name used for the persisted record.
     * @throws domain::PlanningError on invalid chunking configuration.
     */
    JobReport run(std::shared_ptr<const domain::AudioBuffer> audio,
                  const std::string& name,
                  const domain::CancellationToken& token = {},
                  ProgressCallback progress = nullptr);

private:
    std::shared_ptr<TranscriptAssembler> m_assembler;
    std::shared_ptr<domain::TranscriptSink> m_sink;
    JobOptions m_options;
};

} // namespace longscribe::application

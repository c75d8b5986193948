/**
 * @file TranscriptionJobService.cpp
 * @brief Implementation of TranscriptionJobService.
 */

#include "application/TranscriptionJobService.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>

namespace longscribe::application {

TranscriptionJobService::TranscriptionJobService(std::shared_ptr<TranscriptAssembler> assembler,
                                                 std::shared_ptr<domain::TranscriptSink> sink,
                                                 JobOptions options)
    : m_assembler(std::move(assembler)), m_sink(std::move(sink)), m_options(std::move(options)) {
    if (!m_assembler) {
        throw std::invalid_argument("TranscriptionJobService requires an assembler");
    }
}

JobReport TranscriptionJobService::run(std::shared_ptr<const domain::AudioBuffer> audio,
                                       const std::string& name,
                                       const domain::CancellationToken& token,
                                       ProgressCallback progress) {
    std::cout << "[TranscriptionJob] Starting job: " << name << std::endl;

    JobReport report;
    const double durationSeconds = audio ? static_cast<double>(audio->durationMs()) / 1000.0 : 0.0;
    report.outcome = m_assembler->assemble(std::move(audio), token, std::move(progress));

    if (report.outcome.state == AssemblyState::Cancelled) {
        std::cout << "[TranscriptionJob] Job cancelled, nothing saved: " << name << std::endl;
        return report;
    }

    const auto& transcript = report.outcome.transcript;
    report.text = transcript.text;

    if (m_options.diarize) {
        auto words = transcript.words;
        if (words.empty()) {
            words = domain::InferWordTokensFromSegments(transcript.segments);
        }
        auto segments = domain::ResegmentWordsToSegments(words, m_options.resegment);
        report.segments = domain::NormalizeSpeakerLabels(std::move(segments));
        report.diarizedText = domain::FormatDiarizedTranscript(report.segments);
    } else {
        report.segments = transcript.segments;
    }

    if (!report.outcome.gaps.empty()) {
        std::cerr << "[TranscriptionJob] " << report.outcome.gaps.size()
                  << " chunk(s) could not be transcribed for " << name << std::endl;
    }

    if (m_sink && m_options.saveToHistory) {
        domain::TranscriptRecord record;
        record.name = name;
        record.transcript = transcript;
        record.transcript.segments = report.segments;
        record.gaps = report.outcome.gaps;
        record.status = AssemblyStateToString(report.outcome.state);
        record.diarizedText = report.diarizedText;
        record.durationSeconds = durationSeconds;
        record.language = m_options.language;
        try {
            m_sink->save(record);
        } catch (const std::exception& e) {
            std::cerr << "[TranscriptionJob] Failed to save transcript for " << name << ": " << e.what() << std::endl;
        }
    }

    std::cout << "[TranscriptionJob] Job finished (" << AssemblyStateToString(report.outcome.state)
              << "): " << name << std::endl;
    return report;
}

} // namespace longscribe::application

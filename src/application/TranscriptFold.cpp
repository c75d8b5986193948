/**
 * @file TranscriptFold.cpp
 * @brief Implementation of TranscriptFold.
 */

#include "application/TranscriptFold.hpp"
#include "domain/BoundaryResolver.hpp"
#include "domain/SeamDeduplicator.hpp"

#include <iostream>
#include <iterator>
#include <stdexcept>

namespace longscribe::application {

using domain::BoundaryResolver;
using domain::SeamDeduplicator;

namespace {

std::string TrimWhitespace(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // namespace

TranscriptFold::TranscriptFold(FoldOptions options) : m_options(options) {}

void TranscriptFold::expectNext(const domain::ChunkWindow& window) const {
    if (window.chunkIndex != m_nextIndex) {
        throw std::logic_error("TranscriptFold: expected chunk " + std::to_string(m_nextIndex) +
                               ", got chunk " + std::to_string(window.chunkIndex));
    }
}

void TranscriptFold::fold(const domain::ChunkWindow& window, domain::ChunkResult result) {
    expectNext(window);

    if (result.chunkIndex != window.chunkIndex) {
        std::cerr << "[TranscriptFold] Result tagged as chunk " << result.chunkIndex
                  << " delivered for chunk " << window.chunkIndex << "; using window index" << std::endl;
        result.chunkIndex = window.chunkIndex;
    }

    if (result.timeBase == domain::TimeBase::ChunkLocal) {
        BoundaryResolver::offsetToGlobal(result, window.actualStartSec());
    }

    const std::size_t dropped = BoundaryResolver::dropInconsistentUnits(result, window, m_options.epsilonSec);
    if (dropped > 0) {
        std::cerr << "[TranscriptFold] Chunk " << window.chunkIndex << ": dropped " << dropped
                  << " unit(s) with timestamps outside the chunk window" << std::endl;
        m_droppedUnits += dropped;
    }

    const bool hadTimedUnits = !result.words.empty() || !result.segments.empty();
    std::string chunkText = TrimWhitespace(result.rawText);

    if (window.chunkIndex > 0) {
        const double boundary = window.ownedBoundarySec();
        result.words = BoundaryResolver::trimWords(result.words, boundary, m_options.epsilonSec);
        result.segments = BoundaryResolver::trimSegments(result.segments, boundary, m_options.epsilonSec);

        // Everything the engine timed fell inside the overlap; its text would only repeat the previous chunk.
        if (hadTimedUnits && result.words.empty() && result.segments.empty()) {
            std::cout << "[TranscriptFold] Chunk " << window.chunkIndex
                      << ": all tokens/segments fell in overlap, dropping text" << std::endl;
            chunkText.clear();
        }
    }

    appendText(chunkText);
    appendSegments(std::move(result.segments));
    m_transcript.words.insert(m_transcript.words.end(),
                              std::make_move_iterator(result.words.begin()),
                              std::make_move_iterator(result.words.end()));

    ++m_nextIndex;
}

void TranscriptFold::recordGap(const domain::ChunkWindow& window, const std::string& reason) {
    expectNext(window);

    domain::GapRange gap;
    gap.chunkIndex = window.chunkIndex;
    gap.logicalStartMs = window.logicalStartMs;
    gap.logicalEndMs = window.logicalEndMs;
    gap.reason = reason;
    m_gaps.push_back(gap);

    std::cerr << "[TranscriptFold] Chunk " << window.chunkIndex << " recorded as gap ["
              << window.logicalStartMs << "-" << window.logicalEndMs << "]ms: " << reason << std::endl;

    ++m_nextIndex;
}

domain::Transcript TranscriptFold::release() {
    m_transcript.text = TrimWhitespace(m_transcript.text);
    return std::move(m_transcript);
}

void TranscriptFold::appendText(const std::string& chunkText) {
    if (chunkText.empty()) return;

    std::string& text = m_transcript.text;
    if (text.empty()) {
        text = chunkText;
        return;
    }

    const std::string deduped = SeamDeduplicator::dedup(text, chunkText, m_options.maxOverlapChars);
    if (!deduped.empty()) {
        text += ' ';
        text += deduped;
    }
}

void TranscriptFold::appendSegments(std::vector<domain::Segment> segments) {
    if (segments.empty()) return;

    auto& all = m_transcript.segments;
    if (!all.empty()) {
        segments.front().text = SeamDeduplicator::dedup(all.back().text, segments.front().text,
                                                        m_options.maxOverlapChars);
        if (segments.front().text.empty()) {
            segments.erase(segments.begin());
        }
    }
    all.insert(all.end(), std::make_move_iterator(segments.begin()), std::make_move_iterator(segments.end()));
}

} // namespace longscribe::application

/**
 * @file Resegmentation.hpp
 * @brief Word timing inference, word-first resegmentation and speaker formatting.
 */

#pragma once

#include <string>
#include <vector>
#include "TranscriptTypes.hpp"

namespace longscribe::domain {

/**
 * @struct ResegmentOptions
 * @brief Split rules for building segments from words.
 */
struct ResegmentOptions {
    double pauseThresholdMs = 250.0;
    double maxSegmentMs = 1500.0;
    bool splitOnPunctuation = true;
};

/** @brief Splits text on whitespace. Punctuation stays attached to its word. */
std::vector<std::string> TokenizeText(const std::string& text);

/**
 * @brief Approximates word timing when the engine returns only segments.
 *
 * Each segment's duration is spread over its words in proportion to their
 * character length, with a floor of minDurationSec per word. The last word of
 * a segment always ends at the segment end.
 */
std::vector<WordToken> InferWordTokensFromSegments(const std::vector<Segment>& segments,
                                                   double minDurationSec = 0.04);

/**
 * @brief Rebuilds segments from words.
 *
 * A new segment starts on a speaker change (when either side is labelled), on
 * a pause >= pauseThresholdMs, when the segment would reach maxSegmentMs, or
 * after a word ending in '.', '?' or '!'. The segment speaker is the majority
 * label of its words.
 */
std::vector<Segment> ResegmentWordsToSegments(const std::vector<WordToken>& words,
                                              const ResegmentOptions& options = {});

/** @brief Maps raw labels to "Speaker 1", "Speaker 2", ... by first appearance. */
std::vector<Segment> NormalizeSpeakerLabels(std::vector<Segment> segments);

/** @brief "<speaker>: <text>" lines, adjacent segments of one speaker merged. */
std::string FormatDiarizedTranscript(const std::vector<Segment>& segments);

} // namespace longscribe::domain

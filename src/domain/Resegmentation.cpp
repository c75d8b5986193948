#include "domain/Resegmentation.hpp"

#include <algorithm>
#include <map>
#include <sstream>

namespace longscribe::domain {

namespace {

std::string Trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool EndsSentence(const std::string& word) {
    const std::string t = Trim(word);
    if (t.empty()) return false;
    const char c = t.back();
    return c == '.' || c == '?' || c == '!';
}

std::string JoinWords(const std::vector<WordToken>& words) {
    std::string out;
    for (const auto& w : words) {
        if (!out.empty()) out += ' ';
        out += w.text;
    }
    return Trim(out);
}

// First label to reach the highest count wins ties.
std::optional<std::string> MajoritySpeaker(const std::vector<WordToken>& words) {
    std::vector<std::pair<std::string, int>> votes;
    for (const auto& w : words) {
        if (!w.speaker || w.speaker->empty()) continue;
        auto it = std::find_if(votes.begin(), votes.end(),
                               [&](const auto& v) { return v.first == *w.speaker; });
        if (it == votes.end()) {
            votes.emplace_back(*w.speaker, 1);
        } else {
            ++it->second;
        }
    }
    if (votes.empty()) return std::nullopt;

    auto best = votes.begin();
    for (auto it = votes.begin(); it != votes.end(); ++it) {
        if (it->second > best->second) best = it;
    }
    return best->first;
}

} // namespace

std::vector<std::string> TokenizeText(const std::string& text) {
    std::vector<std::string> tokens;
    std::istringstream iss(text);
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::vector<WordToken> InferWordTokensFromSegments(const std::vector<Segment>& segments,
                                                   double minDurationSec) {
    std::vector<WordToken> words;

    for (const auto& seg : segments) {
        const auto tokens = TokenizeText(seg.text);
        if (tokens.empty()) continue;

        const double segDuration = seg.end - seg.start;
        std::size_t totalChars = 0;
        for (const auto& t : tokens) totalChars += t.size();

        double current = seg.start;
        for (std::size_t i = 0; i < tokens.size(); ++i) {
            const double ratio = static_cast<double>(tokens[i].size()) / static_cast<double>(totalChars);
            const double duration = std::max(segDuration * ratio, minDurationSec);

            // Last word absorbs rounding so the segment end is preserved.
            const double wordEnd = (i + 1 == tokens.size()) ? seg.end
                                                            : std::min(current + duration, seg.end);

            WordToken w;
            w.text = tokens[i];
            w.start = current;
            w.end = wordEnd;
            w.speaker = seg.speaker;
            words.push_back(std::move(w));

            current = wordEnd;
        }
    }
    return words;
}

std::vector<Segment> ResegmentWordsToSegments(const std::vector<WordToken>& words,
                                              const ResegmentOptions& options) {
    std::vector<Segment> segments;
    if (words.empty()) return segments;

    const double pauseThresholdSec = options.pauseThresholdMs / 1000.0;
    const double maxSegmentSec = options.maxSegmentMs / 1000.0;

    std::vector<WordToken> current;

    auto flush = [&]() {
        if (current.empty()) return;
        Segment seg;
        seg.start = current.front().start;
        seg.end = current.back().end;
        seg.text = JoinWords(current);
        seg.speaker = MajoritySpeaker(current);
        segments.push_back(std::move(seg));
        current.clear();
    };

    for (const auto& word : words) {
        bool split = false;

        if (!current.empty()) {
            const WordToken& prev = current.back();

            // Split when labels differ and at least one side is labelled.
            if (word.speaker != prev.speaker && (word.speaker || prev.speaker)) {
                split = true;
            }
            if (word.start - prev.end >= pauseThresholdSec) {
                split = true;
            }
            if (word.end - current.front().start >= maxSegmentSec) {
                split = true;
            }
            if (options.splitOnPunctuation && EndsSentence(prev.text)) {
                split = true;
            }
        }

        if (split) flush();
        current.push_back(word);
    }
    flush();

    return segments;
}

std::vector<Segment> NormalizeSpeakerLabels(std::vector<Segment> segments) {
    std::map<std::string, std::string> speakerMap;
    int nextSpeaker = 1;

    for (auto& seg : segments) {
        if (!seg.speaker) continue;
        auto it = speakerMap.find(*seg.speaker);
        if (it == speakerMap.end()) {
            it = speakerMap.emplace(*seg.speaker, "Speaker " + std::to_string(nextSpeaker++)).first;
        }
        seg.speaker = it->second;
    }
    return segments;
}

std::string FormatDiarizedTranscript(const std::vector<Segment>& segments) {
    std::vector<std::string> lines;
    std::string currentSpeaker;
    std::string currentText;

    auto emit = [&]() {
        if (!currentSpeaker.empty() && !currentText.empty()) {
            lines.push_back(currentSpeaker + ": " + currentText);
        }
    };

    for (const auto& seg : segments) {
        const std::string text = Trim(seg.text);
        if (text.empty()) continue;

        const std::string speaker = seg.speaker.value_or("Unknown");
        if (speaker != currentSpeaker) {
            emit();
            currentSpeaker = speaker;
            currentText = text;
        } else {
            currentText += " " + text;
        }
    }
    emit();

    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += '\n';
        out += lines[i];
    }
    return out;
}

} // namespace longscribe::domain

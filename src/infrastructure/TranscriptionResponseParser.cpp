/**
 * @file TranscriptionResponseParser.cpp
 * @brief Implementation of TranscriptionResponseParser.
 */

#include "infrastructure/TranscriptionResponseParser.hpp"
#include "domain/Errors.hpp"
#include "domain/Resegmentation.hpp"

#include <cctype>

namespace longscribe::infrastructure {

using json = nlohmann::json;

namespace {

std::string Trim(const std::string& s) {
    size_t first = 0;
    while (first < s.size() && std::isspace(static_cast<unsigned char>(s[first]))) ++first;
    size_t last = s.size();
    while (last > first && std::isspace(static_cast<unsigned char>(s[last - 1]))) --last;
    return s.substr(first, last - first);
}

double NumberOr(const json& obj, const char* key, double fallback) {
    if (obj.contains(key) && obj[key].is_number()) {
        return obj[key].get<double>();
    }
    return fallback;
}

std::optional<std::string> SpeakerOf(const json& obj) {
    if (obj.contains("speaker") && obj["speaker"].is_string()) {
        return obj["speaker"].get<std::string>();
    }
    return std::nullopt;
}

domain::Segment ParseSegment(const json& item) {
    domain::Segment seg;
    seg.start = NumberOr(item, "start", 0.0);
    seg.end = NumberOr(item, "end", seg.start);
    if (item.contains("text") && item["text"].is_string()) {
        seg.text = Trim(item["text"].get<std::string>());
    }
    seg.speaker = SpeakerOf(item);

    for (auto it = item.begin(); it != item.end(); ++it) {
        const auto& key = it.key();
        if (key == "start" || key == "end" || key == "text" || key == "speaker") continue;
        seg.extra[key] = it.value();
    }
    return seg;
}

} // namespace

domain::ChunkResult TranscriptionResponseParser::FromJson(const json& payload, int chunkIndex) {
    domain::ChunkResult result;
    result.chunkIndex = chunkIndex;
    result.timeBase = domain::TimeBase::ChunkLocal;

    if (payload.is_string()) {
        result.rawText = Trim(payload.get<std::string>());
        return result;
    }
    if (!payload.is_object()) {
        throw domain::ChunkTranscriptionError(chunkIndex, "unexpected response type: " + std::string(payload.type_name()));
    }

    if (payload.contains("text") && payload["text"].is_string()) {
        result.rawText = Trim(payload["text"].get<std::string>());
    }

    if (payload.contains("segments") && payload["segments"].is_array()) {
        for (const auto& item : payload["segments"]) {
            if (!item.is_object()) continue;
            result.segments.push_back(ParseSegment(item));
        }
    }

    if (payload.contains("words") && payload["words"].is_array()) {
        for (const auto& item : payload["words"]) {
            if (!item.is_object()) continue;
            domain::WordToken word;
            if (item.contains("word") && item["word"].is_string()) {
                word.text = Trim(item["word"].get<std::string>());
            } else if (item.contains("text") && item["text"].is_string()) {
                word.text = Trim(item["text"].get<std::string>());
            }
            if (word.text.empty()) continue;
            word.start = NumberOr(item, "start", 0.0);
            word.end = NumberOr(item, "end", word.start);
            word.speaker = SpeakerOf(item);
            result.words.push_back(std::move(word));
        }
    }

    if (result.words.empty() && !result.segments.empty()) {
        result.words = domain::InferWordTokensFromSegments(result.segments);
    }

    if (result.rawText.empty() && !result.segments.empty()) {
        for (const auto& seg : result.segments) {
            if (seg.text.empty()) continue;
            if (!result.rawText.empty()) result.rawText += ' ';
            result.rawText += seg.text;
        }
    }
    return result;
}

domain::ChunkResult TranscriptionResponseParser::Parse(const std::string& body, int chunkIndex) {
    json payload = json::parse(body, nullptr, false);
    if (payload.is_discarded()) {
        domain::ChunkResult result;
        result.chunkIndex = chunkIndex;
        result.rawText = Trim(body);
        return result;
    }
    return FromJson(payload, chunkIndex);
}

} // namespace longscribe::infrastructure

/**
 * @file TranscriptStoreFs.cpp
 * @brief Implementation of TranscriptStoreFs.
 */

#include "infrastructure/TranscriptStoreFs.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace longscribe::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

json SpeakerToJson(const std::optional<std::string>& speaker) {
    return speaker ? json(*speaker) : json(nullptr);
}

std::optional<std::string> SpeakerFromJson(const json& j) {
    if (j.contains("speaker") && j["speaker"].is_string()) {
        return j["speaker"].get<std::string>();
    }
    return std::nullopt;
}

// Names come from file stems; keep them from escaping the output directory.
std::string SanitizeName(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        out.push_back((c == '/' || c == '\\') ? '_' : c);
    }
    return out.empty() ? "transcript" : out;
}

} // namespace

TranscriptStoreFs::TranscriptStoreFs(std::string outputDir, std::shared_ptr<PersistenceService> persistence)
    : m_outputDir(std::move(outputDir)), m_persistence(std::move(persistence)) {
    if (!m_persistence) {
        throw std::invalid_argument("TranscriptStoreFs requires a PersistenceService");
    }
}

std::string TranscriptStoreFs::jsonPath(const std::string& name) const {
    return (fs::path(m_outputDir) / (SanitizeName(name) + ".transcript.json")).string();
}

std::string TranscriptStoreFs::textPath(const std::string& name) const {
    return (fs::path(m_outputDir) / (SanitizeName(name) + ".txt")).string();
}

json TranscriptStoreFs::RecordToJson(const domain::TranscriptRecord& record) {
    json j;
    j["name"] = record.name;
    j["status"] = record.status;
    j["duration_seconds"] = record.durationSeconds;
    j["language"] = record.language;
    j["text"] = record.transcript.text;

    j["segments"] = json::array();
    for (const auto& seg : record.transcript.segments) {
        json s = seg.extra.is_object() ? seg.extra : json::object();
        s["start"] = seg.start;
        s["end"] = seg.end;
        s["text"] = seg.text;
        s["speaker"] = SpeakerToJson(seg.speaker);
        j["segments"].push_back(s);
    }

    j["words"] = json::array();
    for (const auto& w : record.transcript.words) {
        j["words"].push_back({{"word", w.text}, {"start", w.start}, {"end", w.end}, {"speaker", SpeakerToJson(w.speaker)}});
    }

    j["gaps"] = json::array();
    for (const auto& gap : record.gaps) {
        j["gaps"].push_back({
            {"chunk_index", gap.chunkIndex},
            {"logical_start_ms", gap.logicalStartMs},
            {"logical_end_ms", gap.logicalEndMs},
            {"reason", gap.reason}
        });
    }

    if (!record.diarizedText.empty()) {
        j["diarized_text"] = record.diarizedText;
    }
    return j;
}

domain::TranscriptRecord TranscriptStoreFs::RecordFromJson(const json& j) {
    domain::TranscriptRecord record;
    record.name = j.value("name", "");
    record.status = j.value("status", "");
    record.durationSeconds = j.value("duration_seconds", 0.0);
    record.language = j.value("language", "");
    record.transcript.text = j.value("text", "");
    record.diarizedText = j.value("diarized_text", "");

    for (const auto& s : j.value("segments", json::array())) {
        domain::Segment seg;
        seg.start = s.at("start").get<double>();
        seg.end = s.at("end").get<double>();
        seg.text = s.value("text", "");
        seg.speaker = SpeakerFromJson(s);
        for (auto it = s.begin(); it != s.end(); ++it) {
            const auto& key = it.key();
            if (key == "start" || key == "end" || key == "text" || key == "speaker") continue;
            seg.extra[key] = it.value();
        }
        record.transcript.segments.push_back(std::move(seg));
    }

    for (const auto& w : j.value("words", json::array())) {
        domain::WordToken word;
        word.text = w.value("word", "");
        word.start = w.at("start").get<double>();
        word.end = w.at("end").get<double>();
        word.speaker = SpeakerFromJson(w);
        record.transcript.words.push_back(std::move(word));
    }

    for (const auto& g : j.value("gaps", json::array())) {
        domain::GapRange gap;
        gap.chunkIndex = g.at("chunk_index").get<int>();
        gap.logicalStartMs = g.at("logical_start_ms").get<std::int64_t>();
        gap.logicalEndMs = g.at("logical_end_ms").get<std::int64_t>();
        gap.reason = g.value("reason", "");
        record.gaps.push_back(std::move(gap));
    }
    return record;
}

void TranscriptStoreFs::save(const domain::TranscriptRecord& record) {
    const std::string text = record.diarizedText.empty() ? record.transcript.text : record.diarizedText;
    // Engines may cut text mid-character; invalid UTF-8 is written as U+FFFD.
    m_persistence->saveTextAsync(jsonPath(record.name),
                                 RecordToJson(record).dump(2, ' ', false, json::error_handler_t::replace));
    m_persistence->saveTextAsync(textPath(record.name), text + "\n");
    std::cout << "[TranscriptStoreFs] Queued " << jsonPath(record.name) << std::endl;
}

std::optional<domain::TranscriptRecord> TranscriptStoreFs::load(const std::string& name) const {
    const std::string path = jsonPath(name);
    if (!fs::exists(path)) {
        return std::nullopt;
    }
    try {
        std::ifstream f(path);
        json j;
        f >> j;
        return RecordFromJson(j);
    } catch (const std::exception& e) {
        std::cerr << "[TranscriptStoreFs] Error reading " << path << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

} // namespace longscribe::infrastructure

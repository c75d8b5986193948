/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace longscribe::infrastructure {

namespace {

template <typename T>
void ReadKey(const nlohmann::json& section, const char* key, T& target) {
    if (section.is_object() && section.contains(key) && !section[key].is_null()) {
        target = section[key].get<T>();
    }
}

const nlohmann::json& Section(const nlohmann::json& j, const char* name) {
    static const nlohmann::json kEmpty = nlohmann::json::object();
    if (j.is_object() && j.contains(name) && j[name].is_object()) {
        return j[name];
    }
    return kEmpty;
}

} // namespace

application::AssemblerConfig ConfigLoader::ParseAssemblerConfig(const nlohmann::json& j) {
    application::AssemblerConfig config;

    const auto& chunking = Section(j, "chunking");
    ReadKey(chunking, "chunk_duration_ms", config.chunkDurationMs);
    ReadKey(chunking, "overlap_ms", config.overlapMs);
    ReadKey(chunking, "max_overlap_chars", config.maxOverlapChars);
    ReadKey(chunking, "epsilon_sec", config.epsilonSec);

    const auto& dispatch = Section(j, "dispatch");
    ReadKey(dispatch, "max_concurrency", config.maxConcurrency);
    ReadKey(dispatch, "retry_count", config.retryCount);
    ReadKey(dispatch, "retry_backoff_ms", config.retryBackoffMs);
    ReadKey(dispatch, "chunk_timeout_ms", config.chunkTimeoutMs);
    return config;
}

AppConfig ConfigLoader::FromJson(const nlohmann::json& j) {
    AppConfig config;
    config.assembler = ParseAssemblerConfig(j);

    ReadKey(j, "backend", config.backend);
    ReadKey(j, "language", config.language);
    ReadKey(j, "temperature", config.temperature);

    const auto& http = Section(j, "http");
    ReadKey(http, "base_url", config.http.baseUrl);
    ReadKey(http, "endpoint", config.http.endpoint);
    ReadKey(http, "model", config.http.model);
    ReadKey(http, "api_key_env", config.http.apiKeyEnv);
    ReadKey(http, "read_timeout_sec", config.http.readTimeoutSec);
    ReadKey(http, "response_format", config.http.responseFormat);

    const auto& whisper = Section(j, "whisper_cpp");
    ReadKey(whisper, "model_path", config.whisperCpp.modelPath);
    ReadKey(whisper, "threads", config.whisperCpp.threads);

    const auto& output = Section(j, "output");
    ReadKey(output, "directory", config.outputDirectory);
    ReadKey(output, "save_to_history", config.saveToHistory);

    const auto& diarization = Section(j, "diarization");
    ReadKey(diarization, "enabled", config.diarize);
    ReadKey(diarization, "pause_threshold_ms", config.resegment.pauseThresholdMs);
    ReadKey(diarization, "max_segment_ms", config.resegment.maxSegmentMs);
    ReadKey(diarization, "split_on_punctuation", config.resegment.splitOnPunctuation);
    return config;
}

AppConfig ConfigLoader::Load(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        std::cout << "[ConfigLoader] No settings at " << path << ", using defaults" << std::endl;
        return AppConfig{};
    }

    try {
        std::ifstream f(path);
        nlohmann::json j;
        f >> j;
        return FromJson(j);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << path << ": " << e.what() << std::endl;
    }
    return AppConfig{};
}

std::optional<std::string> ConfigLoader::ResolveApiKey(const HttpBackendConfig& http) {
    if (http.apiKeyEnv.empty()) {
        return std::nullopt;
    }
    const char* value = std::getenv(http.apiKeyEnv.c_str());
    if (value && *value) {
        return std::string(value);
    }
    return std::nullopt;
}

} // namespace longscribe::infrastructure

/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the application configuration (settings.json).
 *
 * Every key is optional. Missing keys keep the defaults declared in AppConfig
 * and the structs it embeds.
 */

#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include "application/TranscriptAssembler.hpp"
#include "domain/Resegmentation.hpp"

namespace longscribe::infrastructure {

struct HttpBackendConfig {
    std::string baseUrl = "https://api.openai.com";
    std::string endpoint = "/v1/audio/transcriptions";
    std::string model = "whisper-1";
    std::string apiKeyEnv = "OPENAI_API_KEY";
    int readTimeoutSec = 300;
    std::string responseFormat = "verbose_json";
};

struct WhisperCppConfig {
    std::string modelPath;  ///< Empty: <data home>/LongScribe/models/ggml-base.bin
    int threads = 0;        ///< 0: hardware concurrency.
};

struct AppConfig {
    application::AssemblerConfig assembler;
    std::string backend = "http";
    std::string language;
    double temperature = 0.0;
    HttpBackendConfig http;
    WhisperCppConfig whisperCpp;
    std::string outputDirectory; ///< Empty: <data home>/LongScribe/transcripts
    bool saveToHistory = true;
    bool diarize = false;
    domain::ResegmentOptions resegment;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings from a JSON file.
     * @return Defaults if the file is missing or unreadable (the error is logged).
     */
    static AppConfig Load(const std::string& path);

    /** @brief Builds a config from an already parsed document. */
    static AppConfig FromJson(const nlohmann::json& j);

    /** @brief Reads only the "chunking" and "dispatch" sections. */
    static application::AssemblerConfig ParseAssemblerConfig(const nlohmann::json& j);

    /** @brief Returns the API key from the configured environment variable, if set. */
    static std::optional<std::string> ResolveApiKey(const HttpBackendConfig& http);
};

} // namespace longscribe::infrastructure

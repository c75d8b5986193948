/**
 * @file OpenAITranscriptionClient.hpp
 * @brief Low-level HTTP client for OpenAI-compatible audio transcription endpoints.
 */

#pragma once

#include <optional>
#include <string>

namespace longscribe::infrastructure {

struct TranscriptionRequestOptions {
    std::string model = "whisper-1";
    std::string responseFormat = "verbose_json";
    std::string language;        ///< Empty lets the server detect it.
    double temperature = 0.0;
    bool wordTimestamps = true;  ///< Only sent with verbose_json.
};

class OpenAITranscriptionClient {
public:
    /**
     * @param baseUrl Scheme, host and optional port, e.g. "https://api.openai.com".
     * @param endpoint Request path, e.g. "/v1/audio/transcriptions".
     */
    OpenAITranscriptionClient(const std::string& baseUrl,
                              const std::string& endpoint,
                              std::optional<std::string> apiKey,
                              int readTimeoutSec = 300);

    /**
     * @brief Uploads one WAV file as multipart/form-data.
     * @param error Populated with the HTTP status or connection error on failure.
     * @return The response body on HTTP 200.
     */
    std::optional<std::string> transcribe(const std::string& wavBytes,
                                          const std::string& filename,
                                          const TranscriptionRequestOptions& options,
                                          std::string& error) const;

    const std::string& baseUrl() const { return m_baseUrl; }

private:
    std::string m_baseUrl;
    std::string m_endpoint;
    std::optional<std::string> m_apiKey;
    int m_readTimeoutSec;
};

} // namespace longscribe::infrastructure

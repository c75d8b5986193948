#include "infrastructure/OpenAITranscriptionClient.hpp"
#include <httplib.h>
#include <iostream>
#include <sstream>

namespace longscribe::infrastructure {

namespace {
constexpr int kConnectTimeoutSec = 10;
constexpr size_t kMaxLoggedBody = 300;
}

OpenAITranscriptionClient::OpenAITranscriptionClient(const std::string& baseUrl,
                                                     const std::string& endpoint,
                                                     std::optional<std::string> apiKey,
                                                     int readTimeoutSec)
    : m_baseUrl(baseUrl), m_endpoint(endpoint), m_apiKey(std::move(apiKey)), m_readTimeoutSec(readTimeoutSec) {}

std::optional<std::string> OpenAITranscriptionClient::transcribe(const std::string& wavBytes,
                                                                 const std::string& filename,
                                                                 const TranscriptionRequestOptions& options,
                                                                 std::string& error) const {
    httplib::Client cli(m_baseUrl);
    cli.set_connection_timeout(kConnectTimeoutSec);
    cli.set_read_timeout(m_readTimeoutSec);
    if (m_apiKey) {
        cli.set_bearer_token_auth(*m_apiKey);
    }

    std::ostringstream temperature;
    temperature << options.temperature;

    httplib::MultipartFormDataItems items = {
        {"file", wavBytes, filename, "audio/wav"},
        {"model", options.model, "", ""},
        {"response_format", options.responseFormat, "", ""},
        {"temperature", temperature.str(), "", ""},
    };
    if (!options.language.empty()) {
        items.push_back({"language", options.language, "", ""});
    }
    if (options.wordTimestamps && options.responseFormat == "verbose_json") {
        items.push_back({"timestamp_granularities[]", "word", "", ""});
        items.push_back({"timestamp_granularities[]", "segment", "", ""});
    }

    auto res = cli.Post(m_endpoint, items);
    if (res && res->status == 200) {
        return res->body;
    }

    if (res) {
        error = "HTTP " + std::to_string(res->status) + ": " + res->body.substr(0, kMaxLoggedBody);
    } else {
        error = "connection failed: " + httplib::to_string(res.error());
    }
    std::cerr << "[OpenAITranscriptionClient] " << error << std::endl;
    return std::nullopt;
}

} // namespace longscribe::infrastructure

/**
 * @file OpenAITranscriptionAdapter.hpp
 * @brief Chunk invoker backed by an OpenAI-compatible transcription server.
 */

#pragma once
#include "domain/TranscriptionService.hpp"
#include "infrastructure/OpenAITranscriptionClient.hpp"
#include <string>

namespace longscribe::infrastructure {

/**
 * @class OpenAITranscriptionAdapter
 * @brief Implements ChunkInvoker by uploading each chunk as a WAV file.
 *
 * Stateless apart from configuration, so concurrent calls are safe.
 */
class OpenAITranscriptionAdapter : public domain::ChunkInvoker {
public:
    OpenAITranscriptionAdapter(OpenAITranscriptionClient client, TranscriptionRequestOptions options);

    /** @see domain::ChunkInvoker::transcribeChunk */
    domain::ChunkResult transcribeChunk(const domain::ChunkRequest& request) override;

    std::string name() const override;

private:
    OpenAITranscriptionClient m_client;
    TranscriptionRequestOptions m_options;
};

} // namespace longscribe::infrastructure

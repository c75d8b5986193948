/**
 * @file OpenAITranscriptionAdapter.cpp
 * @brief Implementation of the OpenAITranscriptionAdapter class.
 */
#include "infrastructure/OpenAITranscriptionAdapter.hpp"
#include "infrastructure/AudioUtils.hpp"
#include "infrastructure/TranscriptionResponseParser.hpp"
#include "domain/Errors.hpp"

#include <iostream>

namespace longscribe::infrastructure {

OpenAITranscriptionAdapter::OpenAITranscriptionAdapter(OpenAITranscriptionClient client,
                                                       TranscriptionRequestOptions options)
    : m_client(std::move(client)), m_options(std::move(options)) {}

domain::ChunkResult OpenAITranscriptionAdapter::transcribeChunk(const domain::ChunkRequest& request) {
    const int index = request.window.chunkIndex;
    if (request.audio.sampleCount == 0 || request.audio.data == nullptr) {
        domain::ChunkResult empty;
        empty.chunkIndex = index;
        return empty;
    }

    const std::string wav = AudioUtils::EncodeWav16(request.audio.data, request.audio.sampleCount,
                                                    request.audio.sampleRate);
    const std::string filename = "chunk_" + std::to_string(index) + ".wav";

    std::string error;
    auto body = m_client.transcribe(wav, filename, m_options, error);
    if (!body) {
        throw domain::ChunkTranscriptionError(index, error);
    }

    try {
        return TranscriptionResponseParser::Parse(*body, index);
    } catch (const domain::ChunkTranscriptionError&) {
        throw;
    } catch (const std::exception& e) {
        throw domain::ChunkTranscriptionError(index, std::string("unparseable response: ") + e.what());
    }
}

std::string OpenAITranscriptionAdapter::name() const {
    return "http:" + m_options.model;
}

} // namespace longscribe::infrastructure

#pragma once

#include "domain/TranscriptionService.hpp"
#include <string>
#include <mutex>

// whisper.h stays out of the header; only the context pointer is needed here.
struct whisper_context;

namespace longscribe::infrastructure {

/**
 * @class WhisperCppAdapter
 * @brief Implements ChunkInvoker with an in-process whisper.cpp model.
 *
 * One context is loaded lazily and shared. whisper_full is not reentrant on a
 * context, so inference is serialized by m_mutex.
 */
class WhisperCppAdapter : public domain::ChunkInvoker {
public:
    WhisperCppAdapter(const std::string& modelPath, const std::string& language = "", int threads = 0);
    ~WhisperCppAdapter() override;

    WhisperCppAdapter(const WhisperCppAdapter&) = delete;
    WhisperCppAdapter& operator=(const WhisperCppAdapter&) = delete;

    domain::ChunkResult transcribeChunk(const domain::ChunkRequest& request) override;
    std::string name() const override { return "whisper.cpp"; }

private:
    std::string m_modelPath;
    std::string m_language;
    int m_threads;

    whisper_context* m_ctx = nullptr;
    std::mutex m_mutex;
    bool m_modelLoaded = false;

    bool loadModel(std::string& errorMsg);
};

} // namespace longscribe::infrastructure

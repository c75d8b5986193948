/**
 * @file WhisperCppAdapter.cpp
 * @brief Implementation of the WhisperCppAdapter class.
 */
#include "infrastructure/WhisperCppAdapter.hpp"
#include "domain/Errors.hpp"
#include "whisper.h"

#include <filesystem>
#include <iostream>
#include <thread>
#include <cctype>
#include <algorithm>

namespace longscribe::infrastructure {

namespace {

// whisper.cpp timestamps are in units of 10 ms.
double CentisecondsToSeconds(int64_t t) {
    return static_cast<double>(t) / 100.0;
}

std::string Trim(const std::string& s) {
    size_t first = 0;
    while (first < s.size() && std::isspace(static_cast<unsigned char>(s[first]))) ++first;
    size_t last = s.size();
    while (last > first && std::isspace(static_cast<unsigned char>(s[last - 1]))) --last;
    return s.substr(first, last - first);
}

// Token pieces that begin with a space start a new word; others continue the current one.
// Tokens without a timestamp (t0 < 0) inherit the segment bounds.
void CollectWords(whisper_context* ctx, int segment, std::vector<domain::WordToken>& out) {
    const int64_t segT0 = whisper_full_get_segment_t0(ctx, segment);
    const int64_t segT1 = whisper_full_get_segment_t1(ctx, segment);
    const whisper_token eot = whisper_token_eot(ctx);
    const int nTokens = whisper_full_n_tokens(ctx, segment);

    domain::WordToken current;
    bool open = false;
    auto flush = [&]() {
        if (open) {
            current.text = Trim(current.text);
            if (!current.text.empty()) out.push_back(current);
        }
        current = domain::WordToken{};
        open = false;
    };

    for (int t = 0; t < nTokens; ++t) {
        const whisper_token_data data = whisper_full_get_token_data(ctx, segment, t);
        if (data.id >= eot) continue; // special tokens

        const char* raw = whisper_full_get_token_text(ctx, segment, t);
        const std::string piece = raw ? raw : "";
        if (piece.empty()) continue;

        const bool startsWord = std::isspace(static_cast<unsigned char>(piece[0])) != 0;
        if (startsWord || !open) {
            flush();
            current.start = CentisecondsToSeconds(data.t0 >= 0 ? data.t0 : segT0);
            open = true;
        }
        current.text += piece;
        current.end = std::max(current.start, CentisecondsToSeconds(data.t1 >= 0 ? data.t1 : segT1));
    }
    flush();
}

} // namespace

WhisperCppAdapter::WhisperCppAdapter(const std::string& modelPath, const std::string& language, int threads)
    : m_modelPath(modelPath)
    , m_language(language)
    , m_threads(threads > 0 ? threads : static_cast<int>(std::max(1u, std::thread::hardware_concurrency())))
{
    // The model is loaded on first use.
}

WhisperCppAdapter::~WhisperCppAdapter() {
    if (m_ctx) {
        whisper_free(m_ctx);
    }
}

bool WhisperCppAdapter::loadModel(std::string& errorMsg) {
    if (m_modelLoaded) return true;

    if (!std::filesystem::exists(m_modelPath)) {
        errorMsg = "Model file not found at: " + m_modelPath + ". Download a ggml model (e.g. ggml-base.bin).";
        return false;
    }

    struct whisper_context_params cparams = whisper_context_default_params();
    m_ctx = whisper_init_from_file_with_params(m_modelPath.c_str(), cparams);

    if (!m_ctx) {
        errorMsg = "Failed to initialize whisper context from " + m_modelPath;
        return false;
    }

    std::cout << "[WhisperCppAdapter] Loaded model " << m_modelPath << std::endl;
    m_modelLoaded = true;
    return true;
}

domain::ChunkResult WhisperCppAdapter::transcribeChunk(const domain::ChunkRequest& request) {
    const int index = request.window.chunkIndex;
    domain::ChunkResult result;
    result.chunkIndex = index;
    result.timeBase = domain::TimeBase::ChunkLocal;

    if (request.audio.sampleCount == 0 || request.audio.data == nullptr) {
        return result;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    std::string error;
    if (!loadModel(error)) {
        throw domain::ChunkTranscriptionError(index, error);
    }

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.print_progress = false;
    wparams.print_special = false;
    wparams.print_realtime = false;
    wparams.print_timestamps = false;
    wparams.token_timestamps = true;
    wparams.language = m_language.empty() ? "auto" : m_language.c_str();
    wparams.n_threads = m_threads;

    if (whisper_full(m_ctx, wparams, request.audio.data, static_cast<int>(request.audio.sampleCount)) != 0) {
        throw domain::ChunkTranscriptionError(index, "whisper inference failed");
    }

    const int nSegments = whisper_full_n_segments(m_ctx);
    for (int i = 0; i < nSegments; ++i) {
        const char* text = whisper_full_get_segment_text(m_ctx, i);

        domain::Segment seg;
        seg.start = CentisecondsToSeconds(whisper_full_get_segment_t0(m_ctx, i));
        seg.end = CentisecondsToSeconds(whisper_full_get_segment_t1(m_ctx, i));
        seg.text = Trim(text ? text : "");
        seg.extra["id"] = i;
        if (seg.text.empty()) continue;

        if (!result.rawText.empty()) result.rawText += ' ';
        result.rawText += seg.text;
        result.segments.push_back(std::move(seg));

        CollectWords(m_ctx, i, result.words);
    }

    return result;
}

} // namespace longscribe::infrastructure

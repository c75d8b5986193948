#include "infrastructure/AudioUtils.hpp"
#include <SDL.h>
#include <filesystem>
#include <iostream>
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace longscribe::infrastructure {

namespace {

void AppendLE(std::string& out, std::uint32_t value, int bytes) {
    for (int i = 0; i < bytes; ++i) {
        out.push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
    }
}

} // namespace

int AudioUtils::ExecCmd(const std::string& cmd) {
    return std::system(cmd.c_str());
}

bool AudioUtils::ConvertAudioToWav(const std::string& inputPath, std::string& outputPath, std::string& error) {
    namespace fs = std::filesystem;
    if (outputPath.empty()) {
        fs::path tempPath = fs::temp_directory_path() / (fs::path(inputPath).stem().string() + "_longscribe.wav");
        outputPath = tempPath.string();
    }

    std::error_code ec;
    fs::remove(outputPath, ec);

    std::string cmd = "ffmpeg -y -loglevel error -i \"" + inputPath + "\" -ar 16000 -ac 1 -c:a pcm_s16le \"" + outputPath + "\"";

    int ret = ExecCmd(cmd);
    if (ret != 0) {
        error = "ffmpeg conversion failed (exit " + std::to_string(ret) + "). Is ffmpeg installed?";
        return false;
    }

    if (!fs::exists(outputPath)) {
        error = "Converted file not found: " + outputPath;
        return false;
    }

    return true;
}

bool AudioUtils::LoadAudioSDL(const std::string& fname, std::vector<float>& pcmf32, std::string& error) {
    SDL_AudioSpec wavSpec;
    Uint32 wavLength;
    Uint8 *wavBuffer;

    if (SDL_LoadWAV(fname.c_str(), &wavSpec, &wavBuffer, &wavLength) == NULL) {
        error = "SDL_LoadWAV failed: " + std::string(SDL_GetError());
        return false;
    }

    SDL_AudioCVT cvt;
    if (SDL_BuildAudioCVT(&cvt, wavSpec.format, wavSpec.channels, wavSpec.freq,
                          AUDIO_F32SYS, 1, kTargetSampleRate) < 0) {
        error = "SDL_BuildAudioCVT failed: " + std::string(SDL_GetError());
        SDL_FreeWAV(wavBuffer);
        return false;
    }

    cvt.len = static_cast<int>(wavLength);
    cvt.buf = (Uint8 *)SDL_malloc(static_cast<size_t>(cvt.len) * cvt.len_mult);
    if (!cvt.buf) {
        error = "Out of memory converting " + fname;
        SDL_FreeWAV(wavBuffer);
        return false;
    }
    SDL_memcpy(cvt.buf, wavBuffer, wavLength);

    if (SDL_ConvertAudio(&cvt) < 0) {
        error = "SDL_ConvertAudio failed: " + std::string(SDL_GetError());
        SDL_free(cvt.buf);
        SDL_FreeWAV(wavBuffer);
        return false;
    }

    const size_t sampleCount = static_cast<size_t>(cvt.len_cvt) / sizeof(float);
    pcmf32.resize(sampleCount);
    SDL_memcpy(pcmf32.data(), cvt.buf, sampleCount * sizeof(float));

    SDL_free(cvt.buf);
    SDL_FreeWAV(wavBuffer);

    return true;
}

std::shared_ptr<domain::AudioBuffer> AudioUtils::LoadAudioFile(const std::string& path, std::string& error) {
    namespace fs = std::filesystem;
    if (!fs::exists(path)) {
        error = "Audio file not found: " + path;
        return nullptr;
    }

    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::string processedPath = path;
    bool usingTempFile = false;
    if (ext != ".wav") {
        processedPath.clear();
        if (!ConvertAudioToWav(path, processedPath, error)) {
            return nullptr;
        }
        usingTempFile = true;
    }

    std::vector<float> pcmf32;
    const bool loaded = LoadAudioSDL(processedPath, pcmf32, error);
    if (usingTempFile) {
        std::error_code ec;
        fs::remove(processedPath, ec);
    }
    if (!loaded) {
        return nullptr;
    }

    std::cout << "[AudioUtils] Loaded " << path << ": " << pcmf32.size() << " samples ("
              << pcmf32.size() / kTargetSampleRate << "s)" << std::endl;
    return std::make_shared<domain::AudioBuffer>(std::move(pcmf32), kTargetSampleRate);
}

std::string AudioUtils::EncodeWav16(const float* samples, std::size_t count, int sampleRate) {
    const std::uint32_t dataBytes = static_cast<std::uint32_t>(count * 2);
    std::string out;
    out.reserve(44 + dataBytes);

    out += "RIFF";
    AppendLE(out, 36 + dataBytes, 4);
    out += "WAVE";
    out += "fmt ";
    AppendLE(out, 16, 4);                                        // fmt chunk size
    AppendLE(out, 1, 2);                                         // PCM
    AppendLE(out, 1, 2);                                         // mono
    AppendLE(out, static_cast<std::uint32_t>(sampleRate), 4);
    AppendLE(out, static_cast<std::uint32_t>(sampleRate) * 2, 4); // byte rate
    AppendLE(out, 2, 2);                                         // block align
    AppendLE(out, 16, 2);                                        // bits per sample
    out += "data";
    AppendLE(out, dataBytes, 4);

    for (std::size_t i = 0; i < count; ++i) {
        const float clamped = std::clamp(samples[i], -1.0f, 1.0f);
        const auto value = static_cast<std::int16_t>(clamped * 32767.0f);
        AppendLE(out, static_cast<std::uint16_t>(value), 2);
    }
    return out;
}

} // namespace longscribe::infrastructure

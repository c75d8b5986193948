#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "domain/AudioBuffer.hpp"

namespace longscribe::infrastructure {

/**
 * @brief Utilities for audio processing.
 */
class AudioUtils {
public:
    static constexpr int kTargetSampleRate = 16000;

    /**
     * @brief Executes a system command.
     */
    static int ExecCmd(const std::string& cmd);

    /**
     * @brief Converts an audio file to 16kHz mono WAV using ffmpeg.
     * @param inputPath Path to source file.
     * @param outputPath Output path (populated automatically if empty).
     * @param error Populated on failure.
     * @return True if successful.
     */
    static bool ConvertAudioToWav(const std::string& inputPath, std::string& outputPath, std::string& error);

    /**
     * @brief Loads a WAV file and converts it to 16kHz float32 mono (Whisper format).
     * @param fname Path to WAV file.
     * @param pcmf32 Resulting vector of samples.
     * @param error Populated on failure.
     * @return True if successful.
     */
    static bool LoadAudioSDL(const std::string& fname, std::vector<float>& pcmf32, std::string& error);

    /**
     * @brief Loads any audio file ffmpeg understands into a 16kHz mono buffer.
     *
     * Non-WAV input is converted to a temporary WAV first and removed afterwards.
     * @return nullptr on failure, with error populated.
     */
    static std::shared_ptr<domain::AudioBuffer> LoadAudioFile(const std::string& path, std::string& error);

    /** @brief Encodes float samples as a 16-bit PCM mono WAV file image. */
    static std::string EncodeWav16(const float* samples, std::size_t count, int sampleRate);
};

} // namespace longscribe::infrastructure

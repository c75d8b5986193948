/**
 * @file AudioBuffer.hpp
 * @brief Decoded mono PCM audio and read-only slices of it.
 */

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace longscribe::domain {

/**
 * @struct AudioSlice
 * @brief Non-owning view over a contiguous range of an AudioBuffer.
 *
 * Valid as long as the owning buffer is alive and unmodified.
 */
struct AudioSlice {
    const float* data = nullptr;
    std::size_t sampleCount = 0;
    int sampleRate = 16000;
    std::int64_t startMs = 0; ///< Position of the first sample in the source, in ms.

    std::int64_t durationMs() const {
        return sampleRate > 0 ? static_cast<std::int64_t>(sampleCount) * 1000 / sampleRate : 0;
    }
};

/**
 * @class AudioBuffer
 * @brief Owns float32 mono samples of a whole recording.
 */
class AudioBuffer {
public:
    AudioBuffer() = default;
    AudioBuffer(std::vector<float> samples, int sampleRate)
        : m_samples(std::move(samples)), m_sampleRate(sampleRate) {}

    const std::vector<float>& samples() const { return m_samples; }
    int sampleRate() const { return m_sampleRate; }

    std::int64_t durationMs() const {
        if (m_sampleRate <= 0) return 0;
        return static_cast<std::int64_t>(m_samples.size()) * 1000 / m_sampleRate;
    }

    /** @brief Returns the samples in [startMs, endMs), clamped to the buffer. */
    AudioSlice slice(std::int64_t startMs, std::int64_t endMs) const {
        AudioSlice s;
        s.sampleRate = m_sampleRate;
        s.startMs = startMs;
        if (m_sampleRate <= 0 || endMs <= startMs) return s;

        const std::size_t total = m_samples.size();
        auto toIndex = [this, total](std::int64_t ms) {
            auto idx = static_cast<std::size_t>(std::max<std::int64_t>(0, ms) * m_sampleRate / 1000);
            return std::min(idx, total);
        };
        const std::size_t first = toIndex(startMs);
        const std::size_t last = toIndex(endMs);
        s.data = m_samples.data() + first;
        s.sampleCount = last - first;
        return s;
    }

private:
    std::vector<float> m_samples;
    int m_sampleRate = 16000;
};

} // namespace longscribe::domain

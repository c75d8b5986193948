/**
 * @file CancellationToken.hpp
 * @brief Shared flag used to abandon a running transcription job.
 */

#pragma once

#include <atomic>
#include <memory>

namespace longscribe::domain {

class CancellationToken {
public:
    CancellationToken() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { m_flag->store(true); }
    bool isCancelled() const { return m_flag->load(); }

private:
    // Copies observe the same flag.
    std::shared_ptr<std::atomic<bool>> m_flag;
};

} // namespace longscribe::domain

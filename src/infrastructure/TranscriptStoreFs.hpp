/**
 * @file TranscriptStoreFs.hpp
 * @brief Filesystem-backed transcript sink.
 */

#pragma once

#include "domain/TranscriptSink.hpp"
#include "infrastructure/PersistenceService.hpp"
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace longscribe::infrastructure {

/**
 * @class TranscriptStoreFs
 * @brief Writes <name>.transcript.json and <name>.txt under one directory.
 *
 * Writes go through PersistenceService and complete asynchronously.
 */
class TranscriptStoreFs : public domain::TranscriptSink {
public:
    TranscriptStoreFs(std::string outputDir, std::shared_ptr<PersistenceService> persistence);

    void save(const domain::TranscriptRecord& record) override;

    /** @brief Reads a record previously written by save(). */
    std::optional<domain::TranscriptRecord> load(const std::string& name) const;

    std::string jsonPath(const std::string& name) const;
    std::string textPath(const std::string& name) const;

    static nlohmann::json RecordToJson(const domain::TranscriptRecord& record);
    /** @throws nlohmann::json::exception on malformed documents. */
    static domain::TranscriptRecord RecordFromJson(const nlohmann::json& j);

private:
    std::string m_outputDir;
    std::shared_ptr<PersistenceService> m_persistence;
};

} // namespace longscribe::infrastructure

#pragma once
#ifndef VIGIL_AI_MODEL_STORE_H
#define VIGIL_AI_MODEL_STORE_H

#include "vigil/ai/model_artifact.h"
#include <filesystem>
#include <optional>
#include <string>

namespace vigil {
namespace ai {

// Durable artifact storage. Implementations must be safe to call from many
// lanes at once. Both operations throw StorageError on I/O failure.
class IModelStore {
public:
    virtual ~IModelStore() = default;

    // std::nullopt when no artifact was ever stored for the monitor
    virtual std::optional<ArtifactBytes> get(const std::string& monitor_id) = 0;
    virtual void put(const std::string& monitor_id, const ArtifactBytes& bytes) = 0;
};

// <directory>/<monitor_id>/model.vgm, zstd-framed, replaced atomically
class FileModelStore : public IModelStore {
public:
    // Throws StorageError when the directory cannot be created
    explicit FileModelStore(std::filesystem::path directory, int compression_level = 3);

    std::optional<ArtifactBytes> get(const std::string& monitor_id) override;
    void put(const std::string& monitor_id, const ArtifactBytes& bytes) override;

    std::filesystem::path artifact_path(const std::string& monitor_id) const;
    const std::filesystem::path& directory() const { return directory_; }

    // Frame layout: original_size u32, stored_size u32, compressed u8, payload
    static std::string encode_block(const std::string& data, int compression_level);
    static std::string decode_block(const std::string& block);

private:
    std::filesystem::path directory_;
    int compression_level_;
};

} // namespace ai
} // namespace vigil

#endif // VIGIL_AI_MODEL_STORE_H

#include "vigil/ai/model_store.h"
#include "vigil/errors.h"
#include <zstd.h>
#include <atomic>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>
#include <vector>

namespace vigil {
namespace ai {

namespace {

constexpr size_t kHeaderSize = sizeof(uint32_t) * 2 + sizeof(uint8_t);
constexpr size_t kRawThreshold = 64;
constexpr uint32_t kMaxArtifactSize = 256u * 1024u * 1024u;

void append_header(std::string& out, uint32_t original_size, uint32_t stored_size, uint8_t flag) {
    out.append(reinterpret_cast<const char*>(&original_size), sizeof(original_size));
    out.append(reinterpret_cast<const char*>(&stored_size), sizeof(stored_size));
    out.append(reinterpret_cast<const char*>(&flag), sizeof(flag));
}

bool valid_monitor_id(const std::string& monitor_id) {
    if (monitor_id.empty() || monitor_id == "." || monitor_id == "..") return false;
    return monitor_id.find('/') == std::string::npos && monitor_id.find('\\') == std::string::npos;
}

} // anonymous namespace

FileModelStore::FileModelStore(std::filesystem::path directory, int compression_level)
    : directory_(std::move(directory)), compression_level_(compression_level) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw StorageError("cannot create model directory " + directory_.string() + ": " + ec.message());
    }
    std::cout << "[ModelStore] Using model directory " << directory_.string() << std::endl;
}

std::filesystem::path FileModelStore::artifact_path(const std::string& monitor_id) const {
    return directory_ / monitor_id / "model.vgm";
}

std::string FileModelStore::encode_block(const std::string& data, int compression_level) {
    if (data.size() > UINT32_MAX) {
        throw StorageError("artifact too large to frame: " + std::to_string(data.size()) + " bytes");
    }
    const uint32_t original_size = static_cast<uint32_t>(data.size());
    std::string block;

    // Small payloads are stored raw
    if (data.size() <= kRawThreshold) {
        block.reserve(kHeaderSize + data.size());
        append_header(block, original_size, original_size, 0);
        block.append(data);
        return block;
    }

    size_t max_compressed_size = ZSTD_compressBound(data.size());
    std::vector<char> compressed(max_compressed_size);
    size_t zstd_result = ZSTD_compress(
        compressed.data(), max_compressed_size,
        data.data(), data.size(),
        compression_level
    );

    if (ZSTD_isError(zstd_result)) {
        std::cerr << "[ModelStore] Compression failed, storing raw: "
                  << ZSTD_getErrorName(zstd_result) << std::endl;
        block.reserve(kHeaderSize + data.size());
        append_header(block, original_size, original_size, 0);
        block.append(data);
        return block;
    }

    block.reserve(kHeaderSize + zstd_result);
    append_header(block, original_size, static_cast<uint32_t>(zstd_result), 1);
    block.append(compressed.data(), zstd_result);
    return block;
}

std::string FileModelStore::decode_block(const std::string& block) {
    if (block.size() < kHeaderSize) {
        throw StorageError("artifact frame truncated (" + std::to_string(block.size()) + " bytes)");
    }

    uint32_t original_size = 0;
    uint32_t stored_size = 0;
    uint8_t compression_flag = 0;
    std::memcpy(&original_size, block.data(), sizeof(original_size));
    std::memcpy(&stored_size, block.data() + sizeof(original_size), sizeof(stored_size));
    std::memcpy(&compression_flag, block.data() + sizeof(original_size) * 2, sizeof(compression_flag));

    if (block.size() - kHeaderSize != stored_size) {
        throw StorageError("artifact frame declares " + std::to_string(stored_size) +
                           " bytes but holds " + std::to_string(block.size() - kHeaderSize));
    }

    const char* payload = block.data() + kHeaderSize;
    if (compression_flag == 0) {
        if (stored_size != original_size) {
            throw StorageError("raw artifact frame size mismatch");
        }
        return std::string(payload, stored_size);
    }
    if (compression_flag != 1) {
        throw StorageError("unknown artifact compression flag " + std::to_string(compression_flag));
    }

    // The header is untrusted: check it against the cap and the zstd frame before allocating
    if (original_size > kMaxArtifactSize) {
        throw StorageError("artifact frame declares " + std::to_string(original_size) +
                           " bytes, above the " + std::to_string(kMaxArtifactSize) + " byte limit");
    }
    unsigned long long frame_size = ZSTD_getFrameContentSize(payload, stored_size);
    if (frame_size == ZSTD_CONTENTSIZE_ERROR || frame_size == ZSTD_CONTENTSIZE_UNKNOWN) {
        throw StorageError("artifact payload is not a sized zstd frame");
    }
    if (frame_size != original_size) {
        throw StorageError("zstd frame holds " + std::to_string(frame_size) + " bytes, header declares " +
                           std::to_string(original_size));
    }

    std::string decompressed(original_size, '\0');
    size_t actual = ZSTD_decompress(&decompressed[0], original_size, payload, stored_size);
    if (ZSTD_isError(actual)) {
        throw StorageError(std::string("zstd decompression failed: ") + ZSTD_getErrorName(actual));
    }
    if (actual != original_size) {
        throw StorageError("decompressed " + std::to_string(actual) + " bytes, expected " +
                           std::to_string(original_size));
    }
    return decompressed;
}

std::optional<ArtifactBytes> FileModelStore::get(const std::string& monitor_id) {
    if (!valid_monitor_id(monitor_id)) {
        throw StorageError("invalid monitor id for storage: '" + monitor_id + "'");
    }

    const auto path = artifact_path(monitor_id);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            throw StorageError("cannot stat " + path.string() + ": " + ec.message());
        }
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw StorageError("cannot open " + path.string());
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw StorageError("read failed for " + path.string());
    }

    return decode_block(buffer.str());
}

void FileModelStore::put(const std::string& monitor_id, const ArtifactBytes& bytes) {
    if (!valid_monitor_id(monitor_id)) {
        throw StorageError("invalid monitor id for storage: '" + monitor_id + "'");
    }

    static std::atomic<uint64_t> sequence{0};

    const auto path = artifact_path(monitor_id);
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        throw StorageError("cannot create " + path.parent_path().string() + ": " + ec.message());
    }

    // Write next to the target, then rename over it
    std::ostringstream tmp_name;
    tmp_name << path.filename().string() << ".tmp."
             << std::hash<std::thread::id>{}(std::this_thread::get_id()) << "."
             << sequence.fetch_add(1);
    const auto tmp_path = path.parent_path() / tmp_name.str();

    const std::string block = encode_block(bytes, compression_level_);
    {
        std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw StorageError("cannot open " + tmp_path.string() + " for writing");
        }
        file.write(block.data(), static_cast<std::streamsize>(block.size()));
        file.flush();
        if (!file) {
            file.close();
            std::filesystem::remove(tmp_path, ec);
            throw StorageError("write failed for " + tmp_path.string());
        }
    }

    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        std::error_code cleanup;
        std::filesystem::remove(tmp_path, cleanup);
        throw StorageError("cannot move artifact into place at " + path.string() + ": " + ec.message());
    }

    std::cout << "[ModelStore] Stored artifact for " << monitor_id << " ("
              << bytes.size() << " bytes, " << block.size() << " on disk)" << std::endl;
}

} // namespace ai
} // namespace vigil

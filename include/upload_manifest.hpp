// include/upload_manifest.hpp
#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <chrono> // For timestamps
#include <ctime>

#include <nlohmann/json.hpp> // For JSON handling
#include "file_piece.hpp"

namespace MultipartUploader {
namespace Manifest {

struct PieceEntry {
    int index = 0;
    std::string file;      // Piece file name inside the piece directory
    uint64_t offset = 0;
    uint64_t size = 0;
    std::string etag;      // Empty until the part is acknowledged
};

// Record of one upload run, written next to the file pieces.
class UploadManifest {
public:
    std::string original_filename;
    uint64_t file_size_bytes = 0;
    std::string digest_algorithm;
    std::string digest;
    std::string bucket;
    std::string key;
    std::string upload_id;
    std::string state;       // Final session state, e.g. "Completed" or "Aborted"
    std::string created_at;  // ISO 8601, UTC
    std::vector<PieceEntry> pieces;

    UploadManifest() = default;

    UploadManifest(std::string filename, uint64_t size, std::string algorithm, const std::vector<Pieces::FilePiece>& file_pieces)
        : original_filename(std::move(filename)),
          file_size_bytes(size),
          digest_algorithm(std::move(algorithm))
    {
        for (const auto& piece : file_pieces) {
            pieces.push_back(PieceEntry{piece.index, piece.path.filename().string(), piece.offset, piece.size, ""});
        }

        auto now = std::chrono::system_clock::now();
        std::time_t now_c = std::chrono::system_clock::to_time_t(now);
        char buf[64];
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", std::gmtime(&now_c));
        created_at = buf;
    }

    // Record the ETag of an acknowledged part
    void recordEtag(int part_number, const std::string& etag);

    nlohmann::json toJson() const;

    static UploadManifest fromJson(const nlohmann::json& j);

    // Write <original basename>.manifest.json into dir
    void save(const std::filesystem::path& dir) const;

    static UploadManifest load(const std::filesystem::path& manifest_path);

    std::filesystem::path getFullPath(const std::filesystem::path& dir) const;
};

} // namespace Manifest
} // namespace MultipartUploader

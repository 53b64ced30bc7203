// include/file_piece.hpp
#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <filesystem>

namespace MultipartUploader {
namespace Pieces {

class FilePiece {
public:
    int index = 0;               // 1-based position in the source file, also the part number
    std::filesystem::path path;  // Standalone file holding this piece's bytes
    uint64_t offset = 0;         // Byte offset of the piece within the source file
    uint64_t size = 0;           // Number of bytes in the piece

    FilePiece() = default;

    FilePiece(int piece_index, std::filesystem::path piece_path, uint64_t piece_offset, uint64_t piece_size)
        : index(piece_index), path(std::move(piece_path)), offset(piece_offset), size(piece_size) {}

    // Re-read the piece file from disk. The bytes returned are the bytes that get uploaded.
    std::vector<char> loadData() const;

    // File name of the piece: <source basename>.<zero-padded index>
    static std::string pieceFileName(const std::filesystem::path& source_path, int index, int piece_count);
};

} // namespace Pieces
} // namespace MultipartUploader

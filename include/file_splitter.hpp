// include/file_splitter.hpp
#pragma once

#include <cstddef>
#include <filesystem>
#include <vector>

#include "file_piece.hpp"

namespace MultipartUploader
{
    namespace Pieces
    {

        class FileSplitter
        {
        public:
            // Read the source once and write ceil(size / max_piece_size) consecutive piece files into
            // destination_dir. Every piece holds max_piece_size bytes except the last, which holds the
            // remainder. Pieces come back in ascending index order.
            // Pieces already written are left in place if a later read or write fails.
            static std::vector<FilePiece> split(const std::filesystem::path &source_path,
                                                const std::filesystem::path &destination_dir,
                                                size_t max_piece_size);

            // ceil(file_size / max_piece_size)
            static uint64_t pieceCount(uint64_t file_size, size_t max_piece_size);

        private:
            // Buffer used to copy bytes from the source into a piece file
            static const size_t COPY_BUFFER_SIZE = 1024 * 1024;
        };

    } // namespace Pieces
} // namespace MultipartUploader

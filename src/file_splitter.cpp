// src/file_splitter.cpp
#include "file_splitter.hpp"
#include "upload_errors.hpp"

#include <algorithm>
#include <fstream>
#include <limits>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace MultipartUploader
{
    namespace Pieces
    {

        const size_t FileSplitter::COPY_BUFFER_SIZE;

        uint64_t FileSplitter::pieceCount(uint64_t file_size, size_t max_piece_size)
        {
            if (max_piece_size == 0)
            {
                throw InvalidInput("File piece size must be greater than zero.");
            }
            return file_size / max_piece_size + (file_size % max_piece_size != 0 ? 1 : 0);
        }

        std::vector<FilePiece> FileSplitter::split(const fs::path &source_path,
                                                   const fs::path &destination_dir,
                                                   size_t max_piece_size)
        {
            std::error_code ec;
            const uint64_t file_size = fs::file_size(source_path, ec);
            if (ec)
            {
                throw IOError("Failed to get size of input file " + source_path.string() + ": " + ec.message());
            }

            const uint64_t count = pieceCount(file_size, max_piece_size);
            if (count > static_cast<uint64_t>(std::numeric_limits<int>::max()))
            {
                throw InvalidInput("Input file " + source_path.string() + " would produce too many pieces.");
            }
            const int piece_count = static_cast<int>(count);

            std::ifstream ifs(source_path, std::ios::binary);
            if (!ifs.is_open())
            {
                throw IOError("Failed to open input file: " + source_path.string());
            }

            spdlog::debug("Splitting {} ({} bytes) into {} piece(s) of at most {} bytes",
                          source_path.string(), file_size, piece_count, max_piece_size);

            std::vector<FilePiece> pieces;
            pieces.reserve(static_cast<size_t>(piece_count));
            std::vector<char> buffer(std::min(COPY_BUFFER_SIZE, max_piece_size));
            uint64_t offset = 0;

            for (int index = 1; index <= piece_count; ++index)
            {
                const uint64_t piece_size = std::min<uint64_t>(max_piece_size, file_size - offset);
                fs::path piece_path = destination_dir / FilePiece::pieceFileName(source_path, index, piece_count);

                std::ofstream ofs(piece_path, std::ios::binary | std::ios::trunc);
                if (!ofs.is_open())
                {
                    throw IOError("Failed to open file for writing piece: " + piece_path.string());
                }

                uint64_t remaining = piece_size;
                while (remaining > 0)
                {
                    const size_t to_read = static_cast<size_t>(std::min<uint64_t>(remaining, buffer.size()));
                    if (!ifs.read(buffer.data(), static_cast<std::streamsize>(to_read)))
                    {
                        throw IOError("Failed to read input file " + source_path.string() + " at offset " +
                                      std::to_string(offset + piece_size - remaining));
                    }
                    ofs.write(buffer.data(), static_cast<std::streamsize>(to_read));
                    if (!ofs.good())
                    {
                        throw IOError("Failed to write all data to piece file: " + piece_path.string());
                    }
                    remaining -= to_read;
                }

                ofs.close();
                if (ofs.fail())
                {
                    throw IOError("Failed to close piece file: " + piece_path.string());
                }

                pieces.emplace_back(index, piece_path, offset, piece_size);
                offset += piece_size;
            }

            return pieces;
        }

    } // namespace Pieces
} // namespace MultipartUploader

// src/file_piece.cpp
#include "file_piece.hpp"
#include "upload_errors.hpp"

#include <fstream>

namespace fs = std::filesystem;

namespace MultipartUploader
{
    namespace Pieces
    {

        std::vector<char> FilePiece::loadData() const
        {
            std::ifstream ifs(path, std::ios::binary | std::ios::ate);
            if (!ifs.is_open())
            {
                throw IOError("Failed to open piece file for reading: " + path.string());
            }

            std::streamsize file_size = ifs.tellg();
            if (file_size == -1)
            {
                throw IOError("Failed to get size of piece file: " + path.string());
            }
            ifs.seekg(0, std::ios::beg);

            std::vector<char> buffer(static_cast<size_t>(file_size));
            if (file_size > 0 && !ifs.read(buffer.data(), file_size))
            {
                throw IOError("Failed to read all data from piece file: " + path.string());
            }
            return buffer;
        }

        std::string FilePiece::pieceFileName(const fs::path &source_path, int index, int piece_count)
        {
            std::string number = std::to_string(index);
            const size_t width = std::to_string(piece_count).size();
            if (number.size() < width)
            {
                number.insert(0, width - number.size(), '0');
            }
            return source_path.filename().string() + "." + number;
        }

    } // namespace Pieces
} // namespace MultipartUploader

// src/source_file.cpp
#include "source_file.hpp"
#include "digest_utility.hpp"
#include "upload_errors.hpp"

namespace fs = std::filesystem;

namespace MultipartUploader
{
    namespace Pieces
    {

        SourceFile::SourceFile(fs::path source_path, std::string algorithm_name)
            : file_path(std::move(source_path)), digest_algorithm(std::move(algorithm_name))
        {
            std::error_code ec;
            if (!fs::is_regular_file(file_path, ec))
            {
                throw IOError("Input file not found: " + file_path.string());
            }
            file_size = fs::file_size(file_path, ec);
            if (ec)
            {
                throw IOError("Failed to get size of input file " + file_path.string() + ": " + ec.message());
            }
        }

        const std::string &SourceFile::digest()
        {
            if (!cached_digest)
            {
                cached_digest = Digest::DigestUtility::digestFile(file_path, digest_algorithm);
            }
            return *cached_digest;
        }

    } // namespace Pieces
} // namespace MultipartUploader

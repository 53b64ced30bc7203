// include/source_file.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace MultipartUploader
{
    namespace Pieces
    {

        // The file being uploaded. Read-only for the whole run; its digest is computed on first use and cached.
        class SourceFile
        {
        public:
            SourceFile(std::filesystem::path source_path, std::string algorithm_name);

            const std::filesystem::path &path() const { return file_path; }
            const std::string &algorithm() const { return digest_algorithm; }
            uint64_t size() const { return file_size; }

            // Object key: the file's base name.
            std::string key() const { return file_path.filename().string(); }

            const std::string &digest();

        private:
            std::filesystem::path file_path;
            std::string digest_algorithm;
            uint64_t file_size = 0;
            std::optional<std::string> cached_digest;
        };

    } // namespace Pieces
} // namespace MultipartUploader

// include/upload_config.hpp
#pragma once

#include <string>
#include <cstddef>    // For size_t
#include <filesystem> // For std::filesystem::path
#include <optional>

namespace MultipartUploader
{
    namespace Config
    {

        class UploadConfig
        {
        public:
            // Maximum size of each file piece when none is requested (10 MiB)
            static const size_t DEFAULT_FILE_PIECE_SIZE = 10 * 1024 * 1024;

            // Smallest part the object store accepts, except for the last part (5 MiB)
            static const size_t MIN_FILE_PIECE_SIZE = 5 * 1024 * 1024;

            // Digest used for part integrity and whole-file verification
            static const std::string DEFAULT_DIGEST_ALGORITHM;

            // Prefix of the per-run piece directory
            static const std::string TEMP_DIR_PREFIX;

            // Environment variable naming the object store root
            static const std::string STORE_ROOT_ENV;

            // Store root used when neither the option nor the environment names one
            static const std::string DEFAULT_STORE_DIR_NAME;

            // Resolve the object store root: explicit option, then $MPU_STORE_ROOT, then ./object-store
            static std::filesystem::path resolveStoreRoot(const std::optional<std::string> &requested);

            // Resolve the root under which piece directories are created
            static std::filesystem::path resolveTempRoot(const std::optional<std::string> &requested);

            // Parse a positive decimal count such as a piece size. Signs, junk and zero raise InvalidInput.
            static size_t parsePositiveCount(const std::string &option_name, const std::string &text);

            // Create the directory if it does not exist yet and return its absolute path
            static std::filesystem::path ensureDirectoryExists(const std::filesystem::path &dir_path);
        };

        // Everything one upload run needs to know.
        struct UploadOptions
        {
            std::string bucket_name;
            std::filesystem::path original_filename;
            size_t file_piece_size = UploadConfig::DEFAULT_FILE_PIECE_SIZE;
            bool keep_file_pieces = false;
            std::string digest_algorithm = UploadConfig::DEFAULT_DIGEST_ALGORITHM;
            size_t parallel_parts = 1;
            std::filesystem::path temp_root;
        };

    } // namespace Config
} // namespace MultipartUploader

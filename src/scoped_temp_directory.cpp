// src/scoped_temp_directory.cpp
#include "scoped_temp_directory.hpp"
#include "upload_errors.hpp"

#include <cerrno>
#include <cstring>
#include <stdlib.h> // For mkdtemp
#include <vector>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace MultipartUploader
{
    namespace Config
    {

        ScopedTempDirectory::ScopedTempDirectory(const fs::path &parent, const std::string &prefix)
        {
            std::string pattern = (parent / (prefix + "XXXXXX")).string();
            std::vector<char> buffer(pattern.begin(), pattern.end());
            buffer.push_back('\0');

            // mkdtemp picks a name no other run can have created
            if (mkdtemp(buffer.data()) == nullptr)
            {
                throw IOError("Failed to create temporary directory under " + parent.string() + ": " + std::strerror(errno));
            }
            dir_path = fs::path(buffer.data());
            spdlog::debug("Created file piece directory {}", dir_path.string());
        }

        ScopedTempDirectory::~ScopedTempDirectory()
        {
            if (keep)
            {
                spdlog::info("Leaving file piece directory {} at user request.", dir_path.string());
                return;
            }

            spdlog::info("Deleting file piece directory {}...", dir_path.string());
            std::error_code ec;
            fs::remove_all(dir_path, ec);
            if (ec)
            {
                spdlog::error("Failed to delete {}: {}", dir_path.string(), ec.message());
                return;
            }
            spdlog::info("Deleted {} successfully.", dir_path.string());
        }

    } // namespace Config
} // namespace MultipartUploader

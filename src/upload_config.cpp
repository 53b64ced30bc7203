// src/upload_config.cpp
#include "upload_config.hpp"
#include "upload_errors.hpp"

#include <cstdlib>   // For std::getenv
#include <limits>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace MultipartUploader
{
    namespace Config
    {

        const size_t UploadConfig::DEFAULT_FILE_PIECE_SIZE;
        const size_t UploadConfig::MIN_FILE_PIECE_SIZE;
        const std::string UploadConfig::DEFAULT_DIGEST_ALGORITHM = "md5";
        const std::string UploadConfig::TEMP_DIR_PREFIX = "mpu-";
        const std::string UploadConfig::STORE_ROOT_ENV = "MPU_STORE_ROOT";
        const std::string UploadConfig::DEFAULT_STORE_DIR_NAME = "object-store";

        fs::path UploadConfig::ensureDirectoryExists(const fs::path &dir_path)
        {
            fs::path absolute_path = fs::absolute(dir_path);

            try
            {
                if (!fs::exists(absolute_path))
                {
                    if (fs::create_directories(absolute_path))
                    {
                        spdlog::debug("Created directory: {}", absolute_path.string());
                    }
                    else if (!fs::exists(absolute_path))
                    {
                        // Another process may have created it in the meantime; only fail if it is still missing.
                        throw IOError("Failed to create directory: " + absolute_path.string());
                    }
                }
                else if (!fs::is_directory(absolute_path))
                {
                    throw IOError("Not a directory: " + absolute_path.string());
                }
            }
            catch (const fs::filesystem_error &e)
            {
                throw IOError("Filesystem error creating directory " + absolute_path.string() + ": " + e.what());
            }
            return absolute_path;
        }

        size_t UploadConfig::parsePositiveCount(const std::string &option_name, const std::string &text)
        {
            if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos)
            {
                throw InvalidInput("--" + option_name + " must be a positive whole number, got '" + text + "'");
            }
            unsigned long long value = 0;
            try
            {
                value = std::stoull(text);
            }
            catch (const std::out_of_range &)
            {
                throw InvalidInput("--" + option_name + " is too large: " + text);
            }
            if (value > std::numeric_limits<size_t>::max())
            {
                throw InvalidInput("--" + option_name + " is too large: " + text);
            }
            if (value == 0)
            {
                throw InvalidInput("--" + option_name + " must be greater than zero");
            }
            return static_cast<size_t>(value);
        }

        fs::path UploadConfig::resolveStoreRoot(const std::optional<std::string> &requested)
        {
            if (requested && !requested->empty())
            {
                return ensureDirectoryExists(*requested);
            }
            if (const char *from_env = std::getenv(STORE_ROOT_ENV.c_str()); from_env != nullptr && *from_env != '\0')
            {
                return ensureDirectoryExists(from_env);
            }
            return ensureDirectoryExists(fs::current_path() / DEFAULT_STORE_DIR_NAME);
        }

        fs::path UploadConfig::resolveTempRoot(const std::optional<std::string> &requested)
        {
            if (requested && !requested->empty())
            {
                return ensureDirectoryExists(*requested);
            }
            try
            {
                return fs::temp_directory_path();
            }
            catch (const fs::filesystem_error &e)
            {
                throw IOError(std::string("Cannot determine temporary directory: ") + e.what());
            }
        }

    } // namespace Config
} // namespace MultipartUploader

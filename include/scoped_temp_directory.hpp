// include/scoped_temp_directory.hpp
#pragma once

#include <filesystem>
#include <string>

namespace MultipartUploader
{
    namespace Config
    {

        // Uniquely named directory that lives as long as this object.
        // The directory is removed with everything in it on destruction, unless retain() was called.
        class ScopedTempDirectory
        {
        public:
            ScopedTempDirectory(const std::filesystem::path &parent, const std::string &prefix);
            ~ScopedTempDirectory();

            ScopedTempDirectory(const ScopedTempDirectory &) = delete;
            ScopedTempDirectory &operator=(const ScopedTempDirectory &) = delete;

            const std::filesystem::path &path() const { return dir_path; }

            // Keep the directory and its contents after destruction.
            void retain() { keep = true; }
            bool retained() const { return keep; }

        private:
            std::filesystem::path dir_path;
            bool keep = false;
        };

    } // namespace Config
} // namespace MultipartUploader

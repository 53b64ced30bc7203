// include/digest_utility.hpp
#pragma once

#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace MultipartUploader
{
    namespace Digest
    {

        class DigestUtility
        {
        public:
            // Digest of a byte stream, base64 encoded. The stream is consumed in bounded chunks
            // of (digest block size * 1024) bytes, never loaded whole.
            // Throws UnsupportedAlgorithm for an unknown name and IOError if the stream breaks.
            static std::string digestStream(std::istream &input, const std::string &algorithm);

            // Same as digestStream, over the contents of a file.
            // Equivalent to: openssl <algorithm> -binary <file> | base64
            static std::string digestFile(const std::filesystem::path &file_path, const std::string &algorithm);

            // Digest of an in-memory buffer, base64 encoded.
            static std::string digestBuffer(const std::vector<char> &data_buffer, const std::string &algorithm);

            // True if the crypto library knows a digest by this name.
            static bool isSupported(const std::string &algorithm);

            // Throws UnsupportedAlgorithm unless isSupported(algorithm).
            static void requireSupported(const std::string &algorithm);

            // Hex MD5 of a buffer, as object stores report part ETags.
            static std::string md5Hex(const std::vector<char> &data_buffer);

            static std::string toBase64(const unsigned char *bytes, size_t length);
        };

    } // namespace Digest
} // namespace MultipartUploader

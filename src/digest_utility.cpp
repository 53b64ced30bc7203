// src/digest_utility.cpp
#include "digest_utility.hpp"
#include "upload_errors.hpp"

#include <fstream>
#include <iomanip>   // For std::hex, std::setw, std::setfill
#include <memory>
#include <sstream>   // For std::stringstream

// OpenSSL EVP interface; link against OpenSSL::Crypto
#include <openssl/evp.h>

namespace MultipartUploader
{
    namespace Digest
    {

        namespace
        {
            using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

            const EVP_MD *lookup(const std::string &algorithm)
            {
                const EVP_MD *md = EVP_get_digestbyname(algorithm.c_str());
                if (md == nullptr)
                {
                    throw UnsupportedAlgorithm(algorithm);
                }
                return md;
            }

            DigestContext startDigest(const EVP_MD *md)
            {
                DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
                if (!ctx)
                {
                    throw DigestError("Failed to allocate digest context.");
                }
                if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1)
                {
                    throw DigestError("Failed to initialize digest context.");
                }
                return ctx;
            }

            std::string finishDigest(EVP_MD_CTX *ctx)
            {
                unsigned char hash[EVP_MAX_MD_SIZE];
                unsigned int hash_length = 0;
                if (EVP_DigestFinal_ex(ctx, hash, &hash_length) != 1)
                {
                    throw DigestError("Failed to finalize digest calculation.");
                }
                return DigestUtility::toBase64(hash, hash_length);
            }
        } // namespace

        std::string DigestUtility::digestStream(std::istream &input, const std::string &algorithm)
        {
            const EVP_MD *md = lookup(algorithm);
            DigestContext ctx = startDigest(md);

            std::vector<char> buffer(static_cast<size_t>(EVP_MD_block_size(md)) * 1024);
            while (input)
            {
                input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                std::streamsize count = input.gcount();
                if (count > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(count)) != 1)
                {
                    throw DigestError("Failed to update digest context with data.");
                }
            }
            if (input.bad() || !input.eof())
            {
                throw IOError("Stream could not be read to completion while computing " + algorithm + " digest.");
            }
            return finishDigest(ctx.get());
        }

        std::string DigestUtility::digestFile(const std::filesystem::path &file_path, const std::string &algorithm)
        {
            // Reject the algorithm before touching the filesystem.
            lookup(algorithm);

            std::ifstream ifs(file_path, std::ios::binary);
            if (!ifs.is_open())
            {
                throw IOError("Failed to open file for hashing: " + file_path.string());
            }
            return digestStream(ifs, algorithm);
        }

        std::string DigestUtility::digestBuffer(const std::vector<char> &data_buffer, const std::string &algorithm)
        {
            DigestContext ctx = startDigest(lookup(algorithm));
            if (!data_buffer.empty() && EVP_DigestUpdate(ctx.get(), data_buffer.data(), data_buffer.size()) != 1)
            {
                throw DigestError("Failed to update digest context with data.");
            }
            return finishDigest(ctx.get());
        }

        bool DigestUtility::isSupported(const std::string &algorithm)
        {
            return !algorithm.empty() && EVP_get_digestbyname(algorithm.c_str()) != nullptr;
        }

        void DigestUtility::requireSupported(const std::string &algorithm)
        {
            if (!isSupported(algorithm))
            {
                throw UnsupportedAlgorithm(algorithm);
            }
        }

        std::string DigestUtility::md5Hex(const std::vector<char> &data_buffer)
        {
            DigestContext ctx = startDigest(EVP_md5());
            if (!data_buffer.empty() && EVP_DigestUpdate(ctx.get(), data_buffer.data(), data_buffer.size()) != 1)
            {
                throw DigestError("Failed to update MD5 context with data.");
            }
            unsigned char hash[EVP_MAX_MD_SIZE];
            unsigned int hash_length = 0;
            if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_length) != 1)
            {
                throw DigestError("Failed to finalize MD5 calculation.");
            }

            std::stringstream ss;
            for (unsigned int i = 0; i < hash_length; i++)
            {
                ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
            }
            return ss.str();
        }

        std::string DigestUtility::toBase64(const unsigned char *bytes, size_t length)
        {
            // EVP_EncodeBlock writes 4 characters per 3 input bytes plus a terminating NUL.
            std::string encoded(4 * ((length + 2) / 3) + 1, '\0');
            int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(encoded.data()), bytes, static_cast<int>(length));
            encoded.resize(static_cast<size_t>(written));
            return encoded;
        }

    } // namespace Digest
} // namespace MultipartUploader

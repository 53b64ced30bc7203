// src/local_object_store.cpp
#include "local_object_store.hpp"
#include "digest_utility.hpp"
#include "upload_errors.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>
#include <openssl/rand.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace MultipartUploader
{
    namespace Store
    {

        namespace
        {
            const char *UPLOADS_DIR_NAME = ".uploads";
            const char *METADATA_DIR_NAME = ".metadata";
            const char *UPLOAD_RECORD_NAME = "upload.json";

            void writeFile(const fs::path &path, const char *data, size_t size)
            {
                std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
                if (!ofs.is_open())
                {
                    throw StoreError("IOError", "Failed to open file for writing: " + path.string());
                }
                ofs.write(data, static_cast<std::streamsize>(size));
                ofs.close();
                if (ofs.fail())
                {
                    throw StoreError("IOError", "Failed to write all data to file: " + path.string());
                }
            }

            void writeText(const fs::path &path, const std::string &text)
            {
                writeFile(path, text.data(), text.size());
            }

            std::string readText(const fs::path &path)
            {
                std::ifstream ifs(path, std::ios::binary);
                if (!ifs.is_open())
                {
                    throw StoreError("IOError", "Failed to open file for reading: " + path.string());
                }
                std::stringstream ss;
                ss << ifs.rdbuf();
                return ss.str();
            }

            nlohmann::json readJson(const fs::path &path)
            {
                try
                {
                    return nlohmann::json::parse(readText(path));
                }
                catch (const nlohmann::json::parse_error &e)
                {
                    throw StoreError("IOError", "Error parsing JSON file " + path.string() + ": " + e.what());
                }
            }

            std::string unquote(const std::string &etag)
            {
                if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"')
                {
                    return etag.substr(1, etag.size() - 2);
                }
                return etag;
            }

            // S3-style ETag of a multipart object: MD5 over the concatenated binary part MD5s, suffixed with the part count.
            std::string multipartEtag(const std::vector<PartAck> &parts)
            {
                std::vector<char> concatenated;
                for (const auto &part : parts)
                {
                    const std::string hex = unquote(part.etag);
                    for (size_t i = 0; i + 1 < hex.size(); i += 2)
                    {
                        concatenated.push_back(static_cast<char>(std::stoi(hex.substr(i, 2), nullptr, 16)));
                    }
                }
                return "\"" + Digest::DigestUtility::md5Hex(concatenated) + "-" + std::to_string(parts.size()) + "\"";
            }
        } // namespace

        const int LocalObjectStore::MAX_PART_NUMBER;

        LocalObjectStore::LocalObjectStore(fs::path root, size_t minimum_part_size)
            : root_dir(Config::UploadConfig::ensureDirectoryExists(root)), min_part_size(minimum_part_size)
        {
            Config::UploadConfig::ensureDirectoryExists(root_dir / UPLOADS_DIR_NAME);
            Config::UploadConfig::ensureDirectoryExists(root_dir / METADATA_DIR_NAME);
            spdlog::debug("LocalObjectStore initialized at {}", root_dir.string());
        }

        void LocalObjectStore::validateName(const std::string &what, const std::string &name)
        {
            if (name.empty())
            {
                throw StoreError("InvalidArgument", what + " must not be empty");
            }
            fs::path as_path(name);
            if (as_path.is_absolute())
            {
                throw StoreError("InvalidArgument", what + " must be relative: " + name);
            }
            for (const auto &component : as_path)
            {
                const std::string part = component.string();
                if (part.empty() || part == "." || part == "..")
                {
                    throw StoreError("InvalidArgument", "Invalid " + what + ": " + name);
                }
            }
        }

        std::string LocalObjectStore::newUploadId()
        {
            unsigned char raw[16];
            if (RAND_bytes(raw, sizeof(raw)) != 1)
            {
                throw StoreError("InternalError", "Failed to generate upload id");
            }
            std::stringstream ss;
            for (unsigned char byte : raw)
            {
                ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
            }
            return ss.str();
        }

        fs::path LocalObjectStore::bucketPath(const std::string &bucket) const
        {
            validateName("bucket name", bucket);
            if (bucket.front() == '.' || bucket.find('/') != std::string::npos)
            {
                throw StoreError("InvalidBucketName", "Invalid bucket name: " + bucket);
            }
            return root_dir / bucket;
        }

        fs::path LocalObjectStore::objectPath(const std::string &bucket, const std::string &key) const
        {
            validateName("key", key);
            return bucketPath(bucket) / key;
        }

        fs::path LocalObjectStore::metadataPath(const std::string &bucket, const std::string &key) const
        {
            validateName("key", key);
            return root_dir / METADATA_DIR_NAME / bucket / (key + ".json");
        }

        fs::path LocalObjectStore::uploadPath(const std::string &upload_id) const
        {
            if (upload_id.empty() || upload_id.find_first_not_of("0123456789abcdef") != std::string::npos)
            {
                throw StoreError("NoSuchUpload", "Unknown upload id: " + upload_id);
            }
            return root_dir / UPLOADS_DIR_NAME / upload_id;
        }

        fs::path LocalObjectStore::partPath(const std::string &upload_id, int part_number) const
        {
            std::ostringstream name;
            name << "part-" << std::setw(5) << std::setfill('0') << part_number;
            return uploadPath(upload_id) / name.str();
        }

        void LocalObjectStore::createBucket(const std::string &bucket)
        {
            std::lock_guard<std::mutex> lock(store_mutex);
            Config::UploadConfig::ensureDirectoryExists(bucketPath(bucket));
        }

        bool LocalObjectStore::bucketExists(const std::string &bucket) const
        {
            std::error_code ec;
            return fs::is_directory(bucketPath(bucket), ec);
        }

        LocalObjectStore::UploadRecord LocalObjectStore::loadUpload(const std::string &bucket,
                                                                     const std::string &key,
                                                                     const std::string &upload_id) const
        {
            fs::path record_path = uploadPath(upload_id) / UPLOAD_RECORD_NAME;
            if (!fs::exists(record_path))
            {
                throw StoreError("NoSuchUpload", "The specified upload does not exist: " + upload_id);
            }

            nlohmann::json j = readJson(record_path);
            UploadRecord record;
            j.at("bucket").get_to(record.bucket);
            j.at("key").get_to(record.key);
            j.at("metadata").get_to(record.metadata);

            if (record.bucket != bucket || record.key != key)
            {
                throw StoreError("NoSuchUpload", "Upload " + upload_id + " does not belong to " + bucket + "/" + key);
            }
            return record;
        }

        std::string LocalObjectStore::createMultipartUpload(const std::string &bucket,
                                                            const std::string &key,
                                                            const std::map<std::string, std::string> &metadata)
        {
            std::lock_guard<std::mutex> lock(store_mutex);
            validateName("key", key);
            if (!bucketExists(bucket))
            {
                throw StoreError("NoSuchBucket", "The specified bucket does not exist: " + bucket);
            }

            std::string upload_id = newUploadId();
            fs::path upload_dir = uploadPath(upload_id);
            std::error_code ec;
            if (!fs::create_directories(upload_dir, ec))
            {
                throw StoreError("IOError", "Failed to create upload directory " + upload_dir.string() + ": " + ec.message());
            }

            nlohmann::json record = {
                {"bucket", bucket},
                {"key", key},
                {"metadata", metadata}};
            writeText(upload_dir / UPLOAD_RECORD_NAME, record.dump(4));

            spdlog::debug("Created multipart upload {} for {}/{}", upload_id, bucket, key);
            return upload_id;
        }

        std::string LocalObjectStore::uploadPart(const std::string &bucket,
                                                 const std::string &key,
                                                 const std::string &upload_id,
                                                 int part_number,
                                                 const std::vector<char> &body,
                                                 const ContentDigest &content_digest)
        {
            if (part_number < 1 || part_number > MAX_PART_NUMBER)
            {
                throw StoreError("InvalidArgument", "Part number must be an integer between 1 and " +
                                                        std::to_string(MAX_PART_NUMBER) + ", got " + std::to_string(part_number));
            }

            {
                std::lock_guard<std::mutex> lock(store_mutex);
                loadUpload(bucket, key, upload_id);
            }

            if (!Digest::DigestUtility::isSupported(content_digest.algorithm))
            {
                throw StoreError("InvalidDigest", "Unsupported content digest algorithm: " + content_digest.algorithm);
            }
            const std::string computed = Digest::DigestUtility::digestBuffer(body, content_digest.algorithm);
            if (computed != content_digest.value)
            {
                throw StoreError("BadDigest", "The " + content_digest.algorithm + " digest of part " +
                                                  std::to_string(part_number) + " did not match: expected " +
                                                  content_digest.value + ", computed " + computed);
            }

            const std::string etag = "\"" + Digest::DigestUtility::md5Hex(body) + "\"";
            fs::path part_file = partPath(upload_id, part_number);
            writeFile(part_file, body.data(), body.size());
            writeText(part_file.string() + ".etag", etag);

            spdlog::debug("Stored part {} of upload {} ({} bytes, ETag {})", part_number, upload_id, body.size(), etag);
            return etag;
        }

        void LocalObjectStore::completeMultipartUpload(const std::string &bucket,
                                                       const std::string &key,
                                                       const std::string &upload_id,
                                                       const std::vector<PartAck> &parts)
        {
            std::lock_guard<std::mutex> lock(store_mutex);
            UploadRecord record = loadUpload(bucket, key, upload_id);

            if (parts.empty())
            {
                throw StoreError("MalformedXML", "You must specify at least one part");
            }

            std::vector<uint64_t> part_sizes;
            for (size_t i = 0; i < parts.size(); ++i)
            {
                if (i > 0 && parts[i].part_number <= parts[i - 1].part_number)
                {
                    throw StoreError("InvalidPartOrder", "The list of parts was not in ascending order");
                }

                fs::path part_file = partPath(upload_id, parts[i].part_number);
                fs::path etag_file = part_file.string() + ".etag";
                std::error_code ec;
                if (!fs::exists(part_file, ec) || !fs::exists(etag_file, ec) || readText(etag_file) != parts[i].etag)
                {
                    throw StoreError("InvalidPart", "Part " + std::to_string(parts[i].part_number) +
                                                        " could not be found or its ETag did not match");
                }
                const uint64_t part_size = fs::file_size(part_file, ec);
                if (ec)
                {
                    throw StoreError("IOError", "Failed to get size of part " + std::to_string(parts[i].part_number) +
                                                    ": " + ec.message());
                }
                part_sizes.push_back(part_size);
            }

            for (size_t i = 0; i + 1 < part_sizes.size(); ++i)
            {
                if (part_sizes[i] < min_part_size)
                {
                    throw StoreError("EntityTooSmall", "Part " + std::to_string(parts[i].part_number) + " is " +
                                                           std::to_string(part_sizes[i]) + " bytes, smaller than the minimum of " +
                                                           std::to_string(min_part_size));
                }
            }

            fs::path object_file = objectPath(bucket, key);
            fs::path staging_file = object_file.parent_path() / ("." + object_file.filename().string() + "." + upload_id);
            uint64_t content_length = 0;
            try
            {
                fs::create_directories(object_file.parent_path());
                {
                    std::ofstream ofs(staging_file, std::ios::binary | std::ios::trunc);
                    if (!ofs.is_open())
                    {
                        throw StoreError("IOError", "Failed to open file for writing: " + staging_file.string());
                    }
                    for (size_t i = 0; i < parts.size(); ++i)
                    {
                        const PartAck &part = parts[i];
                        if (part_sizes[i] == 0)
                        {
                            continue;
                        }
                        std::ifstream ifs(partPath(upload_id, part.part_number), std::ios::binary);
                        if (!ifs.is_open())
                        {
                            throw StoreError("IOError", "Failed to open part " + std::to_string(part.part_number));
                        }
                        ofs << ifs.rdbuf();
                        if (!ofs.good())
                        {
                            throw StoreError("IOError", "Failed to append part " + std::to_string(part.part_number) +
                                                            " to " + staging_file.string());
                        }
                    }
                    content_length = static_cast<uint64_t>(ofs.tellp());
                }
                fs::rename(staging_file, object_file);
            }
            catch (const fs::filesystem_error &e)
            {
                std::error_code ignored;
                fs::remove(staging_file, ignored);
                throw StoreError("IOError", std::string("Failed to assemble object: ") + e.what());
            }
            catch (const StoreError &)
            {
                std::error_code ignored;
                fs::remove(staging_file, ignored);
                throw;
            }

            nlohmann::json object_metadata = {
                {"content_length", content_length},
                {"etag", multipartEtag(parts)},
                {"metadata", record.metadata}};
            fs::path metadata_file = metadataPath(bucket, key);
            fs::create_directories(metadata_file.parent_path());
            writeText(metadata_file, object_metadata.dump(4));

            fs::remove_all(uploadPath(upload_id));
            spdlog::debug("Completed multipart upload {} into {}/{} ({} bytes)", upload_id, bucket, key, content_length);
        }

        void LocalObjectStore::abortMultipartUpload(const std::string &bucket,
                                                    const std::string &key,
                                                    const std::string &upload_id)
        {
            std::lock_guard<std::mutex> lock(store_mutex);
            loadUpload(bucket, key, upload_id);

            std::error_code ec;
            fs::remove_all(uploadPath(upload_id), ec);
            if (ec)
            {
                throw StoreError("IOError", "Failed to discard upload " + upload_id + ": " + ec.message());
            }
            spdlog::debug("Aborted multipart upload {} for {}/{}", upload_id, bucket, key);
        }

        ObjectInfo LocalObjectStore::headObject(const std::string &bucket, const std::string &key)
        {
            std::lock_guard<std::mutex> lock(store_mutex);
            fs::path object_file = objectPath(bucket, key);
            fs::path metadata_file = metadataPath(bucket, key);
            std::error_code ec;
            if (!fs::is_regular_file(object_file, ec) || !fs::exists(metadata_file, ec))
            {
                throw StoreError("NoSuchKey", "The specified key does not exist: " + bucket + "/" + key);
            }

            ObjectInfo info;
            info.content_length = fs::file_size(object_file, ec);
            if (ec)
            {
                throw StoreError("IOError", "Failed to get size of " + object_file.string() + ": " + ec.message());
            }

            nlohmann::json j = readJson(metadata_file);
            try
            {
                j.at("etag").get_to(info.etag);
                j.at("metadata").get_to(info.metadata);
            }
            catch (const nlohmann::json::exception &e)
            {
                throw StoreError("IOError", "Malformed object metadata " + metadata_file.string() + ": " + e.what());
            }
            return info;
        }

        std::vector<char> LocalObjectStore::readObject(const std::string &bucket, const std::string &key) const
        {
            std::lock_guard<std::mutex> lock(store_mutex);
            fs::path object_file = objectPath(bucket, key);
            std::error_code ec;
            if (!fs::is_regular_file(object_file, ec))
            {
                throw StoreError("NoSuchKey", "The specified key does not exist: " + bucket + "/" + key);
            }
            std::string contents = readText(object_file);
            return std::vector<char>(contents.begin(), contents.end());
        }

        std::vector<std::string> LocalObjectStore::liveUploadIds() const
        {
            std::lock_guard<std::mutex> lock(store_mutex);
            std::vector<std::string> ids;
            for (const auto &entry : fs::directory_iterator(root_dir / UPLOADS_DIR_NAME))
            {
                if (entry.is_directory())
                {
                    ids.push_back(entry.path().filename().string());
                }
            }
            return ids;
        }

    } // namespace Store
} // namespace MultipartUploader

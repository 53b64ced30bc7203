// include/local_object_store.hpp
#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "object_store.hpp"
#include "upload_config.hpp"

namespace MultipartUploader
{
    namespace Store
    {

        // Object store kept in a local directory tree:
        //   <root>/<bucket>/<key>                   completed objects
        //   <root>/.metadata/<bucket>/<key>.json    object size, ETag and user metadata
        //   <root>/.uploads/<upload id>/            upload record and staged parts
        // Safe to use from several threads at once.
        class LocalObjectStore : public ObjectStore
        {
        public:
            explicit LocalObjectStore(std::filesystem::path root,
                                      size_t min_part_size = Config::UploadConfig::MIN_FILE_PIECE_SIZE);

            std::string createMultipartUpload(const std::string &bucket,
                                              const std::string &key,
                                              const std::map<std::string, std::string> &metadata) override;

            std::string uploadPart(const std::string &bucket,
                                   const std::string &key,
                                   const std::string &upload_id,
                                   int part_number,
                                   const std::vector<char> &body,
                                   const ContentDigest &content_digest) override;

            void completeMultipartUpload(const std::string &bucket,
                                         const std::string &key,
                                         const std::string &upload_id,
                                         const std::vector<PartAck> &parts) override;

            void abortMultipartUpload(const std::string &bucket,
                                      const std::string &key,
                                      const std::string &upload_id) override;

            ObjectInfo headObject(const std::string &bucket, const std::string &key) override;

            // --- Local administration, outside the multipart protocol ---

            void createBucket(const std::string &bucket);

            bool bucketExists(const std::string &bucket) const;

            // Full contents of a completed object.
            std::vector<char> readObject(const std::string &bucket, const std::string &key) const;

            // Upload ids that were created and neither completed nor aborted.
            std::vector<std::string> liveUploadIds() const;

            const std::filesystem::path &root() const { return root_dir; }

            // Highest part number the store accepts
            static const int MAX_PART_NUMBER = 10000;

        private:
            struct UploadRecord
            {
                std::string bucket;
                std::string key;
                std::map<std::string, std::string> metadata;
            };

            std::filesystem::path bucketPath(const std::string &bucket) const;
            std::filesystem::path objectPath(const std::string &bucket, const std::string &key) const;
            std::filesystem::path metadataPath(const std::string &bucket, const std::string &key) const;
            std::filesystem::path uploadPath(const std::string &upload_id) const;
            std::filesystem::path partPath(const std::string &upload_id, int part_number) const;

            // Load the record of an upload and check it belongs to bucket/key. Caller holds store_mutex.
            UploadRecord loadUpload(const std::string &bucket, const std::string &key, const std::string &upload_id) const;

            static void validateName(const std::string &what, const std::string &name);
            static std::string newUploadId();

            std::filesystem::path root_dir;
            size_t min_part_size;
            mutable std::mutex store_mutex;
        };

    } // namespace Store
} // namespace MultipartUploader
